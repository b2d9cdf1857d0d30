#include "ncpfm/metrics.hpp"
#include "ncpfm/blob_uploader.hpp"
#include "ncpfm/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace ncpfm {

namespace {

using Labels = std::map<std::string, std::string>;

// Transfers range from a few kB of CSV to multi-GB video
const prometheus::Histogram::BucketBoundaries& transfer_buckets() {
    static const prometheus::Histogram::BucketBoundaries buckets{
        0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600};
    return buckets;
}

prometheus::Family<prometheus::Counter>& counter_family(prometheus::Registry& registry,
                                                        const std::string& name,
                                                        const std::string& help,
                                                        const Labels& labels) {
    return prometheus::BuildCounter().Name(name).Help(help).Labels(labels).Register(registry);
}

prometheus::Gauge& single_gauge(prometheus::Registry& registry,
                                const std::string& name,
                                const std::string& help,
                                const Labels& labels) {
    return prometheus::BuildGauge().Name(name).Help(help).Labels(labels).Register(registry).Add({});
}

prometheus::Histogram& duration_histogram(prometheus::Registry& registry,
                                          const std::string& name,
                                          const std::string& help,
                                          const Labels& labels) {
    return prometheus::BuildHistogram().Name(name).Help(help).Labels(labels)
        .Register(registry).Add({}, transfer_buckets());
}

} // anonymous namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {
    auto& reg = *registry_;

    auto& downloads = counter_family(reg, "ncpfm_downloads_total", "Blob downloads by result", labels);
    downloads_success_ = &downloads.Add({{"result", "success"}});
    downloads_failure_ = &downloads.Add({{"result", "failure"}});

    auto& uploads = counter_family(reg, "ncpfm_uploads_total", "Blob uploads by result", labels);
    uploads_success_ = &uploads.Add({{"result", "success"}});
    uploads_failure_ = &uploads.Add({{"result", "failure"}});

    download_bytes_total_ = &counter_family(reg, "ncpfm_download_bytes_total",
                                            "Bytes downloaded", labels).Add({});
    upload_bytes_total_ = &counter_family(reg, "ncpfm_upload_bytes_total",
                                          "Bytes uploaded", labels).Add({});
    batch_failures_total_ = &counter_family(reg, "ncpfm_batch_failures_total",
                                            "Bulk transfers that raised BatchTransferFailed",
                                            labels).Add({});

    uploader_pending_ = &single_gauge(reg, "ncpfm_uploader_pending",
                                      "Blobs queued in the background uploader", labels);
    uploader_threads_ = &single_gauge(reg, "ncpfm_uploader_threads",
                                      "Background uploader worker threads", labels);
    uploader_uploaded_ = &single_gauge(reg, "ncpfm_uploader_uploaded",
                                       "Blobs uploaded by the background uploader", labels);
    uploader_failed_ = &single_gauge(reg, "ncpfm_uploader_failed",
                                     "Blobs the background uploader failed to upload", labels);
    uploader_state_ = &single_gauge(reg, "ncpfm_uploader_state",
                                    "Uploader state (0 idle, 1 streaming, 2 draining, 3 batch)", labels);

    download_duration_ = &duration_histogram(reg, "ncpfm_download_duration_seconds",
                                             "Wall time of download operations", labels);
    upload_duration_ = &duration_histogram(reg, "ncpfm_upload_duration_seconds",
                                           "Wall time of upload operations", labels);
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::set_uploader(BlobUploader* uploader) {
    std::lock_guard lock(uploader_mutex_);
    uploader_ = uploader;
}

void MetricsExporter::release_uploader(const BlobUploader* uploader) {
    std::lock_guard lock(uploader_mutex_);
    if (uploader_ == uploader) {
        uploader_ = nullptr;
    }
}

void MetricsExporter::start() {
    std::lock_guard lock(cv_mutex_);
    if (running_) return;
    running_ = true;
    writer_thread_ = std::thread([this] { writer_loop(); });
}

void MetricsExporter::stop() {
    {
        std::lock_guard lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    // Last snapshot carries the final counter values
    write_file();
}

void MetricsExporter::writer_loop() {
    std::unique_lock lock(cv_mutex_);
    while (!cv_.wait_for(lock, write_interval_, [this] { return !running_; })) {
        lock.unlock();
        write_file();
        lock.lock();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(uploader_mutex_);
    if (uploader_ == nullptr) return;

    const auto snapshot = uploader_->stats();
    uploader_pending_->Set(static_cast<double>(snapshot.pending));
    uploader_threads_->Set(static_cast<double>(snapshot.threads));
    uploader_uploaded_->Set(static_cast<double>(snapshot.uploaded));
    uploader_failed_->Set(static_cast<double>(snapshot.failed));
    uploader_state_->Set(static_cast<double>(static_cast<int>(snapshot.state)));
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;
    update_gauges();

    // node_exporter may read at any time; publish by rename only
    std::filesystem::path staging = prom_file_path_;
    staging += ".tmp";

    const std::string text = prometheus::TextSerializer().Serialize(registry_->Collect());
    {
        std::ofstream out(staging, std::ios::trunc);
        out << text;
        if (!out.flush()) {
            log_warn("Cannot write metrics to %s", staging.c_str());
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot publish metrics file %s: %s", prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace ncpfm
