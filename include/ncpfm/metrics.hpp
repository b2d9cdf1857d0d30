#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace ncpfm {

class BlobUploader;

/// Observes the lifetime of a transfer, in seconds, into a duration histogram.
class ScopedTimer {
public:
    using Clock = std::chrono::steady_clock;

    explicit ScopedTimer(prometheus::Histogram& target) : target_(&target), began_(Clock::now()) {}
    ~ScopedTimer() { target_->Observe(elapsed_seconds()); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double elapsed_seconds() const {
        return std::chrono::duration<double>(Clock::now() - began_).count();
    }

private:
    prometheus::Histogram* target_;
    Clock::time_point began_;
};

/// Transfer metrics exported as a Prometheus textfile (node_exporter
/// textfile collector). A background thread rewrites the file every
/// write_interval with temp+rename.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Uploader sampled for the ncpfm_uploader_* gauges (not owned).
    /// Pass nullptr before the uploader is destroyed.
    void set_uploader(BlobUploader* uploader);

    /// Stop sampling uploader if it is the one registered. Once this returns
    /// the exporter no longer touches it.
    void release_uploader(const BlobUploader* uploader);

    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    /// Serialize the registry to the file now.
    void write_file();

    const std::filesystem::path& path() const { return prom_file_path_; }

    // --- Counters ---
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& batch_failures_total() { return *batch_failures_total_; }

    // --- Histograms ---
    prometheus::Histogram& download_duration() { return *download_duration_; }
    prometheus::Histogram& upload_duration() { return *upload_duration_; }

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex uploader_mutex_;
    BlobUploader* uploader_ = nullptr;

    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* batch_failures_total_;

    prometheus::Gauge* uploader_pending_;
    prometheus::Gauge* uploader_threads_;
    prometheus::Gauge* uploader_uploaded_;
    prometheus::Gauge* uploader_failed_;
    prometheus::Gauge* uploader_state_;

    prometheus::Histogram* download_duration_;
    prometheus::Histogram* upload_duration_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace ncpfm
