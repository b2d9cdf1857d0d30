#include "ncpfm/blob_uploader.hpp"
#include "ncpfm/core/log.hpp"
#include "ncpfm/errors.hpp"

namespace ncpfm {

const char* uploader_state_name(UploaderState state) {
    switch (state) {
        case UploaderState::Idle: return "idle";
        case UploaderState::Streaming: return "streaming";
        case UploaderState::DrainingForBatch: return "draining-for-batch";
        case UploaderState::BatchUploading: return "batch-uploading";
    }
    return "idle";
}

BlobUploader::BlobUploader(std::shared_ptr<StorageBackend> backend,
                           size_t max_list_len,
                           size_t nb_threads,
                           size_t batch_workers)
    : backend_(std::move(backend)),
      max_list_len_(max_list_len),
      nb_threads_(nb_threads == 0 ? 1 : nb_threads),
      batch_workers_(batch_workers == 0 ? 1 : batch_workers) {
    start();
}

BlobUploader::~BlobUploader() {
    stop();
}

void BlobUploader::add_blob(BlobData blob) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.emplace_back(std::move(blob));
        ++pending_items_;
    }
    queue_cv_.notify_one();
}

size_t BlobUploader::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return pending_items_;
}

UploaderStats BlobUploader::stats() const {
    UploaderStats s;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        s.uploaded = uploaded_;
        s.failed = failed_;
        s.batch_cycles = batch_cycles_;
    }
    s.pending = pending();
    s.threads = thread_count_.load();
    s.state = state_.load();
    return s;
}

std::string BlobUploader::status() const {
    auto s = stats();
    return "[BlobUploader] Queue: " + std::to_string(s.pending) +
           ", Threads: " + std::to_string(s.threads) +
           ", Uploaded: " + std::to_string(s.uploaded) +
           ", Failed: " + std::to_string(s.failed);
}

// --- Control ---

void BlobUploader::start() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (!workers_.empty()) {
        log_debug("Upload threads already running");
        return;
    }
    spawn_workers();
    state_ = UploaderState::Streaming;
}

void BlobUploader::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (workers_.empty()) {
        state_ = UploaderState::Idle;
        return;
    }

    size_t remaining = pending();
    if (remaining > 0) {
        log_warn("Stopping uploader with %zu blobs still pending", remaining);
    }
    join_workers();
    state_ = UploaderState::Idle;
}

bool BlobUploader::manage() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (state_ != UploaderState::Streaming || pending() <= max_list_len_) {
        return false;
    }

    state_ = UploaderState::DrainingForBatch;
    join_workers();

    state_ = UploaderState::BatchUploading;
    std::vector<BlobData> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (auto& item : queue_) {
            if (item) batch.push_back(std::move(*item));
        }
        queue_.clear();
        pending_items_ = 0;
    }

    log_debug("Switching to parallel upload for %zu blobs", batch.size());
    size_t uploaded = 0;
    size_t failed = 0;
    try {
        uploaded = upload_blobs_data_parallel(*backend_, batch, batch_workers_).size();
    } catch (const BatchTransferFailed& e) {
        uploaded = e.completed().size();
        failed = e.failure_count();
        log_error("Parallel upload: %zu of %zu blobs failed, first was %s: %s",
                  failed, batch.size(), e.first_failed_name().c_str(), e.cause().c_str());
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        uploaded_ += uploaded;
        failed_ += failed;
        ++batch_cycles_;
    }

    spawn_workers();
    state_ = UploaderState::Streaming;
    return true;
}

// --- Workers ---

void BlobUploader::spawn_workers() {
    for (size_t i = 0; i < nb_threads_; ++i) {
        workers_.emplace_back(&BlobUploader::worker_loop, this);
    }
    thread_count_ = workers_.size();
    log_debug("Started %zu upload threads", nb_threads_);
}

void BlobUploader::join_workers() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (size_t i = 0; i < workers_.size(); ++i) {
            queue_.emplace_front(std::nullopt);
        }
    }
    queue_cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    thread_count_ = 0;
    log_debug("All upload threads stopped");
}

std::optional<BlobData> BlobUploader::pop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait(lock, [this] { return !queue_.empty(); });
    auto item = std::move(queue_.front());
    queue_.pop_front();
    if (item) --pending_items_;
    return item;
}

void BlobUploader::worker_loop() {
    while (true) {
        auto item = pop();
        if (!item) break;

        try {
            upload_data(*backend_, item->data, item->blob_name);
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++uploaded_;
        } catch (const std::exception& e) {
            log_error("Background upload failed: %s", e.what());
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++failed_;
        }
    }
}

} // namespace ncpfm
