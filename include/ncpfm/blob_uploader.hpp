#pragma once

#include "ncpfm/core/constants.hpp"
#include "ncpfm/storage/backend.hpp"
#include "ncpfm/transfer.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ncpfm {

enum class UploaderState {
    Idle,               // No worker threads
    Streaming,          // Workers upload queued blobs one at a time
    DrainingForBatch,   // Workers are being stopped to switch mode
    BatchUploading      // One parallel upload over the whole backlog
};

const char* uploader_state_name(UploaderState state);

struct UploaderStats {
    size_t uploaded = 0;
    size_t failed = 0;
    size_t pending = 0;
    size_t threads = 0;
    size_t batch_cycles = 0;
    UploaderState state = UploaderState::Idle;
};

/// Background uploader for a stream of small payloads (e.g. frames).
///
/// Producers call add_blob() from any thread. A single driver calls manage()
/// periodically: once the backlog exceeds max_list_len the streaming workers
/// are stopped, everything queued is uploaded with upload_blobs_data_parallel
/// and the workers are restarted. Failures are logged and counted, never
/// thrown to producers.
class BlobUploader {
public:
    BlobUploader(std::shared_ptr<StorageBackend> backend,
                 size_t max_list_len = constants::DEFAULT_UPLOADER_MAX_QUEUE,
                 size_t nb_threads = constants::DEFAULT_UPLOADER_THREADS,
                 size_t batch_workers = constants::DEFAULT_UPLOAD_WORKERS);
    ~BlobUploader();

    BlobUploader(const BlobUploader&) = delete;
    BlobUploader& operator=(const BlobUploader&) = delete;

    void add_blob(BlobData blob);

    /// Run a batch cycle if the backlog exceeds max_list_len.
    /// Returns true if one ran. No-op while idle.
    bool manage();

    /// Spawn the streaming workers (no-op if already running).
    void start();

    /// Join the workers after their in-flight uploads. Items still queued
    /// are left in place and reported with a warning.
    void stop();

    UploaderState state() const { return state_.load(); }
    size_t pending() const;
    UploaderStats stats() const;

    /// "[BlobUploader] Queue: N, Threads: T, Uploaded: U, Failed: F"
    std::string status() const;

private:
    void worker_loop();
    void spawn_workers();
    void join_workers();

    // Blocks until an item is available; nullopt is a stop sentinel
    std::optional<BlobData> pop();

    std::shared_ptr<StorageBackend> backend_;
    size_t max_list_len_;
    size_t nb_threads_;
    size_t batch_workers_;

    // Queue (sentinels are std::nullopt)
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::optional<BlobData>> queue_;
    size_t pending_items_ = 0;

    // Counters
    mutable std::mutex stats_mutex_;
    size_t uploaded_ = 0;
    size_t failed_ = 0;
    size_t batch_cycles_ = 0;

    // Serializes start/stop/manage
    std::mutex control_mutex_;
    std::vector<std::thread> workers_;
    std::atomic<size_t> thread_count_{0};
    std::atomic<UploaderState> state_{UploaderState::Idle};
};

} // namespace ncpfm
