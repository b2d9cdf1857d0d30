#include "ncpfm/transfer.hpp"
#include "ncpfm/core/log.hpp"
#include "ncpfm/core/worker_pool.hpp"
#include "ncpfm/errors.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace ncpfm {

namespace fs = std::filesystem;

namespace {

bool has_parent_segment(const std::string& name) {
    size_t start = 0;
    while (start <= name.size()) {
        auto slash = name.find('/', start);
        if (name.compare(start, slash == std::string::npos ? std::string::npos : slash - start, "..") == 0) {
            return true;
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return false;
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

// Runs task(i) for every name on a pool of max_workers threads and waits
// for all of them. task returns the text recorded in completed() and throws
// to report a failure.
std::vector<std::string> run_batch(const std::vector<std::string>& names,
                                   size_t max_workers,
                                   const std::function<std::string(size_t)>& task) {
    std::mutex mutex;
    std::vector<std::string> completed;
    std::string first_failed;
    std::string first_cause;
    size_t failures = 0;

    completed.reserve(names.size());
    {
        WorkerPool pool(std::min(std::max<size_t>(1, max_workers), std::max<size_t>(1, names.size())));
        for (size_t i = 0; i < names.size(); ++i) {
            pool.submit([&, i]() {
                try {
                    std::string done = task(i);
                    std::lock_guard<std::mutex> lock(mutex);
                    completed.push_back(std::move(done));
                } catch (const std::exception& e) {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (failures++ == 0) {
                        first_failed = names[i];
                        first_cause = e.what();
                    }
                }
            });
        }
        pool.shutdown();
    }

    if (failures > 0) {
        log_error("Batch transfer: %zu of %zu failed, first was %s: %s",
                  failures, names.size(), first_failed.c_str(), first_cause.c_str());
        throw BatchTransferFailed(first_failed, first_cause, std::move(completed), failures);
    }
    return completed;
}

std::vector<fs::path> to_paths(const std::vector<std::string>& strings) {
    return std::vector<fs::path>(strings.begin(), strings.end());
}

}  // anonymous namespace

// ============================================================================
// Single-blob primitives
// ============================================================================

void download_blob(const StorageBackend& backend,
                   const std::string& blob_name,
                   const fs::path& local_path,
                   const DownloadOptions& options) {
    const int attempts = std::max(1, options.max_retries);
    fs::path temp_path = local_path;
    temp_path += constants::TEMP_DOWNLOAD_SUFFIX;

    if (local_path.has_parent_path()) {
        std::error_code dir_ec;
        fs::create_directories(local_path.parent_path(), dir_ec);
        if (dir_ec) {
            throw DownloadFailed(blob_name, local_path.string(), 0,
                                 "cannot create " + local_path.parent_path().string() + ": " + dir_ec.message());
        }
    }

    std::string last_cause;
    std::vector<uint8_t> buffer(constants::DEFAULT_COPY_BUFFER_SIZE);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto reader = backend.open_read(blob_name, options.max_concurrency);
            const uint64_t expected = reader->size();

            {
                std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
                if (!out) {
                    throw StorageError("Cannot create " + temp_path.string());
                }
                while (size_t n = reader->read(buffer)) {
                    out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
                    if (!out) {
                        throw StorageError("Write error on " + temp_path.string());
                    }
                }
            }

            const uint64_t actual = fs::file_size(temp_path);
            if (actual == expected) {
                fs::rename(temp_path, local_path);
                return;
            }

            last_cause = "size mismatch: expected " + std::to_string(expected) +
                         " bytes, got " + std::to_string(actual);
            log_warn("Size verification failed for %s (attempt %d/%d): %s",
                     local_path.c_str(), attempt, attempts, last_cause.c_str());
            remove_quietly(temp_path);
        } catch (const std::exception& e) {
            log_warn("Error downloading %s (attempt %d/%d): %s",
                     local_path.c_str(), attempt, attempts, e.what());
            remove_quietly(temp_path);
            if (attempt == attempts) {
                throw DownloadFailed(blob_name, local_path.string(), attempts, e.what());
            }
            last_cause = e.what();
        }
    }

    throw DownloadFailed(blob_name, local_path.string(), attempts, last_cause);
}

std::string upload_data(StorageBackend& backend,
                        std::span<const uint8_t> data,
                        const std::string& blob_name) {
    PutResult result;
    try {
        result = backend.put(blob_name, data);
    } catch (const std::exception& e) {
        throw UploadFailed(blob_name, e.what());
    }
    if (!result.success) {
        throw UploadFailed(blob_name, result.error_message);
    }
    return blob_name;
}

std::string upload_file(StorageBackend& backend,
                        const fs::path& local_path,
                        const std::string& blob_name,
                        bool remove_local) {
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        throw UploadFailed(blob_name, "no such file: " + local_path.string());
    }

    PutResult result;
    try {
        result = backend.put_file(blob_name, local_path);
    } catch (const std::exception& e) {
        throw UploadFailed(blob_name, e.what());
    }
    if (!result.success) {
        throw UploadFailed(blob_name, result.error_message);
    }

    if (remove_local) {
        fs::remove(local_path, ec);
        if (ec) {
            log_warn("Uploaded %s but could not remove %s: %s",
                     blob_name.c_str(), local_path.c_str(), ec.message().c_str());
        }
    }
    return blob_name;
}

fs::path local_path_for_blob(const std::string& blob_name,
                             const fs::path& download_dir,
                             const std::string& prefix_to_remove) {
    if (has_parent_segment(blob_name)) {
        throw std::invalid_argument("Blob name escapes the download directory: " + blob_name);
    }

    std::string relative = blob_name;
    if (!prefix_to_remove.empty() && relative.starts_with(prefix_to_remove)) {
        relative.erase(0, prefix_to_remove.size());
    }
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    if (relative.empty()) {
        throw std::invalid_argument("Blob name is empty once '" + prefix_to_remove +
                                    "' is removed: " + blob_name);
    }
    return download_dir / relative;
}

std::vector<std::string> list_blob_names_with_prefix(const StorageBackend& backend,
                                                     const std::string& prefix) {
    std::vector<std::string> names;
    for (auto& entry : backend.list_all(prefix)) {
        names.push_back(std::move(entry.key));
    }
    return names;
}

// ============================================================================
// Bulk operations
// ============================================================================

std::vector<fs::path> download_blobs_parallel(const StorageBackend& backend,
                                              const std::vector<std::string>& blob_names,
                                              const fs::path& download_dir,
                                              size_t max_workers,
                                              const std::string& prefix_to_remove,
                                              const DownloadOptions& options) {
    log_debug("Downloading %zu blobs from %s into %s (prefix '%s')",
              blob_names.size(), backend.container().c_str(), download_dir.c_str(),
              prefix_to_remove.c_str());
    fs::create_directories(download_dir);

    auto completed = run_batch(blob_names, max_workers, [&](size_t i) {
        auto local_path = local_path_for_blob(blob_names[i], download_dir, prefix_to_remove);
        download_blob(backend, blob_names[i], local_path, options);
        return local_path.string();
    });
    return to_paths(completed);
}

std::vector<fs::path> download_prefix_parallel(const StorageBackend& backend,
                                               const std::string& prefix,
                                               const fs::path& download_dir,
                                               size_t max_workers,
                                               const DownloadOptions& options) {
    auto names = list_blob_names_with_prefix(backend, prefix);
    return download_blobs_parallel(backend, names, download_dir, max_workers, prefix, options);
}

std::vector<std::string> upload_folder_parallel(StorageBackend& backend,
                                                const fs::path& folder,
                                                const std::string& blob_prefix,
                                                size_t max_workers,
                                                bool remove_local) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        log_debug("Nothing to upload: %s is not a directory", folder.c_str());
        return {};
    }

    std::vector<fs::path> files;
    std::vector<std::string> blob_names;
    fs::recursive_directory_iterator it(folder, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        files.push_back(it->path());
        blob_names.push_back(blob_prefix + it->path().lexically_relative(folder).generic_string());
    }
    if (ec) {
        // Nothing was uploaded; the folder itself is the failed item
        throw BatchTransferFailed(blob_prefix, "cannot enumerate " + folder.string() + ": " + ec.message(),
                                  {}, 1);
    }

    log_debug("Uploading %zu files from %s to %s/%s",
              files.size(), folder.c_str(), backend.container().c_str(), blob_prefix.c_str());

    return run_batch(blob_names, max_workers, [&](size_t i) {
        return upload_file(backend, files[i], blob_names[i], remove_local);
    });
}

std::vector<std::string> upload_blobs_data_parallel(StorageBackend& backend,
                                                    const std::vector<BlobData>& blobs,
                                                    size_t max_workers) {
    std::vector<std::string> blob_names;
    blob_names.reserve(blobs.size());
    for (const auto& blob : blobs) {
        blob_names.push_back(blob.blob_name);
    }

    return run_batch(blob_names, max_workers, [&](size_t i) {
        return upload_data(backend, blobs[i].data, blobs[i].blob_name);
    });
}

} // namespace ncpfm
