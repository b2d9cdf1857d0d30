#pragma once

#include "ncpfm/core/constants.hpp"
#include "ncpfm/storage/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace ncpfm {

// In-memory payload bound for one blob
struct BlobData {
    std::vector<uint8_t> data;
    std::string blob_name;
};

struct DownloadOptions {
    size_t max_concurrency = constants::DEFAULT_CHUNK_CONCURRENCY;  // Parallel chunks per blob
    int max_retries = constants::DEFAULT_DOWNLOAD_RETRIES;
};

// ============================================================================
// Single-blob primitives
// ============================================================================

/// Stream a blob into <local_path>.temp, verify its size against the size
/// reported when the stream was opened, then rename over local_path.
/// A size mismatch is retried; a transport or IO error is retried until the
/// last attempt. Throws DownloadFailed once max_retries attempts are spent.
void download_blob(const StorageBackend& backend,
                   const std::string& blob_name,
                   const std::filesystem::path& local_path,
                   const DownloadOptions& options = {});

/// Overwrite blob_name with data. Returns blob_name. Throws UploadFailed.
std::string upload_data(StorageBackend& backend,
                        std::span<const uint8_t> data,
                        const std::string& blob_name);

/// Upload a local file. The file is removed only after the upload succeeded
/// and only when remove_local is set. Returns blob_name. Throws UploadFailed.
std::string upload_file(StorageBackend& backend,
                        const std::filesystem::path& local_path,
                        const std::string& blob_name,
                        bool remove_local = false);

/// Where a blob lands under download_dir: prefix_to_remove is dropped when the
/// name starts with it, then the remainder is joined onto download_dir.
/// Throws std::invalid_argument for names with ".." segments or nothing left.
std::filesystem::path local_path_for_blob(const std::string& blob_name,
                                          const std::filesystem::path& download_dir,
                                          const std::string& prefix_to_remove = "");

/// Names of every blob starting with prefix. Throws StorageError.
std::vector<std::string> list_blob_names_with_prefix(const StorageBackend& backend,
                                                     const std::string& prefix);

// ============================================================================
// Bulk operations
//
// Every task runs to completion on a pool of max_workers threads. If any
// failed, BatchTransferFailed is thrown naming the first failure seen, with
// the successful results in completed(). Results are unordered.
// ============================================================================

/// Returns the local paths written.
std::vector<std::filesystem::path> download_blobs_parallel(
    const StorageBackend& backend,
    const std::vector<std::string>& blob_names,
    const std::filesystem::path& download_dir,
    size_t max_workers = constants::DEFAULT_DOWNLOAD_WORKERS,
    const std::string& prefix_to_remove = "",
    const DownloadOptions& options = {});

/// List everything under prefix and download it, stripping the prefix.
std::vector<std::filesystem::path> download_prefix_parallel(
    const StorageBackend& backend,
    const std::string& prefix,
    const std::filesystem::path& download_dir,
    size_t max_workers = constants::DEFAULT_PREFIX_DOWNLOAD_WORKERS,
    const DownloadOptions& options = {});

/// Upload every file under folder as blob_prefix + <relative path with '/'>.
/// Returns the blob names written.
std::vector<std::string> upload_folder_parallel(
    StorageBackend& backend,
    const std::filesystem::path& folder,
    const std::string& blob_prefix,
    size_t max_workers = constants::DEFAULT_UPLOAD_WORKERS,
    bool remove_local = false);

/// Returns the blob names written.
std::vector<std::string> upload_blobs_data_parallel(
    StorageBackend& backend,
    const std::vector<BlobData>& blobs,
    size_t max_workers = constants::DEFAULT_UPLOAD_WORKERS);

} // namespace ncpfm
