#pragma once

#include "ncpfm/core/constants.hpp"
#include "ncpfm/storage/backend.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ncpfm {

/// Administrative operations that need the account credential: pseudo
/// folders, access URLs, listings with download URLs, prefix deletes and
/// tier changes.
class StorageClient {
public:
    explicit StorageClient(std::shared_ptr<StorageAccount> account);

    StorageAccount& account() const { return *account_; }

    // --- Pseudo folders ---

    /// Upload an empty "<record_path>.keep" marker (overwrites).
    void create_record_pseudo_folder(const std::string& container, const std::string& record_path);

    /// Same marker for calibrations; skipped with a warning when a blob
    /// already exists at calibrations_path.
    void create_calibrations_pseudo_folder(const std::string& container,
                                           const std::string& calibrations_path);

    // --- Access URLs ---

    std::string generate_container_read_url(const std::string& container,
                                            std::chrono::hours validity =
                                                std::chrono::hours(constants::DEFAULT_DOWNLOAD_HANDLE_HOURS)) const;

    std::string generate_container_read_write_url(const std::string& container,
                                                  std::chrono::hours validity =
                                                      std::chrono::hours(constants::DEFAULT_UPLOAD_HANDLE_HOURS)) const;

    std::string generate_url_with_permissions(const std::string& container,
                                              const Permissions& permissions,
                                              std::chrono::hours validity) const;

    std::string generate_blob_upload_url(const std::string& container, const std::string& blob,
                                         std::chrono::hours validity =
                                             std::chrono::hours(constants::DEFAULT_UPLOAD_HANDLE_HOURS)) const;

    std::string generate_blob_download_url(const std::string& container, const std::string& blob,
                                           std::chrono::hours validity =
                                               std::chrono::hours(constants::DEFAULT_DOWNLOAD_HANDLE_HOURS)) const;

    // --- Queries ---

    bool blob_exists(const std::string& container, const std::string& blob) const;

    /// Throws StorageError (404) when the blob does not exist.
    uint64_t blob_size(const std::string& container, const std::string& blob) const;

    /// Download URLs for every blob under prefix, skipping ".keep" markers
    /// and empty blobs.
    std::vector<std::string> list_blob_download_urls(const std::string& container,
                                                     const std::string& prefix) const;

    /// Same, grouped by the first folder below prefix. Blobs directly under
    /// the prefix are grouped under "root"; empty groups are omitted.
    std::map<std::string, std::vector<std::string>> list_blob_download_urls_with_folders(
        const std::string& container, std::string prefix) const;

    // --- Mutations ---

    /// Delete every blob under prefix except ".keep" markers. Returns 0 when
    /// nothing matched, otherwise the number deleted. Throws StorageError if
    /// the listing fails and BatchTransferFailed if any delete fails.
    size_t delete_blobs_by_prefix(const std::string& container, const std::string& prefix);

    bool change_blob_access_tier(const std::string& container, const std::string& blob, StorageTier tier);

private:
    std::unique_ptr<StorageBackend> open(const std::string& container) const;

    std::shared_ptr<StorageAccount> account_;
};

} // namespace ncpfm
