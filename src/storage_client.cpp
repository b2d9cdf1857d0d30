#include "ncpfm/storage_client.hpp"
#include "ncpfm/core/log.hpp"
#include "ncpfm/errors.hpp"

#include <algorithm>

namespace ncpfm {

namespace {

bool is_listable(const ListEntry& entry) {
    return !entry.key.ends_with(constants::PSEUDO_FOLDER_MARKER) && entry.size > 0;
}

}  // anonymous namespace

StorageClient::StorageClient(std::shared_ptr<StorageAccount> account)
    : account_(std::move(account)) {
    if (!account_) {
        throw InvalidConfiguration("StorageClient requires a storage account");
    }
}

std::unique_ptr<StorageBackend> StorageClient::open(const std::string& container) const {
    return account_->open_container(container);
}

// --- Pseudo folders ---

void StorageClient::create_record_pseudo_folder(const std::string& container,
                                                const std::string& record_path) {
    auto backend = open(container);
    std::string marker = record_path + constants::PSEUDO_FOLDER_MARKER;
    auto result = backend->put(marker, {});
    if (!result.success) {
        throw UploadFailed(marker, result.error_message);
    }
}

void StorageClient::create_calibrations_pseudo_folder(const std::string& container,
                                                      const std::string& calibrations_path) {
    auto backend = open(container);
    if (backend->exists(calibrations_path)) {
        log_warn("Blob %s already exists", calibrations_path.c_str());
        return;
    }
    std::string marker = calibrations_path + constants::PSEUDO_FOLDER_MARKER;
    auto result = backend->put(marker, {});
    if (!result.success) {
        throw UploadFailed(marker, result.error_message);
    }
}

// --- Access URLs ---

std::string StorageClient::generate_url_with_permissions(const std::string& container,
                                                         const Permissions& permissions,
                                                         std::chrono::hours validity) const {
    return account_->generate_container_handle(container, permissions, validity).url();
}

std::string StorageClient::generate_container_read_url(const std::string& container,
                                                       std::chrono::hours validity) const {
    return generate_url_with_permissions(container, Permissions::read_only(), validity);
}

std::string StorageClient::generate_container_read_write_url(const std::string& container,
                                                             std::chrono::hours validity) const {
    return generate_url_with_permissions(container, Permissions::read_write(), validity);
}

std::string StorageClient::generate_blob_upload_url(const std::string& container,
                                                    const std::string& blob,
                                                    std::chrono::hours validity) const {
    return account_->generate_access_handle(container, blob, Permissions::blob_upload(), validity).url();
}

std::string StorageClient::generate_blob_download_url(const std::string& container,
                                                      const std::string& blob,
                                                      std::chrono::hours validity) const {
    return account_->generate_access_handle(container, blob, Permissions::blob_download(), validity).url();
}

// --- Queries ---

bool StorageClient::blob_exists(const std::string& container, const std::string& blob) const {
    return open(container)->exists(blob);
}

uint64_t StorageClient::blob_size(const std::string& container, const std::string& blob) const {
    auto meta = open(container)->head(blob);
    if (!meta) {
        throw StorageError("Blob not found: " + container + "/" + blob, 404);
    }
    return meta->size;
}

std::vector<std::string> StorageClient::list_blob_download_urls(const std::string& container,
                                                                const std::string& prefix) const {
    std::vector<std::string> urls;
    for (const auto& entry : open(container)->list_all(prefix)) {
        if (!is_listable(entry)) continue;
        urls.push_back(generate_blob_download_url(container, entry.key));
    }
    return urls;
}

std::map<std::string, std::vector<std::string>> StorageClient::list_blob_download_urls_with_folders(
    const std::string& container, std::string prefix) const {
    if (!prefix.ends_with('/')) {
        prefix += '/';
    }

    std::map<std::string, std::vector<std::string>> folders;
    for (const auto& entry : open(container)->list_all(prefix)) {
        if (!is_listable(entry)) continue;

        std::string relative = entry.key.substr(prefix.size());
        auto slash = relative.find('/');
        std::string folder = slash == std::string::npos ? "root" : relative.substr(0, slash);
        folders[folder].push_back(generate_blob_download_url(container, entry.key));
    }
    return folders;
}

// --- Mutations ---

size_t StorageClient::delete_blobs_by_prefix(const std::string& container, const std::string& prefix) {
    auto backend = open(container);

    std::vector<std::string> to_delete;
    for (auto& entry : backend->list_all(prefix)) {
        if (entry.key.ends_with(constants::PSEUDO_FOLDER_MARKER)) continue;
        to_delete.push_back(std::move(entry.key));
    }

    if (to_delete.empty()) {
        log_debug("No blobs found with prefix '%s' in container '%s' to delete",
                  prefix.c_str(), container.c_str());
        return 0;
    }

    log_debug("Deleting %zu blobs with prefix '%s' in container '%s'",
              to_delete.size(), prefix.c_str(), container.c_str());

    auto failed = backend->remove_batch(to_delete);
    if (!failed.empty()) {
        std::vector<std::string> completed;
        for (const auto& name : to_delete) {
            if (std::find(failed.begin(), failed.end(), name) == failed.end()) {
                completed.push_back(name);
            }
        }
        log_error("Batch delete under '%s' in '%s': %zu of %zu failed",
                  prefix.c_str(), container.c_str(), failed.size(), to_delete.size());
        throw BatchTransferFailed(failed.front(), "delete failed", std::move(completed), failed.size());
    }
    return to_delete.size();
}

bool StorageClient::change_blob_access_tier(const std::string& container, const std::string& blob,
                                            StorageTier tier) {
    bool ok = open(container)->set_tier(blob, tier);
    if (ok) {
        log_info("Changed access tier of blob '%s' in container '%s' to '%s'",
                 blob.c_str(), container.c_str(), storage_tier_name(tier));
    } else {
        log_error("Failed to change access tier for blob '%s' in container '%s'",
                  blob.c_str(), container.c_str());
    }
    return ok;
}

} // namespace ncpfm
