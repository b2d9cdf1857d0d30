#include "ncpfm/file_manager.hpp"
#include "ncpfm/core/log.hpp"
#include "ncpfm/errors.hpp"
#include "ncpfm/image_naming.hpp"
#include "ncpfm/metrics.hpp"
#include "ncpfm/storage_client.hpp"
#include "ncpfm/transfer.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>

namespace fs = std::filesystem;

namespace ncpfm {

namespace {

std::string as_directory_prefix(std::string prefix) {
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
    return prefix;
}

bool has_path_segment(const std::string& path, const std::string& segment) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (path.compare(start, slash - start, segment) == 0) return true;
        start = slash + 1;
    }
    return false;
}

std::string lower_extension(const std::string& name) {
    std::string ext = fs::path(name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

uint64_t file_bytes(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

uint64_t folder_bytes(const fs::path& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) return 0;
    uint64_t total = 0;
    for (const auto& entry : fs::recursive_directory_iterator(folder, ec)) {
        if (entry.is_regular_file()) total += file_bytes(entry.path());
    }
    return total;
}

std::vector<std::string> filter_containing(std::vector<std::string> names, const std::string& text) {
    if (text.empty()) return names;
    std::erase_if(names, [&](const std::string& name) { return name.find(text) == std::string::npos; });
    return names;
}

}  // anonymous namespace

NcpFileManager::NcpFileManager(BlobStorageStructure structure,
                               const std::string& instance_id,
                               FileManagerConfig config,
                               bool use_record_dir)
    : structure_(std::move(structure)),
      config_(std::move(config)) {
    if (config_.verbose) {
        set_log_level(LogLevel::Debug);
    }
    if (!config_.account.empty()) {
        account_ = StorageBackendFactory::create(config_.account);
    }

    tmp_dir_ = config_.tmp_root / ("gopro_" + instance_id);
    if (use_record_dir && !structure_.record_prefix.empty()) {
        tmp_dir_ /= structure_.record_prefix;
    }
    input_dir_ = tmp_dir_ / "input";
    output_dir_ = tmp_dir_ / "output";
    downloaded_frame_dir_ = input_dir_ / "frames";
    downloaded_equirect_dir_ = input_dir_ / "equirect";
    processed_frame_dir_ = output_dir_ / "frames";
    processed_equirect_dir_ = output_dir_ / "equirect";

    const auto& extracted = structure_.container_extracted;
    for (auto file : ALL_NCP_RESULT_FILES) {
        auto it = extracted.ncp_result_blobs.find(ncp_result_key(file));
        if (it != extracted.ncp_result_blobs.end()) {
            processed_ncp_results_[file] = input_dir_ / it->second;
        }
    }
    for (auto file : ALL_L2R_RESULT_FILES) {
        auto it = extracted.l2r_result_blobs.find(l2r_result_key(file));
        if (it != extracted.l2r_result_blobs.end()) {
            processed_l2r_results_[file] = input_dir_ / it->second;
        }
    }

    for (const auto* dir : {&tmp_dir_, &input_dir_, &output_dir_,
                            &downloaded_frame_dir_, &downloaded_equirect_dir_,
                            &processed_frame_dir_, &processed_equirect_dir_}) {
        std::error_code ec;
        fs::create_directories(*dir, ec);
        if (ec) {
            throw InvalidConfiguration("Cannot create scratch directory " + dir->string() +
                                       ": " + ec.message());
        }
    }

    set_l2r_blob_names("");

    if (!config_.metrics_file.empty()) {
        auto interval = std::chrono::seconds(std::max<size_t>(1, config_.metrics_interval_secs));
        owned_metrics_ = std::make_shared<MetricsExporter>(
            config_.metrics_file, interval, std::map<std::string, std::string>{{"instance", instance_id}});
        owned_metrics_->start();
        metrics_ = owned_metrics_.get();
        log_info("Writing metrics to %s every %llds", config_.metrics_file.c_str(),
                 static_cast<long long>(interval.count()));
    }
}

NcpFileManager::~NcpFileManager() {
    if (owned_metrics_) {
        owned_metrics_->stop();
    }
}

void NcpFileManager::clean() {
    log_debug("Cleaning scratch directory %s", tmp_dir_.c_str());
    std::error_code ec;
    fs::remove_all(tmp_dir_, ec);
    if (ec) {
        log_warn("Cannot remove %s: %s", tmp_dir_.c_str(), ec.message().c_str());
    }
}

// ============================================================================
// Access
// ============================================================================

StorageAccount& NcpFileManager::account() const {
    if (!account_) {
        throw InvalidConfiguration("No storage account configured");
    }
    return *account_;
}

void NcpFileManager::set_permissions(const Permissions& raw,
                                     const Permissions& extracted,
                                     const Permissions& processed) {
    auto& acct = account();
    auto validity_for = [&](const Permissions& p) {
        bool writes = p.write || p.create || p.add || p.remove;
        return std::chrono::hours(writes ? config_.upload_handle_hours : config_.download_handle_hours);
    };

    const std::pair<ContainerType, const Permissions*> grants[] = {
        {ContainerType::Raw, &raw},
        {ContainerType::Extracted, &extracted},
        {ContainerType::Processed, &processed},
    };
    for (const auto& [type, perms] : grants) {
        auto& container = structure_.container(type);
        container.sas_url = acct.generate_container_handle(container.name, *perms,
                                                           validity_for(*perms)).url();
        log_debug("Access handle for %s container '%s': %s",
                  container_type_name(type), container.name.c_str(), perms->to_string().c_str());
    }
}

std::shared_ptr<StorageBackend> NcpFileManager::backend(ContainerType type) const {
    const auto& container = structure_.container(type);
    if (!container.sas_url.empty()) {
        auto handle = AccessHandle::from_url(container.sas_url);
        if (!handle) {
            throw InvalidConfiguration(std::string("Malformed access handle URL for ") +
                                       container_type_name(type) + " container");
        }
        return StorageBackendFactory::from_access_handle(*handle);
    }
    if (account_) {
        return account_->open_container(container.name);
    }
    throw InvalidConfiguration(std::string("No access handle or account for ") +
                               container_type_name(type) + " container '" + container.name + "'");
}

// ============================================================================
// Accounting
// ============================================================================

std::vector<fs::path> NcpFileManager::tracked_download(
    const std::function<std::vector<fs::path>()>& fn) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->download_duration());

    auto account_paths = [&](const std::vector<fs::path>& paths) {
        uint64_t bytes = 0;
        for (const auto& p : paths) bytes += file_bytes(p);
        {
            std::lock_guard lock(stats_mutex_);
            stats_.downloads_completed += paths.size();
            stats_.bytes_downloaded += bytes;
        }
        if (metrics_) {
            metrics_->downloads_success().Increment(static_cast<double>(paths.size()));
            metrics_->download_bytes_total().Increment(static_cast<double>(bytes));
        }
    };
    auto account_failures = [&](size_t count, bool batch) {
        {
            std::lock_guard lock(stats_mutex_);
            stats_.downloads_failed += count;
            if (batch) ++stats_.batch_failures;
        }
        if (metrics_) {
            metrics_->downloads_failure().Increment(static_cast<double>(count));
            if (batch) metrics_->batch_failures_total().Increment();
        }
    };

    try {
        auto paths = fn();
        account_paths(paths);
        return paths;
    } catch (const BatchTransferFailed& e) {
        std::vector<fs::path> completed(e.completed().begin(), e.completed().end());
        account_paths(completed);
        account_failures(e.failure_count(), true);
        throw;
    } catch (const DownloadFailed&) {
        account_failures(1, false);
        throw;
    }
}

std::vector<std::string> NcpFileManager::tracked_upload(
    uint64_t bytes,
    const std::function<std::vector<std::string>()>& fn) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    auto account_failures = [&](size_t completed, size_t failed, bool batch) {
        {
            std::lock_guard lock(stats_mutex_);
            stats_.uploads_completed += completed;
            stats_.uploads_failed += failed;
            if (batch) ++stats_.batch_failures;
        }
        if (metrics_) {
            metrics_->uploads_success().Increment(static_cast<double>(completed));
            metrics_->uploads_failure().Increment(static_cast<double>(failed));
            if (batch) metrics_->batch_failures_total().Increment();
        }
    };

    try {
        auto names = fn();
        {
            std::lock_guard lock(stats_mutex_);
            stats_.uploads_completed += names.size();
            stats_.bytes_uploaded += bytes;
        }
        if (metrics_) {
            metrics_->uploads_success().Increment(static_cast<double>(names.size()));
            metrics_->upload_bytes_total().Increment(static_cast<double>(bytes));
        }
        return names;
    } catch (const BatchTransferFailed& e) {
        account_failures(e.completed().size(), e.failure_count(), true);
        throw;
    } catch (const UploadFailed&) {
        account_failures(0, 1, false);
        throw;
    }
}

NcpFileManager::Stats NcpFileManager::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// Paths
// ============================================================================

fs::path NcpFileManager::resolve_dir(const fs::path& dir) const {
    return dir.empty() ? input_dir_ : dir;
}

std::string NcpFileManager::record_directory_prefix(const std::string& relative) const {
    return as_directory_prefix(structure_.record_blob_path(relative));
}

std::string NcpFileManager::remove_record_prefix(const std::string& path) const {
    const auto& prefix = structure_.record_prefix;
    if (!prefix.empty() && path.starts_with(prefix)) {
        return path.substr(prefix.size());
    }
    return path;
}

fs::path NcpFileManager::downloaded_blob_path(const std::string& blob_name,
                                              const fs::path& download_dir) const {
    return local_path_for_blob(blob_name, resolve_dir(download_dir),
                               as_directory_prefix(structure_.record_prefix));
}

std::optional<fs::path> NcpFileManager::downloaded_ncp_result(NcpResultFile file) const {
    auto it = downloaded_ncp_results_.find(file);
    if (it == downloaded_ncp_results_.end()) return std::nullopt;
    return it->second;
}

void NcpFileManager::set_processed_ncp_result(NcpResultFile file, const fs::path& path) {
    processed_ncp_results_[file] = path;
}

void NcpFileManager::set_processed_l2r_result(L2rResultFile file, const fs::path& path) {
    processed_l2r_results_[file] = path;
}

void NcpFileManager::set_l2r_blob_names(const std::string& gps_reader_name) {
    L2rResultNames names(gps_reader_name);
    for (auto file : ALL_L2R_RESULT_FILES) {
        l2r_blob_names_[file] = names.path(file);
    }
}

const std::string& NcpFileManager::l2r_blob_name(L2rResultFile file) const {
    return l2r_blob_names_.at(file);
}

// ============================================================================
// Downloads
// ============================================================================

fs::path NcpFileManager::download_blob(ContainerType type,
                                       const std::string& blob_name,
                                       const fs::path& download_dir,
                                       bool remove_prefix) {
    auto source = backend(type);
    std::string prefix = remove_prefix ? as_directory_prefix(structure_.record_prefix) : "";
    auto local_path = local_path_for_blob(blob_name, resolve_dir(download_dir), prefix);

    DownloadOptions options;
    options.max_concurrency = config_.chunk_concurrency;
    options.max_retries = config_.download_retries;

    auto paths = tracked_download([&] {
        ncpfm::download_blob(*source, blob_name, local_path, options);
        return std::vector<fs::path>{local_path};
    });
    return paths.front();
}

fs::path NcpFileManager::download_calibration_video(ContainerType type,
                                                    const std::string& blob_name,
                                                    const fs::path& download_dir) {
    return download_blob(type, blob_name, download_dir, false);
}

std::vector<fs::path> NcpFileManager::download_blobs_parallel(ContainerType type,
                                                              const std::vector<std::string>& blob_names,
                                                              const fs::path& download_dir,
                                                              const std::string& prefix_to_remove) {
    auto source = backend(type);
    DownloadOptions options;
    options.max_concurrency = config_.chunk_concurrency;
    options.max_retries = config_.download_retries;

    return tracked_download([&] {
        return ncpfm::download_blobs_parallel(*source, blob_names, resolve_dir(download_dir),
                                              config_.download_workers, prefix_to_remove, options);
    });
}

std::vector<fs::path> NcpFileManager::download_blobs_with_prefix(ContainerType type,
                                                                 const std::string& prefix,
                                                                 const fs::path& download_dir) {
    auto source = backend(type);
    DownloadOptions options;
    options.max_concurrency = config_.chunk_concurrency;
    options.max_retries = config_.download_retries;

    return tracked_download([&] {
        return download_prefix_parallel(*source, prefix, resolve_dir(download_dir),
                                        config_.prefix_download_workers, options);
    });
}

fs::path NcpFileManager::download_ncp_result_file(ContainerType type, NcpResultFile file) {
    auto blob_name = structure_.record_blob_path(structure_.ncp_result_blob(type, file));
    auto path = download_blob(type, blob_name, input_dir_);
    downloaded_ncp_results_[file] = path;
    return path;
}

std::vector<fs::path> NcpFileManager::download_frames(ContainerType type) {
    auto prefix = record_directory_prefix(structure_.frame_directory_prefix(type));
    return download_blobs_with_prefix(type, prefix, downloaded_frame_dir_);
}

std::vector<fs::path> NcpFileManager::download_equirects(ContainerType type) {
    auto prefix = record_directory_prefix(structure_.equirect_directory_prefix(type));
    return download_blobs_with_prefix(type, prefix, downloaded_equirect_dir_);
}

// ============================================================================
// Uploads
// ============================================================================

std::string NcpFileManager::upload_record_file(ContainerType type,
                                               const fs::path& local_path,
                                               const std::string& blob_name,
                                               bool remove_local) {
    auto target = backend(type);
    auto full_name = structure_.record_blob_path(blob_name);
    auto names = tracked_upload(file_bytes(local_path), [&] {
        return std::vector<std::string>{upload_file(*target, local_path, full_name, remove_local)};
    });
    return names.front();
}

std::vector<std::string> NcpFileManager::upload_folder_parallel(ContainerType type,
                                                                const fs::path& folder,
                                                                const std::string& blob_prefix,
                                                                bool remove_local) {
    auto target = backend(type);
    return tracked_upload(folder_bytes(folder), [&] {
        return ncpfm::upload_folder_parallel(*target, folder, blob_prefix,
                                             config_.upload_workers, remove_local);
    });
}

std::vector<std::string> NcpFileManager::upload_record_folder_parallel(ContainerType type,
                                                                       const fs::path& folder,
                                                                       const std::string& blob_prefix,
                                                                       bool remove_local) {
    return upload_folder_parallel(type, folder, record_directory_prefix(blob_prefix), remove_local);
}

std::string NcpFileManager::upload_downloaded_ncp_result_file(ContainerType type, NcpResultFile file) {
    auto it = downloaded_ncp_results_.find(file);
    if (it == downloaded_ncp_results_.end()) {
        throw InvalidConfiguration(std::string(ncp_result_key(file)) + " has not been downloaded");
    }
    return upload_record_file(type, it->second, structure_.ncp_result_blob(type, file));
}

std::string NcpFileManager::upload_processed_ncp_result_file(ContainerType type, NcpResultFile file) {
    auto it = processed_ncp_results_.find(file);
    if (it == processed_ncp_results_.end()) {
        throw InvalidConfiguration(std::string("no processed path for ") + ncp_result_key(file));
    }
    return upload_record_file(type, it->second, structure_.ncp_result_blob(type, file));
}

std::string NcpFileManager::upload_processed_ncp_imu(ContainerType type,
                                                     const fs::path& imu_file,
                                                     const std::string& target_blob_name) {
    return upload_record_file(type, imu_file, target_blob_name);
}

std::string NcpFileManager::upload_processed_l2r_result_file(ContainerType type, L2rResultFile file) {
    auto it = processed_l2r_results_.find(file);
    if (it == processed_l2r_results_.end()) {
        throw InvalidConfiguration(std::string("no processed path for ") + l2r_result_key(file));
    }
    return upload_record_file(type, it->second, l2r_blob_name(file));
}

std::vector<std::string> NcpFileManager::upload_downloaded_frames(ContainerType type) {
    return upload_record_folder_parallel(type, downloaded_frame_dir_,
                                         structure_.frame_directory_prefix(type));
}

std::vector<std::string> NcpFileManager::upload_processed_frames(ContainerType type,
                                                                 const fs::path& local_dir) {
    return upload_record_folder_parallel(type, local_dir.empty() ? processed_frame_dir_ : local_dir,
                                         structure_.frame_directory_prefix(type));
}

std::vector<std::string> NcpFileManager::upload_downloaded_equirects(ContainerType type) {
    return upload_record_folder_parallel(type, downloaded_equirect_dir_,
                                         structure_.equirect_directory_prefix(type));
}

std::vector<std::string> NcpFileManager::upload_processed_equirects(ContainerType type,
                                                                    const std::string& extra_prefix) {
    auto prefix = join_blob_path(extra_prefix, structure_.equirect_directory_prefix(type));
    return upload_record_folder_parallel(type, processed_equirect_dir_, prefix);
}

// ============================================================================
// Listing
// ============================================================================

std::vector<std::string> NcpFileManager::list_blob_names(ContainerType type,
                                                         const std::string& prefix,
                                                         const std::vector<std::string>& extensions) const {
    auto names = list_blob_names_with_prefix(*backend(type), prefix);
    if (extensions.empty()) return names;

    std::erase_if(names, [&](const std::string& name) {
        return std::find(extensions.begin(), extensions.end(), lower_extension(name)) == extensions.end();
    });
    return names;
}

std::vector<std::string> NcpFileManager::list_frame_blob_names(ContainerType type,
                                                               const std::string& name_contains) const {
    auto prefix = record_directory_prefix(structure_.frame_directory_prefix(type));
    auto names = list_blob_names_with_prefix(*backend(type), prefix);
    std::erase_if(names, [](const std::string& name) { return !has_allowed_image_extension(name); });
    return filter_containing(std::move(names), name_contains);
}

std::vector<std::string> NcpFileManager::list_cubemap_blob_names(ContainerType type) const {
    return list_frame_blob_names(type, image_type_value(ImageType::Cubemap));
}

std::vector<std::string> NcpFileManager::list_equirect_blob_names(ContainerType type) const {
    auto prefix = record_directory_prefix(structure_.equirect_directory_prefix(type));
    auto names = list_blob_names_with_prefix(*backend(type), prefix);
    std::erase_if(names, [](const std::string& name) { return !has_allowed_image_extension(name); });
    return filter_containing(std::move(names), image_type_value(ImageType::Equirect));
}

bool NcpFileManager::blob_exists(ContainerType type, const std::string& blob_name) const {
    return backend(type)->exists(blob_name);
}

// ============================================================================
// Deletion
// ============================================================================

size_t NcpFileManager::delete_all_files_in_container(ContainerType type) {
    if (structure_.record_prefix.empty()) {
        throw InvalidConfiguration("Refusing to delete without a record prefix");
    }
    const auto& container = structure_.container(type);
    const auto prefix = as_directory_prefix(structure_.record_prefix);
    log_info("Deleting files with prefix '%s' in %s container '%s'",
             prefix.c_str(), container_type_name(type), container.name.c_str());

    StorageClient client(account_);
    size_t deleted = client.delete_blobs_by_prefix(container.name, prefix);
    log_info("Deleted %zu blobs from container '%s'", deleted, container.name.c_str());
    return deleted;
}

size_t NcpFileManager::delete_all_files_in_container_for_record(ContainerType type,
                                                                const Record& record,
                                                                const BlobStorageStructure* structure) {
    BlobStorageStructure derived;
    if (!structure) {
        if (config_.structure_template.empty()) {
            throw InvalidConfiguration("No structure template configured to resolve record " + record.slot);
        }
        derived = BlobStorageStructure::from_record(
            BlobStorageStructure::load_template(config_.structure_template), config_.containers, record);
        structure = &derived;
    }

    const auto& record_prefix = structure->record_prefix;
    if (record.slot.empty() || !has_path_segment(record_prefix, record.slot)) {
        throw InvalidConfiguration("Record '" + record.slot + "' not found in record prefix '" +
                                   record_prefix + "'");
    }

    StorageClient client(account_);
    return client.delete_blobs_by_prefix(structure->container(type).name, as_directory_prefix(record_prefix));
}

size_t NcpFileManager::delete_all_files_in_all_containers_for_record(const Record& record) {
    size_t total = 0;
    for (auto type : ALL_CONTAINER_TYPES) {
        total += delete_all_files_in_container_for_record(type, record);
    }
    return total;
}

// ============================================================================
// Uploader
// ============================================================================

UploaderHandle NcpFileManager::make_uploader(ContainerType type) const {
    auto metrics = owned_metrics_;
    UploaderHandle uploader(new BlobUploader(backend(type),
                                             config_.uploader_max_queue,
                                             config_.uploader_threads,
                                             config_.upload_workers),
                            [metrics](BlobUploader* u) {
                                if (metrics) metrics->release_uploader(u);
                                delete u;
                            });
    if (metrics) {
        metrics->set_uploader(uploader.get());
    }
    return uploader;
}

} // namespace ncpfm
