#pragma once

#include "ncpfm/blob_uploader.hpp"
#include "ncpfm/config.hpp"
#include "ncpfm/models.hpp"
#include "ncpfm/storage/backend.hpp"
#include "ncpfm/storage_structure.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ncpfm {

class MetricsExporter;

/// Uploader returned by NcpFileManager::make_uploader. Its deleter detaches
/// it from the manager's exporter before destroying it.
using UploaderHandle = std::unique_ptr<BlobUploader, std::function<void(BlobUploader*)>>;

/// Record-level transfers between local scratch space and the three
/// storage containers.
///
/// Each instance owns a scratch tree:
///   <tmp_root>/gopro_<instance>/<record_prefix>/input/{frames,equirect}
///   <tmp_root>/gopro_<instance>/<record_prefix>/output/{frames,equirect}
/// created eagerly by the constructor.
///
/// Containers are reached through the access handle URL stored in the
/// structure (see set_permissions) or, failing that, with the account
/// credential from config.account.
///
/// With config.metrics_file set, the manager owns a running MetricsExporter
/// labelled with the instance id.
class NcpFileManager {
public:
    NcpFileManager(BlobStorageStructure structure,
                   const std::string& instance_id,
                   FileManagerConfig config = {},
                   bool use_record_dir = true);
    ~NcpFileManager();

    NcpFileManager(const NcpFileManager&) = delete;
    NcpFileManager& operator=(const NcpFileManager&) = delete;

    /// Remove the scratch tree.
    void clean();

    // --- Access ---

    /// Mint container handles with the account credential and store their
    /// URLs in the structure. Throws InvalidConfiguration without an account.
    void set_permissions(const Permissions& raw = Permissions::read_only(),
                         const Permissions& extracted = Permissions::read_write(),
                         const Permissions& processed = Permissions::read_write());

    /// Backend for a container: stored handle URL first, then the account.
    /// Throws InvalidConfiguration when neither is available.
    std::shared_ptr<StorageBackend> backend(ContainerType type) const;

    // --- Downloads ---

    std::filesystem::path download_ncp_result_file(ContainerType type, NcpResultFile file);

    std::vector<std::filesystem::path> download_frames(ContainerType type);
    std::vector<std::filesystem::path> download_equirects(ContainerType type);

    /// Download one blob. The record prefix is dropped from the local path
    /// when remove_prefix is set. Defaults to the input directory.
    std::filesystem::path download_blob(ContainerType type,
                                        const std::string& blob_name,
                                        const std::filesystem::path& download_dir = {},
                                        bool remove_prefix = true);

    /// Calibration videos live outside the record, so the name is kept whole.
    std::filesystem::path download_calibration_video(ContainerType type,
                                                     const std::string& blob_name,
                                                     const std::filesystem::path& download_dir = {});

    std::vector<std::filesystem::path> download_blobs_parallel(
        ContainerType type,
        const std::vector<std::string>& blob_names,
        const std::filesystem::path& download_dir = {},
        const std::string& prefix_to_remove = "");

    std::vector<std::filesystem::path> download_blobs_with_prefix(
        ContainerType type,
        const std::string& prefix,
        const std::filesystem::path& download_dir = {});

    // --- Uploads ---

    std::string upload_downloaded_ncp_result_file(ContainerType type, NcpResultFile file);
    std::string upload_processed_ncp_result_file(ContainerType type, NcpResultFile file);
    std::string upload_processed_ncp_imu(ContainerType type,
                                         const std::filesystem::path& imu_file,
                                         const std::string& target_blob_name);
    std::string upload_processed_l2r_result_file(ContainerType type, L2rResultFile file);

    std::vector<std::string> upload_downloaded_frames(ContainerType type);
    std::vector<std::string> upload_processed_frames(ContainerType type,
                                                     const std::filesystem::path& local_dir = {});
    std::vector<std::string> upload_downloaded_equirects(ContainerType type);
    std::vector<std::string> upload_processed_equirects(ContainerType type,
                                                        const std::string& extra_prefix = "");

    /// Upload a file as <record_prefix>/<blob_name>.
    std::string upload_record_file(ContainerType type,
                                   const std::filesystem::path& local_path,
                                   const std::string& blob_name,
                                   bool remove_local = false);

    /// Upload a folder under <record_prefix>/<blob_prefix>/.
    std::vector<std::string> upload_record_folder_parallel(ContainerType type,
                                                           const std::filesystem::path& folder,
                                                           const std::string& blob_prefix = "",
                                                           bool remove_local = false);

    /// Upload a folder under blob_prefix as given.
    std::vector<std::string> upload_folder_parallel(ContainerType type,
                                                    const std::filesystem::path& folder,
                                                    const std::string& blob_prefix,
                                                    bool remove_local = false);

    // --- Listing and queries ---

    /// Blob names under prefix whose extension (case-insensitive) is in
    /// extensions. An empty extension list matches everything.
    std::vector<std::string> list_blob_names(ContainerType type,
                                             const std::string& prefix = "",
                                             const std::vector<std::string>& extensions = {}) const;

    std::vector<std::string> list_frame_blob_names(ContainerType type,
                                                   const std::string& name_contains = "") const;
    std::vector<std::string> list_cubemap_blob_names(ContainerType type) const;
    std::vector<std::string> list_equirect_blob_names(ContainerType type) const;

    bool blob_exists(ContainerType type, const std::string& blob_name) const;

    /// Drop the record prefix when path starts with it.
    std::string remove_record_prefix(const std::string& path) const;

    /// Local path a blob downloads to (record prefix removed).
    std::filesystem::path downloaded_blob_path(const std::string& blob_name,
                                               const std::filesystem::path& download_dir = {}) const;

    // --- Deletion (needs the account credential) ---

    /// Delete every blob under "<record_prefix>/" in one container. Returns
    /// the count. Throws InvalidConfiguration on an empty record prefix.
    size_t delete_all_files_in_container(ContainerType type);

    /// Same for another record. Without a structure, one is built from the
    /// configured template. Throws InvalidConfiguration unless the record
    /// slot is a whole segment of the structure's record prefix.
    size_t delete_all_files_in_container_for_record(ContainerType type,
                                                    const Record& record,
                                                    const BlobStorageStructure* structure = nullptr);

    size_t delete_all_files_in_all_containers_for_record(const Record& record);

    // --- Misc ---

    void set_l2r_blob_names(const std::string& gps_reader_name);
    const std::string& l2r_blob_name(L2rResultFile file) const;

    /// Background uploader bound to one container, sized from the config.
    /// Its gauges are exported while it lives when the manager owns an exporter.
    UploaderHandle make_uploader(ContainerType type) const;

    /// Exporter fed by every transfer (not owned, may be nullptr). Replaces
    /// the exporter built from config.metrics_file for transfer accounting.
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }
    MetricsExporter* metrics() const { return metrics_; }

    // --- Paths ---

    const BlobStorageStructure& structure() const { return structure_; }
    const std::string& record_prefix() const { return structure_.record_prefix; }
    const std::filesystem::path& tmp_dir() const { return tmp_dir_; }
    const std::filesystem::path& input_dir() const { return input_dir_; }
    const std::filesystem::path& output_dir() const { return output_dir_; }
    const std::filesystem::path& downloaded_frame_dir() const { return downloaded_frame_dir_; }
    const std::filesystem::path& downloaded_equirect_dir() const { return downloaded_equirect_dir_; }
    const std::filesystem::path& processed_frame_dir() const { return processed_frame_dir_; }
    const std::filesystem::path& processed_equirect_dir() const { return processed_equirect_dir_; }

    /// Local path of a downloaded NCP result, if it was downloaded.
    std::optional<std::filesystem::path> downloaded_ncp_result(NcpResultFile file) const;

    /// Override where the processed result files are read from.
    void set_processed_ncp_result(NcpResultFile file, const std::filesystem::path& path);
    void set_processed_l2r_result(L2rResultFile file, const std::filesystem::path& path);

    // --- Statistics ---

    struct Stats {
        uint64_t downloads_completed = 0;
        uint64_t downloads_failed = 0;
        uint64_t uploads_completed = 0;
        uint64_t uploads_failed = 0;
        uint64_t bytes_downloaded = 0;
        uint64_t bytes_uploaded = 0;
        uint64_t batch_failures = 0;
    };
    Stats get_stats() const;

private:
    StorageAccount& account() const;

    // Run a transfer, accounting its outcome in stats and metrics
    std::vector<std::filesystem::path> tracked_download(
        const std::function<std::vector<std::filesystem::path>()>& fn);
    std::vector<std::string> tracked_upload(
        uint64_t bytes,
        const std::function<std::vector<std::string>()>& fn);

    std::filesystem::path resolve_dir(const std::filesystem::path& dir) const;
    std::string record_directory_prefix(const std::string& relative) const;

    BlobStorageStructure structure_;
    FileManagerConfig config_;
    std::shared_ptr<StorageAccount> account_;   // null without config.account

    std::filesystem::path tmp_dir_;
    std::filesystem::path input_dir_;
    std::filesystem::path output_dir_;
    std::filesystem::path downloaded_frame_dir_;
    std::filesystem::path downloaded_equirect_dir_;
    std::filesystem::path processed_frame_dir_;
    std::filesystem::path processed_equirect_dir_;

    std::map<NcpResultFile, std::filesystem::path> downloaded_ncp_results_;
    std::map<NcpResultFile, std::filesystem::path> processed_ncp_results_;
    std::map<L2rResultFile, std::filesystem::path> processed_l2r_results_;
    std::map<L2rResultFile, std::string> l2r_blob_names_;

    std::shared_ptr<MetricsExporter> owned_metrics_;   // from config.metrics_file
    MetricsExporter* metrics_ = nullptr;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace ncpfm
