#pragma once

#include "ncpfm/config.hpp"
#include "ncpfm/models.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ncpfm {

// Storage tiers, one container each
enum class ContainerType {
    Raw,
    Extracted,
    Processed
};

constexpr std::array<ContainerType, 3> ALL_CONTAINER_TYPES = {
    ContainerType::Raw, ContainerType::Extracted, ContainerType::Processed};

const char* container_type_name(ContainerType type);
std::optional<ContainerType> parse_container_type(std::string_view name);

enum class NcpResultFile {
    Trajectory,
    GpsFrames,
    Gyro,
    Grav,
    Accel
};

constexpr std::array<NcpResultFile, 5> ALL_NCP_RESULT_FILES = {
    NcpResultFile::Trajectory, NcpResultFile::GpsFrames, NcpResultFile::Gyro,
    NcpResultFile::Grav, NcpResultFile::Accel};

// Key in ncp_result_blobs, e.g. "ncp_trajectory_path"
const char* ncp_result_key(NcpResultFile file);

enum class L2rResultFile {
    Trajectory,
    Result,
    Vpng
};

constexpr std::array<L2rResultFile, 3> ALL_L2R_RESULT_FILES = {
    L2rResultFile::Trajectory, L2rResultFile::Result, L2rResultFile::Vpng};

// Key in l2r_result_blobs, e.g. "l2r_trajectory"
const char* l2r_result_key(L2rResultFile file);

/// Blob names of the L2R outputs for one GPS recording:
///   <YYYYMMDD_HHMMSS>_l2r_result.json   (timestamp taken from the GPS file name,
///                                        or the current local time if it has none)
///   <gps stem>_l2r_trajectory.csv
///   l2r_vpng.vpng
class L2rResultNames {
public:
    explicit L2rResultNames(const std::string& gps_reader_name);

    const std::string& path(L2rResultFile file) const;

private:
    std::string result_path_;
    std::string trajectory_path_;
    std::string vpng_path_;
};

struct ContainerConfig {
    std::string name;
    std::string sas_url;    // Access handle URL, empty until permissions are set
};

struct RawContainerConfig : ContainerConfig {
    std::vector<std::string> videos;
    std::string gps_device_path;
};

struct ExtractedContainerConfig : ContainerConfig {
    std::string l2r_result_path = "l2r_result.json";
    std::string l2r_trajectory_path = "l2r_trajectory.csv";
    std::string frame_prefix;                               // Relative to the record prefix
    std::map<std::string, std::string> ncp_result_blobs;    // ncp_result_key -> relative blob
    std::map<std::string, std::string> l2r_result_blobs;    // l2r_result_key -> relative blob
};

struct ProcessedContainerConfig : ExtractedContainerConfig {
    std::string equirect_prefix;                            // Relative to the record prefix
};

/// Replace every {key} present in values; other braces are left alone.
std::string substitute_placeholders(const std::string& text,
                                    const std::map<std::string, std::string>& values);

/// Strict template formatting: every {key} must be present in values and
/// braces must balance ("{{" / "}}" are literal braces).
/// Throws InvalidConfiguration.
std::string format_path_template(const std::string& path_template,
                                 const std::map<std::string, std::string>& values);

/// prefix + "/" + name, without doubling the separator
std::string join_blob_path(const std::string& prefix, const std::string& name);

/// Where a record's blobs live in each container. Parsed from JSON, usually
/// produced by instantiating a template with {network_slot}, {record_slot},
/// {camera_id}, {video_blob} and {container_<tier>_name} placeholders.
struct BlobStorageStructure {
    std::string calibration_video;
    std::string network_prefix;     // Template over {network_slot}
    std::string record_prefix;      // Template over {network_slot} and {record_slot}
    RawContainerConfig container_raw;
    ExtractedContainerConfig container_extracted;
    ProcessedContainerConfig container_processed;

    /// Throws InvalidConfiguration on malformed JSON or missing fields.
    static BlobStorageStructure parse(const std::string& json_text);

    /// Substitute container names and slots into every string of the template.
    static BlobStorageStructure from_template(const std::string& template_text,
                                              const ContainerNames& containers,
                                              const std::map<std::string, std::string>& slots = {});

    static BlobStorageStructure from_record(const std::string& template_text,
                                            const ContainerNames& containers,
                                            const Record& record);

    static BlobStorageStructure from_camera(const std::string& template_text,
                                            const ContainerNames& containers,
                                            const Camera& camera);

    static BlobStorageStructure from_calibration_video(const std::string& template_text,
                                                       const ContainerNames& containers,
                                                       const CalibrationVideo& video);

    static std::string load_template(const std::filesystem::path& path);

    std::string to_json(int indent = 4) const;

    const ContainerConfig& container(ContainerType type) const;
    ContainerConfig& container(ContainerType type);

    /// Extracted or processed container. Throws InvalidConfiguration for raw.
    const ExtractedContainerConfig& result_container(ContainerType type) const;

    /// Relative blob of an NCP result. Throws InvalidConfiguration for raw or
    /// when the structure has no entry for the file.
    std::string ncp_result_blob(ContainerType type, NcpResultFile file) const;

    std::string record_blob_path(const std::string& blob_name) const;

    std::string frame_directory_prefix(ContainerType type) const;
    std::string equirect_directory_prefix(ContainerType type) const;

    std::string network_path(const std::string& network_slot) const;
    std::string record_path(const std::string& network_slot, const std::string& record_slot) const;
};

}  // namespace ncpfm
