#include "ncpfm/storage_structure.hpp"
#include "ncpfm/core/log.hpp"
#include "ncpfm/errors.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <fstream>
#include <regex>
#include <sstream>
#include <utility>

namespace ncpfm {

using json = nlohmann::json;

const char* container_type_name(ContainerType type) {
    switch (type) {
        case ContainerType::Raw: return "raw";
        case ContainerType::Extracted: return "extracted";
        case ContainerType::Processed: return "processed";
    }
    return "raw";
}

std::optional<ContainerType> parse_container_type(std::string_view name) {
    if (name == "raw") return ContainerType::Raw;
    if (name == "extracted") return ContainerType::Extracted;
    if (name == "processed") return ContainerType::Processed;
    return std::nullopt;
}

const char* ncp_result_key(NcpResultFile file) {
    switch (file) {
        case NcpResultFile::Trajectory: return "ncp_trajectory_path";
        case NcpResultFile::GpsFrames: return "ncp_gps_frames_path";
        case NcpResultFile::Gyro: return "ncp_gyro_path";
        case NcpResultFile::Grav: return "ncp_grav_path";
        case NcpResultFile::Accel: return "ncp_accel_path";
    }
    return "ncp_trajectory_path";
}

const char* l2r_result_key(L2rResultFile file) {
    switch (file) {
        case L2rResultFile::Trajectory: return "l2r_trajectory";
        case L2rResultFile::Result: return "l2r_result";
        case L2rResultFile::Vpng: return "l2r_vpng";
    }
    return "l2r_result";
}

// --- L2rResultNames ---

namespace {

std::string l2r_timestamp_prefix(const std::string& gps_device_name) {
    static const std::regex timestamp_re("^(\\d{8}_\\d{6})");
    std::smatch match;
    if (std::regex_search(gps_device_name, match, timestamp_re)) {
        return match[1].str();
    }

    log_warn("Could not extract timestamp from '%s', using current time for L2R file name",
             gps_device_name.c_str());
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}

}  // anonymous namespace

L2rResultNames::L2rResultNames(const std::string& gps_reader_name)
    : result_path_(l2r_timestamp_prefix(gps_reader_name) + "_l2r_result.json"),
      trajectory_path_(std::filesystem::path(gps_reader_name).stem().string() + "_l2r_trajectory.csv"),
      vpng_path_("l2r_vpng.vpng") {}

const std::string& L2rResultNames::path(L2rResultFile file) const {
    switch (file) {
        case L2rResultFile::Result: return result_path_;
        case L2rResultFile::Trajectory: return trajectory_path_;
        case L2rResultFile::Vpng: return vpng_path_;
    }
    throw InvalidConfiguration("unknown L2R result file");
}

// --- Template helpers ---

std::string substitute_placeholders(const std::string& text,
                                    const std::map<std::string, std::string>& values) {
    std::string out = text;
    for (const auto& [key, value] : values) {
        std::string token = "{" + key + "}";
        size_t pos = 0;
        while ((pos = out.find(token, pos)) != std::string::npos) {
            out.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return out;
}

std::string format_path_template(const std::string& path_template,
                                 const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(path_template.size());

    for (size_t i = 0; i < path_template.size(); ++i) {
        char c = path_template[i];
        if (c == '{') {
            if (i + 1 < path_template.size() && path_template[i + 1] == '{') {
                out += '{';
                ++i;
                continue;
            }
            size_t close = path_template.find('}', i + 1);
            if (close == std::string::npos) {
                throw InvalidConfiguration("unbalanced '{' in path template: " + path_template);
            }
            std::string key = path_template.substr(i + 1, close - i - 1);
            auto it = values.find(key);
            if (it == values.end()) {
                throw InvalidConfiguration("unknown placeholder {" + key + "} in path template: " +
                                           path_template);
            }
            out += it->second;
            i = close;
        } else if (c == '}') {
            if (i + 1 < path_template.size() && path_template[i + 1] == '}') {
                out += '}';
                ++i;
                continue;
            }
            throw InvalidConfiguration("unbalanced '}' in path template: " + path_template);
        } else {
            out += c;
        }
    }
    return out;
}

std::string join_blob_path(const std::string& prefix, const std::string& name) {
    if (prefix.empty()) return name;
    if (name.empty()) return prefix;
    bool prefix_slash = prefix.back() == '/';
    bool name_slash = name.front() == '/';
    if (prefix_slash && name_slash) return prefix + name.substr(1);
    if (prefix_slash || name_slash) return prefix + name;
    return prefix + "/" + name;
}

// --- JSON mapping ---

namespace {

std::string required_string(const json& j, const char* key, const char* where) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw InvalidConfiguration(std::string("blob storage structure: '") + key +
                                   "' is required in " + where);
    }
    return j[key].get<std::string>();
}

std::string optional_string(const json& j, const char* key, const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

std::map<std::string, std::string> string_map(const json& j, const char* key) {
    std::map<std::string, std::string> out;
    if (j.contains(key) && j[key].is_object()) {
        for (auto& [k, v] : j[key].items()) {
            out[k] = v.get<std::string>();
        }
    }
    return out;
}

const json& section(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_object()) {
        throw InvalidConfiguration(std::string("blob storage structure: '") + key +
                                   "' section is required");
    }
    return j[key];
}

void read_base(const json& j, const char* where, ContainerConfig& out) {
    out.name = required_string(j, "name", where);
    out.sas_url = optional_string(j, "sas_url");
}

void read_extracted(const json& j, const char* where, ExtractedContainerConfig& out) {
    read_base(j, where, out);
    out.l2r_result_path = optional_string(j, "l2r_result_path", out.l2r_result_path);
    out.l2r_trajectory_path = optional_string(j, "l2r_trajectory_path", out.l2r_trajectory_path);
    out.frame_prefix = optional_string(j, "frame_prefix");
    out.ncp_result_blobs = string_map(j, "ncp_result_blobs");
    out.l2r_result_blobs = string_map(j, "l2r_result_blobs");
}

json base_to_json(const ContainerConfig& c) {
    return json{{"name", c.name}, {"sas_url", c.sas_url}};
}

json extracted_to_json(const ExtractedContainerConfig& c) {
    json j = base_to_json(c);
    j["l2r_result_path"] = c.l2r_result_path;
    j["l2r_trajectory_path"] = c.l2r_trajectory_path;
    j["frame_prefix"] = c.frame_prefix;
    j["ncp_result_blobs"] = c.ncp_result_blobs;
    j["l2r_result_blobs"] = c.l2r_result_blobs;
    return j;
}

BlobStorageStructure from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidConfiguration("blob storage structure must be a JSON object");
    }

    BlobStorageStructure s;
    s.calibration_video = optional_string(j, "calibration_video");
    s.network_prefix = optional_string(j, "network_prefix");
    s.record_prefix = required_string(j, "record_prefix", "structure");

    const json& raw = section(j, "container_raw");
    read_base(raw, "container_raw", s.container_raw);
    if (raw.contains("videos") && raw["videos"].is_array()) {
        s.container_raw.videos = raw["videos"].get<std::vector<std::string>>();
    }
    s.container_raw.gps_device_path = optional_string(raw, "gps_device_path");

    read_extracted(section(j, "container_extracted"), "container_extracted", s.container_extracted);

    const json& processed = section(j, "container_processed");
    read_extracted(processed, "container_processed", s.container_processed);
    s.container_processed.equirect_prefix = optional_string(processed, "equirect_prefix");

    return s;
}

// Apply substitutions to every string value of a parsed template
void substitute_strings(json& j, const std::map<std::string, std::string>& values) {
    if (j.is_string()) {
        j = substitute_placeholders(j.get<std::string>(), values);
    } else if (j.is_object() || j.is_array()) {
        for (auto& child : j) {
            substitute_strings(child, values);
        }
    }
}

}  // anonymous namespace

// --- BlobStorageStructure ---

BlobStorageStructure BlobStorageStructure::parse(const std::string& json_text) {
    try {
        return from_json(json::parse(json_text));
    } catch (const json::exception& e) {
        throw InvalidConfiguration(std::string("invalid blob storage structure: ") + e.what());
    }
}

BlobStorageStructure BlobStorageStructure::from_template(
    const std::string& template_text,
    const ContainerNames& containers,
    const std::map<std::string, std::string>& slots) {
    try {
        json j = json::parse(template_text);

        std::map<std::string, std::string> values = slots;
        values["container_raw_name"] = containers.raw;
        values["container_extracted_name"] = containers.extracted;
        values["container_processed_name"] = containers.processed;
        substitute_strings(j, values);

        return from_json(j);
    } catch (const json::exception& e) {
        throw InvalidConfiguration(std::string("invalid blob storage structure template: ") + e.what());
    }
}

BlobStorageStructure BlobStorageStructure::from_record(const std::string& template_text,
                                                       const ContainerNames& containers,
                                                       const Record& record) {
    return from_template(template_text, containers,
                         {{"network_slot", record.network_slug}, {"record_slot", record.slot}});
}

BlobStorageStructure BlobStorageStructure::from_camera(const std::string& template_text,
                                                       const ContainerNames& containers,
                                                       const Camera& camera) {
    return from_template(template_text, containers, {{"camera_id", camera.unique_id}});
}

BlobStorageStructure BlobStorageStructure::from_calibration_video(
    const std::string& template_text,
    const ContainerNames& containers,
    const CalibrationVideo& video) {
    return from_template(template_text, containers,
                         {{"camera_id", video.camera.unique_id}, {"video_blob", video.title}});
}

std::string BlobStorageStructure::load_template(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw InvalidConfiguration("cannot open blob storage structure template: " + path.string());
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

std::string BlobStorageStructure::to_json(int indent) const {
    json j;
    j["calibration_video"] = calibration_video;
    j["network_prefix"] = network_prefix;
    j["record_prefix"] = record_prefix;

    json raw = base_to_json(container_raw);
    raw["videos"] = container_raw.videos;
    raw["gps_device_path"] = container_raw.gps_device_path;
    j["container_raw"] = raw;

    j["container_extracted"] = extracted_to_json(container_extracted);

    json processed = extracted_to_json(container_processed);
    processed["equirect_prefix"] = container_processed.equirect_prefix;
    j["container_processed"] = processed;

    return j.dump(indent);
}

const ContainerConfig& BlobStorageStructure::container(ContainerType type) const {
    switch (type) {
        case ContainerType::Raw: return container_raw;
        case ContainerType::Extracted: return container_extracted;
        case ContainerType::Processed: return container_processed;
    }
    throw InvalidConfiguration("invalid container type");
}

ContainerConfig& BlobStorageStructure::container(ContainerType type) {
    return const_cast<ContainerConfig&>(std::as_const(*this).container(type));
}

const ExtractedContainerConfig& BlobStorageStructure::result_container(ContainerType type) const {
    switch (type) {
        case ContainerType::Extracted: return container_extracted;
        case ContainerType::Processed: return container_processed;
        case ContainerType::Raw: break;
    }
    throw InvalidConfiguration(std::string("invalid container type, no results: ") +
                               container_type_name(type));
}

std::string BlobStorageStructure::ncp_result_blob(ContainerType type, NcpResultFile file) const {
    const auto& blobs = result_container(type).ncp_result_blobs;
    auto it = blobs.find(ncp_result_key(file));
    if (it == blobs.end() || it->second.empty()) {
        throw InvalidConfiguration(std::string("no ") + ncp_result_key(file) + " in " +
                                   container_type_name(type) + " container");
    }
    return it->second;
}

std::string BlobStorageStructure::record_blob_path(const std::string& blob_name) const {
    return join_blob_path(record_prefix, blob_name);
}

std::string BlobStorageStructure::frame_directory_prefix(ContainerType type) const {
    return result_container(type).frame_prefix;
}

std::string BlobStorageStructure::equirect_directory_prefix(ContainerType type) const {
    if (type != ContainerType::Processed) {
        throw InvalidConfiguration(std::string("invalid container type, no equirect possible: ") +
                                   container_type_name(type));
    }
    return container_processed.equirect_prefix;
}

std::string BlobStorageStructure::network_path(const std::string& network_slot) const {
    return format_path_template(network_prefix, {{"network_slot", network_slot}});
}

std::string BlobStorageStructure::record_path(const std::string& network_slot,
                                              const std::string& record_slot) const {
    return format_path_template(record_prefix,
                                {{"network_slot", network_slot}, {"record_slot", record_slot}});
}

}  // namespace ncpfm
