#include "ncpfm/config.hpp"
#include "ncpfm/core/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace ncpfm {

// --- AccountConfig ---

std::string AccountConfig::param(const std::string& key, const std::string& fallback) const {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return fallback;
    return it->second;
}

std::string AccountConfig::validate() const {
    if (type.empty()) return "account type is required";
    if (type == "azure") {
        if (!param("connection_string").empty()) {
            auto parsed = from_connection_string(param("connection_string"));
            if (parsed.empty()) return "azure connection_string has no AccountName";
            return parsed.validate();
        }
        if (param("account_name").empty())
            return "azure account requires 'account_name' or 'connection_string'";
        if (param("account_key").empty())
            return "azure account requires 'account_key'";
    } else if (type == "local") {
        if (param("path").empty())
            return "local account requires 'path'";
    } else {
        return "unknown account type: " + type;
    }
    return {};
}

AccountConfig AccountConfig::from_connection_string(const std::string& connection_string) {
    std::map<std::string, std::string> fields;
    size_t pos = 0;
    while (pos < connection_string.size()) {
        auto semi = connection_string.find(';', pos);
        std::string part = connection_string.substr(
            pos, semi == std::string::npos ? std::string::npos : semi - pos);
        // Values (AccountKey) may contain '=' padding; split on the first one only
        auto eq = part.find('=');
        if (eq != std::string::npos) {
            fields[part.substr(0, eq)] = part.substr(eq + 1);
        }
        if (semi == std::string::npos) break;
        pos = semi + 1;
    }

    AccountConfig config;
    if (fields["AccountName"].empty()) return config;

    config.type = "azure";
    config.params["account_name"] = fields["AccountName"];
    config.params["account_key"] = fields["AccountKey"];

    if (!fields["BlobEndpoint"].empty()) {
        std::string endpoint = fields["BlobEndpoint"];
        while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
        config.params["endpoint"] = endpoint;
    } else if (!fields["EndpointSuffix"].empty() &&
               fields["EndpointSuffix"] != "core.windows.net") {
        std::string protocol = fields["DefaultEndpointsProtocol"].empty()
            ? "https" : fields["DefaultEndpointsProtocol"];
        config.params["endpoint"] = protocol + "://" + fields["AccountName"] +
                                    ".blob." + fields["EndpointSuffix"];
    }
    return config;
}

AccountConfig AccountConfig::local(const std::filesystem::path& root) {
    AccountConfig config;
    config.type = "local";
    config.params["path"] = root.string();
    return config;
}

// --- FileManagerConfig ---

bool FileManagerConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            log_error("cannot open config file: %s", path.c_str());
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("tmp_root")) tmp_root = j["tmp_root"].get<std::string>();
        if (j.contains("structure_template"))
            structure_template = j["structure_template"].get<std::string>();
        if (j.contains("download_workers")) download_workers = j["download_workers"].get<size_t>();
        if (j.contains("prefix_download_workers"))
            prefix_download_workers = j["prefix_download_workers"].get<size_t>();
        if (j.contains("upload_workers")) upload_workers = j["upload_workers"].get<size_t>();
        if (j.contains("download_retries")) download_retries = j["download_retries"].get<int>();
        if (j.contains("chunk_concurrency")) chunk_concurrency = j["chunk_concurrency"].get<size_t>();
        if (j.contains("uploader_max_queue")) uploader_max_queue = j["uploader_max_queue"].get<size_t>();
        if (j.contains("uploader_threads")) uploader_threads = j["uploader_threads"].get<size_t>();
        if (j.contains("upload_handle_hours")) upload_handle_hours = j["upload_handle_hours"].get<int>();
        if (j.contains("download_handle_hours"))
            download_handle_hours = j["download_handle_hours"].get<int>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("containers") && j["containers"].is_object()) {
            auto& jc = j["containers"];
            if (jc.contains("raw")) containers.raw = jc["raw"].get<std::string>();
            if (jc.contains("extracted")) containers.extracted = jc["extracted"].get<std::string>();
            if (jc.contains("processed")) containers.processed = jc["processed"].get<std::string>();
        }

        if (j.contains("account") && j["account"].is_object()) {
            auto& ja = j["account"];
            if (ja.contains("type")) account.type = ja["type"].get<std::string>();
            for (auto& [key, val] : ja.items()) {
                if (key == "type") continue;
                account.params[key] = val.is_string() ? val.get<std::string>() : val.dump();
            }
        }

        return true;
    } catch (const std::exception& e) {
        log_error("Error parsing config %s: %s", path.c_str(), e.what());
        return false;
    }
}

std::string FileManagerConfig::validate() const {
    if (!account.empty()) {
        auto err = account.validate();
        if (!err.empty()) return "account: " + err;
    }
    if (!containers.complete()) return "containers.raw, containers.extracted and containers.processed are required";
    if (tmp_root.empty()) return "tmp_root is required";
    if (download_workers == 0) return "download_workers must be > 0";
    if (prefix_download_workers == 0) return "prefix_download_workers must be > 0";
    if (upload_workers == 0) return "upload_workers must be > 0";
    if (download_retries < 1) return "download_retries must be >= 1";
    if (chunk_concurrency == 0) return "chunk_concurrency must be > 0";
    if (uploader_threads == 0) return "uploader_threads must be > 0";
    if (upload_handle_hours <= 0 || download_handle_hours <= 0) return "handle lifetimes must be > 0 hours";
    if (!structure_template.empty() && !std::filesystem::exists(structure_template))
        return "structure_template does not exist: " + structure_template.string();
    return {};
}

}  // namespace ncpfm
