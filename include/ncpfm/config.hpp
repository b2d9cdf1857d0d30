#pragma once

#include "ncpfm/core/constants.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace ncpfm {

/// Credentials and location of the object store.
///   azure: account_name + account_key, or connection_string; optional
///          endpoint (Azurite / sovereign clouds), verify_ssl, block_size,
///          read_chunk_size
///   local: path (one directory per container)
struct AccountConfig {
    std::string type;  // "azure", "local"
    std::map<std::string, std::string> params;  // Passed to StorageBackendFactory

    bool empty() const { return type.empty(); }

    std::string param(const std::string& key, const std::string& fallback = "") const;

    /// Validate required fields for this account type.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// Parse "DefaultEndpointsProtocol=https;AccountName=...;AccountKey=...;EndpointSuffix=..."
    /// (BlobEndpoint=... overrides the derived endpoint). Returns an empty
    /// config if the string has no AccountName.
    static AccountConfig from_connection_string(const std::string& connection_string);

    static AccountConfig local(const std::filesystem::path& root);
};

/// Names of the three storage tiers' containers
struct ContainerNames {
    std::string raw;
    std::string extracted;
    std::string processed;

    bool complete() const { return !raw.empty() && !extracted.empty() && !processed.empty(); }
};

/// Configuration for the file manager and its transfer engine.
struct FileManagerConfig {
    AccountConfig account;      // Optional: needed to mint access handles
    ContainerNames containers;

    // Scratch root; each instance works under <tmp_root>/gopro_<instance>/
    std::filesystem::path tmp_root = "tmp";

    // Blob storage structure template (JSON with {placeholders})
    std::filesystem::path structure_template;

    // Transfer engine
    size_t download_workers = constants::DEFAULT_DOWNLOAD_WORKERS;
    size_t prefix_download_workers = constants::DEFAULT_PREFIX_DOWNLOAD_WORKERS;
    size_t upload_workers = constants::DEFAULT_UPLOAD_WORKERS;
    int download_retries = constants::DEFAULT_DOWNLOAD_RETRIES;
    size_t chunk_concurrency = constants::DEFAULT_CHUNK_CONCURRENCY;

    // Adaptive uploader
    size_t uploader_max_queue = constants::DEFAULT_UPLOADER_MAX_QUEUE;
    size_t uploader_threads = constants::DEFAULT_UPLOADER_THREADS;

    // Access handle lifetimes
    int upload_handle_hours = constants::DEFAULT_UPLOAD_HANDLE_HOURS;
    int download_handle_hours = constants::DEFAULT_DOWNLOAD_HANDLE_HOURS;

    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace ncpfm
