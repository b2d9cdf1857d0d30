#pragma once

#include <cstddef>
#include <cstdint>

namespace ncpfm::constants {

// Transfer defaults
constexpr int DEFAULT_DOWNLOAD_RETRIES = 3;
constexpr size_t DEFAULT_DOWNLOAD_WORKERS = 4;
constexpr size_t DEFAULT_PREFIX_DOWNLOAD_WORKERS = 8;
constexpr size_t DEFAULT_CHUNK_CONCURRENCY = 4;
constexpr size_t DEFAULT_UPLOAD_WORKERS = 8;
constexpr const char* TEMP_DOWNLOAD_SUFFIX = ".temp";
constexpr size_t DEFAULT_COPY_BUFFER_SIZE = 1024 * 1024;               // 1MB

// Adaptive uploader defaults
constexpr size_t DEFAULT_UPLOADER_MAX_QUEUE = 50;
constexpr size_t DEFAULT_UPLOADER_THREADS = 3;

// Storage defaults
constexpr size_t DEFAULT_MULTIPART_THRESHOLD = 5 * 1024 * 1024;        // 5MB
constexpr size_t DEFAULT_BLOCK_SIZE = 4 * 1024 * 1024;                 // 4MB
constexpr size_t DEFAULT_READ_CHUNK_SIZE = 4 * 1024 * 1024;            // 4MB
constexpr size_t DEFAULT_UPLOAD_CONCURRENCY = 8;
constexpr uint32_t DEFAULT_LIST_PAGE_SIZE = 5000;
constexpr const char* AZURE_API_VERSION = "2020-10-02";
constexpr const char* AZURE_BLOB_DOMAIN = "blob.core.windows.net";

// Access handle lifetimes
constexpr int DEFAULT_UPLOAD_HANDLE_HOURS = 12;
constexpr int DEFAULT_DOWNLOAD_HANDLE_HOURS = 24;

// Pseudo-folder marker blob suffix
constexpr const char* PSEUDO_FOLDER_MARKER = ".keep";

// HTTP request defaults
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_HTTP_MAX_RETRIES = 3;

// Metrics
constexpr int DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace ncpfm::constants
