#pragma once

#include "ncpfm/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ncpfm {

struct AccountConfig;

// Metadata about a stored blob
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
    std::string access_tier;    // Hot, Cool, Cold, Archive
};

// Result of a put operation
struct PutResult {
    bool success = false;
    std::string etag;
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
    std::string access_tier;
};

// Result of a list operation
struct ListResult {
    bool success = false;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
    std::string error_message;
};

// Options for put operations
struct PutOptions {
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> metadata;
};

// Options for list operations. Listing is flat: every blob whose name
// starts with the prefix is returned, whatever its depth.
struct ListOptions {
    std::string prefix;
    uint32_t max_keys = constants::DEFAULT_LIST_PAGE_SIZE;
    std::string continuation_token;
};

enum class StorageTier {
    Hot,
    Cool,
    Cold,
    Archive
};

const char* storage_tier_name(StorageTier tier);
std::optional<StorageTier> parse_storage_tier(const std::string& name);

// Permission set carried by an access handle
struct Permissions {
    bool read = false;
    bool add = false;
    bool create = false;
    bool write = false;
    bool remove = false;
    bool list = false;

    static Permissions read_only();     // read + list
    static Permissions read_write();    // everything
    static Permissions blob_upload();   // create + write
    static Permissions blob_download(); // read

    // Parse an "sp" value such as "racwdl"; unknown letters are ignored
    static Permissions from_string(const std::string& sp);

    // Canonical "racwdl" ordering
    std::string to_string() const;

    bool operator==(const Permissions& other) const = default;
};

// Time-limited, permission-scoped credential for a container or a single blob.
//
// Remote handles look like https://<account>.blob.core.windows.net/<container>[/<blob>]?<sas>.
// Local handles use file://<root>?container=<c>[&blob=<b>]&<token>.
struct AccessHandle {
    std::string account;
    std::string endpoint;
    std::string container;
    std::string blob;           // Empty for container-scoped handles
    std::string token;          // Query string, without the leading '?'
    Permissions permissions;
    std::chrono::system_clock::time_point expiry;

    bool container_scoped() const { return blob.empty(); }
    bool is_local() const;
    bool expired() const;

    std::string url() const;

    static std::optional<AccessHandle> from_url(const std::string& url);
};

// ISO 8601 UTC timestamps as used in "se=" (e.g. 2026-10-19T12:00:00Z)
std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_utc_timestamp(const std::string& s);

// Sequential read stream over one blob
class BlobReader {
public:
    virtual ~BlobReader() = default;

    // Total size reported by the store when the stream was opened
    virtual uint64_t size() const = 0;

    // Fill up to buffer.size() bytes; 0 means end of stream.
    // Throws StorageError on transport or IO failure.
    virtual size_t read(std::span<uint8_t> buffer) = 0;
};

// Storage capability bound to a single container
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual const std::string& container() const = 0;

    virtual bool exists(const std::string& key) const = 0;

    // Get blob properties without downloading content
    virtual std::optional<ObjectMetadata> head(const std::string& key) const = 0;

    // Open a read stream. max_concurrency is a hint for how many chunks a
    // remote backend may fetch in parallel. Throws StorageError.
    virtual std::unique_ptr<BlobReader> open_read(const std::string& key,
                                                  size_t max_concurrency = 1) const = 0;

    // Write blob content, overwriting any existing blob
    virtual PutResult put(const std::string& key,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    virtual PutResult put_file(const std::string& key,
                               const std::filesystem::path& path,
                               const PutOptions& options = {}) = 0;

    virtual bool remove(const std::string& key) = 0;

    // Delete a batch of blobs, returning the keys that could not be deleted
    virtual std::vector<std::string> remove_batch(const std::vector<std::string>& keys) = 0;

    // One page of blobs under a prefix
    virtual ListResult list(const ListOptions& options = {}) const = 0;

    // Every blob under a prefix, following continuation tokens.
    // Throws StorageError if any page fails.
    std::vector<ListEntry> list_all(const std::string& prefix) const;

    virtual std::optional<StorageTier> get_tier(const std::string& key) const = 0;
    virtual bool set_tier(const std::string& key, StorageTier tier) = 0;

    virtual bool is_healthy() const = 0;
};

// Credential-bearing side of the store: mints access handles and opens
// containers with the account's own credential.
class StorageAccount {
public:
    virtual ~StorageAccount() = default;

    virtual std::string type_name() const = 0;

    // Blob-scoped when blob is non-empty, container-scoped otherwise
    virtual AccessHandle generate_access_handle(const std::string& container,
                                                const std::string& blob,
                                                const Permissions& permissions,
                                                std::chrono::hours validity) const = 0;

    AccessHandle generate_container_handle(const std::string& container,
                                           const Permissions& permissions,
                                           std::chrono::hours validity) const {
        return generate_access_handle(container, "", permissions, validity);
    }

    virtual std::unique_ptr<StorageBackend> open_container(const std::string& container) const = 0;
};

class StorageBackendFactory {
public:
    // Create an account from configuration ("azure" or "local").
    // Throws InvalidConfiguration.
    static std::unique_ptr<StorageAccount> create(const AccountConfig& config);

    // Directory-per-container store rooted at root_path
    static std::unique_ptr<StorageAccount> create_local(const std::filesystem::path& root_path);

    static std::unique_ptr<StorageAccount> create_azure(const std::string& account_name,
                                                        const std::string& account_key,
                                                        const std::string& endpoint = "");

    // Backend limited to what the handle grants. Throws InvalidConfiguration.
    static std::unique_ptr<StorageBackend> from_access_handle(const AccessHandle& handle);
};

} // namespace ncpfm
