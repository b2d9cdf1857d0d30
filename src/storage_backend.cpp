#include "ncpfm/storage/backend.hpp"
#include "ncpfm/config.hpp"
#include "ncpfm/core/constants.hpp"
#include "ncpfm/core/log.hpp"
#include "ncpfm/errors.hpp"
#include "ncpfm/net/http.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <deque>
#include <fstream>
#include <future>
#include <mutex>
#include <sstream>
#include <vector>

namespace ncpfm {

namespace fs = std::filesystem;

namespace {

// Marker for in-flight writes; never reported by listings
constexpr const char* LOCAL_TEMP_MARKER = ".ncpfm-tmp.";

// Per-blob access tier sidecars for the local store
constexpr const char* LOCAL_TIER_DIR = ".ncpfm-tiers";

// ============================================================================
// XML parsing helpers for blob service responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, empty string if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Bodies of every <tag>...</tag> in document order
std::vector<std::string> element_bodies(const std::string& xml, const std::string& tag) {
    std::vector<std::string> bodies;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;
        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;
        bodies.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }
    return bodies;
}

std::string decode_entities(const std::string& s) {
    static const std::pair<const char*, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string result;
    result.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        bool matched = false;
        if (s[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                size_t len = std::strlen(entity);
                if (s.compare(i, len, entity) == 0) {
                    result += ch;
                    i += len;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) result += s[i++];
    }
    return result;
}

}  // namespace xml

// ============================================================================
// SecureString - zeroes the account key when released
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string s) : data_(std::move(s)) {}

    SecureString(const SecureString& other) : data_(other.data_) {}
    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            wipe();
            data_ = other.data_;
        }
        return *this;
    }

    ~SecureString() { wipe(); }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void wipe() {
        if (data_.empty()) return;
        volatile char* p = data_.data();
        for (size_t i = 0; i < data_.size(); ++i) p[i] = 0;
        data_.clear();
        data_.shrink_to_fit();
    }

    std::string data_;
};

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         result.data(), &len);
    result.resize(len);
    return result;
}

std::chrono::system_clock::time_point file_time_to_system(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

// "Wed, 09 Sep 2026 10:15:00 GMT"
std::chrono::system_clock::time_point parse_http_date(const std::string& s) {
    std::tm tm_buf{};
    if (s.empty() || strptime(s.c_str(), "%a, %d %b %Y %H:%M:%S", &tm_buf) == nullptr) {
        return {};
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

std::string http_date_now() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[64];
    strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);
    return buf;
}

// Reject keys that could escape the container directory
bool is_safe_key(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    size_t start = 0;
    while (start <= key.size()) {
        auto slash = key.find('/', start);
        std::string segment = key.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (segment == "..") return false;
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return true;
}

std::string error_text(const net::HttpResponse& response) {
    std::string text = response.describe_error();
    std::string code = xml::get_element(response.body_string(), "Code");
    if (!code.empty()) text += " (" + code + ")";
    return text;
}

// ============================================================================
// LocalStorageBackend - one directory per container
// ============================================================================

class LocalBlobReader : public BlobReader {
public:
    explicit LocalBlobReader(const fs::path& path)
        : file_(path, std::ios::binary) {
        if (!file_) {
            throw StorageError("Cannot open " + path.string(), 404);
        }
        std::error_code ec;
        size_ = fs::file_size(path, ec);
        if (ec) {
            throw StorageError("Cannot stat " + path.string() + ": " + ec.message());
        }
    }

    uint64_t size() const override { return size_; }

    size_t read(std::span<uint8_t> buffer) override {
        if (buffer.empty() || file_.eof()) return 0;
        file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (file_.bad()) {
            throw StorageError("Read error");
        }
        return static_cast<size_t>(file_.gcount());
    }

private:
    std::ifstream file_;
    uint64_t size_ = 0;
};

class LocalStorageBackend : public StorageBackend {
public:
    // blob_scope limits every operation to one key (blob-scoped handles)
    LocalStorageBackend(const fs::path& root, const std::string& container,
                        const Permissions& permissions,
                        std::chrono::system_clock::time_point expiry,
                        std::string blob_scope = "")
        : root_(fs::absolute(root)),
          container_(container),
          dir_(root_ / container),
          permissions_(permissions),
          expiry_(expiry),
          blob_scope_(std::move(blob_scope)) {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec) {
            log_warn("Cannot create container directory %s: %s", dir_.c_str(), ec.message().c_str());
        }
    }

    std::string type_name() const override { return "local"; }

    const std::string& container() const override { return container_; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        if (auto denied = check_access(key, permissions_.read)) throw StorageError(*denied, 403);

        auto path = key_to_path(key);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) return std::nullopt;

        ObjectMetadata meta;
        meta.size = fs::file_size(path, ec);
        if (ec) return std::nullopt;
        meta.last_modified = file_time_to_system(fs::last_write_time(path, ec));
        meta.content_type = "application/octet-stream";
        meta.access_tier = storage_tier_name(read_tier(key));
        return meta;
    }

    std::unique_ptr<BlobReader> open_read(const std::string& key, size_t) const override {
        if (auto denied = check_access(key, permissions_.read)) throw StorageError(*denied, 403);
        auto path = key_to_path(key);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw StorageError("Blob not found: " + container_ + "/" + key, 404);
        }
        return std::make_unique<LocalBlobReader>(path);
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions&) override {
        PutResult result;
        if (auto denied = check_write(key)) {
            result.error_message = *denied;
            return result;
        }

        auto path = key_to_path(key);
        auto temp_path = make_temp_path(path);

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                result.error_message = "Failed to create " + temp_path.string();
                return result;
            }
            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!file) {
                file.close();
                fs::remove(temp_path, ec);
                result.error_message = "Failed to write data";
                return result;
            }
        }

        return commit_temp(temp_path, path);
    }

    PutResult put_file(const std::string& key,
                       const fs::path& source_path,
                       const PutOptions&) override {
        PutResult result;
        if (auto denied = check_write(key)) {
            result.error_message = *denied;
            return result;
        }

        auto path = key_to_path(key);
        auto temp_path = make_temp_path(path);

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        fs::copy_file(source_path, temp_path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            result.error_message = "Failed to copy " + source_path.string() + ": " + ec.message();
            return result;
        }
        return commit_temp(temp_path, path);
    }

    bool remove(const std::string& key) override {
        if (auto denied = check_access(key, permissions_.remove)) {
            log_debug("Delete of %s refused: %s", key.c_str(), denied->c_str());
            return false;
        }
        std::error_code ec;
        bool removed = fs::remove(key_to_path(key), ec);
        if (removed) {
            fs::remove(tier_path(key), ec);
        }
        return removed;
    }

    std::vector<std::string> remove_batch(const std::vector<std::string>& keys) override {
        std::vector<std::string> failed;
        for (const auto& key : keys) {
            if (!remove(key)) {
                failed.push_back(key);
            }
        }
        return failed;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;
        if (auto denied = check_access("", permissions_.list)) {
            result.error_message = *denied;
            return result;
        }

        std::vector<ListEntry> matches;
        std::error_code ec;
        if (fs::exists(dir_, ec)) {
            try {
                for (const auto& entry : fs::recursive_directory_iterator(dir_)) {
                    if (!entry.is_regular_file()) continue;
                    std::string key = entry.path().lexically_relative(dir_).generic_string();
                    if (key.find(LOCAL_TEMP_MARKER) != std::string::npos) continue;
                    if (!key.starts_with(options.prefix)) continue;
                    if (!options.continuation_token.empty() && key <= options.continuation_token) continue;

                    ListEntry item;
                    item.key = key;
                    item.size = entry.file_size();
                    item.last_modified = file_time_to_system(entry.last_write_time());
                    item.access_tier = storage_tier_name(read_tier(key));
                    matches.push_back(std::move(item));
                }
            } catch (const fs::filesystem_error& e) {
                result.error_message = e.what();
                return result;
            }
        }

        std::sort(matches.begin(), matches.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });

        if (options.max_keys > 0 && matches.size() > options.max_keys) {
            matches.resize(options.max_keys);
            result.truncated = true;
            result.continuation_token = matches.back().key;
        }

        result.success = true;
        result.entries = std::move(matches);
        return result;
    }

    std::optional<StorageTier> get_tier(const std::string& key) const override {
        if (check_access(key, permissions_.read)) return std::nullopt;
        std::error_code ec;
        if (!fs::is_regular_file(key_to_path(key), ec)) return std::nullopt;
        return read_tier(key);
    }

    bool set_tier(const std::string& key, StorageTier tier) override {
        if (check_access(key, permissions_.write)) return false;
        std::error_code ec;
        if (!fs::is_regular_file(key_to_path(key), ec)) return false;

        auto path = tier_path(key);
        fs::create_directories(path.parent_path(), ec);
        std::ofstream out(path, std::ios::trunc);
        out << storage_tier_name(tier);
        return static_cast<bool>(out);
    }

    bool is_healthy() const override {
        std::error_code ec;
        return fs::is_directory(dir_, ec);
    }

private:
    fs::path root_;
    std::string container_;
    fs::path dir_;
    Permissions permissions_;
    std::chrono::system_clock::time_point expiry_;
    std::string blob_scope_;

    mutable std::atomic<uint64_t> temp_counter_{0};

    fs::path key_to_path(const std::string& key) const {
        return dir_ / key;
    }

    fs::path tier_path(const std::string& key) const {
        return root_ / LOCAL_TIER_DIR / container_ / key;
    }

    fs::path make_temp_path(const fs::path& path) const {
        return path.parent_path() / (path.filename().string() + LOCAL_TEMP_MARKER +
                                     std::to_string(temp_counter_.fetch_add(1)));
    }

    // Error message when the operation is not allowed, nullopt otherwise
    std::optional<std::string> check_access(const std::string& key, bool granted) const {
        if (expiry_ <= std::chrono::system_clock::now()) {
            return "Access handle for " + container_ + " expired";
        }
        if (!granted) {
            return "Access handle for " + container_ + " does not grant this operation";
        }
        if (!key.empty()) {
            if (!is_safe_key(key)) return "Invalid blob name: " + key;
            if (!blob_scope_.empty() && key != blob_scope_) {
                return "Access handle is limited to " + blob_scope_;
            }
        } else if (!blob_scope_.empty()) {
            return "Access handle is limited to " + blob_scope_;
        }
        return std::nullopt;
    }

    std::optional<std::string> check_write(const std::string& key) const {
        std::error_code ec;
        bool existing = fs::exists(key_to_path(key), ec);
        bool granted = permissions_.write || (permissions_.create && !existing);
        return check_access(key, granted);
    }

    PutResult commit_temp(const fs::path& temp_path, const fs::path& path) {
        PutResult result;
        std::error_code ec;
        fs::rename(temp_path, path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            result.error_message = "Failed to rename into place: " + ec.message();
            return result;
        }
        result.success = true;
        return result;
    }

    StorageTier read_tier(const std::string& key) const {
        std::ifstream in(tier_path(key));
        std::string name;
        if (in && std::getline(in, name)) {
            if (auto tier = parse_storage_tier(name)) return *tier;
        }
        return StorageTier::Hot;
    }
};

class LocalStorageAccount : public StorageAccount {
public:
    explicit LocalStorageAccount(const fs::path& root)
        : root_(fs::absolute(root)) {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) {
            throw InvalidConfiguration("Cannot create local store root " + root_.string() +
                                       ": " + ec.message());
        }
    }

    std::string type_name() const override { return "local"; }

    AccessHandle generate_access_handle(const std::string& container,
                                        const std::string& blob,
                                        const Permissions& permissions,
                                        std::chrono::hours validity) const override {
        AccessHandle handle;
        handle.account = "local";
        handle.endpoint = std::string("file://") + root_.generic_string();
        handle.container = container;
        handle.blob = blob;
        handle.permissions = permissions;
        handle.expiry = std::chrono::system_clock::now() + validity;
        handle.token = "sv=local&sr=" + std::string(blob.empty() ? "c" : "b") +
                       "&sp=" + permissions.to_string() +
                       "&se=" + net::url_encode(format_utc_timestamp(handle.expiry));
        return handle;
    }

    std::unique_ptr<StorageBackend> open_container(const std::string& container) const override {
        return std::make_unique<LocalStorageBackend>(
            root_, container, Permissions::read_write(),
            std::chrono::system_clock::time_point::max());
    }

private:
    fs::path root_;
};

// ============================================================================
// AzureStorageBackend - Azure Blob Storage over REST
// ============================================================================

class AzureStorageBackend : public StorageBackend {
public:
    struct Config {
        std::string account_name;
        SecureString account_key;       // SharedKey auth
        std::string sas_token;          // Alternative: SAS token auth
        std::string container;
        std::string endpoint;           // e.g. https://<account>.blob.core.windows.net
        bool verify_ssl = true;
        uint64_t multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
        uint64_t block_size = constants::DEFAULT_BLOCK_SIZE;
        size_t upload_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
        size_t read_chunk_size = constants::DEFAULT_READ_CHUNK_SIZE;
    };

    explicit AzureStorageBackend(Config config)
        : config_(std::move(config)) {
        if (config_.endpoint.empty()) {
            config_.endpoint = "https://" + config_.account_name + "." + constants::AZURE_BLOB_DOMAIN;
        }
        net::HttpClientConfig http_config;
        http_config.verify_ssl_by_default = config_.verify_ssl;
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "azure"; }

    const std::string& container() const override { return config_.container; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto request = net::HttpRequest::head(build_url(key));
        auto response = send(request, key);

        if (response.status_code == 404) return std::nullopt;
        if (!response.ok()) {
            throw StorageError("Get properties of " + key + " failed: " + error_text(response),
                               response.status_code);
        }

        ObjectMetadata meta;
        meta.size = response.headers.content_length().value_or(0);
        meta.etag = response.headers.get("ETag").value_or("");
        meta.content_type = response.headers.content_type().value_or("application/octet-stream");
        meta.access_tier = response.headers.get("x-ms-access-tier").value_or("Hot");
        meta.last_modified = parse_http_date(response.headers.get("Last-Modified").value_or(""));
        return meta;
    }

    std::unique_ptr<BlobReader> open_read(const std::string& key,
                                          size_t max_concurrency) const override;

    // Bytes [start, end) of a blob. Throws StorageError.
    std::vector<uint8_t> fetch_range(const std::string& key, uint64_t start, uint64_t end) const {
        auto request = net::HttpRequest::get(build_url(key));
        request.headers.set("x-ms-range", "bytes=" + std::to_string(start) + "-" + std::to_string(end - 1));
        auto response = send(request, key, true);
        if (!response.ok()) {
            throw StorageError("Read of " + key + " failed: " + error_text(response),
                               response.status_code);
        }
        return std::move(response.body);
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        if (data.size() > config_.multipart_threshold) {
            return put_blocks(key, data.size(), options,
                [data](uint64_t offset, size_t length) {
                    auto chunk = data.subspan(offset, length);
                    return std::vector<uint8_t>(chunk.begin(), chunk.end());
                });
        }

        auto request = net::HttpRequest::put(build_url(key), std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set("x-ms-blob-type", "BlockBlob");
        apply_put_options(request, options, "");

        PutResult result;
        auto response = send(request, key, true);
        if (!response.ok()) {
            result.error_message = error_text(response);
            return result;
        }
        result.success = true;
        result.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    PutResult put_file(const std::string& key,
                       const fs::path& path,
                       const PutOptions& options) override {
        std::error_code ec;
        uint64_t size = fs::file_size(path, ec);
        if (ec) {
            return {false, "", "Cannot stat " + path.string() + ": " + ec.message()};
        }

        if (size <= config_.multipart_threshold) {
            std::ifstream file(path, std::ios::binary);
            std::vector<uint8_t> data(size);
            if (!file || !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
                return {false, "", "Failed to read " + path.string()};
            }
            return put(key, data, options);
        }

        // Stage straight from disk so large files never sit in memory whole
        std::mutex file_mutex;
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return {false, "", "Failed to open " + path.string()};
        }
        return put_blocks(key, size, options,
            [&file, &file_mutex](uint64_t offset, size_t length) {
                std::vector<uint8_t> chunk(length);
                std::lock_guard<std::mutex> lock(file_mutex);
                file.seekg(static_cast<std::streamoff>(offset));
                if (!file.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(length))) {
                    throw StorageError("Short read while staging blocks");
                }
                return chunk;
            });
    }

    bool remove(const std::string& key) override {
        auto request = net::HttpRequest::del(build_url(key));
        auto response = send(request, key, true);
        if (!response.ok()) {
            log_debug("Delete of %s failed: %s", key.c_str(), error_text(response).c_str());
        }
        return response.ok();
    }

    std::vector<std::string> remove_batch(const std::vector<std::string>& keys) override {
        // No batch endpoint in the plain blob API; parallel individual DELETEs
        std::vector<std::string> failed;
        const size_t concurrency = std::max<size_t>(1, config_.upload_concurrency);

        for (size_t batch_start = 0; batch_start < keys.size(); batch_start += concurrency) {
            size_t batch_end = std::min(batch_start + concurrency, keys.size());
            std::vector<std::future<bool>> futures;
            for (size_t i = batch_start; i < batch_end; ++i) {
                futures.push_back(std::async(std::launch::async,
                    [this, &key = keys[i]]() { return remove(key); }));
            }
            for (size_t i = batch_start; i < batch_end; ++i) {
                if (!futures[i - batch_start].get()) {
                    failed.push_back(keys[i]);
                }
            }
        }
        return failed;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        std::string url = build_url("") + "?restype=container&comp=list";
        if (!options.prefix.empty()) {
            url += "&prefix=" + net::url_encode(options.prefix);
        }
        url += "&maxresults=" + std::to_string(options.max_keys);
        if (!options.continuation_token.empty()) {
            url += "&marker=" + net::url_encode(options.continuation_token);
        }

        auto request = net::HttpRequest::get(url);
        auto response = send(request, "", true);
        if (!response.ok()) {
            result.error_message = error_text(response);
            return result;
        }

        result.success = true;
        std::string body = response.body_string();

        result.continuation_token = xml::get_element(body, "NextMarker");
        result.truncated = !result.continuation_token.empty();

        for (const auto& content : xml::element_bodies(body, "Blob")) {
            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Name"));

            std::string props = xml::get_element(content, "Properties");
            if (!props.empty()) {
                std::string size_str = xml::get_element(props, "Content-Length");
                if (!size_str.empty()) entry.size = std::stoull(size_str);
                entry.etag = xml::decode_entities(xml::get_element(props, "Etag"));
                entry.access_tier = xml::get_element(props, "AccessTier");
                entry.last_modified = parse_http_date(xml::get_element(props, "Last-Modified"));
            }
            result.entries.push_back(std::move(entry));
        }
        return result;
    }

    std::optional<StorageTier> get_tier(const std::string& key) const override {
        auto meta = head(key);
        if (!meta) return std::nullopt;
        return parse_storage_tier(meta->access_tier).value_or(StorageTier::Hot);
    }

    bool set_tier(const std::string& key, StorageTier tier) override {
        auto request = net::HttpRequest::put(build_url(key) + "?comp=tier", {});
        request.headers.set("x-ms-access-tier", storage_tier_name(tier));
        auto response = send(request, key, true);
        if (!response.ok()) {
            log_warn("Set tier %s on %s failed: %s", storage_tier_name(tier), key.c_str(),
                     error_text(response).c_str());
        }
        return response.ok();
    }

    bool is_healthy() const override {
        ListOptions opts;
        opts.max_keys = 1;
        return list(opts).success;
    }

    size_t read_chunk_size() const { return config_.read_chunk_size; }

private:
    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;

    static std::string url_encode_path(const std::string& path) {
        std::string result;
        size_t start = 0;
        while (start < path.size()) {
            auto slash = path.find('/', start);
            std::string segment = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
            if (!result.empty() || start > 0) result += '/';
            result += net::url_encode(segment);
            if (slash == std::string::npos) break;
            start = slash + 1;
        }
        return result;
    }

    std::string build_url(const std::string& key) const {
        std::string url = config_.endpoint + "/" + config_.container;
        if (!key.empty()) {
            url += "/" + url_encode_path(key);
        }
        return url;
    }

    static void apply_put_options(net::HttpRequest& request, const PutOptions& options,
                                  const std::string& header_prefix) {
        std::string content_type = options.content_type.empty()
            ? "application/octet-stream" : options.content_type;
        if (header_prefix.empty()) {
            request.headers.set_content_type(content_type);
        } else {
            request.headers.set(header_prefix + "content-type", content_type);
        }
        for (const auto& [k, v] : options.metadata) {
            request.headers.set("x-ms-meta-" + k, v);
        }
    }

    net::HttpResponse send(net::HttpRequest& request, const std::string& key,
                           bool retry = false) const {
        request.verify_ssl = config_.verify_ssl;
        request.headers.set("x-ms-date", http_date_now());
        request.headers.set("x-ms-version", constants::AZURE_API_VERSION);
        sign_request(request, key);
        return retry ? http_client_->execute_with_retry(request) : http_client_->execute(request);
    }

    // SAS: append the token. SharedKey: Authorization header over the
    // canonical string of the request.
    void sign_request(net::HttpRequest& request, const std::string& key) const {
        if (!config_.sas_token.empty()) {
            request.url += (request.url.find('?') != std::string::npos ? "&" : "?") + config_.sas_token;
            return;
        }
        if (config_.account_key.empty()) return;

        std::string string_to_sign;
        string_to_sign += std::string(net::http_method_to_string(request.method)) + "\n";
        string_to_sign += "\n";     // Content-Encoding
        string_to_sign += "\n";     // Content-Language
        string_to_sign += (request.body.empty() ? "" : std::to_string(request.body.size())) + "\n";
        string_to_sign += "\n";     // Content-MD5
        string_to_sign += request.headers.content_type().value_or("") + "\n";
        string_to_sign += "\n";     // Date (x-ms-date is used)
        string_to_sign += "\n";     // If-Modified-Since
        string_to_sign += request.headers.get("If-Match").value_or("") + "\n";
        string_to_sign += request.headers.get("If-None-Match").value_or("") + "\n";
        string_to_sign += "\n";     // If-Unmodified-Since
        string_to_sign += request.headers.get("Range").value_or("") + "\n";

        // all() is lower-cased and sorted
        for (const auto& [name, value] : request.headers.all()) {
            if (name.starts_with("x-ms-")) {
                string_to_sign += name + ":" + value + "\n";
            }
        }

        string_to_sign += "/" + config_.account_name + "/" + config_.container;
        if (!key.empty()) {
            string_to_sign += "/" + key;
        }

        auto qpos = request.url.find('?');
        if (qpos != std::string::npos) {
            std::map<std::string, std::string> params;
            std::string query = request.url.substr(qpos + 1);
            size_t pos = 0;
            while (pos < query.size()) {
                auto amp = query.find('&', pos);
                std::string param = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
                auto eq = param.find('=');
                std::string name = param.substr(0, eq);
                std::transform(name.begin(), name.end(), name.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                params[name] = eq == std::string::npos ? "" : net::url_decode(param.substr(eq + 1));
                if (amp == std::string::npos) break;
                pos = amp + 1;
            }
            for (const auto& [name, value] : params) {
                string_to_sign += "\n" + name + ":" + value;
            }
        }

        auto signature = hmac_sha256(net::base64_decode(config_.account_key.str()), string_to_sign);
        request.headers.set("Authorization",
                            "SharedKey " + config_.account_name + ":" + net::base64_encode(signature));
    }

    static std::string make_block_id(size_t index) {
        char id_buf[16];
        std::snprintf(id_buf, sizeof(id_buf), "%08zu", index);
        return net::base64_encode(std::string(id_buf));
    }

    // Stage blocks in parallel batches, then commit the block list.
    // read_chunk(offset, length) supplies the bytes of each block.
    template <typename ChunkSource>
    PutResult put_blocks(const std::string& key, uint64_t total_size,
                         const PutOptions& options, ChunkSource read_chunk) {
        PutResult result;

        std::vector<std::string> block_ids;
        const size_t concurrency = std::max<size_t>(1, config_.upload_concurrency);
        const uint64_t block_size = std::max<uint64_t>(1, config_.block_size);
        const size_t block_count = static_cast<size_t>((total_size + block_size - 1) / block_size);

        for (size_t batch_start = 0; batch_start < block_count; batch_start += concurrency) {
            size_t batch_end = std::min(batch_start + concurrency, block_count);
            std::vector<std::future<std::string>> futures;

            for (size_t i = batch_start; i < batch_end; ++i) {
                std::string block_id = make_block_id(i);
                block_ids.push_back(block_id);
                uint64_t offset = i * block_size;
                size_t length = static_cast<size_t>(std::min(block_size, total_size - offset));

                futures.push_back(std::async(std::launch::async,
                    [this, &key, &read_chunk, block_id, offset, length]() -> std::string {
                        try {
                            auto url = build_url(key) + "?comp=block&blockid=" + net::url_encode(block_id);
                            auto request = net::HttpRequest::put(url, read_chunk(offset, length));
                            auto response = send(request, key, true);
                            return response.ok() ? "" : error_text(response);
                        } catch (const std::exception& e) {
                            return e.what();
                        }
                    }));
            }

            std::string first_error;
            for (auto& fut : futures) {
                std::string error = fut.get();
                if (!error.empty() && first_error.empty()) first_error = error;
            }
            if (!first_error.empty()) {
                result.error_message = "Failed to stage block: " + first_error;
                return result;
            }
        }

        std::ostringstream block_list_xml;
        block_list_xml << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<BlockList>\n";
        for (const auto& bid : block_ids) {
            block_list_xml << "  <Latest>" << bid << "</Latest>\n";
        }
        block_list_xml << "</BlockList>";
        std::string body = block_list_xml.str();

        auto commit = net::HttpRequest::put(build_url(key) + "?comp=blocklist",
                                            std::vector<uint8_t>(body.begin(), body.end()));
        commit.headers.set_content_type("application/xml");
        apply_put_options(commit, options, "x-ms-blob-");

        auto response = send(commit, key, true);
        if (!response.ok()) {
            result.error_message = "Failed to commit block list: " + error_text(response);
            return result;
        }

        result.success = true;
        result.etag = response.headers.get("ETag").value_or("");
        return result;
    }
};

// Sequential reader that keeps up to max_concurrency ranged GETs in flight
class AzureBlobReader : public BlobReader {
public:
    AzureBlobReader(const AzureStorageBackend& backend, std::string key,
                    uint64_t size, size_t max_concurrency)
        : backend_(backend),
          key_(std::move(key)),
          size_(size),
          max_in_flight_(std::max<size_t>(1, max_concurrency)),
          chunk_size_(std::max<size_t>(1, backend.read_chunk_size())) {}

    ~AzureBlobReader() override {
        for (auto& fut : in_flight_) {
            if (fut.valid()) fut.wait();
        }
    }

    uint64_t size() const override { return size_; }

    size_t read(std::span<uint8_t> buffer) override {
        size_t copied = 0;
        while (copied < buffer.size()) {
            if (current_pos_ == current_.size()) {
                if (!advance()) break;
            }
            size_t n = std::min(buffer.size() - copied, current_.size() - current_pos_);
            std::memcpy(buffer.data() + copied, current_.data() + current_pos_, n);
            current_pos_ += n;
            copied += n;
        }
        return copied;
    }

private:
    const AzureStorageBackend& backend_;
    std::string key_;
    uint64_t size_;
    size_t max_in_flight_;
    size_t chunk_size_;

    uint64_t next_offset_ = 0;
    std::deque<std::future<std::vector<uint8_t>>> in_flight_;
    std::vector<uint8_t> current_;
    size_t current_pos_ = 0;

    void fill() {
        while (in_flight_.size() < max_in_flight_ && next_offset_ < size_) {
            uint64_t start = next_offset_;
            uint64_t end = std::min<uint64_t>(size_, start + chunk_size_);
            next_offset_ = end;
            in_flight_.push_back(std::async(std::launch::async,
                [this, start, end]() { return backend_.fetch_range(key_, start, end); }));
        }
    }

    // Move to the next chunk; false at end of stream. Rethrows fetch errors.
    bool advance() {
        fill();
        if (in_flight_.empty()) return false;
        auto fut = std::move(in_flight_.front());
        in_flight_.pop_front();
        current_ = fut.get();
        current_pos_ = 0;
        fill();
        return !current_.empty();
    }
};

std::unique_ptr<BlobReader> AzureStorageBackend::open_read(const std::string& key,
                                                           size_t max_concurrency) const {
    auto meta = head(key);
    if (!meta) {
        throw StorageError("Blob not found: " + config_.container + "/" + key, 404);
    }
    return std::make_unique<AzureBlobReader>(*this, key, meta->size, max_concurrency);
}

class AzureStorageAccount : public StorageAccount {
public:
    explicit AzureStorageAccount(AzureStorageBackend::Config base)
        : base_(std::move(base)) {
        if (base_.endpoint.empty()) {
            base_.endpoint = "https://" + base_.account_name + "." + constants::AZURE_BLOB_DOMAIN;
        }
    }

    std::string type_name() const override { return "azure"; }

    // Service SAS (signed version 2020-10-02)
    AccessHandle generate_access_handle(const std::string& container,
                                        const std::string& blob,
                                        const Permissions& permissions,
                                        std::chrono::hours validity) const override {
        AccessHandle handle;
        handle.account = base_.account_name;
        handle.endpoint = base_.endpoint;
        handle.container = container;
        handle.blob = blob;
        handle.permissions = permissions;
        // Whole seconds, so the expiry survives a round-trip through the token
        handle.expiry = std::chrono::time_point_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() + validity);

        std::string sp = permissions.to_string();
        std::string se = format_utc_timestamp(handle.expiry);
        std::string sr = blob.empty() ? "c" : "b";
        std::string resource = "/blob/" + base_.account_name + "/" + container;
        if (!blob.empty()) resource += "/" + blob;

        std::string string_to_sign =
            sp + "\n" +
            "\n" +                      // st
            se + "\n" +
            resource + "\n" +
            "\n" +                      // si
            "\n" +                      // sip
            "\n" +                      // spr
            constants::AZURE_API_VERSION + "\n" +
            sr + "\n" +
            "\n" +                      // snapshot time
            "\n\n\n\n";                 // rscc, rscd, rsce, rscl, rsct

        auto signature = hmac_sha256(net::base64_decode(base_.account_key.str()), string_to_sign);

        handle.token = std::string("sv=") + constants::AZURE_API_VERSION +
                       "&se=" + net::url_encode(se) +
                       "&sr=" + sr +
                       "&sp=" + sp +
                       "&sig=" + net::url_encode(net::base64_encode(signature));
        return handle;
    }

    std::unique_ptr<StorageBackend> open_container(const std::string& container) const override {
        AzureStorageBackend::Config config = base_;
        config.container = container;
        return std::make_unique<AzureStorageBackend>(std::move(config));
    }

private:
    AzureStorageBackend::Config base_;
};

uint64_t parse_size_param(const AccountConfig& config, const std::string& key, uint64_t fallback) {
    std::string value = config.param(key);
    if (value.empty()) return fallback;
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        throw InvalidConfiguration("Invalid value for '" + key + "': " + value);
    }
}

}  // anonymous namespace

// ============================================================================
// StorageBackendFactory
// ============================================================================

std::unique_ptr<StorageAccount> StorageBackendFactory::create(const AccountConfig& config) {
    std::string error = config.validate();
    if (!error.empty()) {
        throw InvalidConfiguration(error);
    }

    if (config.type == "local") {
        return create_local(config.param("path"));
    }

    // azure
    AccountConfig effective = config;
    if (!config.param("connection_string").empty()) {
        auto parsed = AccountConfig::from_connection_string(config.param("connection_string"));
        for (const auto& [k, v] : parsed.params) {
            if (effective.param(k).empty()) effective.params[k] = v;
        }
    }

    AzureStorageBackend::Config azure;
    azure.account_name = effective.param("account_name");
    azure.account_key = SecureString(effective.param("account_key"));
    azure.endpoint = effective.param("endpoint");
    while (!azure.endpoint.empty() && azure.endpoint.back() == '/') azure.endpoint.pop_back();
    std::string verify = effective.param("verify_ssl", "true");
    azure.verify_ssl = (verify == "true" || verify == "1");
    azure.block_size = parse_size_param(effective, "block_size", constants::DEFAULT_BLOCK_SIZE);
    azure.read_chunk_size = static_cast<size_t>(
        parse_size_param(effective, "read_chunk_size", constants::DEFAULT_READ_CHUNK_SIZE));
    azure.upload_concurrency = static_cast<size_t>(
        parse_size_param(effective, "upload_concurrency", constants::DEFAULT_UPLOAD_CONCURRENCY));

    log_debug("Azure account %s at %s", azure.account_name.c_str(),
              azure.endpoint.empty() ? "default endpoint" : azure.endpoint.c_str());
    return std::make_unique<AzureStorageAccount>(std::move(azure));
}

std::unique_ptr<StorageAccount> StorageBackendFactory::create_local(const fs::path& root_path) {
    return std::make_unique<LocalStorageAccount>(root_path);
}

std::unique_ptr<StorageAccount> StorageBackendFactory::create_azure(const std::string& account_name,
                                                                    const std::string& account_key,
                                                                    const std::string& endpoint) {
    AzureStorageBackend::Config config;
    config.account_name = account_name;
    config.account_key = SecureString(account_key);
    config.endpoint = endpoint;
    return std::make_unique<AzureStorageAccount>(std::move(config));
}

std::unique_ptr<StorageBackend> StorageBackendFactory::from_access_handle(const AccessHandle& handle) {
    if (handle.container.empty()) {
        throw InvalidConfiguration("Access handle has no container");
    }

    if (handle.is_local()) {
        std::string root = handle.endpoint.substr(std::strlen("file://"));
        if (root.empty()) {
            throw InvalidConfiguration("Local access handle has no root: " + handle.endpoint);
        }
        return std::make_unique<LocalStorageBackend>(root, handle.container, handle.permissions,
                                                     handle.expiry, handle.blob);
    }

    if (handle.token.empty()) {
        throw InvalidConfiguration("Access handle for " + handle.container + " has no token");
    }

    AzureStorageBackend::Config config;
    config.account_name = handle.account;
    config.sas_token = handle.token;
    config.container = handle.container;
    config.endpoint = handle.endpoint;
    return std::make_unique<AzureStorageBackend>(std::move(config));
}

}  // namespace ncpfm
