#include "ncpfm/storage/backend.hpp"
#include "ncpfm/errors.hpp"
#include "ncpfm/net/http.hpp"

#include <cstdio>
#include <ctime>
#include <iterator>
#include <map>

namespace ncpfm {

// ============================================================================
// Storage tiers
// ============================================================================

const char* storage_tier_name(StorageTier tier) {
    switch (tier) {
        case StorageTier::Hot: return "Hot";
        case StorageTier::Cool: return "Cool";
        case StorageTier::Cold: return "Cold";
        case StorageTier::Archive: return "Archive";
    }
    return "Hot";
}

std::optional<StorageTier> parse_storage_tier(const std::string& name) {
    if (name == "Hot" || name == "hot") return StorageTier::Hot;
    if (name == "Cool" || name == "cool") return StorageTier::Cool;
    if (name == "Cold" || name == "cold") return StorageTier::Cold;
    if (name == "Archive" || name == "archive") return StorageTier::Archive;
    return std::nullopt;
}

// ============================================================================
// Permissions
// ============================================================================

Permissions Permissions::read_only() {
    Permissions p;
    p.read = true;
    p.list = true;
    return p;
}

Permissions Permissions::read_write() {
    Permissions p;
    p.read = p.add = p.create = p.write = p.remove = p.list = true;
    return p;
}

Permissions Permissions::blob_upload() {
    Permissions p;
    p.create = true;
    p.write = true;
    return p;
}

Permissions Permissions::blob_download() {
    Permissions p;
    p.read = true;
    return p;
}

Permissions Permissions::from_string(const std::string& sp) {
    Permissions p;
    for (char c : sp) {
        switch (c) {
            case 'r': p.read = true; break;
            case 'a': p.add = true; break;
            case 'c': p.create = true; break;
            case 'w': p.write = true; break;
            case 'd': p.remove = true; break;
            case 'l': p.list = true; break;
            default: break;
        }
    }
    return p;
}

std::string Permissions::to_string() const {
    std::string sp;
    if (read) sp += 'r';
    if (add) sp += 'a';
    if (create) sp += 'c';
    if (write) sp += 'w';
    if (remove) sp += 'd';
    if (list) sp += 'l';
    return sp;
}

// ============================================================================
// Timestamps
// ============================================================================

std::string format_utc_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parse_utc_timestamp(const std::string& s) {
    std::tm tm_buf{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d", &year, &month, &day,
                    &hour, &minute, &second) != 6) {
        return std::nullopt;
    }
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

// ============================================================================
// AccessHandle
// ============================================================================

namespace {

constexpr const char* LOCAL_SCHEME = "file://";

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        std::string param = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = net::url_decode(param.substr(eq + 1));
        } else if (!param.empty()) {
            params[param] = "";
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return params;
}

// Drop the given keys from a raw query string, keeping the rest verbatim
std::string strip_query_keys(const std::string& query, std::initializer_list<const char*> keys) {
    std::string out;
    size_t pos = 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        std::string param = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        std::string name = param.substr(0, param.find('='));
        bool drop = false;
        for (const char* key : keys) {
            if (name == key) drop = true;
        }
        if (!drop && !param.empty()) {
            if (!out.empty()) out += '&';
            out += param;
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return out;
}

std::string encode_blob_path(const std::string& path) {
    std::string result;
    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        std::string segment = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (start > 0) result += '/';
        result += net::url_encode(segment);
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return result;
}

std::string decode_blob_path(const std::string& path) {
    // '+' is literal in a path; only decode percent escapes
    std::string protected_path;
    for (char c : path) {
        if (c == '+') {
            protected_path += "%2B";
        } else {
            protected_path += c;
        }
    }
    return net::url_decode(protected_path);
}

void apply_token_fields(AccessHandle& handle, const std::map<std::string, std::string>& params) {
    auto sp = params.find("sp");
    if (sp != params.end()) handle.permissions = Permissions::from_string(sp->second);
    auto se = params.find("se");
    if (se != params.end()) {
        auto expiry = parse_utc_timestamp(se->second);
        if (expiry) handle.expiry = *expiry;
    }
}

}  // anonymous namespace

bool AccessHandle::is_local() const {
    return endpoint.starts_with(LOCAL_SCHEME);
}

bool AccessHandle::expired() const {
    return expiry <= std::chrono::system_clock::now();
}

std::string AccessHandle::url() const {
    if (is_local()) {
        std::string url = endpoint + "?container=" + net::url_encode(container);
        if (!blob.empty()) url += "&blob=" + net::url_encode(blob);
        if (!token.empty()) url += "&" + token;
        return url;
    }

    std::string url = endpoint + "/" + container;
    if (!blob.empty()) url += "/" + encode_blob_path(blob);
    if (!token.empty()) url += "?" + token;
    return url;
}

std::optional<AccessHandle> AccessHandle::from_url(const std::string& url) {
    AccessHandle handle;

    auto qpos = url.find('?');
    std::string base = url.substr(0, qpos);
    std::string query = qpos == std::string::npos ? "" : url.substr(qpos + 1);
    auto params = parse_query(query);

    if (base.starts_with(LOCAL_SCHEME)) {
        handle.endpoint = base;
        auto container = params.find("container");
        if (container == params.end() || container->second.empty()) return std::nullopt;
        handle.container = container->second;
        auto blob = params.find("blob");
        if (blob != params.end()) handle.blob = blob->second;
        handle.token = strip_query_keys(query, {"container", "blob"});
        apply_token_fields(handle, params);
        return handle;
    }

    auto scheme_end = base.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;
    auto host_start = scheme_end + 3;
    auto path_start = base.find('/', host_start);
    if (path_start == std::string::npos) return std::nullopt;

    std::string host = base.substr(host_start, path_start - host_start);
    std::string path = base.substr(path_start + 1);
    while (!path.empty() && path.back() == '/') path.pop_back();
    if (host.empty() || path.empty()) return std::nullopt;

    std::string endpoint = base.substr(0, path_start);
    auto dot = host.find('.');
    if (dot != std::string::npos && host.find(".blob.") != std::string::npos) {
        // Virtual-hosted: https://<account>.blob.core.windows.net/<container>/<blob>
        handle.account = host.substr(0, dot);
    } else {
        // Path-style (emulators): http://127.0.0.1:10000/<account>/<container>/<blob>
        auto slash = path.find('/');
        if (slash == std::string::npos) return std::nullopt;
        handle.account = path.substr(0, slash);
        endpoint += "/" + handle.account;
        path = path.substr(slash + 1);
    }

    auto slash = path.find('/');
    handle.endpoint = endpoint;
    handle.container = decode_blob_path(path.substr(0, slash));
    if (slash != std::string::npos) {
        handle.blob = decode_blob_path(path.substr(slash + 1));
    }
    handle.token = query;
    apply_token_fields(handle, params);

    if (handle.container.empty()) return std::nullopt;
    return handle;
}

// ============================================================================
// StorageBackend helpers
// ============================================================================

std::vector<ListEntry> StorageBackend::list_all(const std::string& prefix) const {
    std::vector<ListEntry> entries;
    ListOptions options;
    options.prefix = prefix;

    while (true) {
        ListResult page = list(options);
        if (!page.success) {
            throw StorageError("Failed to list '" + prefix + "' in " + container() + ": " +
                               page.error_message);
        }
        entries.insert(entries.end(),
                       std::make_move_iterator(page.entries.begin()),
                       std::make_move_iterator(page.entries.end()));
        if (!page.truncated || page.continuation_token.empty()) break;
        options.continuation_token = page.continuation_token;
    }
    return entries;
}

}  // namespace ncpfm
