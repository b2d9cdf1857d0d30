#include "ncpfm/net/http.hpp"
#include "ncpfm/core/log.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <iterator>
#include <cstring>
#include <mutex>
#include <new>
#include <string_view>
#include <thread>

namespace ncpfm::net {

// ============================================================================
// Status and encoding helpers
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    static constexpr const char* names[] = {"GET", "PUT", "DELETE", "HEAD"};
    auto index = static_cast<size_t>(method);
    return index < std::size(names) ? names[index] : "GET";
}

bool is_success_status(int status) {
    return status / 100 == 2;
}

bool is_retryable_status(int status) {
    switch (status) {
        case 408:   // request timeout
        case 429:   // account throttled
        case 500:
        case 502:
        case 503:   // server busy
        case 504:
            return true;
        default:
            return false;
    }
}

std::string url_encode(const std::string& str) {
    // curl keeps exactly the RFC 3986 unreserved set
    char* escaped = curl_easy_escape(nullptr, str.data(), static_cast<int>(str.size()));
    if (!escaped) {
        throw std::bad_alloc();
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string url_decode(const std::string& str) {
    auto nibble = [](char c) -> int {
        if (std::isdigit(static_cast<unsigned char>(c))) return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return (c >= 'a' && c <= 'f') ? c - 'a' + 10 : -1;
    };

    std::string out;
    out.reserve(str.size());
    size_t pos = 0;
    while (pos < str.size()) {
        char c = str[pos];
        if (c == '+') {
            out.push_back(' ');
            ++pos;
            continue;
        }
        if (c == '%' && pos + 2 < str.size()) {
            int hi = nibble(str[pos + 1]);
            int lo = nibble(str[pos + 2]);
            if (hi >= 0 && lo >= 0) {
                char decoded = static_cast<char>(hi * 16 + lo);
                if (decoded != '\0') out.push_back(decoded);
                pos += 3;
                continue;
            }
        }
        out.push_back(c);
        ++pos;
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    // EVP_DecodeBlock rejects whitespace and wants whole quanta
    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/') {
            clean.push_back(c);
        }
    }
    size_t pad = (4 - clean.size() % 4) % 4;
    if (pad == 3) {
        clean.pop_back();   // a lone trailing sextet carries no whole byte
        pad = 0;
    }
    clean.append(pad, '=');
    if (clean.empty()) return {};

    std::vector<uint8_t> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) return {};
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (unsigned char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    return lowered;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    auto& values = headers_[normalize_name(name)];
    values.assign(1, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto found = headers_.find(normalize_name(name));
    if (found == headers_.end() || found->second.empty()) {
        return std::nullopt;
    }
    return found->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(normalize_name(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> flat;
    for (const auto& entry : headers_) {
        for (const auto& v : entry.second) {
            flat.emplace_back(entry.first, v);
        }
    }
    return flat;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("content-type", content_type);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("content-type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto raw = get("content-length");
    if (!raw) return std::nullopt;

    uint64_t length = 0;
    const char* first = raw->data();
    const char* last = first + raw->size();
    auto [end, ec] = std::from_chars(first, last, length);
    if (ec != std::errc{} || end == first) return std::nullopt;
    return length;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

} // anonymous namespace

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::head(const std::string& url) {
    return make_request(HttpMethod::HEAD, url);
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    auto req = make_request(HttpMethod::PUT, url);
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

std::string HttpResponse::body_string() const {
    return {reinterpret_cast<const char*>(body.data()), body.size()};
}

std::string HttpResponse::describe_error() const {
    return error.empty() ? "HTTP " + std::to_string(status_code) : error;
}

// ============================================================================
// libcurl plumbing
// ============================================================================

namespace {

// State shared with the curl callbacks for one request
struct Exchange {
    const std::vector<uint8_t>* upload = nullptr;
    size_t upload_offset = 0;

    std::vector<uint8_t> download;
    size_t download_limit = 0;
    bool download_truncated = false;

    HttpHeaders* response_headers = nullptr;
};

size_t on_body(char* data, size_t size, size_t count, void* user) {
    auto& ex = *static_cast<Exchange*>(user);
    size_t n = size * count;
    if (ex.download_limit != 0 && ex.download.size() + n > ex.download_limit) {
        ex.download_truncated = true;
        return 0;
    }
    ex.download.insert(ex.download.end(), data, data + n);
    return n;
}

size_t on_upload(char* dest, size_t size, size_t count, void* user) {
    auto& ex = *static_cast<Exchange*>(user);
    size_t remaining = ex.upload->size() - ex.upload_offset;
    size_t n = std::min(size * count, remaining);
    std::memcpy(dest, ex.upload->data() + ex.upload_offset, n);
    ex.upload_offset += n;
    return n;
}

size_t on_header(char* data, size_t size, size_t count, void* user) {
    auto& ex = *static_cast<Exchange*>(user);
    size_t n = size * count;

    std::string_view line(data, n);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    // Interim responses (100 Continue, redirects) restart the header block
    if (line.substr(0, 5) == "HTTP/") {
        *ex.response_headers = HttpHeaders{};
        return n;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return n;
    }
    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    ex.response_headers->add(std::string(line.substr(0, colon)), std::string(value));
    return n;
}

// Owns a curl_slist for the duration of a request
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(list_); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) {
        list_ = curl_slist_append(list_, line.c_str());
    }

    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

} // anonymous namespace

// ============================================================================
// HttpClient::Impl
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    ~Impl() {
        std::lock_guard lock(mutex_);
        std::for_each(idle_.begin(), idle_.end(), curl_easy_cleanup);
    }

    HttpResponse perform(const HttpRequest& request) {
        HttpResponse response;

        // Borrowed easy handle, reset and returned to the pool on exit
        struct Lease {
            Impl& owner;
            CURL* handle;
            ~Lease() { if (handle) owner.give_back(handle); }
        } lease{*this, take()};

        if (!lease.handle) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        Exchange ex;
        ex.upload = &request.body;
        ex.download_limit = config_.max_response_size;
        ex.response_headers = &response.headers;

        HeaderList headers;
        for (const auto& [name, value] : request.headers.all()) {
            headers.append(name + ": " + value);
        }
        headers.append("Expect:");   // no 100-continue round trip on block uploads

        configure(lease.handle, request, ex, headers);

        auto started = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(lease.handle);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (ex.download_truncated) {
            response.status_code = 413;
            response.error = "response larger than " +
                             std::to_string(config_.max_response_size) + " bytes";
            return response;
        }
        if (rc != CURLE_OK) {
            response.is_network_error = true;
            response.error = curl_easy_strerror(rc);
            return response;
        }

        long status = 0;
        curl_easy_getinfo(lease.handle, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
        response.body = std::move(ex.download);
        return response;
    }

    HttpResponse perform_with_retry(const HttpRequest& request) {
        auto backoff = request.initial_retry_delay;
        for (int attempt = 0;; ++attempt) {
            HttpResponse response = perform(request);
            bool transient = response.is_network_error ||
                             is_retryable_status(response.status_code);
            if (!transient || attempt >= request.max_retries) {
                return response;
            }

            log_debug("[http] %s %s: %s (attempt %d), backing off %lld ms",
                      http_method_to_string(request.method), request.url.c_str(),
                      response.describe_error().c_str(), attempt + 1,
                      static_cast<long long>(backoff.count()));
            std::this_thread::sleep_for(backoff);
            backoff = std::chrono::milliseconds(static_cast<long long>(
                static_cast<double>(backoff.count()) * request.retry_backoff_multiplier));
        }
    }

    const HttpClientConfig& config() const { return config_; }

private:
    void configure(CURL* h, const HttpRequest& request, Exchange& ex,
                   const HeaderList& headers) const {
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

        switch (request.method) {
            case HttpMethod::PUT:
                curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(h, CURLOPT_READFUNCTION, on_upload);
                curl_easy_setopt(h, CURLOPT_READDATA, &ex);
                curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::GET:
                curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
                break;
        }

        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &ex);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &ex);

        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));

        const bool verify = config_.verify_ssl_by_default && request.verify_ssl;
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        // SAS-signed redirects stay within the account
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);

        if (config_.tcp_keepalive) curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
        if (!config_.user_agent.empty()) curl_easy_setopt(h, CURLOPT_USERAGENT, config_.user_agent.c_str());
        if (config_.verbose) curl_easy_setopt(h, CURLOPT_VERBOSE, 1L);
    }

    CURL* take() {
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty()) {
                CURL* h = idle_.back();
                idle_.pop_back();
                return h;
            }
        }
        return curl_easy_init();
    }

    void give_back(CURL* h) {
        curl_easy_reset(h);
        std::lock_guard lock(mutex_);
        if (idle_.size() >= config_.max_idle_handles) {
            curl_easy_cleanup(h);
            return;
        }
        idle_.push_back(h);
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) const {
    return impl_->perform(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) const {
    return impl_->perform_with_retry(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

} // namespace ncpfm::net
