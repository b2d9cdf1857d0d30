#pragma once

#include "ncpfm/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace ncpfm::net {

enum class HttpMethod {
    GET,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

// Percent-encode everything except unreserved characters
std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);
std::vector<uint8_t> base64_decode(const std::string& encoded);

// Case-insensitive multi-valued header map
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Lower-cased names, sorted
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    static std::string normalize_name(const std::string& name);

    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds connect_timeout{constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds total_timeout{constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS * 1000};

    bool verify_ssl = true;

    // Used by execute_with_retry
    int max_retries = constants::DEFAULT_HTTP_MAX_RETRIES;
    std::chrono::milliseconds initial_retry_delay{500};
    double retry_backoff_multiplier = 2.0;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds total_time{0};

    // Transport-level failure description (empty when a status was received)
    std::string error;
    bool is_network_error = false;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // "HTTP <status>" or the transport error
    std::string describe_error() const;
};

struct HttpClientConfig {
    size_t max_idle_handles = 32;

    // Response size limit (0 = unlimited)
    size_t max_response_size = 256 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string user_agent = "ncpfm/1.0";

    bool tcp_keepalive = true;
    bool verbose = false;
};

// Blocking HTTP client over a pool of reusable libcurl easy handles.
// Safe to share across threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) const;

    // Retries network errors and retryable statuses with exponential backoff
    HttpResponse execute_with_retry(const HttpRequest& request) const;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ncpfm::net
