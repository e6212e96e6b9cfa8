#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace glacierup::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_server_error_status(int status);

// 408, 429 and 5xx: worth another attempt
bool is_retryable_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<std::string> content_type() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Borrowed body, sent instead of `body` when set. The caller keeps the
    // bytes alive until execute() returns.
    std::span<const uint8_t> body_view;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{300000};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    std::span<const uint8_t> payload() const {
        return body_view.data() ? body_view : std::span<const uint8_t>(body);
    }

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

struct HttpClientConfig {
    size_t max_idle_handles = 16;

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    std::string user_agent = "glacier-upload/1.0";
};

/// Blocking HTTP client over libcurl easy handles.
///
/// Handles are pooled and reused across calls so keep-alive connections
/// survive between part uploads. execute() is safe to call from many threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS SigV4 signing helper
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    // Sign a request; sets Host, X-Amz-Date, X-Amz-Content-Sha256 and Authorization
    void sign(HttpRequest& request) const;

    // Sign with session token (for STS credentials)
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

    // Sign at a fixed timestamp (YYYYMMDDTHHMMSSZ)
    void sign_at(HttpRequest& request, const std::string& datetime) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;

    // Host header value: host, plus ":port" when not the scheme default
    std::string authority() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

std::string url_encode(const std::string& str);

std::string sha256_hex(std::span<const uint8_t> data);

} // namespace glacierup::net
