#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace cloudmux::net {

enum class HttpMethod { GET, POST, PUT, DELETE };

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_redirect_status(int status);

std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);
/// Accepts the standard and URL-safe alphabets, with or without padding.
/// Characters outside the alphabet are skipped.
std::vector<uint8_t> base64_decode(const std::string& encoded);

/// Header map with case-insensitive names (stored lowercase).
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    /// First value for the name, if any.
    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type) { set("Content-Type", content_type); }
    void set_bearer_token(const std::string& token) { set("Authorization", "Bearer " + token); }

private:
    static std::string normalize_name(const std::string& name);
    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Owned body. When body_view is non-empty it takes precedence, so a
    // chunk buffer can be sent without copying it into the request.
    std::vector<uint8_t> body;
    std::span<const uint8_t> body_view;

    // Overrides HttpClientConfig::default_total_timeout
    std::optional<std::chrono::milliseconds> timeout;

    // Inclusive byte range, sent as "Range: bytes=first-second"
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    bool follow_redirects = true;
    bool verify_ssl = true;

    std::span<const uint8_t> payload() const {
        if (!body_view.empty()) return body_view;
        return std::span<const uint8_t>(body.data(), body.size());
    }

    void set_body(std::vector<uint8_t> data) {
        body = std::move(data);
        body_view = {};
    }

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::span<const uint8_t> body_view);
    static HttpRequest del(const std::string& url);

    void set_json_body(const std::string& json);
    void set_form_body(const std::vector<std::pair<std::string, std::string>>& fields);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string error;
    bool is_network_error = false;

    bool ok() const { return !is_network_error && is_success_status(status_code); }
    std::string body_string() const;
};

/// Receives response body bytes as they arrive. Return false to abort the transfer.
using BodySink = std::function<bool(const uint8_t* data, size_t size)>;

/// Seam between the engine and the wire. HttpClient is the production
/// implementation; tests script responses through their own subclass.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Execute and buffer the whole response body.
    virtual HttpResponse execute(const HttpRequest& request) = 0;

    /// Execute and hand 2xx body bytes to sink as they arrive. Non-2xx
    /// bodies are buffered in the response instead, for error reporting.
    virtual HttpResponse stream(const HttpRequest& request, const BodySink& sink) = 0;
};

struct HttpClientConfig {
    std::string user_agent = "cloudmux/1.0";
    size_t max_connections = 32;
    size_t max_response_size = 64 * 1024 * 1024;  // buffered bodies only

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{30};

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds default_total_timeout{300000};

    bool verify_ssl_by_default = true;
    std::string ca_bundle;
    std::string proxy_url;
};

/// libcurl-backed transport with a pool of reusable easy handles.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;
    HttpResponse stream(const HttpRequest& request, const BodySink& sink) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);
    /// Reassembled URL; an empty path becomes "/".
    std::string to_string() const;

    /// Query parameters, decoded, in order of appearance.
    std::vector<std::pair<std::string, std::string>> query_params() const;
};

}  // namespace cloudmux::net
