#include "cloudmux/net/http.hpp"
#include "cloudmux/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>

namespace cloudmux::net {

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_redirect_status(int status) {
    return status >= 300 && status < 400;
}

// --- percent encoding ---

namespace {

constexpr char kHexUpper[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string url_encode(const std::string& str) {
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHexUpper[c >> 4];
            out += kHexUpper[c & 0x0F];
        }
    }
    return out;
}

std::string url_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        char c = str[i];
        if (c == '+') {
            out += ' ';
            ++i;
            continue;
        }
        if (c == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                // Embedded NULs are dropped
                if (int byte = (hi << 4) | lo; byte != 0) out += static_cast<char>(byte);
                i += 3;
                continue;
            }
        }
        out += c;
        ++i;
    }
    return out;
}

// --- base64 (OpenSSL block codec) ---

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    // Normalise to the padded standard alphabet EVP_DecodeBlock expects
    std::string text;
    text.reserve(encoded.size() + 3);
    for (char c : encoded) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/') text += c;
    }
    if (text.size() % 4 == 1) text.pop_back();
    size_t padding = (4 - text.size() % 4) % 4;
    text.append(padding, '=');
    if (text.empty()) return {};

    std::vector<uint8_t> out(text.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) return {};
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

// --- HttpHeaders ---

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string key(name);
    for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return key;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it == headers_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(normalize_name(name)) != 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> pairs;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) pairs.emplace_back(name, value);
    }
    return pairs;
}

// --- HttpRequest / HttpResponse ---

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest request;
    request.url = url;
    return request;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    request.body.assign(body.begin(), body.end());
    return request;
}

HttpRequest HttpRequest::put(const std::string& url, std::span<const uint8_t> body_view) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = url;
    request.body_view = body_view;
    return request;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::DELETE;
    request.url = url;
    return request;
}

void HttpRequest::set_json_body(const std::string& json) {
    set_body(std::vector<uint8_t>(json.begin(), json.end()));
    headers.set_content_type("application/json");
}

void HttpRequest::set_form_body(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string form;
    for (const auto& [key, value] : fields) {
        if (!form.empty()) form += '&';
        form += url_encode(key);
        form += '=';
        form += url_encode(value);
    }
    set_body(std::vector<uint8_t>(form.begin(), form.end()));
    headers.set_content_type("application/x-www-form-urlencoded");
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// --- ParsedUrl ---

namespace {

bool parse_port(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5) return false;
    port = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        port = port * 10 + (c - '0');
    }
    return port <= 65535;
}

}  // namespace

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return std::nullopt;
    result.scheme = url.substr(0, scheme_end);

    auto authority_begin = scheme_end + 3;
    auto authority_end = std::min(url.find_first_of("/?#", authority_begin), url.size());
    std::string authority = url.substr(authority_begin, authority_end - authority_begin);
    if (authority.empty()) return std::nullopt;

    // [v6]:port, host:port or host
    std::string port_text;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        result.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port_text = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
    } else {
        result.host = authority;
    }
    if (!port_text.empty() && !parse_port(port_text, result.port)) return std::nullopt;

    auto fragment = std::min(url.find('#', authority_end), url.size());
    auto question = url.find('?', authority_end);
    if (question == std::string::npos || question > fragment) question = fragment;

    result.path = url.substr(authority_end, question - authority_end);
    if (question < fragment) result.query = url.substr(question + 1, fragment - question - 1);
    return result;
}

std::string ParsedUrl::to_string() const {
    std::string url = scheme + "://";
    url += host.find(':') == std::string::npos ? host : "[" + host + "]";
    if (port != 0) url += ":" + std::to_string(port);
    url += path.empty() ? "/" : path;
    if (!query.empty()) url += "?" + query;
    return url;
}

std::vector<std::pair<std::string, std::string>> ParsedUrl::query_params() const {
    std::vector<std::pair<std::string, std::string>> params;
    size_t begin = 0;
    while (begin <= query.size()) {
        auto end = std::min(query.find('&', begin), query.size());
        if (end > begin) {
            std::string pair = query.substr(begin, end - begin);
            auto eq = pair.find('=');
            params.emplace_back(url_decode(pair.substr(0, eq)),
                                eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1)));
        }
        begin = end + 1;
    }
    return params;
}

// --- libcurl callbacks ---

namespace {

// Where body bytes of one transfer go. A sink only receives 2xx bodies;
// anything else is buffered (up to the size bound) for error reporting.
struct BodyRouter {
    CURL* handle = nullptr;
    const BodySink* sink = nullptr;
    std::vector<uint8_t> buffered;
    size_t limit = 0;
    bool over_limit = false;
    bool sink_refused = false;
};

size_t on_body(char* data, size_t size, size_t count, void* userdata) {
    auto& router = *static_cast<BodyRouter*>(userdata);
    size_t bytes = size * count;

    if (router.sink) {
        long status = 0;
        curl_easy_getinfo(router.handle, CURLINFO_RESPONSE_CODE, &status);
        if (is_success_status(static_cast<int>(status))) {
            if ((*router.sink)(reinterpret_cast<const uint8_t*>(data), bytes)) return bytes;
            router.sink_refused = true;
            return 0;
        }
    }

    if (router.limit != 0 && router.buffered.size() + bytes > router.limit) {
        router.over_limit = true;
        return 0;
    }
    router.buffered.insert(router.buffered.end(), data, data + bytes);
    return bytes;
}

size_t on_header(char* data, size_t size, size_t count, void* userdata) {
    auto& headers = *static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * count;

    std::string_view line(data, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.remove_suffix(1);

    // Each hop of a followed redirect starts a fresh header block
    if (line.starts_with("HTTP/")) {
        headers.clear();
    } else if (auto colon = line.find(':'); colon != std::string_view::npos) {
        auto value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        value = first == std::string_view::npos ? std::string_view{} : value.substr(first);
        headers.add(std::string(line.substr(0, colon)), std::string(value));
    }
    return bytes;
}

struct UploadCursor {
    std::span<const uint8_t> payload;
    size_t offset = 0;
};

size_t on_upload_read(char* buffer, size_t size, size_t count, void* userdata) {
    auto& cursor = *static_cast<UploadCursor*>(userdata);
    size_t n = std::min(size * count, cursor.payload.size() - cursor.offset);
    if (n > 0) {
        std::memcpy(buffer, cursor.payload.data() + cursor.offset, n);
        cursor.offset += n;
    }
    return n;
}

class HeaderList {
public:
    explicit HeaderList(const HttpHeaders& headers) {
        for (const auto& [name, value] : headers.all()) append(name + ": " + value);
        // Presigned part URLs on some stores reject "Expect: 100-continue"
        append("Expect:");
    }
    ~HeaderList() { curl_slist_free_all(list_); }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    curl_slist* get() const { return list_; }

private:
    void append(const std::string& line) {
        if (auto* next = curl_slist_append(list_, line.c_str())) list_ = next;
    }

    curl_slist* list_ = nullptr;
};

}  // namespace

// --- HttpClient ---

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
        if (config_.max_connections == 0) config_.max_connections = 1;
    }

    ~Impl() {
        std::lock_guard lock(pool_mutex_);
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
    }

    HttpResponse perform(const HttpRequest& request, const BodySink* sink) {
        HttpResponse response;
        PooledHandle handle(*this);
        if (!handle) {
            response.error = "no curl handle available";
            response.is_network_error = true;
            return response;
        }

        HeaderList header_list(request.headers);
        UploadCursor cursor{request.payload()};
        BodyRouter router;
        router.handle = handle.get();
        router.sink = sink;
        router.limit = config_.max_response_size;
        std::string range;

        CURL* curl = handle.get();
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
        apply_method(curl, request.method, cursor);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &router);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        apply_connection(curl, request);

        CURLcode rc = curl_easy_perform(curl);
        if (rc == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(router.buffered);
        } else if (router.over_limit) {
            response.status_code = 413;
            response.error = "response body larger than " +
                             std::to_string(config_.max_response_size) + " bytes";
        } else {
            response.is_network_error = true;
            response.error = router.sink_refused ? "transfer aborted by receiver"
                                                 : curl_easy_strerror(rc);
        }
        if (!response.error.empty()) {
            log_debug("%s %s: %s", http_method_to_string(request.method), request.url.c_str(),
                      response.error.c_str());
        }
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    // Borrowed easy handle, reset and returned to the pool on scope exit.
    class PooledHandle {
    public:
        explicit PooledHandle(Impl& owner) : owner_(owner), handle_(owner.acquire()) {}
        ~PooledHandle() { owner_.release(handle_); }
        PooledHandle(const PooledHandle&) = delete;
        PooledHandle& operator=(const PooledHandle&) = delete;

        explicit operator bool() const { return handle_ != nullptr; }
        CURL* get() const { return handle_; }

    private:
        Impl& owner_;
        CURL* handle_;
    };

    static void apply_method(CURL* curl, HttpMethod method, UploadCursor& cursor) {
        switch (method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                return;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload_read);
                curl_easy_setopt(curl, CURLOPT_READDATA, &cursor);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(cursor.payload.size()));
                return;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
        }
        if (!cursor.payload.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, cursor.payload.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(cursor.payload.size()));
        } else if (method == HttpMethod::POST) {
            // An empty POST must not fall back to reading stdin
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
        }
    }

    void apply_connection(CURL* curl, const HttpRequest& request) const {
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.timeout.value_or(config_.default_total_timeout).count()));
        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        bool verify = request.verify_ssl && config_.verify_ssl_by_default;
        if (!verify) {
            static std::once_flag warned;
            std::call_once(warned, [] { log_warn("TLS certificate verification is disabled"); });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
        if (!config_.ca_bundle.empty()) curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        if (!config_.proxy_url.empty()) curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
    }

    CURL* acquire() {
        {
            std::lock_guard lock(pool_mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release(CURL* handle) {
        if (!handle) return;
        curl_easy_reset(handle);
        std::lock_guard lock(pool_mutex_);
        if (idle_.size() < config_.max_connections) {
            idle_.push_back(handle);
            return;
        }
        curl_easy_cleanup(handle);
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->perform(request, nullptr);
}

HttpResponse HttpClient::stream(const HttpRequest& request, const BodySink& sink) {
    return impl_->perform(request, &sink);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace cloudmux::net
