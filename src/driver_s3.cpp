#include "cloudmux/drivers/s3.hpp"
#include "cloudmux/log.hpp"

#include <algorithm>
#include <sstream>

namespace cloudmux::drivers {

namespace {

constexpr const char* kS3Namespace = "http://s3.amazonaws.com/doc/2006-03-01/";
constexpr const char* kModeAttribute = "mode";

// Value between <tag> and </tag>, empty when absent
std::string xml_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";
    return xml.substr(start, end - start);
}

// Contents of every <tag>...</tag>, in document order
std::vector<std::string> xml_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;
        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;
        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }
    return results;
}

std::string xml_unescape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }
    return result;
}

std::string xml_escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

// CompleteMultipartUpload wants quoted ETags
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

std::string strip_quotes(std::string etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }
    return etag;
}

// Percent-encode each path segment, keeping the separators
std::string encode_key(const std::string& key) {
    std::string out;
    size_t pos = 0;
    while (pos <= key.size()) {
        size_t slash = key.find('/', pos);
        if (slash == std::string::npos) slash = key.size();
        out += net::url_encode(key.substr(pos, slash - pos));
        if (slash < key.size()) out += '/';
        pos = slash + 1;
    }
    return out;
}

std::string leaf_name(const std::string& key, const std::string& prefix) {
    std::string name = key.substr(std::min(prefix.size(), key.size()));
    if (!name.empty() && name.back() == '/') name.pop_back();
    return name;
}

}  // namespace

// --- Config ---

std::string S3Driver::Config::validate() const {
    if (bucket.empty()) return "bucket is required";
    if (access_key_id.empty() || secret_access_key.empty()) {
        return "access_key_id and secret_access_key are required";
    }
    if (chunk_size < kMinPartSize) return "chunk size must be at least 5 MiB for multipart uploads";
    if (!endpoint.empty() && endpoint.rfind("http", 0) != 0) return "endpoint must be an http(s) URL";
    return {};
}

S3Driver::Config S3Driver::Config::from_params(const DriverParams& params) {
    Config config;
    config.bucket = param_or(params, "bucket");
    config.region = param_or(params, "region", "us-east-1");
    config.endpoint = param_or(params, "endpoint");
    while (!config.endpoint.empty() && config.endpoint.back() == '/') config.endpoint.pop_back();
    config.path_style = param_flag(params, "path_style", !config.endpoint.empty());
    config.access_key_id = param_or(params, "access_key_id");
    config.secret_access_key = param_or(params, "secret_access_key");
    config.session_token = param_or(params, "session_token");
    config.root_prefix = param_or(params, "root_prefix");
    if (!config.root_prefix.empty() && config.root_prefix.back() != '/') config.root_prefix += '/';
    config.proxy_required = param_flag(params, "proxy_required", false);
    config.chunk_size = param_u64(params, "chunk_size_mb", 10) * kMiB;
    return config;
}

// --- Helpers ---

std::string S3Driver::bucket_url() const {
    std::string endpoint = config_.endpoint.empty()
                               ? "https://s3." + config_.region + ".amazonaws.com"
                               : config_.endpoint;
    if (config_.path_style) return endpoint + "/" + config_.bucket;

    auto parsed = net::ParsedUrl::parse(endpoint);
    if (!parsed) return endpoint + "/" + config_.bucket;
    parsed->host = config_.bucket + "." + parsed->host;
    parsed->path.clear();
    std::string url = parsed->to_string();
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::string S3Driver::object_url(const std::string& key) const {
    return bucket_url() + "/" + encode_key(key);
}

std::string S3Driver::join_key(const std::string& prefix, const std::string& name) {
    if (prefix.empty()) return name;
    return prefix.back() == '/' ? prefix + name : prefix + "/" + name;
}

std::optional<TransferError> S3Driver::parse_error(const net::HttpResponse& response) {
    std::string body = response.body_string();
    if (body.find("<Error>") == std::string::npos) return std::nullopt;
    std::string error = xml_element(body, "Error");
    return TransferError::make(ErrorKind::BackendRejected,
                               xml_unescape(xml_element(error, "Message")),
                               xml_element(error, "Code"), response.status_code);
}

ExecuteResult S3Driver::send(net::HttpRequest request) {
    return engine_->execute(request);
}

// --- Upload protocol ---

class S3Protocol : public UploadProtocol {
public:
    explicit S3Protocol(S3Driver& driver) : driver_(driver) {}

    TransferError open_session(SignedExecutor&, UploadSession& session) override {
        session.remote_id = S3Driver::join_key(session.parent_id, session.name);
        if (session.total_size <= session.chunk_size) {
            session.attributes[kModeAttribute] = "single";
            return {};
        }

        net::HttpRequest request;
        request.method = net::HttpMethod::POST;
        request.url = driver_.object_url(session.remote_id) + "?uploads";
        auto result = driver_.send(std::move(request));
        if (!result.success) return result.error;

        session.upload_id = xml_element(result.response.body_string(), "UploadId");
        if (session.upload_id.empty()) {
            return TransferError::make(ErrorKind::BackendRejected, "no UploadId in response");
        }
        session.attributes[kModeAttribute] = "multipart";
        log_debug("Multipart upload %s started for %s", session.upload_id.c_str(),
                  session.remote_id.c_str());
        return {};
    }

    TransferError resolve_part_target(SignedExecutor&, UploadSession& session,
                                      PartDescriptor& part, std::span<const uint8_t>) override {
        PartTarget target;
        target.method = net::HttpMethod::PUT;
        target.url = driver_.object_url(session.remote_id);
        if (!single(session)) {
            target.url += "?partNumber=" + std::to_string(part.part_number) +
                          "&uploadId=" + net::url_encode(session.upload_id);
        }
        part.target = std::move(target);
        return {};
    }

    // Parts are signed like any other request, so no presigned URL is needed
    TransferError upload_part(SignedExecutor&, UploadSession&, PartDescriptor& part,
                              std::span<const uint8_t> data) override {
        net::HttpRequest request;
        request.method = part.target->method;
        request.url = part.target->url;
        request.body_view = data;

        auto result = driver_.send(std::move(request));
        if (!result.success) return result.error;
        part.etag = ensure_etag_quotes(result.response.headers.get("ETag").value_or(""));
        return {};
    }

    CommitResult commit(SignedExecutor&, UploadSession& session, const std::string&) override {
        CommitResult result;
        result.handle.id = session.remote_id;
        result.handle.name = session.name;
        result.handle.parent_id = session.parent_id;
        result.handle.size = session.total_size;

        if (single(session)) {
            if (session.parts.empty()) {
                // Zero-byte object: nothing was flushed
                auto put = driver_.send(net::HttpRequest::put(driver_.object_url(session.remote_id), {}));
                if (!put.success) {
                    result.error = put.error;
                    return result;
                }
                result.handle.checksum = strip_quotes(put.response.headers.get("ETag").value_or(""));
            } else {
                result.handle.checksum = strip_quotes(session.parts.front().etag);
            }
            result.success = true;
            return result;
        }

        std::ostringstream xml;
        xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        xml << "<CompleteMultipartUpload xmlns=\"" << kS3Namespace << "\">\n";
        for (const auto& part : session.parts) {
            xml << "  <Part>\n";
            xml << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
            xml << "    <ETag>" << xml_escape(part.etag) << "</ETag>\n";
            xml << "  </Part>\n";
        }
        xml << "</CompleteMultipartUpload>";

        net::HttpRequest request = net::HttpRequest::post(
            driver_.object_url(session.remote_id) + "?uploadId=" + net::url_encode(session.upload_id),
            xml.str());
        request.headers.set_content_type("application/xml");
        auto complete = driver_.send(std::move(request));
        if (!complete.success) {
            result.error = complete.error;
            return result;
        }

        result.handle.checksum = strip_quotes(
            xml_unescape(xml_element(complete.response.body_string(), "ETag")));
        result.success = true;
        return result;
    }

private:
    static bool single(const UploadSession& session) {
        auto it = session.attributes.find(kModeAttribute);
        return it != session.attributes.end() && it->second == "single";
    }

    S3Driver& driver_;
};

// --- Driver ---

S3Driver::S3Driver(Config config, std::shared_ptr<net::HttpTransport> transport)
    : config_(std::move(config)) {
    signer_ = std::make_shared<SigV4Signer>(config_.access_key_id, config_.secret_access_key,
                                            config_.region);

    BackendAdapter adapter;
    adapter.name = kType;
    adapter.endpoints["bucket"] = bucket_url();
    adapter.signer = signer_;
    adapter.chunk_policy = std::make_shared<FixedChunkPolicy>(config_.chunk_size);
    adapter.proxy_required = config_.proxy_required;
    adapter.dedup.dedup_enabled = false;

    // 200 responses can still carry an <Error> body (CompleteMultipartUpload)
    adapter.response_policy.parse_error = &S3Driver::parse_error;
    adapter.response_policy.is_auth_expired = [](const net::HttpResponse& response) {
        if (response.is_network_error || response.status_code < 400) return false;
        auto error = parse_error(response);
        return error && (error->code == "ExpiredToken" || error->code == "TokenRefreshRequired");
    };
    adapter.response_policy.is_quota_exceeded = [](const TransferError& error) {
        return error.code == "QuotaExceeded";
    };

    TokenSet tokens;
    tokens.access_token = config_.session_token;
    auto session = std::make_shared<CredentialSession>(tokens, nullptr);
    engine_ = std::make_unique<TransferEngine>(std::move(adapter), std::move(session),
                                               std::move(transport));
}

UploadResult S3Driver::upload(const std::string& parent_id, const std::string& name, uint64_t size,
                              ByteSource& source, const UploadOptions& options) {
    UploadRequest request;
    request.parent_id = parent_id.empty() ? config_.root_prefix : parent_id;
    request.name = name;
    request.size = size;
    request.source = &source;
    request.progress = options.progress;
    request.cancel = options.cancel;

    S3Protocol protocol(*this);
    return engine_->upload(request, protocol);
}

DownloadResult S3Driver::download(const RemoteFileHandle& file, std::optional<ByteRange> range) {
    DownloadResult result;
    if (file.is_directory) {
        result.error = TransferError::make(ErrorKind::Precondition, file.id + " is a prefix");
        return result;
    }

    DownloadTarget target;
    target.request = net::HttpRequest::get(object_url(file.id));
    target.signed_request = true;
    target.supports_ranges = true;
    if (file.size > 0) target.size = file.size;

    result.stream = engine_->download(std::move(target), range);
    result.success = true;
    return result;
}

ListResult S3Driver::list(const std::string& dir_id) {
    ListResult result;
    std::string prefix = dir_id.empty() ? config_.root_prefix : dir_id;
    if (!prefix.empty() && prefix.back() != '/') prefix += '/';

    std::string token;
    for (;;) {
        std::string url = bucket_url() + "?list-type=2&delimiter=%2F&max-keys=1000";
        if (!prefix.empty()) url += "&prefix=" + net::url_encode(prefix);
        if (!token.empty()) url += "&continuation-token=" + net::url_encode(token);

        auto response = send(net::HttpRequest::get(url));
        if (!response.success) {
            result.error = response.error;
            return result;
        }
        std::string xml = response.response.body_string();

        for (const auto& common : xml_elements(xml, "CommonPrefixes")) {
            RemoteFileHandle dir;
            dir.id = xml_unescape(xml_element(common, "Prefix"));
            dir.name = leaf_name(dir.id, prefix);
            dir.parent_id = prefix;
            dir.is_directory = true;
            result.entries.push_back(std::move(dir));
        }
        for (const auto& content : xml_elements(xml, "Contents")) {
            RemoteFileHandle file;
            file.id = xml_unescape(xml_element(content, "Key"));
            if (file.id == prefix) continue;  // the directory marker itself
            file.name = leaf_name(file.id, prefix);
            file.parent_id = prefix;
            std::string size = xml_element(content, "Size");
            try {
                file.size = size.empty() ? 0 : std::stoull(size);
            } catch (const std::exception&) {
                log_warn("Bad object size '%s' for %s", size.c_str(), file.id.c_str());
            }
            file.checksum = strip_quotes(xml_unescape(xml_element(content, "ETag")));
            file.modified = xml_element(content, "LastModified");
            result.entries.push_back(std::move(file));
        }

        if (xml_element(xml, "IsTruncated") != "true") break;
        token = xml_unescape(xml_element(xml, "NextContinuationToken"));
        if (token.empty()) break;
    }

    result.success = true;
    return result;
}

OperationResult S3Driver::remove(const RemoteFileHandle& file) {
    OperationResult result;
    std::string key = file.id;
    if (file.is_directory && !key.empty() && key.back() != '/') key += '/';

    auto response = send(net::HttpRequest::del(object_url(key)));
    if (!response.success) {
        result.error = response.error;
        return result;
    }
    result.handle = file;
    result.success = true;
    return result;
}

OperationResult S3Driver::mkdir(const std::string& parent_id, const std::string& name) {
    OperationResult result;
    std::string parent = parent_id.empty() ? config_.root_prefix : parent_id;
    std::string key = join_key(parent, name) + "/";

    auto response = send(net::HttpRequest::put(object_url(key), {}));
    if (!response.success) {
        result.error = response.error;
        return result;
    }
    result.handle.id = key;
    result.handle.name = name;
    result.handle.parent_id = parent;
    result.handle.is_directory = true;
    result.success = true;
    return result;
}

}  // namespace cloudmux::drivers
