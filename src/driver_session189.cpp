#include "cloudmux/drivers/session189.hpp"
#include "cloudmux/crypto.hpp"
#include "cloudmux/log.hpp"
#include "cloudmux/token_refresher.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <thread>

namespace cloudmux::drivers {

namespace {

constexpr const char* kAccept = "application/json;charset=UTF-8";
constexpr const char* kEmptyMd5 = "D41D8CD98F00B204E9800998ECF8427E";

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

// Long-lived token expired or revoked: a new session cannot fix that
bool is_session_expired(const net::HttpResponse& response) {
    if (response.is_network_error || response.body.empty()) return false;
    std::string text = response.body_string();
    return text.find("InvalidSessionKey") != std::string::npos ||
           text.find("userSessionBO is null") != std::string::npos;
}

// "k=v&k=v" as sent in requestHeader
std::vector<std::pair<std::string, std::string>> parse_header_list(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> headers;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t amp = text.find('&', pos);
        if (amp == std::string::npos) amp = text.size();
        std::string item = text.substr(pos, amp - pos);
        pos = amp + 1;
        size_t eq = item.find('=');
        if (eq == std::string::npos) continue;
        headers.emplace_back(item.substr(0, eq), item.substr(eq + 1));
    }
    return headers;
}

}  // namespace

// --- Config ---

std::string Session189Driver::Config::validate() const {
    if (api_url.empty() || upload_url.empty()) return "api_url and upload_url are required";
    if (access_token.empty() && (session_key.empty() || session_secret.empty())) {
        return "access_token, or session_key with session_secret, is required";
    }
    if (!session_secret.empty() && session_secret.size() < 16) {
        return "session_secret must be at least 16 characters";
    }
    if (batch_poll_limit <= 0) return "batch_poll_limit must be positive";
    return {};
}

Session189Driver::Config Session189Driver::Config::from_params(const DriverParams& params) {
    Config config;
    config.api_url = param_or(params, "api_url", kDefaultApiUrl);
    config.upload_url = param_or(params, "upload_url", kDefaultUploadUrl);
    config.access_token = param_or(params, "access_token", param_or(params, "refresh_token"));
    config.session_key = param_or(params, "session_key");
    config.session_secret = param_or(params, "session_secret");
    config.root_id = param_or(params, "root_id", "-11");
    config.proxy_required = param_flag(params, "proxy_required", false);
    config.chunk_size = param_u64(params, "chunk_size_mb", 0) * kMiB;
    config.batch_poll_interval =
        std::chrono::milliseconds(param_u64(params, "batch_poll_interval_ms", 400));
    config.batch_poll_limit = static_cast<int>(param_u64(params, "batch_poll_limit", 50));
    return config;
}

// --- Helpers ---

Session189Driver::Params Session189Driver::client_suffix() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::string rand = std::to_string(rng() % 100000) + "_" + std::to_string(rng() % 10000000000ULL);
    return {
        {"clientType", "TELEPC"},
        {"version", "6.2"},
        {"channelId", "web_cloud.189.cn"},
        {"rand", rand},
    };
}

std::optional<TransferError> Session189Driver::parse_error(const net::HttpResponse& response) {
    auto body = parse_json_object(response);
    if (!body) return std::nullopt;

    std::string code = json_str(*body, "res_code");
    std::string message;
    if (!code.empty() && code != "0") {
        message = json_str(*body, "res_message");
    } else {
        code = json_str(*body, "code");
        if (!code.empty() && code != "SUCCESS") {
            message = json_str(*body, "msg");
            if (message.empty()) message = json_str(*body, "message");
        } else if (code = json_str(*body, "errorCode"); !code.empty()) {
            message = json_str(*body, "errorMsg");
        } else if (code = json_str(*body, "error"); !code.empty()) {
            message = json_str(*body, "message");
        } else {
            return std::nullopt;
        }
    }
    if (message.empty()) message = code;
    return TransferError::make(ErrorKind::BackendRejected, message, code, response.status_code);
}

std::string Session189Driver::slice_md5(const std::vector<std::string>& part_md5s,
                                        const std::string& file_md5) {
    if (part_md5s.size() <= 1) return upper(file_md5);
    std::string joined;
    for (size_t i = 0; i < part_md5s.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += upper(part_md5s[i]);
    }
    return crypto::digest_hex(crypto::DigestAlgorithm::Md5, std::string_view(joined), true);
}

RemoteFileHandle Session189Driver::parse_file(const json& item, const std::string& parent_id) {
    RemoteFileHandle handle;
    handle.id = json_str(item, "id");
    handle.name = json_str(item, "name");
    handle.parent_id = parent_id;
    handle.size = json_u64(item, "size");
    handle.checksum = json_str(item, "md5");
    handle.modified = json_str(item, "lastOpTime");
    return handle;
}

RemoteFileHandle Session189Driver::parse_folder(const json& item, const std::string& parent_id) {
    RemoteFileHandle handle;
    handle.id = json_str(item, "id");
    handle.name = json_str(item, "name");
    handle.parent_id = json_str(item, "parentId");
    if (handle.parent_id.empty()) handle.parent_id = parent_id;
    handle.is_directory = true;
    handle.modified = json_str(item, "lastOpTime");
    return handle;
}

// --- Upload protocol ---

class Session189Protocol : public UploadProtocol {
public:
    explicit Session189Protocol(Session189Driver& driver) : driver_(driver) {}

    TransferError open_session(SignedExecutor&, UploadSession& session) override {
        TransferError error;
        auto reply = driver_.call(net::HttpMethod::GET,
                                  driver_.config_.upload_url + "/person/initMultiUpload",
                                  {
                                      {"parentFolderId", session.parent_id},
                                      {"fileName", net::url_encode(session.name)},
                                      {"fileSize", std::to_string(session.total_size)},
                                      {"sliceSize", std::to_string(session.chunk_size)},
                                      {"lazyCheck", "1"},
                                  },
                                  true, error);
        if (!reply) return error;

        auto data = reply->find("data");
        if (data == reply->end()) {
            return TransferError::make(ErrorKind::BackendRejected, "initMultiUpload returned no data");
        }
        session.upload_id = json_str(*data, "uploadFileId");
        if (session.upload_id.empty()) {
            return TransferError::make(ErrorKind::BackendRejected, "initMultiUpload returned no uploadFileId");
        }
        return {};
    }

    TransferError resolve_part_target(SignedExecutor&, UploadSession& session,
                                      PartDescriptor& part,
                                      std::span<const uint8_t> data) override {
        crypto::Digest md5(crypto::DigestAlgorithm::Md5);
        md5.update(data);
        auto raw = md5.finish();
        part.checksum = crypto::to_hex(raw, true);

        TransferError error;
        auto reply = driver_.call(net::HttpMethod::GET,
                                  driver_.config_.upload_url + "/person/getMultiUploadUrls",
                                  {
                                      {"uploadFileId", session.upload_id},
                                      {"partInfo", std::to_string(part.part_number) + "-" +
                                                       net::base64_encode(raw)},
                                  },
                                  true, error);
        if (!reply) return error;

        std::string key = "partNumber_" + std::to_string(part.part_number);
        auto urls = reply->find("uploadUrls");
        if (urls == reply->end() || !urls->is_object() || !urls->contains(key)) {
            return TransferError::make(ErrorKind::BackendRejected,
                                       "no upload URL for part " + std::to_string(part.part_number));
        }
        const auto& entry = (*urls)[key];
        PartTarget target;
        target.url = json_str(entry, "requestURL");
        target.method = net::HttpMethod::PUT;
        target.headers = parse_header_list(json_str(entry, "requestHeader"));
        part.target = std::move(target);
        return {};
    }

    CommitResult commit(SignedExecutor&, UploadSession& session,
                        const std::string& content_digest) override {
        CommitResult result;
        std::string file_md5 = content_digest.empty() ? kEmptyMd5 : upper(content_digest);
        std::vector<std::string> part_md5s;
        for (const auto& part : session.parts) part_md5s.push_back(part.checksum);

        auto reply = driver_.call(net::HttpMethod::GET,
                                  driver_.config_.upload_url + "/person/commitMultiUploadFile",
                                  {
                                      {"uploadFileId", session.upload_id},
                                      {"fileMd5", file_md5},
                                      {"sliceMd5", Session189Driver::slice_md5(part_md5s, file_md5)},
                                      {"lazyCheck", "1"},
                                      {"isLog", "0"},
                                      {"opertype", "3"},
                                  },
                                  true, result.error);
        if (!reply) return result;

        auto file = reply->find("file");
        if (file == reply->end() || !file->is_object()) {
            result.error = TransferError::make(ErrorKind::BackendRejected, "commit returned no file");
            return result;
        }
        result.handle.id = json_str(*file, "userFileId");
        result.handle.name = json_str(*file, "fileName");
        result.handle.size = json_u64(*file, "fileSize");
        result.handle.parent_id = session.parent_id;
        result.handle.checksum = json_str(*file, "fileMd5");
        result.checksum = result.handle.checksum;
        result.success = true;
        return result;
    }

    std::optional<crypto::DigestAlgorithm> content_digest() const override {
        return crypto::DigestAlgorithm::Md5;
    }

private:
    Session189Driver& driver_;
};

// --- Driver ---

Session189Driver::Session189Driver(Config config, std::shared_ptr<net::HttpTransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport)) {
    SessionHmacSigner::Options api_options;
    api_options.encrypt_query = false;
    api_signer_ = std::make_shared<SessionHmacSigner>(api_options);

    SessionHmacSigner::Options upload_options;
    upload_options.encrypt_query = true;
    upload_options.plain_params = {"clientType", "version", "channelId", "rand"};
    upload_signer_ = std::make_shared<SessionHmacSigner>(upload_options);

    BackendAdapter adapter;
    adapter.name = kType;
    adapter.endpoints["api"] = config_.api_url;
    adapter.endpoints["upload"] = config_.upload_url;
    adapter.signer = api_signer_;
    if (config_.chunk_size > 0) {
        adapter.chunk_policy = std::make_shared<FixedChunkPolicy>(config_.chunk_size);
    } else {
        adapter.chunk_policy = std::make_shared<TieredChunkPolicy>();
    }
    adapter.proxy_required = config_.proxy_required;
    adapter.dedup.dedup_enabled = false;

    adapter.response_policy.parse_error = &Session189Driver::parse_error;
    adapter.response_policy.is_auth_expired = is_session_expired;
    adapter.response_policy.is_quota_exceeded = [](const TransferError& error) {
        return error.code == "InsufficientStorageSpace";
    };

    std::shared_ptr<TokenRefresher> refresher;
    if (!config_.access_token.empty()) {
        refresher = std::make_shared<SessionKeyRefresher>(
            transport_, config_.api_url + "/getSessionForPC.action?appId=" + kAppId +
                            "&clientType=TELEPC&version=6.2&channelId=web_cloud.189.cn");
    }

    TokenSet tokens;
    tokens.access_token = config_.session_key;
    tokens.session_secret = config_.session_secret;
    tokens.refresh_token = config_.access_token;
    auto session = std::make_shared<CredentialSession>(tokens, std::move(refresher));
    engine_ = std::make_unique<TransferEngine>(std::move(adapter), std::move(session), transport_);
}

TransferError Session189Driver::ensure_session() {
    auto snapshot = engine_->session()->read();
    if (!snapshot.tokens.access_token.empty() && !snapshot.tokens.session_secret.empty()) return {};
    if (!engine_->session()->can_refresh()) {
        return TransferError::make(ErrorKind::AuthRefreshFailed, "no session and no access token");
    }
    auto refreshed = engine_->session()->refresh(snapshot.generation);
    return refreshed.success ? TransferError{} : refreshed.error;
}

std::optional<json> Session189Driver::call(net::HttpMethod method, const std::string& url,
                                           const Params& params, bool upload_endpoint,
                                           TransferError& error) {
    if (auto err = ensure_session(); !err.ok()) {
        error = err;
        return std::nullopt;
    }

    // Upload parameters are encrypted as written, so they go in unescaped
    std::string query;
    auto append = [&query](const std::string& key, const std::string& value, bool escape) {
        if (!query.empty()) query += '&';
        query += key + "=" + (escape ? net::url_encode(value) : value);
    };
    for (const auto& [key, value] : client_suffix()) append(key, value, false);
    for (const auto& [key, value] : params) append(key, value, !upload_endpoint);

    net::HttpRequest request;
    request.method = method;
    request.url = url + "?" + query;
    request.headers.set("Accept", kAccept);

    auto result = upload_endpoint ? engine_->execute(request, *upload_signer_)
                                  : engine_->execute(request);
    if (!result.success) {
        error = result.error;
        return std::nullopt;
    }
    return parse_json_object(result.response, &error);
}

UploadResult Session189Driver::upload(const std::string& parent_id, const std::string& name,
                                      uint64_t size, ByteSource& source,
                                      const UploadOptions& options) {
    UploadRequest request;
    request.parent_id = parent_id.empty() ? config_.root_id : parent_id;
    request.name = name;
    request.size = size;
    request.source = &source;
    request.progress = options.progress;
    request.cancel = options.cancel;

    Session189Protocol protocol(*this);
    return engine_->upload(request, protocol);
}

std::optional<std::string> Session189Driver::download_url(const std::string& file_id,
                                                          TransferError& error) {
    auto reply = call(net::HttpMethod::GET, config_.api_url + "/getFileDownloadUrl.action",
                      {{"fileId", file_id}, {"dt", "3"}, {"flag", "1"}}, false, error);
    if (!reply) return std::nullopt;

    std::string url = json_str(*reply, "fileDownloadUrl");
    if (url.empty()) {
        error = TransferError::make(ErrorKind::BackendRejected, "fileDownloadUrl missing in response");
        return std::nullopt;
    }
    for (size_t pos; (pos = url.find("&amp;")) != std::string::npos;) url.replace(pos, 5, "&");
    if (url.rfind("http://", 0) == 0) url.replace(0, 7, "https://");
    return url;
}

DownloadResult Session189Driver::download(const RemoteFileHandle& file, std::optional<ByteRange> range) {
    DownloadResult result;
    if (file.is_directory) {
        result.error = TransferError::make(ErrorKind::Precondition, file.name + " is a directory");
        return result;
    }
    auto url = download_url(file.id, result.error);
    if (!url) return result;

    // The link answers with a 302 to the storage node; the stream caches it
    DownloadTarget target;
    target.request = net::HttpRequest::get(*url);
    target.signed_request = false;
    target.supports_ranges = true;
    if (file.size > 0) target.size = file.size;

    result.stream = engine_->download(std::move(target), range);
    result.success = true;
    return result;
}

std::optional<std::string> Session189Driver::direct_link(const RemoteFileHandle& file) {
    if (config_.proxy_required || file.is_directory) return std::nullopt;
    TransferError error;
    auto url = download_url(file.id, error);
    if (!url) log_warn("No direct link for %s: %s", file.id.c_str(), error.describe().c_str());
    return url;
}

ListResult Session189Driver::list(const std::string& dir_id) {
    ListResult result;
    std::string folder = dir_id.empty() ? config_.root_id : dir_id;

    for (int page = 1;; ++page) {
        auto reply = call(net::HttpMethod::GET, config_.api_url + "/listFiles.action",
                          {
                              {"folderId", folder},
                              {"fileType", "0"},
                              {"mediaAttr", "0"},
                              {"iconOption", "5"},
                              {"pageNum", std::to_string(page)},
                              {"pageSize", "1000"},
                              {"recursive", "0"},
                              {"orderBy", "filename"},
                              {"descending", "false"},
                          },
                          false, result.error);
        if (!reply) return result;

        auto listing = reply->find("fileListAO");
        if (listing == reply->end() || !listing->is_object()) break;

        size_t before = result.entries.size();
        if (auto folders = listing->find("folderList"); folders != listing->end() && folders->is_array()) {
            for (const auto& item : *folders) result.entries.push_back(parse_folder(item, folder));
        }
        if (auto files = listing->find("fileList"); files != listing->end() && files->is_array()) {
            for (const auto& item : *files) result.entries.push_back(parse_file(item, folder));
        }

        uint64_t count = json_u64(*listing, "count");
        if (result.entries.size() == before || result.entries.size() >= count) break;
    }

    result.success = true;
    return result;
}

TransferError Session189Driver::wait_batch_task(const std::string& type, const std::string& task_id) {
    for (int poll = 0; poll < config_.batch_poll_limit; ++poll) {
        TransferError error;
        auto state = call(net::HttpMethod::POST, config_.api_url + "/batch/checkBatchTask.action",
                          {{"type", type}, {"taskId", task_id}}, false, error);
        if (!state) return error;

        auto status = json_u64(*state, "taskStatus");
        if (status == 4) return {};
        if (status == 2) {
            return TransferError::make(ErrorKind::BackendRejected, "batch task conflict", "2");
        }
        std::this_thread::sleep_for(config_.batch_poll_interval);
    }
    return TransferError::make(ErrorKind::BackendRejected,
                               "batch task " + task_id + " did not finish");
}

OperationResult Session189Driver::remove(const RemoteFileHandle& file) {
    OperationResult result;
    json infos = json::array({{
        {"fileId", file.id},
        {"fileName", file.name},
        {"isFolder", file.is_directory ? 1 : 0},
    }});

    auto task = call(net::HttpMethod::POST, config_.api_url + "/batch/createBatchTask.action",
                     {{"type", "DELETE"}, {"taskInfos", infos.dump()}}, false, result.error);
    if (!task) return result;

    std::string task_id = json_str(*task, "taskId");
    if (task_id.empty()) {
        result.error = TransferError::make(ErrorKind::BackendRejected, "batch task has no id");
        return result;
    }
    result.error = wait_batch_task("DELETE", task_id);
    if (!result.error.ok()) return result;

    result.handle = file;
    result.success = true;
    return result;
}

OperationResult Session189Driver::mkdir(const std::string& parent_id, const std::string& name) {
    OperationResult result;
    std::string parent = parent_id.empty() ? config_.root_id : parent_id;

    auto reply = call(net::HttpMethod::POST, config_.api_url + "/createFolder.action",
                      {{"folderName", name}, {"relativePath", ""}, {"parentFolderId", parent}},
                      false, result.error);
    if (!reply) return result;

    result.handle = parse_folder(*reply, parent);
    if (result.handle.name.empty()) result.handle.name = name;
    result.success = true;
    return result;
}

}  // namespace cloudmux::drivers
