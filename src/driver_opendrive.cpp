#include "cloudmux/drivers/opendrive.hpp"
#include "cloudmux/crypto.hpp"
#include "cloudmux/log.hpp"
#include "cloudmux/token_refresher.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace cloudmux::drivers {

namespace {

constexpr const char* kCreatePath = "/adrive/v1.0/openFile/create";
constexpr const char* kCompletePath = "/adrive/v1.0/openFile/complete";
constexpr const char* kUploadUrlPath = "/adrive/v1.0/openFile/getUploadUrl";
constexpr const char* kListPath = "/adrive/v1.0/openFile/list";
constexpr const char* kDownloadUrlPath = "/adrive/v1.0/openFile/getDownloadUrl";
constexpr const char* kDeletePath = "/adrive/v1.0/openFile/delete";
constexpr const char* kTrashPath = "/adrive/v1.0/openFile/recyclebin/trash";
constexpr const char* kDriveInfoPath = "/adrive/v1.0/user/getDriveInfo";

constexpr std::string_view kPartUrlPrefix = "part_url.";

json part_info_list(uint64_t size, uint64_t chunk) {
    uint64_t count = (size == 0 || chunk == 0) ? 1 : (size + chunk - 1) / chunk;
    json parts = json::array();
    for (uint64_t i = 1; i <= count; ++i) {
        parts.push_back({{"part_number", i}});
    }
    return parts;
}

// file_id, upload_id and the presigned part URLs of a create response
std::vector<std::pair<std::string, std::string>> create_attributes(const json& body) {
    std::vector<std::pair<std::string, std::string>> out;
    out.emplace_back("file_id", json_str(body, "file_id"));
    out.emplace_back("upload_id", json_str(body, "upload_id"));
    if (auto it = body.find("part_info_list"); it != body.end() && it->is_array()) {
        for (const auto& part : *it) {
            std::string url = json_str(part, "upload_url");
            if (url.empty()) continue;
            out.emplace_back(std::string(kPartUrlPrefix) + json_str(part, "part_number"), url);
        }
    }
    return out;
}

std::shared_ptr<TokenRefresher> make_refresher(const OpenDriveDriver::Config& config,
                                               const std::shared_ptr<net::HttpTransport>& transport) {
    if (!config.refresh_proxy_url.empty()) {
        return std::make_shared<ProxyRefresher>(transport, config.refresh_proxy_url);
    }
    if (!config.service_account_json.empty()) {
        return std::make_shared<ServiceAccountRefresher>(transport, config.service_account_json,
                                                         config.scope);
    }
    if (!config.refresh_token.empty()) {
        OAuthRefresher::Options options;
        options.token_url = config.api_url + "/oauth/access_token";
        options.client_id = config.client_id;
        options.client_secret = config.client_secret;
        options.json_body = true;
        options.revoked_codes = {"4126", "InvalidParameter.RefreshToken", "RefreshTokenExpired"};
        return std::make_shared<OAuthRefresher>(transport, std::move(options));
    }
    return nullptr;
}

}  // namespace

// --- Config ---

std::string OpenDriveDriver::Config::validate() const {
    if (api_url.empty()) return "api_url is empty";
    if (drive_type != "default" && drive_type != "resource") {
        return "drive_type must be 'default' or 'resource'";
    }
    if (chunk_size == 0) return "chunk size must be positive";
    if (!refresh_proxy_url.empty() || !service_account_json.empty()) return {};
    if (!refresh_token.empty()) {
        if (client_id.empty() || client_secret.empty()) {
            return "refresh_token needs client_id and client_secret (or refresh_proxy_url)";
        }
        return {};
    }
    if (access_token.empty()) {
        return "one of access_token, refresh_token, refresh_proxy_url or service_account_json is required";
    }
    return {};
}

OpenDriveDriver::Config OpenDriveDriver::Config::from_params(const DriverParams& params) {
    Config config;
    config.api_url = param_or(params, "api_url", kDefaultApiUrl);
    while (!config.api_url.empty() && config.api_url.back() == '/') config.api_url.pop_back();
    config.client_id = param_or(params, "client_id");
    config.client_secret = param_or(params, "client_secret");
    config.refresh_token = param_or(params, "refresh_token");
    config.access_token = param_or(params, "access_token");
    config.refresh_proxy_url = param_or(params, "refresh_proxy_url");
    config.service_account_json = param_or(params, "service_account_json");
    config.scope = param_or(params, "scope");
    config.drive_id = param_or(params, "drive_id");
    config.drive_type = param_or(params, "drive_type", "default");
    config.root_id = param_or(params, "root_id", "root");
    config.use_trash = param_or(params, "remove_way", "delete") == "trash";
    config.proxy_required = param_flag(params, "proxy_required", false);
    config.dedup_enabled = param_flag(params, "dedup", true);
    config.chunk_size = param_u64(params, "chunk_size_mb", 10) * kMiB;
    return config;
}

// --- Upload protocol ---

class OpenDriveProtocol : public UploadProtocol {
public:
    explicit OpenDriveProtocol(OpenDriveDriver& driver) : driver_(driver) {}

    TransferError open_session(SignedExecutor&, UploadSession& session) override {
        std::vector<std::pair<std::string, std::string>> attributes;
        auto file_id = session.attributes.find("file_id");
        auto upload_id = session.attributes.find("upload_id");
        if (file_id != session.attributes.end() && upload_id != session.attributes.end() &&
            !file_id->second.empty() && !upload_id->second.empty()) {
            attributes.assign(session.attributes.begin(), session.attributes.end());
        } else {
            TransferError error;
            auto drive = driver_.drive_id(&error);
            if (!drive) return error;

            json body = {
                {"drive_id", *drive},
                {"parent_file_id", session.parent_id},
                {"name", session.name},
                {"type", "file"},
                {"check_name_mode", "ignore"},
                {"size", session.total_size},
                {"part_info_list", part_info_list(session.total_size, session.chunk_size)},
            };
            auto created = driver_.call(kCreatePath, body, error);
            if (!created) return error;
            attributes = create_attributes(*created);
        }

        for (const auto& [key, value] : attributes) {
            if (key == "file_id") {
                session.remote_id = value;
            } else if (key == "upload_id") {
                session.upload_id = value;
            } else if (key.rfind(kPartUrlPrefix, 0) == 0) {
                try {
                    auto number = static_cast<uint32_t>(std::stoul(key.substr(kPartUrlPrefix.size())));
                    session.prefetched_targets[number] = PartTarget{value, net::HttpMethod::PUT, {}};
                } catch (const std::exception&) {
                    log_warn("Ignoring malformed part key %s", key.c_str());
                }
            }
        }
        if (session.remote_id.empty() || session.upload_id.empty()) {
            return TransferError::make(ErrorKind::BackendRejected,
                                       "create returned no file_id/upload_id");
        }
        return {};
    }

    TransferError resolve_part_target(SignedExecutor& executor, UploadSession& session,
                                      PartDescriptor& part,
                                      std::span<const uint8_t> data) override {
        if (session.prefetched_targets.count(part.part_number)) {
            return UploadProtocol::resolve_part_target(executor, session, part, data);
        }

        // URL list exhausted or expired: ask for this part alone
        TransferError error;
        auto drive = driver_.drive_id(&error);
        if (!drive) return error;
        json body = {
            {"drive_id", *drive},
            {"file_id", session.remote_id},
            {"upload_id", session.upload_id},
            {"part_info_list", json::array({{{"part_number", part.part_number}}})},
        };
        auto reply = driver_.call(kUploadUrlPath, body, error);
        if (!reply) return error;

        auto list = reply->find("part_info_list");
        if (list == reply->end() || !list->is_array() || list->empty()) {
            return TransferError::make(ErrorKind::BackendRejected,
                                       "no upload URL for part " + std::to_string(part.part_number));
        }
        part.target = PartTarget{json_str(list->front(), "upload_url"), net::HttpMethod::PUT, {}};
        return {};
    }

    CommitResult commit(SignedExecutor&, UploadSession& session,
                        const std::string&) override {
        CommitResult result;
        auto drive = driver_.drive_id(&result.error);
        if (!drive) return result;

        json body = {
            {"drive_id", *drive},
            {"file_id", session.remote_id},
            {"upload_id", session.upload_id},
        };
        auto reply = driver_.call(kCompletePath, body, result.error);
        if (!reply) return result;

        result.handle = OpenDriveDriver::parse_item(*reply);
        if (result.handle.id.empty()) result.handle.id = session.remote_id;
        result.checksum = result.handle.checksum;
        result.success = true;
        return result;
    }

    std::optional<crypto::DigestAlgorithm> content_digest() const override {
        return crypto::DigestAlgorithm::Sha1;
    }

    bool part_conflict_is_success() const override { return true; }

private:
    OpenDriveDriver& driver_;
};

// --- Driver ---

OpenDriveDriver::OpenDriveDriver(Config config, std::shared_ptr<net::HttpTransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport)) {
    BackendAdapter adapter;
    adapter.name = kType;
    adapter.endpoints["api"] = config_.api_url;
    adapter.signer = std::make_shared<BearerSigner>();
    adapter.chunk_policy = std::make_shared<FixedChunkPolicy>(config_.chunk_size);
    adapter.proxy_required = config_.proxy_required;

    adapter.dedup.dedup_enabled = config_.dedup_enabled;
    adapter.dedup.supports_partial_hash = true;
    adapter.dedup.supports_full_hash = true;
    adapter.dedup.partial_hash_size = 1024;
    adapter.dedup.digest = crypto::DigestAlgorithm::Sha1;
    adapter.dedup.uppercase_hex = true;

    adapter.response_policy.parse_error = json_error_parser("code", "message");
    adapter.response_policy.is_auth_expired = auth_expiry_markers(
        {"AccessTokenInvalid", "AccessTokenExpired", "I400JD"}, {}, "code", false);
    adapter.response_policy.is_quota_exceeded = [](const TransferError& error) {
        return error.code.find("QuotaExhausted") != std::string::npos;
    };

    TokenSet tokens;
    tokens.access_token = config_.access_token;
    tokens.refresh_token = config_.refresh_token;
    auto session = std::make_shared<CredentialSession>(tokens, make_refresher(config_, transport_));
    engine_ = std::make_unique<TransferEngine>(std::move(adapter), std::move(session), transport_);
}

ExecuteResult OpenDriveDriver::post(const std::string& path, const json& body) {
    // First call with only a refresh token: obtain an access token up front
    auto snapshot = engine_->session()->read();
    if (snapshot.tokens.access_token.empty() && engine_->session()->can_refresh()) {
        auto refreshed = engine_->session()->refresh(snapshot.generation);
        if (!refreshed.success) {
            ExecuteResult result;
            result.error = refreshed.error;
            return result;
        }
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = config_.api_url + path;
    request.set_json_body(body.dump());
    return engine_->execute(request);
}

std::optional<json> OpenDriveDriver::call(const std::string& path, const json& body,
                                          TransferError& error) {
    auto result = post(path, body);
    if (!result.success) {
        error = result.error;
        return std::nullopt;
    }
    return parse_json_object(result.response, &error);
}

std::optional<std::string> OpenDriveDriver::drive_id(TransferError* error) {
    if (!config_.drive_id.empty()) return config_.drive_id;

    std::lock_guard lock(drive_mutex_);
    if (!drive_id_.empty()) return drive_id_;

    TransferError err;
    auto info = call(kDriveInfoPath, json::object(), err);
    if (!info) {
        if (error) *error = err;
        return std::nullopt;
    }
    std::string id;
    if (config_.drive_type == "resource") id = json_str(*info, "resource_drive_id");
    if (id.empty()) id = json_str(*info, "default_drive_id");
    if (id.empty()) {
        if (error) *error = TransferError::make(ErrorKind::BackendRejected, "drive info has no drive id");
        return std::nullopt;
    }
    log_debug("Using drive %s", id.c_str());
    drive_id_ = id;
    return drive_id_;
}

std::optional<std::string> OpenDriveDriver::proof_code(
    const std::string& access_token, uint64_t size,
    const std::function<std::optional<std::vector<uint8_t>>(uint64_t, size_t)>& read_range) {
    if (size == 0) return std::string();
    if (!read_range) return std::nullopt;

    std::string md5 = crypto::digest_hex(crypto::DigestAlgorithm::Md5, std::string_view(access_token));
    uint64_t seed = 0;
    try {
        seed = std::stoull(md5.substr(0, 16), nullptr, 16);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    uint64_t start = seed % size;
    uint64_t end = std::min<uint64_t>(start + 8, size);

    auto bytes = read_range(start, static_cast<size_t>(end - start));
    if (!bytes || bytes->size() != end - start) return std::nullopt;
    return net::base64_encode(*bytes);
}

RemoteFileHandle OpenDriveDriver::parse_item(const json& item) {
    RemoteFileHandle handle;
    handle.id = json_str(item, "file_id");
    handle.name = json_str(item, "name");
    if (handle.name.empty()) handle.name = json_str(item, "file_name");
    handle.parent_id = json_str(item, "parent_file_id");
    handle.size = json_u64(item, "size");
    handle.is_directory = json_str(item, "type") == "folder";
    handle.checksum = json_str(item, "content_hash");
    handle.modified = json_str(item, "updated_at");
    return handle;
}

DedupAnswer OpenDriveDriver::query_rapid(const DedupQuery& query, const std::string& parent_id) {
    DedupAnswer answer;
    auto drive = drive_id(&answer.error);
    if (!drive) return answer;

    json body = {
        {"drive_id", *drive},
        {"parent_file_id", parent_id},
        {"name", query.name},
        {"type", "file"},
        {"check_name_mode", "ignore"},
        {"size", query.size},
        {"part_info_list", part_info_list(query.size, engine_->chunk_size_for(query.size))},
    };

    // A one-shot source cannot be re-read for the proof bytes, so it only
    // ever offers the pre-hash
    const bool can_prove = query.size == 0 || static_cast<bool>(query.read_range);
    if (!query.full_hash.empty() && can_prove) {
        auto proof = proof_code(engine_->session()->read().tokens.access_token, query.size,
                                query.read_range);
        if (!proof) {
            answer.error = TransferError::make(ErrorKind::Precondition, "cannot compute proof code");
            return answer;
        }
        std::string hash = query.full_hash;
        std::transform(hash.begin(), hash.end(), hash.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        body["content_hash"] = hash;
        body["content_hash_name"] = "sha1";
        body["proof_version"] = "v1";
        body["proof_code"] = *proof;
    } else if (!query.partial_hash.empty()) {
        body["pre_hash"] = query.partial_hash;
    } else {
        return answer;
    }

    auto result = post(kCreatePath, body);
    if (!result.success) {
        if (result.error.code == "PreHashMatched") {
            answer.verdict = DedupVerdict::NeedsFullHash;
            return answer;
        }
        answer.error = result.error;
        return answer;
    }

    auto reply = parse_json_object(result.response, &answer.error);
    if (!reply) return answer;

    answer.remote_id = json_str(*reply, "file_id");
    if (auto it = reply->find("rapid_upload"); it != reply->end() && it->is_boolean() && it->get<bool>()) {
        answer.verdict = DedupVerdict::Exists;
        return answer;
    }
    answer.verdict = DedupVerdict::NotFound;
    answer.attributes = create_attributes(*reply);
    return answer;
}

UploadResult OpenDriveDriver::upload(const std::string& parent_id, const std::string& name,
                                     uint64_t size, ByteSource& source,
                                     const UploadOptions& options) {
    UploadRequest request;
    request.parent_id = parent_id.empty() ? config_.root_id : parent_id;
    request.name = name;
    request.size = size;
    request.source = &source;
    request.progress = options.progress;
    request.cancel = options.cancel;

    OpenDriveProtocol protocol(*this);
    std::string parent = request.parent_id;
    return engine_->upload(request, protocol, [this, parent](const DedupQuery& query) {
        return query_rapid(query, parent);
    });
}

std::optional<std::string> OpenDriveDriver::download_url(const std::string& file_id,
                                                         TransferError& error) {
    auto drive = drive_id(&error);
    if (!drive) return std::nullopt;

    json body = {{"drive_id", *drive}, {"file_id", file_id}, {"expire_sec", 14400}};
    auto reply = call(kDownloadUrlPath, body, error);
    if (!reply) return std::nullopt;

    std::string url = json_str(*reply, "url");
    if (url.empty()) {
        error = TransferError::make(ErrorKind::BackendRejected, "download URL missing in response");
        return std::nullopt;
    }
    return url;
}

DownloadResult OpenDriveDriver::download(const RemoteFileHandle& file, std::optional<ByteRange> range) {
    DownloadResult result;
    if (file.is_directory) {
        result.error = TransferError::make(ErrorKind::Precondition, file.name + " is a directory");
        return result;
    }
    auto url = download_url(file.id, result.error);
    if (!url) return result;

    DownloadTarget target;
    target.request = net::HttpRequest::get(*url);
    target.signed_request = false;  // presigned
    target.supports_ranges = true;
    if (file.size > 0) target.size = file.size;

    result.stream = engine_->download(std::move(target), range);
    result.success = true;
    return result;
}

std::optional<std::string> OpenDriveDriver::direct_link(const RemoteFileHandle& file) {
    if (config_.proxy_required || file.is_directory) return std::nullopt;
    TransferError error;
    auto url = download_url(file.id, error);
    if (!url) log_warn("No direct link for %s: %s", file.id.c_str(), error.describe().c_str());
    return url;
}

ListResult OpenDriveDriver::list(const std::string& dir_id) {
    ListResult result;
    auto drive = drive_id(&result.error);
    if (!drive) return result;

    std::string parent = dir_id.empty() ? config_.root_id : dir_id;
    std::string marker;
    do {
        json body = {
            {"drive_id", *drive},
            {"parent_file_id", parent},
            {"limit", 200},
            {"order_by", "name"},
            {"order_direction", "ASC"},
        };
        if (!marker.empty()) body["marker"] = marker;

        auto page = call(kListPath, body, result.error);
        if (!page) return result;

        if (auto items = page->find("items"); items != page->end() && items->is_array()) {
            for (const auto& item : *items) {
                result.entries.push_back(parse_item(item));
            }
        }
        marker = json_str(*page, "next_marker");
    } while (!marker.empty());

    result.success = true;
    return result;
}

OperationResult OpenDriveDriver::remove(const RemoteFileHandle& file) {
    OperationResult result;
    auto drive = drive_id(&result.error);
    if (!drive) return result;

    json body = {{"drive_id", *drive}, {"file_id", file.id}};
    if (!call(config_.use_trash ? kTrashPath : kDeletePath, body, result.error)) return result;

    result.handle = file;
    result.success = true;
    return result;
}

OperationResult OpenDriveDriver::mkdir(const std::string& parent_id, const std::string& name) {
    OperationResult result;
    auto drive = drive_id(&result.error);
    if (!drive) return result;

    std::string parent = parent_id.empty() ? config_.root_id : parent_id;
    json body = {
        {"drive_id", *drive},
        {"parent_file_id", parent},
        {"name", name},
        {"type", "folder"},
        {"check_name_mode", "refuse"},
    };
    auto reply = call(kCreatePath, body, result.error);
    if (!reply) return result;

    result.handle = parse_item(*reply);
    result.handle.is_directory = true;
    if (result.handle.name.empty()) result.handle.name = name;
    if (result.handle.parent_id.empty()) result.handle.parent_id = parent;
    result.success = true;
    return result;
}

}  // namespace cloudmux::drivers
