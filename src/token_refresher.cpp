#include "cloudmux/token_refresher.hpp"
#include "cloudmux/crypto.hpp"
#include "cloudmux/json_body.hpp"
#include "cloudmux/log.hpp"

#include <chrono>

namespace cloudmux {

namespace {

// Pull code/message out of the error shapes used by token endpoints:
// {"code","message"}, {"error_code","error_description"} or {"error"}.
TransferError token_error(const net::HttpResponse& response, const json* body,
                          const std::set<std::string>& revoked_codes) {
    TransferError err;
    err.http_status = response.status_code;
    if (body && body->is_object()) {
        err.code = json_str(*body, "code");
        if (err.code.empty()) err.code = json_str(*body, "error_code");
        if (err.code.empty()) err.code = json_str(*body, "error");
        err.message = json_str(*body, "message");
        if (err.message.empty()) err.message = json_str(*body, "error_description");
    }
    if (err.message.empty()) err.message = response.body_string();

    bool revoked = revoked_codes.count(err.code) > 0 ||
                   (response.status_code >= 400 && response.status_code < 500);
    err.kind = revoked ? ErrorKind::AuthRefreshFailed : ErrorKind::BackendRejected;
    return err;
}

// Shared handling for endpoints answering with access_token/refresh_token/expires_in
RefreshOutcome parse_token_response(const net::HttpResponse& response,
                                    const std::set<std::string>& revoked_codes) {
    RefreshOutcome out;
    if (response.is_network_error) {
        out.error = TransferError::make(ErrorKind::Network, response.error);
        return out;
    }

    json body;
    bool parsed = false;
    try {
        body = json::parse(response.body_string());
        parsed = true;
    } catch (const json::exception&) {
    }

    if (!response.ok()) {
        out.error = token_error(response, parsed ? &body : nullptr, revoked_codes);
        return out;
    }
    if (!parsed || !body.is_object()) {
        out.error = TransferError::make(ErrorKind::BackendRejected,
                                        "token endpoint returned non-JSON body: " +
                                            response.body_string(),
                                        "", response.status_code);
        return out;
    }

    // Some providers report refusal inside a 200 body
    std::string code = json_str(body, "code");
    if (code.empty()) code = json_str(body, "error_code");
    if (!code.empty() && code != "0" && json_str(body, "access_token").empty()) {
        out.error = token_error(response, &body, revoked_codes);
        if (revoked_codes.count(code)) out.error.kind = ErrorKind::AuthRefreshFailed;
        return out;
    }

    out.tokens.access_token = json_str(body, "access_token");
    out.tokens.refresh_token = json_str(body, "refresh_token");
    if (out.tokens.access_token.empty()) {
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed,
                                        "token response missing access_token", "",
                                        response.status_code);
        return out;
    }
    if (auto it = body.find("expires_in"); it != body.end() && it->is_number()) {
        out.tokens.expires_at = std::chrono::system_clock::now() +
                                std::chrono::seconds(it->get<long long>());
    }
    out.success = true;
    return out;
}

}  // namespace

// --- OAuthRefresher ---

OAuthRefresher::OAuthRefresher(std::shared_ptr<net::HttpTransport> transport, Options options)
    : transport_(std::move(transport))
    , options_(std::move(options)) {}

RefreshOutcome OAuthRefresher::refresh(const TokenSet& current) {
    if (current.refresh_token.empty()) {
        RefreshOutcome out;
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed, "no refresh token available");
        return out;
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = options_.token_url;
    if (options_.json_body) {
        json body = {
            {"client_id", options_.client_id},
            {"client_secret", options_.client_secret},
            {"grant_type", "refresh_token"},
            {"refresh_token", current.refresh_token},
        };
        request.set_json_body(body.dump());
    } else {
        request.set_form_body({
            {"client_id", options_.client_id},
            {"client_secret", options_.client_secret},
            {"grant_type", "refresh_token"},
            {"refresh_token", current.refresh_token},
        });
    }

    return parse_token_response(transport_->execute(request), options_.revoked_codes);
}

// --- ProxyRefresher ---

ProxyRefresher::ProxyRefresher(std::shared_ptr<net::HttpTransport> transport, std::string proxy_url)
    : transport_(std::move(transport))
    , proxy_url_(std::move(proxy_url)) {}

RefreshOutcome ProxyRefresher::refresh(const TokenSet& current) {
    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = proxy_url_;
    request.set_json_body(json{{"refresh_token", current.refresh_token}}.dump());
    return parse_token_response(transport_->execute(request), {});
}

// --- ServiceAccountRefresher ---

ServiceAccountRefresher::ServiceAccountRefresher(std::shared_ptr<net::HttpTransport> transport,
                                                 std::string credentials_json, std::string scope)
    : transport_(std::move(transport))
    , scope_(std::move(scope)) {
    try {
        auto creds = json::parse(credentials_json);
        client_email_ = json_str(creds, "client_email");
        private_key_ = json_str(creds, "private_key");
        token_uri_ = json_str(creds, "token_uri");
    } catch (const json::exception& e) {
        log_error("Cannot parse service account credentials: %s", e.what());
    }
    if (token_uri_.empty()) {
        token_uri_ = "https://oauth2.googleapis.com/token";
    }
}

std::optional<std::string> ServiceAccountRefresher::build_assertion(int64_t issued_at) const {
    if (client_email_.empty() || private_key_.empty()) return std::nullopt;

    json header = {{"alg", "RS256"}, {"typ", "JWT"}};
    json payload = {
        {"iss", client_email_},
        {"scope", scope_},
        {"aud", token_uri_},
        {"iat", issued_at},
        {"exp", issued_at + 3600},
    };

    std::string signing_input =
        crypto::base64url_encode(header.dump()) + "." + crypto::base64url_encode(payload.dump());
    auto signature = crypto::rsa_sign_sha256(private_key_, signing_input);
    if (!signature) return std::nullopt;

    return signing_input + "." + crypto::base64url_encode(*signature);
}

RefreshOutcome ServiceAccountRefresher::refresh(const TokenSet&) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    auto assertion = build_assertion(now);
    if (!assertion) {
        RefreshOutcome out;
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed,
                                        "cannot sign service account assertion");
        return out;
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = token_uri_;
    request.set_form_body({
        {"grant_type", "urn:ietf:params:oauth:grant-type:jwt-bearer"},
        {"assertion", *assertion},
    });
    return parse_token_response(transport_->execute(request), {});
}

// --- SessionKeyRefresher ---

SessionKeyRefresher::SessionKeyRefresher(std::shared_ptr<net::HttpTransport> transport,
                                         std::string session_url)
    : transport_(std::move(transport))
    , session_url_(std::move(session_url)) {}

RefreshOutcome SessionKeyRefresher::refresh(const TokenSet& current) {
    RefreshOutcome out;
    if (current.refresh_token.empty()) {
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed, "no access token to renew session");
        return out;
    }

    std::string sep = session_url_.find('?') == std::string::npos ? "?" : "&";
    auto request = net::HttpRequest::get(session_url_ + sep + "accessToken=" +
                                         net::url_encode(current.refresh_token));
    request.headers.set("Accept", "application/json;charset=UTF-8");
    auto response = transport_->execute(request);
    if (response.is_network_error) {
        out.error = TransferError::make(ErrorKind::Network, response.error);
        return out;
    }

    json body;
    try {
        body = json::parse(response.body_string());
    } catch (const json::exception&) {
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed, response.body_string(), "",
                                        response.status_code);
        return out;
    }

    out.tokens.access_token = json_str(body, "sessionKey");
    out.tokens.session_secret = json_str(body, "sessionSecret");
    if (!response.ok() || out.tokens.access_token.empty() || out.tokens.session_secret.empty()) {
        out.error = token_error(response, &body, {});
        out.error.kind = ErrorKind::AuthRefreshFailed;
        return out;
    }
    out.tokens.refresh_token = current.refresh_token;
    out.success = true;
    return out;
}

}  // namespace cloudmux
