#pragma once

#include "cloudmux/credential_session.hpp"
#include "cloudmux/net/http.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace cloudmux {

/// OAuth2 refresh_token grant against the provider's token endpoint.
class OAuthRefresher : public TokenRefresher {
public:
    struct Options {
        std::string token_url;
        std::string client_id;
        std::string client_secret;
        bool json_body = true;  // false: application/x-www-form-urlencoded
        // Error codes meaning the refresh token itself is dead
        std::set<std::string> revoked_codes;
    };

    OAuthRefresher(std::shared_ptr<net::HttpTransport> transport, Options options);

    std::string name() const override { return "oauth"; }
    RefreshOutcome refresh(const TokenSet& current) override;

private:
    std::shared_ptr<net::HttpTransport> transport_;
    Options options_;
};

/// Refresh through an operator-run proxy that holds the client secret.
/// POSTs {"refresh_token": ...} and expects the usual token fields back.
class ProxyRefresher : public TokenRefresher {
public:
    ProxyRefresher(std::shared_ptr<net::HttpTransport> transport, std::string proxy_url);

    std::string name() const override { return "proxy"; }
    RefreshOutcome refresh(const TokenSet& current) override;

private:
    std::shared_ptr<net::HttpTransport> transport_;
    std::string proxy_url_;
};

/// Service-account key: sign an RS256 JWT and exchange it for a bearer token.
class ServiceAccountRefresher : public TokenRefresher {
public:
    ServiceAccountRefresher(std::shared_ptr<net::HttpTransport> transport,
                            std::string credentials_json, std::string scope);

    std::string name() const override { return "service-account"; }
    RefreshOutcome refresh(const TokenSet& current) override;

    /// header.payload.signature, exposed for tests
    std::optional<std::string> build_assertion(int64_t issued_at) const;

private:
    std::shared_ptr<net::HttpTransport> transport_;
    std::string client_email_;
    std::string private_key_;
    std::string token_uri_;
    std::string scope_;
};

/// Session-key backends: the long-lived access token (held as
/// refresh_token) buys a new session key and secret.
class SessionKeyRefresher : public TokenRefresher {
public:
    SessionKeyRefresher(std::shared_ptr<net::HttpTransport> transport, std::string session_url);

    std::string name() const override { return "session-key"; }
    RefreshOutcome refresh(const TokenSet& current) override;

private:
    std::shared_ptr<net::HttpTransport> transport_;
    std::string session_url_;
};

}  // namespace cloudmux
