#pragma once

#include "cloudmux/credential_session.hpp"
#include "cloudmux/net/http.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace cloudmux {

using Clock = std::function<std::chrono::system_clock::time_point()>;

/// Signing strategy applied to every attempt of a request.
///
/// Signers are immutable: they read the token snapshot handed to them and
/// their own static keys, and never touch the session. sign() returns an
/// empty string on success or a description of why the request could not
/// be signed.
class RequestSigner {
public:
    virtual ~RequestSigner() = default;
    virtual std::string name() const = 0;
    virtual std::string sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const = 0;
};

/// Leaves the request untouched. Used for presigned part and download URLs.
class UnsignedSigner : public RequestSigner {
public:
    std::string name() const override { return "unsigned"; }
    std::string sign(net::HttpRequest&, const TokenSnapshot&) const override { return {}; }
};

class BearerSigner : public RequestSigner {
public:
    std::string name() const override { return "bearer"; }
    std::string sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const override;
};

/// Session-key HMAC-SHA1 signing.
///
/// Signed text is
///   SessionKey=<key>&Operate=<METHOD>&RequestURI=<path>&Date=<rfc1123>[&params=<HEX>]
/// keyed with the session secret and sent as an uppercase hex Signature
/// header. With encrypt_query, the URL's query parameters (as written in
/// the URL, not decoded) are sorted, joined as k=v&k=v, AES-128-ECB
/// encrypted with the first 16 bytes of the secret and replaced by a single
/// params=<HEX> parameter. Names in plain_params stay in the clear.
class SessionHmacSigner : public RequestSigner {
public:
    struct Options {
        bool encrypt_query = true;
        std::set<std::string> plain_params;
        Clock clock;  // defaults to system_clock::now
    };

    SessionHmacSigner();
    explicit SessionHmacSigner(Options options);

    std::string name() const override { return "session-hmac"; }
    std::string sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const override;

    /// Sorted k=v&k=v of the parameters, AES encrypted, uppercase hex.
    static std::optional<std::string> encrypt_params(
        std::vector<std::pair<std::string, std::string>> params, const std::string& secret);

    static std::string format_date(std::chrono::system_clock::time_point when);

private:
    Options options_;
};

/// Encrypts the request body with the backend's RSA public key (PKCS#1
/// v1.5, sliced to the key size) and sends it base64-encoded as a single
/// form field. The bearer token, when present, rides along as usual.
class RsaEnvelopeSigner : public RequestSigner {
public:
    RsaEnvelopeSigner(std::string public_key, std::string field = "data");

    std::string name() const override { return "rsa-envelope"; }
    std::string sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const override;

private:
    std::string public_key_;
    std::string field_;
};

/// AWS Signature Version 4 with static keys. A non-empty access token in
/// the snapshot is treated as an STS session token.
class SigV4Signer : public RequestSigner {
public:
    SigV4Signer(std::string access_key_id, std::string secret_access_key,
                std::string region, std::string service = "s3", Clock clock = {});

    std::string name() const override { return "sigv4"; }
    std::string sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const override;

    std::string canonical_request(const net::HttpRequest& request,
                                  const std::string& signed_headers,
                                  const std::string& payload_hash) const;

private:
    std::string string_to_sign(const std::string& datetime, const std::string& date,
                               const std::string& canonical) const;
    std::string signature(const std::string& date, const std::string& string_to_sign) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
    Clock clock_;
};

}  // namespace cloudmux
