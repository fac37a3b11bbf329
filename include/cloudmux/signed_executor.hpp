#pragma once

#include "cloudmux/credential_session.hpp"
#include "cloudmux/error.hpp"
#include "cloudmux/net/http.hpp"
#include "cloudmux/signing.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace cloudmux {

/// Backend-specific reading of responses, supplied by the adapter.
struct ResponsePolicy {
    /// True when the response means "token expired, refresh and retry".
    std::function<bool(const net::HttpResponse&)> is_auth_expired;

    /// Error carried by the response, if any. Called for every response,
    /// so backends that report failures inside 2xx bodies can flag them.
    /// A non-2xx response for which this returns nullopt is still an error.
    std::function<std::optional<TransferError>(const net::HttpResponse&)> parse_error;

    std::function<bool(const TransferError&)> is_quota_exceeded;

    /// Classify a finished response. Returns a kind of None on success.
    TransferError classify(const net::HttpResponse& response) const;
};

/// JSON error bodies of the {"<code_key>": ..., "<message_key>": ...} shape.
/// Codes in `ok_codes` (e.g. "0", "SUCCESS") are not errors.
std::function<std::optional<TransferError>(const net::HttpResponse&)>
json_error_parser(std::string code_key, std::string message_key,
                  std::set<std::string> ok_codes = {});

/// Auth expiry signalled by any of the given error codes or body substrings.
std::function<bool(const net::HttpResponse&)>
auth_expiry_markers(std::set<std::string> codes, std::set<std::string> body_markers,
                    std::string code_key = "code", bool status_401_expires = false);

struct ExecuteResult {
    bool success = false;
    net::HttpResponse response;
    TransferError error;
    int attempts = 0;
    int refreshes = 0;
};

/// Signs, sends and classifies requests for one account.
///
/// Each attempt copies the caller's request, signs it with the current
/// token snapshot and sends it. When the policy reports auth expiry the
/// session is refreshed (single-flight) and the request re-signed, at most
/// max_refreshes times. Transport failures are returned as Network without
/// retry. No response is cached.
class SignedExecutor {
public:
    static constexpr int kDefaultMaxRefreshes = 3;

    SignedExecutor(std::shared_ptr<net::HttpTransport> transport,
                   std::shared_ptr<CredentialSession> session,
                   ResponsePolicy policy,
                   int max_refreshes = kDefaultMaxRefreshes);

    ExecuteResult execute(const net::HttpRequest& request, const RequestSigner& signer);

    /// As execute(), but a 2xx body is delivered to `sink` instead of
    /// being buffered.
    ExecuteResult stream(const net::HttpRequest& request, const RequestSigner& signer,
                         const net::BodySink& sink);

    net::HttpTransport& transport() { return *transport_; }
    const std::shared_ptr<CredentialSession>& session() const { return session_; }
    const ResponsePolicy& policy() const { return policy_; }

    uint64_t attempts() const { return attempts_.load(); }
    uint64_t auth_retries() const { return auth_retries_.load(); }

private:
    ExecuteResult run(const net::HttpRequest& request, const RequestSigner& signer,
                      const net::BodySink* sink);

    std::shared_ptr<net::HttpTransport> transport_;
    std::shared_ptr<CredentialSession> session_;
    ResponsePolicy policy_;
    int max_refreshes_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> auth_retries_{0};
};

}  // namespace cloudmux
