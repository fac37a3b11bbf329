#pragma once

#include "cloudmux/error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace cloudmux {

struct TokenSet {
    std::string access_token;
    std::string refresh_token;
    std::string session_secret;  // HMAC/AES key material for session-signed backends
    std::optional<std::chrono::system_clock::time_point> expires_at;
};

/// Copy of the tokens at one point in time. `generation` increases on every
/// install, so a caller can tell whether a refresh happened since it read.
struct TokenSnapshot {
    TokenSet tokens;
    uint64_t generation = 0;
};

struct RefreshOutcome {
    bool success = false;
    TokenSet tokens;
    TransferError error;
};

/// Backend-specific way of turning the current tokens into fresh ones.
class TokenRefresher {
public:
    virtual ~TokenRefresher() = default;
    virtual std::string name() const = 0;
    virtual RefreshOutcome refresh(const TokenSet& current) = 0;
};

struct RefreshResult {
    bool success = false;
    TokenSnapshot snapshot;
    TransferError error;
};

/// Per-account credentials shared by every request of one driver instance.
///
/// Reads take a shared lock and copy. Refresh is single-flight: the first
/// caller to observe an expired generation performs the network refresh,
/// concurrent callers wait on the same shared future, and callers whose
/// observed generation is already stale get the current tokens back
/// without any network call. There is no background timer.
class CredentialSession {
public:
    using TokenListener = std::function<void(const TokenSet&)>;

    CredentialSession(TokenSet initial, std::shared_ptr<TokenRefresher> refresher);

    CredentialSession(const CredentialSession&) = delete;
    CredentialSession& operator=(const CredentialSession&) = delete;

    TokenSnapshot read() const;

    /// Refresh the tokens that were current at `observed_generation`.
    RefreshResult refresh(uint64_t observed_generation);

    /// Replace the tokens. Empty refresh_token/session_secret keep the old values.
    void install(const TokenSet& tokens);

    /// Called after every install, e.g. to persist a rotated refresh token.
    /// Exceptions thrown by the listener are logged and dropped.
    void set_token_listener(TokenListener listener);

    bool can_refresh() const { return refresher_ != nullptr; }

    uint64_t generation() const;
    uint64_t refresh_count() const { return refresh_count_.load(); }
    uint64_t refresh_failures() const { return refresh_failures_.load(); }

private:
    RefreshOutcome run_refresher(const TokenSet& current);
    TokenSet store(const TokenSet& tokens);
    void notify(const TokenSet& installed);

    mutable std::shared_mutex mutex_;
    TokenSet tokens_;
    uint64_t generation_ = 0;

    std::shared_ptr<TokenRefresher> refresher_;

    std::mutex flight_mutex_;
    std::optional<std::shared_future<RefreshResult>> in_flight_;

    std::mutex listener_mutex_;
    TokenListener listener_;

    std::atomic<uint64_t> refresh_count_{0};
    std::atomic<uint64_t> refresh_failures_{0};
};

}  // namespace cloudmux
