#include "cloudmux/credential_session.hpp"
#include "cloudmux/log.hpp"

namespace cloudmux {

CredentialSession::CredentialSession(TokenSet initial, std::shared_ptr<TokenRefresher> refresher)
    : tokens_(std::move(initial))
    , refresher_(std::move(refresher)) {}

TokenSnapshot CredentialSession::read() const {
    std::shared_lock lock(mutex_);
    return TokenSnapshot{tokens_, generation_};
}

uint64_t CredentialSession::generation() const {
    std::shared_lock lock(mutex_);
    return generation_;
}

TokenSet CredentialSession::store(const TokenSet& tokens) {
    std::unique_lock lock(mutex_);
    std::string old_refresh = tokens_.refresh_token;
    std::string old_secret = tokens_.session_secret;
    tokens_ = tokens;
    if (tokens_.refresh_token.empty()) tokens_.refresh_token = old_refresh;
    if (tokens_.session_secret.empty()) tokens_.session_secret = old_secret;
    ++generation_;
    return tokens_;
}

void CredentialSession::notify(const TokenSet& installed) {
    TokenListener listener;
    {
        std::lock_guard lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener) return;
    try {
        listener(installed);
    } catch (const std::exception& e) {
        log_warn("Token listener failed: %s", e.what());
    } catch (...) {
        log_warn("Token listener failed with a non-standard exception");
    }
}

void CredentialSession::install(const TokenSet& tokens) {
    notify(store(tokens));
}

void CredentialSession::set_token_listener(TokenListener listener) {
    std::lock_guard lock(listener_mutex_);
    listener_ = std::move(listener);
}

RefreshOutcome CredentialSession::run_refresher(const TokenSet& current) {
    if (!refresher_) {
        RefreshOutcome out;
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed,
                                        "no refresh method configured for this account");
        return out;
    }
    try {
        return refresher_->refresh(current);
    } catch (const std::exception& e) {
        RefreshOutcome out;
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed, e.what());
        return out;
    } catch (...) {
        RefreshOutcome out;
        out.error = TransferError::make(ErrorKind::AuthRefreshFailed,
                                        "refresher threw a non-standard exception");
        return out;
    }
}

RefreshResult CredentialSession::refresh(uint64_t observed_generation) {
    std::shared_future<RefreshResult> future;
    std::shared_ptr<std::promise<RefreshResult>> promise;
    {
        std::lock_guard lock(flight_mutex_);
        {
            std::shared_lock read_lock(mutex_);
            if (generation_ != observed_generation) {
                // Someone already refreshed since this caller read its token
                return RefreshResult{true, TokenSnapshot{tokens_, generation_}, {}};
            }
        }
        if (in_flight_) {
            future = *in_flight_;
        } else {
            promise = std::make_shared<std::promise<RefreshResult>>();
            future = promise->get_future().share();
            in_flight_ = future;
        }
    }

    if (!promise) {
        return future.get();
    }

    log_debug("Refreshing credentials via %s (generation %lu)",
              refresher_ ? refresher_->name().c_str() : "none",
              static_cast<unsigned long>(observed_generation));

    RefreshOutcome outcome = run_refresher(read().tokens);
    refresh_count_++;

    RefreshResult result;
    std::optional<TokenSet> installed;
    {
        // Install and clear the in-flight marker together so no caller can
        // observe the old generation without also seeing the new tokens.
        std::lock_guard lock(flight_mutex_);
        if (outcome.success) {
            installed = store(outcome.tokens);
            result.success = true;
            result.snapshot = read();
        } else {
            result.error = outcome.error;
            if (result.error.kind == ErrorKind::None) {
                result.error.kind = ErrorKind::AuthRefreshFailed;
            }
            refresh_failures_++;
        }
        in_flight_.reset();
    }
    promise->set_value(result);

    if (!result.success) {
        log_error("Credential refresh failed: %s", result.error.describe().c_str());
    }

    // Waiters are already released; the listener runs outside every lock
    if (installed) notify(*installed);
    return result;
}

}  // namespace cloudmux
