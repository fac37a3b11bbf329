#include "cloudmux/signed_executor.hpp"
#include "cloudmux/json_body.hpp"
#include "cloudmux/log.hpp"

namespace cloudmux {

TransferError ResponsePolicy::classify(const net::HttpResponse& response) const {
    if (response.is_network_error) {
        return TransferError::make(ErrorKind::Network, response.error);
    }

    std::optional<TransferError> parsed;
    if (parse_error) parsed = parse_error(response);

    if (!parsed && response.ok()) return {};

    TransferError err;
    if (parsed) {
        err = *parsed;
    } else {
        err.message = response.body_string();
        if (err.message.empty()) err.message = "HTTP " + std::to_string(response.status_code);
    }
    if (err.http_status == 0) err.http_status = response.status_code;
    if (err.kind == ErrorKind::None) err.kind = ErrorKind::BackendRejected;
    if (is_quota_exceeded && is_quota_exceeded(err)) err.kind = ErrorKind::QuotaExceeded;
    return err;
}

std::function<std::optional<TransferError>(const net::HttpResponse&)>
json_error_parser(std::string code_key, std::string message_key, std::set<std::string> ok_codes) {
    return [code_key = std::move(code_key), message_key = std::move(message_key),
            ok_codes = std::move(ok_codes)](const net::HttpResponse& response)
               -> std::optional<TransferError> {
        auto body = parse_json_object(response);
        if (!body) return std::nullopt;

        std::string code = json_str(*body, code_key);
        if (code.empty() || ok_codes.count(code)) {
            if (!response.ok()) {
                // Non-2xx without a code: keep whatever message there is
                std::string message = json_str(*body, message_key);
                if (message.empty()) return std::nullopt;
                return TransferError::make(ErrorKind::BackendRejected, message, code,
                                           response.status_code);
            }
            return std::nullopt;
        }
        return TransferError::make(ErrorKind::BackendRejected, json_str(*body, message_key),
                                   code, response.status_code);
    };
}

std::function<bool(const net::HttpResponse&)>
auth_expiry_markers(std::set<std::string> codes, std::set<std::string> body_markers,
                    std::string code_key, bool status_401_expires) {
    return [codes = std::move(codes), body_markers = std::move(body_markers),
            code_key = std::move(code_key), status_401_expires](const net::HttpResponse& response) {
        if (response.is_network_error) return false;
        if (status_401_expires && response.status_code == 401) return true;
        if (response.body.empty()) return false;

        if (!codes.empty()) {
            if (auto body = parse_json_object(response)) {
                if (codes.count(json_str(*body, code_key))) return true;
            }
        }
        if (!body_markers.empty()) {
            std::string text = response.body_string();
            for (const auto& marker : body_markers) {
                if (text.find(marker) != std::string::npos) return true;
            }
        }
        return false;
    };
}

SignedExecutor::SignedExecutor(std::shared_ptr<net::HttpTransport> transport,
                               std::shared_ptr<CredentialSession> session,
                               ResponsePolicy policy,
                               int max_refreshes)
    : transport_(std::move(transport))
    , session_(std::move(session))
    , policy_(std::move(policy))
    , max_refreshes_(max_refreshes) {}

ExecuteResult SignedExecutor::execute(const net::HttpRequest& request, const RequestSigner& signer) {
    return run(request, signer, nullptr);
}

ExecuteResult SignedExecutor::stream(const net::HttpRequest& request, const RequestSigner& signer,
                                     const net::BodySink& sink) {
    return run(request, signer, &sink);
}

ExecuteResult SignedExecutor::run(const net::HttpRequest& request, const RequestSigner& signer,
                                  const net::BodySink* sink) {
    ExecuteResult result;

    for (;;) {
        TokenSnapshot snapshot = session_->read();

        net::HttpRequest attempt = request;
        std::string sign_error = signer.sign(attempt, snapshot);
        if (!sign_error.empty()) {
            result.error = TransferError::make(ErrorKind::Precondition,
                                               signer.name() + ": " + sign_error);
            return result;
        }

        result.attempts++;
        attempts_++;
        result.response = sink ? transport_->stream(attempt, *sink)
                               : transport_->execute(attempt);

        if (result.response.is_network_error) {
            result.error = TransferError::make(ErrorKind::Network, result.response.error);
            return result;
        }

        if (policy_.is_auth_expired && policy_.is_auth_expired(result.response)) {
            if (result.refreshes >= max_refreshes_) {
                TransferError err = policy_.classify(result.response);
                err.kind = ErrorKind::AuthExpired;
                if (err.message.empty()) err.message = "credentials still rejected after refresh";
                log_warn("%s %s: auth retry budget exhausted after %d attempts",
                         net::http_method_to_string(request.method), request.url.c_str(),
                         result.attempts);
                result.error = err;
                return result;
            }

            log_debug("Auth expired on %s (attempt %d), refreshing",
                      request.url.c_str(), result.attempts);
            result.refreshes++;
            auth_retries_++;
            RefreshResult refreshed = session_->refresh(snapshot.generation);
            if (!refreshed.success) {
                result.error = refreshed.error;
                return result;
            }
            continue;
        }

        result.error = policy_.classify(result.response);
        result.success = result.error.ok();
        return result;
    }
}

}  // namespace cloudmux
