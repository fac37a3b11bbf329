#pragma once

#include <string>

namespace cloudmux {

// Failure classes surfaced by the transfer engine.
enum class ErrorKind {
    None,
    AuthExpired,        // auth retry budget exhausted
    AuthRefreshFailed,  // refresh token rejected, user must re-authorize
    Network,            // transport-level failure
    BackendRejected,    // any other API error, code/message kept verbatim
    IntegrityMismatch,  // hash or size disagrees with expectation
    QuotaExceeded,      // backend reports insufficient space
    Precondition,       // local contract violated before any network call
    Cancelled           // caller aborted the transfer
};

const char* error_kind_name(ErrorKind kind);

struct TransferError {
    ErrorKind kind = ErrorKind::None;
    int http_status = 0;
    std::string code;     // backend error code, as returned
    std::string message;  // backend diagnostic text, as returned

    bool ok() const { return kind == ErrorKind::None; }

    /// Whether the engine may retry this class of error without user action.
    bool fatal() const {
        return kind == ErrorKind::AuthRefreshFailed || kind == ErrorKind::QuotaExceeded ||
               kind == ErrorKind::AuthExpired;
    }

    /// "BackendRejected[409 QuotaExhausted]: message"
    std::string describe() const;

    static TransferError make(ErrorKind kind, std::string message,
                              std::string code = {}, int http_status = 0);
};

}  // namespace cloudmux
