#include "cloudmux/error.hpp"

namespace cloudmux {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::AuthExpired: return "AuthExpired";
        case ErrorKind::AuthRefreshFailed: return "AuthRefreshFailed";
        case ErrorKind::Network: return "Network";
        case ErrorKind::BackendRejected: return "BackendRejected";
        case ErrorKind::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorKind::QuotaExceeded: return "QuotaExceeded";
        case ErrorKind::Precondition: return "Precondition";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string TransferError::describe() const {
    std::string out = error_kind_name(kind);
    if (http_status != 0 || !code.empty()) {
        out += "[";
        if (http_status != 0) out += std::to_string(http_status);
        if (http_status != 0 && !code.empty()) out += " ";
        out += code;
        out += "]";
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

TransferError TransferError::make(ErrorKind kind, std::string message,
                                  std::string code, int http_status) {
    TransferError err;
    err.kind = kind;
    err.message = std::move(message);
    err.code = std::move(code);
    err.http_status = http_status;
    return err;
}

}  // namespace cloudmux
