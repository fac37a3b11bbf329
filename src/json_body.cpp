#include "cloudmux/json_body.hpp"

namespace cloudmux {

std::optional<json> parse_json_object(const net::HttpResponse& response, TransferError* error) {
    try {
        auto body = json::parse(response.body.begin(), response.body.end());
        if (body.is_object()) return body;
    } catch (const json::exception&) {
    }
    if (error) {
        std::string text = response.body_string();
        if (text.size() > 256) text.resize(256);
        *error = TransferError::make(ErrorKind::BackendRejected, "malformed response: " + text, "",
                                     response.status_code);
    }
    return std::nullopt;
}

std::string json_str(const json& object, const std::string& key) {
    if (!object.is_object()) return {};
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_unsigned()) return std::to_string(it->get<uint64_t>());
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_boolean()) return it->get<bool>() ? "true" : "false";
    return it->dump();
}

uint64_t json_u64(const json& object, const std::string& key, uint64_t fallback) {
    if (!object.is_object()) return fallback;
    auto it = object.find(key);
    if (it == object.end()) return fallback;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        return v < 0 ? fallback : static_cast<uint64_t>(v);
    }
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

}  // namespace cloudmux
