#pragma once

#include "cloudmux/error.hpp"
#include "cloudmux/net/http.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace cloudmux {

using json = nlohmann::json;

/// Parse a response body as a JSON object. On failure `error` (if given)
/// is set to a BackendRejected carrying the start of the raw body.
std::optional<json> parse_json_object(const net::HttpResponse& response,
                                      TransferError* error = nullptr);

/// String view of a scalar field: strings as-is, integers and booleans
/// formatted, missing or null as "".
std::string json_str(const json& object, const std::string& key);

/// Integer field that some APIs send as a number and others as a string.
uint64_t json_u64(const json& object, const std::string& key, uint64_t fallback = 0);

}  // namespace cloudmux
