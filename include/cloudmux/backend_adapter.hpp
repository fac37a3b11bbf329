#pragma once

#include "cloudmux/chunk_policy.hpp"
#include "cloudmux/dedup.hpp"
#include "cloudmux/signed_executor.hpp"
#include "cloudmux/signing.hpp"

#include <map>
#include <memory>
#include <string>

namespace cloudmux {

/// Everything provider-specific the engine needs, injected by a driver.
/// The engine itself knows no provider URLs or field names.
struct BackendAdapter {
    std::string name;
    std::map<std::string, std::string> endpoints;  // e.g. "api" -> base URL

    std::shared_ptr<const RequestSigner> signer;
    std::shared_ptr<const ChunkPolicy> chunk_policy;
    DedupCapabilities dedup;
    ResponsePolicy response_policy;

    /// Downloads must go through the engine; no direct links are handed out.
    bool proxy_required = false;

    std::string endpoint(const std::string& key) const {
        auto it = endpoints.find(key);
        return it == endpoints.end() ? std::string() : it->second;
    }
};

}  // namespace cloudmux
