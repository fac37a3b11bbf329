#include "cloudmux/driver.hpp"
#include "cloudmux/drivers/opendrive.hpp"
#include "cloudmux/drivers/s3.hpp"
#include "cloudmux/drivers/session189.hpp"
#include "cloudmux/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace cloudmux {

std::string param_or(const DriverParams& params, const std::string& key,
                     const std::string& fallback) {
    auto it = params.find(key);
    return (it == params.end() || it->second.empty()) ? fallback : it->second;
}

bool param_flag(const DriverParams& params, const std::string& key, bool fallback) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return fallback;
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return fallback;
}

uint64_t param_u64(const DriverParams& params, const std::string& key, uint64_t fallback) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return fallback;
    try {
        size_t used = 0;
        uint64_t value = std::stoull(it->second, &used);
        if (used == it->second.size()) return value;
    } catch (const std::exception&) {
    }
    log_warn("Ignoring non-numeric %s='%s'", key.c_str(), it->second.c_str());
    return fallback;
}

namespace {

std::shared_ptr<net::HttpTransport> default_transport(const DriverParams& params) {
    net::HttpClientConfig config;
    if (const char* timeout = std::getenv("CLOUDMUX_REQUEST_TIMEOUT")) {
        try {
            config.default_total_timeout = std::chrono::milliseconds(std::stoull(timeout) * 1000);
        } catch (const std::exception&) {
            log_warn("Ignoring invalid CLOUDMUX_REQUEST_TIMEOUT '%s'", timeout);
        }
    }
    if (const char* pool = std::getenv("CLOUDMUX_CONNECTION_POOL_SIZE")) {
        try {
            config.max_connections = std::stoul(pool);
        } catch (const std::exception&) {
            log_warn("Ignoring invalid CLOUDMUX_CONNECTION_POOL_SIZE '%s'", pool);
        }
    }
    config.proxy_url = param_or(params, "http_proxy");
    config.ca_bundle = param_or(params, "ca_bundle");
    config.verify_ssl_by_default = !param_flag(params, "insecure", false);
    return std::make_shared<net::HttpClient>(config);
}

}  // namespace

std::vector<std::string> DriverFactory::supported_types() {
    return {drivers::OpenDriveDriver::kType, drivers::Session189Driver::kType, drivers::S3Driver::kType};
}

std::string DriverFactory::validate_params(const std::string& type, const DriverParams& params) {
    if (type == drivers::OpenDriveDriver::kType) {
        return drivers::OpenDriveDriver::Config::from_params(params).validate();
    }
    if (type == drivers::Session189Driver::kType) {
        return drivers::Session189Driver::Config::from_params(params).validate();
    }
    if (type == drivers::S3Driver::kType) {
        return drivers::S3Driver::Config::from_params(params).validate();
    }
    return "unknown backend type '" + type + "'";
}

std::unique_ptr<Driver> DriverFactory::create(const std::string& type, const DriverParams& params,
                                              std::shared_ptr<net::HttpTransport> transport) {
    std::string error = validate_params(type, params);
    if (!error.empty()) {
        throw std::runtime_error(type + ": " + error);
    }
    if (!transport) transport = default_transport(params);

    std::unique_ptr<Driver> driver;
    if (type == drivers::OpenDriveDriver::kType) {
        driver = std::make_unique<drivers::OpenDriveDriver>(
            drivers::OpenDriveDriver::Config::from_params(params), std::move(transport));
    } else if (type == drivers::Session189Driver::kType) {
        driver = std::make_unique<drivers::Session189Driver>(
            drivers::Session189Driver::Config::from_params(params), std::move(transport));
    } else {
        driver = std::make_unique<drivers::S3Driver>(
            drivers::S3Driver::Config::from_params(params), std::move(transport));
    }

    log_debug("Created %s driver (root '%s')", type.c_str(), driver->root_id().c_str());
    return driver;
}

}  // namespace cloudmux
