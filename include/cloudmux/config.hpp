#pragma once

#include "cloudmux/driver.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cloudmux {

/// One remote account: a driver type plus its parameters.
struct BackendConfig {
    std::string type;  // "opendrive", "session189", "s3"
    DriverParams params;  // Passed to DriverFactory

    bool empty() const { return type.empty(); }

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the cloudmux command line tool.
struct EngineConfig {
    BackendConfig backend;

    // 0 = backend chunk policy
    uint64_t chunk_size = 0;
    bool dedup = true;
    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Command and its positional arguments, e.g. {"upload", "a.bin", "root"}
    std::string command;
    std::vector<std::string> args;
    std::optional<ByteRange> range;  // download --range a-b

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<EngineConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Pull credentials from the environment where the config left them empty.
    void apply_env();

    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// "key: value" lines with secret values masked.
    std::vector<std::string> banner() const;
};

/// Whether a parameter name holds a secret that must not be logged.
bool is_secret_param(const std::string& key);

/// "a-b" or "a-" into a ByteRange.
std::optional<ByteRange> parse_range(const std::string& text);

}  // namespace cloudmux
