#include "cloudmux/config.hpp"
#include "cloudmux/json_body.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace cloudmux {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    auto types = DriverFactory::supported_types();
    if (std::find(types.begin(), types.end(), type) == types.end()) {
        return "unknown backend type: " + type;
    }
    return DriverFactory::validate_params(type, params);
}

// --- helpers ---

bool is_secret_param(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("credential") != std::string::npos ||
           key.find("password") != std::string::npos ||
           key.find("service_account") != std::string::npos;
}

std::optional<ByteRange> parse_range(const std::string& text) {
    auto dash = text.find('-');
    if (dash == std::string::npos || dash == 0) return std::nullopt;
    try {
        size_t used = 0;
        ByteRange range;
        range.start = std::stoull(text.substr(0, dash), &used);
        if (used != dash) return std::nullopt;
        std::string last = text.substr(dash + 1);
        if (!last.empty()) {
            range.end = std::stoull(last, &used);
            if (used != last.size() || *range.end < range.start) return std::nullopt;
        }
        return range;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// --- EngineConfig ---

namespace {

// --backend-refresh-token -> "refresh_token"
std::string backend_param_name(const std::string& suffix) {
    std::string key = suffix;
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

void print_usage() {
    std::cerr <<
        "Usage: cloudmux [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  upload <local> <remote-dir> [name]        Upload a file\n"
        "  download <remote-id> <local> [--range a-b] Download a file or byte range\n"
        "  ls <dir>                                   List a directory\n"
        "  rm <id>                                    Remove a file or directory\n"
        "  mkdir <parent> <name>                      Create a directory\n"
        "\n"
        "Backend (--backend-*):\n"
        "  --backend-type <type>            opendrive, session189, s3\n"
        "  --backend-<param> <value>        Any driver parameter, '-' read as '_'\n"
        "                                   e.g. --backend-refresh-token, --backend-bucket\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --chunk-size-mb <N>              Override the backend chunk size\n"
        "  --no-dedup                       Skip rapid-upload negotiation\n"
        "  --verbose                        Verbose output\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n"
        "\n"
        "Environment:\n"
        "  CLOUDMUX_REFRESH_TOKEN, CLOUDMUX_CLIENT_SECRET\n"
        "  AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY (s3)\n"
        "  CLOUDMUX_REQUEST_TIMEOUT (seconds), CLOUDMUX_CONNECTION_POOL_SIZE\n";
}

void env_default(DriverParams& params, const std::string& key, const char* env_name) {
    if (params.count(key) != 0 && !params[key].empty()) return;
    if (const char* v = std::getenv(env_name)) {
        if (*v) params[key] = v;
    }
}

}  // namespace

std::optional<EngineConfig> EngineConfig::from_args(int argc, char* argv[]) {
    EngineConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg.compare(0, 10, "--backend-") == 0) {
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                std::string suffix = arg.substr(10);
                if (suffix.empty()) {
                    std::cerr << "Error: unknown option: " << arg << "\n";
                    return std::nullopt;
                }
                if (suffix == "type") {
                    config.backend.type = v;
                } else {
                    config.backend.params[backend_param_name(suffix)] = v;
                }
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--chunk-size-mb") {
                auto* v = next_arg(i, "--chunk-size-mb");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v) * 1024ULL * 1024;
            } else if (arg == "--no-dedup") {
                config.dedup = false;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--range") {
                auto* v = next_arg(i, "--range");
                if (!v) return std::nullopt;
                config.range = parse_range(v);
                if (!config.range) {
                    std::cerr << "Error: invalid --range '" << v << "', expected a-b\n";
                    return std::nullopt;
                }
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.compare(0, 2, "--") == 0) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                config.command = arg;
            } else {
                config.args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    if (config.command.empty()) {
        print_usage();
        return std::nullopt;
    }

    config.apply_env();
    config.apply_defaults();
    return config;
}

bool EngineConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = json::parse(ifs);

        if (j.contains("chunk_size_mb"))
            chunk_size = j["chunk_size_mb"].get<uint64_t>() * 1024ULL * 1024;
        if (j.contains("dedup")) dedup = j["dedup"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key != "type" && !val.is_null()) {
                    backend.params[key] = json_str(jb, key);
                }
            }
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void EngineConfig::apply_env() {
    auto& params = backend.params;
    if (backend.type == "s3") {
        env_default(params, "access_key_id", "AWS_ACCESS_KEY_ID");
        env_default(params, "secret_access_key", "AWS_SECRET_ACCESS_KEY");
        env_default(params, "session_token", "AWS_SESSION_TOKEN");
        return;
    }
    env_default(params, "refresh_token", "CLOUDMUX_REFRESH_TOKEN");
    env_default(params, "client_secret", "CLOUDMUX_CLIENT_SECRET");
}

void EngineConfig::apply_defaults() {
    // A command-line chunk size wins over the backend's own parameter
    if (chunk_size != 0) {
        backend.params["chunk_size_mb"] = std::to_string(chunk_size / (1024 * 1024));
    }
    if (!dedup) backend.params["dedup"] = "false";
    if (metrics_interval_secs == 0) metrics_interval_secs = 15;
}

std::string EngineConfig::validate() const {
    if (backend.empty()) return "backend type is required (--backend-type or config \"backend\")";
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;

    size_t want = 0;
    if (command == "upload") want = 2;
    else if (command == "download") want = 2;
    else if (command == "ls") want = 0;
    else if (command == "rm") want = 1;
    else if (command == "mkdir") want = 2;
    else return "unknown command: " + command;

    if (args.size() < want) return command + " needs " + std::to_string(want) + " argument(s)";
    if (range && command != "download") return "--range only applies to download";
    return {};
}

std::vector<std::string> EngineConfig::banner() const {
    std::vector<std::string> lines;
    lines.push_back("backend-type: " + backend.type);
    for (auto& [k, v] : backend.params) {
        lines.push_back("backend-" + k + ": " + (is_secret_param(k) ? std::string("****") : v));
    }
    lines.push_back("chunk-size: " +
                    (chunk_size ? std::to_string(chunk_size / (1024 * 1024)) + " MB"
                                : std::string("backend default")));
    lines.push_back(std::string("dedup: ") + (dedup ? "yes" : "no"));
    if (!metrics_file.empty()) {
        lines.push_back("metrics-file: " + metrics_file.string());
    }
    return lines;
}

}  // namespace cloudmux
