#include "cloudmux/config.hpp"
#include "cloudmux/driver.hpp"
#include "cloudmux/log.hpp"
#include "cloudmux/metrics.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <map>
#include <vector>

namespace {
std::atomic<bool> g_cancel{false};

void signal_handler(int sig) {
    (void)sig;
    g_cancel.store(true);
}

void print_entry(const cloudmux::RemoteFileHandle& entry) {
    std::printf("%s  %12llu  %-24s  %s\n", entry.is_directory ? "d" : "-",
                static_cast<unsigned long long>(entry.size), entry.id.c_str(), entry.name.c_str());
}

int run_upload(cloudmux::Driver& driver, const cloudmux::EngineConfig& config,
               cloudmux::MetricsExporter* metrics) {
    std::filesystem::path local = config.args[0];
    std::string parent = config.args[1];
    std::string name = config.args.size() > 2 ? config.args[2] : local.filename().string();

    cloudmux::FileSource source(local);
    if (!source.is_open()) {
        std::cerr << "Cannot open " << local << ": " << source.error() << std::endl;
        return 1;
    }

    cloudmux::UploadOptions options;
    options.cancel = &g_cancel;
    options.progress = [](uint64_t done, uint64_t total) {
        cloudmux::log_debug("progress %llu/%llu", static_cast<unsigned long long>(done),
                            static_cast<unsigned long long>(total));
    };

    cloudmux::UploadResult result;
    {
        std::optional<cloudmux::ScopedTimer> timer;
        if (metrics) timer.emplace(metrics->upload_duration());
        result = driver.upload(parent, name, source.size().value_or(0), source, options);
    }
    if (!result.success) {
        std::cerr << "Upload failed: " << result.error.describe() << std::endl;
        return 1;
    }
    std::cout << (result.rapid ? "rapid " : "") << "uploaded " << result.handle.name << " as "
              << result.handle.id << " (" << result.handle.size << " bytes, " << result.chunk_calls
              << " part calls)" << std::endl;
    return 0;
}

int run_download(cloudmux::Driver& driver, const cloudmux::EngineConfig& config) {
    cloudmux::RemoteFileHandle file;
    file.id = config.args[0];
    file.name = file.id;
    std::filesystem::path local = config.args[1];

    auto result = driver.download(file, config.range);
    if (!result.success) {
        std::cerr << "Download failed: " << result.error.describe() << std::endl;
        return 1;
    }

    FILE* out = std::fopen(local.c_str(), "wb");
    if (!out) {
        std::cerr << "Cannot create " << local << std::endl;
        return 1;
    }
    std::vector<uint8_t> buffer(1024 * 1024);
    size_t n = 0;
    bool write_failed = false;
    while (!g_cancel.load() && (n = result.stream->read(buffer.data(), buffer.size())) > 0) {
        if (std::fwrite(buffer.data(), 1, n, out) != n) {
            write_failed = true;
            break;
        }
    }
    bool close_failed = std::fclose(out) != 0;

    if (g_cancel.load()) {
        std::cerr << "Download cancelled" << std::endl;
        return 1;
    }
    if (write_failed || close_failed) {
        std::cerr << "Write to " << local << " failed" << std::endl;
        return 1;
    }
    auto failure = result.stream->failure();
    if (!failure.ok()) {
        std::cerr << "Download failed: " << failure.describe() << std::endl;
        return 1;
    }
    std::cout << "downloaded " << result.stream->delivered() << " bytes to " << local << std::endl;
    return 0;
}

int run_list(cloudmux::Driver& driver, const cloudmux::EngineConfig& config) {
    std::string dir = config.args.empty() ? driver.root_id() : config.args[0];
    auto result = driver.list(dir);
    if (!result.success) {
        std::cerr << "List failed: " << result.error.describe() << std::endl;
        return 1;
    }
    for (auto& entry : result.entries) print_entry(entry);
    return 0;
}

int run_remove(cloudmux::Driver& driver, const cloudmux::EngineConfig& config) {
    cloudmux::RemoteFileHandle file;
    file.id = config.args[0];
    file.is_directory = !file.id.empty() && file.id.back() == '/';
    auto result = driver.remove(file);
    if (!result.success) {
        std::cerr << "Remove failed: " << result.error.describe() << std::endl;
        return 1;
    }
    std::cout << "removed " << file.id << std::endl;
    return 0;
}

int run_mkdir(cloudmux::Driver& driver, const cloudmux::EngineConfig& config) {
    auto result = driver.mkdir(config.args[0], config.args[1]);
    if (!result.success) {
        std::cerr << "Mkdir failed: " << result.error.describe() << std::endl;
        return 1;
    }
    print_entry(result.handle);
    return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = cloudmux::EngineConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    cloudmux::set_verbose(config.verbose);
    cloudmux::log_debug("cloudmux %s", config.command.c_str());
    for (auto& line : config.banner()) {
        cloudmux::log_debug("  %s", line.c_str());
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::unique_ptr<cloudmux::Driver> driver;
    try {
        driver = cloudmux::DriverFactory::create(config.backend.type, config.backend.params);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create backend: " << e.what() << std::endl;
        return 1;
    }

    driver->session().set_token_listener([](const cloudmux::TokenSet&) {
        cloudmux::log_info("Credentials refreshed; persist the new refresh token if it rotated");
    });

    std::unique_ptr<cloudmux::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<cloudmux::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"backend", config.backend.type}});
        metrics->set_engine(&driver->engine());
        metrics->start();
    }

    int rc = 1;
    if (config.command == "upload") {
        rc = run_upload(*driver, config, metrics.get());
    } else if (config.command == "download") {
        rc = run_download(*driver, config);
    } else if (config.command == "ls") {
        rc = run_list(*driver, config);
    } else if (config.command == "rm") {
        rc = run_remove(*driver, config);
    } else if (config.command == "mkdir") {
        rc = run_mkdir(*driver, config);
    }

    if (metrics) metrics->stop();
    return rc;
}
