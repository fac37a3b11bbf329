// Configuration, driver factory and metrics exporter tests.

#include "test_support.hpp"

#include "cloudmux/config.hpp"
#include "cloudmux/driver.hpp"
#include "cloudmux/metrics.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using namespace cloudmux;
using namespace cloudmux::testing;

namespace {

// argv built from strings; from_args never keeps the pointers
std::optional<EngineConfig> parse(std::vector<std::string> args) {
    args.insert(args.begin(), "cloudmux");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return EngineConfig::from_args(static_cast<int>(args.size()), argv.data());
}

void clear_env() {
    for (const char* name : {"CLOUDMUX_REFRESH_TOKEN", "CLOUDMUX_CLIENT_SECRET", "AWS_ACCESS_KEY_ID",
                             "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN"}) {
        unsetenv(name);
    }
}

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           ("cloudmux_test_" + std::to_string(getpid()) + "_" + name);
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool has_line(const std::vector<std::string>& lines, const std::string& line) {
    for (const auto& l : lines) {
        if (l == line) return true;
    }
    return false;
}

}  // namespace

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

static void test_from_args() {
    std::cout << "\n--- Command line ---" << std::endl;
    clear_env();

    {
        TEST(backend_flags_become_params);
        auto config = parse({"--backend-type", "opendrive", "--backend-refresh-token", "rt",
                             "--backend-client-id", "cid", "--backend-client-secret", "cs",
                             "upload", "a.bin", "root"});
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->backend.type, "opendrive", "type");
        ASSERT_EQ(config->backend.params["refresh_token"], "rt", "dash read as underscore");
        ASSERT_EQ(config->backend.params["client_id"], "cid", "client id");
        ASSERT_EQ(config->command, "upload", "command");
        ASSERT_EQ(config->args.size(), 2u, "positional args");
        ASSERT_EQ(config->args[1], "root", "parent dir");
        ASSERT_EMPTY(config->validate(), "valid");
        PASS();
    }

    {
        TEST(chunk_size_and_dedup_pass_through_params);
        auto config = parse({"--backend-type", "opendrive", "--backend-access-token", "at",
                             "--chunk-size-mb", "4", "--no-dedup", "ls"});
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->chunk_size, 4ull * 1024 * 1024, "chunk size");
        ASSERT_EQ(config->backend.params["chunk_size_mb"], "4", "chunk param");
        ASSERT_EQ(config->backend.params["dedup"], "false", "dedup param");
        PASS();
    }

    {
        TEST(download_range);
        auto config = parse({"--backend-type", "s3", "--backend-bucket", "b",
                             "--backend-access-key-id", "AK", "--backend-secret-access-key", "SK",
                             "download", "docs/a.bin", "/tmp/a.bin", "--range", "100-1299"});
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_TRUE(config->range.has_value(), "range set");
        ASSERT_EQ(config->range->start, 100u, "start");
        ASSERT_TRUE(config->range->end && *config->range->end == 1299, "end");
        ASSERT_EMPTY(config->validate(), "valid");
        PASS();
    }

    {
        TEST(range_only_for_download);
        auto config = parse({"--backend-type", "opendrive", "--backend-access-token", "at",
                             "--range", "0-9", "ls"});
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_TRUE(!config->validate().empty(), "range on ls refused");
        PASS();
    }

    {
        TEST(bad_options_refused);
        ASSERT_TRUE(!parse({"--frobnicate", "ls"}), "unknown option");
        ASSERT_TRUE(!parse({"--range", "9-1", "download"}), "inverted range");
        ASSERT_TRUE(!parse({"--chunk-size-mb", "lots", "ls"}), "non-numeric");
        ASSERT_TRUE(!parse({"--backend-type"}), "missing value");
        ASSERT_TRUE(!parse({}), "no command");
        PASS();
    }

    {
        TEST(validate_command_arguments);
        auto config = parse({"--backend-type", "opendrive", "--backend-access-token", "at", "mkdir",
                             "root"});
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_TRUE(contains(config->validate(), "mkdir needs 2"), "mkdir arity");
        config->command = "sync";
        ASSERT_TRUE(contains(config->validate(), "unknown command"), "unknown command");
        config->command = "rm";
        ASSERT_EMPTY(config->validate(), "rm with one arg");
        PASS();
    }

    {
        TEST(backend_problems_surface_in_validate);
        auto config = parse({"ls"});
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_TRUE(contains(config->validate(), "backend type is required"), "no backend");
        config->backend.type = "ftp";
        ASSERT_TRUE(contains(config->validate(), "unknown backend type"), "unknown type");
        config->backend.type = "s3";
        ASSERT_TRUE(contains(config->validate(), "bucket"), "s3 needs bucket");
        PASS();
    }
}

static void test_parse_range() {
    std::cout << "\n--- Ranges ---" << std::endl;

    {
        TEST(parse_range_forms);
        auto closed = parse_range("0-9");
        ASSERT_TRUE(closed && closed->start == 0 && closed->end && *closed->end == 9, "a-b");
        auto open = parse_range("1024-");
        ASSERT_TRUE(open && open->start == 1024 && !open->end, "a-");
        ASSERT_TRUE(!parse_range("-5"), "suffix form refused");
        ASSERT_TRUE(!parse_range("5"), "no dash");
        ASSERT_TRUE(!parse_range("5x-9"), "junk");
        ASSERT_TRUE(!parse_range("10-2"), "inverted");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// JSON file and environment
// ---------------------------------------------------------------------------

static void test_json_and_env() {
    std::cout << "\n--- JSON and environment ---" << std::endl;
    clear_env();

    {
        TEST(load_json_overlays_values);
        auto path = temp_path("config.json");
        {
            std::ofstream out(path);
            out << R"({
                "chunk_size_mb": 8,
                "dedup": false,
                "metrics_file": "/tmp/cloudmux.prom",
                "metrics_interval": 30,
                "backend": {
                    "type": "session189",
                    "access_token": "long-lived",
                    "batch_poll_limit": 5
                }
            })";
        }
        EngineConfig config;
        ASSERT_TRUE(config.load_json(path), "loaded");
        std::filesystem::remove(path);
        ASSERT_EQ(config.chunk_size, 8ull * 1024 * 1024, "chunk size");
        ASSERT_TRUE(!config.dedup, "dedup off");
        ASSERT_EQ(config.metrics_interval_secs, 30u, "interval");
        ASSERT_EQ(config.backend.type, "session189", "type");
        ASSERT_EQ(config.backend.params["access_token"], "long-lived", "string param");
        ASSERT_EQ(config.backend.params["batch_poll_limit"], "5", "numeric param as text");
        ASSERT_EMPTY(config.backend.validate(), "backend valid");
        PASS();
    }

    {
        TEST(config_flag_then_cli_override);
        auto path = temp_path("override.json");
        {
            std::ofstream out(path);
            out << R"({"backend": {"type": "opendrive", "access_token": "from-file"}})";
        }
        auto config = parse({"--config", path.string(), "--backend-access-token", "from-cli", "ls"});
        std::filesystem::remove(path);
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->backend.params["access_token"], "from-cli", "later flag wins");
        PASS();
    }

    {
        TEST(load_json_reports_bad_files);
        EngineConfig config;
        ASSERT_TRUE(!config.load_json(temp_path("missing.json")), "missing file");
        auto path = temp_path("broken.json");
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        ASSERT_TRUE(!config.load_json(path), "malformed file");
        std::filesystem::remove(path);
        PASS();
    }

    {
        TEST(env_fills_missing_credentials_only);
        setenv("CLOUDMUX_REFRESH_TOKEN", "env-rt", 1);
        setenv("CLOUDMUX_CLIENT_SECRET", "env-cs", 1);
        auto config = parse({"--backend-type", "opendrive", "--backend-client-secret", "cli-cs", "ls"});
        clear_env();
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->backend.params["refresh_token"], "env-rt", "filled from env");
        ASSERT_EQ(config->backend.params["client_secret"], "cli-cs", "explicit value kept");
        PASS();
    }

    {
        TEST(aws_env_for_s3);
        setenv("AWS_ACCESS_KEY_ID", "AKENV", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "SKENV", 1);
        setenv("CLOUDMUX_REFRESH_TOKEN", "unused", 1);
        auto config = parse({"--backend-type", "s3", "--backend-bucket", "b", "ls"});
        clear_env();
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->backend.params["access_key_id"], "AKENV", "access key");
        ASSERT_EQ(config->backend.params["secret_access_key"], "SKENV", "secret key");
        ASSERT_TRUE(config->backend.params.count("refresh_token") == 0, "no oauth param for s3");
        ASSERT_EMPTY(config->validate(), "valid");
        PASS();
    }

    {
        TEST(banner_masks_secrets);
        auto config = parse({"--backend-type", "opendrive", "--backend-refresh-token", "rt-secret",
                             "--backend-client-id", "cid", "--backend-client-secret", "cs", "ls"});
        ASSERT_TRUE(config.has_value(), "parsed");
        auto lines = config->banner();
        ASSERT_TRUE(has_line(lines, "backend-type: opendrive"), "type line");
        ASSERT_TRUE(has_line(lines, "backend-refresh_token: ****"), "token masked");
        ASSERT_TRUE(has_line(lines, "backend-client_secret: ****"), "secret masked");
        ASSERT_TRUE(has_line(lines, "backend-client_id: cid"), "plain param shown");
        for (const auto& line : lines) {
            ASSERT_TRUE(!contains(line, "rt-secret"), "secret leaked: " + line);
        }
        ASSERT_TRUE(is_secret_param("secret_access_key"), "aws secret");
        ASSERT_TRUE(is_secret_param("service_account_json"), "service account key");
        ASSERT_TRUE(!is_secret_param("bucket"), "bucket is not secret");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Driver factory
// ---------------------------------------------------------------------------

static void test_param_helpers() {
    std::cout << "\n--- Param helpers ---" << std::endl;

    {
        TEST(param_helpers_fall_back);
        DriverParams params = {{"a", "x"}, {"empty", ""}, {"on", "YES"}, {"off", "0"},
                               {"junk", "maybe"}, {"n", "42"}, {"bad", "4x"}};
        ASSERT_EQ(param_or(params, "a", "d"), "x", "present");
        ASSERT_EQ(param_or(params, "empty", "d"), "d", "empty is missing");
        ASSERT_EQ(param_or(params, "absent"), "", "absent");
        ASSERT_TRUE(param_flag(params, "on", false), "YES");
        ASSERT_TRUE(!param_flag(params, "off", true), "0");
        ASSERT_TRUE(param_flag(params, "junk", true), "unrecognised uses fallback");
        ASSERT_EQ(param_u64(params, "n", 7), 42u, "number");
        ASSERT_EQ(param_u64(params, "bad", 7), 7u, "bad number uses fallback");
        PASS();
    }
}

static void test_driver_factory() {
    std::cout << "\n--- Driver factory ---" << std::endl;

    {
        TEST(supported_types_listed);
        auto types = DriverFactory::supported_types();
        ASSERT_EQ(types.size(), 3u, "three backends");
        ASSERT_EMPTY(DriverFactory::validate_params("opendrive", {{"access_token", "at"}}), "opendrive");
        ASSERT_EMPTY(DriverFactory::validate_params("session189", {{"access_token", "at"}}), "session189");
        ASSERT_EMPTY(DriverFactory::validate_params(
                         "s3", {{"bucket", "b"}, {"access_key_id", "AK"}, {"secret_access_key", "SK"}}),
                     "s3");
        PASS();
    }

    {
        TEST(validate_params_explains_gaps);
        ASSERT_TRUE(contains(DriverFactory::validate_params("opendrive", {{"refresh_token", "rt"}}),
                             "client_id"),
                    "refresh token without client");
        ASSERT_TRUE(contains(DriverFactory::validate_params(
                                 "session189", {{"session_key", "k"}, {"session_secret", "short"}}),
                             "16"),
                    "short session secret");
        ASSERT_TRUE(contains(DriverFactory::validate_params(
                                 "s3", {{"bucket", "b"}, {"access_key_id", "AK"},
                                        {"secret_access_key", "SK"}, {"chunk_size_mb", "1"}}),
                             "5 MiB"),
                    "s3 part floor");
        ASSERT_TRUE(contains(DriverFactory::validate_params("ftp", {}), "unknown backend"), "unknown");
        PASS();
    }

    {
        TEST(create_builds_each_backend);
        auto transport = std::make_shared<FakeTransport>();
        auto od = DriverFactory::create("opendrive", {{"access_token", "at"}, {"root_id", "r0"}},
                                        transport);
        ASSERT_EQ(od->type_name(), "opendrive", "opendrive");
        ASSERT_EQ(od->root_id(), "r0", "root param");
        auto s189 = DriverFactory::create("session189", {{"access_token", "at"}}, transport);
        ASSERT_EQ(s189->root_id(), "-11", "default root");
        auto s3 = DriverFactory::create(
            "s3", {{"bucket", "b"}, {"access_key_id", "AK"}, {"secret_access_key", "SK"},
                   {"root_prefix", "backups"}},
            transport);
        ASSERT_EQ(s3->root_id(), "backups/", "prefix gets separator");
        ASSERT_EQ(transport->count(), 0u, "construction is offline");
        PASS();
    }

    {
        TEST(create_throws_on_bad_input);
        bool threw = false;
        try {
            DriverFactory::create("ftp", {}, std::make_shared<FakeTransport>());
        } catch (const std::runtime_error& e) {
            threw = contains(e.what(), "ftp");
        }
        ASSERT_TRUE(threw, "unknown type");

        threw = false;
        try {
            DriverFactory::create("s3", {{"bucket", "b"}}, std::make_shared<FakeTransport>());
        } catch (const std::runtime_error& e) {
            threw = contains(e.what(), "access_key_id");
        }
        ASSERT_TRUE(threw, "missing keys");
        PASS();
    }

    {
        TEST(direct_link_withheld_when_proxied);
        auto transport = std::make_shared<FakeTransport>();
        auto driver = DriverFactory::create(
            "opendrive", {{"access_token", "at"}, {"drive_id", "d1"}, {"proxy_required", "true"}},
            transport);
        RemoteFileHandle file;
        file.id = "f1";
        ASSERT_TRUE(!driver->direct_link(file).has_value(), "no link");
        ASSERT_EQ(transport->count(), 0u, "no API call");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n--- Metrics ---" << std::endl;

    {
        TEST(exporter_tracks_engine_deltas);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest&) {
            return respond(200, "", {{"ETag", "\"abc\""}});
        });
        auto driver = DriverFactory::create(
            "s3", {{"bucket", "b"}, {"access_key_id", "AK"}, {"secret_access_key", "SK"},
                   {"endpoint", "http://localhost:9000"}},
            transport);

        auto path = temp_path("metrics.prom");
        MetricsExporter exporter(path, std::chrono::seconds(60), {{"backend", "s3"}});
        exporter.set_engine(&driver->engine());

        MemorySource good(std::string("hello"));
        auto ok = driver->upload("", "hello.txt", 5, good);
        ASSERT_TRUE(ok.success, "upload: " + ok.error.describe());

        MemorySource short_source(std::string("abc"));
        auto bad = driver->upload("", "bad.txt", 10, short_source);
        ASSERT_TRUE(bad.error.kind == ErrorKind::Precondition, "size mismatch refused");

        exporter.update_counters();
        exporter.update_counters();
        ASSERT_EQ(exporter.uploads(true), 1.0, "one success");
        ASSERT_EQ(exporter.uploads(false), 1.0, "one failure");
        ASSERT_EQ(exporter.errors(ErrorKind::Precondition), 1.0, "error by kind");
        ASSERT_EQ(exporter.errors(ErrorKind::Network), 0.0, "no network errors");

        ASSERT_TRUE(exporter.write_file(), "file written");
        std::string text = read_file(path);
        std::filesystem::remove(path);
        ASSERT_TRUE(contains(text, "cloudmux_uploads_total"), "uploads family");
        ASSERT_TRUE(contains(text, "backend=\"s3\""), "constant label");
        ASSERT_TRUE(contains(text, "kind=\"Precondition\""), "error label");
        ASSERT_TRUE(contains(text, "cloudmux_upload_bytes_total"), "bytes family");
        PASS();
    }

    {
        TEST(stop_writes_final_snapshot);
        auto path = temp_path("final.prom");
        {
            MetricsExporter exporter(path, std::chrono::seconds(3600), {});
            exporter.start();
            {
                ScopedTimer timer(exporter.upload_duration());
            }
            exporter.stop();
        }
        std::string text = read_file(path);
        std::filesystem::remove(path);
        ASSERT_TRUE(contains(text, "cloudmux_upload_duration_seconds_count 1"), "histogram observed");
        PASS();
    }

    {
        TEST(unwritable_path_reported);
        MetricsExporter exporter("/nonexistent-dir/cloudmux.prom", std::chrono::seconds(60), {});
        ASSERT_TRUE(!exporter.write_file(), "write refused");
        PASS();
    }
}

int main() {
    std::cout << "cloudmux config tests" << std::endl;
    std::cout << "=====================" << std::endl;

    test_from_args();
    test_parse_range();
    test_json_and_env();
    test_param_helpers();
    test_driver_factory();
    test_metrics();

    return report("Results");
}
