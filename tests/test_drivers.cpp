// Backend driver tests: each driver's API flow replayed against a
// scripted transport.

#include "test_support.hpp"

#include "cloudmux/crypto.hpp"
#include "cloudmux/drivers/opendrive.hpp"
#include "cloudmux/drivers/s3.hpp"
#include "cloudmux/drivers/session189.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

using namespace cloudmux;
using namespace cloudmux::testing;
using nlohmann::json;

namespace {

constexpr const char* kSecret = "0123456789abcdef0123";

std::vector<uint8_t> pattern(size_t size, uint32_t seed = 11) {
    std::vector<uint8_t> data(size);
    uint32_t x = seed;
    for (size_t i = 0; i < size; ++i) {
        x = x * 1664525u + 1013904223u;
        data[i] = static_cast<uint8_t>(x >> 24);
    }
    return data;
}

std::string as_string(const std::vector<uint8_t>& data) {
    return std::string(data.begin(), data.end());
}

std::string sha1_upper(const std::vector<uint8_t>& data) {
    return crypto::digest_hex(crypto::DigestAlgorithm::Sha1, std::span<const uint8_t>(data), true);
}

std::string md5_upper(const std::vector<uint8_t>& data) {
    return crypto::digest_hex(crypto::DigestAlgorithm::Md5, std::span<const uint8_t>(data), true);
}

/// Serve `data` honouring the request's byte range.
net::HttpResponse serve_range(const std::vector<uint8_t>& data, const net::HttpRequest& request) {
    if (!request.byte_range) return respond(200, as_string(data));
    uint64_t first = request.byte_range->first;
    uint64_t last = std::min<uint64_t>(request.byte_range->second, data.size() - 1);
    std::string slice(data.begin() + static_cast<std::ptrdiff_t>(first),
                      data.begin() + static_cast<std::ptrdiff_t>(last + 1));
    return respond(206, slice,
                   {{"Content-Range", "bytes " + std::to_string(first) + "-" + std::to_string(last) +
                                          "/" + std::to_string(data.size())}});
}

std::string drain(DownloadStream& stream) {
    std::string out;
    std::vector<uint8_t> buffer(4096);
    size_t n;
    while ((n = stream.read(buffer.data(), buffer.size())) > 0) {
        out.append(reinterpret_cast<const char*>(buffer.data()), n);
    }
    return out;
}

json json_of(const net::HttpRequest& request) {
    try {
        return json::parse(body_of(request));
    } catch (const json::exception&) {
        return json::object();
    }
}

std::string path_of(const std::string& url) {
    auto parsed = net::ParsedUrl::parse(url);
    return parsed ? parsed->path : std::string();
}

std::string query_value(const std::string& url, const std::string& key) {
    auto parsed = net::ParsedUrl::parse(url);
    if (!parsed) return {};
    for (const auto& [k, v] : parsed->query_params()) {
        if (k == key) return v;
    }
    return {};
}

/// Decrypted params=<HEX> of a session-signed upload call.
std::string decrypted_params(const std::string& url) {
    std::string hex = query_value(url, "params");
    std::vector<uint8_t> bytes;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return crypto::aes128_ecb_decrypt(kSecret, bytes).value_or("");
}

drivers::OpenDriveDriver::Config opendrive_config(DriverParams params) {
    params.emplace("api_url", "https://open.test");
    return drivers::OpenDriveDriver::Config::from_params(params);
}

drivers::Session189Driver::Config session189_config(DriverParams params = {}) {
    params.emplace("api_url", "https://api.test");
    params.emplace("upload_url", "https://upload.test");
    params.emplace("access_token", "long-lived");
    params.emplace("batch_poll_interval_ms", "1");
    return drivers::Session189Driver::Config::from_params(params);
}

drivers::S3Driver::Config s3_config(DriverParams params = {}) {
    params.emplace("bucket", "media");
    params.emplace("endpoint", "http://minio.test:9000");
    params.emplace("access_key_id", "AK");
    params.emplace("secret_access_key", "SK");
    return drivers::S3Driver::Config::from_params(params);
}

}  // namespace

// ---------------------------------------------------------------------------
// opendrive
// ---------------------------------------------------------------------------

static void test_opendrive_session() {
    std::cout << "\n--- opendrive: credentials and drive ---" << std::endl;

    {
        TEST(refresh_token_primes_access_token);
        int token_calls = 0;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (contains(req.url, "/oauth/access_token")) {
                ++token_calls;
                return respond(200, R"({"access_token":"at-1","refresh_token":"rt-2","expires_in":7200})");
            }
            return respond(200, R"({"items":[],"next_marker":""})");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"refresh_token", "rt-1"}, {"client_id", "cid"},
                              {"client_secret", "cs"}, {"drive_id", "d1"}}),
            transport);

        std::string rotated;
        driver.session().set_token_listener(
            [&](const TokenSet& tokens) { rotated = tokens.refresh_token; });

        ASSERT_TRUE(driver.list("root").success, "first list");
        ASSERT_TRUE(driver.list("root").success, "second list");
        ASSERT_EQ(token_calls, 1, "one refresh");
        ASSERT_EQ(rotated, "rt-2", "rotated refresh token reported");

        auto sent = json::parse(transport->requests()[0].body);
        ASSERT_EQ(sent.value("refresh_token", ""), "rt-1", "old refresh token sent");
        auto list_call = transport->requests()[1];
        ASSERT_EQ(list_call.headers.get("Authorization").value_or(""), "Bearer at-1", "bearer");
        PASS();
    }

    {
        TEST(expired_access_token_refreshed_and_retried);
        int list_calls = 0;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (contains(req.url, "/oauth/access_token")) {
                return respond(200, R"({"access_token":"at-new"})");
            }
            if (++list_calls == 1) {
                return respond(401, R"({"code":"AccessTokenExpired","message":"expired"})");
            }
            return respond(200, R"({"items":[],"next_marker":""})");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at-old"}, {"refresh_token", "rt"},
                              {"client_id", "cid"}, {"client_secret", "cs"}, {"drive_id", "d1"}}),
            transport);

        ASSERT_TRUE(driver.list("root").success, "list after refresh");
        ASSERT_EQ(list_calls, 2, "retried once");
        auto calls = transport->requests();
        ASSERT_EQ(calls.back().headers.get("Authorization").value_or(""), "Bearer at-new",
                  "retry carries new token");
        ASSERT_EQ(driver.engine().stats().auth_retries, 1u, "auth retry counted");
        PASS();
    }

    {
        TEST(drive_info_looked_up_once);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& req) {
            if (contains(req.url, "/user/getDriveInfo")) {
                return respond(200, R"({"default_drive_id":"d-def","resource_drive_id":"d-res"})");
            }
            return respond(200, R"({"items":[],"next_marker":""})");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_type", "resource"}}), transport);

        ASSERT_TRUE(driver.list("").success, "list");
        ASSERT_TRUE(driver.list("").success, "list again");
        ASSERT_EQ(transport->count_matching("/user/getDriveInfo"), 1u, "cached");
        auto calls = transport->requests();
        auto body = json::parse(calls.back().body);
        ASSERT_EQ(body.value("drive_id", ""), "d-res", "resource drive chosen");
        ASSERT_EQ(body.value("parent_file_id", ""), "root", "empty dir means root");
        PASS();
    }

    {
        TEST(revoked_refresh_token_is_fatal);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest&) {
            return respond(400, R"({"code":"InvalidParameter.RefreshToken","message":"revoked"})");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"refresh_token", "rt"}, {"client_id", "cid"},
                              {"client_secret", "cs"}, {"drive_id", "d1"}}),
            transport);
        auto result = driver.list("root");
        ASSERT_TRUE(!result.success, "list refused");
        ASSERT_TRUE(result.error.kind == ErrorKind::AuthRefreshFailed, "refresh failure surfaced");
        ASSERT_EQ(transport->count(), 1u, "no API call without a token");
        PASS();
    }
}

static void test_opendrive_upload() {
    std::cout << "\n--- opendrive: upload ---" << std::endl;

    {
        TEST(proof_code_reads_eight_bytes);
        auto data = pattern(4096);
        auto reader = [&](uint64_t offset, size_t length) -> std::optional<std::vector<uint8_t>> {
            return std::vector<uint8_t>(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                        data.begin() + static_cast<std::ptrdiff_t>(offset + length));
        };
        std::string md5 = crypto::digest_hex(crypto::DigestAlgorithm::Md5, std::string_view("at"));
        uint64_t start = std::stoull(md5.substr(0, 16), nullptr, 16) % data.size();
        size_t length = static_cast<size_t>(std::min<uint64_t>(8, data.size() - start));
        std::vector<uint8_t> expected(data.begin() + static_cast<std::ptrdiff_t>(start),
                                      data.begin() + static_cast<std::ptrdiff_t>(start + length));

        auto proof = drivers::OpenDriveDriver::proof_code("at", data.size(), reader);
        ASSERT_TRUE(proof.has_value(), "computed");
        ASSERT_EQ(*proof, net::base64_encode(expected), "proof bytes");
        ASSERT_EQ(drivers::OpenDriveDriver::proof_code("at", 0, reader).value_or("x"), "",
                  "empty file has empty proof");
        ASSERT_TRUE(!drivers::OpenDriveDriver::proof_code("at", 10, {}), "no reader");
        PASS();
    }

    {
        TEST(pre_hash_match_then_rapid_upload);
        auto data = pattern(4096);
        std::vector<json> creates;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (contains(req.url, "/openFile/create")) {
                auto body = json_of(req);
                creates.push_back(body);
                if (body.contains("pre_hash")) {
                    return respond(409, R"({"code":"PreHashMatched","message":"pre hash matched"})");
                }
                return respond(200, R"({"file_id":"f-rapid","rapid_upload":true})");
            }
            return respond(500, "unexpected");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}}), transport);

        MemorySource source(data);
        auto result = driver.upload("root", "same.bin", data.size(), source);
        ASSERT_TRUE(result.success, "upload: " + result.error.describe());
        ASSERT_TRUE(result.rapid, "rapid");
        ASSERT_EQ(result.handle.id, "f-rapid", "remote id");
        ASSERT_EQ(result.chunk_calls, 0u, "no part calls");
        ASSERT_EQ(creates.size(), 2u, "two create rounds");

        std::vector<uint8_t> prefix(data.begin(), data.begin() + 1024);
        ASSERT_EQ(creates[0].value("pre_hash", ""), sha1_upper(prefix), "1 KiB pre hash");
        ASSERT_EQ(creates[1].value("content_hash", ""), sha1_upper(data), "content hash");
        ASSERT_EQ(creates[1].value("content_hash_name", ""), "sha1", "hash name");
        auto reader = [&](uint64_t offset, size_t length) -> std::optional<std::vector<uint8_t>> {
            return std::vector<uint8_t>(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                        data.begin() + static_cast<std::ptrdiff_t>(offset + length));
        };
        ASSERT_EQ(creates[1].value("proof_code", ""),
                  drivers::OpenDriveDriver::proof_code("at", data.size(), reader).value_or(""),
                  "proof code");
        ASSERT_EQ(driver.engine().stats().rapid_uploads, 1u, "rapid counted");
        PASS();
    }

    {
        TEST(chunked_upload_with_presigned_parts);
        const size_t size = 2 * 1024 * 1024 + 512 * 1024;
        auto data = pattern(size, 3);
        std::vector<std::string> put_urls;
        std::string assembled;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            std::string path = path_of(req.url);
            if (path == "/adrive/v1.0/openFile/create") {
                return respond(200, R"({"file_id":"f-new","upload_id":"u-1","rapid_upload":false,
                    "part_info_list":[{"part_number":1,"upload_url":"https://oss.test/p1"},
                                      {"part_number":2,"upload_url":"https://oss.test/p2"}]})");
            }
            if (path == "/adrive/v1.0/openFile/getUploadUrl") {
                return respond(200, R"({"part_info_list":[{"part_number":3,"upload_url":"https://oss.test/p3"}]})");
            }
            if (contains(req.url, "oss.test")) {
                put_urls.push_back(req.url);
                assembled += body_of(req);
                // Part 2 is reported as already present
                return respond(contains(req.url, "/p2") ? 409 : 200);
            }
            if (path == "/adrive/v1.0/openFile/complete") {
                json reply = {{"file_id", "f-new"}, {"name", "big.bin"}, {"size", size},
                              {"content_hash", sha1_upper(data)}, {"parent_file_id", "root"}};
                return respond(200, reply.dump());
            }
            return respond(500, "unexpected " + req.url);
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}, {"chunk_size_mb", "1"}}),
            transport);

        MemorySource source(data);
        std::vector<uint64_t> progress;
        UploadOptions options;
        options.progress = [&](uint64_t done, uint64_t) { progress.push_back(done); };
        auto result = driver.upload("root", "big.bin", size, source, options);
        ASSERT_TRUE(result.success, "upload: " + result.error.describe());
        ASSERT_TRUE(!result.rapid, "not rapid");
        ASSERT_EQ(result.handle.id, "f-new", "file id");
        ASSERT_EQ(result.chunk_calls, 3u, "three parts");
        ASSERT_EQ(put_urls.size(), 3u, "three PUTs");
        ASSERT_EQ(put_urls[2], "https://oss.test/p3", "late URL fetched for part 3");
        ASSERT_EQ(transport->count_matching("/openFile/create"), 1u, "dedup create reused");
        ASSERT_EQ(transport->count_matching("/openFile/complete"), 1u, "one complete");
        ASSERT_TRUE(assembled == as_string(data), "parts reassemble the file");
        ASSERT_TRUE(!progress.empty() && progress.back() == size, "progress reaches size");

        for (const auto& call : transport->requests()) {
            if (contains(call.url, "oss.test")) {
                ASSERT_TRUE(!call.headers.has("Authorization"), "presigned part is unsigned");
            }
        }
        PASS();
    }

    {
        TEST(small_one_shot_stream_falls_back_to_upload);
        auto data = pattern(100, 21);
        std::vector<json> creates;
        std::string uploaded;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            std::string path = path_of(req.url);
            if (path == "/adrive/v1.0/openFile/create") {
                auto body = json_of(req);
                creates.push_back(body);
                if (body.contains("pre_hash")) {
                    return respond(409, R"({"code":"PreHashMatched","message":"pre hash matched"})");
                }
                return respond(200, R"({"file_id":"f-s","upload_id":"u-s",
                    "part_info_list":[{"part_number":1,"upload_url":"https://oss.test/s1"}]})");
            }
            if (contains(req.url, "oss.test")) {
                uploaded += body_of(req);
                return respond(200);
            }
            if (path == "/adrive/v1.0/openFile/complete") {
                json reply = {{"file_id", "f-s"}, {"content_hash", sha1_upper(data)}};
                return respond(200, reply.dump());
            }
            return respond(500, "unexpected " + req.url);
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}}), transport);

        std::istringstream in(as_string(data));
        StreamSource source(in, data.size());
        auto result = driver.upload("root", "tiny.bin", data.size(), source);
        ASSERT_TRUE(result.success, "upload: " + result.error.describe());
        ASSERT_TRUE(!result.rapid, "not rapid");
        ASSERT_EQ(result.handle.id, "f-s", "file id");
        ASSERT_TRUE(uploaded == as_string(data), "bytes sent directly");
        ASSERT_EQ(creates.size(), 2u, "pre-hash round then plain create");
        for (const auto& create : creates) {
            ASSERT_TRUE(!create.contains("content_hash") && !create.contains("proof_code"),
                        "no proof without a re-readable source");
        }
        PASS();
    }

    {
        TEST(dedup_disabled_skips_hash_rounds);
        auto data = pattern(2048);
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            std::string path = path_of(req.url);
            if (path == "/adrive/v1.0/openFile/create") {
                return respond(200, R"({"file_id":"f2","upload_id":"u2",
                    "part_info_list":[{"part_number":1,"upload_url":"https://oss.test/x1"}]})");
            }
            if (path == "/adrive/v1.0/openFile/complete") return respond(200, R"({"file_id":"f2"})");
            return respond(200);
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}, {"dedup", "false"}}),
            transport);
        MemorySource source(data);
        auto result = driver.upload("root", "plain.bin", data.size(), source);
        ASSERT_TRUE(result.success, "upload: " + result.error.describe());
        auto create = json::parse(transport->requests()[0].body);
        ASSERT_TRUE(!create.contains("pre_hash") && !create.contains("content_hash"), "no hashes sent");
        PASS();
    }

    {
        TEST(quota_error_is_fatal);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest&) {
            return respond(400, R"({"code":"QuotaExhausted.Drive","message":"drive full"})");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}, {"dedup", "false"}}),
            transport);
        MemorySource source(std::string("data"));
        auto result = driver.upload("root", "x.bin", 4, source);
        ASSERT_TRUE(!result.success, "refused");
        ASSERT_TRUE(result.error.kind == ErrorKind::QuotaExceeded, "quota kind");
        ASSERT_EQ(result.error.code, "QuotaExhausted.Drive", "code kept verbatim");
        PASS();
    }
}

static void test_opendrive_files() {
    std::cout << "\n--- opendrive: files ---" << std::endl;

    {
        TEST(list_follows_markers);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& req) {
            auto body = json_of(req);
            if (!body.contains("marker")) {
                return respond(200, R"({"items":[
                    {"file_id":"d1","name":"docs","type":"folder","parent_file_id":"root"},
                    {"file_id":"f1","name":"a.txt","type":"file","size":12,"content_hash":"AB"}],
                    "next_marker":"m2"})");
            }
            return respond(200, R"({"items":[{"file_id":"f2","name":"b.txt","type":"file","size":7}],
                "next_marker":""})");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}}), transport);
        auto result = driver.list("root");
        ASSERT_TRUE(result.success, "list: " + result.error.describe());
        ASSERT_EQ(result.entries.size(), 3u, "both pages");
        ASSERT_TRUE(result.entries[0].is_directory, "folder");
        ASSERT_EQ(result.entries[1].size, 12u, "size");
        ASSERT_EQ(result.entries[1].checksum, "AB", "content hash");
        ASSERT_EQ(result.entries[2].id, "f2", "second page");
        ASSERT_EQ(json::parse(transport->requests()[1].body).value("marker", ""), "m2", "marker sent");
        PASS();
    }

    {
        TEST(remove_uses_trash_or_delete);
        auto transport = std::make_shared<FakeTransport>(
            [](const net::HttpRequest&) { return respond(200, R"({"file_id":"f1"})"); });
        RemoteFileHandle file;
        file.id = "f1";

        drivers::OpenDriveDriver deleting(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}}), transport);
        ASSERT_TRUE(deleting.remove(file).success, "delete");
        drivers::OpenDriveDriver trashing(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}, {"remove_way", "trash"}}),
            transport);
        ASSERT_TRUE(trashing.remove(file).success, "trash");

        auto calls = transport->requests();
        ASSERT_TRUE(contains(calls[0].url, "/openFile/delete"), "delete endpoint");
        ASSERT_TRUE(contains(calls[1].url, "/recyclebin/trash"), "trash endpoint");
        PASS();
    }

    {
        TEST(mkdir_creates_folder);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest&) {
            return respond(200, R"({"file_id":"dir-1","file_name":"photos","parent_file_id":"root","type":"folder"})");
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}}), transport);
        auto result = driver.mkdir("root", "photos");
        ASSERT_TRUE(result.success, "mkdir");
        ASSERT_EQ(result.handle.id, "dir-1", "id");
        ASSERT_EQ(result.handle.name, "photos", "name");
        ASSERT_TRUE(result.handle.is_directory, "directory");
        auto body = json::parse(transport->requests()[0].body);
        ASSERT_EQ(body.value("type", ""), "folder", "folder type");
        ASSERT_EQ(body.value("check_name_mode", ""), "refuse", "no rename");
        PASS();
    }

    {
        TEST(download_through_presigned_url);
        auto data = pattern(3000, 5);
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (contains(req.url, "/openFile/getDownloadUrl")) {
                return respond(200, R"({"url":"https://cdn.test/f1?sig=x"})");
            }
            if (contains(req.url, "cdn.test")) return serve_range(data, req);
            return respond(500);
        });
        drivers::OpenDriveDriver driver(
            opendrive_config({{"access_token", "at"}, {"drive_id", "d1"}}), transport);

        RemoteFileHandle file;
        file.id = "f1";
        file.size = data.size();
        auto result = driver.download(file, ByteRange{100, 1099});
        ASSERT_TRUE(result.success, "download: " + result.error.describe());
        std::string bytes = drain(*result.stream);
        ASSERT_TRUE(result.stream->failure().ok(), "stream ok");
        ASSERT_EQ(bytes.size(), 1000u, "range length");
        ASSERT_TRUE(bytes == as_string(data).substr(100, 1000), "range bytes");

        auto calls = transport->requests();
        ASSERT_TRUE(!calls.back().headers.has("Authorization"), "cdn fetch unsigned");
        ASSERT_TRUE(calls.back().byte_range && calls.back().byte_range->first == 100, "range sent");

        auto link = driver.direct_link(file);
        ASSERT_EQ(link.value_or(""), "https://cdn.test/f1?sig=x", "direct link");

        RemoteFileHandle dir;
        dir.id = "d1";
        dir.is_directory = true;
        ASSERT_TRUE(driver.download(dir).error.kind == ErrorKind::Precondition, "directory refused");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// session189
// ---------------------------------------------------------------------------

static void test_session189() {
    std::cout << "\n--- session189 ---" << std::endl;

    {
        TEST(slice_md5_rules);
        ASSERT_EQ(drivers::Session189Driver::slice_md5({"abc"}, "def"), "DEF", "single part");
        std::string expected = crypto::digest_hex(crypto::DigestAlgorithm::Md5,
                                                  std::string_view("AAA\nBBB"), true);
        ASSERT_EQ(drivers::Session189Driver::slice_md5({"aaa", "bbb"}, "x"), expected,
                  "joined uppercase digests");
        PASS();
    }

    {
        TEST(parse_error_shapes);
        auto err = drivers::Session189Driver::parse_error(
            respond(200, R"({"res_code":"FileNotFound","res_message":"no such file"})"));
        ASSERT_TRUE(err && err->code == "FileNotFound" && err->message == "no such file", "res_code");
        err = drivers::Session189Driver::parse_error(
            respond(400, R"({"errorCode":"InvalidArgument","errorMsg":"bad"})"));
        ASSERT_TRUE(err && err->code == "InvalidArgument", "errorCode");
        ASSERT_TRUE(!drivers::Session189Driver::parse_error(respond(200, R"({"res_code":0})")),
                    "success code");
        ASSERT_TRUE(!drivers::Session189Driver::parse_error(respond(200, R"({"code":"SUCCESS"})")),
                    "SUCCESS");
        PASS();
    }

    {
        TEST(list_primes_session_and_signs);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& req) {
            if (contains(req.url, "getSessionForPC")) {
                return respond(200, std::string(R"({"sessionKey":"sk-1","sessionSecret":")") + kSecret + "\"}");
            }
            return respond(200, R"({"res_code":0,"fileListAO":{"count":2,
                "folderList":[{"id":"10","name":"docs"}],
                "fileList":[{"id":"20","name":"a.txt","size":5,"md5":"5D41402ABC4B2A76B9719D911017C592"}]}})");
        });
        drivers::Session189Driver driver(session189_config(), transport);
        auto result = driver.list("");
        ASSERT_TRUE(result.success, "list: " + result.error.describe());
        ASSERT_EQ(result.entries.size(), 2u, "entries");
        ASSERT_TRUE(result.entries[0].is_directory, "folder first");
        ASSERT_EQ(result.entries[0].parent_id, "-11", "parent defaults to root");
        ASSERT_EQ(result.entries[1].size, 5u, "file size");

        auto calls = transport->requests();
        ASSERT_EQ(calls.size(), 2u, "session + list");
        ASSERT_EQ(query_value(calls[0].url, "accessToken"), "long-lived", "long-lived token used");
        ASSERT_EQ(calls[1].headers.get("SessionKey").value_or(""), "sk-1", "session key header");
        ASSERT_TRUE(calls[1].headers.has("Signature"), "signed");
        ASSERT_EQ(query_value(calls[1].url, "folderId"), "-11", "api params in clear");
        ASSERT_EQ(query_value(calls[1].url, "clientType"), "TELEPC", "client suffix");
        PASS();
    }

    {
        TEST(expired_session_renewed_and_retried);
        int sessions = 0;
        int lists = 0;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (contains(req.url, "getSessionForPC")) {
                ++sessions;
                return respond(200, R"({"sessionKey":"sk-)" + std::to_string(sessions) +
                                        R"(","sessionSecret":")" + kSecret + "\"}");
            }
            if (++lists == 1) {
                return respond(200, R"({"res_code":"InvalidSessionKey","res_message":"session expired"})");
            }
            return respond(200, R"({"res_code":0,"fileListAO":{"count":0}})");
        });
        drivers::Session189Driver driver(session189_config(), transport);
        auto result = driver.list("-11");
        ASSERT_TRUE(result.success, "list: " + result.error.describe());
        ASSERT_EQ(sessions, 2, "primed then renewed");
        ASSERT_EQ(lists, 2, "list retried");
        ASSERT_EQ(transport->requests().back().headers.get("SessionKey").value_or(""), "sk-2",
                  "retry uses new session");
        PASS();
    }

    {
        TEST(multipart_upload_flow);
        auto data = pattern(3000, 9);
        std::string part_body;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            std::string path = path_of(req.url);
            if (contains(req.url, "getSessionForPC")) {
                return respond(200, std::string(R"({"sessionKey":"sk-1","sessionSecret":")") + kSecret + "\"}");
            }
            if (path == "/person/initMultiUpload") {
                return respond(200, R"({"code":"SUCCESS","data":{"uploadFileId":"up-1"}})");
            }
            if (path == "/person/getMultiUploadUrls") {
                return respond(200, R"({"code":"SUCCESS","uploadUrls":{"partNumber_1":{
                    "requestURL":"https://store.test/part1",
                    "requestHeader":"x-amz-meta-id=7&Content-Type=application/octet-stream"}}})");
            }
            if (contains(req.url, "store.test")) {
                part_body = body_of(req);
                return respond(200);
            }
            if (path == "/person/commitMultiUploadFile") {
                json reply = {{"code", "SUCCESS"},
                              {"file", {{"userFileId", "uf-1"}, {"fileName", "a.bin"},
                                        {"fileSize", 3000}, {"fileMd5", md5_upper(data)}}}};
                return respond(200, reply.dump());
            }
            return respond(500, "unexpected " + req.url);
        });
        drivers::Session189Driver driver(session189_config(), transport);

        MemorySource source(data);
        auto result = driver.upload("", "a.bin", data.size(), source);
        ASSERT_TRUE(result.success, "upload: " + result.error.describe());
        ASSERT_EQ(result.handle.id, "uf-1", "file id");
        ASSERT_EQ(result.chunk_calls, 1u, "one slice");
        ASSERT_TRUE(part_body == as_string(data), "slice bytes");

        std::string init_url, urls_url, commit_url;
        net::HttpHeaders part_headers;
        for (const auto& call : transport->requests()) {
            std::string path = path_of(call.url);
            if (path == "/person/initMultiUpload") init_url = call.url;
            if (path == "/person/getMultiUploadUrls") urls_url = call.url;
            if (path == "/person/commitMultiUploadFile") commit_url = call.url;
            if (contains(call.url, "store.test")) part_headers = call.headers;
        }
        ASSERT_EQ(query_value(init_url, "clientType"), "TELEPC", "suffix in clear");
        ASSERT_EQ(query_value(init_url, "parentFolderId"), "", "params not in clear");

        std::string init = decrypted_params(init_url);
        ASSERT_TRUE(contains(init, "parentFolderId=-11"), "parent: " + init);
        ASSERT_TRUE(contains(init, "fileSize=3000"), "size: " + init);
        ASSERT_TRUE(contains(init, "fileName=a.bin"), "name: " + init);

        crypto::Digest md5(crypto::DigestAlgorithm::Md5);
        md5.update(std::span<const uint8_t>(data));
        std::string part_info = "partInfo=1-" + net::base64_encode(md5.finish());
        ASSERT_TRUE(contains(decrypted_params(urls_url), part_info), "part md5 sent");

        std::string commit = decrypted_params(commit_url);
        ASSERT_TRUE(contains(commit, "fileMd5=" + md5_upper(data)), "file md5: " + commit);
        ASSERT_TRUE(contains(commit, "sliceMd5=" + md5_upper(data)), "single slice md5");
        ASSERT_EQ(part_headers.get("x-amz-meta-id").value_or(""), "7", "part headers applied");
        PASS();
    }

    {
        TEST(remove_polls_batch_task);
        int polls = 0;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (contains(req.url, "getSessionForPC")) {
                return respond(200, std::string(R"({"sessionKey":"sk-1","sessionSecret":")") + kSecret + "\"}");
            }
            if (contains(req.url, "createBatchTask")) return respond(200, R"({"res_code":0,"taskId":"t-1"})");
            if (contains(req.url, "checkBatchTask")) {
                return respond(200, ++polls < 3 ? R"({"res_code":0,"taskStatus":3})"
                                                : R"({"res_code":0,"taskStatus":4})");
            }
            return respond(500);
        });
        drivers::Session189Driver driver(session189_config(), transport);
        RemoteFileHandle file;
        file.id = "20";
        file.name = "a.txt";
        auto result = driver.remove(file);
        ASSERT_TRUE(result.success, "remove: " + result.error.describe());
        ASSERT_EQ(polls, 3, "polled until done");

        std::string infos;
        for (const auto& call : transport->requests()) {
            if (contains(call.url, "createBatchTask")) infos = query_value(call.url, "taskInfos");
        }
        auto parsed = json::parse(infos);
        ASSERT_EQ(parsed[0].value("fileId", ""), "20", "task info");
        ASSERT_EQ(parsed[0].value("isFolder", -1), 0, "file flag");
        PASS();
    }

    {
        TEST(batch_task_conflict_and_timeout);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& req) {
            if (contains(req.url, "getSessionForPC")) {
                return respond(200, std::string(R"({"sessionKey":"sk-1","sessionSecret":")") + kSecret + "\"}");
            }
            if (contains(req.url, "createBatchTask")) return respond(200, R"({"res_code":0,"taskId":"t-2"})");
            return respond(200, R"({"res_code":0,"taskStatus":2})");
        });
        drivers::Session189Driver driver(session189_config(), transport);
        RemoteFileHandle file;
        file.id = "20";
        auto conflict = driver.remove(file);
        ASSERT_TRUE(!conflict.success && conflict.error.code == "2", "conflict reported");

        transport->set_handler([](const net::HttpRequest& req) {
            if (contains(req.url, "createBatchTask")) return respond(200, R"({"res_code":0,"taskId":"t-3"})");
            return respond(200, R"({"res_code":0,"taskStatus":1})");
        });
        drivers::Session189Driver limited(
            session189_config({{"batch_poll_limit", "3"}, {"session_key", "sk-1"},
                               {"session_secret", kSecret}}),
            transport);
        transport->clear();
        auto stuck = limited.remove(file);
        ASSERT_TRUE(!stuck.success, "gave up");
        ASSERT_EQ(transport->count_matching("checkBatchTask"), 3u, "poll limit honoured");
        PASS();
    }

    {
        TEST(mkdir_and_download_link);
        auto data = pattern(1500, 2);
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (contains(req.url, "getSessionForPC")) {
                return respond(200, std::string(R"({"sessionKey":"sk-1","sessionSecret":")") + kSecret + "\"}");
            }
            if (contains(req.url, "createFolder")) {
                return respond(200, R"({"res_code":0,"id":"30","name":"new","parentId":"-11"})");
            }
            if (contains(req.url, "getFileDownloadUrl")) {
                return respond(200, R"({"res_code":0,"fileDownloadUrl":"http://dl.test/file?a=1&amp;b=2"})");
            }
            if (contains(req.url, "dl.test")) {
                return respond(302, "", {{"Location", "https://node.test/blob"}});
            }
            if (contains(req.url, "node.test")) return serve_range(data, req);
            return respond(500);
        });
        drivers::Session189Driver driver(session189_config(), transport);

        auto made = driver.mkdir("", "new");
        ASSERT_TRUE(made.success, "mkdir: " + made.error.describe());
        ASSERT_EQ(made.handle.id, "30", "folder id");
        ASSERT_TRUE(made.handle.is_directory, "directory");

        RemoteFileHandle file;
        file.id = "20";
        file.size = data.size();
        auto download = driver.download(file);
        ASSERT_TRUE(download.success, "download: " + download.error.describe());
        ASSERT_TRUE(drain(*download.stream) == as_string(data), "bytes");

        bool saw_rewritten = false;
        for (const auto& call : transport->requests()) {
            if (call.url == "https://dl.test/file?a=1&b=2") {
                saw_rewritten = true;
                ASSERT_TRUE(!call.follow_redirects, "redirect captured, not followed");
            }
        }
        ASSERT_TRUE(saw_rewritten, "link unescaped and upgraded to https");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// s3
// ---------------------------------------------------------------------------

static void test_s3() {
    std::cout << "\n--- s3 ---" << std::endl;

    {
        TEST(urls_and_keys);
        auto transport = std::make_shared<FakeTransport>();
        drivers::S3Driver path_style(s3_config(), transport);
        ASSERT_EQ(path_style.object_url("dir/a b.txt"), "http://minio.test:9000/media/dir/a%20b.txt",
                  "path style, encoded segment");

        drivers::S3Driver virtual_host(
            drivers::S3Driver::Config::from_params(
                {{"bucket", "media"}, {"region", "eu-west-1"}, {"access_key_id", "AK"},
                 {"secret_access_key", "SK"}}),
            transport);
        ASSERT_EQ(virtual_host.bucket_url(), "https://media.s3.eu-west-1.amazonaws.com",
                  "virtual host");
        ASSERT_EQ(drivers::S3Driver::join_key("a/", "b"), "a/b", "join with separator");
        ASSERT_EQ(drivers::S3Driver::join_key("a", "b"), "a/b", "join adds separator");
        ASSERT_EQ(drivers::S3Driver::join_key("", "b"), "b", "bucket root");
        PASS();
    }

    {
        TEST(small_file_single_put);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest&) {
            return respond(200, "", {{"ETag", "\"5d41402abc4b2a76b9719d911017c592\""}});
        });
        drivers::S3Driver driver(s3_config(), transport);
        MemorySource source(std::string("hello"));
        auto result = driver.upload("docs/", "hello.txt", 5, source);
        ASSERT_TRUE(result.success, "upload: " + result.error.describe());
        ASSERT_EQ(result.handle.id, "docs/hello.txt", "key");
        ASSERT_EQ(result.handle.checksum, "5d41402abc4b2a76b9719d911017c592", "etag unquoted");

        auto calls = transport->requests();
        ASSERT_EQ(calls.size(), 1u, "one request");
        ASSERT_TRUE(calls[0].method == net::HttpMethod::PUT, "PUT");
        ASSERT_EQ(calls[0].url, "http://minio.test:9000/media/docs/hello.txt", "object url");
        ASSERT_EQ(calls[0].body, "hello", "body");
        ASSERT_TRUE(contains(calls[0].headers.get("Authorization").value_or(""), "AWS4-HMAC-SHA256"),
                    "signed");
        PASS();
    }

    {
        TEST(large_file_multipart);
        const size_t size = 11 * 1024 * 1024;
        auto data = pattern(size, 4);
        std::string complete_xml;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (req.method == net::HttpMethod::POST && contains(req.url, "?uploads")) {
                return respond(200, "<InitiateMultipartUploadResult><UploadId>mp-1</UploadId>"
                                    "</InitiateMultipartUploadResult>");
            }
            if (req.method == net::HttpMethod::PUT && contains(req.url, "partNumber=")) {
                return respond(200, "", {{"ETag", "etag-" + query_value(req.url, "partNumber")}});
            }
            if (req.method == net::HttpMethod::POST && contains(req.url, "uploadId=mp-1")) {
                complete_xml = body_of(req);
                return respond(200, "<CompleteMultipartUploadResult><ETag>&quot;final-3&quot;</ETag>"
                                    "</CompleteMultipartUploadResult>");
            }
            return respond(500, "unexpected " + req.url);
        });
        drivers::S3Driver driver(s3_config({{"chunk_size_mb", "5"}}), transport);
        MemorySource source(data);
        auto result = driver.upload("", "big.bin", size, source);
        ASSERT_TRUE(result.success, "upload: " + result.error.describe());
        ASSERT_EQ(result.chunk_calls, 3u, "5 + 5 + 1 MiB");
        ASSERT_EQ(result.handle.checksum, "final-3", "final etag");
        ASSERT_EQ(transport->count_matching("partNumber="), 3u, "three part PUTs");

        size_t p1 = complete_xml.find("<PartNumber>1</PartNumber>");
        size_t p2 = complete_xml.find("<PartNumber>2</PartNumber>");
        size_t p3 = complete_xml.find("<PartNumber>3</PartNumber>");
        ASSERT_TRUE(p1 != std::string::npos && p1 < p2 && p2 < p3 && p3 != std::string::npos,
                    "parts ascending");
        ASSERT_TRUE(contains(complete_xml, "<ETag>&quot;etag-2&quot;</ETag>"), "quoted etags");
        PASS();
    }

    {
        TEST(complete_error_inside_200);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& req) {
            if (contains(req.url, "?uploads")) {
                return respond(200, "<InitiateMultipartUploadResult><UploadId>mp-2</UploadId>"
                                    "</InitiateMultipartUploadResult>");
            }
            if (contains(req.url, "partNumber=")) return respond(200, "", {{"ETag", "e"}});
            return respond(200, "<Error><Code>InternalError</Code><Message>try again</Message></Error>");
        });
        drivers::S3Driver driver(s3_config({{"chunk_size_mb", "5"}}), transport);
        MemorySource source(pattern(6 * 1024 * 1024));
        auto result = driver.upload("", "x.bin", 6 * 1024 * 1024, source);
        ASSERT_TRUE(!result.success, "commit refused");
        ASSERT_EQ(result.error.code, "InternalError", "code");
        PASS();
    }

    {
        TEST(list_prefixes_and_objects);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& req) {
            if (query_value(req.url, "continuation-token").empty()) {
                return respond(200,
                    "<ListBucketResult><IsTruncated>true</IsTruncated>"
                    "<NextContinuationToken>tok2</NextContinuationToken>"
                    "<Contents><Key>docs/</Key><Size>0</Size></Contents>"
                    "<Contents><Key>docs/a&amp;b.txt</Key><Size>42</Size><ETag>&quot;e1&quot;</ETag></Contents>"
                    "<CommonPrefixes><Prefix>docs/sub/</Prefix></CommonPrefixes>"
                    "</ListBucketResult>");
            }
            return respond(200,
                "<ListBucketResult><IsTruncated>false</IsTruncated>"
                "<Contents><Key>docs/z.txt</Key><Size>1</Size></Contents></ListBucketResult>");
        });
        drivers::S3Driver driver(s3_config(), transport);
        auto result = driver.list("docs");
        ASSERT_TRUE(result.success, "list: " + result.error.describe());
        ASSERT_EQ(result.entries.size(), 3u, "marker skipped");
        ASSERT_TRUE(result.entries[0].is_directory && result.entries[0].name == "sub", "prefix");
        ASSERT_EQ(result.entries[1].name, "a&b.txt", "unescaped key");
        ASSERT_EQ(result.entries[1].size, 42u, "size");
        ASSERT_EQ(result.entries[1].checksum, "e1", "etag");
        ASSERT_EQ(result.entries[2].id, "docs/z.txt", "second page");
        ASSERT_EQ(query_value(transport->requests()[0].url, "prefix"), "docs/", "prefix param");
        PASS();
    }

    {
        TEST(mkdir_remove_download);
        auto data = pattern(2500, 8);
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& req) {
            if (req.method == net::HttpMethod::GET) return serve_range(data, req);
            return respond(req.method == net::HttpMethod::DELETE ? 204 : 200);
        });
        drivers::S3Driver driver(s3_config(), transport);

        auto made = driver.mkdir("docs/", "new");
        ASSERT_TRUE(made.success, "mkdir");
        ASSERT_EQ(made.handle.id, "docs/new/", "marker key");

        RemoteFileHandle dir;
        dir.id = "docs/new";
        dir.is_directory = true;
        ASSERT_TRUE(driver.remove(dir).success, "remove");

        RemoteFileHandle file;
        file.id = "docs/blob.bin";
        file.size = data.size();
        auto download = driver.download(file);
        ASSERT_TRUE(download.success, "download");
        ASSERT_TRUE(drain(*download.stream) == as_string(data), "bytes");

        auto calls = transport->requests();
        ASSERT_EQ(calls[0].url, "http://minio.test:9000/media/docs/new/", "mkdir url");
        ASSERT_TRUE(calls[1].method == net::HttpMethod::DELETE, "delete");
        ASSERT_EQ(calls[1].url, "http://minio.test:9000/media/docs/new/", "directory key");
        ASSERT_TRUE(calls[2].headers.has("Authorization"), "download signed");
        ASSERT_TRUE(!driver.direct_link(file).has_value(), "no direct link");
        PASS();
    }

    {
        TEST(expired_session_token_is_not_refreshable);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest&) {
            return respond(400, "<Error><Code>ExpiredToken</Code><Message>expired</Message></Error>");
        });
        drivers::S3Driver driver(s3_config({{"session_token", "sts"}}), transport);
        auto result = driver.list("");
        ASSERT_TRUE(!result.success, "list refused");
        ASSERT_TRUE(result.error.kind == ErrorKind::AuthRefreshFailed, "no refresher");
        ASSERT_EQ(transport->count(), 1u, "not retried");
        PASS();
    }
}

int main() {
    std::cout << "cloudmux driver tests" << std::endl;
    std::cout << "=====================" << std::endl;

    test_opendrive_session();
    test_opendrive_upload();
    test_opendrive_files();
    test_session189();
    test_s3();

    return report("Results");
}
