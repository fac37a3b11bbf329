#pragma once

#include "cloudmux/driver.hpp"
#include "cloudmux/json_body.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cloudmux::drivers {

/// Bearer-token drive with the open-platform file API: SHA-1 pre-hash,
/// proof code and content-hash rapid upload, per-part presigned URLs.
class OpenDriveDriver : public Driver {
public:
    static constexpr const char* kType = "opendrive";
    static constexpr const char* kDefaultApiUrl = "https://openapi.alipan.com";

    struct Config {
        std::string api_url = kDefaultApiUrl;
        std::string client_id;
        std::string client_secret;
        std::string refresh_token;
        std::string access_token;
        std::string refresh_proxy_url;
        std::string service_account_json;
        std::string scope;
        std::string drive_id;
        std::string drive_type = "default";  // default | resource
        std::string root_id = "root";
        bool use_trash = false;
        bool proxy_required = false;
        bool dedup_enabled = true;
        uint64_t chunk_size = 10 * 1024 * 1024;

        /// Empty when usable, otherwise what is missing.
        std::string validate() const;
        static Config from_params(const DriverParams& params);
    };

    OpenDriveDriver(Config config, std::shared_ptr<net::HttpTransport> transport);

    std::string type_name() const override { return kType; }

    UploadResult upload(const std::string& parent_id, const std::string& name, uint64_t size,
                        ByteSource& source, const UploadOptions& options = {}) override;
    DownloadResult download(const RemoteFileHandle& file,
                            std::optional<ByteRange> range = std::nullopt) override;
    ListResult list(const std::string& dir_id) override;
    OperationResult remove(const RemoteFileHandle& file) override;
    OperationResult mkdir(const std::string& parent_id, const std::string& name) override;
    std::optional<std::string> direct_link(const RemoteFileHandle& file) override;

    std::string root_id() const override { return config_.root_id; }
    TransferEngine& engine() override { return *engine_; }

    /// drive_id from config, or looked up once through /user/getDriveInfo.
    std::optional<std::string> drive_id(TransferError* error = nullptr);

    /// First 8 bytes (at most) at md5(token)[0..16) mod size, base64.
    static std::optional<std::string> proof_code(
        const std::string& access_token, uint64_t size,
        const std::function<std::optional<std::vector<uint8_t>>(uint64_t, size_t)>& read_range);

    static RemoteFileHandle parse_item(const json& item);

private:
    friend class OpenDriveProtocol;

    ExecuteResult post(const std::string& path, const json& body);
    std::optional<json> call(const std::string& path, const json& body, TransferError& error);
    DedupAnswer query_rapid(const DedupQuery& query, const std::string& parent_id);
    std::optional<std::string> download_url(const std::string& file_id, TransferError& error);

    Config config_;
    std::shared_ptr<net::HttpTransport> transport_;
    std::unique_ptr<TransferEngine> engine_;

    std::mutex drive_mutex_;
    std::string drive_id_;
};

}  // namespace cloudmux::drivers
