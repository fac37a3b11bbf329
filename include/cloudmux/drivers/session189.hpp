#pragma once

#include "cloudmux/driver.hpp"
#include "cloudmux/json_body.hpp"
#include "cloudmux/signing.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cloudmux::drivers {

/// Session-key drive: every call is HMAC-SHA1 signed with the session
/// secret, upload calls additionally carry their parameters AES-encrypted.
/// The long-lived access token buys new session keys when they expire.
class Session189Driver : public Driver {
public:
    static constexpr const char* kType = "session189";
    static constexpr const char* kDefaultApiUrl = "https://api.cloud.189.cn";
    static constexpr const char* kDefaultUploadUrl = "https://upload.cloud.189.cn";
    static constexpr const char* kAppId = "8025431004";

    using Params = std::vector<std::pair<std::string, std::string>>;

    struct Config {
        std::string api_url = kDefaultApiUrl;
        std::string upload_url = kDefaultUploadUrl;
        std::string access_token;  // long-lived, exchanged for session keys
        std::string session_key;
        std::string session_secret;
        std::string root_id = "-11";
        bool proxy_required = false;
        uint64_t chunk_size = 0;  // 0 = size-tiered slices
        std::chrono::milliseconds batch_poll_interval{400};
        int batch_poll_limit = 50;

        std::string validate() const;
        static Config from_params(const DriverParams& params);
    };

    Session189Driver(Config config, std::shared_ptr<net::HttpTransport> transport);

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

    /// clientType, version, channelId and rand, sent with every call.
    static Params client_suffix();

    /// res_code / code / errorCode / error, whichever the endpoint uses.
    static std::optional<TransferError> parse_error(const net::HttpResponse& response);

    /// MD5 over the uppercase part digests joined by '\n'; a single part
    /// uses the whole-file digest.
    static std::string slice_md5(const std::vector<std::string>& part_md5s,
                                 const std::string& file_md5);

    static RemoteFileHandle parse_file(const json& item, const std::string& parent_id);
    static RemoteFileHandle parse_folder(const json& item, const std::string& parent_id);

private:
    friend class Session189Protocol;

    /// Signed call. Upload endpoints go through the parameter-encrypting signer.
    std::optional<json> call(net::HttpMethod method, const std::string& url, const Params& params,
                             bool upload_endpoint, TransferError& error);
    TransferError ensure_session();
    std::optional<std::string> download_url(const std::string& file_id, TransferError& error);
    TransferError wait_batch_task(const std::string& type, const std::string& task_id);

    Config config_;
    std::shared_ptr<net::HttpTransport> transport_;
    std::shared_ptr<const SessionHmacSigner> api_signer_;
    std::shared_ptr<const SessionHmacSigner> upload_signer_;
    std::unique_ptr<TransferEngine> engine_;
};

}  // namespace cloudmux::drivers
