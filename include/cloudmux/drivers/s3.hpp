#pragma once

#include "cloudmux/driver.hpp"
#include "cloudmux/signing.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudmux::drivers {

/// S3-compatible object store with static SigV4 keys. Objects are
/// addressed by key; "directories" are key prefixes ending in '/'.
/// Files that fit in one chunk go up in a single PUT, larger ones as a
/// multipart upload. No rapid upload.
class S3Driver : public Driver {
public:
    static constexpr const char* kType = "s3";
    static constexpr uint64_t kMinPartSize = 5 * 1024 * 1024;

    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;  // default https://s3.<region>.amazonaws.com
        bool path_style = false;
        std::string access_key_id;
        std::string secret_access_key;
        std::string session_token;
        std::string root_prefix;  // "" = bucket root
        bool proxy_required = false;
        uint64_t chunk_size = 10 * 1024 * 1024;

        std::string validate() const;
        static Config from_params(const DriverParams& params);
    };

    S3Driver(Config config, std::shared_ptr<net::HttpTransport> transport);

    std::string type_name() const override { return kType; }

    UploadResult upload(const std::string& parent_id, const std::string& name, uint64_t size,
                        ByteSource& source, const UploadOptions& options = {}) override;
    DownloadResult download(const RemoteFileHandle& file,
                            std::optional<ByteRange> range = std::nullopt) override;
    ListResult list(const std::string& dir_id) override;
    OperationResult remove(const RemoteFileHandle& file) override;
    OperationResult mkdir(const std::string& parent_id, const std::string& name) override;

    std::string root_id() const override { return config_.root_prefix; }
    TransferEngine& engine() override { return *engine_; }

    /// Object URL for a key; the key is percent-encoded per segment.
    std::string object_url(const std::string& key) const;
    std::string bucket_url() const;

    /// "dir/" + name, with the separator added when missing.
    static std::string join_key(const std::string& prefix, const std::string& name);

    /// <Error><Code/><Message/></Error> bodies.
    static std::optional<TransferError> parse_error(const net::HttpResponse& response);

private:
    friend class S3Protocol;

    ExecuteResult send(net::HttpRequest request);

    Config config_;
    std::shared_ptr<const SigV4Signer> signer_;
    std::unique_ptr<TransferEngine> engine_;
};

}  // namespace cloudmux::drivers
