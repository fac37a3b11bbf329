#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// OpenSSL types, kept out of the public header
struct evp_md_ctx_st;

namespace cloudmux::crypto {

enum class DigestAlgorithm { Sha1, Md5, Sha256 };

const char* digest_name(DigestAlgorithm algorithm);

/// Incremental message digest. Bytes can be fed in any number of slices,
/// so whole files never need to be resident.
class Digest {
public:
    explicit Digest(DigestAlgorithm algorithm);
    ~Digest();

    Digest(Digest&& other) noexcept;
    Digest& operator=(Digest&& other) noexcept;
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(std::span<const uint8_t> data) { update(data.data(), data.size()); }
    void update(std::string_view data);

    /// Finalize and return the raw digest. The object is reset afterwards.
    std::vector<uint8_t> finish();
    std::string finish_hex(bool uppercase = false);

    void reset();

    DigestAlgorithm algorithm() const { return algorithm_; }
    uint64_t bytes_hashed() const { return bytes_hashed_; }

private:
    DigestAlgorithm algorithm_;
    evp_md_ctx_st* ctx_ = nullptr;
    uint64_t bytes_hashed_ = 0;
};

std::string to_hex(const uint8_t* data, size_t size, bool uppercase = false);
inline std::string to_hex(const std::vector<uint8_t>& data, bool uppercase = false) {
    return to_hex(data.data(), data.size(), uppercase);
}

/// One-shot digest of a buffer, hex encoded.
std::string digest_hex(DigestAlgorithm algorithm, std::string_view data, bool uppercase = false);
std::string digest_hex(DigestAlgorithm algorithm, std::span<const uint8_t> data, bool uppercase = false);

// HMAC with SHA-1 or SHA-256
std::vector<uint8_t> hmac(DigestAlgorithm algorithm, std::span<const uint8_t> key,
                          std::string_view data);
std::vector<uint8_t> hmac(DigestAlgorithm algorithm, std::string_view key, std::string_view data);
std::string hmac_hex(DigestAlgorithm algorithm, std::string_view key, std::string_view data,
                     bool uppercase = false);

/// RSA-SHA256 (PKCS#1 v1.5) signature with a PEM private key.
std::optional<std::vector<uint8_t>> rsa_sign_sha256(const std::string& pem_private_key,
                                                    std::string_view data);

/// RSA PKCS#1 v1.5 public-key encryption. Input longer than one block is
/// split into (key_size - 11) byte slices, each encrypted separately and
/// concatenated. The key may be PEM or bare base64 DER (SubjectPublicKeyInfo).
std::optional<std::vector<uint8_t>> rsa_public_encrypt(const std::string& public_key,
                                                       std::span<const uint8_t> data);

/// AES-128-ECB with PKCS#7 padding. Only the first 16 bytes of key are used.
std::optional<std::vector<uint8_t>> aes128_ecb_encrypt(std::string_view key,
                                                       std::string_view plaintext);
std::optional<std::string> aes128_ecb_decrypt(std::string_view key,
                                              std::span<const uint8_t> ciphertext);

/// Base64 with the URL-safe alphabet and no padding.
std::string base64url_encode(std::span<const uint8_t> data);
std::string base64url_encode(std::string_view data);

}  // namespace cloudmux::crypto
