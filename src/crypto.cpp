#include "cloudmux/crypto.hpp"
#include "cloudmux/net/http.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace cloudmux::crypto {

namespace {

const EVP_MD* evp_for(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Sha1: return EVP_sha1();
        case DigestAlgorithm::Md5: return EVP_md5();
        case DigestAlgorithm::Sha256: return EVP_sha256();
    }
    return EVP_sha1();
}

// Owning wrappers for the OpenSSL objects used below
struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); }
};
struct BioDeleter {
    void operator()(BIO* p) const { BIO_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

PkeyPtr load_public_key(const std::string& key) {
    if (key.find("-----BEGIN") != std::string::npos) {
        std::unique_ptr<BIO, BioDeleter> bio(
            BIO_new_mem_buf(key.data(), static_cast<int>(key.size())));
        if (!bio) return nullptr;
        return PkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    }

    // Bare base64 DER, as handed out by several drive APIs
    auto der = net::base64_decode(key);
    if (der.empty()) return nullptr;
    const unsigned char* p = der.data();
    return PkeyPtr(d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size())));
}

}  // namespace

const char* digest_name(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Sha1: return "sha1";
        case DigestAlgorithm::Md5: return "md5";
        case DigestAlgorithm::Sha256: return "sha256";
    }
    return "sha1";
}

// --- Digest ---

Digest::Digest(DigestAlgorithm algorithm)
    : algorithm_(algorithm)
    , ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    reset();
}

Digest::~Digest() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

Digest::Digest(Digest&& other) noexcept
    : algorithm_(other.algorithm_)
    , ctx_(other.ctx_)
    , bytes_hashed_(other.bytes_hashed_) {
    other.ctx_ = nullptr;
}

Digest& Digest::operator=(Digest&& other) noexcept {
    if (this != &other) {
        if (ctx_) EVP_MD_CTX_free(ctx_);
        algorithm_ = other.algorithm_;
        ctx_ = other.ctx_;
        bytes_hashed_ = other.bytes_hashed_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Digest::reset() {
    if (EVP_DigestInit_ex(ctx_, evp_for(algorithm_), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    bytes_hashed_ = 0;
}

void Digest::update(const uint8_t* data, size_t size) {
    if (size == 0) return;
    EVP_DigestUpdate(ctx_, data, size);
    bytes_hashed_ += size;
}

void Digest::update(std::string_view data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> Digest::finish() {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, out.data(), &len);
    out.resize(len);
    reset();
    return out;
}

std::string Digest::finish_hex(bool uppercase) {
    return to_hex(finish(), uppercase);
}

std::string to_hex(const uint8_t* data, size_t size, bool uppercase) {
    const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string digest_hex(DigestAlgorithm algorithm, std::string_view data, bool uppercase) {
    Digest d(algorithm);
    d.update(data);
    return d.finish_hex(uppercase);
}

std::string digest_hex(DigestAlgorithm algorithm, std::span<const uint8_t> data, bool uppercase) {
    Digest d(algorithm);
    d.update(data);
    return d.finish_hex(uppercase);
}

// --- HMAC ---

std::vector<uint8_t> hmac(DigestAlgorithm algorithm, std::span<const uint8_t> key,
                          std::string_view data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    HMAC(evp_for(algorithm), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         out, &out_len);
    return std::vector<uint8_t>(out, out + out_len);
}

std::vector<uint8_t> hmac(DigestAlgorithm algorithm, std::string_view key, std::string_view data) {
    return hmac(algorithm,
                std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(key.data()), key.size()),
                data);
}

std::string hmac_hex(DigestAlgorithm algorithm, std::string_view key, std::string_view data,
                     bool uppercase) {
    return to_hex(hmac(algorithm, key, data), uppercase);
}

// --- RSA ---

std::optional<std::vector<uint8_t>> rsa_sign_sha256(const std::string& pem_private_key,
                                                    std::string_view data) {
    std::unique_ptr<BIO, BioDeleter> bio(
        BIO_new_mem_buf(pem_private_key.data(), static_cast<int>(pem_private_key.size())));
    if (!bio) return std::nullopt;

    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) return std::nullopt;

    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return std::nullopt;
    }
    if (EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return std::nullopt;
    }
    size_t sig_len = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) return std::nullopt;
    std::vector<uint8_t> signature(sig_len);
    if (EVP_DigestSignFinal(ctx.get(), signature.data(), &sig_len) != 1) return std::nullopt;
    signature.resize(sig_len);
    return signature;
}

std::optional<std::vector<uint8_t>> rsa_public_encrypt(const std::string& public_key,
                                                       std::span<const uint8_t> data) {
    auto pkey = load_public_key(public_key);
    if (!pkey) return std::nullopt;

    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new(pkey.get(), nullptr));
    if (!ctx) return std::nullopt;
    if (EVP_PKEY_encrypt_init(ctx.get()) != 1) return std::nullopt;
    if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1) return std::nullopt;

    const size_t key_size = static_cast<size_t>(EVP_PKEY_size(pkey.get()));
    if (key_size <= 11) return std::nullopt;
    const size_t slice = key_size - 11;

    std::vector<uint8_t> out;
    out.reserve(((data.size() + slice - 1) / slice) * key_size);
    for (size_t pos = 0; pos < data.size(); pos += slice) {
        size_t n = std::min(slice, data.size() - pos);
        size_t out_len = 0;
        if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, data.data() + pos, n) != 1) {
            return std::nullopt;
        }
        size_t offset = out.size();
        out.resize(offset + out_len);
        if (EVP_PKEY_encrypt(ctx.get(), out.data() + offset, &out_len,
                             data.data() + pos, n) != 1) {
            return std::nullopt;
        }
        out.resize(offset + out_len);
    }
    return out;
}

// --- AES ---

std::optional<std::vector<uint8_t>> aes128_ecb_encrypt(std::string_view key,
                                                       std::string_view plaintext) {
    if (key.size() < 16) return std::nullopt;

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) return std::nullopt;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr,
                           reinterpret_cast<const unsigned char*>(key.data()), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(plaintext.size() + 16);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return std::nullopt;
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) return std::nullopt;
    total += len;
    out.resize(static_cast<size_t>(total));
    return out;
}

std::optional<std::string> aes128_ecb_decrypt(std::string_view key,
                                              std::span<const uint8_t> ciphertext) {
    if (key.size() < 16) return std::nullopt;

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) return std::nullopt;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr,
                           reinterpret_cast<const unsigned char*>(key.data()), nullptr) != 1) {
        return std::nullopt;
    }

    std::string out(ciphertext.size() + 16, '\0');
    int len = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        return std::nullopt;
    }
    total = len;
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + total,
                            &len) != 1) {
        return std::nullopt;
    }
    total += len;
    out.resize(static_cast<size_t>(total));
    return out;
}

// --- base64url ---

std::string base64url_encode(std::span<const uint8_t> data) {
    std::string out = net::base64_encode(std::vector<uint8_t>(data.begin(), data.end()));
    for (auto& ch : out) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string base64url_encode(std::string_view data) {
    return base64url_encode(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

}  // namespace cloudmux::crypto
