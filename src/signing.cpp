#include "cloudmux/signing.hpp"
#include "cloudmux/crypto.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace cloudmux {

namespace {

std::chrono::system_clock::time_point now_from(const Clock& clock) {
    return clock ? clock() : std::chrono::system_clock::now();
}

std::string format_utc(std::chrono::system_clock::time_point when, const char* format) {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, format);
    return oss.str();
}

// Random v4-style request id
std::string request_id() {
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        for (size_t i = 0; i < sizeof(bytes); ++i) {
            bytes[i] = static_cast<uint8_t>(ticks >> ((i % 8) * 8));
        }
    }
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;
    std::string hex = crypto::to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Query params are already URL-encoded in the URL; sort them and give
// valueless params the "key=" form.
std::string canonical_query_string(const std::string& query) {
    if (query.empty()) return "";

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq != std::string::npos) {
                params[param.substr(0, eq)] = param.substr(eq + 1);
            } else {
                params[param] = "";
            }
        }
        pos = amp + 1;
    }

    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += "&";
        out += key + "=" + value;
    }
    return out;
}

}  // namespace

// --- BearerSigner ---

std::string BearerSigner::sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const {
    if (snapshot.tokens.access_token.empty()) {
        return "no access token";
    }
    request.headers.set_bearer_token(snapshot.tokens.access_token);
    return {};
}

// --- SessionHmacSigner ---

SessionHmacSigner::SessionHmacSigner() : SessionHmacSigner(Options{}) {}

SessionHmacSigner::SessionHmacSigner(Options options) : options_(std::move(options)) {}

std::string SessionHmacSigner::format_date(std::chrono::system_clock::time_point when) {
    return format_utc(when, "%a, %d %b %Y %H:%M:%S GMT");
}

std::optional<std::string> SessionHmacSigner::encrypt_params(
    std::vector<std::pair<std::string, std::string>> params, const std::string& secret) {
    if (secret.size() < 16) return std::nullopt;

    std::stable_sort(params.begin(), params.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    std::string joined;
    for (const auto& [key, value] : params) {
        if (!joined.empty()) joined += "&";
        joined += key + "=" + value;
    }

    auto encrypted = crypto::aes128_ecb_encrypt(std::string_view(secret).substr(0, 16), joined);
    if (!encrypted) return std::nullopt;
    return crypto::to_hex(*encrypted, true);
}

std::string SessionHmacSigner::sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const {
    const auto& tokens = snapshot.tokens;
    if (tokens.access_token.empty() || tokens.session_secret.empty()) {
        return "no session key";
    }

    auto url = net::ParsedUrl::parse(request.url);
    if (!url) return "cannot parse URL: " + request.url;

    std::string encrypted;
    if (options_.encrypt_query && !url->query.empty()) {
        std::vector<std::pair<std::string, std::string>> secret_params;
        std::string plain;
        size_t pos = 0;
        while (pos < url->query.size()) {
            size_t amp = url->query.find('&', pos);
            if (amp == std::string::npos) amp = url->query.size();
            std::string param = url->query.substr(pos, amp - pos);
            pos = amp + 1;
            if (param.empty()) continue;

            size_t eq = param.find('=');
            std::string key = param.substr(0, eq);
            std::string value = eq == std::string::npos ? "" : param.substr(eq + 1);
            if (options_.plain_params.count(key)) {
                plain += (plain.empty() ? "" : "&") + param;
            } else if (key != "params") {
                secret_params.emplace_back(std::move(key), std::move(value));
            }
        }
        if (!secret_params.empty()) {
            auto hex = encrypt_params(std::move(secret_params), tokens.session_secret);
            if (!hex) return "session secret too short for parameter encryption";
            encrypted = *hex;
            plain += (plain.empty() ? "params=" : "&params=") + encrypted;
        }
        url->query = plain;
        request.url = url->to_string();
    }

    std::string date = format_date(now_from(options_.clock));
    std::string path = url->path.empty() ? "/" : url->path;

    std::string text = "SessionKey=" + tokens.access_token +
                       "&Operate=" + net::http_method_to_string(request.method) +
                       "&RequestURI=" + path + "&Date=" + date;
    if (!encrypted.empty()) {
        text += "&params=" + encrypted;
    }

    request.headers.set("Date", date);
    request.headers.set("SessionKey", tokens.access_token);
    request.headers.set("Signature", crypto::hmac_hex(crypto::DigestAlgorithm::Sha1,
                                                      tokens.session_secret, text, true));
    request.headers.set("X-Request-ID", request_id());
    return {};
}

// --- RsaEnvelopeSigner ---

RsaEnvelopeSigner::RsaEnvelopeSigner(std::string public_key, std::string field)
    : public_key_(std::move(public_key))
    , field_(std::move(field)) {}

std::string RsaEnvelopeSigner::sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const {
    auto plain = request.payload();
    auto encrypted = crypto::rsa_public_encrypt(public_key_, plain);
    if (!encrypted) return "RSA envelope encryption failed";

    request.set_form_body({{field_, net::base64_encode(*encrypted)}});
    if (!snapshot.tokens.access_token.empty()) {
        request.headers.set_bearer_token(snapshot.tokens.access_token);
    }
    return {};
}

// --- SigV4Signer ---

SigV4Signer::SigV4Signer(std::string access_key_id, std::string secret_access_key,
                         std::string region, std::string service, Clock clock)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service))
    , clock_(std::move(clock)) {}

std::string SigV4Signer::canonical_request(const net::HttpRequest& request,
                                           const std::string& signed_headers,
                                           const std::string& payload_hash) const {
    auto url = net::ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;
    oss << net::http_method_to_string(request.method) << "\n";
    oss << (url->path.empty() ? "/" : url->path) << "\n";
    oss << canonical_query_string(url->query) << "\n";

    std::map<std::string, std::string> sorted_headers;
    for (const auto& [name, value] : request.headers.all()) {
        sorted_headers[to_lower(name)] = value;
    }
    for (const auto& [name, value] : sorted_headers) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";
    oss << signed_headers << "\n";
    oss << payload_hash;
    return oss.str();
}

std::string SigV4Signer::string_to_sign(const std::string& datetime, const std::string& date,
                                        const std::string& canonical) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << crypto::digest_hex(crypto::DigestAlgorithm::Sha256, canonical);
    return oss.str();
}

std::string SigV4Signer::signature(const std::string& date, const std::string& string_to_sign) const {
    using crypto::DigestAlgorithm;
    auto k_date = crypto::hmac(DigestAlgorithm::Sha256, "AWS4" + secret_access_key_, date);
    auto k_region = crypto::hmac(DigestAlgorithm::Sha256, k_date, region_);
    auto k_service = crypto::hmac(DigestAlgorithm::Sha256, k_region, service_);
    auto k_signing = crypto::hmac(DigestAlgorithm::Sha256, k_service, "aws4_request");
    return crypto::to_hex(crypto::hmac(DigestAlgorithm::Sha256, k_signing, string_to_sign));
}

std::string SigV4Signer::sign(net::HttpRequest& request, const TokenSnapshot& snapshot) const {
    if (access_key_id_.empty() || secret_access_key_.empty()) {
        return "missing access key";
    }
    auto url = net::ParsedUrl::parse(request.url);
    if (!url) return "cannot parse URL: " + request.url;

    auto now = now_from(clock_);
    std::string datetime = format_utc(now, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(now, "%Y%m%d");

    std::string host = url->host;
    if (url->port != 0) host += ":" + std::to_string(url->port);
    request.headers.set("Host", host);
    request.headers.set("X-Amz-Date", datetime);
    if (!snapshot.tokens.access_token.empty()) {
        request.headers.set("X-Amz-Security-Token", snapshot.tokens.access_token);
    }

    // Reuse a pre-set payload hash (e.g. UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash = request.headers.get("X-Amz-Content-Sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = crypto::digest_hex(crypto::DigestAlgorithm::Sha256, request.payload());
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::set<std::string> header_names;
    for (const auto& [name, value] : request.headers.all()) {
        header_names.insert(to_lower(name));
    }
    std::string signed_headers;
    for (const auto& h : header_names) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += h;
    }

    std::string canonical = canonical_request(request, signed_headers, payload_hash);
    std::string sig = signature(date, string_to_sign(datetime, date, canonical));

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 "
         << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, "
         << "SignedHeaders=" << signed_headers << ", "
         << "Signature=" << sig;
    request.headers.set("Authorization", auth.str());
    return {};
}

}  // namespace cloudmux
