#pragma once

// Shared harness for the cloudmux test executables: the TEST/PASS/FAIL
// macros and a scripted HttpTransport.

#include "cloudmux/credential_session.hpp"
#include "cloudmux/net/http.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), std::string(msg) + ": " + (s))

inline int report(const char* suite) {
    std::cout << "\n===================" << std::endl;
    std::cout << suite << ": " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;
    return tests_failed > 0 ? 1 : 0;
}

namespace cloudmux::testing {

inline net::HttpResponse respond(int status, const std::string& body = {},
                                 std::vector<std::pair<std::string, std::string>> headers = {}) {
    net::HttpResponse response;
    response.status_code = status;
    response.body.assign(body.begin(), body.end());
    for (const auto& [name, value] : headers) response.headers.set(name, value);
    return response;
}

inline net::HttpResponse network_failure(const std::string& message) {
    net::HttpResponse response;
    response.is_network_error = true;
    response.error = message;
    return response;
}

inline std::string body_of(const net::HttpRequest& request) {
    auto payload = request.payload();
    return std::string(payload.begin(), payload.end());
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// Scripted transport. Every request is recorded with its body copied,
/// then answered by the handler.
class FakeTransport : public net::HttpTransport {
public:
    using Handler = std::function<net::HttpResponse(const net::HttpRequest&)>;

    struct Recorded {
        net::HttpMethod method;
        std::string url;
        net::HttpHeaders headers;
        std::string body;
        std::optional<std::pair<uint64_t, uint64_t>> byte_range;
        bool follow_redirects = true;
    };

    explicit FakeTransport(Handler handler = {}) : handler_(std::move(handler)) {}

    void set_handler(Handler handler) {
        std::lock_guard lock(mutex_);
        handler_ = std::move(handler);
    }

    net::HttpResponse execute(const net::HttpRequest& request) override {
        Handler handler;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(Recorded{request.method, request.url, request.headers,
                                         body_of(request), request.byte_range,
                                         request.follow_redirects});
            handler = handler_;
        }
        if (!handler) return respond(500, "no handler");
        return handler(request);
    }

    net::HttpResponse stream(const net::HttpRequest& request, const net::BodySink& sink) override {
        auto response = execute(request);
        if (response.ok() && !response.body.empty()) {
            if (!sink(response.body.data(), response.body.size())) {
                response.is_network_error = true;
                response.error = "sink aborted";
            }
            response.body.clear();
        }
        return response;
    }

    std::vector<Recorded> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    size_t count() const {
        std::lock_guard lock(mutex_);
        return requests_.size();
    }

    /// Number of recorded requests whose URL contains `fragment`.
    size_t count_matching(const std::string& fragment) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.url.find(fragment) != std::string::npos) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        requests_.clear();
    }

private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<Recorded> requests_;
};

/// Refresher that hands out "token-N" and counts its invocations.
class CountingRefresher : public TokenRefresher {
public:
    explicit CountingRefresher(std::chrono::milliseconds delay = std::chrono::milliseconds(0),
                               bool fail = false)
        : delay_(delay), fail_(fail) {}

    std::string name() const override { return "counting"; }

    RefreshOutcome refresh(const TokenSet& current) override {
        int n = ++calls_;
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        RefreshOutcome out;
        if (fail_) {
            out.error = TransferError::make(ErrorKind::AuthRefreshFailed, "refresh token revoked",
                                            "4126");
            return out;
        }
        out.tokens.access_token = "token-" + std::to_string(n);
        out.tokens.refresh_token = current.refresh_token;
        out.success = true;
        return out;
    }

    int calls() const { return calls_.load(); }

private:
    std::chrono::milliseconds delay_;
    bool fail_;
    std::atomic<int> calls_{0};
};

}  // namespace cloudmux::testing
