#pragma once

#include "cloudmux/transfer_engine.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace cloudmux {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer engine counters to a Prometheus textfile for
/// node_exporter pickup.
///
/// Counters are pulled from TransferEngine::stats() and advanced by the
/// delta since the previous snapshot. A background writer thread
/// serializes the registry to a .prom file using atomic temp+rename.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Engine to snapshot (not owned).
    void set_engine(const TransferEngine* engine) { engine_ = engine; }

    void start();

    /// Stop the writer thread (writes one final snapshot).
    void stop();

    /// Pull engine counters now.
    void update_counters();
    bool write_file();

    prometheus::Histogram& upload_duration() { return *upload_duration_; }

    /// Current value of one counter series, for inspection.
    double uploads(bool success) const;
    double errors(ErrorKind kind) const;

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    const TransferEngine* engine_ = nullptr;
    EngineStats prev_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* rapid_uploads_;
    prometheus::Counter* chunk_calls_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* download_bytes_;
    prometheus::Counter* refreshes_;
    prometheus::Counter* auth_retries_;
    std::array<prometheus::Counter*, 9> errors_{};

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;

    // Writer thread
    std::mutex update_mutex_;
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace cloudmux
