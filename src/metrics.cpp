#include "cloudmux/metrics.hpp"
#include "cloudmux/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace cloudmux {

namespace {

void advance(prometheus::Counter* counter, uint64_t now, uint64_t before) {
    if (now > before) counter->Increment(static_cast<double>(now - before));
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("cloudmux_uploads_total")
        .Help("Total uploads finished")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    rapid_uploads_ = &counter_reg("cloudmux_rapid_uploads_total",
                                  "Uploads satisfied by content already on the backend");
    chunk_calls_ = &counter_reg("cloudmux_chunk_calls_total", "Part upload calls");
    upload_bytes_ = &counter_reg("cloudmux_upload_bytes_total", "Total bytes uploaded");
    download_bytes_ = &counter_reg("cloudmux_download_bytes_total", "Total bytes downloaded");
    refreshes_ = &counter_reg("cloudmux_token_refreshes_total", "Credential refreshes performed");
    auth_retries_ = &counter_reg("cloudmux_auth_retries_total",
                                 "Requests re-sent after an auth-expired response");

    auto& errors_family = prometheus::BuildCounter()
        .Name("cloudmux_errors_total")
        .Help("Failed operations by error kind")
        .Labels(labels)
        .Register(*registry_);
    for (size_t i = 0; i < errors_.size(); ++i) {
        errors_[i] = &errors_family.Add({{"kind", error_kind_name(static_cast<ErrorKind>(i))}});
    }

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("cloudmux_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_counters();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_counters();
        write_file();
    }
}

void MetricsExporter::update_counters() {
    if (!engine_) return;
    std::lock_guard lock(update_mutex_);

    auto s = engine_->stats();
    advance(uploads_success_, s.uploads_ok, prev_.uploads_ok);
    advance(uploads_failure_, s.uploads_failed, prev_.uploads_failed);
    advance(rapid_uploads_, s.rapid_uploads, prev_.rapid_uploads);
    advance(chunk_calls_, s.chunk_calls, prev_.chunk_calls);
    advance(upload_bytes_, s.bytes_uploaded, prev_.bytes_uploaded);
    advance(download_bytes_, s.bytes_downloaded, prev_.bytes_downloaded);
    advance(refreshes_, s.refreshes, prev_.refreshes);
    advance(auth_retries_, s.auth_retries, prev_.auth_retries);
    for (size_t i = 0; i < errors_.size(); ++i) {
        advance(errors_[i], s.errors_by_kind[i], prev_.errors_by_kind[i]);
    }
    prev_ = s;
}

bool MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return false;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot publish metrics file %s: %s", prom_file_path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

double MetricsExporter::uploads(bool success) const {
    return (success ? uploads_success_ : uploads_failure_)->Value();
}

double MetricsExporter::errors(ErrorKind kind) const {
    return errors_[static_cast<size_t>(kind)]->Value();
}

}  // namespace cloudmux
