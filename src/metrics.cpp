#include "gigvault/metrics.hpp"
#include "gigvault/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace gigvault {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("gigvault_uploads_total")
        .Help("Total uploads by terminal outcome")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_duplicate_ = &uploads_family.Add({{"result", "duplicate"}});
    uploads_cancelled_ = &uploads_family.Add({{"result", "cancelled"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("gigvault_upload_bytes_total")
        .Help("Total bytes acknowledged by the upload server")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    upload_chunks_total_ = &prometheus::BuildCounter()
        .Name("gigvault_upload_chunks_total")
        .Help("Total upload chunks acknowledged")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    finalize_family_ = &prometheus::BuildCounter()
        .Name("gigvault_finalize_total")
        .Help("Finalize responses by HTTP status")
        .Labels(labels)
        .Register(*registry_);

    auto& proxy_family = prometheus::BuildCounter()
        .Name("gigvault_proxy_requests_total")
        .Help("Total proxied playback requests by outcome")
        .Labels(labels)
        .Register(*registry_);
    proxy_finished_ = &proxy_family.Add({{"result", "finished"}});
    proxy_cancelled_ = &proxy_family.Add({{"result", "cancelled"}});
    proxy_error_ = &proxy_family.Add({{"result", "error"}});

    proxy_bytes_total_ = &prometheus::BuildCounter()
        .Name("gigvault_proxy_bytes_total")
        .Help("Total bytes delivered to the media player")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    proxy_active_requests_ = &prometheus::BuildGauge()
        .Name("gigvault_proxy_active_requests")
        .Help("Playback requests currently in flight")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("gigvault_upload_duration_seconds")
        .Help("Whole upload duration (transfer and finalize) in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            1, 5, 10, 30, 60, 120, 300, 600, 1200, 3600});

    chunk_duration_ = &prometheus::BuildHistogram()
        .Name("gigvault_chunk_duration_seconds")
        .Help("Upload chunk round-trip duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});

    proxy_first_byte_ = &prometheus::BuildHistogram()
        .Name("gigvault_proxy_first_byte_seconds")
        .Help("Time from player request to first upstream byte in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::set_active_requests_source(std::function<size_t()> source) {
    std::lock_guard lock(source_mutex_);
    active_requests_source_ = std::move(source);
}

prometheus::Counter& MetricsExporter::finalize_status(int status) {
    // Family::Add is thread-safe and returns the existing child for known labels
    return finalize_family_->Add({{"status", std::to_string(status)}});
}

void MetricsExporter::start() {
    if (prom_file_path_.empty()) return;
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
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(source_mutex_);
    if (active_requests_source_) {
        proxy_active_requests_->Set(static_cast<double>(active_requests_source_()));
    }
}

std::string MetricsExporter::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename metrics file to %s: %s", prom_file_path_.c_str(),
                 ec.message().c_str());
    }
}

}  // namespace gigvault
