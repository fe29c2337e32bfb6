#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace gigvault {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports gigvault metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. With an empty path nothing is written, but the counters
/// still work (tests and one-shot CLI runs).
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file (may be empty).
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Source for the active-proxy-requests gauge, sampled before each write.
    void set_active_requests_source(std::function<size_t()> source);

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize the registry in text exposition format.
    std::string serialize() const;

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_duplicate() { return *uploads_duplicate_; }
    prometheus::Counter& uploads_cancelled() { return *uploads_cancelled_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& upload_chunks_total() { return *upload_chunks_total_; }
    prometheus::Counter& proxy_finished() { return *proxy_finished_; }
    prometheus::Counter& proxy_cancelled() { return *proxy_cancelled_; }
    prometheus::Counter& proxy_error() { return *proxy_error_; }
    prometheus::Counter& proxy_bytes_total() { return *proxy_bytes_total_; }

    /// gigvault_finalize_total{status="<code>"}; status 0 means no response.
    prometheus::Counter& finalize_status(int status);

    // --- Gauge accessors ---
    prometheus::Gauge& proxy_active_requests() { return *proxy_active_requests_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& chunk_duration() { return *chunk_duration_; }
    prometheus::Histogram& proxy_first_byte() { return *proxy_first_byte_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex source_mutex_;
    std::function<size_t()> active_requests_source_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_duplicate_;
    prometheus::Counter* uploads_cancelled_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* upload_chunks_total_;
    prometheus::Counter* proxy_finished_;
    prometheus::Counter* proxy_cancelled_;
    prometheus::Counter* proxy_error_;
    prometheus::Counter* proxy_bytes_total_;
    prometheus::Family<prometheus::Counter>* finalize_family_;

    // --- Gauges ---
    prometheus::Gauge* proxy_active_requests_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* chunk_duration_;
    prometheus::Histogram* proxy_first_byte_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace gigvault
