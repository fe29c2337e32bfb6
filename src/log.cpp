#include "gigvault/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace gigvault {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_log_mutex;

// [2026-10-19T09:31:02.417Z]
void write_timestamp(FILE* out) {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    time_t t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);
    fprintf(out, "[%s.%03dZ] ", buf, static_cast<int>(ms));
}

void vlog(FILE* out, const char* level, const char* fmt, va_list args) {
    std::lock_guard lock(g_log_mutex);
    write_timestamp(out);
    if (level) fputs(level, out);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_verbose_logging(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose_logging() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_debug(const char* fmt, ...) {
    if (!verbose_logging()) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

}  // namespace gigvault
