#pragma once

#include "types.hpp"
#include <string>
#include <sstream>
#include <atomic>
#include <mutex>
#include <memory>
#include <chrono>
#include <vector>

namespace notecache {

// Forward declarations
class NoteCache;

// Histogram bucket for latency tracking
struct HistogramBucket {
    double upper_bound;
    std::unique_ptr<std::atomic<uint64_t>> count;

    HistogramBucket(double bound) : upper_bound(bound), count(std::make_unique<std::atomic<uint64_t>>(0)) {}
};

// Latency histogram with configurable buckets
class LatencyHistogram {
public:
    LatencyHistogram();

    void observe(double value_ms);

    // Get bucket counts and sum for Prometheus format
    struct Snapshot {
        std::vector<std::pair<double, uint64_t>> buckets;
        uint64_t count;
        double sum;
    };

    Snapshot snapshot() const;
    void reset();

private:
    std::vector<HistogramBucket> buckets_;
    std::atomic<uint64_t> count_{0};
    std::atomic<double> sum_{0};

    // Default buckets in milliseconds
    static constexpr double DEFAULT_BUCKETS[] = {
        0.01, 0.05, 0.1, 0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 5000
    };
};

// Counter metric
class Counter {
public:
    Counter() = default;

    void inc(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }
    void reset() { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

// Gauge metric (can go up or down)
class Gauge {
public:
    Gauge() = default;

    void set(double v) { value_.store(v, std::memory_order_relaxed); }
    void inc(double n = 1) {
        double old = value_.load();
        while (!value_.compare_exchange_weak(old, old + n));
    }
    void dec(double n = 1) { inc(-n); }
    double get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0};
};

// Process-wide metrics. Per-cache operation counts live in NoteCache::Stats.
struct Metrics {
    // Registry contents, refreshed by MetricsCollector::collect()
    Gauge registry_users;
    Gauge registry_notes;
    Gauge registry_public_notes;
    Gauge registry_generation;

    // Latency histograms
    LatencyHistogram load_latency_ms;
    LatencyHistogram page_latency_ms;
    LatencyHistogram note_latency_ms;
    LatencyHistogram user_notes_latency_ms;
    LatencyHistogram create_latency_ms;

    // HTTP server metrics
    Counter http_requests_total;
    Counter http_errors_total;
    Counter http_not_modified_total;
    LatencyHistogram http_request_latency_ms;

    // Uptime
    std::chrono::steady_clock::time_point start_time;

    Metrics() : start_time(std::chrono::steady_clock::now()) {}

    double uptime_seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time).count();
    }
};

// Global metrics instance
Metrics& metrics();

// Metrics collector - aggregates metrics from the cache
class MetricsCollector {
public:
    MetricsCollector();

    void set_cache(const NoteCache* cache) { cache_ = cache; }

    // Update gauges from the cache
    void collect();

    // Export to Prometheus format
    std::string export_prometheus() const;

    // Export to JSON format
    std::string export_json() const;

private:
    const NoteCache* cache_ = nullptr;
    mutable std::mutex mutex_;

    void write_counter(std::ostringstream& out, const std::string& name,
                       const std::string& help, uint64_t value) const;
    void write_gauge(std::ostringstream& out, const std::string& name,
                     const std::string& help, double value) const;
    void write_histogram(std::ostringstream& out, const std::string& name,
                         const std::string& help,
                         const LatencyHistogram::Snapshot& snap) const;
};

// RAII timer for latency measurement
class LatencyTimer {
public:
    explicit LatencyTimer(LatencyHistogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now())
    {}

    ~LatencyTimer() {
        histogram_.observe(elapsed_ms());
    }

    double elapsed_ms() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    // Non-copyable
    LatencyTimer(const LatencyTimer&) = delete;
    LatencyTimer& operator=(const LatencyTimer&) = delete;

private:
    LatencyHistogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

#define NOTECACHE_CONCAT_INNER(a, b) a##b
#define NOTECACHE_CONCAT(a, b) NOTECACHE_CONCAT_INNER(a, b)

// Convenience macro for timing operations
#define NOTECACHE_TIME_OPERATION(histogram) \
    notecache::LatencyTimer NOTECACHE_CONCAT(_timer_, __LINE__)(histogram)

}  // namespace notecache
