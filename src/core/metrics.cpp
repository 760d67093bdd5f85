#include "notecache/metrics.hpp"
#include "notecache/note_cache.hpp"
#include <iomanip>
#include <cmath>
#include <limits>

namespace notecache {

// Global metrics instance
static Metrics g_metrics;

Metrics& metrics() {
    return g_metrics;
}

// LatencyHistogram implementation

LatencyHistogram::LatencyHistogram() {
    for (double bound : DEFAULT_BUCKETS) {
        buckets_.emplace_back(bound);
    }
    // Add +Inf bucket
    buckets_.emplace_back(std::numeric_limits<double>::infinity());
}

void LatencyHistogram::observe(double value_ms) {
    for (auto& bucket : buckets_) {
        if (value_ms <= bucket.upper_bound) {
            bucket.count->fetch_add(1, std::memory_order_relaxed);
            break;
        }
    }

    count_.fetch_add(1, std::memory_order_relaxed);

    // Update sum (atomic double addition)
    double old_sum = sum_.load(std::memory_order_relaxed);
    while (!sum_.compare_exchange_weak(old_sum, old_sum + value_ms,
                                        std::memory_order_relaxed));
}

LatencyHistogram::Snapshot LatencyHistogram::snapshot() const {
    Snapshot snap;
    snap.count = count_.load(std::memory_order_relaxed);
    snap.sum = sum_.load(std::memory_order_relaxed);

    uint64_t cumulative = 0;
    for (const auto& bucket : buckets_) {
        cumulative += bucket.count->load(std::memory_order_relaxed);
        snap.buckets.emplace_back(bucket.upper_bound, cumulative);
    }

    return snap;
}

void LatencyHistogram::reset() {
    for (auto& bucket : buckets_) {
        bucket.count->store(0, std::memory_order_relaxed);
    }
    count_.store(0, std::memory_order_relaxed);
    sum_.store(0, std::memory_order_relaxed);
}

// MetricsCollector implementation

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::collect() {
    if (!cache_) return;

    auto& m = metrics();
    auto stats = cache_->stats();
    m.registry_users.set(static_cast<double>(stats.user_count));
    m.registry_notes.set(static_cast<double>(stats.note_count));
    m.registry_public_notes.set(static_cast<double>(stats.public_count));
    m.registry_generation.set(static_cast<double>(stats.generation));
}

void MetricsCollector::write_counter(std::ostringstream& out,
                                      const std::string& name,
                                      const std::string& help,
                                      uint64_t value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
}

void MetricsCollector::write_gauge(std::ostringstream& out,
                                    const std::string& name,
                                    const std::string& help,
                                    double value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << std::fixed << std::setprecision(2) << value << "\n";
}

void MetricsCollector::write_histogram(std::ostringstream& out,
                                        const std::string& name,
                                        const std::string& help,
                                        const LatencyHistogram::Snapshot& snap) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " histogram\n";

    for (const auto& [bound, count] : snap.buckets) {
        out << name << "_bucket{le=\"";
        if (std::isinf(bound)) {
            out << "+Inf";
        } else {
            out << std::fixed << std::setprecision(2) << bound;
        }
        out << "\"} " << count << "\n";
    }

    out << name << "_sum " << std::fixed << std::setprecision(3) << snap.sum << "\n";
    out << name << "_count " << snap.count << "\n";
}

std::string MetricsCollector::export_prometheus() const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;

    auto& m = metrics();

    // Cache operation counters
    NoteCache::Stats stats;
    if (cache_) {
        stats = cache_->stats();
    }
    write_counter(out, "notecache_page_requests_total",
                  "Total recent-page lookups", stats.page_requests);
    write_counter(out, "notecache_page_not_found_total",
                  "Page lookups past the last page", stats.page_misses);
    write_counter(out, "notecache_note_requests_total",
                  "Total note lookups", stats.note_requests);
    write_counter(out, "notecache_note_not_found_total",
                  "Note lookups that were unknown or hidden", stats.note_misses);
    write_counter(out, "notecache_user_note_requests_total",
                  "Total per-user listings", stats.user_note_requests);
    write_counter(out, "notecache_notes_created_total",
                  "Notes persisted and mirrored into the registry", stats.notes_created);
    write_counter(out, "notecache_duplicate_inserts_total",
                  "Registry inserts ignored because the id was present", stats.duplicate_inserts);
    write_counter(out, "notecache_create_failures_total",
                  "Note creations rejected by the store", stats.create_failures);
    write_counter(out, "notecache_reloads_total",
                  "Successful registry loads", stats.reloads);
    write_counter(out, "notecache_reload_failures_total",
                  "Failed registry loads", stats.reload_failures);

    // Registry gauges
    write_gauge(out, "notecache_registry_users",
                "Users in the registry", m.registry_users.get());
    write_gauge(out, "notecache_registry_notes",
                "Notes in the registry", m.registry_notes.get());
    write_gauge(out, "notecache_registry_public_notes",
                "Public notes in the registry", m.registry_public_notes.get());
    write_gauge(out, "notecache_registry_generation",
                "Current registry generation", m.registry_generation.get());

    // Latency histograms
    write_histogram(out, "notecache_load_latency_ms",
                    "Registry load latency in milliseconds", m.load_latency_ms.snapshot());
    write_histogram(out, "notecache_page_latency_ms",
                    "Recent-page query latency in milliseconds", m.page_latency_ms.snapshot());
    write_histogram(out, "notecache_note_latency_ms",
                    "Note query latency in milliseconds", m.note_latency_ms.snapshot());
    write_histogram(out, "notecache_user_notes_latency_ms",
                    "Per-user listing latency in milliseconds", m.user_notes_latency_ms.snapshot());
    write_histogram(out, "notecache_create_latency_ms",
                    "Note creation latency in milliseconds", m.create_latency_ms.snapshot());

    // HTTP metrics
    write_counter(out, "notecache_http_requests_total",
                  "Total HTTP requests handled", m.http_requests_total.get());
    write_counter(out, "notecache_http_errors_total",
                  "Total HTTP errors", m.http_errors_total.get());
    write_counter(out, "notecache_http_not_modified_total",
                  "Responses answered with 304 Not Modified", m.http_not_modified_total.get());
    write_histogram(out, "notecache_http_request_latency_ms",
                    "HTTP request latency in milliseconds",
                    m.http_request_latency_ms.snapshot());

    // Uptime
    write_gauge(out, "notecache_uptime_seconds",
                "Time since server start in seconds", m.uptime_seconds());

    return out.str();
}

std::string MetricsCollector::export_json() const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;

    auto& m = metrics();
    NoteCache::Stats stats;
    if (cache_) {
        stats = cache_->stats();
    }

    out << "{\n";
    out << "  \"cache\": {\n";
    out << "    \"page_requests\": " << stats.page_requests << ",\n";
    out << "    \"page_misses\": " << stats.page_misses << ",\n";
    out << "    \"note_requests\": " << stats.note_requests << ",\n";
    out << "    \"note_misses\": " << stats.note_misses << ",\n";
    out << "    \"user_note_requests\": " << stats.user_note_requests << ",\n";
    out << "    \"notes_created\": " << stats.notes_created << ",\n";
    out << "    \"duplicate_inserts\": " << stats.duplicate_inserts << ",\n";
    out << "    \"create_failures\": " << stats.create_failures << ",\n";
    out << "    \"reloads\": " << stats.reloads << ",\n";
    out << "    \"reload_failures\": " << stats.reload_failures << "\n";
    out << "  },\n";

    out << "  \"registry\": {\n";
    out << "    \"users\": " << stats.user_count << ",\n";
    out << "    \"notes\": " << stats.note_count << ",\n";
    out << "    \"public_notes\": " << stats.public_count << ",\n";
    out << "    \"generation\": " << stats.generation << "\n";
    out << "  },\n";

    out << "  \"http\": {\n";
    out << "    \"requests\": " << m.http_requests_total.get() << ",\n";
    out << "    \"errors\": " << m.http_errors_total.get() << ",\n";
    out << "    \"not_modified\": " << m.http_not_modified_total.get() << "\n";
    out << "  },\n";

    auto avg = [](const LatencyHistogram::Snapshot& snap) {
        return snap.count > 0 ? snap.sum / snap.count : 0.0;
    };

    out << "  \"latency_ms\": {\n";
    out << std::fixed << std::setprecision(3);
    out << "    \"load_avg\": " << avg(m.load_latency_ms.snapshot()) << ",\n";
    out << "    \"page_avg\": " << avg(m.page_latency_ms.snapshot()) << ",\n";
    out << "    \"note_avg\": " << avg(m.note_latency_ms.snapshot()) << ",\n";
    out << "    \"create_avg\": " << avg(m.create_latency_ms.snapshot()) << "\n";
    out << "  },\n";

    out << "  \"uptime_seconds\": " << std::setprecision(1) << m.uptime_seconds() << "\n";
    out << "}\n";

    return out.str();
}

}  // namespace notecache
