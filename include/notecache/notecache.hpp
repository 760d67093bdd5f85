#pragma once

// Main NoteCache header - includes everything needed

#include "types.hpp"
#include "config.hpp"
#include "store.hpp"
#include "sqlite_store.hpp"
#include "registry.hpp"
#include "query.hpp"
#include "note_cache.hpp"
#include "http_api.hpp"
#include "metrics.hpp"
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>

namespace notecache {

// Main server class
class NoteCacheServer {
public:
    // Opens the store; throws std::runtime_error when it cannot be opened
    explicit NoteCacheServer(const Config& config);
    ~NoteCacheServer();

    // Initial load. The server refuses to start on a failed load.
    Status load();

    // Start the HTTP server (requires scheduler)
    elio::coro::task<Status> start(elio::runtime::scheduler& sched);

    // Stop all services gracefully
    elio::coro::task<void> stop();

    // Access components
    NoteCache& cache() { return *cache_; }
    SqliteNoteStore& store() { return *store_; }
    HttpServer* http_server() { return http_server_.get(); }
    MetricsCollector& metrics() { return *metrics_collector_; }
    elio::io::io_context& io_context() { return io_ctx_; }

    // Configuration
    const Config& config() const { return config_; }

private:
    Config config_;
    elio::io::io_context io_ctx_;  // Owned io_context for all async I/O
    std::unique_ptr<SqliteNoteStore> store_;
    std::unique_ptr<NoteCache> cache_;
    std::unique_ptr<MetricsCollector> metrics_collector_;
    std::unique_ptr<HttpHandler> http_handler_;
    std::unique_ptr<HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace notecache
