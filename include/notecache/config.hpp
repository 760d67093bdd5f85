#pragma once

#include "types.hpp"
#include <string>
#include <optional>
#include <filesystem>

namespace notecache {

// Persisted store configuration
struct StoreConfig {
    std::string path = "notecache.db";  // ":memory:" for a private in-memory database
    bool create_schema = true;
    std::chrono::milliseconds busy_timeout{5000};
};

// Cache configuration
struct CacheConfig {
    size_t page_size = DEFAULT_PAGE_SIZE;  // Shared by all paging endpoints
};

// Network configuration
struct NetworkConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t http_port = 5000;
    std::chrono::milliseconds read_timeout{30000};
};

// Performance tuning
struct PerformanceConfig {
    size_t worker_threads = 0;  // 0 = auto (based on CPU count)
    bool enable_metrics = true;
};

// Main configuration
struct Config {
    StoreConfig store;
    CacheConfig cache;
    NetworkConfig network;
    PerformanceConfig perf;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_json(const std::string& json);

    // config/<env>.json under config_dir when NOTECACHE_ENV is set
    static std::optional<std::filesystem::path> env_config_path(
        const std::filesystem::path& config_dir = "config");

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;
};

}  // namespace notecache
