#include "notecache/notecache.hpp"
#include <elio/runtime/scheduler.hpp>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace {

std::atomic<bool> g_running{true};
elio::runtime::scheduler* g_scheduler = nullptr;

void signal_handler(int sig) {
    std::cout << "\nReceived signal " << sig << ", shutting down...\n";
    g_running = false;
    if (g_scheduler) {
        g_scheduler->shutdown();
    }
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>      Configuration file path\n"
              << "                           (default: config/$NOTECACHE_ENV.json)\n"
              << "  -p, --port <port>        HTTP port (default: 5000)\n"
              << "  -d, --db <path>          SQLite database file (default: notecache.db)\n"
              << "  -P, --page-size <n>      Notes per page (default: 100)\n"
              << "  -u, --seed-user <id:name> Create a user before loading\n"
              << "  -h, --help               Show this help\n"
              << "  -v, --version            Show version\n";
}

void print_version() {
    std::cout << "NoteCache version " << notecache::Version::string() << "\n"
              << "In-memory note and user cache over SQLite\n";
}

// "42:alice" -> User{42, "alice"}
bool parse_seed_user(const std::string& arg, notecache::User& user) {
    auto colon = arg.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == arg.size()) {
        return false;
    }
    try {
        user.id = std::stoll(arg.substr(0, colon));
    } catch (const std::exception&) {
        return false;
    }
    user.username = arg.substr(colon + 1);
    user.last_access = notecache::now_timestamp();
    return user.id > 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    notecache::Config config;
    std::string config_file;

    // Command line values are applied on top of the config file
    std::optional<uint16_t> port;
    std::optional<std::string> db_path;
    std::optional<size_t> page_size;
    std::vector<notecache::User> seed_users;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        }

        try {
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_file = argv[++i];
            }
            else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                int value = std::stoi(argv[++i]);
                if (value < 1 || value > 65535) {
                    std::cerr << "Port out of range: " << argv[i] << " (expected 1-65535)\n";
                    return 1;
                }
                port = static_cast<uint16_t>(value);
            }
            else if ((arg == "-d" || arg == "--db") && i + 1 < argc) {
                db_path = argv[++i];
            }
            else if ((arg == "-P" || arg == "--page-size") && i + 1 < argc) {
                page_size = std::stoull(argv[++i]);
            }
            else if ((arg == "-u" || arg == "--seed-user") && i + 1 < argc) {
                notecache::User user;
                if (!parse_seed_user(argv[++i], user)) {
                    std::cerr << "Invalid seed user: " << argv[i] << " (expected id:name)\n";
                    return 1;
                }
                seed_users.push_back(std::move(user));
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << "\n";
            return 1;
        }
    }

    // Load config file if specified, or the one selected by NOTECACHE_ENV
    if (config_file.empty()) {
        if (auto env_path = notecache::Config::env_config_path()) {
            config_file = env_path->string();
        }
    }
    if (!config_file.empty()) {
        try {
            config = notecache::Config::load(config_file);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    if (port) config.network.http_port = *port;
    if (db_path) config.store.path = *db_path;
    if (page_size) config.cache.page_size = *page_size;

    // Validate config
    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid configuration: " << status.message() << "\n";
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Print startup info
    std::cout << "Starting NoteCache " << notecache::Version::string() << "\n";
    if (!config_file.empty()) {
        std::cout << "  Config: " << config_file << "\n";
    }
    std::cout << "  Database: " << config.store.path << "\n";
    std::cout << "  Page size: " << config.cache.page_size << "\n";
    std::cout << "  HTTP: " << config.network.bind_address << ":"
              << config.network.http_port << "\n";

    try {
        // Determine number of worker threads
        size_t num_threads = config.perf.worker_threads;
        if (num_threads == 0) {
            num_threads = std::thread::hardware_concurrency();
            if (num_threads == 0) num_threads = 4;
        }

        notecache::NoteCacheServer server(config);

        for (const auto& user : seed_users) {
            auto seeded = server.store().insert_user(user);
            if (!seeded) {
                std::cerr << "Failed to seed user " << user.id << ": "
                          << seeded.to_string() << "\n";
                return 1;
            }
            std::cout << "  Seeded user " << user.id << " (" << user.username << ")\n";
        }

        // A service without its initial data refuses to start
        status = server.load();
        if (!status) {
            std::cerr << "Initial load failed: " << status.message() << "\n";
            return 1;
        }

        // Create scheduler
        elio::runtime::scheduler sched(num_threads);
        g_scheduler = &sched;

        // Connect scheduler to server's io_context
        sched.set_io_context(&server.io_context());

        // Start the scheduler
        sched.start();

        // Create startup task
        auto startup_task = [&server, &sched]() -> elio::coro::task<void> {
            auto status = co_await server.start(sched);
            if (!status) {
                std::cerr << "Failed to start server: " << status.message() << "\n";
                g_running = false;
            } else {
                std::cout << "NoteCache server started successfully\n";
                std::cout << "Press Ctrl+C to stop\n";
            }
        };

        auto task = startup_task();
        sched.spawn(task.release());

        // Main loop - check for shutdown
        while (g_running && sched.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "Shutting down...\n";

        auto shutdown_task = [&server]() -> elio::coro::task<void> {
            co_await server.stop();
        };

        if (sched.is_running()) {
            auto stop_task = shutdown_task();
            sched.spawn(stop_task.release());

            // Wait briefly for shutdown to complete
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        sched.shutdown();
        g_scheduler = nullptr;

        std::cout << "NoteCache server stopped\n";

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

// NoteCacheServer implementation

namespace notecache {

NoteCacheServer::NoteCacheServer(const Config& config)
    : config_(config)
    , io_ctx_()
{
    store_ = std::make_unique<SqliteNoteStore>(config.store);
    cache_ = std::make_unique<NoteCache>(*store_, config.cache);

    metrics_collector_ = std::make_unique<MetricsCollector>();
    metrics_collector_->set_cache(cache_.get());

    http_handler_ = std::make_unique<HttpHandler>(*cache_);
    if (config.perf.enable_metrics) {
        http_handler_->set_metrics_collector(metrics_collector_.get());
    }
    http_server_ = std::make_unique<HttpServer>(config.network, *http_handler_);
}

NoteCacheServer::~NoteCacheServer() = default;

Status NoteCacheServer::load() {
    return cache_->initialize();
}

elio::coro::task<Status> NoteCacheServer::start(elio::runtime::scheduler& sched) {
    running_ = true;

    auto status = co_await http_server_->start(io_ctx_, sched);
    if (!status) {
        co_return status;
    }

    co_return Status::make_ok();
}

elio::coro::task<void> NoteCacheServer::stop() {
    running_ = false;
    co_await http_server_->stop();
}

}  // namespace notecache
