#include "notecache/config.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace notecache {

// Flat JSON reader for the handful of keys the config file carries

namespace {

// Very simple JSON value extraction (supports basic types)
class SimpleJson {
public:
    explicit SimpleJson(const std::string& json) : json_(json) {}

    std::string get_string(const std::string& key, const std::string& def = "") const {
        auto pos = value_pos(key);
        if (pos == std::string::npos || json_[pos] != '"') return def;

        std::string out;
        for (size_t i = pos + 1; i < json_.size(); ++i) {
            char c = json_[i];
            if (c == '"') return out;
            if (c == '\\' && i + 1 < json_.size()) {
                c = json_[++i];
                switch (c) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    default: out += c; break;
                }
                continue;
            }
            out += c;
        }
        return def;
    }

    int64_t get_int(const std::string& key, int64_t def = 0) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        auto end = pos;
        while (end < json_.size() && (std::isdigit(static_cast<unsigned char>(json_[end])) ||
                                      json_[end] == '-')) {
            ++end;
        }

        if (end == pos) return def;
        return std::stoll(json_.substr(pos, end - pos));
    }

    bool get_bool(const std::string& key, bool def = false) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        if (json_.compare(pos, 4, "true") == 0) return true;
        if (json_.compare(pos, 5, "false") == 0) return false;
        return def;
    }

    SimpleJson get_object(const std::string& key) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos || json_[pos] != '{') return SimpleJson("{}");

        int depth = 1;
        size_t end = pos + 1;
        while (end < json_.size() && depth > 0) {
            if (json_[end] == '{') ++depth;
            else if (json_[end] == '}') --depth;
            ++end;
        }

        return SimpleJson(json_.substr(pos, end - pos));
    }

private:
    std::string json_;

    // Position of the first non-space character after "key":
    size_t value_pos(const std::string& key) const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return pos;

        pos = json_.find(':', pos);
        if (pos == std::string::npos) return pos;

        ++pos;
        while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;
        return pos < json_.size() ? pos : std::string::npos;
    }
};

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

}  // namespace

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

Config Config::load_json(const std::string& json) {
    Config config;
    SimpleJson j(json);

    // Store config
    auto store = j.get_object("store");
    config.store.path = store.get_string("path", config.store.path);
    config.store.create_schema = store.get_bool("create_schema", config.store.create_schema);
    config.store.busy_timeout = std::chrono::milliseconds(
        store.get_int("busy_timeout_ms", config.store.busy_timeout.count()));

    // Cache config
    auto cache = j.get_object("cache");
    auto page_size = cache.get_int("page_size", static_cast<int64_t>(config.cache.page_size));
    config.cache.page_size = page_size > 0 ? static_cast<size_t>(page_size) : 0;

    // Network config
    auto net = j.get_object("network");
    config.network.bind_address = net.get_string("bind_address", config.network.bind_address);
    auto port = net.get_int("http_port", config.network.http_port);
    config.network.http_port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;  // 0 fails validation
    config.network.read_timeout = std::chrono::milliseconds(
        net.get_int("read_timeout_ms", config.network.read_timeout.count()));

    // Performance config
    auto perf = j.get_object("performance");
    config.perf.worker_threads = perf.get_int("worker_threads", 0);
    config.perf.enable_metrics = perf.get_bool("enable_metrics", true);

    return config;
}

std::optional<std::filesystem::path> Config::env_config_path(
    const std::filesystem::path& config_dir)
{
    const char* env = std::getenv("NOTECACHE_ENV");
    if (!env || *env == '\0') {
        return std::nullopt;
    }
    return config_dir / (std::string(env) + ".json");
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string Config::to_json() const {
    std::ostringstream oss;
    oss << "{\n";

    // Store
    oss << "  \"store\": {\n";
    oss << "    \"path\": \"" << escape(store.path) << "\",\n";
    oss << "    \"create_schema\": " << (store.create_schema ? "true" : "false") << ",\n";
    oss << "    \"busy_timeout_ms\": " << store.busy_timeout.count() << "\n";
    oss << "  },\n";

    // Cache
    oss << "  \"cache\": {\n";
    oss << "    \"page_size\": " << cache.page_size << "\n";
    oss << "  },\n";

    // Network
    oss << "  \"network\": {\n";
    oss << "    \"bind_address\": \"" << escape(network.bind_address) << "\",\n";
    oss << "    \"http_port\": " << network.http_port << ",\n";
    oss << "    \"read_timeout_ms\": " << network.read_timeout.count() << "\n";
    oss << "  },\n";

    // Performance
    oss << "  \"performance\": {\n";
    oss << "    \"worker_threads\": " << perf.worker_threads << ",\n";
    oss << "    \"enable_metrics\": " << (perf.enable_metrics ? "true" : "false") << "\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

Status Config::validate() const {
    if (store.path.empty()) {
        return Status::error(ErrorCode::InvalidArgument, "Store path must not be empty");
    }

    if (cache.page_size == 0) {
        return Status::error(ErrorCode::InvalidArgument, "Page size must be at least 1");
    }

    if (network.http_port == 0) {
        return Status::error(ErrorCode::InvalidArgument, "HTTP port must be between 1 and 65535");
    }

    return Status::make_ok();
}

}  // namespace notecache
