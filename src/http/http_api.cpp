#include "notecache/http_api.hpp"
#include "notecache/note_cache.hpp"
#include <xxhash.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace notecache {

namespace {

bool parse_number(std::string_view text, uint64_t& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < in.size() &&
                   hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

HttpResponse make_response(int code, const char* text, std::string body) {
    HttpResponse resp;
    resp.status_code = code;
    resp.status_text = text;
    resp.body = std::move(body);
    resp.set_content_type("text/plain");
    return resp;
}

}  // namespace

// HttpRequest implementation

HttpRequest HttpRequest::from_context(elio::http::context& ctx) {
    HttpRequest req;

    // Map Elio method to string
    switch (ctx.req().get_method()) {
        case elio::http::method::GET:     req.method = "GET"; break;
        case elio::http::method::POST:    req.method = "POST"; break;
        case elio::http::method::PUT:     req.method = "PUT"; break;
        case elio::http::method::DELETE_: req.method = "DELETE"; break;
        case elio::http::method::HEAD:    req.method = "HEAD"; break;
        case elio::http::method::OPTIONS: req.method = "OPTIONS"; break;
        case elio::http::method::PATCH:   req.method = "PATCH"; break;
        default: req.method = "UNKNOWN"; break;
    }

    req.path = std::string(ctx.req().path());

    // Routing ignores any query string
    auto query_pos = req.path.find('?');
    if (query_pos != std::string::npos) {
        req.path.resize(query_pos);
    }

    for (const auto& [name, value] : ctx.req().get_headers()) {
        req.headers[name] = value;
    }

    req.body = std::string(ctx.req().body());
    return req;
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    // Case-insensitive search
    std::string lower_name = to_lower(name);
    for (const auto& [k, v] : headers) {
        if (to_lower(k) == lower_name) {
            return v;
        }
    }
    return "";
}

std::optional<std::string> HttpRequest::form_value(const std::string& name) const {
    std::string_view rest(body);
    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);

        auto eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq));
        if (key == name) {
            return eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
        }
    }
    return std::nullopt;
}

// HttpResponse implementation

HttpResponse HttpResponse::ok(std::string body) {
    HttpResponse resp;
    resp.body = std::move(body);
    resp.set_content_type("text/plain");
    return resp;
}

HttpResponse HttpResponse::json(std::string body) {
    HttpResponse resp;
    resp.body = std::move(body);
    resp.set_content_type("application/json");
    return resp;
}

HttpResponse HttpResponse::created(std::string body, const std::string& location) {
    HttpResponse resp;
    resp.status_code = 201;
    resp.status_text = "Created";
    resp.body = std::move(body);
    resp.set_content_type("application/json");
    resp.headers["Location"] = location;
    return resp;
}

HttpResponse HttpResponse::not_modified() {
    HttpResponse resp;
    resp.status_code = 304;
    resp.status_text = "Not Modified";
    return resp;
}

HttpResponse HttpResponse::not_found(const std::string& msg) {
    return make_response(404, "Not Found", msg);
}

HttpResponse HttpResponse::bad_request(const std::string& msg) {
    return make_response(400, "Bad Request", msg);
}

HttpResponse HttpResponse::forbidden(const std::string& msg) {
    return make_response(403, "Forbidden", msg);
}

HttpResponse HttpResponse::conflict(const std::string& msg) {
    return make_response(409, "Conflict", msg);
}

HttpResponse HttpResponse::internal_error(const std::string& msg) {
    return make_response(500, "Internal Server Error", msg);
}

HttpResponse HttpResponse::service_unavailable(const std::string& msg) {
    return make_response(503, "Service Unavailable", msg);
}

void HttpResponse::set_content_type(const std::string& type) {
    headers["Content-Type"] = type;
}

elio::http::response HttpResponse::to_elio_response() const {
    elio::http::response resp(static_cast<elio::http::status>(status_code));
    resp.set_body(body);
    for (const auto& [name, value] : headers) {
        resp.set_header(name, value);
    }
    return resp;
}

// JSON encoding

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string note_to_json(const Note& note) {
    std::ostringstream json;
    json << "{\"id\": " << note.id
         << ", \"user\": " << note.user_id
         << ", \"username\": \"" << json_escape(note.username) << "\""
         << ", \"title\": \"" << json_escape(note.title()) << "\""
         << ", \"content\": \"" << json_escape(note.content) << "\""
         << ", \"is_private\": " << (note.is_private ? "true" : "false")
         << ", \"created_at\": \"" << json_escape(note.created_at) << "\""
         << ", \"updated_at\": \"" << json_escape(note.updated_at) << "\"}";
    return json.str();
}

std::string notes_to_json(const std::vector<Note>& notes) {
    std::string out = "[";
    for (size_t i = 0; i < notes.size(); ++i) {
        if (i > 0) out += ", ";
        out += note_to_json(notes[i]);
    }
    out += "]";
    return out;
}

std::string page_to_json(const Page& page, size_t page_size) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"page\": " << page.page << ",\n";
    json << "  \"page_size\": " << page_size << ",\n";
    json << "  \"total\": " << page.total << ",\n";
    json << "  \"page_start\": " << page.page_start << ",\n";
    json << "  \"page_end\": " << page.page_end << ",\n";
    json << "  \"notes\": " << notes_to_json(page.notes) << "\n";
    json << "}\n";
    return json.str();
}

std::string context_to_json(const NoteContext& ctx) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"note\": " << note_to_json(ctx.note) << ",\n";
    json << "  \"older\": " << (ctx.older ? note_to_json(*ctx.older) : "null") << ",\n";
    json << "  \"newer\": " << (ctx.newer ? note_to_json(*ctx.newer) : "null") << "\n";
    json << "}\n";
    return json.str();
}

std::string compute_etag(std::string_view body) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "\"%016llx\"",
                  static_cast<unsigned long long>(XXH3_64bits(body.data(), body.size())));
    return buf;
}

// HttpHandler implementation

HttpHandler::HttpHandler(NoteCache& cache)
    : cache_(cache)
{}

HttpResponse HttpHandler::handle(const HttpRequest& req) {
    auto& m = metrics();
    NOTECACHE_TIME_OPERATION(m.http_request_latency_ms);
    m.http_requests_total.inc();

    auto resp = route(req);

    if (resp.status_code >= 500) {
        m.http_errors_total.inc();
    } else if (resp.status_code == 304) {
        m.http_not_modified_total.inc();
    }
    return resp;
}

HttpResponse HttpHandler::route(const HttpRequest& req) {
    const std::string& path = req.path;
    bool is_get = req.method == "GET" || req.method == "HEAD";

    if (path == "/" && is_get) {
        return handle_top(req);
    } else if (path.starts_with("/recent/") && is_get) {
        return handle_recent(req);
    } else if (path.starts_with("/notes/") && is_get) {
        return handle_note(req);
    } else if (path == "/notes" && req.method == "POST") {
        return handle_create(req);
    } else if (path.starts_with("/users/") && path.ends_with("/notes") && is_get) {
        return handle_user_notes(req);
    } else if (path == "/reset" && (req.method == "POST" || req.method == "GET")) {
        return handle_reset(req);
    } else if (path == "/stats" && is_get) {
        return handle_stats(req);
    } else if (path == "/health" && is_get) {
        return handle_health(req);
    } else if (path == "/metrics" && is_get) {
        return handle_metrics(req);
    }

    return HttpResponse::not_found("Endpoint not found");
}

std::optional<UserId> HttpHandler::requester(const HttpRequest& req) const {
    uint64_t id = 0;
    if (!parse_number(trim(req.header(USER_HEADER)), id)) {
        return std::nullopt;
    }
    auto user = cache_.find_user(static_cast<UserId>(id));
    if (!user) {
        return std::nullopt;
    }
    return user->id;
}

HttpResponse HttpHandler::finish_read(const HttpRequest& req, HttpResponse resp,
                                      std::optional<UserId> viewer) {
    if (viewer) {
        resp.headers["Cache-Control"] = "private";
    }

    auto etag = compute_etag(resp.body);
    if (trim(req.header("If-None-Match")) == etag) {
        auto not_modified = HttpResponse::not_modified();
        not_modified.headers["ETag"] = etag;
        if (viewer) {
            not_modified.headers["Cache-Control"] = "private";
        }
        return not_modified;
    }

    resp.headers["ETag"] = etag;
    return resp;
}

HttpResponse HttpHandler::handle_top(const HttpRequest& req) {
    auto page = cache_.get_page(0);
    if (!page) {
        // Nothing public yet; the top page still renders
        page.emplace();
        page->total = 0;
    }
    return finish_read(req, HttpResponse::json(page_to_json(*page, cache_.page_size())),
                       requester(req));
}

HttpResponse HttpHandler::handle_recent(const HttpRequest& req) {
    uint64_t page_index = 0;
    if (!parse_number(std::string_view(req.path).substr(8), page_index)) {  // "/recent/"
        return HttpResponse::not_found("Page not found");
    }

    auto page = cache_.get_page(page_index);
    if (!page) {
        return HttpResponse::not_found("Page not found");
    }
    return finish_read(req, HttpResponse::json(page_to_json(*page, cache_.page_size())),
                       requester(req));
}

HttpResponse HttpHandler::handle_note(const HttpRequest& req) {
    uint64_t note_id = 0;
    if (!parse_number(std::string_view(req.path).substr(7), note_id)) {  // "/notes/"
        return HttpResponse::not_found("Note not found");
    }

    auto viewer = requester(req);
    auto ctx = cache_.get_note_with_context(static_cast<NoteId>(note_id), viewer);
    if (!ctx) {
        return HttpResponse::not_found("Note not found");
    }
    return finish_read(req, HttpResponse::json(context_to_json(*ctx)), viewer);
}

HttpResponse HttpHandler::handle_user_notes(const HttpRequest& req) {
    // "/users/{id}/notes"
    std::string_view path(req.path);
    auto id_part = path.substr(7, path.size() - 7 - 6);
    uint64_t user_id = 0;
    if (!parse_number(id_part, user_id)) {
        return HttpResponse::not_found("User not found");
    }

    auto user = cache_.find_user(static_cast<UserId>(user_id));
    if (!user) {
        return HttpResponse::not_found("User not found");
    }

    // Private notes are only listed for their owner
    auto viewer = requester(req);
    if (!viewer || *viewer != user->id) {
        return HttpResponse::forbidden("Listing is restricted to its owner");
    }

    auto notes = cache_.get_user_notes(user->id);

    std::ostringstream json;
    json << "{\n";
    json << "  \"user\": " << user->id << ",\n";
    json << "  \"username\": \"" << json_escape(user->username) << "\",\n";
    json << "  \"notes\": " << notes_to_json(notes) << "\n";
    json << "}\n";
    return finish_read(req, HttpResponse::json(json.str()), viewer);
}

HttpResponse HttpHandler::handle_create(const HttpRequest& req) {
    auto owner = requester(req);
    if (!owner) {
        return HttpResponse::forbidden("Sign in required");
    }

    auto content = req.form_value("content");
    if (!content || content->empty()) {
        return HttpResponse::bad_request("Missing content");
    }
    bool is_private = req.form_value("is_private").value_or("0") == "1";

    NoteId id = 0;
    auto status = cache_.create_note(*owner, std::move(*content), is_private, id);
    if (!status) {
        if (status.code() == ErrorCode::ConstraintViolation) {
            return HttpResponse::conflict(status.to_string());
        }
        return HttpResponse::internal_error(status.to_string());
    }

    auto location = "/notes/" + std::to_string(id);
    return HttpResponse::created("{\"id\": " + std::to_string(id) + "}", location);
}

HttpResponse HttpHandler::handle_reset(const HttpRequest& req) {
    auto status = cache_.initialize();
    if (!status) {
        return HttpResponse::internal_error(status.to_string());
    }
    return HttpResponse::ok("OK");
}

HttpResponse HttpHandler::handle_stats(const HttpRequest& req) {
    auto stats = cache_.stats();

    std::ostringstream json;
    json << "{\n";
    json << "  \"users\": " << stats.user_count << ",\n";
    json << "  \"notes\": " << stats.note_count << ",\n";
    json << "  \"public_notes\": " << stats.public_count << ",\n";
    json << "  \"generation\": " << stats.generation << ",\n";
    json << "  \"page_size\": " << cache_.page_size() << ",\n";
    json << "  \"page_requests\": " << stats.page_requests << ",\n";
    json << "  \"page_misses\": " << stats.page_misses << ",\n";
    json << "  \"note_requests\": " << stats.note_requests << ",\n";
    json << "  \"note_misses\": " << stats.note_misses << ",\n";
    json << "  \"user_note_requests\": " << stats.user_note_requests << ",\n";
    json << "  \"notes_created\": " << stats.notes_created << ",\n";
    json << "  \"duplicate_inserts\": " << stats.duplicate_inserts << ",\n";
    json << "  \"create_failures\": " << stats.create_failures << ",\n";
    json << "  \"reloads\": " << stats.reloads << ",\n";
    json << "  \"reload_failures\": " << stats.reload_failures << "\n";
    json << "}\n";

    return HttpResponse::json(json.str());
}

HttpResponse HttpHandler::handle_health(const HttpRequest& req) {
    if (!cache_.ready()) {
        return HttpResponse::service_unavailable("Cache not loaded");
    }
    return HttpResponse::json(R"({"status": "healthy"})");
}

HttpResponse HttpHandler::handle_metrics(const HttpRequest& req) {
    if (!metrics_) {
        return HttpResponse::service_unavailable("Metrics disabled");
    }

    metrics_->collect();
    auto resp = HttpResponse::ok(metrics_->export_prometheus());
    resp.set_content_type("text/plain; version=0.0.4");
    return resp;
}

// Elio handler adapter

elio::coro::task<elio::http::response> HttpHandler::elio_handler(elio::http::context& ctx) {
    auto req = HttpRequest::from_context(ctx);
    auto resp = handle(req);
    co_return resp.to_elio_response();
}

elio::http::router HttpHandler::build_router() {
    elio::http::router router;

    auto dispatch = [this](elio::http::context& ctx) {
        return elio_handler(ctx);
    };

    // Note endpoints
    router.get("/", dispatch);
    router.get("/recent/:page", dispatch);
    router.get("/notes/:id", dispatch);
    router.post("/notes", dispatch);
    router.get("/users/:id/notes", dispatch);

    // Admin/stats endpoints
    router.post("/reset", dispatch);
    router.get("/reset", dispatch);
    router.get("/stats", dispatch);
    router.get("/health", dispatch);
    router.get("/metrics", dispatch);

    return router;
}

// HttpServer implementation using Elio's async HTTP server

HttpServer::HttpServer(const NetworkConfig& config, HttpHandler& handler)
    : config_(config)
    , handler_(handler)
{}

HttpServer::~HttpServer() {
    if (server_) {
        server_->stop();
    }
}

elio::coro::task<Status> HttpServer::start(elio::io::io_context& io_ctx,
                                            elio::runtime::scheduler& sched) {
    running_ = true;

    auto router = handler_.build_router();

    elio::http::server_config server_config;
    server_config.max_request_size = 1024 * 1024;  // Notes are small
    server_config.read_buffer_size = 16 * 1024;
    server_config.keep_alive_timeout = std::chrono::duration_cast<std::chrono::seconds>(config_.read_timeout);
    server_config.max_keep_alive_requests = 1000;
    server_config.enable_logging = true;

    server_ = std::make_unique<elio::http::server>(std::move(router), server_config);

    elio::net::ipv4_address addr(config_.bind_address, config_.http_port);

    auto listen_task = server_->listen(addr, io_ctx, sched);
    sched.spawn(listen_task.release());

    std::cout << "[NoteCache] HTTP server listening on " << config_.bind_address
              << ":" << config_.http_port << "\n" << std::flush;

    co_return Status::make_ok();
}

elio::coro::task<void> HttpServer::stop() {
    running_ = false;
    if (server_) {
        server_->stop();
    }
    co_return;
}

}  // namespace notecache
