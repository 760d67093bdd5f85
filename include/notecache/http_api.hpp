#pragma once

#include "types.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include <elio/coro/task.hpp>
#include <elio/http/http_server.hpp>
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace notecache {

// Forward declarations
class NoteCache;

// Header carrying the requesting user's id. Authentication happens upstream.
constexpr const char* USER_HEADER = "X-NoteCache-User";

// HTTP request representation (kept for internal use)
struct HttpRequest {
    std::string method;
    std::string path;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    // Helper methods
    std::string header(const std::string& name) const;

    // application/x-www-form-urlencoded body field
    std::optional<std::string> form_value(const std::string& name) const;

    // Build from Elio context
    static HttpRequest from_context(elio::http::context& ctx);
};

// HTTP response representation (kept for internal use)
struct HttpResponse {
    int status_code = 200;
    std::string status_text = "OK";
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    // Common responses
    static HttpResponse ok(std::string body = {});
    static HttpResponse json(std::string body);
    static HttpResponse created(std::string body, const std::string& location);
    static HttpResponse not_modified();
    static HttpResponse not_found(const std::string& msg = "Not Found");
    static HttpResponse bad_request(const std::string& msg);
    static HttpResponse forbidden(const std::string& msg);
    static HttpResponse conflict(const std::string& msg);
    static HttpResponse internal_error(const std::string& msg);
    static HttpResponse service_unavailable(const std::string& msg);

    void set_content_type(const std::string& type);

    // Convert to Elio response
    elio::http::response to_elio_response() const;
};

// JSON encoding of cache results
std::string json_escape(std::string_view s);
std::string note_to_json(const Note& note);
std::string page_to_json(const Page& page, size_t page_size);
std::string context_to_json(const NoteContext& ctx);
std::string notes_to_json(const std::vector<Note>& notes);

// Strong ETag of a response body
std::string compute_etag(std::string_view body);

// HTTP API handler
class HttpHandler {
public:
    explicit HttpHandler(NoteCache& cache);

    // Set metrics collector for /metrics endpoint
    void set_metrics_collector(MetricsCollector* collector) { metrics_ = collector; }

    // Route a request
    HttpResponse handle(const HttpRequest& req);

    // Build Elio router
    elio::http::router build_router();

private:
    NoteCache& cache_;
    MetricsCollector* metrics_ = nullptr;

    HttpResponse route(const HttpRequest& req);

    // Requester named by USER_HEADER, if it is a known user
    std::optional<UserId> requester(const HttpRequest& req) const;

    // Note endpoints
    HttpResponse handle_top(const HttpRequest& req);
    HttpResponse handle_recent(const HttpRequest& req);
    HttpResponse handle_note(const HttpRequest& req);
    HttpResponse handle_user_notes(const HttpRequest& req);
    HttpResponse handle_create(const HttpRequest& req);

    // Stats/admin endpoints
    HttpResponse handle_reset(const HttpRequest& req);
    HttpResponse handle_stats(const HttpRequest& req);
    HttpResponse handle_health(const HttpRequest& req);
    HttpResponse handle_metrics(const HttpRequest& req);

    // Adds ETag/Cache-Control and answers If-None-Match
    HttpResponse finish_read(const HttpRequest& req, HttpResponse resp,
                             std::optional<UserId> viewer);

    // Elio handler adapter
    elio::coro::task<elio::http::response> elio_handler(elio::http::context& ctx);
};

// HTTP server using Elio's async server
class HttpServer {
public:
    HttpServer(const NetworkConfig& config, HttpHandler& handler);
    ~HttpServer();

    elio::coro::task<Status> start(elio::io::io_context& io_ctx,
                                    elio::runtime::scheduler& sched);
    elio::coro::task<void> stop();

    uint16_t port() const { return config_.http_port; }
    bool is_running() const { return running_; }

private:
    NetworkConfig config_;
    HttpHandler& handler_;
    std::unique_ptr<elio::http::server> server_;
    std::atomic<bool> running_{false};
};

}  // namespace notecache

/*
HTTP API:

  GET  /                     - Top page (page 0, empty when there are no public notes)
  GET  /recent/{page}        - Page of recent public notes, 404 past the last page
  GET  /notes/{id}           - Note with older/newer neighbors, 404 when hidden
  GET  /users/{id}/notes     - All notes of a user, newest first
  POST /notes                - Create note (form body: content, is_private=0|1)
  POST /reset                - Reload the cache from the store

  GET  /stats                - Cache statistics
  GET  /health               - Health check
  GET  /metrics              - Prometheus metrics

Headers:
  X-NoteCache-User: 42       - Requesting user id (required for POST /notes)
  If-None-Match: "..."       - Conditional read, answered with 304

Response Headers:
  ETag: "..."                - XXH3-64 of the body on read endpoints
  Cache-Control: private     - When the response depends on the requester
  Location: /notes/{id}      - On 201 Created
*/
