#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <optional>

namespace notecache {

// Constants
constexpr size_t DEFAULT_PAGE_SIZE = 100;
constexpr size_t TIMESTAMP_LENGTH = 19;  // "YYYY-MM-DD HH:MM:SS"

// Identifier types
using UserId = int64_t;
using NoteId = int64_t;

// Time types
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using SystemClock = std::chrono::system_clock;

// Registered user. Credential fields are opaque to the cache.
struct User {
    UserId id = 0;
    std::string username;
    std::string password;     // Hex digest
    std::string salt;
    std::string last_access;  // Maintained by the store, not the cache
};

// A note as held by the registry.
struct Note {
    NoteId id = 0;
    UserId user_id = 0;
    std::string content;
    bool is_private = false;
    std::string created_at;   // Ordering key, lexicographic == chronological
    std::string updated_at;
    std::string username;     // Owner name captured at load/insert time

    bool is_public() const noexcept { return !is_private; }

    // First line of the content, used as a title by listing views
    std::string_view title() const noexcept;
};

// Fields supplied by the caller when creating a note. The id comes from the store.
struct NewNote {
    UserId user_id = 0;
    std::string content;
    bool is_private = false;
    std::string created_at;
};

// Newest first; equal timestamps fall back to the higher id first.
struct NewestFirst {
    bool operator()(const Note& a, const Note& b) const noexcept {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.id > b.id;
    }

    bool operator()(const Note* a, const Note* b) const noexcept {
        return (*this)(*a, *b);
    }
};

// One page of recent public notes
struct Page {
    std::vector<Note> notes;
    uint64_t page = 0;
    uint64_t total = 0;       // Public notes in the registry
    uint64_t page_start = 0;  // 1-based rank of the first note on the page
    uint64_t page_end = 0;    // 1-based rank of the last note on the page
};

// A note together with its neighbors in the requester's visibility scope
struct NoteContext {
    Note note;
    std::optional<Note> older;
    std::optional<Note> newer;
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    NotFound,
    InvalidArgument,
    LoadFailed,
    StoreError,
    ConstraintViolation,
    InternalError
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    explicit operator bool() const noexcept { return is_ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    // "<code>: <message>" for logs and error bodies
    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

// Timestamp helpers ("YYYY-MM-DD HH:MM:SS", local time)
std::string format_timestamp(SystemClock::time_point tp);
std::string now_timestamp();
bool is_valid_timestamp(std::string_view ts);

}  // namespace notecache
