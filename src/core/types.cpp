#include "notecache/types.hpp"
#include <cctype>
#include <ctime>

namespace notecache {

// Note implementation
std::string_view Note::title() const noexcept {
    std::string_view view(content);
    auto eol = view.find('\n');
    if (eol == std::string_view::npos) {
        return view;
    }
    return view.substr(0, eol);
}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::LoadFailed: return "Load failed";
        case ErrorCode::StoreError: return "Store error";
        case ErrorCode::ConstraintViolation: return "Constraint violation";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

std::string Status::to_string() const {
    std::string out = error_code_string(code_);
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }
    return out;
}

// Timestamp helpers

std::string format_timestamp(SystemClock::time_point tp) {
    std::time_t t = SystemClock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[TIMESTAMP_LENGTH + 1];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, TIMESTAMP_LENGTH);
}

std::string now_timestamp() {
    return format_timestamp(SystemClock::now());
}

bool is_valid_timestamp(std::string_view ts) {
    if (ts.size() != TIMESTAMP_LENGTH) return false;

    // Positions of the separators in "YYYY-MM-DD HH:MM:SS"
    for (size_t i = 0; i < ts.size(); ++i) {
        char c = ts[i];
        switch (i) {
            case 4: case 7:
                if (c != '-') return false;
                break;
            case 10:
                if (c != ' ') return false;
                break;
            case 13: case 16:
                if (c != ':') return false;
                break;
            default:
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
                break;
        }
    }
    return true;
}

}  // namespace notecache
