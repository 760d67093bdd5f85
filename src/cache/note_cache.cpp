#include "notecache/note_cache.hpp"
#include "notecache/metrics.hpp"
#include "notecache/query.hpp"
#include <iostream>

namespace notecache {

NoteCache::NoteCache(INoteStore& store, const CacheConfig& config)
    : store_(store)
    , config_(config)
{}

NoteCache::~NoteCache() = default;

Status NoteCache::initialize() {
    LatencyTimer timer(metrics().load_latency_ms);

    auto status = registry_.load(store_);
    if (!status) {
        reload_failures_++;
        std::cerr << "[NoteCache] Load failed: " << status.message()
                  << (registry_.loaded() ? " (previous data still serving)" : "") << "\n";
        return status;
    }

    reloads_++;
    std::cout << "[NoteCache] Loaded generation " << registry_.generation()
              << ": " << registry_.user_count() << " users, "
              << registry_.note_count() << " notes ("
              << registry_.public_count() << " public) in "
              << timer.elapsed_ms() << " ms\n";
    return Status::make_ok();
}

std::optional<Page> NoteCache::get_page(uint64_t page) {
    NOTECACHE_TIME_OPERATION(metrics().page_latency_ms);
    page_requests_++;

    auto result = registry_.read([&](const Generation& gen) {
        return query::recent_public_page(gen, page, config_.page_size);
    });
    if (!result) {
        page_misses_++;
    }
    return result;
}

std::vector<Note> NoteCache::get_user_notes(UserId user_id) {
    NOTECACHE_TIME_OPERATION(metrics().user_notes_latency_ms);
    user_note_requests_++;

    return registry_.read([&](const Generation& gen) {
        return query::user_notes(gen, user_id);
    });
}

std::optional<NoteContext> NoteCache::get_note_with_context(
    NoteId note_id,
    std::optional<UserId> requester)
{
    NOTECACHE_TIME_OPERATION(metrics().note_latency_ms);
    note_requests_++;

    auto result = registry_.read([&](const Generation& gen) {
        return query::note_with_context(gen, note_id, requester);
    });
    if (!result) {
        note_misses_++;
    }
    return result;
}

Status NoteCache::create_note(UserId owner, std::string content, bool is_private, NoteId& out_id) {
    NOTECACHE_TIME_OPERATION(metrics().create_latency_ms);

    NewNote fresh;
    fresh.user_id = owner;
    fresh.content = std::move(content);
    fresh.is_private = is_private;
    fresh.created_at = now_timestamp();

    NoteId id = 0;
    auto status = store_.insert_note(fresh, id);
    if (!status) {
        create_failures_++;
        std::cerr << "[NoteCache] Insert for user " << owner << " failed: "
                  << status.to_string() << "\n";
        return status;
    }

    Note note;
    note.id = id;
    note.user_id = owner;
    note.content = std::move(fresh.content);
    note.is_private = is_private;
    note.created_at = fresh.created_at;
    note.updated_at = fresh.created_at;

    if (registry_.insert(std::move(note))) {
        notes_created_++;
    } else {
        duplicate_inserts_++;
    }

    out_id = id;
    return Status::make_ok();
}

std::optional<User> NoteCache::find_user(UserId id) const {
    return registry_.find_user(id);
}

std::optional<User> NoteCache::find_user_by_name(std::string_view username) const {
    return registry_.find_user_by_name(username);
}

NoteCache::Stats NoteCache::stats() const {
    Stats s;
    s.page_requests = page_requests_.load();
    s.page_misses = page_misses_.load();
    s.note_requests = note_requests_.load();
    s.note_misses = note_misses_.load();
    s.user_note_requests = user_note_requests_.load();
    s.notes_created = notes_created_.load();
    s.duplicate_inserts = duplicate_inserts_.load();
    s.create_failures = create_failures_.load();
    s.reloads = reloads_.load();
    s.reload_failures = reload_failures_.load();

    // One shared acquisition so the counts belong to the same generation
    registry_.read([&](const Generation& gen) {
        s.user_count = gen.users.size();
        s.note_count = gen.notes.size();
        s.public_count = gen.public_count;
        s.generation = gen.number;
    });
    return s;
}

}  // namespace notecache
