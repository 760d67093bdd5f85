#pragma once

#include "types.hpp"
#include "config.hpp"
#include "store.hpp"
#include "registry.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notecache {

// The cache as seen by the surrounding service.
//
// Reads are answered from the registry without touching the store. The only
// mutation path is create_note(), which writes to the store first and mirrors
// the committed note into the registry afterwards.
class NoteCache {
public:
    NoteCache(INoteStore& store, const CacheConfig& config);
    ~NoteCache();

    NoteCache(const NoteCache&) = delete;
    NoteCache& operator=(const NoteCache&) = delete;

    // Full load from the store. Called once at startup and again on reset.
    // A failed reset leaves the previous data serving.
    Status initialize();

    // Recent public notes, std::nullopt for a page past the end
    std::optional<Page> get_page(uint64_t page);

    // All notes of a user, newest first
    std::vector<Note> get_user_notes(UserId user_id);

    // std::nullopt for unknown notes and for private notes of someone else
    std::optional<NoteContext> get_note_with_context(
        NoteId note_id,
        std::optional<UserId> requester = std::nullopt);

    // Store insert, then registry insert. Store errors come back unchanged
    // and leave the registry untouched.
    Status create_note(UserId owner, std::string content, bool is_private, NoteId& out_id);

    // User lookups for the service layer
    std::optional<User> find_user(UserId id) const;
    std::optional<User> find_user_by_name(std::string_view username) const;

    bool ready() const { return registry_.loaded(); }
    size_t page_size() const noexcept { return config_.page_size; }

    const EntityRegistry& registry() const noexcept { return registry_; }

    // Statistics
    struct Stats {
        uint64_t page_requests = 0;
        uint64_t page_misses = 0;
        uint64_t note_requests = 0;
        uint64_t note_misses = 0;
        uint64_t user_note_requests = 0;
        uint64_t notes_created = 0;
        uint64_t duplicate_inserts = 0;
        uint64_t create_failures = 0;
        uint64_t reloads = 0;
        uint64_t reload_failures = 0;

        size_t user_count = 0;
        size_t note_count = 0;
        uint64_t public_count = 0;
        uint64_t generation = 0;
    };

    Stats stats() const;

private:
    INoteStore& store_;
    CacheConfig config_;
    EntityRegistry registry_;

    // Statistics
    std::atomic<uint64_t> page_requests_{0};
    std::atomic<uint64_t> page_misses_{0};
    std::atomic<uint64_t> note_requests_{0};
    std::atomic<uint64_t> note_misses_{0};
    std::atomic<uint64_t> user_note_requests_{0};
    std::atomic<uint64_t> notes_created_{0};
    std::atomic<uint64_t> duplicate_inserts_{0};
    std::atomic<uint64_t> create_failures_{0};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> reload_failures_{0};
};

}  // namespace notecache
