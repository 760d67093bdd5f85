#pragma once

#include "types.hpp"
#include "store.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace notecache {

// One complete state of the registry between a load and the next.
struct Generation {
    std::unordered_map<UserId, User> users;
    std::unordered_map<NoteId, Note> notes;

    // Visibility index: ids of public notes, in insertion order
    std::vector<NoteId> public_ids;
    uint64_t public_count = 0;

    // Bumped by every successful load and every effective insert
    uint64_t number = 0;

    // Stores the note unless its id is already present.
    // Returns false for a duplicate, leaving the generation untouched.
    bool add_note(Note note);

    const Note* find_note(NoteId id) const;
    const User* find_user(UserId id) const;
};

// In-memory mirror of the persisted users and notes.
//
// All state sits behind one reader/writer lock. Queries run under the shared
// lock through read(); load() and insert() take it exclusively, so a reader
// sees either a whole generation or the next one, never a partial update.
class EntityRegistry {
public:
    EntityRegistry();
    ~EntityRegistry();

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    // Rebuilds the registry from the store. The listings are fetched and
    // validated into a staging generation without holding the lock; the
    // staging generation is then swapped in. On failure the current
    // generation keeps serving and ErrorCode::LoadFailed is returned, also
    // when the store throws.
    Status load(INoteStore& store);

    // Mirrors a note already committed to the store. A note whose id is
    // present is ignored (returns false). The owner name is resolved here
    // when the caller left it empty.
    bool insert(Note note);

    std::optional<Note> get(NoteId id) const;
    std::optional<User> find_user(UserId id) const;
    std::optional<User> find_user_by_name(std::string_view username) const;

    uint64_t public_count() const;
    size_t note_count() const;
    size_t user_count() const;
    uint64_t generation() const;
    bool loaded() const;

    // Load bookkeeping; both are idle outside a load
    bool load_in_flight() const;
    size_t pending_replay() const;

    // Runs fn(const Generation&) under the shared lock and returns its result.
    // The reference must not escape fn.
    template <typename Fn>
    auto read(Fn&& fn) const {
        std::shared_lock lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<const Generation&>(*current_));
    }

private:
    mutable std::shared_mutex mutex_;
    std::unique_ptr<Generation> current_;
    bool loaded_ = false;

    // Serializes loads. While a load is in flight, inserts are also recorded
    // here so the swap can carry them into the new generation.
    std::mutex load_mutex_;
    bool load_in_flight_ = false;
    std::vector<Note> inserted_during_load_;

    static Status build_generation(INoteStore& store, Generation& staging);
};

}  // namespace notecache
