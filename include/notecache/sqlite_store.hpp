#pragma once

#include "store.hpp"
#include "config.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace notecache {

// Persisted store backed by a single SQLite database.
//
// Tables:
//   users(id, username, password, salt, last_access)
//   notes(id, user, content, is_private, created_at, updated_at)
//
// notes.user references users.id with foreign keys enforced, so inserting a
// note for an unknown owner fails with ErrorCode::ConstraintViolation. So does
// a note with empty content.
class SqliteNoteStore : public INoteStore {
public:
    // Opens (or creates) the database. Throws std::runtime_error when the
    // database cannot be opened or the schema cannot be created.
    explicit SqliteNoteStore(const StoreConfig& config);
    ~SqliteNoteStore() override;

    SqliteNoteStore(const SqliteNoteStore&) = delete;
    SqliteNoteStore& operator=(const SqliteNoteStore&) = delete;

    // INoteStore interface
    Status list_users(std::vector<User>& out) override;
    Status list_notes(std::vector<Note>& out) override;
    Status insert_note(const NewNote& note, NoteId& out_id) override;

    // Administrative helpers, not used by the cache
    Status insert_user(const User& user);
    Status rename_user(UserId id, const std::string& username);

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;  // One connection, serialized

    void create_schema();
    Status exec(const char* sql);
    Status make_error(int rc, const std::string& what) const;
};

}  // namespace notecache
