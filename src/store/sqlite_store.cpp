#include "notecache/sqlite_store.hpp"
#include <sqlite3.h>
#include <iostream>
#include <stdexcept>

namespace notecache {

namespace {

const char* SCHEMA = R"(
    CREATE TABLE IF NOT EXISTS users (
        id INTEGER PRIMARY KEY,
        username TEXT NOT NULL UNIQUE,
        password TEXT NOT NULL DEFAULT '',
        salt TEXT NOT NULL DEFAULT '',
        last_access TEXT NOT NULL DEFAULT ''
    );
    CREATE TABLE IF NOT EXISTS notes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        user INTEGER NOT NULL REFERENCES users(id),
        content TEXT NOT NULL CHECK (content <> ''),
        is_private INTEGER NOT NULL DEFAULT 0,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_notes_created ON notes(created_at);
)";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

// Finalizes a prepared statement when it leaves scope
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) {
            (void)sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool prepared() const noexcept { return rc_ == SQLITE_OK; }
    int prepare_rc() const noexcept { return rc_; }
    sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

}  // namespace

SqliteNoteStore::SqliteNoteStore(const StoreConfig& config)
    : path_(config.path)
{
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("Failed to open note store " + path_ + ": " + msg);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(config.busy_timeout.count()));

    auto status = exec("PRAGMA foreign_keys=ON");
    if (!status) {
        std::cerr << "[NoteCache] Warning: " << status.message() << "\n";
    }

    if (config.create_schema) {
        try {
            create_schema();
        } catch (const std::exception&) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }
}

SqliteNoteStore::~SqliteNoteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteNoteStore::create_schema() {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, SCHEMA, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string err = errmsg ? errmsg : "Unknown";
        sqlite3_free(errmsg);
        throw std::runtime_error("Failed to create note store schema: " + err);
    }
}

Status SqliteNoteStore::exec(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string err = errmsg ? errmsg : "Unknown";
        sqlite3_free(errmsg);
        return Status::error(ErrorCode::StoreError, std::string(sql) + ": " + err);
    }
    return Status::make_ok();
}

Status SqliteNoteStore::make_error(int rc, const std::string& what) const {
    std::string msg = what + ": " + sqlite3_errmsg(db_);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return Status::error(ErrorCode::ConstraintViolation, std::move(msg));
    }
    return Status::error(ErrorCode::StoreError, std::move(msg));
}

Status SqliteNoteStore::list_users(std::vector<User>& out) {
    std::lock_guard lock(mutex_);
    out.clear();

    Statement stmt(db_,
        "SELECT id, username, password, salt, last_access FROM users ORDER BY id");
    if (!stmt.prepared()) {
        return make_error(stmt.prepare_rc(), "list users");
    }

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        User user;
        user.id = sqlite3_column_int64(stmt.get(), 0);
        user.username = column_text(stmt.get(), 1);
        user.password = column_text(stmt.get(), 2);
        user.salt = column_text(stmt.get(), 3);
        user.last_access = column_text(stmt.get(), 4);
        out.push_back(std::move(user));
    }

    if (rc != SQLITE_DONE) {
        out.clear();
        return make_error(rc, "list users");
    }
    return Status::make_ok();
}

Status SqliteNoteStore::list_notes(std::vector<Note>& out) {
    std::lock_guard lock(mutex_);
    out.clear();

    Statement stmt(db_,
        "SELECT id, user, content, is_private, created_at, updated_at FROM notes ORDER BY id");
    if (!stmt.prepared()) {
        return make_error(stmt.prepare_rc(), "list notes");
    }

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Note note;
        note.id = sqlite3_column_int64(stmt.get(), 0);
        note.user_id = sqlite3_column_int64(stmt.get(), 1);
        note.content = column_text(stmt.get(), 2);
        note.is_private = sqlite3_column_int(stmt.get(), 3) != 0;
        note.created_at = column_text(stmt.get(), 4);
        note.updated_at = column_text(stmt.get(), 5);
        out.push_back(std::move(note));
    }

    if (rc != SQLITE_DONE) {
        out.clear();
        return make_error(rc, "list notes");
    }
    return Status::make_ok();
}

Status SqliteNoteStore::insert_note(const NewNote& note, NoteId& out_id) {
    std::lock_guard lock(mutex_);

    Statement stmt(db_,
        "INSERT INTO notes (user, content, is_private, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?)");
    if (!stmt.prepared()) {
        return make_error(stmt.prepare_rc(), "insert note");
    }

    sqlite3_bind_int64(stmt.get(), 1, note.user_id);
    sqlite3_bind_text(stmt.get(), 2, note.content.data(),
                      static_cast<int>(note.content.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 3, note.is_private ? 1 : 0);
    sqlite3_bind_text(stmt.get(), 4, note.created_at.data(),
                      static_cast<int>(note.created_at.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 5, note.created_at.data(),
                      static_cast<int>(note.created_at.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return make_error(rc, "insert note");
    }

    out_id = sqlite3_last_insert_rowid(db_);
    return Status::make_ok();
}

Status SqliteNoteStore::insert_user(const User& user) {
    std::lock_guard lock(mutex_);

    Statement stmt(db_,
        "INSERT INTO users (id, username, password, salt, last_access) "
        "VALUES (?, ?, ?, ?, ?)");
    if (!stmt.prepared()) {
        return make_error(stmt.prepare_rc(), "insert user");
    }

    sqlite3_bind_int64(stmt.get(), 1, user.id);
    sqlite3_bind_text(stmt.get(), 2, user.username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, user.password.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, user.salt.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 5, user.last_access.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return make_error(rc, "insert user");
    }
    return Status::make_ok();
}

Status SqliteNoteStore::rename_user(UserId id, const std::string& username) {
    std::lock_guard lock(mutex_);

    Statement stmt(db_, "UPDATE users SET username = ? WHERE id = ?");
    if (!stmt.prepared()) {
        return make_error(stmt.prepare_rc(), "rename user");
    }

    sqlite3_bind_text(stmt.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, id);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        return make_error(rc, "rename user");
    }
    if (sqlite3_changes(db_) == 0) {
        return Status::error(ErrorCode::NotFound, "No user with id " + std::to_string(id));
    }
    return Status::make_ok();
}

}  // namespace notecache
