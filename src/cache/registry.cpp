#include "notecache/registry.hpp"
#include <exception>

namespace notecache {

// Generation implementation

bool Generation::add_note(Note note) {
    if (notes.find(note.id) != notes.end()) {
        return false;
    }

    if (note.is_public()) {
        public_ids.push_back(note.id);
        ++public_count;
    }
    NoteId id = note.id;
    notes.emplace(id, std::move(note));
    return true;
}

const Note* Generation::find_note(NoteId id) const {
    auto it = notes.find(id);
    return it != notes.end() ? &it->second : nullptr;
}

const User* Generation::find_user(UserId id) const {
    auto it = users.find(id);
    return it != users.end() ? &it->second : nullptr;
}

// EntityRegistry implementation

EntityRegistry::EntityRegistry()
    : current_(std::make_unique<Generation>())
{}

EntityRegistry::~EntityRegistry() = default;

Status EntityRegistry::build_generation(INoteStore& store, Generation& staging) {
    std::vector<User> users;
    auto status = store.list_users(users);
    if (!status) {
        return Status::error(ErrorCode::LoadFailed, "listing users: " + status.to_string());
    }

    std::vector<Note> notes;
    status = store.list_notes(notes);
    if (!status) {
        return Status::error(ErrorCode::LoadFailed, "listing notes: " + status.to_string());
    }

    staging.users.reserve(users.size());
    for (auto& user : users) {
        UserId id = user.id;
        staging.users[id] = std::move(user);
    }

    staging.notes.reserve(notes.size());
    for (auto& note : notes) {
        if (!is_valid_timestamp(note.created_at)) {
            return Status::error(ErrorCode::LoadFailed,
                "note " + std::to_string(note.id) + " has malformed created_at '" +
                note.created_at + "'");
        }
        const User* owner = staging.find_user(note.user_id);
        if (!owner) {
            return Status::error(ErrorCode::LoadFailed,
                "note " + std::to_string(note.id) + " references unknown user " +
                std::to_string(note.user_id));
        }
        note.username = owner->username;
        staging.add_note(std::move(note));
    }

    return Status::make_ok();
}

Status EntityRegistry::load(INoteStore& store) {
    std::lock_guard load_lock(load_mutex_);

    {
        std::unique_lock lock(mutex_);
        load_in_flight_ = true;
        inserted_during_load_.clear();
    }

    auto staging = std::make_unique<Generation>();
    Status status;
    try {
        status = build_generation(store, *staging);
    } catch (const std::exception& e) {
        status = Status::error(ErrorCode::LoadFailed, std::string("store threw: ") + e.what());
    }

    std::unique_lock lock(mutex_);
    load_in_flight_ = false;

    if (!status) {
        inserted_during_load_.clear();
        return status;
    }

    // Inserts that landed after the listings were taken
    for (auto& note : inserted_during_load_) {
        if (const User* owner = staging->find_user(note.user_id)) {
            note.username = owner->username;
        }
        staging->add_note(std::move(note));
    }
    inserted_during_load_.clear();

    staging->number = current_->number + 1;
    current_.swap(staging);
    loaded_ = true;

    // The previous generation is released after the lock
    return Status::make_ok();
}

bool EntityRegistry::insert(Note note) {
    std::unique_lock lock(mutex_);

    if (note.username.empty()) {
        if (const User* owner = current_->find_user(note.user_id)) {
            note.username = owner->username;
        }
    }

    if (load_in_flight_) {
        inserted_during_load_.push_back(note);
    }

    if (!current_->add_note(std::move(note))) {
        return false;
    }
    ++current_->number;
    return true;
}

std::optional<Note> EntityRegistry::get(NoteId id) const {
    std::shared_lock lock(mutex_);
    if (const Note* note = current_->find_note(id)) {
        return *note;
    }
    return std::nullopt;
}

std::optional<User> EntityRegistry::find_user(UserId id) const {
    std::shared_lock lock(mutex_);
    if (const User* user = current_->find_user(id)) {
        return *user;
    }
    return std::nullopt;
}

std::optional<User> EntityRegistry::find_user_by_name(std::string_view username) const {
    std::shared_lock lock(mutex_);
    for (const auto& [id, user] : current_->users) {
        if (user.username == username) {
            return user;
        }
    }
    return std::nullopt;
}

uint64_t EntityRegistry::public_count() const {
    std::shared_lock lock(mutex_);
    return current_->public_count;
}

size_t EntityRegistry::note_count() const {
    std::shared_lock lock(mutex_);
    return current_->notes.size();
}

size_t EntityRegistry::user_count() const {
    std::shared_lock lock(mutex_);
    return current_->users.size();
}

uint64_t EntityRegistry::generation() const {
    std::shared_lock lock(mutex_);
    return current_->number;
}

bool EntityRegistry::load_in_flight() const {
    std::shared_lock lock(mutex_);
    return load_in_flight_;
}

size_t EntityRegistry::pending_replay() const {
    std::shared_lock lock(mutex_);
    return inserted_during_load_.size();
}

bool EntityRegistry::loaded() const {
    std::shared_lock lock(mutex_);
    return loaded_;
}

}  // namespace notecache
