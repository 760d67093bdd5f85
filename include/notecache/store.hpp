#pragma once

#include "types.hpp"
#include <vector>

namespace notecache {

// Persisted store the registry mirrors.
// Implementations must be safe to call from several request threads at once.
class INoteStore {
public:
    virtual ~INoteStore() = default;

    // Full listings used by the registry load
    virtual Status list_users(std::vector<User>& out) = 0;

    // Notes come back without the denormalized owner name
    virtual Status list_notes(std::vector<Note>& out) = 0;

    // Persist a note and hand back the id the store generated.
    // Unknown owners fail with ErrorCode::ConstraintViolation.
    virtual Status insert_note(const NewNote& note, NoteId& out_id) = 0;
};

}  // namespace notecache
