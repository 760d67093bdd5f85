#pragma once

#include "types.hpp"
#include "registry.hpp"
#include <optional>
#include <vector>

namespace notecache::query {

// Stateless read operations over one registry generation.
// Callers hold the registry's shared lock for the duration (see EntityRegistry::read).
//
// Every listing is ordered newest first by created_at. Notes created within the
// same second are ordered by descending id, so repeated calls agree with each other.

// Whether a note is visible to the requester: public, or owned by the requester.
bool visible_to(const Note& note, std::optional<UserId> requester);

// Page `page` of the public notes. std::nullopt when the page starts at or
// beyond the number of public notes.
std::optional<Page> recent_public_page(const Generation& gen, uint64_t page, size_t page_size);

// Every note owned by the user, private ones included. Unbounded.
std::vector<Note> user_notes(const Generation& gen, UserId user_id);

// The note plus its neighbors, or std::nullopt when the note does not exist or
// is private to someone other than the requester. Neighbors are taken from the
// public notes, plus the owner's private notes when the requester owns the note.
std::optional<NoteContext> note_with_context(const Generation& gen,
                                             NoteId note_id,
                                             std::optional<UserId> requester);

}  // namespace notecache::query
