#include "notecache/query.hpp"
#include <algorithm>

namespace notecache::query {

bool visible_to(const Note& note, std::optional<UserId> requester) {
    if (note.is_public()) return true;
    return requester && *requester == note.user_id;
}

std::optional<Page> recent_public_page(const Generation& gen, uint64_t page, size_t page_size) {
    if (page_size == 0) {
        return std::nullopt;
    }

    uint64_t total = gen.public_ids.size();
    uint64_t page_count = (total + page_size - 1) / page_size;
    if (page >= page_count) {
        return std::nullopt;
    }

    std::vector<const Note*> ordered;
    ordered.reserve(total);
    for (NoteId id : gen.public_ids) {
        if (const Note* note = gen.find_note(id)) {
            ordered.push_back(note);
        }
    }

    uint64_t start = page * page_size;
    uint64_t end = std::min<uint64_t>(start + page_size, ordered.size());
    if (start >= end) {
        return std::nullopt;
    }

    // Only the prefix up to the end of the page needs to be in order
    std::partial_sort(ordered.begin(), ordered.begin() + end, ordered.end(), NewestFirst{});

    Page result;
    result.page = page;
    result.total = gen.public_count;
    result.page_start = start + 1;
    result.page_end = end;
    result.notes.reserve(end - start);
    for (uint64_t i = start; i < end; ++i) {
        result.notes.push_back(*ordered[i]);
    }
    return result;
}

std::vector<Note> user_notes(const Generation& gen, UserId user_id) {
    std::vector<const Note*> owned;
    for (const auto& [id, note] : gen.notes) {
        if (note.user_id == user_id) {
            owned.push_back(&note);
        }
    }
    std::sort(owned.begin(), owned.end(), NewestFirst{});

    std::vector<Note> result;
    result.reserve(owned.size());
    for (const Note* note : owned) {
        result.push_back(*note);
    }
    return result;
}

std::optional<NoteContext> note_with_context(const Generation& gen,
                                             NoteId note_id,
                                             std::optional<UserId> requester)
{
    const Note* target = gen.find_note(note_id);
    if (!target || !visible_to(*target, requester)) {
        return std::nullopt;
    }

    bool owner_view = requester && *requester == target->user_id;
    auto in_scope = [&](const Note& note) {
        return note.is_public() || (owner_view && note.user_id == target->user_id);
    };

    // Single pass instead of sorting the scope: the newer neighbor is the
    // closest note ranked before the target, the older one the closest ranked after.
    NewestFirst before;
    const Note* newer = nullptr;
    const Note* older = nullptr;
    for (const auto& [id, note] : gen.notes) {
        if (id == target->id || !in_scope(note)) continue;

        if (before(note, *target)) {
            if (!newer || before(*newer, note)) newer = &note;
        } else {
            if (!older || before(note, *older)) older = &note;
        }
    }

    NoteContext ctx;
    ctx.note = *target;
    if (older) ctx.older = *older;
    if (newer) ctx.newer = *newer;
    return ctx;
}

}  // namespace notecache::query
