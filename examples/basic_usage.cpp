/*
 * NoteCache Basic Usage Example
 *
 * This example demonstrates:
 * - Opening an in-memory SQLite store and seeding users
 * - Loading the cache and creating notes through it
 * - Paging recent public notes and reading a note with its neighbors
 */

#include "notecache/note_cache.hpp"
#include "notecache/sqlite_store.hpp"
#include <iostream>
#include <string>

int main() {
    using namespace notecache;

    std::cout << "NoteCache Basic Usage Example\n";
    std::cout << "=============================\n\n";

    StoreConfig store_config;
    store_config.path = ":memory:";

    CacheConfig cache_config;
    cache_config.page_size = 3;

    try {
        SqliteNoteStore store(store_config);

        for (const auto& user : {User{1, "alice", "", "", ""}, User{2, "bob", "", "", ""}}) {
            auto status = store.insert_user(user);
            if (!status) {
                std::cerr << "Failed to seed " << user.username << ": " << status.to_string() << "\n";
                return 1;
            }
        }

        NoteCache cache(store, cache_config);
        auto status = cache.initialize();
        if (!status) {
            std::cerr << "Load failed: " << status.to_string() << "\n";
            return 1;
        }

        // Create a few notes; private ones stay out of the public pages
        const struct { UserId owner; const char* content; bool is_private; } drafts[] = {
            {1, "Shopping\nmilk, eggs", false},
            {2, "Reading list\nSICP", false},
            {2, "Diary\nnot for you", true},
            {1, "Ideas\nnote cache", false},
            {1, "Travel\nLisbon", false},
        };

        NoteId last_id = 0;
        for (const auto& draft : drafts) {
            status = cache.create_note(draft.owner, draft.content, draft.is_private, last_id);
            if (!status) {
                std::cerr << "Create failed: " << status.to_string() << "\n";
                return 1;
            }
        }

        // Page through recent public notes
        for (uint64_t p = 0;; ++p) {
            auto page = cache.get_page(p);
            if (!page) break;

            std::cout << "Page " << p << " (" << page->page_start << "-" << page->page_end
                      << " of " << page->total << "):\n";
            for (const auto& note : page->notes) {
                std::cout << "  #" << note.id << " " << note.title()
                          << " by " << note.username << "\n";
            }
        }
        std::cout << "\n";

        // A note with its neighbors
        auto ctx = cache.get_note_with_context(2);
        if (ctx) {
            std::cout << "Note #" << ctx->note.id << " \"" << ctx->note.title() << "\"\n";
            std::cout << "  older: " << (ctx->older ? std::string(ctx->older->title()) : "-") << "\n";
            std::cout << "  newer: " << (ctx->newer ? std::string(ctx->newer->title()) : "-") << "\n";
        }

        // The private note is only visible to its owner
        std::cout << "\nNote #3 anonymous: "
                  << (cache.get_note_with_context(3) ? "visible" : "not found") << "\n";
        std::cout << "Note #3 as bob:    "
                  << (cache.get_note_with_context(3, UserId{2}) ? "visible" : "not found") << "\n";

        auto stats = cache.stats();
        std::cout << "\nRegistry: " << stats.user_count << " users, " << stats.note_count
                  << " notes, " << stats.public_count << " public, generation "
                  << stats.generation << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
