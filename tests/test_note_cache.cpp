#include <catch2/catch_test_macros.hpp>
#include "notecache/note_cache.hpp"
#include "notecache/sqlite_store.hpp"
#include "fake_store.hpp"

using namespace notecache;
using notecache::testing::FakeNoteStore;

namespace {

CacheConfig page_size(size_t n) {
    CacheConfig config;
    config.page_size = n;
    return config;
}

StoreConfig in_memory() {
    StoreConfig config;
    config.path = ":memory:";
    return config;
}

NoteId persist(SqliteNoteStore& store, UserId owner, const std::string& content,
               bool is_private, const std::string& created_at) {
    NewNote fresh;
    fresh.user_id = owner;
    fresh.content = content;
    fresh.is_private = is_private;
    fresh.created_at = created_at;
    NoteId id = 0;
    REQUIRE(store.insert_note(fresh, id));
    return id;
}

}  // namespace

TEST_CASE("Initial load and reset", "[note_cache]") {
    FakeNoteStore store;
    store.add_user(1, "alice");
    store.add_note(1, "hello", false, "2024-01-01 10:00:00");

    NoteCache cache(store, page_size(10));
    REQUIRE(!cache.ready());

    SECTION("Successful load") {
        REQUIRE(cache.initialize());
        REQUIRE(cache.ready());
        REQUIRE(cache.stats().reloads == 1);
        REQUIRE(cache.stats().note_count == 1);
    }

    SECTION("Failed initial load is reported") {
        store.fail_list_users = ErrorCode::StoreError;
        auto status = cache.initialize();
        REQUIRE(status.code() == ErrorCode::LoadFailed);
        REQUIRE(!cache.ready());
        REQUIRE(cache.stats().reload_failures == 1);
    }

    SECTION("Failed reset keeps serving the previous data") {
        REQUIRE(cache.initialize());
        store.add_note(1, "added behind the cache", false, "2024-01-02 10:00:00");
        store.fail_list_notes = ErrorCode::StoreError;

        REQUIRE(!cache.initialize());
        REQUIRE(cache.ready());
        auto page = cache.get_page(0);
        REQUIRE(page);
        REQUIRE(page->total == 1);
    }

    SECTION("Reset picks up rows written behind the cache") {
        REQUIRE(cache.initialize());
        store.add_note(1, "added behind the cache", false, "2024-01-02 10:00:00");
        REQUIRE(cache.get_page(0)->total == 1);

        REQUIRE(cache.initialize());
        REQUIRE(cache.get_page(0)->total == 2);
    }
}

TEST_CASE("Reads do not touch the store", "[note_cache]") {
    FakeNoteStore store;
    store.add_user(1, "alice");
    store.add_note(1, "hello", false, "2024-01-01 10:00:00");

    NoteCache cache(store, page_size(10));
    REQUIRE(cache.initialize());
    int calls = store.list_calls;

    cache.get_page(0);
    cache.get_user_notes(1);
    cache.get_note_with_context(1);
    REQUIRE(store.list_calls == calls);
}

TEST_CASE("Create note", "[note_cache]") {
    FakeNoteStore store;
    store.add_user(1, "alice");
    store.add_user(2, "bob");

    NoteCache cache(store, page_size(10));
    REQUIRE(cache.initialize());

    SECTION("Public note becomes visible immediately") {
        NoteId id = 0;
        REQUIRE(cache.create_note(1, "Title\nbody", false, id));
        REQUIRE(id > 0);

        auto page = cache.get_page(0);
        REQUIRE(page);
        REQUIRE(page->total == 1);
        REQUIRE(page->notes[0].id == id);
        REQUIRE(page->notes[0].username == "alice");
        REQUIRE(page->notes[0].title() == "Title");
        REQUIRE(is_valid_timestamp(page->notes[0].created_at));
        REQUIRE(cache.stats().notes_created == 1);
    }

    SECTION("Private note is listed for its owner only") {
        NoteId id = 0;
        REQUIRE(cache.create_note(2, "diary", true, id));

        REQUIRE(!cache.get_page(0));
        REQUIRE(cache.get_user_notes(2).size() == 1);
        REQUIRE(!cache.get_note_with_context(id));
        REQUIRE(!cache.get_note_with_context(id, UserId{1}));
        REQUIRE(cache.get_note_with_context(id, UserId{2}));
    }

    SECTION("Store failure leaves the registry unchanged") {
        store.fail_insert = ErrorCode::StoreError;
        auto before = cache.stats();

        NoteId id = 0;
        auto status = cache.create_note(1, "lost", false, id);
        REQUIRE(status.code() == ErrorCode::StoreError);
        REQUIRE(status.message() == "insert rejected");

        auto after = cache.stats();
        REQUIRE(after.note_count == before.note_count);
        REQUIRE(after.public_count == before.public_count);
        REQUIRE(after.generation == before.generation);
        REQUIRE(after.create_failures == 1);
    }

    SECTION("Unknown owner is rejected by the store") {
        NoteId id = 0;
        auto status = cache.create_note(42, "who am i", false, id);
        REQUIRE(status.code() == ErrorCode::ConstraintViolation);
        REQUIRE(cache.stats().note_count == 0);
    }
}

TEST_CASE("Counter invariant across operations", "[note_cache]") {
    FakeNoteStore store;
    store.add_user(1, "alice");
    for (int i = 0; i < 5; ++i) {
        store.add_note(1, "n", i % 2 == 1, "2024-01-01 10:00:0" + std::to_string(i));
    }

    NoteCache cache(store, page_size(2));

    auto check = [&] {
        auto public_seen = cache.registry().read([](const Generation& gen) {
            uint64_t n = 0;
            for (const auto& [id, note] : gen.notes) {
                if (note.is_public()) ++n;
            }
            return n;
        });
        REQUIRE(cache.stats().public_count == public_seen);
    };

    REQUIRE(cache.initialize());
    check();

    NoteId id = 0;
    REQUIRE(cache.create_note(1, "public", false, id));
    check();
    REQUIRE(cache.create_note(1, "private", true, id));
    check();

    REQUIRE(cache.initialize());
    check();
    REQUIRE(cache.stats().note_count == 7);
    REQUIRE(cache.stats().public_count == 4);
}

TEST_CASE("SQLite backed cache", "[note_cache][sqlite]") {
    SqliteNoteStore store(in_memory());
    User alice{1, "alice", "", "", ""};
    User bob{2, "bob", "", "", ""};
    REQUIRE(store.insert_user(alice));
    REQUIRE(store.insert_user(bob));

    SECTION("Three public notes and one private note") {
        auto t1 = persist(store, 1, "first", false, "2024-06-01 09:00:01");
        auto t2 = persist(store, 2, "second", false, "2024-06-01 09:00:02");
        auto t3 = persist(store, 1, "third", false, "2024-06-01 09:00:03");
        auto t4 = persist(store, 2, "private", true, "2024-06-01 09:00:04");

        NoteCache cache(store, page_size(10));
        REQUIRE(cache.initialize());

        auto page = cache.get_page(0);
        REQUIRE(page);
        REQUIRE(page->total == 3);
        REQUIRE(page->notes.size() == 3);
        REQUIRE(page->notes[0].id == t3);
        REQUIRE(page->notes[1].id == t2);
        REQUIRE(page->notes[2].id == t1);

        auto ctx = cache.get_note_with_context(t2);
        REQUIRE(ctx);
        REQUIRE(ctx->note.id == t2);
        REQUIRE(ctx->older->id == t1);
        REQUIRE(ctx->newer->id == t3);

        auto priv = cache.get_note_with_context(t4, UserId{2});
        REQUIRE(priv);
        REQUIRE(priv->note.id == t4);
        REQUIRE(priv->older->id == t3);
        REQUIRE(!priv->newer);

        REQUIRE(!cache.get_note_with_context(t4));
        REQUIRE(!cache.get_note_with_context(t4, UserId{1}));
    }

    SECTION("Pagination boundary") {
        for (int i = 0; i < 5; ++i) {
            persist(store, 1, "n", false, "2024-06-01 09:00:0" + std::to_string(i));
        }
        NoteCache cache(store, page_size(2));
        REQUIRE(cache.initialize());

        REQUIRE(cache.get_page(0));
        REQUIRE(cache.get_page(2));
        REQUIRE(cache.get_page(2)->notes.size() == 1);
        REQUIRE(!cache.get_page(3));
        REQUIRE(cache.stats().page_misses == 1);
    }

    SECTION("Reload matches a fresh cache") {
        persist(store, 1, "a", false, "2024-06-01 09:00:01");
        persist(store, 2, "b", true, "2024-06-01 09:00:02");

        NoteCache cache(store, page_size(10));
        REQUIRE(cache.initialize());

        NoteId id = 0;
        REQUIRE(cache.create_note(1, "c", false, id));
        REQUIRE(cache.create_note(2, "d", true, id));
        REQUIRE(cache.initialize());

        NoteCache fresh(store, page_size(10));
        REQUIRE(fresh.initialize());

        auto a = cache.stats();
        auto b = fresh.stats();
        REQUIRE(a.note_count == b.note_count);
        REQUIRE(a.public_count == b.public_count);
        REQUIRE(a.user_count == b.user_count);

        auto page_a = cache.get_page(0);
        auto page_b = fresh.get_page(0);
        REQUIRE(page_a->notes.size() == page_b->notes.size());
        for (size_t i = 0; i < page_a->notes.size(); ++i) {
            REQUIRE(page_a->notes[i].id == page_b->notes[i].id);
        }
    }

    SECTION("Owner names are captured at load time") {
        auto id = persist(store, 1, "mine", false, "2024-06-01 09:00:01");
        NoteCache cache(store, page_size(10));
        REQUIRE(cache.initialize());

        REQUIRE(store.rename_user(1, "alicia"));
        REQUIRE(cache.get_note_with_context(id)->note.username == "alice");

        REQUIRE(cache.initialize());
        REQUIRE(cache.get_note_with_context(id)->note.username == "alicia");
        REQUIRE(cache.find_user_by_name("alicia"));
    }

    SECTION("Empty content is rejected by the store") {
        NoteCache cache(store, page_size(10));
        REQUIRE(cache.initialize());
        auto generation = cache.stats().generation;

        NoteId id = 0;
        auto status = cache.create_note(1, "", false, id);
        REQUIRE(status.code() == ErrorCode::ConstraintViolation);
        REQUIRE(cache.stats().note_count == 0);
        REQUIRE(cache.stats().generation == generation);
        REQUIRE(cache.stats().create_failures == 1);
    }

    SECTION("Insert into the store is mirrored with the store's id") {
        NoteCache cache(store, page_size(10));
        REQUIRE(cache.initialize());

        NoteId id = 0;
        REQUIRE(cache.create_note(2, "hello", false, id));

        std::vector<Note> rows;
        REQUIRE(store.list_notes(rows));
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].id == id);
        REQUIRE(cache.get_note_with_context(id)->note.content == "hello");
    }
}
