#include <catch2/catch_test_macros.hpp>
#include "notecache/registry.hpp"
#include "fake_store.hpp"
#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

using namespace notecache;
using notecache::testing::FakeNoteStore;
using notecache::testing::make_note;

namespace {

// Public-note count recomputed from scratch
uint64_t count_public(const EntityRegistry& registry) {
    return registry.read([](const Generation& gen) {
        uint64_t n = 0;
        for (const auto& [id, note] : gen.notes) {
            if (note.is_public()) ++n;
        }
        return n;
    });
}

FakeNoteStore sample_store() {
    FakeNoteStore store;
    store.add_user(1, "alice");
    store.add_user(2, "bob");
    store.add_note(1, "first", false, "2024-01-01 10:00:00");
    store.add_note(2, "secret", true, "2024-01-01 11:00:00");
    store.add_note(2, "second", false, "2024-01-01 12:00:00");
    return store;
}

}  // namespace

TEST_CASE("Registry load", "[registry]") {
    EntityRegistry registry;
    REQUIRE(!registry.loaded());
    REQUIRE(registry.note_count() == 0);

    auto store = sample_store();

    SECTION("Loads users and notes") {
        REQUIRE(registry.load(store));
        REQUIRE(registry.loaded());
        REQUIRE(registry.user_count() == 2);
        REQUIRE(registry.note_count() == 3);
        REQUIRE(registry.public_count() == 2);
        REQUIRE(registry.public_count() == count_public(registry));
    }

    SECTION("Owner names are attached") {
        REQUIRE(registry.load(store));
        auto note = registry.get(2);
        REQUIRE(note);
        REQUIRE(note->username == "bob");
    }

    SECTION("Each load starts a new generation") {
        REQUIRE(registry.load(store));
        auto first = registry.generation();
        REQUIRE(registry.load(store));
        REQUIRE(registry.generation() > first);
    }

    SECTION("Reload replaces the contents") {
        REQUIRE(registry.load(store));
        store.add_note(1, "third", false, "2024-01-02 09:00:00");
        REQUIRE(registry.load(store));
        REQUIRE(registry.note_count() == 4);
        REQUIRE(registry.public_count() == 3);
    }

    SECTION("User lookups") {
        REQUIRE(registry.load(store));
        REQUIRE(registry.find_user(1)->username == "alice");
        REQUIRE(registry.find_user_by_name("bob")->id == 2);
        REQUIRE(!registry.find_user(99));
        REQUIRE(!registry.find_user_by_name("carol"));
    }
}

TEST_CASE("Registry load failures", "[registry]") {
    EntityRegistry registry;
    auto store = sample_store();

    SECTION("Initial load failure leaves the registry unloaded") {
        store.fail_list_notes = ErrorCode::StoreError;
        auto status = registry.load(store);
        REQUIRE(!status);
        REQUIRE(status.code() == ErrorCode::LoadFailed);
        REQUIRE(!registry.loaded());
        REQUIRE(registry.note_count() == 0);
    }

    SECTION("User listing failure") {
        store.fail_list_users = ErrorCode::StoreError;
        auto status = registry.load(store);
        REQUIRE(status.code() == ErrorCode::LoadFailed);
        REQUIRE(status.message().find("listing users") != std::string::npos);
    }

    SECTION("Dangling owner reference aborts the load") {
        store.add_note(42, "orphan", false, "2024-01-03 00:00:00");
        auto status = registry.load(store);
        REQUIRE(status.code() == ErrorCode::LoadFailed);
        REQUIRE(status.message().find("unknown user 42") != std::string::npos);
        REQUIRE(!registry.loaded());
    }

    SECTION("Malformed timestamp aborts the load") {
        store.add_note(1, "undated", false, "yesterday");
        auto status = registry.load(store);
        REQUIRE(status.code() == ErrorCode::LoadFailed);
        REQUIRE(status.message().find("malformed created_at") != std::string::npos);
        REQUIRE(!registry.loaded());
    }

    SECTION("Throwing store is reported as a failed load") {
        REQUIRE(registry.load(store));
        auto generation = registry.generation();

        store.throws_on_list_notes = 1;
        auto status = registry.load(store);
        REQUIRE(status.code() == ErrorCode::LoadFailed);
        REQUIRE(status.message().find("listing interrupted") != std::string::npos);
        REQUIRE(registry.generation() == generation);

        // Later inserts are not buffered for a replay that never comes
        REQUIRE(!registry.load_in_flight());
        for (NoteId id = 20; id < 23; ++id) {
            REQUIRE(registry.insert(make_note(id, 1, "2024-01-05 00:00:00")));
        }
        REQUIRE(registry.pending_replay() == 0);

        REQUIRE(registry.load(store));
        REQUIRE(registry.note_count() == 3);
    }

    SECTION("Failed reload keeps the previous generation") {
        REQUIRE(registry.load(store));
        auto generation = registry.generation();

        store.add_note(1, "never seen", false, "2024-01-03 00:00:00");
        store.fail_list_notes = ErrorCode::StoreError;
        REQUIRE(!registry.load(store));

        REQUIRE(registry.loaded());
        REQUIRE(registry.generation() == generation);
        REQUIRE(registry.note_count() == 3);
        REQUIRE(registry.public_count() == 2);
    }
}

TEST_CASE("Registry insert", "[registry]") {
    EntityRegistry registry;
    auto store = sample_store();
    REQUIRE(registry.load(store));

    SECTION("Public insert bumps the public count") {
        auto generation = registry.generation();
        REQUIRE(registry.insert(make_note(10, 1, "2024-02-01 00:00:00")));
        REQUIRE(registry.note_count() == 4);
        REQUIRE(registry.public_count() == 3);
        REQUIRE(registry.generation() == generation + 1);
        REQUIRE(registry.public_count() == count_public(registry));
    }

    SECTION("Private insert leaves the public count") {
        REQUIRE(registry.insert(make_note(10, 1, "2024-02-01 00:00:00", true)));
        REQUIRE(registry.note_count() == 4);
        REQUIRE(registry.public_count() == 2);
    }

    SECTION("Duplicate insert is a no-op") {
        REQUIRE(registry.insert(make_note(10, 1, "2024-02-01 00:00:00")));
        auto generation = registry.generation();

        auto again = make_note(10, 1, "2024-02-01 00:00:00");
        again.content = "changed";
        REQUIRE(!registry.insert(again));

        REQUIRE(registry.note_count() == 4);
        REQUIRE(registry.public_count() == 3);
        REQUIRE(registry.generation() == generation);
        REQUIRE(registry.get(10)->content == "note 10");
    }

    SECTION("Owner name resolved on insert") {
        REQUIRE(registry.insert(make_note(10, 2, "2024-02-01 00:00:00")));
        REQUIRE(registry.get(10)->username == "bob");
    }
}

TEST_CASE("Registry insert during reload", "[registry]") {
    EntityRegistry registry;
    auto store = sample_store();
    REQUIRE(registry.load(store));

    // The note lands in the store and the registry after the listing was taken
    bool fired = false;
    store.after_list_notes = [&] {
        if (fired) return;
        fired = true;
        auto& late = store.add_note(1, "late", false, "2024-03-01 00:00:00");
        REQUIRE(registry.insert(late));
    };

    REQUIRE(registry.load(store));
    REQUIRE(registry.get(4));
    REQUIRE(registry.note_count() == 4);
    REQUIRE(registry.public_count() == 3);
    REQUIRE(registry.public_count() == count_public(registry));
}

TEST_CASE("Registry concurrent readers and writers", "[registry][concurrency]") {
    EntityRegistry registry;
    auto store = sample_store();
    REQUIRE(registry.load(store));

    constexpr int kWriters = 4;
    constexpr int kNotesPerWriter = 200;
    std::atomic<bool> inconsistent{false};
    std::atomic<bool> done{false};

    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w] {
            for (int i = 0; i < kNotesPerWriter; ++i) {
                NoteId id = 1000 + w * kNotesPerWriter + i;
                registry.insert(make_note(id, 1, "2024-04-01 00:00:00", i % 3 == 0));
            }
        });
    }

    // Readers check the counter invariant inside one shared acquisition
    threads.emplace_back([&] {
        while (!done) {
            registry.read([&](const Generation& gen) {
                uint64_t n = 0;
                for (const auto& [id, note] : gen.notes) {
                    if (note.is_public()) ++n;
                }
                if (n != gen.public_count || n != gen.public_ids.size()) {
                    inconsistent = true;
                }
                return 0;
            });
        }
    });

    for (int w = 0; w < kWriters; ++w) {
        threads[w].join();
    }
    done = true;
    threads.back().join();

    REQUIRE(!inconsistent);
    REQUIRE(registry.note_count() == 3 + kWriters * kNotesPerWriter);
    REQUIRE(registry.public_count() == count_public(registry));
}

TEST_CASE("Registry reloads observed by readers", "[registry][concurrency]") {
    FakeNoteStore store;
    store.add_user(1, "alice");

    constexpr int kBatch = 10;
    constexpr int kReloads = 50;

    // Every store state holds whole batches of notes, one private per batch
    auto add_batch = [&](int batch) {
        for (int i = 0; i < kBatch; ++i) {
            char ts[32];
            std::snprintf(ts, sizeof(ts), "2024-06-01 %02d:%02d:00", batch % 24, i);
            store.add_note(1, "batch", i == 0, ts);
        }
    };

    EntityRegistry registry;
    add_batch(0);
    REQUIRE(registry.load(store));

    std::atomic<bool> done{false};
    std::atomic<bool> partial_seen{false};
    std::atomic<bool> inconsistent{false};
    std::atomic<bool> went_backwards{false};
    std::atomic<int> observations{0};

    std::thread reader([&] {
        uint64_t last_number = 0;
        while (!done) {
            registry.read([&](const Generation& gen) {
                if (gen.notes.size() % kBatch != 0) {
                    partial_seen = true;
                }

                uint64_t n = 0;
                for (const auto& [id, note] : gen.notes) {
                    if (note.is_public()) ++n;
                }
                if (n != gen.public_count || n != gen.public_ids.size() ||
                    n != gen.notes.size() / kBatch * (kBatch - 1)) {
                    inconsistent = true;
                }
                for (NoteId id : gen.public_ids) {
                    if (!gen.find_note(id)) inconsistent = true;
                }

                if (gen.number < last_number) {
                    went_backwards = true;
                }
                last_number = gen.number;
                return 0;
            });
            ++observations;
        }
    });

    uint64_t previous = registry.generation();
    for (int batch = 1; batch <= kReloads; ++batch) {
        add_batch(batch);
        REQUIRE(registry.load(store));
        REQUIRE(registry.generation() > previous);
        previous = registry.generation();
    }

    done = true;
    reader.join();

    REQUIRE(observations > 0);
    REQUIRE(!partial_seen);
    REQUIRE(!inconsistent);
    REQUIRE(!went_backwards);
    REQUIRE(registry.note_count() == static_cast<size_t>((kReloads + 1) * kBatch));
}
