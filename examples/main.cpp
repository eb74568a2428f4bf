#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "records/Counter.hpp"
#include "records/Settings.hpp"

#include <jsave/jsave.hpp>

using namespace JSave;

// =============================================================================
// Helper Macros for Demo Output
// =============================================================================

#define DEMO_SECTION(name) std::cout << "\n=== " << name << " ===\n"
#define DEMO_CASE(name) std::cout << "\n--- " << name << " ---\n"
#define DEMO_PASS(msg) std::cout << "[PASS] " << msg << "\n"
#define DEMO_FAIL(msg) std::cout << "[FAIL] " << msg << "\n"
#define CHECK_EC(ec, context)                                                                      \
    if (ec) {                                                                                      \
        DEMO_FAIL(context << ": " << ec.message());                                                \
        return;                                                                                    \
    }

// =============================================================================
// Mutex
// =============================================================================

void demoMutex() {
    DEMO_SECTION("Mutex<std::map<std::string, long>>");
    std::error_code ec;

    const std::string path = "./demo_mutex.json";
    ::remove(path.c_str());

    // =========================================================================
    // 1. Create with an initial value (written immediately)
    // =========================================================================
    DEMO_CASE("initWith");

    auto store = Mutex<std::map<std::string, long>>::initWith({}, path, ec);
    CHECK_EC(ec, "initWith");
    DEMO_PASS("Created " << path << " holding {}");

    // =========================================================================
    // 2. Mutate under a guard, then save
    // =========================================================================
    DEMO_CASE("lock + save");
    {
        auto guard = store->lock();
        (*guard)["foo"] = 114514;
    } // guard released here, nothing written yet

    store->save(ec);
    CHECK_EC(ec, "save");
    DEMO_PASS("Saved: " << *store);

    // =========================================================================
    // 3. Reopen from the file
    // =========================================================================
    DEMO_CASE("init");

    auto reopened = Mutex<std::map<std::string, long>>::init(path, ec);
    CHECK_EC(ec, "init");
    if (reopened->lock()->at("foo") == 114514) {
        DEMO_PASS("Reloaded foo = 114514");
    } else {
        DEMO_FAIL("Reloaded value mismatch");
    }
}

// =============================================================================
// RwLock
// =============================================================================

void demoRwLock() {
    DEMO_SECTION("RwLock<Settings>");
    std::error_code ec;

    const std::string path = "./demo_rwlock.json";
    ::remove(path.c_str());

    Settings initial;
    initial.user = "alice";
    initial.plugins["equalizer"] = true;

    auto store = RwLock<Settings>::initWith(initial, path, ec, Options::pretty(2));
    CHECK_EC(ec, "initWith");

    // =========================================================================
    // 1. Concurrent readers
    // =========================================================================
    DEMO_CASE("Concurrent readers");
    {
        auto r1 = store->read();
        bool shared = false;
        std::thread other([&store, &shared]() { shared = store->tryRead().has_value(); });
        other.join();
        if (shared) {
            DEMO_PASS("Second thread read while the first held a guard, user=" << r1->user);
        } else {
            DEMO_FAIL("Second reader was refused");
        }
    }

    // =========================================================================
    // 2. Writer with save-on-release
    // =========================================================================
    DEMO_CASE("writeAndSave");
    {
        auto w = store->writeAndSave();
        w->volume = 80;
        w->recent.push_back("/music/track01.flac");
        if (!w.commit(ec)) {
            DEMO_FAIL("commit: " << ec.message());
            return;
        }
    }
    DEMO_PASS("Pretty-printed file now holds:\n" << *store);
}

// =============================================================================
// ReentrantMutex
// =============================================================================

void demoReentrantMutex() {
    DEMO_SECTION("ReentrantMutex<Counter>");
    std::error_code ec;

    const std::string path = "./demo_reentrant.json";
    ::remove(path.c_str());

    Options options;
    options.writePolicy = WritePolicy::ReplaceAtomically;
    auto store = ReentrantMutex<Counter>::initWith(Counter(), path, ec, options);
    CHECK_EC(ec, "initWith");

    // =========================================================================
    // 1. Nested acquisition by the owner
    // =========================================================================
    DEMO_CASE("Nested lock");
    {
        auto outer = store->lock();
        outer->first = 1;
        {
            auto inner = store->lock();
            inner->second = 1;
            std::cout << "depth while nested: " << store->recursionDepth() << "\n";
        }
        // save() from the owner nests as well
        store->save(ec);
        CHECK_EC(ec, "save while holding the lock");
    }
    DEMO_PASS("Saved " << *store);

    // =========================================================================
    // 2. Several threads incrementing
    // =========================================================================
    DEMO_CASE("Threads");

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&store]() {
            for (int i = 0; i < 100; ++i) {
                auto g = store->lock();
                ++g->first;
                ++g->second;
            }
        });
    }
    for (auto& w : workers)
        w.join();

    store->save(ec);
    CHECK_EC(ec, "save after threads");

    Counter result = ReentrantMutex<Counter>::intoInner(std::move(store));
    if (result.consistent() && result.first == 401) {
        DEMO_PASS("first == second == 401");
    } else {
        DEMO_FAIL("Unexpected counter " << result.first << "/" << result.second);
    }
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "========================================\n";
    std::cout << "    jsave demo\n";
    std::cout << "========================================\n";

    demoMutex();
    demoRwLock();
    demoReentrantMutex();

    std::cout << "\n========================================\n";
    std::cout << "    Done\n";
    std::cout << "========================================\n";

    return 0;
}
