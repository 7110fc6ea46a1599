/**
 * Named Lock Service Tests
 *
 * Covers the channel key hash, reentrant acquisition within a process,
 * contention between two lock services sharing one lock server, and
 * cleanup when sessions fail.
 */

#include "test_support.hpp"
#include <spdlog/spdlog.h>

using namespace sluice;
using namespace sluice::testing;

bool test_hash_is_rolling_31() {
    std::cout << "\n=== Test: Channel Key Hash ===" << std::endl;

    TEST_ASSERT(hash_channel_key("") == 0, "Empty key hashes to 0");
    TEST_ASSERT(hash_channel_key("a") == 97, "Single character hashes to its code");
    TEST_ASSERT(hash_channel_key("ab") == 97 * 31 + 98, "Two characters follow h*31+c");

    std::string key = "postgresql:9b2f4c0e-1111-4e4e-8888-0123456789ab:orders";
    TEST_ASSERT(hash_channel_key(key) == hash_channel_key(key), "Hash is deterministic");

    std::string long_key(4096, 'z');
    TEST_ASSERT(hash_channel_key(long_key) >= 0, "Long keys stay non-negative");
    TEST_ASSERT(hash_channel_key("postgresql:a:orders") != hash_channel_key("postgresql:a:billing"),
                "Different databases get different lock ids");

    return true;
}

bool test_reentrant_acquire() {
    std::cout << "\n=== Test: Reentrant Acquire ===" << std::endl;

    FakeLockServer server;
    NamedLockService locks(std::make_shared<FakeLockSource>(server));

    TEST_ASSERT(locks.acquire("postgresql:i1:orders"), "First acquire succeeds");
    TEST_ASSERT(locks.is_held("postgresql:i1:orders"), "Key is reported held");
    TEST_ASSERT(locks.acquire("postgresql:i1:orders"), "Second acquire in the same process succeeds");
    TEST_ASSERT(server.sessions_opened == 1, "No second session opened");
    TEST_ASSERT(server.try_lock_calls == 1, "No second lock attempt made");
    TEST_ASSERT(locks.active_lock_count() == 1, "One handle tracked");

    locks.release("postgresql:i1:orders");
    TEST_ASSERT(!locks.is_held("postgresql:i1:orders"), "Key no longer held after release");
    TEST_ASSERT(server.sessions_closed == 1, "Session returned after release");
    TEST_ASSERT(server.held.empty(), "Server holds no locks");

    return true;
}

bool test_contention_between_processes() {
    std::cout << "\n=== Test: Contention Between Workers ===" << std::endl;

    FakeLockServer server;
    NamedLockService worker_a(std::make_shared<FakeLockSource>(server));
    NamedLockService worker_b(std::make_shared<FakeLockSource>(server));

    TEST_ASSERT(worker_a.acquire("mongodb:i2:events"), "Worker A acquires the channel");
    TEST_ASSERT(!worker_b.acquire("mongodb:i2:events"), "Worker B is refused without waiting");
    TEST_ASSERT(!worker_b.is_held("mongodb:i2:events"), "Worker B records no handle");
    TEST_ASSERT(server.sessions_closed == 1, "Refused session is returned immediately");

    TEST_ASSERT(worker_b.acquire("mongodb:i2:other"), "Unrelated channel is free");

    worker_a.release("mongodb:i2:events");
    TEST_ASSERT(worker_b.acquire("mongodb:i2:events"), "Worker B acquires after A releases");

    return true;
}

bool test_release_edge_cases() {
    std::cout << "\n=== Test: Release Edge Cases ===" << std::endl;

    FakeLockServer server;
    NamedLockService locks(std::make_shared<FakeLockSource>(server));

    locks.release("postgresql:never:held");
    TEST_ASSERT(server.sessions_opened == 0, "Releasing an unknown key is a no-op");

    TEST_ASSERT(locks.acquire("postgresql:i1:orders"), "Acquire before failing unlock");
    server.fail_unlock = true;
    locks.release("postgresql:i1:orders");
    TEST_ASSERT(!locks.is_held("postgresql:i1:orders"), "Handle dropped even when unlock fails");
    TEST_ASSERT(server.sessions_closed == 1, "Session returned even when unlock fails");
    server.fail_unlock = false;

    locks.release("postgresql:i1:orders");
    TEST_ASSERT(server.sessions_closed == 1, "Second release is a no-op");

    return true;
}

bool test_acquire_errors_become_false() {
    std::cout << "\n=== Test: Acquire Errors ===" << std::endl;

    FakeLockServer server;
    NamedLockService locks(std::make_shared<FakeLockSource>(server));

    server.fail_open = true;
    bool acquired = true;
    try {
        acquired = locks.acquire("postgresql:i1:orders");
    } catch (const std::exception& e) {
        TEST_ASSERT(false, std::string("acquire must not throw: ") + e.what());
    }
    TEST_ASSERT(!acquired, "Session failure reported as not acquired");
    TEST_ASSERT(locks.active_lock_count() == 0, "No handle recorded");

    return true;
}

bool test_release_all() {
    std::cout << "\n=== Test: Release All ===" << std::endl;

    FakeLockServer server;
    {
        NamedLockService locks(std::make_shared<FakeLockSource>(server));
        TEST_ASSERT(locks.acquire("postgresql:i1:a"), "Acquire a");
        TEST_ASSERT(locks.acquire("postgresql:i1:b"), "Acquire b");
        TEST_ASSERT(locks.acquire("mongodb:i2:c"), "Acquire c");

        locks.release_all();
        TEST_ASSERT(locks.active_lock_count() == 0, "release_all drops every handle");
        TEST_ASSERT(server.held.empty(), "Server holds no locks after release_all");

        TEST_ASSERT(locks.acquire("postgresql:i1:a"), "Re-acquire after release_all");
    }
    TEST_ASSERT(server.held.empty(), "Destructor releases remaining locks");
    TEST_ASSERT(server.sessions_opened == server.sessions_closed, "Every session returned");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Named Lock Service Tests                             ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_hash_is_rolling_31();
    all_passed &= test_reentrant_acquire();
    all_passed &= test_contention_between_processes();
    all_passed &= test_release_edge_cases();
    all_passed &= test_acquire_errors_become_false();
    all_passed &= test_release_all();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
