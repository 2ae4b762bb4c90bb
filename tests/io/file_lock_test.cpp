// =============================================================================
// refcache - File Lock Tests
// =============================================================================
// Unit tests for the per-entry exclusive lock: mutual exclusion, bounded
// waits, owner records and lease reclaim.
// =============================================================================

#include "refcache/io/file_lock.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "test_support.h"

namespace refcache::io {
namespace {

using namespace std::chrono_literals;
using refcache::test::TempDir;
using refcache::test::readText;
using refcache::test::writeText;

LockOptions fastOptions() {
    LockOptions options;
    options.backoff = 5ms;
    return options;
}

// =============================================================================
// Owner Records
// =============================================================================

TEST(LockOwnerTest, ParsesItsOwnFormat) {
    LockOwner owner{4242, "node-7", 1700000000};
    auto parsed = LockOwner::parse(owner.toString());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->pid, 4242);
    EXPECT_EQ(parsed->host, "node-7");
    EXPECT_EQ(parsed->acquiredAt, 1700000000);

    EXPECT_FALSE(LockOwner::parse("").has_value());
    EXPECT_FALSE(LockOwner::parse("not a lock").has_value());
}

// =============================================================================
// Acquisition and Release
// =============================================================================

TEST(FileLockTest, CreatesAndRemovesLockFile) {
    TempDir dir;
    const auto path = dir / "entry" / ".lock";
    {
        FileLock lock(path, fastOptions());
        EXPECT_TRUE(lock.isHeld());
        EXPECT_EQ(lock.contendedAttempts(), 0u);
        ASSERT_TRUE(std::filesystem::exists(path));

        auto owner = FileLock::readOwner(path);
        ASSERT_TRUE(owner.has_value());
        EXPECT_EQ(owner->pid, static_cast<long>(::getpid()));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(FileLockTest, ReleaseIsIdempotent) {
    TempDir dir;
    FileLock lock(dir / ".lock", fastOptions());
    lock.release();
    EXPECT_FALSE(lock.isHeld());
    lock.release();
    EXPECT_FALSE(std::filesystem::exists(dir / ".lock"));
}

TEST(FileLockTest, TimesOutWhileHeld) {
    TempDir dir;
    const auto path = dir / ".lock";
    FileLock holder(path, fastOptions());

    auto options = fastOptions();
    options.timeout = 50ms;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(FileLock(path, options), LockTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);

    // The holder's lock is untouched by the failed waiter
    EXPECT_TRUE(holder.isHeld());
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(FileLockTest, WaiterProceedsAfterRelease) {
    TempDir dir;
    const auto path = dir / ".lock";
    auto holder = std::make_unique<FileLock>(path, fastOptions());

    std::atomic<bool> acquired{false};
    std::size_t attempts = 0;
    std::thread waiter([&] {
        FileLock lock(path, fastOptions());
        attempts = lock.contendedAttempts();
        acquired = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());
    holder.reset();
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_GT(attempts, 0u);
}

TEST(FileLockTest, AtMostOneHolderAtATime) {
    TempDir dir;
    const auto path = dir / ".lock";

    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&] {
            for (int round = 0; round < 5; ++round) {
                FileLock lock(path, fastOptions());
                const int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(2ms);
                --inside;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(maxInside.load(), 1);
}

// =============================================================================
// Lease Reclaim
// =============================================================================

TEST(FileLockTest, StaleLockIsReclaimedWhenLeaseConfigured) {
    TempDir dir;
    const auto path = dir / ".lock";
    writeText(path, LockOwner{999999, "dead-host", 1000}.toString() + "\n");

    auto options = fastOptions();
    options.staleAfter = 60s;
    options.timeout = 2s;
    FileLock lock(path, options);

    EXPECT_TRUE(lock.isHeld());
    auto owner = FileLock::readOwner(path);
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->pid, static_cast<long>(::getpid()));
    EXPECT_FALSE(std::filesystem::exists(dir / ".lock.reclaim"));
}

TEST(FileLockTest, StaleLockIsKeptWithoutLease) {
    TempDir dir;
    const auto path = dir / ".lock";
    const auto token = LockOwner{999999, "dead-host", 1000}.toString() + "\n";
    writeText(path, token);

    auto options = fastOptions();
    options.timeout = 30ms;
    EXPECT_THROW(FileLock(path, options), LockTimeout);
    EXPECT_EQ(readText(path), token);
}

TEST(FileLockTest, FreshLockIsNotReclaimed) {
    TempDir dir;
    const auto path = dir / ".lock";
    FileLock holder(path, fastOptions());

    auto options = fastOptions();
    options.staleAfter = 3600s;
    options.timeout = 30ms;
    EXPECT_THROW(FileLock(path, options), LockTimeout);
    EXPECT_TRUE(holder.isHeld());
}

TEST(FileLockTest, ReleaseLeavesLockTakenOverByReclaimer) {
    TempDir dir;
    const auto path = dir / ".lock";
    FileLock lock(path, fastOptions());

    const auto other = LockOwner{123, "other-host", 2000}.toString() + "\n";
    writeText(path, other);
    lock.release();

    EXPECT_EQ(readText(path), other);
}

}  // namespace
}  // namespace refcache::io
