/**
 * @file test_handle_cache.cpp
 * @brief Unit tests for the per-thread transport handle cache
 */

#include <gtest/gtest.h>
#include <netfetch/transport/http/handle_cache.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace netfetch::transport::http;

namespace {

struct FakeHandle {
    int id = 0;
    std::string target;  ///< Per-call configuration that must not leak
    int resets = 0;
};

}  // namespace

class HandleCacheTest : public ::testing::Test {
protected:
    HandleCacheTest()
        : cache_(
              [this] {
                  created_.fetch_add(1);
                  auto handle = std::make_unique<FakeHandle>();
                  handle->id  = next_id_.fetch_add(1);
                  return handle;
              },
              [](FakeHandle* handle) {
                  handle->target.clear();
                  ++handle->resets;
              }) {}

    std::atomic<int> created_{0};
    std::atomic<int> next_id_{1};
    HandleCache<FakeHandle> cache_;
};

// ============================================================================
// Reuse Tests
// ============================================================================

TEST_F(HandleCacheTest, FirstAcquireCreates) {
    auto lease = cache_.acquire();
    ASSERT_TRUE(lease);
    EXPECT_TRUE(lease.is_cached());
    EXPECT_EQ(created_.load(), 1);
    EXPECT_EQ(lease.get()->resets, 0);
}

TEST_F(HandleCacheTest, SequentialAcquireReusesAndResets) {
    int first_id = 0;
    {
        auto lease = cache_.acquire();
        first_id             = lease.get()->id;
        lease.get()->target = "http://first.example/";
    }
    {
        auto lease = cache_.acquire();
        EXPECT_EQ(lease.get()->id, first_id);
        EXPECT_TRUE(lease.get()->target.empty());
        EXPECT_EQ(lease.get()->resets, 1);
    }
    EXPECT_EQ(created_.load(), 1);
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(HandleCacheTest, NestedAcquireGetsTemporaryHandle) {
    auto outer = cache_.acquire();
    {
        auto inner = cache_.acquire();
        ASSERT_TRUE(inner);
        EXPECT_FALSE(inner.is_cached());
        EXPECT_NE(inner.get(), outer.get());
    }
    EXPECT_EQ(created_.load(), 2);
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(HandleCacheTest, MovedLeaseReturnsOnce) {
    FakeHandle* raw = nullptr;
    {
        auto lease = cache_.acquire();
        raw        = lease.get();
        auto moved = std::move(lease);
        EXPECT_FALSE(lease);
        EXPECT_EQ(moved.get(), raw);
    }
    auto again = cache_.acquire();
    EXPECT_EQ(again.get(), raw);
    EXPECT_EQ(created_.load(), 1);
}

// ============================================================================
// Threading Tests
// ============================================================================

TEST_F(HandleCacheTest, EachThreadGetsItsOwnHandle) {
    constexpr int kThreads = 4;
    std::vector<int> ids(kThreads);
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, &ids, t] {
            int id = 0;
            for (int i = 0; i < 3; ++i) {
                auto lease = cache_.acquire();
                if (id == 0) {
                    id = lease.get()->id;
                }
                EXPECT_EQ(lease.get()->id, id);
            }
            ids[t] = id;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(std::set<int>(ids.begin(), ids.end()).size(), static_cast<size_t>(kThreads));
    EXPECT_EQ(created_.load(), kThreads);
}

TEST_F(HandleCacheTest, ExitedThreadsReleaseTheirHandles) {
    constexpr int kThreads = 50;
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this] {
            auto lease = cache_.acquire();
            EXPECT_TRUE(lease.is_cached());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(created_.load(), kThreads);
    EXPECT_EQ(cache_.size(), 0u);

    // The calling thread's slot is unaffected
    { auto lease = cache_.acquire(); }
    EXPECT_EQ(cache_.size(), 1u);
}

TEST(HandleCacheLifetimeTest, ThreadMayOutliveCache) {
    std::atomic<int> alive{0};
    struct Counted {
        explicit Counted(std::atomic<int>& count) : count_(count) { ++count_; }
        ~Counted() { --count_; }
        std::atomic<int>& count_;
    };

    std::mutex mutex;
    std::condition_variable cv;
    bool cache_gone = false;
    std::thread worker;
    {
        HandleCache<Counted> cache([&alive] { return std::make_unique<Counted>(alive); });
        std::atomic<bool> acquired{false};
        worker = std::thread([&] {
            { auto lease = cache.acquire(); }
            acquired = true;
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return cache_gone; });
        });
        while (!acquired) {
            std::this_thread::yield();
        }
        EXPECT_EQ(cache.size(), 1u);
    }
    EXPECT_EQ(alive.load(), 0);

    {
        std::lock_guard<std::mutex> lock(mutex);
        cache_gone = true;
    }
    cv.notify_one();
    worker.join();
    EXPECT_EQ(alive.load(), 0);
}

TEST_F(HandleCacheTest, ClearDropsIdleHandles) {
    { auto lease = cache_.acquire(); }
    EXPECT_EQ(cache_.size(), 1u);

    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);

    auto lease = cache_.acquire();
    EXPECT_EQ(created_.load(), 2);
}

// ============================================================================
// Factory Failure Tests
// ============================================================================

TEST(HandleCacheFactoryTest, FailedFactoryYieldsEmptyLease) {
    bool fail = true;
    HandleCache<FakeHandle> cache([&fail]() -> std::unique_ptr<FakeHandle> {
        if (fail) {
            return nullptr;
        }
        return std::make_unique<FakeHandle>();
    });

    auto empty = cache.acquire();
    EXPECT_FALSE(empty);
    EXPECT_EQ(cache.size(), 0u);

    fail       = false;
    auto lease = cache.acquire();
    EXPECT_TRUE(lease);
    EXPECT_TRUE(lease.is_cached());
}
