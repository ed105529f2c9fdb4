#include <atomic>
#include <chrono>
#include <thread>
#include "gtest/gtest.h"
#include "sandbox/slot_pool.hpp"

using namespace std;
using namespace codejudge;

TEST(SlotPoolTest, EmptyPoolIsRejected) {
    EXPECT_THROW(slot_pool(vector<size_t>{}), invalid_argument);
}

TEST(SlotPoolTest, AcquireAndRelease) {
    slot_pool pool(vector<size_t>{2, 3});
    EXPECT_EQ(pool.capacity(), 2);
    EXPECT_EQ(pool.available(), 2);

    {
        auto first = pool.acquire();
        EXPECT_EQ(pool.available(), 1);
        EXPECT_EQ(first.cpuset(), to_string(first.core_id()));

        auto second = pool.acquire();
        EXPECT_EQ(pool.available(), 0);
        EXPECT_NE(first.core_id(), second.core_id());
    }

    EXPECT_EQ(pool.available(), 2);
}

TEST(SlotPoolTest, MovedSlotIsReleasedOnce) {
    slot_pool pool(vector<size_t>{0});
    {
        auto slot = pool.acquire();
        sandbox_slot moved(move(slot));
        EXPECT_EQ(moved.core_id(), 0);
        EXPECT_EQ(pool.available(), 0);
    }
    EXPECT_EQ(pool.available(), 1);
}

TEST(SlotPoolTest, AcquireBlocksUntilReleased) {
    slot_pool pool(vector<size_t>{5});
    atomic<bool> acquired(false);

    auto slot = make_unique<sandbox_slot>(pool.acquire());
    thread waiter([&] {
        auto other = pool.acquire();
        acquired = true;
        EXPECT_EQ(other.core_id(), 5);
    });

    this_thread::sleep_for(chrono::milliseconds(100));
    EXPECT_FALSE(acquired);

    slot.reset();
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(pool.available(), 1);
}
