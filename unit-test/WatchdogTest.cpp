#include <atomic>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "watchdog.hpp"

using namespace std;
using namespace coexec;

TEST(WatchdogTest, FiresAfterDeadline) {
    watchdog dog;
    promise<void> fired;
    auto start = watchdog::clock::now();
    dog.arm(start + chrono::milliseconds(50), [&] { fired.set_value(); });
    EXPECT_EQ(1u, dog.armed());

    auto future = fired.get_future();
    ASSERT_EQ(future_status::ready, future.wait_for(chrono::seconds(5)));
    EXPECT_GE(watchdog::clock::now() - start, chrono::milliseconds(50));
    EXPECT_EQ(0u, dog.armed());
}

TEST(WatchdogTest, DisarmedEntryNeverFires) {
    watchdog dog;
    atomic<int> fired{0};
    unsigned id = dog.arm(watchdog::clock::now() + chrono::milliseconds(50), [&] { ++fired; });
    dog.disarm(id);
    EXPECT_EQ(0u, dog.armed());
    this_thread::sleep_for(chrono::milliseconds(150));
    EXPECT_EQ(0, fired);

    // 重复取消没有副作用
    dog.disarm(id);
}

TEST(WatchdogTest, FiresInDeadlineOrder) {
    watchdog dog;
    mutex mut;
    vector<int> order;
    promise<void> done;
    auto now = watchdog::clock::now();
    dog.arm(now + chrono::milliseconds(120), [&] {
        lock_guard<mutex> lock(mut);
        order.push_back(3);
        done.set_value();
    });
    dog.arm(now + chrono::milliseconds(20), [&] {
        lock_guard<mutex> lock(mut);
        order.push_back(1);
    });
    dog.arm(now + chrono::milliseconds(70), [&] {
        lock_guard<mutex> lock(mut);
        order.push_back(2);
    });

    ASSERT_EQ(future_status::ready, done.get_future().wait_for(chrono::seconds(5)));
    lock_guard<mutex> lock(mut);
    EXPECT_EQ((vector<int>{1, 2, 3}), order);
}

TEST(WatchdogTest, CallbackMayArmAgain) {
    watchdog dog;
    promise<void> second;
    dog.arm(watchdog::clock::now(), [&] {
        dog.arm(watchdog::clock::now() + chrono::milliseconds(10), [&] { second.set_value(); });
    });
    EXPECT_EQ(future_status::ready, second.get_future().wait_for(chrono::seconds(5)));
}

TEST(WatchdogTest, StopDiscardsPendingEntries) {
    atomic<int> fired{0};
    {
        watchdog dog;
        dog.arm(watchdog::clock::now() + chrono::hours(1), [&] { ++fired; });
        dog.stop();
        EXPECT_EQ(0u, dog.armed());
    }
    EXPECT_EQ(0, fired);
}
