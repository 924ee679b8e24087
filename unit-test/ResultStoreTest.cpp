#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "result_store.hpp"

using namespace std;
using namespace coexec;

class ResultStoreTest : public ::testing::Test {
protected:
    ResultStoreTest() : store(chrono::hours(1)), now(chrono::system_clock::now()) {}

    execution_result make(const string &id, const string &room, status stat, chrono::system_clock::time_point ended_at) {
        execution_result result;
        result.id = id;
        result.room_id = room;
        result.user = {"user-" + id, "User " + id, ""};
        result.language = "python";
        result.stat = stat;
        result.submitted_at = ended_at - chrono::seconds(2);
        result.started_at = ended_at - chrono::seconds(1);
        result.ended_at = ended_at;
        result.duration_ms = 1000;
        return result;
    }

    result_store store;
    chrono::system_clock::time_point now;
};

TEST_F(ResultStoreTest, RecordsAndFinds) {
    store.record(make("a", "room", status::COMPLETED, now));
    auto result = store.find("a");
    ASSERT_TRUE(result);
    EXPECT_EQ(status::COMPLETED, result->stat);
    EXPECT_EQ("room", result->room_id);
    EXPECT_FALSE(store.find("b"));
}

TEST_F(ResultStoreTest, RejectsNonTerminalResult) {
    EXPECT_THROW(store.record(make("a", "room", status::EXECUTING, now)), internal_error);
    EXPECT_THROW(store.record(make("b", "room", status::QUEUED, now)), internal_error);
    EXPECT_EQ(0u, store.size());
}

TEST_F(ResultStoreTest, ResultsAreWrittenOnce) {
    store.record(make("a", "room", status::COMPLETED, now));
    EXPECT_THROW(store.record(make("a", "room", status::FAILED, now)), internal_error);
    EXPECT_EQ(status::COMPLETED, store.find("a")->stat);
}

TEST_F(ResultStoreTest, HistoryIsNewestFirst) {
    store.record(make("a", "room", status::COMPLETED, now - chrono::seconds(30)));
    store.record(make("c", "room", status::COMPLETED, now - chrono::seconds(10)));
    // 乱序写入
    store.record(make("b", "room", status::FAILED, now - chrono::seconds(20)));
    store.record(make("x", "other", status::COMPLETED, now));

    auto history = store.history("room", 10);
    ASSERT_EQ(3u, history.size());
    EXPECT_EQ("c", history[0].id);
    EXPECT_EQ("b", history[1].id);
    EXPECT_EQ("a", history[2].id);

    auto limited = store.history("room", 2);
    ASSERT_EQ(2u, limited.size());
    EXPECT_EQ("c", limited[0].id);

    EXPECT_TRUE(store.history("empty", 10).empty());
}

TEST_F(ResultStoreTest, SweepRemovesExpiredResults) {
    store.record(make("old", "room", status::COMPLETED, now - chrono::hours(2)));
    store.record(make("older", "gone", status::FAILED, now - chrono::hours(3)));
    store.record(make("new", "room", status::COMPLETED, now - chrono::minutes(5)));

    EXPECT_EQ(2u, store.sweep(now));
    EXPECT_EQ(1u, store.size());
    EXPECT_FALSE(store.find("old"));
    EXPECT_TRUE(store.find("new"));

    auto history = store.history("room", 10);
    ASSERT_EQ(1u, history.size());
    EXPECT_EQ("new", history[0].id);
    EXPECT_TRUE(store.history("gone", 10).empty());

    EXPECT_EQ(0u, store.sweep(now));
}

TEST_F(ResultStoreTest, ComputesStatistics) {
    store.record(make("a", "room", status::COMPLETED, now));
    store.record(make("b", "room", status::COMPLETED, now));
    store.record(make("c", "room", status::FAILED, now));
    store.record(make("d", "room", status::TIMEOUT, now));
    store.record(make("e", "room", status::CANCELLED, now));

    auto stats = store.statistics();
    EXPECT_EQ(5u, stats.total);
    EXPECT_EQ(2u, stats.completed);
    EXPECT_EQ(2u, stats.failed);
    EXPECT_EQ(1u, stats.timed_out);
    EXPECT_EQ(1u, stats.cancelled);
    EXPECT_DOUBLE_EQ(40.0, stats.success_rate);
}

TEST_F(ResultStoreTest, EmptyStatistics) {
    auto stats = store.statistics();
    EXPECT_EQ(0u, stats.total);
    EXPECT_DOUBLE_EQ(0.0, stats.success_rate);
}
