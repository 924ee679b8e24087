#include <atomic>
#include <stdexcept>
#include "gtest/gtest.h"
#include "broadcaster.hpp"
#include "test/recording_channel.hpp"

using namespace std;
using namespace coexec;
using namespace coexec::test;

static execution_event make_event(event_type type, const string &room, const string &id) {
    execution_event event;
    event.type = type;
    event.room_id = room;
    event.execution_id = id;
    event.language = "python";
    event.timestamp = chrono::system_clock::now();
    return event;
}

TEST(BroadcasterTest, DeliversInPublishOrder) {
    recording_channel channel;
    event_broadcaster broadcaster(&channel);
    broadcaster.start();

    broadcaster.publish("room", make_event(event_type::QUEUED, "room", "a"));
    broadcaster.publish("room", make_event(event_type::STARTED, "room", "a"));
    broadcaster.publish("room", make_event(event_type::COMPLETED, "room", "a"));

    ASSERT_TRUE(channel.wait_for_event("a", event_type::COMPLETED));
    vector<event_type> expected = {event_type::QUEUED, event_type::STARTED, event_type::COMPLETED};
    EXPECT_EQ(expected, channel.types_of("a"));
    broadcaster.stop();
    EXPECT_EQ(3u, broadcaster.delivered());
}

TEST(BroadcasterTest, SubscribersAreScopedByRoom) {
    event_broadcaster broadcaster;
    atomic<int> room_a{0}, room_b{0}, all{0};
    broadcaster.subscribe("a", [&](const execution_event &) { ++room_a; });
    broadcaster.subscribe("b", [&](const execution_event &) { ++room_b; });
    broadcaster.subscribe("", [&](const execution_event &) { ++all; });
    broadcaster.start();

    broadcaster.publish("a", make_event(event_type::QUEUED, "a", "1"));
    broadcaster.publish("a", make_event(event_type::STARTED, "a", "1"));
    broadcaster.publish("b", make_event(event_type::QUEUED, "b", "2"));
    broadcaster.stop();

    EXPECT_EQ(2, room_a);
    EXPECT_EQ(1, room_b);
    EXPECT_EQ(3, all);
}

TEST(BroadcasterTest, UnsubscribeStopsDelivery) {
    event_broadcaster broadcaster;
    atomic<int> count{0};
    unsigned id = broadcaster.subscribe("room", [&](const execution_event &) { ++count; });

    broadcaster.publish("room", make_event(event_type::QUEUED, "room", "1"));
    broadcaster.start();
    broadcaster.stop();
    EXPECT_EQ(1, count);

    broadcaster.unsubscribe(id);
    broadcaster.publish("room", make_event(event_type::QUEUED, "room", "2"));
    broadcaster.stop();
    EXPECT_EQ(1, count);
}

TEST(BroadcasterTest, FailingSubscriberDoesNotAffectOthers) {
    recording_channel channel;
    event_broadcaster broadcaster(&channel);
    atomic<int> count{0};
    broadcaster.subscribe("", [](const execution_event &) { throw runtime_error("subscriber is gone"); });
    broadcaster.subscribe("", [&](const execution_event &) { ++count; });
    broadcaster.start();

    broadcaster.publish("room", make_event(event_type::QUEUED, "room", "1"));
    broadcaster.publish("room", make_event(event_type::CANCELLED, "room", "1"));
    broadcaster.stop();

    EXPECT_EQ(2, count);
    EXPECT_EQ(2u, channel.events().size());
}

TEST(BroadcasterTest, StopDrainsPendingEvents) {
    recording_channel channel;
    event_broadcaster broadcaster(&channel);
    for (int i = 0; i < 100; ++i)
        broadcaster.publish("room", make_event(event_type::QUEUED, "room", to_string(i)));
    broadcaster.start();
    broadcaster.stop();
    EXPECT_EQ(100u, channel.events().size());
}
