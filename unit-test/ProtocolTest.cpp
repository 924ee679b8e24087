#include <memory>
#include <sstream>
#include "gtest/gtest.h"
#include "protocol.hpp"
#include "test/fake_sandbox.hpp"

using namespace std;
using namespace coexec;
using namespace coexec::test;
using namespace nlohmann;

class ProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        box = make_shared<fake_sandbox>();
        engine_config config = default_engine_config();
        config.max_concurrent_executions = 1;
        config.max_queue_size = 1;
        engine = make_unique<execution_engine>(config, box, &channel);
    }

    void TearDown() override {
        box->release_all();
        engine.reset();
    }

    json submit(const string &user, const string &code) {
        json command = {{"op", "submit"}, {"roomId", "room"}, {"userId", user}, {"language", "python"}, {"code", code}};
        return handle_line(*engine, command.dump());
    }

    ostringstream out;
    line_writer writer{out};
    stream_channel channel{writer};
    shared_ptr<fake_sandbox> box;
    unique_ptr<execution_engine> engine;
};

TEST_F(ProtocolTest, SubmitsAndQueues) {
    json first = submit("alice", "block:a");
    EXPECT_EQ("response", first["type"]);
    EXPECT_EQ("submit", first["op"]);
    EXPECT_EQ("queued", first["status"]);
    EXPECT_EQ(1, first["position"]);
    EXPECT_TRUE(first["executionId"].is_string());

    json second = submit("bob", "ok:b");
    EXPECT_EQ(1, second["position"]);
    EXPECT_EQ(10000, second["estimatedWaitMs"]);

    json status = handle_line(*engine, R"({"op":"status","roomId":"room"})");
    EXPECT_EQ(1, status["status"]["queueLength"]);
    EXPECT_EQ(1, status["status"]["activeCount"]);
    EXPECT_EQ(second["executionId"], status["status"]["queued"][0]["executionId"]);
}

TEST_F(ProtocolTest, ReportsAdmissionErrors) {
    submit("alice", "block:a");
    json again = submit("alice", "ok:again");
    EXPECT_EQ("error", again["type"]);
    EXPECT_EQ("ConcurrentExecutionLimit", again["reason"]);

    submit("bob", "block:b");
    json full = submit("carol", "ok:c");
    EXPECT_EQ("QueueFull", full["reason"]);
}

TEST_F(ProtocolTest, ReportsValidationErrors) {
    json rejected = submit("alice", "import subprocess");
    EXPECT_EQ("error", rejected["type"]);
    EXPECT_EQ("ValidationError", rejected["reason"]);
    EXPECT_EQ("process", rejected["category"]);
}

TEST_F(ProtocolTest, RejectsMalformedCommands) {
    EXPECT_EQ("BadRequest", handle_line(*engine, "not json")["reason"]);
    EXPECT_EQ("BadRequest", handle_line(*engine, "[1, 2]")["reason"]);
    EXPECT_EQ("BadRequest", handle_line(*engine, R"({"op":"launch"})")["reason"]);
    EXPECT_EQ("BadRequest", handle_line(*engine, R"({"op":"cancel","roomId":"room"})")["reason"]);
    EXPECT_EQ("BadRequest", handle_line(*engine, R"({"op":"history","roomId":"room","limit":-1})")["reason"]);
}

TEST_F(ProtocolTest, CancelsQueuedSubmission) {
    submit("alice", "block:a");
    submit("bob", "block:b");

    json cancelled = handle_line(*engine, R"({"op":"cancel","roomId":"room","userId":"bob"})");
    EXPECT_EQ("cancelled", cancelled["outcome"]);
    EXPECT_EQ(true, cancelled["cancelled"]);

    json running = handle_line(*engine, R"({"op":"cancel","roomId":"room","userId":"alice"})");
    EXPECT_EQ("not_cancellable", running["outcome"]);
    EXPECT_EQ(false, running["cancelled"]);

    json statistics = handle_line(*engine, R"({"op":"statistics"})");
    EXPECT_EQ(1, statistics["statistics"]["cancelled"]);
    EXPECT_EQ(1, statistics["statistics"]["active"]);

    json history = handle_line(*engine, R"({"op":"history","roomId":"room"})");
    ASSERT_EQ(1u, history["history"].size());
    EXPECT_EQ("cancelled", history["history"][0]["status"]);
    EXPECT_EQ("Cancelled by user", history["history"][0]["error"]);
}

TEST_F(ProtocolTest, WritesEventsAsLines) {
    json response = submit("alice", "ok:hello");
    engine->shutdown();

    istringstream lines(out.str());
    string line;
    vector<string> events;
    while (getline(lines, line)) {
        json event = json::parse(line);
        EXPECT_EQ("event", event["type"]);
        EXPECT_EQ("room", event["roomId"]);
        EXPECT_EQ(response["executionId"], event["event"]["executionId"]);
        events.push_back(event["event"]["event"].get<string>());
    }
    vector<string> expected = {"execution-queued", "execution-started", "execution-completed"};
    EXPECT_EQ(expected, events);
}

TEST_F(ProtocolTest, DeliversInvalidUtf8Output) {
    json response = submit("alice", "binary");
    engine->shutdown();

    istringstream lines(out.str());
    string line;
    json completed;
    while (getline(lines, line)) {
        json event = json::parse(line);
        if (event["event"]["event"] == "execution-completed") completed = event["event"];
    }
    ASSERT_FALSE(completed.is_null());
    EXPECT_EQ(response["executionId"], completed["executionId"]);
    EXPECT_EQ("caf\xEF\xBF\xBD\n\xEF\xBF\xBD\xEF\xBF\xBD", completed["result"]["stdout"].get<string>());

    json history = handle_line(*engine, R"({"op":"history","roomId":"room"})");
    ASSERT_EQ(1u, history["history"].size());
    ostringstream written;
    line_writer history_writer(written);
    EXPECT_NO_THROW(history_writer.write(history));
    EXPECT_NE(string::npos, written.str().find("\"stdout\":\"caf\xEF\xBF\xBD"));
}
