#include <unistd.h>
#include <filesystem>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "validator.hpp"

using namespace std;
using namespace coexec;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = fs::temp_directory_path() / ("coexec-config-test-" + to_string(getpid()) + ".json");
    }

    void TearDown() override {
        error_code ec;
        fs::remove(path, ec);
    }

    engine_config load(const string &content) {
        write_file_content(path, content);
        return load_engine_config(path);
    }

    fs::path path;
};

TEST_F(ConfigTest, DefaultsMatchBuiltInPolicies) {
    engine_config config = default_engine_config();
    EXPECT_EQ(3u, config.max_concurrent_executions);
    EXPECT_EQ(10u, config.max_queue_size);
    EXPECT_EQ(chrono::milliseconds(30000), config.execution_timeout);
    EXPECT_EQ(chrono::milliseconds(60000), config.cleanup_interval);
    EXPECT_EQ(chrono::hours(24), config.retention_window);
    ASSERT_EQ(3u, config.languages.size());
    EXPECT_EQ("main.py", config.languages.at("python").filename);
    EXPECT_EQ("main.js", config.languages.at("javascript").filename);
    EXPECT_EQ("Main.java", config.languages.at("java").filename);
    EXPECT_EQ(262144, config.get_language("python").memory_kb);
    EXPECT_THROW(config.get_language("ruby"), validation_error);
}

TEST_F(ConfigTest, LoadsEngineSettings) {
    engine_config config = load(R"({
        "maxConcurrentExecutions": 2,
        "maxQueueSize": 4,
        "executionTimeoutMs": 1500,
        "retentionWindowMs": 60000,
        "historyLimit": 5,
        "sandbox": {
            "runguard": "/usr/local/bin/runguard",
            "runDir": "/var/lib/coexec",
            "runUser": "coexec-run",
            "maxOutputLines": 50
        }
    })");
    EXPECT_EQ(2u, config.max_concurrent_executions);
    EXPECT_EQ(4u, config.max_queue_size);
    EXPECT_EQ(chrono::milliseconds(1500), config.execution_timeout);
    EXPECT_EQ(chrono::milliseconds(60000), config.retention_window);
    EXPECT_EQ(chrono::milliseconds(60000), config.cleanup_interval);
    EXPECT_EQ(5u, config.history_limit);
    EXPECT_EQ("/usr/local/bin/runguard", config.sandbox.runguard.string());
    EXPECT_EQ("/var/lib/coexec", config.sandbox.run_dir.string());
    EXPECT_EQ("coexec-run", config.sandbox.run_user);
    EXPECT_EQ(50u, config.sandbox.max_output_lines);
    EXPECT_EQ(size_t(1 << 20), config.sandbox.max_output_bytes);
    EXPECT_EQ(3u, config.languages.size());
}

TEST_F(ConfigTest, MergesLanguagePolicies) {
    engine_config config = load(R"({
        "languages": {
            "python": { "memoryKB": 131072 },
            "ruby": {
                "filename": "main.rb",
                "command": ["ruby", "{file}"],
                "forbiddenPatterns": [ { "category": "process", "pattern": "\\bsystem\\s*\\(" } ]
            }
        }
    })");
    ASSERT_EQ(4u, config.languages.size());

    const language_policy &python = config.get_language("python");
    EXPECT_EQ(131072, python.memory_kb);
    EXPECT_EQ("main.py", python.filename);
    EXPECT_FALSE(python.forbidden_patterns.empty());

    const language_policy &ruby = config.get_language("ruby");
    EXPECT_EQ("ruby", ruby.name);
    vector<string> command = {"ruby", "{file}"};
    EXPECT_EQ(command, ruby.command);
    ASSERT_EQ(1u, ruby.forbidden_patterns.size());

    code_validator validator(config);
    EXPECT_NO_THROW(validator.validate("ruby", "puts 1"));
    EXPECT_THROW(validator.validate("ruby", "system (\"ls\")"), validation_error);
}

TEST_F(ConfigTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(load("{ not json"), invalid_argument);
    EXPECT_THROW(load(R"({"maxConcurrentExecutions": 0})"), invalid_argument);
    EXPECT_THROW(load(R"({"executionTimeoutMs": -5})"), invalid_argument);
    EXPECT_THROW(load(R"({"maxQueueSize": "many"})"), invalid_argument);
    EXPECT_THROW(load(R"({"languages": {"ruby": {"command": ["ruby"]}}})"), invalid_argument);
    EXPECT_THROW(load(R"({"languages": {"ruby": {"filename": "../main.rb", "command": ["ruby"]}}})"), invalid_argument);
    EXPECT_THROW(load_engine_config(path.string() + ".missing"), invalid_argument);
}
