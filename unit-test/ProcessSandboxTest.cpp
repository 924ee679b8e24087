#include <unistd.h>
#include <algorithm>
#include <filesystem>
#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "runguard.hpp"
#include "sandbox/process_sandbox.hpp"

using namespace std;
using namespace coexec;
using namespace coexec::sandbox;
namespace fs = std::filesystem;

class ProcessSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = fs::temp_directory_path() / ("coexec-sandbox-test-" + to_string(getpid()));
        fs::create_directories(run_dir);
        config.run_dir = run_dir;
        config.max_output_lines = 20;
        config.max_output_bytes = 4096;
    }

    void TearDown() override {
        error_code ec;
        fs::remove_all(run_dir, ec);
    }

    sandbox_request shell(const string &code, const string &input = "") {
        sandbox_request request;
        request.execution_id = "exec_" + to_string(++counter);
        request.policy.name = "sh";
        request.policy.filename = "main.sh";
        request.policy.command = {"/bin/sh", "{file}"};
        request.policy.max_processes = 0;
        request.code = code;
        request.input = input;
        request.timeout = chrono::seconds(5);
        return request;
    }

    bool run_dir_is_empty() const {
        return fs::is_empty(run_dir);
    }

    fs::path run_dir;
    sandbox_config config;
    int counter = 0;
};

TEST_F(ProcessSandboxTest, CapturesStandardOutput) {
    process_sandbox box(config);
    sandbox_result result = box.run(shell("echo hello"));
    EXPECT_EQ("hello\n", result.stdout_text);
    EXPECT_EQ("", result.stderr_text);
    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(-1, result.signal);
    EXPECT_FALSE(result.output_truncated);
    EXPECT_GE(result.memory_bytes, 0);
    EXPECT_TRUE(run_dir_is_empty());
    EXPECT_EQ(0u, box.live_processes());
}

TEST_F(ProcessSandboxTest, FeedsStandardInput) {
    process_sandbox box(config);
    sandbox_result result = box.run(shell("read line\necho \"got:$line\"", "abc\n"));
    EXPECT_EQ("got:abc\n", result.stdout_text);
}

TEST_F(ProcessSandboxTest, ReportsNonZeroExit) {
    process_sandbox box(config);
    sandbox_result result = box.run(shell("echo oops >&2\nexit 3"));
    EXPECT_EQ(3, result.exit_code);
    EXPECT_EQ("oops\n", result.stderr_text);
}

TEST_F(ProcessSandboxTest, ReportsTerminatingSignal) {
    process_sandbox box(config);
    sandbox_result result = box.run(shell("kill -9 $$"));
    EXPECT_EQ(SIGKILL, result.signal);
    EXPECT_EQ(128 + SIGKILL, result.exit_code);
}

TEST_F(ProcessSandboxTest, RunsInCleanEnvironment) {
    process_sandbox box(config);
    auto request = shell("echo \"$HOME\"\necho \"${SECRET_TOKEN:-unset}\"\necho \"$EXTRA\"\npwd");
    request.policy.environment = {"EXTRA=yes"};
    setenv("SECRET_TOKEN", "leaked", 1);
    sandbox_result result = box.run(request);
    unsetenv("SECRET_TOKEN");

    string workdir = (run_dir / request.execution_id).string();
    EXPECT_EQ(workdir + "\nunset\nyes\n" + workdir + "\n", result.stdout_text);
}

TEST_F(ProcessSandboxTest, TruncatesLongOutput) {
    process_sandbox box(config);
    sandbox_result result = box.run(shell("i=0\nwhile [ $i -lt 100 ]; do echo line$i; i=$((i+1)); done"));
    EXPECT_TRUE(result.output_truncated);
    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(0u, result.stdout_text.find("line80\n"));
    EXPECT_NE(string::npos, result.stdout_text.find("line99\n"));
}

TEST_F(ProcessSandboxTest, KillsProgramOnTimeout) {
    process_sandbox box(config);
    auto request = shell("echo started\nsleep 10 &\nsleep 10");
    request.timeout = chrono::milliseconds(300);

    auto start = chrono::steady_clock::now();
    try {
        box.run(request);
        FAIL() << "sandbox did not time out";
    } catch (timeout_error &e) {
        EXPECT_EQ("Execution timed out after 300ms", string(e.what()));
        EXPECT_EQ("started\n", e.stdout_text);
        EXPECT_GE(e.elapsed, chrono::milliseconds(300));
    }
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(5));
    EXPECT_EQ(0u, box.live_processes());
    EXPECT_TRUE(run_dir_is_empty());
}

TEST_F(ProcessSandboxTest, FailsWhenInterpreterIsMissing) {
    process_sandbox box(config);
    auto request = shell("echo never");
    request.policy.command = {"/nonexistent/interpreter", "{file}"};
    EXPECT_THROW(box.run(request), execution_error);
    EXPECT_EQ(0u, box.live_processes());
    EXPECT_TRUE(run_dir_is_empty());
}

TEST_F(ProcessSandboxTest, RejectsUnsafeExecutionId) {
    process_sandbox box(config);
    auto request = shell("echo never");
    request.execution_id = "../escape";
    EXPECT_THROW(box.run(request), execution_error);
}

TEST_F(ProcessSandboxTest, RunsConcurrently) {
    process_sandbox box(config);
    vector<thread> threads;
    vector<string> outputs(4);
    vector<sandbox_request> requests;
    for (int i = 0; i < 4; ++i)
        requests.push_back(shell("echo " + to_string(i)));
    for (int i = 0; i < 4; ++i)
        threads.emplace_back([&, i] { outputs[i] = box.run(requests[i]).stdout_text; });
    for (auto &th : threads) th.join();
    for (int i = 0; i < 4; ++i)
        EXPECT_EQ(to_string(i) + "\n", outputs[i]);
    EXPECT_TRUE(run_dir_is_empty());
}

TEST_F(ProcessSandboxTest, BuildsRunguardCommand) {
    config.runguard = "/usr/local/bin/runguard";
    config.chroot_dir = "/srv/chroot";
    config.run_user = "coexec-run";
    config.scratch_size_kb = 2048;
    process_sandbox box(config);

    sandbox_request request;
    request.execution_id = "exec_1";
    request.policy = default_language_policies().at("python");
    request.timeout = chrono::milliseconds(1500);

    fs::path workdir = run_dir / "exec_1";
    vector<string> command = box.build_command(request, workdir);
    ASSERT_FALSE(command.empty());
    EXPECT_EQ("/usr/local/bin/runguard", command[0]);

    auto find_option = [&](const string &name) -> string {
        auto it = find(command.begin(), command.end(), name);
        if (it == command.end() || it + 1 == command.end()) return "";
        return *(it + 1);
    };
    EXPECT_EQ("1.500", find_option("--wall-time"));
    EXPECT_EQ("1.500:3.000", find_option("--cpu-time"));
    EXPECT_EQ("262144", find_option("--memory-limit"));
    EXPECT_EQ("2048", find_option("--file-limit"));
    EXPECT_EQ("/srv/chroot", find_option("--root"));
    EXPECT_EQ(workdir.string() + ":/sandbox", find_option("--bind"));
    EXPECT_EQ("/sandbox", find_option("--work-dir"));
    EXPECT_EQ("coexec-run", find_option("--user"));
    EXPECT_EQ((workdir / "program.meta").string(), find_option("--out-meta"));
    EXPECT_NE(command.end(), find(command.begin(), command.end(), "-VHOME=/sandbox"));

    auto separator = find(command.begin(), command.end(), "--");
    ASSERT_NE(command.end(), separator);
    vector<string> program(separator + 1, command.end());
    vector<string> expected = {"python3", "-u", "main.py"};
    EXPECT_EQ(expected, program);
}

TEST_F(ProcessSandboxTest, ReadsRunguardMetadata) {
    fs::path metafile = run_dir / "program.meta";
    write_file_content(metafile,
                       "memory-bytes: 1048576\n"
                       "memory-result: oom\n"
                       "exitcode: 137\n"
                       "signal: 9\n"
                       "wall-time: 0.250\n"
                       "cpu-time: 0.125\n"
                       "time-result: \n"
                       "output-truncated: stdout\n");
    runguard_result meta = read_runguard_result(metafile);
    EXPECT_EQ(1048576, meta.memory);
    EXPECT_EQ("oom", meta.memory_result);
    EXPECT_EQ(137, meta.exitcode);
    EXPECT_EQ(9, meta.signal);
    EXPECT_DOUBLE_EQ(0.25, meta.wall_time);
    EXPECT_DOUBLE_EQ(0.125, meta.cpu_time);
    EXPECT_EQ("", meta.time_result);
    EXPECT_EQ("stdout", meta.output_truncated);
    EXPECT_TRUE(meta.internal_error.empty());

    runguard_result missing = read_runguard_result(run_dir / "missing.meta");
    EXPECT_EQ(-1, missing.exitcode);
}

TEST_F(ProcessSandboxTest, RequiresIsolationOutsideDebugMode) {
    EXPECT_THROW(check_isolation(config, false), invalid_argument);
    EXPECT_NO_THROW(check_isolation(config, true));

    config.runguard = "/usr/local/bin/runguard";
    EXPECT_THROW(check_isolation(config, false), invalid_argument);
    config.run_user = "coexec-run";
    EXPECT_NO_THROW(check_isolation(config, false));
}
