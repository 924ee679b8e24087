#include "sandbox/process_sandbox.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "runguard.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/output_buffer.hpp"

namespace coexec::sandbox {
using namespace std;
namespace fs = std::filesystem;

sandbox::~sandbox() {}

static const char *INPUT_FILE = "input.txt";
static const char *META_FILE = "program.meta";
static const char *SANDBOX_PATH = "/usr/local/bin:/usr/bin:/bin";

/**
 * @brief chroot 后执行目录被挂载到的位置
 */
static const char *CHROOT_WORKDIR = "/sandbox";

/**
 * @brief SIGTERM 与 SIGKILL 之间的等待时间
 */
static const chrono::milliseconds KILL_GRACE(100);

/**
 * @brief runguard 收到 SIGTERM 后需要时间清理 cgroup 并写出 meta 文件
 */
static const chrono::milliseconds RUNGUARD_KILL_GRACE(1000);

/**
 * @brief runguard 自己会按时钟时间杀死用户程序，父进程多等待一段时间
 */
static const chrono::milliseconds RUNGUARD_MARGIN(1000);

static const chrono::milliseconds POLL_INTERVAL(20);

static const size_t BUF_SIZE = 4096;

/**
 * @brief 子进程在 exec 之前失败的阶段，通过状态管道告知父进程
 */
enum child_stage : int {
    STAGE_SESSION = 1,
    STAGE_REDIRECT = 2,
    STAGE_RLIMIT = 3,
    STAGE_CHDIR = 4,
    STAGE_EXEC = 5
};

static const char *stage_name(int stage) {
    switch (stage) {
        case STAGE_SESSION: return "setsid";
        case STAGE_REDIRECT: return "redirecting standard streams";
        case STAGE_RLIMIT: return "setting resource limits";
        case STAGE_CHDIR: return "entering execution directory";
        case STAGE_EXEC: return "exec";
        default: return "unknown stage";
    }
}

/**
 * @brief 持有一个文件描述符，析构时关闭
 */
struct unique_fd {
    int fd = -1;

    unique_fd() = default;
    explicit unique_fd(int fd) : fd(fd) {}
    unique_fd(const unique_fd &) = delete;
    unique_fd &operator=(const unique_fd &) = delete;
    ~unique_fd() { reset(); }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
};

static void make_pipe(unique_fd &read_end, unique_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw execution_error(fmt::format("sandbox allocation failed: unable to create pipe: {}", strerror(errno)));
    read_end.fd = fds[0];
    write_end.fd = fds[1];
}

static vector<char *> to_argv(vector<string> &list) {
    vector<char *> argv;
    for (auto &item : list) argv.push_back(item.data());
    argv.push_back(nullptr);
    return argv;
}

/**
 * @brief 在 PATH 中查找可执行文件，fork 之后不能做这件事
 */
static string resolve_executable(const string &name) {
    if (name.find('/') != string::npos) return name;
    string path = SANDBOX_PATH;
    vector<string> dirs;
    boost::algorithm::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0)
            return candidate.string();
    }
    return name;
}

[[noreturn]] static void child_fail(int status_fd, int stage) {
    int report[2] = {stage, errno};
    ssize_t written = write(status_fd, report, sizeof(report));
    (void)written;
    _exit(127);
}

/**
 * @brief 读取管道中所有可读的数据，遇到 EOF 时关闭管道
 */
static void pump_pipe(unique_fd &pipe, output_buffer &buffer) {
    char buf[BUF_SIZE];
    while (pipe.fd >= 0) {
        ssize_t nread = read(pipe.fd, buf, BUF_SIZE);
        if (nread > 0) {
            buffer.append(buf, nread);
        } else if (nread == 0) {
            pipe.reset();
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        } else {
            LOG(ERROR) << "reading from sandboxed process failed: " << strerror(errno);
            pipe.reset();
        }
    }
}

void check_isolation(const sandbox_config &config, bool debug) {
    if (config.runguard.empty()) {
        if (!debug)
            throw invalid_argument("runguard is not configured, refusing to run user programs without network and filesystem isolation");
        return;
    }
    if (config.run_user.empty())
        throw invalid_argument("runguard requires a run user");
}

process_sandbox::process_sandbox(sandbox_config config)
    : config(move(config)) {}

size_t process_sandbox::live_processes() const {
    return running.load();
}

vector<string> process_sandbox::build_environment(const sandbox_request &request, const string &home) const {
    vector<string> environment = {
        fmt::format("PATH={}", SANDBOX_PATH),
        fmt::format("HOME={}", home),
        fmt::format("TMPDIR={}", home),
        "LANG=C.UTF-8"};
    for (auto &entry : request.policy.environment)
        environment.push_back(entry);
    return environment;
}

vector<string> process_sandbox::build_command(const sandbox_request &request, const fs::path &workdir) const {
    vector<string> program;
    for (auto &arg : request.policy.command)
        program.push_back(boost::algorithm::replace_all_copy(arg, "{file}", request.policy.filename));

    if (config.runguard.empty()) {
        program[0] = resolve_executable(program[0]);
        return program;
    }

    bool use_chroot = !config.chroot_dir.empty();
    string home = use_chroot ? CHROOT_WORKDIR : workdir.string();
    const language_policy &policy = request.policy;
    double seconds = request.timeout.count() / 1000.0;

    vector<string> command = {
        config.runguard.string(),
        "--wall-time", fmt::format("{:.3f}", seconds),
        "--cpu-time", fmt::format("{:.3f}:{:.3f}", seconds, ceil(seconds) + 1),
        "--cpu-quota", fmt::format("{:.2f}", policy.cpu_quota),
        "--stream-size", to_string(config.max_output_bytes),
        "--out-meta", (workdir / META_FILE).string(),
        "--work-dir", home,
        "--no-core-dumps"};
    if (policy.memory_kb > 0) command.insert(command.end(), {"--memory-limit", to_string(policy.memory_kb)});
    if (policy.max_processes > 0) command.insert(command.end(), {"--nproc", to_string(policy.max_processes)});
    if (policy.max_open_files > 0) command.insert(command.end(), {"--nofile", to_string(policy.max_open_files)});
    if (config.scratch_size_kb > 0) command.insert(command.end(), {"--file-limit", to_string(config.scratch_size_kb)});
    if (use_chroot) {
        command.insert(command.end(), {"--root", config.chroot_dir.string()});
        command.insert(command.end(), {"--bind", fmt::format("{}:{}", workdir.string(), CHROOT_WORKDIR)});
    }
    if (!config.run_user.empty()) command.insert(command.end(), {"--user", config.run_user});
    if (!config.run_group.empty()) command.insert(command.end(), {"--group", config.run_group});
    for (auto &entry : build_environment(request, home))
        command.push_back("-V" + entry);
    command.push_back("--");
    command.insert(command.end(), program.begin(), program.end());
    return command;
}

sandbox_result process_sandbox::run(const sandbox_request &request) {
    if (request.policy.command.empty())
        throw execution_error("language " + request.policy.name + " does not specify a command");

    fs::path workdir;
    string filename;
    try {
        workdir = config.run_dir / assert_safe_path(request.execution_id);
        filename = assert_safe_path(request.policy.filename);
    } catch (invalid_argument &e) {
        throw execution_error(fmt::format("sandbox allocation failed: {}", e.what()));
    }

    error_code ec;
    fs::create_directories(workdir, ec);
    if (ec)
        throw execution_error(fmt::format("sandbox allocation failed: unable to create {}: {}", workdir.string(), ec.message()));

    defer {
        if (DEBUG) return;
        error_code remove_ec;
        fs::remove_all(workdir, remove_ec);
        if (remove_ec)
            LOG(ERROR) << "internal fault: unable to remove execution directory " << workdir << ": " << remove_ec.message();
    };

    try {
        write_file_content(workdir / filename, boost::algorithm::replace_all_copy(request.code, "\r\n", "\n"));
        write_file_content(workdir / INPUT_FILE, request.input);
    } catch (system_error &e) {
        throw execution_error(fmt::format("sandbox allocation failed: {}", e.what()));
    }

    // 用户程序可能以 run_user 的身份运行，需要能读取执行目录
    fs::permissions(workdir,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    ec);
    if (ec) LOG(WARNING) << "unable to change permissions of " << workdir << ": " << ec.message();

    bool use_runguard = !config.runguard.empty();
    string home = use_runguard && !config.chroot_dir.empty() ? CHROOT_WORKDIR : workdir.string();

    // fork 之后的子进程只能调用异步信号安全的函数，所有参数都要事先准备好
    vector<string> command = build_command(request, workdir);
    vector<string> environment = build_environment(request, home);
    vector<char *> argv = to_argv(command);
    vector<char *> envp = to_argv(environment);
    vector<rlimit_setting> limits;
    if (!use_runguard) limits = plan_rlimits(request.policy, config, request.timeout);
    string workdir_str = workdir.string();

    unique_fd input(open((workdir / INPUT_FILE).c_str(), O_RDONLY | O_CLOEXEC));
    if (input.fd < 0)
        throw execution_error(fmt::format("sandbox allocation failed: unable to open input: {}", strerror(errno)));

    unique_fd stdout_read, stdout_write, stderr_read, stderr_write, status_read, status_write;
    make_pipe(stdout_read, stdout_write);
    make_pipe(stderr_read, stderr_write);
    make_pipe(status_read, status_write);

    DLOG(INFO) << "starting " << command[0] << " for execution " << request.execution_id;

    pid_t pid = fork();
    if (pid < 0)
        throw execution_error(fmt::format("sandbox allocation failed: unable to fork: {}", strerror(errno)));

    if (pid == 0) {
        // 新的会话使得用户程序和它的所有子进程可以通过一个信号全部杀死
        if (setsid() < 0) child_fail(status_write.fd, STAGE_SESSION);
        if (dup2(input.fd, STDIN_FILENO) < 0 ||
            dup2(stdout_write.fd, STDOUT_FILENO) < 0 ||
            dup2(stderr_write.fd, STDERR_FILENO) < 0)
            child_fail(status_write.fd, STAGE_REDIRECT);
        if (apply_rlimits(limits) != 0) child_fail(status_write.fd, STAGE_RLIMIT);
        if (chdir(workdir_str.c_str()) != 0) child_fail(status_write.fd, STAGE_CHDIR);
        execve(argv[0], argv.data(), envp.data());
        child_fail(status_write.fd, STAGE_EXEC);
    }

    ++running;
    bool reaped = false;
    int wait_status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));

    defer {
        if (!reaped) {
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(ERROR) << "internal fault: unable to kill process group " << pid << ": " << strerror(errno);
            while (waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {}
        }
        --running;
    };

    elapsed_time timer;
    input.reset();
    stdout_write.reset();
    stderr_write.reset();
    status_write.reset();

    {
        // exec 成功时状态管道因为 O_CLOEXEC 被关闭，读到 EOF
        int report[2];
        ssize_t nread;
        while ((nread = read(status_read.fd, report, sizeof(report))) < 0 && errno == EINTR) {}
        if (nread == (ssize_t)sizeof(report))
            throw execution_error(fmt::format("failed to start {}: {}: {}", request.policy.command[0], stage_name(report[0]), strerror(report[1])));
        status_read.reset();
    }

    for (int fd : {stdout_read.fd, stderr_read.fd}) {
        int flags = fcntl(fd, F_GETFL);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
            throw execution_error(fmt::format("sandbox allocation failed: fcntl: {}", strerror(errno)));
    }

    output_buffer stdout_buffer(config.max_output_lines, config.max_output_bytes);
    output_buffer stderr_buffer(config.max_output_lines, config.max_output_bytes);

    auto deadline = chrono::steady_clock::now() + request.timeout + (use_runguard ? RUNGUARD_MARGIN : chrono::milliseconds(0));
    bool timed_out = false;

    while (true) {
        if (!reaped) {
            pid_t r = wait4(pid, &wait_status, WNOHANG, &usage);
            if (r == pid) {
                reaped = true;
                // 进程组中残留的进程不能比用户程序活得更久
                kill(-pid, SIGKILL);
            } else if (r < 0 && errno != EINTR) {
                throw execution_error(fmt::format("waiting on sandboxed process failed: {}", strerror(errno)));
            }
        }

        if (reaped && stdout_read.fd < 0 && stderr_read.fd < 0) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = !reaped;
            break;
        }

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now);
        int wait_ms = (int)min(remaining, POLL_INTERVAL).count();
        struct pollfd fds[2];
        nfds_t nfds = 0;
        for (int fd : {stdout_read.fd, stderr_read.fd})
            if (fd >= 0) fds[nfds++] = {fd, POLLIN, 0};

        if (nfds == 0) {
            this_thread::sleep_for(chrono::milliseconds(wait_ms));
        } else if (poll(fds, nfds, wait_ms) < 0 && errno != EINTR) {
            throw execution_error(fmt::format("polling sandboxed process failed: {}", strerror(errno)));
        }

        pump_pipe(stdout_read, stdout_buffer);
        pump_pipe(stderr_read, stderr_buffer);
    }

    if (timed_out) {
        LOG(WARNING) << "execution " << request.execution_id << " exceeded " << request.timeout.count() << "ms, terminating";

        if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGTERM to process group " << pid << ": " << strerror(errno);

        auto kill_deadline = chrono::steady_clock::now() + (use_runguard ? RUNGUARD_KILL_GRACE : KILL_GRACE);
        while (!reaped && chrono::steady_clock::now() < kill_deadline) {
            if (wait4(pid, &wait_status, WNOHANG, &usage) == pid)
                reaped = true;
            else
                this_thread::sleep_for(chrono::milliseconds(10));
        }

        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
        while (!reaped) {
            if (wait4(pid, &wait_status, 0, &usage) == pid || errno != EINTR)
                reaped = true;
        }

        pump_pipe(stdout_read, stdout_buffer);
        pump_pipe(stderr_read, stderr_buffer);
        throw timeout_error(fmt::format("Execution timed out after {}ms", request.timeout.count()),
                            stdout_buffer.str(), stderr_buffer.str(),
                            timer.duration<chrono::milliseconds>());
    }

    pump_pipe(stdout_read, stdout_buffer);
    pump_pipe(stderr_read, stderr_buffer);

    sandbox_result result;
    result.stdout_text = stdout_buffer.str();
    result.stderr_text = stderr_buffer.str();
    result.output_truncated = stdout_buffer.truncated() || stderr_buffer.truncated();
    result.wall_time_ms = timer.duration<chrono::milliseconds>().count();

    if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.signal = WTERMSIG(wait_status);
        result.exit_code = 128 + result.signal;
    }

    if (use_runguard) {
        runguard_result meta = read_runguard_result(workdir / META_FILE);
        if (!meta.internal_error.empty())
            throw execution_error("sandbox failure: " + meta.internal_error);
        if (meta.time_result == "hard-timelimit")
            throw timeout_error(fmt::format("Execution timed out after {}ms", request.timeout.count()),
                                result.stdout_text, result.stderr_text,
                                chrono::milliseconds(result.wall_time_ms));
        if (meta.exitcode >= 0) result.exit_code = meta.exitcode;
        if (meta.signal >= 0) result.signal = meta.signal;
        if (meta.memory >= 0) result.memory_bytes = meta.memory;
        if (meta.cpu_time >= 0) result.cpu_time_ms = llround(meta.cpu_time * 1000);
        result.memory_exceeded = meta.memory_result == "oom";
        result.output_truncated = result.output_truncated || !meta.output_truncated.empty();
    } else {
        result.memory_bytes = (int64_t)usage.ru_maxrss * 1024;
        result.cpu_time_ms = (int64_t)usage.ru_utime.tv_sec * 1000 + usage.ru_utime.tv_usec / 1000 +
                             (int64_t)usage.ru_stime.tv_sec * 1000 + usage.ru_stime.tv_usec / 1000;
        if (result.signal == SIGXCPU)
            throw timeout_error(fmt::format("Execution exceeded its CPU time limit of {}ms", request.timeout.count()),
                                result.stdout_text, result.stderr_text,
                                chrono::milliseconds(result.wall_time_ms));
    }

    DLOG(INFO) << fmt::format("execution {} finished with exit code {} in {}ms", request.execution_id, result.exit_code, result.wall_time_ms);
    return result;
}

}  // namespace coexec::sandbox
