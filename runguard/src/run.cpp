#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/select.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include "cgroup.hpp"
#include "isolation.hpp"

namespace coexec::runguard {
using namespace std;

static const struct timespec KILL_DELAY = {0, 100000000L};  // 0.1s
static const size_t BUF_SIZE = 4096;
static const size_t MAX_ERROR_LENGTH = 1024;

static volatile sig_atomic_t received_sigchld = 0;
static volatile sig_atomic_t received_signal = -1;

static void on_signal(int sig) {
    if (sig == SIGCHLD)
        received_sigchld = 1;
    else
        received_signal = sig;
}

template <typename... Args>
[[noreturn]] static void fail(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, forward<Args>(args)...));
}

/**
 * @brief "key: value" 格式的 meta 文件
 */
struct meta_writer {
    explicit meta_writer(const string &path) {
        if (!path.empty()) out.open(path);
    }

    template <typename T>
    void write(const char *key, const T &value) {
        if (out) out << key << ": " << value << endl;
    }

private:
    ofstream out;
};

/**
 * @brief 把子进程的一个输出流转发到 runguard 自己的文件描述符
 * 超过 limit 的数据仍然会被读出，只是不再转发
 */
struct stream_pump {
    int source = -1;
    int target = -1;
    int64_t limit = -1;
    size_t read_bytes = 0;
    size_t passed_bytes = 0;

    bool is_open() const { return source >= 0; }

    bool truncated() const { return passed_bytes < read_bytes; }

    void close_source() {
        if (source >= 0) close(source);
        source = -1;
    }

    void pump() {
        char buf[BUF_SIZE];
        while (source >= 0) {
            ssize_t nread = read(source, buf, BUF_SIZE);
            if (nread == 0) {
                close_source();
            } else if (nread < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                fail(errno, "reading output of fd {}", target);
            } else {
                read_bytes += nread;
                size_t pass = nread;
                if (limit >= 0) pass = min(pass, (size_t)max<int64_t>(0, limit - (int64_t)passed_bytes));
                write_all(buf, pass);
                passed_bytes += pass;
            }
        }
    }

private:
    void write_all(const char *data, size_t size) {
        while (size > 0) {
            ssize_t nwritten = write(target, data, size);
            if (nwritten < 0) {
                if (errno == EINTR) continue;
                fail(errno, "forwarding output to fd {}", target);
            }
            data += nwritten;
            size -= nwritten;
        }
    }
};

static vector<char *> to_argv(vector<string> &list) {
    vector<char *> argv;
    for (auto &item : list) argv.push_back(item.data());
    argv.push_back(nullptr);
    return argv;
}

/**
 * @brief 有些登录环境会把 oom_score_adj 设为负数，这个值会被子进程继承，
 * 使得内核在内存不足时优先杀死其他进程
 */
static void reset_oom_score() {
    const char *path = "/proc/self/oom_score_adj";
    fstream file(path, ios::in | ios::out);
    int score = 0;
    if (!(file >> score)) return;
    if (score < 0) {
        LOG(INFO) << "resetting " << path << " from " << score << " to 0";
        file.seekp(0);
        if (!(file << 0 << endl)) fail(errno, "cannot write to {}", path);
    }
}

/**
 * @brief 先礼后兵：SIGTERM 之后等待一段时间再 SIGKILL
 */
static void terminate_child(pid_t pid) {
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH) fail(errno, "sending SIGTERM to command");
    nanosleep(&KILL_DELAY, nullptr);
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) fail(errno, "sending SIGKILL to command");
}

static void set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) fail(errno, "fcntl, getting flags");
    flags = blocking ? flags & ~O_NONBLOCK : flags | O_NONBLOCK;
    if (fcntl(fd, F_SETFL, flags) == -1) fail(errno, "fcntl, setting flags");
}

[[noreturn]] static void exec_child(runguard_options &opt, int out_fd, int err_fd, int status_fd,
                                    vector<char *> &argv, vector<char *> &envp) {
    try {
        sigset_t emptymask;
        sigemptyset(&emptymask);
        if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) fail(errno, "restoring signal mask");
        signal(SIGTERM, SIG_DFL);
        signal(SIGALRM, SIG_DFL);
        signal(SIGCHLD, SIG_DFL);

        if (dup2(out_fd, STDOUT_FILENO) < 0 || dup2(err_fd, STDERR_FILENO) < 0)
            fail(errno, "redirecting standard streams");

        set_restrictions(opt);

        execvpe(argv[0], argv.data(), envp.data());
        fail(errno, "unable to start command {}", opt.command[0]);
    } catch (exception &e) {
        string message = e.what();
        if (message.size() > MAX_ERROR_LENGTH) message.resize(MAX_ERROR_LENGTH);
        ssize_t written = write(status_fd, message.data(), message.size());
        (void)written;
    }
    _exit(127);
}

static int supervise(runguard_options &opt, meta_writer &meta, pid_t &child_pid, bool &cgroup_created) {
    sigset_t emptymask, blocked;
    sigemptyset(&emptymask);
    blocked = emptymask;
    sigaddset(&blocked, SIGCHLD);
    sigaddset(&blocked, SIGALRM);
    sigaddset(&blocked, SIGTERM);
    if (sigprocmask(SIG_SETMASK, &blocked, nullptr) != 0) fail(errno, "blocking signals");

    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = on_signal;
    sigact.sa_mask = blocked;
    for (int sig : {SIGCHLD, SIGALRM, SIGTERM})
        if (sigaction(sig, &sigact, nullptr) != 0) fail(errno, "installing signal handler");

    control_group::init();
    opt.cgroup_name = fmt::format("/coexec/runguard_{}_{}", getpid(), (long)time(nullptr));
    create_cgroup(opt);
    cgroup_created = true;

    // 用户程序不能继承宿主机的文件表、网络、挂载点和进程间通信
    if (unshare(CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWNS | CLONE_NEWUTS | CLONE_SYSVSEM) != 0)
        fail(errno, "unshare");

    reset_oom_score();

    int out_pipe[2], err_pipe[2], status_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0)
        fail(errno, "creating pipes");

    vector<string> command = opt.command;
    vector<string> environment = opt.env;
    vector<char *> argv = to_argv(command);
    vector<char *> envp = to_argv(environment);

    child_pid = fork();
    if (child_pid < 0) fail(errno, "unable to fork");
    if (child_pid == 0) exec_child(opt, out_pipe[1], err_pipe[1], status_pipe[1], argv, envp);

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    {
        // exec 成功时状态管道被关闭，读到 EOF
        char buf[MAX_ERROR_LENGTH];
        ssize_t nread;
        while ((nread = read(status_pipe[0], buf, sizeof(buf))) < 0 && errno == EINTR) {}
        close(status_pipe[0]);
        if (nread > 0) throw runtime_error(string(buf, nread));
    }

    auto start_time = chrono::steady_clock::now();

    if (opt.use_wall_limit) {
        double whole;
        struct itimerval itimer;
        itimer.it_interval.tv_sec = 0;
        itimer.it_interval.tv_usec = 0;
        itimer.it_value.tv_sec = (time_t)opt.wall_limit.hard;
        itimer.it_value.tv_usec = (suseconds_t)(modf(opt.wall_limit.hard, &whole) * 1e6);
        if (setitimer(ITIMER_REAL, &itimer, nullptr) != 0) fail(errno, "setting timer");
        LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);
    }

    stream_pump streams[2] = {
        {out_pipe[0], STDOUT_FILENO, opt.stream_size},
        {err_pipe[0], STDERR_FILENO, opt.stream_size}};
    for (auto &stream : streams) set_blocking(stream.source, false);

    int status = 0;
    bool terminated = false, wall_exceeded = false;
    while (true) {
        fd_set readfds;
        FD_ZERO(&readfds);
        int nfds = -1;
        for (auto &stream : streams) {
            if (!stream.is_open()) continue;
            FD_SET(stream.source, &readfds);
            nfds = max(nfds, stream.source);
        }

        int r = pselect(nfds + 1, &readfds, nullptr, nullptr, nullptr, &emptymask);
        if (r == -1 && errno != EINTR) fail(errno, "waiting for child data");

        if (received_signal != -1 && !terminated) {
            terminated = true;
            if (received_signal == SIGALRM) {
                wall_exceeded = true;
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
            } else {
                LOG(WARNING) << "received signal " << received_signal << ": aborting command";
            }
            terminate_child(child_pid);
        }

        if (received_sigchld) {
            received_sigchld = 0;
            pid_t pid = waitpid(child_pid, &status, WNOHANG);
            if (pid < 0) fail(errno, "waiting on child");
            if (pid == child_pid) break;
        }

        for (auto &stream : streams) stream.pump();
    }

    auto wall_time = chrono::duration<double>(chrono::steady_clock::now() - start_time).count();

    // 后台进程可能还持有管道的写端，先清理 cgroup 再读完剩余输出
    kill_cgroup(opt);
    for (auto &stream : streams) {
        if (!stream.is_open()) continue;
        set_blocking(stream.source, true);
        stream.pump();
    }

    int exitcode, term_signal = -1;
    bool cpu_exceeded = false;
    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        term_signal = WTERMSIG(status);
        exitcode = 128 + term_signal;
        if (term_signal == SIGXCPU) {
            cpu_exceeded = true;
            LOG(WARNING) << "timelimit exceeded (hard cpu time)";
        } else {
            LOG(WARNING) << "command terminated with signal " << term_signal << " (" << strsignal(term_signal) << ")";
        }
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }
    if (terminated && term_signal == -1) term_signal = received_signal;

    cgroup_usage usage = read_cgroup_usage(opt);
    delete_cgroup(opt);
    cgroup_created = false;

    if (opt.use_cpu_limit && usage.cpu_seconds > opt.cpu_limit.hard) cpu_exceeded = true;

    string time_result;
    if (wall_exceeded || cpu_exceeded)
        time_result = "hard-timelimit";
    else if ((opt.use_wall_limit && wall_time > opt.wall_limit.soft) ||
             (opt.use_cpu_limit && usage.cpu_seconds > opt.cpu_limit.soft))
        time_result = "soft-timelimit";

    vector<string> truncated;
    if (streams[0].truncated()) truncated.push_back("stdout");
    if (streams[1].truncated()) truncated.push_back("stderr");

    LOG(INFO) << fmt::format("run time: wall {:.3f}, cpu {:.3f}, memory {}kB", wall_time, usage.cpu_seconds, usage.memory_bytes / 1024);

    meta.write("memory-bytes", usage.memory_bytes);
    meta.write("memory-result", usage.oom_killed ? "oom" : "");
    meta.write("exitcode", exitcode);
    if (term_signal != -1) meta.write("signal", term_signal);
    meta.write("wall-time", fmt::format("{:.3f}", wall_time));
    meta.write("cpu-time", fmt::format("{:.3f}", usage.cpu_seconds));
    meta.write("time-result", time_result);
    meta.write("output-truncated", boost::algorithm::join(truncated, ","));
    meta.write("stdout-bytes", streams[0].read_bytes);
    meta.write("stderr-bytes", streams[1].read_bytes);
    return exitcode;
}

int run_guarded(runguard_options opt) {
    meta_writer meta(opt.metafile_path);
    pid_t child_pid = -1;
    bool cgroup_created = false;
    try {
        return supervise(opt, meta, child_pid, cgroup_created);
    } catch (exception &e) {
        LOG(ERROR) << "runguard failed: " << e.what();
        meta.write("internal-error", e.what());
    }

    if (child_pid > 0) {
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to kill command: " << strerror(errno);
        waitpid(child_pid, nullptr, 0);
    }
    if (cgroup_created) {
        try {
            kill_cgroup(opt);
            delete_cgroup(opt);
        } catch (exception &e) {
            LOG(ERROR) << "unable to clean up cgroup " << opt.cgroup_name << ": " << e.what();
        }
    }
    return EXIT_FAILURE;
}

}  // namespace coexec::runguard
