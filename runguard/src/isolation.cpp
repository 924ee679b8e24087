#include "isolation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <libcgroup.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <system_error>
#include "cgroup.hpp"

namespace coexec::runguard {
using namespace std;

static const int64_t CFS_PERIOD_US = 100000;
static const char *CGROUP_MEMORY_ROOT = "/sys/fs/cgroup/memory";

void create_cgroup(const runguard_options &opt) {
    control_group cg(opt.cgroup_name);

    controller_ref memory = cg.add_controller("memory");
    if (opt.memory_limit >= 0) {
        memory.set("memory.limit_in_bytes", opt.memory_limit);
        memory.set("memory.memsw.limit_in_bytes", opt.memory_limit);
    }

    if (opt.cpu_quota > 0) {
        controller_ref cpu = cg.add_controller("cpu");
        cpu.set("cpu.cfs_period_us", CFS_PERIOD_US);
        cpu.set("cpu.cfs_quota_us", (int64_t)llround(opt.cpu_quota * CFS_PERIOD_US));
    }

    if (opt.nproc > 0) {
        controller_ref pids = cg.add_controller("pids");
        pids.set("pids.max", opt.nproc);
    }

    cg.add_controller("cpuacct");
    cg.create();
    LOG(INFO) << "created cgroup " << opt.cgroup_name;
}

void attach_cgroup(const runguard_options &opt) {
    control_group cg(opt.cgroup_name);
    cg.load();
    cg.attach_current();
}

cgroup_usage read_cgroup_usage(const runguard_options &opt) {
    cgroup_usage usage;
    control_group cg(opt.cgroup_name);
    cg.load();

    usage.memory_bytes = cg.controller("memory").get_int64("memory.max_usage_in_bytes");
    usage.cpu_seconds = (double)cg.controller("cpuacct").get_int64("cpuacct.usage") / 1e9;

    ifstream fin(fmt::format("{}{}/memory.oom_control", CGROUP_MEMORY_ROOT, opt.cgroup_name));
    string key;
    int64_t value;
    while (fin >> key >> value) {
        if (key == "oom_kill") usage.oom_killed = value > 0;
    }
    return usage;
}

void kill_cgroup(const runguard_options &opt) {
    void *handle = nullptr;
    pid_t pid;
    // 每轮重新遍历，直到 cgroup 中没有进程
    while (true) {
        int ret = cgroup_get_task_begin(opt.cgroup_name.c_str(), "memory", &handle, &pid);
        cgroup_get_task_end(&handle);
        if (ret != 0) break;
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG(ERROR) << "unable to kill process " << pid << " in cgroup: " << strerror(errno);
            break;
        }
    }
}

void delete_cgroup(const runguard_options &opt) {
    control_group cg(opt.cgroup_name);
    cg.load();
    cg.remove();
}

static void set_rlimit(int resource, rlim_t soft, rlim_t hard, const char *name) {
    struct rlimit lim;
    lim.rlim_cur = soft;
    lim.rlim_max = hard;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), fmt::format("setrlimit {}", name));
}

static void check(int ret, const string &what) {
    if (ret != 0) throw system_error(errno, generic_category(), what);
}

static void mount_filesystem(const runguard_options &opt) {
    if (opt.chroot_dir.empty()) return;

    // 新的挂载命名空间中的改动不能传播回宿主机
    check(mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr), "making mounts private");

    const char *root = opt.chroot_dir.c_str();
    check(mount(root, root, nullptr, MS_BIND | MS_REC, nullptr),
          fmt::format("bind mounting {}", opt.chroot_dir));
    check(mount(nullptr, root, nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr),
          fmt::format("remounting {} read-only", opt.chroot_dir));

    for (auto &bind : opt.binds) {
        string target = opt.chroot_dir + bind.target;
        check(mount(bind.source.c_str(), target.c_str(), nullptr, MS_BIND, nullptr),
              fmt::format("binding {} to {}", bind.source, target));
        check(mount(nullptr, target.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_NOSUID | MS_NODEV, nullptr),
              fmt::format("remounting {}", target));
    }

    check(chroot(root), fmt::format("unable to chroot to {}", opt.chroot_dir));
    check(chdir("/"), "unable to chdir to / in chroot");
}

void set_restrictions(const runguard_options &opt) {
    if (opt.use_cpu_limit) {
        // 软限制时内核发送 SIGXCPU，硬限制时发送 SIGKILL
        rlim_t cputime = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime, cputime + 1, "cpu");
    }

    // 内存由 cgroup 限制
    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY, "as");
    set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY, "data");
    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY, "stack");

    if (opt.file_limit >= 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit, "fsize");
    if (opt.nofile > 0) set_rlimit(RLIMIT_NOFILE, opt.nofile, opt.nofile, "nofile");
    if (opt.nproc > 0) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc, "nproc");
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0, "core");

    attach_cgroup(opt);

    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    mount_filesystem(opt);

    if (!opt.work_dir.empty())
        check(chdir(opt.work_dir.c_str()), fmt::format("unable to chdir to {}", opt.work_dir));

    if (opt.group_id >= 0) {
        check(setgid(opt.group_id), "unable to set group id");
        gid_t groups[1] = {(gid_t)opt.group_id};
        check(setgroups(1, groups), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0)
        check(setuid(opt.user_id), "unable to set user id");
    else
        check(setuid(getuid()), "unable to reset user id");

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("refusing to run user command as root");
}

}  // namespace coexec::runguard
