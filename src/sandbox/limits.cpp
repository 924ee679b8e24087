#include "sandbox/limits.hpp"
#include <cerrno>
#include <algorithm>
#include <cmath>

namespace coexec::sandbox {
using namespace std;

vector<rlimit_setting> plan_rlimits(const language_policy &policy, const sandbox_config &config, chrono::milliseconds timeout) {
    vector<rlimit_setting> settings;

    rlim_t cpu_seconds = (rlim_t)ceil(timeout.count() / 1000.0) + 1;
    settings.push_back({RLIMIT_CPU, cpu_seconds, cpu_seconds + 1});

    if (policy.memory_kb > 0) {
        rlim_t memory = (rlim_t)policy.memory_kb * 1024;
        settings.push_back({RLIMIT_DATA, memory, memory});
    }

    if (policy.max_processes > 0)
        settings.push_back({RLIMIT_NPROC, (rlim_t)policy.max_processes, (rlim_t)policy.max_processes});

    if (policy.max_open_files > 0)
        settings.push_back({RLIMIT_NOFILE, (rlim_t)policy.max_open_files, (rlim_t)policy.max_open_files});

    if (config.scratch_size_kb > 0) {
        rlim_t file_size = (rlim_t)config.scratch_size_kb * 1024;
        settings.push_back({RLIMIT_FSIZE, file_size, file_size});
    }

    settings.push_back({RLIMIT_CORE, 0, 0});
    return settings;
}

int apply_rlimits(const vector<rlimit_setting> &settings) noexcept {
    for (auto &setting : settings) {
        struct rlimit current, lim;
        if (getrlimit(setting.resource, &current) != 0)
            return errno;
        // 非特权进程不能提高硬限制
        lim.rlim_max = current.rlim_max == RLIM_INFINITY ? setting.hard : min(setting.hard, current.rlim_max);
        lim.rlim_cur = min(setting.soft, lim.rlim_max);
        if (setrlimit(setting.resource, &lim) != 0)
            return errno;
    }
    return 0;
}

}  // namespace coexec::sandbox
