#pragma once

#include <cstdint>
#include <string>
#include "runguard_options.hpp"

namespace coexec::runguard {

/**
 * @brief cgroup 中记录的资源使用情况
 */
struct cgroup_usage {
    int64_t memory_bytes = -1;
    double cpu_seconds = -1;
    bool oom_killed = false;
};

/**
 * @brief 在内核中创建 opt.cgroup_name
 * 启用以下管控器：
 * 1. memory：限制内存，内存与内存加交换分区的上限设为一样，使得用户程序不能使用交换分区
 * 2. cpu：通过 CFS 配额限制用户程序能使用的 CPU 核数
 * 3. pids：限制 cgroup 内同时存在的进程数
 * 4. cpuacct：统计 CPU 时间
 */
void create_cgroup(const runguard_options &opt);

/**
 * @brief 把当前进程移入 opt.cgroup_name
 */
void attach_cgroup(const runguard_options &opt);

/**
 * @brief 读取 cgroup 记录的峰值内存、CPU 时间以及是否发生过 OOM
 */
cgroup_usage read_cgroup_usage(const runguard_options &opt);

/**
 * @brief 杀死 cgroup 内所有进程，用户程序派生的进程不能比 runguard 活得更久
 */
void kill_cgroup(const runguard_options &opt);

void delete_cgroup(const runguard_options &opt);

/**
 * @brief 在子进程中设置用户程序的运行环境，之后直接 exec 用户程序
 * 1. 移入 cgroup
 * 2. 设置 rlimit：CPU 时间、单个文件大小、打开文件数、进程数、禁止 core dump
 * 3. 建立新的会话，使得 runguard 可以通过进程组杀死所有子进程
 * 4. 只读挂载 chroot 目录，将执行目录绑定到 chroot 中，再 chroot 并进入工作目录
 * 5. 切换到 opt.user_id 和 opt.group_id，拒绝以 root 身份运行用户程序
 * @throw std::system_error 任何一步失败时
 */
void set_restrictions(const runguard_options &opt);

}  // namespace coexec::runguard
