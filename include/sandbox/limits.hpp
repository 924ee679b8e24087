#pragma once

#include <sys/resource.h>
#include <chrono>
#include <vector>
#include "config.hpp"

namespace coexec::sandbox {

struct rlimit_setting {
    int resource;
    rlim_t soft;
    rlim_t hard;
};

/**
 * @brief 计算不使用 runguard 时用户程序的 rlimit
 * 内存限制通过 RLIMIT_DATA 实现，因为 JVM 和 V8 会预留大量不可写的虚拟内存，
 * 使用 RLIMIT_AS 会导致它们无法启动。
 * CPU 时间限制比时钟时间多一秒，作为时钟时间监控失效时的兜底。
 */
std::vector<rlimit_setting> plan_rlimits(const language_policy &policy, const sandbox_config &config, std::chrono::milliseconds timeout);

/**
 * @brief 对当前进程应用 rlimit
 * 只调用 setrlimit，可以在多线程程序 fork 出的子进程中 exec 之前使用
 * @return 成功返回 0，否则返回 errno
 */
int apply_rlimits(const std::vector<rlimit_setting> &settings) noexcept;

}  // namespace coexec::sandbox
