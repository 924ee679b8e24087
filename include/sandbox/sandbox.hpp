#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "config.hpp"

namespace coexec::sandbox {

/**
 * @brief 交给沙箱运行的一段用户代码
 */
struct sandbox_request {
    /**
     * @brief 执行 id，沙箱用它来命名执行目录
     */
    std::string execution_id;

    /**
     * @brief 语言的运行命令以及资源限制
     */
    language_policy policy;

    std::string code;

    std::string input;

    /**
     * @brief 从用户程序启动开始计算的时钟时间上限
     */
    std::chrono::milliseconds timeout;
};

/**
 * @brief 用户程序正常结束（包括非零退出码）时的运行结果
 */
struct sandbox_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 退出码，若被信号杀死则为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 杀死用户程序的信号，没有则为 -1
     */
    int signal = -1;

    bool output_truncated = false;

    /**
     * @brief 用户程序因为内存超限被杀死
     */
    bool memory_exceeded = false;

    int64_t memory_bytes = -1;

    int64_t cpu_time_ms = -1;

    int64_t wall_time_ms = 0;
};

/**
 * @brief 沙箱后端
 * 每次 run 都在一个全新的、相互隔离的环境中运行用户程序，返回前
 * 必须清理掉所有的进程和临时文件。
 *
 * 实现必须是线程安全的，引擎会在多个执行线程中同时调用 run。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 运行用户代码
     * @return 用户程序退出后的结果，退出码非零也属于正常返回
     * @throw timeout_error 用户程序运行超时，已被杀死
     * @throw execution_error 无法分配执行环境或者无法启动用户程序
     */
    virtual sandbox_result run(const sandbox_request &request) = 0;
};

}  // namespace coexec::sandbox
