#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/sandbox.hpp"

namespace coexec::sandbox {

/**
 * @brief 基于进程隔离的沙箱
 * 每次执行都会在 RUN_DIR 下创建以执行 id 命名的目录，写入用户代码和标准输入，
 * 然后 fork 出子进程运行语言命令。
 *
 * 配置了 runguard 时，子进程为 runguard，由 runguard 负责 cgroup 资源限制、
 * 命名空间隔离、只读根文件系统和降权；否则子进程自行设置 rlimit 并在新的会话中运行。
 *
 * 父进程以轮询的方式读取输出到有界缓冲区，超时后先发送 SIGTERM，
 * 等待一段时间后发送 SIGKILL 给整个进程组。无论成功失败，返回前都会回收子进程
 * 并删除执行目录。
 */
struct process_sandbox : public sandbox {
    explicit process_sandbox(sandbox_config config);

    sandbox_result run(const sandbox_request &request) override;

    /**
     * @brief 还没有被回收的子进程数量
     */
    size_t live_processes() const;

    /**
     * @brief 生成运行命令
     * @param workdir 执行目录
     */
    std::vector<std::string> build_command(const sandbox_request &request, const std::filesystem::path &workdir) const;

    /**
     * @brief 生成用户程序的环境变量
     * @param home 用户程序看到的执行目录
     */
    std::vector<std::string> build_environment(const sandbox_request &request, const std::string &home) const;

private:
    sandbox_config config;
    std::atomic<size_t> running{0};
};

/**
 * @brief 检查沙箱配置是否提供了命名空间隔离
 * 不使用 runguard 时用户程序可以访问网络和可写的宿主文件系统，只允许在调试模式下这样运行。
 * 使用 runguard 时必须指定运行用户，因为 runguard 拒绝以 root 身份运行用户程序。
 * @throw std::invalid_argument 当配置不满足要求时
 */
void check_isolation(const sandbox_config &config, bool debug);

}  // namespace coexec::sandbox
