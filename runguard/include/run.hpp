#pragma once

#include "runguard_options.hpp"

namespace coexec::runguard {

/**
 * @brief 在受限环境中运行 opt.command，并等待其结束
 * @note 该函数会修改当前进程的信号处理和命名空间，必须在 main 函数最后调用
 * 1. 屏蔽 SIGCHLD、SIGALRM、SIGTERM，只在 pselect 中接收
 * 2. 创建 cgroup，限制内存、CPU 核数、进程数，并统计 CPU 时间
 * 3. 分离 FD、FS、IPC、NET、NS、UTS、SYSVSEM 命名空间，用户程序无法访问网络和宿主机的进程间通信
 * 4. fork 出子进程，子进程设置限制后 exec 用户程序，exec 失败时通过状态管道告知父进程
 * 5. 父进程把子进程的 stdout、stderr 转发到自己的 stdout、stderr，超过 stream_size 的部分被丢弃
 * 6. 收到 SIGALRM（时钟时间超限）或 SIGTERM 时先发送 SIGTERM 再发送 SIGKILL 给子进程组
 * 7. 子进程结束后杀死 cgroup 内所有进程，读取内存、CPU 使用情况，删除 cgroup
 * 8. 把运行结果写入 meta 文件，内部错误记录为 internal-error
 * @return 用户程序的退出码，被信号杀死时为 128 + 信号值
 */
int run_guarded(runguard_options opt);

}  // namespace coexec::runguard
