#pragma once

#include <chrono>
#include <functional>
#include <thread>
#include "config.hpp"
#include "execution.hpp"
#include "sandbox/sandbox.hpp"

/**
 * 执行线程相关函数
 * 引擎为每个获得执行槽位的请求启动一个执行线程，执行线程在沙箱中运行用户代码，
 * 把沙箱的各种结局（正常退出、非零退出、超时、无法启动、内部错误）统一转换为
 * 终止状态的 execution_result，再通过回调交还给引擎。
 */
namespace coexec {

/**
 * @brief 为请求构造终止状态的结果，输出与资源统计留空
 */
execution_result make_result(const execution_request &request, status stat, std::chrono::system_clock::time_point ended_at);

/**
 * @brief 在沙箱中运行请求，并将所有结局转换为终止状态的结果
 * @param box 沙箱后端
 * @param request 已经开始执行的请求
 * @param policy 请求语言的策略
 * @param timeout 用户程序的时钟时间上限
 * @return 终止状态的结果，本函数不会抛出异常
 */
execution_result run_execution(sandbox::sandbox &box, const execution_request &request, const language_policy &policy, std::chrono::milliseconds timeout) noexcept;

/**
 * @brief 启动执行线程
 * 线程运行 run_execution，然后以结果调用 on_finish
 * @return 产生的线程
 */
std::thread start_worker(sandbox::sandbox &box, execution_request request, language_policy policy, std::chrono::milliseconds timeout,
                         std::function<void(execution_result)> on_finish);

}  // namespace coexec
