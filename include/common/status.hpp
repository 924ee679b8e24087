#pragma once

#include <string>

namespace coexec {

/**
 * @brief 表示一次代码执行请求的状态
 * QUEUED 与 EXECUTING 为非终止状态，其余均为终止状态。
 * 一个请求只会单向地从 QUEUED 走到 EXECUTING 再走到某个终止状态，
 * 或者从 QUEUED 直接被取消。
 */
enum class status {
    /**
     * @brief 请求已通过准入检查，正在房间的等待队列中
     */
    QUEUED = 0,

    /**
     * @brief 请求占用了一个执行槽位，正在沙箱中运行
     */
    EXECUTING = 1,

    /**
     * @brief 用户程序正常退出，且退出码为 0
     */
    COMPLETED = 2,

    /**
     * @brief 用户程序以非零退出码退出、被信号杀死、内存超限，
     * 或者沙箱本身出现了故障
     */
    FAILED = 3,

    /**
     * @brief 用户程序运行时间超过了 executionTimeoutMs
     */
    TIMEOUT = 4,

    /**
     * @brief 请求在排队期间被提交者取消
     */
    CANCELLED = 5
};

/**
 * @brief 返回状态对应的协议名，如 "completed"
 */
const char *get_status_name(status stat);

/**
 * @brief 返回适合展示给用户的状态描述
 */
const char *get_display_message(status stat);

/**
 * @brief 根据协议名解析状态
 * @throw std::invalid_argument 当名称无法识别时
 */
status parse_status(const std::string &name);

/**
 * @brief 判断状态是否为终止状态
 */
bool is_terminal(status stat);

}  // namespace coexec
