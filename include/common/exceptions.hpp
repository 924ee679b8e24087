#pragma once

#include <boost/stacktrace.hpp>
#include <chrono>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace coexec {

struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    const char *what() const noexcept override;

protected:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 准入被拒绝的原因
 */
enum class admission_reason {
    /**
     * @brief 该用户在该房间已经有一个未结束的请求
     */
    CONCURRENT_EXECUTION_LIMIT,

    /**
     * @brief 房间的等待队列已满
     */
    QUEUE_FULL,

    /**
     * @brief 引擎正在关闭，不再接受新的请求
     */
    ENGINE_STOPPED
};

/**
 * @brief 表示提交请求没有通过准入检查
 * 被拒绝的请求不会产生任何状态，也不会广播任何事件
 */
struct admission_error : public engine_exception {
    admission_error(admission_reason reason, const std::string &message);

    admission_reason reason;

    /**
     * @brief 协议中使用的错误名，如 "QueueFull"
     */
    const char *reason_name() const;
};

/**
 * @brief 表示提交的代码或输入没有通过静态校验
 */
struct validation_error : public engine_exception {
    validation_error(const std::string &category, const std::string &message);

    /**
     * @brief 校验失败的类别，比如 "empty"、"too_long"、"filesystem"
     */
    std::string category;
};

/**
 * @brief 表示沙箱无法完成执行：分配失败或者用户程序未能启动
 */
struct execution_error : public engine_exception {
    execution_error();
    explicit execution_error(const std::string &message);
};

/**
 * @brief 表示用户程序超出了时间限制并已被杀死
 * 携带被截断之前收集到的部分输出
 */
struct timeout_error : public engine_exception {
    timeout_error(const std::string &message, std::string stdout_text, std::string stderr_text, std::chrono::milliseconds elapsed);

    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds elapsed;
};

/**
 * @brief 表示引擎的内部错误
 * 一般是调用的外部程序或者文件系统本身出现问题
 */
struct internal_error : public engine_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace coexec
