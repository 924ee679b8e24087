#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

/**
 * 测试用的沙箱，按代码内容决定运行结果：
 * 1. "ok:<text>"：输出 text，退出码为 0
 * 2. "block:<name>"：阻塞到 release(name) 被调用，然后输出 name
 * 3. "hang"：阻塞到 release("hang") 被调用，不理会超时，用于测试看门狗
 * 4. "binary"：输出不合法的 UTF-8 字节
 * 5. "fail"：在标准错误输出 boom，退出码为 1
 * 6. "timeout"：抛出 timeout_error，带有部分输出
 * 7. "crash"：抛出 execution_error
 * 8. 其他代码原样输出
 */
namespace coexec::test {

struct fake_sandbox : public coexec::sandbox::sandbox {
    coexec::sandbox::sandbox_result run(const coexec::sandbox::sandbox_request &request) override;

    /**
     * @brief 放行所有等待 name 的执行，之后到达的也不再阻塞
     */
    void release(const std::string &name);

    void release_all();

    /**
     * @brief 按开始顺序排列的代码
     */
    std::vector<std::string> started_codes() const;

    size_t running() const;

    /**
     * @brief 同时运行的执行数的峰值
     */
    size_t peak_running() const;

    /**
     * @brief 等待至少 count 个执行开始
     */
    bool wait_started(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

private:
    void block_until_released(const std::string &name);

    mutable std::mutex mut;
    mutable std::condition_variable cond;
    std::set<std::string> released;
    bool release_everything = false;
    std::vector<std::string> codes;
    size_t running_count = 0;
    size_t peak = 0;
};

}  // namespace coexec::test
