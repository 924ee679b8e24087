#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace coexec {

/**
 * @brief 执行看门狗
 * 为每个正在执行的请求登记一个截止时间，到期后在看门狗线程中调用回调。
 * 回调调用时不持有看门狗的锁，可以在回调中调用 disarm。
 */
struct watchdog {
    using clock = std::chrono::steady_clock;
    using callback = std::function<void()>;

    watchdog();
    ~watchdog();

    /**
     * @brief 登记截止时间
     * @return 登记 id，用于 disarm
     */
    unsigned arm(clock::time_point deadline, callback on_expire);

    /**
     * @brief 取消登记，如果回调已经被调用则什么也不做
     */
    void disarm(unsigned id);

    /**
     * @brief 尚未到期的登记数量
     */
    size_t armed() const;

    /**
     * @brief 停止看门狗线程，尚未到期的回调不会再被调用
     */
    void stop();

private:
    void loop();

    mutable std::mutex mut;
    std::condition_variable cond;
    std::set<std::pair<clock::time_point, unsigned>> deadlines;
    std::map<unsigned, std::pair<clock::time_point, callback>> entries;
    unsigned next_id = 1;
    bool stopped = false;
    std::thread worker;
};

}  // namespace coexec
