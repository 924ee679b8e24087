#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "broadcaster.hpp"

namespace coexec::test {

/**
 * 记录所有广播事件的通道
 */
struct recording_channel : public broadcast_channel {
    using predicate = std::function<bool(const std::vector<execution_event> &)>;

    void publish(const std::string &room_id, const execution_event &event) override;

    std::vector<execution_event> events() const;

    /**
     * @brief 某个执行的所有事件，按送达顺序排列
     */
    std::vector<event_type> types_of(const std::string &execution_id) const;

    /**
     * @brief 事件在送达顺序中的下标，不存在时返回 -1
     */
    int index_of(const std::string &execution_id, event_type type) const;

    /**
     * @brief 等待已送达的事件满足 pred
     */
    bool wait_for(predicate pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

    /**
     * @brief 等待执行的某个事件送达
     */
    bool wait_for_event(const std::string &execution_id, event_type type, std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

private:
    mutable std::mutex mut;
    mutable std::condition_variable cond;
    std::vector<execution_event> recorded;
};

}  // namespace coexec::test
