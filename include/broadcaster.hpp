#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include "common/concurrent_queue.hpp"
#include "execution.hpp"

namespace coexec {

/**
 * @brief 房间广播通道
 * 负责把事件送达房间内的所有连接，由接入层实现（比如 WebSocket 房间）。
 * publish 只会在事件分发线程中被调用。
 */
struct broadcast_channel {
    virtual ~broadcast_channel();

    virtual void publish(const std::string &room_id, const execution_event &event) = 0;
};

/**
 * @brief 事件广播器
 * 引擎在持有房间锁时把事件放入队列，由单独的分发线程按入队顺序送达广播通道
 * 和本地订阅者，因此同一房间内的事件顺序与状态变化的顺序一致，
 * 而且广播通道的阻塞不会影响引擎。
 */
struct event_broadcaster {
    using subscriber = std::function<void(const execution_event &)>;

    /**
     * @param channel 广播通道，可以为空；需要比广播器活得更久
     */
    explicit event_broadcaster(broadcast_channel *channel = nullptr);

    ~event_broadcaster();

    /**
     * @brief 启动分发线程
     */
    void start();

    /**
     * @brief 送达队列中剩余的事件后停止分发线程
     */
    void stop();

    /**
     * @brief 事件入队，立即返回
     */
    void publish(const std::string &room_id, execution_event event);

    /**
     * @brief 订阅房间的事件
     * @param room_id 房间 id，为空时订阅所有房间
     * @return 订阅 id，用于取消订阅
     */
    unsigned subscribe(const std::string &room_id, subscriber callback);

    void unsubscribe(unsigned id);

    /**
     * @brief 已送达的事件数量
     */
    size_t delivered() const;

private:
    void dispatch_loop();
    void deliver(const std::string &room_id, const execution_event &event);

    broadcast_channel *channel;
    concurrent_queue<std::pair<std::string, execution_event>> queue;
    std::thread dispatcher;
    std::atomic<bool> running{false};
    std::atomic<size_t> delivered_count{0};

    std::mutex subscribers_mut;
    std::map<unsigned, std::pair<std::string, subscriber>> subscribers;
    unsigned next_subscriber = 1;
};

}  // namespace coexec
