#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "broadcaster.hpp"
#include "config.hpp"
#include "execution.hpp"
#include "result_store.hpp"
#include "sandbox/sandbox.hpp"
#include "validator.hpp"
#include "watchdog.hpp"

namespace coexec {

enum class cancel_outcome {
    /**
     * @brief 排队中的请求已被移出队列
     */
    CANCELLED,

    /**
     * @brief 该用户在该房间没有未结束的请求
     */
    NOT_FOUND,

    /**
     * @brief 请求已经开始执行，不能取消
     */
    NOT_CANCELLABLE
};

const char *get_cancel_outcome_name(cancel_outcome outcome);

/**
 * @brief 多房间并发代码执行引擎
 *
 * 每个房间有一个由互斥锁串行化的协调者，房间内的所有状态变化（入队、出队、
 * 取消、状态迁移）都在房间锁内完成，事件也在房间锁内入队，因此房间内
 * 事件的顺序与状态变化的顺序一致。
 *
 * 每个房间同时最多有 maxConcurrentExecutions 个请求在执行，每个用户在每个
 * 房间最多有一个未结束的请求，等待队列严格先进先出。
 *
 * 用户代码在沙箱中运行，每个执行占用一个执行线程；每个执行都登记一个看门狗，
 * 沙箱在超时之后仍未返回时由看门狗强制将请求标记为超时并释放槽位。
 */
struct execution_engine {
    /**
     * @param config 引擎配置
     * @param box 沙箱后端
     * @param channel 房间广播通道，可以为空；需要比引擎活得更久
     * @throw std::invalid_argument 配置中有非法的禁止模式时
     */
    execution_engine(engine_config config, std::shared_ptr<sandbox::sandbox> box, broadcast_channel *channel = nullptr);

    ~execution_engine();

    /**
     * @brief 提交一段代码
     * 先做准入检查，再做静态校验，通过后进入房间队列，有空闲槽位时立即开始执行
     * @return 执行 id、排队位置、预计等待时间以及在终止时就绪的结果
     * @throw admission_error 用户已有未结束的请求、队列已满或者引擎已停止
     * @throw validation_error 代码或输入没有通过静态校验
     */
    submission_ticket submit_execution(const std::string &room_id, const user_info &user, const std::string &language,
                                       const std::string &code, const std::string &input = "");

    /**
     * @brief 与 submit_execution 相同，只返回执行 id
     */
    std::string request_execution(const std::string &room_id, const user_info &user, const std::string &language,
                                  const std::string &code, const std::string &input = "");

    /**
     * @brief 取消用户在房间中排队的请求
     * 已经开始执行的请求不能取消
     */
    cancel_outcome cancel_execution(const std::string &room_id, const std::string &user_id);

    room_status get_room_status(const std::string &room_id) const;

    /**
     * @brief 房间最近的结果，按结束时间从新到旧排列
     * @param limit 最多返回的条数，为 0 时使用配置中的 historyLimit
     */
    std::vector<execution_result> get_room_history(const std::string &room_id, size_t limit = 0) const;

    execution_statistics get_statistics() const;

    std::optional<execution_result> get_result(const std::string &execution_id) const;

    event_broadcaster &events();

    const engine_config &config() const;

    /**
     * @brief 当前持有状态的房间数量
     * 队列、执行中集合都为空的房间会被移除，历史结果仍然保存在结果存储中
     */
    size_t room_count() const;

    /**
     * @brief 立即清理过期的结果，通常由清理线程周期性调用
     * @return 删除的结果数量
     */
    size_t sweep_results();

    /**
     * @brief 停止引擎
     * 拒绝新的请求，取消所有排队中的请求，等待正在执行的请求结束，
     * 然后送达所有剩余的事件。可以重复调用。
     */
    void shutdown();

private:
    struct pending_execution {
        execution_request request;
        std::promise<execution_result> promise;
        std::shared_future<execution_result> future;
        unsigned watchdog_id = 0;
        bool settled = false;
    };

    /**
     * @brief 房间的执行状态，所有字段都由 mut 保护
     */
    struct room_state {
        std::mutex mut;

        /**
         * @brief 排队中的请求，按入队时间排列
         */
        std::deque<std::shared_ptr<pending_execution>> queue;

        /**
         * @brief 正在执行的请求
         */
        std::map<std::string, std::shared_ptr<pending_execution>> active;

        /**
         * @brief 用户 id 到该用户未结束请求的 id
         */
        std::map<std::string, std::string> user_index;

        /**
         * @brief 房间已经从 rooms 中移除，持有旧指针的调用者需要重新获取房间
         */
        bool retired = false;
    };

    std::shared_ptr<room_state> find_room(const std::string &room_id) const;
    std::shared_ptr<room_state> get_or_create_room(const std::string &room_id);
    std::shared_ptr<room_state> lock_room(const std::string &room_id, std::unique_lock<std::mutex> &lock);
    void release_room_if_idle(const std::string &room_id);
    void check_admission(const room_state &room, const user_info &user) const;
    execution_event make_event(event_type type, const execution_request &request) const;

    // 以下函数调用时必须持有房间锁
    void drain(const std::string &room_id, room_state &room);
    void start_execution(const std::string &room_id, room_state &room, const std::shared_ptr<pending_execution> &pending);
    void settle(const std::string &room_id, room_state &room, pending_execution &pending, const execution_result &result);

    void on_worker_finished(const std::string &room_id, const std::string &execution_id, execution_result result);
    void on_watchdog_expired(const std::string &room_id, const std::string &execution_id);
    void reap_workers();
    void sweeper_loop();

    engine_config cfg;
    code_validator validator;
    std::shared_ptr<sandbox::sandbox> box;
    result_store results;
    event_broadcaster broadcaster;
    watchdog dog;

    mutable std::mutex rooms_mut;
    std::map<std::string, std::shared_ptr<room_state>> rooms;

    std::mutex workers_mut;
    std::condition_variable workers_cond;
    std::map<std::string, std::thread> workers;
    std::vector<std::string> finished_workers;

    std::mutex sweeper_mut;
    std::condition_variable sweeper_cond;
    std::thread sweeper;

    std::atomic<bool> stopped{false};
    std::once_flag shutdown_flag;
};

}  // namespace coexec
