#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace coexec {

/**
 * @brief 提交者的身份信息，会原样出现在事件和结果中
 */
struct user_info {
    std::string user_id;
    std::string display_name;
    std::string avatar;
};

/**
 * @brief 一次执行请求
 * 由引擎在准入时创建，id 在引擎生命周期内唯一
 */
struct execution_request {
    std::string id;
    std::string room_id;
    user_info user;
    std::string language;
    std::string code;
    std::string input;
    std::chrono::system_clock::time_point submitted_at;

    /**
     * @brief 占用执行槽位的时间，仍在排队时无意义
     */
    std::chrono::system_clock::time_point started_at;

    status stat = status::QUEUED;

    /**
     * @brief 静态校验给出的复杂度估计，仅供参考
     */
    double complexity = 0;
};

/**
 * @brief 一次执行请求的最终结果
 * 只有处于终止状态的请求才会产生结果，结果一旦写入结果存储就不再改变
 */
struct execution_result {
    std::string id;
    std::string room_id;
    user_info user;
    std::string language;
    status stat = status::FAILED;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    std::chrono::system_clock::time_point submitted_at;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point ended_at;

    /**
     * @brief 从开始执行到结束的毫秒数，排队期间被取消的请求为 0
     */
    int64_t duration_ms = 0;

    /**
     * @brief 失败、超时、取消时给出的原因
     */
    std::optional<std::string> error;

    /**
     * @brief 峰值内存使用（字节），沙箱无法统计时为 -1
     */
    int64_t memory_bytes = -1;

    /**
     * @brief CPU 时间（毫秒），沙箱无法统计时为 -1
     */
    int64_t cpu_time_ms = -1;

    bool output_truncated = false;
};

enum class event_type {
    QUEUED,
    STARTED,
    COMPLETED,
    FAILED,
    CANCELLED
};

/**
 * @brief 事件在协议中的名字，如 "execution-queued"
 */
const char *get_event_name(event_type type);

/**
 * @brief 推送给房间内所有观察者的执行事件
 * 同一个请求的事件严格按照 queued、started、completed/failed 的顺序发出，
 * 或者 queued、cancelled
 */
struct execution_event {
    event_type type;
    std::string execution_id;
    std::string room_id;
    user_info user;
    std::string language;
    std::chrono::system_clock::time_point timestamp;

    /**
     * @brief 排队位置（从 1 开始），仅 queued 事件有效
     */
    size_t position = 0;

    /**
     * @brief 估计的等待时间，仅 queued 事件有效
     */
    int64_t estimated_wait_ms = 0;

    /**
     * @brief 终止事件携带最终结果
     */
    std::optional<execution_result> result;
};

/**
 * @brief 提交成功后返回给调用者的凭据
 */
struct submission_ticket {
    std::string execution_id;
    size_t position = 0;
    int64_t estimated_wait_ms = 0;
    double complexity = 0;

    /**
     * @brief 在请求进入终止状态时就绪
     */
    std::shared_future<execution_result> result;
};

/**
 * @brief 房间状态快照中的一条记录
 */
struct room_status_entry {
    std::string execution_id;
    user_info user;
    std::string language;
    status stat;
    std::chrono::system_clock::time_point submitted_at;

    /**
     * @brief 仅对正在执行的请求有效
     */
    std::optional<std::chrono::system_clock::time_point> started_at;

    /**
     * @brief 排队位置（从 1 开始），正在执行的请求为 0
     */
    size_t position = 0;
};

struct room_status {
    std::string room_id;
    std::vector<room_status_entry> queued;
    std::vector<room_status_entry> active;
    size_t queue_length = 0;
    size_t active_count = 0;
    size_t max_concurrent = 0;
};

/**
 * @brief 全局统计
 * total、completed、failed、timed_out、cancelled 基于结果存储中仍保留的结果，
 * queued、active 为当前值
 */
struct execution_statistics {
    size_t total = 0;
    size_t queued = 0;
    size_t active = 0;
    size_t completed = 0;

    /**
     * @brief 失败与超时的请求数
     */
    size_t failed = 0;

    /**
     * @brief failed 中因为超时失败的请求数
     */
    size_t timed_out = 0;

    size_t cancelled = 0;

    /**
     * @brief completed / total * 100，没有结果时为 0
     */
    double success_rate = 0;
};

void to_json(nlohmann::json &j, const user_info &user);
void from_json(const nlohmann::json &j, user_info &user);
void to_json(nlohmann::json &j, const execution_result &result);
void to_json(nlohmann::json &j, const execution_event &event);
void to_json(nlohmann::json &j, const room_status_entry &entry);
void to_json(nlohmann::json &j, const room_status &snapshot);
void to_json(nlohmann::json &j, const execution_statistics &statistics);

}  // namespace coexec
