#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "execution.hpp"

namespace coexec {

/**
 * @brief 保存已结束请求的结果
 * 每个 id 只能写入一次。结果在保留期过后会被 sweep 删除，
 * 房间历史按结束时间从新到旧返回。
 */
struct result_store {
    explicit result_store(std::chrono::milliseconds retention_window);

    /**
     * @brief 写入一个终止状态的结果
     * @throw internal_error 当结果不是终止状态或者该 id 已经写入过时
     */
    void record(const execution_result &result);

    std::optional<execution_result> find(const std::string &id) const;

    /**
     * @brief 房间最近的结果，按结束时间从新到旧排列
     * @param limit 最多返回的条数
     */
    std::vector<execution_result> history(const std::string &room_id, size_t limit) const;

    /**
     * @brief 删除结束时间早于 now - retention_window 的结果
     * @return 删除的结果数量
     */
    size_t sweep(std::chrono::system_clock::time_point now);

    /**
     * @brief 统计保留的结果，queued 与 active 由调用者填写
     */
    execution_statistics statistics() const;

    size_t size() const;

private:
    std::chrono::milliseconds retention_window;

    mutable std::mutex mut;

    std::map<std::string, execution_result> results;

    /**
     * @brief 房间 id 到该房间结果 id 的索引，按结束时间升序排列
     */
    std::map<std::string, std::deque<std::string>> room_index;
};

}  // namespace coexec
