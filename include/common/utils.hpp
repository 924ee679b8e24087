#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace coexec {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成执行请求的唯一标识，形如 exec_1700000000000_3f9a1c2b
 * 可以被多个线程同时调用
 */
std::string generate_execution_id();

/**
 * @brief 将时间点转换为 Unix 毫秒时间戳
 */
int64_t to_epoch_ms(std::chrono::system_clock::time_point time);

/**
 * @brief 计算两个时间点之间经过的毫秒数
 */
int64_t milliseconds_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace coexec
