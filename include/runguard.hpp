#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace coexec {

/**
 * @brief runguard 写出的 meta 文件中记录的运行结果
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    std::string internal_error;

    /**
     * @brief 峰值内存使用（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 为 "oom" 时表示用户程序因为内存超限被杀死
     */
    std::string memory_result;

    /**
     * @brief 为 "hard-timelimit" 时表示用户程序因为超时被杀死
     */
    std::string time_result;

    /**
     * @brief 被截断的输出流，如 "stdout,stderr"
     */
    std::string output_truncated;
};

/**
 * @brief 解析 "key: value" 格式的 meta 文件
 * 文件不存在时返回空表
 */
std::map<std::string, std::string> read_metadata(const std::filesystem::path &metafile);

runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace coexec
