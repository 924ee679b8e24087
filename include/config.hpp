#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace coexec {

/**
 * @brief 调试模式下沙箱不会删除执行目录，以便检查用户程序留下的文件
 */
extern bool DEBUG;

/**
 * @brief 静态校验中的一条禁止模式
 * 模式按行匹配（ECMAScript 正则语法），命中任意一行即拒绝该代码
 */
struct forbidden_pattern {
    /**
     * @brief 违规类别，如 "filesystem"、"process"、"network"，会出现在校验错误中
     */
    std::string category;

    std::string pattern;
};

/**
 * @brief 一门语言的运行方式、资源限制和静态校验规则
 */
struct language_policy {
    std::string name;

    /**
     * @brief 用户代码写入执行目录时使用的文件名，如 main.py
     */
    std::string filename;

    /**
     * @brief 运行命令，其中的 {file} 会被替换成源文件名
     */
    std::vector<std::string> command;

    /**
     * @brief 额外的环境变量，形如 KEY=VALUE
     * 用户程序运行在干净的环境中，只会看到 PATH、HOME、TMPDIR 和这里列出的变量
     */
    std::vector<std::string> environment;

    /**
     * @brief 内存限制，单位为 KB，0 表示不限制
     */
    int64_t memory_kb = 262144;

    /**
     * @brief 可以使用的 CPU 核心份额，0.5 表示半个核心
     */
    double cpu_quota = 0.5;

    int max_processes = 50;

    int max_open_files = 64;

    size_t max_code_length = 50000;

    size_t max_input_length = 1000;

    /**
     * @brief 单行代码的字符数上限，超过的行不会交给禁止模式匹配
     */
    size_t max_line_length = 4096;

    std::vector<forbidden_pattern> forbidden_patterns;
};

/**
 * @brief 沙箱后端的配置
 */
struct sandbox_config {
    /**
     * @brief runguard 可执行文件路径，为空时直接在子进程中设置 rlimit 运行用户程序
     */
    std::filesystem::path runguard;

    /**
     * @brief 存放每次执行的临时目录的父目录
     *
     * RUN_DIR
     * └── exec_1700000000000_3f9a1c2b // 执行 id
     *     ├── main.py // 用户代码
     *     ├── input.txt // 标准输入
     *     └── program.meta // runguard 写出的运行结果
     */
    std::filesystem::path run_dir = "/tmp/coexec";

    /**
     * @brief 只读的根文件系统，仅在使用 runguard 时生效
     */
    std::filesystem::path chroot_dir;

    std::string run_user;

    std::string run_group;

    size_t max_output_lines = 1000;

    size_t max_output_bytes = 1 << 20;

    /**
     * @brief 用户程序可写文件大小的上限，单位为 KB
     */
    int64_t scratch_size_kb = 1024;
};

/**
 * @brief 执行引擎的全部配置
 */
struct engine_config {
    size_t max_concurrent_executions = 3;

    size_t max_queue_size = 10;

    std::chrono::milliseconds execution_timeout{30000};

    std::chrono::milliseconds cleanup_interval{60000};

    std::chrono::milliseconds retention_window{24 * 60 * 60 * 1000};

    /**
     * @brief 估算排队等待时间时假设的单次执行耗时
     */
    std::chrono::milliseconds average_execution_time{5000};

    /**
     * @brief 沙箱超时之后引擎看门狗再等待的时间，超过后强制将请求标记为超时
     */
    std::chrono::milliseconds watchdog_grace{2000};

    size_t history_limit = 20;

    sandbox_config sandbox;

    std::map<std::string, language_policy> languages;

    /**
     * @brief 查找语言的策略
     * @throw validation_error 当语言不受支持时（类别为 unsupported_language）
     */
    const language_policy &get_language(const std::string &language) const;
};

/**
 * @brief 内置的 python、javascript、java 三种语言策略
 */
std::map<std::string, language_policy> default_language_policies();

/**
 * @brief 默认配置，包含内置语言策略
 */
engine_config default_engine_config();

/**
 * @brief 从 JSON 配置文件加载配置，文件中未出现的字段保持默认值
 * @throw std::invalid_argument 当配置格式错误或取值非法时
 */
engine_config load_engine_config(const std::filesystem::path &path);

void from_json(const nlohmann::json &j, forbidden_pattern &pattern);
void from_json(const nlohmann::json &j, language_policy &policy);
void from_json(const nlohmann::json &j, sandbox_config &config);
void from_json(const nlohmann::json &j, engine_config &config);

}  // namespace coexec
