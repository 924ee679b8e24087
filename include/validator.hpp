#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>
#include "config.hpp"

namespace coexec {

/**
 * @brief 通过校验的代码的统计信息
 */
struct validation_report {
    size_t lines = 0;
    size_t loops = 0;
    size_t functions = 0;

    /**
     * @brief loops * 3 + functions * 2 + lines / 10，仅供参考，不会导致拒绝
     */
    double complexity = 0;
};

/**
 * @brief 估算代码复杂度
 */
validation_report estimate_complexity(const std::string &code);

/**
 * @brief 代码静态校验器
 * 在请求进入队列之前对代码做纯函数式的检查，检查顺序为：
 * 1. 语言是否受支持
 * 2. 代码是否为空（只包含空白字符也视为空）
 * 3. 代码是否为合法的 UTF-8，长度（按字符计）是否超过语言的上限
 * 4. 代码是否包含换行、回车、制表符以外的控制字符
 * 5. 每一行的长度是否超过语言的单行上限
 * 6. 代码的每一行是否命中语言的禁止模式
 * 任何一项不通过都会抛出 validation_error。
 * 禁止模式只是第一道防线，通过校验的代码仍然会在沙箱中运行。
 *
 * 校验器构造完成后只读，可以被多个线程同时使用。
 */
struct code_validator {
    /**
     * @throw std::invalid_argument 当某条禁止模式不是合法的正则表达式时
     */
    explicit code_validator(const engine_config &config);

    /**
     * @brief 校验代码
     * @return 代码的复杂度估计
     * @throw validation_error 校验不通过时
     */
    validation_report validate(const std::string &language, const std::string &code) const;

    /**
     * @brief 校验标准输入
     * @throw validation_error 语言不受支持，或者输入过长、不是合法的 UTF-8 时
     */
    void validate_input(const std::string &language, const std::string &input) const;

private:
    struct compiled_pattern {
        std::string category;
        std::string source;
        std::regex regex;
    };

    struct compiled_policy {
        size_t max_code_length;
        size_t max_input_length;
        size_t max_line_length;
        std::vector<compiled_pattern> patterns;
    };

    const compiled_policy &get_policy(const std::string &language) const;

    std::map<std::string, compiled_policy> policies;
};

}  // namespace coexec
