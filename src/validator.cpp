#include "validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <sstream>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace coexec {
using namespace std;

static const regex loop_regex(R"(\b(for|while|do)\b)");
static const regex function_regex(R"(\b(def|function|fun|func|fn|lambda)\b|=>|\b(public|private|protected|static)\s+[\w<>\[\], ]+\s+\w+\s*\()");

static size_t count_matches(const string &line, const regex &re) {
    return distance(sregex_iterator(line.begin(), line.end(), re), sregex_iterator());
}

/**
 * @brief 统计 UTF-8 字符串中的字符数，调用前需确保字符串是合法的 UTF-8
 */
static size_t count_characters(const string &text) {
    size_t count = 0;
    for (unsigned char c : text)
        if ((c & 0xC0) != 0x80) ++count;
    return count;
}

/**
 * @brief 换行、回车、制表符以外的 C0 控制字符以及 DEL
 */
static bool is_forbidden_control(unsigned char c) {
    return (c <= 0x08) || c == 0x0B || c == 0x0C || (c >= 0x0E && c <= 0x1F) || c == 0x7F;
}

validation_report estimate_complexity(const string &code) {
    validation_report report;
    istringstream stream(code);
    string line;
    while (getline(stream, line)) {
        ++report.lines;
        report.loops += count_matches(line, loop_regex);
        report.functions += count_matches(line, function_regex);
    }
    report.complexity = report.loops * 3.0 + report.functions * 2.0 + report.lines / 10.0;
    return report;
}

code_validator::code_validator(const engine_config &config) {
    for (auto &[name, policy] : config.languages) {
        compiled_policy compiled;
        compiled.max_code_length = policy.max_code_length;
        compiled.max_input_length = policy.max_input_length;
        compiled.max_line_length = policy.max_line_length;
        for (auto &pattern : policy.forbidden_patterns) {
            try {
                compiled.patterns.push_back({pattern.category, pattern.pattern, regex(pattern.pattern, regex::ECMAScript | regex::optimize)});
            } catch (regex_error &e) {
                throw invalid_argument(fmt::format("language {}: invalid forbidden pattern {}: {}", name, pattern.pattern, e.what()));
            }
        }
        policies[name] = move(compiled);
    }
}

const code_validator::compiled_policy &code_validator::get_policy(const string &language) const {
    auto it = policies.find(language);
    if (it == policies.end())
        throw validation_error("unsupported_language", "Unsupported language: " + language);
    return it->second;
}

validation_report code_validator::validate(const string &language, const string &code) const {
    const compiled_policy &policy = get_policy(language);

    if (boost::algorithm::trim_copy(code).empty())
        throw validation_error("empty", "Code cannot be empty");

    if (!utf8_check_is_valid(code))
        throw validation_error("invalid_characters", "Code is not valid UTF-8");

    if (count_characters(code) > policy.max_code_length)
        throw validation_error("too_long", fmt::format("Code too long (max {} characters)", policy.max_code_length));

    for (unsigned char c : code)
        if (is_forbidden_control(c))
            throw validation_error("invalid_characters", "Code contains invalid characters");

    istringstream stream(code);
    string line;
    size_t line_number = 0;
    while (getline(stream, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // std::regex 的匹配深度随行长增长，过长的行会耗尽栈空间
        if (count_characters(line) > policy.max_line_length)
            throw validation_error("line_too_long",
                                   fmt::format("Line {} too long (max {} characters)", line_number, policy.max_line_length));
        for (auto &pattern : policy.patterns) {
            if (regex_search(line, pattern.regex)) {
                DLOG(INFO) << "code rejected by pattern " << pattern.source << " at line " << line_number;
                throw validation_error(pattern.category,
                                       fmt::format("Code contains potentially dangerous pattern ({}) at line {}", pattern.category, line_number));
            }
        }
    }

    return estimate_complexity(code);
}

void code_validator::validate_input(const string &language, const string &input) const {
    const compiled_policy &policy = get_policy(language);

    if (!utf8_check_is_valid(input))
        throw validation_error("invalid_characters", "Input is not valid UTF-8");

    if (count_characters(input) > policy.max_input_length)
        throw validation_error("input_too_long", fmt::format("Input too long (max {} characters)", policy.max_input_length));
}

}  // namespace coexec
