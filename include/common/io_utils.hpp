#pragma once

#include <filesystem>
#include <string>

namespace coexec {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * @throw std::system_error 当文件无法打开或者写入失败时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将不合法的 UTF-8 字节逐个替换为 U+FFFD，合法的部分原样保留
 */
std::string utf8_sanitize(const std::string &text);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于沙箱
 * 运行时可能需要 root 权限，如果拿到的文件名包含 "../" 或者
 * 是绝对路径，那么最后有可能导致系统重要文件被覆盖。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace coexec
