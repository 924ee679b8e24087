#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace coexec::sandbox {

/**
 * @brief 有界的输出缓冲区
 * 只保留最近的 max_lines 行且总字节数不超过 max_bytes，
 * 超出时丢弃最早的行，单独一行超过 max_bytes 时只保留该行的末尾。
 * 截断总是发生在 UTF-8 字符的边界上。用户程序可以无限输出，但内存占用是有界的。
 */
struct output_buffer {
    output_buffer(size_t max_lines, size_t max_bytes);

    /**
     * @brief 追加一段从管道读入的数据，数据可以在行中间断开
     */
    void append(const char *data, size_t size);

    /**
     * @brief 返回保留下来的输出，不合法的 UTF-8 字节会被替换为 U+FFFD
     */
    std::string str() const;

    /**
     * @brief 是否有输出被丢弃
     */
    bool truncated() const;

    /**
     * @brief 累计读入的字节数，包含被丢弃的部分
     */
    size_t total_bytes() const;

private:
    void push_line(std::string &&line);
    void trim();

    size_t max_lines;
    size_t max_bytes;

    std::deque<std::string> lines;

    /**
     * @brief 还没有遇到换行符的最后一行
     */
    std::string partial;

    size_t stored_bytes = 0;
    size_t received_bytes = 0;
    bool dropped = false;
};

}  // namespace coexec::sandbox
