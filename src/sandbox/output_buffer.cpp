#include "sandbox/output_buffer.hpp"
#include <algorithm>
#include <cstring>
#include "common/io_utils.hpp"

namespace coexec::sandbox {
using namespace std;

output_buffer::output_buffer(size_t max_lines, size_t max_bytes)
    : max_lines(max_lines), max_bytes(max_bytes) {}

void output_buffer::append(const char *data, size_t size) {
    received_bytes += size;
    const char *end = data + size;
    while (data < end) {
        const char *newline = static_cast<const char *>(memchr(data, '\n', end - data));
        if (!newline) {
            partial.append(data, end);
            stored_bytes += end - data;
            break;
        }
        partial.append(data, newline + 1);
        stored_bytes += newline + 1 - data;
        push_line(move(partial));
        partial.clear();
        data = newline + 1;
    }
    trim();
}

/**
 * @brief 从 text 头部删掉至少 count 个字节，删除的位置不会落在多字节字符中间
 * @return 实际删除的字节数
 */
static size_t erase_front(string &text, size_t count) {
    count = min(count, text.size());
    // 一个字符最多 4 个字节，非法输出中连续的后续字节交给 utf8_sanitize 处理
    for (int i = 0; i < 3 && count < text.size() && (static_cast<unsigned char>(text[count]) & 0xC0) == 0x80; ++i)
        ++count;
    text.erase(0, count);
    return count;
}

void output_buffer::push_line(string &&line) {
    // 单独一行就超过字节上限时只保留末尾
    if (line.size() > max_bytes) {
        stored_bytes -= erase_front(line, line.size() - max_bytes);
        dropped = true;
    }
    lines.push_back(move(line));
}

void output_buffer::trim() {
    size_t line_count = lines.size() + (partial.empty() ? 0 : 1);
    while (!lines.empty() && (line_count > max_lines || stored_bytes > max_bytes)) {
        stored_bytes -= lines.front().size();
        lines.pop_front();
        --line_count;
        dropped = true;
    }
    // 没有换行符的超长行只保留末尾
    if (stored_bytes > max_bytes && !partial.empty()) {
        erase_front(partial, stored_bytes - max_bytes);
        stored_bytes = partial.size();
        dropped = true;
    }
}

string output_buffer::str() const {
    string result;
    result.reserve(stored_bytes);
    for (auto &line : lines) result += line;
    result += partial;
    return utf8_sanitize(result);
}

bool output_buffer::truncated() const {
    return dropped;
}

size_t output_buffer::total_bytes() const {
    return received_bytes;
}

}  // namespace coexec::sandbox
