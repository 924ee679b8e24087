#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace coexec {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::out | ios::trunc | ios::binary);
    if (!fout)
        throw system_error(errno, generic_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw system_error(errno, generic_category(), "unable to write " + path.string());
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  // U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

/**
 * @brief 返回从 pos 开始的合法 UTF-8 字符的字节数，不合法时返回 0
 */
static size_t utf8_sequence_length(const string &text, size_t pos) {
    unsigned char c = text[pos];
    size_t n;
    unsigned char lo = 0x80, hi = 0xBF;  // 第二个字节的取值范围
    if (c <= 0x7F)
        return 1;
    else if (c >= 0xC2 && c <= 0xDF)
        n = 2;
    else if (c >= 0xE0 && c <= 0xEF) {
        n = 3;
        if (c == 0xE0) lo = 0xA0;  // 过长编码
        if (c == 0xED) hi = 0x9F;  // U+D800 到 U+DFFF
    } else if (c >= 0xF0 && c <= 0xF4) {
        n = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;  // 超过 U+10FFFF
    } else
        return 0;
    if (pos + n > text.size()) return 0;
    unsigned char second = text[pos + 1];
    if (second < lo || second > hi) return 0;
    for (size_t i = 2; i < n; ++i)
        if (((unsigned char)text[pos + i] & 0xC0) != 0x80) return 0;
    return n;
}

string utf8_sanitize(const string &text) {
    static const char replacement[] = "\xEF\xBF\xBD";  // U+FFFD
    string result;
    result.reserve(text.size());
    for (size_t pos = 0; pos < text.size();) {
        size_t n = utf8_sequence_length(text, pos);
        if (n == 0) {
            result += replacement;
            ++pos;
        } else {
            result.append(text, pos, n);
            pos += n;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace coexec
