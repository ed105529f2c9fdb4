#include "common/io_utils.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace codejudge {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, generic_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, generic_category(), "unable to write " + path.string());
}

// 返回从 pos 开始的合法 UTF-8 序列的字节数，不合法时返回 0
// 拒绝过长编码、代理区码点以及大于 U+10FFFF 的码点
static size_t utf8_sequence_length(const string &str, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(str[i]); };
    unsigned char c = byte(pos);
    if (c <= 0x7F) return 1;

    size_t n;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        n = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        n = 3;
        if (c == 0xE0) lo = 0xA0;
        else if (c == 0xED) hi = 0x9F;  // U+D800 to U+DFFF
    } else if (c >= 0xF0 && c <= 0xF4) {
        n = 4;
        if (c == 0xF0) lo = 0x90;
        else if (c == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (pos + n > str.size()) return 0;
    if (byte(pos + 1) < lo || byte(pos + 1) > hi) return 0;
    for (size_t i = 2; i < n; ++i)
        if ((byte(pos + i) & 0xC0) != 0x80) return 0;
    return n;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.size();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

string utf8_replace_invalid(const string &string) {
    static const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";
    std::string result;
    result.reserve(string.size());
    for (size_t i = 0; i < string.size();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) {
            result += REPLACEMENT_CHARACTER;
            ++i;
        } else {
            result.append(string, i, n);
            i += n;
        }
    }
    return result;
}

size_t utf8_length(const string &string) {
    size_t length = 0;
    for (unsigned char c : string)
        if ((c & 0xC0) != 0x80) ++length;
    return length;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/' || subpath.find('/') != string::npos)
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace codejudge
