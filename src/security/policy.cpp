#include "security/policy.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <boost/regex.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string_view>
#include "common/io_utils.hpp"

namespace codejudge::security {
using namespace std;

const string TRUNCATION_MARKER = "\n... [Output truncated due to size limit]";

// clang-format off
static const map<security_level, security_limits> level_limits = boost::assign::map_list_of
    //                          memory  cpu  wall  procs  files  output
    (security_level::LOW,     security_limits{512, 30, 60, 5, 50, 1024 * 1024})
    (security_level::MEDIUM,  security_limits{256, 15, 30, 3, 25, 512 * 1024})
    (security_level::HIGH,    security_limits{128, 10, 20, 2, 15, 256 * 1024})
    (security_level::MAXIMUM, security_limits{64,  5,  10, 1, 10, 128 * 1024});

static const map<security_level, const char *> level_names = boost::assign::map_list_of
    (security_level::LOW, "low")
    (security_level::MEDIUM, "medium")
    (security_level::HIGH, "high")
    (security_level::MAXIMUM, "maximum");

/**
 * 各语言的危险模式，按顺序匹配。
 * 包括文件系统、进程创建、网络、反射和动态求值相关的 API。
 */
static const map<language_type, vector<string>> dangerous_patterns = boost::assign::map_list_of
    (language_type::PYTHON, vector<string>{
        R"re(import\s+os)re",
        R"re(import\s+subprocess)re",
        R"re(import\s+sys)re",
        R"re(import\s+socket)re",
        R"re(import\s+urllib)re",
        R"re(import\s+requests)re",
        R"re(import\s+http)re",
        R"re(from\s+os\s+import)re",
        R"re(from\s+subprocess\s+import)re",
        R"re(from\s+socket\s+import)re",
        R"re(__import__\s*\()re",
        R"re(eval\s*\()re",
        R"re(exec\s*\()re",
        R"re(compile\s*\()re",
        R"re(open\s*\()re",
        R"re(file\s*\()re",
        R"re(input\s*\(\s*["'][^"']*["'])re"})  // 带提示语的 input
    (language_type::JAVASCRIPT, vector<string>{
        R"re(require\s*\(\s*["']fs["'])re",
        R"re(require\s*\(\s*["']child_process["'])re",
        R"re(require\s*\(\s*["']net["'])re",
        R"re(require\s*\(\s*["']http["'])re",
        R"re(require\s*\(\s*["']https["'])re",
        R"re(require\s*\(\s*["']url["'])re",
        R"re(process\.exit)re",
        R"re(process\.kill)re",
        R"re(eval\s*\()re",
        R"re(Function\s*\()re",
        R"re(setTimeout\s*\()re",
        R"re(setInterval\s*\()re"})
    (language_type::JAVA, vector<string>{
        R"re(import\s+java\.io\.)re",
        R"re(import\s+java\.net\.)re",
        R"re(import\s+java\.nio\.)re",
        R"re(import\s+java\.lang\.reflect\.)re",
        R"re(import\s+java\.lang\.Runtime)re",
        R"re(Runtime\.getRuntime\(\))re",
        R"re(ProcessBuilder)re",
        R"re(System\.exit)re",
        R"re(System\.setProperty)re",
        R"re(Class\.forName)re",
        R"re(Thread\s*\()re"})
    (language_type::CPP, vector<string>{
        R"re(#include\s*<fstream>)re",
        R"re(#include\s*<filesystem>)re",
        R"re(#include\s*<cstdlib>)re",
        R"re(#include\s*<unistd\.h>)re",
        R"re(#include\s*<sys/)re",
        R"re(system\s*\()re",
        R"re(exec\w*\s*\()re",
        R"re(fork\s*\()re",
        R"re(pthread_create)re",
        R"re(std::thread)re"})
    (language_type::CSHARP, vector<string>{
        R"re(using\s+System\.IO)re",
        R"re(using\s+System\.Net)re",
        R"re(using\s+System\.Diagnostics)re",
        R"re(using\s+System\.Reflection)re",
        R"re(using\s+System\.Threading)re",
        R"re(Process\.Start)re",
        R"re(File\.)re",
        R"re(Directory\.)re",
        R"re(Environment\.Exit)re",
        R"re(Assembly\.Load)re"})
    (language_type::GO, vector<string>{
        R"re(import\s+"os")re",
        R"re(import\s+"os/exec")re",
        R"re(import\s+"net")re",
        R"re(import\s+"net/http")re",
        R"re(import\s+"syscall")re",
        R"re(import\s+"unsafe")re",
        R"re(os\.Exit)re",
        R"re(exec\.Command)re",
        R"re(syscall\.)re"})
    (language_type::RUST, vector<string>{
        R"re(use\s+std::process)re",
        R"re(use\s+std::fs)re",
        R"re(use\s+std::net)re",
        R"re(use\s+std::thread)re",
        R"re(std::process::Command)re",
        R"re(std::fs::File)re",
        R"re(std::net::TcpStream)re",
        R"re(unsafe\s*\{)re",
        R"re(std::process::exit)re"});
// clang-format on

// 以 if 等关键字开头的行视为打开了一层新的代码块
static const vector<string> python_block_keywords = {
    "if", "elif", "else:", "for", "while", "try:", "except", "finally:", "with", "def", "class"};

static const boost::regex hex_escape(R"(\\x[0-9a-fA-F]{2})");
static const boost::regex octal_escape(R"(\\[0-7]{3})");

// 源代码可能有几百 KB，匹配器不能随输入长度递归
static const map<language_type, vector<boost::regex>> &compiled_patterns() {
    static const map<language_type, vector<boost::regex>> patterns = [] {
        map<language_type, vector<boost::regex>> result;
        for (auto &[lang, list] : dangerous_patterns)
            for (auto &pattern : list)
                result[lang].emplace_back(pattern, boost::regex::perl | boost::regex::icase);
        return result;
    }();
    return patterns;
}

const char *get_security_level_name(security_level level) {
    return level_names.at(level);
}

security_level parse_security_level(const string &name) {
    string lower = boost::algorithm::to_lower_copy(name);
    for (auto &[level, level_name] : level_names)
        if (lower == level_name) return level;
    throw invalid_argument("Unknown security level " + name);
}

const security_limits &get_security_limits(security_level level) {
    return level_limits.at(level);
}

security_limits resolve_limits(security_level level, const optional<resource_limits> &request_limits) {
    security_limits limits = get_security_limits(level);
    if (!request_limits) return limits;
    limits.memory_mb = min(limits.memory_mb, request_limits->memory_mb);
    limits.cpu_time_seconds = min(limits.cpu_time_seconds, request_limits->cpu_time_seconds);
    limits.wall_time_seconds = min(limits.wall_time_seconds, request_limits->wall_time_seconds);
    limits.max_processes = min(limits.max_processes, request_limits->max_processes);
    limits.max_files = min(limits.max_files, request_limits->max_files);
    return limits;
}

static int python_nesting_depth(const string &code) {
    int max_depth = 0;
    size_t start = 0;
    while (start <= code.size()) {
        size_t end = code.find('\n', start);
        if (end == string::npos) end = code.size();
        string_view line(code.data() + start, end - start);
        start = end + 1;

        size_t columns = 0, pos = 0;
        for (; pos < line.size(); ++pos) {
            if (line[pos] == ' ') columns += 1;
            else if (line[pos] == '\t') columns += 4;
            else if (line[pos] != '\r' && line[pos] != '\f' && line[pos] != '\v') break;
        }
        string_view stripped = line.substr(pos);
        if (stripped.empty() || stripped.front() == '#') continue;

        bool opens_block = any_of(python_block_keywords.begin(), python_block_keywords.end(),
                                  [&](const string &keyword) { return stripped.substr(0, keyword.size()) == keyword; });
        if (opens_block)
            max_depth = max(max_depth, static_cast<int>(columns / 4) + 1);
    }
    return max_depth;
}

static int brace_nesting_depth(const string &code) {
    int depth = 0, max_depth = 0;
    for (char c : code) {
        if (c == '{') {
            max_depth = max(max_depth, ++depth);
        } else if (c == '}') {
            depth = max(0, depth - 1);
        }
    }
    return max_depth;
}

int max_nesting_depth(const string &code, language_type lang) {
    if (lang == language_type::PYTHON)
        return python_nesting_depth(code);
    else
        return brace_nesting_depth(code);
}

security_finding screen(const string &code, language_type lang) {
    security_finding finding;

    auto patterns = compiled_patterns().find(lang);
    if (patterns != compiled_patterns().end()) {
        for (auto &pattern : patterns->second) {
            for (boost::sregex_iterator it(code.begin(), code.end(), pattern), end; it != end; ++it) {
                auto line = count(code.begin(), code.begin() + it->position(), '\n') + 1;
                finding.violations.push_back(
                    fmt::format("Line {}: Potentially dangerous pattern '{}' detected", line, it->str()));
            }
        }
    }

    size_t start = 0, line_number = 1;
    while (start <= code.size()) {
        size_t end = code.find('\n', start);
        if (end == string::npos) end = code.size();
        size_t length = utf8_length(code.substr(start, end - start));
        if (length > MAX_LINE_LENGTH)
            finding.warnings.push_back(fmt::format("Line {}: Unusually long line ({} characters)", line_number, length));
        start = end + 1;
        ++line_number;
    }

    int depth = max_nesting_depth(code, lang);
    if (depth > MAX_NESTING_DEPTH)
        finding.warnings.push_back(fmt::format("Excessive nesting depth: {} levels", depth));

    return finding;
}

static bool is_stripped_control(unsigned char c) {
    return c <= 0x08 || c == 0x0B || c == 0x0C || (c >= 0x0E && c <= 0x1F) || c == 0x7F;
}

bool validate_test_case_input(const string &input) {
    if (input.size() > MAX_INPUT_SIZE)
        return false;
    if (!utf8_check_is_valid(input))
        return false;
    if (any_of(input.begin(), input.end(), [](char c) { return is_stripped_control(c); }))
        return false;
    if (boost::regex_search(input, hex_escape) || boost::regex_search(input, octal_escape))
        return false;
    return true;
}

/**
 * @brief 计算从 pos 处 ESC 开始的 ANSI 转义序列长度
 * 识别两字节的 Fe 序列以及 CSI 序列 ESC [ 参数 中间字节 结束字节。
 * 序列不完整时返回 0，调用方只删除 ESC 本身。
 */
static size_t ansi_sequence_length(const string &text, size_t pos) {
    if (pos + 1 >= text.size()) return 0;
    unsigned char kind = text[pos + 1];
    if (kind != '[')
        return kind >= 0x40 && kind <= 0x5F ? 2 : 0;

    size_t i = pos + 2;
    while (i < text.size() && text[i] >= 0x30 && text[i] <= 0x3F) ++i;  // 参数字节
    while (i < text.size() && text[i] >= 0x20 && text[i] <= 0x2F) ++i;  // 中间字节
    if (i < text.size() && text[i] >= 0x40 && text[i] <= 0x7E)
        return i + 1 - pos;
    return 0;
}

static string strip_escapes_and_controls(const string &text) {
    string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        if (text[i] == '\x1B') {
            size_t length = ansi_sequence_length(text, i);
            i += max<size_t>(length, 1);
        } else {
            if (!is_stripped_control(text[i])) result += text[i];
            ++i;
        }
    }
    return result;
}

// 回退到 UTF-8 字符边界，保证不把多字节字符截成两半
static size_t utf8_boundary(const string &text, size_t keep) {
    while (keep > 0 && (static_cast<unsigned char>(text[keep]) & 0xC0) == 0x80) --keep;
    return keep;
}

string sanitize_output(const string &output, size_t max_size) {
    // 先替换非法字节，替换可能让文本变长，所以必须在截断之前
    string result = utf8_replace_invalid(output);
    if (result.size() > max_size) {
        if (max_size > TRUNCATION_MARKER.size()) {
            size_t keep = utf8_boundary(result, max_size - TRUNCATION_MARKER.size());
            result = result.substr(0, keep) + TRUNCATION_MARKER;
        } else {
            result.resize(utf8_boundary(result, max_size));
        }
    }
    return strip_escapes_and_controls(result);
}

}  // namespace codejudge::security
