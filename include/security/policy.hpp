#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "language/language_type.hpp"

/**
 * 这里实现的是提交代码的静态安全检查，只是 runguard 运行时隔离之前的一层
 * 尽力而为的过滤：正则黑名单不可能识别所有危险代码，真正的安全边界
 * 是 runguard 提供的命名空间、chroot、cgroup 和资源限制。
 */
namespace codejudge::security {

/**
 * @brief 安全等级，每个等级对应一组固定的资源限制
 */
enum class security_level {
    LOW,
    MEDIUM,
    HIGH,
    MAXIMUM
};

const char *get_security_level_name(security_level level);

/**
 * @brief 根据名称（low、medium、high、maximum，大小写不敏感）解析安全等级
 * @throw std::invalid_argument 名称不存在
 */
security_level parse_security_level(const std::string &name);

/**
 * @brief 执行请求中可选的资源限制
 * 这些限制只能收紧安全等级的限制，参见 resolve_limits
 */
struct resource_limits {
    int memory_mb = 128;
    int cpu_time_seconds = 5;
    int wall_time_seconds = 10;
    int max_processes = 1;
    int max_files = 10;
};

/**
 * @brief 一个沙箱上下文最终使用的资源限制
 */
struct security_limits {
    int memory_mb;
    int cpu_time_seconds;
    int wall_time_seconds;
    int max_processes;
    int max_files;

    /**
     * @brief stdout、stderr 分别允许的最大字节数
     */
    std::size_t max_output_size;
};

const security_limits &get_security_limits(security_level level);

/**
 * @brief 计算安全等级和请求的资源限制共同作用下的最终限制
 * 每一项取两者的较小值，请求无法借此放宽安全等级的限制
 * @param request_limits 请求中的资源限制，为空时直接使用安全等级的限制
 */
security_limits resolve_limits(security_level level, const std::optional<resource_limits> &request_limits);

/**
 * @brief 静态检查的结果
 * violations 非空时请求会在创建任何沙箱之前被拒绝，warnings 只作为提示
 */
struct security_finding {
    std::vector<std::string> violations;
    std::vector<std::string> warnings;
};

/**
 * @brief 超过这个嵌套深度的代码会产生警告
 */
constexpr int MAX_NESTING_DEPTH = 10;

/**
 * @brief 超过这个长度（按字符计）的行会产生警告
 */
constexpr std::size_t MAX_LINE_LENGTH = 500;

/**
 * @brief 测试用例输入的最大字节数
 */
constexpr std::size_t MAX_INPUT_SIZE = 10 * 1024;

/**
 * @brief 输出被截断时附加在末尾的标记
 */
extern const std::string TRUNCATION_MARKER;

/**
 * @brief 对提交的代码进行静态安全检查
 * 按顺序匹配该语言的危险模式（大小写不敏感），每一处匹配产生一条
 * "Line N: Potentially dangerous pattern '...' detected"；同时检查超长行和嵌套深度
 * @param code 提交的代码
 * @param lang 代码的语言
 */
security_finding screen(const std::string &code, language_type lang);

/**
 * @brief 计算代码的最大嵌套深度
 * Python 按缩进计算，其余语言按花括号计算
 */
int max_nesting_depth(const std::string &code, language_type lang);

/**
 * @brief 检查测试用例的输入
 * 输入过大、不是合法的 UTF-8、包含控制字符（\t、\n、\r 除外）
 * 或者包含形如 \x1b、\033 的转义序列文本时返回 false
 */
bool validate_test_case_input(const std::string &input);

/**
 * @brief 清理程序输出
 * 先把超出 max_size 的输出截断并附加 TRUNCATION_MARKER（结果不超过 max_size），
 * 再删除 ANSI 转义序列和控制字符（保留 \t、\n、\r）。
 * 对已经清理过的输出再次清理不会改变内容。
 */
std::string sanitize_output(const std::string &output, std::size_t max_size);

}  // namespace codejudge::security
