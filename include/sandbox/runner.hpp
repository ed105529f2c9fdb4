#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "language/language.hpp"
#include "sandbox/sandbox.hpp"
#include "security/policy.hpp"

namespace codejudge {

/**
 * @brief 编译结果
 */
struct compilation_result {
    bool success = false;

    /**
     * @brief 编译器的输出（stdout 和 stderr），已经过清理
     */
    std::string output;

    std::optional<std::string> error_message;

    /**
     * @brief 编译器输出中包含 warning 的行
     */
    std::vector<std::string> warnings;
};

/**
 * @brief 一个测试用例在沙箱中运行的结果
 */
struct run_result {
    /**
     * @brief 由退出状态翻译得到的执行状态
     * 为 SUCCESS 时只说明程序正常退出，输出是否正确由调用方比较
     */
    execution_status status = execution_status::INTERNAL_ERROR;

    int exit_code = -1;

    /**
     * @brief 已经过清理的 stdout
     */
    std::string stdout_data;

    /**
     * @brief 已经过清理的 stderr
     */
    std::string stderr_data;

    double peak_memory_mb = 0;
    double elapsed_ms = 0;

    /**
     * @brief 非成功状态时的错误信息
     */
    std::string error_message;
};

/**
 * @brief 一次执行请求的工作区
 * 由 runner::prepare 创建，调用方负责在请求结束后删除 root
 *
 * root
 * └── build // 源代码及编译产物，运行时复制到每个测试用例独立的 scratch 目录中
 */
struct program_workspace {
    std::filesystem::path root;
    std::filesystem::path build_dir;

    /**
     * @brief 源文件名，位于 build_dir 中
     */
    std::string source_file;
};

/**
 * @brief 超时时 runguard 使用的返回值
 */
constexpr int EXIT_CODE_TIMEOUT = 124;

/**
 * @brief 被 SIGKILL 杀死时的返回值，cgroup 的 OOM killer 也使用 SIGKILL
 */
constexpr int EXIT_CODE_KILLED = 137;

/**
 * @brief 将沙箱的原始结果翻译为执行状态
 * 按顺序判断：超时（时间限制标记或返回值 124）为 TIMEOUT；
 * OOM 标记或返回值 137 为 MEMORY_LIMIT_EXCEEDED；返回值 0 为 SUCCESS；
 * 其余为 RUNTIME_ERROR。
 */
execution_status translate_outcome(const sandbox_outcome &outcome);

/**
 * @brief 沙箱运行器
 * 负责为每次编译、每个测试用例创建独立的沙箱上下文，
 * 并保证上下文在任何情况下（成功、失败、超时、异常）都会被销毁。
 * 一个 runner 只在一个执行请求内使用，cpuset 是该请求占用的沙箱槽位。
 */
struct runner {
    /**
     * @param box 沙箱后端
     * @param cpuset 沙箱能使用的 CPU 核心，为空表示不限制
     */
    runner(sandbox &box, std::string cpuset);

    /**
     * @brief 创建工作区并写入源代码
     * 对于 Java 这类语言，需要先从代码中提取入口点才能确定源文件名
     * @param parent 工作区所在的目录
     * @throw compilation_error 找不到入口点，此时不会创建任何沙箱上下文
     */
    program_workspace prepare(const std::string &code, const language_driver &driver, const std::filesystem::path &parent);

    /**
     * @brief 在沙箱中编译源代码
     * 编译使用 COMPILE_* 的资源限制，编译产物保留在 build_dir 中
     * @throw sandbox_error 沙箱无法创建
     */
    compilation_result compile(const language_driver &driver, const program_workspace &workspace);

    /**
     * @brief 在独立的沙箱上下文中运行程序
     * @param input 测试用例的输入，通过文件重定向为程序的标准输入
     * @param limits 资源限制
     * @throw sandbox_error 沙箱无法创建
     */
    run_result run(const language_driver &driver, const program_workspace &workspace, const std::string &input, const security::security_limits &limits);

    /**
     * @brief 在沙箱中只检查语法而不运行程序
     * @return 语法错误列表，为空表示没有发现语法错误
     * @throw sandbox_error 沙箱无法创建
     */
    std::vector<std::string> check_syntax(const language_driver &driver, const program_workspace &workspace);

    /**
     * @brief 在沙箱中获取编译器、解释器的版本
     * @return 版本信息的第一行，无法获取时返回 std::nullopt
     */
    std::optional<std::string> probe_version(const language_driver &driver, const std::filesystem::path &parent);

private:
    sandbox &box;
    std::string cpuset;

    sandbox_context_spec make_compile_spec(const language_driver &driver, const std::filesystem::path &context_dir, const std::filesystem::path &scratch_dir) const;
};

}  // namespace codejudge
