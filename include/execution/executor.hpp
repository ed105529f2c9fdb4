#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "execution/request.hpp"
#include "execution/result.hpp"
#include "language/registry.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/slot_pool.hpp"
#include "security/policy.hpp"

namespace codejudge {

/**
 * @brief 执行引擎的入口
 *
 * 一个执行请求的处理流程：
 * 1. 检查语言是否受支持，不支持时返回 INTERNAL_ERROR，不会创建任何沙箱
 * 2. 检查请求的字段范围、测试用例的输入，以及对代码进行静态安全检查，
 *    发现问题时返回 SECURITY_VIOLATION，不会创建任何沙箱
 * 3. 需要编译的语言在沙箱中编译，失败时返回 COMPILATION_ERROR
 * 4. 按顺序为每个测试用例创建独立的沙箱上下文运行程序，比较输出
 * 5. 汇总得到加权得分和整体状态
 *
 * 所有公开函数都不会抛出异常，错误以结果的形式返回。
 * 不同线程可以同时调用 execute_code，并发数由 slot_pool 限制。
 */
struct executor {
    /**
     * @param registry 语言表，生命周期必须长于 executor
     * @param box 沙箱后端，生命周期必须长于 executor
     * @param slots 沙箱槽位池，生命周期必须长于 executor
     * @param level 安全等级，请求中的资源限制只能收紧该等级的限制
     * @param run_dir 存放执行请求工作区的路径
     */
    executor(const language_registry &registry, sandbox &box, slot_pool &slots,
             security::security_level level, std::filesystem::path run_dir);

    /**
     * @brief 编译代码并运行所有测试用例
     */
    execution_result execute_code(const execution_request &request);

    /**
     * @brief 只检查代码的语法，不运行任何测试用例
     * 需要编译的语言直接编译；解释型语言运行语法检查命令
     */
    validation_result validate_syntax(const validation_request &request);

    /**
     * @brief 受支持的语言
     * 版本信息来自 build_sandbox_images 时的探测，未探测过时为 "latest"
     */
    std::vector<language_info> get_supported_languages() const;

    /**
     * @brief 构建所有语言的沙箱模板，并探测编译器、解释器版本
     * 这是管理操作，调用方负责权限检查
     */
    std::vector<image_build_report> build_sandbox_images();

    /**
     * @brief 清理由于崩溃残留的沙箱上下文和工作区
     * 这是管理操作，调用方负责权限检查
     * @return 清理掉的沙箱上下文与工作区数量
     */
    std::size_t cleanup_orphaned_contexts();

private:
    const language_registry &registry;
    sandbox &box;
    slot_pool &slots;
    security::security_level level;
    std::filesystem::path run_dir;

    mutable std::mutex mut;

    /**
     * @brief 正在处理的请求的工作区，清理时不能删除
     */
    std::set<std::filesystem::path> active_workspaces;

    /**
     * @brief 探测到的编译器、解释器版本
     */
    std::map<language_type, std::string> versions;

    execution_result execute_impl(const execution_request &request);
    validation_result validate_impl(const validation_request &request);

    test_case_result run_test_case(runner &sandbox_runner, const language_driver &driver,
                                   const program_workspace &workspace, const test_case &tc,
                                   const security::security_limits &limits);

    void register_workspace(const std::filesystem::path &root);
    void release_workspace(const std::filesystem::path &root);
};

/**
 * @brief 计算加权得分
 * 得分为通过的测试用例的权重之和占总权重的百分比，四舍五入保留两位小数，
 * 总权重为 0 时得分为 0
 */
double calculate_score(const std::vector<test_case> &test_cases, const std::vector<test_case_result> &results);

/**
 * @brief 根据所有测试用例的结果决定整体状态
 * 全部通过为 SUCCESS，否则依次检查是否存在 TIMEOUT、MEMORY_LIMIT_EXCEEDED、
 * SECURITY_VIOLATION，都不存在时为 RUNTIME_ERROR
 */
execution_status aggregate_status(const std::vector<test_case_result> &results);

/**
 * @brief 比较实际输出和期望输出，忽略首尾空白字符
 */
bool outputs_match(const std::string &actual, const std::string &expected);

}  // namespace codejudge
