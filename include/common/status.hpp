#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace codejudge {

/**
 * @brief 表示单个测试用例或整个执行请求的执行结果
 */
enum class execution_status {
    /**
     * @brief 程序正常退出
     * 对于测试用例，还要求输出与期望输出一致
     */
    SUCCESS = 0,

    /**
     * @brief 程序编译失败，或者无法找到程序入口（比如 Java 的 public class）
     * 该状态会终止整个请求，不会运行任何测试用例
     */
    COMPILATION_ERROR = 1,

    /**
     * @brief 程序以非零返回值退出、被除 SIGKILL 外的信号终止，或者输出不正确
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 程序运行超出时钟时间或者 CPU 时间限制
     */
    TIMEOUT = 3,

    /**
     * @brief 程序运行内存超出限制
     * cgroup 触发 OOM killer，或者程序被 SIGKILL 终止
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief 代码或者测试输入没有通过安全检查
     */
    SECURITY_VIOLATION = 5,

    /**
     * @brief 执行引擎出错，比如语言不受支持或者沙箱无法创建
     */
    INTERNAL_ERROR = 6
};

const char *get_display_message(execution_status);

/**
 * @brief 状态在 JSON 中的表示，比如 "memory_limit_exceeded"
 */
const char *get_status_name(execution_status);

/**
 * @brief 根据 JSON 中的名称解析状态
 * @throw std::invalid_argument 当名称不存在时
 */
execution_status parse_status_name(const std::string &name);

void to_json(nlohmann::json &j, const execution_status &status);
void from_json(const nlohmann::json &j, execution_status &status);

}  // namespace codejudge
