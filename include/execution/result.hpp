#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/runner.hpp"

namespace codejudge {

/**
 * @brief 一个测试用例的执行结果
 */
struct test_case_result {
    std::string input;
    std::string expected_output;

    /**
     * @brief 程序的实际输出，已经过清理
     */
    std::string actual_output;

    execution_status status = execution_status::INTERNAL_ERROR;
    std::int64_t execution_time_ms = 0;
    double memory_used_mb = 0;
    bool passed = false;
    std::optional<std::string> error_message;

    /**
     * @brief 与测试用例的 is_hidden 一致，由调用方决定是否向提交者隐藏
     */
    bool is_hidden = false;
};

/**
 * @brief 执行请求的结果
 */
struct execution_result {
    execution_status status = execution_status::INTERNAL_ERROR;

    /**
     * @brief 测试用例的结果，顺序与请求中的测试用例一致
     */
    std::vector<test_case_result> test_results;

    /**
     * @brief 编译结果，不需要编译的语言没有编译结果
     */
    std::optional<compilation_result> compilation;

    /**
     * @brief 整个请求的时钟时间
     */
    std::int64_t total_execution_time_ms = 0;

    /**
     * @brief 所有测试用例的峰值内存之和
     */
    double total_memory_used_mb = 0;

    std::size_t passed_tests = 0;
    std::size_t total_tests = 0;

    /**
     * @brief 加权得分，范围为 0 到 100，保留两位小数
     */
    double score = 0;

    std::optional<std::string> error_message;
    std::vector<std::string> security_violations;

    /**
     * @brief 静态检查产生的警告，不影响执行
     */
    std::vector<std::string> warnings;
};

/**
 * @brief 语法检查的结果
 */
struct validation_result {
    bool is_valid = false;
    std::vector<std::string> syntax_errors;
    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;
};

/**
 * @brief 受支持语言的信息
 */
struct language_info {
    std::string name;

    /**
     * @brief 编译器或解释器的版本，未知时为 "latest"
     */
    std::string version;

    std::string file_extension;
    std::optional<std::string> compile_command;
    std::string run_command;
    std::vector<std::string> supported_features;
};

/**
 * @brief 构建一个语言沙箱模板的结果
 */
struct image_build_report {
    std::string language;
    std::string image;
    bool success = false;
    std::string message;
};

/**
 * @brief 构造一个没有运行任何测试用例的结果
 * @param status 执行状态
 * @param total_tests 请求中的测试用例数
 * @param message 错误信息
 */
execution_result make_error_result(execution_status status, std::size_t total_tests, const std::string &message);

void to_json(nlohmann::json &j, const compilation_result &value);
void to_json(nlohmann::json &j, const test_case_result &value);
void to_json(nlohmann::json &j, const execution_result &value);
void to_json(nlohmann::json &j, const validation_result &value);
void to_json(nlohmann::json &j, const language_info &value);
void to_json(nlohmann::json &j, const image_build_report &value);

}  // namespace codejudge
