#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "language/language_type.hpp"
#include "security/policy.hpp"

namespace codejudge {

/**
 * @brief 代码的最大长度（按字符计）
 */
constexpr std::size_t MAX_CODE_LENGTH = 50000;

/**
 * @brief 一个执行请求最多包含的测试用例数
 */
constexpr std::size_t MAX_TEST_CASES = 20;

/**
 * @brief 测试用例的超时时间上限，单位为秒
 */
constexpr int MAX_TEST_CASE_TIMEOUT = 30;

/**
 * @brief 测试用例
 */
struct test_case {
    std::string input;
    std::string expected_output;

    /**
     * @brief 是否对提交者隐藏，不影响执行
     */
    bool is_hidden = false;

    /**
     * @brief 测试用例在总分中的权重
     */
    double weight = 1.0;

    /**
     * @brief 测试用例的时钟时间限制，单位为秒
     * 只能收紧资源限制中的 wall_time_seconds
     */
    std::optional<int> timeout;
};

/**
 * @brief 执行请求
 * 由调用方构造完整之后传入执行引擎，执行期间不会被修改
 */
struct execution_request {
    std::string code;
    language_type language;
    std::vector<test_case> test_cases;
    std::optional<security::resource_limits> resource_limits;

    /**
     * @brief 为真时只编译而不运行测试用例
     */
    bool compile_only = false;
};

/**
 * @brief 语法检查请求
 */
struct validation_request {
    std::string code;
    language_type language;
};

/**
 * @brief 检查请求的字段是否在允许的范围内
 * @throw std::invalid_argument 字段超出范围，异常信息说明了具体字段
 */
void validate_request(const execution_request &request);

/**
 * @brief 检查资源限制的字段是否在允许的范围内
 * @throw std::invalid_argument 字段超出范围
 */
void validate_resource_limits(const security::resource_limits &limits);

void from_json(const nlohmann::json &j, test_case &value);
void to_json(nlohmann::json &j, const test_case &value);

void from_json(const nlohmann::json &j, execution_request &value);
void to_json(nlohmann::json &j, const execution_request &value);

void from_json(const nlohmann::json &j, validation_request &value);

}  // namespace codejudge

namespace codejudge::security {

void from_json(const nlohmann::json &j, resource_limits &value);
void to_json(nlohmann::json &j, const resource_limits &value);

}  // namespace codejudge::security
