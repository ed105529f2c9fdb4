#include "execution/request.hpp"
#include "execution/result.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace codejudge;

static execution_request make_request() {
    execution_request request;
    request.code = "print(int(input())+int(input()))";
    request.language = language_type::PYTHON;
    test_case tc;
    tc.input = "5\n3";
    tc.expected_output = "8";
    request.test_cases.push_back(tc);
    return request;
}

TEST(RequestJsonTest, ParseExecutionRequest) {
    json j = R"json({
        "code": "print(input())",
        "language": "python",
        "test_cases": [
            {"input": "1", "expected_output": "1"},
            {"input": "2", "expected_output": "2", "is_hidden": true, "weight": 2.5, "timeout": 3}
        ],
        "resource_limits": {"memory_mb": 64, "cpu_time_seconds": 2},
        "compile_only": false
    })json"_json;

    auto request = j.get<execution_request>();
    EXPECT_EQ(request.code, "print(input())");
    EXPECT_EQ(request.language, language_type::PYTHON);
    ASSERT_EQ(request.test_cases.size(), 2);

    EXPECT_FALSE(request.test_cases[0].is_hidden);
    EXPECT_DOUBLE_EQ(request.test_cases[0].weight, 1.0);
    EXPECT_FALSE(request.test_cases[0].timeout.has_value());

    EXPECT_TRUE(request.test_cases[1].is_hidden);
    EXPECT_DOUBLE_EQ(request.test_cases[1].weight, 2.5);
    EXPECT_EQ(request.test_cases[1].timeout, 3);

    ASSERT_TRUE(request.resource_limits.has_value());
    EXPECT_EQ(request.resource_limits->memory_mb, 64);
    EXPECT_EQ(request.resource_limits->cpu_time_seconds, 2);
    // 缺失的字段使用默认值
    EXPECT_EQ(request.resource_limits->wall_time_seconds, security::resource_limits().wall_time_seconds);
    EXPECT_NO_THROW(validate_request(request));
}

TEST(RequestJsonTest, ExecutionRequestToJson) {
    auto request = make_request();
    json expected = R"json({
        "code": "print(int(input())+int(input()))",
        "language": "python",
        "test_cases": [{"input": "5\n3", "expected_output": "8", "is_hidden": false, "weight": 1.0}],
        "compile_only": false
    })json"_json;
    EXPECT_JSON_EQ(json(request), expected);
}

TEST(RequestJsonTest, UnsupportedLanguage) {
    json j = R"({"code": "x", "language": "cobol", "test_cases": []})"_json;
    EXPECT_THROW(j.get<execution_request>(), invalid_argument);
}

TEST(RequestJsonTest, MissingFieldThrows) {
    json j = R"({"language": "python", "test_cases": []})"_json;
    EXPECT_THROW(j.get<execution_request>(), json::exception);
}

TEST(RequestJsonTest, ValidateRequestRanges) {
    EXPECT_NO_THROW(validate_request(make_request()));

    auto empty_code = make_request();
    empty_code.code = "";
    EXPECT_THROW(validate_request(empty_code), invalid_argument);

    auto long_code = make_request();
    long_code.code = string(MAX_CODE_LENGTH + 1, 'x');
    EXPECT_THROW(validate_request(long_code), invalid_argument);

    auto no_cases = make_request();
    no_cases.test_cases.clear();
    EXPECT_THROW(validate_request(no_cases), invalid_argument);

    auto many_cases = make_request();
    many_cases.test_cases.resize(MAX_TEST_CASES + 1, many_cases.test_cases[0]);
    EXPECT_THROW(validate_request(many_cases), invalid_argument);

    auto bad_timeout = make_request();
    bad_timeout.test_cases[0].timeout = MAX_TEST_CASE_TIMEOUT + 1;
    EXPECT_THROW(validate_request(bad_timeout), invalid_argument);

    auto negative_weight = make_request();
    negative_weight.test_cases[0].weight = -1;
    EXPECT_THROW(validate_request(negative_weight), invalid_argument);

    auto zero_weight = make_request();
    zero_weight.test_cases[0].weight = 0;
    EXPECT_NO_THROW(validate_request(zero_weight));
}

TEST(RequestJsonTest, ValidateResourceLimits) {
    security::resource_limits limits;
    EXPECT_NO_THROW(validate_resource_limits(limits));

    limits.memory_mb = 1024;
    try {
        validate_resource_limits(limits);
        FAIL() << "memory_mb 1024 should be rejected";
    } catch (invalid_argument &e) {
        EXPECT_STREQ(e.what(), "memory_mb must be between 16 and 512, got 1024");
    }

    limits = security::resource_limits();
    limits.max_files = 0;
    EXPECT_THROW(validate_resource_limits(limits), invalid_argument);

    limits = security::resource_limits();
    limits.wall_time_seconds = 61;
    EXPECT_THROW(validate_resource_limits(limits), invalid_argument);
}

TEST(RequestJsonTest, ErrorResultToJson) {
    auto result = make_error_result(execution_status::INTERNAL_ERROR, 2, "Unsupported language: java");
    json expected = R"({
        "status": "internal_error",
        "test_results": [],
        "compilation": null,
        "total_execution_time_ms": 0,
        "total_memory_used_mb": 0.0,
        "passed_tests": 0,
        "total_tests": 2,
        "score": 0.0,
        "error_message": "Unsupported language: java",
        "security_violations": [],
        "warnings": []
    })"_json;
    EXPECT_JSON_EQ(json(result), expected);
}

TEST(RequestJsonTest, LanguageInfoToJson) {
    language_info info;
    info.name = "python";
    info.version = "latest";
    info.file_extension = ".py";
    info.run_command = "python3 {filename}";
    info.supported_features = {"syntax_highlighting"};

    json expected = R"({
        "name": "python",
        "version": "latest",
        "file_extension": ".py",
        "compile_command": null,
        "run_command": "python3 {filename}",
        "supported_features": ["syntax_highlighting"]
    })"_json;
    EXPECT_JSON_EQ(json(info), expected);
}
