#include "execution/request.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

static void check_range(const char *field, int value, int min_value, int max_value) {
    if (value < min_value || value > max_value)
        throw invalid_argument(fmt::format("{} must be between {} and {}, got {}", field, min_value, max_value, value));
}

void validate_resource_limits(const security::resource_limits &limits) {
    check_range("memory_mb", limits.memory_mb, 16, 512);
    check_range("cpu_time_seconds", limits.cpu_time_seconds, 1, 30);
    check_range("wall_time_seconds", limits.wall_time_seconds, 1, 60);
    check_range("max_processes", limits.max_processes, 1, 5);
    check_range("max_files", limits.max_files, 1, 50);
}

void validate_request(const execution_request &request) {
    size_t code_length = utf8_length(request.code);
    if (code_length == 0)
        throw invalid_argument("code must not be empty");
    if (code_length > MAX_CODE_LENGTH)
        throw invalid_argument(fmt::format("code must be at most {} characters, got {}", MAX_CODE_LENGTH, code_length));

    if (request.test_cases.empty())
        throw invalid_argument("at least one test case is required");
    if (request.test_cases.size() > MAX_TEST_CASES)
        throw invalid_argument(fmt::format("at most {} test cases are allowed, got {}", MAX_TEST_CASES, request.test_cases.size()));

    for (size_t i = 0; i < request.test_cases.size(); ++i) {
        auto &tc = request.test_cases[i];
        if (!(tc.weight >= 0))
            throw invalid_argument(fmt::format("test case {}: weight must be non-negative", i + 1));
        if (tc.timeout && (*tc.timeout < 1 || *tc.timeout > MAX_TEST_CASE_TIMEOUT))
            throw invalid_argument(fmt::format("test case {}: timeout must be between 1 and {}", i + 1, MAX_TEST_CASE_TIMEOUT));
    }

    if (request.resource_limits)
        validate_resource_limits(*request.resource_limits);
}

void from_json(const json &j, test_case &value) {
    j.at("input").get_to(value.input);
    j.at("expected_output").get_to(value.expected_output);
    if (j.count("is_hidden")) j.at("is_hidden").get_to(value.is_hidden);
    if (j.count("weight")) j.at("weight").get_to(value.weight);
    if (j.count("timeout") && !j.at("timeout").is_null())
        value.timeout = j.at("timeout").get<int>();
}

void to_json(json &j, const test_case &value) {
    j = {{"input", value.input},
         {"expected_output", value.expected_output},
         {"is_hidden", value.is_hidden},
         {"weight", value.weight}};
    if (value.timeout) j["timeout"] = *value.timeout;
}

void from_json(const json &j, execution_request &value) {
    j.at("code").get_to(value.code);
    j.at("language").get_to(value.language);
    j.at("test_cases").get_to(value.test_cases);
    if (j.count("resource_limits") && !j.at("resource_limits").is_null())
        value.resource_limits = j.at("resource_limits").get<security::resource_limits>();
    if (j.count("compile_only")) j.at("compile_only").get_to(value.compile_only);
}

void to_json(json &j, const execution_request &value) {
    j = {{"code", value.code},
         {"language", value.language},
         {"test_cases", value.test_cases},
         {"compile_only", value.compile_only}};
    if (value.resource_limits) j["resource_limits"] = *value.resource_limits;
}

void from_json(const json &j, validation_request &value) {
    j.at("code").get_to(value.code);
    j.at("language").get_to(value.language);
}

}  // namespace codejudge

namespace codejudge::security {

void from_json(const nlohmann::json &j, resource_limits &value) {
    if (j.count("memory_mb")) j.at("memory_mb").get_to(value.memory_mb);
    if (j.count("cpu_time_seconds")) j.at("cpu_time_seconds").get_to(value.cpu_time_seconds);
    if (j.count("wall_time_seconds")) j.at("wall_time_seconds").get_to(value.wall_time_seconds);
    if (j.count("max_processes")) j.at("max_processes").get_to(value.max_processes);
    if (j.count("max_files")) j.at("max_files").get_to(value.max_files);
}

void to_json(nlohmann::json &j, const resource_limits &value) {
    j = {{"memory_mb", value.memory_mb},
         {"cpu_time_seconds", value.cpu_time_seconds},
         {"wall_time_seconds", value.wall_time_seconds},
         {"max_processes", value.max_processes},
         {"max_files", value.max_files}};
}

}  // namespace codejudge::security
