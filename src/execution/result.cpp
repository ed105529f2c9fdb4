#include "execution/result.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

template <typename T>
static json optional_to_json(const optional<T> &value) {
    if (value) return json(*value);
    return json();
}

execution_result make_error_result(execution_status status, size_t total_tests, const string &message) {
    execution_result result;
    result.status = status;
    result.total_tests = total_tests;
    result.error_message = message;
    return result;
}

void to_json(json &j, const compilation_result &value) {
    j = {{"success", value.success},
         {"output", value.output},
         {"error_message", optional_to_json(value.error_message)},
         {"warnings", value.warnings}};
}

void to_json(json &j, const test_case_result &value) {
    j = {{"input", value.input},
         {"expected_output", value.expected_output},
         {"actual_output", value.actual_output},
         {"status", value.status},
         {"execution_time_ms", value.execution_time_ms},
         {"memory_used_mb", value.memory_used_mb},
         {"passed", value.passed},
         {"error_message", optional_to_json(value.error_message)},
         {"is_hidden", value.is_hidden}};
}

void to_json(json &j, const execution_result &value) {
    j = {{"status", value.status},
         {"test_results", value.test_results},
         {"compilation", optional_to_json(value.compilation)},
         {"total_execution_time_ms", value.total_execution_time_ms},
         {"total_memory_used_mb", value.total_memory_used_mb},
         {"passed_tests", value.passed_tests},
         {"total_tests", value.total_tests},
         {"score", value.score},
         {"error_message", optional_to_json(value.error_message)},
         {"security_violations", value.security_violations},
         {"warnings", value.warnings}};
}

void to_json(json &j, const validation_result &value) {
    j = {{"is_valid", value.is_valid},
         {"syntax_errors", value.syntax_errors},
         {"warnings", value.warnings},
         {"suggestions", value.suggestions}};
}

void to_json(json &j, const language_info &value) {
    j = {{"name", value.name},
         {"version", value.version},
         {"file_extension", value.file_extension},
         {"compile_command", optional_to_json(value.compile_command)},
         {"run_command", value.run_command},
         {"supported_features", value.supported_features}};
}

void to_json(json &j, const image_build_report &value) {
    j = {{"language", value.language},
         {"image", value.image},
         {"success", value.success},
         {"message", value.message}};
}

}  // namespace codejudge
