#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> status_string = boost::assign::map_list_of
    (execution_status::SUCCESS, "Success")
    (execution_status::COMPILATION_ERROR, "Compilation Error")
    (execution_status::RUNTIME_ERROR, "Runtime Error")
    (execution_status::TIMEOUT, "Timeout")
    (execution_status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (execution_status::SECURITY_VIOLATION, "Security Violation")
    (execution_status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<execution_status, const char *> status_name = boost::assign::map_list_of
    (execution_status::SUCCESS, "success")
    (execution_status::COMPILATION_ERROR, "compilation_error")
    (execution_status::RUNTIME_ERROR, "runtime_error")
    (execution_status::TIMEOUT, "timeout")
    (execution_status::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded")
    (execution_status::SECURITY_VIOLATION, "security_violation")
    (execution_status::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(execution_status stat) {
    return status_string.at(stat);
}

const char *get_status_name(execution_status stat) {
    return status_name.at(stat);
}

execution_status parse_status_name(const string &name) {
    for (auto &[stat, text] : status_name)
        if (name == text) return stat;
    throw invalid_argument("Unknown execution status " + name);
}

void to_json(nlohmann::json &j, const execution_status &status) {
    j = get_status_name(status);
}

void from_json(const nlohmann::json &j, execution_status &status) {
    status = parse_status_name(j.get<string>());
}

}  // namespace codejudge
