#include "execution/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <chrono>
#include <cmath>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/runner.hpp"

namespace codejudge {
using namespace std;

// 最近修改过的工作区可能属于刚刚开始的请求，清理时跳过
static const auto STALE_WORKSPACE_AGE = chrono::minutes(1);

static const vector<string> SUPPORTED_FEATURES = {"syntax_highlighting", "auto_completion", "error_detection"};

executor::executor(const language_registry &registry, sandbox &box, slot_pool &slots,
                   security::security_level level, filesystem::path run_dir)
    : registry(registry), box(box), slots(slots), level(level), run_dir(move(run_dir)) {}

execution_result executor::execute_code(const execution_request &request) {
    elapsed_time timer;
    execution_result result;
    try {
        result = execute_impl(request);
    } catch (engine_exception &e) {
        LOG(ERROR) << "Execution of " << get_language_name(request.language) << " code failed: " << e;
        result = make_error_result(execution_status::INTERNAL_ERROR, request.test_cases.size(), fmt::format("Internal error: {}", e.what()));
    } catch (exception &e) {
        LOG(ERROR) << "Execution of " << get_language_name(request.language) << " code failed: " << e.what();
        result = make_error_result(execution_status::INTERNAL_ERROR, request.test_cases.size(), fmt::format("Internal error: {}", e.what()));
    }
    result.total_execution_time_ms = timer.duration<chrono::milliseconds>().count();
    LOG(INFO) << get_language_name(request.language) << " request finished: " << get_display_message(result.status)
              << ", " << result.passed_tests << "/" << result.total_tests << " passed in " << result.total_execution_time_ms << "ms";
    return result;
}

execution_result executor::execute_impl(const execution_request &request) {
    const language_driver *driver = registry.resolve(request.language);
    if (!driver)
        return make_error_result(execution_status::INTERNAL_ERROR, request.test_cases.size(),
                                 fmt::format("Unsupported language: {}", get_language_name(request.language)));

    try {
        validate_request(request);
    } catch (invalid_argument &e) {
        return make_error_result(execution_status::INTERNAL_ERROR, request.test_cases.size(),
                                 fmt::format("Invalid request: {}", e.what()));
    }

    auto finding = security::screen(request.code, request.language);
    for (size_t i = 0; i < request.test_cases.size(); ++i)
        if (!security::validate_test_case_input(request.test_cases[i].input))
            finding.violations.push_back(fmt::format("Test case {}: Invalid input data", i + 1));

    if (!finding.violations.empty()) {
        LOG(WARNING) << "Rejected " << get_language_name(request.language) << " code with "
                     << finding.violations.size() << " security violation(s)";
        auto result = make_error_result(execution_status::SECURITY_VIOLATION, request.test_cases.size(),
                                        "Code contains potentially dangerous operations");
        result.security_violations = finding.violations;
        result.warnings = finding.warnings;
        return result;
    }

    auto limits = security::resolve_limits(level, request.resource_limits);

    // 整个请求独占一个槽位，所有沙箱上下文都运行在同一个 CPU 核心上
    sandbox_slot slot = slots.acquire();
    runner sandbox_runner(box, slot.cpuset());

    program_workspace workspace;
    try {
        workspace = sandbox_runner.prepare(request.code, *driver, run_dir);
    } catch (compilation_error &e) {
        auto result = make_error_result(execution_status::COMPILATION_ERROR, request.test_cases.size(), e.what());
        compilation_result compilation;
        compilation.error_message = e.what();
        result.compilation = compilation;
        result.warnings = finding.warnings;
        return result;
    }

    register_workspace(workspace.root);
    defer {
        release_workspace(workspace.root);
        if (!DEBUG) {
            error_code ec;
            filesystem::remove_all(workspace.root, ec);
            if (ec) LOG(ERROR) << "Unable to remove workspace " << workspace.root << ": " << ec.message();
        }
    };

    execution_result result;
    result.total_tests = request.test_cases.size();
    result.warnings = finding.warnings;

    if (driver->requires_compilation()) {
        auto compilation = sandbox_runner.compile(*driver, workspace);
        append(result.warnings, compilation.warnings);
        result.compilation = compilation;
        if (!compilation.success) {
            result.status = execution_status::COMPILATION_ERROR;
            result.error_message = compilation.error_message;
            return result;
        }
    }

    if (request.compile_only) {
        result.status = execution_status::SUCCESS;
        return result;
    }

    for (auto &tc : request.test_cases) {
        auto case_result = run_test_case(sandbox_runner, *driver, workspace, tc, limits);
        result.total_memory_used_mb += case_result.memory_used_mb;
        if (case_result.passed) ++result.passed_tests;
        result.test_results.push_back(move(case_result));
    }

    result.score = calculate_score(request.test_cases, result.test_results);
    result.status = aggregate_status(result.test_results);
    return result;
}

test_case_result executor::run_test_case(runner &sandbox_runner, const language_driver &driver,
                                         const program_workspace &workspace, const test_case &tc,
                                         const security::security_limits &limits) {
    auto case_limits = limits;
    if (tc.timeout)
        case_limits.wall_time_seconds = min(case_limits.wall_time_seconds, *tc.timeout);

    auto run = sandbox_runner.run(driver, workspace, tc.input, case_limits);

    test_case_result result;
    result.input = tc.input;
    result.expected_output = tc.expected_output;
    result.actual_output = run.stdout_data;
    result.execution_time_ms = llround(run.elapsed_ms);
    result.memory_used_mb = run.peak_memory_mb;
    result.is_hidden = tc.is_hidden;

    if (run.status != execution_status::SUCCESS) {
        result.status = run.status;
        result.error_message = run.error_message;
    } else if (outputs_match(run.stdout_data, tc.expected_output)) {
        result.status = execution_status::SUCCESS;
        result.passed = true;
    } else {
        result.status = execution_status::RUNTIME_ERROR;
        result.error_message = "Output mismatch";
    }
    return result;
}

validation_result executor::validate_syntax(const validation_request &request) {
    try {
        return validate_impl(request);
    } catch (exception &e) {
        LOG(ERROR) << "Syntax validation of " << get_language_name(request.language) << " code failed: " << e.what();
        validation_result result;
        result.syntax_errors.push_back(fmt::format("Validation error: {}", e.what()));
        return result;
    }
}

validation_result executor::validate_impl(const validation_request &request) {
    validation_result result;
    const language_driver *driver = registry.resolve(request.language);
    if (!driver) {
        result.syntax_errors.push_back(fmt::format("Unsupported language: {}", get_language_name(request.language)));
        return result;
    }
    if (request.code.empty()) {
        result.syntax_errors.push_back("Code must not be empty");
        return result;
    }
    if (utf8_length(request.code) > MAX_CODE_LENGTH) {
        result.syntax_errors.push_back(fmt::format("Code exceeds {} characters", MAX_CODE_LENGTH));
        return result;
    }

    auto finding = security::screen(request.code, request.language);
    result.warnings = finding.warnings;
    for (auto &violation : finding.violations)
        result.suggestions.push_back("Avoid restricted construct: " + violation);

    sandbox_slot slot = slots.acquire();
    runner sandbox_runner(box, slot.cpuset());

    program_workspace workspace;
    try {
        workspace = sandbox_runner.prepare(request.code, *driver, run_dir);
    } catch (compilation_error &e) {
        result.syntax_errors.push_back(e.what());
        return result;
    }

    register_workspace(workspace.root);
    defer {
        release_workspace(workspace.root);
        if (!DEBUG) {
            error_code ec;
            filesystem::remove_all(workspace.root, ec);
            if (ec) LOG(ERROR) << "Unable to remove workspace " << workspace.root << ": " << ec.message();
        }
    };

    if (driver->requires_compilation()) {
        auto compilation = sandbox_runner.compile(*driver, workspace);
        append(result.warnings, compilation.warnings);
        if (!compilation.success) {
            result.syntax_errors.push_back(compilation.error_message.value_or("Compilation failed"));
            string output = boost::algorithm::trim_copy(compilation.output);
            if (!output.empty())
                result.syntax_errors.push_back(output);
        }
    } else {
        result.syntax_errors = sandbox_runner.check_syntax(*driver, workspace);
    }

    result.is_valid = result.syntax_errors.empty();
    return result;
}

vector<language_info> executor::get_supported_languages() const {
    lock_guard<mutex> guard(mut);
    vector<language_info> languages;
    for (auto *driver : registry.drivers()) {
        auto &config = driver->config();
        language_info info;
        info.name = get_language_name(config.type);
        auto it = versions.find(config.type);
        info.version = it != versions.end() ? it->second : "latest";
        info.file_extension = config.file_extension;
        if (!config.compile_command.empty())
            info.compile_command = config.compile_command;
        info.run_command = config.run_command;
        info.supported_features = SUPPORTED_FEATURES;
        languages.push_back(info);
    }
    return languages;
}

vector<image_build_report> executor::build_sandbox_images() {
    vector<image_build_report> reports;
    for (auto *driver : registry.drivers()) {
        auto &config = driver->config();
        image_build_report report;
        report.language = get_language_name(config.type);
        report.image = config.image;

        try {
            box.build_image(config.image, report.language);

            sandbox_slot slot = slots.acquire();
            runner sandbox_runner(box, slot.cpuset());
            filesystem::create_directories(run_dir);
            auto version = sandbox_runner.probe_version(*driver, run_dir);

            report.success = true;
            if (version) {
                lock_guard<mutex> guard(mut);
                versions[config.type] = *version;
                report.message = fmt::format("Built {} ({})", config.image, *version);
            } else {
                report.message = fmt::format("Built {}", config.image);
            }
            LOG(INFO) << report.message;
        } catch (exception &e) {
            LOG(ERROR) << "Failed to build " << config.image << ": " << e.what();
            report.message = e.what();
        }
        reports.push_back(report);
    }
    return reports;
}

size_t executor::cleanup_orphaned_contexts() {
    size_t removed = 0;
    try {
        removed = box.cleanup_orphans();
    } catch (engine_exception &e) {
        LOG(ERROR) << "Unable to clean up orphaned sandbox contexts: " << e;
    } catch (exception &e) {
        LOG(ERROR) << "Unable to clean up orphaned sandbox contexts: " << e.what();
    }

    error_code ec;
    if (!filesystem::is_directory(run_dir, ec))
        return removed;

    auto now = filesystem::file_time_type::clock::now();
    filesystem::directory_iterator it(run_dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        error_code entry_ec;
        if (!it->is_directory(entry_ec)) continue;
        filesystem::path path = it->path();
        {
            lock_guard<mutex> guard(mut);
            if (active_workspaces.count(path)) continue;
        }
        auto modified = filesystem::last_write_time(path, entry_ec);
        if (entry_ec || now - modified < STALE_WORKSPACE_AGE) continue;

        filesystem::remove_all(path, entry_ec);
        if (entry_ec) {
            LOG(WARNING) << "Unable to remove stale workspace " << path << ": " << entry_ec.message();
        } else {
            LOG(INFO) << "Removed stale workspace " << path;
            ++removed;
        }
    }
    if (ec)
        LOG(WARNING) << "Unable to scan " << run_dir << ": " << ec.message();
    return removed;
}

void executor::register_workspace(const filesystem::path &root) {
    lock_guard<mutex> guard(mut);
    active_workspaces.insert(root);
}

void executor::release_workspace(const filesystem::path &root) {
    lock_guard<mutex> guard(mut);
    active_workspaces.erase(root);
}

double calculate_score(const vector<test_case> &test_cases, const vector<test_case_result> &results) {
    double total_weight = 0, passed_weight = 0;
    for (size_t i = 0; i < test_cases.size(); ++i) {
        total_weight += test_cases[i].weight;
        if (i < results.size() && results[i].passed)
            passed_weight += test_cases[i].weight;
    }
    if (total_weight <= 0) return 0;
    return round(passed_weight / total_weight * 100 * 100) / 100;
}

execution_status aggregate_status(const vector<test_case_result> &results) {
    auto has = [&](execution_status status) {
        for (auto &result : results)
            if (result.status == status) return true;
        return false;
    };

    bool all_passed = true;
    for (auto &result : results)
        if (!result.passed) all_passed = false;
    if (all_passed) return execution_status::SUCCESS;

    for (auto status : {execution_status::TIMEOUT, execution_status::MEMORY_LIMIT_EXCEEDED, execution_status::SECURITY_VIOLATION})
        if (has(status)) return status;
    return execution_status::RUNTIME_ERROR;
}

bool outputs_match(const string &actual, const string &expected) {
    return boost::algorithm::trim_copy(actual) == boost::algorithm::trim_copy(expected);
}

}  // namespace codejudge
