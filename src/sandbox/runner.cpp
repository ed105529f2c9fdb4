#include "sandbox/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace codejudge {
using namespace std;

// stdin、stdout、stderr 占用的文件描述符
static const int STDIO_FILES = 3;

static string new_uuid() {
    return boost::lexical_cast<string>(boost::uuids::random_generator()());
}

/**
 * @brief 删除沙箱上下文目录，失败时只记录日志
 */
static void remove_context(const filesystem::path &context_dir) {
    if (DEBUG) return;
    error_code ec;
    filesystem::remove_all(context_dir, ec);
    if (ec) LOG(ERROR) << "Unable to remove sandbox context " << context_dir << ": " << ec.message();
}

execution_status translate_outcome(const sandbox_outcome &outcome) {
    if (outcome.time_limit_exceeded || outcome.exit_code == EXIT_CODE_TIMEOUT)
        return execution_status::TIMEOUT;
    if (outcome.out_of_memory || outcome.exit_code == EXIT_CODE_KILLED)
        return execution_status::MEMORY_LIMIT_EXCEEDED;
    if (outcome.exit_code == 0)
        return execution_status::SUCCESS;
    return execution_status::RUNTIME_ERROR;
}

runner::runner(sandbox &box, string cpuset) : box(box), cpuset(move(cpuset)) {}

program_workspace runner::prepare(const string &code, const language_driver &driver, const filesystem::path &parent) {
    // 先确定源文件名，找不到入口点时不创建任何目录
    string source_file = assert_safe_path(driver.source_file_name(code));

    program_workspace workspace;
    workspace.root = parent / new_uuid();
    workspace.build_dir = workspace.root / "build";
    workspace.source_file = source_file;

    filesystem::create_directories(workspace.build_dir);
    scoped_guard rollback([&] { remove_context(workspace.root); });
    write_file_content(workspace.build_dir / source_file, code);
    rollback.dismiss();
    return workspace;
}

sandbox_context_spec runner::make_compile_spec(const language_driver &driver, const filesystem::path &context_dir, const filesystem::path &scratch_dir) const {
    auto &config = driver.config();
    sandbox_context_spec spec;
    spec.image = config.image;
    spec.context_dir = context_dir;
    spec.scratch_dir = scratch_dir;
    spec.environment = config.environment;
    spec.memory_mb = COMPILE_MEM_LIMIT;
    spec.cpu_time_seconds = COMPILE_TIME_LIMIT;
    spec.wall_time_seconds = COMPILE_TIME_LIMIT;
    spec.max_processes = COMPILE_PROC_LIMIT + config.extra_processes;
    spec.max_files = COMPILE_FILE_LIMIT + config.extra_files;
    spec.max_output_size = COMPILE_OUTPUT_LIMIT;
    spec.cpuset = cpuset;
    return spec;
}

compilation_result runner::compile(const language_driver &driver, const program_workspace &workspace) {
    filesystem::path context_dir = workspace.root / ("compile-" + new_uuid());
    filesystem::create_directories(context_dir);
    defer { remove_context(context_dir); };

    auto spec = make_compile_spec(driver, context_dir, workspace.build_dir);
    spec.command = driver.compile_command(workspace.source_file);

    compilation_result result;
    sandbox_outcome outcome;
    try {
        outcome = box.execute(spec);
    } catch (timeout_error &e) {
        LOG(WARNING) << "Compilation of " << workspace.source_file << " did not finish: " << e.what();
        result.error_message = "Compilation timed out";
        return result;
    }

    result.output = security::sanitize_output(outcome.stdout_data + outcome.stderr_data, COMPILE_OUTPUT_LIMIT);
    for (auto &line : split_lines(result.output))
        if (boost::algorithm::icontains(line, "warning"))
            result.warnings.push_back(line);

    switch (translate_outcome(outcome)) {
        case execution_status::SUCCESS:
            result.success = true;
            break;
        case execution_status::TIMEOUT:
            result.error_message = "Compilation timed out";
            break;
        case execution_status::MEMORY_LIMIT_EXCEEDED:
            result.error_message = "Compilation exceeded memory limit";
            break;
        default:
            result.error_message = "Compilation failed";
            break;
    }
    return result;
}

run_result runner::run(const language_driver &driver, const program_workspace &workspace, const string &input, const security::security_limits &limits) {
    // 每个测试用例使用全新的 scratch 目录，测试用例之间不能共享状态
    filesystem::path context_dir = workspace.root / ("run-" + new_uuid());
    filesystem::path scratch_dir = context_dir / "sandbox";
    filesystem::create_directories(scratch_dir);
    defer { remove_context(context_dir); };

    filesystem::copy(workspace.build_dir, scratch_dir, filesystem::copy_options::recursive | filesystem::copy_options::copy_symlinks);
    write_file_content(context_dir / "testdata.in", input);

    auto &config = driver.config();
    sandbox_context_spec spec;
    spec.image = config.image;
    spec.context_dir = context_dir;
    spec.scratch_dir = scratch_dir;
    spec.command = driver.run_command(workspace.source_file);
    spec.environment = config.environment;
    spec.input_file = context_dir / "testdata.in";
    spec.memory_mb = limits.memory_mb;
    spec.cpu_time_seconds = limits.cpu_time_seconds;
    spec.wall_time_seconds = limits.wall_time_seconds;
    spec.max_processes = limits.max_processes + config.extra_processes;
    spec.max_files = limits.max_files + config.extra_files + STDIO_FILES;
    spec.max_output_size = limits.max_output_size;
    spec.cpuset = cpuset;

    run_result result;
    sandbox_outcome outcome;
    try {
        outcome = box.execute(spec);
    } catch (timeout_error &e) {
        LOG(WARNING) << "Sandbox context " << context_dir << " did not finish: " << e.what();
        result.status = execution_status::TIMEOUT;
        result.elapsed_ms = limits.wall_time_seconds * 1000.0;
        result.error_message = "Execution timeout";
        return result;
    }

    result.status = translate_outcome(outcome);
    result.exit_code = outcome.exit_code;
    result.stdout_data = security::sanitize_output(outcome.stdout_data, limits.max_output_size);
    result.stderr_data = security::sanitize_output(outcome.stderr_data, limits.max_output_size);
    result.peak_memory_mb = outcome.peak_memory_bytes / (1024.0 * 1024.0);
    result.elapsed_ms = outcome.wall_time_seconds * 1000.0;

    switch (result.status) {
        case execution_status::TIMEOUT:
            result.error_message = "Execution timeout";
            break;
        case execution_status::MEMORY_LIMIT_EXCEEDED:
            result.error_message = "Memory limit exceeded";
            break;
        case execution_status::RUNTIME_ERROR:
            result.error_message = fmt::format("Runtime error (exit code: {})", outcome.exit_code);
            if (!result.stderr_data.empty())
                result.error_message += "\n" + result.stderr_data;
            break;
        default:
            break;
    }
    return result;
}

vector<string> runner::check_syntax(const language_driver &driver, const program_workspace &workspace) {
    auto command = driver.syntax_check_command(workspace.source_file);
    if (command.empty()) return {};

    filesystem::path context_dir = workspace.root / ("check-" + new_uuid());
    filesystem::create_directories(context_dir);
    defer { remove_context(context_dir); };

    auto spec = make_compile_spec(driver, context_dir, workspace.build_dir);
    spec.command = command;

    sandbox_outcome outcome;
    try {
        outcome = box.execute(spec);
    } catch (timeout_error &) {
        return {"Syntax check timed out"};
    }

    if (translate_outcome(outcome) == execution_status::SUCCESS)
        return {};

    string output = security::sanitize_output(outcome.stdout_data + outcome.stderr_data, COMPILE_OUTPUT_LIMIT);
    auto errors = driver.parse_syntax_errors(output);
    if (errors.empty())
        errors.push_back(fmt::format("Syntax check failed (exit code: {})", outcome.exit_code));
    return errors;
}

optional<string> runner::probe_version(const language_driver &driver, const filesystem::path &parent) {
    auto command = driver.version_command();
    if (command.empty()) return nullopt;

    filesystem::path context_dir = parent / ("version-" + new_uuid());
    filesystem::path scratch_dir = context_dir / "sandbox";
    filesystem::create_directories(scratch_dir);
    defer { remove_context(context_dir); };

    auto spec = make_compile_spec(driver, context_dir, scratch_dir);
    spec.command = command;

    sandbox_outcome outcome;
    try {
        outcome = box.execute(spec);
    } catch (timeout_error &) {
        LOG(WARNING) << "Version probe of " << get_language_name(driver.config().type) << " timed out";
        return nullopt;
    }
    if (outcome.exit_code != 0) return nullopt;

    // java --version、g++ --version 输出多行，只取第一行非空内容
    string output = security::sanitize_output(outcome.stdout_data + outcome.stderr_data, COMPILE_OUTPUT_LIMIT);
    for (auto &line : split_lines(output)) {
        string trimmed = boost::algorithm::trim_copy(line);
        if (!trimmed.empty()) return trimmed;
    }
    return nullopt;
}

}  // namespace codejudge
