#pragma once

#include "gmock/gmock.h"
#include "sandbox/sandbox.hpp"

namespace codejudge::mock {

/**
 * @brief 不创建真正沙箱的沙箱后端
 * 测试通过 EXPECT_CALL 决定每个沙箱上下文的运行结果，并检查传给沙箱的参数
 */
struct mock_sandbox : public sandbox {
    MOCK_METHOD(sandbox_outcome, execute, (const sandbox_context_spec &spec), (override));
    MOCK_METHOD(void, build_image, (const std::string &image, const std::string &lang), (override));
    MOCK_METHOD(std::size_t, cleanup_orphans, (), (override));
};

/**
 * @brief 正常退出的运行结果
 */
inline sandbox_outcome exited(int exit_code, const std::string &stdout_data = "", const std::string &stderr_data = "") {
    sandbox_outcome outcome;
    outcome.exit_code = exit_code;
    outcome.stdout_data = stdout_data;
    outcome.stderr_data = stderr_data;
    outcome.peak_memory_bytes = 8 * 1024 * 1024;
    outcome.wall_time_seconds = 0.0125;
    outcome.cpu_time_seconds = 0.01;
    return outcome;
}

}  // namespace codejudge::mock
