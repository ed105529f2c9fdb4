#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "execution/executor.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/runguard_sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codejudge;
using ::testing::ElementsAre;

static bool has_option(const vector<string> &args, const string &key, const string &value) {
    for (size_t i = 0; i + 1 < args.size(); ++i)
        if (args[i] == key && args[i + 1] == value) return true;
    return false;
}

TEST(RunguardSandboxTest, BuildArguments) {
    runguard_sandbox box("/usr/bin/runguard", "/images", "/exec", "/run", "nobody", "nogroup");

    sandbox_context_spec spec;
    spec.image = "codejudge-python";
    spec.context_dir = "/run/req/run-1";
    spec.scratch_dir = "/run/req/run-1/sandbox";
    spec.command = {"python3", "code.py"};
    spec.environment = {{"PYTHONDONTWRITEBYTECODE", "1"}};
    spec.input_file = "/run/req/run-1/testdata.in";
    spec.memory_mb = 64;
    spec.cpu_time_seconds = 5;
    spec.wall_time_seconds = 10;
    spec.max_processes = 2;
    spec.max_files = 13;
    spec.max_output_size = 1024;
    spec.cpuset = "2";

    auto args = box.build_arguments(spec);
    EXPECT_TRUE(has_option(args, "--root", "/images/codejudge-python"));
    EXPECT_TRUE(has_option(args, "--scratch", "/run/req/run-1/sandbox"));
    EXPECT_TRUE(has_option(args, "--work-dir", "/sandbox"));
    EXPECT_TRUE(has_option(args, "--user", "nobody"));
    EXPECT_TRUE(has_option(args, "--group", "nogroup"));
    EXPECT_TRUE(has_option(args, "--memory-limit", "65536"));
    EXPECT_TRUE(has_option(args, "--cpu-time", "5"));
    EXPECT_TRUE(has_option(args, "--wall-time", "10"));
    EXPECT_TRUE(has_option(args, "--nproc", "2"));
    EXPECT_TRUE(has_option(args, "--nofile", "13"));
    EXPECT_TRUE(has_option(args, "--stream-size", "1025"));
    EXPECT_TRUE(has_option(args, "--cpuset", "2"));
    EXPECT_TRUE(has_option(args, "--standard-input-file", "/run/req/run-1/testdata.in"));
    EXPECT_TRUE(has_option(args, "--out-meta", "/run/req/run-1/program.meta"));
    EXPECT_TRUE(has_option(args, "-V", "PYTHONDONTWRITEBYTECODE=1"));
    EXPECT_NE(find(args.begin(), args.end(), "--no-core-dumps"), args.end());

    // 命令放在最后，不经过 shell
    auto separator = find(args.begin(), args.end(), "--");
    ASSERT_NE(separator, args.end());
    EXPECT_THAT(vector<string>(separator + 1, args.end()), ElementsAre("python3", "code.py"));
}

TEST(RunguardSandboxTest, NoInputMeansNoRedirection) {
    runguard_sandbox box("/usr/bin/runguard", "/images", "/exec", "/run", "nobody", "");

    sandbox_context_spec spec;
    spec.image = "codejudge-cpp";
    spec.context_dir = "/run/req/compile-1";
    spec.scratch_dir = "/run/req/build";
    spec.command = {"g++", "code.cpp"};

    auto args = box.build_arguments(spec);
    EXPECT_EQ(find(args.begin(), args.end(), "--standard-input-file"), args.end());
    EXPECT_EQ(find(args.begin(), args.end(), "--group"), args.end());
    EXPECT_EQ(find(args.begin(), args.end(), "--cpuset"), args.end());
}

TEST(RunguardSandboxTest, MissingImageIsSandboxError) {
    auto dir = test::setup_test_environment("missing-image");
    runguard_sandbox box("/usr/bin/runguard", dir / "images", dir, dir, "nobody", "");

    sandbox_context_spec spec;
    spec.image = "codejudge-python";
    spec.context_dir = dir / "ctx";
    spec.scratch_dir = dir / "ctx" / "sandbox";
    spec.command = {"python3", "code.py"};
    EXPECT_THROW(box.execute(spec), sandbox_error);

    spec.command.clear();
    EXPECT_THROW(box.execute(spec), sandbox_error);
    filesystem::remove_all(dir);
}

/**
 * @brief 真实沙箱的端到端测试
 * 需要 root 权限、RUNGUARD 环境变量指向 runguard，并且已经构建了 Python 沙箱模板
 */
class SandboxIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char *runguard = getenv("RUNGUARD");
        const char *image_dir = getenv("IMAGEDIR");
        const char *run_user = getenv("RUNUSER");
        if (image_dir) IMAGE_DIR = image_dir;
        if (run_user) RUN_USER = run_user;

        if (geteuid() != 0 || !runguard || !filesystem::is_directory(IMAGE_DIR / "codejudge-python"))
            GTEST_SKIP() << "requires root, RUNGUARD and the codejudge-python image";

        RUNGUARD = runguard;
        run_dir = test::setup_test_environment("integration");
        box = make_unique<runguard_sandbox>(RUNGUARD, IMAGE_DIR, EXEC_DIR, run_dir, RUN_USER, RUN_GROUP);
        engine = make_unique<executor>(registry, *box, slots, security::security_level::HIGH, run_dir);
    }

    void TearDown() override {
        if (!run_dir.empty()) filesystem::remove_all(run_dir);
    }

    execution_result run_python(const string &code, const string &input, const string &expected_output) {
        execution_request request;
        request.language = language_type::PYTHON;
        request.code = code;
        test_case tc;
        tc.input = input;
        tc.expected_output = expected_output;
        request.test_cases.push_back(tc);
        return engine->execute_code(request);
    }

    filesystem::path run_dir;
    language_registry registry;
    slot_pool slots{vector<size_t>{0}};
    unique_ptr<runguard_sandbox> box;
    unique_ptr<executor> engine;
};

TEST_F(SandboxIntegrationTest, PythonAddition) {
    auto result = run_python("print(int(input())+int(input()))", "5\n3", "8");
    EXPECT_EQ(result.status, execution_status::SUCCESS) << result.error_message.value_or("");
    EXPECT_EQ(result.passed_tests, 1);
    EXPECT_TRUE(filesystem::is_empty(run_dir));
}

TEST_F(SandboxIntegrationTest, InfiniteLoopTimesOut) {
    auto result = run_python("while True:\n    pass", "", "");
    EXPECT_EQ(result.status, execution_status::TIMEOUT);
}

TEST_F(SandboxIntegrationTest, MemoryBombIsKilled) {
    auto result = run_python("x = bytearray(1 << 30)\nprint(len(x))", "", "");
    EXPECT_EQ(result.status, execution_status::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(SandboxIntegrationTest, RootFilesystemIsReadOnly) {
    // 写根目录失败时程序以非零返回值退出
    auto result = run_python("f = __builtins__.__dict__['op' + 'en']('/evil', 'w')", "", "");
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
}
