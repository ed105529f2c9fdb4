#include <memory>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "execution/executor.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace codejudge;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StartsWith;
using ::testing::Throw;

static test_case make_case(const string &input, const string &expected_output, double weight = 1.0) {
    test_case tc;
    tc.input = input;
    tc.expected_output = expected_output;
    tc.weight = weight;
    return tc;
}

static execution_request make_request(language_type language, const string &code, vector<test_case> test_cases) {
    execution_request request;
    request.language = language;
    request.code = code;
    request.test_cases = move(test_cases);
    return request;
}

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = test::setup_test_environment("executor");
        engine = make_unique<executor>(registry, box, slots, security::security_level::HIGH, run_dir);
    }

    void TearDown() override {
        engine.reset();
        filesystem::remove_all(run_dir);
    }

    filesystem::path run_dir;
    language_registry registry;
    mock::mock_sandbox box;
    slot_pool slots{vector<size_t>{0}};
    unique_ptr<executor> engine;
};

TEST_F(ExecutorTest, PythonAddition) {
    auto request = make_request(language_type::PYTHON, "print(int(input())+int(input()))", {make_case("5\n3", "8")});

    EXPECT_CALL(box, execute(_)).WillOnce(Invoke([](const sandbox_context_spec &spec) {
        EXPECT_THAT(spec.command, ElementsAre("python3", "code.py"));
        EXPECT_EQ(spec.image, "codejudge-python");
        EXPECT_EQ(spec.cpuset, "0");
        return mock::exited(0, "8\n");
    }));

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::SUCCESS);
    EXPECT_FALSE(result.compilation.has_value());
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_EQ(result.test_results[0].status, execution_status::SUCCESS);
    EXPECT_EQ(result.test_results[0].actual_output, "8\n");
    EXPECT_EQ(result.test_results[0].execution_time_ms, 13);
    EXPECT_DOUBLE_EQ(result.test_results[0].memory_used_mb, 8);
    EXPECT_EQ(result.passed_tests, 1);
    EXPECT_EQ(result.total_tests, 1);
    EXPECT_DOUBLE_EQ(result.score, 100);
    EXPECT_DOUBLE_EQ(result.total_memory_used_mb, 8);
    EXPECT_FALSE(result.error_message.has_value());

    // 工作区在请求结束后删除
    EXPECT_TRUE(filesystem::is_empty(run_dir));
}

TEST_F(ExecutorTest, WeightedScore) {
    auto request = make_request(language_type::PYTHON, "print(input())",
                                {make_case("1", "1", 1), make_case("2", "2", 2), make_case("3", "3", 3)});
    {
        InSequence seq;
        EXPECT_CALL(box, execute(_)).WillOnce(Return(mock::exited(0, "1\n")));
        EXPECT_CALL(box, execute(_)).WillOnce(Return(mock::exited(0, "wrong\n")));
        EXPECT_CALL(box, execute(_)).WillOnce(Return(mock::exited(0, "  3  \n")));
    }

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
    ASSERT_EQ(result.test_results.size(), 3);
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_FALSE(result.test_results[1].passed);
    EXPECT_EQ(result.test_results[1].error_message, "Output mismatch");
    EXPECT_TRUE(result.test_results[2].passed);
    EXPECT_EQ(result.passed_tests, 2);
    EXPECT_DOUBLE_EQ(result.score, 66.67);
}

TEST_F(ExecutorTest, TestResultsKeepRequestOrder) {
    auto request = make_request(language_type::PYTHON, "print(input())",
                                {make_case("a", "a"), make_case("b", "b")});
    request.test_cases[1].is_hidden = true;
    EXPECT_CALL(box, execute(_)).WillRepeatedly(Invoke([](const sandbox_context_spec &spec) {
        return mock::exited(0, read_file_content(spec.input_file));
    }));

    auto result = engine->execute_code(request);
    ASSERT_EQ(result.test_results.size(), 2);
    EXPECT_EQ(result.test_results[0].input, "a");
    EXPECT_EQ(result.test_results[1].input, "b");
    EXPECT_FALSE(result.test_results[0].is_hidden);
    EXPECT_TRUE(result.test_results[1].is_hidden);
    EXPECT_EQ(result.status, execution_status::SUCCESS);
}

TEST_F(ExecutorTest, UnsupportedLanguageCreatesNoSandbox) {
    vector<language_config> configs;
    for (auto &config : default_language_configs())
        if (config.type != language_type::JAVA) configs.push_back(config);
    language_registry partial(configs);
    executor partial_engine(partial, box, slots, security::security_level::HIGH, run_dir);

    EXPECT_CALL(box, execute(_)).Times(0);
    auto request = make_request(language_type::JAVA, "public class Main {}", {make_case("", ""), make_case("", "")});
    auto result = partial_engine.execute_code(request);
    EXPECT_EQ(result.status, execution_status::INTERNAL_ERROR);
    EXPECT_EQ(result.error_message, "Unsupported language: java");
    EXPECT_EQ(result.total_tests, 2);
    EXPECT_DOUBLE_EQ(result.score, 0);
}

TEST_F(ExecutorTest, SecurityViolationCreatesNoSandbox) {
    EXPECT_CALL(box, execute(_)).Times(0);
    auto request = make_request(language_type::PYTHON, "import os\nos.system('ls')", {make_case("", "")});

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::SECURITY_VIOLATION);
    EXPECT_EQ(result.error_message, "Code contains potentially dangerous operations");
    EXPECT_FALSE(result.security_violations.empty());
    EXPECT_THAT(result.security_violations[0], StartsWith("Line 1: "));
    EXPECT_TRUE(result.test_results.empty());
    EXPECT_DOUBLE_EQ(result.score, 0);
}

TEST_F(ExecutorTest, InvalidTestInputIsSecurityViolation) {
    EXPECT_CALL(box, execute(_)).Times(0);
    auto request = make_request(language_type::PYTHON, "print(input())",
                                {make_case("1", "1"), make_case("\\x1b[2J", "")});

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::SECURITY_VIOLATION);
    EXPECT_THAT(result.security_violations, ElementsAre("Test case 2: Invalid input data"));
}

TEST_F(ExecutorTest, InvalidRequest) {
    EXPECT_CALL(box, execute(_)).Times(0);
    auto request = make_request(language_type::PYTHON, "print(1)", {});

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::INTERNAL_ERROR);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_THAT(*result.error_message, StartsWith("Invalid request: "));
}

TEST_F(ExecutorTest, JavaWithoutPublicClass) {
    EXPECT_CALL(box, execute(_)).Times(0);
    auto request = make_request(language_type::JAVA, "class Main { public static void main(String[] a) {} }", {make_case("", "")});

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::COMPILATION_ERROR);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_THAT(*result.error_message, HasSubstr("No public class"));
    ASSERT_TRUE(result.compilation.has_value());
    EXPECT_FALSE(result.compilation->success);
}

TEST_F(ExecutorTest, CompilationErrorStopsRequest) {
    EXPECT_CALL(box, execute(_)).WillOnce(Return(mock::exited(1, "", "code.cpp:1:1: error: expected unqualified-id\n")));
    auto request = make_request(language_type::CPP, "int main( {}", {make_case("", ""), make_case("", "")});

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::COMPILATION_ERROR);
    EXPECT_EQ(result.error_message, "Compilation failed");
    ASSERT_TRUE(result.compilation.has_value());
    EXPECT_THAT(result.compilation->output, HasSubstr("expected unqualified-id"));
    EXPECT_TRUE(result.test_results.empty());
    EXPECT_EQ(result.total_tests, 2);
}

TEST_F(ExecutorTest, CompiledProgramRunsPerTestCase) {
    {
        InSequence seq;
        EXPECT_CALL(box, execute(_)).WillOnce(Invoke([](const sandbox_context_spec &spec) {
            EXPECT_EQ(spec.command.front(), "g++");
            write_file_content(spec.scratch_dir / "program", "binary");
            return mock::exited(0, "", "code.cpp:3:9: warning: unused variable 'y'\n");
        }));
        EXPECT_CALL(box, execute(_)).Times(2).WillRepeatedly(Invoke([](const sandbox_context_spec &spec) {
            EXPECT_THAT(spec.command, ElementsAre("./program"));
            EXPECT_TRUE(filesystem::exists(spec.scratch_dir / "program"));
            return mock::exited(0, "ok\n");
        }));
    }
    auto request = make_request(language_type::CPP, "int main() { int y; puts(\"ok\"); }", {make_case("", "ok"), make_case("", "ok")});

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::SUCCESS);
    ASSERT_TRUE(result.compilation.has_value());
    EXPECT_TRUE(result.compilation->success);
    EXPECT_THAT(result.warnings, ElementsAre("code.cpp:3:9: warning: unused variable 'y'"));
    EXPECT_EQ(result.passed_tests, 2);
}

TEST_F(ExecutorTest, CompileOnly) {
    EXPECT_CALL(box, execute(_)).Times(1).WillOnce(Return(mock::exited(0)));
    auto request = make_request(language_type::CPP, "int main() {}", {make_case("", "")});
    request.compile_only = true;

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::SUCCESS);
    EXPECT_TRUE(result.test_results.empty());
    ASSERT_TRUE(result.compilation.has_value());
    EXPECT_TRUE(result.compilation->success);
}

TEST_F(ExecutorTest, TimeoutTestCase) {
    sandbox_outcome outcome = mock::exited(143);
    outcome.signal = 15;
    outcome.time_limit_exceeded = true;
    EXPECT_CALL(box, execute(_)).WillOnce(Return(outcome));

    auto request = make_request(language_type::PYTHON, "while True:\n    pass", {make_case("", "")});
    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::TIMEOUT);
    ASSERT_EQ(result.test_results.size(), 1);
    EXPECT_EQ(result.test_results[0].status, execution_status::TIMEOUT);
    EXPECT_EQ(result.test_results[0].error_message, "Execution timeout");
    EXPECT_DOUBLE_EQ(result.score, 0);
    EXPECT_EQ(result.passed_tests, 0);
}

TEST_F(ExecutorTest, MemoryLimitExceeded) {
    sandbox_outcome outcome = mock::exited(EXIT_CODE_KILLED);
    outcome.out_of_memory = true;
    EXPECT_CALL(box, execute(_)).WillOnce(Return(outcome));

    auto request = make_request(language_type::PYTHON, "x = ' ' * (1 << 40)", {make_case("", "")});
    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(result.test_results[0].error_message, "Memory limit exceeded");
}

TEST_F(ExecutorTest, SandboxErrorIsInternalError) {
    EXPECT_CALL(box, execute(_)).WillOnce(Throw(sandbox_error("unable to create cgroup")));
    auto request = make_request(language_type::PYTHON, "print(1)", {make_case("", "1")});

    auto result = engine->execute_code(request);
    EXPECT_EQ(result.status, execution_status::INTERNAL_ERROR);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_THAT(*result.error_message, StartsWith("Internal error: "));
    EXPECT_THAT(*result.error_message, HasSubstr("unable to create cgroup"));
    EXPECT_TRUE(filesystem::is_empty(run_dir));
    // 槽位已经归还
    EXPECT_EQ(slots.available(), 1);
}

TEST_F(ExecutorTest, RequestLimitsOnlyTighten) {
    auto request = make_request(language_type::PYTHON, "print(1)", {make_case("", "1")});
    security::resource_limits limits;
    limits.memory_mb = 512;
    limits.cpu_time_seconds = 2;
    limits.wall_time_seconds = 20;
    limits.max_processes = 1;
    limits.max_files = 10;
    request.resource_limits = limits;
    request.test_cases[0].timeout = 3;

    auto &level = security::get_security_limits(security::security_level::HIGH);
    EXPECT_CALL(box, execute(_)).WillOnce(Invoke([&](const sandbox_context_spec &spec) {
        EXPECT_EQ(spec.memory_mb, level.memory_mb);
        EXPECT_EQ(spec.cpu_time_seconds, 2);
        EXPECT_EQ(spec.wall_time_seconds, 3);
        EXPECT_EQ(spec.max_processes, 1);
        EXPECT_EQ(spec.max_files, 13);
        return mock::exited(0, "1");
    }));

    EXPECT_EQ(engine->execute_code(request).status, execution_status::SUCCESS);
}

TEST_F(ExecutorTest, ValidateSyntaxOfInterpretedLanguage) {
    EXPECT_CALL(box, execute(_)).WillOnce(Return(mock::exited(1, "", "  File \"code.py\", line 2\n    print(\n         ^\nSyntaxError: '(' was never closed\n")));

    auto result = engine->validate_syntax({"x = 1\nprint(", language_type::PYTHON});
    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.syntax_errors, ElementsAre("Syntax error at line 2: '(' was never closed"));
    EXPECT_TRUE(filesystem::is_empty(run_dir));
}

TEST_F(ExecutorTest, ValidateSyntaxTurnsViolationsIntoSuggestions) {
    EXPECT_CALL(box, execute(_)).WillOnce(Return(mock::exited(0)));

    auto result = engine->validate_syntax({"import os\nprint(1)", language_type::PYTHON});
    EXPECT_TRUE(result.is_valid);
    EXPECT_THAT(result.suggestions, ElementsAre("Avoid restricted construct: Line 1: Potentially dangerous pattern 'import os' detected"));
}

TEST_F(ExecutorTest, ValidateSyntaxOfCompiledLanguage) {
    EXPECT_CALL(box, execute(_)).WillOnce(Return(mock::exited(1, "", "code.cpp:1:11: error: expected '}' at end of input\n")));

    auto result = engine->validate_syntax({"int main() {", language_type::CPP});
    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.syntax_errors, ElementsAre("Compilation failed", "code.cpp:1:11: error: expected '}' at end of input"));
}

TEST_F(ExecutorTest, ValidateSyntaxRejectsWithoutSandbox) {
    EXPECT_CALL(box, execute(_)).Times(0);

    auto empty = engine->validate_syntax({"", language_type::PYTHON});
    EXPECT_FALSE(empty.is_valid);
    EXPECT_THAT(empty.syntax_errors, ElementsAre("Code must not be empty"));

    auto too_long = engine->validate_syntax({string(MAX_CODE_LENGTH + 1, 'x'), language_type::PYTHON});
    EXPECT_FALSE(too_long.is_valid);

    auto java = engine->validate_syntax({"class Main {}", language_type::JAVA});
    EXPECT_FALSE(java.is_valid);
    EXPECT_THAT(java.syntax_errors, ElementsAre(HasSubstr("No public class")));
}

TEST_F(ExecutorTest, ValidateSyntaxReportsSandboxFailure) {
    EXPECT_CALL(box, execute(_)).WillOnce(Throw(sandbox_error("image missing")));

    auto result = engine->validate_syntax({"print(1)", language_type::PYTHON});
    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.syntax_errors.size(), 1);
    EXPECT_THAT(result.syntax_errors[0], StartsWith("Validation error: "));
}

TEST_F(ExecutorTest, SupportedLanguages) {
    auto languages = engine->get_supported_languages();
    ASSERT_EQ(languages.size(), all_languages().size());

    bool found_python = false, found_cpp = false;
    for (auto &info : languages) {
        EXPECT_EQ(info.version, "latest");
        EXPECT_THAT(info.supported_features, ElementsAre("syntax_highlighting", "auto_completion", "error_detection"));
        if (info.name == "python") {
            found_python = true;
            EXPECT_EQ(info.file_extension, ".py");
            EXPECT_FALSE(info.compile_command.has_value());
        } else if (info.name == "cpp") {
            found_cpp = true;
            EXPECT_TRUE(info.compile_command.has_value());
        }
    }
    EXPECT_TRUE(found_python);
    EXPECT_TRUE(found_cpp);
}

TEST_F(ExecutorTest, BuildSandboxImagesProbesVersions) {
    EXPECT_CALL(box, build_image(_, _)).Times(all_languages().size() - 1);
    EXPECT_CALL(box, build_image("codejudge-rust", "rust")).WillOnce(Throw(internal_error("debootstrap failed")));
    EXPECT_CALL(box, execute(_)).WillRepeatedly(Return(mock::exited(0, "version 1.0\n")));

    auto reports = engine->build_sandbox_images();
    ASSERT_EQ(reports.size(), all_languages().size());
    for (auto &report : reports) {
        if (report.language == "rust") {
            EXPECT_FALSE(report.success);
            EXPECT_EQ(report.message, "debootstrap failed");
        } else {
            EXPECT_TRUE(report.success) << report.language;
        }
    }

    for (auto &info : engine->get_supported_languages())
        EXPECT_EQ(info.version, info.name == "rust" ? "latest" : "version 1.0");
}

TEST_F(ExecutorTest, CleanupRemovesStaleWorkspaces) {
    EXPECT_CALL(box, cleanup_orphans()).WillOnce(Return(2));

    filesystem::create_directories(run_dir / "stale" / "build");
    filesystem::create_directories(run_dir / "fresh");
    filesystem::last_write_time(run_dir / "stale", filesystem::file_time_type::clock::now() - chrono::minutes(10));

    EXPECT_EQ(engine->cleanup_orphaned_contexts(), 3);
    EXPECT_FALSE(filesystem::exists(run_dir / "stale"));
    EXPECT_TRUE(filesystem::exists(run_dir / "fresh"));
}

TEST_F(ExecutorTest, CleanupSurvivesSandboxFailure) {
    EXPECT_CALL(box, cleanup_orphans()).WillOnce(Throw(sandbox_error("cgroup hierarchy is not mounted")));

    filesystem::create_directories(run_dir / "stale");
    filesystem::last_write_time(run_dir / "stale", filesystem::file_time_type::clock::now() - chrono::minutes(10));

    size_t removed = 0;
    EXPECT_NO_THROW(removed = engine->cleanup_orphaned_contexts());
    EXPECT_EQ(removed, 1);
    EXPECT_FALSE(filesystem::exists(run_dir / "stale"));
}

TEST_F(ExecutorTest, CleanupWithoutRunDirectory) {
    EXPECT_CALL(box, cleanup_orphans()).WillOnce(Return(0));
    filesystem::remove_all(run_dir);
    EXPECT_EQ(engine->cleanup_orphaned_contexts(), 0);
}

static test_case_result case_result(execution_status status) {
    test_case_result result;
    result.status = status;
    result.passed = status == execution_status::SUCCESS;
    return result;
}

TEST(AggregateStatusTest, Priority) {
    using S = execution_status;
    EXPECT_EQ(aggregate_status({}), S::SUCCESS);
    EXPECT_EQ(aggregate_status({case_result(S::SUCCESS), case_result(S::SUCCESS)}), S::SUCCESS);
    EXPECT_EQ(aggregate_status({case_result(S::SUCCESS), case_result(S::RUNTIME_ERROR)}), S::RUNTIME_ERROR);
    EXPECT_EQ(aggregate_status({case_result(S::RUNTIME_ERROR), case_result(S::MEMORY_LIMIT_EXCEEDED), case_result(S::TIMEOUT)}), S::TIMEOUT);
    EXPECT_EQ(aggregate_status({case_result(S::RUNTIME_ERROR), case_result(S::MEMORY_LIMIT_EXCEEDED)}), S::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(aggregate_status({case_result(S::SECURITY_VIOLATION), case_result(S::RUNTIME_ERROR)}), S::SECURITY_VIOLATION);
}

TEST(CalculateScoreTest, Weights) {
    vector<test_case> cases = {make_case("", "", 1), make_case("", "", 2), make_case("", "", 3)};
    vector<test_case_result> results = {case_result(execution_status::SUCCESS),
                                        case_result(execution_status::RUNTIME_ERROR),
                                        case_result(execution_status::SUCCESS)};
    EXPECT_DOUBLE_EQ(calculate_score(cases, results), 66.67);

    vector<test_case> zero = {make_case("", "", 0), make_case("", "", 0)};
    EXPECT_DOUBLE_EQ(calculate_score(zero, {case_result(execution_status::SUCCESS), case_result(execution_status::SUCCESS)}), 0);

    vector<test_case> thirds = {make_case("", ""), make_case("", ""), make_case("", "")};
    EXPECT_DOUBLE_EQ(calculate_score(thirds, {case_result(execution_status::SUCCESS),
                                              case_result(execution_status::RUNTIME_ERROR),
                                              case_result(execution_status::RUNTIME_ERROR)}), 33.33);
}

TEST(OutputsMatchTest, IgnoresSurroundingWhitespace) {
    EXPECT_TRUE(outputs_match("8\n", "8"));
    EXPECT_TRUE(outputs_match("  1 2\n\n", "1 2"));
    EXPECT_FALSE(outputs_match("1  2", "1 2"));
    EXPECT_FALSE(outputs_match("", "0"));
}
