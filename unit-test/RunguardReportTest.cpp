#include <signal.h>
#include <sys/wait.h>
#include <algorithm>
#include <sstream>
#include "cgroup_layout.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "report.hpp"
#include "runguard.hpp"
#include "test/environment.hpp"

using namespace std;

static const cgroup_setting *find_setting(const vector<cgroup_setting> &settings, const string &name) {
    auto it = find_if(settings.begin(), settings.end(), [&](const cgroup_setting &s) { return s.name == name; });
    return it == settings.end() ? nullptr : &*it;
}

TEST(CgroupLayoutTest, ProcessLimitUsesPidsController) {
    runguard_options opt;
    opt.nproc = 2;
    opt.memory_limit = 64 * 1024 * 1024;

    auto settings = context_cgroup_settings(opt);
    auto pids_max = find_setting(settings, "pids.max");
    ASSERT_NE(pids_max, nullptr);
    EXPECT_EQ(pids_max->controller, "pids");
    EXPECT_EQ(pids_max->value, "2");

    auto memory = find_setting(settings, "memory.limit_in_bytes");
    ASSERT_NE(memory, nullptr);
    EXPECT_EQ(memory->value, "67108864");
    EXPECT_EQ(find_setting(settings, "memory.memsw.limit_in_bytes")->value, "67108864");

    auto controllers = context_controllers(opt);
    EXPECT_EQ(controllers.front(), "memory");
    EXPECT_NE(find(controllers.begin(), controllers.end(), "pids"), controllers.end());
    EXPECT_EQ(find(controllers.begin(), controllers.end(), "cpuset"), controllers.end());
}

TEST(CgroupLayoutTest, UnlimitedContext) {
    runguard_options opt;
    auto settings = context_cgroup_settings(opt);
    EXPECT_EQ(find_setting(settings, "pids.max")->value, "max");
    EXPECT_EQ(find_setting(settings, "memory.limit_in_bytes")->value, "-1");
    EXPECT_EQ(find_setting(settings, "cpuset.cpus"), nullptr);
}

TEST(CgroupLayoutTest, CpusetPinsCore) {
    runguard_options opt;
    opt.cpuset = "3";
    auto settings = context_cgroup_settings(opt);
    ASSERT_NE(find_setting(settings, "cpuset.cpus"), nullptr);
    EXPECT_EQ(find_setting(settings, "cpuset.cpus")->value, "3");
    EXPECT_EQ(find_setting(settings, "cpuset.mems")->value, "0");

    auto controllers = context_controllers(opt);
    EXPECT_NE(find(controllers.begin(), controllers.end(), "cpuset"), controllers.end());
}

TEST(CgroupLayoutTest, ContextNames) {
    string name = context_cgroup_name(1234, 1700000000);
    EXPECT_EQ(name, CGROUP_PARENT + "/ctx_1234_1700000000");

    pid_t owner = 0;
    EXPECT_TRUE(parse_context_cgroup_name("ctx_1234_1700000000", owner));
    EXPECT_EQ(owner, 1234);

    EXPECT_FALSE(parse_context_cgroup_name("ctx_abc_1", owner));
    EXPECT_FALSE(parse_context_cgroup_name("ctx_1", owner));
    EXPECT_FALSE(parse_context_cgroup_name("judge_1_2", owner));
    EXPECT_FALSE(parse_context_cgroup_name("ctx_99999999999_1", owner));

    EXPECT_EQ(cgroup_directory("pids", name), "/sys/fs/cgroup/pids" + name);
}

TEST(CgroupLayoutTest, OomControl) {
    istringstream killed("oom_kill_disable 0\nunder_oom 0\noom_kill 1\n");
    EXPECT_TRUE(read_oom_kill(killed));

    istringstream clean("oom_kill_disable 0\nunder_oom 0\noom_kill 0\n");
    EXPECT_FALSE(read_oom_kill(clean));

    // 旧内核没有 oom_kill 计数
    istringstream old_kernel("oom_kill_disable 0\nunder_oom 0\n");
    EXPECT_FALSE(read_oom_kill(old_kernel));
}

TEST(ContextReportTest, RecordExit) {
    context_report normal;
    normal.record_exit(W_EXITCODE(3, 0));
    EXPECT_EQ(normal.exitcode, 3);
    EXPECT_EQ(normal.signal, -1);
    EXPECT_EQ(normal.time_result(), "");

    context_report cpu;
    cpu.record_exit(W_EXITCODE(0, SIGXCPU));
    EXPECT_EQ(cpu.exitcode, 128 + SIGXCPU);
    EXPECT_EQ(cpu.signal, SIGXCPU);
    EXPECT_EQ(cpu.time_result(), "hard-timelimit");

    context_report killed;
    killed.record_exit(W_EXITCODE(0, SIGKILL));
    EXPECT_EQ(killed.exitcode, 137);
    EXPECT_EQ(killed.time_result(), "");
}

TEST(ContextReportTest, SoftLimits) {
    runguard_options opt;
    opt.use_cpu_limit = true;
    opt.cpu_limit = {1.0, 2.0};
    opt.use_wall_limit = true;
    opt.wall_limit = {5.0, 5.0};

    context_report report;
    report.cpu_time = 0.5;
    report.wall_time = 1.0;
    report.check_soft_limits(opt);
    EXPECT_EQ(report.time_result(), "");

    report.cpu_time = 1.5;
    report.check_soft_limits(opt);
    EXPECT_EQ(report.time_result(), "soft-timelimit");

    // 墙上时间硬限制优先
    report.wall_limit |= TIME_LIMIT_HARD;
    EXPECT_EQ(report.time_result(), "hard-timelimit");
}

class ContextReportMetaTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = codejudge::test::setup_test_environment("context-report");
    }

    void TearDown() override {
        filesystem::remove_all(dir);
    }

    codejudge::runguard_result round_trip(const context_report &report) {
        ostringstream meta;
        report.write(meta);
        codejudge::write_file_content(dir / "program.meta", meta.str());
        return codejudge::read_runguard_result(dir / "program.meta");
    }

    filesystem::path dir;
};

TEST_F(ContextReportMetaTest, OomAndTruncation) {
    context_report report;
    report.record_exit(W_EXITCODE(0, SIGKILL));
    report.oom = true;
    report.memory_bytes = 134217728;
    report.wall_time = 0.25;
    report.cpu_time = 0.125;
    report.stream_limited = true;
    report.truncated_streams = {"stdout"};

    auto result = round_trip(report);
    EXPECT_EQ(result.exitcode, 137);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_EQ(result.memory_result, "oom");
    EXPECT_EQ(result.memory, 134217728);
    EXPECT_DOUBLE_EQ(result.wall_time, 0.25);
    EXPECT_DOUBLE_EQ(result.cpu_time, 0.125);
    EXPECT_TRUE(result.output_truncated);
    EXPECT_TRUE(result.time_result.empty());
}

TEST_F(ContextReportMetaTest, CleanExit) {
    context_report report;
    report.record_exit(W_EXITCODE(0, 0));
    report.memory_bytes = 2453504;
    report.stream_limited = true;

    auto result = round_trip(report);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, -1);
    EXPECT_TRUE(result.memory_result.empty());
    EXPECT_TRUE(result.time_result.empty());
    EXPECT_FALSE(result.output_truncated);
}

TEST_F(ContextReportMetaTest, WallTimeAbort) {
    context_report report;
    report.wall_limit |= TIME_LIMIT_HARD;
    report.record_exit(W_EXITCODE(0, SIGTERM));

    auto result = round_trip(report);
    EXPECT_EQ(result.time_result, "hard-timelimit");
    EXPECT_EQ(result.exitcode, 143);
}
