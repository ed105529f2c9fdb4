#pragma once

#include <sys/types.h>
#include <ctime>
#include <istream>
#include <string>
#include <vector>
#include "runguard_options.hpp"

/**
 * @brief cgroup v1 各层级的挂载位置
 */
const std::string CGROUP_MOUNT_ROOT = "/sys/fs/cgroup";

/**
 * @brief 沙箱上下文可能使用的层级
 * memory 必须排在第一位，列举 cgroup 内的进程、读取 OOM 记录都使用这一层级；
 * cpuset 只在指定了 --cpuset 时使用。
 */
const std::vector<std::string> CONTEXT_CONTROLLERS = {"memory", "cpuacct", "pids", "cpuset"};

/**
 * @brief 创建 cgroup 时写入的一项设置
 */
struct cgroup_setting {
    std::string controller;
    std::string name;
    std::string value;
};

/**
 * @brief 沙箱上下文的 cgroup 名称，形如 CGROUP_PARENT/ctx_{pid}_{time}
 * @param owner 创建该 cgroup 的 runguard 进程
 */
std::string context_cgroup_name(pid_t owner, std::time_t created);

/**
 * @brief 解析 CGROUP_PARENT 下的子 cgroup 名称
 * @param leaf 不带 CGROUP_PARENT 前缀的名称，如 "ctx_123_1700000000"
 * @param owner 解析成功时写入创建者的 pid
 * @return 名称是否由 context_cgroup_name 生成
 */
bool parse_context_cgroup_name(const std::string &leaf, pid_t &owner);

/**
 * @brief 一个沙箱上下文实际使用的层级
 */
std::vector<std::string> context_controllers(const runguard_options &opt);

/**
 * @brief 根据资源限制计算要写入 cgroup 的设置
 * 进程数通过 pids 控制器按 cgroup 限制，而不是按 uid 计数的 RLIMIT_NPROC，
 * 因此同一个运行用户下并发的沙箱上下文互不影响。
 */
std::vector<cgroup_setting> context_cgroup_settings(const runguard_options &opt);

std::string cgroup_directory(const std::string &controller, const std::string &cgroup_name);

/**
 * @brief 读取 memory.oom_control，判断 OOM killer 是否在该 cgroup 内杀死过进程
 */
bool read_oom_kill(std::istream &oom_control);
