#pragma once

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "cgroup_layout.hpp"

struct cgroup;
struct cgroup_controller;

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_error : public std::runtime_error {
    cgroup_error(const std::string &operation, int err);

    static void check(const std::string &operation, int err);
};

/**
 * @brief 初始化 libcgroup，使用 context_cgroup 之前必须调用一次
 */
void cgroup_library_init();

struct cgroup_deleter {
    void operator()(struct cgroup *cg) const;
};

/**
 * @brief 一个沙箱上下文的 cgroup
 *
 * 对象只记录 cgroup 的名称和用到的层级，调用 create 或 adopt 之后才对应内核中的 cgroup。
 * 析构时若 cgroup 仍然存在，会杀死其中的所有进程并删除它，因此 runguard
 * 因为异常退出时也不会残留选手进程。
 */
class context_cgroup {
public:
    /**
     * @param name cgroup 的名称，如 "/codejudge/ctx_1234_1700000000"
     * @param controllers 用到的层级，第一个层级用于列举进程
     * @throw cgroup_error 当 libcgroup 无法分配 cgroup 时
     */
    context_cgroup(std::string name, const std::vector<std::string> &controllers);
    ~context_cgroup();

    context_cgroup(const context_cgroup &) = delete;
    context_cgroup &operator=(const context_cgroup &) = delete;

    const std::string &name() const { return cgroup_name; }

    /**
     * @brief 写入设置并在内核中创建 cgroup
     * 使用 cpuset 时，父 cgroup 会先继承根 cgroup 的 cpuset.cpus 与 cpuset.mems。
     */
    void create(const std::vector<cgroup_setting> &settings);

    /**
     * @brief 接管一个已经存在的 cgroup，比如 runguard 被 SIGKILL 后残留的 cgroup
     */
    void adopt();

    /**
     * @brief 将当前进程移入本 cgroup
     */
    void attach() const;

    /**
     * @brief 从内核读取一个统计值，如 memory.memsw.max_usage_in_bytes
     */
    std::int64_t read_value(const std::string &controller, const std::string &name) const;

    /**
     * @brief 反复向 cgroup 内的所有进程发送 SIGKILL，直到 cgroup 为空
     * 选手程序 fork 出来的进程可能已经离开了原来的进程组，只能通过 cgroup 找到它们。
     * @return 发送过 SIGKILL 的进程数
     */
    std::size_t kill_tasks() const;

    /**
     * @brief 从内核中删除这个 cgroup
     */
    void remove();

private:
    std::vector<pid_t> list_tasks() const;

    std::string cgroup_name;
    std::string task_controller;
    std::unique_ptr<struct cgroup, cgroup_deleter> cg;
    bool exists = false;
};
