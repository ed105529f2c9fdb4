#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief runguard 写入 meta 文件的监测信息
 * meta 文件每行形如 "key: value"，缺失的字段保持默认值
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    std::string internal_error;

    /**
     * @brief 实际内存使用（单位为字节）
     */
    std::int64_t memory = -1;

    /**
     * @brief 超时的类型，为 "soft-timelimit"、"hard-timelimit" 或空
     */
    std::string time_result;

    /**
     * @brief cgroup 触发 OOM killer 时为 "oom"
     */
    std::string memory_result;

    /**
     * @brief 选手程序的 stdout 或 stderr 是否因为超出输出限制被截断
     */
    bool output_truncated = false;

    /**
     * @brief runguard --cleanup 删除的孤儿 cgroup 数
     */
    int removed_cgroups = 0;
};

/**
 * @brief 读取 runguard 的 meta 文件
 * 文件不存在时返回全部为默认值的结果，调用方通过 exitcode < 0 判断 runguard 是否正常写入了 meta
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace codejudge
