#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "runguard_options.hpp"

const int TIME_LIMIT_SOFT = 1;
const int TIME_LIMIT_HARD = 2;

/**
 * @brief 一个沙箱上下文的监测结果
 * 监视循环在运行过程中逐步填写，结束后整体写入 meta 文件
 */
struct context_report {
    int exitcode = -1;

    /**
     * @brief 终止选手程序的信号，正常退出时为 -1
     */
    int signal = -1;

    int wall_limit = 0;  // TIME_LIMIT_SOFT / TIME_LIMIT_HARD 的组合
    int cpu_limit = 0;

    bool oom = false;
    std::int64_t memory_bytes = -1;

    double wall_time = 0;
    double user_time = 0;
    double sys_time = 0;
    double cpu_time = 0;

    /**
     * @brief 设置了 --stream-size 时才报告 output-truncated
     */
    bool stream_limited = false;
    std::vector<std::string> truncated_streams;
    std::size_t stdout_bytes = 0;
    std::size_t stderr_bytes = 0;

    /**
     * @brief 根据 wait 得到的状态记录退出码
     * 被信号终止时退出码为 128 + 信号，SIGXCPU 说明达到了 RLIMIT_CPU 的硬限制
     * @throw std::runtime_error 无法识别的状态
     */
    void record_exit(int status);

    /**
     * @brief 运行时间超过软限制时记录超时
     */
    void check_soft_limits(const runguard_options &opt);

    /**
     * @return "hard-timelimit"、"soft-timelimit" 或空
     */
    std::string time_result() const;

    void write(std::ostream &meta) const;
};
