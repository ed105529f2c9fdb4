#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

/**
 * @brief 所有沙箱上下文的 cgroup 都位于这个 cgroup 之下
 * 这样 runguard --cleanup 只需要检查这一层的子 cgroup
 */
const std::string CGROUP_PARENT = "/codejudge";

struct runguard_options {
    std::string cgroupname;
    std::string chroot_dir;

    /**
     * @brief 绑定挂载到 chroot 内 /sandbox 的可写目录
     * 为空时不挂载
     */
    std::string scratch_dir;

    /**
     * @brief chroot 后的工作路径
     */
    std::string work_dir;

    /**
     * @brief 挂载到 chroot 内 /tmp 的 tmpfs 大小，单位为 MB，小于 0 时不挂载
     */
    int tmp_size = -1;

    size_t nproc = std::numeric_limits<size_t>::max();
    size_t nofile = 0;  // 0 表示不限制打开的文件数
    int user_id = -1;
    int group_id = -1;
    std::string cpuset;  // processor id to run client program.

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Output file size limit in bytes
    int64_t stream_size = -1;   // stdout/stderr limit in bytes
    bool no_core_dumps = false;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    bool preserve_sys_env = false;
    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};
