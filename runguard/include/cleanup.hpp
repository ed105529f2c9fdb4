#pragma once

#include <string>

/**
 * @brief 清理孤儿 cgroup
 * 沙箱上下文的 cgroup 名称形如 CGROUP_PARENT/ctx_{pid}_{time}，其中 pid 为创建它的
 * runguard 进程。runguard 被 SIGKILL 杀死时来不及删除 cgroup，cgroup 内的进程也可能残留，
 * 这里杀死 pid 已经不存在的 cgroup 内的所有进程并删除 cgroup。
 * @param metafile_path 写入 removed-cgroups 的 meta 文件，为空时不写入
 * @return 删除的 cgroup 数
 */
int cleanup_orphans(const std::string &metafile_path);
