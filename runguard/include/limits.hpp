#pragma once

#include "cgroup.hpp"
#include "runguard_options.hpp"

/**
 * @brief 在子进程中 exec 之前限制其资源并完成隔离
 * 1. 清理环境变量，只保留 PATH 与 -V 指定的变量
 * 2. 通过 rlimit 限制 CPU 时间、打开的文件数、写入文件的大小，并给予无限大的栈空间
 * 3. 移入沙箱上下文的 cgroup，内存、进程数和 CPU 核心由 cgroup 限制
 * 4. 分离到独立的会话，挂载并 chroot 到语言模板，最后切换到运行用户
 * @throw std::system_error 任何一步失败
 */
void set_restrictions(const runguard_options &opt, const context_cgroup &cg);
