#pragma once

#include "runguard_options.hpp"

/**
 * @brief 在一个新的沙箱上下文中运行命令，并把监测结果写入 meta 文件
 *
 * 沙箱上下文的生命周期：
 * 1. 创建 CGROUP_PARENT/ctx_{pid}_{time}，通过 memory、pids、cpuset 限制内存、进程数与 CPU 核心，
 *    cpuacct 统计 CPU 时间
 * 2. 分离 FD、FS、IPC、NET、NS、UTS、SYSVSEM 命名空间，子进程无法访问网络和主机的挂载
 * 3. fork 出子进程，子进程设置资源限制、进入 cgroup、chroot 到语言模板并切换用户后 exec 命令
 * 4. 监视循环通过管道转发 stdout/stderr 并在超出 --stream-size 后丢弃多余的输出；
 *    收到 SIGALRM（墙上时间硬限制）或 SIGTERM 时终止 cgroup 内的所有进程
 * 5. 命令结束后杀死 cgroup 内残留的进程，读取内存峰值、CPU 时间和 OOM 记录，删除 cgroup
 * 6. 写入 meta 文件：exitcode、signal、各项时间、time-result、memory-result、output-truncated
 *
 * 任何一步失败都会在 meta 文件中写入 internal-error，并且不会残留 cgroup 和进程。
 * @return 命令的退出码，被信号终止时为 128 + 信号；runguard 自身出错时为 EXIT_FAILURE
 */
int runit(runguard_options opt);
