#pragma once

#include "runguard_options.hpp"

/**
 * @brief 在新的挂载命名空间中准备 chroot 目录
 * 必须在 unshare(CLONE_NEWNS) 之后、chroot 之前调用：
 * 1. 将所有挂载点的传播设置为 private，避免影响主机的挂载
 * 2. 将 chroot 目录绑定挂载到自身并重新挂载为只读，语言模板在所有沙箱之间共享
 * 3. 将 scratch 目录绑定挂载到 chroot 内的 /sandbox（nosuid、nodev）
 * 4. 在 chroot 内的 /tmp 挂载限制大小的 tmpfs（noexec、nosuid、nodev）
 * 5. 在 chroot 内的 /proc 挂载 hidepid=2 的 proc，程序只能看到自己的进程
 * 命名空间随 runguard 退出而销毁，因此不需要卸载。
 * @throw std::system_error 挂载失败
 */
void setup_mounts(const struct runguard_options &opt);
