#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace codejudge {

/**
 * @brief 基于 runguard 的沙箱后端
 * 每个沙箱上下文对应一次 runguard 调用：runguard 在新的命名空间中 chroot 到
 * 只读的语言模板，把 scratch 目录挂载到 /sandbox，在 /tmp 挂载限制大小的 tmpfs，
 * 用 cgroup 和 rlimit 限制资源，切换到低权限用户后运行命令。
 *
 * context_dir 的文件结构如下：
 * context_dir
 * ├── program.out // 程序的 stdout，超出输出限制的部分被丢弃
 * ├── program.err // 程序的 stderr
 * └── program.meta // runguard 的监测信息，参见 runguard_result
 */
struct runguard_sandbox : public sandbox {
    /**
     * @param runguard runguard 可执行文件路径
     * @param image_dir 存放沙箱模板的路径，参见 IMAGE_DIR
     * @param exec_dir 存放 build_image.sh 的路径，参见 EXEC_DIR
     * @param run_dir 存放临时文件的路径，参见 RUN_DIR
     * @param run_user 运行程序的用户
     * @param run_group 运行程序的用户组，为空时使用 run_user 的主组
     */
    runguard_sandbox(std::filesystem::path runguard,
                     std::filesystem::path image_dir,
                     std::filesystem::path exec_dir,
                     std::filesystem::path run_dir,
                     std::string run_user,
                     std::string run_group);

    sandbox_outcome execute(const sandbox_context_spec &spec) override;

    void build_image(const std::string &image, const std::string &lang) override;

    std::size_t cleanup_orphans() override;

    /**
     * @brief 生成调用 runguard 的参数列表（不包括 runguard 本身）
     */
    std::vector<std::string> build_arguments(const sandbox_context_spec &spec) const;

private:
    std::filesystem::path runguard, image_dir, exec_dir, run_dir;
    std::string run_user, run_group;
};

}  // namespace codejudge
