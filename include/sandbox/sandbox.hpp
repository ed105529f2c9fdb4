#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 创建一个沙箱上下文所需的全部信息
 * 一个沙箱上下文只对应一次编译或者一个测试用例的运行，用完即销毁。
 */
struct sandbox_context_spec {
    /**
     * @brief 沙箱模板（chroot 环境）的名称，沙箱内的根文件系统只读
     */
    std::string image;

    /**
     * @brief 上下文在主机上的目录，存放 stdin、stdout、stderr 和 meta 文件
     * 这个目录不会挂载到沙箱内
     */
    std::filesystem::path context_dir;

    /**
     * @brief 可写的 scratch 目录，挂载到沙箱内的 /sandbox，也是程序的工作路径
     */
    std::filesystem::path scratch_dir;

    /**
     * @brief 要执行的命令，argv[0] 在沙箱内通过 PATH 查找
     */
    std::vector<std::string> command;

    std::map<std::string, std::string> environment;

    /**
     * @brief 重定向为标准输入的主机文件，为空时标准输入为 /dev/null
     */
    std::filesystem::path input_file;

    int memory_mb = 128;
    int cpu_time_seconds = 5;
    int wall_time_seconds = 10;
    int max_processes = 1;
    int max_files = 10;

    /**
     * @brief stdout、stderr 分别最多保留的字节数，超出部分被丢弃
     */
    std::size_t max_output_size = 256 * 1024;

    /**
     * @brief 沙箱能使用的 CPU 核心，为空表示不限制
     */
    std::string cpuset;
};

/**
 * @brief 沙箱上下文结束后的原始结果
 * 这里只是如实记录，解释成执行状态由 runner 负责
 */
struct sandbox_outcome {
    /**
     * @brief 程序的返回值，被信号终止时为 128 + 信号值
     */
    int exit_code = -1;

    /**
     * @brief 终止程序的信号，没有时为 -1
     */
    int signal = -1;

    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 峰值内存（包括 swap），单位为字节
     */
    std::int64_t peak_memory_bytes = 0;

    double wall_time_seconds = 0;
    double cpu_time_seconds = 0;

    /**
     * @brief 是否超出 CPU 时间或者时钟时间限制
     */
    bool time_limit_exceeded = false;

    /**
     * @brief cgroup 是否触发了 OOM killer
     */
    bool out_of_memory = false;

    bool output_truncated = false;
};

/**
 * @brief 沙箱后端
 * 负责真正创建隔离环境并运行命令。执行引擎的其余部分只通过这个接口
 * 访问沙箱，因此单元测试可以替换为模拟实现。
 * 实现必须是线程安全的：不同请求会在不同线程中同时调用。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 创建一个沙箱上下文，运行命令并等待其结束
     * 等待时间有上限（时钟时间限制加上一小段宽限时间），超过上限时
     * 沙箱上下文会被强制终止。
     * @throw timeout_error 沙箱上下文在等待上限内没有结束
     * @throw sandbox_error 沙箱无法创建，或者沙箱监控程序报告内部错误
     */
    virtual sandbox_outcome execute(const sandbox_context_spec &spec) = 0;

    /**
     * @brief 构建一个语言的沙箱模板
     * 这是管理操作，不会在执行请求时调用
     * @param image 沙箱模板名称
     * @param lang 语言名称，由构建脚本决定需要安装的软件包
     * @throw internal_error 构建失败
     */
    virtual void build_image(const std::string &image, const std::string &lang) = 0;

    /**
     * @brief 清理由于执行引擎崩溃而残留的沙箱上下文
     * @return 清理掉的沙箱上下文数量
     */
    virtual std::size_t cleanup_orphans() = 0;
};

typedef std::shared_ptr<sandbox> sandbox_ptr;

}  // namespace codejudge
