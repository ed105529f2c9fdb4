#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 编译步骤的内存限制，单位为 MB
 * 编译器（尤其是 javac、rustc）需要比选手程序多得多的内存，
 * 因此编译步骤不使用安全等级的资源限制
 */
extern int COMPILE_MEM_LIMIT;

/**
 * @brief 编译步骤的时间限制（CPU 时间和时钟时间），单位为秒
 */
extern int COMPILE_TIME_LIMIT;

/**
 * @brief 编译步骤的进程数限制
 */
extern int COMPILE_PROC_LIMIT;

/**
 * @brief 编译步骤能够同时打开的文件数
 */
extern int COMPILE_FILE_LIMIT;

/**
 * @brief 编译步骤的输出限制，单位为字节
 */
extern int COMPILE_OUTPUT_LIMIT;

/**
 * @brief 沙箱内 /tmp 的 tmpfs 大小，单位为 MB
 */
extern int SANDBOX_TMP_SIZE;

/**
 * @brief 等待 runguard 结束时，在时钟时间限制之外额外等待的时间，单位为秒
 * runguard 本身会在时钟时间限制到达时杀死选手程序，这里的等待只是为了
 * 防止 runguard 自身卡死导致执行引擎无限等待
 */
extern int SANDBOX_GRACE_TIME;

/**
 * @brief 默认的安全等级名称，可以是 low、medium、high、maximum
 */
extern std::string SECURITY_LEVEL;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 存放执行引擎外置脚本的路径
 *
 * EXEC_DIR
 * └── build_image.sh // 构建语言沙箱模板（chroot 环境）的脚本
 */
extern std::filesystem::path EXEC_DIR;

/**
 * @brief 存放各个语言的沙箱模板（chroot 环境）的路径
 * 沙箱模板由管理员通过 --build-images 构建，执行请求时只读共享
 *
 * IMAGE_DIR
 * ├── codejudge-python // 模板名称，参见 language_config::image
 * │   ├── sandbox // 沙箱上下文的 scratch 目录挂载点
 * │   ├── tmp // tmpfs 挂载点
 * │   └── usr ...
 * └── ...
 */
extern std::filesystem::path IMAGE_DIR;

/**
 * @brief 执行请求的工作路径
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * └── 6f1c... // 执行请求的 uuid，请求结束后删除
 *     ├── build // 编译目录，存放源代码和编译产物
 *     ├── compile-6a2b... // 编译步骤的沙箱上下文
 *     │   ├── program.out // 编译器的 stdout
 *     │   ├── program.err // 编译器的 stderr
 *     │   └── program.meta // runguard 的监测信息
 *     └── run-8d3e... // 一个测试用例的沙箱上下文，用完即删
 *         ├── sandbox // scratch 目录，挂载到沙箱内的 /sandbox
 *         ├── testdata.in // 测试用例的输入，重定向为选手程序的 stdin
 *         ├── program.out
 *         ├── program.err
 *         └── program.meta
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 运行选手程序的低权限用户
 */
extern std::string RUN_USER;

/**
 * @brief 运行选手程序的用户组，为空时使用 RUN_USER 的主组
 */
extern std::string RUN_GROUP;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行引擎将不再检查程序是否在特权模式下执行，
 * 并且不会删除产生的请求目录，以便手动检查产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace codejudge
