#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace codejudge {

struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 一般是配置错误或者调用的外部脚本本身出错
 */
struct internal_error : public engine_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示沙箱基础设施出错
 * 比如 runguard 无法创建 cgroup、无法 chroot，这类错误与选手程序无关，
 * 会终止整个执行请求
 */
struct sandbox_error : public engine_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示等待外部进程超时
 * 调用方已经强制终止了该进程
 */
struct timeout_error : public engine_exception {
    timeout_error();
    explicit timeout_error(const std::string &message);
};

/**
 * @brief 表示选手程序编译错误
 * 可以表示程序格式不正确（比如找不到入口类），或者编译器报错
 */
struct compilation_error : public std::runtime_error {
public:
    const std::string error_log;

    explicit compilation_error(const std::string &what, const std::string &error_log = "");
};

}  // namespace codejudge
