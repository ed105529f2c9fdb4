#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令
 * @param env additional environment variables
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param timeout 等待外部命令结束的最长时间，非正数表示不限制
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 * @throw codejudge::timeout_error 若外部命令在 timeout 内没有结束，此时外部命令已被杀死
 */
int exec_program(const std::map<std::string, std::string> &env, const std::vector<std::string> &argv, std::chrono::milliseconds timeout);

/**
 * @brief 调用外部程序，并限制等待时间
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param timeout 最长等待时间，超时后会先发送 SIGTERM 再发送 SIGKILL
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     std::filesystem::path runguard("/opt/codejudge/bin/runguard");
 *     int exitcode = call_process_timeout(std::chrono::seconds(10), runguard, "--cleanup");
 * @endcode
 */
template <typename... Args>
int call_process_timeout(std::chrono::milliseconds timeout, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list)
        ss << arg << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program({}, list, timeout);
}

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
