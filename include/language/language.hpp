#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "language/language_type.hpp"

/**
 * 这个头文件包含编程语言相关的配置以及各语言的驱动。
 * 执行引擎不在代码中根据语言分支，而是在收到请求时通过 language_registry
 * 找到对应语言的 language_driver，之后所有和语言相关的行为（入口点、
 * 源文件名、编译命令、运行命令、语法检查）都交由 driver 处理。
 */
namespace codejudge {

/**
 * @brief 一个编程语言的静态配置
 * 命令模板以空白分隔成参数，每个参数中的 {filename}、{output}、{classname}
 * 会被替换成实际的值。命令不会经过 shell 解释。
 */
struct language_config {
    language_type type;

    /**
     * @brief 沙箱模板（chroot 环境）的名称，位于 IMAGE_DIR 下
     */
    std::string image;

    /**
     * @brief 源文件的扩展名，比如 ".cpp"
     */
    std::string file_extension;

    /**
     * @brief 编译命令模板，为空表示该语言不需要编译
     */
    std::string compile_command;

    std::string run_command;

    /**
     * @brief 获取编译器、解释器版本的命令
     */
    std::string version_command;

    /**
     * @brief 只检查语法而不运行程序的命令模板，只对解释型语言有意义
     */
    std::string syntax_check_command;

    /**
     * @brief 运行时额外需要的进程（线程）数
     * JVM、Go、Node.js、Mono 在启动时就会创建若干线程，而沙箱的 pids.max 同样计算线程数，
     * 因此这些语言在安全等级的进程数限制之上需要额外的配额
     */
    int extra_processes = 0;

    /**
     * @brief 运行时额外需要打开的文件数，比如动态链接库、JVM 的 jar 包
     */
    int extra_files = 0;

    /**
     * @brief 运行时的环境变量
     */
    std::map<std::string, std::string> environment;
};

/**
 * @brief 将命令模板展开为参数列表
 * @param command 命令模板，比如 "g++ -o {output} {filename}"
 * @param values 占位符的值，键不包括花括号
 * @return 参数列表，模板为空时返回空列表
 */
std::vector<std::string> expand_command(const std::string &command, const std::map<std::string, std::string> &values);

/**
 * @brief 编程语言的驱动
 * 默认实现适用于大部分语言：源文件名为 code 加扩展名，可执行文件名为 program。
 */
struct language_driver {
    explicit language_driver(language_config config);
    virtual ~language_driver();

    const language_config &config() const;

    bool requires_compilation() const;

    /**
     * @brief 提取程序的入口点
     * @return 入口点名称，对于大部分语言没有入口点的概念，返回空字符串
     * @throw compilation_error 如果代码中找不到入口点
     */
    virtual std::string entry_point(const std::string &code) const;

    /**
     * @brief 根据代码决定源文件的文件名
     * @throw compilation_error 如果代码中找不到入口点
     */
    virtual std::string source_file_name(const std::string &code) const;

    /**
     * @brief 编译命令，不需要编译的语言返回空列表
     * @param source_file 源文件名，由 source_file_name 获得
     */
    virtual std::vector<std::string> compile_command(const std::string &source_file) const;

    virtual std::vector<std::string> run_command(const std::string &source_file) const;

    /**
     * @brief 只检查语法的命令，不支持时返回空列表
     */
    virtual std::vector<std::string> syntax_check_command(const std::string &source_file) const;

    /**
     * @brief 从语法检查命令的输出中提取语法错误
     * @param output 语法检查命令的 stdout 与 stderr
     * @return 形如 "Syntax error at line N: message" 的错误列表
     */
    virtual std::vector<std::string> parse_syntax_errors(const std::string &output) const;

    std::vector<std::string> version_command() const;

protected:
    /**
     * @brief 命令模板中占位符的值
     */
    virtual std::map<std::string, std::string> placeholders(const std::string &source_file) const;

    language_config cfg;
};

/**
 * @brief Java 的驱动
 * Java 要求 public class 的类名与文件名一致，因此必须先从代码中找到
 * public class 才能确定源文件名，运行时也以类名作为参数。
 */
struct java_driver : public language_driver {
    using language_driver::language_driver;

    std::string entry_point(const std::string &code) const override;
    std::string source_file_name(const std::string &code) const override;

protected:
    std::map<std::string, std::string> placeholders(const std::string &source_file) const override;
};

/**
 * @brief Python 的驱动
 * 语法检查使用 py_compile，错误信息形如 File "code.py", line 3
 */
struct python_driver : public language_driver {
    using language_driver::language_driver;

    std::vector<std::string> parse_syntax_errors(const std::string &output) const override;
};

/**
 * @brief JavaScript 的驱动
 * 语法检查使用 node --check，错误信息形如 /sandbox/code.js:3
 */
struct javascript_driver : public language_driver {
    using language_driver::language_driver;

    std::vector<std::string> parse_syntax_errors(const std::string &output) const override;
};

typedef std::unique_ptr<language_driver> language_driver_ptr;

/**
 * @brief 根据配置创建对应的驱动
 */
language_driver_ptr make_language_driver(const language_config &config);

}  // namespace codejudge
