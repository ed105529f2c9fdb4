#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件存在时覆盖
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 检查字符串是否是严格合法的 UTF-8 编码
 * 过长编码、代理区码点和超出 U+10FFFF 的码点都视为不合法
 */
bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将不合法的 UTF-8 字节逐个替换为 U+FFFD
 * 结果一定能通过 utf8_check_is_valid，合法的输入原样返回
 */
std::string utf8_replace_invalid(const std::string &string);

/**
 * @brief 统计 UTF-8 字符串的字符（码点）数量
 * 只统计非 10xxxxxx 形式的字节，不检查字符串是否合法
 */
std::size_t utf8_length(const std::string &string);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于执行引擎
 * 运行时需要 root 权限，如果拿到的文件名包含 "../" 或者是绝对路径，
 * 那么最后有可能导致系统重要文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace codejudge
