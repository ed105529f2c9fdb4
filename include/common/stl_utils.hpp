#pragma once

#include <string>
#include <vector>

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

/**
 * @brief 按 '\n' 切分文本，保留空行，行尾的 '\r' 会被去掉
 * 以 '\n' 结尾的文本不会产生额外的空行
 */
std::vector<std::string> split_lines(const std::string &text);
