#pragma once

#include <map>
#include <vector>
#include "language/language.hpp"

namespace codejudge {

/**
 * @brief 执行引擎内置的语言配置
 * 包括 python、javascript、java、cpp、csharp、go、rust
 */
std::vector<language_config> default_language_configs();

/**
 * @brief 支持的编程语言表
 * 在程序启动时构造一次，之后只读，通过引用注入到 executor 中，
 * 因此可以被多个线程同时访问。
 */
struct language_registry {
    /**
     * @brief 根据语言配置构造语言表
     * @param configs 语言配置，同一语言出现多次时以最后一个为准
     */
    explicit language_registry(const std::vector<language_config> &configs = default_language_configs());

    language_registry(const language_registry &) = delete;
    language_registry &operator=(const language_registry &) = delete;

    /**
     * @brief 查找语言的驱动
     * @return 语言的驱动，语言不受支持时返回 nullptr
     */
    const language_driver *resolve(language_type lang) const;

    /**
     * @brief 所有受支持的语言，按 language_type 的顺序排列
     */
    std::vector<const language_driver *> drivers() const;

private:
    std::map<language_type, language_driver_ptr> table;
};

}  // namespace codejudge
