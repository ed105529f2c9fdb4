#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 执行引擎支持的编程语言
 */
enum class language_type {
    PYTHON,
    JAVASCRIPT,
    JAVA,
    CPP,
    CSHARP,
    GO,
    RUST
};

/**
 * @brief 语言在 JSON 中的名称，比如 "cpp"
 */
const char *get_language_name(language_type);

/**
 * @brief 根据名称解析语言
 * @throw std::invalid_argument 语言不受支持，异常信息形如 "Unsupported language: cobol"
 */
language_type parse_language_name(const std::string &name);

const std::vector<language_type> &all_languages();

void to_json(nlohmann::json &j, const language_type &lang);
void from_json(const nlohmann::json &j, language_type &lang);

}  // namespace codejudge
