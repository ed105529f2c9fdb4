#include "language/language_type.hpp"
#include <boost/assign.hpp>
#include <map>
#include <stdexcept>

namespace codejudge {
using namespace std;

// clang-format off
static const map<language_type, const char *> language_names = boost::assign::map_list_of
    (language_type::PYTHON, "python")
    (language_type::JAVASCRIPT, "javascript")
    (language_type::JAVA, "java")
    (language_type::CPP, "cpp")
    (language_type::CSHARP, "csharp")
    (language_type::GO, "go")
    (language_type::RUST, "rust");
// clang-format on

const char *get_language_name(language_type lang) {
    return language_names.at(lang);
}

language_type parse_language_name(const string &name) {
    for (auto &[lang, lang_name] : language_names)
        if (name == lang_name) return lang;
    throw invalid_argument("Unsupported language: " + name);
}

const vector<language_type> &all_languages() {
    static const vector<language_type> languages = {
        language_type::PYTHON, language_type::JAVASCRIPT, language_type::JAVA,
        language_type::CPP, language_type::CSHARP, language_type::GO, language_type::RUST};
    return languages;
}

void to_json(nlohmann::json &j, const language_type &lang) {
    j = get_language_name(lang);
}

void from_json(const nlohmann::json &j, language_type &lang) {
    lang = parse_language_name(j.get<string>());
}

}  // namespace codejudge
