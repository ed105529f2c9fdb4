#include "language/language.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <filesystem>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace codejudge {
using namespace std;

// 编译产物的文件名
static const string OUTPUT_NAME = "program";

vector<string> expand_command(const string &command, const map<string, string> &values) {
    vector<string> tokens, result;
    string trimmed = boost::algorithm::trim_copy(command);
    if (trimmed.empty()) return result;
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    for (auto &token : tokens) {
        string arg = token;
        for (auto &[key, value] : values)
            boost::algorithm::replace_all(arg, "{" + key + "}", value);
        result.push_back(arg);
    }
    return result;
}

language_driver::language_driver(language_config config) : cfg(move(config)) {}

language_driver::~language_driver() = default;

const language_config &language_driver::config() const {
    return cfg;
}

bool language_driver::requires_compilation() const {
    return !cfg.compile_command.empty();
}

string language_driver::entry_point(const string &) const {
    return "";
}

string language_driver::source_file_name(const string &) const {
    return "code" + cfg.file_extension;
}

vector<string> language_driver::compile_command(const string &source_file) const {
    return expand_command(cfg.compile_command, placeholders(source_file));
}

vector<string> language_driver::run_command(const string &source_file) const {
    return expand_command(cfg.run_command, placeholders(source_file));
}

vector<string> language_driver::syntax_check_command(const string &source_file) const {
    return expand_command(cfg.syntax_check_command, placeholders(source_file));
}

vector<string> language_driver::parse_syntax_errors(const string &output) const {
    string trimmed = boost::algorithm::trim_copy(output);
    if (trimmed.empty()) return {};
    return {trimmed};
}

vector<string> language_driver::version_command() const {
    return expand_command(cfg.version_command, {});
}

map<string, string> language_driver::placeholders(const string &source_file) const {
    return {
        {"filename", source_file},
        {"output", OUTPUT_NAME},
        {"classname", filesystem::path(source_file).stem().string()}};
}

static const boost::regex java_public_class(R"(public\s+class\s+(\w+))");

string java_driver::entry_point(const string &code) const {
    boost::smatch match;
    if (!boost::regex_search(code, match, java_public_class))
        throw compilation_error("No public class found in Java code");
    return match[1].str();
}

string java_driver::source_file_name(const string &code) const {
    return entry_point(code) + cfg.file_extension;
}

map<string, string> java_driver::placeholders(const string &source_file) const {
    auto values = language_driver::placeholders(source_file);
    // javac 产生的 class 文件与类名相同
    values["output"] = values["classname"];
    return values;
}

static const boost::regex python_error_location(R"re(File "[^"]*", line (\d+))re");
static const boost::regex python_error_message(R"(^\s*(\w*Error): (.*)$)");

vector<string> python_driver::parse_syntax_errors(const string &output) const {
    string line_number, message;
    for (auto &line : split_lines(output)) {
        boost::smatch match;
        if (boost::regex_search(line, match, python_error_location))
            line_number = match[1].str();
        else if (boost::regex_search(line, match, python_error_message))
            message = match[2].str();
    }
    if (line_number.empty() || message.empty())
        return language_driver::parse_syntax_errors(output);
    return {"Syntax error at line " + line_number + ": " + message};
}

static const boost::regex javascript_error_location(R"(^\S+\.js:(\d+)$)");
static const boost::regex javascript_error_message(R"(^(\w*Error): (.*)$)");

vector<string> javascript_driver::parse_syntax_errors(const string &output) const {
    string line_number, message;
    for (auto &line : split_lines(output)) {
        boost::smatch match;
        if (line_number.empty() && boost::regex_search(line, match, javascript_error_location))
            line_number = match[1].str();
        else if (message.empty() && boost::regex_search(line, match, javascript_error_message))
            message = match[2].str();
    }
    if (line_number.empty() || message.empty())
        return language_driver::parse_syntax_errors(output);
    return {"Syntax error at line " + line_number + ": " + message};
}

language_driver_ptr make_language_driver(const language_config &config) {
    switch (config.type) {
        case language_type::JAVA:
            return make_unique<java_driver>(config);
        case language_type::PYTHON:
            return make_unique<python_driver>(config);
        case language_type::JAVASCRIPT:
            return make_unique<javascript_driver>(config);
        default:
            return make_unique<language_driver>(config);
    }
}

}  // namespace codejudge
