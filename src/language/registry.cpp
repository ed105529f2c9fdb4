#include "language/registry.hpp"

namespace codejudge {
using namespace std;

vector<language_config> default_language_configs() {
    vector<language_config> configs;

    {
        language_config python{language_type::PYTHON};
        python.image = "codejudge-python";
        python.file_extension = ".py";
        python.run_command = "python3 {filename}";
        python.version_command = "python3 --version";
        python.syntax_check_command = "python3 -m py_compile {filename}";
        // 字节码缓存写到 /tmp 的 tmpfs，不留在 scratch 目录中
        python.environment = {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONPYCACHEPREFIX", "/tmp/pycache"}};
        configs.push_back(python);
    }

    {
        language_config javascript{language_type::JAVASCRIPT};
        javascript.image = "codejudge-javascript";
        javascript.file_extension = ".js";
        javascript.run_command = "node {filename}";
        javascript.version_command = "node --version";
        javascript.syntax_check_command = "node --check {filename}";
        javascript.extra_processes = 10;
        javascript.extra_files = 20;
        configs.push_back(javascript);
    }

    {
        language_config java{language_type::JAVA};
        java.image = "codejudge-java";
        java.file_extension = ".java";
        java.compile_command = "javac {filename}";
        java.run_command = "java {classname}";
        java.version_command = "java --version";
        java.extra_processes = 32;
        java.extra_files = 64;
        java.environment = {{"JAVA_TOOL_OPTIONS", "-XX:+UseSerialGC -XX:TieredStopAtLevel=1"}};
        configs.push_back(java);
    }

    {
        language_config cpp{language_type::CPP};
        cpp.image = "codejudge-cpp";
        cpp.file_extension = ".cpp";
        cpp.compile_command = "g++ -o {output} {filename} -std=c++17 -Wall";
        cpp.run_command = "./{output}";
        cpp.version_command = "g++ --version";
        configs.push_back(cpp);
    }

    {
        language_config csharp{language_type::CSHARP};
        csharp.image = "codejudge-csharp";
        csharp.file_extension = ".cs";
        csharp.compile_command = "mcs -out:{output}.exe {filename}";
        csharp.run_command = "mono {output}.exe";
        csharp.version_command = "mono --version";
        csharp.extra_processes = 16;
        csharp.extra_files = 32;
        configs.push_back(csharp);
    }

    {
        language_config go{language_type::GO};
        go.image = "codejudge-go";
        go.file_extension = ".go";
        go.compile_command = "go build -o {output} {filename}";
        go.run_command = "./{output}";
        go.version_command = "go version";
        go.extra_processes = 16;
        go.extra_files = 16;
        // go build 需要可写的缓存目录
        go.environment = {{"GOCACHE", "/tmp/gocache"}, {"HOME", "/tmp"}};
        configs.push_back(go);
    }

    {
        language_config rust{language_type::RUST};
        rust.image = "codejudge-rust";
        rust.file_extension = ".rs";
        rust.compile_command = "rustc {filename} -o {output}";
        rust.run_command = "./{output}";
        rust.version_command = "rustc --version";
        configs.push_back(rust);
    }

    return configs;
}

language_registry::language_registry(const vector<language_config> &configs) {
    for (auto &config : configs)
        table[config.type] = make_language_driver(config);
}

const language_driver *language_registry::resolve(language_type lang) const {
    auto it = table.find(lang);
    if (it == table.end()) return nullptr;
    return it->second.get();
}

vector<const language_driver *> language_registry::drivers() const {
    vector<const language_driver *> result;
    for (auto &[lang, driver] : table)
        result.push_back(driver.get());
    return result;
}

}  // namespace codejudge
