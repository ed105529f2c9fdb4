#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/regex.hpp>
#include <iostream>
#include <iterator>
#include <set>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/executor.hpp"
#include "sandbox/runguard_sandbox.hpp"
using namespace std;

struct cpuset {
    string literal;
    set<size_t> ids;
};

void validate(boost::any& v, const vector<string>& values, cpuset*, int) {
    using namespace boost::program_options;
    static const boost::regex matcher("^([0-9]+)(-([0-9]+))?$");
    validators::check_first_occurrence(v);

    cpuset result;
    string const& s = validators::get_single_string(values);
    result.literal = s;
    vector<string> splitted;
    boost::split(splitted, s, boost::is_any_of(","));
    for (auto& token : splitted) {
        boost::smatch matches;
        if (!boost::regex_match(token, matches, matcher))
            throw validation_error(validation_error::invalid_option_value);

        if (matches[3].str().empty()) {
            result.ids.insert(boost::lexical_cast<size_t>(matches[1].str()));
        } else {
            size_t begin = boost::lexical_cast<size_t>(matches[1].str());
            size_t end = boost::lexical_cast<size_t>(matches[3].str());
            if (begin > end)
                throw validation_error(validation_error::invalid_option_value);
            for (size_t i = begin; i <= end; ++i)
                result.ids.insert(i);
        }
    }
    v = result;
}

/**
 * @brief 读取请求，"-" 表示从标准输入读取
 */
static string read_request(const string& source) {
    if (source == "-")
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return codejudge::read_file_content(source);
}

// 请求中的字段（如 code）原样回显时也可能不是合法的 UTF-8
static void print_json(const nlohmann::json& j) {
    cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    // 默认情况下，假设运行环境是拉取代码直接编译的环境，此时我们可以假定 runguard 的运行路径
    if (!getenv("RUNGUARD")) {
        filesystem::path runguard(repo_dir / "runguard" / "bin" / "runguard");
        if (filesystem::exists(runguard)) {
            set_env("RUNGUARD", filesystem::weakly_canonical(runguard).string());
        }
    }

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("execute", po::value<string>(), "execute the request in the given JSON file (- for stdin) and print the result")
        ("validate", po::value<string>(), "check the syntax of the code in the given JSON file (- for stdin) and print the result")
        ("languages", "print the supported languages")
        ("build-images", "build the sandbox image of every language and probe compiler versions")
        ("cleanup", "remove sandbox contexts and workspaces left behind by crashed requests")
        ("cores", po::value<cpuset>(), "set the cores the sandboxes can make use of, for example 0-3,6, default to 0")
        ("security-level", po::value<string>(), "set the security level: low, medium, high or maximum, default to high. You can either pass it from environ SECURITYLEVEL")
        ("exec-dir", po::value<string>(), "set the directory with build_image.sh stored. You can either pass it from environ EXECDIR")
        ("image-dir", po::value<string>(), "set the directory to store the sandbox images. You can either pass it from environ IMAGEDIR")
        ("run-dir", po::value<string>(), "set the directory to store request workspaces and sandbox contexts. You can either pass it from environ RUNDIR")
        ("compile-mem-limit", po::value<int>(), "set memory limit in MB for compilers, default to 512")
        ("compile-time-limit", po::value<int>(), "set time limit in seconds for compilers, default to 30")
        ("tmp-size", po::value<int>(), "set size in MB of the tmpfs mounted at /tmp in every sandbox, default to 64")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete workspaces to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codejudge: Compile and run untrusted code against test cases in sandboxes" << endl
             << "This app requires root privilege" << endl
             << "Required Environment Variables:" << endl
             << "\tRUNGUARD: location of runguard" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        codejudge::DEBUG = true;
    } else if (getenv("DEBUG")) {
        codejudge::DEBUG = true;
    }

    if (getuid() != 0) {
        cerr << "You should run this program in privileged mode" << endl;
        if (!codejudge::DEBUG) return EXIT_FAILURE;
    }

    CHECK(getenv("RUNGUARD"))
        << "RUNGUARD environment variable should be specified. This env points out where the runguard executable locates in.";
    codejudge::RUNGUARD = filesystem::path(getenv("RUNGUARD"));

    if (vm.count("exec-dir")) {
        codejudge::EXEC_DIR = filesystem::path(vm.at("exec-dir").as<string>());
    } else if (getenv("EXECDIR")) {
        codejudge::EXEC_DIR = filesystem::path(getenv("EXECDIR"));
    } else {
        filesystem::path execdir(repo_dir / "exec");
        if (filesystem::exists(execdir)) {
            codejudge::EXEC_DIR = execdir;
        }
    }

    if (vm.count("image-dir")) {
        codejudge::IMAGE_DIR = filesystem::path(vm.at("image-dir").as<string>());
    } else if (getenv("IMAGEDIR")) {
        codejudge::IMAGE_DIR = filesystem::path(getenv("IMAGEDIR"));
    }

    if (vm.count("run-dir")) {
        codejudge::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        codejudge::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(codejudge::RUN_DIR);
    CHECK(filesystem::is_directory(codejudge::RUN_DIR))
        << "Run directory " << codejudge::RUN_DIR << " does not exist";

    if (vm.count("compile-mem-limit")) {
        codejudge::COMPILE_MEM_LIMIT = vm["compile-mem-limit"].as<int>();
    }
    if (vm.count("compile-time-limit")) {
        codejudge::COMPILE_TIME_LIMIT = vm["compile-time-limit"].as<int>();
    }
    if (vm.count("tmp-size")) {
        codejudge::SANDBOX_TMP_SIZE = vm["tmp-size"].as<int>();
    }

    if (vm.count("run-user")) {
        codejudge::RUN_USER = vm["run-user"].as<string>();
    } else if (getenv("RUNUSER")) {
        codejudge::RUN_USER = getenv("RUNUSER");
    }

    if (vm.count("run-group")) {
        codejudge::RUN_GROUP = vm["run-group"].as<string>();
    } else if (getenv("RUNGROUP")) {
        codejudge::RUN_GROUP = getenv("RUNGROUP");
    }

    if (vm.count("security-level")) {
        codejudge::SECURITY_LEVEL = vm["security-level"].as<string>();
    } else if (getenv("SECURITYLEVEL")) {
        codejudge::SECURITY_LEVEL = getenv("SECURITYLEVEL");
    }

    codejudge::security::security_level level = codejudge::security::security_level::HIGH;
    try {
        level = codejudge::security::parse_security_level(codejudge::SECURITY_LEVEL);
    } catch (invalid_argument& e) {
        LOG(FATAL) << e.what();
    }

    // 让执行引擎写入的数据只允许当前用户写入
    umask(0022);

    vector<size_t> cores = {0};
    if (vm.count("cores")) {
        auto set = vm["cores"].as<cpuset>();
        cores.assign(set.ids.begin(), set.ids.end());
    }

    codejudge::language_registry registry;
    codejudge::runguard_sandbox box(codejudge::RUNGUARD, codejudge::IMAGE_DIR, codejudge::EXEC_DIR,
                                    codejudge::RUN_DIR, codejudge::RUN_USER, codejudge::RUN_GROUP);
    codejudge::slot_pool slots(cores);
    codejudge::executor engine(registry, box, slots, level, codejudge::RUN_DIR);

    if (vm.count("execute")) {
        codejudge::execution_request request;
        try {
            request = nlohmann::json::parse(read_request(vm["execute"].as<string>())).get<codejudge::execution_request>();
        } catch (exception& e) {
            LOG(WARNING) << "Malformed execution request: " << e.what();
            print_json(codejudge::make_error_result(codejudge::execution_status::INTERNAL_ERROR, 0, e.what()));
            return EXIT_FAILURE;
        }
        print_json(engine.execute_code(request));
    } else if (vm.count("validate")) {
        codejudge::validation_request request;
        try {
            request = nlohmann::json::parse(read_request(vm["validate"].as<string>())).get<codejudge::validation_request>();
        } catch (exception& e) {
            LOG(WARNING) << "Malformed validation request: " << e.what();
            codejudge::validation_result result;
            result.syntax_errors.push_back(e.what());
            print_json(result);
            return EXIT_FAILURE;
        }
        print_json(engine.validate_syntax(request));
    } else if (vm.count("languages")) {
        print_json(engine.get_supported_languages());
    } else if (vm.count("build-images")) {
        auto reports = engine.build_sandbox_images();
        print_json(reports);
        for (auto& report : reports)
            if (!report.success) return EXIT_FAILURE;
    } else if (vm.count("cleanup")) {
        try {
            size_t removed = engine.cleanup_orphaned_contexts();
            print_json({{"removed", removed}});
        } catch (exception& e) {
            LOG(ERROR) << "Cleanup failed: " << e.what();
            return EXIT_FAILURE;
        }
    } else {
        cerr << "One of --execute, --validate, --languages, --build-images and --cleanup is required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
