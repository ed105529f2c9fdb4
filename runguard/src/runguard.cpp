#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include "cgroup.hpp"
#include "cleanup.hpp"
#include "common/system.hpp"
#include "run.hpp"

using namespace std;

void validate(boost::any& v, const vector<string>& values, size_t*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    if (s[0] == '-') {
        throw validation_error(validation_error::invalid_option_value);
    }

    v = boost::lexical_cast<size_t>(s);
}

void validate(boost::any& v, const vector<string>& values, struct time_limit*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    struct time_limit result;
    string const& s = validators::get_single_string(values);
    auto colon = s.find(':');
    string left = s.substr(0, colon);
    string right = colon < s.size() ? s.substr(colon + 1) : "";

    result.soft = boost::lexical_cast<double>(left);
    if (right.size())
        result.hard = boost::lexical_cast<double>(right);
    else
        result.hard = result.soft;

    if (result.hard < result.soft ||
        !finite(result.hard) || !finite(result.soft) ||
        result.hard < 0 || result.soft < 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    struct runguard_options opt;

    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "run command with root directory set to root. If this option is provided, running command is executed relative to the chroot, and the root is mounted read-only.")
        ("scratch", po::value<string>(), "bind mount the writable directory at /sandbox in the chroot")
        ("work-dir,w", po::value<string>(), "change to this directory in the chroot before running command")
        ("tmp-size", po::value<size_t>(), "mount a noexec tmpfs of the size in MB at /tmp in the chroot")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id. If only 'user' is set, this defaults to the primary group of the user")
        ("wall-time,T", po::value<time_limit>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("cpu-time,t", po::value<time_limit>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<size_t>(), "set maximum memory consumption of the command in KB")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<size_t>(), "set maximum number of processes and threads in the sandbox context (cgroup pids.max)")
        ("nofile", po::value<size_t>(), "set maximum number of file descriptors opened simutanously")
        ("cpuset,P", po::value<string>(), "set the processor IDs that can only be used (e.g. \"0,2-3\")")
        ("no-core-dumps", "disable core dumps")
        ("standard-input-file,i", po::value<string>(), "redirect command standard input fd to file")
        ("standard-output-file,o", po::value<string>(), "redirect command standard output fd to file")
        ("standard-error-file,e", po::value<string>(), "redirect command standard error fd to file")
        ("stream-size", po::value<size_t>(), "truncate command output streams at the size in bytes")
        ("environment,E", "preseve system environment variables (or only PATH is loaded)")
        ("variable,V", po::value<vector<string>>(), "add additional environment variables (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, memory usage, ...) to file")
        ("cleanup", "kill processes and delete cgroups left behind by runguard processes that no longer exist, then exit")
        ("cmd", po::value<vector<string>>()->composing(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .allow_unregistered()
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    if (vm.count("help")) {
        cout << "Runguard: Running user program in protected mode with system resource access limitations." << endl
             << "This app requires root privilege if either 'root' or 'user' option is provided." << endl
             << "Usage: " << argv[0] << " [options] -- [command]";
        cout << desc << endl;
        return 0;
    }

    if (vm.count("version")) {
        cout << "runguard" << endl;
        return 0;
    }

    if (vm.count("out-meta")) opt.metafile_path = vm["out-meta"].as<string>();

    if (vm.count("cleanup")) {
        try {
            cgroup_library_init();
            cleanup_orphans(opt.metafile_path);
        } catch (exception& e) {
            cerr << e.what() << endl;
            if (!opt.metafile_path.empty()) {
                ofstream metafile(opt.metafile_path);
                metafile << "internal-error: " << e.what() << endl;
            }
            return 1;
        }
        return 0;
    }

    if (!vm.count("cmd")) {
        cerr << "the command to run is required" << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    if (vm.count("root")) {
        opt.chroot_dir = vm["root"].as<string>();
    }
    if (vm.count("scratch")) opt.scratch_dir = vm["scratch"].as<string>();
    if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();
    if (vm.count("tmp-size")) opt.tmp_size = (int)vm["tmp-size"].as<size_t>();

    if (vm.count("user")) {
        string user = vm["user"].as<string>();
        opt.user_id = get_userid(user);
        if (opt.user_id < 0) {
            cerr << "unknown user " << user << endl;
            return 1;
        }
    }

    if (vm.count("group")) {
        string group = vm["group"].as<string>();
        opt.group_id = get_groupid(group);
        if (opt.group_id < 0) {
            cerr << "unknown group " << group << endl;
            return 1;
        }
    } else if (vm.count("user")) {
        opt.group_id = get_primary_groupid(vm["user"].as<string>());
    }

    if (vm.count("variable")) {
        opt.env = vm["variable"].as<vector<string>>();
    }

    if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<time_limit>();
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    if (vm.count("memory-limit")) {
        opt.memory_limit = vm["memory-limit"].as<size_t>();
        if (opt.memory_limit != (opt.memory_limit * 1024) / 1024)
            opt.memory_limit = -1;
        else
            opt.memory_limit *= 1024;
    }
    if (vm.count("file-limit")) opt.file_limit = (int64_t)vm["file-limit"].as<size_t>() * 1024;
    if (vm.count("nproc")) opt.nproc = vm["nproc"].as<size_t>();
    if (vm.count("nofile")) opt.nofile = vm["nofile"].as<size_t>();
    if (vm.count("no-core-dumps")) opt.no_core_dumps = true;
    if (vm.count("cpuset")) opt.cpuset = vm["cpuset"].as<string>();
    if (vm.count("standard-input-file")) opt.stdin_filename = vm["standard-input-file"].as<string>();
    if (vm.count("standard-output-file")) opt.stdout_filename = vm["standard-output-file"].as<string>();
    if (vm.count("standard-error-file")) opt.stderr_filename = vm["standard-error-file"].as<string>();
    if (vm.count("stream-size")) opt.stream_size = (int64_t)vm["stream-size"].as<size_t>();
    if (vm.count("environment")) opt.preserve_sys_env = true;
    opt.command = vm["cmd"].as<vector<string>>();

    return runit(opt);
}