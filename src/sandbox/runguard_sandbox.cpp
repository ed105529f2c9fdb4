#include "sandbox/runguard_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/system.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runguard.hpp"

namespace codejudge {
using namespace std;

runguard_sandbox::runguard_sandbox(filesystem::path runguard,
                                   filesystem::path image_dir,
                                   filesystem::path exec_dir,
                                   filesystem::path run_dir,
                                   string run_user,
                                   string run_group)
    : runguard(move(runguard)),
      image_dir(move(image_dir)),
      exec_dir(move(exec_dir)),
      run_dir(move(run_dir)),
      run_user(move(run_user)),
      run_group(move(run_group)) {}

/**
 * @brief 将 scratch 目录交给运行用户
 * 编译器需要在 scratch 目录中写入编译产物，选手程序也可能需要写文件
 */
static void give_to_user(const filesystem::path &dir, const string &user, const string &group) {
    int uid = get_userid(user);
    if (uid < 0) throw sandbox_error("unknown run user " + user);
    int gid = group.empty() ? get_primary_groupid(user) : get_groupid(group);
    if (gid < 0) throw sandbox_error("unknown run group " + (group.empty() ? user : group));

    auto change_owner = [&](const filesystem::path &path) {
        if (lchown(path.c_str(), uid, gid) != 0)
            throw sandbox_error(fmt::format("unable to chown {}: {}", path.string(), error_code(errno, system_category()).message()));
    };

    change_owner(dir);
    for (auto &entry : filesystem::recursive_directory_iterator(dir))
        change_owner(entry.path());
}

vector<string> runguard_sandbox::build_arguments(const sandbox_context_spec &spec) const {
    vector<string> args = {
        "--root", (image_dir / spec.image).string(),
        "--scratch", spec.scratch_dir.string(),
        "--work-dir", "/sandbox",
        "--tmp-size", to_string(SANDBOX_TMP_SIZE),
        "--user", run_user,
        "--wall-time", to_string(spec.wall_time_seconds),
        "--cpu-time", to_string(spec.cpu_time_seconds),
        "--memory-limit", to_string((int64_t)spec.memory_mb * 1024),
        "--file-limit", to_string((int64_t)SANDBOX_TMP_SIZE * 1024),
        "--nproc", to_string(spec.max_processes),
        "--nofile", to_string(spec.max_files),
        "--no-core-dumps",
        "--standard-output-file", (spec.context_dir / "program.out").string(),
        "--standard-error-file", (spec.context_dir / "program.err").string(),
        // 多保留一个字节，以便调用方判断输出是否超出了限制
        "--stream-size", to_string(spec.max_output_size + 1),
        "--out-meta", (spec.context_dir / "program.meta").string()};

    if (!run_group.empty()) {
        args.push_back("--group");
        args.push_back(run_group);
    }
    if (!spec.cpuset.empty()) {
        args.push_back("--cpuset");
        args.push_back(spec.cpuset);
    }
    if (!spec.input_file.empty()) {
        args.push_back("--standard-input-file");
        args.push_back(spec.input_file.string());
    }
    for (auto &[key, value] : spec.environment) {
        args.push_back("-V");
        args.push_back(key + "=" + value);
    }

    args.push_back("--");
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

sandbox_outcome runguard_sandbox::execute(const sandbox_context_spec &spec) {
    if (spec.command.empty())
        throw sandbox_error("empty command");
    if (!filesystem::is_directory(image_dir / spec.image))
        throw sandbox_error(fmt::format("sandbox image {} does not exist, run --build-images first", spec.image));

    give_to_user(spec.scratch_dir, run_user, run_group);

    auto args = build_arguments(spec);
    chrono::seconds timeout(spec.wall_time_seconds + SANDBOX_GRACE_TIME);

    // 超时的时候 call_process_timeout 会杀死 runguard 并抛出 timeout_error，
    // runguard 收到 SIGTERM 时会杀死 cgroup 内的所有进程
    int ret = call_process_timeout(timeout, runguard, args);

    auto metadata = read_runguard_result(spec.context_dir / "program.meta");
    if (!metadata.internal_error.empty())
        throw sandbox_error("runguard: " + metadata.internal_error);
    if (metadata.exitcode < 0)
        throw sandbox_error(fmt::format("runguard exited with {} without reporting the result", ret));

    sandbox_outcome outcome;
    outcome.exit_code = metadata.exitcode;
    outcome.signal = metadata.signal;
    outcome.stdout_data = read_file_content(spec.context_dir / "program.out", "");
    outcome.stderr_data = read_file_content(spec.context_dir / "program.err", "");
    outcome.peak_memory_bytes = max<int64_t>(metadata.memory, 0);
    outcome.wall_time_seconds = max(metadata.wall_time, 0.0);
    outcome.cpu_time_seconds = max(metadata.cpu_time, 0.0);
    outcome.time_limit_exceeded = !metadata.time_result.empty();
    outcome.out_of_memory = metadata.memory_result == "oom";
    outcome.output_truncated = metadata.output_truncated;
    return outcome;
}

void runguard_sandbox::build_image(const string &image, const string &lang) {
    filesystem::path script = exec_dir / "build_image.sh";
    if (!filesystem::exists(script))
        throw internal_error(fmt::format("image build script {} does not exist", script.string()));

    LOG(INFO) << "Building sandbox image " << image << " for " << lang;
    // build_image.sh <image-dir> <language>
    int ret = call_process_timeout(chrono::hours(1), script, image_dir / image, lang);
    if (ret != 0)
        throw internal_error(fmt::format("build_image.sh exited with {} while building {}", ret, image));
}

size_t runguard_sandbox::cleanup_orphans() {
    filesystem::create_directories(run_dir);
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    filesystem::path metafile = run_dir / ("cleanup-" + uuid + ".meta");
    defer { filesystem::remove(metafile); };

    int ret = call_process_timeout(chrono::minutes(1), runguard, "--cleanup", "--out-meta", metafile);
    auto metadata = read_runguard_result(metafile);
    if (!metadata.internal_error.empty())
        throw sandbox_error("runguard: " + metadata.internal_error);
    if (ret != 0)
        throw sandbox_error(fmt::format("runguard --cleanup exited with {}", ret));
    return metadata.removed_cgroups;
}

}  // namespace codejudge
