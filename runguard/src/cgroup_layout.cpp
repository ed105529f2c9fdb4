#include "cgroup_layout.hpp"
#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>
#include <limits>

using namespace std;

string context_cgroup_name(pid_t owner, time_t created) {
    return fmt::format("{}/ctx_{}_{}", CGROUP_PARENT, owner, static_cast<long long>(created));
}

bool parse_context_cgroup_name(const string &leaf, pid_t &owner) {
    static const boost::regex matcher("ctx_([0-9]{1,9})_([0-9]+)");

    boost::smatch matches;
    if (!boost::regex_match(leaf, matches, matcher))
        return false;
    owner = boost::lexical_cast<pid_t>(matches[1].str());
    return true;
}

vector<string> context_controllers(const runguard_options &opt) {
    vector<string> controllers;
    for (auto &controller : CONTEXT_CONTROLLERS)
        if (controller != "cpuset" || !opt.cpuset.empty())
            controllers.push_back(controller);
    return controllers;
}

vector<cgroup_setting> context_cgroup_settings(const runguard_options &opt) {
    vector<cgroup_setting> settings;

    // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换，-1 表示不限制
    string memory_limit = to_string(opt.memory_limit < 0 ? -1 : opt.memory_limit);
    settings.push_back({"memory", "memory.limit_in_bytes", memory_limit});
    settings.push_back({"memory", "memory.memsw.limit_in_bytes", memory_limit});

    // pids.max 同时计算进程和线程
    bool unlimited = opt.nproc == 0 || opt.nproc == numeric_limits<size_t>::max();
    settings.push_back({"pids", "pids.max", unlimited ? "max" : to_string(opt.nproc)});

    if (!opt.cpuset.empty()) {
        // TODO: cpuset.mems 需要被设置为对应的 NUMA 以避免跨 NUMA 导致内存访问慢
        settings.push_back({"cpuset", "cpuset.mems", "0"});
        settings.push_back({"cpuset", "cpuset.cpus", opt.cpuset});
    }
    return settings;
}

string cgroup_directory(const string &controller, const string &cgroup_name) {
    return CGROUP_MOUNT_ROOT + "/" + controller + cgroup_name;
}

bool read_oom_kill(istream &oom_control) {
    string key;
    long long value;
    while (oom_control >> key >> value)
        if (key == "oom_kill") return value > 0;
    return false;
}
