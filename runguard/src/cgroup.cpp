#include "cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <time.h>
#include <algorithm>
#include <fstream>
#include <system_error>

using namespace std;

static const struct timespec KILL_INTERVAL = {0, 20000000L};  // 20ms
static const int KILL_ROUNDS = 50;

static string describe_cgroup_error(const string &operation, int err) {
    if (err == ECGOTHER)
        return fmt::format("libcgroup: {}: {}", operation, cgroup_strerror(cgroup_get_last_errno()));
    return fmt::format("{}: {}", operation, cgroup_strerror(err));
}

cgroup_error::cgroup_error(const string &operation, int err)
    : runtime_error(describe_cgroup_error(operation, err)) {}

void cgroup_error::check(const string &operation, int err) {
    if (err != 0)
        throw cgroup_error(operation, err);
}

void cgroup_library_init() {
    cgroup_error::check("cgroup_init", cgroup_init());
}

void cgroup_deleter::operator()(struct cgroup *cg) const {
    cgroup_free(&cg);
}

static unique_ptr<struct cgroup, cgroup_deleter> new_cgroup(const string &name) {
    unique_ptr<struct cgroup, cgroup_deleter> cg(cgroup_new_cgroup(name.c_str()));
    if (!cg)
        throw cgroup_error(fmt::format("cgroup_new_cgroup({})", name), cgroup_get_last_errno());
    return cg;
}

static struct cgroup_controller *find_controller(struct cgroup *cg, const string &name) {
    struct cgroup_controller *controller = cgroup_get_controller(cg, name.c_str());
    if (!controller)
        throw cgroup_error(fmt::format("cgroup_get_controller({})", name), ECGROUPNOTEXIST);
    return controller;
}

static string read_first_line(const string &path) {
    ifstream fin(path);
    string line;
    getline(fin, line);
    return line;
}

/**
 * @brief 子 cgroup 的 cpuset.cpus 和 cpuset.mems 必须是父 cgroup 的子集，
 * 因此 CGROUP_PARENT 需要继承根 cgroup 的设置，否则为空
 */
static void prepare_parent_cpuset() {
    auto parent = new_cgroup(CGROUP_PARENT);
    struct cgroup_controller *controller = cgroup_add_controller(parent.get(), "cpuset");
    if (!controller)
        throw cgroup_error("cgroup_add_controller(cpuset)", cgroup_get_last_errno());
    for (const char *key : {"cpuset.mems", "cpuset.cpus"}) {
        string value = read_first_line(cgroup_directory("cpuset", "") + "/" + key);
        cgroup_error::check(fmt::format("cgroup_add_value_string({}, {})", key, value),
                            cgroup_add_value_string(controller, key, value.c_str()));
    }
    cgroup_error::check(fmt::format("cgroup_create_cgroup({})", CGROUP_PARENT), cgroup_create_cgroup(parent.get(), 1));
}

context_cgroup::context_cgroup(string name, const vector<string> &controllers)
    : cgroup_name(move(name)), cg(new_cgroup(cgroup_name)) {
    if (controllers.empty())
        throw invalid_argument("cgroup " + cgroup_name + " has no controllers");
    task_controller = controllers.front();
    for (auto &controller : controllers)
        if (!cgroup_add_controller(cg.get(), controller.c_str()))
            throw cgroup_error(fmt::format("cgroup_add_controller({})", controller), cgroup_get_last_errno());
}

context_cgroup::~context_cgroup() {
    if (!exists) return;
    try {
        kill_tasks();
        remove();
    } catch (exception &e) {
        LOG(ERROR) << "unable to clean up cgroup " << cgroup_name << ": " << e.what();
    }
}

void context_cgroup::create(const vector<cgroup_setting> &settings) {
    bool uses_cpuset = any_of(settings.begin(), settings.end(),
                              [](const cgroup_setting &setting) { return setting.controller == "cpuset"; });
    if (uses_cpuset) prepare_parent_cpuset();

    for (auto &setting : settings) {
        cgroup_error::check(
            fmt::format("cgroup_add_value_string({}, {})", setting.name, setting.value),
            cgroup_add_value_string(find_controller(cg.get(), setting.controller), setting.name.c_str(), setting.value.c_str()));
    }

    cgroup_error::check(fmt::format("cgroup_create_cgroup({})", cgroup_name), cgroup_create_cgroup(cg.get(), 1));
    exists = true;
    LOG(INFO) << "created cgroup " << cgroup_name;
}

void context_cgroup::adopt() {
    auto current = new_cgroup(cgroup_name);
    cgroup_error::check(fmt::format("cgroup_get_cgroup({})", cgroup_name), cgroup_get_cgroup(current.get()));
    exists = true;
}

void context_cgroup::attach() const {
    cgroup_error::check(fmt::format("cgroup_attach_task({})", cgroup_name), cgroup_attach_task(cg.get()));
}

int64_t context_cgroup::read_value(const string &controller, const string &name) const {
    // 只有从内核读入的 cgroup 才带有统计值
    auto current = new_cgroup(cgroup_name);
    cgroup_error::check(fmt::format("cgroup_get_cgroup({})", cgroup_name), cgroup_get_cgroup(current.get()));

    int64_t value;
    cgroup_error::check(fmt::format("cgroup_get_value_int64({})", name),
                        cgroup_get_value_int64(find_controller(current.get(), controller), name.c_str(), &value));
    return value;
}

vector<pid_t> context_cgroup::list_tasks() const {
    vector<pid_t> tasks;
    void *handle = nullptr;
    pid_t pid;
    int ret = cgroup_get_task_begin(cgroup_name.c_str(), task_controller.c_str(), &handle, &pid);
    while (ret == 0) {
        tasks.push_back(pid);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
    if (ret != ECGEOF)
        throw cgroup_error(fmt::format("cgroup_get_task_begin({})", cgroup_name), ret);
    return tasks;
}

size_t context_cgroup::kill_tasks() const {
    size_t killed = 0;
    for (int round = 0; round < KILL_ROUNDS; ++round) {
        auto tasks = list_tasks();
        if (tasks.empty()) return killed;

        for (pid_t pid : tasks) {
            if (kill(pid, SIGKILL) == 0)
                ++killed;
            else if (errno != ESRCH)
                throw system_error(errno, generic_category(), fmt::format("unable to kill {} in {}", pid, cgroup_name));
        }
        nanosleep(&KILL_INTERVAL, nullptr);
    }
    LOG(WARNING) << "processes in " << cgroup_name << " survived SIGKILL";
    return killed;
}

void context_cgroup::remove() {
    cgroup_error::check(
        fmt::format("cgroup_delete_cgroup({})", cgroup_name),
        cgroup_delete_cgroup_ext(cg.get(), CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
    exists = false;
    LOG(INFO) << "deleted cgroup " << cgroup_name;
}
