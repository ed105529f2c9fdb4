#include "limits.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <grp.h>
#include <math.h>
#include <sys/resource.h>
#include <unistd.h>
#include <system_error>
#include "mount.hpp"

using namespace std;

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void set_restrictions(const runguard_options &opt, const context_cgroup &cg) {
    if (!opt.preserve_sys_env) {
        char *path = getenv("PATH");
        string saved_path = path ? path : "";
        clearenv();
        if (!saved_path.empty()) setenv("PATH", saved_path.c_str(), true);
    }

    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos)
            throw invalid_argument(fmt::format("malformed environment variable {}", entry));
        setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        // 到达软限制时内核发送 SIGXCPU，再过一秒发送 SIGKILL，
        // 选手程序被 SIGXCPU 终止即说明超出了 CPU 时间
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // 地址空间不限制，JVM 等运行时会预留远大于实际使用的虚拟内存
    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);
    set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY);

    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nofile > 0) set_rlimit(RLIMIT_NOFILE, opt.nofile, opt.nofile);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // 内存、进程数由 cgroup 限制
    cg.attach();

    // 独立的会话与进程组，超时时 runguard 先向整个进程组发送 SIGTERM
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    if (!opt.chroot_dir.empty()) {
        setup_mounts(opt);

        if (chroot(opt.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", opt.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");

        if (!opt.work_dir.empty()) {
            if (chdir(opt.work_dir.c_str()) != 0)
                throw system_error(errno, generic_category(), "unable to chdir to workdir in chroot");
        }

        LOG(INFO) << "chrooted to directory " << opt.chroot_dir;
    }

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[1];
        aux_groups[0] = opt.group_id;
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
    }

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("you cannot run user command as root");
}
