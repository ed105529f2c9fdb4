#include "report.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <boost/algorithm/string/join.hpp>
#include <stdexcept>

using namespace std;

void context_report::record_exit(int status) {
    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
        return;
    }

    if (WIFSIGNALED(status)) {
        signal = WTERMSIG(status);
        LOG(WARNING) << "command terminated with signal " << signal << " (" << strsignal(signal) << ")";
    } else if (WIFSTOPPED(status)) {
        signal = WSTOPSIG(status);
        LOG(WARNING) << "command stopped with signal " << signal << " (" << strsignal(signal) << ")";
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    exitcode = 128 + signal;
    if (signal == SIGXCPU) {
        cpu_limit |= TIME_LIMIT_HARD;
        LOG(WARNING) << "Time Limit Exceeded (hard cpu time)";
    }
}

void context_report::check_soft_limits(const runguard_options &opt) {
    if (opt.use_wall_limit && wall_time > opt.wall_limit.soft) {
        wall_limit |= TIME_LIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft wall time)";
    }
    if (opt.use_cpu_limit && cpu_time > opt.cpu_limit.soft) {
        cpu_limit |= TIME_LIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }
}

string context_report::time_result() const {
    int flags = wall_limit | cpu_limit;
    if (flags & TIME_LIMIT_HARD) return "hard-timelimit";
    if (flags & TIME_LIMIT_SOFT) return "soft-timelimit";
    return "";
}

void context_report::write(ostream &meta) const {
    meta << "memory-bytes: " << memory_bytes << '\n'
         << "exitcode: " << exitcode << '\n';
    if (signal >= 0)
        meta << "signal: " << signal << '\n';
    meta << fmt::format("wall-time: {:.3f}\n", wall_time)
         << fmt::format("user-time: {:.3f}\n", user_time)
         << fmt::format("sys-time: {:.3f}\n", sys_time)
         << fmt::format("cpu-time: {:.3f}\n", cpu_time)
         << "time-result: " << time_result() << '\n'
         << "memory-result: " << (oom ? "oom" : "") << '\n';
    if (stream_limited)
        meta << "output-truncated: " << boost::algorithm::join(truncated_streams, ",") << '\n';
    meta << "stdout-bytes: " << stdout_bytes << '\n'
         << "stderr-bytes: " << stderr_bytes << endl;
}
