#include "common/utils.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include <thread>
#include "common/exceptions.hpp"
using namespace std;

static const chrono::milliseconds poll_interval(10);
static const chrono::milliseconds kill_delay(500);

static int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else
        return -1;
}

int exec_program(const map<string, string> &env, const vector<string> &args, chrono::milliseconds timeout) {
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            // 独立的进程组，超时的时候可以一次杀死整个进程组
            setpgid(0, 0);
            for (auto &[key, value] : env)
                set_env(key, value);
            execvp(argv[0], argv.data());
            _exit(EXIT_FAILURE);
        default:  // 父进程
            break;
    }

    int status = 0;
    if (timeout <= chrono::milliseconds::zero()) {
        if (waitpid(pid, &status, 0) < 0)
            throw system_error(errno, system_category(), "waiting on " + args[0]);
        return decode_status(status);
    }

    auto deadline = chrono::steady_clock::now() + timeout;
    while (chrono::steady_clock::now() < deadline) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) return decode_status(status);
        if (ret < 0 && errno != EINTR)
            throw system_error(errno, system_category(), "waiting on " + args[0]);
        this_thread::sleep_for(poll_interval);
    }

    // First try to kill graciously so that runguard is able to clean up
    // its control group, then hard.
    LOG(WARNING) << args[0] << " did not finish in " << timeout.count() << "ms, terminating";
    kill(-pid, SIGTERM);
    auto kill_deadline = chrono::steady_clock::now() + kill_delay;
    while (chrono::steady_clock::now() < kill_deadline) {
        if (waitpid(pid, &status, WNOHANG) == pid)
            throw codejudge::timeout_error(fmt::format("{} terminated after {}ms", args[0], timeout.count()));
        this_thread::sleep_for(poll_interval);
    }
    kill(-pid, SIGKILL);
    waitpid(pid, &status, 0);
    throw codejudge::timeout_error(fmt::format("{} killed after {}ms", args[0], timeout.count()));
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
