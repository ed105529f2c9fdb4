#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sched.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/times.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <system_error>
#include <vector>
#include "cgroup.hpp"
#include "limits.hpp"
#include "report.hpp"

using namespace std;

static const struct timespec TERM_GRACE = {0, 100000000L};  // 0.1s
static const size_t BUF_SIZE = 4096;

static volatile sig_atomic_t child_exited = 0;
static volatile sig_atomic_t abort_signal = 0;

/**
 * @brief 在 fork 之前打开，子进程 exec 失败时也写入这个文件
 * 父子进程共享文件偏移，子进程写入的 internal-error 不会被覆盖
 */
static ofstream metafile;

[[noreturn]] static void error(int err, const string &what) {
    throw system_error(err, system_category(), what);
}

static void on_child_exit(int) {
    child_exited = 1;
}

static void on_abort(int sig) {
    abort_signal = sig;
}

static void write_all(int fd, const char *data, size_t size) {
    while (size > 0) {
        ssize_t written = write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            error(errno, "writing command output");
        }
        data += written;
        size -= written;
    }
}

/**
 * @brief oom_score_adj 会被子进程继承，为负数时 OOM killer 可能会先杀死沙箱外的进程
 */
static void reset_oom_score_adj() {
    const string path = "/proc/self/oom_score_adj";
    int value = 0;
    {
        ifstream fin(path);
        if (!(fin >> value)) return;
    }
    if (value >= 0) return;

    LOG(INFO) << "resetting " << path << " from " << value << " to 0";
    ofstream fout(path);
    if (!(fout << 0 << endl))
        error(errno, "cannot write to " + path);
}

namespace {

/**
 * @brief 选手程序的一个输出流
 * 从管道读出的数据写入输出文件，超出 limit 之后只读出并丢弃，
 * 这样选手程序不会阻塞在写管道上，而 consumed > written 说明输出被截断了。
 */
struct output_stream {
    const char *name;
    int fd;           // 选手程序中的文件描述符
    int source = -1;  // 管道读端，读到 EOF 之后为 -1
    int sink = -1;    // 管道写端，只在子进程中使用
    int target = -1;
    bool owns_target = false;
    int64_t limit = -1;
    size_t consumed = 0;
    size_t written = 0;

    output_stream(const char *name, int fd) : name(name), fd(fd) {}

    bool open() const { return source >= 0; }

    bool truncated() const { return written < consumed; }

    void pump(bool &use_splice);

    void close_all();
};

void output_stream::pump(bool &use_splice) {
    char buf[BUF_SIZE];
    size_t room = BUF_SIZE;
    if (limit >= 0)
        room = min<size_t>(BUF_SIZE, static_cast<size_t>(limit) - written);

    ssize_t n;
    if (room == 0) {
        n = read(source, buf, BUF_SIZE);
    } else if (use_splice) {
        n = splice(source, nullptr, target, nullptr, room, SPLICE_F_MOVE | SPLICE_F_NONBLOCK);
        if (n < 0 && errno == EINVAL) {
            LOG(WARNING) << "splice failed for " << name << ", switching to read/write";
            use_splice = false;
            return;
        }
        if (n > 0) written += n;
    } else {
        n = read(source, buf, room);
        if (n > 0) {
            write_all(target, buf, n);
            written += n;
        }
    }

    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return;
        error(errno, fmt::format("copying {} of command", name));
    }
    if (n == 0) {
        if (close(source) != 0) error(errno, fmt::format("closing {} pipe", name));
        source = -1;
        return;
    }

    consumed += n;
    if (limit >= 0 && written == static_cast<size_t>(limit) && consumed == written)
        LOG(INFO) << name << " reached the stream size limit, discarding further output";
}

void output_stream::close_all() {
    for (int *end : {&source, &sink}) {
        if (*end >= 0 && close(*end) != 0) PLOG(WARNING) << "closing " << name << " pipe";
        *end = -1;
    }
    if (owns_target && close(target) != 0) PLOG(WARNING) << "closing " << name << " output file";
    target = -1;
    owns_target = false;
}

/**
 * @brief 一个沙箱上下文的监视进程
 * 异常退出时析构函数负责杀死子进程，context_cgroup 负责清理 cgroup 内残留的进程
 */
class supervisor {
public:
    explicit supervisor(const runguard_options &opt)
        : opt(opt), cg(opt.cgroupname, context_controllers(opt)) {}

    ~supervisor();

    int run();

private:
    void setup_signals();
    void isolate();
    void open_outputs();
    [[noreturn]] void run_command();
    void start_wall_timer();
    void monitor();
    void abort_command();
    void finish();

    const runguard_options &opt;
    context_cgroup cg;
    output_stream streams[2] = {{"stdout", STDOUT_FILENO}, {"stderr", STDERR_FILENO}};
    pid_t child = -1;
    bool child_reaped = false;
    bool aborted = false;
    int status = 0;
    sigset_t wait_mask;
    context_report report;
    struct timeval start_time, end_time;
    struct tms start_ticks, end_ticks;
};

supervisor::~supervisor() {
    if (child > 0 && !child_reaped) {
        if (kill(child, SIGKILL) != 0 && errno != ESRCH)
            PLOG(ERROR) << "unable to kill command " << child;
        while (waitpid(child, nullptr, 0) < 0 && errno == EINTR) {}
    }
    for (auto &stream : streams) stream.close_all();
}

int supervisor::run() {
    for (auto &stream : streams) {
        int fds[2];
        if (pipe(fds) != 0) error(errno, fmt::format("creating pipe for {}", stream.name));
        stream.source = fds[0];
        stream.sink = fds[1];
    }

    setup_signals();
    cg.create(context_cgroup_settings(opt));
    isolate();

    child = fork();
    if (child < 0) error(errno, "unable to fork");
    if (child == 0) run_command();

    open_outputs();
    if (gettimeofday(&start_time, nullptr) != 0) error(errno, "getting time");
    if (times(&start_ticks) == (clock_t)-1) error(errno, "getting start clock ticks");
    start_wall_timer();

    monitor();
    finish();
    return report.exitcode;
}

void supervisor::setup_signals() {
    sigset_t blocked;
    if (sigemptyset(&wait_mask) != 0 || sigemptyset(&blocked) != 0)
        error(errno, "creating signal mask");

    // 这些信号只在 pselect 中递送，检查标志和开始等待之间不会丢失信号
    for (int sig : {SIGCHLD, SIGALRM, SIGTERM})
        if (sigaddset(&blocked, sig) != 0) error(errno, "setting signal mask");
    if (sigprocmask(SIG_SETMASK, &blocked, nullptr) != 0)
        error(errno, "blocking signals");

    struct sigaction action {};
    if (sigemptyset(&action.sa_mask) != 0) error(errno, "creating signal mask");
    action.sa_handler = on_child_exit;
    if (sigaction(SIGCHLD, &action, nullptr) != 0)
        error(errno, "installing SIGCHLD handler");
    action.sa_handler = on_abort;
    if (sigaction(SIGALRM, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0)
        error(errno, "installing signal handler");
}

/**
 * CLONE_FILES 使受控程序无法访问调用者打开的文件，CLONE_NEWNET 断开网络，
 * CLONE_NEWNS 使沙箱内的挂载不影响主机，CLONE_NEWIPC、CLONE_NEWUTS、CLONE_SYSVSEM
 * 阻止通过 IPC 或主机名与沙箱外通信。
 */
void supervisor::isolate() {
    if (unshare(CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWNS | CLONE_NEWUTS | CLONE_SYSVSEM) != 0)
        error(errno, "unsharing namespaces");
    reset_oom_score_adj();
}

void supervisor::open_outputs() {
    const string *paths[] = {&opt.stdout_filename, &opt.stderr_filename};
    for (int i = 0; i < 2; ++i) {
        auto &stream = streams[i];
        if (close(stream.sink) != 0) error(errno, fmt::format("closing {} pipe", stream.name));
        stream.sink = -1;
        stream.limit = opt.stream_size;

        const string &path = *paths[i];
        if (path.empty()) {
            stream.target = stream.fd;
        } else if (i == 1 && path == opt.stdout_filename) {
            stream.target = streams[0].target;
        } else {
            stream.target = creat(path.c_str(), S_IRUSR | S_IWUSR);
            if (stream.target < 0) error(errno, fmt::format("opening file '{}'", path));
            stream.owns_target = true;
        }
    }
}

void supervisor::run_command() {
    try {
        // exec 会保留信号屏蔽字
        for (int sig : {SIGCHLD, SIGALRM, SIGTERM})
            if (signal(sig, SIG_DFL) == SIG_ERR) error(errno, "restoring signal handler");
        if (sigprocmask(SIG_SETMASK, &wait_mask, nullptr) != 0)
            error(errno, "unmasking signals");

        if (!opt.stdin_filename.empty() && !freopen(opt.stdin_filename.c_str(), "r", stdin))
            error(errno, fmt::format("opening standard input file '{}'", opt.stdin_filename));

        set_restrictions(opt, cg);

        for (auto &stream : streams) {
            if (dup2(stream.sink, stream.fd) < 0)
                error(errno, fmt::format("redirecting {}", stream.name));
            if (close(stream.sink) != 0 || close(stream.source) != 0)
                error(errno, fmt::format("closing {} pipe", stream.name));
        }

        vector<char *> args;
        for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        error(errno, fmt::format("unable to start command {}", opt.command[0]));
    } catch (exception &e) {
        if (metafile.is_open()) metafile << "internal-error: " << e.what() << endl;
    }
    _exit(EXIT_FAILURE);
}

void supervisor::start_wall_timer() {
    if (!opt.use_wall_limit) return;

    struct itimerval timer {};
    double seconds;
    timer.it_value.tv_usec = static_cast<suseconds_t>(modf(opt.wall_limit.hard, &seconds) * 1E6);
    timer.it_value.tv_sec = static_cast<time_t>(seconds);
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0)
        error(errno, "setting timer");
    LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);
}

void supervisor::monitor() {
    // splice 不支持所有的输出文件，失败后改用 read/write
    bool use_splice = true;
    while (true) {
        fd_set readfds;
        FD_ZERO(&readfds);
        int nfds = 0;
        for (auto &stream : streams) {
            if (!stream.open()) continue;
            FD_SET(stream.source, &readfds);
            nfds = max(nfds, stream.source + 1);
        }

        int ready = pselect(nfds, &readfds, nullptr, nullptr, nullptr, &wait_mask);
        if (ready < 0 && errno != EINTR) error(errno, "waiting for command output");

        if (abort_signal != 0 && !aborted) abort_command();

        if (child_exited) {
            child_exited = 0;
            pid_t pid = waitpid(child, &status, WNOHANG);
            if (pid < 0) error(errno, "waiting on command");
            if (pid == child) {
                child_reaped = true;
                return;
            }
        }

        if (ready > 0) {
            for (auto &stream : streams)
                if (stream.open() && FD_ISSET(stream.source, &readfds)) stream.pump(use_splice);
        }
    }
}

void supervisor::abort_command() {
    aborted = true;
    if (abort_signal == SIGALRM) {
        report.wall_limit |= TIME_LIMIT_HARD;
        LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
    } else {
        LOG(WARNING) << "received signal " << abort_signal << ": aborting command";
    }

    // 先给进程组正常退出的机会，再杀死 cgroup 内的所有进程
    if (kill(-child, SIGTERM) != 0 && errno != ESRCH)
        error(errno, "sending SIGTERM to command");
    nanosleep(&TERM_GRACE, nullptr);
    cg.kill_tasks();
}

void supervisor::finish() {
    if (times(&end_ticks) == (clock_t)-1) error(errno, "getting end clock ticks");
    if (gettimeofday(&end_time, nullptr) != 0) error(errno, "getting time");

    struct itimerval disarm {};
    if (setitimer(ITIMER_REAL, &disarm, nullptr) != 0) error(errno, "clearing timer");

    report.record_exit(status);
    {
        ifstream oom_control(cgroup_directory("memory", cg.name()) + "/memory.oom_control");
        report.oom = read_oom_kill(oom_control);
    }

    // 后台进程可能还持有输出管道，杀死它们之后才能读到 EOF
    size_t leftovers = cg.kill_tasks();
    if (leftovers > 0)
        LOG(INFO) << "killed " << leftovers << " processes left behind by the command";

    bool use_splice = false;
    for (auto &stream : streams)
        while (stream.open()) stream.pump(use_splice);
    for (auto &stream : streams) {
        if (stream.owns_target && close(stream.target) != 0)
            error(errno, fmt::format("closing {} output file", stream.name));
        stream.target = -1;
        stream.owns_target = false;
    }

    report.memory_bytes = cg.read_value("memory", "memory.memsw.max_usage_in_bytes");
    report.cpu_time = static_cast<double>(cg.read_value("cpuacct", "cpuacct.usage")) / 1e9;
    cg.remove();

    long ticks = sysconf(_SC_CLK_TCK);
    report.wall_time = (end_time.tv_sec - start_time.tv_sec) + (end_time.tv_usec - start_time.tv_usec) * 1E-6;
    report.user_time = static_cast<double>(end_ticks.tms_cutime - start_ticks.tms_cutime) / ticks;
    report.sys_time = static_cast<double>(end_ticks.tms_cstime - start_ticks.tms_cstime) / ticks;
    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}, cpu {:.3f}; memory {}kB",
                             report.wall_time, report.user_time, report.sys_time, report.cpu_time,
                             report.memory_bytes / 1024);
    report.check_soft_limits(opt);

    report.stream_limited = opt.stream_size >= 0;
    for (auto &stream : streams)
        if (stream.truncated()) report.truncated_streams.push_back(stream.name);
    report.stdout_bytes = streams[0].consumed;
    report.stderr_bytes = streams[1].consumed;

    if (metafile.is_open()) report.write(metafile);
}

}  // namespace

int runit(runguard_options opt) {
    if (!opt.metafile_path.empty()) {
        metafile.open(opt.metafile_path, ofstream::out | ofstream::trunc);
        if (!metafile) PLOG(ERROR) << "unable to open meta file " << opt.metafile_path;
    }
    opt.cgroupname = context_cgroup_name(getpid(), time(nullptr));

    try {
        cgroup_library_init();
        supervisor context(opt);
        return context.run();
    } catch (exception &e) {
        LOG(ERROR) << e.what();
        if (metafile.is_open()) metafile << "internal-error: " << e.what() << endl;
        return EXIT_FAILURE;
    }
}
