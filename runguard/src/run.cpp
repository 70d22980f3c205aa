#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <fstream>
#include <system_error>
#include "limits.hpp"

using namespace std;

static const struct timespec kill_delay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

// pipe() 返回的数组中 0 为读端，1 为写端
static const int READ_END = 0;
static const int WRITE_END = 1;

static const int TIMELIMIT_SOFT = 1;
static const int TIMELIMIT_HARD = 2;
static int wall_result = 0, cpu_result = 0;

static ofstream metafile;
static pid_t child_pid = -1;
static pid_t runguard_pid = -1;
static volatile sig_atomic_t received_SIGCHLD = 0;
static volatile sig_atomic_t received_signal = -1;

/**
 * @brief 子进程两个输出流的状态，下标为 STDOUT_FILENO、STDERR_FILENO
 */
struct output_streams {
    int pipe_fd[3][2];
    int redirect_fd[3] = {-1, STDOUT_FILENO, STDERR_FILENO};
    size_t bytes_read[3] = {0, 0, 0};
    size_t bytes_kept[3] = {0, 0, 0};
};

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

template <typename T>
static void append_meta(const char *key, const T &value) {
    if (!metafile) return;
    metafile << key << ": " << value << endl;
}

static void kill_process_group(int sig) {
    if (child_pid > 0 && kill(-child_pid, sig) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send signal " << sig << " to process group " << child_pid << ": " << strerror(errno);
}

/**
 * @brief runguard 出现未处理的异常时，记录错误并杀死进程树后退出
 */
static void runguard_terminate_handler() {
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGALRM);
    sigaddset(&sigs, SIGTERM);
    sigprocmask(SIG_BLOCK, &sigs, nullptr);

    try {
        if (auto cur = current_exception()) rethrow_exception(cur);
    } catch (const exception &e) {
        LOG(ERROR) << e.what();
        append_meta("internal-error", e.what());
    }

    kill_process_group(SIGKILL);
    nanosleep(&kill_delay, nullptr);
    exit(EXIT_FAILURE);
}

static const char *time_result_string(int limit) {
    if (limit & TIMELIMIT_HARD) return "hard-timelimit";
    if (limit & TIMELIMIT_SOFT) return "soft-timelimit";
    return "";
}

/**
 * @brief SIGTERM（评测系统取消评测）和 SIGALRM（时钟时间超限）的处理函数
 * 先发送 SIGTERM 给整个进程组，稍后再发送 SIGKILL。
 */
static void terminate_child(int sig) {
    if (sig == SIGALRM) {
        wall_result |= TIMELIMIT_HARD;
        LOG(WARNING) << "hard wall time limit exceeded, aborting command";
    } else {
        LOG(WARNING) << "received signal " << sig << ", aborting command";
    }
    received_signal = sig;

    kill_process_group(SIGTERM);
    nanosleep(&kill_delay, nullptr);
    kill_process_group(SIGKILL);
    nanosleep(&kill_delay, nullptr);
}

static void child_handler(int) {
    received_SIGCHLD = true;
}

/**
 * @brief 屏蔽 SIGCHLD，使其只在 pselect 等待期间被递送
 * SIGTERM 和 SIGALRM 也被屏蔽，直到 install_watchdog 安装好处理函数，
 * 否则在 fork 之后、安装处理函数之前收到的 SIGTERM 会直接结束 runguard，留下失去控制的子进程。
 */
static void install_sigchld_handler() {
    sigset_t mask;
    if (sigemptyset(&mask) != 0 || sigaddset(&mask, SIGCHLD) != 0 ||
        sigaddset(&mask, SIGTERM) != 0 || sigaddset(&mask, SIGALRM) != 0)
        error(errno, "setting signal mask");
    if (sigprocmask(SIG_SETMASK, &mask, nullptr) != 0) error(errno, "masking SIGCHLD, SIGTERM and SIGALRM");

    struct sigaction sigact;
    sigact.sa_handler = child_handler;
    sigact.sa_flags = 0;
    sigemptyset(&sigact.sa_mask);
    received_SIGCHLD = 0;
    if (sigaction(SIGCHLD, &sigact, nullptr) != 0) error(errno, "installing SIGCHLD handler");
}

static void install_watchdog(const runguard_options &opt) {
    struct sigaction sigact;
    sigact.sa_handler = terminate_child;
    sigact.sa_flags = SA_RESETHAND | SA_RESTART;
    sigemptyset(&sigact.sa_mask);
    sigaddset(&sigact.sa_mask, SIGALRM);
    sigaddset(&sigact.sa_mask, SIGTERM);

    if (sigaction(SIGTERM, &sigact, nullptr) != 0) error(errno, "installing SIGTERM handler");
    if (!opt.use_wall_limit) return;
    if (sigaction(SIGALRM, &sigact, nullptr) != 0) error(errno, "installing SIGALRM handler");

    double seconds;
    struct itimerval timer = {};
    timer.it_value.tv_usec = (suseconds_t)(modf(opt.wall_limit.hard, &seconds) * 1E6);
    timer.it_value.tv_sec = (time_t)seconds;
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0) error(errno, "setting wall time timer");
    LOG(INFO) << fmt::format("hard wall time limit is {:.3f} seconds", opt.wall_limit.hard);
}

/**
 * @brief 处理函数安装完成后解除 SIGTERM 和 SIGALRM 的屏蔽，之前被挂起的信号会在此时递送
 */
static void unblock_watchdog_signals() {
    sigset_t mask;
    if (sigemptyset(&mask) != 0 || sigaddset(&mask, SIGTERM) != 0 || sigaddset(&mask, SIGALRM) != 0)
        error(errno, "setting signal mask");
    if (sigprocmask(SIG_UNBLOCK, &mask, nullptr) != 0) error(errno, "unmasking SIGTERM and SIGALRM");
}

/**
 * @brief 在子进程中设置限制并执行命令，不会返回
 */
[[noreturn]] static void exec_command(runguard_options &opt, output_streams &streams) {
    if (!opt.stdin_filename.empty() && !freopen(opt.stdin_filename.c_str(), "r", stdin))
        error(errno, "redirecting stdin from {}", opt.stdin_filename);

    signal(SIGCHLD, SIG_DFL);
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    set_restrictions(opt);

    // runguard 被 SIGKILL 杀死时子进程随之结束，切换用户会清除这个设置，因此放在 set_restrictions 之后
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) error(errno, "setting parent death signal");
    if (getppid() != runguard_pid) _exit(EXIT_FAILURE);

    for (int fd : {STDOUT_FILENO, STDERR_FILENO}) {
        if (dup2(streams.pipe_fd[fd][WRITE_END], fd) < 0) error(errno, "redirecting child fd {}", fd);
        if (close(streams.pipe_fd[fd][WRITE_END]) != 0 || close(streams.pipe_fd[fd][READ_END]) != 0)
            error(errno, "closing pipe for fd {}", fd);
    }

    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(arg.data());
    args.push_back(nullptr);
    execvp(args[0], args.data());

    // 命令不存在等情况属于提交本身的错误，与 shell 一样返回 127
    string message = fmt::format("unable to start command {}: {}\n", opt.command[0], strerror(errno));
    [[maybe_unused]] ssize_t written = write(STDERR_FILENO, message.data(), message.size());
    _exit(127);
}

static int open_redirect(const string &filename) {
    int fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (fd < 0) error(errno, "opening file '{}'", filename);
    return fd;
}

/**
 * @brief 关闭管道写端，将读端设为非阻塞，并打开输出文件
 */
static void open_outputs(const runguard_options &opt, output_streams &streams) {
    for (int fd : {STDOUT_FILENO, STDERR_FILENO}) {
        if (close(streams.pipe_fd[fd][WRITE_END]) != 0) error(errno, "closing pipe for fd {}", fd);
        int flags = fcntl(streams.pipe_fd[fd][READ_END], F_GETFL);
        if (flags == -1 || fcntl(streams.pipe_fd[fd][READ_END], F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "setting pipe of fd {} non-blocking", fd);
    }

    if (!opt.stdout_filename.empty())
        streams.redirect_fd[STDOUT_FILENO] = open_redirect(opt.stdout_filename);
    if (!opt.stderr_filename.empty()) {
        streams.redirect_fd[STDERR_FILENO] = opt.stderr_filename == opt.stdout_filename
                                                 ? streams.redirect_fd[STDOUT_FILENO]
                                                 : open_redirect(opt.stderr_filename);
    }
}

static void write_fully(int fd, const char *data, size_t size) {
    while (size > 0) {
        ssize_t written = write(fd, data, size);
        if (written == -1) {
            if (errno == EINTR) continue;
            error(errno, "writing output to fd {}", fd);
        }
        data += written;
        size -= written;
    }
}

/**
 * @brief 将子进程的输出写入重定向文件，超过 stream_size 的部分只计数不保存
 * @return 本次是否读到了数据
 */
static bool pump_pipes(const runguard_options &opt, fd_set *readfds, output_streams &streams) {
    char buf[BUF_SIZE];
    bool progress = false;

    for (int fd : {STDOUT_FILENO, STDERR_FILENO}) {
        int &read_fd = streams.pipe_fd[fd][READ_END];
        if (read_fd == -1 || !FD_ISSET(read_fd, readfds)) continue;

        ssize_t nread = read(read_fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            error(errno, "reading output of fd {}", fd);
        }
        if (nread == 0) {
            if (close(read_fd) != 0) error(errno, "closing pipe for fd {}", fd);
            read_fd = -1;
            continue;
        }

        size_t keep = nread;
        if (opt.stream_size >= 0) {
            size_t remaining = (size_t)opt.stream_size - min((size_t)opt.stream_size, streams.bytes_kept[fd]);
            if (remaining > 0 && remaining < keep) LOG(INFO) << "output limit of fd " << fd << " reached";
            keep = min(keep, remaining);
        }
        if (keep > 0) write_fully(streams.redirect_fd[fd], buf, keep);

        streams.bytes_kept[fd] += keep;
        streams.bytes_read[fd] += nread;
        progress = true;
    }
    return progress;
}

/**
 * @brief 转发子进程输出直到子进程退出
 * @return 子进程的 wait 状态
 */
static int wait_for_child(const runguard_options &opt, output_streams &streams) {
    sigset_t empty;
    if (sigemptyset(&empty) != 0) error(errno, "creating empty signal mask");

    fd_set readfds;
    while (true) {
        FD_ZERO(&readfds);
        int nfds = -1;
        for (int fd : {STDOUT_FILENO, STDERR_FILENO}) {
            if (streams.pipe_fd[fd][READ_END] < 0) continue;
            FD_SET(streams.pipe_fd[fd][READ_END], &readfds);
            nfds = max(nfds, streams.pipe_fd[fd][READ_END]);
        }

        int r = pselect(nfds + 1, &readfds, nullptr, nullptr, nullptr, &empty);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
        if (r == -1) FD_ZERO(&readfds);

        if (received_SIGCHLD || received_signal == SIGALRM) {
            int status;
            pid_t pid = wait(&status);
            if (pid < 0) error(errno, "waiting on child");
            if (pid == child_pid) return status;
        }

        pump_pipes(opt, &readfds, streams);
    }
}

/**
 * @brief 杀死进程组中残留的后台进程，读出管道中剩余的数据并关闭输出文件
 * 后台进程可能持有管道的写端，必须先杀死进程组再读取。
 */
static void drain_outputs(const runguard_options &opt, output_streams &streams) {
    kill_process_group(SIGKILL);

    fd_set readfds;
    for (int fd : {STDOUT_FILENO, STDERR_FILENO}) {
        while (streams.pipe_fd[fd][READ_END] >= 0) {
            FD_ZERO(&readfds);
            FD_SET(streams.pipe_fd[fd][READ_END], &readfds);
            if (!pump_pipes(opt, &readfds, streams)) break;
        }
        if (streams.pipe_fd[fd][READ_END] >= 0) close(streams.pipe_fd[fd][READ_END]);
    }

    int out = streams.redirect_fd[STDOUT_FILENO], err = streams.redirect_fd[STDERR_FILENO];
    if (out != STDOUT_FILENO && close(out) != 0) error(errno, "closing standard output file");
    if (err != STDERR_FILENO && err != out && close(err) != 0) error(errno, "closing standard error file");
}

/**
 * @brief 将 wait 状态转换为退出码，被信号终止时为 128 + 信号编号
 */
static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);

    if (WIFSIGNALED(status)) {
        received_signal = WTERMSIG(status);
        if (received_signal == SIGXCPU) {
            cpu_result |= TIMELIMIT_HARD;
            LOG(WARNING) << "hard cpu time limit exceeded";
        } else {
            LOG(WARNING) << "command terminated with signal " << received_signal << " (" << strsignal(received_signal) << ")";
        }
        return received_signal + 128;
    }

    if (WIFSTOPPED(status)) {
        received_signal = WSTOPSIG(status);
        LOG(WARNING) << "command stopped with signal " << received_signal << " (" << strsignal(received_signal) << ")";
        return received_signal + 128;
    }

    throw runtime_error(fmt::format("unknown wait status {:x}", status));
}

static double seconds(const struct timeval &tv) {
    return tv.tv_sec + tv.tv_usec * 1E-6;
}

static void summarize(const runguard_options &opt, int exitcode, double wall_time, const output_streams &streams) {
    struct rusage usage;
    if (getrusage(RUSAGE_CHILDREN, &usage) != 0) error(errno, "getting resource usage");

    double user_time = seconds(usage.ru_utime), sys_time = seconds(usage.ru_stime);
    double cpu_time = user_time + sys_time;

    // ru_maxrss 的单位为 KB
    append_meta("memory-bytes", (int64_t)usage.ru_maxrss * 1024);
    append_meta("exitcode", exitcode);
    if (received_signal != -1) append_meta("signal", (int)received_signal);
    append_meta("wall-time", fmt::format("{:.3f}", wall_time));
    append_meta("user-time", fmt::format("{:.3f}", user_time));
    append_meta("sys-time", fmt::format("{:.3f}", sys_time));
    append_meta("cpu-time", fmt::format("{:.3f}", cpu_time));
    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}, memory {}kB", wall_time, user_time, sys_time, usage.ru_maxrss);

    if (opt.use_wall_limit && wall_time > opt.wall_limit.soft) wall_result |= TIMELIMIT_SOFT;
    if (opt.use_cpu_limit && cpu_time > opt.cpu_limit.soft) cpu_result |= TIMELIMIT_SOFT;

    append_meta("time-result", time_result_string(wall_result | cpu_result));
    append_meta("wall-result", time_result_string(wall_result));
    append_meta("cpu-result", time_result_string(cpu_result));

    vector<string> truncated;
    if (streams.bytes_kept[STDOUT_FILENO] < streams.bytes_read[STDOUT_FILENO]) truncated.push_back("stdout");
    if (streams.bytes_kept[STDERR_FILENO] < streams.bytes_read[STDERR_FILENO]) truncated.push_back("stderr");
    append_meta("output-truncated", boost::algorithm::join(truncated, ","));
    append_meta("stdout-bytes", streams.bytes_read[STDOUT_FILENO]);
    append_meta("stderr-bytes", streams.bytes_read[STDERR_FILENO]);
}

int runit(struct runguard_options opt) {
    set_terminate(runguard_terminate_handler);
    if (!opt.metafile_path.empty()) metafile.open(opt.metafile_path, ofstream::out);

    output_streams streams;
    for (int fd : {STDOUT_FILENO, STDERR_FILENO})
        if (pipe(streams.pipe_fd[fd]) != 0) error(errno, "creating pipe for fd {}", fd);

    install_sigchld_handler();
    isolate_namespaces(opt);

    runguard_pid = getpid();
    child_pid = fork();
    if (child_pid == -1) error(errno, "unable to fork");
    if (child_pid == 0) exec_command(opt, streams);

    // 不切换运行用户时放弃特权；切换用户时需要保留权限来杀死子进程
    if (opt.user_id < 0 && setuid(getuid()) != 0) error(errno, "setting watchdog uid");

    struct timeval start_time, end_time;
    if (gettimeofday(&start_time, nullptr)) error(errno, "getting time");

    open_outputs(opt, streams);
    install_watchdog(opt);
    unblock_watchdog_signals();
    int status = wait_for_child(opt, streams);

    if (gettimeofday(&end_time, nullptr)) error(errno, "getting time");

    drain_outputs(opt, streams);
    int exitcode = decode_status(status);
    summarize(opt, exitcode, seconds(end_time) - seconds(start_time), streams);
    return exitcode;
}
