#include "limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <math.h>
#include <sched.h>
#include <string.h>
#include <sys/resource.h>
#include <unistd.h>
#include <system_error>

using namespace std;

void isolate_namespaces(const struct runguard_options &opt) {
    /*
     * unshare 函数可以用来进行进程隔离。通常情况下，POSIX 系统的 fork 或 clone 函数
     * 在产生子进程时会共享父进程的资源。
     *
     * CLONE_NEWIPC：隔离 IPC 命名空间，受控程序无法与评测系统进行进程间通信
     * CLONE_NEWNET：隔离网络命名空间，受控程序无法访问主机网络（拉取代码时需要网络，不隔离）
     * CLONE_NEWNS：隔离挂载命名空间
     * CLONE_NEWUTS：隔离 hostname 和 NIS，避免利用 NIS 来进行通信
     * CLONE_SYSVSEM：不与评测系统共享 System V 信号量
     */
    int flags = CLONE_NEWIPC | CLONE_NEWNS | CLONE_NEWUTS | CLONE_SYSVSEM;
    if (!opt.share_network) flags |= CLONE_NEWNET;

    if (unshare(flags) != 0) {
        LOG(WARNING) << "namespace isolation unavailable: " << strerror(errno);
    }
}

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void set_restrictions(const struct runguard_options &opt) {
    string path = getenv("PATH") ? getenv("PATH") : "/usr/local/bin:/usr/bin:/bin";
    if (clearenv() != 0)
        throw runtime_error("unable to clear environment");
    setenv("PATH", path.c_str(), true);

    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos) continue;
        setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    if (opt.memory_limit > 0) {
        set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit);
    }

    if (opt.nproc != numeric_limits<size_t>::max()) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
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
        if (geteuid() == 0 || getuid() == 0)
            throw runtime_error("you cannot run user command as root");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
    }
}
