#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <pwd.h>
#include <signal.h>
#include <unistd.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/split.hpp>
#include <algorithm>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "runguard.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// runguard 超出时钟时间限制后仍未退出时，等待多久再强制结束 runguard
static const double WATCHDOG_GRACE_SECONDS = 5;
static const double WATCHDOG_KILL_SECONDS = 2;
static const auto POLL_INTERVAL = chrono::milliseconds(10);

static const char *TRUNCATION_MARKER = "\n[output truncated]";

bool execution_outcome::timed_out() const {
    return timeout || cpu_limit_exceeded;
}

bool execution_outcome::succeeded() const {
    return exit_status == 0 && !timed_out() && !cancelled;
}

sandbox::sandbox(shared_ptr<const grader_config> config) : config(move(config)) {}

execution_limits sandbox::default_limits(double timeout_seconds) const {
    execution_limits limits;
    limits.wall_time = timeout_seconds > 0 ? timeout_seconds : config->sandbox_timeout_seconds;
    limits.cpu_time = config->sandbox_cpu_time_seconds > 0 ? config->sandbox_cpu_time_seconds : limits.wall_time;
    limits.memory = config->sandbox_memory_limit;
    limits.output = config->sandbox_output_limit;
    limits.nproc = config->sandbox_process_limit;
    limits.network = config->sandbox_network;
    return limits;
}

vector<string> expand_command(const vector<string> &command, const map<string, string> &variables, const language_profile &profile) {
    auto expand = [&](string arg) {
        for (auto &[key, value] : variables)
            boost::replace_all(arg, "${" + key + "}", value);
        return arg;
    };

    vector<string> result;
    for (auto &arg : command) {
        if (arg == "${install_command}") {
            for (auto &sub : profile.install_command) result.push_back(expand(sub));
        } else if (arg == "${run_command}") {
            for (auto &sub : profile.run_command) result.push_back(expand(sub));
        } else {
            result.push_back(expand(arg));
        }
    }
    return result;
}

/**
 * @brief 将文件夹的所有者修改为运行选手程序的用户，使得选手程序可以写入工作目录
 */
static void chown_tree(const fs::path &dir, const string &user, const string &group) {
    struct passwd *pwd = getpwnam(user.c_str());
    if (!pwd) throw sandbox_infrastructure_error("unknown run user " + user);
    gid_t gid = pwd->pw_gid;
    if (!group.empty()) {
        struct group *grp = getgrnam(group.c_str());
        if (!grp) throw sandbox_infrastructure_error("unknown run group " + group);
        gid = grp->gr_gid;
    }

    auto change = [&](const fs::path &path) {
        if (lchown(path.c_str(), pwd->pw_uid, gid) != 0)
            throw system_error(errno, system_category(), "unable to chown " + path.string());
    };
    change(dir);
    for (auto &entry : fs::recursive_directory_iterator(dir))
        change(entry.path());
}

static string read_output(const fs::path &path, const string &stream, const runguard_result &result) {
    string text = read_file_content(path, "");
    vector<string> truncated;
    boost::split(truncated, result.output_truncated, boost::is_any_of(","));
    if (find(truncated.begin(), truncated.end(), stream) != truncated.end())
        text += TRUNCATION_MARKER;
    return text;
}

execution_outcome sandbox::execute(const fs::path &run_dir,
                                   const fs::path &work_dir,
                                   const vector<string> &command,
                                   const execution_limits &limits,
                                   const map<string, string> &environment,
                                   const cancellation_token &token) const {
    if (command.empty())
        throw invalid_argument("sandbox command should not be empty");

    fs::path stdout_file = run_dir / "program.out";
    fs::path stderr_file = run_dir / "program.err";
    fs::path meta_file = run_dir / "program.meta";
    fs::path log_file = run_dir / "runguard.log";

    vector<string> argv;
    to_string_list(argv, config->runguard,
                   "-T", limits.wall_time,
                   "--stream-size", limits.output,
                   "--no-core-dumps",
                   "-i", "/dev/null",
                   "-o", stdout_file,
                   "-e", stderr_file,
                   "-M", meta_file,
                   "-w", work_dir);
    if (limits.cpu_time > 0) to_string_list(argv, "-t", limits.cpu_time);
    if (limits.memory > 0) to_string_list(argv, "-m", limits.memory);
    if (limits.network) argv.push_back("--share-network");
    bool as_run_user = limits.use_run_user && !config->run_user.empty();
    if (as_run_user) to_string_list(argv, "-u", config->run_user);
    if (as_run_user && !config->run_group.empty()) to_string_list(argv, "-g", config->run_group);
    // RLIMIT_NPROC 按真实用户计数，只有切换到专用的运行用户时才能限制单次运行的进程数
    if (as_run_user && limits.nproc > 0) to_string_list(argv, "-p", limits.nproc);
    for (auto &[key, value] : environment) to_string_list(argv, "-V", key + "=" + value);
    argv.push_back("--");
    to_string_list(argv, command);

    DLOG(INFO) << "Sandbox running " << boost::algorithm::join(command, " ") << " in " << work_dir;

    pid_t pid;
    try {
        pid = spawn_program(argv, log_file);
    } catch (system_error &e) {
        throw sandbox_infrastructure_error(fmt::format("unable to start runguard {}: {}", config->runguard, e.what()));
    }

    bool cancelled = false, terminated = false, killed = false;
    elapsed_time timer;
    optional<int> runguard_status;
    while (true) {
        try {
            runguard_status = try_wait_program(pid);
        } catch (system_error &e) {
            throw sandbox_infrastructure_error(fmt::format("unable to wait for runguard: {}", e.what()));
        }
        if (runguard_status) break;

        double elapsed = timer.seconds();
        if (!cancelled && token.cancelled()) {
            // runguard 收到 SIGTERM 后会杀死整个进程树并写入 meta 文件
            cancelled = true;
            LOG(INFO) << "Sandbox cancelled, terminating " << command[0];
            kill(pid, SIGTERM);
        }
        if (!terminated && elapsed > limits.wall_time + WATCHDOG_GRACE_SECONDS) {
            terminated = true;
            LOG(WARNING) << "runguard did not stop after wall time limit, sending SIGTERM";
            kill(pid, SIGTERM);
        }
        if (!killed && elapsed > limits.wall_time + WATCHDOG_GRACE_SECONDS + WATCHDOG_KILL_SECONDS) {
            killed = true;
            LOG(ERROR) << "runguard did not respond to SIGTERM, sending SIGKILL";
            kill(pid, SIGKILL);
        }
        this_thread::sleep_for(POLL_INTERVAL);
    }

    execution_outcome outcome;
    outcome.cancelled = cancelled;

    runguard_result result;
    try {
        result = read_runguard_result(meta_file);
    } catch (runtime_error &e) {
        if (cancelled) {
            // runguard 在安装信号处理函数之前就被终止了
            outcome.wall_time = timer.seconds();
            return outcome;
        }
        throw sandbox_infrastructure_error(fmt::format("runguard exited with {} without results: {}\n{}",
                                                       *runguard_status, e.what(),
                                                       utf8_truncate(read_file_content(log_file, ""), 2048)));
    }

    if (!result.internal_error.empty() && !cancelled) {
        throw sandbox_infrastructure_error("runguard internal error: " + result.internal_error);
    }

    outcome.exit_status = result.exitcode;
    outcome.signal = result.signal;
    outcome.wall_time = result.wall_time;
    outcome.cpu_time = result.cpu_time;
    outcome.memory = result.memory;
    outcome.timeout = result.wall_result == "hard-timelimit";
    outcome.cpu_limit_exceeded = result.cpu_result == "hard-timelimit";
    outcome.truncated = !result.output_truncated.empty();
    outcome.stdout_text = read_output(stdout_file, "stdout", result);
    outcome.stderr_text = read_output(stderr_file, "stderr", result);

    LOG_IF(INFO, outcome.timed_out()) << fmt::format("Sandbox command {} exceeded time limit ({:.3f}s wall, {:.3f}s cpu)",
                                                     command[0], outcome.wall_time, outcome.cpu_time);
    return outcome;
}

execution_outcome sandbox::run(const workspace &ws, const sandbox_request &request, const cancellation_token &token) const {
    fs::path run_dir = ws.root / ("run-" + random_uuid());
    fs::path work_dir = run_dir / "work";
    fs::path fixture_dir = run_dir / "fixture";

    defer {
        if (config->keep_workspace) return;
        error_code ec;
        fs::remove_all(run_dir, ec);
        if (ec) LOG(WARNING) << "Unable to remove run directory " << run_dir << ": " << ec.message();
    };

    map<string, string> variables = {
        {"workspace", work_dir.string()},
        {"fixture", fixture_dir.string()},
        {"entry_point", ws.entry_point},
        {"language", ws.language.name}};

    auto expand = [&](map<string, string> env) {
        for (auto &entry : env)
            for (auto &[key, value] : variables)
                boost::replace_all(entry.second, "${" + key + "}", value);
        return env;
    };

    // 全局环境变量可以被评分项的环境变量覆盖
    map<string, string> global_environment = expand(config->environment);
    map<string, string> environment = global_environment;
    for (auto &[key, value] : expand(request.environment)) environment[key] = value;
    if (!environment.count("HOME")) environment["HOME"] = work_dir.string();

    try {
        fs::create_directories(fixture_dir);
        copy_directory(ws.snapshot, work_dir);
        set_tree_writable(work_dir, true);

        for (auto &fixture : request.fixtures)
            fixture->fetch(fixture_dir);

        if (config->write_env_file) {
            string content;
            for (auto &[key, value] : global_environment)
                content += key + "=" + value + "\n";
            write_file_content(work_dir / ".env", content);
        }

        if (!config->run_user.empty()) {
            chown_tree(work_dir, config->run_user, config->run_group);
            chown_tree(fixture_dir, config->run_user, config->run_group);
        }
    } catch (system_error &e) {
        // filesystem_error 也是 system_error
        throw sandbox_infrastructure_error(fmt::format("unable to prepare run directory {}: {}", run_dir, e.what()));
    }

    return execute(run_dir, work_dir, expand_command(request.command, variables, ws.language), request.limits, environment, token);
}

}  // namespace grader
