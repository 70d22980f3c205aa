#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>
#include <system_error>

namespace grader {
using namespace std;

pid_t spawn_program(const vector<string> &args, const filesystem::path &output_file) {
    // fork 之后子进程只能调用异步信号安全的函数，因此 argv 必须提前准备好
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    int fd = open(output_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open " + output_file.string());

    pid_t pid;
    switch (pid = fork()) {
        case -1: {  // fork 失败
            int err = errno;
            close(fd);
            throw system_error(err, system_category(), "unable to fork");
        }
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            dup2(fd, STDOUT_FILENO);
            dup2(fd, STDERR_FILENO);
            execvp(argv[0], argv.data());
            _exit(127);
        default:  // 父进程
            close(fd);
            return pid;
    }
}

optional<int> try_wait_program(pid_t pid) {
    int status;
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == 0) return {};
    if (ret < 0)
        throw system_error(errno, system_category(), "waiting on child " + to_string(pid));
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    else
        return -1;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_uuid() {
    // boost::uuids::random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::uuids::to_string(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return chrono::duration<double>(chrono::steady_clock::now() - start).count();
}

}  // namespace grader
