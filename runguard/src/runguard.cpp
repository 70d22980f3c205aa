#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <iostream>
#include <limits>
#include "run.hpp"
#include "utils.hpp"

using namespace std;
namespace po = boost::program_options;

/**
 * @brief 解析 "soft[:hard]" 形式的时间限制，省略 hard 时与 soft 相同
 */
void validate(boost::any &v, const vector<string> &values, struct time_limit *, int) {
    po::validators::check_first_occurrence(v);
    const string &s = po::validators::get_single_string(values);

    struct time_limit limit;
    try {
        auto colon = s.find(':');
        limit.soft = boost::lexical_cast<double>(s.substr(0, colon));
        limit.hard = colon == string::npos ? limit.soft : boost::lexical_cast<double>(s.substr(colon + 1));
    } catch (boost::bad_lexical_cast &) {
        throw po::validation_error(po::validation_error::invalid_option_value);
    }

    if (!isfinite(limit.soft) || !isfinite(limit.hard) || limit.soft < 0 || limit.hard < limit.soft)
        throw po::validation_error(po::validation_error::invalid_option_value);
    v = limit;
}

/**
 * @brief 用户名、用户组名或者数字 id
 */
static int resolve_id(const string &name, int (*lookup)(const char *)) {
    return is_number(name) ? boost::lexical_cast<int>(name) : lookup(name.c_str());
}

static runguard_options build_options(const po::variables_map &vm) {
    runguard_options opt;

    if (vm.count("user")) {
        string user = vm["user"].as<string>();
        opt.user_id = resolve_id(user, get_userid);
        // 只指定用户时，用户组默认与用户同名
        opt.group_id = resolve_id(vm.count("group") ? vm["group"].as<string>() : user, get_groupid);
    } else if (vm.count("group")) {
        opt.group_id = resolve_id(vm["group"].as<string>(), get_groupid);
    }

    if (vm.count("wall-time")) {
        opt.use_wall_limit = true;
        opt.wall_limit = vm["wall-time"].as<time_limit>();
    }
    if (vm.count("cpu-time")) {
        opt.use_cpu_limit = true;
        opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    }

    if (vm.count("memory-limit")) {
        int64_t kb = vm["memory-limit"].as<int64_t>();
        if (kb > 0 && kb <= numeric_limits<int64_t>::max() / 1024) opt.memory_limit = kb * 1024;
    }
    if (vm.count("nproc")) opt.nproc = vm["nproc"].as<size_t>();
    if (vm.count("stream-size")) opt.stream_size = vm["stream-size"].as<int64_t>();
    opt.no_core_dumps = vm.count("no-core-dumps") > 0;
    opt.share_network = vm.count("share-network") > 0;

    if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();
    if (vm.count("standard-input-file")) opt.stdin_filename = vm["standard-input-file"].as<string>();
    if (vm.count("standard-output-file")) opt.stdout_filename = vm["standard-output-file"].as<string>();
    if (vm.count("standard-error-file")) opt.stderr_filename = vm["standard-error-file"].as<string>();
    if (vm.count("variable")) opt.env = vm["variable"].as<vector<string>>();
    if (vm.count("out-meta")) opt.metafile_path = vm["out-meta"].as<string>();
    opt.command = vm["cmd"].as<vector<string>>();
    return opt;
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    // runguard 的日志写入 stderr，由评测系统重定向到运行目录中的 runguard.log
    FLAGS_logtostderr = true;

    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("work-dir,w", po::value<string>(), "run command with working directory set to work-dir")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id, defaults to user")
        ("wall-time,T", po::value<time_limit>(), "kill command after soft[:hard] wall clock seconds")
        ("cpu-time,t", po::value<time_limit>(), "limit CPU time of the command to soft[:hard] seconds")
        ("memory-limit,m", po::value<int64_t>(), "limit address space of the command in KB")
        ("nproc,p", po::value<size_t>(), "limit number of processes of the run user")
        ("no-core-dumps", "disable core dumps")
        ("share-network", "do not isolate the network namespace")
        ("standard-input-file,i", po::value<string>(), "redirect standard input from file")
        ("standard-output-file,o", po::value<string>(), "redirect standard output to file")
        ("standard-error-file,e", po::value<string>(), "redirect standard error to file")
        ("stream-size", po::value<int64_t>(), "keep at most this many bytes of each output stream")
        ("variable,V", po::value<vector<string>>(), "environment variable passed to command (e.g. -VPORT=8000)")
        ("out-meta,M", po::value<string>(), "write run time, exit code, memory usage and limit results to file")
        ("cmd", po::value<vector<string>>()->composing()->required(), "command")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        if (vm.count("help")) {
            cout << "Runguard: run a submission command with resource limits and an isolated process tree." << endl
                 << "Usage: " << argv[0] << " [options] -- command [args...]" << endl
                 << desc << endl;
            return 0;
        }
        if (vm.count("version")) {
            cout << "runguard (rag-grader)" << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl
             << desc << endl;
        return 1;
    }

    runguard_options opt;
    try {
        opt = build_options(vm);
    } catch (std::exception &e) {
        LOG(ERROR) << "invalid runguard options: " << e.what();
        return 1;
    }
    return runit(opt);
}
