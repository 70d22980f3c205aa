#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine.hpp"
using namespace std;

static grader::cancellation_token *batch_token = nullptr;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, cancelling remaining submissions";
    if (batch_token) batch_token->cancel();
}

/**
 * @brief 读取提交列表，每行一个提交引用，忽略空行和 # 开头的注释
 */
static vector<string> read_batch_file(const filesystem::path &path) {
    ifstream fin(path);
    CHECK(fin) << "Batch file " << path << " does not exist";

    vector<string> references;
    string line;
    while (getline(fin, line)) {
        boost::trim(line);
        if (line.empty() || line[0] == '#') continue;
        references.push_back(line);
    }
    return references;
}

static void log_summary(const vector<grader::grading_result> &results) {
    size_t successful = 0;
    double score_sum = 0;
    map<string, size_t> grades;
    for (auto &result : results) {
        if (!result.success) continue;
        ++successful;
        score_sum += result.total_score;
        ++grades[result.grade];
    }

    LOG(INFO) << "Grading summary";
    LOG(INFO) << "  Total submissions: " << results.size();
    LOG(INFO) << "  Successful: " << successful;
    LOG(INFO) << "  Failed: " << results.size() - successful;
    for (auto &[grade, count] : grades)
        LOG(INFO) << "  Grade " << grade << ": " << count;
    if (successful > 0)
        LOG(INFO) << fmt::format("  Average score: {:.1f}", score_sum / successful);
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("rag-grader options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config,c", po::value<string>(), "set the grader configuration file. You can either pass it from environ GRADER_CONFIG")
        ("batch,b", po::value<string>(), "grade all submission references listed in the given file, one per line")
        ("concurrency,j", po::value<size_t>(), "set the number of submissions graded concurrently, default to max_concurrency in configuration")
        ("output,o", po::value<string>()->default_value("reports"), "set the directory to write <grading id>.json reports to")
        ("run-dir", po::value<string>(), "set the directory to store workspaces of submissions. You can either pass it from environ RUNDIR")
        ("run-user", po::value<string>(), "set the user to run submissions as. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set the group to run submissions as. You can either pass it from environ RUNGROUP")
        ("reference", po::value<vector<string>>(), "submission references to grade, git repository urls or local directories")
        ("debug", "turn on the debug mode to keep workspaces of submissions for inspection")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("reference", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "rag-grader: Fetch RAG pipeline submissions, grade them against a rubric" << endl
             << "Optional Environment Variables:" << endl
             << "\tRUNGUARD: location of runguard" << endl
             << "Usage: " << argv[0] << " [options] [reference...]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "rag-grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    filesystem::path config_file;
    if (vm.count("config")) {
        config_file = vm.at("config").as<string>();
    } else if (getenv("GRADER_CONFIG")) {
        config_file = getenv("GRADER_CONFIG");
    } else {
        filesystem::path current(argv[0]);
        config_file = filesystem::weakly_canonical(current).parent_path().parent_path() / "config" / "grader.json";
    }

    vector<string> references;
    if (vm.count("reference")) references = vm.at("reference").as<vector<string>>();
    if (vm.count("batch")) {
        auto listed = read_batch_file(vm.at("batch").as<string>());
        references.insert(references.end(), listed.begin(), listed.end());
    }
    if (references.empty()) {
        cerr << "No submission to grade" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    filesystem::path output_dir = vm.at("output").as<string>();
    filesystem::create_directories(output_dir);

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    unique_ptr<grader::grading_engine> engine;
    try {
        grader::grader_config config = grader::load_config(config_file);
        if (vm.count("run-dir")) config.run_dir = vm.at("run-dir").as<string>();
        if (vm.count("run-user")) config.run_user = vm.at("run-user").as<string>();
        if (vm.count("run-group")) config.run_group = vm.at("run-group").as<string>();
        if (vm.count("debug")) config.keep_workspace = true;
        engine = make_unique<grader::grading_engine>(move(config));
    } catch (grader::grader_exception &e) {
        LOG(ERROR) << "Invalid configuration " << config_file << ": " << e.what();
        return EXIT_FAILURE;
    }
    engine->register_monitor(make_unique<grader::log_monitor>());

    auto token = engine->create_batch_token();
    batch_token = token.get();
    signal(SIGINT, sigintHandler);

    size_t concurrency = vm.count("concurrency") ? vm.at("concurrency").as<size_t>() : 0;
    vector<grader::grading_result> results = engine->grade_batch(references, concurrency, *token);

    signal(SIGINT, SIG_DFL);
    batch_token = nullptr;

    for (auto &result : results) {
        filesystem::path report_file = output_dir / (result.grading_id + ".json");
        try {
            nlohmann::json j = result.payload;
            grader::write_file_content(report_file, j.dump(2));
        } catch (std::system_error &e) {
            LOG(ERROR) << "Unable to write report " << report_file << ": " << e.what();
        } catch (nlohmann::json::exception &e) {
            LOG(ERROR) << "Unable to serialize report " << report_file << ": " << e.what();
        }
    }

    log_summary(results);
    return EXIT_SUCCESS;
}
