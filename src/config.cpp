#include "config.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

vector<language_profile> default_language_profiles() {
    return {
        {"nodejs", {"package.json"}, {"main.js", "index.js", "app.js", "server.js"}, {"npm", "install"}, {"node", "${entry_point}"}},
        {"python", {"requirements.txt"}, {"main.py", "app.py", "server.py"}, {"pip", "install", "-r", "requirements.txt"}, {"python3", "${entry_point}"}},
        {"golang", {"go.mod"}, {"main.go"}, {"go", "mod", "download"}, {"go", "run", "${entry_point}"}},
        {"dart", {"pubspec.yaml"}, {"main.dart", "bin/main.dart"}, {"dart", "pub", "get"}, {"dart", "run", "${entry_point}"}}};
}

vector<grade_threshold> default_grade_thresholds() {
    return {{90, "A"}, {80, "B"}, {70, "C"}, {60, "D"}, {0, "F"}};
}

void from_json(const json &j, language_profile &profile) {
    j.at("name").get_to(profile.name);
    j.at("dependency_files").get_to(profile.dependency_files);
    j.at("entry_points").get_to(profile.entry_points);
    profile.install_command = get_value_def(j, vector<string>(), "install_command");
    profile.run_command = get_value_def(j, vector<string>(), "run_command");
}

void from_json(const json &j, grade_threshold &threshold) {
    if (j.is_array()) {
        if (j.size() != 2)
            throw configuration_error("grade threshold should be a pair [score, letter]: " + j.dump());
        j.at(0).get_to(threshold.score);
        j.at(1).get_to(threshold.letter);
    } else {
        j.at("score").get_to(threshold.score);
        j.at("grade").get_to(threshold.letter);
    }
}

void from_json(const json &j, grader_config &config) {
    config.sandbox_timeout_seconds = get_value_def(j, 60.0, "sandbox_timeout_seconds");
    config.sandbox_cpu_time_seconds = get_value_def(j, 0.0, "sandbox_cpu_time_seconds");
    config.sandbox_memory_limit = get_value_def(j, (size_t)2097152, "sandbox_memory_limit");
    config.sandbox_output_limit = get_value_def(j, (size_t)65536, "sandbox_output_limit");
    config.sandbox_process_limit = get_value_def(j, (size_t)256, "sandbox_process_limit");
    config.sandbox_network = get_value_def(j, false, "sandbox_network");
    config.max_concurrency = get_value_def(j, (size_t)4, "max_concurrency");
    config.acquisition_timeout_seconds = get_value_def(j, 60.0, "acquisition_timeout_seconds");
    config.batch_deadline_seconds = get_value_def(j, 0.0, "batch_deadline_seconds");
    config.parallel_criteria = get_value_def(j, false, "parallel_criteria");

    if (j.count("run_dir"))
        config.run_dir = j.at("run_dir").get<string>();
    else
        config.run_dir = get_env("RUNDIR", (fs::temp_directory_path() / "rag-grader").string());

    if (j.count("runguard"))
        config.runguard = j.at("runguard").get<string>();
    else
        config.runguard = get_env("RUNGUARD", "");

    config.git = get_value_def(j, string("git"), "git");
    config.run_user = get_value_def(j, get_env("RUNUSER", ""), "run_user");
    config.run_group = get_value_def(j, get_env("RUNGROUP", ""), "run_group");
    config.environment = get_value_def(j, map<string, string>(), "environment");
    config.write_env_file = get_value_def(j, false, "write_env_file");
    config.report_excerpt_bytes = get_value_def(j, (size_t)4096, "report_excerpt_bytes");
    config.keep_workspace = get_value_def(j, false, "keep_workspace");

    if (j.count("languages"))
        j.at("languages").get_to(config.languages);
    else
        config.languages = default_language_profiles();

    j.at("rubric").get_to(config.rubric);

    if (j.count("grade_thresholds"))
        j.at("grade_thresholds").get_to(config.grade_thresholds);
    else
        config.grade_thresholds = default_grade_thresholds();

    if (config.sandbox_timeout_seconds <= 0)
        throw configuration_error("sandbox_timeout_seconds must be positive");
    if (config.acquisition_timeout_seconds <= 0)
        throw configuration_error("acquisition_timeout_seconds must be positive");
    if (config.max_concurrency == 0)
        throw configuration_error("max_concurrency must be positive");
    if (config.languages.empty())
        throw configuration_error("at least one language profile is required");
}

/**
 * @brief 将评分项 fixtures 中的相对路径转换为相对于配置文件目录的绝对路径
 */
static void resolve_fixture_paths(json &j, const fs::path &base_dir) {
    if (!j.count("rubric") || !j.at("rubric").is_array()) return;
    for (auto &criterion : j.at("rubric")) {
        if (!criterion.is_object() || !criterion.count("fixtures")) continue;
        for (auto &[name, value] : criterion.at("fixtures").items()) {
            if (!value.is_string()) continue;
            fs::path path = value.get<string>();
            if (path.is_relative()) value = (base_dir / path).lexically_normal().string();
        }
    }
}

grader_config load_config(const fs::path &path) {
    if (!fs::is_regular_file(path))
        throw configuration_error(fmt::format("configuration file {} does not exist", path));

    try {
        json j = json::parse(read_file_content(path));
        resolve_fixture_paths(j, fs::absolute(path).parent_path());
        grader_config config = j.get<grader_config>();
        LOG(INFO) << "Loaded configuration " << path << " with " << config.rubric.size() << " criteria";
        return config;
    } catch (json::exception &e) {
        throw configuration_error(fmt::format("configuration file {} is malformed: {}", path, e.what()));
    } catch (invalid_argument &e) {
        throw configuration_error(fmt::format("configuration file {} is malformed: {}", path, e.what()));
    }
}

}  // namespace grader
