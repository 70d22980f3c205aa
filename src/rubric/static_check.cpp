#include "rubric/static_check.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <regex>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// 超过该大小的文件不做模式匹配
static const uintmax_t MAX_SCANNED_FILE_SIZE = 1 << 20;

set<string> parse_env_template(const string &content) {
    static const regex variable_matcher(R"(^\s*(export\s+)?([A-Za-z_][A-Za-z0-9_]*)\s*=)");
    set<string> variables;
    istringstream stream(content);
    string line;
    while (getline(stream, line)) {
        smatch matches;
        if (regex_search(line, matches, variable_matcher))
            variables.insert(matches[2].str());
    }
    return variables;
}

static bool snapshot_contains(const fs::path &snapshot, const string &path) {
    return fs::exists(snapshot / assert_safe_path(path));
}

/**
 * @brief 检查环境变量模板
 * @return 得分比例，模板不存在时为 0
 */
static double check_env_template(const workspace &ws, const static_rule &rule, string &detail) {
    for (auto &path : rule.paths) {
        fs::path file = ws.snapshot / assert_safe_path(path);
        if (!fs::is_regular_file(file)) continue;

        if (rule.variables.empty()) {
            detail = path + " found";
            return 1;
        }

        set<string> declared = parse_env_template(read_file_content(file));
        vector<string> missing;
        for (auto &variable : rule.variables)
            if (!declared.count(variable)) missing.push_back(variable);

        detail = fmt::format("{} declares {}/{} variables", path, rule.variables.size() - missing.size(), rule.variables.size());
        if (!missing.empty()) detail += ", missing " + boost::algorithm::join(missing, ", ");
        return (double)(rule.variables.size() - missing.size()) / rule.variables.size();
    }
    detail = "no environment template found";
    return 0;
}

static bool has_extension(const fs::path &file, const vector<string> &extensions) {
    if (extensions.empty()) return true;
    string ext = file.extension().string();
    return find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

/**
 * @brief 在源代码中搜索模式
 * @return 第一个匹配的文件相对于快照的路径，找不到时返回空
 */
static optional<string> search_pattern(const fs::path &snapshot, const static_rule &rule) {
    auto flags = regex::ECMAScript;
    if (rule.ignore_case) flags |= regex::icase;
    regex pattern(rule.pattern, flags);

    auto it = fs::recursive_directory_iterator(snapshot, fs::directory_options::skip_permission_denied);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const fs::path &path = it->path();
        if (it->is_directory()) {
            string name = path.filename().string();
            if (find(rule.excluded_directories.begin(), rule.excluded_directories.end(), name) != rule.excluded_directories.end())
                it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file() || !has_extension(path, rule.extensions)) continue;
        if (it->file_size() > MAX_SCANNED_FILE_SIZE) continue;

        if (regex_search(read_file_content(path, ""), pattern))
            return fs::relative(path, snapshot).string();
    }
    return nullopt;
}

criterion_kind static_check_evaluator::kind() const {
    return criterion_kind::STATIC_CHECK;
}

score_entry static_check_evaluator::evaluate(const evaluation_context &ctx, const rubric_criterion &criterion) const {
    auto &spec = get<static_check_spec>(criterion.detail);
    const fs::path &snapshot = ctx.ws.snapshot;

    double earned = 0, total = 0;
    vector<string> details;
    for (auto &rule : spec.rules) {
        ctx.token.throw_if_cancelled();

        double ratio = 0;
        string detail;
        switch (rule.kind) {
            case static_rule_kind::FILE_EXISTS: {
                auto found = find_if(rule.paths.begin(), rule.paths.end(), [&](const string &path) {
                    return snapshot_contains(snapshot, path);
                });
                ratio = found != rule.paths.end() ? 1 : 0;
                detail = found != rule.paths.end() ? *found + " found" : "missing " + boost::algorithm::join(rule.paths, " or ");
                break;
            }
            case static_rule_kind::ENV_TEMPLATE:
                ratio = check_env_template(ctx.ws, rule, detail);
                break;
            case static_rule_kind::SOURCE_PATTERN: {
                optional<string> match;
                try {
                    match = search_pattern(snapshot, rule);
                } catch (fs::filesystem_error &e) {
                    throw criterion_evaluation_error(fmt::format("unable to scan source code: {}", e.what()));
                }
                ratio = match ? 1 : 0;
                detail = match ? "found in " + *match : "not found";
                break;
            }
            case static_rule_kind::ENTRY_POINT:
                ratio = !ctx.ws.entry_point.empty() && fs::is_regular_file(snapshot / ctx.ws.entry_point) ? 1 : 0;
                detail = ratio > 0 ? fmt::format("{} entry point {}", ctx.ws.language.name, ctx.ws.entry_point) : "no entry point";
                break;
        }

        earned += ratio * rule.points;
        total += rule.points;
        details.push_back(fmt::format("{}: {} ({:.1f}/{:.1f})", rule.description, detail, ratio * rule.points, rule.points));
    }

    score_entry entry;
    entry.raw_score = total > 0 ? criterion.max_score * earned / total : 0;
    entry.rationale = fmt::format("{:.1f}/{:.1f} points", earned, total);
    entry.log = boost::algorithm::join(details, "\n");
    return entry;
}

}  // namespace grader
