#include "rubric/criterion.hpp"
#include <fmt/core.h>
#include <boost/assign.hpp>
#include <regex>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<criterion_kind, const char *> criterion_kind_string = boost::assign::map_list_of
    (criterion_kind::FUNCTIONAL_TEST, "functional_test")
    (criterion_kind::RETRIEVAL_METRIC, "retrieval_metric")
    (criterion_kind::STATIC_CHECK, "static_check");

static const unordered_map<retrieval_metric, const char *> retrieval_metric_string = boost::assign::map_list_of
    (retrieval_metric::PRECISION_AT_K, "precision_at_k")
    (retrieval_metric::RECALL_AT_K, "recall_at_k")
    (retrieval_metric::MRR, "mrr")
    (retrieval_metric::KEYWORD_RELEVANCE, "keyword_relevance");

static const unordered_map<static_rule_kind, const char *> static_rule_kind_string = boost::assign::map_list_of
    (static_rule_kind::FILE_EXISTS, "file_exists")
    (static_rule_kind::ENV_TEMPLATE, "env_template")
    (static_rule_kind::SOURCE_PATTERN, "source_pattern")
    (static_rule_kind::ENTRY_POINT, "entry_point");
// clang-format on

const char *get_display_message(criterion_kind kind) {
    return criterion_kind_string.at(kind);
}

const char *get_display_message(retrieval_metric metric) {
    return retrieval_metric_string.at(metric);
}

template <typename EnumT>
static EnumT parse_enum(const unordered_map<EnumT, const char *> &table, const string &name, const char *what) {
    for (auto &[value, display] : table)
        if (name == display) return value;
    throw configuration_error(fmt::format("unknown {} '{}'", what, name));
}

criterion_kind rubric_criterion::kind() const {
    return static_cast<criterion_kind>(detail.index());
}

static vector<asset_ptr> read_fixtures(const json &j) {
    vector<asset_ptr> fixtures;
    if (!exists(j, "fixtures")) return fixtures;
    for (auto &[name, path] : j.at("fixtures").items())
        fixtures.push_back(make_shared<local_asset>(name, path.get<string>()));
    return fixtures;
}

static vector<string> read_command(const json &j, const string &id) {
    auto command = get_value<vector<string>>(j, "command");
    if (command.empty())
        throw configuration_error(fmt::format("criterion {} has an empty command", id));
    return command;
}

void from_json(const json &j, retrieval_query &query) {
    j.at("question").get_to(query.question);
    query.id = get_value_def(j, query.question, "id");
    query.relevant_documents = get_value_def(j, vector<string>(), "relevant_documents");
    query.expected_keywords = get_value_def(j, vector<string>(), "expected_keywords");
}

void from_json(const json &j, static_rule &rule) {
    rule.kind = parse_enum(static_rule_kind_string, j.at("type").get<string>(), "static rule type");
    rule.description = get_value_def(j, string(static_rule_kind_string.at(rule.kind)), "description");
    rule.points = get_value_def(j, 1.0, "points");
    rule.paths = get_value_def(j, vector<string>(), "paths");
    rule.variables = get_value_def(j, vector<string>(), "variables");
    rule.pattern = get_value_def(j, string(), "pattern");
    rule.extensions = get_value_def(j, vector<string>(), "extensions");
    rule.excluded_directories = get_value_def(j, vector<string>{"node_modules", "venv", ".venv", "__pycache__", ".git"}, "excluded_directories");
    rule.ignore_case = get_value_def(j, false, "ignore_case");

    if (rule.points < 0)
        throw configuration_error("static rule points must not be negative: " + rule.description);

    switch (rule.kind) {
        case static_rule_kind::FILE_EXISTS:
            if (rule.paths.empty())
                throw configuration_error("file_exists rule requires paths: " + rule.description);
            break;
        case static_rule_kind::ENV_TEMPLATE:
            if (rule.paths.empty())
                rule.paths = {".env.example", ".env.template", ".env.sample"};
            break;
        case static_rule_kind::SOURCE_PATTERN:
            if (rule.pattern.empty())
                throw configuration_error("source_pattern rule requires pattern: " + rule.description);
            try {
                regex re(rule.pattern);
            } catch (regex_error &e) {
                throw configuration_error(fmt::format("invalid pattern '{}': {}", rule.pattern, e.what()));
            }
            break;
        case static_rule_kind::ENTRY_POINT:
            break;
    }
}

void from_json(const json &j, rubric_criterion &criterion) {
    j.at("id").get_to(criterion.id);
    criterion.name = get_value_def(j, criterion.id, "name");
    criterion.weight = get_value_def(j, 1.0, "weight");
    criterion.max_score = get_value_def(j, 100.0, "max_score");
    criterion.timeout_seconds = get_value_def(j, 0.0, "timeout_seconds");
    criterion.declares_nondeterminism = get_value_def(j, false, "nondeterministic");

    criterion_kind kind = parse_enum(criterion_kind_string, j.at("kind").get<string>(), "criterion kind");
    switch (kind) {
        case criterion_kind::FUNCTIONAL_TEST: {
            functional_test_spec spec;
            spec.command = read_command(j, criterion.id);
            string scoring = get_value_def(j, string("assertions"), "scoring");
            if (scoring == "assertions")
                spec.scoring = functional_test_spec::scoring_mode::ASSERTIONS;
            else if (scoring == "exit_status")
                spec.scoring = functional_test_spec::scoring_mode::EXIT_STATUS;
            else
                throw configuration_error(fmt::format("criterion {} has unknown scoring mode '{}'", criterion.id, scoring));
            spec.environment = get_value_def(j, map<string, string>(), "environment");
            spec.fixtures = read_fixtures(j);
            criterion.detail = move(spec);
            break;
        }
        case criterion_kind::RETRIEVAL_METRIC: {
            retrieval_metric_spec spec;
            spec.command = read_command(j, criterion.id);
            spec.metric = parse_enum(retrieval_metric_string, j.at("metric").get<string>(), "retrieval metric");
            spec.k = get_value_def(j, (size_t)5, "k");
            j.at("queries").get_to(spec.queries);
            spec.environment = get_value_def(j, map<string, string>(), "environment");
            spec.fixtures = read_fixtures(j);
            spec.metric_floor = get_value_def(j, 0.0, "metric_floor");
            spec.metric_ceiling = get_value_def(j, 1.0, "metric_ceiling");

            if (spec.k == 0)
                throw configuration_error(fmt::format("criterion {} requires k > 0", criterion.id));
            if (spec.queries.empty())
                throw configuration_error(fmt::format("criterion {} has no queries", criterion.id));
            if (spec.metric_ceiling <= spec.metric_floor)
                throw configuration_error(fmt::format("criterion {} requires metric_ceiling > metric_floor", criterion.id));
            criterion.detail = move(spec);
            break;
        }
        case criterion_kind::STATIC_CHECK: {
            static_check_spec spec;
            j.at("rules").get_to(spec.rules);
            if (spec.rules.empty())
                throw configuration_error(fmt::format("criterion {} has no rules", criterion.id));
            criterion.detail = move(spec);
            break;
        }
    }
}

}  // namespace grader
