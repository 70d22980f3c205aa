#include "rubric/retrieval_metric.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static const char *FIXTURE_FILE = "fixture.json";

void from_json(const json &j, retrieval_response &response) {
    response.id = get_value_def(j, string(), "id");
    response.query = get_value_def(j, string(), "query");
    response.retrieved = get_value_def(j, vector<string>(), "retrieved");
    response.answer = get_value_def(j, string(), "answer");
}

vector<retrieval_response> parse_retrieval_responses(const string &output) {
    optional<vector<retrieval_response>> responses;
    istringstream stream(output);
    string line;
    while (getline(stream, line)) {
        boost::trim(line);
        if (line.empty() || line.front() != '{') continue;

        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.count("results") || !j["results"].is_array()) continue;
        try {
            responses = j["results"].get<vector<retrieval_response>>();
        } catch (std::invalid_argument &e) {
            LOG(INFO) << "Skipping malformed retrieval results: " << e.what();
        } catch (json::exception &e) {
            LOG(INFO) << "Skipping malformed retrieval results: " << e.what();
        }
    }

    if (!responses)
        throw criterion_evaluation_error("no retrieval results found in output");
    return *responses;
}

static size_t count_hits(const vector<string> &retrieved, const vector<string> &relevant, size_t k) {
    set<string> expected(relevant.begin(), relevant.end());
    set<string> seen;
    size_t hits = 0;
    for (size_t i = 0; i < retrieved.size() && i < k; ++i) {
        // 同一个文档重复返回只算一次命中
        if (expected.count(retrieved[i]) && seen.insert(retrieved[i]).second) ++hits;
    }
    return hits;
}

double precision_at_k(const vector<string> &retrieved, const vector<string> &relevant, size_t k) {
    if (k == 0) return 0;
    return (double)count_hits(retrieved, relevant, k) / k;
}

double recall_at_k(const vector<string> &retrieved, const vector<string> &relevant, size_t k) {
    set<string> expected(relevant.begin(), relevant.end());
    if (expected.empty()) return 0;
    return (double)count_hits(retrieved, relevant, k) / expected.size();
}

double reciprocal_rank(const vector<string> &retrieved, const vector<string> &relevant, size_t k) {
    set<string> expected(relevant.begin(), relevant.end());
    for (size_t i = 0; i < retrieved.size() && i < k; ++i)
        if (expected.count(retrieved[i])) return 1.0 / (i + 1);
    return 0;
}

double keyword_relevance(const string &answer, const vector<string> &keywords) {
    if (keywords.empty()) return 0;
    string text = boost::to_lower_copy(answer);
    size_t matched = 0;
    for (auto &keyword : keywords)
        if (text.find(boost::to_lower_copy(keyword)) != string::npos) ++matched;
    return (double)matched / keywords.size();
}

static const retrieval_response *find_response(const vector<retrieval_response> &responses, const retrieval_query &query) {
    for (auto &response : responses)
        if (!response.id.empty() && response.id == query.id) return &response;
    for (auto &response : responses)
        if (response.id.empty() && response.query == query.question) return &response;
    return nullptr;
}

double compute_metric(const retrieval_metric_spec &spec, const vector<retrieval_response> &responses) {
    if (spec.queries.empty()) return 0;

    double sum = 0;
    for (auto &query : spec.queries) {
        const retrieval_response *response = find_response(responses, query);
        if (!response) continue;

        switch (spec.metric) {
            case retrieval_metric::PRECISION_AT_K:
                sum += precision_at_k(response->retrieved, query.relevant_documents, spec.k);
                break;
            case retrieval_metric::RECALL_AT_K:
                sum += recall_at_k(response->retrieved, query.relevant_documents, spec.k);
                break;
            case retrieval_metric::MRR:
                sum += reciprocal_rank(response->retrieved, query.relevant_documents, spec.k);
                break;
            case retrieval_metric::KEYWORD_RELEVANCE:
                sum += keyword_relevance(response->answer, query.expected_keywords);
                break;
        }
    }
    return sum / spec.queries.size();
}

static string build_fixture(const retrieval_metric_spec &spec) {
    json queries = json::array();
    for (auto &query : spec.queries)
        queries.push_back({{"id", query.id}, {"question", query.question}});
    json fixture = {{"k", spec.k}, {"queries", queries}};
    return fixture.dump(2);
}

criterion_kind retrieval_metric_evaluator::kind() const {
    return criterion_kind::RETRIEVAL_METRIC;
}

score_entry retrieval_metric_evaluator::evaluate(const evaluation_context &ctx, const rubric_criterion &criterion) const {
    auto &spec = get<retrieval_metric_spec>(criterion.detail);

    sandbox_request request;
    request.command = spec.command;
    request.limits = ctx.runner.default_limits(criterion.timeout_seconds);
    request.environment = spec.environment;
    request.environment.insert({"GRADER_FIXTURE", string("${fixture}/") + FIXTURE_FILE});
    request.environment.insert({"GRADER_DOCUMENTS", "${fixture}/documents"});
    request.fixtures = spec.fixtures;
    request.fixtures.push_back(make_shared<text_asset>(FIXTURE_FILE, build_fixture(spec)));

    execution_outcome outcome = ctx.runner.run(ctx.ws, request, ctx.token);
    if (outcome.cancelled) throw cancelled_error();

    score_entry entry;
    entry.log = outcome.stderr_text.empty() ? outcome.stdout_text : outcome.stdout_text + "\n[stderr]\n" + outcome.stderr_text;
    entry.truncated = outcome.truncated;

    if (outcome.timed_out()) {
        entry.raw_score = 0;
        entry.rationale = fmt::format("exceeded time limit of {:.0f}s", request.limits.wall_time);
        return entry;
    }

    vector<retrieval_response> responses = parse_retrieval_responses(outcome.stdout_text);
    double value = compute_metric(spec, responses);
    double ratio = clamp((value - spec.metric_floor) / (spec.metric_ceiling - spec.metric_floor), 0.0, 1.0);

    entry.raw_score = criterion.max_score * ratio;
    entry.rationale = fmt::format("{} = {:.3f} (k = {}) over {} queries", get_display_message(spec.metric), value, spec.k, spec.queries.size());
    if (outcome.exit_status != 0)
        entry.rationale += fmt::format(", command exited with {}", outcome.exit_status);
    return entry;
}

}  // namespace grader
