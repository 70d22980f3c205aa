#include "scoring/aggregator.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

void validate_rubric(const vector<rubric_criterion> &criteria) {
    if (criteria.empty())
        throw aggregation_error("rubric has no criteria");

    set<string> ids;
    double total_weight = 0;
    for (auto &criterion : criteria) {
        if (!ids.insert(criterion.id).second)
            throw aggregation_error("duplicate criterion id " + criterion.id);
        if (criterion.weight < 0)
            throw aggregation_error(fmt::format("criterion {} has negative weight {}", criterion.id, criterion.weight));
        if (criterion.max_score <= 0)
            throw aggregation_error(fmt::format("criterion {} has non-positive max score {}", criterion.id, criterion.max_score));
        total_weight += criterion.weight;
    }
    if (total_weight <= 0)
        throw aggregation_error("total weight of rubric is zero");
}

void validate_thresholds(const vector<grade_threshold> &thresholds) {
    if (thresholds.empty())
        throw configuration_error("grade thresholds should not be empty");
    for (size_t i = 0; i < thresholds.size(); ++i) {
        auto &threshold = thresholds[i];
        if (threshold.score < 0 || threshold.score > 100)
            throw configuration_error(fmt::format("grade threshold {} of {} is out of [0, 100]", threshold.score, threshold.letter));
        if (i > 0 && threshold.score >= thresholds[i - 1].score)
            throw configuration_error("grade thresholds should be strictly descending");
    }
    if (thresholds.back().score != 0)
        throw configuration_error("the lowest grade threshold should be 0");
}

string letter_grade(double total_score, const vector<grade_threshold> &thresholds) {
    for (auto &threshold : thresholds)
        if (total_score >= threshold.score) return threshold.letter;
    return thresholds.empty() ? "" : thresholds.back().letter;
}

aggregate_result aggregate(const vector<score_entry> &entries,
                           const vector<rubric_criterion> &criteria,
                           const vector<grade_threshold> &thresholds) {
    map<string, const score_entry *> scores;
    for (auto &entry : entries) scores[entry.criterion_id] = &entry;

    double weighted = 0, total_weight = 0;
    for (auto &criterion : criteria) {
        total_weight += criterion.weight;
        auto it = scores.find(criterion.id);
        if (it == scores.end() || criterion.max_score <= 0) continue;
        double ratio = clamp(it->second->raw_score / criterion.max_score, 0.0, 1.0);
        weighted += ratio * criterion.weight;
    }
    if (total_weight <= 0)
        throw aggregation_error("total weight of rubric is zero");

    aggregate_result result;
    result.total_score = round(clamp(100 * weighted / total_weight, 0.0, 100.0) * 10) / 10;
    result.grade = letter_grade(result.total_score, thresholds);
    return result;
}

}  // namespace grader
