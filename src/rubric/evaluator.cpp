#include "rubric/evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <future>
#include "common/exceptions.hpp"
#include "rubric/functional_test.hpp"
#include "rubric/retrieval_metric.hpp"
#include "rubric/static_check.hpp"

namespace grader {
using namespace std;

evaluator::~evaluator() {}

rubric_evaluator::rubric_evaluator() {
    register_evaluator(make_unique<functional_test_evaluator>());
    register_evaluator(make_unique<retrieval_metric_evaluator>());
    register_evaluator(make_unique<static_check_evaluator>());
}

void rubric_evaluator::register_evaluator(unique_ptr<evaluator> &&e) {
    criterion_kind kind = e->kind();
    evaluators[kind] = move(e);
}

score_entry rubric_evaluator::evaluate_one(const evaluation_context &ctx, const rubric_criterion &criterion) const {
    ctx.token.throw_if_cancelled();

    auto it = evaluators.find(criterion.kind());
    if (it == evaluators.end())
        throw runtime_error(fmt::format("no evaluator registered for {}", get_display_message(criterion.kind())));

    score_entry entry;
    try {
        entry = it->second->evaluate(ctx, criterion);
    } catch (sandbox_infrastructure_error &) {
        throw;
    } catch (cancelled_error &) {
        throw;
    } catch (std::exception &e) {
        LOG(WARNING) << "Criterion " << criterion.id << " failed: " << e.what();
        entry = score_entry();
        entry.error = e.what();
        entry.rationale = string("evaluation failed: ") + e.what();
    }

    entry.criterion_id = criterion.id;
    entry.max_score = criterion.max_score;
    entry.raw_score = clamp(entry.raw_score, 0.0, criterion.max_score);
    DLOG(INFO) << fmt::format("Criterion {} scored {:.2f}/{:.2f}: {}", criterion.id, entry.raw_score, entry.max_score, entry.rationale);
    return entry;
}

vector<score_entry> rubric_evaluator::evaluate(const evaluation_context &ctx, const vector<rubric_criterion> &criteria, bool parallel) const {
    vector<score_entry> entries;
    entries.reserve(criteria.size());

    if (!parallel) {
        for (auto &criterion : criteria)
            entries.push_back(evaluate_one(ctx, criterion));
        return entries;
    }

    vector<future<score_entry>> futures;
    for (auto &criterion : criteria)
        futures.push_back(async(launch::async, [&, this] { return evaluate_one(ctx, criterion); }));

    // 所有 future 都必须等待结束，因为它们引用了 ctx 中的工作区
    exception_ptr failure;
    for (auto &f : futures) {
        try {
            entries.push_back(f.get());
        } catch (std::exception &) {
            if (!failure) failure = current_exception();
        }
    }
    if (failure) rethrow_exception(failure);
    return entries;
}

}  // namespace grader
