#include "engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <filesystem>
#include "common/exceptions.hpp"
#include "scoring/aggregator.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static vector<asset_ptr> criterion_fixtures(const rubric_criterion &criterion) {
    if (auto spec = get_if<functional_test_spec>(&criterion.detail)) return spec->fixtures;
    if (auto spec = get_if<retrieval_metric_spec>(&criterion.detail)) return spec->fixtures;
    return {};
}

/**
 * @brief 查找 runguard：配置项、环境变量 RUNGUARD、评测程序所在目录
 */
static fs::path resolve_runguard(const fs::path &configured) {
    if (!configured.empty()) {
        if (!fs::is_regular_file(configured))
            throw configuration_error(fmt::format("runguard {} does not exist", configured));
        return configured;
    }

    error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && fs::is_regular_file(self.parent_path() / "runguard"))
        return self.parent_path() / "runguard";

    throw configuration_error("unable to find runguard, set \"runguard\" in configuration or RUNGUARD environment variable");
}

static shared_ptr<const grader_config> prepare_config(grader_config config) {
    validate_rubric(config.rubric);
    validate_thresholds(config.grade_thresholds);

    for (auto &criterion : config.rubric) {
        for (auto &fixture : criterion_fixtures(criterion)) {
            auto local = dynamic_pointer_cast<local_asset>(fixture);
            if (local && !fs::exists(local->path))
                throw configuration_error(fmt::format("fixture {} of criterion {} does not exist", local->path, criterion.id));
        }
    }

    config.runguard = resolve_runguard(config.runguard);

    LOG_IF(WARNING, config.sandbox_process_limit > 0 && config.run_user.empty())
        << "sandbox_process_limit is ignored because run_user is not set, processes of sandboxes are not limited";

    try {
        fs::create_directories(config.run_dir);
    } catch (fs::filesystem_error &e) {
        throw configuration_error(fmt::format("unable to create run directory {}: {}", config.run_dir, e.what()));
    }

    LOG(INFO) << "Using runguard " << config.runguard << ", run directory " << config.run_dir;
    return make_shared<const grader_config>(move(config));
}

grading_engine::grading_engine(grader_config config)
    : config(prepare_config(move(config))),
      runner(this->config),
      fetcher(this->config, runner),
      orchestrator(this->config, [this](const string &reference, const cancellation_token &token) {
          return grade_submission(reference, token);
      }) {}

const grader_config &grading_engine::get_config() const {
    return *config;
}

void grading_engine::register_monitor(unique_ptr<monitor> &&m) {
    orchestrator.register_monitor(move(m));
}

grading_result grading_engine::grade_submission(const string &reference) const {
    cancellation_token token;
    return grade_submission(reference, token);
}

grading_result grading_engine::grade_submission(const string &reference, const cancellation_token &token) const {
    submission submit;
    submit.reference = reference;
    submit.grading_id = generate_grading_id();
    submit.started_at = chrono::system_clock::now();

    string tag = fmt::format("Submission[{}:{}]", submit.grading_id, reference);
    LOG(INFO) << tag << " grading started";

    auto fail = [&](error_kind kind, const string &message) {
        submit.finished_at = chrono::system_clock::now();
        LOG(WARNING) << tag << " failed with " << get_display_message(kind) << ": " << message;
        return make_failure_result(submit, kind, message, *config);
    };

    try {
        workspace ws = fetcher.acquire(reference, submit.grading_id, token);
        submit.language = ws.language.name;
        submit.entry_point = ws.entry_point;

        evaluation_context ctx{ws, *config, runner, token};
        vector<score_entry> entries = evaluator.evaluate(ctx, config->rubric, config->parallel_criteria);
        aggregate_result aggregated = aggregate(entries, config->rubric, config->grade_thresholds);
        submit.finished_at = chrono::system_clock::now();

        grading_result result;
        result.submission_id = reference;
        result.grading_id = submit.grading_id;
        result.success = true;
        result.total_score = aggregated.total_score;
        result.grade = aggregated.grade;
        result.payload = build_report(submit, entries, config->rubric, aggregated.total_score, aggregated.grade, nullopt, config->report_excerpt_bytes);
        result.duration_seconds = result.payload.duration_seconds;
        result.entries = move(entries);

        LOG(INFO) << tag << fmt::format(" scored {:.1f} ({}) in {:.2f}s", result.total_score, result.grade, result.duration_seconds);
        return result;
    } catch (acquisition_error &e) {
        return fail(e.kind(), e.what());
    } catch (cancelled_error &e) {
        return fail(error_kind::CANCELLED, e.what());
    } catch (sandbox_infrastructure_error &e) {
        LOG(ERROR) << tag << " sandbox failure" << endl << boost::diagnostic_information(e);
        return fail(error_kind::SANDBOX_INFRASTRUCTURE, e.what());
    } catch (std::exception &e) {
        LOG(ERROR) << tag << " unexpected exception" << endl << boost::diagnostic_information(e);
        return fail(error_kind::INTERNAL, e.what());
    }
}

unique_ptr<cancellation_token> grading_engine::create_batch_token() const {
    if (config->batch_deadline_seconds > 0) {
        auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(
                                                           chrono::duration<double>(config->batch_deadline_seconds));
        return make_unique<cancellation_token>(deadline);
    }
    return make_unique<cancellation_token>();
}

vector<grading_result> grading_engine::grade_batch(const vector<string> &references, size_t concurrency) {
    auto token = create_batch_token();
    return grade_batch(references, concurrency, *token);
}

vector<grading_result> grading_engine::grade_batch(const vector<string> &references, size_t concurrency, const cancellation_token &token) {
    if (concurrency == 0) concurrency = config->max_concurrency;
    LOG(INFO) << "Grading " << references.size() << " submissions with concurrency " << concurrency;
    return orchestrator.grade_all(references, concurrency, token);
}

}  // namespace grader
