#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <optional>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

batch_orchestrator::batch_orchestrator(shared_ptr<const grader_config> config, grading_pipeline pipeline)
    : config(move(config)), pipeline(move(pipeline)) {}

void batch_orchestrator::register_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void batch_orchestrator::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    for (auto &monitor : monitors) {
        try {
            callback(*monitor);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
        }
    }
}

void batch_orchestrator::report_error(const string &message) {
    call_monitor(-1, [&](monitor &m) { m.report_error(message); });
}

grading_result batch_orchestrator::make_failure(const string &reference, error_kind kind, const string &message) const {
    submission submit;
    submit.reference = reference;
    submit.grading_id = generate_grading_id();
    submit.started_at = submit.finished_at = chrono::system_clock::now();
    return make_failure_result(submit, kind, message, *config);
}

vector<grading_result> batch_orchestrator::grade_all(const vector<string> &references, size_t concurrency, const cancellation_token &token) {
    if (concurrency == 0) concurrency = config->max_concurrency;
    concurrency = max<size_t>(1, min(concurrency, references.size()));

    // 每个位置只会被一个线程写入
    vector<optional<grading_result>> slots(references.size());
    concurrent_queue<size_t> queue(concurrency);

    auto worker_loop = [&](int worker_id) {
        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

        size_t index;
        while (queue.pop(index)) {
            const string &reference = references[index];
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::GRADING, ""); });
            call_monitor(worker_id, [&](monitor &m) { m.start_submission(index, reference); });

            grading_result result;
            if (token.cancelled()) {
                result = make_failure(reference, error_kind::CANCELLED, "grading cancelled before start");
            } else {
                try {
                    result = pipeline(reference, token);
                } catch (cancelled_error &ex) {
                    result = make_failure(reference, error_kind::CANCELLED, ex.what());
                } catch (std::exception &ex) {
                    LOG(ERROR) << "Worker " << worker_id << " caught unexpected exception while grading " << reference << ", "
                               << boost::diagnostic_information(ex);
                    report_error(string("unexpected exception while grading ") + reference + ": " + ex.what());
                    result = make_failure(reference, error_kind::INTERNAL, ex.what());
                } catch (...) {
                    LOG(ERROR) << "Worker " << worker_id << " caught unknown exception while grading " << reference << ", "
                               << boost::current_exception_diagnostic_information();
                    report_error("unknown exception while grading " + reference);
                    result = make_failure(reference, error_kind::INTERNAL, "unknown exception");
                }
            }

            call_monitor(worker_id, [&](monitor &m) { m.end_submission(index, result); });
            slots[index] = move(result);
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
        }

        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
    };

    vector<thread> workers;
    for (size_t i = 0; i < concurrency && i < references.size(); ++i)
        workers.emplace_back(worker_loop, (int)i);

    for (size_t i = 0; i < references.size(); ++i) {
        if (token.cancelled()) {
            slots[i] = make_failure(references[i], error_kind::CANCELLED, "grading cancelled before start");
            call_monitor(-1, [&](monitor &m) { m.end_submission(i, *slots[i]); });
        } else {
            queue.push(i);
        }
    }
    queue.close();

    for (auto &worker : workers) worker.join();

    vector<grading_result> results;
    results.reserve(slots.size());
    for (auto &slot : slots) results.push_back(move(*slot));
    return results;
}

}  // namespace grader
