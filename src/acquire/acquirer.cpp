#include "acquire/acquirer.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

submission_reference parse_reference(const string &reference) {
    static const regex url_matcher(R"(^(https?|ssh|git)://[A-Za-z0-9._~@:-]+/[^\s]+$)");
    static const regex scp_matcher(R"(^[A-Za-z0-9._-]+@[A-Za-z0-9.-]+:[^\s]+$)");
    static const regex file_matcher(R"(^file://(/[^\n\r]*)$)");

    if (reference.empty())
        throw acquisition_error(error_kind::MALFORMED, "empty submission reference");
    for (char c : reference)
        if (iscntrl((unsigned char)c))
            throw acquisition_error(error_kind::MALFORMED, "submission reference contains control characters");
    if (!utf8_check_is_valid(reference))
        throw acquisition_error(error_kind::MALFORMED, "submission reference is not valid UTF-8");

    smatch matches;
    if (regex_match(reference, matches, file_matcher))
        return {reference_type::LOCAL, matches[1].str()};
    if (regex_match(reference, url_matcher) || regex_match(reference, scp_matcher))
        return {reference_type::REMOTE, reference};
    if (reference[0] == '/')
        return {reference_type::LOCAL, reference};

    throw acquisition_error(error_kind::MALFORMED, "unrecognized submission reference " + reference);
}

error_kind classify_clone_failure(const string &stderr_text) {
    string message = boost::to_lower_copy(stderr_text);
    for (const char *pattern : {"repository not found", "not found", "does not exist",
                                "does not appear to be a git repository", "could not resolve host"})
        if (message.find(pattern) != string::npos) return error_kind::NOT_FOUND;
    for (const char *pattern : {"authentication failed", "could not read username", "permission denied",
                                "access denied", "403"})
        if (message.find(pattern) != string::npos) return error_kind::UNAUTHORIZED;
    return error_kind::NOT_FOUND;
}

acquirer::acquirer(shared_ptr<const grader_config> config, const sandbox &runner)
    : config(move(config)), runner(runner) {}

void acquirer::clone(const submission_reference &ref, const workspace &ws, const cancellation_token &token) const {
    fs::path run_dir = ws.root / "acquire";
    try {
        fs::create_directories(run_dir);
    } catch (fs::filesystem_error &e) {
        throw sandbox_infrastructure_error(fmt::format("unable to create {}: {}", run_dir, e.what()));
    }

    execution_limits limits = runner.default_limits(config->acquisition_timeout_seconds);
    limits.network = true;
    limits.use_run_user = false;

    vector<string> command = {config->git, "clone", "--depth", "1", "--quiet", "--", ref.location, ws.snapshot.string()};
    execution_outcome outcome = runner.execute(run_dir, ws.root, command, limits, {{"GIT_TERMINAL_PROMPT", "0"}}, token);

    error_code ec;
    fs::remove_all(run_dir, ec);

    if (outcome.cancelled) throw cancelled_error();
    if (outcome.timed_out())
        throw acquisition_error(error_kind::TIMEOUT,
                                fmt::format("cloning {} exceeded {:.0f} seconds", ref.location, config->acquisition_timeout_seconds));
    if (outcome.exit_status != 0) {
        string message = utf8_truncate(outcome.stderr_text, 1024);
        throw acquisition_error(classify_clone_failure(outcome.stderr_text),
                                fmt::format("unable to clone {}: {}", ref.location, message));
    }
}

void acquirer::copy_local(const submission_reference &ref, const workspace &ws) const {
    fs::path source = ref.location;
    error_code ec;
    if (!fs::exists(source, ec)) {
        if (ec == errc::permission_denied)
            throw acquisition_error(error_kind::UNAUTHORIZED, "permission denied: " + ref.location);
        throw acquisition_error(error_kind::NOT_FOUND, "directory " + ref.location + " does not exist");
    }
    if (!fs::is_directory(source))
        throw acquisition_error(error_kind::MALFORMED, ref.location + " is not a directory");
    if (access(source.c_str(), R_OK | X_OK) != 0)
        throw acquisition_error(error_kind::UNAUTHORIZED, "permission denied: " + ref.location);

    try {
        copy_directory(source, ws.snapshot, {".git"});
    } catch (fs::filesystem_error &e) {
        if (e.code() == errc::permission_denied)
            throw acquisition_error(error_kind::UNAUTHORIZED, fmt::format("unable to read {}: {}", ref.location, e.what()));
        throw sandbox_infrastructure_error(fmt::format("unable to copy {}: {}", ref.location, e.what()));
    }
}

void acquirer::verify_structure(workspace &ws) const {
    const language_profile *detected = nullptr;
    for (auto &profile : config->languages) {
        for (auto &file : profile.dependency_files) {
            if (fs::is_regular_file(ws.snapshot / file)) {
                detected = &profile;
                break;
            }
        }
        if (detected) break;
    }

    if (!detected) {
        vector<string> expected;
        for (auto &profile : config->languages)
            expected.insert(expected.end(), profile.dependency_files.begin(), profile.dependency_files.end());
        throw acquisition_error(error_kind::MALFORMED,
                                "no recognizable project, expected one of " + boost::algorithm::join(expected, ", "));
    }

    ws.language = *detected;
    LOG(INFO) << "Detected language " << detected->name << " in " << ws.snapshot;

    for (auto &entry : detected->entry_points) {
        if (fs::is_regular_file(ws.snapshot / entry)) {
            ws.entry_point = entry;
            break;
        }
    }
    if (ws.entry_point.empty())
        throw acquisition_error(error_kind::MALFORMED,
                                fmt::format("no entry point found for {}, expected one of {}",
                                            detected->name, boost::algorithm::join(detected->entry_points, ", ")));

    for (const char *name : {".env.example", ".env.template", ".env.sample"}) {
        if (fs::is_regular_file(ws.snapshot / name)) {
            ws.env_template = name;
            break;
        }
    }

    for (const char *name : {"README.md", "README.txt", "README", "readme.md"}) {
        if (fs::is_regular_file(ws.snapshot / name)) {
            ws.has_readme = true;
            break;
        }
    }
}

workspace acquirer::acquire(const string &reference, const string &grading_id, const cancellation_token &token) const {
    submission_reference ref = parse_reference(reference);
    token.throw_if_cancelled();

    workspace ws(config->run_dir / grading_id);
    ws.keep = config->keep_workspace;
    try {
        fs::create_directories(ws.root);
    } catch (fs::filesystem_error &e) {
        throw sandbox_infrastructure_error(fmt::format("unable to create workspace {}: {}", ws.root, e.what()));
    }

    elapsed_time timer;
    if (ref.type == reference_type::REMOTE)
        clone(ref, ws, token);
    else
        copy_local(ref, ws);

    verify_structure(ws);

    try {
        set_tree_writable(ws.snapshot, false);
    } catch (fs::filesystem_error &e) {
        throw sandbox_infrastructure_error(fmt::format("unable to freeze snapshot {}: {}", ws.snapshot, e.what()));
    }

    LOG(INFO) << fmt::format("Acquired {} in {:.2f}s, language {}, entry point {}", reference, timer.seconds(), ws.language.name, ws.entry_point);
    return ws;
}

}  // namespace grader
