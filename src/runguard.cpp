#include "runguard.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>
#include <stdexcept>

namespace grader {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) {
            // 值为空的行形如 "time-result: "，也可能被写成 "time-result:"
            if (!line.empty() && line.back() == ':') mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // 保留默认值
    }
}

template <>
void try_to_parse(const map<string, string> &metadata, const char *key, string &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second;
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    if (!filesystem::is_regular_file(metafile))
        throw runtime_error("runguard meta file " + metafile.string() + " does not exist");

    auto metadata = read_metadata(metafile);
    if (metadata.empty())
        throw runtime_error("runguard meta file " + metafile.string() + " is empty");

    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "time-result", result.time_result);
    try_to_parse(metadata, "wall-result", result.wall_result);
    try_to_parse(metadata, "cpu-result", result.cpu_result);
    try_to_parse(metadata, "output-truncated", result.output_truncated);
    try_to_parse(metadata, "stdout-bytes", result.stdout_bytes);
    try_to_parse(metadata, "stderr-bytes", result.stderr_bytes);
    try_to_parse(metadata, "internal-error", result.internal_error);
    return result;
}

}  // namespace grader
