#include "runguard.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace codejudge {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t sep = line.find(": ");
        if (sep == string::npos) {
            // "key:" 形式的行表示空值
            if (!line.empty() && line.back() == ':')
                mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, sep)] = line.substr(sep + 2);
    }
    return mp;
}

template <typename T>
static void try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // 保持默认值
    }
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "time-result", result.time_result);
    try_to_parse(metadata, "memory-result", result.memory_result);
    try_to_parse(metadata, "removed-cgroups", result.removed_cgroups);
    if (metadata.count("internal-error")) result.internal_error = metadata.at("internal-error");
    if (metadata.count("output-truncated")) result.output_truncated = !metadata.at("output-truncated").empty();
    return result;
}

}  // namespace codejudge
