#include "runguard.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <fstream>

namespace coexec {
using namespace std;

map<string, string> read_metadata(const filesystem::path &metafile) {
    map<string, string> mp;
    ifstream fin(metafile);
    string line;
    while (getline(fin, line)) {
        size_t colon = line.find(':');
        if (colon == string::npos) continue;
        string key = line.substr(0, colon);
        string value = line.substr(colon + 1);
        boost::algorithm::trim(key);
        boost::algorithm::trim(value);
        mp[key] = value;
    }
    return mp;
}

template <typename T>
static void parse_field(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    if (!boost::conversion::try_lexical_convert(it->second, value))
        LOG(WARNING) << "runguard meta field " << key << " has unexpected value " << it->second;
}

template <>
void parse_field(const map<string, string> &metadata, const char *key, string &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second;
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    parse_field(metadata, "cpu-time", result.cpu_time);
    parse_field(metadata, "wall-time", result.wall_time);
    parse_field(metadata, "exitcode", result.exitcode);
    parse_field(metadata, "signal", result.signal);
    parse_field(metadata, "memory-bytes", result.memory);
    parse_field(metadata, "memory-result", result.memory_result);
    parse_field(metadata, "time-result", result.time_result);
    parse_field(metadata, "output-truncated", result.output_truncated);
    parse_field(metadata, "internal-error", result.internal_error);
    return result;
}

}  // namespace coexec
