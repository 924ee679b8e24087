#include "common/utils.hpp"
#include <fmt/core.h>
#include <stdlib.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace coexec {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string generate_execution_id() {
    // random_generator 不是线程安全的，每个线程持有自己的生成器
    thread_local boost::uuids::random_generator generator;
    string random = boost::uuids::to_string(generator());
    return fmt::format("exec_{}_{}", to_epoch_ms(chrono::system_clock::now()), random.substr(0, 8));
}

int64_t to_epoch_ms(chrono::system_clock::time_point time) {
    return chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count();
}

int64_t milliseconds_between(chrono::system_clock::time_point from, chrono::system_clock::time_point to) {
    return chrono::duration_cast<chrono::milliseconds>(to - from).count();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace coexec
