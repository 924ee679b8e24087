#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <iostream>
#include "run.hpp"
#include "utils.hpp"

using namespace std;

namespace coexec::runguard {

void validate(boost::any &v, const vector<string> &values, time_limit *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    const string &s = validators::get_single_string(values);
    auto colon = s.find(':');
    time_limit result;
    try {
        result.soft = boost::lexical_cast<double>(s.substr(0, colon));
        result.hard = colon == string::npos ? result.soft : boost::lexical_cast<double>(s.substr(colon + 1));
    } catch (boost::bad_lexical_cast &) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (!isfinite(result.soft) || !isfinite(result.hard) ||
        result.soft < 0 || result.hard < result.soft)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

void validate(boost::any &v, const vector<string> &values, bind_mount *, int) {
    using namespace boost::program_options;
    const string &s = validators::get_single_string(values);
    auto colon = s.find(':');
    if (colon == string::npos || colon == 0 || colon + 1 == s.size() || s[colon + 1] != '/')
        throw validation_error(validation_error::invalid_option_value);
    v = bind_mount{s.substr(0, colon), s.substr(colon + 1)};
}

static int resolve_id(const string &name, int (*lookup)(const string &), const char *kind) {
    int id = is_number(name) ? boost::lexical_cast<int>(name) : lookup(name);
    if (id < 0) throw invalid_argument(string("unknown ") + kind + " " + name);
    return id;
}

}  // namespace coexec::runguard

int main(int argc, const char *argv[]) {
    using namespace coexec::runguard;
    namespace po = boost::program_options;

    // 标准错误输出被用户程序占用，日志只写入文件
    FLAGS_stderrthreshold = google::FATAL;
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;
    runguard_options opt;

    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "run command with root directory set to root, the root is mounted read-only")
        ("bind,b", po::value<vector<bind_mount>>(), "bind a host directory into the root read-write (e.g. /tmp/run/1:/sandbox)")
        ("work-dir,w", po::value<string>(), "working directory of command, relative to root if provided")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id, defaults to user")
        ("wall-time,T", po::value<time_limit>(), "kill command after wall time clock seconds (soft:hard)")
        ("cpu-time,t", po::value<time_limit>(), "set maximum CPU time consumption of the command in seconds (soft:hard)")
        ("cpu-quota,c", po::value<double>(), "set maximum number of CPU cores the command can use (e.g. 0.5)")
        ("memory-limit,m", po::value<int64_t>(), "set maximum memory consumption of the command in KB")
        ("file-limit,f", po::value<int64_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<int64_t>(), "set maximum processes living simultaneously")
        ("nofile,n", po::value<int64_t>(), "set maximum open files of each process")
        ("no-core-dumps", "disable core dumps")
        ("stream-size,s", po::value<int64_t>(), "truncate command output streams at the size in bytes")
        ("variable,V", po::value<vector<string>>(), "set environment variables of command (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, memory usage, ...) to file")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        if (vm.count("help")) {
            cout << "Runguard: run a command with resource limits in an isolated environment." << endl
                 << "Requires root privilege, the command itself is never run as root." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }
        if (vm.count("version")) {
            cout << "runguard" << endl;
            return 0;
        }
        po::notify(vm);

        if (vm.count("root")) opt.chroot_dir = vm["root"].as<string>();
        if (vm.count("bind")) opt.binds = vm["bind"].as<vector<bind_mount>>();
        if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();
        if (vm.count("user")) opt.user_id = resolve_id(vm["user"].as<string>(), get_userid, "user");
        if (vm.count("group"))
            opt.group_id = resolve_id(vm["group"].as<string>(), get_groupid, "group");
        else if (vm.count("user"))
            opt.group_id = resolve_id(vm["user"].as<string>(), get_groupid, "group");
        if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<time_limit>();
        if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<time_limit>();
        if (vm.count("cpu-quota")) opt.cpu_quota = vm["cpu-quota"].as<double>();
        if (vm.count("memory-limit")) opt.memory_limit = vm["memory-limit"].as<int64_t>() * 1024;
        if (vm.count("file-limit")) opt.file_limit = vm["file-limit"].as<int64_t>() * 1024;
        if (vm.count("nproc")) opt.nproc = vm["nproc"].as<int64_t>();
        if (vm.count("nofile")) opt.nofile = vm["nofile"].as<int64_t>();
        if (vm.count("no-core-dumps")) opt.no_core_dumps = true;
        if (vm.count("stream-size")) opt.stream_size = vm["stream-size"].as<int64_t>();
        if (vm.count("variable")) opt.env = vm["variable"].as<vector<string>>();
        if (vm.count("out-meta")) opt.metafile_path = vm["out-meta"].as<string>();
        opt.command = vm["cmd"].as<vector<string>>();
    } catch (exception &e) {
        cerr << e.what() << endl
             << endl
             << desc << endl;
        return 1;
    }

    return run_guarded(opt);
}
