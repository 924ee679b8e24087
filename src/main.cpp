#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "common/utils.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "protocol.hpp"
#include "sandbox/process_sandbox.hpp"
using namespace std;

static volatile sig_atomic_t stop_requested = 0;

static void stop_handler(int /* signum */) {
    stop_requested = 1;
}

/**
 * @brief 安装 SIGINT、SIGTERM 的处理函数
 * 不设置 SA_RESTART，使得主线程阻塞中的 read 被信号打断
 */
static void install_stop_handler() {
    struct sigaction sigact;
    sigact.sa_handler = stop_handler;
    sigact.sa_flags = 0;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGINT, &sigact, nullptr);
    sigaction(SIGTERM, &sigact, nullptr);
}

static void set_stop_signals_blocked(bool blocked) {
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(blocked ? SIG_BLOCK : SIG_UNBLOCK, &sigs, nullptr);
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());

    namespace po = boost::program_options;
    po::options_description desc("coexec-server options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load engine configuration from the json file")
        ("runguard", po::value<string>(), "set the location of runguard executable. You can either pass it from environ RUNGUARD. If neither is given, the server only starts in debug mode and programs run under rlimits only")
        ("run-dir", po::value<string>(), "set the directory to run user programs in. You can either pass it from environ RUNDIR")
        ("chroot-dir", po::value<string>(), "set the read-only root directory for user programs. You can either pass it from environ CHROOTDIR")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("max-concurrent", po::value<size_t>(), "set maximum number of concurrent executions per room")
        ("max-queue", po::value<size_t>(), "set maximum number of queued executions per room")
        ("timeout-ms", po::value<int64_t>(), "set wall clock limit of each execution in milliseconds")
        ("debug", "turn on the debug mode to keep execution directories after running")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "coexec-server: run untrusted code for collaborative rooms" << endl
             << "Reads one json command per line from standard input, writes responses and room events to standard output." << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "coexec-server 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) coexec::DEBUG = true;

    coexec::engine_config config;
    try {
        config = vm.count("config") ? coexec::load_engine_config(vm["config"].as<string>()) : coexec::default_engine_config();
    } catch (exception& e) {
        LOG(FATAL) << "Configuration file " << vm["config"].as<string>() << " is malformed: " << e.what();
    }

    auto& sandbox = config.sandbox;
    if (vm.count("runguard")) {
        sandbox.runguard = vm["runguard"].as<string>();
    } else if (getenv("RUNGUARD")) {
        sandbox.runguard = getenv("RUNGUARD");
    } else if (sandbox.runguard.empty() && getuid() == 0) {
        // 默认情况下，假设 runguard 与本程序编译在同一个目录下
        filesystem::path runguard(bin_dir / "runguard");
        if (filesystem::exists(runguard)) sandbox.runguard = runguard;
    }

    if (vm.count("run-dir")) {
        sandbox.run_dir = vm["run-dir"].as<string>();
    } else if (getenv("RUNDIR")) {
        sandbox.run_dir = getenv("RUNDIR");
    }
    error_code ec;
    filesystem::create_directories(sandbox.run_dir, ec);
    CHECK(filesystem::is_directory(sandbox.run_dir))
        << "Run directory " << sandbox.run_dir << " does not exist: " << ec.message();

    if (vm.count("chroot-dir")) {
        sandbox.chroot_dir = vm["chroot-dir"].as<string>();
    } else if (getenv("CHROOTDIR")) {
        sandbox.chroot_dir = getenv("CHROOTDIR");
    }
    if (!sandbox.chroot_dir.empty())
        CHECK(filesystem::is_directory(sandbox.chroot_dir))
            << "Chroot directory " << sandbox.chroot_dir << " does not exist";

    sandbox.run_user = vm.count("run-user") ? vm["run-user"].as<string>() : coexec::get_env("RUNUSER", sandbox.run_user);
    sandbox.run_group = vm.count("run-group") ? vm["run-group"].as<string>() : coexec::get_env("RUNGROUP", sandbox.run_group);

    if (vm.count("max-concurrent")) config.max_concurrent_executions = vm["max-concurrent"].as<size_t>();
    if (vm.count("max-queue")) config.max_queue_size = vm["max-queue"].as<size_t>();
    if (vm.count("timeout-ms")) config.execution_timeout = chrono::milliseconds(vm["timeout-ms"].as<int64_t>());
    CHECK(config.max_concurrent_executions > 0) << "max-concurrent should be positive";
    CHECK(config.execution_timeout.count() > 0) << "timeout-ms should be positive";

    try {
        coexec::sandbox::check_isolation(sandbox, coexec::DEBUG);
    } catch (exception& e) {
        LOG(FATAL) << e.what();
    }
    if (sandbox.runguard.empty())
        LOG(WARNING) << "Debug mode: runguard is not configured, user programs run under rlimits only without namespace isolation";
    else if (getuid() != 0 && !coexec::DEBUG)
        LOG(FATAL) << "runguard requires privileged mode";

    // 执行目录只允许当前用户写入
    umask(0022);

    coexec::line_writer writer(cout);
    coexec::stream_channel channel(writer);

    // 信号只由主线程处理，引擎创建的线程继承屏蔽字
    set_stop_signals_blocked(true);
    install_stop_handler();

    {
        coexec::execution_engine engine(config, make_shared<coexec::sandbox::process_sandbox>(sandbox), &channel);
        set_stop_signals_blocked(false);

        LOG(INFO) << "coexec-server started, " << config.languages.size() << " languages, at most "
                  << config.max_concurrent_executions << " concurrent executions per room";

        string line;
        while (!stop_requested && getline(cin, line)) {
            if (line.empty()) continue;
            writer.write(coexec::handle_line(engine, line));
        }

        if (stop_requested)
            LOG(INFO) << "Received stop signal, shutting down";
        else
            LOG(INFO) << "Standard input closed, shutting down";
        engine.shutdown();
    }

    return EXIT_SUCCESS;
}
