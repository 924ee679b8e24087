#include "config.hpp"
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace coexec {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

const language_policy &engine_config::get_language(const string &language) const {
    auto it = languages.find(language);
    if (it == languages.end())
        throw validation_error("unsupported_language", "Unsupported language: " + language);
    return it->second;
}

static language_policy python_policy() {
    language_policy policy;
    policy.name = "python";
    policy.filename = "main.py";
    policy.command = {"python3", "-u", "{file}"};
    policy.environment = {"PYTHONUNBUFFERED=1", "PYTHONDONTWRITEBYTECODE=1", "PYTHONIOENCODING=utf-8"};
    policy.memory_kb = 131072;
    // clang-format off
    policy.forbidden_patterns = {
        {"filesystem", R"re(^\s*import\s+[\w\s,.]*\b(os|shutil|glob|pathlib|tempfile)\b)re"},
        {"filesystem", R"re(^\s*from\s+(os|shutil|glob|pathlib|tempfile)(\.\w+)*\s+import\b)re"},
        {"filesystem", R"re(\bopen\s*\()re"},
        {"filesystem", R"re(\bfile\s*\()re"},
        {"filesystem", R"re(\bos\.)re"},
        {"process", R"re(^\s*import\s+[\w\s,.]*\b(subprocess|sys|multiprocessing|signal)\b)re"},
        {"process", R"re(^\s*from\s+(subprocess|sys|multiprocessing|signal)\s+import\b)re"},
        {"process", R"re(\bsubprocess\.)re"},
        {"process", R"re(\bsys\.)re"},
        {"process", R"re(\b(exit|quit|breakpoint)\s*\()re"},
        {"network", R"re(^\s*import\s+[\w\s,.]*\b(socket|urllib|requests|http|ftplib|smtplib)\b)re"},
        {"network", R"re(^\s*from\s+(socket|urllib|requests|http|ftplib|smtplib)(\.\w+)*\s+import\b)re"},
        {"serialization", R"re(^\s*import\s+(pickle|marshal|shelve)\b)re"},
        {"dynamic_code", R"re(\b__import__\s*\()re"},
        {"dynamic_code", R"re(\b(exec|eval|compile)\s*\()re"},
        {"dynamic_code", R"re(\b(importlib|ctypes)\b)re"},
        {"dynamic_code", R"re(\b(globals|locals|vars)\s*\(\s*\))re"},
        {"relative_import", R"re(^\s*from\s+\.)re"}};
    // clang-format on
    return policy;
}

static language_policy javascript_policy() {
    language_policy policy;
    policy.name = "javascript";
    policy.filename = "main.js";
    policy.command = {"node", "--max-old-space-size=96", "{file}"};
    policy.environment = {"NODE_ENV=production"};
    policy.memory_kb = 262144;
    // clang-format off
    policy.forbidden_patterns = {
        {"filesystem", R"re(\brequire\s*\(\s*['"`](fs|path|os|fs/promises)['"`]\s*\))re"},
        {"filesystem", R"re(\b(__dirname|__filename)\b)re"},
        {"process", R"re(\brequire\s*\(\s*['"`](child_process|process|cluster|worker_threads|vm)['"`]\s*\))re"},
        {"process", R"re(\bprocess\.(exit|kill|env|binding|dlopen)\b)re"},
        {"network", R"re(\brequire\s*\(\s*['"`](http|https|net|dgram|tls|dns)['"`]\s*\))re"},
        {"network", R"re(\bfetch\s*\()re"},
        {"module_import", R"re(^\s*import\s[^'"`;]*\bfrom\s+['"`])re"},
        {"module_import", R"re(\bimport\s*\()re"},
        {"dynamic_code", R"re(\beval\s*\()re"},
        {"dynamic_code", R"re(\bFunction\s*\()re"},
        {"timers", R"re(\b(setTimeout|setInterval|setImmediate)\s*\()re"},
        {"globals", R"re(\b(global|globalThis)\.)re"},
        {"globals", R"re(\bBuffer\.)re"},
        {"globals", R"re(\bnew\s+Buffer\b)re"},
        {"relative_import", R"re(\brequire\s*\(\s*['"`]\.)re"}};
    // clang-format on
    return policy;
}

static language_policy java_policy() {
    language_policy policy;
    policy.name = "java";
    policy.filename = "Main.java";
    policy.command = {"java", "-Xmx128m", "-Xss8m", "-XX:+UseSerialGC", "-XX:TieredStopAtLevel=1", "{file}"};
    policy.environment = {"JAVA_TOOL_OPTIONS=-Dfile.encoding=UTF-8"};
    policy.memory_kb = 524288;
    policy.cpu_quota = 1.0;
    // JVM 会创建大量线程，每个线程都计入进程数限制
    policy.max_processes = 128;
    policy.max_open_files = 128;
    // clang-format off
    policy.forbidden_patterns = {
        {"filesystem", R"re(\bimport\s+java\.(io|nio)\.)re"},
        {"filesystem", R"re(\bFile\s*\()re"},
        {"filesystem", R"re(\bFile(InputStream|OutputStream|Reader|Writer)\b)re"},
        {"filesystem", R"re(\b(Files|Paths)\.)re"},
        {"network", R"re(\bimport\s+java\.net\.)re"},
        {"network", R"re(\b(Socket|ServerSocket|URL|HttpURLConnection)\s*\()re"},
        {"process", R"re(\bProcessBuilder\b)re"},
        {"process", R"re(\bRuntime\.getRuntime\s*\()re"},
        {"process", R"re(\bSystem\.exit\s*\()re"},
        {"reflection", R"re(\bimport\s+java\.lang\.reflect\.)re"},
        {"reflection", R"re(\bClass\.forName\s*\()re"},
        {"reflection", R"re(\.getDeclared(Method|Field|Constructor)s?\s*\()re"},
        {"security_manager", R"re(\b(set|get)SecurityManager\s*\()re"},
        {"native", R"re(\bnative\s+\w)re"},
        {"native", R"re(\bSystem\.(load|loadLibrary)\s*\()re"},
        {"native", R"re(\b(sun\.misc|jdk\.internal)\.)re"}};
    // clang-format on
    return policy;
}

map<string, language_policy> default_language_policies() {
    map<string, language_policy> policies;
    for (auto &policy : {python_policy(), javascript_policy(), java_policy()})
        policies[policy.name] = policy;
    return policies;
}

engine_config default_engine_config() {
    engine_config config;
    config.languages = default_language_policies();
    return config;
}

static chrono::milliseconds get_duration_def(const json &j, const char *key, chrono::milliseconds def) {
    int64_t value = get_value_def<int64_t>(j, def.count(), key);
    if (value <= 0)
        throw invalid_argument(string(key) + " must be positive");
    return chrono::milliseconds(value);
}

void from_json(const json &j, forbidden_pattern &pattern) {
    j.at("category").get_to(pattern.category);
    j.at("pattern").get_to(pattern.pattern);
}

void from_json(const json &j, language_policy &policy) {
    assign_optional(j, policy.filename, "filename");
    assign_optional(j, policy.command, "command");
    assign_optional(j, policy.environment, "environment");
    assign_optional(j, policy.memory_kb, "memoryKB");
    assign_optional(j, policy.cpu_quota, "cpuQuota");
    assign_optional(j, policy.max_processes, "maxProcesses");
    assign_optional(j, policy.max_open_files, "maxOpenFiles");
    assign_optional(j, policy.max_code_length, "maxCodeLength");
    assign_optional(j, policy.max_input_length, "maxInputLength");
    assign_optional(j, policy.max_line_length, "maxLineLength");
    if (j.count("forbiddenPatterns"))
        policy.forbidden_patterns = j.at("forbiddenPatterns").get<vector<forbidden_pattern>>();
}

void from_json(const json &j, sandbox_config &config) {
    if (j.count("runguard")) config.runguard = j.at("runguard").get<string>();
    if (j.count("runDir")) config.run_dir = j.at("runDir").get<string>();
    if (j.count("chrootDir")) config.chroot_dir = j.at("chrootDir").get<string>();
    assign_optional(j, config.run_user, "runUser");
    assign_optional(j, config.run_group, "runGroup");
    assign_optional(j, config.max_output_lines, "maxOutputLines");
    assign_optional(j, config.max_output_bytes, "maxOutputBytes");
    assign_optional(j, config.scratch_size_kb, "scratchSizeKB");
}

void from_json(const json &j, engine_config &config) {
    assign_optional(j, config.max_concurrent_executions, "maxConcurrentExecutions");
    assign_optional(j, config.max_queue_size, "maxQueueSize");
    assign_optional(j, config.history_limit, "historyLimit");
    config.execution_timeout = get_duration_def(j, "executionTimeoutMs", config.execution_timeout);
    config.cleanup_interval = get_duration_def(j, "cleanupIntervalMs", config.cleanup_interval);
    config.retention_window = get_duration_def(j, "retentionWindowMs", config.retention_window);
    config.average_execution_time = get_duration_def(j, "averageExecutionTimeMs", config.average_execution_time);
    config.watchdog_grace = get_duration_def(j, "watchdogGraceMs", config.watchdog_grace);

    if (j.count("sandbox"))
        from_json(j.at("sandbox"), config.sandbox);

    if (j.count("languages")) {
        for (auto &[name, value] : j.at("languages").items()) {
            // 与内置策略同名时只覆盖出现的字段
            language_policy &policy = config.languages[name];
            from_json(value, policy);
            policy.name = name;
        }
    }

    if (config.max_concurrent_executions == 0)
        throw invalid_argument("maxConcurrentExecutions must be at least 1");
    for (auto &[name, policy] : config.languages) {
        if (policy.filename.empty())
            throw invalid_argument("language " + name + " does not specify a filename");
        assert_safe_path(policy.filename);
        if (policy.command.empty())
            throw invalid_argument("language " + name + " does not specify a command");
    }
}

engine_config load_engine_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw invalid_argument("configuration file " + path.string() + " does not exist");
    engine_config config = default_engine_config();
    try {
        json j = json::parse(read_file_content(path));
        from_json(j, config);
    } catch (json::exception &e) {
        throw invalid_argument("configuration file " + path.string() + " is malformed: " + e.what());
    }
    return config;
}

}  // namespace coexec
