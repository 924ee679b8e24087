#include "test/fake_sandbox.hpp"
#include <algorithm>
#include "common/exceptions.hpp"

namespace coexec::test {
using namespace std;

static bool starts_with(const string &s, const string &prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

coexec::sandbox::sandbox_result fake_sandbox::run(const coexec::sandbox::sandbox_request &request) {
    const string &code = request.code;
    {
        lock_guard<mutex> lock(mut);
        codes.push_back(code);
        peak = max(peak, ++running_count);
    }
    cond.notify_all();

    struct running_guard {
        fake_sandbox &box;
        ~running_guard() {
            lock_guard<mutex> lock(box.mut);
            --box.running_count;
        }
    } guard{*this};

    coexec::sandbox::sandbox_result result;
    result.exit_code = 0;
    result.memory_bytes = 1024;
    result.cpu_time_ms = 1;
    if (starts_with(code, "ok:")) {
        result.stdout_text = code.substr(3);
    } else if (starts_with(code, "block:")) {
        block_until_released(code.substr(6));
        result.stdout_text = code.substr(6);
    } else if (code == "hang") {
        block_until_released("hang");
    } else if (code == "binary") {
        result.stdout_text = "caf\xc3\n\xff\xfe";
        result.stderr_text = "\x80";
    } else if (code == "fail") {
        result.stderr_text = "boom";
        result.exit_code = 1;
    } else if (code == "timeout") {
        throw timeout_error("Execution timed out after " + to_string(request.timeout.count()) + "ms",
                            "partial", "", request.timeout);
    } else if (code == "crash") {
        throw execution_error("sandbox allocation failed: no space left");
    } else {
        result.stdout_text = code;
    }
    return result;
}

void fake_sandbox::block_until_released(const string &name) {
    unique_lock<mutex> lock(mut);
    cond.wait(lock, [&] { return release_everything || released.count(name); });
}

void fake_sandbox::release(const string &name) {
    {
        lock_guard<mutex> lock(mut);
        released.insert(name);
    }
    cond.notify_all();
}

void fake_sandbox::release_all() {
    {
        lock_guard<mutex> lock(mut);
        release_everything = true;
    }
    cond.notify_all();
}

vector<string> fake_sandbox::started_codes() const {
    lock_guard<mutex> lock(mut);
    return codes;
}

size_t fake_sandbox::running() const {
    lock_guard<mutex> lock(mut);
    return running_count;
}

size_t fake_sandbox::peak_running() const {
    lock_guard<mutex> lock(mut);
    return peak;
}

bool fake_sandbox::wait_started(size_t count, chrono::milliseconds timeout) const {
    unique_lock<mutex> lock(mut);
    return cond.wait_for(lock, timeout, [&] { return codes.size() >= count; });
}

}  // namespace coexec::test
