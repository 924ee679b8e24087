#include "worker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace coexec {
using namespace std;

execution_result make_result(const execution_request &request, status stat, chrono::system_clock::time_point ended_at) {
    execution_result result;
    result.id = request.id;
    result.room_id = request.room_id;
    result.user = request.user;
    result.language = request.language;
    result.stat = stat;
    result.submitted_at = request.submitted_at;
    result.started_at = request.stat == status::QUEUED ? ended_at : request.started_at;
    result.ended_at = ended_at;
    result.duration_ms = max<int64_t>(0, milliseconds_between(result.started_at, ended_at));
    return result;
}

static string describe_exit(const sandbox::sandbox_result &outcome) {
    if (outcome.signal > 0)
        return fmt::format("Process terminated by signal {} ({})", outcome.signal, strsignal(outcome.signal));
    return fmt::format("Process exited with code {}", outcome.exit_code);
}

execution_result run_execution(sandbox::sandbox &box, const execution_request &request, const language_policy &policy, chrono::milliseconds timeout) noexcept {
    sandbox::sandbox_request job;
    job.execution_id = request.id;
    job.policy = policy;
    job.code = request.code;
    job.input = request.input;
    job.timeout = timeout;

    try {
        sandbox::sandbox_result outcome = box.run(job);
        execution_result result = make_result(request, status::COMPLETED, chrono::system_clock::now());
        result.stdout_text = move(outcome.stdout_text);
        result.stderr_text = move(outcome.stderr_text);
        result.exit_code = outcome.exit_code;
        result.memory_bytes = outcome.memory_bytes;
        result.cpu_time_ms = outcome.cpu_time_ms;
        result.output_truncated = outcome.output_truncated;
        if (outcome.memory_exceeded) {
            result.stat = status::FAILED;
            result.error = "Memory limit exceeded";
        } else if (outcome.exit_code != 0) {
            result.stat = status::FAILED;
            result.error = describe_exit(outcome);
        }
        return result;
    } catch (timeout_error &e) {
        execution_result result = make_result(request, status::TIMEOUT, chrono::system_clock::now());
        result.stdout_text = e.stdout_text;
        result.stderr_text = e.stderr_text;
        result.error = e.what();
        return result;
    } catch (execution_error &e) {
        LOG(WARNING) << "execution " << request.id << " could not run: " << e.what();
        execution_result result = make_result(request, status::FAILED, chrono::system_clock::now());
        result.error = e.what();
        return result;
    } catch (engine_exception &e) {
        LOG(ERROR) << "internal fault while running execution " << request.id << ": " << e;
        execution_result result = make_result(request, status::FAILED, chrono::system_clock::now());
        result.error = fmt::format("Internal error: {}", e.what());
        return result;
    } catch (exception &e) {
        LOG(ERROR) << "internal fault while running execution " << request.id << ": " << e.what();
        execution_result result = make_result(request, status::FAILED, chrono::system_clock::now());
        result.error = fmt::format("Internal error: {}", e.what());
        return result;
    }
}

thread start_worker(sandbox::sandbox &box, execution_request request, language_policy policy, chrono::milliseconds timeout,
                    function<void(execution_result)> on_finish) {
    return thread([&box, request = move(request), policy = move(policy), timeout, on_finish = move(on_finish)] {
        DLOG(INFO) << "execution " << request.id << " started on worker thread";
        on_finish(run_execution(box, request, policy, timeout));
    });
}

}  // namespace coexec
