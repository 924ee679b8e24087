#include "execution.hpp"
#include "common/utils.hpp"

namespace coexec {
using namespace std;
using namespace nlohmann;

const char *get_event_name(event_type type) {
    switch (type) {
        case event_type::QUEUED:
            return "execution-queued";
        case event_type::STARTED:
            return "execution-started";
        case event_type::COMPLETED:
            return "execution-completed";
        case event_type::FAILED:
            return "execution-failed";
        case event_type::CANCELLED:
            return "execution-cancelled";
    }
    return "execution-unknown";
}

void to_json(json &j, const user_info &user) {
    j = {{"userId", user.user_id},
         {"displayName", user.display_name},
         {"avatar", user.avatar}};
}

void from_json(const json &j, user_info &user) {
    j.at("userId").get_to(user.user_id);
    if (j.count("displayName")) j.at("displayName").get_to(user.display_name);
    if (j.count("avatar")) j.at("avatar").get_to(user.avatar);
}

void to_json(json &j, const execution_result &result) {
    j = {{"id", result.id},
         {"roomId", result.room_id},
         {"user", result.user},
         {"language", result.language},
         {"status", get_status_name(result.stat)},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"exitCode", result.exit_code},
         {"submittedAt", to_epoch_ms(result.submitted_at)},
         {"startedAt", to_epoch_ms(result.started_at)},
         {"endedAt", to_epoch_ms(result.ended_at)},
         {"durationMs", result.duration_ms},
         {"outputTruncated", result.output_truncated}};
    if (result.error) j["error"] = *result.error;
    if (result.memory_bytes >= 0) j["memoryBytes"] = result.memory_bytes;
    if (result.cpu_time_ms >= 0) j["cpuTimeMs"] = result.cpu_time_ms;
}

void to_json(json &j, const execution_event &event) {
    j = {{"event", get_event_name(event.type)},
         {"executionId", event.execution_id},
         {"roomId", event.room_id},
         {"user", event.user},
         {"language", event.language},
         {"timestamp", to_epoch_ms(event.timestamp)}};
    if (event.type == event_type::QUEUED) {
        j["position"] = event.position;
        j["estimatedWaitMs"] = event.estimated_wait_ms;
    }
    if (event.result) {
        j["result"] = *event.result;
        j["status"] = get_status_name(event.result->stat);
    }
}

void to_json(json &j, const room_status_entry &entry) {
    j = {{"executionId", entry.execution_id},
         {"user", entry.user},
         {"language", entry.language},
         {"status", get_status_name(entry.stat)},
         {"submittedAt", to_epoch_ms(entry.submitted_at)}};
    if (entry.started_at) j["startedAt"] = to_epoch_ms(*entry.started_at);
    if (entry.position > 0) j["position"] = entry.position;
}

void to_json(json &j, const room_status &snapshot) {
    j = {{"roomId", snapshot.room_id},
         {"queued", snapshot.queued},
         {"active", snapshot.active},
         {"queueLength", snapshot.queue_length},
         {"activeCount", snapshot.active_count},
         {"maxConcurrent", snapshot.max_concurrent}};
}

void to_json(json &j, const execution_statistics &statistics) {
    j = {{"total", statistics.total},
         {"queued", statistics.queued},
         {"active", statistics.active},
         {"completed", statistics.completed},
         {"failed", statistics.failed},
         {"timedOut", statistics.timed_out},
         {"cancelled", statistics.cancelled},
         {"successRate", statistics.success_rate}};
}

}  // namespace coexec
