#include "protocol.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace coexec {
using namespace std;
using namespace nlohmann;

line_writer::line_writer(ostream &out) : out(out) {}

void line_writer::write(const json &j) {
    // 用户程序的输出可能不是合法的 UTF-8
    string line = j.dump(-1, ' ', false, json::error_handler_t::replace);
    lock_guard<mutex> guard(mut);
    out << line << endl;
}

stream_channel::stream_channel(line_writer &writer) : writer(writer) {}

void stream_channel::publish(const string &room_id, const execution_event &event) {
    writer.write({{"type", "event"}, {"roomId", room_id}, {"event", event}});
}

static json make_error(const string &reason, const string &message) {
    return {{"type", "error"}, {"reason", reason}, {"message", message}};
}

static json make_response(const string &op) {
    return {{"type", "response"}, {"op", op}};
}

json handle_command(execution_engine &engine, const json &command) {
    string op = get_value<string>(command, "op");
    json response = make_response(op);

    if (op == "submit") {
        user_info user;
        user.user_id = get_value<string>(command, "userId");
        user.display_name = get_value_def<string>(command, user.user_id, "displayName");
        user.avatar = get_value_def<string>(command, "", "avatar");
        auto ticket = engine.submit_execution(get_value<string>(command, "roomId"), user,
                                              get_value<string>(command, "language"),
                                              get_value<string>(command, "code"),
                                              get_value_def<string>(command, "", "input"));
        response["executionId"] = ticket.execution_id;
        response["status"] = get_status_name(status::QUEUED);
        response["position"] = ticket.position;
        response["estimatedWaitMs"] = ticket.estimated_wait_ms;
        response["complexity"] = ticket.complexity;
    } else if (op == "cancel") {
        cancel_outcome outcome = engine.cancel_execution(get_value<string>(command, "roomId"),
                                                         get_value<string>(command, "userId"));
        response["outcome"] = get_cancel_outcome_name(outcome);
        response["cancelled"] = outcome == cancel_outcome::CANCELLED;
    } else if (op == "status") {
        response["status"] = engine.get_room_status(get_value<string>(command, "roomId"));
    } else if (op == "history") {
        int64_t limit = get_value_def<int64_t>(command, 0, "limit");
        if (limit < 0) throw invalid_argument("limit must not be negative");
        response["history"] = engine.get_room_history(get_value<string>(command, "roomId"), (size_t)limit);
    } else if (op == "statistics") {
        response["statistics"] = engine.get_statistics();
    } else {
        throw invalid_argument("unknown op " + op);
    }
    return response;
}

json handle_line(execution_engine &engine, const string &line) {
    try {
        json command = json::parse(line);
        if (!command.is_object()) return make_error("BadRequest", "command must be a json object");
        return handle_command(engine, command);
    } catch (admission_error &e) {
        LOG(INFO) << "rejected submission: " << e.what();
        return make_error(e.reason_name(), e.what());
    } catch (validation_error &e) {
        json error = make_error("ValidationError", e.what());
        error["category"] = e.category;
        return error;
    } catch (json::exception &e) {
        return make_error("BadRequest", e.what());
    } catch (invalid_argument &e) {
        return make_error("BadRequest", e.what());
    } catch (exception &e) {
        LOG(ERROR) << "unable to handle command: " << e.what();
        return make_error("InternalError", e.what());
    }
}

}  // namespace coexec
