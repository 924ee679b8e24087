#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace coexec {
using namespace std;

engine_exception::engine_exception()
    : engine_exception("") {}

engine_exception::engine_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *engine_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const engine_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

admission_error::admission_error(admission_reason reason, const string &message)
    : engine_exception(message), reason(reason) {}

const char *admission_error::reason_name() const {
    switch (reason) {
        case admission_reason::CONCURRENT_EXECUTION_LIMIT:
            return "ConcurrentExecutionLimit";
        case admission_reason::QUEUE_FULL:
            return "QueueFull";
        case admission_reason::ENGINE_STOPPED:
            return "EngineStopped";
    }
    return "Unknown";
}

validation_error::validation_error(const string &category, const string &message)
    : engine_exception(message), category(category) {}

execution_error::execution_error()
    : engine_exception() {}

execution_error::execution_error(const string &message)
    : engine_exception(message) {}

timeout_error::timeout_error(const string &message, string stdout_text, string stderr_text, chrono::milliseconds elapsed)
    : engine_exception(message), stdout_text(move(stdout_text)), stderr_text(move(stderr_text)), elapsed(elapsed) {}

internal_error::internal_error()
    : engine_exception() {}

internal_error::internal_error(const string &message)
    : engine_exception(message) {}

}  // namespace coexec
