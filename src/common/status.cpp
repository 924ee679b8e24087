#include "common/status.hpp"
#include <boost/assign.hpp>
#include <map>
#include <stdexcept>

namespace coexec {
using namespace std;

static map<status, const char *> status_names = boost::assign::map_list_of
    (status::QUEUED, "queued")
    (status::EXECUTING, "executing")
    (status::COMPLETED, "completed")
    (status::FAILED, "failed")
    (status::TIMEOUT, "timeout")
    (status::CANCELLED, "cancelled");

static map<status, const char *> display_messages = boost::assign::map_list_of
    (status::QUEUED, "Waiting for a free execution slot")
    (status::EXECUTING, "Running")
    (status::COMPLETED, "Finished successfully")
    (status::FAILED, "Failed")
    (status::TIMEOUT, "Time limit exceeded")
    (status::CANCELLED, "Cancelled by submitter");

const char *get_status_name(status stat) {
    return status_names.at(stat);
}

const char *get_display_message(status stat) {
    return display_messages.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, stat_name] : status_names)
        if (name == stat_name)
            return stat;
    throw invalid_argument("unrecognized status " + name);
}

bool is_terminal(status stat) {
    return stat != status::QUEUED && stat != status::EXECUTING;
}

}  // namespace coexec
