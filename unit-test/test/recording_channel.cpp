#include "test/recording_channel.hpp"

namespace coexec::test {
using namespace std;

void recording_channel::publish(const string &room_id, const execution_event &event) {
    {
        lock_guard<mutex> lock(mut);
        recorded.push_back(event);
    }
    cond.notify_all();
}

vector<execution_event> recording_channel::events() const {
    lock_guard<mutex> lock(mut);
    return recorded;
}

vector<event_type> recording_channel::types_of(const string &execution_id) const {
    lock_guard<mutex> lock(mut);
    vector<event_type> types;
    for (auto &event : recorded)
        if (event.execution_id == execution_id) types.push_back(event.type);
    return types;
}

int recording_channel::index_of(const string &execution_id, event_type type) const {
    lock_guard<mutex> lock(mut);
    for (size_t i = 0; i < recorded.size(); ++i)
        if (recorded[i].execution_id == execution_id && recorded[i].type == type) return (int)i;
    return -1;
}

bool recording_channel::wait_for(predicate pred, chrono::milliseconds timeout) const {
    unique_lock<mutex> lock(mut);
    return cond.wait_for(lock, timeout, [&] { return pred(recorded); });
}

bool recording_channel::wait_for_event(const string &execution_id, event_type type, chrono::milliseconds timeout) const {
    return wait_for([&](const vector<execution_event> &events) {
        for (auto &event : events)
            if (event.execution_id == execution_id && event.type == type) return true;
        return false;
    }, timeout);
}

}  // namespace coexec::test
