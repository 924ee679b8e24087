#include "watchdog.hpp"
#include <glog/logging.h>
#include <exception>

namespace coexec {
using namespace std;

watchdog::watchdog() {
    worker = thread([this] { loop(); });
}

watchdog::~watchdog() {
    stop();
}

unsigned watchdog::arm(clock::time_point deadline, callback on_expire) {
    unsigned id;
    {
        lock_guard<mutex> lock(mut);
        id = next_id++;
        deadlines.insert({deadline, id});
        entries[id] = {deadline, move(on_expire)};
    }
    cond.notify_one();
    return id;
}

void watchdog::disarm(unsigned id) {
    lock_guard<mutex> lock(mut);
    auto it = entries.find(id);
    if (it == entries.end()) return;
    deadlines.erase({it->second.first, id});
    entries.erase(it);
}

size_t watchdog::armed() const {
    lock_guard<mutex> lock(mut);
    return entries.size();
}

void watchdog::stop() {
    {
        lock_guard<mutex> lock(mut);
        stopped = true;
        deadlines.clear();
        entries.clear();
    }
    cond.notify_one();
    if (worker.joinable()) worker.join();
}

void watchdog::loop() {
    unique_lock<mutex> lock(mut);
    while (!stopped) {
        if (deadlines.empty()) {
            cond.wait(lock);
            continue;
        }

        auto [deadline, id] = *deadlines.begin();
        if (clock::now() < deadline) {
            cond.wait_until(lock, deadline);
            continue;
        }

        deadlines.erase(deadlines.begin());
        callback on_expire = move(entries.at(id).second);
        entries.erase(id);

        lock.unlock();
        try {
            on_expire();
        } catch (exception &e) {
            LOG(ERROR) << "watchdog callback failed: " << e.what();
        }
        lock.lock();
    }
}

}  // namespace coexec
