#include "broadcaster.hpp"
#include <glog/logging.h>
#include <vector>

namespace coexec {
using namespace std;

broadcast_channel::~broadcast_channel() {}

event_broadcaster::event_broadcaster(broadcast_channel *channel)
    : channel(channel) {}

event_broadcaster::~event_broadcaster() {
    stop();
}

void event_broadcaster::start() {
    if (running.exchange(true)) return;
    dispatcher = thread([this] { dispatch_loop(); });
}

void event_broadcaster::stop() {
    running = false;
    if (dispatcher.joinable()) dispatcher.join();

    // 分发线程退出后仍然可能有事件入队
    pair<string, execution_event> item;
    while (queue.try_pop(item))
        deliver(item.first, item.second);
}

void event_broadcaster::publish(const string &room_id, execution_event event) {
    queue.push({room_id, move(event)});
}

unsigned event_broadcaster::subscribe(const string &room_id, subscriber callback) {
    lock_guard<mutex> lock(subscribers_mut);
    unsigned id = next_subscriber++;
    subscribers[id] = {room_id, move(callback)};
    return id;
}

void event_broadcaster::unsubscribe(unsigned id) {
    lock_guard<mutex> lock(subscribers_mut);
    subscribers.erase(id);
}

size_t event_broadcaster::delivered() const {
    return delivered_count.load();
}

void event_broadcaster::dispatch_loop() {
    pair<string, execution_event> item;
    while (true) {
        if (queue.try_pop_for(item, chrono::milliseconds(100))) {
            deliver(item.first, item.second);
        } else if (!running) {
            break;
        }
    }
}

void event_broadcaster::deliver(const string &room_id, const execution_event &event) {
    if (channel) {
        try {
            channel->publish(room_id, event);
        } catch (exception &e) {
            LOG(ERROR) << "failed to broadcast " << get_event_name(event.type) << " of execution " << event.execution_id
                       << " to room " << room_id << ": " << e.what();
        }
    }

    vector<subscriber> targets;
    {
        lock_guard<mutex> lock(subscribers_mut);
        for (auto &[id, entry] : subscribers)
            if (entry.first.empty() || entry.first == room_id)
                targets.push_back(entry.second);
    }
    for (auto &target : targets) {
        try {
            target(event);
        } catch (exception &e) {
            LOG(ERROR) << "event subscriber failed on " << get_event_name(event.type) << " of execution " << event.execution_id << ": " << e.what();
        }
    }
    ++delivered_count;
}

}  // namespace coexec
