#include "engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "worker.hpp"

namespace coexec {
using namespace std;

const char *get_cancel_outcome_name(cancel_outcome outcome) {
    switch (outcome) {
        case cancel_outcome::CANCELLED:
            return "cancelled";
        case cancel_outcome::NOT_FOUND:
            return "not_found";
        case cancel_outcome::NOT_CANCELLABLE:
            return "not_cancellable";
    }
    return "unknown";
}

static event_type terminal_event_type(status stat) {
    switch (stat) {
        case status::COMPLETED:
            return event_type::COMPLETED;
        case status::CANCELLED:
            return event_type::CANCELLED;
        default:
            return event_type::FAILED;
    }
}

execution_engine::execution_engine(engine_config config, shared_ptr<sandbox::sandbox> box, broadcast_channel *channel)
    : cfg(move(config)), validator(cfg), box(move(box)), results(cfg.retention_window), broadcaster(channel) {
    broadcaster.start();
    sweeper = thread([this] { sweeper_loop(); });
    LOG(INFO) << fmt::format("execution engine started: {} concurrent executions and {} queued requests per room, timeout {}ms",
                             cfg.max_concurrent_executions, cfg.max_queue_size, cfg.execution_timeout.count());
}

execution_engine::~execution_engine() {
    shutdown();
}

shared_ptr<execution_engine::room_state> execution_engine::find_room(const string &room_id) const {
    lock_guard<mutex> lock(rooms_mut);
    auto it = rooms.find(room_id);
    return it == rooms.end() ? nullptr : it->second;
}

shared_ptr<execution_engine::room_state> execution_engine::get_or_create_room(const string &room_id) {
    lock_guard<mutex> lock(rooms_mut);
    auto &room = rooms[room_id];
    if (!room) room = make_shared<room_state>();
    return room;
}

shared_ptr<execution_engine::room_state> execution_engine::lock_room(const string &room_id, unique_lock<mutex> &lock) {
    while (true) {
        auto room = get_or_create_room(room_id);
        lock = unique_lock<mutex>(room->mut);
        if (!room->retired) return room;
        lock.unlock();
    }
}

void execution_engine::release_room_if_idle(const string &room_id) {
    lock_guard<mutex> rooms_lock(rooms_mut);
    auto it = rooms.find(room_id);
    if (it == rooms.end()) return;
    auto &room = *it->second;
    lock_guard<mutex> lock(room.mut);
    if (!room.queue.empty() || !room.active.empty() || !room.user_index.empty()) return;
    room.retired = true;
    rooms.erase(it);
    DLOG(INFO) << "room " << room_id << " is idle, released";
}

void execution_engine::check_admission(const room_state &room, const user_info &user) const {
    if (room.user_index.count(user.user_id))
        throw admission_error(admission_reason::CONCURRENT_EXECUTION_LIMIT,
                              "User " + user.user_id + " already has an execution in progress in this room");
    if (room.queue.size() >= cfg.max_queue_size && room.active.size() >= cfg.max_concurrent_executions)
        throw admission_error(admission_reason::QUEUE_FULL,
                              fmt::format("Execution queue is full (max {} queued requests)", cfg.max_queue_size));
}

execution_event execution_engine::make_event(event_type type, const execution_request &request) const {
    execution_event event;
    event.type = type;
    event.execution_id = request.id;
    event.room_id = request.room_id;
    event.user = request.user;
    event.language = request.language;
    event.timestamp = chrono::system_clock::now();
    return event;
}

submission_ticket execution_engine::submit_execution(const string &room_id, const user_info &user, const string &language,
                                                     const string &code, const string &input) {
    if (stopped)
        throw admission_error(admission_reason::ENGINE_STOPPED, "Execution engine is shutting down");

    // 先做便宜的准入检查，校验可能比较耗时，不在房间锁内进行
    if (auto room = find_room(room_id)) {
        lock_guard<mutex> lock(room->mut);
        check_admission(*room, user);
    }

    validation_report report = validator.validate(language, code);
    validator.validate_input(language, input);

    auto pending = make_shared<pending_execution>();
    execution_request &request = pending->request;
    request.id = generate_execution_id();
    request.room_id = room_id;
    request.user = user;
    request.language = language;
    request.code = code;
    request.input = input;
    request.submitted_at = chrono::system_clock::now();
    request.stat = status::QUEUED;
    request.complexity = report.complexity;
    pending->future = pending->promise.get_future().share();

    submission_ticket ticket;
    ticket.execution_id = request.id;
    ticket.complexity = report.complexity;
    ticket.result = pending->future;

    {
        unique_lock<mutex> lock;
        auto room = lock_room(room_id, lock);
        if (stopped)
            throw admission_error(admission_reason::ENGINE_STOPPED, "Execution engine is shutting down");
        // 校验期间可能有其他请求进入了房间
        check_admission(*room, user);

        room->queue.push_back(pending);
        room->user_index[user.user_id] = request.id;

        int64_t average = cfg.average_execution_time.count();
        ticket.position = room->queue.size();
        ticket.estimated_wait_ms = ticket.position * average + (room->active.size() >= cfg.max_concurrent_executions ? average : 0);

        execution_event event = make_event(event_type::QUEUED, request);
        event.position = ticket.position;
        event.estimated_wait_ms = ticket.estimated_wait_ms;
        broadcaster.publish(room_id, move(event));

        LOG(INFO) << fmt::format("execution {} of user {} queued in room {} at position {}", ticket.execution_id, user.user_id, room_id, ticket.position);

        drain(room_id, *room);
    }

    // 请求可能启动失败并立即结束
    release_room_if_idle(room_id);
    reap_workers();
    return ticket;
}

string execution_engine::request_execution(const string &room_id, const user_info &user, const string &language,
                                           const string &code, const string &input) {
    return submit_execution(room_id, user, language, code, input).execution_id;
}

cancel_outcome execution_engine::cancel_execution(const string &room_id, const string &user_id) {
    auto room = find_room(room_id);
    if (!room) return cancel_outcome::NOT_FOUND;

    cancel_outcome outcome;
    {
        lock_guard<mutex> lock(room->mut);
        auto user_it = room->user_index.find(user_id);
        if (user_it == room->user_index.end()) {
            outcome = cancel_outcome::NOT_FOUND;
        } else {
            string execution_id = user_it->second;
            auto it = find_if(room->queue.begin(), room->queue.end(), [&](const shared_ptr<pending_execution> &pending) {
                return pending->request.id == execution_id;
            });
            if (it == room->queue.end()) {
                LOG(INFO) << "execution " << execution_id << " of user " << user_id << " is already running and cannot be cancelled";
                outcome = cancel_outcome::NOT_CANCELLABLE;
            } else {
                auto pending = *it;
                room->queue.erase(it);

                execution_result result = make_result(pending->request, status::CANCELLED, chrono::system_clock::now());
                result.error = "Cancelled by user";
                settle(room_id, *room, *pending, result);
                LOG(INFO) << "execution " << execution_id << " of user " << user_id << " cancelled in room " << room_id;

                drain(room_id, *room);
                outcome = cancel_outcome::CANCELLED;
            }
        }
    }

    if (outcome == cancel_outcome::CANCELLED) release_room_if_idle(room_id);
    reap_workers();
    return outcome;
}

void execution_engine::drain(const string &room_id, room_state &room) {
    while (room.active.size() < cfg.max_concurrent_executions && !room.queue.empty()) {
        auto pending = room.queue.front();
        room.queue.pop_front();
        start_execution(room_id, room, pending);
    }
}

void execution_engine::start_execution(const string &room_id, room_state &room, const shared_ptr<pending_execution> &pending) {
    execution_request &request = pending->request;
    request.stat = status::EXECUTING;
    request.started_at = chrono::system_clock::now();
    room.active[request.id] = pending;

    broadcaster.publish(room_id, make_event(event_type::STARTED, request));

    string execution_id = request.id;
    auto deadline = watchdog::clock::now() + cfg.execution_timeout + cfg.watchdog_grace;
    pending->watchdog_id = dog.arm(deadline, [this, room_id, execution_id] {
        on_watchdog_expired(room_id, execution_id);
    });

    try {
        const language_policy &policy = cfg.get_language(request.language);
        thread worker = start_worker(*box, request, policy, cfg.execution_timeout,
                                     [this, room_id, execution_id](execution_result result) {
                                         on_worker_finished(room_id, execution_id, move(result));
                                     });
        lock_guard<mutex> lock(workers_mut);
        workers[execution_id] = move(worker);
    } catch (system_error &e) {
        LOG(ERROR) << "unable to start worker for execution " << execution_id << ": " << e.what();
        execution_result result = make_result(request, status::FAILED, chrono::system_clock::now());
        result.error = fmt::format("Internal error: unable to start execution: {}", e.what());
        settle(room_id, room, *pending, result);
    } catch (validation_error &e) {
        execution_result result = make_result(request, status::FAILED, chrono::system_clock::now());
        result.error = e.what();
        settle(room_id, room, *pending, result);
    }
}

void execution_engine::settle(const string &room_id, room_state &room, pending_execution &pending, const execution_result &result) {
    pending.settled = true;
    pending.request.stat = result.stat;
    if (pending.watchdog_id) dog.disarm(pending.watchdog_id);

    room.active.erase(result.id);
    auto user_it = room.user_index.find(result.user.user_id);
    if (user_it != room.user_index.end() && user_it->second == result.id)
        room.user_index.erase(user_it);

    // 先写入结果存储，观察者收到终止事件时就能查到结果
    try {
        results.record(result);
    } catch (internal_error &e) {
        LOG(ERROR) << "internal fault: " << e;
    }

    execution_event event = make_event(terminal_event_type(result.stat), pending.request);
    event.result = result;
    broadcaster.publish(room_id, move(event));

    LOG(INFO) << fmt::format("execution {} in room {} finished as {} in {}ms", result.id, room_id, get_status_name(result.stat), result.duration_ms);
    pending.promise.set_value(result);
}

void execution_engine::on_worker_finished(const string &room_id, const string &execution_id, execution_result result) {
    auto room = find_room(room_id);
    if (room) {
        lock_guard<mutex> lock(room->mut);
        auto it = room->active.find(execution_id);
        if (it == room->active.end() || it->second->settled) {
            LOG(WARNING) << "discarding late result of execution " << execution_id << " already settled by watchdog";
        } else {
            auto pending = it->second;
            settle(room_id, *room, *pending, result);
            drain(room_id, *room);
        }
    }
    release_room_if_idle(room_id);

    {
        lock_guard<mutex> lock(workers_mut);
        finished_workers.push_back(execution_id);
    }
    workers_cond.notify_all();
}

void execution_engine::on_watchdog_expired(const string &room_id, const string &execution_id) {
    auto room = find_room(room_id);
    if (!room) return;

    {
        lock_guard<mutex> lock(room->mut);
        auto it = room->active.find(execution_id);
        if (it == room->active.end() || it->second->settled) return;

        auto pending = it->second;
        LOG(ERROR) << "execution " << execution_id << " did not return within "
                   << (cfg.execution_timeout + cfg.watchdog_grace).count() << "ms, forcing timeout";
        execution_result result = make_result(pending->request, status::TIMEOUT, chrono::system_clock::now());
        result.error = fmt::format("Execution timed out after {}ms", cfg.execution_timeout.count());
        pending->watchdog_id = 0;
        settle(room_id, *room, *pending, result);
        drain(room_id, *room);
    }
    release_room_if_idle(room_id);
}

void execution_engine::reap_workers() {
    vector<thread> finished;
    {
        lock_guard<mutex> lock(workers_mut);
        for (auto &id : finished_workers) {
            auto it = workers.find(id);
            if (it == workers.end()) continue;
            finished.push_back(move(it->second));
            workers.erase(it);
        }
        finished_workers.clear();
    }
    for (auto &th : finished)
        th.join();
}

void execution_engine::sweeper_loop() {
    unique_lock<mutex> lock(sweeper_mut);
    while (!stopped) {
        sweeper_cond.wait_for(lock, cfg.cleanup_interval, [this] { return stopped.load(); });
        if (stopped) break;
        lock.unlock();
        sweep_results();
        reap_workers();
        lock.lock();
    }
}

size_t execution_engine::sweep_results() {
    return results.sweep(chrono::system_clock::now());
}

room_status execution_engine::get_room_status(const string &room_id) const {
    room_status snapshot;
    snapshot.room_id = room_id;
    snapshot.max_concurrent = cfg.max_concurrent_executions;

    auto room = find_room(room_id);
    if (!room) return snapshot;

    lock_guard<mutex> lock(room->mut);
    size_t position = 0;
    for (auto &pending : room->queue) {
        room_status_entry entry;
        entry.execution_id = pending->request.id;
        entry.user = pending->request.user;
        entry.language = pending->request.language;
        entry.stat = pending->request.stat;
        entry.submitted_at = pending->request.submitted_at;
        entry.position = ++position;
        snapshot.queued.push_back(entry);
    }
    for (auto &[id, pending] : room->active) {
        room_status_entry entry;
        entry.execution_id = id;
        entry.user = pending->request.user;
        entry.language = pending->request.language;
        entry.stat = pending->request.stat;
        entry.submitted_at = pending->request.submitted_at;
        entry.started_at = pending->request.started_at;
        snapshot.active.push_back(entry);
    }
    sort(snapshot.active.begin(), snapshot.active.end(), [](const room_status_entry &a, const room_status_entry &b) {
        return *a.started_at < *b.started_at;
    });
    snapshot.queue_length = snapshot.queued.size();
    snapshot.active_count = snapshot.active.size();
    return snapshot;
}

vector<execution_result> execution_engine::get_room_history(const string &room_id, size_t limit) const {
    return results.history(room_id, limit == 0 ? cfg.history_limit : limit);
}

execution_statistics execution_engine::get_statistics() const {
    execution_statistics stats = results.statistics();
    vector<shared_ptr<room_state>> snapshot;
    {
        lock_guard<mutex> lock(rooms_mut);
        for (auto &[id, room] : rooms) snapshot.push_back(room);
    }
    for (auto &room : snapshot) {
        lock_guard<mutex> lock(room->mut);
        stats.queued += room->queue.size();
        stats.active += room->active.size();
    }
    return stats;
}

optional<execution_result> execution_engine::get_result(const string &execution_id) const {
    return results.find(execution_id);
}

event_broadcaster &execution_engine::events() {
    return broadcaster;
}

const engine_config &execution_engine::config() const {
    return cfg;
}

size_t execution_engine::room_count() const {
    lock_guard<mutex> lock(rooms_mut);
    return rooms.size();
}

void execution_engine::shutdown() {
    call_once(shutdown_flag, [this] {
        LOG(INFO) << "execution engine shutting down";
        stopped = true;

        vector<pair<string, shared_ptr<room_state>>> snapshot;
        {
            lock_guard<mutex> lock(rooms_mut);
            for (auto &[id, room] : rooms) snapshot.emplace_back(id, room);
        }
        for (auto &[room_id, room] : snapshot) {
            lock_guard<mutex> lock(room->mut);
            while (!room->queue.empty()) {
                auto pending = room->queue.front();
                room->queue.pop_front();
                execution_result result = make_result(pending->request, status::CANCELLED, chrono::system_clock::now());
                result.error = "Execution engine is shutting down";
                settle(room_id, *room, *pending, result);
            }
        }

        {
            unique_lock<mutex> lock(workers_mut);
            workers_cond.wait(lock, [this] { return finished_workers.size() >= workers.size(); });
        }
        reap_workers();

        {
            lock_guard<mutex> lock(sweeper_mut);
        }
        sweeper_cond.notify_all();
        if (sweeper.joinable()) sweeper.join();
        dog.stop();
        broadcaster.stop();
        LOG(INFO) << "execution engine stopped";
    });
}

}  // namespace coexec
