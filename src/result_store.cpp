#include "result_store.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace coexec {
using namespace std;

result_store::result_store(chrono::milliseconds retention_window)
    : retention_window(retention_window) {}

void result_store::record(const execution_result &result) {
    if (!is_terminal(result.stat))
        throw internal_error("cannot record result of execution " + result.id + " in state " + get_status_name(result.stat));

    lock_guard<mutex> lock(mut);
    if (!results.emplace(result.id, result).second)
        throw internal_error("result of execution " + result.id + " has already been recorded");

    // 结果几乎总是按结束时间顺序写入，从尾部向前找插入位置
    auto &index = room_index[result.room_id];
    auto pos = index.end();
    while (pos != index.begin() && results.at(*prev(pos)).ended_at > result.ended_at) --pos;
    index.insert(pos, result.id);
}

optional<execution_result> result_store::find(const string &id) const {
    lock_guard<mutex> lock(mut);
    auto it = results.find(id);
    if (it == results.end()) return nullopt;
    return it->second;
}

vector<execution_result> result_store::history(const string &room_id, size_t limit) const {
    lock_guard<mutex> lock(mut);
    vector<execution_result> list;
    auto it = room_index.find(room_id);
    if (it == room_index.end()) return list;
    auto &index = it->second;
    for (auto id = index.rbegin(); id != index.rend() && list.size() < limit; ++id)
        list.push_back(results.at(*id));
    return list;
}

size_t result_store::sweep(chrono::system_clock::time_point now) {
    lock_guard<mutex> lock(mut);
    auto threshold = now - retention_window;
    size_t removed = 0;
    for (auto room = room_index.begin(); room != room_index.end();) {
        auto &index = room->second;
        auto first_kept = find_if(index.begin(), index.end(), [&](const string &id) {
            return results.at(id).ended_at >= threshold;
        });
        for (auto id = index.begin(); id != first_kept; ++id) results.erase(*id);
        removed += distance(index.begin(), first_kept);
        index.erase(index.begin(), first_kept);

        if (index.empty())
            room = room_index.erase(room);
        else
            ++room;
    }
    if (removed > 0)
        LOG(INFO) << "removed " << removed << " expired execution results";
    return removed;
}

execution_statistics result_store::statistics() const {
    lock_guard<mutex> lock(mut);
    execution_statistics stats;
    for (auto &[id, result] : results) {
        ++stats.total;
        switch (result.stat) {
            case status::COMPLETED:
                ++stats.completed;
                break;
            case status::FAILED:
                ++stats.failed;
                break;
            case status::TIMEOUT:
                ++stats.failed;
                ++stats.timed_out;
                break;
            case status::CANCELLED:
                ++stats.cancelled;
                break;
            default:
                break;
        }
    }
    stats.success_rate = stats.total == 0 ? 0 : stats.completed * 100.0 / stats.total;
    return stats;
}

size_t result_store::size() const {
    lock_guard<mutex> lock(mut);
    return results.size();
}

}  // namespace coexec
