#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "broadcaster.hpp"
#include "engine.hpp"

namespace coexec {

/**
 * @brief 按行输出 json 对象，可以被多个线程同时调用
 */
struct line_writer {
    explicit line_writer(std::ostream &out);

    void write(const nlohmann::json &j);

private:
    std::mutex mut;
    std::ostream &out;
};

/**
 * @brief 把房间事件按行写出的广播通道
 * 输出形如 {"type":"event","roomId":"r1","event":{...}}
 */
struct stream_channel : broadcast_channel {
    explicit stream_channel(line_writer &writer);

    void publish(const std::string &room_id, const execution_event &event) override;

private:
    line_writer &writer;
};

/**
 * @brief 处理一条命令
 *
 * 支持的命令：
 * 1. {"op":"submit","roomId","userId","displayName","avatar","language","code","input"}
 * 2. {"op":"cancel","roomId","userId"}
 * 3. {"op":"status","roomId"}
 * 4. {"op":"history","roomId","limit"}
 * 5. {"op":"statistics"}
 *
 * 成功时返回 {"type":"response","op":...}，失败时返回
 * {"type":"error","reason":...,"message":...}，reason 为 ConcurrentExecutionLimit、
 * QueueFull、EngineStopped、ValidationError 或 BadRequest
 */
nlohmann::json handle_command(execution_engine &engine, const nlohmann::json &command);

/**
 * @brief 解析并处理一行输入，不会抛出异常
 */
nlohmann::json handle_line(execution_engine &engine, const std::string &line);

}  // namespace coexec
