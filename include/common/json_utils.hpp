#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 沿着 keys 逐层查找 json 子节点
 * @return 子节点的指针，任一层不存在时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2, ' ', false, json::error_handler_t::replace);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

/**
 * @brief 读取必须存在的字段
 * @throw std::invalid_argument 字段不存在或者类型不匹配时
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选字段，字段不存在或者为 null 时返回 def_value
 * @throw std::invalid_argument 字段存在但类型不匹配时
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 字段存在时才覆盖 value
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&... keys) {
    value = get_value_def<T>(j, value, keys...);
}

}  // namespace nlohmann
