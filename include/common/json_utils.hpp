#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 构造一个说明 key 的值不合法的异常
 * 只给出 key 以及实际的类型，不输出值本身，提交中的源代码和测试数据可能很大
 */
inline std::invalid_argument build_invalid_argument(const json &j, const std::string &key) {
    if (!j.is_object()) return std::invalid_argument("expected an object holding \"" + key + "\", got " + j.type_name());
    if (!j.contains(key)) return std::invalid_argument("missing field \"" + key + "\"");
    return std::invalid_argument("unexpected type of field \"" + key + "\": " + j.at(key).type_name());
}

/**
 * @brief 读取必须存在的字段
 * @throw std::invalid_argument 字段不存在或者类型不对
 */
template <typename T>
T get_value(const json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null())
        throw build_invalid_argument(j, key);
    try {
        return j.at(key).get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, key);
    }
}

/**
 * @brief 读取可选字段，字段不存在或为 null 时不修改 value
 * @throw std::invalid_argument 字段存在但是类型不对
 */
template <typename T>
void assign_optional(const json &j, T &value, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) return;
    try {
        j.at(key).get_to(value);
    } catch (json::exception &) {
        throw build_invalid_argument(j, key);
    }
}

/**
 * @brief 判断字符串是否为合法的 UTF-8
 * JSON 字符串只能承载 UTF-8 文本，不合法的字节序列无法原样发送给沙箱
 */
inline bool is_valid_utf8(const std::string &text) {
    try {
        json(text).dump(-1, ' ', false, json::error_handler_t::strict);
        return true;
    } catch (json::type_error &) {
        return false;
    }
}

}  // namespace nlohmann
