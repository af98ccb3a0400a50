#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_access {

template <typename Key>
const json *step(const json *ref, const Key &key) {
    if (!ref || !ref->is_object() || !ref->count(key)) return nullptr;
    return &ref->at(key);
}

}  // namespace detail_access

/**
 * @brief 沿着 keys 依次访问 json 对象，返回最终节点
 * @return 节点指针，若路径上任何一个键不存在则返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = detail_access::step(ref, keys)), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
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

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &e) {
        return def_value;
    }
}

template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res || res->is_null()) return;
    try {
        value = res->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
