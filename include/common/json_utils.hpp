#pragma once

#include <nlohmann/json.hpp>

namespace nlohmann {

/**
 * @brief 按照 keys 逐层查找 JSON 对象中的值
 * @code{.cpp}
 *     // 相当于 j["compiler"]["CC"]，但是不存在时返回 nullptr 而不是插入或抛出异常
 *     const json *cc = find_path(j, "compiler", "CC");
 * @endcode
 * @return 找到的值，中途任何一层不是对象或者不存在时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, const Keys &... keys) {
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

/**
 * @brief 判断 keys 对应的值是否存在且不为 null
 */
template <typename... Keys>
bool exists(const json &j, const Keys &... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

}  // namespace nlohmann
