#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace orbit {

/**
 * @brief 将 JSON 序列化为紧凑的字符串
 * 用户程序的输出是任意字节，可能不是合法的 UTF-8，
 * 非法的字节序列会被替换为 U+FFFD 而不是抛出 type_error。
 */
std::string dump_json(const nlohmann::json &j);

}  // namespace orbit
