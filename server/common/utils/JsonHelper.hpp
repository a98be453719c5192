#pragma once

#include <json/json.h>

#include <sstream>
#include <stdexcept>

/**
 * @brief JSON 序列化/反序列化辅助工具
 *
 * 统一 JSON 操作，避免重复的 StreamWriterBuilder 配置代码
 */
namespace JsonHelper {

/**
 * @brief 将 Json::Value 序列化为紧凑字符串（无换行、无缩进）
 */
inline std::string serialize(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

/**
 * @brief 将字符串反序列化为 Json::Value
 * @throws std::runtime_error 解析失败时抛出
 */
inline Json::Value parse(const std::string& jsonStr) {
    Json::CharReaderBuilder reader;
    Json::Value result;
    std::string errs;
    std::istringstream iss(jsonStr);
    if (!Json::parseFromStream(reader, iss, &result, &errs)) {
        throw std::runtime_error("JSON parse error: " + errs);
    }
    return result;
}

/**
 * @brief 递归检查是否所有数值都是有限数（NaN/Inf 无法写成合法 JSON）
 */
inline bool allNumbersFinite(const Json::Value& value) {
    if (value.isDouble()) {
        return std::isfinite(value.asDouble());
    }
    if (value.isArray() || value.isObject()) {
        for (const auto& child : value) {
            if (!allNumbersFinite(child)) return false;
        }
    }
    return true;
}

/**
 * @brief 读取可选字符串字段（缺失或 null 返回 nullopt）
 */
inline std::optional<std::string> optionalString(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key) || obj[key].isNull()) return std::nullopt;
    if (!obj[key].isString()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a string");
    }
    return obj[key].asString();
}

/**
 * @brief 写入可选字符串字段（nullopt 写为 null）
 */
inline void setOptional(Json::Value& obj, const char* key, const std::optional<std::string>& value) {
    obj[key] = value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

}  // namespace JsonHelper
