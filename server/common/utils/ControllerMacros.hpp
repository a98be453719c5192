#pragma once

#include "AppException.hpp"

/**
 * @brief Controller 工具函数
 *
 * 提供 Controller 常用的辅助函数
 */
namespace ControllerUtils {

/** 请求携带关联 id 的头部 */
inline constexpr const char* CORRELATION_HEADER = "X-Correlation-Id";

/**
 * @brief 从请求中获取 JSON 请求体
 * @throws ValidationException 请求体不是 JSON 对象
 */
inline std::shared_ptr<Json::Value> requireJson(const drogon::HttpRequestPtr& req) {
    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        throw ValidationException("请求体格式错误，需要 JSON 对象");
    }
    return json;
}

/**
 * @brief 读取请求的关联 id，未携带时为空
 */
inline std::optional<std::string> getCorrelationId(const drogon::HttpRequestPtr& req) {
    const auto& value = req->getHeader(CORRELATION_HEADER);
    if (value.empty()) return std::nullopt;
    return value;
}

}  // namespace ControllerUtils
