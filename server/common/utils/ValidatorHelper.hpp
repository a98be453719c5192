#pragma once

#include "AppException.hpp"
#include "TimestampHelper.hpp"

/**
 * @brief 参数校验和解析工具类
 *
 * 提供安全的参数解析和统一的 JSON 校验功能
 */
class ValidatorHelper {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;

    // ==================== 安全参数解析 ====================

    /**
     * @brief 安全解析 int64 参数，失败时返回空
     */
    static std::optional<int64_t> tryParseInt64(const std::string& value) {
        if (value.empty()) return std::nullopt;
        int64_t result = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc() || ptr != value.data() + value.size()) return std::nullopt;
        return result;
    }

    /**
     * @brief 读取非负整数查询参数（缺省返回 defaultValue）
     * @throws ValidationException 参数存在但不是非负整数
     */
    static int64_t getNonNegativeInt64Param(const HttpRequestPtr& req, const std::string& name,
                                            int64_t defaultValue = 0) {
        auto raw = req->getParameter(name);
        if (raw.empty()) return defaultValue;
        auto value = tryParseInt64(raw);
        if (!value || *value < 0) {
            throw ValidationException("参数 " + name + " 必须是非负整数");
        }
        return *value;
    }

    /**
     * @brief 读取 ISO-8601 时间查询参数
     * @throws ValidationException 参数存在但格式错误
     */
    static std::optional<TimestampHelper::TimePoint> getTimeParam(const HttpRequestPtr& req,
                                                                  const std::string& name) {
        auto raw = req->getParameter(name);
        if (raw.empty()) return std::nullopt;
        auto value = TimestampHelper::fromIso(raw);
        if (!value) {
            throw ValidationException("参数 " + name + " 必须是 ISO-8601 时间，如 2024-01-01T00:00:00Z");
        }
        return value;
    }

    // ==================== JSON 校验 ====================

    static bool hasNonEmptyString(const Json::Value& json, const std::string& field) {
        return json.isMember(field) && json[field].isString() && !json[field].asString().empty();
    }

    /** 超出 int64 的整数（如 2^63）视为非法，而不是在 asInt64() 处抛 Json::LogicError */
    static bool hasPositiveInt(const Json::Value& json, const std::string& field,
                               int64_t max = std::numeric_limits<int64_t>::max()) {
        return json.isMember(field) && json[field].isInt64()
            && json[field].asInt64() > 0 && json[field].asInt64() <= max;
    }

    static bool hasNonNegativeNumber(const Json::Value& json, const std::string& field) {
        return json.isMember(field) && json[field].isNumeric()
            && std::isfinite(json[field].asDouble()) && json[field].asDouble() >= 0;
    }

    // ==================== 批量校验（返回错误消息） ====================

    /**
     * @brief 校验结果
     */
    struct ValidationResult {
        bool valid = true;
        std::string errorMessage;

        operator bool() const { return valid; }

        static ValidationResult ok() {
            return {true, ""};
        }

        static ValidationResult fail(const std::string& message) {
            return {false, message};
        }

        /**
         * @brief 如果校验失败则抛出 ValidationException
         */
        void throwIfInvalid() const {
            if (!valid) {
                throw ValidationException(errorMessage);
            }
        }
    };

    /**
     * @brief 校验必填的非空字符串字段
     */
    static ValidationResult requireNonEmptyString(const Json::Value& json,
                                                   const std::string& field,
                                                   const std::string& fieldName) {
        if (!hasNonEmptyString(json, field)) {
            return ValidationResult::fail(fieldName + "不能为空");
        }
        return ValidationResult::ok();
    }

    /**
     * @brief 校验必填的正整数字段
     */
    static ValidationResult requirePositiveInt(const Json::Value& json,
                                                const std::string& field,
                                                const std::string& fieldName,
                                                int64_t max = std::numeric_limits<int64_t>::max()) {
        if (!hasPositiveInt(json, field, max)) {
            return ValidationResult::fail(fieldName + "必须是 1-" + std::to_string(max) + " 的整数");
        }
        return ValidationResult::ok();
    }

    /**
     * @brief 校验必填的非负数值字段
     */
    static ValidationResult requireNonNegativeNumber(const Json::Value& json,
                                                      const std::string& field,
                                                      const std::string& fieldName) {
        if (!hasNonNegativeNumber(json, field)) {
            return ValidationResult::fail(fieldName + "必须是非负数");
        }
        return ValidationResult::ok();
    }

    /**
     * @brief 可选字符串字段存在时必须是字符串
     */
    static ValidationResult requireStringIfPresent(const Json::Value& json,
                                                   const std::string& field,
                                                   const std::string& fieldName) {
        if (json.isMember(field) && !json[field].isNull() && !json[field].isString()) {
            return ValidationResult::fail(fieldName + "必须是字符串");
        }
        return ValidationResult::ok();
    }
};
