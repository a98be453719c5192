#pragma once

#include "AppException.hpp"
#include "ErrorCodes.hpp"

/**
 * @brief 全局异常处理器
 *
 * 将 AppException 转换为对应 HTTP 状态码的 JSON 响应，
 * 并发冲突附带版本信息；其他异常统一返回 500 错误
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static void setup() {
        drogon::app().setExceptionHandler([](const std::exception& e,
                                       const HttpRequestPtr& req,
                                       std::function<void (const HttpResponsePtr &)> &&callback) {
            auto json = toJson(e);
            auto status = static_cast<HttpStatusCode>(json["status"].asInt());

            if (status >= k500InternalServerError) {
                LOG_ERROR << req->methodString() << " " << req->path() << " failed: " << e.what();
            } else if (status == k409Conflict) {
                LOG_WARN << req->methodString() << " " << req->path() << ": " << e.what();
            }

            auto resp = HttpResponse::newHttpJsonResponse(json);
            resp->setStatusCode(status);
            callback(resp);
        });
    }

    /**
     * @brief 异常 → {code, message, status[, details]}
     */
    static Json::Value toJson(const std::exception& e) {
        Json::Value json;
        HttpStatusCode status = k500InternalServerError;

        if (const auto* appEx = dynamic_cast<const AppException*>(&e)) {
            json["code"] = appEx->getCode();
            json["message"] = appEx->getMessage();
            status = appEx->getStatus();

            if (const auto* conflict = dynamic_cast<const ConcurrencyError*>(&e)) {
                Json::Value details;
                details["aggregateId"] = conflict->aggregateId();
                details["expectedVersion"] = static_cast<Json::Int64>(conflict->expectedVersion());
                details["actualVersion"] = static_cast<Json::Int64>(conflict->actualVersion());
                json["details"] = details;
            } else if (const auto* replay = dynamic_cast<const ReplayError*>(&e)) {
                Json::Value details;
                details["aggregateId"] = replay->aggregateId();
                details["version"] = static_cast<Json::Int64>(replay->version());
                json["details"] = details;
            }
        } else {
            json["code"] = ErrorCodes::INTERNAL_ERROR;
            json["message"] = "服务器内部错误";
        }

        json["status"] = static_cast<int>(status);
        return json;
    }
};
