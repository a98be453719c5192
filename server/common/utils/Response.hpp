#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 统一响应体 {code, message, data?}
 *
 * 成功时 code 为 0；失败响应一般由 AppExceptionHandler 生成，
 * 这里的 error 系列只用于控制器内的参数检查。
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpStatusCode = drogon::HttpStatusCode;

    static HttpResponsePtr ok(const Json::Value& data = Json::Value::null,
                              const std::string& message = "Success") {
        return envelope(0, message, data, drogon::k200OK);
    }

    static HttpResponsePtr created(const Json::Value& data, const std::string& message = "Created") {
        return envelope(0, message, data, drogon::k201Created);
    }

    /** @brief 列表响应 {list, total} */
    static HttpResponsePtr list(const Json::Value& items) {
        Json::Value data;
        data["list"] = items.isNull() ? Json::Value(Json::arrayValue) : items;
        data["total"] = static_cast<Json::UInt>(items.size());
        return ok(data);
    }

    static HttpResponsePtr error(int code, const std::string& message,
                                 HttpStatusCode status = drogon::k400BadRequest) {
        return envelope(code, message, Json::Value::null, status);
    }

    static HttpResponsePtr notFound(const std::string& message) {
        return error(ErrorCodes::NOT_FOUND, message, drogon::k404NotFound);
    }

    static HttpResponsePtr badRequest(const std::string& message) {
        return error(ErrorCodes::BAD_REQUEST, message, drogon::k400BadRequest);
    }

private:
    static HttpResponsePtr envelope(int code, const std::string& message,
                                    const Json::Value& data, HttpStatusCode status) {
        Json::Value body;
        body["code"] = code;
        body["message"] = message;
        if (!data.isNull()) body["data"] = data;

        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(status);
        return resp;
    }
};
