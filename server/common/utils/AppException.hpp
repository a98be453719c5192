#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest)
        : code_(code), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
};

/**
 * @brief 通用异常 - 资源不存在
 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在")
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound) {}
};

/**
 * @brief 通用异常 - 验证失败
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::BAD_REQUEST, message, k400BadRequest) {}
};

/**
 * @brief 通用异常 - 数据冲突
 *
 * 服务层在并发冲突重试耗尽后抛出，客户端可重新提交命令。
 */
class ConflictException : public AppException {
public:
    explicit ConflictException(const std::string& message = "数据冲突，请重试")
        : AppException(ErrorCodes::CONFLICT, message, k409Conflict) {}
};

// ==================== 事件溯源异常 ====================

/**
 * @brief 并发冲突 - 期望版本与聚合当前版本不一致
 *
 * 调用方应重新加载聚合后重试，不应在旧状态上重放命令。
 */
class ConcurrencyError : public AppException {
private:
    std::string aggregateId_;
    int64_t expectedVersion_;
    int64_t actualVersion_;

public:
    /**
     * @param actualVersion 存储中的当前版本，未知时为 -1（唯一约束冲突）
     */
    ConcurrencyError(std::string aggregateId, int64_t expectedVersion, int64_t actualVersion)
        : AppException(ErrorCodes::CONCURRENCY_CONFLICT,
              "Concurrency conflict for aggregate " + aggregateId
                  + ": expected version " + std::to_string(expectedVersion)
                  + (actualVersion >= 0
                         ? ", current version is " + std::to_string(actualVersion)
                         : ", version already taken by a concurrent writer"),
              k409Conflict)
        , aggregateId_(std::move(aggregateId))
        , expectedVersion_(expectedVersion)
        , actualVersion_(actualVersion) {}

    const std::string& aggregateId() const { return aggregateId_; }
    int64_t expectedVersion() const { return expectedVersion_; }
    int64_t actualVersion() const { return actualVersion_; }
};

/**
 * @brief 配置错误 - 订阅或聚合行为定义非法
 */
class ConfigurationError : public AppException {
public:
    explicit ConfigurationError(const std::string& message)
        : AppException(ErrorCodes::CONFIGURATION_INVALID, message, k500InternalServerError) {}
};

/**
 * @brief 处理器执行错误
 *
 * 只作为 PublishResult 中的失败记录出现，publish 本身不会抛出。
 */
class HandlerExecutionError : public AppException {
private:
    uint64_t subscriptionId_;
    std::string handlerName_;
    std::string eventId_;
    std::string eventType_;
    bool cancelled_;

public:
    HandlerExecutionError(uint64_t subscriptionId, std::string handlerName,
                          std::string eventId, std::string eventType,
                          const std::string& cause, bool cancelled = false)
        : AppException(ErrorCodes::HANDLER_FAILED,
              "Error handling event " + eventType + " (" + eventId + ") in "
                  + handlerName + ": " + cause,
              k500InternalServerError)
        , subscriptionId_(subscriptionId)
        , handlerName_(std::move(handlerName))
        , eventId_(std::move(eventId))
        , eventType_(std::move(eventType))
        , cancelled_(cancelled) {}

    uint64_t subscriptionId() const { return subscriptionId_; }
    const std::string& handlerName() const { return handlerName_; }
    const std::string& eventId() const { return eventId_; }
    const std::string& eventType() const { return eventType_; }
    bool cancelled() const { return cancelled_; }
};

/**
 * @brief 存储不可用 - 后端无法访问，未写入任何数据
 */
class StoreUnavailableError : public AppException {
public:
    explicit StoreUnavailableError(const std::string& message)
        : AppException(ErrorCodes::STORE_UNAVAILABLE, message, k503ServiceUnavailable) {}
};

/**
 * @brief 序列化错误 - 事件负载或聚合状态无法编码/解码
 */
class SerializationError : public AppException {
public:
    explicit SerializationError(const std::string& message)
        : AppException(ErrorCodes::SERIALIZATION_FAILED, message, k422UnprocessableEntity) {}
};

/**
 * @brief 重放错误 - reducer 失败或事件流断档，本次加载失败
 */
class ReplayError : public AppException {
private:
    std::string aggregateId_;
    int64_t version_;

public:
    ReplayError(std::string aggregateId, int64_t version, const std::string& cause)
        : AppException(ErrorCodes::REPLAY_FAILED,
              "Replay failed for aggregate " + aggregateId + " at version "
                  + std::to_string(version) + ": " + cause,
              k500InternalServerError)
        , aggregateId_(std::move(aggregateId))
        , version_(version) {}

    const std::string& aggregateId() const { return aggregateId_; }
    int64_t version() const { return version_; }
};
