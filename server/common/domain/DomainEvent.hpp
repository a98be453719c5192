#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 领域事件
 *
 * 不可变值对象：构造后没有任何修改接口，withXxx() 返回新的事件副本。
 * 事件相等性只比较 id。
 *
 * 使用示例：
 * @code
 * DomainEvent placed("OrderPlaced", "order-1", "Order", 1, payload);
 * auto traced = placed.withMetadata("corr-1", std::nullopt, "orders.placed");
 * @endcode
 */
class DomainEvent {
public:
    using TimePoint = TimestampHelper::TimePoint;

    /**
     * @brief 从存储恢复事件时使用的完整字段集
     */
    struct Fields {
        std::string id;
        std::string type;
        TimePoint occurredAt{};
        std::optional<std::string> aggregateId;
        std::optional<std::string> aggregateType;
        int64_t version = 0;
        std::optional<std::string> correlationId;
        std::optional<std::string> causationId;
        std::optional<std::string> topic;
        Json::Value payload{Json::objectValue};
    };

    /**
     * @brief 创建不属于任何聚合流的事件（仅用于总线分发）
     */
    explicit DomainEvent(std::string type, Json::Value payload = Json::Value(Json::objectValue))
        : DomainEvent(Fields{
              .type = std::move(type),
              .payload = std::move(payload)}) {}

    /**
     * @brief 创建聚合流中的事件
     */
    DomainEvent(std::string type, std::string aggregateId, std::string aggregateType,
                int64_t version, Json::Value payload = Json::Value(Json::objectValue))
        : DomainEvent(Fields{
              .type = std::move(type),
              .aggregateId = std::move(aggregateId),
              .aggregateType = std::move(aggregateType),
              .version = version,
              .payload = std::move(payload)}) {}

    /**
     * @brief 按完整字段恢复事件（id、时间缺失时自动生成）
     * @throws ValidationException 类型为空或版本为负
     */
    static DomainEvent restore(Fields fields) {
        return DomainEvent(std::move(fields));
    }

    // ========== 访问器 ==========

    const std::string& id() const { return f_.id; }
    const std::string& type() const { return f_.type; }
    TimePoint occurredAt() const { return f_.occurredAt; }
    const std::optional<std::string>& aggregateId() const { return f_.aggregateId; }
    const std::optional<std::string>& aggregateType() const { return f_.aggregateType; }
    int64_t version() const { return f_.version; }
    const std::optional<std::string>& correlationId() const { return f_.correlationId; }
    const std::optional<std::string>& causationId() const { return f_.causationId; }
    const std::optional<std::string>& topic() const { return f_.topic; }
    const Json::Value& payload() const { return f_.payload; }
    const Fields& fields() const { return f_; }

    // ========== 派生副本 ==========

    /**
     * @brief 返回附加追踪/路由元数据的新事件，未提供的字段保持原值
     */
    DomainEvent withMetadata(std::optional<std::string> correlationId,
                             std::optional<std::string> causationId = std::nullopt,
                             std::optional<std::string> topic = std::nullopt) const {
        Fields copy = f_;
        if (correlationId) copy.correlationId = std::move(correlationId);
        if (causationId) copy.causationId = std::move(causationId);
        if (topic) copy.topic = std::move(topic);
        return DomainEvent(std::move(copy));
    }

    /**
     * @brief 返回由当前事件引发的新事件的追踪信息：沿用 correlation，causation 指向自身
     */
    std::pair<std::string, std::string> traceForFollowUp() const {
        return {f_.correlationId.value_or(f_.id), f_.id};
    }

    DomainEvent withVersion(int64_t version) const {
        Fields copy = f_;
        copy.version = version;
        return DomainEvent(std::move(copy));
    }

    DomainEvent forAggregate(std::string aggregateId, std::string aggregateType, int64_t version) const {
        Fields copy = f_;
        copy.aggregateId = std::move(aggregateId);
        copy.aggregateType = std::move(aggregateType);
        copy.version = version;
        return DomainEvent(std::move(copy));
    }

    bool operator==(const DomainEvent& other) const { return f_.id == other.f_.id; }
    bool operator!=(const DomainEvent& other) const { return !(*this == other); }

private:
    Fields f_;

    explicit DomainEvent(Fields fields) : f_(std::move(fields)) {
        if (f_.type.empty()) {
            throw ValidationException("Event type must not be empty");
        }
        if (f_.version < 0) {
            throw ValidationException("Event version must not be negative: " + std::to_string(f_.version));
        }
        if (f_.id.empty()) {
            f_.id = drogon::utils::getUuid();
        }
        if (f_.occurredAt == TimePoint{}) {
            f_.occurredAt = TimestampHelper::now();
        }
        if (f_.payload.isNull()) {
            f_.payload = Json::Value(Json::objectValue);
        }
    }
};
