#pragma once

#include "DomainEvent.hpp"
#include "TopicPattern.hpp"
#include "AsyncPrimitives.hpp"

/**
 * @brief 订阅优先级层级，数值越小越先执行
 */
enum class EventPriority : int {
    High = 0,
    Normal = 1,
    Low = 2
};

inline const char* priorityName(EventPriority p) {
    switch (p) {
        case EventPriority::High: return "high";
        case EventPriority::Normal: return "normal";
        case EventPriority::Low: return "low";
    }
    return "normal";
}

/**
 * @throws ConfigurationError 未知的优先级名称
 */
inline EventPriority parsePriority(const std::string& name) {
    if (name == "high") return EventPriority::High;
    if (name == "normal") return EventPriority::Normal;
    if (name == "low") return EventPriority::Low;
    throw ConfigurationError("Unknown event priority: " + name);
}

/** 匹配任意事件类型 */
inline constexpr const char* ANY_EVENT = "*";

/**
 * @brief 事件处理器
 */
using EventHandler = std::function<drogon::Task<void>(const DomainEvent&)>;

/**
 * @brief 可感知取消的事件处理器
 */
using CancellableHandler = std::function<drogon::Task<void>(const DomainEvent&, CancellationToken)>;

/**
 * @brief 类型化处理器：负载已解码为 E，同时可访问事件元数据
 */
template<typename E>
using TypedHandler = std::function<drogon::Task<void>(const E&, const DomainEvent&)>;

/**
 * @brief 解码负载后调用类型化处理器
 */
template<typename E>
drogon::Task<void> invokeTyped(TypedHandler<E> handler, const DomainEvent& event) {
    E typed = E::fromJson(event.payload());
    co_await handler(typed, event);
}

/**
 * @brief 订阅选项
 */
struct SubscriptionOptions {
    std::string eventType;
    EventPriority priority = EventPriority::Normal;
    std::optional<std::string> topicPattern;
    std::string name;
    bool exclusive = false;
};

/**
 * @brief 订阅句柄，用于取消订阅
 */
struct SubscriptionHandle {
    uint64_t id = 0;
    std::string eventType;

    bool valid() const { return id != 0; }
};

/**
 * @brief 已注册的订阅（注册后不可变）
 */
struct Subscription {
    uint64_t id;
    std::string eventType;
    EventPriority priority;
    std::optional<TopicPattern> topicPattern;
    std::string name;
    bool exclusive;
    CancellableHandler handler;

    bool matches(const DomainEvent& event) const {
        if (eventType != ANY_EVENT && eventType != event.type()) return false;
        if (!topicPattern) return true;
        return event.topic() && topicPattern->matches(*event.topic());
    }

    std::string displayName() const {
        return name.empty() ? eventType + "#" + std::to_string(id) : name;
    }
};

/**
 * @brief 单个订阅者的投递结果
 */
struct DeliveryOutcome {
    uint64_t subscriptionId;
    std::string handlerName;
    bool delivered;
    bool cancelled;
    std::string error;
};

/**
 * @brief 一次发布的汇总结果
 *
 * 处理器失败只记录在这里，publish 本身不抛出。
 */
struct PublishResult {
    std::string eventId;
    std::string eventType;
    size_t matched = 0;
    size_t delivered = 0;
    std::vector<DeliveryOutcome> outcomes;
    std::vector<HandlerExecutionError> failures;
    bool timedOut = false;

    bool ok() const { return failures.empty() && !timedOut; }
};
