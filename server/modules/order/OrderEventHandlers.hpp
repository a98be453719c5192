#pragma once

#include "OrderProjection.hpp"
#include "common/domain/SubscriptionManager.hpp"

/**
 * @brief 订单事件处理器
 *
 * 读模型、发货通知和审计日志都只通过事件与订单聚合交互，
 * 聚合根只负责业务规则和持久化。
 */
class OrderEventHandlers {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    /** 读模型订阅名为 PROJECTION + "." + 事件类型 */
    static constexpr const char* PROJECTION = "order-projection";
    static constexpr const char* SHIPPING_NOTIFIER = "order-shipping-notifier";
    static constexpr const char* AUDIT_LOG = "order-audit-log";

    /**
     * @brief 登记所有订单处理器（应用启动时、分发器启动前调用）
     */
    static void registerAll(SubscriptionManager& subscriptions, std::shared_ptr<OrderProjection> projection) {
        // 订单事件 → 更新读模型（每种事件一个订阅，最先执行，查询接口依赖它）
        registerProjection<OrderPlaced>(subscriptions, projection);
        registerProjection<OrderItemAdded>(subscriptions, projection);
        registerProjection<OrderShipped>(subscriptions, projection);
        registerProjection<OrderCancelled>(subscriptions, projection);

        // 订单发货 → 通知客户（唯一订阅者，失败重试）
        SubscriptionConfig notifierConfig;
        notifierConfig.name = SHIPPING_NOTIFIER;
        notifierConfig.priority = EventPriority::Normal;
        notifierConfig.exclusive = true;
        notifierConfig.maxRetries = 3;
        notifierConfig.retryDelay = std::chrono::milliseconds(200);
        notifierConfig.description = "发货通知";
        subscriptions.registerHandler<OrderShipped>(notifierConfig,
            TypedHandler<OrderShipped>(notifyShipped));

        // 所有订单事件 → 审计日志
        SubscriptionConfig auditConfig;
        auditConfig.name = AUDIT_LOG;
        auditConfig.eventType = ANY_EVENT;
        auditConfig.topicPattern = "orders.#";
        auditConfig.priority = EventPriority::Low;
        auditConfig.description = "订单审计日志";
        subscriptions.registerHandler(auditConfig, EventHandler(audit));
    }

private:
    template<typename E>
    static void registerProjection(SubscriptionManager& subscriptions, std::shared_ptr<OrderProjection> projection) {
        SubscriptionConfig config;
        config.name = std::string(PROJECTION) + "." + E::TYPE;
        config.priority = EventPriority::High;
        config.maxRetries = 2;
        config.retryDelay = std::chrono::milliseconds(50);
        config.description = std::string("订单列表读模型: ") + E::TYPE;
        subscriptions.registerHandler<E>(config,
            TypedHandler<E>([projection](const E& payload, const DomainEvent& event) {
                return applyToProjection<E>(projection, payload, event);
            }));
    }

    template<typename E>
    static Task<void> applyToProjection(std::shared_ptr<OrderProjection> projection, E payload, DomainEvent event) {
        if (!co_await projection->apply(event, payload)) {
            LOG_DEBUG << "OrderEventHandler: Skipped stale " << event.type() << " v" << event.version()
                      << " of order " << event.aggregateId().value_or("");
        }
    }

    static Task<void> notifyShipped(const OrderShipped& shipped, const DomainEvent& event) {
        LOG_INFO << "OrderEventHandler: Order " << event.aggregateId().value_or("")
                 << " shipped via " << shipped.carrier << " (" << shipped.trackingNumber << ")";
        co_return;
    }

    static Task<void> audit(const DomainEvent& event) {
        LOG_INFO << "OrderAudit: " << event.type() << " order=" << event.aggregateId().value_or("")
                 << " v" << event.version()
                 << " correlation=" << event.correlationId().value_or(event.id());
        co_return;
    }
};
