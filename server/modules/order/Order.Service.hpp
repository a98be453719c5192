#pragma once

#include "OrderProjection.hpp"
#include "common/domain/EventCoreContext.hpp"
#include "common/eventstore/EventSerializer.hpp"

/**
 * @brief 订单服务
 *
 * 每个命令：加载聚合 → 执行命令 → 保存。保存遇到并发冲突时重新加载后重试，
 * 重试耗尽抛 ConflictException，客户端可重新提交。
 */
class OrderService {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using Command = std::function<void(OrderAggregate&)>;

    OrderService(EventCoreContext& core, std::shared_ptr<OrderProjection> projection)
        : core_(core),
          repo_(core.repository<OrderState>(OrderBehavior::instance())),
          projection_(std::move(projection)),
          maxRetries_(core.config().maxCommandRetries) {}

    /**
     * @brief 下单
     * @param orderId 为空时生成新 id
     */
    Task<Json::Value> place(std::string orderId, std::string customerId, std::string currency,
                            std::optional<std::string> correlationId = std::nullopt) {
        if (orderId.empty()) orderId = drogon::utils::getUuid();
        co_return co_await execute(orderId, true,
            [customerId = std::move(customerId), currency = std::move(currency)](OrderAggregate& order) {
                OrderCommands::place(order, customerId, currency);
            }, std::move(correlationId));
    }

    Task<Json::Value> addItem(std::string orderId, std::string sku, int64_t quantity, double unitPrice,
                              std::optional<std::string> correlationId = std::nullopt) {
        co_return co_await execute(std::move(orderId), false,
            [sku = std::move(sku), quantity, unitPrice](OrderAggregate& order) {
                OrderCommands::addItem(order, sku, quantity, unitPrice);
            }, std::move(correlationId));
    }

    Task<Json::Value> ship(std::string orderId, std::string carrier, std::string trackingNumber,
                           std::optional<std::string> correlationId = std::nullopt) {
        co_return co_await execute(std::move(orderId), false,
            [carrier = std::move(carrier), trackingNumber = std::move(trackingNumber)](OrderAggregate& order) {
                OrderCommands::ship(order, carrier, trackingNumber);
            }, std::move(correlationId));
    }

    Task<Json::Value> cancel(std::string orderId, std::string reason,
                             std::optional<std::string> correlationId = std::nullopt) {
        co_return co_await execute(std::move(orderId), false,
            [reason = std::move(reason)](OrderAggregate& order) {
                OrderCommands::cancel(order, reason);
            }, std::move(correlationId));
    }

    /**
     * @brief 订单详情（由事件重建）
     * @throws NotFoundException 订单不存在
     */
    Task<Json::Value> detail(const std::string& orderId) {
        auto order = co_await repo_.load(orderId);
        auto json = OrderCommands::toJson(order);
        if (order.snapshotVersion()) {
            json["snapshotVersion"] = static_cast<Json::Int64>(*order.snapshotVersion());
        }
        json["replayedEvents"] = static_cast<Json::UInt64>(order.replayedEvents());
        co_return json;
    }

    /**
     * @brief 订单事件历史
     */
    Task<Json::Value> history(const std::string& orderId) {
        auto events = co_await core_.store().getEvents(orderId);
        if (events.empty()) {
            throw NotFoundException("订单不存在: " + orderId);
        }
        Json::Value list(Json::arrayValue);
        for (const auto& e : events) list.append(EventSerializer::toJson(e));
        co_return list;
    }

    /**
     * @brief 读模型列表
     */
    Json::Value list(std::optional<OrderStatus> status = std::nullopt) const {
        Json::Value items(Json::arrayValue);
        for (const auto& row : projection_->list(status)) {
            items.append(OrderProjection::toJson(row));
        }
        return items;
    }

private:
    EventCoreContext& core_;
    EventSourcedRepository<OrderState> repo_;
    std::shared_ptr<OrderProjection> projection_;
    int maxRetries_;

    /**
     * @param create true 表示在新聚合上执行（下单）
     */
    Task<Json::Value> execute(std::string orderId, bool create, Command command,
                              std::optional<std::string> correlationId) {
        for (int attempt = 0;; ++attempt) {
            auto order = create ? co_await loadOrCreate(orderId) : co_await repo_.load(orderId);
            order.correlate(correlationId);
            command(order);

            std::optional<std::string> conflict;
            try {
                co_await repo_.save(order);
            } catch (const ConcurrencyError& e) {
                conflict = e.what();
            }
            if (!conflict) co_return OrderCommands::toJson(order);

            if (attempt >= maxRetries_) {
                LOG_WARN << "OrderService: Giving up on order " << orderId << " after "
                         << (attempt + 1) << " attempt(s): " << *conflict;
                throw ConflictException("订单 " + orderId + " 正被并发修改，请重试");
            }
            LOG_WARN << "OrderService: " << *conflict << ", reloading (attempt " << (attempt + 2) << ")";
        }
    }

    Task<OrderAggregate> loadOrCreate(const std::string& orderId) {
        auto existing = co_await repo_.getById(orderId);
        if (existing) co_return std::move(*existing);
        co_return repo_.create(orderId);
    }
};
