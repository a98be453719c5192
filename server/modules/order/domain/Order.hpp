#pragma once

#include "Events.hpp"
#include "common/domain/Aggregate.hpp"

/**
 * @brief 订单状态
 */
enum class OrderStatus {
    None,       ///< 尚未下单
    Placed,
    Shipped,
    Cancelled
};

inline const char* orderStatusName(OrderStatus s) {
    switch (s) {
        case OrderStatus::None: return "none";
        case OrderStatus::Placed: return "placed";
        case OrderStatus::Shipped: return "shipped";
        case OrderStatus::Cancelled: return "cancelled";
    }
    return "none";
}

inline OrderStatus parseOrderStatus(const std::string& name) {
    if (name == "placed") return OrderStatus::Placed;
    if (name == "shipped") return OrderStatus::Shipped;
    if (name == "cancelled") return OrderStatus::Cancelled;
    if (name == "none") return OrderStatus::None;
    throw SerializationError("Unknown order status: " + name);
}

/**
 * @brief 数量上限：单个订单的商品总数不超过 MAX_ITEMS
 */
namespace OrderLimits {

inline constexpr int64_t MAX_ITEMS = 1'000'000'000;

/**
 * @brief 累加数量，结果超过 MAX_ITEMS（或为负）时抛 ValidationException
 */
inline int64_t addQuantity(int64_t current, int64_t delta) {
    if (delta < 0 || current < 0 || delta > MAX_ITEMS - std::min(current, MAX_ITEMS)) {
        throw ValidationException("商品数量超出上限 " + std::to_string(MAX_ITEMS));
    }
    return current + delta;
}

}  // namespace OrderLimits

struct OrderLine {
    std::string sku;
    int64_t quantity = 0;
    double unitPrice = 0;
};

/**
 * @brief 订单聚合状态（纯数据，只由 reducer 产生）
 */
struct OrderState {
    OrderStatus status = OrderStatus::None;
    std::string customerId;
    std::string currency;
    std::vector<OrderLine> lines;
    std::string carrier;
    std::string trackingNumber;
    std::string cancelReason;

    double total() const {
        double sum = 0;
        for (const auto& l : lines) sum += static_cast<double>(l.quantity) * l.unitPrice;
        return sum;
    }

    int64_t itemCount() const {
        int64_t n = 0;
        for (const auto& l : lines) n = OrderLimits::addQuantity(n, l.quantity);
        return n;
    }

    static Json::Value toJson(const OrderState& s) {
        Json::Value json;
        json["status"] = orderStatusName(s.status);
        json["customerId"] = s.customerId;
        json["currency"] = s.currency;
        Json::Value lines(Json::arrayValue);
        for (const auto& l : s.lines) {
            Json::Value line;
            line["sku"] = l.sku;
            line["quantity"] = static_cast<Json::Int64>(l.quantity);
            line["unitPrice"] = l.unitPrice;
            lines.append(line);
        }
        json["lines"] = lines;
        json["carrier"] = s.carrier;
        json["trackingNumber"] = s.trackingNumber;
        json["cancelReason"] = s.cancelReason;
        return json;
    }

    static OrderState fromJson(const Json::Value& json) {
        OrderState s;
        s.status = parseOrderStatus(order_events::requireString(json, "status", "OrderState"));
        s.customerId = order_events::requireString(json, "customerId", "OrderState");
        s.currency = order_events::requireString(json, "currency", "OrderState");
        s.carrier = order_events::requireString(json, "carrier", "OrderState");
        s.trackingNumber = order_events::requireString(json, "trackingNumber", "OrderState");
        s.cancelReason = order_events::requireString(json, "cancelReason", "OrderState");
        if (!json["lines"].isArray()) {
            throw SerializationError("OrderState.lines must be an array");
        }
        for (const auto& line : json["lines"]) {
            s.lines.push_back({order_events::requireString(line, "sku", "OrderLine"),
                               order_events::requireInt(line, "quantity", "OrderLine"),
                               order_events::requireNumber(line, "unitPrice", "OrderLine")});
        }
        return s;
    }
};

using OrderAggregate = Aggregate<OrderState>;

/**
 * @brief 订单 reducer 表与快照编解码
 */
class OrderBehavior {
public:
    static constexpr const char* AGGREGATE_TYPE = "Order";

    static std::shared_ptr<const AggregateBehavior<OrderState>> instance() {
        static const auto behavior = build();
        return behavior;
    }

private:
    static std::shared_ptr<const AggregateBehavior<OrderState>> build() {
        auto b = std::make_shared<AggregateBehavior<OrderState>>(AGGREGATE_TYPE);

        b->on<OrderPlaced>([](const OrderState& s, const OrderPlaced& e) {
            OrderState next = s;
            next.status = OrderStatus::Placed;
            next.customerId = e.customerId;
            next.currency = e.currency;
            return next;
        });

        // 同一 SKU 合并数量，单价取最新
        b->on<OrderItemAdded>([](const OrderState& s, const OrderItemAdded& e) {
            OrderState next = s;
            auto it = std::find_if(next.lines.begin(), next.lines.end(),
                [&](const OrderLine& l) { return l.sku == e.sku; });
            if (it != next.lines.end()) {
                it->quantity = OrderLimits::addQuantity(it->quantity, e.quantity);
                it->unitPrice = e.unitPrice;
            } else {
                next.lines.push_back({e.sku, e.quantity, e.unitPrice});
            }
            return next;
        });

        b->on<OrderShipped>([](const OrderState& s, const OrderShipped& e) {
            OrderState next = s;
            next.status = OrderStatus::Shipped;
            next.carrier = e.carrier;
            next.trackingNumber = e.trackingNumber;
            return next;
        });

        b->on<OrderCancelled>([](const OrderState& s, const OrderCancelled& e) {
            OrderState next = s;
            next.status = OrderStatus::Cancelled;
            next.cancelReason = e.reason;
            return next;
        });

        b->codec(OrderState::toJson, OrderState::fromJson);
        return b;
    }
};

/**
 * @brief 订单命令：先校验不变式，再产生事件
 *
 * 不变式违反时抛 ValidationException，聚合保持不变。
 */
namespace OrderCommands {

inline void place(OrderAggregate& order, const std::string& customerId, const std::string& currency) {
    order.require(order.state().status == OrderStatus::None, "订单已存在: " + order.id())
         .require(!customerId.empty(), "客户不能为空")
         .require(currency.size() == 3, "币种必须是 3 位代码");
    order.raise(OrderPlaced{customerId, currency});
}

inline void addItem(OrderAggregate& order, const std::string& sku, int64_t quantity, double unitPrice) {
    order.require(order.state().status == OrderStatus::Placed,
                  std::string("订单状态为 ") + orderStatusName(order.state().status) + "，不能添加商品")
         .require(!sku.empty(), "SKU 不能为空")
         .require(quantity > 0, "数量必须大于 0")
         .require(quantity <= OrderLimits::MAX_ITEMS - order.state().itemCount(),
                  "订单商品总数不能超过 " + std::to_string(OrderLimits::MAX_ITEMS))
         .require(std::isfinite(unitPrice) && unitPrice >= 0, "单价必须是非负数");
    order.raise(OrderItemAdded{sku, quantity, unitPrice});
}

inline void ship(OrderAggregate& order, const std::string& carrier, const std::string& trackingNumber) {
    order.require(order.state().status == OrderStatus::Placed,
                  std::string("订单状态为 ") + orderStatusName(order.state().status) + "，不能发货")
         .require(!order.state().lines.empty(), "空订单不能发货")
         .require(!carrier.empty(), "承运商不能为空")
         .require(!trackingNumber.empty(), "运单号不能为空");
    order.raise(OrderShipped{carrier, trackingNumber});
}

inline void cancel(OrderAggregate& order, const std::string& reason) {
    order.require(order.state().status == OrderStatus::Placed,
                  std::string("订单状态为 ") + orderStatusName(order.state().status) + "，不能取消")
         .require(!reason.empty(), "取消原因不能为空");
    order.raise(OrderCancelled{reason});
}

/**
 * @brief 订单详情（状态 + 版本）
 */
inline Json::Value toJson(const OrderAggregate& order) {
    auto json = OrderState::toJson(order.state());
    json["id"] = order.id();
    json["version"] = static_cast<Json::Int64>(order.version());
    json["total"] = order.state().total();
    json["itemCount"] = static_cast<Json::Int64>(order.state().itemCount());
    return json;
}

}  // namespace OrderCommands
