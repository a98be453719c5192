#pragma once

#include "common/domain/DomainEvent.hpp"
#include "common/utils/AppException.hpp"

/**
 * @brief 订单事件负载
 *
 * 每个负载提供 TYPE（事件类型）、TOPIC（发布主题）、toJson 与 fromJson，
 * 供 Aggregate::raise<E>、AggregateBehavior::on<E> 和类型化订阅使用。
 * fromJson 遇到缺失或类型错误的字段抛 SerializationError。
 */
namespace order_events {

inline std::string requireString(const Json::Value& json, const char* key, const char* type) {
    if (!json.isMember(key) || !json[key].isString()) {
        throw SerializationError(std::string(type) + "." + key + " must be a string");
    }
    return json[key].asString();
}

inline int64_t requireInt(const Json::Value& json, const char* key, const char* type) {
    if (!json.isMember(key) || !json[key].isInt64()) {
        throw SerializationError(std::string(type) + "." + key + " must be an integer");
    }
    return json[key].asInt64();
}

inline double requireNumber(const Json::Value& json, const char* key, const char* type) {
    if (!json.isMember(key) || !json[key].isNumeric()) {
        throw SerializationError(std::string(type) + "." + key + " must be a number");
    }
    return json[key].asDouble();
}

}  // namespace order_events

// ==================== 订单相关事件 ====================

struct OrderPlaced {
    static constexpr const char* TYPE = "OrderPlaced";
    static constexpr const char* TOPIC = "orders.placed";

    std::string customerId;
    std::string currency;

    Json::Value toJson() const {
        Json::Value json;
        json["customerId"] = customerId;
        json["currency"] = currency;
        return json;
    }

    static OrderPlaced fromJson(const Json::Value& json) {
        return {order_events::requireString(json, "customerId", TYPE),
                order_events::requireString(json, "currency", TYPE)};
    }
};

struct OrderItemAdded {
    static constexpr const char* TYPE = "OrderItemAdded";
    static constexpr const char* TOPIC = "orders.items";

    std::string sku;
    int64_t quantity = 0;
    double unitPrice = 0;

    Json::Value toJson() const {
        Json::Value json;
        json["sku"] = sku;
        json["quantity"] = static_cast<Json::Int64>(quantity);
        json["unitPrice"] = unitPrice;
        return json;
    }

    static OrderItemAdded fromJson(const Json::Value& json) {
        return {order_events::requireString(json, "sku", TYPE),
                order_events::requireInt(json, "quantity", TYPE),
                order_events::requireNumber(json, "unitPrice", TYPE)};
    }
};

struct OrderShipped {
    static constexpr const char* TYPE = "OrderShipped";
    static constexpr const char* TOPIC = "orders.shipped";

    std::string carrier;
    std::string trackingNumber;

    Json::Value toJson() const {
        Json::Value json;
        json["carrier"] = carrier;
        json["trackingNumber"] = trackingNumber;
        return json;
    }

    static OrderShipped fromJson(const Json::Value& json) {
        return {order_events::requireString(json, "carrier", TYPE),
                order_events::requireString(json, "trackingNumber", TYPE)};
    }
};

struct OrderCancelled {
    static constexpr const char* TYPE = "OrderCancelled";
    static constexpr const char* TOPIC = "orders.cancelled";

    std::string reason;

    Json::Value toJson() const {
        Json::Value json;
        json["reason"] = reason;
        return json;
    }

    static OrderCancelled fromJson(const Json::Value& json) {
        return {order_events::requireString(json, "reason", TYPE)};
    }
};
