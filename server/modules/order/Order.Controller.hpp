#pragma once

#include "Order.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerMacros.hpp"
#include "common/utils/ValidatorHelper.hpp"

/**
 * @brief 订单控制器
 *
 * 依赖运行期创建的 OrderService，由 main 通过 registerController 注册。
 */
class OrderController : public drogon::HttpController<OrderController, false> {
private:
    std::shared_ptr<OrderService> service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    explicit OrderController(std::shared_ptr<OrderService> service) : service_(std::move(service)) {}

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(OrderController::list, "/api/orders", Get);
    ADD_METHOD_TO(OrderController::detail, "/api/orders/{id}", Get);
    ADD_METHOD_TO(OrderController::history, "/api/orders/{id}/events", Get);
    ADD_METHOD_TO(OrderController::place, "/api/orders", Post);
    ADD_METHOD_TO(OrderController::addItem, "/api/orders/{id}/items", Post);
    ADD_METHOD_TO(OrderController::ship, "/api/orders/{id}/ship", Post);
    ADD_METHOD_TO(OrderController::cancel, "/api/orders/{id}/cancel", Post);
    METHOD_LIST_END

    /**
     * @brief 订单列表（读模型），可按 status 过滤
     */
    Task<HttpResponsePtr> list(HttpRequestPtr req) {
        std::optional<OrderStatus> status;
        auto raw = req->getParameter("status");
        if (!raw.empty()) {
            if (raw != "placed" && raw != "shipped" && raw != "cancelled") {
                co_return Response::badRequest("status 只能是 placed、shipped 或 cancelled");
            }
            status = parseOrderStatus(raw);
        }
        co_return Response::list(service_->list(status));
    }

    /**
     * @brief 订单详情（由快照 + 事件重建）
     */
    Task<HttpResponsePtr> detail(HttpRequestPtr req, std::string id) {
        co_return Response::ok(co_await service_->detail(id));
    }

    Task<HttpResponsePtr> history(HttpRequestPtr req, std::string id) {
        co_return Response::list(co_await service_->history(id));
    }

    /**
     * @brief 下单
     */
    Task<HttpResponsePtr> place(HttpRequestPtr req) {
        auto json = ControllerUtils::requireJson(req);
        ValidatorHelper::requireNonEmptyString(*json, "customerId", "客户").throwIfInvalid();
        ValidatorHelper::requireNonEmptyString(*json, "currency", "币种").throwIfInvalid();
        ValidatorHelper::requireStringIfPresent(*json, "id", "订单 id").throwIfInvalid();

        auto order = co_await service_->place(json->get("id", "").asString(),
            (*json)["customerId"].asString(), (*json)["currency"].asString(),
            ControllerUtils::getCorrelationId(req));
        co_return Response::created(order);
    }

    /**
     * @brief 添加商品
     */
    Task<HttpResponsePtr> addItem(HttpRequestPtr req, std::string id) {
        auto json = ControllerUtils::requireJson(req);
        ValidatorHelper::requireNonEmptyString(*json, "sku", "SKU").throwIfInvalid();
        ValidatorHelper::requirePositiveInt(*json, "quantity", "数量", OrderLimits::MAX_ITEMS).throwIfInvalid();
        ValidatorHelper::requireNonNegativeNumber(*json, "unitPrice", "单价").throwIfInvalid();

        co_return Response::ok(co_await service_->addItem(id, (*json)["sku"].asString(),
            (*json)["quantity"].asInt64(), (*json)["unitPrice"].asDouble(),
            ControllerUtils::getCorrelationId(req)));
    }

    /**
     * @brief 发货
     */
    Task<HttpResponsePtr> ship(HttpRequestPtr req, std::string id) {
        auto json = ControllerUtils::requireJson(req);
        ValidatorHelper::requireNonEmptyString(*json, "carrier", "承运商").throwIfInvalid();
        ValidatorHelper::requireNonEmptyString(*json, "trackingNumber", "运单号").throwIfInvalid();

        co_return Response::ok(co_await service_->ship(id, (*json)["carrier"].asString(),
            (*json)["trackingNumber"].asString(), ControllerUtils::getCorrelationId(req)));
    }

    /**
     * @brief 取消订单
     */
    Task<HttpResponsePtr> cancel(HttpRequestPtr req, std::string id) {
        auto json = ControllerUtils::requireJson(req);
        ValidatorHelper::requireNonEmptyString(*json, "reason", "取消原因").throwIfInvalid();

        co_return Response::ok(co_await service_->cancel(id, (*json)["reason"].asString(),
            ControllerUtils::getCorrelationId(req)));
    }
};
