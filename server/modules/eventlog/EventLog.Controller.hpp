#pragma once

#include "common/domain/EventCoreContext.hpp"
#include "common/eventstore/EventSerializer.hpp"
#include "common/utils/ControllerMacros.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ValidatorHelper.hpp"

/**
 * @brief 事件日志与订阅查看控制器（重放和排查工具）
 */
class EventLogController : public drogon::HttpController<EventLogController, false> {
private:
    EventCoreContext& core_;

    /** 按类型查询单次返回的上限 */
    static constexpr int64_t MAX_TYPE_RESULTS = 5000;

    static Json::Value toJsonList(const std::vector<DomainEvent>& events) {
        Json::Value list(Json::arrayValue);
        for (const auto& e : events) list.append(EventSerializer::toJson(e));
        return list;
    }

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    explicit EventLogController(EventCoreContext& core) : core_(core) {}

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(EventLogController::byAggregate, "/api/events/aggregate/{id}", Get);
    ADD_METHOD_TO(EventLogController::byType, "/api/events/type/{type}", Get);
    ADD_METHOD_TO(EventLogController::byCorrelation, "/api/events/correlation/{id}", Get);
    ADD_METHOD_TO(EventLogController::dispatchRecord, "/api/events/dispatch/{eventId}", Get);
    ADD_METHOD_TO(EventLogController::subscriptions, "/api/subscriptions", Get);
    ADD_METHOD_TO(EventLogController::update, "/api/subscriptions/{name}", Put);
    ADD_METHOD_TO(EventLogController::activate, "/api/subscriptions/{name}/activate", Post);
    ADD_METHOD_TO(EventLogController::deactivate, "/api/subscriptions/{name}/deactivate", Post);
    METHOD_LIST_END

    /**
     * @brief 聚合事件流，since 为起始版本（不含）
     */
    Task<HttpResponsePtr> byAggregate(HttpRequestPtr req, std::string id) {
        auto since = ValidatorHelper::getNonNegativeInt64Param(req, "since");
        auto events = co_await core_.store().getEvents(id, since);

        Json::Value data;
        data["aggregateId"] = id;
        data["version"] = static_cast<Json::Int64>(co_await core_.store().getAggregateVersion(id));
        data["events"] = toJsonList(events);
        co_return Response::ok(data);
    }

    /**
     * @brief 按类型读取事件，since 为 ISO-8601 时间（含），limit 默认 500
     */
    Task<HttpResponsePtr> byType(HttpRequestPtr req, std::string type) {
        auto since = ValidatorHelper::getTimeParam(req, "since");
        auto limit = ValidatorHelper::getNonNegativeInt64Param(req, "limit",
            static_cast<int64_t>(EventStore::DEFAULT_BATCH_SIZE));
        if (limit == 0 || limit > MAX_TYPE_RESULTS) {
            co_return Response::badRequest("limit 范围为 1-" + std::to_string(MAX_TYPE_RESULTS));
        }

        auto stream = co_await core_.store().getEventsByType(type, since);
        std::vector<DomainEvent> events;
        bool truncated = false;
        while (auto batch = co_await stream.next()) {
            for (auto& e : *batch) {
                if (static_cast<int64_t>(events.size()) >= limit) {
                    truncated = true;
                    break;
                }
                events.push_back(std::move(e));
            }
            if (truncated) break;
        }

        Json::Value data;
        data["eventType"] = type;
        data["events"] = toJsonList(events);
        data["truncated"] = truncated;
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> byCorrelation(HttpRequestPtr req, std::string id) {
        co_return Response::list(toJsonList(co_await core_.store().getEventsByCorrelationId(id)));
    }

    /**
     * @brief 事件的分发记录（处理状态与各订阅者结果）
     */
    Task<HttpResponsePtr> dispatchRecord(HttpRequestPtr req, std::string eventId) {
        auto record = core_.dispatcher().record(eventId);
        if (!record) co_return Response::notFound("没有事件 " + eventId + " 的分发记录");
        co_return Response::ok(record->toJson());
    }

    Task<HttpResponsePtr> subscriptions(HttpRequestPtr req) {
        auto catalog = core_.subscriptions().toJson();
        Json::Value data;
        data["subscriptions"] = catalog["subscriptions"];
        data["eventTypes"] = catalog["eventTypes"];
        data["busSubscriptions"] = static_cast<Json::UInt64>(core_.bus().subscriptionCount());
        data["dispatcherRunning"] = core_.dispatcher().isRunning();
        data["queued"] = static_cast<Json::UInt64>(core_.dispatcher().queuedCount());
        data["inFlight"] = static_cast<Json::UInt64>(core_.dispatcher().inFlightCount());
        co_return Response::ok(data);
    }

    /**
     * @brief 修改订阅：{priority?: high|normal|low, topicPattern?: string（空串取消过滤）, active?: bool, description?: string}
     */
    Task<HttpResponsePtr> update(HttpRequestPtr req, std::string name) {
        auto json = ControllerUtils::requireJson(req);
        ValidatorHelper::requireStringIfPresent(*json, "priority", "priority").throwIfInvalid();
        ValidatorHelper::requireStringIfPresent(*json, "topicPattern", "topicPattern").throwIfInvalid();
        ValidatorHelper::requireStringIfPresent(*json, "description", "description").throwIfInvalid();
        if (json->isMember("active") && !(*json)["active"].isBool()) {
            throw ValidationException("active 必须是布尔值");
        }

        SubscriptionUpdate change;
        if (json->isMember("topicPattern")) change.topicPattern = (*json)["topicPattern"].asString();
        if (json->isMember("active")) change.active = (*json)["active"].asBool();
        if (json->isMember("description")) change.description = (*json)["description"].asString();

        // 优先级名称、主题模式或独占冲突属于请求参数问题
        bool found = false;
        try {
            if (json->isMember("priority")) change.priority = parsePriority((*json)["priority"].asString());
            found = core_.subscriptions().update(name, change);
        } catch (const ConfigurationError& e) {
            throw ValidationException(e.what());
        }
        if (!found) co_return Response::notFound("订阅不存在: " + name);
        co_return Response::ok(Json::Value::null, "已更新");
    }

    Task<HttpResponsePtr> activate(HttpRequestPtr req, std::string name) {
        if (!core_.subscriptions().activate(name)) {
            co_return Response::notFound("订阅不存在: " + name);
        }
        co_return Response::ok(Json::Value::null, "已启用");
    }

    Task<HttpResponsePtr> deactivate(HttpRequestPtr req, std::string name) {
        if (!core_.subscriptions().deactivate(name)) {
            co_return Response::notFound("订阅不存在: " + name);
        }
        co_return Response::ok(Json::Value::null, "已停用");
    }
};
