#pragma once

#include "common/domain/DomainEvent.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief 事件的行存储形式（对应 es_events 表的列）
 */
struct EventRecord {
    std::string eventId;
    std::string aggregateId;
    /** 未设置与空字符串是两种不同的值 */
    std::optional<std::string> aggregateType;
    int64_t version = 0;
    std::string eventType;
    int64_t occurredAtMicros = 0;
    std::optional<std::string> correlationId;
    std::optional<std::string> causationId;
    std::optional<std::string> topic;
    std::string payload;
    /** 存储分配的全局位置，写入前为 0 */
    int64_t position = 0;
};

/**
 * @brief 事件序列化
 *
 * - toRecord()/fromRecord()：数据库行
 * - toJson()/fromJson()：对外展示与 Redis/文件等文本存储
 *
 * 负载中出现 NaN/Inf 时无法写成合法 JSON，统一抛 SerializationError。
 */
class EventSerializer {
public:
    static EventRecord toRecord(const DomainEvent& event) {
        if (!event.aggregateId()) {
            throw ValidationException("Event " + event.type() + " (" + event.id() + ") has no aggregate id");
        }
        EventRecord r;
        r.eventId = event.id();
        r.aggregateId = *event.aggregateId();
        r.aggregateType = event.aggregateType();
        r.version = event.version();
        r.eventType = event.type();
        r.occurredAtMicros = TimestampHelper::toMicros(event.occurredAt());
        r.correlationId = event.correlationId();
        r.causationId = event.causationId();
        r.topic = event.topic();
        r.payload = encodePayload(event);
        return r;
    }

    static DomainEvent fromRecord(const EventRecord& r) {
        DomainEvent::Fields f;
        f.id = r.eventId;
        f.type = r.eventType;
        f.occurredAt = TimestampHelper::fromMicros(r.occurredAtMicros);
        f.aggregateId = r.aggregateId;
        f.aggregateType = r.aggregateType;
        f.version = r.version;
        f.correlationId = r.correlationId;
        f.causationId = r.causationId;
        f.topic = r.topic;
        f.payload = decodePayload(r.payload, r.eventId);
        return restoreChecked(std::move(f));
    }

    static Json::Value toJson(const DomainEvent& event) {
        if (!JsonHelper::allNumbersFinite(event.payload())) {
            throw SerializationError("Payload of " + event.type() + " (" + event.id()
                + ") contains a non-finite number");
        }
        Json::Value json;
        json["id"] = event.id();
        json["type"] = event.type();
        json["occurredAt"] = TimestampHelper::toIso(event.occurredAt());
        JsonHelper::setOptional(json, "aggregateId", event.aggregateId());
        JsonHelper::setOptional(json, "aggregateType", event.aggregateType());
        json["version"] = static_cast<Json::Int64>(event.version());
        JsonHelper::setOptional(json, "correlationId", event.correlationId());
        JsonHelper::setOptional(json, "causationId", event.causationId());
        JsonHelper::setOptional(json, "topic", event.topic());
        json["payload"] = event.payload();
        return json;
    }

    /**
     * @throws SerializationError 字段缺失、类型错误或时间格式非法
     */
    static DomainEvent fromJson(const Json::Value& json) {
        if (!json.isObject()) {
            throw SerializationError("Event JSON must be an object");
        }
        if (!json["id"].isString() || !json["type"].isString()) {
            throw SerializationError("Event JSON requires string fields 'id' and 'type'");
        }
        if (json["id"].asString().empty()) {
            throw SerializationError("Event JSON has an empty 'id'");
        }
        if (!json["occurredAt"].isString()) {
            throw SerializationError("Event JSON requires 'occurredAt'");
        }
        if (json.isMember("version") && !json["version"].isInt64()) {
            throw SerializationError("Event 'version' must be an integer");
        }

        auto occurredAt = TimestampHelper::fromIso(json["occurredAt"].asString());
        if (!occurredAt) {
            throw SerializationError("Invalid event timestamp: " + json["occurredAt"].asString());
        }

        DomainEvent::Fields f;
        f.id = json["id"].asString();
        f.type = json["type"].asString();
        f.occurredAt = *occurredAt;
        f.version = json.get("version", 0).asInt64();
        try {
            f.aggregateId = JsonHelper::optionalString(json, "aggregateId");
            f.aggregateType = JsonHelper::optionalString(json, "aggregateType");
            f.correlationId = JsonHelper::optionalString(json, "correlationId");
            f.causationId = JsonHelper::optionalString(json, "causationId");
            f.topic = JsonHelper::optionalString(json, "topic");
        } catch (const std::runtime_error& e) {
            throw SerializationError(std::string("Malformed event JSON: ") + e.what());
        }
        f.payload = json.get("payload", Json::Value(Json::objectValue));
        return restoreChecked(std::move(f));
    }

    static std::string encodePayload(const DomainEvent& event) {
        if (!JsonHelper::allNumbersFinite(event.payload())) {
            throw SerializationError("Payload of " + event.type() + " (" + event.id()
                + ") contains a non-finite number");
        }
        return JsonHelper::serialize(event.payload());
    }

    static Json::Value decodePayload(const std::string& text, const std::string& eventId) {
        try {
            return JsonHelper::parse(text);
        } catch (const std::runtime_error& e) {
            throw SerializationError("Cannot decode payload of event " + eventId + ": " + e.what());
        }
    }

private:
    static DomainEvent restoreChecked(DomainEvent::Fields f) {
        try {
            return DomainEvent::restore(std::move(f));
        } catch (const ValidationException& e) {
            throw SerializationError(std::string("Invalid stored event: ") + e.what());
        }
    }
};
