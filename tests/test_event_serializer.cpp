#include "TestSupport.hpp"

TEST_SUITE("EventSerializer") {

TEST_CASE("json form keeps every field") {
    Json::Value payload;
    payload["sku"] = "A-1";
    payload["quantity"] = 3;
    auto event = DomainEvent("OrderItemAdded", "o-1", "Order", 4, payload)
        .withMetadata("corr", "cause", "orders.items");

    auto restored = EventSerializer::fromJson(EventSerializer::toJson(event));

    CHECK(restored.id() == event.id());
    CHECK(restored.type() == "OrderItemAdded");
    CHECK(restored.aggregateId() == event.aggregateId());
    CHECK(restored.aggregateType() == event.aggregateType());
    CHECK(restored.version() == 4);
    CHECK(restored.correlationId() == event.correlationId());
    CHECK(restored.causationId() == event.causationId());
    CHECK(restored.topic() == event.topic());
    CHECK(restored.payload() == payload);
    CHECK(TimestampHelper::toMicros(restored.occurredAt()) == TimestampHelper::toMicros(event.occurredAt()));
}

TEST_CASE("record form requires an aggregate id") {
    CHECK_THROWS_AS(EventSerializer::toRecord(DomainEvent("Loose")), ValidationException);

    auto record = EventSerializer::toRecord(aggregateEvent("X", "agg-1"));
    CHECK(record.aggregateId == "agg-1");
    CHECK(record.aggregateType == std::optional<std::string>("Test"));
    CHECK(record.payload == "{}");
}

TEST_CASE("record form keeps every field") {
    Json::Value payload;
    payload["sku"] = "A-1";
    payload["unitPrice"] = 2.5;
    auto event = DomainEvent("OrderItemAdded", "o-1", "Order", 7, payload)
        .withMetadata("corr-1", "cause-1", "orders.items");

    auto record = EventSerializer::toRecord(event);
    CHECK(record.eventId == event.id());
    CHECK(record.version == 7);
    CHECK(record.correlationId == std::optional<std::string>("corr-1"));
    CHECK(record.position == 0);

    auto restored = EventSerializer::fromRecord(record);
    CHECK(restored.id() == event.id());
    CHECK(restored.type() == "OrderItemAdded");
    CHECK(restored.aggregateId() == std::optional<std::string>("o-1"));
    CHECK(restored.aggregateType() == std::optional<std::string>("Order"));
    CHECK(restored.version() == 7);
    CHECK(restored.correlationId() == std::optional<std::string>("corr-1"));
    CHECK(restored.causationId() == std::optional<std::string>("cause-1"));
    CHECK(restored.topic() == std::optional<std::string>("orders.items"));
    CHECK(restored.payload() == payload);
    CHECK(TimestampHelper::toMicros(restored.occurredAt()) == TimestampHelper::toMicros(event.occurredAt()));
}

TEST_CASE("record form keeps an empty aggregate type apart from a missing one") {
    auto empty = EventSerializer::fromRecord(EventSerializer::toRecord(DomainEvent("X", "agg-1", "", 1)));
    CHECK(empty.aggregateType() == std::optional<std::string>(""));

    DomainEvent::Fields f;
    f.id = "e-untyped";
    f.type = "X";
    f.aggregateId = "agg-1";
    f.version = 1;
    auto record = EventSerializer::toRecord(DomainEvent::restore(f));
    CHECK_FALSE(record.aggregateType.has_value());

    auto untyped = EventSerializer::fromRecord(record);
    CHECK_FALSE(untyped.aggregateType().has_value());
    CHECK_FALSE(untyped.correlationId().has_value());
    CHECK_FALSE(untyped.topic().has_value());
}

TEST_CASE("non-finite payload numbers are rejected") {
    Json::Value payload;
    payload["price"] = std::numeric_limits<double>::quiet_NaN();
    DomainEvent event("X", "agg-1", "Test", 1, payload);

    CHECK_THROWS_AS(EventSerializer::toJson(event), SerializationError);
    CHECK_THROWS_AS(EventSerializer::encodePayload(event), SerializationError);
}

TEST_CASE("malformed input raises SerializationError") {
    CHECK_THROWS_AS(EventSerializer::fromJson(Json::Value("text")), SerializationError);

    Json::Value noTime;
    noTime["id"] = "e-1";
    noTime["type"] = "X";
    CHECK_THROWS_AS(EventSerializer::fromJson(noTime), SerializationError);

    Json::Value badTime = noTime;
    badTime["occurredAt"] = "yesterday";
    CHECK_THROWS_AS(EventSerializer::fromJson(badTime), SerializationError);

    Json::Value emptyId = badTime;
    emptyId["occurredAt"] = "2024-01-01T00:00:00Z";
    emptyId["id"] = "";
    CHECK_THROWS_AS(EventSerializer::fromJson(emptyId), SerializationError);

    Json::Value badVersion = emptyId;
    badVersion["id"] = "e-1";
    badVersion["version"] = "two";
    CHECK_THROWS_AS(EventSerializer::fromJson(badVersion), SerializationError);

    CHECK_THROWS_AS(EventSerializer::decodePayload("{not json", "e-1"), SerializationError);
}

}
