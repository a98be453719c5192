#include "TestSupport.hpp"

TEST_SUITE("DomainEvent") {

TEST_CASE("new events get a unique id, timestamp and object payload") {
    auto before = TimestampHelper::now();
    DomainEvent a("Pinged");
    DomainEvent b("Pinged", Json::Value());

    CHECK_FALSE(a.id().empty());
    CHECK(a.id() != b.id());
    CHECK(a.occurredAt() >= before);
    CHECK(a.payload().isObject());
    CHECK(b.payload().isObject());
    CHECK(a.version() == 0);
    CHECK_FALSE(a.aggregateId().has_value());
    CHECK_FALSE(a.topic().has_value());
}

TEST_CASE("empty type and negative version are rejected") {
    CHECK_THROWS_AS(DomainEvent(""), ValidationException);
    CHECK_THROWS_AS(DomainEvent("X", "agg-1", "Test", -1, Json::Value(Json::objectValue)), ValidationException);
}

TEST_CASE("withMetadata copies the event and keeps unspecified fields") {
    DomainEvent base("OrderPlaced", "o-1", "Order", 3, Json::Value(Json::objectValue));
    auto tagged = base.withMetadata("corr-1", std::nullopt, "orders.placed");

    CHECK(tagged.id() == base.id());
    CHECK(tagged.correlationId() == std::optional<std::string>("corr-1"));
    CHECK_FALSE(tagged.causationId().has_value());
    CHECK(tagged.topic() == std::optional<std::string>("orders.placed"));
    CHECK(tagged.version() == 3);
    CHECK_FALSE(base.correlationId().has_value());

    auto retagged = tagged.withMetadata(std::nullopt, "cause-9");
    CHECK(retagged.correlationId() == std::optional<std::string>("corr-1"));
    CHECK(retagged.causationId() == std::optional<std::string>("cause-9"));
    CHECK(retagged.topic() == std::optional<std::string>("orders.placed"));
}

TEST_CASE("follow-up trace keeps the correlation and points causation at the source") {
    DomainEvent root("Started");
    auto [corr, cause] = root.traceForFollowUp();
    CHECK(corr == root.id());
    CHECK(cause == root.id());

    auto child = DomainEvent("Continued").withMetadata(corr, cause);
    auto [corr2, cause2] = child.traceForFollowUp();
    CHECK(corr2 == root.id());
    CHECK(cause2 == child.id());
}

TEST_CASE("equality is by id") {
    DomainEvent e("X");
    CHECK(e == e.withVersion(5));
    CHECK(e != DomainEvent("X"));
}

}
