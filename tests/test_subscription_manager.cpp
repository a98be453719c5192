#include "TestSupport.hpp"

namespace {

struct Pinged {
    static constexpr const char* TYPE = "Pinged";
    std::string from;

    static Pinged fromJson(const Json::Value& json) {
        if (!json["from"].isString()) throw SerializationError("Pinged.from must be a string");
        return Pinged{json["from"].asString()};
    }
};

SubscriptionConfig named(const std::string& name, const std::string& eventType = "X") {
    SubscriptionConfig config;
    config.name = name;
    config.eventType = eventType;
    return config;
}

}  // namespace

TEST_SUITE("SubscriptionManager") {

TEST_CASE("handlers stay inactive until activateAll") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();

    subs.registerHandler(named("a"), recordingHandler(log, "a"));
    subs.registerHandler(named("b"), recordingHandler(log, "b"));
    CHECK(subs.contains("a"));
    CHECK_FALSE(subs.isActive("a"));
    CHECK(bus.subscriptionCount() == 0);

    subs.activateAll();
    CHECK(subs.activeCount() == 2);
    CHECK(subs.names() == std::vector<std::string>{"a", "b"});

    runTask(bus.publish(DomainEvent("X")));
    CHECK(log->entries() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("names must be unique and configuration valid") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();

    subs.registerHandler(named("a"), recordingHandler(log, "a"));
    CHECK_THROWS_AS(subs.registerHandler(named("a"), recordingHandler(log, "a")), ConfigurationError);
    CHECK_THROWS_AS(subs.registerHandler(named(""), recordingHandler(log, "x")), ConfigurationError);
    CHECK_THROWS_AS(subs.registerHandler(named("t", ""), recordingHandler(log, "x")), ConfigurationError);

    auto badTopic = named("topic");
    badTopic.topicPattern = "orders.#.eu";
    CHECK_THROWS_AS(subs.registerHandler(badTopic, recordingHandler(log, "x")), ConfigurationError);

    auto badRetries = named("retries");
    badRetries.maxRetries = -1;
    CHECK_THROWS_AS(subs.registerHandler(badRetries, recordingHandler(log, "x")), ConfigurationError);

    auto badDelay = named("delay");
    badDelay.retryDelay = std::chrono::milliseconds(-5);
    CHECK_THROWS_AS(subs.registerHandler(badDelay, recordingHandler(log, "x")), ConfigurationError);

    CHECK(subs.names() == std::vector<std::string>{"a"});
}

TEST_CASE("single subscriptions can be toggled") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();
    subs.registerHandler(named("a"), recordingHandler(log, "a"));
    auto dormant = named("dormant");
    dormant.active = false;
    subs.registerHandler(dormant, recordingHandler(log, "dormant"));
    subs.activateAll();

    CHECK(subs.isActive("a"));
    CHECK_FALSE(subs.isActive("dormant"));

    CHECK(subs.deactivate("a"));
    CHECK(subs.activate("dormant"));
    runTask(bus.publish(DomainEvent("X")));
    CHECK(log->entries() == std::vector<std::string>{"dormant"});

    CHECK_FALSE(subs.activate("missing"));
    CHECK_FALSE(subs.deactivate("missing"));

    CHECK(subs.remove("dormant"));
    CHECK_FALSE(subs.contains("dormant"));
    CHECK(bus.subscriptionCount() == 0);
}

TEST_CASE("registering after start subscribes immediately") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();
    subs.activateAll();

    subs.registerHandler(named("late"), recordingHandler(log, "late"));
    CHECK(subs.isActive("late"));

    subs.deactivateAll();
    CHECK(subs.activeCount() == 0);
    CHECK(bus.subscriptionCount() == 0);
}

TEST_CASE("metrics count successes and failures") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto fail = std::make_shared<std::atomic<bool>>(false);
    subs.registerHandler(named("sometimes"), EventHandler([fail](const DomainEvent&) -> drogon::Task<void> {
        if (fail->load()) throw std::runtime_error("broken");
        co_return;
    }));
    subs.activateAll();

    runTask(bus.publish(DomainEvent("X")));
    runTask(bus.publish(DomainEvent("X")));
    fail->store(true);
    auto result = runTask(bus.publish(DomainEvent("X")));
    CHECK_FALSE(result.ok());

    auto m = subs.metrics("sometimes");
    REQUIRE(m.has_value());
    CHECK(m->invocations == 3);
    CHECK(m->successes == 2);
    CHECK(m->failures == 1);
    CHECK(m->lastError == "broken");
    CHECK(m->lastInvokedAt.has_value());
    CHECK(m->maxMs >= m->minMs);
    CHECK_FALSE(subs.metrics("missing").has_value());

    auto json = subs.toJson()["subscriptions"];
    REQUIRE(json.size() == 1);
    CHECK(json[0]["name"].asString() == "sometimes");
    CHECK(json[0]["active"].asBool());
    CHECK(json[0]["metrics"]["failures"].asUInt64() == 1);
}

TEST_CASE("configured retries run inside one delivery") {
    TestLoop loop;
    EventBus bus(loop.loop());
    SubscriptionManager subs(bus);
    auto calls = std::make_shared<std::atomic<int>>(0);

    auto config = named("flaky");
    config.maxRetries = 2;
    config.retryDelay = std::chrono::milliseconds(5);
    subs.registerHandler(config, EventHandler([calls](const DomainEvent&) -> drogon::Task<void> {
        if (++*calls < 3) throw std::runtime_error("not yet");
        co_return;
    }));
    subs.activateAll();

    CHECK(runTask(bus.publish(DomainEvent("X"))).ok());
    CHECK(calls->load() == 3);
    CHECK(subs.metrics("flaky")->successes == 1);
}

TEST_CASE("exclusive conflicts surface on activation") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();
    auto first = named("first");
    first.exclusive = true;
    subs.registerHandler(first, recordingHandler(log, "first"));
    subs.registerHandler(named("second"), recordingHandler(log, "second"));

    CHECK_THROWS_AS(subs.activateAll(), ConfigurationError);
    CHECK(subs.isActive("first"));
    CHECK_FALSE(subs.isActive("second"));
}

TEST_CASE("typed handlers bind to the payload type") {
    EventBus bus;
    SubscriptionManager subs(bus);
    std::string from;
    subs.registerHandler<Pinged>(named("pings", "ignored"),
        [&from](const Pinged& p, const DomainEvent&) -> drogon::Task<void> {
            from = p.from;
            co_return;
        });
    subs.activateAll();

    Json::Value payload;
    payload["from"] = "tester";
    runTask(bus.publish(DomainEvent("Pinged", payload)));
    CHECK(from == "tester");
    CHECK(subs.toJson()["subscriptions"][0]["eventType"].asString() == "Pinged");
}

TEST_CASE("update changes priority and topic in place") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();
    subs.registerHandler(named("first"), recordingHandler(log, "first"));
    subs.registerHandler(named("second"), recordingHandler(log, "second"));
    subs.activateAll();

    SubscriptionUpdate promote;
    promote.priority = EventPriority::High;
    CHECK(subs.update("second", promote));
    runTask(bus.publish(DomainEvent("X")));
    CHECK(log->entries() == std::vector<std::string>{"second", "first"});
    CHECK(subs.metrics("second")->invocations == 1);

    SubscriptionUpdate narrow;
    narrow.topicPattern = "orders.*";
    CHECK(subs.update("first", narrow));
    log->clear();
    runTask(bus.publish(DomainEvent("X")));
    runTask(bus.publish(DomainEvent("X").withMetadata(std::nullopt, std::nullopt, std::string("orders.eu"))));
    CHECK(log->entries() == std::vector<std::string>{"second", "second", "first"});

    SubscriptionUpdate widen;
    widen.topicPattern = "";
    CHECK(subs.update("first", widen));
    CHECK(subs.toJson()["subscriptions"][0]["topicPattern"].isNull());

    auto entry = subs.toJson()["subscriptions"][1];
    CHECK(entry["priority"].asString() == "high");
    CHECK(entry["metrics"]["invocations"].asUInt64() == 3);
    CHECK(bus.subscriptionCount() == 2);
}

TEST_CASE("update can disable, enable and reject bad input") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();
    subs.registerHandler(named("a"), recordingHandler(log, "a"));
    subs.activateAll();

    SubscriptionUpdate off;
    off.active = false;
    CHECK(subs.update("a", off));
    CHECK_FALSE(subs.isActive("a"));
    runTask(bus.publish(DomainEvent("X")));
    CHECK(log->entries().empty());

    SubscriptionUpdate on;
    on.active = true;
    CHECK(subs.update("a", on));
    CHECK(subs.isActive("a"));

    SubscriptionUpdate badTopic;
    badTopic.topicPattern = "orders..eu";
    CHECK_THROWS_AS(subs.update("a", badTopic), ConfigurationError);
    CHECK(subs.isActive("a"));
    CHECK_FALSE(subs.update("missing", on));
}

TEST_CASE("event types are catalogued") {
    EventBus bus;
    SubscriptionManager subs(bus);
    auto log = std::make_shared<CallLog>();
    subs.registerHandler(named("a", "OrderPlaced"), recordingHandler(log, "a"));
    subs.registerHandler(named("b", "OrderPlaced"), recordingHandler(log, "b"));
    subs.registerHandler(named("any", ANY_EVENT), recordingHandler(log, "any"));
    subs.registerEventType("OrderShipped", "订单已发货");
    subs.registerEventType("OrderPlaced", "订单已创建");

    CHECK(subs.eventTypes() == std::vector<std::string>{"OrderPlaced", "OrderShipped"});
    CHECK_THROWS_AS(subs.registerEventType(""), ConfigurationError);
    CHECK_THROWS_AS(subs.registerEventType(ANY_EVENT), ConfigurationError);

    auto types = subs.toJson()["eventTypes"];
    REQUIRE(types.size() == 2);
    CHECK(types[0]["type"].asString() == "OrderPlaced");
    CHECK(types[0]["description"].asString() == "订单已创建");
    CHECK(types[0]["subscribers"].asUInt64() == 2);
    CHECK(types[1]["subscribers"].asUInt64() == 0);
}

}
