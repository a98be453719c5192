#include "TestSupport.hpp"

namespace {

SubscriptionConfig named(const std::string& name, const std::string& eventType = ANY_EVENT) {
    SubscriptionConfig config;
    config.name = name;
    config.eventType = eventType;
    return config;
}

/**
 * @brief 等待后台分发全部结束（最多 timeout）
 */
bool waitIdle(const EventDispatcher& dispatcher, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (dispatcher.inFlightCount() > 0) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

}  // namespace

TEST_SUITE("EventDispatcher") {

TEST_CASE("events committed while stopped wait in the outbox") {
    InMemoryEventStore store;
    EventBus bus;
    SubscriptionManager subs(bus);
    EventDispatcher dispatcher(bus, store, subs);
    auto log = std::make_shared<CallLog>();
    subs.registerHandler(named("recorder"), recordingHandler(log, "recorder"));

    auto first = aggregateEvent("A", "agg").withVersion(1);
    auto second = aggregateEvent("B", "agg").withVersion(2);
    runTask(dispatcher.dispatchCommitted({first, second}));

    CHECK_FALSE(dispatcher.isRunning());
    CHECK(dispatcher.queuedCount() == 2);
    CHECK(log->size() == 0);
    REQUIRE(dispatcher.record(first.id()).has_value());
    CHECK(dispatcher.record(first.id())->state == EventProcessingState::Appended);

    runTask(dispatcher.start());

    CHECK(dispatcher.isRunning());
    CHECK(dispatcher.queuedCount() == 0);
    CHECK(log->size() == 2);
    CHECK(dispatcher.record(second.id())->state == EventProcessingState::Delivered);
}

TEST_CASE("sync dispatch records each delivery") {
    InMemoryEventStore store;
    EventBus bus;
    SubscriptionManager subs(bus);
    EventDispatcher dispatcher(bus, store, subs);
    auto log = std::make_shared<CallLog>();

    auto good = named("good");
    good.priority = EventPriority::High;
    subs.registerHandler(good, recordingHandler(log, "good"));
    subs.registerHandler(named("bad"), failingHandler("no luck"));
    runTask(dispatcher.start());

    auto version = runTask(dispatcher.appendAndPublish({aggregateEvent("A", "agg")}, 0));
    CHECK(version == 1);
    CHECK(log->size() == 1);

    auto stored = runTask(store.getEvents("agg"));
    REQUIRE(stored.size() == 1);
    auto rec = dispatcher.record(stored[0].id());
    REQUIRE(rec.has_value());
    CHECK(rec->state == EventProcessingState::Failed);
    CHECK(rec->version == 1);
    REQUIRE(rec->deliveries.size() == 2);
    CHECK(rec->deliveries[0].handlerName == "good");
    CHECK(rec->deliveries[0].state == EventProcessingState::Delivered);
    CHECK(rec->deliveries[1].handlerName == "bad");
    CHECK(rec->deliveries[1].state == EventProcessingState::Failed);
    CHECK(rec->deliveries[1].error == "no luck");

    auto json = rec->toJson();
    CHECK(json["state"].asString() == "FAILED");
    CHECK(json["deliveries"][1]["error"].asString() == "no luck");
}

TEST_CASE("a failed append publishes nothing") {
    InMemoryEventStore store;
    EventBus bus;
    SubscriptionManager subs(bus);
    EventDispatcher dispatcher(bus, store, subs);
    auto log = std::make_shared<CallLog>();
    subs.registerHandler(named("recorder"), recordingHandler(log, "recorder"));
    runTask(dispatcher.start());

    runTask(dispatcher.appendAndPublish({aggregateEvent("A", "agg")}, 0));
    auto stale = aggregateEvent("B", "agg");
    CHECK_THROWS_AS(runTask(dispatcher.appendAndPublish({stale}, 0)), ConcurrencyError);

    CHECK(log->size() == 1);
    CHECK_FALSE(dispatcher.record(stale.id()).has_value());
    CHECK(runTask(store.getAggregateVersion("agg")) == 1);
}

TEST_CASE("history is bounded") {
    InMemoryEventStore store;
    EventBus bus;
    SubscriptionManager subs(bus);
    DispatcherOptions options;
    options.historyLimit = 2;
    EventDispatcher dispatcher(bus, store, subs, options);
    runTask(dispatcher.start());

    auto a = aggregateEvent("A", "agg").withVersion(1);
    auto b = aggregateEvent("B", "agg").withVersion(2);
    auto c = aggregateEvent("C", "agg").withVersion(3);
    runTask(dispatcher.dispatchCommitted({a, b, c}));

    CHECK_FALSE(dispatcher.record(a.id()).has_value());
    CHECK(dispatcher.record(b.id()).has_value());
    CHECK(dispatcher.record(c.id()).has_value());
}

TEST_CASE("invalid options are rejected") {
    InMemoryEventStore store;
    EventBus bus;
    SubscriptionManager subs(bus);
    DispatcherOptions zeroConcurrency;
    zeroConcurrency.maxConcurrency = 0;
    CHECK_THROWS_AS(EventDispatcher(bus, store, subs, zeroConcurrency), ConfigurationError);
    DispatcherOptions zeroHistory;
    zeroHistory.historyLimit = 0;
    CHECK_THROWS_AS(EventDispatcher(bus, store, subs, zeroHistory), ConfigurationError);

    CHECK(parseDispatchMode("async") == DispatchMode::Async);
    CHECK_THROWS_AS(parseDispatchMode("eventually"), ConfigurationError);
}

TEST_CASE("async dispatch returns before handlers finish and stop waits for them") {
    TestLoop loop;
    InMemoryEventStore store;
    EventBus bus(loop.loop());
    SubscriptionManager subs(bus);
    DispatcherOptions options;
    options.mode = DispatchMode::Async;
    options.stopTimeout = std::chrono::milliseconds(2000);
    EventDispatcher dispatcher(bus, store, subs, options);

    auto log = std::make_shared<CallLog>();
    auto* l = loop.loop();
    subs.registerHandler(named("slow"), EventHandler([log, l](const DomainEvent&) -> drogon::Task<void> {
        co_await drogon::sleepCoro(l, std::chrono::milliseconds(100));
        log->add("slow");
    }));
    runTask(dispatcher.start());

    auto event = aggregateEvent("A", "agg").withVersion(1);
    runTask(dispatcher.dispatchCommitted({event}));
    CHECK(log->size() == 0);
    CHECK(dispatcher.inFlightCount() == 1);

    runTask(dispatcher.stop());
    CHECK(dispatcher.inFlightCount() == 0);
    CHECK(log->entries() == std::vector<std::string>{"slow"});
    CHECK(dispatcher.record(event.id())->state == EventProcessingState::Delivered);
    CHECK_FALSE(subs.isActive("slow"));
}

TEST_CASE("stop cancels background dispatch that outlives the stop timeout") {
    TestLoop loop;
    InMemoryEventStore store;
    EventBus bus(loop.loop());
    SubscriptionManager subs(bus);
    DispatcherOptions options;
    options.mode = DispatchMode::Async;
    options.stopTimeout = std::chrono::milliseconds(50);
    EventDispatcher dispatcher(bus, store, subs, options);

    auto log = std::make_shared<CallLog>();
    auto* l = loop.loop();
    subs.registerHandler(named("stubborn"), CancellableHandler(
        [log, l](const DomainEvent&, CancellationToken token) -> drogon::Task<void> {
            for (int i = 0; i < 100 && !token.isCancelled(); ++i) {
                co_await drogon::sleepCoro(l, std::chrono::milliseconds(10));
            }
            log->add(token.isCancelled() ? "cancelled" : "finished");
        }));
    runTask(dispatcher.start());

    runTask(dispatcher.dispatchCommitted({aggregateEvent("A", "agg").withVersion(1)}));
    runTask(dispatcher.stop());

    CHECK(waitIdle(dispatcher, std::chrono::milliseconds(1000)));
    CHECK(log->entries() == std::vector<std::string>{"cancelled"});
}

TEST_CASE("destroying the dispatcher waits for background dispatch that ignores cancellation") {
    TestLoop loop;
    InMemoryEventStore store;
    EventBus bus(loop.loop());
    SubscriptionManager subs(bus);
    DispatcherOptions options;
    options.mode = DispatchMode::Async;
    options.asyncTimeout = std::chrono::milliseconds(150);
    options.stopTimeout = std::chrono::milliseconds(20);
    auto dispatcher = std::make_unique<EventDispatcher>(bus, store, subs, options);

    auto log = std::make_shared<CallLog>();
    auto* l = loop.loop();
    subs.registerHandler(named("deaf"), EventHandler([log, l](const DomainEvent&) -> drogon::Task<void> {
        co_await drogon::sleepCoro(l, std::chrono::milliseconds(400));
        log->add("finished");
    }));
    runTask(dispatcher->start());

    runTask(dispatcher->dispatchCommitted({aggregateEvent("A", "agg").withVersion(1)}));
    runTask(dispatcher->stop());
    CHECK(dispatcher->backgroundCount() == 1);

    // 析构阻塞到 publishAsync 超时返回，而不是等处理器本身
    auto start = std::chrono::steady_clock::now();
    dispatcher.reset();
    auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed >= std::chrono::milliseconds(50));
    CHECK(elapsed < std::chrono::milliseconds(380));
    CHECK(log->size() == 0);

    // 处理器只持有共享状态，分发器销毁后仍可安全结束
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(1000);
    while (log->size() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(log->entries() == std::vector<std::string>{"finished"});
}

TEST_CASE("background count drops to zero once async dispatch completes") {
    TestLoop loop;
    InMemoryEventStore store;
    EventBus bus(loop.loop());
    SubscriptionManager subs(bus);
    DispatcherOptions options;
    options.mode = DispatchMode::Async;
    EventDispatcher dispatcher(bus, store, subs, options);
    auto log = std::make_shared<CallLog>();
    subs.registerHandler(named("recorder"), recordingHandler(log, "recorder"));
    runTask(dispatcher.start());

    runTask(dispatcher.dispatchCommitted({aggregateEvent("A", "agg").withVersion(1),
                                          aggregateEvent("B", "agg").withVersion(2)}));
    CHECK(waitIdle(dispatcher, std::chrono::milliseconds(1000)));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(1000);
    while (dispatcher.backgroundCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    CHECK(dispatcher.backgroundCount() == 0);
    CHECK(log->size() == 2);
}

}
