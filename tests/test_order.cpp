#include "TestSupport.hpp"

#include "modules/order/Order.Service.hpp"
#include "modules/order/OrderEventHandlers.hpp"
#include "common/utils/ValidatorHelper.hpp"

namespace {

EventCoreConfig memoryConfig(int64_t snapshotEvery = 50, int maxCommandRetries = 3) {
    EventCoreConfig config;
    config.eventStore = EventStoreBackend::Memory;
    config.snapshots = SnapshotBackend::Memory;
    config.snapshotEvery = snapshotEvery;
    config.maxCommandRetries = maxCommandRetries;
    return config;
}

OrderAggregate placedOrder(const std::string& id = "o-1") {
    OrderAggregate order(id, OrderBehavior::instance());
    OrderCommands::place(order, "cust-1", "EUR");
    return order;
}

DomainEvent orderEvent(const std::string& type, int64_t version, Json::Value payload) {
    return DomainEvent(type, "o-1", OrderBehavior::AGGREGATE_TYPE, version, std::move(payload));
}

/**
 * @brief 内存后端的完整订单模块（处理器已登记，分发器已启动）
 */
struct OrderFixture {
    EventCoreContext core;
    std::shared_ptr<OrderProjection> projection = std::make_shared<OrderProjection>(core.store());
    std::unique_ptr<OrderService> service;

    explicit OrderFixture(EventCoreConfig config) : core(std::move(config)) {
        OrderEventHandlers::registerAll(core.subscriptions(), projection);
        service = std::make_unique<OrderService>(core, projection);
        runTask(core.start());
    }

    ~OrderFixture() { runTask(core.stop()); }
};

}  // namespace

TEST_SUITE("Order") {

TEST_CASE("commands enforce the order lifecycle") {
    OrderAggregate fresh("o-1", OrderBehavior::instance());
    CHECK_THROWS_AS(OrderCommands::addItem(fresh, "sku", 1, 1.0), ValidationException);
    CHECK_THROWS_AS(OrderCommands::place(fresh, "", "EUR"), ValidationException);
    CHECK_THROWS_AS(OrderCommands::place(fresh, "cust-1", "EURO"), ValidationException);
    CHECK_FALSE(fresh.hasChanges());

    auto order = placedOrder();
    CHECK(order.state().status == OrderStatus::Placed);
    CHECK_THROWS_AS(OrderCommands::place(order, "cust-2", "USD"), ValidationException);
    CHECK_THROWS_AS(OrderCommands::ship(order, "DHL", "T-1"), ValidationException);
    CHECK_THROWS_AS(OrderCommands::addItem(order, "sku", 0, 1.0), ValidationException);
    CHECK_THROWS_AS(OrderCommands::addItem(order, "sku", 1, -2.0), ValidationException);
    CHECK_THROWS_AS(OrderCommands::addItem(order, "", 1, 1.0), ValidationException);

    OrderCommands::addItem(order, "sku-1", 2, 10.0);
    OrderCommands::addItem(order, "sku-1", 1, 12.0);
    OrderCommands::addItem(order, "sku-2", 1, 5.5);
    REQUIRE(order.state().lines.size() == 2);
    CHECK(order.state().lines[0].quantity == 3);
    CHECK(order.state().lines[0].unitPrice == doctest::Approx(12.0));
    CHECK(order.state().itemCount() == 4);
    CHECK(order.state().total() == doctest::Approx(41.5));

    OrderCommands::ship(order, "DHL", "T-1");
    CHECK(order.state().status == OrderStatus::Shipped);
    CHECK_THROWS_AS(OrderCommands::cancel(order, "too late"), ValidationException);
    CHECK_THROWS_AS(OrderCommands::addItem(order, "sku-3", 1, 1.0), ValidationException);
    CHECK(order.version() == 5);
}

TEST_CASE("raised order events carry their topics") {
    auto order = placedOrder();
    OrderCommands::cancel(order, "changed mind");
    const auto& events = order.pendingEvents();
    REQUIRE(events.size() == 2);
    CHECK(events[0].topic() == std::optional<std::string>("orders.placed"));
    CHECK(events[1].topic() == std::optional<std::string>("orders.cancelled"));
    CHECK(order.state().cancelReason == "changed mind");
}

TEST_CASE("order state survives the snapshot codec") {
    auto order = placedOrder();
    OrderCommands::addItem(order, "sku-1", 2, 9.99);
    OrderCommands::ship(order, "UPS", "1Z");

    const auto& behavior = *OrderBehavior::instance();
    auto restored = behavior.decode(behavior.encode(order.state()));
    CHECK(restored.status == OrderStatus::Shipped);
    CHECK(restored.customerId == "cust-1");
    CHECK(restored.carrier == "UPS");
    REQUIRE(restored.lines.size() == 1);
    CHECK(restored.lines[0].unitPrice == doctest::Approx(9.99));

    CHECK_THROWS_AS(behavior.decode(R"({"status":"lost"})"), SerializationError);
}

TEST_CASE("projection ignores duplicate and stale events") {
    InMemoryEventStore store;
    OrderProjection projection(store);
    OrderPlaced placed{"cust-1", "EUR"};
    OrderItemAdded item{"sku-1", 2, 3.0};

    auto v1 = orderEvent(OrderPlaced::TYPE, 1, placed.toJson());
    auto v2 = orderEvent(OrderItemAdded::TYPE, 2, item.toJson());
    CHECK(runTask(projection.apply(v1, placed)));
    CHECK(runTask(projection.apply(v2, item)));
    CHECK_FALSE(runTask(projection.apply(v2, item)));
    CHECK_FALSE(runTask(projection.apply(v1, placed)));

    auto row = projection.find("o-1");
    REQUIRE(row.has_value());
    CHECK(row->status == OrderStatus::Placed);
    CHECK(row->itemCount == 2);
    CHECK(row->total == doctest::Approx(6.0));
    CHECK(row->version == 2);

    CHECK_FALSE(runTask(projection.apply(DomainEvent(OrderPlaced::TYPE, placed.toJson()), placed)));
    CHECK(projection.size() == 1);
}

TEST_CASE("projection fills version gaps from the event store") {
    InMemoryEventStore store;
    OrderProjection projection(store);

    auto order = placedOrder();
    OrderCommands::addItem(order, "sku-1", 2, 3.0);
    OrderCommands::addItem(order, "sku-2", 1, 4.0);
    OrderCommands::ship(order, "DHL", "T-1");
    runTask(store.appendAll(order.pendingEvents(), 0));
    auto events = runTask(store.getEvents("o-1"));
    REQUIRE(events.size() == 4);

    auto payload = [&](size_t i) { return OrderItemAdded::fromJson(events[i].payload()); };

    // v3 先于 v2 到达
    CHECK(runTask(projection.apply(events[0], OrderPlaced::fromJson(events[0].payload()))));
    CHECK(runTask(projection.apply(events[2], payload(2))));
    auto row = projection.find("o-1");
    REQUIRE(row.has_value());
    CHECK(row->version == 3);
    CHECK(row->itemCount == 3);
    CHECK(row->total == doctest::Approx(10.0));

    CHECK_FALSE(runTask(projection.apply(events[1], payload(1))));
    CHECK(projection.find("o-1")->itemCount == 3);

    CHECK(runTask(projection.apply(events[3], OrderShipped::fromJson(events[3].payload()))));
    CHECK(projection.find("o-1")->status == OrderStatus::Shipped);
    CHECK(projection.find("o-1")->version == 4);
}

TEST_CASE("projection rejects a gap whose stored payload cannot be decoded") {
    InMemoryEventStore store;
    OrderProjection projection(store);
    OrderPlaced placed{"cust-1", "EUR"};
    OrderItemAdded item{"sku-1", 1, 1.0};

    std::vector<DomainEvent> stream = {
        orderEvent(OrderPlaced::TYPE, 0, placed.toJson()),
        orderEvent(OrderItemAdded::TYPE, 0, Json::Value(Json::objectValue)),
        orderEvent(OrderItemAdded::TYPE, 0, item.toJson()),
    };
    runTask(store.appendAll(stream, 0));
    auto events = runTask(store.getEvents("o-1"));

    CHECK(runTask(projection.apply(events[0], placed)));
    CHECK_THROWS_AS(runTask(projection.apply(events[2], item)), SerializationError);
    CHECK(projection.find("o-1")->version == 1);
    CHECK(projection.find("o-1")->itemCount == 0);
}

TEST_CASE("item quantities are bounded") {
    auto order = placedOrder();
    CHECK_THROWS_AS(OrderCommands::addItem(order, "sku-1", OrderLimits::MAX_ITEMS + 1, 1.0), ValidationException);
    CHECK_THROWS_AS(OrderCommands::addItem(order, "sku-1", std::numeric_limits<int64_t>::max(), 1.0),
                    ValidationException);

    OrderCommands::addItem(order, "sku-1", OrderLimits::MAX_ITEMS - 1, 1.0);
    CHECK_THROWS_AS(OrderCommands::addItem(order, "sku-1", 2, 1.0), ValidationException);
    CHECK_THROWS_AS(OrderCommands::addItem(order, "sku-2", 2, 1.0), ValidationException);
    OrderCommands::addItem(order, "sku-1", 1, 1.0);
    CHECK(order.state().itemCount() == OrderLimits::MAX_ITEMS);
    CHECK(order.version() == 3);

    CHECK_THROWS_AS(OrderLimits::addQuantity(std::numeric_limits<int64_t>::max(), 1), ValidationException);
    CHECK_THROWS_AS(OrderLimits::addQuantity(1, -1), ValidationException);
    CHECK(OrderLimits::addQuantity(0, OrderLimits::MAX_ITEMS) == OrderLimits::MAX_ITEMS);
}

TEST_CASE("quantity validation rejects out-of-range JSON integers") {
    Json::Value body;
    body["quantity"] = Json::UInt64(9223372036854775808ULL);
    CHECK_FALSE(ValidatorHelper::requirePositiveInt(body, "quantity", "数量", OrderLimits::MAX_ITEMS));

    body["quantity"] = static_cast<Json::Int64>(OrderLimits::MAX_ITEMS + 1);
    CHECK_FALSE(ValidatorHelper::requirePositiveInt(body, "quantity", "数量", OrderLimits::MAX_ITEMS));

    body["quantity"] = 3;
    CHECK(ValidatorHelper::requirePositiveInt(body, "quantity", "数量", OrderLimits::MAX_ITEMS));

    body["quantity"] = Json::UInt64(9223372036854775808ULL);
    body["sku"] = "sku-1";
    body["unitPrice"] = 1.0;
    CHECK_THROWS_AS(OrderItemAdded::fromJson(body), SerializationError);
}

TEST_CASE("service commands persist, publish and update the read model") {
    OrderFixture fx(memoryConfig(2));

    auto placed = runTask(fx.service->place("", "cust-1", "EUR", std::string("corr-1")));
    auto id = placed["id"].asString();
    CHECK_FALSE(id.empty());
    CHECK(placed["version"].asInt64() == 1);

    runTask(fx.service->addItem(id, "sku-1", 2, 10.0));
    runTask(fx.service->addItem(id, "sku-2", 1, 4.0));
    auto shipped = runTask(fx.service->ship(id, "DHL", "T-1"));
    CHECK(shipped["status"].asString() == "shipped");
    CHECK(shipped["version"].asInt64() == 4);

    auto detail = runTask(fx.service->detail(id));
    CHECK(detail["snapshotVersion"].asInt64() == 4);
    CHECK(detail["replayedEvents"].asUInt64() == 0);
    CHECK(detail["total"].asDouble() == doctest::Approx(24.0));

    auto history = runTask(fx.service->history(id));
    REQUIRE(history.size() == 4);
    CHECK(history[0]["type"].asString() == "OrderPlaced");
    CHECK(history[0]["correlationId"].asString() == "corr-1");
    CHECK(history[3]["type"].asString() == "OrderShipped");

    auto row = fx.projection->find(id);
    REQUIRE(row.has_value());
    CHECK(row->status == OrderStatus::Shipped);
    CHECK(row->itemCount == 3);
    CHECK(fx.service->list(OrderStatus::Shipped).size() == 1);
    CHECK(fx.service->list(OrderStatus::Cancelled).size() == 0);

    auto metrics = fx.core.subscriptions().metrics(OrderEventHandlers::SHIPPING_NOTIFIER);
    REQUIRE(metrics.has_value());
    CHECK(metrics->successes == 1);
    CHECK(fx.core.subscriptions().metrics(OrderEventHandlers::AUDIT_LOG)->successes == 4);
}

TEST_CASE("detail replays the events after the last snapshot") {
    OrderFixture fx(memoryConfig(2));
    runTask(fx.service->place("o-7", "cust-1", "EUR"));
    runTask(fx.service->addItem("o-7", "sku-1", 1, 1.0));
    runTask(fx.service->addItem("o-7", "sku-2", 1, 1.0));

    auto detail = runTask(fx.service->detail("o-7"));
    CHECK(detail["snapshotVersion"].asInt64() == 2);
    CHECK(detail["replayedEvents"].asUInt64() == 1);
    CHECK(detail["itemCount"].asInt64() == 2);
}

TEST_CASE("service rejects unknown orders and invalid commands") {
    OrderFixture fx(memoryConfig());
    CHECK_THROWS_AS(runTask(fx.service->addItem("missing", "sku", 1, 1.0)), NotFoundException);
    CHECK_THROWS_AS(runTask(fx.service->detail("missing")), NotFoundException);
    CHECK_THROWS_AS(runTask(fx.service->history("missing")), NotFoundException);

    runTask(fx.service->place("o-1", "cust-1", "EUR"));
    CHECK_THROWS_AS(runTask(fx.service->place("o-1", "cust-2", "EUR")), ValidationException);
    CHECK_THROWS_AS(runTask(fx.service->ship("o-1", "DHL", "T-1")), ValidationException);
    CHECK(runTask(fx.core.store().getAggregateVersion("o-1")) == 1);
}

TEST_CASE("concurrent commands on one order are retried until they all land") {
    OrderFixture fx(memoryConfig(50, 1000));
    runTask(fx.service->place("o-1", "cust-1", "EUR"));

    auto worker = [&fx](const std::string& sku) {
        for (int i = 0; i < 20; ++i) {
            runTask(fx.service->addItem("o-1", sku, 1, 1.0));
        }
    };
    std::thread a(worker, "sku-a");
    std::thread b(worker, "sku-b");
    a.join();
    b.join();

    auto detail = runTask(fx.service->detail("o-1"));
    CHECK(detail["version"].asInt64() == 41);
    CHECK(detail["itemCount"].asInt64() == 40);

    // 两个线程的分发可能乱序到达，缺口由事件存储补齐
    auto row = fx.projection->find("o-1");
    REQUIRE(row.has_value());
    CHECK(row->version == 41);
    CHECK(row->itemCount == 40);
    CHECK(row->total == doctest::Approx(40.0));
}

}
