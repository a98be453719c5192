#include "TestSupport.hpp"

TEST_SUITE("InMemorySnapshotStore") {

TEST_CASE("keep_latest retains only the newest snapshot") {
    InMemorySnapshotStore store(SnapshotRetention::KeepLatest);
    runTask(store.save("agg", 5, "{\"n\":5}"));
    runTask(store.save("agg", 10, "{\"n\":10}"));

    CHECK(store.count("agg") == 1);
    auto latest = runTask(store.getLatest("agg"));
    REQUIRE(latest.has_value());
    CHECK(latest->version == 10);
    CHECK(latest->state == "{\"n\":10}");
    CHECK_FALSE(runTask(store.getLatest("agg", 9)).has_value());
}

TEST_CASE("keep_all answers point-in-time lookups") {
    InMemorySnapshotStore store(SnapshotRetention::KeepAll);
    runTask(store.save("agg", 5, "five"));
    runTask(store.save("agg", 10, "ten"));
    runTask(store.save("agg", 15, "fifteen"));

    CHECK(store.count("agg") == 3);
    CHECK(runTask(store.getLatest("agg"))->version == 15);
    CHECK(runTask(store.getLatest("agg", 12))->state == "ten");
    CHECK(runTask(store.getLatest("agg", 5))->version == 5);
    CHECK_FALSE(runTask(store.getLatest("agg", 4)).has_value());
}

TEST_CASE("saving the same version twice keeps the first state") {
    InMemorySnapshotStore store(SnapshotRetention::KeepAll);
    runTask(store.save("agg", 3, "first"));
    runTask(store.save("agg", 3, "second"));
    CHECK(store.count("agg") == 1);
    CHECK(runTask(store.getLatest("agg"))->state == "first");
}

TEST_CASE("unknown aggregates and invalid arguments") {
    InMemorySnapshotStore store;
    CHECK_FALSE(runTask(store.getLatest("missing")).has_value());
    CHECK_THROWS_AS(runTask(store.save("", 1, "x")), ValidationException);
    CHECK_THROWS_AS(runTask(store.save("agg", 0, "x")), ValidationException);
    CHECK(store.retention() == SnapshotRetention::KeepLatest);
}

TEST_CASE("retention names parse") {
    CHECK(parseRetention("keep_all") == SnapshotRetention::KeepAll);
    CHECK(parseRetention("keep_latest") == SnapshotRetention::KeepLatest);
    CHECK_THROWS_AS(parseRetention("forever"), ConfigurationError);
}

}
