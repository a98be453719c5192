#include "TestSupport.hpp"

#include "common/database/DatabaseService.hpp"

TEST_SUITE("DatabaseErrors") {

TEST_CASE("constraint name is read from a unique violation message") {
    CHECK(DbErrors::violatedConstraint(
              R"(ERROR:  duplicate key value violates unique constraint "uq_es_events_stream")")
          == std::optional<std::string>("uq_es_events_stream"));
    CHECK(DbErrors::violatedConstraint(
              "duplicate key value violates unique constraint \"uq_es_events_event_id\"\n"
              "DETAIL:  Key (event_id)=(e-1) already exists.")
          == std::optional<std::string>("uq_es_events_event_id"));
}

TEST_CASE("messages without a constraint name are not classified") {
    CHECK_FALSE(DbErrors::violatedConstraint("connection refused").has_value());
    CHECK_FALSE(DbErrors::violatedConstraint("violates unique constraint \"").has_value());
    CHECK_FALSE(DbErrors::violatedConstraint("violates unique constraint \"\"").has_value());
    CHECK(DbErrors::violatedConstraint(R"(violates unique constraint "es_snapshots_pkey")")
          != std::optional<std::string>(std::string(EventSchema::STREAM_CONSTRAINT)));
}

TEST_CASE("placeholders are numbered outside quoted literals") {
    CHECK(SqlBinding::numberPlaceholders("SELECT ? WHERE a = '?' AND b = ?", 2)
          == "SELECT $1 WHERE a = '?' AND b = $2");
    CHECK(SqlBinding::numberPlaceholders("SELECT ?, ?", 1) == "SELECT $1, ?");
}

}
