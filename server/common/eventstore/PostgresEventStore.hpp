#pragma once

#include "EventStore.hpp"
#include "EventSerializer.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/database/TransactionGuard.hpp"

/**
 * @brief PostgreSQL 事件存储（es_events 表）
 *
 * 追加在一个事务中完成：读取当前最大版本 → 比对期望版本 → 批量插入。
 * 两个写者同时通过版本比对时，后插入者撞上 uq_es_events_stream 约束，
 * 同样报告为 ConcurrencyError，存储中只会留下一方的事件。其他唯一约束
 * （重复的事件 id）报告为 ConflictException，不作为版本冲突重试。
 */
class PostgresEventStore : public EventStore {
public:
    Task<int64_t> appendAll(std::vector<DomainEvent> events, int64_t expectedVersion) override {
        requireValidExpectedVersion(expectedVersion);
        auto aggregateId = requireSingleAggregate(events);

        std::vector<EventRecord> records;
        records.reserve(events.size());
        int64_t version = expectedVersion;
        for (const auto& e : events) {
            records.push_back(EventSerializer::toRecord(e.withVersion(++version)));
        }

        std::string sql = R"(
            INSERT INTO es_events (event_id, aggregate_id, aggregate_type, version, event_type,
                                   occurred_at, correlation_id, causation_id, topic, payload)
            VALUES )";
        SqlParams params;
        params.reserve(records.size() * 10);
        for (size_t i = 0; i < records.size(); ++i) {
            const auto& r = records[i];
            if (i > 0) sql += ", ";
            sql += "(?, ?, ?, ?::BIGINT, ?, ?::TIMESTAMPTZ, ?, ?, ?, ?::JSONB)";
            params.push_back(r.eventId);
            params.push_back(r.aggregateId);
            params.push_back(r.aggregateType);
            params.push_back(std::to_string(r.version));
            params.push_back(r.eventType);
            params.push_back(TimestampHelper::toIso(TimestampHelper::fromMicros(r.occurredAtMicros)));
            params.push_back(r.correlationId);
            params.push_back(r.causationId);
            params.push_back(r.topic);
            params.push_back(r.payload);
        }

        std::optional<int64_t> mismatch;
        std::string unavailable;
        bool versionTaken = false;
        bool duplicateKey = false;

        try {
            auto guard = co_await TransactionGuard::create(db_);
            auto current = co_await guard.execSqlCoro(
                "SELECT COALESCE(MAX(version), 0) AS current_version FROM es_events WHERE aggregate_id = ?",
                {aggregateId});
            auto currentVersion = current[0]["current_version"].as<int64_t>();

            if (currentVersion != expectedVersion) {
                guard.rollback();
                mismatch = currentVersion;
            } else {
                co_await guard.execSqlCoro(sql, params);
                co_await guard.commit();
            }
        } catch (const drogon::orm::DrogonDbException& e) {
            versionTaken = DbErrors::violatesConstraint(e, EventSchema::STREAM_CONSTRAINT);
            duplicateKey = !versionTaken && DbErrors::isUniqueViolation(e);
            unavailable = DbErrors::describe(e);
        } catch (const StoreUnavailableError& e) {
            unavailable = e.what();
        }

        if (mismatch) {
            LOG_WARN << "PostgresEventStore: Concurrency conflict on " << aggregateId
                     << ", expected " << expectedVersion << ", actual " << *mismatch;
            throw ConcurrencyError(aggregateId, expectedVersion, *mismatch);
        }
        if (versionTaken) {
            LOG_WARN << "PostgresEventStore: Concurrent writer took version " << (expectedVersion + 1)
                     << " of " << aggregateId;
            throw ConcurrencyError(aggregateId, expectedVersion, -1);
        }
        if (duplicateKey) {
            LOG_ERROR << "PostgresEventStore: Append to " << aggregateId << " rejected: " << unavailable;
            throw ConflictException("事件已存在: " + unavailable);
        }
        if (!unavailable.empty()) {
            LOG_ERROR << "PostgresEventStore: Append to " << aggregateId << " failed: " << unavailable;
            throw StoreUnavailableError("Event store unavailable: " + unavailable);
        }

        LOG_DEBUG << "PostgresEventStore: Appended " << records.size() << " event(s) to "
                  << aggregateId << ", version " << version;
        co_return version;
    }

    Task<std::vector<DomainEvent>> getEvents(const std::string& aggregateId, int64_t sinceVersion = 0) override {
        auto result = co_await query(
            std::string(SELECT_COLUMNS) + " WHERE aggregate_id = ? AND version > ?::BIGINT ORDER BY version ASC",
            {aggregateId, std::to_string(sinceVersion)});
        co_return toEvents(result);
    }

    Task<int64_t> getAggregateVersion(const std::string& aggregateId) override {
        auto result = co_await query(
            "SELECT COALESCE(MAX(version), 0) AS current_version FROM es_events WHERE aggregate_id = ?",
            {aggregateId});
        co_return result[0]["current_version"].as<int64_t>();
    }

    Task<std::vector<DomainEvent>> getEventsByCorrelationId(const std::string& correlationId) override {
        auto result = co_await query(
            std::string(SELECT_COLUMNS) + " WHERE correlation_id = ? ORDER BY position ASC",
            {correlationId});
        co_return toEvents(result);
    }

protected:
    Task<int64_t> headPosition() override {
        auto result = co_await query("SELECT COALESCE(MAX(position), 0) AS head FROM es_events");
        co_return result[0]["head"].as<int64_t>();
    }

    Task<std::vector<PositionedEvent>> readTypePage(const std::string& eventType,
                                                    std::optional<TimePoint> since,
                                                    int64_t afterPosition,
                                                    int64_t headPosition,
                                                    size_t limit) override {
        std::string sql = std::string(SELECT_COLUMNS)
            + " WHERE event_type = ? AND position > ?::BIGINT AND position <= ?::BIGINT";
        SqlParams params{eventType, std::to_string(afterPosition), std::to_string(headPosition)};
        if (since) {
            sql += " AND occurred_at >= ?::TIMESTAMPTZ";
            params.push_back(TimestampHelper::toIso(*since));
        }
        sql += " ORDER BY position ASC LIMIT ?::BIGINT";
        params.push_back(std::to_string(limit));

        auto result = co_await query(sql, params);
        std::vector<PositionedEvent> page;
        page.reserve(result.size());
        for (const auto& row : result) {
            page.push_back({row["position"].as<int64_t>(), EventSerializer::fromRecord(toRecord(row))});
        }
        co_return page;
    }

private:
    DatabaseService db_;

    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT position, event_id, aggregate_id, aggregate_type, version, event_type,
               ROUND(EXTRACT(EPOCH FROM occurred_at) * 1000000)::BIGINT AS occurred_us,
               correlation_id, causation_id, topic, payload::TEXT AS payload
        FROM es_events)";

    /**
     * @brief 只读查询，数据库异常统一转为 StoreUnavailableError
     */
    Task<DatabaseService::Result> query(const std::string& sql, const SqlParams& params = {}) {
        std::string error;
        try {
            co_return co_await db_.execSqlCoro(sql, params);
        } catch (const drogon::orm::DrogonDbException& e) {
            error = DbErrors::describe(e);
        }
        LOG_ERROR << "PostgresEventStore: Query failed: " << error;
        throw StoreUnavailableError("Event store unavailable: " + error);
    }

    static std::optional<std::string> optionalColumn(const drogon::orm::Row& row, const char* name) {
        if (row[name].isNull()) return std::nullopt;
        return row[name].as<std::string>();
    }

    static EventRecord toRecord(const drogon::orm::Row& row) {
        EventRecord r;
        r.position = row["position"].as<int64_t>();
        r.eventId = row["event_id"].as<std::string>();
        r.aggregateId = row["aggregate_id"].as<std::string>();
        r.aggregateType = optionalColumn(row, "aggregate_type");
        r.version = row["version"].as<int64_t>();
        r.eventType = row["event_type"].as<std::string>();
        r.occurredAtMicros = row["occurred_us"].as<int64_t>();
        r.correlationId = optionalColumn(row, "correlation_id");
        r.causationId = optionalColumn(row, "causation_id");
        r.topic = optionalColumn(row, "topic");
        r.payload = row["payload"].as<std::string>();
        return r;
    }

    static std::vector<DomainEvent> toEvents(const DatabaseService::Result& result) {
        std::vector<DomainEvent> events;
        events.reserve(result.size());
        for (const auto& row : result) {
            events.push_back(EventSerializer::fromRecord(toRecord(row)));
        }
        return events;
    }
};
