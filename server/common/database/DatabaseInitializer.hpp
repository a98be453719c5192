#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 事件存储表结构初始化
 *
 * - es_events：只追加事件日志，(aggregate_id, version) 唯一，position 为全局顺序
 * - es_snapshots：按 (aggregate_id, version) 存放聚合状态快照
 *
 * 所有语句幂等，每次启动都可执行。
 */
class DatabaseInitializer {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    template<typename T = void> using Task = drogon::Task<T>;

private:
    static DbClientPtr getDbClient() {
        return AppDbConfig::useFast()
            ? drogon::app().getFastDbClient("default")
            : drogon::app().getDbClient("default");
    }

public:
    static Task<> initialize() {
        auto db = getDbClient();

        LOG_INFO << "Checking event store schema...";

        // 抑制 IF NOT EXISTS 产生的 NOTICE（"relation already exists, skipping"）
        co_await db->execSqlCoro("SET client_min_messages = WARNING");

        // 数据库级别固定 UTC 时区
        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                EXECUTE format('ALTER DATABASE %I SET timezone = ''UTC''', current_database());
            END $$
        )");

        co_await createEventTable(db);
        co_await createSnapshotTable(db);
        co_await createTriggers(db);

        LOG_INFO << "Event store schema ready";
    }

private:
    static Task<> createEventTable(const DbClientPtr& db) {
        co_await db->execSqlCoro(std::string(R"(
            CREATE TABLE IF NOT EXISTS es_events (
                position BIGSERIAL PRIMARY KEY,
                event_id VARCHAR(64) NOT NULL,
                aggregate_id VARCHAR(255) NOT NULL,
                aggregate_type VARCHAR(255),
                version BIGINT NOT NULL CHECK (version > 0),
                event_type VARCHAR(255) NOT NULL,
                occurred_at TIMESTAMPTZ NOT NULL,
                correlation_id VARCHAR(64),
                causation_id VARCHAR(64),
                topic VARCHAR(255),
                payload JSONB NOT NULL DEFAULT '{}'::jsonb,
                recorded_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
                CONSTRAINT )") + std::string(EventSchema::EVENT_ID_CONSTRAINT) + R"( UNIQUE (event_id),
                CONSTRAINT )" + std::string(EventSchema::STREAM_CONSTRAINT) + R"( UNIQUE (aggregate_id, version)
            )
        )");

        // 早期的表把 aggregate_type 定义为 NOT NULL DEFAULT ''，无法区分未设置
        co_await db->execSqlCoro(R"(ALTER TABLE es_events ALTER COLUMN aggregate_type DROP NOT NULL, ALTER COLUMN aggregate_type DROP DEFAULT)");

        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_es_events_type ON es_events (event_type, position))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_es_events_type_time ON es_events (event_type, occurred_at))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_es_events_correlation ON es_events (correlation_id) WHERE correlation_id IS NOT NULL)");

        LOG_INFO << "Table es_events created/verified";
    }

    static Task<> createSnapshotTable(const DbClientPtr& db) {
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS es_snapshots (
                aggregate_id VARCHAR(255) NOT NULL,
                version BIGINT NOT NULL CHECK (version > 0),
                state TEXT NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
                PRIMARY KEY (aggregate_id, version)
            )
        )");

        LOG_INFO << "Table es_snapshots created/verified";
    }

    static Task<> createTriggers(const DbClientPtr& db) {
        // 事件日志只允许追加
        co_await db->execSqlCoro(R"(
            CREATE OR REPLACE FUNCTION es_events_append_only()
            RETURNS TRIGGER AS $$
            BEGIN
                RAISE EXCEPTION 'es_events is append-only (% rejected)', TG_OP;
            END;
            $$ language 'plpgsql'
        )");

        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                CREATE TRIGGER es_events_no_update BEFORE UPDATE OR DELETE ON es_events
                    FOR EACH ROW EXECUTE FUNCTION es_events_append_only();
            EXCEPTION WHEN duplicate_object THEN null; END $$
        )");

        LOG_INFO << "Triggers created/verified";
    }
};
