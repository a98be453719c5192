#pragma once

#include "SnapshotStore.hpp"
#include "common/database/DatabaseService.hpp"

/**
 * @brief PostgreSQL 快照存储（es_snapshots 表）
 */
class PostgresSnapshotStore : public SnapshotStore {
public:
    explicit PostgresSnapshotStore(SnapshotRetention retention = SnapshotRetention::KeepLatest)
        : SnapshotStore(retention) {}

    Task<void> save(const std::string& aggregateId, int64_t version, const std::string& state) override {
        requireValid(aggregateId, version);

        co_await exec(R"(
            INSERT INTO es_snapshots (aggregate_id, version, state, created_at)
            VALUES (?, ?::BIGINT, ?, NOW())
            ON CONFLICT (aggregate_id, version) DO NOTHING
        )", {aggregateId, std::to_string(version), state});

        if (retention() == SnapshotRetention::KeepLatest) {
            co_await exec(R"(
                DELETE FROM es_snapshots
                WHERE aggregate_id = ?
                  AND version < (SELECT MAX(version) FROM es_snapshots WHERE aggregate_id = ?)
            )", {aggregateId, aggregateId});
        }
        LOG_DEBUG << "PostgresSnapshotStore: Saved snapshot of " << aggregateId << " at version " << version;
    }

    Task<std::optional<Snapshot>> getLatest(const std::string& aggregateId,
                                            std::optional<int64_t> maxVersion = std::nullopt) override {
        std::string sql = R"(
            SELECT aggregate_id, version, state,
                   ROUND(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_us
            FROM es_snapshots
            WHERE aggregate_id = ?)";
        SqlParams params{aggregateId};
        if (maxVersion) {
            sql += " AND version <= ?::BIGINT";
            params.push_back(std::to_string(*maxVersion));
        }
        sql += " ORDER BY version DESC LIMIT 1";

        auto result = co_await exec(sql, params);
        if (result.empty()) co_return std::nullopt;

        const auto& row = result[0];
        co_return Snapshot{
            row["aggregate_id"].as<std::string>(),
            row["version"].as<int64_t>(),
            row["state"].as<std::string>(),
            TimestampHelper::fromMicros(row["created_us"].as<int64_t>())
        };
    }

private:
    DatabaseService db_;

    Task<DatabaseService::Result> exec(const std::string& sql, const SqlParams& params) {
        std::string error;
        try {
            co_return co_await db_.execSqlCoro(sql, params);
        } catch (const drogon::orm::DrogonDbException& e) {
            error = DbErrors::describe(e);
        }
        LOG_ERROR << "PostgresSnapshotStore: Query failed: " << error;
        throw StoreUnavailableError("Snapshot store unavailable: " + error);
    }
};
