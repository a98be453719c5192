#pragma once

#include "SnapshotStore.hpp"
#include "common/database/RedisService.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief Redis 快照存储
 *
 * 每个聚合一个有序集合 `snapshot:{aggregateId}`，score 为版本，
 * 成员为 {"version","state","createdAt"} 的 JSON 文本。
 */
class RedisSnapshotStore : public SnapshotStore {
public:
    explicit RedisSnapshotStore(SnapshotRetention retention = SnapshotRetention::KeepLatest,
                                std::string keyPrefix = "snapshot:")
        : SnapshotStore(retention), keyPrefix_(std::move(keyPrefix)) {}

    Task<void> save(const std::string& aggregateId, int64_t version, const std::string& state) override {
        requireValid(aggregateId, version);
        auto key = keyPrefix_ + aggregateId;

        std::string error;
        try {
            auto existing = co_await redis_.zrevrangeByScore(key, version, version, 1);
            if (existing.empty()) {
                Json::Value member;
                member["version"] = static_cast<Json::Int64>(version);
                member["state"] = state;
                member["createdAt"] = static_cast<Json::Int64>(TimestampHelper::toMicros(TimestampHelper::now()));
                co_await redis_.zadd(key, version, JsonHelper::serialize(member));
            }

            if (retention() == SnapshotRetention::KeepLatest) {
                auto latest = co_await redis_.zrevrangeByScore(key, std::nullopt, 0, 1);
                if (!latest.empty()) {
                    co_await redis_.zremBelowScore(key, decode(aggregateId, latest.front()).version);
                }
            }
        } catch (const SerializationError&) {
            throw;
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (!error.empty()) {
            LOG_ERROR << "RedisSnapshotStore: Save of " << aggregateId << " failed: " << error;
            throw StoreUnavailableError("Snapshot store unavailable: " + error);
        }
        LOG_DEBUG << "RedisSnapshotStore: Saved snapshot of " << aggregateId << " at version " << version;
    }

    Task<std::optional<Snapshot>> getLatest(const std::string& aggregateId,
                                            std::optional<int64_t> maxVersion = std::nullopt) override {
        std::vector<std::string> members;
        std::string error;
        try {
            members = co_await redis_.zrevrangeByScore(keyPrefix_ + aggregateId, maxVersion, 0, 1);
        } catch (const std::exception& e) {
            error = e.what();
        }
        if (!error.empty()) {
            LOG_ERROR << "RedisSnapshotStore: Read of " << aggregateId << " failed: " << error;
            throw StoreUnavailableError("Snapshot store unavailable: " + error);
        }

        if (members.empty()) co_return std::nullopt;
        co_return decode(aggregateId, members.front());
    }

private:
    RedisService redis_;
    std::string keyPrefix_;

    static Snapshot decode(const std::string& aggregateId, const std::string& text) {
        Json::Value json;
        try {
            json = JsonHelper::parse(text);
        } catch (const std::runtime_error& e) {
            throw SerializationError("Corrupt snapshot of " + aggregateId + ": " + e.what());
        }
        if (!json["version"].isInt64() || !json["state"].isString()) {
            throw SerializationError("Corrupt snapshot of " + aggregateId + ": missing version or state");
        }
        return Snapshot{
            aggregateId,
            json["version"].asInt64(),
            json["state"].asString(),
            TimestampHelper::fromMicros(json.get("createdAt", 0).asInt64())
        };
    }
};
