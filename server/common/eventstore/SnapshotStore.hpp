#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 聚合状态快照（只会被新快照取代，不会被修改）
 */
struct Snapshot {
    std::string aggregateId;
    int64_t version = 0;
    std::string state;
    TimestampHelper::TimePoint createdAt{};
};

/**
 * @brief 快照保留策略
 */
enum class SnapshotRetention {
    KeepAll,     ///< 保留全部历史快照
    KeepLatest   ///< 每次保存后删除该聚合更早的快照
};

/**
 * @throws ConfigurationError 未知的保留策略名称
 */
inline SnapshotRetention parseRetention(const std::string& name) {
    if (name == "keep_latest") return SnapshotRetention::KeepLatest;
    if (name == "keep_all") return SnapshotRetention::KeepAll;
    throw ConfigurationError("Unknown snapshot retention: " + name);
}

/**
 * @brief 快照存储接口
 *
 * 快照节奏由仓储的 SnapshotPolicy 决定，这里只负责存取。
 */
class SnapshotStore {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    explicit SnapshotStore(SnapshotRetention retention) : retention_(retention) {}
    virtual ~SnapshotStore() = default;

    /**
     * @brief 保存快照；同一 (aggregateId, version) 重复保存是幂等的
     */
    virtual Task<void> save(const std::string& aggregateId, int64_t version, const std::string& state) = 0;

    /**
     * @brief 版本最高的快照（给定 maxVersion 时不超过它）
     */
    virtual Task<std::optional<Snapshot>> getLatest(const std::string& aggregateId,
                                                    std::optional<int64_t> maxVersion = std::nullopt) = 0;

    SnapshotRetention retention() const { return retention_; }

protected:
    static void requireValid(const std::string& aggregateId, int64_t version) {
        if (aggregateId.empty()) {
            throw ValidationException("Snapshot aggregate id must not be empty");
        }
        if (version <= 0) {
            throw ValidationException("Snapshot version must be positive: " + std::to_string(version));
        }
    }

private:
    SnapshotRetention retention_;
};

/**
 * @brief 内存快照存储
 */
class InMemorySnapshotStore : public SnapshotStore {
public:
    explicit InMemorySnapshotStore(SnapshotRetention retention = SnapshotRetention::KeepLatest)
        : SnapshotStore(retention) {}

    Task<void> save(const std::string& aggregateId, int64_t version, const std::string& state) override {
        requireValid(aggregateId, version);

        std::lock_guard lock(mutex_);
        auto& byVersion = snapshots_[aggregateId];
        byVersion.try_emplace(version, Snapshot{aggregateId, version, state, TimestampHelper::now()});
        if (retention() == SnapshotRetention::KeepLatest) {
            byVersion.erase(byVersion.begin(), byVersion.find(byVersion.rbegin()->first));
        }
        co_return;
    }

    Task<std::optional<Snapshot>> getLatest(const std::string& aggregateId,
                                            std::optional<int64_t> maxVersion = std::nullopt) override {
        std::lock_guard lock(mutex_);
        auto it = snapshots_.find(aggregateId);
        if (it == snapshots_.end() || it->second.empty()) co_return std::nullopt;

        const auto& byVersion = it->second;
        if (!maxVersion) co_return byVersion.rbegin()->second;

        auto upper = byVersion.upper_bound(*maxVersion);
        if (upper == byVersion.begin()) co_return std::nullopt;
        co_return std::prev(upper)->second;
    }

    size_t count(const std::string& aggregateId) const {
        std::lock_guard lock(mutex_);
        auto it = snapshots_.find(aggregateId);
        return it == snapshots_.end() ? 0 : it->second.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<int64_t, Snapshot>> snapshots_;
};
