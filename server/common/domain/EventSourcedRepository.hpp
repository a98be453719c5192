#pragma once

#include "Aggregate.hpp"
#include "EventDispatcher.hpp"
#include "common/eventstore/EventStore.hpp"
#include "common/eventstore/SnapshotStore.hpp"

/**
 * @brief 快照节奏：版本每跨过 every 的整数倍时保存一次，0 表示不保存
 */
struct SnapshotPolicy {
    int64_t every = 0;

    bool shouldSnapshot(int64_t before, int64_t after) const {
        return every > 0 && after / every > before / every;
    }
};

/**
 * @brief 事件溯源仓储
 *
 * 加载：最新快照 → 快照版本之后的事件 → 按 reducer 表逐个重放。
 * 保存：以 persistedVersion 为期望版本追加 → 清空队列 → 按策略保存快照
 *       → 交给分发器发布。并发冲突原样抛给调用方，由调用方重新加载后重试。
 *
 * 使用示例：
 * @code
 * EventSourcedRepository<OrderState> repo(behavior, store, &snapshots, {.every = 50}, &dispatcher);
 * auto order = co_await repo.load(orderId);
 * order.raise(OrderShipped{...});
 * co_await repo.save(order);
 * @endcode
 */
template<typename State>
class EventSourcedRepository {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;
    using AggregateType = Aggregate<State>;
    using BehaviorPtr = typename AggregateType::BehaviorPtr;

    EventSourcedRepository(BehaviorPtr behavior,
                           EventStore& store,
                           SnapshotStore* snapshots = nullptr,
                           SnapshotPolicy policy = {},
                           EventDispatcher* dispatcher = nullptr)
        : behavior_(std::move(behavior)), store_(store), snapshots_(snapshots),
          policy_(policy), dispatcher_(dispatcher) {
        if (!behavior_) {
            throw ConfigurationError("Repository requires an aggregate behavior");
        }
        if (policy_.every < 0) {
            throw ConfigurationError("Snapshot interval must not be negative");
        }
        if (snapshots_ && policy_.every > 0 && !behavior_->canSnapshot()) {
            throw ConfigurationError("Aggregate " + behavior_->aggregateType()
                + " has a snapshot policy but no state codec");
        }
    }

    /**
     * @brief 新建聚合（版本 0，尚未持久化）
     */
    AggregateType create(const std::string& id) const {
        return AggregateType(id, behavior_);
    }

    /**
     * @brief 重建聚合；既无快照也无事件时返回 nullopt
     * @throws ReplayError reducer 失败或事件流断档
     */
    Task<std::optional<AggregateType>> getById(const std::string& id) {
        AggregateType aggregate(id, behavior_);

        auto snapshot = co_await loadSnapshot(id);
        if (snapshot) {
            aggregate.restoreSnapshot(std::move(snapshot->state), snapshot->version);
        }

        auto events = co_await store_.getEvents(id, aggregate.version());
        if (!snapshot && events.empty()) co_return std::nullopt;

        for (const auto& event : events) {
            int64_t expected = aggregate.version() + 1;
            if (event.version() != expected) {
                throw ReplayError(id, event.version(),
                    "expected version " + std::to_string(expected) + " (stream has a gap)");
            }
            try {
                aggregate.replay(event);
            } catch (const std::exception& e) {
                throw ReplayError(id, event.version(), event.type() + ": " + e.what());
            }
        }

        LOG_TRACE << "Repository: Loaded " << behavior_->aggregateType() << " " << id
                  << " at version " << aggregate.version()
                  << (snapshot ? " from snapshot " + std::to_string(snapshot->version) : std::string())
                  << ", replayed " << aggregate.replayedEvents();
        co_return aggregate;
    }

    /**
     * @throws NotFoundException 聚合不存在
     */
    Task<AggregateType> load(const std::string& id) {
        auto aggregate = co_await getById(id);
        if (!aggregate) {
            throw NotFoundException(behavior_->aggregateType() + " " + id + " not found");
        }
        co_return std::move(*aggregate);
    }

    /**
     * @brief 保存未提交事件
     * @return 聚合新版本
     * @throws ConcurrencyError 期望版本已过期，聚合保持原样
     */
    Task<int64_t> save(AggregateType& aggregate) {
        if (!aggregate.hasChanges()) co_return aggregate.version();

        int64_t before = aggregate.persistedVersion();
        int64_t after = co_await store_.appendAll(aggregate.pendingEvents(), before);
        auto committed = aggregate.markCommitted(after);

        if (snapshots_ && policy_.shouldSnapshot(before, after)) {
            co_await trySnapshot(aggregate);
        }

        if (dispatcher_) {
            co_await dispatcher_->dispatchCommitted(std::move(committed));
        }
        co_return after;
    }

    const AggregateBehavior<State>& behavior() const { return *behavior_; }

private:
    BehaviorPtr behavior_;
    EventStore& store_;
    SnapshotStore* snapshots_;
    SnapshotPolicy policy_;
    EventDispatcher* dispatcher_;

    struct LoadedSnapshot {
        State state;
        int64_t version;
    };

    /**
     * @brief 快照只是缓存：读取或解码失败时记录日志并从头重放
     */
    Task<std::optional<LoadedSnapshot>> loadSnapshot(const std::string& id) {
        if (!snapshots_ || !behavior_->canSnapshot()) co_return std::nullopt;

        std::optional<LoadedSnapshot> loaded;
        std::string error;
        try {
            auto snapshot = co_await snapshots_->getLatest(id);
            if (snapshot) {
                loaded = LoadedSnapshot{behavior_->decode(snapshot->state), snapshot->version};
            }
        } catch (const AppException& e) {
            error = e.what();
        }
        if (!error.empty()) {
            LOG_WARN << "Repository: Ignoring snapshot of " << id << ", replaying from start: " << error;
            co_return std::nullopt;
        }
        co_return loaded;
    }

    /**
     * @brief 快照失败不影响已提交的事件
     */
    Task<void> trySnapshot(const AggregateType& aggregate) {
        std::string error;
        try {
            co_await snapshots_->save(aggregate.id(), aggregate.version(), behavior_->encode(aggregate.state()));
        } catch (const AppException& e) {
            error = e.what();
        }
        if (!error.empty()) {
            LOG_ERROR << "Repository: Snapshot of " << aggregate.id() << " at version "
                     << aggregate.version() << " failed: " << error;
        } else {
            LOG_DEBUG << "Repository: Snapshot of " << aggregate.id() << " at version " << aggregate.version();
        }
    }
};
