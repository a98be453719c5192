#pragma once

#include "EventCoreConfig.hpp"
#include "EventSourcedRepository.hpp"
#include "common/eventstore/InMemoryEventStore.hpp"
#include "common/eventstore/PostgresEventStore.hpp"
#include "common/eventstore/PostgresSnapshotStore.hpp"
#include "common/eventstore/RedisSnapshotStore.hpp"

/**
 * @brief 事件溯源核心的组装点
 *
 * 按配置创建总线、事件存储、快照存储、订阅管理器和分发器，
 * 并为各聚合提供仓储。成员按依赖顺序声明，析构时逆序销毁。
 *
 * 使用示例：
 * @code
 * EventCoreContext core(ConfigManager::eventCore(), app().getLoop());
 * OrderEventHandlers::registerAll(core.subscriptions(), projection);
 * co_await core.start();
 * auto repo = core.repository(OrderBehavior::instance());
 * @endcode
 */
class EventCoreContext {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    /**
     * @param timerLoop 异步发布超时与重试延迟使用的事件循环
     * @throws ConfigurationError 配置组合非法
     */
    explicit EventCoreContext(EventCoreConfig config, trantor::EventLoop* timerLoop = nullptr)
        : config_(std::move(config)),
          bus_(timerLoop),
          store_(makeEventStore(config_)),
          snapshots_(makeSnapshotStore(config_)),
          subscriptions_(bus_),
          dispatcher_(bus_, *store_, subscriptions_, config_.dispatcherOptions()) {
        LOG_INFO << "EventCore: event store=" << backendName(config_.eventStore)
                 << ", snapshots=" << backendName(config_.snapshots)
                 << " (every " << config_.snapshotEvery << ")"
                 << ", dispatch=" << (config_.dispatchMode == DispatchMode::Sync ? "sync" : "async");
    }

    EventCoreContext(const EventCoreContext&) = delete;
    EventCoreContext& operator=(const EventCoreContext&) = delete;

    /**
     * @brief 为聚合创建仓储，共享本上下文的存储、快照和分发器
     */
    template<typename State>
    EventSourcedRepository<State> repository(typename Aggregate<State>::BehaviorPtr behavior) {
        SnapshotPolicy policy{snapshots_ && behavior && behavior->canSnapshot() ? config_.snapshotEvery : 0};
        return EventSourcedRepository<State>(std::move(behavior), *store_, snapshots_.get(), policy, &dispatcher_);
    }

    Task<void> start() { co_await dispatcher_.start(); }
    Task<void> stop() { co_await dispatcher_.stop(); }

    const EventCoreConfig& config() const { return config_; }
    EventBus& bus() { return bus_; }
    EventStore& store() { return *store_; }
    /** 未配置快照时为 nullptr */
    SnapshotStore* snapshots() { return snapshots_.get(); }
    SubscriptionManager& subscriptions() { return subscriptions_; }
    EventDispatcher& dispatcher() { return dispatcher_; }

private:
    EventCoreConfig config_;
    EventBus bus_;
    std::unique_ptr<EventStore> store_;
    std::unique_ptr<SnapshotStore> snapshots_;
    SubscriptionManager subscriptions_;
    EventDispatcher dispatcher_;

    static std::unique_ptr<EventStore> makeEventStore(const EventCoreConfig& config) {
        switch (config.eventStore) {
            case EventStoreBackend::Postgres: return std::make_unique<PostgresEventStore>();
            case EventStoreBackend::Memory: return std::make_unique<InMemoryEventStore>();
        }
        throw ConfigurationError("Unsupported event store backend");
    }

    static std::unique_ptr<SnapshotStore> makeSnapshotStore(const EventCoreConfig& config) {
        switch (config.snapshots) {
            case SnapshotBackend::Postgres: return std::make_unique<PostgresSnapshotStore>(config.retention);
            case SnapshotBackend::Redis: return std::make_unique<RedisSnapshotStore>(config.retention);
            case SnapshotBackend::Memory: return std::make_unique<InMemorySnapshotStore>(config.retention);
            case SnapshotBackend::None: return nullptr;
        }
        throw ConfigurationError("Unsupported snapshot backend");
    }

    static const char* backendName(EventStoreBackend b) {
        return b == EventStoreBackend::Postgres ? "postgres" : "memory";
    }

    static const char* backendName(SnapshotBackend b) {
        switch (b) {
            case SnapshotBackend::Postgres: return "postgres";
            case SnapshotBackend::Redis: return "redis";
            case SnapshotBackend::Memory: return "memory";
            case SnapshotBackend::None: return "none";
        }
        return "none";
    }
};
