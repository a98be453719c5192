#pragma once

#include "EventBus.hpp"
#include "SubscriptionManager.hpp"
#include "common/eventstore/EventStore.hpp"

/**
 * @brief 分发模式
 */
enum class DispatchMode {
    Sync,   ///< 保存在所有处理器执行完后才返回
    Async   ///< 后台 publishAsync，保存立即返回
};

/**
 * @throws ConfigurationError 未知模式
 */
inline DispatchMode parseDispatchMode(const std::string& name) {
    if (name == "sync") return DispatchMode::Sync;
    if (name == "async") return DispatchMode::Async;
    throw ConfigurationError("Unknown dispatch mode: " + name);
}

struct DispatcherOptions {
    DispatchMode mode = DispatchMode::Sync;
    size_t maxConcurrency = 10;
    std::chrono::milliseconds asyncTimeout{5000};
    std::chrono::milliseconds stopTimeout{5000};
    size_t historyLimit = 1000;
};

/**
 * @brief 事件处理状态
 *
 * Created → Appended → Published → 每个订阅者 Delivered | Failed
 */
enum class EventProcessingState {
    Created,
    Appended,
    Published,
    Delivered,
    Failed
};

inline const char* stateName(EventProcessingState s) {
    switch (s) {
        case EventProcessingState::Created: return "CREATED";
        case EventProcessingState::Appended: return "APPENDED";
        case EventProcessingState::Published: return "PUBLISHED";
        case EventProcessingState::Delivered: return "DELIVERED";
        case EventProcessingState::Failed: return "FAILED";
    }
    return "CREATED";
}

/**
 * @brief 单个订阅者的投递记录
 */
struct DeliveryRecord {
    uint64_t subscriptionId;
    std::string handlerName;
    EventProcessingState state;
    std::string error;
};

/**
 * @brief 单个事件的分发记录
 */
struct DispatchRecord {
    std::string eventId;
    std::string eventType;
    std::optional<std::string> aggregateId;
    int64_t version = 0;
    EventProcessingState state = EventProcessingState::Created;
    std::vector<DeliveryRecord> deliveries;
    bool timedOut = false;
    TimestampHelper::TimePoint updatedAt{};

    Json::Value toJson() const {
        Json::Value json;
        json["eventId"] = eventId;
        json["eventType"] = eventType;
        JsonHelper::setOptional(json, "aggregateId", aggregateId);
        json["version"] = static_cast<Json::Int64>(version);
        json["state"] = stateName(state);
        json["timedOut"] = timedOut;
        json["updatedAt"] = TimestampHelper::toIso(updatedAt);
        Json::Value list(Json::arrayValue);
        for (const auto& d : deliveries) {
            Json::Value item;
            item["subscriptionId"] = static_cast<Json::UInt64>(d.subscriptionId);
            item["handler"] = d.handlerName;
            item["state"] = stateName(d.state);
            item["error"] = d.error.empty() ? Json::Value(Json::nullValue) : Json::Value(d.error);
            list.append(item);
        }
        json["deliveries"] = list;
        return json;
    }
};

/**
 * @brief 事件分发器 - 只把已持久化的事件交给总线
 *
 * 负责：
 * - 发件箱：提交后的事件按提交顺序排队；停止期间保持排队，start() 时补发
 * - 同步/异步两种分发模式
 * - 有界的分发记录历史，可按事件 id 查询
 * - 启停时整体激活/停用托管订阅，stop() 限时等待后台分发
 *
 * 关闭前先 co_await stop()。析构时取消仍在运行的后台分发，并阻塞到它们全部
 * 退出（publishAsync 受 asyncTimeout 约束，不受忽略取消的处理器影响），
 * 因此析构不能发生在总线的定时 EventLoop 线程上。
 */
class EventDispatcher {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    EventDispatcher(EventBus& bus, EventStore& store, SubscriptionManager& subscriptions,
                    DispatcherOptions options = {})
        : bus_(bus), store_(store), subscriptions_(subscriptions), options_(options) {
        if (options_.maxConcurrency == 0) {
            throw ConfigurationError("Dispatcher maxConcurrency must be at least 1");
        }
        if (options_.historyLimit == 0) {
            throw ConfigurationError("Dispatcher historyLimit must be at least 1");
        }
    }

    ~EventDispatcher() {
        {
            std::lock_guard lock(mutex_);
            for (auto& [eventId, token] : inFlight_) token.cancel();
        }
        std::unique_lock lock(background_->mutex);
        if (background_->running > 0) {
            LOG_WARN << "EventDispatcher: Waiting for " << background_->running << " background dispatch(es)";
        }
        background_->idle.wait(lock, [this] { return background_->running == 0; });
    }

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // ==================== 生命周期 ====================

    /**
     * @brief 激活托管订阅并补发停止期间排队的事件
     */
    Task<void> start() {
        subscriptions_.activateAll();

        size_t flushed = 0;
        while (true) {
            std::vector<DomainEvent> batch;
            {
                std::lock_guard lock(mutex_);
                if (outbox_.empty()) {
                    running_ = true;
                    break;
                }
                batch.assign(outbox_.begin(), outbox_.end());
                outbox_.clear();
            }
            flushed += batch.size();
            co_await publishAll(batch);
        }

        LOG_INFO << "EventDispatcher: Started (" << (options_.mode == DispatchMode::Sync ? "sync" : "async")
                 << " mode), flushed " << flushed << " queued event(s)";
    }

    /**
     * @brief 停用订阅，限时等待后台分发，超时的取消并记录
     */
    Task<void> stop() {
        {
            std::lock_guard lock(mutex_);
            running_ = false;
        }
        subscriptions_.deactivateAll();

        auto* loop = bus_.loop() ? bus_.loop() : trantor::EventLoop::getEventLoopOfCurrentThread();
        auto deadline = std::chrono::steady_clock::now() + options_.stopTimeout;
        if (loop) {
            while (inFlightCount() > 0 && std::chrono::steady_clock::now() < deadline) {
                co_await drogon::sleepCoro(loop, std::chrono::milliseconds(10));
            }
        }

        std::lock_guard lock(mutex_);
        for (auto& [eventId, token] : inFlight_) {
            token.cancel();
            LOG_WARN << "EventDispatcher: Cancelled in-flight dispatch of " << eventId
                     << " after stop timeout " << options_.stopTimeout.count() << "ms";
        }
        LOG_INFO << "EventDispatcher: Stopped, " << outbox_.size() << " event(s) left in outbox";
    }

    bool isRunning() const {
        std::lock_guard lock(mutex_);
        return running_;
    }

    // ==================== 分发 ====================

    /**
     * @brief 追加并分发（无聚合的事件生产者使用）
     * @return 聚合新版本
     * @throws ConcurrencyError 追加失败时不会分发任何事件
     */
    Task<int64_t> appendAndPublish(std::vector<DomainEvent> events, int64_t expectedVersion) {
        for (const auto& e : events) {
            track(e, EventProcessingState::Created);
        }

        int64_t newVersion = 0;
        try {
            newVersion = co_await store_.appendAll(events, expectedVersion);
        } catch (const std::exception&) {
            std::lock_guard lock(mutex_);
            for (const auto& ev : events) forget(ev.id());
            throw;
        }

        std::vector<DomainEvent> committed;
        committed.reserve(events.size());
        int64_t version = expectedVersion;
        for (const auto& e : events) {
            committed.push_back(e.withVersion(++version));
        }
        co_await dispatchCommitted(std::move(committed));
        co_return newVersion;
    }

    /**
     * @brief 分发已持久化的事件（仓储在提交后调用）
     *
     * 同步模式下返回时所有匹配处理器已执行完毕；停止期间只入队。
     */
    Task<void> dispatchCommitted(std::vector<DomainEvent> events) {
        {
            std::lock_guard lock(mutex_);
            for (const auto& e : events) {
                trackLocked(e, EventProcessingState::Appended);
            }
            if (!running_) {
                for (auto& e : events) outbox_.push_back(std::move(e));
                LOG_DEBUG << "EventDispatcher: Not running, " << outbox_.size() << " event(s) queued";
                co_return;
            }
        }
        co_await publishAll(events);
    }

    // ==================== 查询 ====================

    std::optional<DispatchRecord> record(const std::string& eventId) const {
        std::lock_guard lock(mutex_);
        auto it = records_.find(eventId);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    size_t queuedCount() const {
        std::lock_guard lock(mutex_);
        return outbox_.size();
    }

    size_t inFlightCount() const {
        std::lock_guard lock(mutex_);
        return inFlight_.size();
    }

    /** @brief 尚未退出的后台分发协程数（含已取消、仍在收尾的） */
    size_t backgroundCount() const {
        std::lock_guard lock(background_->mutex);
        return background_->running;
    }

    const DispatcherOptions& options() const { return options_; }

private:
    /**
     * @brief 后台分发计数，由每个后台协程共同持有
     */
    struct BackgroundTasks {
        std::mutex mutex;
        std::condition_variable idle;
        size_t running = 0;
    };

    /**
     * @brief 后台协程帧内的计数守卫，随协程帧销毁而递减
     */
    class BackgroundGuard {
    public:
        explicit BackgroundGuard(std::shared_ptr<BackgroundTasks> tasks) : tasks_(std::move(tasks)) {
            std::lock_guard lock(tasks_->mutex);
            ++tasks_->running;
        }

        ~BackgroundGuard() {
            std::lock_guard lock(tasks_->mutex);
            if (--tasks_->running == 0) tasks_->idle.notify_all();
        }

        BackgroundGuard(const BackgroundGuard&) = delete;
        BackgroundGuard& operator=(const BackgroundGuard&) = delete;

    private:
        std::shared_ptr<BackgroundTasks> tasks_;
    };

    EventBus& bus_;
    EventStore& store_;
    SubscriptionManager& subscriptions_;
    DispatcherOptions options_;

    mutable std::mutex mutex_;
    bool running_ = false;
    std::deque<DomainEvent> outbox_;
    std::unordered_map<std::string, DispatchRecord> records_;
    std::deque<std::string> recordOrder_;
    std::unordered_map<std::string, CancellationToken> inFlight_;
    std::shared_ptr<BackgroundTasks> background_ = std::make_shared<BackgroundTasks>();

    Task<void> publishAll(const std::vector<DomainEvent>& events) {
        for (const auto& e : events) {
            markPublished(e.id());
            if (options_.mode == DispatchMode::Sync) {
                auto result = co_await bus_.publish(e);
                complete(result);
            } else {
                CancellationToken token;
                {
                    std::lock_guard lock(mutex_);
                    inFlight_.emplace(e.id(), token);
                }
                // guard 随 async_run 的协程帧存活，析构函数据此等待本次分发结束
                drogon::async_run([this, e, token, guard = std::make_shared<BackgroundGuard>(background_)]() {
                    return publishInBackground(e, token);
                });
            }
        }
    }

    Task<void> publishInBackground(DomainEvent event, CancellationToken token) {
        PublishResult result;
        std::string error;
        try {
            result = co_await bus_.publishAsync(event, options_.maxConcurrency, options_.asyncTimeout, token);
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (!error.empty()) {
            LOG_ERROR << "EventDispatcher: Async publish of " << event.type() << " (" << event.id()
                      << ") failed: " << error;
            result.eventId = event.id();
            result.eventType = event.type();
            result.timedOut = true;
        }
        complete(result);

        std::lock_guard lock(mutex_);
        inFlight_.erase(event.id());
    }

    void complete(const PublishResult& result) {
        std::lock_guard lock(mutex_);
        auto it = records_.find(result.eventId);
        if (it == records_.end()) return;

        auto& rec = it->second;
        rec.timedOut = result.timedOut;
        rec.deliveries.clear();
        for (const auto& o : result.outcomes) {
            rec.deliveries.push_back({o.subscriptionId, o.handlerName,
                o.delivered ? EventProcessingState::Delivered : EventProcessingState::Failed, o.error});
        }
        if (result.timedOut && result.outcomes.empty()) {
            rec.state = EventProcessingState::Failed;
        } else {
            rec.state = result.ok() ? EventProcessingState::Delivered : EventProcessingState::Failed;
        }
        rec.updatedAt = TimestampHelper::now();

        if (!result.ok()) {
            LOG_WARN << "EventDispatcher: " << result.eventType << " (" << result.eventId << ") delivered to "
                     << result.delivered << "/" << result.matched << " subscriber(s)"
                     << (result.timedOut ? ", timed out" : "");
        }
    }

    void track(const DomainEvent& e, EventProcessingState state) {
        std::lock_guard lock(mutex_);
        trackLocked(e, state);
    }

    void trackLocked(const DomainEvent& e, EventProcessingState state) {
        auto [it, inserted] = records_.try_emplace(e.id());
        auto& rec = it->second;
        if (inserted) {
            rec.eventId = e.id();
            rec.eventType = e.type();
            recordOrder_.push_back(e.id());
            while (recordOrder_.size() > options_.historyLimit) {
                records_.erase(recordOrder_.front());
                recordOrder_.pop_front();
            }
        }
        rec.aggregateId = e.aggregateId();
        rec.version = e.version();
        rec.state = state;
        rec.updatedAt = TimestampHelper::now();
    }

    /**
     * @brief 只推进仍在历史中的记录，已被淘汰的不再重新登记
     */
    void markPublished(const std::string& eventId) {
        std::lock_guard lock(mutex_);
        auto it = records_.find(eventId);
        if (it == records_.end()) return;
        it->second.state = EventProcessingState::Published;
        it->second.updatedAt = TimestampHelper::now();
    }

    void forget(const std::string& eventId) {
        records_.erase(eventId);
        recordOrder_.erase(std::remove(recordOrder_.begin(), recordOrder_.end(), eventId), recordOrder_.end());
    }
};
