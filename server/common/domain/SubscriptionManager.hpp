#pragma once

#include "EventBus.hpp"
#include "HandlerDecorators.hpp"

/**
 * @brief 托管订阅的配置
 */
struct SubscriptionConfig {
    std::string name;
    std::string eventType;
    EventPriority priority = EventPriority::Normal;
    std::optional<std::string> topicPattern;
    /** 启动时是否激活 */
    bool active = true;
    bool exclusive = false;
    int maxRetries = 0;
    std::chrono::milliseconds retryDelay{0};
    std::string description;
};

/**
 * @brief 原地修改托管订阅（未给出的字段保持不变）
 */
struct SubscriptionUpdate {
    std::optional<EventPriority> priority;
    /** 空字符串表示取消主题过滤 */
    std::optional<std::string> topicPattern;
    std::optional<bool> active;
    std::optional<std::string> description;
};

/**
 * @brief 单个订阅的处理统计
 */
struct HandlerMetrics {
    uint64_t invocations = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    double totalMs = 0;
    double minMs = 0;
    double maxMs = 0;
    std::optional<TimestampHelper::TimePoint> lastInvokedAt;
    std::string lastError;

    double avgMs() const { return invocations ? totalMs / static_cast<double>(invocations) : 0; }

    Json::Value toJson() const {
        Json::Value json;
        json["invocations"] = static_cast<Json::UInt64>(invocations);
        json["successes"] = static_cast<Json::UInt64>(successes);
        json["failures"] = static_cast<Json::UInt64>(failures);
        json["avgMs"] = avgMs();
        json["minMs"] = minMs;
        json["maxMs"] = maxMs;
        json["lastInvokedAt"] = lastInvokedAt ? Json::Value(TimestampHelper::toIso(*lastInvokedAt))
                                              : Json::Value(Json::nullValue);
        json["lastError"] = lastError.empty() ? Json::Value(Json::nullValue) : Json::Value(lastError);
        return json;
    }
};

/**
 * @brief 订阅管理器 - 启动时显式登记所有处理器
 *
 * 负责：
 * - 按名称登记处理器（名称唯一，可枚举）
 * - 按需包装重试装饰器与统计
 * - 整体或单个激活/停用（停用即从总线注销），原地修改优先级与主题
 * - 维护已知事件类型目录（登记处理器时自动加入）
 *
 * 使用示例：
 * @code
 * SubscriptionManager subs(bus);
 * subs.registerHandler({.name = "order-projection", .eventType = "OrderPlaced"}, handler);
 * subs.activateAll();
 * @endcode
 */
class SubscriptionManager {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    explicit SubscriptionManager(EventBus& bus) : bus_(bus) {}

    ~SubscriptionManager() {
        std::lock_guard lock(mutex_);
        for (auto& [name, entry] : entries_) {
            if (entry.handle) bus_.unsubscribe(*entry.handle);
        }
    }

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    /**
     * @throws ConfigurationError 名称为空或重复、事件类型为空、主题模式非法、重试参数非法
     */
    void registerHandler(SubscriptionConfig config, CancellableHandler handler) {
        if (config.name.empty()) {
            throw ConfigurationError("Managed subscription requires a name");
        }
        if (config.eventType.empty()) {
            throw ConfigurationError("Subscription '" + config.name + "' has no event type");
        }
        if (config.topicPattern) {
            TopicPattern::parse(*config.topicPattern);
        }
        if (config.retryDelay.count() < 0) {
            throw ConfigurationError("Subscription '" + config.name + "' has a negative retry delay");
        }

        auto retried = HandlerDecorators::withRetry(std::move(handler), config.maxRetries,
                                                    config.retryDelay, bus_.loop(), config.name);
        auto metrics = std::make_shared<MetricsCell>();
        CancellableHandler measured = [retried = std::move(retried), metrics](const DomainEvent& e, CancellationToken token) {
            return invokeMeasured(retried, metrics, e, token);
        };

        bool activateNow = false;
        {
            std::lock_guard lock(mutex_);
            if (entries_.contains(config.name)) {
                throw ConfigurationError("Duplicate subscription name: " + config.name);
            }
            activateNow = started_ && config.active;
            if (config.eventType != ANY_EVENT) eventTypes_.try_emplace(config.eventType, "");
            order_.push_back(config.name);
            entries_.emplace(config.name, Entry{config, std::move(measured), metrics, std::nullopt, config.active});
        }
        LOG_INFO << "SubscriptionManager: Registered " << config.name << " -> " << config.eventType
                 << (config.topicPattern ? " [" + *config.topicPattern + "]" : std::string())
                 << " (" << priorityName(config.priority) << ", retries=" << config.maxRetries << ")";

        if (activateNow) activate(config.name);
    }

    void registerHandler(SubscriptionConfig config, EventHandler handler) {
        if (!handler) {
            throw ConfigurationError("Subscription '" + config.name + "' has no handler");
        }
        registerHandler(std::move(config),
            CancellableHandler([handler = std::move(handler)](const DomainEvent& e, CancellationToken) {
                return handler(e);
            }));
    }

    /**
     * @brief 登记类型化处理器，事件类型取 E::TYPE
     */
    template<typename E>
    void registerHandler(SubscriptionConfig config, TypedHandler<E> handler) {
        if (!handler) {
            throw ConfigurationError("Subscription '" + config.name + "' has no handler");
        }
        config.eventType = E::TYPE;
        registerHandler(std::move(config),
            CancellableHandler([handler = std::move(handler)](const DomainEvent& e, CancellationToken) {
                return invokeTyped<E>(handler, e);
            }));
    }

    /**
     * @brief 登记事件类型（可附说明）；已存在时只在说明非空时覆盖说明
     * @throws ConfigurationError 类型为空或为通配符
     */
    void registerEventType(const std::string& eventType, const std::string& description = "") {
        if (eventType.empty() || eventType == ANY_EVENT) {
            throw ConfigurationError("Event type must be a concrete, non-empty name");
        }
        std::lock_guard lock(mutex_);
        auto [it, inserted] = eventTypes_.try_emplace(eventType, description);
        if (!inserted && !description.empty()) it->second = description;
    }

    /** @brief 已知事件类型（按名称排序） */
    std::vector<std::string> eventTypes() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> types;
        types.reserve(eventTypes_.size());
        for (const auto& [type, description] : eventTypes_) types.push_back(type);
        return types;
    }

    /**
     * @brief 原地修改优先级、主题、启用状态或说明，统计保持累积
     *
     * 已订阅到总线时先注销再按新配置订阅，同层内的执行顺序随之排到最后。
     * @return 名称不存在返回 false
     * @throws ConfigurationError 主题模式非法，或新配置被总线拒绝（此时订阅保持停用）
     */
    bool update(const std::string& name, const SubscriptionUpdate& change) {
        if (change.topicPattern && !change.topicPattern->empty()) {
            TopicPattern::parse(*change.topicPattern);
        }

        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(name);
            if (it == entries_.end()) return false;
            auto& entry = it->second;

            if (change.priority) entry.config.priority = *change.priority;
            if (change.topicPattern) {
                entry.config.topicPattern = change.topicPattern->empty()
                    ? std::nullopt : std::optional<std::string>(*change.topicPattern);
            }
            if (change.description) entry.config.description = *change.description;
            if (change.active) entry.enabled = *change.active;

            if (entry.handle) {
                bus_.unsubscribe(*entry.handle);
                entry.handle.reset();
            }
        }
        LOG_INFO << "SubscriptionManager: Updated " << name;

        subscribeIfEnabled(name);
        return true;
    }

    // ==================== 生命周期 ====================

    /**
     * @brief 订阅所有启用的处理器（按登记顺序）
     * @throws ConfigurationError 总线拒绝订阅（如独占冲突）
     */
    void activateAll() {
        std::vector<std::string> names;
        {
            std::lock_guard lock(mutex_);
            started_ = true;
            names = order_;
        }
        for (const auto& name : names) {
            subscribeIfEnabled(name);
        }
        LOG_INFO << "SubscriptionManager: Activated, " << activeCount() << " live subscription(s)";
    }

    void deactivateAll() {
        std::lock_guard lock(mutex_);
        started_ = false;
        for (auto& [name, entry] : entries_) {
            if (entry.handle) {
                bus_.unsubscribe(*entry.handle);
                entry.handle.reset();
            }
        }
        LOG_INFO << "SubscriptionManager: All subscriptions deactivated";
    }

    /**
     * @brief 启用单个订阅；管理器已启动时立即订阅到总线
     * @return 名称不存在返回 false
     */
    bool activate(const std::string& name) {
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(name);
            if (it == entries_.end()) return false;
            it->second.enabled = true;
        }
        subscribeIfEnabled(name);
        return true;
    }

    bool deactivate(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) return false;
        it->second.enabled = false;
        if (it->second.handle) {
            bus_.unsubscribe(*it->second.handle);
            it->second.handle.reset();
        }
        LOG_INFO << "SubscriptionManager: Deactivated " << name;
        return true;
    }

    /**
     * @brief 注销并移除订阅
     */
    bool remove(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) return false;
        if (it->second.handle) bus_.unsubscribe(*it->second.handle);
        entries_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
        return true;
    }

    // ==================== 查询 ====================

    bool isActive(const std::string& name) const {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(name);
        return it != entries_.end() && it->second.handle.has_value();
    }

    bool contains(const std::string& name) const {
        std::lock_guard lock(mutex_);
        return entries_.contains(name);
    }

    size_t activeCount() const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
            [](const auto& kv) { return kv.second.handle.has_value(); }));
    }

    std::vector<std::string> names() const {
        std::lock_guard lock(mutex_);
        return order_;
    }

    std::optional<HandlerMetrics> metrics(const std::string& name) const {
        std::shared_ptr<MetricsCell> cell;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(name);
            if (it == entries_.end()) return std::nullopt;
            cell = it->second.metrics;
        }
        std::lock_guard lock(cell->mutex);
        return cell->data;
    }

    /**
     * @brief {subscriptions: [配置、状态与统计], eventTypes: [{type, description, subscribers}]}
     */
    Json::Value toJson() const {
        Json::Value list(Json::arrayValue);
        Json::Value types(Json::arrayValue);
        std::lock_guard lock(mutex_);
        for (const auto& name : order_) {
            const auto& entry = entries_.at(name);
            const auto& c = entry.config;
            Json::Value item;
            item["name"] = c.name;
            item["eventType"] = c.eventType;
            item["priority"] = priorityName(c.priority);
            JsonHelper::setOptional(item, "topicPattern", c.topicPattern);
            item["exclusive"] = c.exclusive;
            item["maxRetries"] = c.maxRetries;
            item["retryDelayMs"] = static_cast<Json::Int64>(c.retryDelay.count());
            item["description"] = c.description;
            item["enabled"] = entry.enabled;
            item["active"] = entry.handle.has_value();
            {
                std::lock_guard metricsLock(entry.metrics->mutex);
                item["metrics"] = entry.metrics->data.toJson();
            }
            list.append(item);
        }

        for (const auto& [type, description] : eventTypes_) {
            Json::Value item;
            item["type"] = type;
            item["description"] = description;
            item["subscribers"] = static_cast<Json::UInt64>(std::count_if(entries_.begin(), entries_.end(),
                [&type = type](const auto& kv) { return kv.second.config.eventType == type; }));
            types.append(item);
        }

        Json::Value json;
        json["subscriptions"] = list;
        json["eventTypes"] = types;
        return json;
    }

private:
    struct MetricsCell {
        std::mutex mutex;
        HandlerMetrics data;

        void record(double ms, const std::string& error) {
            std::lock_guard lock(mutex);
            auto& m = data;
            m.minMs = m.invocations == 0 ? ms : std::min(m.minMs, ms);
            m.maxMs = std::max(m.maxMs, ms);
            ++m.invocations;
            m.totalMs += ms;
            m.lastInvokedAt = TimestampHelper::now();
            if (error.empty()) {
                ++m.successes;
            } else {
                ++m.failures;
                m.lastError = error;
            }
        }
    };

    struct Entry {
        SubscriptionConfig config;
        CancellableHandler handler;
        std::shared_ptr<MetricsCell> metrics;
        std::optional<SubscriptionHandle> handle;
        bool enabled;
    };

    EventBus& bus_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> eventTypes_;
    bool started_ = false;

    void subscribeIfEnabled(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) return;
        auto& entry = it->second;
        if (!started_ || !entry.enabled || entry.handle) return;

        SubscriptionOptions options;
        options.eventType = entry.config.eventType;
        options.priority = entry.config.priority;
        options.topicPattern = entry.config.topicPattern;
        options.name = entry.config.name;
        options.exclusive = entry.config.exclusive;
        entry.handle = bus_.subscribe(std::move(options), entry.handler);
        LOG_DEBUG << "SubscriptionManager: Activated " << name;
    }

    static Task<void> invokeMeasured(CancellableHandler handler, std::shared_ptr<MetricsCell> metrics,
                                     const DomainEvent& event, CancellationToken token) {
        auto start = std::chrono::steady_clock::now();
        std::exception_ptr failure;
        std::string error;
        try {
            co_await handler(event, token);
        } catch (const std::exception& e) {
            failure = std::current_exception();
            error = e.what();
        } catch (...) {
            failure = std::current_exception();
            error = "unknown exception";
        }

        std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
        metrics->record(elapsed.count(), error);
        if (failure) std::rethrow_exception(failure);
    }

};
