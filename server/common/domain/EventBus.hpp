#pragma once

#include "Subscription.hpp"

/**
 * @brief 事件总线 - 按优先级层级与主题路由的发布订阅
 *
 * 负责：
 * - 维护订阅注册表（写时复制，分发期间增删订阅不会看到半更新状态）
 * - 按 High → Normal → Low 顺序分发，层内按注册顺序
 * - 每个处理器独立的失败边界，失败汇总到 PublishResult
 *
 * 总线是显式实例，启动时创建一次并通过引用传递。
 *
 * 使用示例：
 * @code
 * EventBus bus(drogon::app().getLoop());
 *
 * bus.subscribe("OrderPlaced", [](const DomainEvent& e) -> Task<void> {
 *     LOG_INFO << "Order placed: " << *e.aggregateId();
 *     co_return;
 * }, EventPriority::High);
 *
 * auto result = co_await bus.publish(event);
 * if (!result.ok()) { ... }
 * @endcode
 */
class EventBus {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    using SubscriptionPtr = std::shared_ptr<const Subscription>;
    using Registry = std::vector<SubscriptionPtr>;

    /**
     * @param timerLoop publishAsync 超时定时器所在的 EventLoop
     */
    explicit EventBus(trantor::EventLoop* timerLoop = nullptr)
        : timerLoop_(timerLoop), registry_(std::make_shared<const Registry>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    trantor::EventLoop* loop() const { return timerLoop_; }

    // ==================== 订阅 ====================

    SubscriptionHandle subscribe(const std::string& eventType, EventHandler handler,
                                 EventPriority priority = EventPriority::Normal,
                                 std::optional<std::string> topicPattern = std::nullopt) {
        SubscriptionOptions options;
        options.eventType = eventType;
        options.priority = priority;
        options.topicPattern = std::move(topicPattern);
        return subscribe(std::move(options), std::move(handler));
    }

    SubscriptionHandle subscribe(SubscriptionOptions options, EventHandler handler) {
        if (!handler) {
            throw ConfigurationError("Handler for '" + options.eventType + "' must not be empty");
        }
        return subscribe(std::move(options),
            CancellableHandler([handler = std::move(handler)](const DomainEvent& e, CancellationToken) {
                return handler(e);
            }));
    }

    /**
     * @brief 注册可感知取消的处理器
     * @throws ConfigurationError 处理器为空、事件类型为空、主题模式非法或违反独占约束
     */
    SubscriptionHandle subscribe(SubscriptionOptions options, CancellableHandler handler) {
        if (!handler) {
            throw ConfigurationError("Handler for '" + options.eventType + "' must not be empty");
        }
        if (options.eventType.empty()) {
            throw ConfigurationError("Subscription event type must not be empty");
        }

        std::optional<TopicPattern> pattern;
        if (options.topicPattern) {
            pattern = TopicPattern::parse(*options.topicPattern);
        }

        std::lock_guard lock(mutex_);

        for (const auto& existing : *registry_) {
            if (existing->eventType != options.eventType) continue;
            bool samePattern = existing->topicPattern.has_value() == pattern.has_value()
                && (!pattern || existing->topicPattern->text() == pattern->text());
            if (!samePattern) continue;
            if (existing->exclusive || options.exclusive) {
                throw ConfigurationError("Exclusive subscription conflict for '" + options.eventType + "'"
                    + (pattern ? " on topic '" + pattern->text() + "'" : std::string())
                    + " (existing: " + existing->displayName() + ")");
            }
        }

        auto sub = std::make_shared<const Subscription>(Subscription{
            ++nextId_,
            options.eventType,
            options.priority,
            std::move(pattern),
            std::move(options.name),
            options.exclusive,
            std::move(handler)
        });

        auto next = std::make_shared<Registry>(*registry_);
        auto pos = std::upper_bound(next->begin(), next->end(), sub->priority,
            [](EventPriority p, const SubscriptionPtr& s) { return p < s->priority; });
        next->insert(pos, sub);
        registry_ = std::move(next);

        LOG_DEBUG << "EventBus: Subscribed " << sub->displayName() << " to " << sub->eventType
                  << " (" << priorityName(sub->priority) << ")";
        return SubscriptionHandle{sub->id, sub->eventType};
    }

    /**
     * @brief 订阅类型化负载
     *
     * E 需提供 `static constexpr const char* TYPE` 与 `static E fromJson(const Json::Value&)`，
     * 处理器只绑定到 E::TYPE 这一种事件类型。
     */
    template<typename E>
    SubscriptionHandle subscribe(TypedHandler<E> handler,
                                 EventPriority priority = EventPriority::Normal,
                                 std::string name = {}) {
        if (!handler) {
            throw ConfigurationError(std::string("Handler for '") + E::TYPE + "' must not be empty");
        }
        SubscriptionOptions options;
        options.eventType = E::TYPE;
        options.priority = priority;
        options.name = std::move(name);
        return subscribe(std::move(options),
            CancellableHandler([handler = std::move(handler)](const DomainEvent& e, CancellationToken) {
                return invokeTyped<E>(handler, e);
            }));
    }

    bool unsubscribe(const SubscriptionHandle& handle) {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(registry_->begin(), registry_->end(),
            [&](const SubscriptionPtr& s) { return s->id == handle.id; });
        if (it == registry_->end()) return false;

        auto next = std::make_shared<Registry>(*registry_);
        next->erase(next->begin() + (it - registry_->begin()));
        registry_ = std::move(next);
        LOG_DEBUG << "EventBus: Unsubscribed #" << handle.id << " from " << handle.eventType;
        return true;
    }

    /**
     * @brief 注销所有事件处理器（服务关闭时调用）
     */
    void unsubscribeAll() {
        std::lock_guard lock(mutex_);
        registry_ = std::make_shared<const Registry>();
        LOG_INFO << "EventBus: All handlers unsubscribed";
    }

    /** 当前注册表快照 */
    std::shared_ptr<const Registry> subscriptions() const {
        std::lock_guard lock(mutex_);
        return registry_;
    }

    size_t subscriptionCount() const { return subscriptions()->size(); }

    // ==================== 同步发布 ====================

    /**
     * @brief 按优先级顺序依次执行所有匹配的处理器
     *
     * 所有匹配处理器运行结束（成功或失败）后返回；处理器异常不会向外传播。
     */
    Task<PublishResult> publish(const DomainEvent& event) {
        auto snapshot = subscriptions();
        PublishResult result = beginResult(event);
        CancellationToken token;

        LOG_DEBUG << "EventBus: Publishing " << event.type() << " (" << event.id() << ")";

        for (const auto& sub : *snapshot) {
            if (!sub->matches(event)) continue;
            ++result.matched;

            std::string error;
            try {
                co_await sub->handler(event, token);
            } catch (const std::exception& e) {
                error = e.what();
            } catch (...) {
                error = "unknown exception";
            }
            recordOutcome(result, *sub, event, error, false);
        }

        co_return result;
    }

    /**
     * @brief 非协程调用方使用的同步发布
     */
    PublishResult publishBlocking(const DomainEvent& event) {
        return drogon::sync_wait(publish(event));
    }

    /**
     * @brief 依次发布多个事件（前一个事件的所有处理器结束后才发布下一个）
     */
    Task<std::vector<PublishResult>> publishMany(const std::vector<DomainEvent>& events) {
        std::vector<PublishResult> results;
        results.reserve(events.size());
        for (const auto& e : events) {
            results.push_back(co_await publish(e));
        }
        co_return results;
    }

    // ==================== 并发发布 ====================

    /**
     * @brief 层内并发、层间严格有序的发布
     *
     * @param maxConcurrency 单层内同时运行的处理器上限
     * @param timeout 整体超时；到期后取消令牌、放弃尚未开始的处理器，
     *                未完成的处理器记为已取消的失败，其后的层级不再执行
     * @param token 传给处理器的取消令牌，超时时由总线触发
     */
    Task<PublishResult> publishAsync(const DomainEvent& event,
                                     size_t maxConcurrency,
                                     std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                     CancellationToken token = {}) {
        if (maxConcurrency == 0) {
            throw ConfigurationError("maxConcurrency must be at least 1");
        }

        auto snapshot = subscriptions();
        PublishResult result = beginResult(event);
        auto shared = std::make_shared<const DomainEvent>(event);

        std::vector<std::vector<SubscriptionPtr>> tiers;
        std::optional<EventPriority> current;
        for (const auto& sub : *snapshot) {
            if (!sub->matches(event)) continue;
            if (!current || *current != sub->priority) {
                tiers.emplace_back();
                current = sub->priority;
            }
            tiers.back().push_back(sub);
        }

        auto* timerLoop = timerLoop_ ? timerLoop_ : trantor::EventLoop::getEventLoopOfCurrentThread();
        if (timeout && !timerLoop) {
            LOG_WARN << "EventBus: No event loop for publishAsync timeout, running without timeout";
        }
        auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds(0));

        LOG_DEBUG << "EventBus: Publishing " << event.type() << " (" << event.id() << ") async, "
                  << tiers.size() << " tier(s), maxConcurrency=" << maxConcurrency;

        for (size_t t = 0; t < tiers.size(); ++t) {
            const auto& tier = tiers[t];
            result.matched += tier.size();

            std::optional<std::chrono::milliseconds> remaining;
            if (timeout && timerLoop) {
                remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining->count() <= 0) {
                    markTimedOut(result, event, t, tiers, nullptr, token);
                    break;
                }
            }

            AsyncGate gate(maxConcurrency);
            CompletionLatch latch(tier.size());
            auto state = std::make_shared<TierState>(tier.size());

            for (size_t i = 0; i < tier.size(); ++i) {
                drogon::async_run([sub = tier[i], shared, gate, latch, state, i, token]() {
                    return runGated(sub, shared, gate, latch, state, i, token);
                });
            }

            bool completed = co_await latch.wait(timerLoop, remaining);
            if (!completed) {
                token.cancel();
                gate.drain();
                markTimedOut(result, event, t, tiers, state, token);
                break;
            }

            std::lock_guard lock(state->mutex);
            state->closed = true;
            for (size_t i = 0; i < tier.size(); ++i) {
                if (state->finished[i]) {
                    recordOutcome(result, *tier[i], event, state->errors[i], false);
                } else {
                    recordOutcome(result, *tier[i], event, "publish cancelled", true);
                }
            }
        }

        co_return result;
    }

private:
    /**
     * @brief 单层并发执行的共享进度（按下标记录每个处理器的结果）
     */
    struct TierState {
        explicit TierState(size_t n) : finished(n, false), errors(n) {}

        std::mutex mutex;
        std::vector<bool> finished;
        std::vector<std::string> errors;
        bool closed = false;
    };

    trantor::EventLoop* timerLoop_;
    mutable std::mutex mutex_;
    std::shared_ptr<const Registry> registry_;
    uint64_t nextId_ = 0;


    static Task<void> runGated(SubscriptionPtr sub,
                               std::shared_ptr<const DomainEvent> event,
                               AsyncGate gate,
                               CompletionLatch latch,
                               std::shared_ptr<TierState> state,
                               size_t index,
                               CancellationToken token) {
        bool admitted = co_await gate.acquire();
        if (admitted && token.isCancelled()) {
            gate.release();
        } else if (admitted) {
            std::string error;
            try {
                co_await sub->handler(*event, token);
            } catch (const std::exception& e) {
                error = e.what();
            } catch (...) {
                error = "unknown exception";
            }
            gate.release();

            std::lock_guard lock(state->mutex);
            if (state->closed) {
                LOG_WARN << "EventBus: Handler " << sub->displayName() << " finished after timeout for "
                         << event->type() << " (" << event->id() << ")"
                         << (error.empty() ? "" : ": " + error);
            } else {
                state->finished[index] = true;
                state->errors[index] = std::move(error);
            }
        }
        latch.countDown();
    }

    static PublishResult beginResult(const DomainEvent& event) {
        PublishResult result;
        result.eventId = event.id();
        result.eventType = event.type();
        return result;
    }

    static void recordOutcome(PublishResult& result, const Subscription& sub, const DomainEvent& event,
                              const std::string& error, bool cancelled) {
        bool failed = cancelled || !error.empty();
        result.outcomes.push_back({sub.id, sub.displayName(), !failed, cancelled, error});
        if (!failed) {
            ++result.delivered;
            return;
        }
        result.failures.emplace_back(sub.id, sub.displayName(), event.id(), event.type(), error, cancelled);
        if (cancelled) {
            LOG_WARN << "EventBus: Handler " << sub.displayName() << " cancelled for "
                     << event.type() << " (" << event.id() << "): " << error;
        } else {
            LOG_ERROR << "EventBus: Handler " << sub.displayName() << " failed for "
                      << event.type() << " (" << event.id() << "): " << error;
        }
    }

    /**
     * @brief 超时收尾：当前层未完成的处理器与后续层级全部记为已取消
     */
    static void markTimedOut(PublishResult& result, const DomainEvent& event, size_t tierIndex,
                             const std::vector<std::vector<SubscriptionPtr>>& tiers,
                             const std::shared_ptr<TierState>& state, CancellationToken& token) {
        token.cancel();
        result.timedOut = true;

        const auto& tier = tiers[tierIndex];
        if (state) {
            std::lock_guard lock(state->mutex);
            state->closed = true;
            for (size_t i = 0; i < tier.size(); ++i) {
                if (state->finished[i]) {
                    recordOutcome(result, *tier[i], event, state->errors[i], false);
                } else {
                    recordOutcome(result, *tier[i], event, "publish timed out", true);
                }
            }
        } else {
            for (const auto& sub : tier) {
                recordOutcome(result, *sub, event, "publish timed out before tier started", true);
            }
        }

        for (size_t t = tierIndex + 1; t < tiers.size(); ++t) {
            result.matched += tiers[t].size();
            for (const auto& sub : tiers[t]) {
                recordOutcome(result, *sub, event, "publish timed out before tier started", true);
            }
        }
    }
};
