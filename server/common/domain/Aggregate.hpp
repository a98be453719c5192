#pragma once

#include "DomainEvent.hpp"
#include "common/utils/JsonHelper.hpp"

template<typename State>
class EventSourcedRepository;

/**
 * @brief 聚合行为定义：初始状态 + 事件类型 → reducer 表 + 快照编解码
 *
 * 状态是纯数据，行为集中在这张表里，重放时按事件类型查表调用，
 * 同样的事件序列总是得到同样的状态。
 *
 * 使用示例：
 * @code
 * auto behavior = std::make_shared<AggregateBehavior<OrderState>>("Order");
 * behavior->on<OrderPlaced>([](const OrderState& s, const OrderPlaced& e) {
 *     OrderState next = s;
 *     next.customerId = e.customerId;
 *     return next;
 * });
 * behavior->codec(OrderState::toJson, OrderState::fromJson);
 * @endcode
 */
template<typename State>
class AggregateBehavior {
public:
    using Reducer = std::function<State(const State&, const DomainEvent&)>;
    using Encoder = std::function<Json::Value(const State&)>;
    using Decoder = std::function<State(const Json::Value&)>;

    explicit AggregateBehavior(std::string aggregateType,
                               std::function<State()> initial = [] { return State{}; })
        : aggregateType_(std::move(aggregateType)), initial_(std::move(initial)) {
        if (aggregateType_.empty()) {
            throw ConfigurationError("Aggregate type must not be empty");
        }
    }

    /**
     * @throws ConfigurationError reducer 为空或同一事件类型重复注册
     */
    AggregateBehavior& on(const std::string& eventType, Reducer reducer) {
        if (!reducer) {
            throw ConfigurationError("Reducer for " + aggregateType_ + "." + eventType + " must not be empty");
        }
        if (!reducers_.emplace(eventType, std::move(reducer)).second) {
            throw ConfigurationError("Duplicate reducer for " + aggregateType_ + "." + eventType);
        }
        return *this;
    }

    /**
     * @brief 注册类型化 reducer（E 提供 TYPE 与 fromJson）
     */
    template<typename E>
    AggregateBehavior& on(std::function<State(const State&, const E&)> reducer) {
        if (!reducer) {
            throw ConfigurationError(std::string("Reducer for ") + aggregateType_ + "." + E::TYPE + " must not be empty");
        }
        return on(E::TYPE, [reducer = std::move(reducer)](const State& s, const DomainEvent& e) {
            return reducer(s, E::fromJson(e.payload()));
        });
    }

    AggregateBehavior& codec(Encoder encode, Decoder decode) {
        encode_ = std::move(encode);
        decode_ = std::move(decode);
        return *this;
    }

    const std::string& aggregateType() const { return aggregateType_; }
    State initial() const { return initial_(); }
    bool handles(const std::string& eventType) const { return reducers_.contains(eventType); }
    bool canSnapshot() const { return encode_ && decode_; }

    /**
     * @throws ConfigurationError 事件类型没有 reducer
     */
    State apply(const State& state, const DomainEvent& event) const {
        auto it = reducers_.find(event.type());
        if (it == reducers_.end()) {
            throw ConfigurationError("No reducer for " + aggregateType_ + "." + event.type());
        }
        return it->second(state, event);
    }

    /**
     * @throws SerializationError 未配置编解码器或状态含非有限数值
     */
    std::string encode(const State& state) const {
        if (!encode_) {
            throw SerializationError("No state codec for aggregate " + aggregateType_);
        }
        auto json = encode_(state);
        if (!JsonHelper::allNumbersFinite(json)) {
            throw SerializationError("State of " + aggregateType_ + " contains a non-finite number");
        }
        return JsonHelper::serialize(json);
    }

    State decode(const std::string& text) const {
        if (!decode_) {
            throw SerializationError("No state codec for aggregate " + aggregateType_);
        }
        try {
            return decode_(JsonHelper::parse(text));
        } catch (const SerializationError&) {
            throw;
        } catch (const std::exception& e) {
            throw SerializationError("Cannot decode " + aggregateType_ + " state: " + e.what());
        }
    }

private:
    std::string aggregateType_;
    std::function<State()> initial_;
    std::unordered_map<std::string, Reducer> reducers_;
    Encoder encode_;
    Decoder decode_;
};

/**
 * @brief 事件溯源聚合实例
 *
 * 持有当前状态、版本和尚未持久化的事件。命令方法先校验不变式，
 * 再通过 raise() 产生事件；raise() 立即经 reducer 更新状态。
 * 版本字段由仓储在重放和提交时维护。
 */
template<typename State>
class Aggregate {
public:
    using BehaviorPtr = std::shared_ptr<const AggregateBehavior<State>>;

    Aggregate(std::string id, BehaviorPtr behavior)
        : id_(std::move(id)), behavior_(std::move(behavior)) {
        if (id_.empty()) {
            throw ValidationException("Aggregate id must not be empty");
        }
        if (!behavior_) {
            throw ConfigurationError("Aggregate " + id_ + " has no behavior");
        }
        state_ = behavior_->initial();
    }

    // ========== 状态查询 ==========

    const std::string& id() const { return id_; }
    const std::string& aggregateType() const { return behavior_->aggregateType(); }
    const State& state() const { return state_; }
    int64_t version() const { return version_; }
    /** 最近一次持久化后的版本，即保存时的期望版本 */
    int64_t persistedVersion() const { return persistedVersion_; }
    const std::vector<DomainEvent>& pendingEvents() const { return pending_; }
    bool hasChanges() const { return !pending_.empty(); }
    bool isNew() const { return persistedVersion_ == 0; }
    /** 加载时使用的快照版本，未使用快照为 nullopt */
    std::optional<int64_t> snapshotVersion() const { return snapshotVersion_; }
    /** 加载时重放的事件数 */
    size_t replayedEvents() const { return replayed_; }

    // ========== 命令辅助 ==========

    /**
     * @brief 命令前置条件，不满足时抛 ValidationException
     */
    Aggregate& require(bool condition, const std::string& message) {
        if (!condition) throw ValidationException(message);
        return *this;
    }

    /**
     * @brief 为之后产生的事件设置追踪信息
     */
    Aggregate& correlate(std::optional<std::string> correlationId,
                         std::optional<std::string> causationId = std::nullopt) {
        correlationId_ = std::move(correlationId);
        causationId_ = std::move(causationId);
        return *this;
    }

    /**
     * @brief 产生新事件：先计算新状态，成功后才入队并推进版本
     */
    const DomainEvent& raise(const std::string& eventType, Json::Value payload,
                             std::optional<std::string> topic = std::nullopt) {
        DomainEvent event = DomainEvent(eventType, id_, behavior_->aggregateType(), version_ + 1, std::move(payload))
            .withMetadata(correlationId_, causationId_, std::move(topic));
        State next = behavior_->apply(state_, event);

        state_ = std::move(next);
        version_ = event.version();
        pending_.push_back(std::move(event));
        return pending_.back();
    }

    /**
     * @brief 产生类型化事件（E 提供 TYPE、TOPIC 与 toJson）
     */
    template<typename E>
    const DomainEvent& raise(const E& payload) {
        return raise(E::TYPE, payload.toJson(), std::string(E::TOPIC));
    }

private:
    friend class EventSourcedRepository<State>;

    std::string id_;
    BehaviorPtr behavior_;
    State state_;
    int64_t version_ = 0;
    int64_t persistedVersion_ = 0;
    std::vector<DomainEvent> pending_;
    std::optional<std::string> correlationId_;
    std::optional<std::string> causationId_;
    std::optional<int64_t> snapshotVersion_;
    size_t replayed_ = 0;

    void restoreSnapshot(State state, int64_t version) {
        state_ = std::move(state);
        version_ = version;
        persistedVersion_ = version;
        snapshotVersion_ = version;
    }

    /**
     * @brief 重放一个已持久化事件（不入队）
     */
    void replay(const DomainEvent& event) {
        state_ = behavior_->apply(state_, event);
        version_ = event.version();
        persistedVersion_ = version_;
        ++replayed_;
    }

    /**
     * @brief 提交成功后清空队列
     * @return 已提交的事件
     */
    std::vector<DomainEvent> markCommitted(int64_t newVersion) {
        std::vector<DomainEvent> committed;
        committed.swap(pending_);
        version_ = newVersion;
        persistedVersion_ = newVersion;
        return committed;
    }
};
