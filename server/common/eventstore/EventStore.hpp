#pragma once

#include "common/domain/DomainEvent.hpp"

/**
 * @brief 带存储全局位置的事件
 */
struct PositionedEvent {
    int64_t position;
    DomainEvent event;
};

/**
 * @brief 按类型读取事件的有限序列
 *
 * 上界为创建时刻的存储头部位置，之后追加的事件不会出现在序列中；
 * restart() 从头重新读取同一范围，用于读模型重建。
 *
 * 序列持有创建它的 EventStore 的引用，不能比存储活得更久。
 *
 * @code
 * auto stream = co_await store.getEventsByType("OrderPlaced");
 * while (auto batch = co_await stream.next()) {
 *     for (const auto& e : *batch) projection.apply(e);
 * }
 * @endcode
 */
class EventTypeStream {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    using PageReader = std::function<Task<std::vector<PositionedEvent>>(int64_t afterPosition, size_t limit)>;

    EventTypeStream(PageReader reader, int64_t headPosition, size_t batchSize)
        : reader_(std::move(reader)), headPosition_(headPosition), batchSize_(batchSize) {}

    /**
     * @return 下一批事件；序列读完返回 nullopt
     */
    Task<std::optional<std::vector<DomainEvent>>> next() {
        if (exhausted_) co_return std::nullopt;

        auto page = co_await reader_(cursor_, batchSize_);
        if (page.size() < batchSize_) exhausted_ = true;
        if (page.empty()) co_return std::nullopt;

        cursor_ = page.back().position;
        std::vector<DomainEvent> batch;
        batch.reserve(page.size());
        for (auto& p : page) batch.push_back(std::move(p.event));
        co_return batch;
    }

    void restart() {
        cursor_ = 0;
        exhausted_ = false;
    }

    /**
     * @brief 读取剩余的全部事件
     */
    Task<std::vector<DomainEvent>> collect() {
        std::vector<DomainEvent> all;
        while (auto batch = co_await next()) {
            for (auto& e : *batch) all.push_back(std::move(e));
        }
        co_return all;
    }

    int64_t headPosition() const { return headPosition_; }

private:
    PageReader reader_;
    int64_t headPosition_;
    size_t batchSize_;
    int64_t cursor_ = 0;
    bool exhausted_ = false;
};

/**
 * @brief 事件存储接口 - 按聚合分流、只追加、乐观并发
 *
 * 不变式：每个聚合的事件流版本严格为 1..N，无断档、无重复；
 * 不提供任何修改或删除事件的接口。
 */
class EventStore {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;
    using TimePoint = TimestampHelper::TimePoint;

    static constexpr size_t DEFAULT_BATCH_SIZE = 500;

    virtual ~EventStore() = default;

    /**
     * @brief 追加单个事件
     * @return 聚合的新版本（expectedVersion + 1）
     * @throws ConcurrencyError 当前版本与 expectedVersion 不一致，不写入任何数据
     */
    virtual Task<int64_t> append(const DomainEvent& event, int64_t expectedVersion) {
        co_return co_await appendAll({event}, expectedVersion);
    }

    /**
     * @brief 原子追加同一聚合的多个事件，版本依次为 expectedVersion+1..
     *
     * 事件自带的版本号会被存储重新编号。
     *
     * @return 聚合的新版本
     * @throws ValidationException 事件缺少聚合 id 或不属于同一聚合
     * @throws ConcurrencyError 版本冲突
     * @throws StoreUnavailableError 后端不可用
     * @throws SerializationError 负载无法编码
     */
    virtual Task<int64_t> appendAll(std::vector<DomainEvent> events, int64_t expectedVersion) = 0;

    /**
     * @brief 读取聚合中版本大于 sinceVersion 的事件，按版本升序
     */
    virtual Task<std::vector<DomainEvent>> getEvents(const std::string& aggregateId, int64_t sinceVersion = 0) = 0;

    /**
     * @brief 聚合当前版本，不存在时为 0
     */
    virtual Task<int64_t> getAggregateVersion(const std::string& aggregateId) = 0;

    /**
     * @brief 同一关联 id 下的全部事件，按存储顺序
     */
    virtual Task<std::vector<DomainEvent>> getEventsByCorrelationId(const std::string& correlationId) = 0;

    /**
     * @brief 按类型读取事件（occurredAt >= since），上界为调用时刻的存储内容
     */
    Task<EventTypeStream> getEventsByType(std::string eventType,
                                          std::optional<TimePoint> since = std::nullopt,
                                          size_t batchSize = DEFAULT_BATCH_SIZE) {
        if (batchSize == 0) {
            throw ValidationException("batchSize must be at least 1");
        }
        int64_t head = co_await headPosition();
        co_return EventTypeStream(
            [this, eventType = std::move(eventType), since, head](int64_t after, size_t limit) {
                return readTypePage(eventType, since, after, head, limit);
            },
            head, batchSize);
    }

protected:
    /**
     * @brief 存储中最大的全局位置，空存储为 0
     */
    virtual Task<int64_t> headPosition() = 0;

    /**
     * @brief 读取一页 position ∈ (afterPosition, headPosition] 的指定类型事件，按位置升序
     */
    virtual Task<std::vector<PositionedEvent>> readTypePage(const std::string& eventType,
                                                            std::optional<TimePoint> since,
                                                            int64_t afterPosition,
                                                            int64_t headPosition,
                                                            size_t limit) = 0;

    /**
     * @brief 校验一次追加的事件都属于同一聚合
     * @return 聚合 id
     */
    static std::string requireSingleAggregate(const std::vector<DomainEvent>& events) {
        if (events.empty()) {
            throw ValidationException("Cannot append an empty event list");
        }
        const auto& first = events.front().aggregateId();
        if (!first || first->empty()) {
            throw ValidationException("Event " + events.front().type() + " has no aggregate id");
        }
        for (const auto& e : events) {
            if (e.aggregateId() != first) {
                throw ValidationException("All events of one append must share aggregate id " + *first);
            }
        }
        return *first;
    }

    static void requireValidExpectedVersion(int64_t expectedVersion) {
        if (expectedVersion < 0) {
            throw ValidationException("expectedVersion must not be negative");
        }
    }
};
