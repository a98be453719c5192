#pragma once

#include "EventStore.hpp"
#include "EventSerializer.hpp"

/**
 * @brief 内存事件存储（测试与 memory 后端）
 *
 * 单个互斥锁串行化所有追加，版本检查与写入在同一临界区内完成。
 * 负载在写入时即做编码检查，与数据库后端的失败行为一致。
 */
class InMemoryEventStore : public EventStore {
public:
    Task<int64_t> appendAll(std::vector<DomainEvent> events, int64_t expectedVersion) override {
        requireValidExpectedVersion(expectedVersion);
        auto aggregateId = requireSingleAggregate(events);
        for (const auto& e : events) {
            EventSerializer::encodePayload(e);
        }

        std::lock_guard lock(mutex_);
        auto& stream = streams_[aggregateId];
        auto current = static_cast<int64_t>(stream.size());
        if (current != expectedVersion) {
            LOG_WARN << "InMemoryEventStore: Concurrency conflict on " << aggregateId
                     << ", expected " << expectedVersion << ", actual " << current;
            if (stream.empty()) streams_.erase(aggregateId);
            throw ConcurrencyError(aggregateId, expectedVersion, current);
        }

        int64_t version = expectedVersion;
        for (const auto& e : events) {
            ++version;
            stream.push_back(log_.size());
            log_.push_back(e.withVersion(version));
        }
        co_return version;
    }

    Task<std::vector<DomainEvent>> getEvents(const std::string& aggregateId, int64_t sinceVersion = 0) override {
        std::vector<DomainEvent> out;
        std::lock_guard lock(mutex_);
        auto it = streams_.find(aggregateId);
        if (it != streams_.end()) {
            auto start = static_cast<size_t>(std::max<int64_t>(sinceVersion, 0));
            for (size_t i = start; i < it->second.size(); ++i) {
                out.push_back(log_[it->second[i]]);
            }
        }
        co_return out;
    }

    Task<int64_t> getAggregateVersion(const std::string& aggregateId) override {
        std::lock_guard lock(mutex_);
        auto it = streams_.find(aggregateId);
        co_return it == streams_.end() ? 0 : static_cast<int64_t>(it->second.size());
    }

    Task<std::vector<DomainEvent>> getEventsByCorrelationId(const std::string& correlationId) override {
        std::vector<DomainEvent> out;
        std::lock_guard lock(mutex_);
        for (const auto& e : log_) {
            if (e.correlationId() == correlationId) out.push_back(e);
        }
        co_return out;
    }

    size_t totalEvents() const {
        std::lock_guard lock(mutex_);
        return log_.size();
    }

protected:
    Task<int64_t> headPosition() override {
        std::lock_guard lock(mutex_);
        co_return static_cast<int64_t>(log_.size());
    }

    Task<std::vector<PositionedEvent>> readTypePage(const std::string& eventType,
                                                    std::optional<TimePoint> since,
                                                    int64_t afterPosition,
                                                    int64_t headPosition,
                                                    size_t limit) override {
        std::vector<PositionedEvent> page;
        std::lock_guard lock(mutex_);
        auto end = std::min<int64_t>(headPosition, static_cast<int64_t>(log_.size()));
        // 位置从 1 开始，对应 log_[position - 1]
        for (int64_t pos = afterPosition + 1; pos <= end && page.size() < limit; ++pos) {
            const auto& e = log_[pos - 1];
            if (e.type() != eventType) continue;
            if (since && e.occurredAt() < *since) continue;
            page.push_back({pos, e});
        }
        co_return page;
    }

private:
    mutable std::mutex mutex_;
    std::vector<DomainEvent> log_;
    /** 聚合 id → 该聚合事件在 log_ 中的下标，下标 i 对应版本 i + 1 */
    std::unordered_map<std::string, std::vector<size_t>> streams_;
};
