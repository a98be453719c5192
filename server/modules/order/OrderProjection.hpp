#pragma once

#include "domain/Order.hpp"
#include "common/eventstore/EventStore.hpp"

/**
 * @brief 订单列表读模型
 *
 * 每种订单事件各有一个类型化入口，由总线上的对应订阅调用。每行记录已应用的
 * 版本，事件严格按版本逐个应用：
 * - 版本不高于当前行：重复或过期，忽略
 * - 恰为下一版本：直接应用
 * - 中间有缺口（并发或异步分发导致乱序到达）：从事件存储补读缺失的事件，
 *   按版本顺序应用到当前事件为止；之后到达的较早事件按重复忽略
 */
class OrderProjection {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    struct Summary {
        std::string id;
        std::string customerId;
        std::string currency;
        OrderStatus status = OrderStatus::None;
        int64_t itemCount = 0;
        double total = 0;
        int64_t version = 0;
        TimestampHelper::TimePoint updatedAt{};
    };

    explicit OrderProjection(EventStore& store) : store_(store) {}

    /**
     * @brief 应用一个类型化订单事件
     * @return 本次调用推进了读模型返回 true，重复或过期返回 false
     * @throws SerializationError 补读到的事件负载无法解码（读模型保持在上一个完整版本）
     */
    template<typename E>
    Task<bool> apply(const DomainEvent& event, const E& payload) {
        if (!event.aggregateId()) co_return false;
        const std::string id = *event.aggregateId();

        {
            std::lock_guard lock(mutex_);
            auto next = currentVersion(id) + 1;
            if (event.version() < next) co_return false;
            if (event.version() == next) {
                auto& row = rowFor(id);
                mutate(row, payload);
                stamp(row, event);
                co_return true;
            }
        }

        co_return co_await catchUp(id, event.version());
    }

    std::optional<Summary> find(const std::string& id) const {
        std::lock_guard lock(mutex_);
        auto it = rows_.find(id);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @brief 按更新时间倒序列出，可按状态过滤
     */
    std::vector<Summary> list(std::optional<OrderStatus> status = std::nullopt) const {
        std::vector<Summary> result;
        {
            std::lock_guard lock(mutex_);
            for (const auto& [id, row] : rows_) {
                if (!status || row.status == *status) result.push_back(row);
            }
        }
        std::sort(result.begin(), result.end(), [](const Summary& a, const Summary& b) {
            return a.updatedAt != b.updatedAt ? a.updatedAt > b.updatedAt : a.id < b.id;
        });
        return result;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return rows_.size();
    }

    static Json::Value toJson(const Summary& s) {
        Json::Value json;
        json["id"] = s.id;
        json["customerId"] = s.customerId;
        json["currency"] = s.currency;
        json["status"] = orderStatusName(s.status);
        json["itemCount"] = static_cast<Json::Int64>(s.itemCount);
        json["total"] = s.total;
        json["version"] = static_cast<Json::Int64>(s.version);
        json["updatedAt"] = TimestampHelper::toIso(s.updatedAt);
        return json;
    }

private:
    using Step = std::function<void(Summary&)>;

    EventStore& store_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Summary> rows_;

    static void mutate(Summary& row, const OrderPlaced& e) {
        row.customerId = e.customerId;
        row.currency = e.currency;
        row.status = OrderStatus::Placed;
    }

    static void mutate(Summary& row, const OrderItemAdded& e) {
        row.itemCount = OrderLimits::addQuantity(row.itemCount, e.quantity);
        row.total += static_cast<double>(e.quantity) * e.unitPrice;
    }

    static void mutate(Summary& row, const OrderShipped&) {
        row.status = OrderStatus::Shipped;
    }

    static void mutate(Summary& row, const OrderCancelled&) {
        row.status = OrderStatus::Cancelled;
    }

    static void stamp(Summary& row, const DomainEvent& event) {
        row.version = event.version();
        row.updatedAt = event.occurredAt();
    }

    template<typename E>
    static Step decodeStep(const DomainEvent& event) {
        return [payload = E::fromJson(event.payload())](Summary& row) { mutate(row, payload); };
    }

    /** 补读时按事件类型解码的表（与聚合的 reducer 表同一思路） */
    static const std::unordered_map<std::string, Step (*)(const DomainEvent&)>& decoders() {
        static const std::unordered_map<std::string, Step (*)(const DomainEvent&)> table = {
            {OrderPlaced::TYPE, &decodeStep<OrderPlaced>},
            {OrderItemAdded::TYPE, &decodeStep<OrderItemAdded>},
            {OrderShipped::TYPE, &decodeStep<OrderShipped>},
            {OrderCancelled::TYPE, &decodeStep<OrderCancelled>},
        };
        return table;
    }

    int64_t currentVersion(const std::string& id) const {
        auto it = rows_.find(id);
        return it == rows_.end() ? 0 : it->second.version;
    }

    Summary& rowFor(const std::string& id) {
        auto& row = rows_[id];
        row.id = id;
        return row;
    }

    /**
     * @brief 从存储补读 (当前版本, target] 的事件并按序应用
     *
     * 先在锁外读取并解码，再在锁内逐个应用；并发的补读或直接应用已推进的版本被跳过。
     */
    Task<bool> catchUp(const std::string& id, int64_t target) {
        int64_t from = 0;
        {
            std::lock_guard lock(mutex_);
            from = currentVersion(id);
        }
        LOG_DEBUG << "OrderProjection: Order " << id << " jumped from v" << from << " to v" << target
                  << ", reading missing events";

        auto events = co_await store_.getEvents(id, from);

        std::vector<std::pair<const DomainEvent*, Step>> steps;
        for (const auto& e : events) {
            if (e.version() > target) break;
            auto decoder = decoders().find(e.type());
            if (decoder == decoders().end()) {
                throw SerializationError("Order " + id + " has an unknown event type " + e.type());
            }
            steps.emplace_back(&e, decoder->second(e));
        }

        bool advanced = false;
        std::lock_guard lock(mutex_);
        for (const auto& [event, step] : steps) {
            if (event->version() != currentVersion(id) + 1) continue;
            auto& row = rowFor(id);
            step(row);
            stamp(row, *event);
            advanced = true;
        }
        co_return advanced;
    }
};
