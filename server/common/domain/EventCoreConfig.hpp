#pragma once

#include "EventDispatcher.hpp"
#include "common/eventstore/SnapshotStore.hpp"

/**
 * @brief 事件存储后端
 */
enum class EventStoreBackend {
    Postgres,
    Memory
};

/**
 * @brief 快照存储后端
 */
enum class SnapshotBackend {
    Postgres,
    Redis,
    Memory,
    None
};

/**
 * @brief custom_config.eventcore 配置节
 *
 * fromJson 只做解析与校验，不访问框架，可直接单元测试。
 */
struct EventCoreConfig {
    EventStoreBackend eventStore = EventStoreBackend::Postgres;

    SnapshotBackend snapshots = SnapshotBackend::Postgres;
    int64_t snapshotEvery = 50;
    SnapshotRetention retention = SnapshotRetention::KeepLatest;

    size_t maxConcurrency = 10;
    std::chrono::milliseconds asyncTimeout{5000};

    DispatchMode dispatchMode = DispatchMode::Sync;
    std::chrono::milliseconds stopTimeout{5000};
    size_t historyLimit = 1000;

    int maxCommandRetries = 3;

    bool needsPostgres() const {
        return eventStore == EventStoreBackend::Postgres || snapshots == SnapshotBackend::Postgres;
    }

    bool needsRedis() const { return snapshots == SnapshotBackend::Redis; }

    DispatcherOptions dispatcherOptions() const {
        DispatcherOptions options;
        options.mode = dispatchMode;
        options.maxConcurrency = maxConcurrency;
        options.asyncTimeout = asyncTimeout;
        options.stopTimeout = stopTimeout;
        options.historyLimit = historyLimit;
        return options;
    }

    /**
     * @brief 解析配置节，缺省字段取默认值
     * @param block custom_config.eventcore，可为 null
     * @param errors 收集的错误信息（带字段路径前缀）
     */
    static EventCoreConfig fromJson(const Json::Value& block, std::vector<std::string>& errors) {
        EventCoreConfig config;
        if (block.isNull()) return config;
        if (!block.isObject()) {
            errors.emplace_back("[eventcore] 必须是 JSON 对象");
            return config;
        }

        const auto& store = section(block, "event_store", errors);
        if (auto backend = stringField(store, "event_store.backend", errors)) {
            if (*backend == "postgres") config.eventStore = EventStoreBackend::Postgres;
            else if (*backend == "memory") config.eventStore = EventStoreBackend::Memory;
            else errors.push_back("[eventcore.event_store.backend] 未知后端: " + *backend + "（可选 postgres、memory）");
        }

        const auto& snap = section(block, "snapshots", errors);
        if (auto backend = stringField(snap, "snapshots.backend", errors)) {
            if (*backend == "postgres") config.snapshots = SnapshotBackend::Postgres;
            else if (*backend == "redis") config.snapshots = SnapshotBackend::Redis;
            else if (*backend == "memory") config.snapshots = SnapshotBackend::Memory;
            else if (*backend == "none") config.snapshots = SnapshotBackend::None;
            else errors.push_back("[eventcore.snapshots.backend] 未知后端: " + *backend + "（可选 postgres、redis、memory、none）");
        }
        if (auto every = intField(snap, "snapshots.every", 0, errors)) {
            config.snapshotEvery = *every;
        }
        if (auto retention = stringField(snap, "snapshots.retention", errors)) {
            try {
                config.retention = parseRetention(*retention);
            } catch (const ConfigurationError&) {
                errors.push_back("[eventcore.snapshots.retention] 未知策略: " + *retention + "（可选 keep_latest、keep_all）");
            }
        }

        const auto& bus = section(block, "event_bus", errors);
        if (auto n = intField(bus, "event_bus.max_concurrency", 1, errors)) {
            config.maxConcurrency = static_cast<size_t>(*n);
        }
        if (auto ms = intField(bus, "event_bus.async_timeout_ms", 1, errors)) {
            config.asyncTimeout = std::chrono::milliseconds(*ms);
        }

        const auto& dispatcher = section(block, "dispatcher", errors);
        if (auto mode = stringField(dispatcher, "dispatcher.mode", errors)) {
            try {
                config.dispatchMode = parseDispatchMode(*mode);
            } catch (const ConfigurationError&) {
                errors.push_back("[eventcore.dispatcher.mode] 未知模式: " + *mode + "（可选 sync、async）");
            }
        }
        if (auto ms = intField(dispatcher, "dispatcher.stop_timeout_ms", 0, errors)) {
            config.stopTimeout = std::chrono::milliseconds(*ms);
        }
        if (auto n = intField(dispatcher, "dispatcher.history_limit", 1, errors)) {
            config.historyLimit = static_cast<size_t>(*n);
        }

        const auto& service = section(block, "service", errors);
        if (auto n = intField(service, "service.max_command_retries", 0, errors)) {
            config.maxCommandRetries = static_cast<int>(*n);
        }

        return config;
    }

private:
    static const Json::Value& section(const Json::Value& block, const char* name,
                                      std::vector<std::string>& errors) {
        static const Json::Value empty(Json::objectValue);
        if (!block.isMember(name)) return empty;
        const auto& value = block[name];
        if (!value.isObject()) {
            errors.push_back(std::string("[eventcore.") + name + "] 必须是 JSON 对象");
            return empty;
        }
        return value;
    }

    static std::optional<std::string> stringField(const Json::Value& obj, const std::string& path,
                                                  std::vector<std::string>& errors) {
        auto key = path.substr(path.find('.') + 1);
        if (!obj.isMember(key)) return std::nullopt;
        if (!obj[key].isString()) {
            errors.push_back("[eventcore." + path + "] 必须是字符串");
            return std::nullopt;
        }
        return obj[key].asString();
    }

    static std::optional<int64_t> intField(const Json::Value& obj, const std::string& path,
                                           int64_t minValue, std::vector<std::string>& errors) {
        auto key = path.substr(path.find('.') + 1);
        if (!obj.isMember(key)) return std::nullopt;
        if (!obj[key].isInt64()) {
            errors.push_back("[eventcore." + path + "] 必须是整数");
            return std::nullopt;
        }
        auto value = obj[key].asInt64();
        if (value < minValue) {
            errors.push_back("[eventcore." + path + "] 不能小于 " + std::to_string(minValue)
                + "（当前 " + std::to_string(value) + "）");
            return std::nullopt;
        }
        return value;
    }
};
