#pragma once

/**
 * @brief 连接选择（ConfigManager 按 redis_clients[0].is_fast 设置）
 */
struct AppRedisConfig {
    static bool& useFast() {
        static bool value = false;
        return value;
    }
};

/**
 * @brief Redis 访问入口
 *
 * 快照按聚合存成有序集合：score 为聚合版本，member 为快照 JSON。
 * 连接或命令失败以 std::runtime_error 抛出，由调用方转换为领域异常。
 */
class RedisService {
public:
    using RedisClientPtr = drogon::nosql::RedisClientPtr;
    template<typename T = void> using Task = drogon::Task<T>;

    RedisClientPtr getClient() const {
        RedisClientPtr client = AppRedisConfig::useFast()
            ? drogon::app().getFastRedisClient("default")
            : drogon::app().getRedisClient("default");
        if (!client) {
            throw std::runtime_error("Redis client \"default\" is not configured");
        }
        return client;
    }

    Task<void> ping() {
        auto reply = co_await getClient()->execCommandCoro("PING");
        if (reply.isNil() || reply.asString() != "PONG") {
            throw std::runtime_error("Redis PING got an unexpected reply");
        }
    }

    // ==================== 有序集合 ====================

    /**
     * @brief ZADD key score member
     * @return 新增成员数
     */
    Task<int64_t> zadd(const std::string& key, int64_t score, const std::string& member) {
        auto client = getClient();

        auto result = co_await client->execCommandCoro("ZADD %s %lld %s",
            key.c_str(), static_cast<long long>(score), member.c_str());
        co_return result.asInteger();
    }

    /**
     * @brief ZREVRANGEBYSCORE key max min LIMIT 0 count
     *
     * max 为空时使用 +inf
     */
    Task<std::vector<std::string>> zrevrangeByScore(const std::string& key,
                                                    std::optional<int64_t> max,
                                                    int64_t min,
                                                    int count) {
        auto client = getClient();

        std::string maxArg = max ? std::to_string(*max) : "+inf";
        auto result = co_await client->execCommandCoro("ZREVRANGEBYSCORE %s %s %lld LIMIT 0 %d",
            key.c_str(), maxArg.c_str(), static_cast<long long>(min), count);

        std::vector<std::string> members;
        if (result.isNil()) co_return members;
        for (const auto& item : result.asArray()) {
            members.push_back(item.asString());
        }
        co_return members;
    }

    /**
     * @brief ZREMRANGEBYSCORE key min (max
     * @return 删除的成员数
     */
    Task<int64_t> zremBelowScore(const std::string& key, int64_t exclusiveMax) {
        auto client = getClient();

        std::string maxArg = "(" + std::to_string(exclusiveMax);
        auto result = co_await client->execCommandCoro("ZREMRANGEBYSCORE %s -inf %s",
            key.c_str(), maxArg.c_str());
        co_return result.asInteger();
    }
};
