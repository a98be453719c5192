#pragma once

/**
 * @brief SQL 参数（nullopt 绑定为 NULL）
 */
using SqlParam = std::optional<std::string>;
using SqlParams = std::vector<SqlParam>;

namespace SqlBinding {

/**
 * @brief "?" 占位符改写为 PostgreSQL 的 $1..$n，单引号字面量内的 "?" 原样保留
 */
inline std::string numberPlaceholders(std::string_view sql, size_t paramCount) {
    std::string out;
    out.reserve(sql.size() + paramCount * 2);
    size_t next = 1;
    bool quoted = false;
    for (char c : sql) {
        if (c == '\'') quoted = !quoted;
        if (c == '?' && !quoted && next <= paramCount) {
            out += '$';
            out += std::to_string(next++);
        } else {
            out += c;
        }
    }
    return out;
}

/**
 * @brief 在 DbClient 或 Transaction 上执行参数化语句（服务端绑定，不做客户端转义）
 */
template<typename Executor>
drogon::Task<drogon::orm::Result> run(Executor& executor, const std::string& sql, const SqlParams& params) {
    if (params.empty()) {
        co_return co_await executor.execSqlCoro(sql);
    }
    auto binder = executor << numberPlaceholders(sql, params.size());
    for (const auto& p : params) {
        if (p) {
            binder << *p;
        } else {
            binder << nullptr;
        }
    }
    co_return co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
}

}  // namespace SqlBinding

/**
 * @brief 数据库异常分类
 */
/**
 * @brief es_events 表上的约束名（建表语句与冲突分类共用）
 */
namespace EventSchema {
/** UNIQUE (aggregate_id, version)：同一流的同一版本只能写入一次 */
inline constexpr std::string_view STREAM_CONSTRAINT = "uq_es_events_stream";
/** UNIQUE (event_id) */
inline constexpr std::string_view EVENT_ID_CONSTRAINT = "uq_es_events_event_id";
}  // namespace EventSchema

namespace DbErrors {

/** PostgreSQL unique_violation */
inline constexpr const char* UNIQUE_VIOLATION = "23505";

inline bool isUniqueViolation(const drogon::orm::DrogonDbException& e) {
    if (const auto* sqlErr = dynamic_cast<const drogon::orm::SqlError*>(&e.base())) {
        return sqlErr->sqlState() == UNIQUE_VIOLATION;
    }
    return std::string_view(e.base().what()).find("duplicate key") != std::string_view::npos;
}

inline std::string describe(const drogon::orm::DrogonDbException& e) {
    return e.base().what();
}

/**
 * @brief 从唯一约束冲突的错误消息中取出约束名
 *
 * PostgreSQL 的消息形如：duplicate key value violates unique constraint "uq_es_events_stream"
 * @return 消息中没有约束名时返回 nullopt
 */
inline std::optional<std::string> violatedConstraint(std::string_view message) {
    static constexpr std::string_view marker = "unique constraint \"";
    auto start = message.find(marker);
    if (start == std::string_view::npos) return std::nullopt;
    start += marker.size();
    auto end = message.find('"', start);
    if (end == std::string_view::npos || end == start) return std::nullopt;
    return std::string(message.substr(start, end - start));
}

/**
 * @brief 是否违反了指定名称的唯一约束
 */
inline bool violatesConstraint(const drogon::orm::DrogonDbException& e, std::string_view constraint) {
    if (!isUniqueViolation(e)) return false;
    auto name = violatedConstraint(describe(e));
    return name && *name == constraint;
}

}  // namespace DbErrors

/**
 * @brief 连接选择（ConfigManager 按 db_clients[0].is_fast 设置）
 */
struct AppDbConfig {
    static bool& useFast() {
        static bool value = false;
        return value;
    }
};

/**
 * @brief PostgreSQL 访问入口，事件存储与快照存储共用名为 "default" 的客户端
 */
class DatabaseService {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    using Result = drogon::orm::Result;
    using Transaction = drogon::orm::Transaction;
    template<typename T = void> using Task = drogon::Task<T>;

    DatabaseService() = default;

    DbClientPtr getClient() const {
        return AppDbConfig::useFast()
            ? drogon::app().getFastDbClient("default")
            : drogon::app().getDbClient("default");
    }

    Task<void> ping() {
        co_await getClient()->execSqlCoro("SELECT 1");
    }

    Task<Result> execSqlCoro(const std::string& sql, const SqlParams& params = {}) {
        auto client = getClient();
        co_return co_await SqlBinding::run(*client, sql, params);
    }

    Task<std::shared_ptr<Transaction>> newTransactionCoro() {
        co_return co_await getClient()->newTransactionCoro();
    }
};
