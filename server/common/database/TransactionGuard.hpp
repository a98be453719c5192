#pragma once

#include "DatabaseService.hpp"
#include "common/utils/AppException.hpp"

/**
 * @brief 事件追加事务（RAII）
 *
 * 事件追加把“读取流版本 + 插入事件”放进同一事务（并发写者由唯一约束兜底）：
 * - 未提交就离开作用域时自动回滚，版本冲突或插入失败都不会留下部分写入
 * - commit() 挂起到 PostgreSQL 确认 COMMIT 后才返回，返回即代表事件已持久化
 *
 * 使用示例：
 * @code
 * auto tx = co_await TransactionGuard::create(db);
 * auto rows = co_await tx.execSqlCoro("SELECT MAX(version) ...", {aggregateId});
 * co_await tx.execSqlCoro("INSERT INTO es_events ...", params);
 * co_await tx.commit();
 * @endcode
 */
class TransactionGuard {
public:
    using Transaction = drogon::orm::Transaction;
    using Result = drogon::orm::Result;
    template<typename T = void> using Task = drogon::Task<T>;

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;
    TransactionGuard& operator=(TransactionGuard&&) = delete;

    TransactionGuard(TransactionGuard&& other) noexcept
        : tx_(std::move(other.tx_)), state_(other.state_) {
        other.state_ = State::Committed;
    }

    static Task<TransactionGuard> create(DatabaseService& db) {
        co_return TransactionGuard(co_await db.newTransactionCoro());
    }

    ~TransactionGuard() {
        if (state_ != State::Open || !tx_) return;
        try {
            LOG_DEBUG << "TransactionGuard: Rolling back unfinished append";
            tx_->rollback();
        } catch (const std::exception& e) {
            LOG_ERROR << "TransactionGuard: Rollback failed: " << e.what();
        }
    }

    Task<Result> execSqlCoro(const std::string& sql, const SqlParams& params = {}) {
        requireOpen();
        co_return co_await SqlBinding::run(*tx_, sql, params);
    }

    /**
     * @brief 提交并等待数据库确认
     * @throws StoreUnavailableError COMMIT 未被确认（数据库已回滚）
     */
    Task<void> commit() {
        requireOpen();

        // 释放 Transaction 时 Drogon 发送 COMMIT，结果经 commit 回调送回
        struct CommitAwaiter : drogon::CallbackAwaiter<bool> {
            std::shared_ptr<Transaction> tx;

            explicit CommitAwaiter(std::shared_ptr<Transaction> t) : tx(std::move(t)) {}

            void await_suspend(std::coroutine_handle<> handle) {
                tx->setCommitCallback([this, handle](bool success) {
                    setValue(success);
                    handle.resume();
                });
                tx.reset();
            }
        };

        state_ = State::Committed;
        bool success = co_await CommitAwaiter(std::move(tx_));
        if (!success) {
            throw StoreUnavailableError("Event append was not committed by the database");
        }
    }

    /**
     * @brief 放弃本次追加（版本冲突时在抛出前调用）
     */
    void rollback() {
        if (state_ != State::Open) return;
        tx_->rollback();
        state_ = State::RolledBack;
    }

private:
    enum class State { Open, Committed, RolledBack };

    std::shared_ptr<Transaction> tx_;
    State state_ = State::Open;

    explicit TransactionGuard(std::shared_ptr<Transaction> tx) : tx_(std::move(tx)) {}

    void requireOpen() const {
        if (state_ != State::Open) {
            throw StoreUnavailableError("Append transaction is no longer open");
        }
    }
};
