#pragma once

/**
 * @brief 协程同步原语
 *
 * 均为共享状态的轻量句柄，可按值拷贝到 async_run 启动的协程中。
 * 挂起时记录当前线程的 EventLoop，唤醒时投递回该 EventLoop；
 * 不在 EventLoop 线程上（如测试中的 sync_wait）则直接在唤醒方线程恢复。
 */
namespace async_detail {

struct Waiter {
    trantor::EventLoop* loop;
    std::coroutine_handle<> handle;
};

inline void resume(const Waiter& w) {
    if (w.loop) {
        w.loop->queueInLoop([h = w.handle]() { h.resume(); });
    } else {
        w.handle.resume();
    }
}

}  // namespace async_detail

/**
 * @brief 协作式取消令牌
 *
 * 发布方超时后调用 cancel()，处理器在耗时步骤之间检查 isCancelled() 自行退出。
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief 异步信号量，限制同一层级内并发运行的处理器数量
 *
 * release() 直接把许可交给队首等待者，不会被新来者插队。
 * drain() 后所有等待者与后续 acquire() 都以 false 返回，表示放弃执行。
 */
class AsyncGate {
    struct Pending {
        async_detail::Waiter waiter;
        bool* granted;
    };

    struct State {
        mutable std::mutex mutex;
        size_t permits = 0;
        bool drained = false;
        std::deque<Pending> waiters;
    };

    std::shared_ptr<State> state_;

public:
    explicit AsyncGate(size_t permits) : state_(std::make_shared<State>()) {
        state_->permits = permits;
    }

    struct Awaiter {
        std::shared_ptr<State> state;
        bool granted = false;

        bool await_ready() const noexcept { return false; }

        bool await_suspend(std::coroutine_handle<> handle) {
            std::lock_guard lock(state->mutex);
            if (state->drained) {
                granted = false;
                return false;
            }
            if (state->permits > 0) {
                --state->permits;
                granted = true;
                return false;
            }
            state->waiters.push_back({{trantor::EventLoop::getEventLoopOfCurrentThread(), handle}, &granted});
            return true;
        }

        bool await_resume() const noexcept { return granted; }
    };

    /**
     * @return true 获得许可；false 闸门已关闭
     */
    Awaiter acquire() { return Awaiter{state_}; }

    void release() {
        async_detail::Waiter next{};
        {
            std::lock_guard lock(state_->mutex);
            if (state_->waiters.empty() || state_->drained) {
                ++state_->permits;
                return;
            }
            auto pending = state_->waiters.front();
            state_->waiters.pop_front();
            *pending.granted = true;
            next = pending.waiter;
        }
        async_detail::resume(next);
    }

    void drain() {
        std::deque<Pending> waiters;
        {
            std::lock_guard lock(state_->mutex);
            state_->drained = true;
            waiters.swap(state_->waiters);
            for (auto& p : waiters) *p.granted = false;
        }
        for (auto& p : waiters) async_detail::resume(p.waiter);
    }

    size_t waiting() const {
        std::lock_guard lock(state_->mutex);
        return state_->waiters.size();
    }
};

/**
 * @brief 计数闩锁：等待 N 个任务完成，可带超时
 *
 * 超时定时器注册在调用方指定的 EventLoop 上，定时器只持有 weak_ptr。
 */
class CompletionLatch {
    struct State {
        mutable std::mutex mutex;
        size_t remaining = 0;
        bool fired = false;
        bool timedOut = false;
        async_detail::Waiter waiter{nullptr, {}};
        trantor::EventLoop* timerLoop = nullptr;
        trantor::TimerId timerId{};
    };

    std::shared_ptr<State> state_;

public:
    explicit CompletionLatch(size_t count) : state_(std::make_shared<State>()) {
        state_->remaining = count;
    }

    void countDown() {
        async_detail::Waiter waiter{};
        trantor::EventLoop* timerLoop = nullptr;
        trantor::TimerId timerId{};
        {
            std::lock_guard lock(state_->mutex);
            if (state_->remaining > 0) --state_->remaining;
            if (state_->remaining > 0 || state_->fired || !state_->waiter.handle) return;
            state_->fired = true;
            waiter = state_->waiter;
            timerLoop = state_->timerLoop;
            timerId = state_->timerId;
        }
        if (timerLoop) timerLoop->invalidateTimer(timerId);
        async_detail::resume(waiter);
    }

    size_t remaining() const {
        std::lock_guard lock(state_->mutex);
        return state_->remaining;
    }

    struct Awaiter {
        std::shared_ptr<State> state;
        trantor::EventLoop* timerLoop;
        std::optional<std::chrono::milliseconds> timeout;

        bool await_ready() const {
            std::lock_guard lock(state->mutex);
            return state->remaining == 0;
        }

        bool await_suspend(std::coroutine_handle<> handle) {
            std::lock_guard lock(state->mutex);
            if (state->remaining == 0) return false;

            state->waiter = {trantor::EventLoop::getEventLoopOfCurrentThread(), handle};
            if (timeout && timerLoop) {
                std::weak_ptr<State> weak = state;
                state->timerLoop = timerLoop;
                state->timerId = timerLoop->runAfter(
                    static_cast<double>(timeout->count()) / 1000.0,
                    [weak]() {
                        auto s = weak.lock();
                        if (!s) return;
                        async_detail::Waiter w{};
                        {
                            std::lock_guard inner(s->mutex);
                            if (s->fired) return;
                            s->fired = true;
                            s->timedOut = true;
                            w = s->waiter;
                        }
                        async_detail::resume(w);
                    });
            }
            return true;
        }

        /** @return true 全部完成；false 超时 */
        bool await_resume() const {
            std::lock_guard lock(state->mutex);
            return !state->timedOut;
        }
    };

    /**
     * @param timerLoop 承载超时定时器的 EventLoop（为空则不设超时）
     */
    Awaiter wait(trantor::EventLoop* timerLoop,
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        return Awaiter{state_, timerLoop, timeout};
    }
};
