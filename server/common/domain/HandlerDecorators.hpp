#pragma once

#include "Subscription.hpp"

/**
 * @brief 处理器装饰器
 *
 * 总线本身从不重试，需要重试的处理器在注册前用这里的装饰器包装。
 */
namespace HandlerDecorators {

template<typename T = void>
using Task = drogon::Task<T>;

namespace detail {

inline Task<void> runWithRetry(CancellableHandler handler, int maxRetries,
                               std::chrono::milliseconds delay, trantor::EventLoop* loop,
                               std::string name, const DomainEvent& event,
                               CancellationToken token) {
    for (int attempt = 0;; ++attempt) {
        std::exception_ptr failure;
        try {
            co_await handler(event, token);
            co_return;
        } catch (...) {
            failure = std::current_exception();
        }

        if (attempt >= maxRetries || token.isCancelled()) {
            std::rethrow_exception(failure);
        }

        LOG_WARN << "Handler " << name << " failed for " << event.type() << " (" << event.id()
                 << "), retry " << (attempt + 1) << "/" << maxRetries;

        if (delay.count() > 0) {
            auto* sleepLoop = loop ? loop : trantor::EventLoop::getEventLoopOfCurrentThread();
            if (sleepLoop) {
                co_await drogon::sleepCoro(sleepLoop, delay);
            }
        }
    }
}

}  // namespace detail

/**
 * @brief 失败后最多重试 maxRetries 次，每次间隔 delay
 *
 * 令牌被取消后不再重试，最后一次的异常原样抛出。
 *
 * @param loop 用于等待重试间隔的 EventLoop，为空时使用当前线程的 EventLoop
 */
inline CancellableHandler withRetry(CancellableHandler handler, int maxRetries,
                                    std::chrono::milliseconds delay,
                                    trantor::EventLoop* loop = nullptr,
                                    std::string name = "handler") {
    if (!handler) {
        throw ConfigurationError("Cannot decorate an empty handler");
    }
    if (maxRetries < 0) {
        throw ConfigurationError("maxRetries must not be negative");
    }
    if (maxRetries == 0) return handler;

    return [handler = std::move(handler), maxRetries, delay, loop, name = std::move(name)](
               const DomainEvent& event, CancellationToken token) {
        return detail::runWithRetry(handler, maxRetries, delay, loop, name, event, token);
    };
}

inline CancellableHandler withRetry(EventHandler handler, int maxRetries,
                                    std::chrono::milliseconds delay,
                                    trantor::EventLoop* loop = nullptr,
                                    std::string name = "handler") {
    if (!handler) {
        throw ConfigurationError("Cannot decorate an empty handler");
    }
    return withRetry(
        CancellableHandler([handler = std::move(handler)](const DomainEvent& e, CancellationToken) {
            return handler(e);
        }),
        maxRetries, delay, loop, std::move(name));
}

}  // namespace HandlerDecorators
