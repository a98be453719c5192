#include "TestSupport.hpp"

namespace {

/**
 * @brief 前 failures 次调用失败，之后成功
 */
EventHandler flakyHandler(std::shared_ptr<std::atomic<int>> calls, int failures) {
    return [calls, failures](const DomainEvent&) -> drogon::Task<void> {
        int n = ++*calls;
        if (n <= failures) throw std::runtime_error("attempt " + std::to_string(n) + " failed");
        co_return;
    };
}

}  // namespace

TEST_SUITE("HandlerDecorators") {

TEST_CASE("retry succeeds once the handler recovers") {
    TestLoop loop;
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto handler = HandlerDecorators::withRetry(flakyHandler(calls, 2), 3,
                                                std::chrono::milliseconds(5), loop.loop(), "flaky");

    CHECK_NOTHROW(runTask(handler(DomainEvent("X"), CancellationToken{})));
    CHECK(calls->load() == 3);
}

TEST_CASE("exhausted retries rethrow the last failure") {
    TestLoop loop;
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto handler = HandlerDecorators::withRetry(flakyHandler(calls, 10), 2,
                                                std::chrono::milliseconds(1), loop.loop(), "flaky");

    CHECK_THROWS_WITH_AS(runTask(handler(DomainEvent("X"), CancellationToken{})),
                         "attempt 3 failed", std::runtime_error);
    CHECK(calls->load() == 3);
}

TEST_CASE("a cancelled token stops further retries") {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto handler = HandlerDecorators::withRetry(flakyHandler(calls, 10), 5, std::chrono::milliseconds(0));

    CancellationToken token;
    token.cancel();
    CHECK_THROWS_AS(runTask(handler(DomainEvent("X"), token)), std::runtime_error);
    CHECK(calls->load() == 1);
}

TEST_CASE("invalid decorator arguments are rejected") {
    auto calls = std::make_shared<std::atomic<int>>(0);
    CHECK_THROWS_AS(HandlerDecorators::withRetry(flakyHandler(calls, 0), -1, std::chrono::milliseconds(0)),
                    ConfigurationError);
    CHECK_THROWS_AS(HandlerDecorators::withRetry(EventHandler{}, 1, std::chrono::milliseconds(0)),
                    ConfigurationError);
}

}
