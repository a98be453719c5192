#pragma once

#include <doctest/doctest.h>

#include <limits>
#include <thread>

#include "common/domain/Domain.hpp"
#include "common/eventstore/InMemoryEventStore.hpp"
#include "common/eventstore/EventSerializer.hpp"

/**
 * @brief 测试用事件循环线程（定时器、sleepCoro 与超时都在这里触发）
 */
class TestLoop {
public:
    TestLoop() : thread_("TestLoop") { thread_.run(); }

    ~TestLoop() {
        thread_.getLoop()->quit();
        thread_.wait();
    }

    TestLoop(const TestLoop&) = delete;
    TestLoop& operator=(const TestLoop&) = delete;

    trantor::EventLoop* loop() { return thread_.getLoop(); }

private:
    trantor::EventLoopThread thread_;
};

/**
 * @brief 在测试线程上同步执行协程
 */
template<typename T>
T runTask(drogon::Task<T> task) {
    return drogon::sync_wait(std::move(task));
}

inline void runTask(drogon::Task<void> task) {
    drogon::sync_wait(std::move(task));
}

/**
 * @brief 线程安全的调用记录
 */
class CallLog {
public:
    void add(std::string entry) {
        std::lock_guard lock(mutex_);
        entries_.push_back(std::move(entry));
    }

    std::vector<std::string> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

/**
 * @brief 在作用域内截获 trantor 日志输出，析构时恢复为 stdout
 */
class LogCapture {
public:
    LogCapture() : lines_(std::make_shared<CallLog>()) {
        trantor::Logger::setOutputFunction(
            [lines = lines_](const char* msg, const uint64_t len) { lines->add(std::string(msg, len)); },
            [] {});
    }

    ~LogCapture() {
        trantor::Logger::setOutputFunction(
            [](const char* msg, const uint64_t len) { std::fwrite(msg, 1, len, stdout); },
            [] { std::fflush(stdout); });
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    /** @brief 同时包含 level 与 text 的行数 */
    size_t count(const std::string& level, const std::string& text) const {
        size_t n = 0;
        for (const auto& line : lines_->entries()) {
            if (line.find(level) != std::string::npos && line.find(text) != std::string::npos) ++n;
        }
        return n;
    }

private:
    std::shared_ptr<CallLog> lines_;
};

/**
 * @brief 记录名称后立即完成的处理器
 */
inline EventHandler recordingHandler(std::shared_ptr<CallLog> log, std::string name) {
    return [log, name](const DomainEvent&) -> drogon::Task<void> {
        log->add(name);
        co_return;
    };
}

/**
 * @brief 总是抛出 runtime_error 的处理器
 */
inline EventHandler failingHandler(std::string message) {
    return [message](const DomainEvent&) -> drogon::Task<void> {
        throw std::runtime_error(message);
        co_return;
    };
}

inline DomainEvent aggregateEvent(const std::string& type, const std::string& aggregateId,
                                  Json::Value payload = Json::Value(Json::objectValue)) {
    return DomainEvent(type, aggregateId, "Test", 0, std::move(payload));
}
