// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/ExceptionHandler.hpp"

// Database
#include "common/database/DatabaseInitializer.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/database/RedisService.hpp"

// Event core
#include "common/domain/EventCoreContext.hpp"

// Controllers - Order Module
#include "modules/order/Order.Controller.hpp"
#include "modules/order/OrderEventHandlers.hpp"

// Controllers - Event Log Module
#include "modules/eventlog/EventLog.Controller.hpp"

using namespace drogon;

// ─── 启动流程 ──────────────────────────────────────────────

void printStartupError(const std::string& title, const std::string& detail,
                       const std::vector<std::string>& hints = {}) {
    std::cerr << "\n" << std::string(60, '=') << "\n [ERROR] " << title << "\n  " << detail << "\n";
    for (const auto& hint : hints) {
        std::cerr << "    - " << hint << "\n";
    }
    std::cerr << std::string(60, '=') << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

/**
 * @brief 启动步骤：按顺序执行，任一步失败则输出排查提示并退出
 */
struct StartupStep {
    std::string name;
    std::vector<std::string> hints;
    std::function<Task<>()> run;
};

std::vector<StartupStep> startupSteps(const std::shared_ptr<EventCoreContext>& core) {
    std::vector<StartupStep> steps;
    const auto& config = core->config();

    if (config.needsPostgres()) {
        steps.push_back({"database:ping",
                         {"PostgreSQL 是否在运行", "db_clients 的 host/port/user/passwd/dbname"},
                         []() -> Task<> { co_await DatabaseService().ping(); }});
        steps.push_back({"database:schema",
                         {"数据库用户是否有建表权限"},
                         []() -> Task<> { co_await DatabaseInitializer::initialize(); }});
    }
    if (config.needsRedis()) {
        steps.push_back({"redis:ping",
                         {"Redis 是否在运行", "redis_clients 的 host/port/passwd"},
                         []() -> Task<> { co_await RedisService().ping(); }});
    }
    steps.push_back({"dispatcher:start",
                     {"订阅之间是否存在独占冲突", "custom_config.eventcore.dispatcher 配置"},
                     [core]() -> Task<> { co_await core->start(); }});
    return steps;
}

/**
 * @brief 启动步骤在后台协程中执行，协程持有 core 的一份引用，
 *        框架提前退出时 main 释放自己的引用也不会让它悬空
 */
void onServerStarted(std::shared_ptr<EventCoreContext> core) {
    std::cout << "eventcore server started" << std::endl;
    for (const auto& addr : app().getListeners()) {
        std::cout << "  -> http://" << addr.toIpPort() << std::endl;
        LOG_INFO << "Server listening on http://" << addr.toIpPort();
    }

    async_run([core = std::move(core)]() -> Task<> {
        auto steps = startupSteps(core);
        for (const auto& step : steps) {
            if (!app().isRunning()) {
                LOG_WARN << "[Startup] Server is shutting down, skipping " << step.name;
                co_return;
            }
            LOG_INFO << "[Startup] " << step.name;
            std::string error;
            try {
                co_await step.run();
            } catch (const std::exception& e) {
                error = e.what();
            }
            if (!error.empty()) {
                printStartupError("启动步骤失败: " + step.name, error, step.hints);
                app().getLoop()->queueInLoop([]() { app().quit(); });
                co_return;
            }
        }
        LOG_INFO << "[Startup] event core ready, " << steps.size() << " step(s) completed";
    });
}

int main() {
    std::cout << "mimalloc v" << (mi_version() / 100) << "." << (mi_version() % 100) << std::endl;

    LoggerManager::initialize("./logs");

    // 配置错误已由 ConfigManager 输出
    if (!ConfigManager::load()) {
        return 1;
    }

    if (!LoggerManager::setLogLevel(ConfigManager::getLogLevel())) {
        LOG_WARN << "Unknown log_level '" << ConfigManager::getLogLevel() << "', keeping INFO";
    }
    LoggerManager::setConsoleEcho(ConfigManager::isConsoleLogEnabled());

    AppExceptionHandler::setup();

    // 事件核心使用独立定时线程，框架退出后仍可等待后台分发结束
    trantor::EventLoopThread timerThread("EventCoreTimer");
    timerThread.run();

    std::shared_ptr<EventCoreContext> core;
    try {
        core = std::make_shared<EventCoreContext>(ConfigManager::eventCore(), timerThread.getLoop());
    } catch (const std::exception& e) {
        printStartupError("事件核心初始化失败", e.what(), {"custom_config.eventcore 配置是否正确"});
        return 1;
    }

    // 登记订阅（分发器启动时统一激活）并注册控制器
    auto projection = std::make_shared<OrderProjection>(core->store());
    OrderEventHandlers::registerAll(core->subscriptions(), projection);

    auto orderService = std::make_shared<OrderService>(*core, projection);
    app().registerController(std::make_shared<OrderController>(orderService));
    app().registerController(std::make_shared<EventLogController>(*core));

    app().registerBeginningAdvice([&core]() {
        // Drogon 按配置建好连接池后才能取到客户端
        std::string failure;
        try {
            if (core->config().needsPostgres() && !DatabaseService().getClient()) {
                failure = "db_clients 中没有名为 default 的客户端";
            }
            if (core->config().needsRedis()) {
                RedisService().getClient();
            }
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (!failure.empty()) {
            printStartupError("存储客户端不可用", failure, {"db_clients / redis_clients 配置"});
            std::exit(1);
        }
        onServerStarted(core);
    });

    app().run();

    // 框架已退出，限时等待后台分发结束
    LOG_INFO << "Server stopped, draining event dispatch";
    drogon::sync_wait(core->stop());
    if (core.use_count() > 1) {
        LOG_WARN << "Startup steps still running, event core is released when they finish";
    }
    core.reset();
    timerThread.getLoop()->quit();
    timerThread.wait();

    LOG_INFO << "All resources cleaned up";
    LoggerManager::close();
    return 0;
}
