#pragma once

/**
 * @brief 日志管理器
 *
 * 接管 trantor::Logger 的输出：每行整理为 "YYYY-MM-DD HH:MM:SS 线程 级别 消息"，
 * 交给 trantor::AsyncFileLogger 异步写入 logs/eventcore_YYYY-MM-DD*.log。
 * 跨日或单文件超过上限时换新文件，console_log 打开时同时写 stdout。
 */
class LoggerManager {
public:
    static void initialize(const std::string& logDir,
                           uint64_t fileSizeLimit = DEFAULT_FILE_SIZE_LIMIT) {
        std::filesystem::create_directories(logDir);

        auto& s = state();
        {
            std::unique_lock lock(s.mutex);
            s.dir = logDir;
            s.sizeLimit = fileSizeLimit;
            s.day = currentDate();
            s.sink = openSink(s, s.day);
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(&LoggerManager::write, &LoggerManager::flush);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 按名称设置级别（TRACE/DEBUG/INFO/WARN/ERROR/FATAL，大小写不敏感）
     * @return 未识别的名称返回 false，级别保持不变
     */
    static bool setLogLevel(const std::string& name) {
        static const std::pair<const char*, trantor::Logger::LogLevel> levels[] = {
            {"TRACE", trantor::Logger::kTrace}, {"DEBUG", trantor::Logger::kDebug},
            {"INFO", trantor::Logger::kInfo},   {"WARN", trantor::Logger::kWarn},
            {"ERROR", trantor::Logger::kError}, {"FATAL", trantor::Logger::kFatal},
        };
        std::string upper(name);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (const auto& [label, level] : levels) {
            if (upper == label) {
                trantor::Logger::setLogLevel(level);
                return true;
            }
        }
        return false;
    }

    static void setConsoleEcho(bool enabled) {
        state().console.store(enabled, std::memory_order_relaxed);
    }

    /** @brief 停止文件输出，剩余缓冲在 AsyncFileLogger 析构时落盘 */
    static void close() {
        std::unique_ptr<trantor::AsyncFileLogger> sink;
        {
            std::unique_lock lock(state().mutex);
            sink = std::move(state().sink);
        }
    }

private:
    static constexpr uint64_t DEFAULT_FILE_SIZE_LIMIT = 100ULL * 1024 * 1024;

    struct State {
        std::shared_mutex mutex;
        std::unique_ptr<trantor::AsyncFileLogger> sink;
        std::string dir;
        uint64_t sizeLimit = DEFAULT_FILE_SIZE_LIMIT;
        std::chrono::year_month_day day{};
        std::atomic<bool> console{false};
    };

    static State& state() {
        static State instance;
        return instance;
    }

    static std::chrono::year_month_day currentDate() {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        return std::chrono::year_month_day{std::chrono::year{local.tm_year + 1900},
                                           std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)},
                                           std::chrono::day{static_cast<unsigned>(local.tm_mday)}};
    }

    static std::unique_ptr<trantor::AsyncFileLogger> openSink(const State& s,
                                                              std::chrono::year_month_day day) {
        char date[11];
        std::snprintf(date, sizeof(date), "%04d-%02u-%02u", static_cast<int>(day.year()),
                      static_cast<unsigned>(day.month()), static_cast<unsigned>(day.day()));

        auto sink = std::make_unique<trantor::AsyncFileLogger>();
        sink->setFileName(s.dir + "/eventcore_" + date);
        sink->setFileSizeLimit(s.sizeLimit);
        sink->startLogging();
        return sink;
    }

    /**
     * @brief trantor 原始行 "20260101 12:00:00.123456 1234 INFO  msg - File.hpp:42"
     *        整理为 "2026-01-01 12:00:00 1234 INFO  msg"
     */
    static std::string reformat(std::string_view raw) {
        if (raw.size() < 17 || raw[8] != ' ') return std::string(raw);
        auto clockEnd = raw.find(' ', 9);
        if (clockEnd == std::string_view::npos) return std::string(raw);

        std::string line;
        line.reserve(raw.size());
        line.append(raw.substr(0, 4)).append("-")
            .append(raw.substr(4, 2)).append("-")
            .append(raw.substr(6, 2)).append(" ")
            .append(raw.substr(9, 8));

        auto body = raw.substr(clockEnd);
        // 协程与 lambda 内的日志带有无意义的 [operator ()] 前缀
        if (auto op = body.find("[operator ()] "); op != std::string_view::npos) {
            line.append(body.substr(0, op));
            body = body.substr(op + 14);
        }
        auto source = body.rfind(" - ");
        if (source != std::string_view::npos &&
            (body.find(".hpp:", source) != std::string_view::npos ||
             body.find(".cpp:", source) != std::string_view::npos)) {
            line.append(body.substr(0, source)).append("\n");
        } else {
            line.append(body);
        }
        return line;
    }

    static void write(const char* msg, uint64_t len) {
        auto line = reformat(std::string_view(msg, len));
        auto& s = state();

        if (s.console.load(std::memory_order_relaxed)) {
            std::fwrite(line.data(), 1, line.size(), stdout);
        }

        auto today = currentDate();
        {
            std::shared_lock lock(s.mutex);
            if (today == s.day) {
                if (s.sink) s.sink->output(line.data(), line.size());
                return;
            }
        }

        // 跨日：旧文件在锁外析构并落盘
        std::unique_ptr<trantor::AsyncFileLogger> previous;
        std::unique_lock lock(s.mutex);
        if (s.sink && today != s.day) {
            previous = std::move(s.sink);
            s.sink = openSink(s, today);
            s.day = today;
        }
        if (s.sink) s.sink->output(line.data(), line.size());
        lock.unlock();
    }

    static void flush() {
        std::shared_lock lock(state().mutex);
        if (state().sink) state().sink->flush();
    }
};
