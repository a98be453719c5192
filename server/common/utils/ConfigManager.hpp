#pragma once

#include "common/database/DatabaseService.hpp"
#include "common/database/RedisService.hpp"
#include "common/domain/EventCoreConfig.hpp"

namespace fs = std::filesystem;

/**
 * @brief 配置管理器 - 负责加载、验证和管理应用配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 必填字段检查（listeners；所选后端需要的 db_clients、redis_clients）
 * - custom_config.eventcore 的后端、快照、总线与分发器参数
 * - 端口范围、类型合法性校验
 * - 占位符值警告（YOUR_*、CHANGE_ME 等）
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load() {
        // 每次加载前重置为默认值，避免读取失败时沿用旧值
        AppDbConfig::useFast() = false;
        AppRedisConfig::useFast() = false;
        numberOfThreads_ = 0;
        eventCore_ = EventCoreConfig{};

        // 1. 查找配置文件
        auto configPath = findConfigFile();
        if (!configPath) {
            return false;
        }

        // 2. 解析 JSON
        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        // 3. 验证配置
        if (!validateConfig(root, *configPath)) {
            return false;
        }

        // 4. 提取自定义配置（is_fast、线程数等）
        applyConfig(root);

        // 5. 加载到 Drogon 框架
        try {
            drogon::app().loadConfigFile(*configPath);
        } catch (const std::exception& e) {
            printErrors("Drogon 加载配置失败", {e.what()});
            return false;
        }

        LOG_INFO << "Config loaded from: " << *configPath;
        return true;
    }

    /**
     * @brief 获取日志级别配置
     */
    static std::string getLogLevel() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("log_level", "INFO").asString();
    }

    /**
     * @brief 获取是否启用控制台日志
     */
    static bool isConsoleLogEnabled() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("console_log", false).asBool();
    }

    /**
     * @brief 获取线程数配置
     * @return 线程数，0 表示自动（使用 CPU 核心数）
     */
    static size_t getNumberOfThreads() {
        return numberOfThreads_;
    }

    /**
     * @brief 事件溯源核心配置（load() 成功后有效）
     */
    static const EventCoreConfig& eventCore() {
        return eventCore_;
    }

private:
    inline static size_t numberOfThreads_ = 0;
    inline static EventCoreConfig eventCore_;

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        // EVENTCORE_CONFIG 优先，其次按目录由近及远查找，local 覆盖默认
        if (const char* env = std::getenv("EVENTCORE_CONFIG"); env && *env) {
            if (fs::exists(env)) return std::string(env);
            printErrors("EVENTCORE_CONFIG 指向的文件不存在", {env});
            return std::nullopt;
        }

        std::vector<std::string> tried;
        for (const char* dir : {"./config", "../config", "../../config"}) {
            for (const char* name : {"config.local.json", "config.json"}) {
                auto path = std::string(dir) + "/" + name;
                if (fs::exists(path)) return path;
                tried.push_back("  - " + path);
            }
        }

        tried.insert(tried.begin(), "已查找:");
        tried.emplace_back("可复制 config/config.example.json 后修改");
        printErrors("未找到配置文件", tried);
        return std::nullopt;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static bool validateConfig(const Json::Value& root, const std::string& path) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        validateListeners(root, errors);
        auto eventCore = validateEventCore(root, errors);
        if (eventCore.needsPostgres()) {
            validateDbClients(root, errors, warnings);
        }
        if (eventCore.needsRedis()) {
            validateRedisClients(root, errors, warnings);
        }
        if (eventCore.eventStore == EventStoreBackend::Memory) {
            warnings.emplace_back("[eventcore.event_store] memory 后端不持久化，进程退出后事件丢失");
        }

        // 先输出警告（不阻断启动）
        if (!warnings.empty()) {
            printWarnings("配置警告 (" + path + ")", warnings);
        }

        // 有错误则中断启动
        if (!errors.empty()) {
            printErrors("配置验证失败: " + path, errors);
            return false;
        }

        return true;
    }

    /** @brief 连接类配置段的校验规则（listeners、db_clients、redis_clients） */
    struct SectionRule {
        const char* key;
        const char* missingHint;
        std::vector<const char*> requiredStrings;
        bool passwordRequired;
    };

    static void validateListeners(const Json::Value& root, std::vector<std::string>& errors) {
        std::vector<std::string> unused;
        validateSection(root, {"listeners", "需要至少一个 HTTP 监听地址", {"address"}, false},
                        errors, unused);
    }

    static void validateDbClients(const Json::Value& root,
                                  std::vector<std::string>& errors,
                                  std::vector<std::string>& warnings) {
        validateSection(root,
                        {"db_clients", "PostgreSQL 事件存储/快照存储需要至少一个连接",
                         {"name", "rdbms", "host", "user", "dbname"}, true},
                        errors, warnings);
    }

    static void validateRedisClients(const Json::Value& root,
                                     std::vector<std::string>& errors,
                                     std::vector<std::string>& warnings) {
        validateSection(root, {"redis_clients", "Redis 快照存储需要至少一个连接", {"host"}, false},
                        errors, warnings);
    }

    static void validateSection(const Json::Value& root, const SectionRule& rule,
                                std::vector<std::string>& errors,
                                std::vector<std::string>& warnings) {
        const auto& items = root[rule.key];
        if (!items.isArray() || items.empty()) {
            errors.push_back(std::string("[") + rule.key + "] 缺失或为空：" + rule.missingHint);
            return;
        }

        for (Json::ArrayIndex i = 0; i < items.size(); ++i) {
            const auto& item = items[i];
            auto where = std::string("[") + rule.key + "[" + std::to_string(i) + "]] ";

            for (const char* field : rule.requiredStrings) {
                if (!item[field].isString() || item[field].asString().empty()) {
                    errors.push_back(where + field + " 必须是非空字符串");
                }
            }
            validatePort(item, where, errors);

            const auto& passwd = item["passwd"];
            if (rule.passwordRequired && !passwd.isString()) {
                errors.push_back(where + "passwd 必须是字符串");
            } else if (passwd.isString() && isPlaceholder(passwd.asString())) {
                warnings.push_back(where + "passwd 仍是示例占位符");
            }
        }
    }

    static EventCoreConfig validateEventCore(const Json::Value& root, std::vector<std::string>& errors) {
        if (root.isMember("custom_config") && !root["custom_config"].isObject()) {
            errors.emplace_back("[custom_config] 必须是 JSON 对象");
            return {};
        }
        const auto& custom = root["custom_config"];
        return EventCoreConfig::fromJson(custom.isObject() ? custom["eventcore"] : Json::Value(), errors);
    }

    // ─── 配置应用 ──────────────────────────────────────────────

    static void applyConfig(const Json::Value& root) {
        if (root.isMember("db_clients") && root["db_clients"].isArray() &&
            !root["db_clients"].empty()) {
            AppDbConfig::useFast() = root["db_clients"][0].get("is_fast", false).asBool();
        }
        if (root.isMember("redis_clients") && root["redis_clients"].isArray() &&
            !root["redis_clients"].empty()) {
            AppRedisConfig::useFast() = root["redis_clients"][0].get("is_fast", false).asBool();
        }
        if (root.isMember("app") && root["app"].isMember("number_of_threads")) {
            numberOfThreads_ = static_cast<size_t>(root["app"]["number_of_threads"].asUInt());
        }
        std::vector<std::string> ignored;
        const auto& custom = root["custom_config"];
        eventCore_ = EventCoreConfig::fromJson(custom.isObject() ? custom["eventcore"] : Json::Value(), ignored);
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void validatePort(const Json::Value& obj, const std::string& where,
                             std::vector<std::string>& errors) {
        const auto& port = obj["port"];
        if (!port.isInt64()) {
            errors.push_back(where + "port 必须是整数");
        } else if (port.asInt64() < 1 || port.asInt64() > 65535) {
            errors.push_back(where + "port 超出范围 1-65535: " + std::to_string(port.asInt64()));
        }
    }

    static bool isPlaceholder(const std::string& value) {
        static const std::vector<std::string> markers = {"YOUR_", "your_", "CHANGE_ME", "TODO"};
        if (value == "password" || value == "PASSWORD") return true;
        return std::any_of(markers.begin(), markers.end(), [&](const std::string& m) {
            return value.find(m) != std::string::npos;
        });
    }

    static void report(bool fatal, const std::string& title, const std::vector<std::string>& lines) {
        std::cerr << "\n" << std::string(60, fatal ? '=' : '-') << "\n"
                  << (fatal ? " [ERROR] " : " [WARN] ") << title << "\n";
        for (const auto& line : lines) {
            std::cerr << "  " << line << "\n";
            if (fatal) {
                LOG_ERROR << "[Config] " << line;
            } else {
                LOG_WARN << "[Config] " << line;
            }
        }
        std::cerr << std::string(60, fatal ? '=' : '-') << "\n" << std::endl;
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& lines) {
        report(true, title, lines);
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& lines) {
        report(false, title, lines);
    }
};
