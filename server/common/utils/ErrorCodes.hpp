#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 客户端错误（请求参数、资源不存在、冲突等）
 * - 3xxx: 事件溯源核心错误（并发冲突、订阅配置、存储、序列化、重放）
 * - 5xxx: 服务器内部错误
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 客户端错误 (1xxx) ====================

/** 资源不存在 */
inline constexpr int NOT_FOUND = 1001;

/** 请求参数错误 */
inline constexpr int BAD_REQUEST = 1002;

/** 无权限访问 */
inline constexpr int FORBIDDEN = 1003;

/** 数据冲突（命令重试耗尽，可由客户端重新提交） */
inline constexpr int CONFLICT = 1004;

/** 数据验证失败 */
inline constexpr int VALIDATION_FAILED = 1005;

// ==================== 事件溯源错误 (3xxx) ====================

/** 期望版本与聚合当前版本不一致 */
inline constexpr int CONCURRENCY_CONFLICT = 3001;

/** 订阅或聚合行为定义非法 */
inline constexpr int CONFIGURATION_INVALID = 3002;

/** 事件处理器执行失败 */
inline constexpr int HANDLER_FAILED = 3003;

/** 事件存储后端不可用 */
inline constexpr int STORE_UNAVAILABLE = 3004;

/** 负载或状态无法编码/解码 */
inline constexpr int SERIALIZATION_FAILED = 3005;

/** 重放事件时 reducer 失败或版本断档 */
inline constexpr int REPLAY_FAILED = 3006;

// ==================== 服务器错误 (5xxx) ====================

/** 服务器内部错误 */
inline constexpr int INTERNAL_ERROR = 5000;

/** 数据库错误 */
inline constexpr int DATABASE_ERROR = 5001;

}  // namespace ErrorCodes
