#pragma once

/**
 * @brief 事件溯源核心统一入口
 *
 * 包含事件、总线、存储、仓储和分发基础设施。
 *
 * 使用示例：
 * @code
 * #include "common/domain/Domain.hpp"
 *
 * auto repo = core.repository(OrderBehavior::instance());
 * auto order = co_await repo.load(id);
 * OrderCommands::ship(order, "SF", "SF1234");
 * co_await repo.save(order);
 * @endcode
 */

// ==================== 事件与订阅 ====================

#include "DomainEvent.hpp"            // 领域事件
#include "TopicPattern.hpp"           // 主题通配
#include "EventBus.hpp"               // 优先级分层发布订阅
#include "HandlerDecorators.hpp"      // 处理器重试

// ==================== 聚合与仓储 ====================

#include "Aggregate.hpp"              // 聚合行为与实例
#include "EventSourcedRepository.hpp" // 快照 + 重放

// ==================== 托管订阅与分发 ====================

#include "SubscriptionManager.hpp"
#include "EventDispatcher.hpp"
#include "EventCoreContext.hpp"
