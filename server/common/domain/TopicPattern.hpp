#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 主题匹配模式
 *
 * 主题与模式都是以 '.' 分隔的段序列：
 * - `*` 恰好匹配一个任意段
 * - 末尾的 `#` 匹配剩余的一个或多个段
 * - 其余段必须逐字相等，段数必须一致（末尾 `#` 除外）
 *
 * @code
 * auto p = TopicPattern::parse("orders.*");
 * p.matches("orders.created");     // true
 * p.matches("orders.created.v2");  // false
 * TopicPattern::parse("orders.#").matches("orders.created.v2");  // true
 * @endcode
 */
class TopicPattern {
public:
    /**
     * @throws ConfigurationError 模式为空、含空段、通配符与字面量混用、`#` 不在末尾
     */
    static TopicPattern parse(const std::string& pattern) {
        if (pattern.empty()) {
            throw ConfigurationError("Topic pattern must not be empty");
        }

        auto segments = split(pattern);
        for (size_t i = 0; i < segments.size(); ++i) {
            const auto& seg = segments[i];
            if (seg.empty()) {
                throw ConfigurationError("Topic pattern has an empty segment: '" + pattern + "'");
            }
            bool hasWildcard = seg.find_first_of("*#") != std::string::npos;
            if (hasWildcard && seg != "*" && seg != "#") {
                throw ConfigurationError("Wildcard must be a whole segment: '" + pattern + "'");
            }
            if (seg == "#" && i + 1 != segments.size()) {
                throw ConfigurationError("'#' is only allowed as the last segment: '" + pattern + "'");
            }
        }

        TopicPattern result;
        result.text_ = pattern;
        result.multiTail_ = segments.back() == "#";
        if (result.multiTail_) segments.pop_back();
        result.segments_ = std::move(segments);
        return result;
    }

    bool matches(const std::string& topic) const {
        if (topic.empty()) return false;

        auto parts = split(topic);
        for (const auto& p : parts) {
            if (p.empty()) return false;
        }

        if (multiTail_) {
            if (parts.size() < segments_.size() + 1) return false;
        } else if (parts.size() != segments_.size()) {
            return false;
        }

        for (size_t i = 0; i < segments_.size(); ++i) {
            if (segments_[i] != "*" && segments_[i] != parts[i]) return false;
        }
        return true;
    }

    const std::string& text() const { return text_; }

private:
    std::string text_;
    std::vector<std::string> segments_;
    bool multiTail_ = false;

    TopicPattern() = default;

    static std::vector<std::string> split(const std::string& text) {
        std::vector<std::string> out;
        size_t start = 0;
        while (true) {
            auto dot = text.find('.', start);
            if (dot == std::string::npos) {
                out.push_back(text.substr(start));
                break;
            }
            out.push_back(text.substr(start, dot - start));
            start = dot + 1;
        }
        return out;
    }
};
