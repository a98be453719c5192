#pragma once

/**
 * @brief 时间戳助手
 *
 * 事件时间统一使用 UTC、微秒精度，保证写入存储后再读回完全一致。
 */
class TimestampHelper {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

    static TimePoint now() {
        return std::chrono::floor<std::chrono::microseconds>(Clock::now());
    }

    static int64_t toMicros(TimePoint tp) {
        return tp.time_since_epoch().count();
    }

    static TimePoint fromMicros(int64_t micros) {
        return TimePoint(std::chrono::microseconds(micros));
    }

    /**
     * @brief 格式化为 ISO-8601：YYYY-MM-DDTHH:MM:SS.ffffffZ
     */
    static std::string toIso(TimePoint tp) {
        auto secs = std::chrono::floor<std::chrono::seconds>(tp);
        auto dp = std::chrono::floor<std::chrono::days>(secs);
        std::chrono::year_month_day ymd{dp};
        std::chrono::hh_mm_ss hms{secs - dp};
        auto micros = (tp - secs).count();

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
            << std::setw(2) << hms.hours().count() << ":"
            << std::setw(2) << hms.minutes().count() << ":"
            << std::setw(2) << hms.seconds().count() << "."
            << std::setw(6) << micros << "Z";
        return oss.str();
    }

    /**
     * @brief 解析 toIso() 的输出（小数位 0-6 位均可，必须以 Z 结尾）
     * @return 格式非法时返回 nullopt
     */
    static std::optional<TimePoint> fromIso(const std::string& text) {
        int y = 0;
        unsigned mo = 0, d = 0, h = 0, mi = 0, s = 0;
        if (text.size() < 20 || text.back() != 'Z') return std::nullopt;
        if (std::sscanf(text.c_str(), "%4d-%2u-%2uT%2u:%2u:%2u", &y, &mo, &d, &h, &mi, &s) != 6) {
            return std::nullopt;
        }

        int64_t micros = 0;
        if (text[19] == '.') {
            std::string frac = text.substr(20, text.size() - 21);
            if (frac.empty() || frac.size() > 6 ||
                !std::all_of(frac.begin(), frac.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
            frac.append(6 - frac.size(), '0');
            micros = std::stoll(frac);
        } else if (text.size() != 20) {
            return std::nullopt;
        }

        std::chrono::year_month_day ymd{std::chrono::year(y), std::chrono::month(mo), std::chrono::day(d)};
        if (!ymd.ok() || h > 23 || mi > 59 || s > 60) return std::nullopt;

        auto tp = std::chrono::sys_days(ymd) + std::chrono::hours(h)
                + std::chrono::minutes(mi) + std::chrono::seconds(s)
                + std::chrono::microseconds(micros);
        return TimePoint(tp);
    }
};
