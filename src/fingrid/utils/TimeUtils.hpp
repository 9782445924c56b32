#pragma once

#include <chrono>
#include <cmath>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace fingrid {
namespace utils {

/**
 * @brief 日期结构（公历）
 */
struct CivilDate {
    int year = 1899;
    int month = 12;
    int day = 30;
};

/**
 * @brief 时间工具类 - 历史时间戳与 1900 日期序列号
 *
 * 序列号与 Excel 1900 日期系统一致（1900-03-01 之后）：
 * 序列号 0 对应 1899-12-30，1 天为 1.0。
 */
class TimeUtils {
public:
    /**
     * @brief 获取当前UTC时间的 std::tm 结构
     */
    static std::tm getCurrentUTCTime() {
        std::time_t now = std::time(nullptr);
        std::tm result{};
#ifdef _WIN32
        gmtime_s(&result, &now);
#else
        gmtime_r(&now, &result);
#endif
        return result;
    }

    /**
     * @brief 获取当前本地时间的 std::tm 结构
     */
    static std::tm getCurrentTime() {
        std::time_t now = std::time(nullptr);
        std::tm result{};
#ifdef _WIN32
        localtime_s(&result, &now);
#else
        localtime_r(&now, &result);
#endif
        return result;
    }

    /**
     * @brief 格式化为 ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)，用于单元格历史
     */
    static std::string formatTimeISO8601(const std::tm& time) {
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                           time.tm_year + 1900, time.tm_mon + 1, time.tm_mday,
                           time.tm_hour, time.tm_min, time.tm_sec);
    }

    static std::string nowISO8601() {
        return formatTimeISO8601(getCurrentUTCTime());
    }

    // 公历日期 -> 自 1970-01-01 起的天数（Howard Hinnant 算法）
    static long daysFromCivil(int y, int m, int d) {
        y -= m <= 2 ? 1 : 0;
        const long era = (y >= 0 ? y : y - 399) / 400;
        const long yoe = static_cast<long>(y) - era * 400;
        const long doy = (153L * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    static CivilDate civilFromDays(long z) {
        z += 719468;
        const long era = (z >= 0 ? z : z - 146096) / 146097;
        const long doe = z - era * 146097;
        const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const long mp = (5 * doy + 2) / 153;
        CivilDate date;
        date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
        return date;
    }

    /**
     * @brief 公历日期 -> 1900 序列号；月份可越界（13 月即次年 1 月）
     */
    static double toSerial(int year, int month, int day) {
        int total_months = year * 12 + (month - 1);
        int norm_year = total_months >= 0 ? total_months / 12 : (total_months - 11) / 12;
        int norm_month = total_months - norm_year * 12 + 1;
        long days = daysFromCivil(norm_year, norm_month, 1) + (day - 1);
        return static_cast<double>(days - kSerialEpochOffset);
    }

    // 9999-12-31 的序列号；日期换算只接受绝对值不超过它的序列号
    static constexpr double kMaxSerial = 2958465.0;

    static bool isSerialInRange(double serial) {
        return serial >= -kMaxSerial && serial <= kMaxSerial;
    }

    static CivilDate fromSerial(double serial) {
        long days = static_cast<long>(std::floor(serial)) + kSerialEpochOffset;
        return civilFromDays(days);
    }

    static double todaySerial() {
        std::tm now = getCurrentTime();
        return toSerial(now.tm_year + 1900, now.tm_mon + 1, now.tm_mday);
    }

    static double nowSerial() {
        std::tm now = getCurrentTime();
        double seconds = now.tm_hour * 3600.0 + now.tm_min * 60.0 + now.tm_sec;
        return todaySerial() + seconds / 86400.0;
    }

    /**
     * @brief 解析 "YYYY-MM-DD" 前缀（后面可跟时间部分）
     */
    static std::optional<double> parseISODate(std::string_view text) {
        if (!hasISODatePrefix(text)) {
            return std::nullopt;
        }
        int year = digits(text.substr(0, 4));
        int month = digits(text.substr(5, 2));
        int day = digits(text.substr(8, 2));
        if (month < 1 || month > 12 || day < 1 || day > 31) {
            return std::nullopt;
        }
        return toSerial(year, month, day);
    }

    static bool hasISODatePrefix(std::string_view text) {
        if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
            return false;
        }
        for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
            if (text[i] < '0' || text[i] > '9') {
                return false;
            }
        }
        return true;
    }

    static std::string formatISODate(double serial) {
        CivilDate date = fromSerial(serial);
        return fmt::format("{:04}-{:02}-{:02}", date.year, date.month, date.day);
    }

private:
    // 1899-12-30 距 1970-01-01 的天数
    static constexpr long kSerialEpochOffset = -25569;

    static int digits(std::string_view text) {
        int value = 0;
        for (char ch : text) {
            value = value * 10 + (ch - '0');
        }
        return value;
    }
};

}} // namespace fingrid::utils
