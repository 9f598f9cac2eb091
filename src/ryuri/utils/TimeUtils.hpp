#pragma once

#include <ctime>
#include <string>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace ryuri {
namespace utils {

/**
 * @brief 时间工具类
 */
class TimeUtils {
public:
    /**
     * @brief 获取当前UTC时间的 std::tm 结构
     */
    static std::tm getCurrentUTCTime() {
        return fmt::gmtime(std::time(nullptr));
    }

    /**
     * @brief 格式化时间为ISO 8601格式 (YYYY-MM-DDTHH:MM:SSZ)
     */
    static std::string formatTimeISO8601(const std::tm& time) {
        return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", time);
    }

    static std::string formatDate(const std::tm& time) {
        return fmt::format("{:%Y-%m-%d}", time);
    }
};

}} // namespace ryuri::utils
