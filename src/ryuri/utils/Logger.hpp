#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace ryuri {

/**
 * @brief 进程级日志器
 *
 * 文件输出带滚动，控制台输出带颜色。首次写日志时若尚未初始化，
 * 按默认参数自动初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/ryuri.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    /**
     * @brief 解析级别名称（trace/debug/info/warn/error/critical/off，大小写不敏感）
     * @return 无法识别时返回 false
     */
    static bool parseLevel(const std::string& name, Level& out);

    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            log(level, fmt_str);
        } else {
            try {
                log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error& e) {
                log(level, fmt::format("{} <format error: {}>", fmt_str, e.what()));
            }
        }
    }

    void flush();
    void shutdown();

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void open_file_locked();
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define RYURI_FUNC __FUNCTION__
#else
#  define RYURI_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define RYURI_LOG_TRACE(fmt, ...)    ::ryuri::Logger::getInstance().logCtx(::ryuri::Logger::Level::TRACE,    __FILE__, __LINE__, RYURI_FUNC, fmt, ##__VA_ARGS__)
#define RYURI_LOG_DEBUG(fmt, ...)    ::ryuri::Logger::getInstance().logCtx(::ryuri::Logger::Level::DEBUG,    __FILE__, __LINE__, RYURI_FUNC, fmt, ##__VA_ARGS__)
#define RYURI_LOG_INFO(fmt, ...)     ::ryuri::Logger::getInstance().logCtx(::ryuri::Logger::Level::INFO,     __FILE__, __LINE__, RYURI_FUNC, fmt, ##__VA_ARGS__)
#define RYURI_LOG_WARN(fmt, ...)     ::ryuri::Logger::getInstance().logCtx(::ryuri::Logger::Level::WARN,     __FILE__, __LINE__, RYURI_FUNC, fmt, ##__VA_ARGS__)
#define RYURI_LOG_ERROR(fmt, ...)    ::ryuri::Logger::getInstance().logCtx(::ryuri::Logger::Level::ERROR,    __FILE__, __LINE__, RYURI_FUNC, fmt, ##__VA_ARGS__)
#define RYURI_LOG_CRITICAL(fmt, ...) ::ryuri::Logger::getInstance().logCtx(::ryuri::Logger::Level::CRITICAL, __FILE__, __LINE__, RYURI_FUNC, fmt, ##__VA_ARGS__)

} // namespace ryuri
