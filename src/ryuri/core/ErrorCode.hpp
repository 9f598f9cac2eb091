#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace ryuri {
namespace core {

/**
 * @brief RyuriCore统一错误码
 *
 * 设计原则：
 * - 存储层/缓存层抛异常，链路层返回Result
 * - 每个错误码对应一种用户可见的失败类别
 * - 使用紧凑编码，按区段分组
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,

    // 存储错误 (20-39)
    NotFound = 20,
    CorruptArchive = 21,
    IOFailure = 22,

    // 文档错误 (40-59)
    MalformedMarkup = 40,
    SerializationMismatch = 41,

    // 过滤器错误 (60-69)
    FilterFailure = 60,

    // 保护错误 (70-79)
    AuthenticationFailure = 70,
    ManifestInconsistent = 71,

    // 调度状态 (80-89)
    Cancelled = 80,
    Timeout = 81
};

/**
 * @brief 错误信息结构
 *
 * context 保存出错的条目路径或过滤器名称；
 * cause 仅在 FilterFailure 时有效，记录被包装的原始错误码。
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;
    ErrorCode cause = ErrorCode::Ok;

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    operator bool() const noexcept { return isError(); }

    std::string fullMessage() const;
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码名称（与枚举名一致，用于日志和测试断言）
 */
const char* codeName(ErrorCode code) noexcept;

/**
 * @brief 创建错误对象的便利函数
 */
inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 将底层错误包装为过滤器失败
 */
inline Error makeFilterFailure(const std::string& filter_name, const Error& cause) {
    Error wrapped(ErrorCode::FilterFailure, cause.fullMessage(), filter_name);
    wrapped.cause = cause.code == ErrorCode::FilterFailure ? cause.cause : cause.code;
    return wrapped;
}

/**
 * @brief 成功结果
 */
inline Error success() {
    return Error(ErrorCode::Ok);
}

/**
 * @brief 将Error转换为对应的异常抛出（实现见 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace ryuri::core
