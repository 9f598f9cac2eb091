#include "ryuri/core/ErrorCode.hpp"

namespace ryuri {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

std::string Error::fullMessage() const {
    if (context.empty()) {
        return fmt::format("[{}] {}", codeName(code), message);
    }
    return fmt::format("[{}] {} (Context: {})", codeName(code), message, context);
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 存储错误
        case ErrorCode::NotFound:
            return "Entry not found";
        case ErrorCode::CorruptArchive:
            return "Corrupt archive";
        case ErrorCode::IOFailure:
            return "I/O failure";

        // 文档错误
        case ErrorCode::MalformedMarkup:
            return "Malformed markup";
        case ErrorCode::SerializationMismatch:
            return "Serialization mode mismatch";

        case ErrorCode::FilterFailure:
            return "Filter failure";

        // 保护错误
        case ErrorCode::AuthenticationFailure:
            return "Authentication failure";
        case ErrorCode::ManifestInconsistent:
            return "Protection manifest inconsistent";

        // 调度状态
        case ErrorCode::Cancelled:
            return "Job cancelled";
        case ErrorCode::Timeout:
            return "Job timed out";

        default:
            return "Unknown error";
    }
}

const char* codeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::CorruptArchive: return "CorruptArchive";
        case ErrorCode::IOFailure: return "IOFailure";
        case ErrorCode::MalformedMarkup: return "MalformedMarkup";
        case ErrorCode::SerializationMismatch: return "SerializationMismatch";
        case ErrorCode::FilterFailure: return "FilterFailure";
        case ErrorCode::AuthenticationFailure: return "AuthenticationFailure";
        case ErrorCode::ManifestInconsistent: return "ManifestInconsistent";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

}} // namespace ryuri::core
