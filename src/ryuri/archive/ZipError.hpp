#pragma once

namespace ryuri {
namespace archive {

// 归档层错误码，由存储层映射到 core::ErrorCode
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // 归档未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // ZIP 结构损坏（中央目录不可读、CRC 错误）
    DuplicateEntry,       // 同一路径出现多次
    InvalidParameter,     // 无效参数
    CompressionFail,      // 压缩失败
    InternalError         // 内部错误
};

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok: return "Ok";
        case ZipError::NotOpen: return "NotOpen";
        case ZipError::IoFail: return "IoFail";
        case ZipError::BadFormat: return "BadFormat";
        case ZipError::DuplicateEntry: return "DuplicateEntry";
        case ZipError::InvalidParameter: return "InvalidParameter";
        case ZipError::CompressionFail: return "CompressionFail";
        default: return "InternalError";
    }
}

}} // namespace ryuri::archive
