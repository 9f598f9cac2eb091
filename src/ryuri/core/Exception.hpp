/**
 * @file Exception.hpp
 * @brief RyuriCore异常类定义
 */

#ifndef RYURI_EXCEPTION_HPP
#define RYURI_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace ryuri {
namespace core {

/**
 * @brief RyuriCore基础异常类
 */
class RyuriException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的源文件
     * @param line 发生错误的行号
     */
    RyuriException(const std::string& message,
                   ErrorCode code = ErrorCode::InternalError,
                   const char* file = nullptr,
                   int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return codeName(error_code_); }

    /**
     * @brief 获取详细错误信息（含错误码、源位置与上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为Error，供Result边界使用
     */
    virtual Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 包条目相关异常（NotFound / CorruptArchive / IOFailure）
 */
class PackageException : public RyuriException {
public:
    PackageException(const std::string& message, const std::string& entry_path,
                     ErrorCode code = ErrorCode::NotFound,
                     const char* file = nullptr, int line = 0);

    const std::string& getEntryPath() const { return entry_path_; }

    Error toError() const override;

private:
    std::string entry_path_;
};

/**
 * @brief XML解析/序列化异常（MalformedMarkup / SerializationMismatch）
 */
class XMLException : public RyuriException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 int xml_line = -1,
                 ErrorCode code = ErrorCode::MalformedMarkup,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }
    int getXMLLine() const { return xml_line_; }

    Error toError() const override;

private:
    std::string xml_path_;
    int xml_line_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public RyuriException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

    Error toError() const override;

private:
    std::string parameter_name_;
};

} // namespace core
} // namespace ryuri

// 便捷宏定义
#define RYURI_THROW_PACKAGE(code, message, path) \
    throw ::ryuri::core::PackageException(message, path, code, __FILE__, __LINE__)

#define RYURI_THROW_XML(code, message, path, xml_line) \
    throw ::ryuri::core::XMLException(message, path, xml_line, code, __FILE__, __LINE__)

#define RYURI_THROW_PARAM(message, name) \
    throw ::ryuri::core::ParameterException(message, name, __FILE__, __LINE__)

#define RYURI_THROW_IF(condition, code, message) \
    do { if (condition) { throw ::ryuri::core::RyuriException(message, code, __FILE__, __LINE__); } } while(0)

#endif // RYURI_EXCEPTION_HPP
