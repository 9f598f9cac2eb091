/**
 * @file Exception.cpp
 * @brief RyuriCore异常类实现
 */

#include "ryuri/core/Exception.hpp"
#include <fmt/format.h>

namespace ryuri {
namespace core {

// RyuriException 实现
RyuriException::RyuriException(const std::string& message,
                               ErrorCode code,
                               const char* file,
                               int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string RyuriException::getDetailedMessage() const {
    std::string detailed = fmt::format("[{}] {}", getErrorCodeString(), what());

    if (file_ && line_ > 0) {
        detailed += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        detailed += "\nContext:";
        for (const auto& ctx : context_) {
            detailed += "\n  - " + ctx;
        }
    }

    return detailed;
}

void RyuriException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error RyuriException::toError() const {
    std::string ctx;
    for (const auto& c : context_) {
        if (!ctx.empty()) ctx += "; ";
        ctx += c;
    }
    return Error(error_code_, what(), ctx);
}

// PackageException 实现
PackageException::PackageException(const std::string& message, const std::string& entry_path,
                                   ErrorCode code, const char* file, int line)
    : RyuriException(fmt::format("{} (entry: {})", message, entry_path), code, file, line)
    , entry_path_(entry_path) {
}

Error PackageException::toError() const {
    return Error(getErrorCode(), what(), entry_path_);
}

// XMLException 实现
XMLException::XMLException(const std::string& message, const std::string& xml_path,
                           int xml_line, ErrorCode code, const char* file, int line)
    : RyuriException(xml_line > 0
                         ? fmt::format("{} (xml: {}, line {})", message, xml_path, xml_line)
                         : fmt::format("{} (xml: {})", message, xml_path),
                     code, file, line)
    , xml_path_(xml_path)
    , xml_line_(xml_line) {
}

Error XMLException::toError() const {
    return Error(getErrorCode(), what(), xml_path_);
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : RyuriException(parameter_name.empty()
                         ? message
                         : fmt::format("{} (parameter: {})", message, parameter_name),
                     ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

Error ParameterException::toError() const {
    return Error(ErrorCode::InvalidArgument, what(), parameter_name_);
}

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::NotFound:
        case ErrorCode::CorruptArchive:
        case ErrorCode::IOFailure:
            throw PackageException(error.message, error.context, error.code);
        case ErrorCode::MalformedMarkup:
        case ErrorCode::SerializationMismatch:
            throw XMLException(error.message, error.context, -1, error.code);
        case ErrorCode::InvalidArgument:
            throw ParameterException(error.message, error.context);
        default: {
            RyuriException ex(error.message, error.code);
            if (!error.context.empty()) {
                ex.addContext(error.context);
            }
            throw ex;
        }
    }
}

}} // namespace ryuri::core
