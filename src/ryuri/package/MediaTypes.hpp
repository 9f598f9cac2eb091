#pragma once

#include <string>

namespace ryuri {
namespace package {

/**
 * @brief 扩展名到媒体类型的映射
 */
struct MediaTypes {
    static constexpr const char* kXhtml = "application/xhtml+xml";
    static constexpr const char* kCss = "text/css";
    static constexpr const char* kNcx = "application/x-dtbncx+xml";
    static constexpr const char* kOpf = "application/oebps-package+xml";
    static constexpr const char* kSvg = "image/svg+xml";

    /**
     * @brief 按条目路径推断媒体类型，未知扩展名返回 application/octet-stream
     */
    static std::string forPath(const std::string& path);

    static bool isFont(const std::string& media_type);
    static bool isImage(const std::string& media_type);

    /**
     * @brief 两个媒体类型是否视为等价（字体类型的各种别名互相等价）
     */
    static bool equivalent(const std::string& a, const std::string& b);
};

}} // namespace ryuri::package
