#pragma once

#include <string>

namespace ryuri {
namespace store {

/**
 * @brief 条目内容类别（由扩展名决定）
 */
enum class ContentFlag {
    Binary,
    Text,
    Markup
};

const char* toString(ContentFlag flag) noexcept;

/**
 * @brief 包内条目路径工具
 *
 * 条目路径为 POSIX 风格、区分大小写、以 '/' 分隔的相对路径，
 * 不允许空段、"." 与 ".." 段以及反斜杠。
 */
class EntryPath {
public:
    /**
     * @brief 校验条目路径
     * @throws core::ParameterException(InvalidArgument)
     */
    static void validate(const std::string& path);

    static bool isValid(const std::string& path) noexcept;

    static ContentFlag contentFlag(const std::string& path);

    /**
     * @brief 小写扩展名（不含点），无扩展名返回空串
     */
    static std::string extension(const std::string& path);

    static std::string directory(const std::string& path);
    static std::string fileName(const std::string& path);
    static std::string stem(const std::string& path);
};

}} // namespace ryuri::store
