#pragma once

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace ryuri {
namespace xml {

// XML 转义常量：集中提供实体字面量
struct XMLEscapes {
    inline static constexpr char AMP[]  = "&amp;";
    inline static constexpr char LT[]   = "&lt;";
    inline static constexpr char GT[]   = "&gt;";
    inline static constexpr char QUOT[] = "&quot;";
    inline static constexpr char NL[]   = "&#10;";   // 属性值中的换行
};

/**
 * @brief 转义文本节点内容（& < >）
 */
inline void appendEscapedText(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '&': out += XMLEscapes::AMP; break;
            case '<': out += XMLEscapes::LT; break;
            case '>': out += XMLEscapes::GT; break;
            default: out.push_back(c); break;
        }
    }
}

/**
 * @brief 转义双引号包围的属性值
 */
inline void appendEscapedAttribute(std::string& out, std::string_view value) {
    for (char c : value) {
        switch (c) {
            case '&': out += XMLEscapes::AMP; break;
            case '<': out += XMLEscapes::LT; break;
            case '>': out += XMLEscapes::GT; break;
            case '"': out += XMLEscapes::QUOT; break;
            case '\n': out += XMLEscapes::NL; break;
            default: out.push_back(c); break;
        }
    }
}

/**
 * @brief 常见 HTML 命名实体到 UTF-8 的映射，未知实体返回 nullptr
 */
inline const char* htmlEntityUtf8(const char* name) {
    struct Entity { const char* name; const char* utf8; };
    static constexpr Entity kEntities[] = {
        {"nbsp", "\xC2\xA0"},
        {"copy", "\xC2\xA9"},
        {"reg", "\xC2\xAE"},
        {"middot", "\xC2\xB7"},
        {"laquo", "\xC2\xAB"},
        {"raquo", "\xC2\xBB"},
        {"ensp", "\xE2\x80\x82"},
        {"emsp", "\xE2\x80\x83"},
        {"thinsp", "\xE2\x80\x89"},
        {"zwnj", "\xE2\x80\x8C"},
        {"zwj", "\xE2\x80\x8D"},
        {"ndash", "\xE2\x80\x93"},
        {"mdash", "\xE2\x80\x94"},
        {"lsquo", "\xE2\x80\x98"},
        {"rsquo", "\xE2\x80\x99"},
        {"ldquo", "\xE2\x80\x9C"},
        {"rdquo", "\xE2\x80\x9D"},
        {"bull", "\xE2\x80\xA2"},
        {"hellip", "\xE2\x80\xA6"},
        {"times", "\xC3\x97"},
    };
    if (!name) return nullptr;
    for (const auto& e : kEntities) {
        if (std::strcmp(e.name, name) == 0) {
            return e.utf8;
        }
    }
    return nullptr;
}

}} // namespace ryuri::xml
