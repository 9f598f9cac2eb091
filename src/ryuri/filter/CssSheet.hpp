#pragma once

#include <string>
#include <vector>

namespace ryuri {
namespace filter {

struct CssDeclaration {
    std::string property;
    std::string value;
    bool important = false;
};

/**
 * @brief 样式表条目
 *
 * - Rule：普通规则，prelude 为选择器列表
 * - AtStatement：无块 at 规则（@import、@charset），prelude 为整条语句（不含分号）
 * - AtBlock：带块 at 规则。@media/@supports 等的子规则在 children 中，
 *   @font-face/@page 等的声明在 declarations 中
 */
struct CssItem {
    enum class Kind {
        Rule,
        AtStatement,
        AtBlock
    };

    Kind kind = Kind::Rule;
    std::string prelude;
    std::vector<CssDeclaration> declarations;
    std::vector<CssItem> children;
    bool nested = false;  // AtBlock 是否包含子规则

    /**
     * @brief at 规则名（小写，不含 @）
     */
    std::string atKeyword() const;
};

/**
 * @brief 简单 CSS 解析器与序列化器
 *
 * 容错解析：注释被丢弃，未闭合的块取到文件末尾。
 */
class CssSheet {
public:
    static CssSheet parse(const std::string& text);

    /**
     * @brief 解析声明块内容（也用于 style 属性）
     */
    static std::vector<CssDeclaration> parseDeclarations(const std::string& text);

    static std::string serializeDeclarations(const std::vector<CssDeclaration>& declarations);

    /**
     * @brief 拆分选择器列表（忽略括号与字符串内的逗号）
     */
    static std::vector<std::string> splitSelectors(const std::string& prelude);

    /**
     * @brief 拆分 font-family 值为族名列表（去除引号）
     */
    static std::vector<std::string> splitFontFamilies(const std::string& value);

    std::string serialize() const;

    std::vector<CssItem>& items() { return items_; }
    const std::vector<CssItem>& items() const { return items_; }

private:
    std::vector<CssItem> items_;
};

}} // namespace ryuri::filter
