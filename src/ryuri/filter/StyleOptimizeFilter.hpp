#pragma once

#include "ryuri/filter/CssSheet.hpp"
#include "ryuri/filter/Filter.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace ryuri {
namespace filter {

/**
 * @brief 标记文档中实际使用的选择器成分
 */
struct SelectorUsage {
    std::unordered_set<std::string> classes;
    std::unordered_set<std::string> ids;
    std::unordered_set<std::string> elements;

    void collect(const xml::Node& root);

    /**
     * @brief 选择器中出现的每个类、id、元素是否都被使用
     */
    bool matches(const std::string& selector) const;
};

/**
 * @brief 样式表优化
 *
 * 删除选择器不匹配任何已用类/id/元素的规则，规范声明
 * （属性名小写、后者覆盖前者），并删除空规则。
 */
class StyleOptimizeFilter : public IFilter {
public:
    static constexpr const char* kName = "style-optimize";

    explicit StyleOptimizeFilter(const FilterOptions& options);

    const char* name() const override { return kName; }

    void apply(FilterContext& context) override;

    /**
     * @brief 属性名小写，同名声明后者覆盖前者（!important 优先）
     */
    static std::vector<CssDeclaration> canonicalize(const std::vector<CssDeclaration>& declarations);

    /**
     * @brief 优化一张样式表
     * @return 删除的规则数
     */
    static size_t optimize(CssSheet& sheet, const SelectorUsage& usage, bool remove_unused);

private:
    bool remove_unused_;
};

}} // namespace ryuri::filter
