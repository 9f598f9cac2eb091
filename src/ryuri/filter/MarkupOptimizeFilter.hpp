#pragma once

#include "ryuri/filter/Filter.hpp"

namespace ryuri {
namespace filter {

/**
 * @brief 正文标记清理
 *
 * 展开无属性的 span，删除空的 class/style 属性，补全 head/title、
 * XHTML 默认命名空间以及 epub 前缀声明。
 */
class MarkupOptimizeFilter : public IFilter {
public:
    static constexpr const char* kName = "markup-optimize";

    explicit MarkupOptimizeFilter(const FilterOptions& options);

    const char* name() const override { return kName; }

    void apply(FilterContext& context) override;

    /**
     * @brief 就地清理一个文档
     * @return 展开的 span 数
     */
    size_t optimize(xml::Document& document) const;

private:
    bool unwrap_spans_;
};

}} // namespace ryuri::filter
