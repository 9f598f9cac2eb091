#pragma once

#include "ryuri/filter/Filter.hpp"

namespace ryuri {
namespace filter {

/**
 * @brief 结构修复
 *
 * - 重建缺失或内容错误的 mimetype
 * - 重建缺失或指向失效的 META-INF/container.xml
 * - 删除指向缺失条目的清单项、重复 id、未知或重复的 spine idref
 * - 把未登记的内容条目加入清单
 * - 纠正与扩展名不符的媒体类型（选项 correct_mime，默认开启）
 */
class StructuralRepairFilter : public IFilter {
public:
    static constexpr const char* kName = "structural-repair";

    explicit StructuralRepairFilter(const FilterOptions& options);

    const char* name() const override { return kName; }

    void apply(FilterContext& context) override;

private:
    void repairMimetype(FilterContext& context);
    void repairContainer(FilterContext& context);
    bool repairManifest(FilterContext& context, xml::Document& opf, const std::string& opf_path);

    bool correct_mime_;
};

}} // namespace ryuri::filter
