#pragma once

#include "ryuri/filter/Filter.hpp"
#include <string>

namespace ryuri {
namespace filter {

/**
 * @brief 元数据规范化
 *
 * 折叠 dc:* 文本空白，删除空元素与重复元素，规范语言标签，
 * 并保证存在书名与唯一标识符。
 */
class MetadataNormalizeFilter : public IFilter {
public:
    static constexpr const char* kName = "metadata-normalize";

    explicit MetadataNormalizeFilter(const FilterOptions& options);

    const char* name() const override { return kName; }

    void apply(FilterContext& context) override;

    /**
     * @brief 规范语言标签：zh_cn → zh-CN，EN-us → en-US，zh-hans-cn → zh-Hans-CN
     */
    static std::string canonicalLanguage(const std::string& tag);

private:
    std::string default_title_;
};

}} // namespace ryuri::filter
