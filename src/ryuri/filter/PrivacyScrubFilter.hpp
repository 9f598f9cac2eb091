#pragma once

#include "ryuri/filter/Filter.hpp"
#include <string>

namespace ryuri {
namespace filter {

/**
 * @brief 隐私清理
 *
 * 删除阅读器写入的状态条目（calibre 书签、iTunes 元数据、Adobe/Kobo/多看状态、
 * 系统垃圾文件）与 calibre 阅读状态 meta，并移除对应清单项。
 */
class PrivacyScrubFilter : public IFilter {
public:
    static constexpr const char* kName = "privacy-scrub";

    explicit PrivacyScrubFilter(const FilterOptions& options);

    const char* name() const override { return kName; }

    void apply(FilterContext& context) override;

    /**
     * @brief 条目是否属于阅读器状态或系统垃圾
     */
    static bool isReaderState(const std::string& path);

    /**
     * @brief meta 名称是否属于 calibre 阅读状态
     */
    static bool isReaderStateMeta(const std::string& name);

private:
    bool scrub_metadata_;
};

}} // namespace ryuri::filter
