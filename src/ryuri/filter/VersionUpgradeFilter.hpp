#pragma once

#include "ryuri/filter/Filter.hpp"
#include <string>

namespace ryuri {
namespace filter {

/**
 * @brief EPUB 2 → EPUB 3 升级
 *
 * 版本已是 3.x 时不做任何修改，因此重复执行是幂等的。
 */
class VersionUpgradeFilter : public IFilter {
public:
    static constexpr const char* kName = "version-upgrade";

    explicit VersionUpgradeFilter(const FilterOptions& options);

    const char* name() const override { return kName; }

    void apply(FilterContext& context) override;

private:
    void upgradeMetadata(xml::Document& opf);
    void markCoverImage(xml::Document& opf);
    void generateNav(FilterContext& context, xml::Document& opf);

    std::string modified_;  // 固定的 dcterms:modified 值，为空则取当前时间
};

}} // namespace ryuri::filter
