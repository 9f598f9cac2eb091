#include "ryuri/filter/FilterRegistry.hpp"
#include "ryuri/core/ExceptionBridge.hpp"
#include "ryuri/filter/MarkupOptimizeFilter.hpp"
#include "ryuri/filter/MetadataNormalizeFilter.hpp"
#include "ryuri/filter/PrivacyScrubFilter.hpp"
#include "ryuri/filter/StructuralRepairFilter.hpp"
#include "ryuri/filter/StyleOptimizeFilter.hpp"
#include "ryuri/filter/VersionUpgradeFilter.hpp"
#include "ryuri/layout/LayoutTransform.hpp"

namespace ryuri {
namespace filter {

void FilterRegistry::registerFilter(const std::string& name, Factory factory) {
    factories_[name] = std::move(factory);
}

bool FilterRegistry::contains(const std::string& name) const {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> FilterRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& entry : factories_) {
        result.push_back(entry.first);
    }
    return result;
}

core::Result<std::unique_ptr<IFilter>> FilterRegistry::create(const FilterSpec& spec) const {
    auto it = factories_.find(spec.name);
    if (it == factories_.end()) {
        return core::makeError(core::ErrorCode::InvalidArgument, "Unknown filter '" + spec.name + "'",
                               spec.name);
    }
    const Factory& factory = it->second;
    return core::ExceptionBridge::wrapCall([&]() { return factory(spec.options); });
}

FilterRegistry FilterRegistry::withBuiltins() {
    FilterRegistry registry;
    registry.registerFilter(StructuralRepairFilter::kName, [](const FilterOptions& options) {
        return std::unique_ptr<IFilter>(new StructuralRepairFilter(options));
    });
    registry.registerFilter(VersionUpgradeFilter::kName, [](const FilterOptions& options) {
        return std::unique_ptr<IFilter>(new VersionUpgradeFilter(options));
    });
    registry.registerFilter(PrivacyScrubFilter::kName, [](const FilterOptions& options) {
        return std::unique_ptr<IFilter>(new PrivacyScrubFilter(options));
    });
    registry.registerFilter(MetadataNormalizeFilter::kName, [](const FilterOptions& options) {
        return std::unique_ptr<IFilter>(new MetadataNormalizeFilter(options));
    });
    registry.registerFilter(StyleOptimizeFilter::kName, [](const FilterOptions& options) {
        return std::unique_ptr<IFilter>(new StyleOptimizeFilter(options));
    });
    registry.registerFilter(MarkupOptimizeFilter::kName, [](const FilterOptions& options) {
        return std::unique_ptr<IFilter>(new MarkupOptimizeFilter(options));
    });
    registry.registerFilter(layout::LayoutTransform::kName, [](const FilterOptions& options) {
        return std::unique_ptr<IFilter>(new layout::LayoutTransform(options));
    });
    return registry;
}

}} // namespace ryuri::filter
