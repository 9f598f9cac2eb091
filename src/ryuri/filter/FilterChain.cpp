#include "ryuri/filter/FilterChain.hpp"
#include "ryuri/core/ExceptionBridge.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <unordered_set>

namespace ryuri {
namespace filter {

core::Result<FilterChain> FilterChain::build(const std::vector<FilterSpec>& specs,
                                             const FilterRegistry& registry) {
    FilterChain chain;
    std::unordered_set<std::string> seen;
    for (const auto& spec : specs) {
        if (!seen.insert(spec.name).second) {
            FILTER_ERROR("Duplicate filter '{}' in chain", spec.name);
            return core::makeError(core::ErrorCode::InvalidArgument,
                                   "Duplicate filter '" + spec.name + "'", spec.name);
        }
        auto created = registry.create(spec);
        if (!created) {
            FILTER_ERROR("Cannot build filter '{}': {}", spec.name, created.error().message);
            return created.error();
        }
        chain.filters_.push_back(std::move(created).value());
    }
    FILTER_DEBUG("Built filter chain with {} filters", chain.filters_.size());
    return core::Result<FilterChain>(std::move(chain));
}

core::VoidResult FilterChain::append(std::unique_ptr<IFilter> filter) {
    if (!filter) {
        return core::makeError(core::ErrorCode::InvalidArgument, "Null filter");
    }
    for (const auto& existing : filters_) {
        if (std::string(existing->name()) == filter->name()) {
            return core::makeError(core::ErrorCode::InvalidArgument,
                                   std::string("Duplicate filter '") + filter->name() + "'", filter->name());
        }
    }
    filters_.push_back(std::move(filter));
    return core::ok();
}

std::vector<std::string> FilterChain::names() const {
    std::vector<std::string> result;
    result.reserve(filters_.size());
    for (const auto& filter : filters_) {
        result.push_back(filter->name());
    }
    return result;
}

core::VoidResult FilterChain::run(store::PackageStore& store, cache::DocumentCache& cache,
                                  std::optional<Deadline> deadline) {
    FilterContext context(store, cache);
    for (const auto& filter : filters_) {
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            FILTER_WARN("Deadline expired before filter '{}'", filter->name());
            return core::makeError(core::ErrorCode::Timeout, "Deadline expired before filter ran",
                                   filter->name());
        }

        FILTER_DEBUG("Running filter '{}'", filter->name());
        core::VoidResult result = core::ExceptionBridge::wrapVoidCall([&]() { filter->apply(context); });
        if (!result) {
            const core::Error wrapped = core::makeFilterFailure(filter->name(), result.error());
            FILTER_ERROR("Filter '{}' failed: {}", filter->name(), result.error().fullMessage());
            return wrapped;
        }
        // 过滤器可能改写了 OPF
        context.reloadLayout();
        package::PackageLayout::refreshManifestOrder(cache, store);
        if (!retain_documents_) {
            cache.clear();
        }
    }
    return core::ok();
}

}} // namespace ryuri::filter
