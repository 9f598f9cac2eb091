#include "ryuri/filter/Filter.hpp"
#include "ryuri/core/Exception.hpp"
#include <algorithm>
#include <cctype>

namespace ryuri {
namespace filter {

const package::PackageLayout& FilterContext::layout() {
    if (!layout_) {
        layout_ = std::make_unique<package::PackageLayout>(package::PackageLayout::load(cache_));
    }
    return *layout_;
}

bool boolOption(const FilterOptions& options, const std::string& key, bool fallback) {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    RYURI_THROW_PARAM("Invalid boolean value '" + it->second + "'", key);
}

std::string stringOption(const FilterOptions& options, const std::string& key, const std::string& fallback) {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

}} // namespace ryuri::filter
