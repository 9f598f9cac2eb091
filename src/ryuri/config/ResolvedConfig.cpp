#include "ryuri/config/ResolvedConfig.hpp"
#include "ryuri/filter/StructuralRepairFilter.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include <cerrno>
#include <cstdlib>

namespace ryuri {
namespace config {

using utils::StringUtils;

namespace {

core::Error invalid(const std::string& key, const std::string& value, const char* expected) {
    return core::makeError(core::ErrorCode::InvalidArgument,
                           fmt::format("Invalid value '{}' (expected {})", value, expected), key);
}

std::string lookup(const ConfigLayer& layer, const std::string& key) {
    const std::string* value = layer.find(key);
    return value ? StringUtils::trim(*value) : std::string();
}

bool parseBool(const std::string& text, bool& out) {
    const std::string lowered = StringUtils::toLower(text);
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        out = true;
    } else if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        out = false;
    } else {
        return false;
    }
    return true;
}

bool parseInt(const std::string& text, long min_value, long max_value, long& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size() || value < min_value || value > max_value) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

core::Result<ResolvedConfig> resolveConfig(const ConfigLayer& defaults,
                                           const ConfigLayer& file,
                                           const ConfigLayer& overrides) {
    ResolvedConfig config;
    config.merged_ = defaults;
    config.merged_.overlay(file);
    config.merged_.overlay(overrides);
    const ConfigLayer& merged = config.merged_;

    long number = 0;
    std::string value = lookup(merged, "sanitizer.threads");
    if (!parseInt(value, 1, 256, number)) {
        return invalid("sanitizer.threads", value, "an integer in 1..256");
    }
    config.threads_ = static_cast<size_t>(number);

    value = lookup(merged, "sanitizer.compress");
    if (!parseInt(value, 0, 9, number)) {
        return invalid("sanitizer.compress", value, "an integer in 0..9");
    }
    config.compression_level_ = static_cast<int>(number);

    value = lookup(merged, "sanitizer.xml_cache");
    if (!parseBool(value, config.xml_cache_)) {
        return invalid("sanitizer.xml_cache", value, "a boolean");
    }
    value = lookup(merged, "sanitizer.correct_mime");
    if (!parseBool(value, config.correct_mime_)) {
        return invalid("sanitizer.correct_mime", value, "a boolean");
    }

    value = lookup(merged, "cleaner.platform");
    if (!layout::parsePlatform(value, config.platform_)) {
        return invalid("cleaner.platform", value, "generic, duokan, zhangyue or kindle");
    }

    value = lookup(merged, "encryptor.algorithm");
    if (value != protect::ProtectionCodec::kAlgorithmBasic) {
        return invalid("encryptor.algorithm", value, "'basic'");
    }
    config.protection_.algorithm = value;
    config.protection_.extensions.clear();
    for (const auto& ext : StringUtils::split(lookup(merged, "encryptor.extensions"), ',')) {
        config.protection_.extensions.push_back(StringUtils::toLower(ext));
    }

    value = lookup(merged, "log.level");
    if (!Logger::parseLevel(value, config.log_level_)) {
        return invalid("log.level", value, "trace, debug, info, warn, error, critical or off");
    }

    // ========== 过滤器链 ==========
    for (const auto& name : StringUtils::split(lookup(merged, "sanitizer.filters"), ',')) {
        filter::FilterSpec spec(name);
        if (name == filter::StructuralRepairFilter::kName) {
            spec.options["correct_mime"] = config.correct_mime_ ? "true" : "false";
        } else if (name == layout::LayoutTransform::kName) {
            spec.options["platform"] = layout::toString(config.platform_);
        }
        const std::string prefix = "filter." + name + ".";
        for (const auto& entry : merged.values()) {
            if (StringUtils::startsWith(entry.first, prefix) && entry.first.size() > prefix.size()) {
                spec.options[entry.first.substr(prefix.size())] = entry.second;
            }
        }
        config.filters_.push_back(std::move(spec));
    }

    CORE_DEBUG("Resolved configuration: {} filters, {} threads, platform {}",
               config.filters_.size(), config.threads_, layout::toString(config.platform_));
    return core::Result<ResolvedConfig>(std::move(config));
}

core::Result<ResolvedConfig> resolveDefaultConfig() {
    return resolveConfig(defaultLayer(), ConfigLayer(), ConfigLayer());
}

}} // namespace ryuri::config
