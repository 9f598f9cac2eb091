#include "ryuri/config/ConfigLayer.hpp"
#include "ryuri/core/ExceptionBridge.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"

namespace ryuri {
namespace config {

using utils::StringUtils;

const std::string* ConfigLayer::find(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

void ConfigLayer::overlay(const ConfigLayer& other) {
    for (const auto& entry : other.values_) {
        values_[entry.first] = entry.second;
    }
}

core::Result<ConfigLayer> ConfigLayer::parseIni(const std::string& text, const std::string& source) {
    ConfigLayer layer;
    std::string section;
    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        const std::string line = StringUtils::trim(text.substr(pos, end - pos));
        pos = end + 1;
        ++line_no;

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        const std::string where = fmt::format("{}:{}", source, line_no);
        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return core::makeError(core::ErrorCode::InvalidArgument,
                                       fmt::format("Malformed section header '{}'", line), where);
            }
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }
        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return core::makeError(core::ErrorCode::InvalidArgument,
                                   fmt::format("Expected 'key = value', got '{}'", line), where);
        }
        const std::string key = StringUtils::trim(line.substr(0, eq));
        if (key.empty()) {
            return core::makeError(core::ErrorCode::InvalidArgument, "Empty configuration key", where);
        }
        layer.set(section.empty() ? key : section + "." + key, StringUtils::trim(line.substr(eq + 1)));
    }
    return core::Result<ConfigLayer>(std::move(layer));
}

core::Result<ConfigLayer> ConfigLayer::fromFile(const core::Path& path) {
    auto bytes = core::ExceptionBridge::wrapCall([&]() { return path.readAll(); });
    if (!bytes) {
        CORE_ERROR("Cannot read configuration {}: {}", path.string(), bytes.error().message);
        return bytes.error();
    }
    return parseIni(std::string(bytes.value().begin(), bytes.value().end()), path.string());
}

ConfigLayer defaultLayer() {
    return ConfigLayer{
        {"sanitizer.filters", "structural-repair,version-upgrade,privacy-scrub"},
        {"sanitizer.threads", "4"},
        {"sanitizer.xml_cache", "true"},
        {"sanitizer.correct_mime", "true"},
        {"sanitizer.compress", "6"},
        {"cleaner.platform", "generic"},
        {"encryptor.algorithm", "basic"},
        {"encryptor.extensions", "ttf,otf,woff,woff2,jpg,jpeg,png,gif,svg,webp"},
        {"log.level", "info"},
    };
}

}} // namespace ryuri::config
