#pragma once

#include "ryuri/config/ConfigLayer.hpp"
#include "ryuri/core/Expected.hpp"
#include "ryuri/filter/Filter.hpp"
#include "ryuri/layout/LayoutTransform.hpp"
#include "ryuri/protect/ProtectionCodec.hpp"
#include "ryuri/utils/Logger.hpp"
#include <string>
#include <vector>

namespace ryuri {
namespace config {

/**
 * @brief 合并并校验后的只读配置
 *
 * 只能由 resolveConfig 构建，之后不可修改。
 */
class ResolvedConfig {
public:
    const std::vector<filter::FilterSpec>& filters() const { return filters_; }
    size_t threads() const { return threads_; }
    bool xmlCache() const { return xml_cache_; }
    bool correctMime() const { return correct_mime_; }
    int compressionLevel() const { return compression_level_; }
    layout::Platform platform() const { return platform_; }
    const protect::ProtectionOptions& protection() const { return protection_; }
    Logger::Level logLevel() const { return log_level_; }

    /**
     * @brief 合并后的原始键值（含未识别的键）
     */
    const ConfigLayer& merged() const { return merged_; }

private:
    friend core::Result<ResolvedConfig> resolveConfig(const ConfigLayer&, const ConfigLayer&, const ConfigLayer&);

    ResolvedConfig() = default;

    std::vector<filter::FilterSpec> filters_;
    size_t threads_ = 4;
    bool xml_cache_ = true;
    bool correct_mime_ = true;
    int compression_level_ = 6;
    layout::Platform platform_ = layout::Platform::Generic;
    protect::ProtectionOptions protection_;
    Logger::Level log_level_ = Logger::Level::INFO;
    ConfigLayer merged_;
};

/**
 * @brief 按 defaults < file < overrides 合并三层配置并校验
 *
 * 过滤器选项来源：sanitizer.correct_mime → structural-repair 的 correct_mime，
 * cleaner.platform → layout 的 platform，以及任意 "filter.<名称>.<选项>" 键。
 *
 * @return 值不合法时返回 InvalidArgument（context 为键名）
 */
core::Result<ResolvedConfig> resolveConfig(const ConfigLayer& defaults,
                                           const ConfigLayer& file,
                                           const ConfigLayer& overrides);

/**
 * @brief 仅用默认层解析
 */
core::Result<ResolvedConfig> resolveDefaultConfig();

}} // namespace ryuri::config
