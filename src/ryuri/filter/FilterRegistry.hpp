#pragma once

#include "ryuri/filter/Filter.hpp"
#include "ryuri/core/Expected.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ryuri {
namespace filter {

/**
 * @brief 过滤器注册表
 *
 * 名称到工厂的映射，在构建过滤器链时一次性解析。
 * 工厂在选项非法时抛出 ParameterException。
 */
class FilterRegistry {
public:
    using Factory = std::function<std::unique_ptr<IFilter>(const FilterOptions&)>;

    /**
     * @brief 注册过滤器，同名覆盖
     */
    void registerFilter(const std::string& name, Factory factory);

    bool contains(const std::string& name) const;

    std::vector<std::string> names() const;

    /**
     * @brief 按规格创建过滤器
     * @return 未知名称或非法选项时返回 InvalidArgument
     */
    core::Result<std::unique_ptr<IFilter>> create(const FilterSpec& spec) const;

    /**
     * @brief 含全部内置过滤器的注册表
     *
     * structural-repair, version-upgrade, privacy-scrub, metadata-normalize,
     * style-optimize, markup-optimize, layout
     */
    static FilterRegistry withBuiltins();

private:
    std::map<std::string, Factory> factories_;
};

}} // namespace ryuri::filter
