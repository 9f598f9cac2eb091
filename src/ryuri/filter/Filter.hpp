#pragma once

#include "ryuri/cache/DocumentCache.hpp"
#include "ryuri/package/PackageLayout.hpp"
#include "ryuri/store/PackageStore.hpp"
#include <map>
#include <memory>
#include <string>

namespace ryuri {
namespace filter {

using FilterOptions = std::map<std::string, std::string>;

/**
 * @brief 过滤器名称加已解析的选项
 */
struct FilterSpec {
    std::string name;
    FilterOptions options;

    FilterSpec() = default;
    FilterSpec(std::string n, FilterOptions o = {}) : name(std::move(n)), options(std::move(o)) {}
};

/**
 * @brief 过滤器执行上下文
 *
 * 持有同一个包的存储与文档缓存，包结构视图按需加载。
 * 改写 OPF 后调用 reloadLayout() 使视图失效。
 */
class FilterContext {
public:
    FilterContext(store::PackageStore& store, cache::DocumentCache& cache)
        : store_(store), cache_(cache) {}

    store::PackageStore& store() { return store_; }
    cache::DocumentCache& cache() { return cache_; }

    /**
     * @throws core::PackageException(NotFound) 包内没有 OPF
     */
    const package::PackageLayout& layout();

    void reloadLayout() { layout_.reset(); }

private:
    store::PackageStore& store_;
    cache::DocumentCache& cache_;
    std::unique_ptr<package::PackageLayout> layout_;
};

/**
 * @brief 过滤器接口
 *
 * apply 以异常报告错误（存储层/缓存层异常原样上抛），
 * 由 FilterChain 统一包装为 FilterFailure。
 */
class IFilter {
public:
    virtual ~IFilter() = default;

    virtual const char* name() const = 0;

    virtual void apply(FilterContext& context) = 0;
};

// ========== 选项解析 ==========

/**
 * @brief 读取布尔选项（true/false/1/0/yes/no/on/off）
 * @throws core::ParameterException 值无法识别
 */
bool boolOption(const FilterOptions& options, const std::string& key, bool fallback);

std::string stringOption(const FilterOptions& options, const std::string& key, const std::string& fallback);

}} // namespace ryuri::filter
