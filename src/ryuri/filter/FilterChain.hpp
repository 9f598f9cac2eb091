#pragma once

#include "ryuri/filter/FilterRegistry.hpp"
#include "ryuri/core/Expected.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ryuri {
namespace filter {

using Deadline = std::chrono::steady_clock::time_point;

/**
 * @brief 有序过滤器链
 *
 * 构建时解析全部名称，未知或重复名称立即失败。
 * 运行时按顺序执行，第一个失败即终止，已完成的改写保留在存储中。
 */
class FilterChain {
public:
    FilterChain() = default;
    FilterChain(FilterChain&&) = default;
    FilterChain& operator=(FilterChain&&) = default;

    FilterChain(const FilterChain&) = delete;
    FilterChain& operator=(const FilterChain&) = delete;

    /**
     * @return 未知名称、重复名称或非法选项时返回 InvalidArgument
     */
    static core::Result<FilterChain> build(const std::vector<FilterSpec>& specs,
                                           const FilterRegistry& registry);

    /**
     * @brief 依次执行全部过滤器
     * @param deadline 可选截止时间，在过滤器之间检查，超时返回 Timeout
     * @return 过滤器失败时返回 FilterFailure{name, cause}
     */
    core::VoidResult run(store::PackageStore& store, cache::DocumentCache& cache,
                         std::optional<Deadline> deadline = std::nullopt);

    /**
     * @brief 追加一个已创建的过滤器
     * @return 名称重复时返回 InvalidArgument
     */
    core::VoidResult append(std::unique_ptr<IFilter> filter);

    /**
     * @brief 是否在过滤器之间保留已解析的文档（默认保留）；关闭时每个过滤器后清空缓存
     */
    void setRetainDocuments(bool retain) { retain_documents_ = retain; }
    bool retainDocuments() const { return retain_documents_; }

    size_t size() const { return filters_.size(); }
    bool empty() const { return filters_.empty(); }

    std::vector<std::string> names() const;

private:
    std::vector<std::unique_ptr<IFilter>> filters_;
    bool retain_documents_ = true;
};

}} // namespace ryuri::filter
