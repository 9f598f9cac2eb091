#pragma once

#include "ryuri/store/PackageStore.hpp"
#include "ryuri/core/Path.hpp"
#include <cstdint>
#include <vector>

namespace ryuri {
namespace store {

/**
 * @brief 包导出（构造的结构逆操作）
 *
 * - mimetype 总是第一个条目，STORE 方式，内容固定为 application/epub+zip，缺失时重新生成
 * - 未改写的归档条目沿用原压缩方式与时间戳
 * - 其余条目使用固定时间戳
 */
class PackageExporter {
public:
    explicit PackageExporter(int compression_level = 6) : compression_level_(compression_level) {}

    /**
     * @throws core::PackageException(IOFailure) 归档写入失败
     */
    std::vector<uint8_t> toArchive(const PackageStore& store) const;

    void toArchiveFile(const PackageStore& store, const core::Path& target) const;

    /**
     * @brief 导出为目录树
     */
    void toDirectory(const PackageStore& store, const core::Path& target_dir) const;

private:
    int compression_level_;
};

}} // namespace ryuri::store
