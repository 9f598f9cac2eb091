#pragma once

#include "ryuri/store/PackageStore.hpp"
#include "ryuri/core/Path.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ryuri {
namespace store {

/**
 * @brief 内存归档存储
 *
 * 构造时把整个归档完全解到内存。未改写的条目保留原压缩方式与时间戳，
 * 导出时按原样写回。
 */
class ArchivePackageStore : public PackageStore {
public:
    /**
     * @brief 空存储
     */
    ArchivePackageStore() = default;

    /**
     * @brief 从归档字节构建
     * @throws core::PackageException(CorruptArchive) 重复条目、中央目录不可读、CRC错误
     */
    static std::unique_ptr<ArchivePackageStore> fromBlob(std::vector<uint8_t> blob);

    /**
     * @throws core::PackageException(IOFailure) 文件不可读
     * @throws core::PackageException(CorruptArchive)
     */
    static std::unique_ptr<ArchivePackageStore> fromFile(const core::Path& path);

    EntryAttributes attributes(const std::string& path) const override;

    const char* backendName() const override { return "archive"; }

protected:
    std::vector<uint8_t> doGet(const std::string& path) const override;
    void doPut(const std::string& path, std::vector<uint8_t> data) override;
    void doRemove(const std::string& path) override;
    bool doExists(const std::string& path) const override;
    const std::vector<std::string>& entryOrder() const override { return order_; }

private:
    struct StoredEntry {
        std::vector<uint8_t> data;
        EntryAttributes attributes;
    };

    std::unordered_map<std::string, StoredEntry> entries_;
    std::vector<std::string> order_;
};

}} // namespace ryuri::store
