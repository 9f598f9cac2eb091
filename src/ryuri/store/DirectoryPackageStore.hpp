#pragma once

#include "ryuri/store/PackageStore.hpp"
#include "ryuri/core/Path.hpp"
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace ryuri {
namespace store {

/**
 * @brief 目录存储
 *
 * 条目按需从基目录读取，写入与删除直接落盘。
 * 打开时扫描得到的条目按路径排序，之后新增的条目追加在末尾。
 */
class DirectoryPackageStore : public PackageStore {
public:
    /**
     * @throws core::PackageException(IOFailure) 基目录不存在或不可读
     */
    static std::unique_ptr<DirectoryPackageStore> open(const core::Path& base_dir);

    /**
     * @brief 在（可能不存在的）目录上创建空存储
     * @throws core::PackageException(IOFailure) 目录无法创建
     */
    static std::unique_ptr<DirectoryPackageStore> create(const core::Path& base_dir);

    const core::Path& baseDirectory() const { return base_dir_; }

    EntryAttributes attributes(const std::string& path) const override;

    const char* backendName() const override { return "directory"; }

protected:
    std::vector<uint8_t> doGet(const std::string& path) const override;
    void doPut(const std::string& path, std::vector<uint8_t> data) override;
    void doRemove(const std::string& path) override;
    bool doExists(const std::string& path) const override;
    const std::vector<std::string>& entryOrder() const override { return order_; }

private:
    explicit DirectoryPackageStore(core::Path base_dir) : base_dir_(std::move(base_dir)) {}

    void scan();

    core::Path base_dir_;
    std::unordered_set<std::string> index_;
    std::vector<std::string> order_;
};

}} // namespace ryuri::store
