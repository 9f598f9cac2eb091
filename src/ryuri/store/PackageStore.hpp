#pragma once

#include "ryuri/store/EntryPath.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <unordered_map>
#include <vector>

namespace ryuri {
namespace store {

/**
 * @brief 导出时使用的条目属性
 */
struct EntryAttributes {
    uint16_t compression_method = 8;  // 0 = STORE, 8 = DEFLATE
    time_t modified_date = 0;
    bool modified = true;             // 自打开后是否被改写
};

/**
 * @brief 包存储接口
 *
 * 以条目路径为键的字节存储。归档实现与目录实现行为一致：
 * 相同的操作、相同的错误分类。
 *
 * 错误约定（异常）：
 * - get/remove 不存在的路径：PackageException(NotFound)
 * - 非法路径：ParameterException(InvalidArgument)
 * - 底层读写失败：PackageException(IOFailure)
 *
 * 单个实例不可跨线程共享，每个批处理任务独占一个存储。
 */
class PackageStore {
public:
    virtual ~PackageStore() = default;

    PackageStore(const PackageStore&) = delete;
    PackageStore& operator=(const PackageStore&) = delete;

    // ========== 条目访问 ==========

    std::vector<uint8_t> get(const std::string& path) const;
    std::string getString(const std::string& path) const;

    /**
     * @brief 写入条目，已存在则静默覆盖；修订号递增
     */
    void put(const std::string& path, std::vector<uint8_t> data);
    void put(const std::string& path, const std::string& text);

    void remove(const std::string& path);

    bool exists(const std::string& path) const;

    /**
     * @brief 有序路径列表：先按清单顺序，其余按插入顺序
     */
    std::vector<std::string> list() const;

    size_t size() const { return entryOrder().size(); }

    /**
     * @brief 条目内容的 SHA-256（小写十六进制）
     */
    std::string contentHash(const std::string& path) const;

    ContentFlag contentFlag(const std::string& path) const { return EntryPath::contentFlag(path); }

    /**
     * @brief 条目修订号，每次 put/remove 递增，从未写过为 0
     */
    uint64_t revision(const std::string& path) const;

    // ========== 清单顺序 ==========

    void setManifestOrder(std::vector<std::string> paths) { manifest_order_ = std::move(paths); }
    const std::vector<std::string>& manifestOrder() const { return manifest_order_; }

    // ========== 导出支持 ==========

    virtual EntryAttributes attributes(const std::string& path) const = 0;

    virtual const char* backendName() const = 0;

protected:
    PackageStore() = default;

    virtual std::vector<uint8_t> doGet(const std::string& path) const = 0;
    virtual void doPut(const std::string& path, std::vector<uint8_t> data) = 0;
    virtual void doRemove(const std::string& path) = 0;
    virtual bool doExists(const std::string& path) const = 0;

    /**
     * @brief 当前条目按插入顺序排列
     */
    virtual const std::vector<std::string>& entryOrder() const = 0;

private:
    std::vector<std::string> manifest_order_;
    std::unordered_map<std::string, uint64_t> revisions_;
};

}} // namespace ryuri::store
