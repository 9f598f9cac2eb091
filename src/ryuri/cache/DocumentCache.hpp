#pragma once

#include "ryuri/store/PackageStore.hpp"
#include "ryuri/xml/Document.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace ryuri {
namespace cache {

/**
 * @brief 文档序列化模式
 */
enum class SerializationMode {
    Package,  // OPF：根元素 package，默认命名空间 OPF
    Markup,   // XHTML：根元素 html，默认命名空间 XHTML，输出 <!DOCTYPE html>
    Generic   // 其它XML（NCX、container、保护清单），保留原 doctype
};

const char* toString(SerializationMode mode) noexcept;

/**
 * @brief 解析文档缓存
 *
 * 包装一个 PackageStore，按路径缓存解析后的文档树。
 * 条目修订号变化后下次读取会重新解析。
 *
 * 同一个存储在生命周期内只应通过一个 DocumentCache 访问结构化文档。
 */
class DocumentCache {
public:
    explicit DocumentCache(store::PackageStore& store) : store_(store) {}

    DocumentCache(const DocumentCache&) = delete;
    DocumentCache& operator=(const DocumentCache&) = delete;

    /**
     * @brief 读取并缓存文档
     * @return 缓存中的文档引用，在 forget/clear 或下次重新解析前有效
     * @throws core::PackageException(NotFound)
     * @throws core::XMLException(MalformedMarkup)
     */
    xml::Document& readXml(const std::string& path);

    /**
     * @brief 序列化、写回存储并以写入的树刷新缓存
     * @throws core::XMLException(SerializationMismatch) 文档不符合模式要求
     */
    void writeXml(const std::string& path, const xml::Document& document, SerializationMode mode);

    /**
     * @brief 按模式序列化文档
     * @param path 仅用于错误信息
     */
    static std::string serialize(const xml::Document& document, SerializationMode mode,
                                 const std::string& path);

    // ========== 缓存管理 ==========

    void forget(const std::string& path);
    void clear();

    bool isCached(const std::string& path) const;
    size_t cachedCount() const { return documents_.size(); }

    // ========== 存储直通 ==========

    void put(const std::string& path, std::vector<uint8_t> data);
    void put(const std::string& path, const std::string& text);
    void remove(const std::string& path);

    store::PackageStore& store() { return store_; }
    const store::PackageStore& store() const { return store_; }

    struct Stats {
        size_t hits = 0;
        size_t parses = 0;
        size_t writes = 0;
    };

    const Stats& getStats() const { return stats_; }

private:
    struct CachedDocument {
        xml::Document document;
        uint64_t revision = 0;
    };

    store::PackageStore& store_;
    std::unordered_map<std::string, CachedDocument> documents_;
    Stats stats_;
};

}} // namespace ryuri::cache
