#pragma once

#include "ryuri/cache/DocumentCache.hpp"
#include "ryuri/store/PackageStore.hpp"
#include <string>
#include <vector>

namespace ryuri {
namespace package {

/**
 * @brief OPF 清单项
 */
struct ManifestItem {
    std::string id;
    std::string href;
    std::string path;        // 解析后的包内路径
    std::string media_type;
    std::string properties;

    bool hasProperty(const std::string& property) const;
};

struct SpineItem {
    std::string idref;
    bool linear = true;
};

/**
 * @brief 包结构视图
 *
 * 通过 META-INF/container.xml 定位 OPF，读取清单与阅读顺序。
 * 视图是加载时的快照，OPF 改写后需重新加载。
 */
class PackageLayout {
public:
    /**
     * @brief 定位 OPF 路径：container.xml 的 rootfile，其次第一个 .opf 条目
     * @return 找不到时返回空串
     */
    static std::string locateOpf(cache::DocumentCache& cache);

    /**
     * @throws core::PackageException(NotFound) 包内没有 OPF
     * @throws core::XMLException(MalformedMarkup) OPF 无法解析
     */
    static PackageLayout load(cache::DocumentCache& cache);

    const std::string& opfPath() const { return opf_path_; }
    std::string opfDirectory() const;

    const std::string& version() const { return version_; }
    bool isVersion3() const { return version_.compare(0, 1, "3") == 0; }

    /**
     * @brief unique-identifier 指向的 dc:identifier 文本（去除首尾空白）
     */
    const std::string& uniqueIdentifier() const { return unique_identifier_; }

    const std::vector<ManifestItem>& items() const { return items_; }
    const std::vector<SpineItem>& spine() const { return spine_; }

    const ManifestItem* findById(const std::string& id) const;
    const ManifestItem* findByPath(const std::string& path) const;

    /**
     * @brief 阅读顺序中的文档路径
     */
    std::vector<std::string> spinePaths() const;

    /**
     * @brief 全部 XHTML 文档：先阅读顺序，再其余清单项
     */
    std::vector<std::string> markupPaths() const;

    std::vector<std::string> stylePaths() const;

    /**
     * @brief NCX 路径（spine@toc 或媒体类型），没有则为空串
     */
    std::string ncxPath() const;

    /**
     * @brief EPUB3 导航文档路径（properties 含 nav），没有则为空串
     */
    std::string navPath() const;

    /**
     * @brief 相对 OPF 的 href
     */
    std::string hrefFor(const std::string& path) const;

    /**
     * @brief 清单顺序：mimetype、container、OPF、阅读顺序文档、其余清单项
     */
    std::vector<std::string> manifestOrder() const;

    void applyManifestOrder(store::PackageStore& store) const;

    /**
     * @brief 按当前 OPF 重新设置存储的清单顺序
     *
     * 没有 OPF 或 OPF 无法解析时保留原顺序并返回 false。
     */
    static bool refreshManifestOrder(cache::DocumentCache& cache, store::PackageStore& store);

    /**
     * @brief 在清单中分配一个未被占用的 id
     */
    std::string uniqueId(const std::string& base) const;

    // ========== OPF 树访问 ==========

    static xml::Node* metadataNode(xml::Document& opf);
    static xml::Node* manifestNode(xml::Document& opf);
    static xml::Node* spineNode(xml::Document& opf);

    /**
     * @brief 向 OPF 清单追加条目
     */
    static xml::Node& addManifestItem(xml::Document& opf, const std::string& id, const std::string& href,
                                      const std::string& media_type, const std::string& properties = "");

private:
    std::string opf_path_;
    std::string version_;
    std::string unique_identifier_;
    std::string toc_id_;
    std::vector<ManifestItem> items_;
    std::vector<SpineItem> spine_;
};

}} // namespace ryuri::package
