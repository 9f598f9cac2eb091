#include "ryuri/filter/VersionUpgradeFilter.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/package/MediaTypes.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include "ryuri/utils/TimeUtils.hpp"
#include "ryuri/xml/MarkupUtils.hpp"
#include <unordered_map>
#include <unordered_set>

namespace ryuri {
namespace filter {

namespace {

using utils::StringUtils;

// opf:* 属性到 refines meta 的 property 名
const std::unordered_map<std::string, std::string>& refinedAttributes() {
    static const std::unordered_map<std::string, std::string> kMap = {
        {"opf:role", "role"},
        {"opf:file-as", "file-as"},
        {"opf:scheme", "identifier-type"},
    };
    return kMap;
}

std::string assignId(xml::Node& element, std::unordered_set<std::string>& used) {
    std::string id = element.attributeOr("id");
    if (!id.empty()) {
        return id;
    }
    const std::string base = element.localName();
    for (int i = 1;; ++i) {
        id = fmt::format("{}{:02d}", base, i);
        if (used.insert(id).second) {
            break;
        }
    }
    element.setAttribute("id", id);
    return id;
}

void appendNavPoints(const xml::Node& parent, xml::Node& list, const std::string& ncx_path,
                     const std::string& nav_path) {
    for (xml::Node* point : parent.childElements("navPoint")) {
        std::string label;
        if (xml::Node* nav_label = point->firstChildElement("navLabel")) {
            label = StringUtils::collapseWhitespace(nav_label->textContent());
        }
        std::string href;
        if (xml::Node* content = point->firstChildElement("content")) {
            const std::string src = content->attributeOr("src");
            const std::string target = package::PathUtils::bookPath(src, ncx_path);
            if (!target.empty()) {
                href = package::PathUtils::percentEncode(package::PathUtils::relativePath(nav_path, target));
                const std::string fragment = package::PathUtils::fragment(src);
                if (!fragment.empty()) {
                    href += "#" + fragment;
                }
            }
        }

        xml::Node& li = list.appendChild(xml::Node::element("li"));
        xml::Node::NodePtr anchor = xml::MarkupUtils::textElement("a", label.empty() ? "Untitled" : label);
        anchor->setAttribute("href", href);
        li.appendChild(std::move(anchor));

        if (point->firstChildElement("navPoint")) {
            xml::Node& sub = li.appendChild(xml::Node::element("ol"));
            appendNavPoints(*point, sub, ncx_path, nav_path);
        }
    }
}

} // namespace

VersionUpgradeFilter::VersionUpgradeFilter(const FilterOptions& options)
    : modified_(stringOption(options, "modified", "")) {
}

void VersionUpgradeFilter::apply(FilterContext& context) {
    const package::PackageLayout& layout = context.layout();
    if (layout.isVersion3()) {
        FILTER_DEBUG("Package already at version {}, nothing to upgrade", layout.version());
        return;
    }

    const std::string opf_path = layout.opfPath();
    xml::Document& opf = context.cache().readXml(opf_path);
    FILTER_INFO("Upgrading {} from version '{}' to 3.0", opf_path, layout.version());

    opf.root()->setAttribute("version", "3.0");
    upgradeMetadata(opf);
    markCoverImage(opf);
    generateNav(context, opf);

    context.cache().writeXml(opf_path, opf, cache::SerializationMode::Package);
    context.reloadLayout();
}

void VersionUpgradeFilter::upgradeMetadata(xml::Document& opf) {
    xml::Node* metadata = package::PackageLayout::metadataNode(opf);
    if (!metadata) {
        metadata = &opf.root()->insertChild(0, xml::Node::element("metadata"));
    }

    std::unordered_set<std::string> used_ids;
    for (xml::Node* element : opf.root()->descendants()) {
        const std::string id = element->attributeOr("id");
        if (!id.empty()) {
            used_ids.insert(id);
        }
    }

    // opf:* 属性 → refines meta
    for (xml::Node* element : metadata->childElements()) {
        if (!StringUtils::startsWith(element->name(), "dc:")) {
            continue;
        }
        std::vector<std::pair<std::string, std::string>> refinements;
        std::vector<std::string> to_remove;
        for (const auto& attr : element->attributes()) {
            if (!StringUtils::startsWith(attr.name, "opf:")) {
                continue;
            }
            to_remove.push_back(attr.name);
            auto mapped = refinedAttributes().find(attr.name);
            if (mapped != refinedAttributes().end() && !attr.value.empty()) {
                refinements.emplace_back(mapped->second, attr.value);
            }
        }
        for (const auto& name : to_remove) {
            element->removeAttribute(name);
        }
        if (refinements.empty()) {
            continue;
        }

        const std::string id = assignId(*element, used_ids);
        for (const auto& refinement : refinements) {
            xml::Node::NodePtr meta = xml::MarkupUtils::textElement("meta", refinement.second);
            meta->setAttribute("refines", "#" + id);
            meta->setAttribute("property", refinement.first);
            if (refinement.first == "role") {
                meta->setAttribute("scheme", "marc:relators");
            }
            metadata->appendChild(std::move(meta));
        }
    }

    // dcterms:modified
    const std::string modified = modified_.empty()
        ? utils::TimeUtils::formatTimeISO8601(utils::TimeUtils::getCurrentUTCTime())
        : modified_;
    xml::Node* existing = metadata->findDescendant([](const xml::Node& node) {
        return node.isElement() && node.localName() == "meta" &&
               node.attributeOr("property") == "dcterms:modified";
    });
    if (existing) {
        existing->setTextContent(modified);
    } else {
        xml::Node::NodePtr meta = xml::MarkupUtils::textElement("meta", modified);
        meta->setAttribute("property", "dcterms:modified");
        metadata->appendChild(std::move(meta));
    }
}

void VersionUpgradeFilter::markCoverImage(xml::Document& opf) {
    xml::Node* metadata = package::PackageLayout::metadataNode(opf);
    xml::Node* manifest = package::PackageLayout::manifestNode(opf);
    if (!metadata || !manifest) {
        return;
    }
    std::string cover_id;
    for (xml::Node* meta : metadata->childElements("meta")) {
        if (meta->attributeOr("name") == "cover") {
            cover_id = meta->attributeOr("content");
            break;
        }
    }
    if (cover_id.empty()) {
        return;
    }
    for (xml::Node* item : manifest->childElements("item")) {
        if (item->attributeOr("id") != cover_id) {
            continue;
        }
        const std::string properties = item->attributeOr("properties");
        if (!StringUtils::hasToken(properties, "cover-image")) {
            item->setAttribute("properties", properties.empty() ? "cover-image" : properties + " cover-image");
        }
        break;
    }
}

void VersionUpgradeFilter::generateNav(FilterContext& context, xml::Document& opf) {
    const package::PackageLayout& layout = context.layout();
    if (!layout.navPath().empty()) {
        return;
    }

    const std::string opf_dir = layout.opfDirectory();
    std::string nav_path = opf_dir.empty() ? "nav.xhtml" : opf_dir + "/nav.xhtml";
    for (int i = 1; context.store().exists(nav_path); ++i) {
        const std::string name = fmt::format("nav-{}.xhtml", i);
        nav_path = opf_dir.empty() ? name : opf_dir + "/" + name;
    }

    xml::Document nav(xml::Node::element("html"));
    xml::Node* html = nav.root();
    html->setAttribute("xmlns", core::EpubConstants::kXhtmlNamespace);
    html->setAttribute("xmlns:epub", core::EpubConstants::kOpsNamespace);
    xml::Node& head = html->appendChild(xml::Node::element("head"));
    head.appendChild(xml::MarkupUtils::textElement("title", "Table of Contents"));
    xml::Node& body = html->appendChild(xml::Node::element("body"));
    xml::Node& toc = body.appendChild(xml::Node::element("nav"));
    toc.setAttribute("epub:type", "toc");
    toc.setAttribute("id", "toc");
    toc.appendChild(xml::MarkupUtils::textElement("h1", "Table of Contents"));
    xml::Node& list = toc.appendChild(xml::Node::element("ol"));

    const std::string ncx_path = layout.ncxPath();
    bool from_ncx = false;
    if (!ncx_path.empty() && context.store().exists(ncx_path)) {
        xml::Document& ncx = context.cache().readXml(ncx_path);
        if (xml::Node* nav_map = ncx.root()->firstChildElement("navMap")) {
            appendNavPoints(*nav_map, list, ncx_path, nav_path);
            from_ncx = !list.children().empty();
        }
    }
    if (!from_ncx) {
        // 没有可用的 NCX，按阅读顺序以章节标题生成目录
        for (const auto& path : layout.spinePaths()) {
            if (!context.store().exists(path)) {
                continue;
            }
            const std::string title = xml::MarkupUtils::extractTitle(context.cache().readXml(path));
            xml::Node& li = list.appendChild(xml::Node::element("li"));
            xml::Node::NodePtr anchor = xml::MarkupUtils::textElement("a", title);
            anchor->setAttribute("href",
                                 package::PathUtils::percentEncode(package::PathUtils::relativePath(nav_path, path)));
            li.appendChild(std::move(anchor));
        }
    }
    if (list.children().empty()) {
        // 空 <ol> 不合法
        list.appendChild(xml::MarkupUtils::textElement("li", "Contents"));
    }

    context.cache().writeXml(nav_path, nav, cache::SerializationMode::Markup);
    package::PackageLayout::addManifestItem(opf, layout.uniqueId("nav"), layout.hrefFor(nav_path),
                                            package::MediaTypes::kXhtml, "nav");
    FILTER_INFO("Generated navigation document {} ({})", nav_path, from_ncx ? "from NCX" : "from spine");
}

}} // namespace ryuri::filter
