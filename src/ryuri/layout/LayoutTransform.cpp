#include "ryuri/layout/LayoutTransform.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/filter/CssSheet.hpp"
#include "ryuri/layout/FontFallbacks.hpp"
#include "ryuri/layout/StandardStructure.hpp"
#include "ryuri/layout/TrackingSpans.hpp"
#include "ryuri/package/MediaTypes.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/store/EntryPath.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include "ryuri/xml/MarkupUtils.hpp"
#include <algorithm>
#include <map>
#include <unordered_set>

namespace ryuri {
namespace layout {

using filter::CssSheet;
using package::PackageLayout;
using package::PathUtils;
using utils::StringUtils;
using xml::MarkupUtils;
using xml::Node;

namespace {

const char* const kNoteIconSvg =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"24\" height=\"24\" viewBox=\"0 0 24 24\">\n"
    "  <circle cx=\"12\" cy=\"12\" r=\"11\" fill=\"#c8553d\"/>\n"
    "  <path d=\"M11 6h2v8h-2zM11 16h2v2h-2z\" fill=\"#ffffff\"/>\n"
    "</svg>\n";

const char* const kBaseSheet =
    "html, body {\n"
    "  margin: 0;\n"
    "  padding: 0;\n"
    "  text-align: justify;\n"
    "}\n"
    "p {\n"
    "  text-indent: 2em;\n"
    "  margin: 1em 0;\n"
    "  line-height: 1.8em;\n"
    "  text-align: justify;\n"
    "  text-justify: inter-ideograph;\n"
    "  word-break: break-all;\n"
    "}\n"
    "h1, h2, h3, h4 {\n"
    "  text-indent: 0;\n"
    "  font-weight: normal;\n"
    "  line-height: 1.8;\n"
    "  color: #2e5b60;\n"
    "}\n"
    "h1 {\n"
    "  font-family: \"hywfs\", \"kt\";\n"
    "  font-size: 1.3em;\n"
    "  margin: 0 0 1.5em 0;\n"
    "}\n"
    "h2 {\n"
    "  font-family: \"fzqys\", \"kt\";\n"
    "  font-size: 1.2em;\n"
    "  text-align: center;\n"
    "}\n"
    "h3, h4 {\n"
    "  font-family: \"fs2\", \"kt\";\n"
    "  font-size: 1.05em;\n"
    "}\n"
    "blockquote {\n"
    "  margin: 1.4em 0 1.4em 1em;\n"
    "  font-family: \"fs\";\n"
    "  color: #412938;\n"
    "}\n"
    ".center {\n"
    "  text-align: center !important;\n"
    "  text-indent: 0;\n"
    "}\n"
    ".right {\n"
    "  text-align: right !important;\n"
    "}\n"
    ".kt {\n"
    "  font-family: \"kt\";\n"
    "}\n"
    ".fs {\n"
    "  font-family: \"fs\";\n"
    "}\n"
    "hr {\n"
    "  height: 1px;\n"
    "  margin: 0.9em 0;\n"
    "  border-style: none;\n"
    "  border-top: 1px dotted gray;\n"
    "}\n"
    "a {\n"
    "  color: black;\n"
    "}\n"
    ".footnote-icon img {\n"
    "  width: 0.65em;\n"
    "}\n"
    "aside {\n"
    "  font-size: 0.95em;\n"
    "  line-height: 1.8em;\n"
    "  font-family: \"kt\";\n"
    "}\n";

const char* const kStyleHacks = "div#book-inner { margin-top: 0; margin-bottom: 0; }";

const char* const kNcxDoctype =
    "<!DOCTYPE ncx PUBLIC \"-//NISO//DTD ncx 2005-1//EN\" \"http://www.daisy.org/z3986/2005/ncx-2005-1.dtd\">";

std::string joinPath(const std::string& directory, const std::string& name) {
    return directory.empty() ? name : directory + "/" + name;
}

std::string quoted(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void collectFromDeclarations(const std::vector<filter::CssDeclaration>& declarations,
                             std::vector<std::string>& families, std::unordered_set<std::string>& seen) {
    for (const auto& decl : declarations) {
        if (StringUtils::toLower(decl.property) != "font-family") {
            continue;
        }
        for (const auto& family : CssSheet::splitFontFamilies(decl.value)) {
            if (family.empty() || FontFallbacks::isGenericFamily(family)) {
                continue;
            }
            if (seen.insert(StringUtils::toLower(family)).second) {
                families.push_back(family);
            }
        }
    }
}

void collectFromItems(const std::vector<filter::CssItem>& items,
                      std::vector<std::string>& families, std::unordered_set<std::string>& seen) {
    for (const auto& item : items) {
        if (item.kind == filter::CssItem::Kind::AtBlock) {
            if (item.nested) {
                collectFromItems(item.children, families, seen);
            }
            // @font-face 中的 font-family 是声明而非引用
            continue;
        }
        if (item.kind == filter::CssItem::Kind::Rule) {
            collectFromDeclarations(item.declarations, families, seen);
        }
    }
}

bool isNoteReference(const Node& node) {
    return node.isElement() && node.localName() == "a" &&
           StringUtils::hasToken(node.attributeOr("epub:type"), "noteref") &&
           StringUtils::startsWith(node.attributeOr("href"), "#");
}

bool isAncestorOf(const Node& candidate, const Node& node) {
    for (const Node* p = node.parent(); p; p = p->parent()) {
        if (p == &candidate) {
            return true;
        }
    }
    return false;
}

// 脚注插入点：锚点所在的最近块元素，找不到时取 body 的直接子元素
Node* enclosingBlock(Node& anchor) {
    Node* fallback = nullptr;
    for (Node* p = anchor.parent(); p && p->parent(); p = p->parent()) {
        if (TrackingSpans::isEligibleBlock(p->localName())) {
            return p;
        }
        if (p->parent()->localName() == "body") {
            fallback = p;
        }
    }
    return fallback ? fallback : &anchor;
}

Node& ensureHead(xml::Document& document) {
    if (Node* head = MarkupUtils::head(document)) {
        return *head;
    }
    return document.root()->insertChild(0, Node::element("head"));
}

bool linkStylesheet(xml::Document& document, const std::string& doc_path, const std::string& sheet_path) {
    const std::string href = PathUtils::percentEncode(PathUtils::relativePath(doc_path, sheet_path));
    Node& head = ensureHead(document);
    for (const Node* link : head.childElements("link")) {
        if (link->attributeOr("href") == href) {
            return false;
        }
    }
    Node& link = head.appendChild(Node::element("link"));
    link.setAttribute("href", href);
    link.setAttribute("rel", "stylesheet");
    link.setAttribute("type", "text/css");
    return true;
}

} // namespace

const char* toString(Platform platform) noexcept {
    switch (platform) {
        case Platform::Generic:  return "generic";
        case Platform::Duokan:   return "duokan";
        case Platform::Zhangyue: return "zhangyue";
        case Platform::Kindle:   return "kindle";
    }
    return "generic";
}

bool parsePlatform(const std::string& name, Platform& out) {
    const std::string lowered = StringUtils::toLower(StringUtils::trim(name));
    if (lowered == "generic") out = Platform::Generic;
    else if (lowered == "duokan") out = Platform::Duokan;
    else if (lowered == "zhangyue") out = Platform::Zhangyue;
    else if (lowered == "kindle") out = Platform::Kindle;
    else return false;
    return true;
}

LayoutTransform::LayoutTransform(const filter::FilterOptions& options) {
    const std::string name = filter::stringOption(options, "platform", "generic");
    if (!parsePlatform(name, platform_)) {
        RYURI_THROW_PARAM(fmt::format("Unknown layout platform '{}'", name), "platform");
    }
    const bool standard = filter::boolOption(options, "standard", false);
    restructure_ = filter::boolOption(options, "restructure", standard);
    base_css_ = filter::boolOption(options, "base_css", standard);
    wrap_chapters_ = filter::boolOption(options, "wrap_chapters", standard);
    ncx_ = filter::boolOption(options, "ncx", standard);
}

const char* LayoutTransform::footnoteClass() const {
    switch (platform_) {
        case Platform::Duokan:   return "duokan-footnote";
        case Platform::Zhangyue: return "zhangyue-footnote";
        case Platform::Generic:
        case Platform::Kindle:
            break;
    }
    return "noteref";
}

// ========== 字体表 ==========

std::vector<std::string> LayoutTransform::collectFontFamilies(filter::FilterContext& context) {
    const PackageLayout& layout = context.layout();
    const std::string sheet_path = joinPath(layout.opfDirectory(), std::string("Styles/") + kFontSheetName);

    std::vector<std::string> families;
    std::unordered_set<std::string> seen;

    std::vector<std::string> style_paths = layout.stylePaths();
    const std::string base_path = joinPath(layout.opfDirectory(), std::string("Styles/") + kBaseSheetName);
    if (std::find(style_paths.begin(), style_paths.end(), base_path) == style_paths.end()) {
        style_paths.push_back(base_path);
    }
    for (const auto& path : style_paths) {
        if (path == sheet_path || !context.store().exists(path)) {
            continue;
        }
        collectFromItems(CssSheet::parse(context.store().getString(path)).items(), families, seen);
    }
    for (const auto& path : layout.markupPaths()) {
        if (!context.store().exists(path)) {
            continue;
        }
        const xml::Document& document = context.cache().readXml(path);
        for (const Node* element : document.root()->descendants()) {
            if (const std::string* style = element->attribute("style")) {
                collectFromDeclarations(CssSheet::parseDeclarations(*style), families, seen);
            }
        }
    }
    return families;
}

std::string LayoutTransform::buildFontSheet(filter::FilterContext& context, const std::string& sheet_path) {
    // 包内字体按文件名（不含扩展名）索引，先出现者优先
    std::map<std::string, std::string> embedded;
    for (const auto& path : context.store().list()) {
        if (package::MediaTypes::isFont(package::MediaTypes::forPath(path))) {
            embedded.emplace(StringUtils::toLower(store::EntryPath::stem(path)), path);
        }
    }

    filter::CssSheet sheet;
    for (const auto& family : collectFontFamilies(context)) {
        std::vector<std::string> sources;
        auto font = embedded.find(StringUtils::toLower(family));
        if (font != embedded.end()) {
            sources.push_back("url(" + quoted(PathUtils::percentEncode(
                                           PathUtils::relativePath(sheet_path, font->second))) + ")");
        }
        if (const auto* fallbacks = FontFallbacks::find(family)) {
            for (const auto& local : *fallbacks) {
                sources.push_back("local(" + quoted(local) + ")");
            }
        }
        if (sources.empty()) {
            LAYOUT_DEBUG("No font source for family '{}'", family);
            continue;
        }

        std::string src;
        for (const auto& source : sources) {
            if (!src.empty()) src += ", ";
            src += source;
        }
        filter::CssItem rule;
        rule.kind = filter::CssItem::Kind::AtBlock;
        rule.prelude = "@font-face";
        rule.declarations.push_back({"font-family", quoted(family), false});
        rule.declarations.push_back({"src", src, false});
        sheet.items().push_back(std::move(rule));
    }
    return sheet.items().empty() ? std::string() : sheet.serialize();
}

void LayoutTransform::writeFontSheet(filter::FilterContext& context, xml::Document& opf, bool& opf_changed) {
    const PackageLayout& layout = context.layout();
    const std::string sheet_path = joinPath(layout.opfDirectory(), std::string("Styles/") + kFontSheetName);
    const std::string content = buildFontSheet(context, sheet_path);
    if (content.empty()) {
        return;
    }

    context.cache().put(sheet_path, content);
    if (!layout.findByPath(sheet_path)) {
        PackageLayout::addManifestItem(opf, layout.uniqueId("fonts-css"), layout.hrefFor(sheet_path),
                                       package::MediaTypes::kCss);
        opf_changed = true;
    }

    for (const auto& path : layout.markupPaths()) {
        if (!context.store().exists(path)) {
            continue;
        }
        xml::Document& document = context.cache().readXml(path);
        if (document.root()->localName() == "html" && linkStylesheet(document, path, sheet_path)) {
            context.cache().writeXml(path, document, cache::SerializationMode::Markup);
        }
    }
    LAYOUT_INFO("Wrote font sheet {}", sheet_path);
}

// ========== 基础样式与章节外框 ==========

const char* LayoutTransform::baseSheet() {
    return kBaseSheet;
}

void LayoutTransform::writeBaseSheet(filter::FilterContext& context, xml::Document& opf, bool& opf_changed) const {
    const PackageLayout& layout = context.layout();
    const std::string sheet_path = joinPath(layout.opfDirectory(), std::string("Styles/") + kBaseSheetName);
    if (!context.store().exists(sheet_path) || context.store().getString(sheet_path) != kBaseSheet) {
        context.cache().put(sheet_path, std::string(kBaseSheet));
    }
    if (!layout.findByPath(sheet_path)) {
        PackageLayout::addManifestItem(opf, layout.uniqueId("base-css"), layout.hrefFor(sheet_path),
                                       package::MediaTypes::kCss);
        opf_changed = true;
    }

    for (const auto& path : layout.markupPaths()) {
        if (!context.store().exists(path)) {
            continue;
        }
        xml::Document& document = context.cache().readXml(path);
        if (document.root()->localName() == "html" && linkStylesheet(document, path, sheet_path)) {
            context.cache().writeXml(path, document, cache::SerializationMode::Markup);
        }
    }
    LAYOUT_INFO("Wrote base sheet {}", sheet_path);
}

bool LayoutTransform::wrapChapter(xml::Document& document) {
    Node* body = MarkupUtils::body(document);
    if (!body || MarkupUtils::findById(*body, "book-columns")) {
        return false;
    }

    Node::NodePtr columns = Node::element("div");
    columns->setAttribute("id", "book-columns");
    Node& inner = columns->appendChild(Node::element("div"));
    inner.setAttribute("id", "book-inner");
    while (!body->children().empty()) {
        inner.appendChild(body->removeChild(0));
    }
    body->appendChild(std::move(columns));

    Node& head = ensureHead(document);
    for (const Node* style : head.childElements("style")) {
        if (MarkupUtils::hasClass(*style, "kobostylehacks")) {
            return true;
        }
    }
    Node& style = head.appendChild(Node::element("style"));
    style.setAttribute("type", "text/css");
    style.setAttribute("class", "kobostylehacks");
    style.appendChild(Node::text(kStyleHacks));
    return true;
}

// ========== NCX ==========

xml::Document LayoutTransform::buildNcx(filter::FilterContext& context, const std::string& ncx_path) {
    const PackageLayout& layout = context.layout();
    xml::Document& opf = context.cache().readXml(layout.opfPath());

    std::string title;
    if (Node* metadata = PackageLayout::metadataNode(opf)) {
        if (Node* element = metadata->firstChildElement("title")) {
            title = StringUtils::collapseWhitespace(element->textContent());
        }
    }

    Node::NodePtr root = Node::element("ncx");
    root->setAttribute("xmlns", core::EpubConstants::kNcxNamespace);
    root->setAttribute("version", "2005-1");

    Node& head = root->appendChild(Node::element("head"));
    const std::pair<const char*, std::string> metas[] = {
        {"dtb:uid", layout.uniqueIdentifier()},
        {"dtb:depth", "1"},
        {"dtb:totalPageCount", "0"},
        {"dtb:maxPageNumber", "0"},
    };
    for (const auto& entry : metas) {
        Node& meta = head.appendChild(Node::element("meta"));
        meta.setAttribute("name", entry.first);
        meta.setAttribute("content", entry.second);
    }

    Node& doc_title = root->appendChild(Node::element("docTitle"));
    doc_title.appendChild(MarkupUtils::textElement("text", title));

    Node& nav_map = root->appendChild(Node::element("navMap"));
    int order = 0;
    for (const auto& path : layout.spinePaths()) {
        const package::ManifestItem* item = layout.findByPath(path);
        if (!item || item->media_type != package::MediaTypes::kXhtml || !context.store().exists(path)) {
            continue;
        }
        const std::string label = MarkupUtils::extractTitle(context.cache().readXml(path));
        const std::string n = std::to_string(++order);

        Node& point = nav_map.appendChild(Node::element("navPoint"));
        point.setAttribute("id", "navPoint-" + n);
        point.setAttribute("playOrder", n);
        Node& nav_label = point.appendChild(Node::element("navLabel"));
        nav_label.appendChild(MarkupUtils::textElement("text", label));
        Node& content = point.appendChild(Node::element("content"));
        content.setAttribute("src", PathUtils::percentEncode(PathUtils::relativePath(ncx_path, path)));
    }

    xml::Document ncx(std::move(root));
    ncx.setHasDeclaration(true);
    ncx.setDoctype(kNcxDoctype);
    return ncx;
}

void LayoutTransform::writeNcx(filter::FilterContext& context, xml::Document& opf, bool& opf_changed) const {
    const PackageLayout& layout = context.layout();
    std::string ncx_path = layout.ncxPath();
    if (ncx_path.empty()) {
        ncx_path = joinPath(layout.opfDirectory(), kNcxName);
    }

    const xml::Document ncx = buildNcx(context, ncx_path);
    context.cache().writeXml(ncx_path, ncx, cache::SerializationMode::Generic);

    std::string id;
    if (const package::ManifestItem* item = layout.findByPath(ncx_path)) {
        id = item->id;
    } else {
        id = layout.uniqueId("ncx");
        PackageLayout::addManifestItem(opf, id, layout.hrefFor(ncx_path), package::MediaTypes::kNcx);
        opf_changed = true;
    }
    Node* spine = PackageLayout::spineNode(opf);
    if (spine && spine->attributeOr("toc") != id) {
        spine->setAttribute("toc", id);
        opf_changed = true;
    }
    LAYOUT_INFO("Rebuilt NCX {}", ncx_path);
}

// ========== 脚注 ==========

size_t LayoutTransform::rewriteFootnotes(xml::Document& document, const std::string& doc_path,
                                         const std::string& icon_path) const {
    Node* root = document.root();
    std::vector<Node*> anchors;
    for (Node* element : root->descendants("a")) {
        if (isNoteReference(*element)) {
            anchors.push_back(element);
        }
    }

    // 锚点内容替换为平台图标
    auto fillAnchor = [&](Node& anchor, const std::string& n) {
        MarkupUtils::addClass(anchor, footnoteClass());
        while (!anchor.children().empty()) {
            anchor.removeChild(0);
        }
        if (platform_ == Platform::Kindle) {
            anchor.appendChild(Node::text(n));
            return;
        }
        Node& icon = anchor.appendChild(Node::element("span"));
        icon.setAttribute("class", "footnote-icon");
        if (usesImageIcon()) {
            Node& img = icon.appendChild(Node::element("img"));
            img.setAttribute("alt", "note");
            img.setAttribute("src", PathUtils::percentEncode(PathUtils::relativePath(doc_path, icon_path)));
        } else {
            icon.appendChild(MarkupUtils::textElement("sup", n));
        }
    };

    // 已移入 aside 的原目标 id -> 编号
    std::map<std::string, std::string> consumed;
    size_t count = 0;
    for (Node* anchor : anchors) {
        const std::string target_id = PathUtils::percentDecode(anchor->attributeOr("href").substr(1));
        auto reused = consumed.find(target_id);
        if (reused != consumed.end()) {
            // 同一条脚注的重复引用指向已生成的 aside
            anchor->setAttribute("href", "#B_" + reused->second);
            fillAnchor(*anchor, reused->second);
            LAYOUT_DEBUG("{}: repeated footnote reference '#{}' joined B_{}", doc_path, target_id, reused->second);
            continue;
        }
        Node* target = MarkupUtils::findById(*root, target_id);
        if (!target || target == anchor || target == root || isAncestorOf(*target, *anchor) ||
            isNoteReference(*target)) {
            LAYOUT_WARN("{}: footnote target '#{}' not usable", doc_path, target_id);
            continue;
        }

        const std::string n = std::to_string(++count);
        consumed.emplace(target_id, n);
        Node::NodePtr body = target->detach();

        Node::NodePtr aside = Node::element("aside");
        aside->setAttribute("epub:type", "footnote");
        aside->setAttribute("id", "B_" + n);
        while (!body->children().empty()) {
            aside->appendChild(body->removeChild(0));
        }

        Node* block = enclosingBlock(*anchor);
        Node* parent = block->parent();
        parent->insertChild(block->indexInParent() + 1, std::move(aside));

        anchor->setAttribute("id", "A_" + n);
        anchor->setAttribute("href", "#B_" + n);
        fillAnchor(*anchor, n);
    }

    if (count > 0) {
        MarkupUtils::ensureNamespace(*root, "epub", core::EpubConstants::kOpsNamespace);
    }
    return count;
}

void LayoutTransform::ensureNoteIcon(filter::FilterContext& context, xml::Document& opf,
                                     const std::string& icon_path, bool& opf_changed) const {
    if (!context.store().exists(icon_path)) {
        context.cache().put(icon_path, std::string(kNoteIconSvg));
    }
    const PackageLayout& layout = context.layout();
    if (!layout.findByPath(icon_path)) {
        PackageLayout::addManifestItem(opf, layout.uniqueId("note-icon"), layout.hrefFor(icon_path),
                                       package::MediaTypes::kSvg);
        opf_changed = true;
    }
}

// ========== 平台元数据 ==========

void LayoutTransform::addPlatformMeta(xml::Document& opf, bool& opf_changed) const {
    const char* name = nullptr;
    const char* content = nullptr;
    switch (platform_) {
        case Platform::Duokan:
            name = "duokan-body-font";
            content = "DK-SONGTI";
            break;
        case Platform::Zhangyue:
            name = "zhangyue-book-layout";
            content = "reflowable";
            break;
        case Platform::Kindle:
            name = "primary-writing-mode";
            content = "horizontal-lr";
            break;
        case Platform::Generic:
            return;
    }

    Node* metadata = PackageLayout::metadataNode(opf);
    if (!metadata) {
        RYURI_THROW_XML(core::ErrorCode::MalformedMarkup, "Package document has no <metadata>", "", -1);
    }
    for (const Node* meta : metadata->childElements("meta")) {
        if (meta->attributeOr("name") == name) {
            return;
        }
    }
    Node& meta = metadata->appendChild(Node::element("meta"));
    meta.setAttribute("content", content);
    meta.setAttribute("name", name);
    opf_changed = true;
}

// ========== 入口 ==========

void LayoutTransform::apply(filter::FilterContext& context) {
    if (restructure_) {
        StandardStructure::apply(context);
    }

    const PackageLayout& layout = context.layout();
    const std::string opf_path = layout.opfPath();
    const std::string icon_path = joinPath(layout.opfDirectory(), std::string("Images/") + kNoteIconName);
    const std::vector<std::string> markup_paths = layout.markupPaths();

    xml::Document& opf = context.cache().readXml(opf_path);
    bool opf_changed = false;

    // 基础样式表先于字体表写入，其中引用的字体族一并声明
    if (base_css_) {
        writeBaseSheet(context, opf, opf_changed);
    }
    writeFontSheet(context, opf, opf_changed);

    size_t notes = 0;
    size_t spans = 0;
    for (const auto& path : markup_paths) {
        if (!context.store().exists(path)) {
            continue;
        }
        xml::Document& document = context.cache().readXml(path);
        if (document.root()->localName() != "html") {
            LAYOUT_WARN("Skipping {}: root element is <{}>", path, document.root()->name());
            continue;
        }
        const size_t rewritten = rewriteFootnotes(document, path, icon_path);
        const bool wrapped = wrap_chapters_ && wrapChapter(document);
        const size_t added = TrackingSpans::apply(document);
        if (rewritten > 0 || wrapped || added > 0) {
            context.cache().writeXml(path, document, cache::SerializationMode::Markup);
        }
        notes += rewritten;
        spans += added;
    }

    if (notes > 0 && usesImageIcon()) {
        ensureNoteIcon(context, opf, icon_path, opf_changed);
    }
    if (ncx_) {
        writeNcx(context, opf, opf_changed);
    }
    addPlatformMeta(opf, opf_changed);

    if (opf_changed) {
        context.cache().writeXml(opf_path, opf, cache::SerializationMode::Package);
        context.reloadLayout();
    }
    context.layout().applyManifestOrder(context.store());

    LAYOUT_INFO("Layout for {}: {} footnotes, {} tracking spans", toString(platform_), notes, spans);
}

}} // namespace ryuri::layout
