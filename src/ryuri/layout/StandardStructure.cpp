#include "ryuri/layout/StandardStructure.hpp"
#include "ryuri/package/MediaTypes.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/store/EntryPath.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include "ryuri/core/Constants.hpp"
#include <algorithm>
#include <functional>
#include <unordered_set>
#include <vector>

namespace ryuri {
namespace layout {

using package::MediaTypes;
using package::PackageLayout;
using package::PathUtils;
using store::EntryPath;
using utils::StringUtils;
using xml::Node;

namespace {

// 正文中可能携带包内引用的属性
const char* const kLinkAttributes[] = {"href", "src", "xlink:href", "poster"};

std::string joinPath(const std::string& directory, const std::string& name) {
    return directory.empty() ? name : directory + "/" + name;
}

std::string uniquePath(const std::string& path, const std::function<bool(const std::string&)>& taken) {
    if (!taken(path)) {
        return path;
    }
    const std::string directory = EntryPath::directory(path);
    const std::string stem = EntryPath::stem(path);
    const std::string extension = EntryPath::extension(path);
    for (int i = 2;; ++i) {
        std::string name = stem + "-" + std::to_string(i);
        if (!extension.empty()) {
            name += "." + extension;
        }
        const std::string candidate = joinPath(directory, name);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

const char* directoryFor(const std::string& media_type) {
    if (media_type == MediaTypes::kXhtml) return StandardStructure::kTextDir;
    if (media_type == MediaTypes::kCss) return StandardStructure::kStylesDir;
    if (MediaTypes::isImage(media_type)) return StandardStructure::kImagesDir;
    if (MediaTypes::isFont(media_type)) return StandardStructure::kFontsDir;
    return nullptr;
}

bool isXhtmlDocument(const xml::Document& document) {
    const Node* root = document.root();
    return root && root->localName() == "html" &&
           root->attributeOr("xmlns") == core::EpubConstants::kXhtmlNamespace;
}

size_t rebaseMarkup(Node& root, const std::string& refer_path, const std::string& new_refer_path,
                    const StandardStructure::Moves& moves) {
    size_t changed = 0;
    for (Node* element : root.descendants()) {
        for (const char* name : kLinkAttributes) {
            const std::string* value = element->attribute(name);
            if (!value) {
                continue;
            }
            const std::string rebased = StandardStructure::rebaseHref(*value, refer_path, new_refer_path, moves);
            if (rebased != *value) {
                element->setAttribute(name, rebased);
                ++changed;
            }
        }
        if (const std::string* style = element->attribute("style")) {
            std::string css = *style;
            if (StandardStructure::rebaseCss(css, refer_path, new_refer_path, moves) > 0) {
                element->setAttribute("style", css);
                ++changed;
            }
        }
        if (element->localName() == "style") {
            std::string css = element->textContent();
            if (StandardStructure::rebaseCss(css, refer_path, new_refer_path, moves) > 0) {
                element->setTextContent(css);
                ++changed;
            }
        }
    }
    return changed;
}

} // namespace

// ========== 引用换算 ==========

std::string StandardStructure::rebaseHref(const std::string& href, const std::string& refer_path,
                                          const std::string& new_refer_path, const Moves& moves) {
    if (href.empty() || href[0] == '#' || PathUtils::isExternal(href)) {
        return href;
    }
    const std::string target = PathUtils::bookPath(href, refer_path);
    if (target.empty()) {
        return href;
    }
    const auto moved = moves.find(target);
    if (moved == moves.end() && refer_path == new_refer_path) {
        return href;
    }

    const std::string& destination = moved == moves.end() ? target : moved->second;
    std::string result = PathUtils::percentEncode(PathUtils::relativePath(new_refer_path, destination));
    const auto suffix = href.find_first_of("#?");
    if (suffix != std::string::npos) {
        result += href.substr(suffix);
    }
    return result;
}

size_t StandardStructure::rebaseCss(std::string& css, const std::string& refer_path,
                                    const std::string& new_refer_path, const Moves& moves) {
    const std::string lower = StringUtils::toLower(css);
    std::string out;
    out.reserve(css.size());
    size_t changed = 0;
    size_t pos = 0;

    // 从 begin 起读取一个可带引号的引用，写出换算结果，返回引用结束位置
    auto rewriteToken = [&](size_t begin, bool require_quote) -> size_t {
        size_t i = begin;
        while (i < css.size() && StringUtils::isSpace(css[i])) {
            ++i;
        }
        const char quote = (i < css.size() && (css[i] == '"' || css[i] == '\'')) ? css[i] : '\0';
        if (require_quote && !quote) {
            return std::string::npos;
        }
        const size_t start = quote ? i + 1 : i;
        size_t end = quote ? css.find(quote, start) : css.find(')', start);
        if (end == std::string::npos) {
            return std::string::npos;
        }
        size_t value_end = end;
        while (!quote && value_end > start && StringUtils::isSpace(css[value_end - 1])) {
            --value_end;
        }

        const std::string value = css.substr(start, value_end - start);
        const std::string rebased = rebaseHref(value, refer_path, new_refer_path, moves);
        if (rebased != value) {
            ++changed;
        }
        out.append(css, pos, start - pos);
        out += rebased;
        return value_end;
    };

    while (pos < css.size()) {
        const size_t url = lower.find("url(", pos);
        const size_t import = lower.find("@import", pos);
        const size_t next = std::min(url, import);
        if (next == std::string::npos) {
            break;
        }

        size_t resume = std::string::npos;
        if (next == url) {
            resume = rewriteToken(url + 4, false);
        } else {
            // @import url(...) 由 url 分支处理
            resume = rewriteToken(import + 7, true);
        }
        if (resume == std::string::npos) {
            const size_t skip = next == url ? url + 4 : import + 7;
            out.append(css, pos, skip - pos);
            pos = skip;
            continue;
        }
        pos = resume;
    }
    out.append(css, pos, std::string::npos);

    if (changed > 0) {
        css = std::move(out);
    }
    return changed;
}

// ========== 移动计划 ==========

StandardStructure::Moves StandardStructure::plan(const PackageLayout& layout, const store::PackageStore& store) {
    const std::string base = layout.opfDirectory();

    std::vector<std::pair<std::string, std::string>> candidates;
    std::unordered_set<std::string> queued;

    // 阅读顺序中的文档按序编号
    int chapter = 0;
    for (const auto& path : layout.spinePaths()) {
        const package::ManifestItem* item = layout.findByPath(path);
        if (!item || item->media_type != MediaTypes::kXhtml || !store.exists(path) || queued.count(path)) {
            continue;
        }
        queued.insert(path);
        const std::string name = "f" + std::to_string(++chapter) + ".xhtml";
        candidates.emplace_back(path, joinPath(joinPath(base, kTextDir), name));
    }

    for (const auto& item : layout.items()) {
        if (item.path.empty() || queued.count(item.path) || !store.exists(item.path)) {
            continue;
        }
        const char* directory = directoryFor(item.media_type);
        if (!directory) {
            continue;
        }
        queued.insert(item.path);
        candidates.emplace_back(item.path,
                                joinPath(joinPath(base, directory), EntryPath::fileName(item.path)));
    }

    // 不参与移动的条目占用的路径不可作为目标
    std::unordered_set<std::string> fixed;
    for (const auto& path : store.list()) {
        if (!queued.count(path)) {
            fixed.insert(path);
        }
    }

    Moves moves;
    std::unordered_set<std::string> assigned;
    for (const auto& candidate : candidates) {
        const std::string destination = uniquePath(candidate.second, [&](const std::string& path) {
            return assigned.count(path) > 0 || fixed.count(path) > 0;
        });
        assigned.insert(destination);
        if (destination != candidate.first) {
            moves.emplace(candidate.first, destination);
        }
    }
    return moves;
}

// ========== 执行 ==========

size_t StandardStructure::apply(filter::FilterContext& context) {
    const PackageLayout& layout = context.layout();
    const Moves moves = plan(layout, context.store());
    if (moves.empty()) {
        LAYOUT_DEBUG("Package already uses the standard structure");
        return 0;
    }

    const std::string opf_path = layout.opfPath();
    const std::string ncx_path = layout.ncxPath();

    // 先在内存中生成全部新内容，再统一落盘，避免新旧路径互相覆盖
    std::map<std::string, std::string> staged;
    std::unordered_set<std::string> visited;
    for (const auto& item : layout.items()) {
        const std::string& path = item.path;
        if (path.empty() || path == opf_path || !context.store().exists(path) || !visited.insert(path).second) {
            continue;
        }
        const auto moved = moves.find(path);
        const bool is_moved = moved != moves.end();
        const std::string target = is_moved ? moved->second : path;

        if (item.media_type == MediaTypes::kXhtml) {
            xml::Document& document = context.cache().readXml(path);
            if (isXhtmlDocument(document)) {
                if (rebaseMarkup(*document.root(), path, target, moves) > 0 || is_moved) {
                    staged[target] = cache::DocumentCache::serialize(document, cache::SerializationMode::Markup,
                                                                     target);
                }
                continue;
            }
            LAYOUT_WARN("{} is not an XHTML document, moving it unchanged", path);
        } else if (item.media_type == MediaTypes::kCss) {
            std::string css = context.store().getString(path);
            if (rebaseCss(css, path, target, moves) > 0 || is_moved) {
                staged[target] = std::move(css);
            }
            continue;
        } else if (path == ncx_path) {
            xml::Document& ncx = context.cache().readXml(path);
            size_t changed = 0;
            for (Node* content : ncx.root()->descendants("content")) {
                const std::string src = content->attributeOr("src");
                const std::string rebased = rebaseHref(src, path, target, moves);
                if (rebased != src) {
                    content->setAttribute("src", rebased);
                    ++changed;
                }
            }
            if (changed > 0 || is_moved) {
                staged[target] = cache::DocumentCache::serialize(ncx, cache::SerializationMode::Generic, target);
            }
            continue;
        }

        if (is_moved) {
            staged[target] = context.store().getString(path);
        }
    }

    for (const auto& move : moves) {
        context.cache().remove(move.first);
    }
    for (const auto& entry : staged) {
        context.cache().put(entry.first, entry.second);
    }

    xml::Document& opf = context.cache().readXml(opf_path);
    if (Node* manifest = PackageLayout::manifestNode(opf)) {
        for (Node* item : manifest->childElements("item")) {
            const std::string href = item->attributeOr("href");
            const std::string rebased = rebaseHref(href, opf_path, opf_path, moves);
            if (rebased != href) {
                item->setAttribute("href", rebased);
            }
        }
    }
    if (Node* guide = opf.root()->firstChildElement("guide")) {
        for (Node* reference : guide->childElements("reference")) {
            const std::string href = reference->attributeOr("href");
            const std::string rebased = rebaseHref(href, opf_path, opf_path, moves);
            if (rebased != href) {
                reference->setAttribute("href", rebased);
            }
        }
    }
    context.cache().writeXml(opf_path, opf, cache::SerializationMode::Package);
    context.reloadLayout();

    LAYOUT_INFO("Moved {} entries into the standard OEBPS structure", moves.size());
    return moves.size();
}

}} // namespace ryuri::layout
