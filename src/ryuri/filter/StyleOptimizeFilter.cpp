#include "ryuri/filter/StyleOptimizeFilter.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include <cctype>
#include <functional>

namespace ryuri {
namespace filter {

using utils::StringUtils;

namespace {

bool isNameChar(char c) {
    const unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '-' || c == '_' || u >= 0x80 || c == '\\';
}

std::string readName(const std::string& text, size_t& pos) {
    std::string name;
    while (pos < text.size() && isNameChar(text[pos])) {
        if (text[pos] == '\\' && pos + 1 < text.size()) {
            ++pos;
        }
        name.push_back(text[pos++]);
    }
    return name;
}

// 跳过与 open 匹配的括号段，pos 指向 open
void skipGroup(const std::string& text, size_t& pos, char open, char close) {
    int depth = 0;
    char quote = 0;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == open) {
            ++depth;
        } else if (c == close && --depth == 0) {
            ++pos;
            return;
        }
    }
}

} // namespace

void SelectorUsage::collect(const xml::Node& root) {
    auto record = [this](const xml::Node& node) {
        elements.insert(StringUtils::toLower(node.localName()));
        for (const auto& token : StringUtils::tokens(node.attributeOr("class"))) {
            classes.insert(token);
        }
        const std::string id = node.attributeOr("id");
        if (!id.empty()) {
            ids.insert(id);
        }
    };
    record(root);
    for (const xml::Node* node : root.descendants()) {
        record(*node);
    }
}

bool SelectorUsage::matches(const std::string& selector) const {
    size_t pos = 0;
    bool compound_start = true;
    while (pos < selector.size()) {
        const char c = selector[pos];
        if (c == '.') {
            ++pos;
            if (!classes.count(readName(selector, pos))) return false;
            compound_start = false;
        } else if (c == '#') {
            ++pos;
            if (!ids.count(readName(selector, pos))) return false;
            compound_start = false;
        } else if (c == '[') {
            skipGroup(selector, pos, '[', ']');
            compound_start = false;
        } else if (c == '(') {
            skipGroup(selector, pos, '(', ')');
        } else if (c == ':') {
            while (pos < selector.size() && selector[pos] == ':') ++pos;
            readName(selector, pos);
            compound_start = false;
        } else if (c == ' ' || c == '>' || c == '+' || c == '~' || c == '\t' || c == '\n') {
            ++pos;
            compound_start = true;
        } else if (c == '*') {
            ++pos;
            compound_start = false;
        } else if (compound_start && isNameChar(c)) {
            const std::string element = StringUtils::toLower(readName(selector, pos));
            // 命名空间前缀 ns|tag
            if (pos < selector.size() && selector[pos] == '|') {
                ++pos;
                continue;
            }
            if (!element.empty() && !elements.count(element)) return false;
            compound_start = false;
        } else {
            ++pos;
        }
    }
    return true;
}

StyleOptimizeFilter::StyleOptimizeFilter(const FilterOptions& options)
    : remove_unused_(boolOption(options, "remove_unused", true)) {
}

std::vector<CssDeclaration> StyleOptimizeFilter::canonicalize(const std::vector<CssDeclaration>& declarations) {
    std::vector<CssDeclaration> result;
    for (const auto& decl : declarations) {
        CssDeclaration normalized = decl;
        normalized.property = StringUtils::toLower(StringUtils::trim(decl.property));
        if (normalized.property.empty() || normalized.value.empty()) {
            continue;
        }
        bool replaced = false;
        for (auto it = result.begin(); it != result.end(); ++it) {
            if (it->property != normalized.property) {
                continue;
            }
            if (it->important && !normalized.important) {
                replaced = true;  // 前面的 !important 胜出
            } else {
                result.erase(it);
            }
            break;
        }
        if (!replaced) {
            result.push_back(std::move(normalized));
        }
    }
    return result;
}

size_t StyleOptimizeFilter::optimize(CssSheet& sheet, const SelectorUsage& usage, bool remove_unused) {
    size_t dropped = 0;
    std::function<void(std::vector<CssItem>&)> process = [&](std::vector<CssItem>& items) {
        std::vector<CssItem> kept;
        kept.reserve(items.size());
        for (auto& item : items) {
            if (item.kind == CssItem::Kind::AtStatement) {
                kept.push_back(std::move(item));
                continue;
            }
            if (item.kind == CssItem::Kind::AtBlock && item.nested) {
                process(item.children);
                if (item.children.empty()) {
                    ++dropped;
                    continue;
                }
                kept.push_back(std::move(item));
                continue;
            }

            item.declarations = canonicalize(item.declarations);
            if (item.declarations.empty()) {
                ++dropped;
                continue;
            }
            if (item.kind == CssItem::Kind::Rule && remove_unused) {
                std::vector<std::string> used;
                for (const auto& selector : CssSheet::splitSelectors(item.prelude)) {
                    if (usage.matches(selector)) {
                        used.push_back(selector);
                    }
                }
                if (used.empty()) {
                    ++dropped;
                    continue;
                }
                std::string prelude;
                for (const auto& selector : used) {
                    if (!prelude.empty()) prelude += ", ";
                    prelude += selector;
                }
                item.prelude = prelude;
            }
            kept.push_back(std::move(item));
        }
        items = std::move(kept);
    };
    process(sheet.items());
    return dropped;
}

void StyleOptimizeFilter::apply(FilterContext& context) {
    const package::PackageLayout& layout = context.layout();

    SelectorUsage usage;
    for (const auto& path : layout.markupPaths()) {
        if (context.store().exists(path)) {
            usage.collect(*context.cache().readXml(path).root());
        }
    }

    for (const auto& path : layout.stylePaths()) {
        if (!context.store().exists(path)) {
            continue;
        }
        const std::string original = context.store().getString(path);
        CssSheet sheet = CssSheet::parse(original);
        const size_t dropped = optimize(sheet, usage, remove_unused_);
        const std::string rewritten = sheet.serialize();
        if (rewritten != original) {
            context.cache().put(path, rewritten);
        }
        FILTER_INFO("Optimized {}: {} rules removed", path, dropped);
    }
}

}} // namespace ryuri::filter
