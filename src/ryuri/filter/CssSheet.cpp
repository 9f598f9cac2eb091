#include "ryuri/filter/CssSheet.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace ryuri {
namespace filter {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n\f";
    const auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string stripComments(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote) {
            out.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                out.push_back(text[++i]);
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            out.push_back(c);
            continue;
        }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            const auto end = text.find("*/", i + 2);
            if (end == std::string::npos) {
                break;
            }
            i = end + 1;
            continue;
        }
        out.push_back(c);
    }
    return out;
}

// 从 pos 开始查找 stop 中任一字符（跳过字符串与括号），返回位置或 npos
size_t findTopLevel(const std::string& text, size_t pos, const char* stop) {
    char quote = 0;
    int paren = 0;
    for (size_t i = pos; i < text.size(); ++i) {
        const char c = text[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(') {
            ++paren;
        } else if (c == ')') {
            if (paren > 0) --paren;
        } else if (paren == 0 && std::strchr(stop, c)) {
            return i;
        }
    }
    return std::string::npos;
}

// 给定 '{' 的位置，返回匹配 '}' 的位置（未闭合返回 text.size()）
size_t findBlockEnd(const std::string& text, size_t open) {
    int depth = 0;
    char quote = 0;
    for (size_t i = open; i < text.size(); ++i) {
        const char c = text[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return text.size();
}

bool isNestingAtRule(const std::string& keyword) {
    return keyword == "media" || keyword == "supports" || keyword == "document" ||
           keyword == "layer" || keyword == "container";
}

std::vector<CssItem> parseItems(const std::string& text) {
    std::vector<CssItem> items;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t stop = findTopLevel(text, pos, "{;}");
        if (stop == std::string::npos) {
            const std::string rest = trim(text.substr(pos));
            if (!rest.empty() && rest.front() == '@') {
                CssItem item;
                item.kind = CssItem::Kind::AtStatement;
                item.prelude = collapseWhitespace(rest);
                items.push_back(std::move(item));
            }
            break;
        }

        const std::string prelude = collapseWhitespace(trim(text.substr(pos, stop - pos)));
        const char delimiter = text[stop];

        if (delimiter == '}') {
            // 多余的右括号
            pos = stop + 1;
            continue;
        }
        if (delimiter == ';') {
            if (!prelude.empty() && prelude.front() == '@') {
                CssItem item;
                item.kind = CssItem::Kind::AtStatement;
                item.prelude = prelude;
                items.push_back(std::move(item));
            }
            pos = stop + 1;
            continue;
        }

        const size_t close = findBlockEnd(text, stop);
        const std::string body = text.substr(stop + 1, close > stop ? close - stop - 1 : 0);
        pos = close + 1;

        CssItem item;
        item.prelude = prelude;
        if (!prelude.empty() && prelude.front() == '@') {
            item.kind = CssItem::Kind::AtBlock;
            if (isNestingAtRule(item.atKeyword())) {
                item.nested = true;
                item.children = parseItems(body);
            } else {
                item.declarations = CssSheet::parseDeclarations(body);
            }
        } else {
            item.kind = CssItem::Kind::Rule;
            item.declarations = CssSheet::parseDeclarations(body);
        }
        items.push_back(std::move(item));
    }
    return items;
}

void serializeItems(const std::vector<CssItem>& items, std::string& out, const std::string& indent) {
    for (const auto& item : items) {
        switch (item.kind) {
            case CssItem::Kind::AtStatement:
                out += indent + item.prelude + ";\n";
                break;
            case CssItem::Kind::AtBlock:
                if (item.nested) {
                    out += indent + item.prelude + " {\n";
                    serializeItems(item.children, out, indent + "  ");
                    out += indent + "}\n";
                    break;
                }
                [[fallthrough]];
            case CssItem::Kind::Rule:
                out += indent + item.prelude + " {\n";
                for (const auto& decl : item.declarations) {
                    out += indent + "  " + decl.property + ": " + decl.value;
                    if (decl.important) {
                        out += " !important";
                    }
                    out += ";\n";
                }
                out += indent + "}\n";
                break;
        }
    }
}

} // namespace

std::string CssItem::atKeyword() const {
    if (prelude.empty() || prelude.front() != '@') {
        return "";
    }
    size_t end = 1;
    while (end < prelude.size() && (std::isalnum(static_cast<unsigned char>(prelude[end])) || prelude[end] == '-')) {
        ++end;
    }
    std::string keyword = prelude.substr(1, end - 1);
    std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return keyword;
}

CssSheet CssSheet::parse(const std::string& text) {
    CssSheet sheet;
    sheet.items_ = parseItems(stripComments(text));
    return sheet;
}

std::vector<CssDeclaration> CssSheet::parseDeclarations(const std::string& text) {
    const std::string clean = stripComments(text);
    std::vector<CssDeclaration> declarations;
    size_t pos = 0;
    while (pos < clean.size()) {
        size_t end = findTopLevel(clean, pos, ";");
        if (end == std::string::npos) {
            end = clean.size();
        }
        const std::string part = clean.substr(pos, end - pos);
        pos = end + 1;

        const auto colon = part.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        CssDeclaration decl;
        decl.property = trim(part.substr(0, colon));
        std::string value = trim(part.substr(colon + 1));
        if (decl.property.empty()) {
            continue;
        }

        const auto bang = value.rfind('!');
        if (bang != std::string::npos) {
            std::string flag = trim(value.substr(bang + 1));
            std::transform(flag.begin(), flag.end(), flag.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (flag == "important") {
                decl.important = true;
                value = trim(value.substr(0, bang));
            }
        }
        decl.value = collapseWhitespace(value);
        declarations.push_back(std::move(decl));
    }
    return declarations;
}

std::string CssSheet::serializeDeclarations(const std::vector<CssDeclaration>& declarations) {
    std::string out;
    for (const auto& decl : declarations) {
        if (!out.empty()) {
            out += ' ';
        }
        out += decl.property + ": " + decl.value;
        if (decl.important) {
            out += " !important";
        }
        out += ';';
    }
    return out;
}

std::vector<std::string> CssSheet::splitSelectors(const std::string& prelude) {
    std::vector<std::string> selectors;
    size_t pos = 0;
    while (pos <= prelude.size()) {
        size_t end = findTopLevel(prelude, pos, ",");
        if (end == std::string::npos) {
            end = prelude.size();
        }
        const std::string selector = trim(prelude.substr(pos, end - pos));
        if (!selector.empty()) {
            selectors.push_back(selector);
        }
        pos = end + 1;
    }
    return selectors;
}

std::vector<std::string> CssSheet::splitFontFamilies(const std::string& value) {
    std::vector<std::string> families;
    for (std::string family : splitSelectors(value)) {
        if (family.size() >= 2 && (family.front() == '"' || family.front() == '\'') &&
            family.back() == family.front()) {
            family = family.substr(1, family.size() - 2);
        }
        family = trim(family);
        if (!family.empty()) {
            families.push_back(family);
        }
    }
    return families;
}

std::string CssSheet::serialize() const {
    std::string out;
    serializeItems(items_, out, "");
    return out;
}

}} // namespace ryuri::filter
