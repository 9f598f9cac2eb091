#include "ryuri/package/PathUtils.hpp"
#include <cctype>
#include <vector>

namespace ryuri {
namespace package {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        parts.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string PathUtils::relativePath(const std::string& from_path, const std::string& to_path) {
    std::vector<std::string> from_parts = splitPath(from_path);
    std::vector<std::string> to_parts = splitPath(to_path);

    size_t common = 0;
    while (common + 1 < from_parts.size() && common < to_parts.size() &&
           from_parts[common] == to_parts[common]) {
        ++common;
    }

    std::string result;
    for (size_t i = common; i + 1 < from_parts.size(); ++i) {
        result += "../";
    }
    for (size_t i = common; i < to_parts.size(); ++i) {
        result += to_parts[i];
        if (i + 1 < to_parts.size()) {
            result += '/';
        }
    }
    return result;
}

bool PathUtils::isExternal(const std::string& href) {
    // URI scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    if (href.empty() || !std::isalpha(static_cast<unsigned char>(href[0]))) {
        return false;
    }
    for (size_t i = 1; i < href.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(href[i]);
        if (c == ':') {
            return true;
        }
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return false;
}

std::string PathUtils::fragment(const std::string& href) {
    const auto hash = href.find('#');
    return hash == std::string::npos ? std::string() : href.substr(hash + 1);
}

std::string PathUtils::bookPath(const std::string& href, const std::string& refer_path) {
    if (href.empty() || isExternal(href)) {
        return "";
    }
    std::string target = href.substr(0, href.find_first_of("#?"));
    if (target.empty()) {
        return "";
    }
    target = percentDecode(target);

    std::vector<std::string> parts;
    if (target.front() != '/') {
        parts = splitPath(refer_path);
        parts.pop_back();
    }

    for (const auto& segment : splitPath(target)) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (parts.empty()) {
                return "";
            }
            parts.pop_back();
            continue;
        }
        parts.push_back(segment);
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) result += '/';
        result += parts[i];
    }
    return result;
}

std::string PathUtils::percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string PathUtils::percentEncode(const std::string& path) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~' ||
            c == '*' || c == ':' || c >= 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

}} // namespace ryuri::package
