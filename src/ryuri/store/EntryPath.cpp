#include "ryuri/store/EntryPath.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include <algorithm>
#include <cctype>

namespace ryuri {
namespace store {

const char* toString(ContentFlag flag) noexcept {
    switch (flag) {
        case ContentFlag::Binary: return "binary";
        case ContentFlag::Text:   return "text";
        case ContentFlag::Markup: return "markup";
    }
    return "binary";
}

bool EntryPath::isValid(const std::string& path) noexcept {
    if (path.empty() || path.front() == '/' || path.back() == '/') {
        return false;
    }
    if (path.find('\\') != std::string::npos) {
        return false;
    }
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        const size_t len = end - start;
        if (len == 0) {
            return false;
        }
        if ((len == 1 && path[start] == '.') ||
            (len == 2 && path[start] == '.' && path[start + 1] == '.')) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

void EntryPath::validate(const std::string& path) {
    if (!isValid(path)) {
        RYURI_THROW_PARAM("Invalid entry path '" + path + "'", path);
    }
}

std::string EntryPath::extension(const std::string& path) {
    const std::string name = fileName(path);
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string EntryPath::directory(const std::string& path) {
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

std::string EntryPath::fileName(const std::string& path) {
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string EntryPath::stem(const std::string& path) {
    const std::string name = fileName(path);
    const auto dot = name.rfind('.');
    return (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
}

ContentFlag EntryPath::contentFlag(const std::string& path) {
    if (path == core::EpubConstants::kMimetypePath) {
        return ContentFlag::Text;
    }
    const std::string ext = extension(path);
    if (ext == "xhtml" || ext == "html" || ext == "htm" || ext == "opf" || ext == "ncx" ||
        ext == "xml" || ext == "svg" || ext == "smil") {
        return ContentFlag::Markup;
    }
    if (ext == "css" || ext == "txt" || ext == "js") {
        return ContentFlag::Text;
    }
    return ContentFlag::Binary;
}

}} // namespace ryuri::store
