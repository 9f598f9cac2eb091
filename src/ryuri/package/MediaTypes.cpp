#include "ryuri/package/MediaTypes.hpp"
#include "ryuri/store/EntryPath.hpp"
#include <unordered_map>

namespace ryuri {
namespace package {

std::string MediaTypes::forPath(const std::string& path) {
    static const std::unordered_map<std::string, std::string> kByExtension = {
        {"xhtml", kXhtml},
        {"html", kXhtml},
        {"htm", kXhtml},
        {"css", kCss},
        {"ncx", kNcx},
        {"opf", kOpf},
        {"svg", kSvg},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"ttf", "font/ttf"},
        {"otf", "font/otf"},
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
        {"js", "application/javascript"},
        {"smil", "application/smil+xml"},
        {"xml", "application/xml"},
        {"txt", "text/plain"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
    };
    auto it = kByExtension.find(store::EntryPath::extension(path));
    return it == kByExtension.end() ? "application/octet-stream" : it->second;
}

bool MediaTypes::isFont(const std::string& media_type) {
    return media_type.compare(0, 5, "font/") == 0 ||
           media_type == "application/x-font-ttf" ||
           media_type == "application/x-font-otf" ||
           media_type == "application/font-sfnt" ||
           media_type == "application/vnd.ms-opentype" ||
           media_type == "application/font-woff";
}

bool MediaTypes::isImage(const std::string& media_type) {
    return media_type.compare(0, 6, "image/") == 0;
}

bool MediaTypes::equivalent(const std::string& a, const std::string& b) {
    if (a == b) {
        return true;
    }
    return isFont(a) && isFont(b);
}

}} // namespace ryuri::package
