#include "ryuri/filter/PrivacyScrubFilter.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include <unordered_set>

namespace ryuri {
namespace filter {

using utils::StringUtils;

namespace {

// 任意目录下出现即删除的文件名
const std::unordered_set<std::string>& junkFileNames() {
    static const std::unordered_set<std::string> kNames = {
        "calibre_bookmarks.txt",
        "iTunesMetadata.plist",
        "iTunesMetadata-original.plist",
        "iTunesArtwork",
        ".DS_Store",
        "Thumbs.db",
        "desktop.ini",
    };
    return kNames;
}

// 目录前缀
const char* const kJunkPrefixes[] = {
    "__MACOSX/",
    ".kobo/",
    ".duokan/",
    ".adobe-digital-editions/",
};

// 保留的 calibre 描述性 meta
const char* const kDescriptiveCalibreMetas[] = {
    "calibre:series",
    "calibre:series_index",
    "calibre:title_sort",
};

} // namespace

PrivacyScrubFilter::PrivacyScrubFilter(const FilterOptions& options)
    : scrub_metadata_(boolOption(options, "metadata", true)) {
}

bool PrivacyScrubFilter::isReaderState(const std::string& path) {
    if (junkFileNames().count(store::EntryPath::fileName(path))) {
        return true;
    }
    for (const char* prefix : kJunkPrefixes) {
        if (StringUtils::startsWith(path, prefix)) {
            return true;
        }
    }
    const std::string ext = store::EntryPath::extension(path);
    // Adobe Digital Editions 标注、多看阅读进度
    return ext == "annot" || ext == "dkprogress";
}

bool PrivacyScrubFilter::isReaderStateMeta(const std::string& name) {
    if (!StringUtils::startsWith(name, "calibre:")) {
        return false;
    }
    for (const char* keep : kDescriptiveCalibreMetas) {
        if (name == keep) {
            return false;
        }
    }
    return true;
}

void PrivacyScrubFilter::apply(FilterContext& context) {
    std::unordered_set<std::string> removed;
    for (const auto& path : context.store().list()) {
        if (isReaderState(path)) {
            context.cache().remove(path);
            removed.insert(path);
            FILTER_INFO("Removed reader-state entry {}", path);
        }
    }

    const std::string opf_path = package::PackageLayout::locateOpf(context.cache());
    if (opf_path.empty()) {
        return;
    }

    xml::Document& opf = context.cache().readXml(opf_path);
    bool changed = false;

    if (scrub_metadata_) {
        if (xml::Node* metadata = package::PackageLayout::metadataNode(opf)) {
            for (xml::Node* meta : metadata->childElements("meta")) {
                const std::string name = meta->attributeOr("name");
                if (isReaderStateMeta(name)) {
                    FILTER_DEBUG("Removed metadata '{}'", name);
                    meta->detach();
                    changed = true;
                }
            }
        }
    }

    if (!removed.empty()) {
        std::unordered_set<std::string> dropped_ids;
        if (xml::Node* manifest = package::PackageLayout::manifestNode(opf)) {
            for (xml::Node* item : manifest->childElements("item")) {
                const std::string path = package::PathUtils::bookPath(item->attributeOr("href"), opf_path);
                if (removed.count(path)) {
                    dropped_ids.insert(item->attributeOr("id"));
                    item->detach();
                    changed = true;
                }
            }
        }
        if (xml::Node* spine = package::PackageLayout::spineNode(opf)) {
            for (xml::Node* itemref : spine->childElements("itemref")) {
                if (dropped_ids.count(itemref->attributeOr("idref"))) {
                    itemref->detach();
                }
            }
        }
    }

    if (changed) {
        context.cache().writeXml(opf_path, opf, cache::SerializationMode::Package);
        context.reloadLayout();
    }
    FILTER_INFO("Privacy scrub removed {} entries", removed.size());
}

}} // namespace ryuri::filter
