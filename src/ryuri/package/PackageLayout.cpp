#include "ryuri/package/PackageLayout.hpp"
#include "ryuri/package/MediaTypes.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <sstream>
#include <unordered_set>

namespace ryuri {
namespace package {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    const auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

} // namespace

bool ManifestItem::hasProperty(const std::string& property) const {
    std::istringstream in(properties);
    std::string token;
    while (in >> token) {
        if (token == property) {
            return true;
        }
    }
    return false;
}

std::string PackageLayout::locateOpf(cache::DocumentCache& cache) {
    const store::PackageStore& store = cache.store();
    const std::string container_path = core::EpubConstants::kContainerPath;

    if (store.exists(container_path)) {
        try {
            xml::Document& container = cache.readXml(container_path);
            for (xml::Node* rootfile : container.root()->descendants("rootfile")) {
                const std::string full_path = PathUtils::percentDecode(rootfile->attributeOr("full-path"));
                if (!full_path.empty() && store.exists(full_path)) {
                    return full_path;
                }
            }
            STORE_WARN("container.xml does not point at an existing package document");
        } catch (const core::XMLException& e) {
            STORE_WARN("Unreadable container.xml, scanning for package document: {}", e.what());
        }
    }

    for (const auto& path : store.list()) {
        if (store::EntryPath::extension(path) == "opf") {
            return path;
        }
    }
    return "";
}

PackageLayout PackageLayout::load(cache::DocumentCache& cache) {
    PackageLayout layout;
    layout.opf_path_ = locateOpf(cache);
    if (layout.opf_path_.empty()) {
        RYURI_THROW_PACKAGE(core::ErrorCode::NotFound, "Package document (OPF) not found",
                            core::EpubConstants::kContainerPath);
    }

    xml::Document& opf = cache.readXml(layout.opf_path_);
    xml::Node* root = opf.root();
    layout.version_ = root->attributeOr("version");

    const std::string uid_ref = root->attributeOr("unique-identifier");
    if (xml::Node* metadata = root->firstChildElement("metadata")) {
        std::string first_identifier;
        for (xml::Node* identifier : metadata->childElements("identifier")) {
            const std::string text = trim(identifier->textContent());
            if (first_identifier.empty()) {
                first_identifier = text;
            }
            if (!uid_ref.empty() && identifier->attributeOr("id") == uid_ref) {
                layout.unique_identifier_ = text;
            }
        }
        if (layout.unique_identifier_.empty()) {
            layout.unique_identifier_ = first_identifier;
        }
    }

    if (xml::Node* manifest = root->firstChildElement("manifest")) {
        for (xml::Node* item : manifest->childElements("item")) {
            ManifestItem entry;
            entry.id = item->attributeOr("id");
            entry.href = item->attributeOr("href");
            entry.path = PathUtils::bookPath(entry.href, layout.opf_path_);
            entry.media_type = item->attributeOr("media-type");
            entry.properties = item->attributeOr("properties");
            layout.items_.push_back(std::move(entry));
        }
    }

    if (xml::Node* spine = root->firstChildElement("spine")) {
        layout.toc_id_ = spine->attributeOr("toc");
        for (xml::Node* itemref : spine->childElements("itemref")) {
            SpineItem entry;
            entry.idref = itemref->attributeOr("idref");
            entry.linear = itemref->attributeOr("linear", "yes") != "no";
            layout.spine_.push_back(std::move(entry));
        }
    }

    STORE_DEBUG("Loaded package layout {}: version {}, {} items, {} spine entries",
                layout.opf_path_, layout.version_, layout.items_.size(), layout.spine_.size());
    return layout;
}

std::string PackageLayout::opfDirectory() const {
    return store::EntryPath::directory(opf_path_);
}

const ManifestItem* PackageLayout::findById(const std::string& id) const {
    for (const auto& item : items_) {
        if (item.id == id) {
            return &item;
        }
    }
    return nullptr;
}

const ManifestItem* PackageLayout::findByPath(const std::string& path) const {
    for (const auto& item : items_) {
        if (item.path == path) {
            return &item;
        }
    }
    return nullptr;
}

std::vector<std::string> PackageLayout::spinePaths() const {
    std::vector<std::string> paths;
    for (const auto& ref : spine_) {
        const ManifestItem* item = findById(ref.idref);
        if (item && !item->path.empty()) {
            paths.push_back(item->path);
        }
    }
    return paths;
}

std::vector<std::string> PackageLayout::markupPaths() const {
    std::vector<std::string> paths = spinePaths();
    std::unordered_set<std::string> seen(paths.begin(), paths.end());
    for (const auto& item : items_) {
        if (item.media_type == MediaTypes::kXhtml && !item.path.empty() && seen.insert(item.path).second) {
            paths.push_back(item.path);
        }
    }
    return paths;
}

std::vector<std::string> PackageLayout::stylePaths() const {
    std::vector<std::string> paths;
    for (const auto& item : items_) {
        if (item.media_type == MediaTypes::kCss && !item.path.empty()) {
            paths.push_back(item.path);
        }
    }
    return paths;
}

std::string PackageLayout::ncxPath() const {
    if (!toc_id_.empty()) {
        if (const ManifestItem* item = findById(toc_id_)) {
            return item->path;
        }
    }
    for (const auto& item : items_) {
        if (item.media_type == MediaTypes::kNcx) {
            return item.path;
        }
    }
    return "";
}

std::string PackageLayout::navPath() const {
    for (const auto& item : items_) {
        if (item.hasProperty("nav")) {
            return item.path;
        }
    }
    return "";
}

std::string PackageLayout::hrefFor(const std::string& path) const {
    return PathUtils::percentEncode(PathUtils::relativePath(opf_path_, path));
}

std::vector<std::string> PackageLayout::manifestOrder() const {
    std::vector<std::string> order = {core::EpubConstants::kMimetypePath,
                                      core::EpubConstants::kContainerPath,
                                      opf_path_};
    for (const auto& path : spinePaths()) {
        order.push_back(path);
    }
    for (const auto& item : items_) {
        if (!item.path.empty()) {
            order.push_back(item.path);
        }
    }
    return order;
}

void PackageLayout::applyManifestOrder(store::PackageStore& store) const {
    store.setManifestOrder(manifestOrder());
}

bool PackageLayout::refreshManifestOrder(cache::DocumentCache& cache, store::PackageStore& store) {
    if (locateOpf(cache).empty()) {
        return false;
    }
    try {
        load(cache).applyManifestOrder(store);
        return true;
    } catch (const core::RyuriException& e) {
        STORE_WARN("Keeping entry order, package document unusable: {}", e.what());
        return false;
    }
}

std::string PackageLayout::uniqueId(const std::string& base) const {
    if (!findById(base)) {
        return base;
    }
    for (int i = 1;; ++i) {
        const std::string candidate = base + "-" + std::to_string(i);
        if (!findById(candidate)) {
            return candidate;
        }
    }
}

xml::Node* PackageLayout::metadataNode(xml::Document& opf) {
    return opf.root() ? opf.root()->firstChildElement("metadata") : nullptr;
}

xml::Node* PackageLayout::manifestNode(xml::Document& opf) {
    return opf.root() ? opf.root()->firstChildElement("manifest") : nullptr;
}

xml::Node* PackageLayout::spineNode(xml::Document& opf) {
    return opf.root() ? opf.root()->firstChildElement("spine") : nullptr;
}

xml::Node& PackageLayout::addManifestItem(xml::Document& opf, const std::string& id, const std::string& href,
                                          const std::string& media_type, const std::string& properties) {
    xml::Node* manifest = manifestNode(opf);
    if (!manifest) {
        xml::Node* root = opf.root();
        if (!root) {
            RYURI_THROW_XML(core::ErrorCode::MalformedMarkup, "Package document has no root", "", -1);
        }
        manifest = &root->appendChild(xml::Node::element("manifest"));
    }
    auto item = xml::Node::element("item");
    item->setAttribute("id", id);
    item->setAttribute("href", href);
    item->setAttribute("media-type", media_type);
    if (!properties.empty()) {
        item->setAttribute("properties", properties);
    }
    return manifest->appendChild(std::move(item));
}

}} // namespace ryuri::package
