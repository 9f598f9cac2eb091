#include "ryuri/filter/StructuralRepairFilter.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/package/MediaTypes.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include <cctype>
#include <unordered_set>

namespace ryuri {
namespace filter {

namespace {

// 由文件名生成合法的 XML id
std::string idFromPath(const std::string& path) {
    std::string id;
    for (unsigned char c : store::EntryPath::fileName(path)) {
        id.push_back((std::isalnum(c) || c == '-' || c == '_' || c == '.' || c >= 0x80)
                         ? static_cast<char>(c) : '_');
    }
    if (id.empty() || !(std::isalpha(static_cast<unsigned char>(id[0])) || id[0] == '_')) {
        id = "x" + id;
    }
    return id;
}

bool isPackageInfrastructure(const std::string& path, const std::string& opf_path) {
    return path == core::EpubConstants::kMimetypePath || path == opf_path ||
           utils::StringUtils::startsWith(path, "META-INF/");
}

} // namespace

StructuralRepairFilter::StructuralRepairFilter(const FilterOptions& options)
    : correct_mime_(boolOption(options, "correct_mime", true)) {
}

void StructuralRepairFilter::apply(FilterContext& context) {
    repairMimetype(context);
    repairContainer(context);

    const std::string opf_path = package::PackageLayout::locateOpf(context.cache());
    xml::Document& opf = context.cache().readXml(opf_path);
    if (repairManifest(context, opf, opf_path)) {
        context.cache().writeXml(opf_path, opf, cache::SerializationMode::Package);
        context.reloadLayout();
    }
    context.layout().applyManifestOrder(context.store());
}

void StructuralRepairFilter::repairMimetype(FilterContext& context) {
    const std::string path = core::EpubConstants::kMimetypePath;
    const std::string expected = core::EpubConstants::kMimetypeContent;
    if (context.store().exists(path) && context.store().getString(path) == expected) {
        return;
    }
    FILTER_INFO("Regenerating mimetype entry");
    context.cache().put(path, expected);
}

void StructuralRepairFilter::repairContainer(FilterContext& context) {
    const std::string container_path = core::EpubConstants::kContainerPath;
    store::PackageStore& store = context.store();

    std::string declared;
    if (store.exists(container_path)) {
        try {
            xml::Document& container = context.cache().readXml(container_path);
            for (xml::Node* rootfile : container.root()->descendants("rootfile")) {
                declared = package::PathUtils::percentDecode(rootfile->attributeOr("full-path"));
                break;
            }
        } catch (const core::XMLException& e) {
            FILTER_WARN("Discarding malformed container.xml: {}", e.what());
        }
    }
    if (!declared.empty() && store.exists(declared)) {
        return;
    }

    const std::string opf_path = package::PackageLayout::locateOpf(context.cache());
    if (opf_path.empty()) {
        RYURI_THROW_PACKAGE(core::ErrorCode::NotFound, "Package has no package document to repair around",
                            container_path);
    }

    xml::Document container(xml::Node::element("container"));
    container.setHasDeclaration(true);
    xml::Node* root = container.root();
    root->setAttribute("version", "1.0");
    root->setAttribute("xmlns", core::EpubConstants::kContainerNamespace);
    xml::Node& rootfiles = root->appendChild(xml::Node::element("rootfiles"));
    xml::Node& rootfile = rootfiles.appendChild(xml::Node::element("rootfile"));
    rootfile.setAttribute("full-path", opf_path);
    rootfile.setAttribute("media-type", package::MediaTypes::kOpf);

    FILTER_INFO("Regenerating {} pointing at {}", container_path, opf_path);
    context.cache().writeXml(container_path, container, cache::SerializationMode::Generic);
}

bool StructuralRepairFilter::repairManifest(FilterContext& context, xml::Document& opf,
                                            const std::string& opf_path) {
    store::PackageStore& store = context.store();
    bool changed = false;

    xml::Node* root = opf.root();
    if (root->localName() == "package" && !root->hasAttribute("xmlns")) {
        root->setAttribute("xmlns", core::EpubConstants::kOpfNamespace);
        changed = true;
    }

    xml::Node* manifest = package::PackageLayout::manifestNode(opf);
    if (!manifest) {
        manifest = &root->appendChild(xml::Node::element("manifest"));
        changed = true;
    }

    // ========== 清单项 ==========
    std::unordered_set<std::string> ids;
    std::unordered_set<std::string> listed_paths;
    for (xml::Node* item : manifest->childElements("item")) {
        const std::string id = item->attributeOr("id");
        const std::string path = package::PathUtils::bookPath(item->attributeOr("href"), opf_path);

        const char* reason = nullptr;
        if (id.empty()) {
            reason = "missing id";
        } else if (!ids.insert(id).second) {
            reason = "duplicate id";
        } else if (path.empty() || !store.exists(path)) {
            reason = "missing entry";
        } else if (!listed_paths.insert(path).second) {
            reason = "duplicate entry";
        }

        if (reason) {
            FILTER_INFO("Dropping manifest item '{}' ({}): {}", id, item->attributeOr("href"), reason);
            if (!id.empty() && std::string(reason) != "duplicate id") {
                ids.erase(id);
            }
            item->detach();
            changed = true;
            continue;
        }

        if (correct_mime_) {
            const std::string expected = package::MediaTypes::forPath(path);
            const std::string declared = item->attributeOr("media-type");
            if (expected != "application/octet-stream" && !package::MediaTypes::equivalent(declared, expected)) {
                FILTER_INFO("Correcting media type of {}: '{}' -> '{}'", path, declared, expected);
                item->setAttribute("media-type", expected);
                changed = true;
            }
        }
    }

    // ========== 未登记条目 ==========
    for (const auto& path : store.list()) {
        if (listed_paths.count(path) || isPackageInfrastructure(path, opf_path)) {
            continue;
        }
        std::string id = idFromPath(path);
        const std::string base = id;
        for (int i = 1; ids.count(id); ++i) {
            id = base + "-" + std::to_string(i);
        }
        ids.insert(id);
        listed_paths.insert(path);

        const std::string href = package::PathUtils::percentEncode(package::PathUtils::relativePath(opf_path, path));
        package::PackageLayout::addManifestItem(opf, id, href, package::MediaTypes::forPath(path));
        FILTER_INFO("Registering unlisted entry {} as '{}'", path, id);
        changed = true;
    }

    // ========== 阅读顺序 ==========
    if (xml::Node* spine = package::PackageLayout::spineNode(opf)) {
        std::unordered_set<std::string> seen_refs;
        for (xml::Node* itemref : spine->childElements("itemref")) {
            const std::string idref = itemref->attributeOr("idref");
            if (!ids.count(idref) || !seen_refs.insert(idref).second) {
                FILTER_INFO("Dropping spine reference '{}'", idref);
                itemref->detach();
                changed = true;
            }
        }
        const std::string toc = spine->attributeOr("toc");
        if (!toc.empty() && !ids.count(toc)) {
            spine->removeAttribute("toc");
            changed = true;
        }
    }

    return changed;
}

}} // namespace ryuri::filter
