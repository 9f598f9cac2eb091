#include "ryuri/filter/MetadataNormalizeFilter.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/utils/Digest.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include "ryuri/xml/MarkupUtils.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace ryuri {
namespace filter {

using utils::StringUtils;

namespace {

bool hasOnlyText(const xml::Node& element) {
    return std::all_of(element.children().begin(), element.children().end(),
                       [](const xml::Node::NodePtr& child) { return child->isText(); });
}

// 由条目路径集合派生的确定性 urn:uuid
std::string derivedUuid(const store::PackageStore& store) {
    std::vector<std::string> paths = store.list();
    std::sort(paths.begin(), paths.end());
    utils::Digest digest(utils::Digest::Algorithm::MD5);
    for (const auto& path : paths) {
        digest.update(path).update("\n", 1);
    }
    const std::string hex = digest.finishHex();
    return fmt::format("urn:uuid:{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
                       hex.substr(16, 4), hex.substr(20, 12));
}

} // namespace

MetadataNormalizeFilter::MetadataNormalizeFilter(const FilterOptions& options)
    : default_title_(stringOption(options, "default_title", "Untitled")) {
}

std::string MetadataNormalizeFilter::canonicalLanguage(const std::string& tag) {
    std::string normalized = StringUtils::trim(tag);
    std::replace(normalized.begin(), normalized.end(), '_', '-');

    std::string result;
    size_t index = 0;
    for (const auto& part : StringUtils::split(normalized, '-')) {
        std::string subtag;
        if (index == 0) {
            subtag = StringUtils::toLower(part);
        } else if (part.size() == 2) {
            subtag = StringUtils::toUpper(part);         // 地区
        } else if (part.size() == 4) {
            subtag = StringUtils::toLower(part);         // 文字
            subtag[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(subtag[0])));
        } else {
            subtag = StringUtils::toLower(part);
        }
        if (!result.empty()) {
            result += '-';
        }
        result += subtag;
        ++index;
    }
    return result;
}

void MetadataNormalizeFilter::apply(FilterContext& context) {
    const std::string opf_path = context.layout().opfPath();
    xml::Document& opf = context.cache().readXml(opf_path);
    xml::Node* root = opf.root();

    xml::Node* metadata = package::PackageLayout::metadataNode(opf);
    if (!metadata) {
        metadata = &root->insertChild(0, xml::Node::element("metadata"));
    }
    if (!metadata->hasAttribute("xmlns:dc") && !root->hasAttribute("xmlns:dc")) {
        metadata->setAttribute("xmlns:dc", core::EpubConstants::kDcNamespace);
    }

    const std::string uid_ref = root->attributeOr("unique-identifier");
    size_t collapsed = 0;
    size_t removed = 0;
    std::set<std::pair<std::string, std::string>> seen;

    for (xml::Node* element : metadata->childElements()) {
        if (!StringUtils::startsWith(element->name(), "dc:")) {
            continue;
        }
        if (hasOnlyText(*element)) {
            const std::string original = element->textContent();
            std::string text = StringUtils::collapseWhitespace(original);
            if (element->localName() == "language") {
                text = canonicalLanguage(text);
            }
            if (text != original) {
                element->setTextContent(text);
                ++collapsed;
            }
        }

        const std::string text = element->textContent();
        const std::string id = element->attributeOr("id");
        const bool referenced = !id.empty();
        if (StringUtils::isBlank(text) && !referenced) {
            element->detach();
            ++removed;
            continue;
        }
        if (!seen.emplace(element->name(), StringUtils::collapseWhitespace(text)).second && !referenced) {
            element->detach();
            ++removed;
        }
    }

    // ========== 书名 ==========
    if (!metadata->firstChildElement("dc:title")) {
        xml::Node::NodePtr title = xml::MarkupUtils::textElement("dc:title", default_title_);
        metadata->insertChild(0, std::move(title));
        FILTER_INFO("Added missing dc:title '{}'", default_title_);
    }

    // ========== 唯一标识符 ==========
    xml::Node* unique = nullptr;
    xml::Node* first_identifier = nullptr;
    for (xml::Node* identifier : metadata->childElements("dc:identifier")) {
        if (!first_identifier) {
            first_identifier = identifier;
        }
        if (!uid_ref.empty() && identifier->attributeOr("id") == uid_ref) {
            unique = identifier;
            break;
        }
    }
    if (!unique) {
        const std::string id = uid_ref.empty() ? "BookId" : uid_ref;
        if (first_identifier && !first_identifier->hasAttribute("id")) {
            first_identifier->setAttribute("id", id);
            root->setAttribute("unique-identifier", id);
        } else if (first_identifier) {
            root->setAttribute("unique-identifier", first_identifier->attributeOr("id"));
        } else {
            xml::Node::NodePtr identifier = xml::MarkupUtils::textElement("dc:identifier",
                                                                          derivedUuid(context.store()));
            identifier->setAttribute("id", id);
            metadata->appendChild(std::move(identifier));
            root->setAttribute("unique-identifier", id);
            FILTER_INFO("Added generated unique identifier");
        }
    }

    context.cache().writeXml(opf_path, opf, cache::SerializationMode::Package);
    context.reloadLayout();
    FILTER_INFO("Normalized metadata of {}: {} fields rewritten, {} removed", opf_path, collapsed, removed);
}

}} // namespace ryuri::filter
