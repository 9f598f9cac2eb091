#include "ryuri/filter/MarkupOptimizeFilter.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include "ryuri/xml/MarkupUtils.hpp"

namespace ryuri {
namespace filter {

using xml::MarkupUtils;
using xml::Node;

MarkupOptimizeFilter::MarkupOptimizeFilter(const FilterOptions& options)
    : unwrap_spans_(boolOption(options, "unwrap_spans", true)) {
}

size_t MarkupOptimizeFilter::optimize(xml::Document& document) const {
    Node* root = document.root();
    size_t unwrapped = 0;

    for (Node* element : root->descendants()) {
        for (const char* attr : {"class", "style"}) {
            const std::string* value = element->attribute(attr);
            if (value && utils::StringUtils::isBlank(*value)) {
                element->removeAttribute(attr);
            }
        }
    }

    if (unwrap_spans_) {
        // 自底向上展开，避免展开后访问已失效的节点
        std::vector<Node*> spans = root->descendants("span");
        for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
            if ((*it)->name() == "span" && (*it)->attributes().empty()) {
                MarkupUtils::unwrap(**it);
                ++unwrapped;
            }
        }
    }

    if (!root->hasAttribute("xmlns")) {
        root->setAttribute("xmlns", core::EpubConstants::kXhtmlNamespace);
    }
    if (MarkupUtils::usesPrefix(*root, "epub")) {
        MarkupUtils::ensureNamespace(*root, "epub", core::EpubConstants::kOpsNamespace);
    }

    Node* head = MarkupUtils::head(document);
    if (!head) {
        head = &root->insertChild(0, Node::element("head"));
    }
    Node* title = head->firstChildElement("title");
    if (!title) {
        title = &head->insertChild(0, Node::element("title"));
    }
    if (utils::StringUtils::isBlank(title->textContent())) {
        title->setTextContent(MarkupUtils::extractTitle(document));
    }
    return unwrapped;
}

void MarkupOptimizeFilter::apply(FilterContext& context) {
    for (const auto& path : context.layout().markupPaths()) {
        if (!context.store().exists(path)) {
            continue;
        }
        xml::Document& document = context.cache().readXml(path);
        if (document.root()->localName() != "html") {
            FILTER_WARN("Skipping {}: root element is <{}>", path, document.root()->name());
            continue;
        }
        const size_t unwrapped = optimize(document);
        context.cache().writeXml(path, document, cache::SerializationMode::Markup);
        FILTER_DEBUG("Optimized {} ({} spans unwrapped)", path, unwrapped);
    }
}

}} // namespace ryuri::filter
