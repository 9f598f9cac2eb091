#include "ryuri/xml/MarkupUtils.hpp"
#include "ryuri/utils/StringUtils.hpp"

namespace ryuri {
namespace xml {

Node* MarkupUtils::head(const Document& document) {
    return document.root() ? document.root()->firstChildElement("head") : nullptr;
}

Node* MarkupUtils::body(const Document& document) {
    return document.root() ? document.root()->firstChildElement("body") : nullptr;
}

std::string MarkupUtils::extractTitle(const Document& document) {
    if (!document.root()) {
        return "Chapter";
    }
    for (const char* name : {"h1", "title"}) {
        const auto found = document.root()->descendants(name);
        if (!found.empty()) {
            const std::string title = utils::StringUtils::collapseWhitespace(found.front()->textContent());
            if (!title.empty()) {
                return title;
            }
        }
    }
    return "Chapter";
}

bool MarkupUtils::usesPrefix(const Node& root, const std::string& prefix) {
    const std::string tag = prefix + ":";
    const std::string declaration = "xmlns:" + prefix;
    auto matches = [&](const Node& node) {
        if (!node.isElement()) {
            return false;
        }
        if (utils::StringUtils::startsWith(node.name(), tag)) {
            return true;
        }
        for (const auto& attr : node.attributes()) {
            if (attr.name != declaration && utils::StringUtils::startsWith(attr.name, tag)) {
                return true;
            }
        }
        return false;
    };
    return matches(root) || root.findDescendant(matches) != nullptr;
}

bool MarkupUtils::ensureNamespace(Node& root, const std::string& prefix, const std::string& uri) {
    const std::string declaration = "xmlns:" + prefix;
    if (root.hasAttribute(declaration)) {
        return false;
    }
    root.setAttribute(declaration, uri);
    return true;
}

void MarkupUtils::unwrap(Node& element) {
    Node* parent = element.parent();
    if (!parent) {
        return;
    }
    size_t index = element.indexInParent();
    Node::NodePtr owned = parent->removeChild(index);
    while (!owned->children().empty()) {
        parent->insertChild(index++, owned->removeChild(0));
    }
}

bool MarkupUtils::hasClass(const Node& element, const std::string& class_name) {
    const std::string* value = element.attribute("class");
    return value && utils::StringUtils::hasToken(*value, class_name);
}

void MarkupUtils::addClass(Node& element, const std::string& class_name) {
    if (hasClass(element, class_name)) {
        return;
    }
    const std::string current = utils::StringUtils::trim(element.attributeOr("class"));
    element.setAttribute("class", current.empty() ? class_name : current + " " + class_name);
}

Node* MarkupUtils::findById(const Node& root, const std::string& id) {
    if (root.isElement() && root.attributeOr("id") == id) {
        return const_cast<Node*>(&root);
    }
    return root.findDescendant([&](const Node& node) {
        return node.isElement() && node.attributeOr("id") == id;
    });
}

Node::NodePtr MarkupUtils::textElement(const std::string& name, const std::string& text) {
    Node::NodePtr element = Node::element(name);
    if (!text.empty()) {
        element->appendChild(Node::text(text));
    }
    return element;
}

}} // namespace ryuri::xml
