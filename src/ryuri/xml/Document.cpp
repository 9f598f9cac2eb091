#include "ryuri/xml/Document.hpp"
#include "ryuri/xml/XMLStreamReader.hpp"
#include "ryuri/xml/XMLStreamWriter.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"

namespace ryuri {
namespace xml {

// ========== Node ==========

Node::NodePtr Node::element(const std::string& name) {
    return NodePtr(new Node(Type::Element, name, ""));
}

Node::NodePtr Node::text(const std::string& content) {
    return NodePtr(new Node(Type::Text, "", content));
}

Node::NodePtr Node::comment(const std::string& content) {
    return NodePtr(new Node(Type::Comment, "", content));
}

Node::NodePtr Node::processingInstruction(const std::string& target, const std::string& data) {
    return NodePtr(new Node(Type::ProcessingInstruction, target, data));
}

std::string Node::localName() const {
    const auto colon = name_.rfind(':');
    return colon == std::string::npos ? name_ : name_.substr(colon + 1);
}

const std::string* Node::attribute(const std::string& name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name) {
            return &attr.value;
        }
    }
    return nullptr;
}

std::string Node::attributeOr(const std::string& name, const std::string& fallback) const {
    const std::string* v = attribute(name);
    return v ? *v : fallback;
}

void Node::setAttribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    attributes_.push_back({name, value});
}

bool Node::removeAttribute(const std::string& name) {
    for (auto it = attributes_.begin(); it != attributes_.end(); ++it) {
        if (it->name == name) {
            attributes_.erase(it);
            return true;
        }
    }
    return false;
}

Node& Node::appendChild(NodePtr child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

Node& Node::insertChild(size_t index, NodePtr child) {
    if (index > children_.size()) {
        index = children_.size();
    }
    child->parent_ = this;
    auto it = children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    return **it;
}

Node::NodePtr Node::removeChild(size_t index) {
    if (index >= children_.size()) {
        return nullptr;
    }
    NodePtr removed = std::move(children_[index]);
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
    removed->parent_ = nullptr;
    return removed;
}

Node::NodePtr Node::detach() {
    if (!parent_) {
        return nullptr;
    }
    return parent_->removeChild(indexInParent());
}

size_t Node::indexInParent() const {
    if (!parent_) {
        return static_cast<size_t>(-1);
    }
    const auto& siblings = parent_->children_;
    for (size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].get() == this) {
            return i;
        }
    }
    return static_cast<size_t>(-1);
}

Node* Node::firstChildElement(const std::string& name) const {
    for (const auto& child : children_) {
        if (child->isElement() && (name.empty() || child->name_ == name || child->localName() == name)) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<Node*> Node::childElements(const std::string& name) const {
    std::vector<Node*> out;
    for (const auto& child : children_) {
        if (child->isElement() && (name.empty() || child->name_ == name || child->localName() == name)) {
            out.push_back(child.get());
        }
    }
    return out;
}

void Node::collect(const std::string& name, std::vector<Node*>& out) const {
    for (const auto& child : children_) {
        if (!child->isElement()) continue;
        if (name.empty() || child->name_ == name || child->localName() == name) {
            out.push_back(child.get());
        }
        child->collect(name, out);
    }
}

std::vector<Node*> Node::descendants(const std::string& name) const {
    std::vector<Node*> out;
    collect(name, out);
    return out;
}

Node* Node::findDescendant(const std::function<bool(const Node&)>& pred) const {
    for (const auto& child : children_) {
        if (pred(*child)) {
            return child.get();
        }
        if (Node* found = child->findDescendant(pred)) {
            return found;
        }
    }
    return nullptr;
}

std::string Node::textContent() const {
    if (type_ == Type::Text) {
        return value_;
    }
    std::string out;
    for (const auto& child : children_) {
        if (child->type_ == Type::Text || child->type_ == Type::Element) {
            out += child->textContent();
        }
    }
    return out;
}

void Node::setTextContent(const std::string& text) {
    children_.clear();
    if (!text.empty()) {
        appendChild(Node::text(text));
    }
}

Node::NodePtr Node::clone() const {
    NodePtr copy(new Node(type_, name_, value_));
    copy->attributes_ = attributes_;
    for (const auto& child : children_) {
        copy->appendChild(child->clone());
    }
    return copy;
}

void Node::write(XMLStreamWriter& writer) const {
    switch (type_) {
        case Type::Element:
            writer.startElement(name_);
            for (const auto& attr : attributes_) {
                writer.writeAttribute(attr.name, attr.value);
            }
            for (const auto& child : children_) {
                child->write(writer);
            }
            writer.endElement();
            break;
        case Type::Text:
            writer.writeText(value_);
            break;
        case Type::Comment:
            writer.writeComment(value_);
            break;
        case Type::ProcessingInstruction:
            writer.writeProcessingInstruction(name_, value_);
            break;
    }
}

// ========== Document ==========

namespace {

std::string buildDoctype(std::string_view name, std::string_view system_id, std::string_view public_id) {
    std::string out = "<!DOCTYPE ";
    out += name;
    if (!public_id.empty()) {
        out += " PUBLIC \"";
        out += public_id;
        out += "\"";
        if (!system_id.empty()) {
            out += " \"";
            out += system_id;
            out += "\"";
        }
    } else if (!system_id.empty()) {
        out += " SYSTEM \"";
        out += system_id;
        out += "\"";
    }
    out += ">";
    return out;
}

} // namespace

Document Document::parse(const std::string& text, const std::string& source_path) {
    Document doc;
    std::vector<Node*> stack;

    XMLStreamReader reader;
    reader.setXmlDeclCallback([&doc]() { doc.has_declaration_ = true; });
    reader.setDoctypeCallback([&doc](std::string_view name, std::string_view sysid, std::string_view pubid) {
        doc.doctype_ = buildDoctype(name, sysid, pubid);
    });
    reader.setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>& attrs) {
        Node::NodePtr element = Node::element(std::string(name));
        for (const auto& a : attrs) {
            element->setAttribute(a.name, a.value);
        }
        Node* raw = element.get();
        if (stack.empty()) {
            doc.root_ = std::move(element);
        } else {
            stack.back()->appendChild(std::move(element));
        }
        stack.push_back(raw);
    });
    reader.setEndElementCallback([&](std::string_view) {
        if (!stack.empty()) {
            stack.pop_back();
        }
    });
    reader.setTextCallback([&](std::string_view content) {
        // 根元素之外的空白不保留
        if (!stack.empty()) {
            stack.back()->appendChild(Node::text(std::string(content)));
        }
    });
    reader.setCommentCallback([&](std::string_view content) {
        if (!stack.empty()) {
            stack.back()->appendChild(Node::comment(std::string(content)));
        }
    });
    reader.setProcessingInstructionCallback([&](std::string_view target, std::string_view data) {
        if (!stack.empty()) {
            stack.back()->appendChild(Node::processingInstruction(std::string(target), std::string(data)));
        }
    });

    const XMLParseError result = reader.parseBuffer(text.data(), text.size());
    if (!isSuccess(result)) {
        RYURI_THROW_XML(core::ErrorCode::MalformedMarkup, reader.getLastError(), source_path,
                        reader.getErrorLine());
    }
    if (!doc.root_) {
        RYURI_THROW_XML(core::ErrorCode::MalformedMarkup, "Document has no root element", source_path, -1);
    }

    XML_DEBUG("Parsed {} ({} elements)", source_path, reader.getElementsParsed());
    return doc;
}

Document Document::parse(const std::vector<uint8_t>& bytes, const std::string& source_path) {
    return parse(std::string(bytes.begin(), bytes.end()), source_path);
}

Document Document::clone() const {
    Document copy;
    if (root_) {
        copy.root_ = root_->clone();
    }
    copy.has_declaration_ = has_declaration_;
    copy.doctype_ = doctype_;
    return copy;
}

}} // namespace ryuri::xml
