#include "ryuri/xml/XMLStreamWriter.hpp"
#include "ryuri/xml/XMLEscapes.hpp"
#include "ryuri/core/Exception.hpp"
#include <algorithm>
#include <cctype>

namespace ryuri {
namespace xml {

XMLStreamWriter::XMLStreamWriter(EmptyElementStyle style)
    : style_(style) {
    buffer_.reserve(4096);
}

void XMLStreamWriter::startDocument(const std::string& encoding) {
    if (!buffer_.empty()) {
        RYURI_THROW_PARAM("XML declaration must be the first output", "startDocument");
    }
    buffer_ += "<?xml version=\"1.0\" encoding=\"";
    buffer_ += encoding;
    buffer_ += "\"?>\n";
}

void XMLStreamWriter::writeDoctype(const std::string& doctype) {
    ensureElementClosed();
    buffer_ += doctype;
    buffer_ += '\n';
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        RYURI_THROW_PARAM("Element name cannot be empty", "name");
    }
    ensureElementClosed();
    buffer_ += '<';
    buffer_ += name;
    element_stack_.push_back(name);
    in_start_tag_ = true;
}

void XMLStreamWriter::writeAttribute(const std::string& name, const std::string& value) {
    if (!in_start_tag_) {
        RYURI_THROW_PARAM("Cannot write attribute outside of a start tag", name);
    }
    buffer_ += ' ';
    buffer_ += name;
    buffer_ += "=\"";
    appendEscapedAttribute(buffer_, value);
    buffer_ += '"';
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        RYURI_THROW_PARAM("No element to close", "endElement");
    }
    const std::string name = std::move(element_stack_.back());
    element_stack_.pop_back();

    if (in_start_tag_) {
        in_start_tag_ = false;
        if (style_ == EmptyElementStyle::SelfClose || isVoidElement(name)) {
            buffer_ += "/>";
            return;
        }
        buffer_ += '>';
    }
    buffer_ += "</";
    buffer_ += name;
    buffer_ += '>';
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) return;
    ensureElementClosed();
    appendEscapedText(buffer_, text);
}

void XMLStreamWriter::writeComment(std::string_view comment) {
    ensureElementClosed();
    buffer_ += "<!--";
    buffer_ += comment;
    buffer_ += "-->";
}

void XMLStreamWriter::writeProcessingInstruction(std::string_view target, std::string_view data) {
    ensureElementClosed();
    buffer_ += "<?";
    buffer_ += target;
    if (!data.empty()) {
        buffer_ += ' ';
        buffer_ += data;
    }
    buffer_ += "?>";
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_ += data;
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        endElement();
    }
    if (!buffer_.empty() && buffer_.back() != '\n') {
        buffer_ += '\n';
    }
}

std::string XMLStreamWriter::takeString() {
    std::string out;
    out.swap(buffer_);
    element_stack_.clear();
    in_start_tag_ = false;
    return out;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_start_tag_) {
        buffer_ += '>';
        in_start_tag_ = false;
    }
}

bool XMLStreamWriter::isVoidElement(const std::string& name) const {
    static const char* const kVoidElements[] = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"
    };
    const auto colon = name.rfind(':');
    const std::string local = colon == std::string::npos ? name : name.substr(colon + 1);
    return std::any_of(std::begin(kVoidElements), std::end(kVoidElements),
                       [&](const char* v) { return local == v; });
}

}} // namespace ryuri::xml
