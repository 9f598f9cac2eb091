#include "ryuri/layout/TrackingSpans.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include "ryuri/xml/MarkupUtils.hpp"
#include <cstdint>
#include <utf8.h>

namespace ryuri {
namespace layout {

using xml::Node;

namespace {

bool isTerminator(uint32_t cp) {
    switch (cp) {
        case 0x3002:  // 。
        case 0xFF01:  // ！
        case 0xFF1F:  // ？
        case '!':
        case '?':
        case '.':
        case 0x2026:  // …
            return true;
        default:
            return false;
    }
}

bool isCloser(uint32_t cp) {
    switch (cp) {
        case '"':
        case '\'':
        case ')':
        case 0x201D:  // ”
        case 0x2019:  // ’
        case 0xFF09:  // ）
        case 0x300D:  // 」
        case 0x300F:  // 』
        case 0x3011:  // 】
        case 0x300B:  // 》
            return true;
        default:
            return false;
    }
}

bool insideFootnote(const Node& node) {
    for (const Node* p = node.parent(); p; p = p->parent()) {
        if (p->localName() == "aside" && utils::StringUtils::hasToken(p->attributeOr("epub:type"), "footnote")) {
            return true;
        }
    }
    return false;
}

void collectTextNodes(Node& node, std::vector<Node*>& out) {
    for (const auto& child : node.children()) {
        if (child->isText()) {
            if (TrackingSpans::isEligibleBlock(node.localName()) && !insideFootnote(*child)) {
                out.push_back(child.get());
            }
        } else if (child->isElement()) {
            collectTextNodes(*child, out);
        }
    }
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

} // namespace

bool TrackingSpans::isEligibleBlock(const std::string& local_name) {
    static const char* const kBlocks[] = {
        "p", "h1", "h2", "h3", "h4", "h5", "h6", "li", "dt", "dd",
        "blockquote", "figcaption", "td", "th", "div"
    };
    for (const char* block : kBlocks) {
        if (local_name == block) {
            return true;
        }
    }
    return false;
}

bool TrackingSpans::hasSpans(const xml::Node& root) {
    return root.findDescendant([](const Node& node) {
        return node.isElement() && node.localName() == "span" && xml::MarkupUtils::hasClass(node, kSpanClass);
    }) != nullptr;
}

std::vector<std::string> TrackingSpans::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    auto it = text.begin();
    const auto end = text.end();
    while (it != end) {
        const auto start = it;
        const uint32_t cp = utf8::next(it, end);
        current.append(start, it);
        if (!isTerminator(cp)) {
            continue;
        }
        while (it != end) {
            const uint32_t following = utf8::peek_next(it, end);
            if (!isTerminator(following) && !isCloser(following)) {
                break;
            }
            const auto mark = it;
            utf8::next(it, end);
            current.append(mark, it);
        }
        sentences.push_back(std::move(current));
        current.clear();
    }
    if (!current.empty()) {
        sentences.push_back(std::move(current));
    }
    return sentences;
}

size_t TrackingSpans::apply(xml::Document& document) {
    Node* body = xml::MarkupUtils::body(document);
    if (!body || hasSpans(*document.root())) {
        return 0;
    }

    std::vector<Node*> texts;
    collectTextNodes(*body, texts);

    size_t paragraph = 0;
    size_t sentence = 0;
    size_t added = 0;
    const Node* current_block = nullptr;

    for (Node* text : texts) {
        if (utils::StringUtils::isBlank(text->value())) {
            continue;
        }
        Node* block = text->parent();
        if (block != current_block) {
            current_block = block;
            ++paragraph;
            sentence = 0;
        }

        const std::vector<std::string> pieces = splitSentences(text->value());
        size_t index = text->indexInParent();
        block->removeChild(index);  // text 此后失效

        for (const auto& piece : pieces) {
            size_t first = 0;
            while (first < piece.size() && isSpace(piece[first])) ++first;
            size_t last = piece.size();
            while (last > first && isSpace(piece[last - 1])) --last;

            if (first > 0) {
                block->insertChild(index++, Node::text(piece.substr(0, first)));
            }
            if (last > first) {
                Node::NodePtr span = Node::element("span");
                span->setAttribute("class", kSpanClass);
                span->setAttribute("id", "kobo." + std::to_string(paragraph) + "." + std::to_string(++sentence));
                span->appendChild(Node::text(piece.substr(first, last - first)));
                block->insertChild(index++, std::move(span));
                ++added;
            }
            if (last < piece.size()) {
                block->insertChild(index++, Node::text(piece.substr(last)));
            }
        }
    }
    RYURI_LOG_LAYOUT_DEBUG("Added {} tracking spans over {} paragraphs", added, paragraph);
    return added;
}

}} // namespace ryuri::layout
