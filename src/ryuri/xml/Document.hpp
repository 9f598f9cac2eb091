#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ryuri {
namespace xml {

class XMLStreamWriter;

/**
 * @brief 混合内容文档树节点
 *
 * 元素节点保存名称（含前缀）、有序属性和子节点；文本、注释、
 * 处理指令节点保存各自的字符数据。子节点由父节点独占。
 */
class Node {
public:
    enum class Type {
        Element,
        Text,
        Comment,
        ProcessingInstruction
    };

    struct Attribute {
        std::string name;
        std::string value;
    };

    using NodePtr = std::unique_ptr<Node>;

    // ========== 工厂 ==========
    static NodePtr element(const std::string& name);
    static NodePtr text(const std::string& content);
    static NodePtr comment(const std::string& content);
    static NodePtr processingInstruction(const std::string& target, const std::string& data);

    Type type() const noexcept { return type_; }
    bool isElement() const noexcept { return type_ == Type::Element; }
    bool isText() const noexcept { return type_ == Type::Text; }

    /**
     * @brief 元素名或处理指令目标
     */
    const std::string& name() const noexcept { return name_; }
    void setName(const std::string& name) { name_ = name; }

    /**
     * @brief 去掉前缀的本地名
     */
    std::string localName() const;

    /**
     * @brief 文本/注释/处理指令数据
     */
    const std::string& value() const noexcept { return value_; }
    void setValue(const std::string& value) { value_ = value; }

    // ========== 属性 ==========
    const std::vector<Attribute>& attributes() const noexcept { return attributes_; }
    const std::string* attribute(const std::string& name) const;
    std::string attributeOr(const std::string& name, const std::string& fallback = "") const;
    bool hasAttribute(const std::string& name) const { return attribute(name) != nullptr; }
    void setAttribute(const std::string& name, const std::string& value);
    bool removeAttribute(const std::string& name);

    // ========== 子节点 ==========
    const std::vector<NodePtr>& children() const noexcept { return children_; }
    Node* parent() const noexcept { return parent_; }

    Node& appendChild(NodePtr child);
    Node& insertChild(size_t index, NodePtr child);
    NodePtr removeChild(size_t index);
    NodePtr detach();

    /**
     * @brief 在父节点中的下标；无父节点时返回 size_t(-1)
     */
    size_t indexInParent() const;

    Node* firstChildElement(const std::string& name = "") const;
    std::vector<Node*> childElements(const std::string& name = "") const;

    /**
     * @brief 深度优先查找后代元素（按名称或本地名匹配，空串匹配全部）
     */
    std::vector<Node*> descendants(const std::string& name = "") const;
    Node* findDescendant(const std::function<bool(const Node&)>& pred) const;

    /**
     * @brief 所有后代文本拼接
     */
    std::string textContent() const;

    /**
     * @brief 用单个文本节点替换全部子节点
     */
    void setTextContent(const std::string& text);

    NodePtr clone() const;

    void write(XMLStreamWriter& writer) const;

private:
    Node(Type type, std::string name, std::string value)
        : type_(type), name_(std::move(name)), value_(std::move(value)) {}

    void collect(const std::string& name, std::vector<Node*>& out) const;

    Type type_;
    std::string name_;
    std::string value_;
    std::vector<Attribute> attributes_;
    std::vector<NodePtr> children_;
    Node* parent_ = nullptr;
};

/**
 * @brief 解析后的XML文档
 */
class Document {
public:
    Document() = default;
    explicit Document(Node::NodePtr root) : root_(std::move(root)) {}

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;
    Document(Document&&) noexcept = default;
    Document& operator=(Document&&) noexcept = default;

    /**
     * @brief 从字节解析
     * @param source_path 仅用于错误信息
     * @throws core::XMLException(MalformedMarkup)
     */
    static Document parse(const std::vector<uint8_t>& bytes, const std::string& source_path);
    static Document parse(const std::string& text, const std::string& source_path);

    Node* root() const noexcept { return root_.get(); }
    void setRoot(Node::NodePtr root) { root_ = std::move(root); }

    bool hasDeclaration() const noexcept { return has_declaration_; }
    void setHasDeclaration(bool value) { has_declaration_ = value; }

    /**
     * @brief 原始 doctype 声明文本（如 "<!DOCTYPE html>"），没有则为空
     */
    const std::string& doctype() const noexcept { return doctype_; }
    void setDoctype(const std::string& doctype) { doctype_ = doctype; }

    Document clone() const;

private:
    Node::NodePtr root_;
    bool has_declaration_ = false;
    std::string doctype_;
};

}} // namespace ryuri::xml
