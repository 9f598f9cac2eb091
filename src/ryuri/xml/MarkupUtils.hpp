#pragma once

#include "ryuri/xml/Document.hpp"
#include <string>

namespace ryuri {
namespace xml {

/**
 * @brief XHTML 文档树辅助函数
 */
class MarkupUtils {
public:
    static Node* head(const Document& document);
    static Node* body(const Document& document);

    /**
     * @brief 章节标题：第一个 h1，其次 <title>，否则 "Chapter"
     */
    static std::string extractTitle(const Document& document);

    /**
     * @brief 文档中是否有元素名或属性名使用了给定前缀
     */
    static bool usesPrefix(const Node& root, const std::string& prefix);

    /**
     * @brief 在根元素上声明命名空间前缀（已声明则不变）
     * @return 是否新增了声明
     */
    static bool ensureNamespace(Node& root, const std::string& prefix, const std::string& uri);

    /**
     * @brief 用子节点替换元素本身
     */
    static void unwrap(Node& element);

    static bool hasClass(const Node& element, const std::string& class_name);
    static void addClass(Node& element, const std::string& class_name);

    /**
     * @brief 按 id 查找元素
     */
    static Node* findById(const Node& root, const std::string& id);

    /**
     * @brief 创建仅含一个文本子节点的元素
     */
    static Node::NodePtr textElement(const std::string& name, const std::string& text);
};

}} // namespace ryuri::xml
