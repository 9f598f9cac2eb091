/**
 * @file XMLStreamWriter.hpp
 * @brief 内存XML流写入器
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ryuri {
namespace xml {

/**
 * @brief 内存XML流写入器
 *
 * 按调用顺序输出，不做缩进；空白由调用方以文本节点形式写入。
 * XHTML 模式下只有 void 元素会自闭合，其余空元素写成成对标签。
 */
class XMLStreamWriter {
public:
    enum class EmptyElementStyle {
        SelfClose,     // 所有空元素写作 <x/>
        XhtmlVoidOnly  // 仅 HTML void 元素自闭合
    };

    explicit XMLStreamWriter(EmptyElementStyle style = EmptyElementStyle::SelfClose);

    /**
     * @brief 写出 XML 声明
     */
    void startDocument(const std::string& encoding = "utf-8");
    void writeDoctype(const std::string& doctype);

    void startElement(const std::string& name);
    void writeAttribute(const std::string& name, const std::string& value);
    void endElement();

    void writeText(std::string_view text);
    void writeComment(std::string_view comment);
    void writeProcessingInstruction(std::string_view target, std::string_view data);
    void writeRaw(std::string_view data);

    /**
     * @brief 结束文档（关闭所有未关闭元素）
     */
    void endDocument();

    const std::string& toString() const { return buffer_; }
    std::string takeString();

    size_t depth() const { return element_stack_.size(); }

private:
    void ensureElementClosed();
    bool isVoidElement(const std::string& name) const;

    EmptyElementStyle style_;
    std::string buffer_;
    std::vector<std::string> element_stack_;
    bool in_start_tag_ = false;
};

}} // namespace ryuri::xml
