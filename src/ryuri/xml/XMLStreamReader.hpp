#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <expat.h>

namespace ryuri {
namespace xml {

/**
 * @brief 基于libexpat的流式XML解析器
 *
 * 非命名空间感知：元素名和属性名保持带前缀的原样（如 dc:title、xmlns:epub），
 * 以便序列化时原样写回。相邻字符数据合并为一次文本回调，保留空白。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

struct XMLAttribute {
    std::string name;
    std::string value;
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes)>;
    using EndElementCallback = std::function<void(std::string_view name)>;
    using TextCallback = std::function<void(std::string_view text)>;
    using CommentCallback = std::function<void(std::string_view comment)>;
    using ProcessingInstructionCallback = std::function<void(std::string_view target, std::string_view data)>;
    using DoctypeCallback = std::function<void(std::string_view name, std::string_view system_id, std::string_view public_id)>;
    using XmlDeclCallback = std::function<void()>;

    XMLStreamReader() = default;
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setCommentCallback(CommentCallback callback) { comment_callback_ = std::move(callback); }
    void setProcessingInstructionCallback(ProcessingInstructionCallback callback) { pi_callback_ = std::move(callback); }
    void setDoctypeCallback(DoctypeCallback callback) { doctype_callback_ = std::move(callback); }
    void setXmlDeclCallback(XmlDeclCallback callback) { xml_decl_callback_ = std::move(callback); }

    /**
     * @brief 解析整块内存
     */
    XMLParseError parseBuffer(const char* data, size_t size);

    const std::string& getLastError() const { return last_error_message_; }
    int getErrorLine() const { return error_line_; }

    size_t getElementsParsed() const { return elements_parsed_; }

private:
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);
    static void XMLCALL commentHandler(void* userData, const XML_Char* data);
    static void XMLCALL processingInstructionHandler(void* userData, const XML_Char* target, const XML_Char* data);
    static void XMLCALL startDoctypeHandler(void* userData, const XML_Char* name, const XML_Char* sysid,
                                            const XML_Char* pubid, int has_internal_subset);
    static void XMLCALL xmlDeclHandler(void* userData, const XML_Char* version, const XML_Char* encoding,
                                       int standalone);
    static void XMLCALL skippedEntityHandler(void* userData, const XML_Char* name, int is_parameter_entity);

    bool initializeParser();
    void cleanupParser();
    void flushText();

    // 回调抛出异常时停止解析并记录错误
    template<typename F>
    void guarded(const char* what, F&& func);

    XML_Parser parser_ = nullptr;
    std::string pending_text_;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int error_line_ = -1;
    size_t elements_parsed_ = 0;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    CommentCallback comment_callback_;
    ProcessingInstructionCallback pi_callback_;
    DoctypeCallback doctype_callback_;
    XmlDeclCallback xml_decl_callback_;
};

}} // namespace ryuri::xml
