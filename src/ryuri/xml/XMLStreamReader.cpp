#include "ryuri/xml/XMLStreamReader.hpp"
#include "ryuri/xml/XMLEscapes.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <cstring>
#include <limits>

namespace ryuri {
namespace xml {

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate(nullptr);
    if (!parser_) {
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    XML_SetCommentHandler(parser_, commentHandler);
    XML_SetProcessingInstructionHandler(parser_, processingInstructionHandler);
    XML_SetStartDoctypeDeclHandler(parser_, startDoctypeHandler);
    XML_SetXmlDeclHandler(parser_, xmlDeclHandler);
    XML_SetSkippedEntityHandler(parser_, skippedEntityHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

XMLParseError XMLStreamReader::parseBuffer(const char* data, size_t size) {
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    error_line_ = -1;
    pending_text_.clear();
    elements_parsed_ = 0;

    if ((!data && size > 0) || size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        last_error_ = XMLParseError::InvalidInput;
        last_error_message_ = "Invalid input buffer";
        return last_error_;
    }

    if (!initializeParser()) {
        last_error_ = XMLParseError::ParserCreateFailed;
        last_error_message_ = "Failed to create XML parser";
        return last_error_;
    }

    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        last_error_ = XMLParseError::ParseFailed;
        last_error_message_ = "Failed to get parser buffer";
        cleanupParser();
        return last_error_;
    }
    if (size > 0) {
        std::memcpy(expat_buffer, data, size);
    }

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        if (last_error_ == XMLParseError::Ok) {
            last_error_ = XMLParseError::ParseFailed;
            error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
            last_error_message_ = fmt::format("Parse error at line {}, column {}: {}",
                XML_GetCurrentLineNumber(parser_),
                XML_GetCurrentColumnNumber(parser_),
                XML_ErrorString(XML_GetErrorCode(parser_)));
        }
        XML_DEBUG("{}", last_error_message_);
        cleanupParser();
        return last_error_;
    }

    flushText();
    cleanupParser();
    return last_error_;
}

template<typename F>
void XMLStreamReader::guarded(const char* what, F&& func) {
    if (last_error_ != XMLParseError::Ok) {
        return;
    }
    try {
        func();
    } catch (const std::exception& e) {
        last_error_ = XMLParseError::CallbackError;
        error_line_ = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
        last_error_message_ = fmt::format("{} callback error at line {}: {}", what, error_line_, e.what());
        if (parser_) {
            XML_StopParser(parser_, XML_FALSE);
        }
    }
}

void XMLStreamReader::flushText() {
    if (pending_text_.empty()) {
        return;
    }
    if (text_callback_) {
        std::string text;
        text.swap(pending_text_);
        guarded("Text", [&] { text_callback_(text); });
    } else {
        pending_text_.clear();
    }
}

// ========== libexpat回调 ==========

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();
    reader->elements_parsed_++;

    if (!reader->start_element_callback_) return;

    std::vector<XMLAttribute> attributes;
    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            attributes.push_back({attrs[i], attrs[i + 1] ? attrs[i + 1] : ""});
        }
    }
    reader->guarded("Start element", [&] {
        reader->start_element_callback_(std::string_view{name}, attributes);
    });
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();
    if (reader->end_element_callback_) {
        reader->guarded("End element", [&] { reader->end_element_callback_(std::string_view{name}); });
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->pending_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLCALL XMLStreamReader::commentHandler(void* userData, const XML_Char* data) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();
    if (reader->comment_callback_) {
        reader->guarded("Comment", [&] { reader->comment_callback_(std::string_view{data}); });
    }
}

void XMLCALL XMLStreamReader::processingInstructionHandler(void* userData, const XML_Char* target, const XML_Char* data) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();
    if (reader->pi_callback_) {
        reader->guarded("Processing instruction", [&] {
            reader->pi_callback_(std::string_view{target}, data ? std::string_view{data} : std::string_view{});
        });
    }
}

void XMLCALL XMLStreamReader::startDoctypeHandler(void* userData, const XML_Char* name, const XML_Char* sysid,
                                                  const XML_Char* pubid, int /*has_internal_subset*/) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    if (reader->doctype_callback_) {
        reader->guarded("Doctype", [&] {
            reader->doctype_callback_(std::string_view{name},
                                      sysid ? std::string_view{sysid} : std::string_view{},
                                      pubid ? std::string_view{pubid} : std::string_view{});
        });
    }
}

void XMLCALL XMLStreamReader::xmlDeclHandler(void* userData, const XML_Char* /*version*/,
                                             const XML_Char* /*encoding*/, int /*standalone*/) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    if (reader->xml_decl_callback_) {
        reader->guarded("XML declaration", [&] { reader->xml_decl_callback_(); });
    }
}

void XMLCALL XMLStreamReader::skippedEntityHandler(void* userData, const XML_Char* name, int is_parameter_entity) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    if (is_parameter_entity) {
        return;
    }
    // 外部DTD未加载时，HTML 命名实体会走到这里
    const char* replacement = htmlEntityUtf8(name);
    if (replacement) {
        reader->pending_text_.append(replacement);
    } else {
        XML_WARN("Dropping unknown entity reference &{};", name);
    }
}

}} // namespace ryuri::xml
