#pragma once

#include "ryuri/xml/Document.hpp"
#include <string>
#include <vector>

namespace ryuri {
namespace layout {

/**
 * @brief 阅读进度追踪 span（kobo.P.S）
 *
 * 含直接文本的块元素各算一个段落 P，段内按句末标点切分为句子 S，
 * 每句包进 <span class="koboSpan" id="kobo.P.S">。P 与 S 均从 1 开始，
 * 句首句尾空白留在 span 外。
 */
class TrackingSpans {
public:
    static constexpr const char* kSpanClass = "koboSpan";

    /**
     * @brief 文档是否已带有追踪 span
     */
    static bool hasSpans(const xml::Node& root);

    /**
     * @brief 为文档加入追踪 span；已带 span 的文档不变
     * @return 新增 span 数
     * @throws utf8::exception 文本不是合法 UTF-8
     */
    static size_t apply(xml::Document& document);

    /**
     * @brief 按句末标点切分，结果依次拼接等于原文
     *
     * 连续的句末标点及其后的右引号、右括号归入同一句。
     */
    static std::vector<std::string> splitSentences(const std::string& text);

    static bool isEligibleBlock(const std::string& local_name);
};

}} // namespace ryuri::layout
