#pragma once

#include "ryuri/filter/Filter.hpp"
#include <string>
#include <vector>

namespace ryuri {
namespace layout {

/**
 * @brief 目标阅读平台
 */
enum class Platform {
    Generic,
    Duokan,
    Zhangyue,
    Kindle
};

const char* toString(Platform platform) noexcept;

/**
 * @brief 解析平台名（大小写不敏感）
 * @return 无法识别时返回 false
 */
bool parsePlatform(const std::string& name, Platform& out);

/**
 * @brief 面向阅读平台的排版改写（过滤器名 "layout"）
 *
 * 依次完成：可选的标准目录重组、字体表 Styles/fonts.css 与可选的
 * 基础样式表 Styles/base.css 生成与链接、脚注改写为 A_n/B_n 弹注、
 * 可选的章节外框、为正文加入追踪 span、可选的 NCX 重建，
 * 最后按平台补充元数据。
 *
 * 选项：
 * - platform：generic / duokan / zhangyue / kindle
 * - standard：以下四项的默认值，默认 false
 * - restructure：归入 Text/ Styles/ Images/ Fonts/ 并把章节命名为 f{n}.xhtml
 * - base_css：写入并链接基础样式表
 * - wrap_chapters：正文包入 book-columns/book-inner 外框并加入 kobostylehacks 样式
 * - ncx：按阅读顺序重建 NCX
 */
class LayoutTransform : public filter::IFilter {
public:
    static constexpr const char* kName = "layout";
    static constexpr const char* kFontSheetName = "fonts.css";
    static constexpr const char* kBaseSheetName = "base.css";
    static constexpr const char* kNoteIconName = "note.svg";
    static constexpr const char* kNcxName = "toc.ncx";

    /**
     * @throws core::ParameterException 未知平台
     */
    explicit LayoutTransform(const filter::FilterOptions& options);
    explicit LayoutTransform(Platform platform) : platform_(platform) {}

    const char* name() const override { return kName; }

    void apply(filter::FilterContext& context) override;

    Platform platform() const { return platform_; }

    bool restructures() const { return restructure_; }
    bool writesBaseSheet() const { return base_css_; }
    bool wrapsChapters() const { return wrap_chapters_; }
    bool rebuildsNcx() const { return ncx_; }

    /**
     * @brief 平台对应的脚注锚点 class
     */
    const char* footnoteClass() const;

    /**
     * @brief 改写一个文档中的脚注
     * @param doc_path 文档在包内的路径（用于计算图标相对路径）
     * @param icon_path 图标在包内的路径
     * @return 改写的脚注数
     */
    size_t rewriteFootnotes(xml::Document& document, const std::string& doc_path,
                            const std::string& icon_path) const;

    /**
     * @brief 按出现顺序收集样式表与 style 属性中的字体族（已去重，不含通用族）
     */
    static std::vector<std::string> collectFontFamilies(filter::FilterContext& context);

    /**
     * @brief 生成字体表内容
     * @param sheet_path 字体表在包内的路径
     * @return 没有可声明的字体族时为空串
     */
    static std::string buildFontSheet(filter::FilterContext& context, const std::string& sheet_path);

    /**
     * @brief 基础样式表内容
     */
    static const char* baseSheet();

    /**
     * @brief 把 body 内容包入 div#book-columns > div#book-inner，并在 head 中加入 kobostylehacks 样式
     * @return 已有外框时返回 false
     */
    static bool wrapChapter(xml::Document& document);

    /**
     * @brief 按阅读顺序生成 NCX（每个章节一个 navPoint，标题取自章节）
     * @param ncx_path NCX 在包内的路径
     */
    static xml::Document buildNcx(filter::FilterContext& context, const std::string& ncx_path);

private:
    bool usesImageIcon() const { return platform_ == Platform::Duokan || platform_ == Platform::Zhangyue; }

    void writeFontSheet(filter::FilterContext& context, xml::Document& opf, bool& opf_changed);
    void writeBaseSheet(filter::FilterContext& context, xml::Document& opf, bool& opf_changed) const;
    void writeNcx(filter::FilterContext& context, xml::Document& opf, bool& opf_changed) const;
    void addPlatformMeta(xml::Document& opf, bool& opf_changed) const;
    void ensureNoteIcon(filter::FilterContext& context, xml::Document& opf, const std::string& icon_path,
                        bool& opf_changed) const;

    Platform platform_ = Platform::Generic;
    bool restructure_ = false;
    bool base_css_ = false;
    bool wrap_chapters_ = false;
    bool ncx_ = false;
};

}} // namespace ryuri::layout
