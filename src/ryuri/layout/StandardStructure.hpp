#pragma once

#include "ryuri/filter/Filter.hpp"
#include <map>
#include <string>

namespace ryuri {
namespace layout {

/**
 * @brief 标准 OEBPS 目录结构
 *
 * 把清单中的内容条目按类型归入 OPF 同级的 Text/、Styles/、Images/、Fonts/，
 * 阅读顺序中的文档依次命名为 f1.xhtml、f2.xhtml……
 * 正文、样式表、NCX 与 OPF 中指向被移动条目的引用随之改写。
 */
class StandardStructure {
public:
    /// 旧路径 -> 新路径
    using Moves = std::map<std::string, std::string>;

    static constexpr const char* kTextDir = "Text";
    static constexpr const char* kStylesDir = "Styles";
    static constexpr const char* kImagesDir = "Images";
    static constexpr const char* kFontsDir = "Fonts";

    /**
     * @brief 计算移动计划（不含原地不动的条目）
     */
    static Moves plan(const package::PackageLayout& layout, const store::PackageStore& store);

    /**
     * @brief 执行移动并改写引用
     * @return 移动的条目数；为 0 时包不变
     */
    static size_t apply(filter::FilterContext& context);

    /**
     * @brief 把 refer_path 中的 href 换算到 new_refer_path，目标按 moves 重定位
     *
     * 外部链接、纯片段和无法解析的 href 原样返回；查询与片段保留。
     */
    static std::string rebaseHref(const std::string& href, const std::string& refer_path,
                                  const std::string& new_refer_path, const Moves& moves);

    /**
     * @brief 改写样式文本中的 url(...) 与 @import "..." 引用
     * @return 改写的引用数
     */
    static size_t rebaseCss(std::string& css, const std::string& refer_path,
                            const std::string& new_refer_path, const Moves& moves);
};

}} // namespace ryuri::layout
