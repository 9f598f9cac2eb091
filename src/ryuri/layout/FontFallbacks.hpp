#pragma once

#include <string>
#include <vector>

namespace ryuri {
namespace layout {

/**
 * @brief 常用中文字体族的本地字体回退表
 *
 * 键为书中常见的字体族简写（st、kt、ht、fs、h2、h3、fs2、fzqys、hywfs），
 * 值为 @font-face 的 local() 候选名，按优先级排列。
 */
class FontFallbacks {
public:
    /**
     * @brief 查找字体族的回退列表（大小写不敏感）
     * @return 未收录时为 nullptr
     */
    static const std::vector<std::string>* find(const std::string& family);

    static bool contains(const std::string& family) { return find(family) != nullptr; }

    /**
     * @brief CSS 通用字体族（serif、sans-serif 等）
     */
    static bool isGenericFamily(const std::string& family);
};

}} // namespace ryuri::layout
