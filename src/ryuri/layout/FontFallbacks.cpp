#include "ryuri/layout/FontFallbacks.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include <map>

namespace ryuri {
namespace layout {

namespace {

const std::map<std::string, std::vector<std::string>>& fallbackTable() {
    static const std::map<std::string, std::vector<std::string>> table = {
        {"st", {"st", "宋体", "DK-SONGTI", "STSongti", "STSong", "Song S", "Songti", "Songti SC", "Songti TC"}},
        {"kt", {"kt", "楷体", "方正楷体", "方正楷体_GBK", "方正新楷体_GBK", "DK-KAITI", "STKaiti", "STKai",
                "MKai PRC", "Kaiti", "Kaiti SC", "Kaiti TC"}},
        {"ht", {"ht", "DK-XIHEITI", "黑体", "微软雅黑", "STHeiti", "STHei", "MYing Hei S", "Heiti", "Heiti SC",
                "Heiti TC"}},
        {"fs", {"fs", "DK-FANGSONG", "仿宋", "方正仿宋", "方正仿宋_GBK", "STKaiti", "STKai", "MKai PRC", "Kaiti",
                "Kaiti SC", "Kaiti TC"}},
        {"h2", {"h2", "DK-XIAOBIAOSONG", "方正大标宋_GBK", "方正大标宋简体", "方正大标宋繁体", "STHeiti", "STHei",
                "MYing Hei S", "Heiti", "Heiti SC", "Heiti TC"}},
        {"h3", {"h3", "DK-XIAOBIAOSONG", "h2", "方正小标宋_GBK", "方正小标宋_GB18030", "方正大标宋繁体", "STHeiti",
                "STHei", "MYing Hei S", "Heiti", "Heiti SC", "Heiti TC"}},
        {"fs2", {"fs2", "DK-FANGSONG", "DFJadeFangSongU W6", "仿宋", "方正仿宋", "方正仿宋_GBK", "STKaiti", "STKai",
                 "MKai PRC", "Kaiti", "Kaiti SC", "Kaiti TC"}},
        {"fzqys", {"fzqys", "方正轻妍宋 简"}},
        {"hywfs", {"hywfs", "汉仪婉风宋 65W"}},
    };
    return table;
}

} // namespace

const std::vector<std::string>* FontFallbacks::find(const std::string& family) {
    const auto& table = fallbackTable();
    auto it = table.find(utils::StringUtils::toLower(family));
    return it == table.end() ? nullptr : &it->second;
}

bool FontFallbacks::isGenericFamily(const std::string& family) {
    static const char* const kGeneric[] = {
        "serif", "sans-serif", "monospace", "cursive", "fantasy", "system-ui",
        "inherit", "initial", "unset", "ui-serif", "ui-sans-serif", "ui-monospace"
    };
    const std::string lowered = utils::StringUtils::toLower(family);
    for (const char* generic : kGeneric) {
        if (lowered == generic) {
            return true;
        }
    }
    return false;
}

}} // namespace ryuri::layout
