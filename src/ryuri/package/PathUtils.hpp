#pragma once

#include <string>

namespace ryuri {
namespace package {

/**
 * @brief 包内路径与 href 换算
 */
class PathUtils {
public:
    /**
     * @brief 从 from_path 所在目录指向 to_path 的相对 href
     *
     * 例：relativePath("OEBPS/Text/c1.xhtml", "OEBPS/Styles/a.css") == "../Styles/a.css"
     */
    static std::string relativePath(const std::string& from_path, const std::string& to_path);

    /**
     * @brief 把相对 href 解析为包内路径（去掉片段与查询、百分号解码、折叠 ".."）
     * @param refer_path 引用方条目路径
     * @return 越过包根或为外部链接时返回空串
     */
    static std::string bookPath(const std::string& href, const std::string& refer_path);

    static std::string percentDecode(const std::string& text);

    /**
     * @brief 对路径中的非安全字符做百分号编码，保留 '/'
     */
    static std::string percentEncode(const std::string& path);

    /**
     * @brief href 的片段部分（不含 '#'），没有则为空串
     */
    static std::string fragment(const std::string& href);

    static bool isExternal(const std::string& href);
};

}} // namespace ryuri::package
