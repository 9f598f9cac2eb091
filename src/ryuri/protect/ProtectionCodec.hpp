#pragma once

#include "ryuri/cache/DocumentCache.hpp"
#include "ryuri/core/Expected.hpp"
#include "ryuri/protect/ProtectionManifest.hpp"
#include "ryuri/store/PackageStore.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ryuri {
namespace protect {

struct ProtectionOptions {
    std::string algorithm = "basic";
    // 小写扩展名，不含点
    std::vector<std::string> extensions = {"ttf", "otf", "woff", "woff2", "jpg", "jpeg",
                                           "png", "gif", "svg", "webp"};
};

/**
 * @brief 包内容保护：路径混淆 + 内容加扰
 *
 * protect 选出扩展名匹配的条目，改名为同目录下的
 * "_" + 32 个 '*'/':' + "." + 扩展名，用密钥流异或加扰，
 * 改写 OPF/CSS/正文中的文本引用，并把映射写入 META-INF/protection.xml。
 * unprotect 在修改前校验全部条目，成功后恢复原名、原内容与引用。
 *
 * 两个操作都先暂存全部改动，失败时回滚，存储保持原状。
 */
class ProtectionCodec {
public:
    static constexpr const char* kAlgorithmBasic = "basic";

    explicit ProtectionCodec(ProtectionOptions options = ProtectionOptions());

    /**
     * @return ParameterException→InvalidArgument（未知算法）等错误
     */
    core::VoidResult protect(store::PackageStore& store, cache::DocumentCache& cache, const std::string& key) const;
    core::VoidResult protect(store::PackageStore& store, const std::string& key) const;

    /**
     * @return NotFound（无清单）、ManifestInconsistent、AuthenticationFailure（密钥错误）等
     */
    core::VoidResult unprotect(store::PackageStore& store, cache::DocumentCache& cache, const std::string& key) const;
    core::VoidResult unprotect(store::PackageStore& store, const std::string& key) const;

    const ProtectionOptions& options() const { return options_; }

    // ========== 方案细节 ==========

    /**
     * @brief 混淆路径：MD5(salt + path) 的第 i 个十六进制位为奇数取 '*'，偶数取 ':'
     */
    static std::string obfuscatedPath(const std::string& path, const std::string& salt);

    /**
     * @brief 文件名是否已是混淆形式
     */
    static bool isObfuscatedName(const std::string& file_name);

    /**
     * @brief 异或密钥流，块 i = MD5(key ‖ salt ‖ path ‖ le32(i))；加扰与解扰相同
     */
    static std::vector<uint8_t> transform(const std::vector<uint8_t>& data, const std::string& key,
                                          const std::string& salt, const std::string& path);

    static std::string checksum(const std::string& key, const std::string& salt, const std::vector<uint8_t>& plain);

    /**
     * @brief 盐值：唯一标识符文本的 MD5；没有 OPF 或标识符时为排序后路径列表的 MD5
     */
    static std::string computeSalt(cache::DocumentCache& cache);

    /**
     * @brief 把文档中指向 from 的相对引用改写为指向 to
     * @param doc_path 文档在包内的路径
     * @return 替换次数
     */
    static size_t rewriteReferences(std::string& text, const std::string& doc_path,
                                    const std::map<std::string, std::string>& mapping);

private:
    void doProtect(store::PackageStore& store, cache::DocumentCache& cache, const std::string& key) const;
    void doUnprotect(store::PackageStore& store, cache::DocumentCache& cache, const std::string& key) const;

    bool selects(const std::string& path) const;

    ProtectionOptions options_;
};

}} // namespace ryuri::protect
