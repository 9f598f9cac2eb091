#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// OpenSSL 前向声明，避免头文件污染
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ryuri {
namespace utils {

/**
 * @brief 基于 OpenSSL EVP 的流式摘要
 *
 * 用于条目内容哈希（SHA-256）以及保护方案的路径混淆、
 * 密钥流与校验和（MD5）。
 */
class Digest {
public:
    enum class Algorithm {
        MD5,
        SHA256
    };

    explicit Digest(Algorithm algorithm);
    ~Digest();

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    Digest& update(const void* data, size_t size);
    Digest& update(const std::string& data) { return update(data.data(), data.size()); }
    Digest& update(const std::vector<uint8_t>& data) { return update(data.data(), data.size()); }

    /**
     * @brief 结束计算并返回摘要，之后对象不可再用
     */
    std::vector<uint8_t> finish();

    std::string finishHex();

    // ========== 一次性便捷接口 ==========

    static std::string md5Hex(const std::string& data);
    static std::string sha256Hex(const std::vector<uint8_t>& data);

    static std::string toHex(const std::vector<uint8_t>& bytes);

private:
    EVP_MD_CTX* ctx_;
    bool finished_ = false;
};

}} // namespace ryuri::utils
