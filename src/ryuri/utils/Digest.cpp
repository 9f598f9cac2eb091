#include "ryuri/utils/Digest.hpp"
#include "ryuri/core/Exception.hpp"
#include <openssl/evp.h>

namespace ryuri {
namespace utils {

Digest::Digest(Algorithm algorithm) : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw core::RyuriException("EVP_MD_CTX_new failed", core::ErrorCode::InternalError,
                                   __FILE__, __LINE__);
    }
    const EVP_MD* md = (algorithm == Algorithm::MD5) ? EVP_md5() : EVP_sha256();
    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw core::RyuriException("EVP_DigestInit_ex failed", core::ErrorCode::InternalError,
                                   __FILE__, __LINE__);
    }
}

Digest::~Digest() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Digest& Digest::update(const void* data, size_t size) {
    if (finished_) {
        throw core::RyuriException("Digest updated after finish", core::ErrorCode::InternalError,
                                   __FILE__, __LINE__);
    }
    if (size > 0 && EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw core::RyuriException("EVP_DigestUpdate failed", core::ErrorCode::InternalError,
                                   __FILE__, __LINE__);
    }
    return *this;
}

std::vector<uint8_t> Digest::finish() {
    if (finished_) {
        throw core::RyuriException("Digest finished twice", core::ErrorCode::InternalError,
                                   __FILE__, __LINE__);
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
        throw core::RyuriException("EVP_DigestFinal_ex failed", core::ErrorCode::InternalError,
                                   __FILE__, __LINE__);
    }
    finished_ = true;
    return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string Digest::finishHex() {
    return toHex(finish());
}

std::string Digest::md5Hex(const std::string& data) {
    Digest d(Algorithm::MD5);
    d.update(data);
    return d.finishHex();
}

std::string Digest::sha256Hex(const std::vector<uint8_t>& data) {
    Digest d(Algorithm::SHA256);
    d.update(data);
    return d.finishHex();
}

std::string Digest::toHex(const std::vector<uint8_t>& bytes) {
    static const char kHexDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

}} // namespace ryuri::utils
