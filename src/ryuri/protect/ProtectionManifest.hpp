#pragma once

#include "ryuri/xml/Document.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ryuri {
namespace protect {

/**
 * @brief 一个被保护条目的记录
 */
struct ProtectionRecord {
    std::string path;        // 原始路径
    std::string obfuscated;  // 混淆后路径
    std::string algorithm;
    std::string salt;
    uint64_t size = 0;       // 明文字节数
    std::string checksum;    // MD5(key ‖ salt ‖ plaintext) 十六进制
};

/**
 * @brief META-INF/protection.xml 的内存表示
 *
 * 固定格式：
 * <protection version="1.0"><entry path obfuscated algorithm salt size checksum/></protection>
 */
class ProtectionManifest {
public:
    static constexpr const char* kVersion = "1.0";

    /**
     * @throws core::PackageException(ManifestInconsistent) 结构或属性不合法
     */
    static ProtectionManifest fromDocument(const xml::Document& document, const std::string& source_path);

    xml::Document toDocument() const;

    const std::vector<ProtectionRecord>& records() const { return records_; }
    bool empty() const { return records_.empty(); }

    const ProtectionRecord* findByPath(const std::string& path) const;
    const ProtectionRecord* findByObfuscated(const std::string& obfuscated) const;

    /**
     * @brief 合并记录；同一原始路径的记录被替换
     */
    void merge(const ProtectionRecord& record);

private:
    std::vector<ProtectionRecord> records_;
};

}} // namespace ryuri::protect
