#pragma once

#include <cstddef>
#include <cstdint>

namespace ryuri {
namespace core {

// 通用常量集中定义
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // 批处理默认并发宽度
    static constexpr size_t kDefaultBatchWidth = 4;

    // 默认 deflate 压缩级别
    static constexpr int kDefaultCompressionLevel = 6;

    // 目录存储导出为归档时使用的固定时间戳 (1980-01-02 00:00:00 UTC)，避开 DOS 日期下限
    static constexpr int64_t kFixedEntryTime = 315619200;
};

// EPUB 容器常量
struct EpubConstants {
    static constexpr const char* kMimetypePath = "mimetype";
    static constexpr const char* kMimetypeContent = "application/epub+zip";
    static constexpr const char* kContainerPath = "META-INF/container.xml";
    static constexpr const char* kProtectionManifestPath = "META-INF/protection.xml";

    static constexpr const char* kOpfNamespace = "http://www.idpf.org/2007/opf";
    static constexpr const char* kXhtmlNamespace = "http://www.w3.org/1999/xhtml";
    static constexpr const char* kOpsNamespace = "http://www.idpf.org/2007/ops";
    static constexpr const char* kDcNamespace = "http://purl.org/dc/elements/1.1/";
    static constexpr const char* kNcxNamespace = "http://www.daisy.org/z3986/2005/ncx/";
    static constexpr const char* kContainerNamespace = "urn:oasis:names:tc:opendocument:xmlns:container";
};

}} // namespace ryuri::core
