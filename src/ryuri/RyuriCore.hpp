#pragma once

// RyuriCore - EPUB 包处理引擎

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ryuri/core/Expected.hpp"
#include "ryuri/core/Path.hpp"
#include "ryuri/filter/FilterChain.hpp"
#include "ryuri/store/PackageStore.hpp"
#include "ryuri/utils/Logger.hpp"

// 版本信息
#define RYURI_VERSION_MAJOR 1
#define RYURI_VERSION_MINOR 0
#define RYURI_VERSION_PATCH 0
#define RYURI_VERSION_STRING "1.0.0"

// 平台检测
#ifdef _WIN32
    #define RYURI_WINDOWS
#elif defined(__linux__)
    #define RYURI_LINUX
#elif defined(__APPLE__)
    #define RYURI_MACOS
#endif

// 导出宏定义
#ifdef RYURI_WINDOWS
    #ifdef RYURI_SHARED
        #ifdef RYURI_EXPORTS
            #define RYURI_API __declspec(dllexport)
        #else
            #define RYURI_API __declspec(dllimport)
        #endif
    #else
        #define RYURI_API
    #endif
#else
    #define RYURI_API
#endif

namespace ryuri {

inline std::string getVersion() {
    return RYURI_VERSION_STRING;
}

/**
 * @brief 导出格式
 */
enum class ExportFormat {
    Archive,    // zip 容器，mimetype 为首个 STORED 条目
    Directory   // 解包目录
};

/**
 * @brief 初始化日志系统
 * @return 初始化是否成功
 */
RYURI_API bool initialize(const std::string& log_file_path = "logs/ryuri.log",
                          Logger::Level level = Logger::Level::INFO,
                          bool enable_console = true);

RYURI_API void cleanup();

/**
 * @brief 打开包：目录按目录后端打开，其余按 zip 容器读取
 * @throws core::PackageException(IOFailure / CorruptArchive)
 */
RYURI_API std::unique_ptr<store::PackageStore> openPackage(const core::Path& path);

/**
 * @brief 以规范形式导出包
 * @throws core::PackageException(IOFailure)
 */
RYURI_API void exportPackage(const store::PackageStore& store, const core::Path& target,
                             ExportFormat format = ExportFormat::Archive, int compression_level = 6);

/**
 * @brief 用内置过滤器注册表构建并运行过滤器链
 * @return 构建失败时 InvalidArgument，运行失败时 FilterFailure / Timeout
 */
RYURI_API core::VoidResult runPipeline(store::PackageStore& store,
                                       const std::vector<filter::FilterSpec>& specs,
                                       std::optional<filter::Deadline> deadline = std::nullopt);

} // namespace ryuri
