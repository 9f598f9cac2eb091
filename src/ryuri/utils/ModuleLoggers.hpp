#pragma once
#include "ryuri/utils/Logger.hpp"
#include "ryuri/utils/LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core / config)
#define CORE_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     RYURI_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     RYURI_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    RYURI_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     RYURI_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     RYURI_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    RYURI_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 包存储模块 (store / package)
#define STORE_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][stor] " __VA_ARGS__)
#define STORE_INFO(...)     RYURI_LOG_INFO("[INF][stor] " __VA_ARGS__)
#define STORE_WARN(...)     RYURI_LOG_WARN("[WRN][stor] " __VA_ARGS__)
#define STORE_ERROR(...)    RYURI_LOG_ERROR("[ERR][stor] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     RYURI_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     RYURI_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    RYURI_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 文档缓存模块 (cache)
#define CACHE_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][cach] " __VA_ARGS__)
#define CACHE_INFO(...)     RYURI_LOG_INFO("[INF][cach] " __VA_ARGS__)
#define CACHE_WARN(...)     RYURI_LOG_WARN("[WRN][cach] " __VA_ARGS__)
#define CACHE_ERROR(...)    RYURI_LOG_ERROR("[ERR][cach] " __VA_ARGS__)

// 过滤器模块 (filter)
#define FILTER_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][filt] " __VA_ARGS__)
#define FILTER_INFO(...)     RYURI_LOG_INFO("[INF][filt] " __VA_ARGS__)
#define FILTER_WARN(...)     RYURI_LOG_WARN("[WRN][filt] " __VA_ARGS__)
#define FILTER_ERROR(...)    RYURI_LOG_ERROR("[ERR][filt] " __VA_ARGS__)

// 排版转换模块 (layout)
#define LAYOUT_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][lay ] " __VA_ARGS__)
#define LAYOUT_INFO(...)     RYURI_LOG_INFO("[INF][lay ] " __VA_ARGS__)
#define LAYOUT_WARN(...)     RYURI_LOG_WARN("[WRN][lay ] " __VA_ARGS__)
#define LAYOUT_ERROR(...)    RYURI_LOG_ERROR("[ERR][lay ] " __VA_ARGS__)

// 内容保护模块 (protect)
#define PROTECT_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][prot] " __VA_ARGS__)
#define PROTECT_INFO(...)     RYURI_LOG_INFO("[INF][prot] " __VA_ARGS__)
#define PROTECT_WARN(...)     RYURI_LOG_WARN("[WRN][prot] " __VA_ARGS__)
#define PROTECT_ERROR(...)    RYURI_LOG_ERROR("[ERR][prot] " __VA_ARGS__)

// 批处理模块 (batch)
#define BATCH_DEBUG(...)    RYURI_LOG_DEBUG("[DBG][btch] " __VA_ARGS__)
#define BATCH_INFO(...)     RYURI_LOG_INFO("[INF][btch] " __VA_ARGS__)
#define BATCH_WARN(...)     RYURI_LOG_WARN("[WRN][btch] " __VA_ARGS__)
#define BATCH_ERROR(...)    RYURI_LOG_ERROR("[ERR][btch] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_ZIP_DEBUG_LOGS
    #define RYURI_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define RYURI_LOG_ZIP_DEBUG(...) do {} while(0)
#endif

#if ENABLE_CACHE_DEBUG_LOGS
    #define RYURI_LOG_CACHE_DEBUG(...) CACHE_DEBUG(__VA_ARGS__)
#else
    #define RYURI_LOG_CACHE_DEBUG(...) do {} while(0)
#endif

#if ENABLE_LAYOUT_DEBUG_LOGS
    #define RYURI_LOG_LAYOUT_DEBUG(...) LAYOUT_DEBUG(__VA_ARGS__)
#else
    #define RYURI_LOG_LAYOUT_DEBUG(...) do {} while(0)
#endif
