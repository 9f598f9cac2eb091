#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的调试日志，设置为 1 启用

#define ENABLE_ZIP_DEBUG_LOGS 0       // 逐条目的ZIP读写日志
#define ENABLE_CACHE_DEBUG_LOGS 0     // 文档缓存命中/失效日志
#define ENABLE_LAYOUT_DEBUG_LOGS 0    // 排版转换逐段落日志
