#pragma once

#include "ryuri/archive/ZipError.hpp"
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <unordered_set>
#include <vector>

namespace ryuri {
namespace archive {

/**
 * @brief 内存ZIP写入器
 *
 * 条目按 addEntry 调用顺序写入。调用方负责把 mimetype 放在首位并指定 STORE。
 */
class ZipWriter {
public:
    enum class Method : uint16_t {
        Store = 0,
        Deflate = 8
    };

    struct EntryOptions {
        Method method = Method::Deflate;
        time_t modified_date = 0;
    };

    struct Stats {
        size_t entries_written = 0;
        uint64_t bytes_written = 0;
        size_t duplicates_skipped = 0;
    };

    explicit ZipWriter(int compression_level = 6);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    ZipError open();

    /**
     * 写入一个条目；已写过的路径会被跳过并计入统计
     */
    ZipError addEntry(const std::string& path, const uint8_t* data, size_t size,
                      const EntryOptions& options);

    ZipError addEntry(const std::string& path, const std::vector<uint8_t>& data,
                      const EntryOptions& options) {
        return addEntry(path, data.data(), data.size(), options);
    }

    /**
     * 写出中央目录并取出归档字节
     */
    ZipError finish(std::vector<uint8_t>& blob);

    const Stats& getStats() const { return stats_; }

private:
    void cleanup();

    int compression_level_;
    void* zip_handle_ = nullptr;
    void* mem_stream_ = nullptr;
    bool is_open_ = false;
    std::unordered_set<std::string> written_paths_;
    Stats stats_;
};

}} // namespace ryuri::archive
