#pragma once

#include "ryuri/archive/ZipError.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace ryuri {
namespace archive {

/**
 * @brief 内存ZIP读取器
 *
 * 持有整个归档字节流，按中央目录顺序一次性解出全部条目。
 * 重复路径、中央目录不可读、CRC 校验失败都报告为错误。
 */
class ZipReader {
public:
    // ========== 条目信息结构 ==========
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        uint16_t compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    struct Entry {
        EntryInfo info;
        std::vector<uint8_t> data;
    };

    // ========== 构造/析构 ==========
    explicit ZipReader(std::vector<uint8_t> blob);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开归档（解析中央目录）
     */
    ZipError open();

    void close();

    bool isOpen() const { return is_open_; }

    /**
     * 按归档顺序读取全部文件条目（跳过目录条目）
     * @param entries 输出条目
     * @param failed_path 出错时填入出错条目的路径
     */
    ZipError readAll(std::vector<Entry>& entries, std::string& failed_path);

private:
    ZipError readCurrentEntry(std::vector<uint8_t>& data, uint64_t expected_size);

    std::vector<uint8_t> blob_;
    void* unzip_handle_ = nullptr;
    bool is_open_ = false;
};

}} // namespace ryuri::archive
