#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

namespace ryuri {
namespace core {

/**
 * @brief UTF-8宿主文件系统路径
 *
 * 与包内条目路径（POSIX风格、相对、区分大小写）不同，
 * Path 表示宿主机上的文件或目录。Windows 下通过 utf8cpp 转为 UTF-16。
 */
class Path {
private:
    std::string utf8_path_;

public:
    Path() = default;
    explicit Path(const std::string& path) : utf8_path_(path) {}
    explicit Path(const char* path) : utf8_path_(path ? path : "") {}

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    /**
     * @brief 转换为 std::filesystem::path
     */
    std::filesystem::path native() const;

    /**
     * @brief 拼接子路径（子路径使用 '/' 分隔）
     */
    Path operator/(const std::string& relative) const;

    /**
     * @brief 小写扩展名（含点），无扩展名返回空串
     */
    std::string extension() const;

    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;

    /**
     * @brief 读取整个文件
     * @throws PackageException(IOFailure) 无法打开或读取
     */
    std::vector<uint8_t> readAll() const;

    /**
     * @brief 写入整个文件，必要时创建父目录
     * @throws PackageException(IOFailure) 无法写入
     */
    void writeAll(const std::vector<uint8_t>& data) const;

#ifdef _WIN32
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace ryuri::core
