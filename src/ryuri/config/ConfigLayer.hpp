#pragma once

#include "ryuri/core/Expected.hpp"
#include "ryuri/core/Path.hpp"
#include <map>
#include <string>

namespace ryuri {
namespace config {

/**
 * @brief 一层扁平配置："section.key" → 字符串值
 *
 * 三层按 默认值 < 配置文件 < 调用时覆盖 的顺序合并。
 */
class ConfigLayer {
public:
    ConfigLayer() = default;
    ConfigLayer(std::initializer_list<std::pair<const std::string, std::string>> entries) : values_(entries) {}

    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    bool erase(const std::string& key) { return values_.erase(key) > 0; }

    const std::string* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    const std::map<std::string, std::string>& values() const { return values_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    /**
     * @brief 用 other 中的值覆盖本层
     */
    void overlay(const ConfigLayer& other);

    /**
     * @brief 解析 INI 文本：[section] 小节与 key = value 行，# 或 ; 开头为注释
     * @param source 仅用于错误信息
     * @return 行格式错误时返回 InvalidArgument（context 为 "source:行号"）
     */
    static core::Result<ConfigLayer> parseIni(const std::string& text, const std::string& source);

    /**
     * @return 文件不可读时返回 IOFailure
     */
    static core::Result<ConfigLayer> fromFile(const core::Path& path);

private:
    std::map<std::string, std::string> values_;
};

/**
 * @brief 内置默认配置层
 */
ConfigLayer defaultLayer();

}} // namespace ryuri::config
