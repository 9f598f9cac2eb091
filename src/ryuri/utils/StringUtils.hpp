#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace ryuri {
namespace utils {

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    static std::string trim(const std::string& text) {
        const char* ws = " \t\r\n\f\v";
        const auto first = text.find_first_not_of(ws);
        if (first == std::string::npos) {
            return "";
        }
        const auto last = text.find_last_not_of(ws);
        return text.substr(first, last - first + 1);
    }

    /**
     * @brief 去除首尾空白并把内部连续空白折叠为单个空格
     */
    static std::string collapseWhitespace(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        bool pending_space = false;
        for (char c : text) {
            if (isSpace(c)) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(c);
        }
        return out;
    }

    static bool isBlank(const std::string& text) {
        return std::all_of(text.begin(), text.end(), [](char c) { return isSpace(c); });
    }

    static std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    static std::string toUpper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }

    static bool startsWith(const std::string& text, const std::string& prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    /**
     * @brief 按分隔符拆分并去除每段首尾空白，丢弃空段
     */
    static std::vector<std::string> split(const std::string& text, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find(delimiter, start);
            if (end == std::string::npos) {
                end = text.size();
            }
            std::string part = trim(text.substr(start, end - start));
            if (!part.empty()) {
                parts.push_back(std::move(part));
            }
            start = end + 1;
        }
        return parts;
    }

    /**
     * @brief 以空白拆分的 token 列表（class、properties 属性）
     */
    static std::vector<std::string> tokens(const std::string& text) {
        std::vector<std::string> result;
        std::string current;
        for (char c : text) {
            if (isSpace(c)) {
                if (!current.empty()) {
                    result.push_back(std::move(current));
                    current.clear();
                }
            } else {
                current.push_back(c);
            }
        }
        if (!current.empty()) {
            result.push_back(std::move(current));
        }
        return result;
    }

    static bool hasToken(const std::string& text, const std::string& token) {
        const auto list = tokens(text);
        return std::find(list.begin(), list.end(), token) != list.end();
    }

    static bool isSpace(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }
};

}} // namespace ryuri::utils
