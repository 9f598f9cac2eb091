#include "ryuri/core/Path.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

#ifdef _WIN32
#include <utf8.h>
#endif

namespace ryuri {
namespace core {

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    std::wstring result;
    utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
    return result;
}

std::filesystem::path Path::native() const {
    return std::filesystem::path(getWidePath());
}
#else
std::filesystem::path Path::native() const {
    return std::filesystem::path(utf8_path_);
}
#endif

Path Path::operator/(const std::string& relative) const {
    if (utf8_path_.empty()) {
        return Path(relative);
    }
    if (utf8_path_.back() == '/' || utf8_path_.back() == '\\') {
        return Path(utf8_path_ + relative);
    }
    return Path(utf8_path_ + "/" + relative);
}

std::string Path::extension() const {
    const auto slash = utf8_path_.find_last_of("/\\");
    const auto dot = utf8_path_.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = utf8_path_.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool Path::exists() const {
    std::error_code ec;
    return !utf8_path_.empty() && std::filesystem::exists(native(), ec);
}

bool Path::isFile() const {
    std::error_code ec;
    return !utf8_path_.empty() && std::filesystem::is_regular_file(native(), ec);
}

bool Path::isDirectory() const {
    std::error_code ec;
    return !utf8_path_.empty() && std::filesystem::is_directory(native(), ec);
}

std::vector<uint8_t> Path::readAll() const {
    std::ifstream in(native(), std::ios::binary);
    if (!in.is_open()) {
        RYURI_THROW_PACKAGE(ErrorCode::IOFailure, "Cannot open file for reading", utf8_path_);
    }

    std::vector<uint8_t> data;
    char buffer[Constants::kIOBufferSize];
    while (in) {
        in.read(buffer, sizeof(buffer));
        const auto got = in.gcount();
        if (got > 0) {
            data.insert(data.end(), buffer, buffer + got);
        }
    }
    if (in.bad()) {
        RYURI_THROW_PACKAGE(ErrorCode::IOFailure, "Read error", utf8_path_);
    }
    return data;
}

void Path::writeAll(const std::vector<uint8_t>& data) const {
    const std::filesystem::path target = native();
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            RYURI_THROW_PACKAGE(ErrorCode::IOFailure,
                                "Cannot create parent directory: " + ec.message(), utf8_path_);
        }
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        RYURI_THROW_PACKAGE(ErrorCode::IOFailure, "Cannot open file for writing", utf8_path_);
    }
    if (!data.empty()) {
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }
    out.flush();
    if (!out) {
        RYURI_THROW_PACKAGE(ErrorCode::IOFailure, "Write error", utf8_path_);
    }
}

}} // namespace ryuri::core
