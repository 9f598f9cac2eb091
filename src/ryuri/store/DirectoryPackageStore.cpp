#include "ryuri/store/DirectoryPackageStore.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace ryuri {
namespace store {

std::unique_ptr<DirectoryPackageStore> DirectoryPackageStore::open(const core::Path& base_dir) {
    if (!base_dir.isDirectory()) {
        RYURI_THROW_PACKAGE(core::ErrorCode::IOFailure, "Package directory does not exist",
                            base_dir.string());
    }
    std::unique_ptr<DirectoryPackageStore> store(new DirectoryPackageStore(base_dir));
    store->scan();
    STORE_INFO("Opened directory package {}: {} entries", base_dir.string(), store->order_.size());
    return store;
}

std::unique_ptr<DirectoryPackageStore> DirectoryPackageStore::create(const core::Path& base_dir) {
    std::error_code ec;
    std::filesystem::create_directories(base_dir.native(), ec);
    if (ec || !base_dir.isDirectory()) {
        RYURI_THROW_PACKAGE(core::ErrorCode::IOFailure,
                            fmt::format("Cannot create package directory: {}", ec.message()),
                            base_dir.string());
    }
    return open(base_dir);
}

void DirectoryPackageStore::scan() {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path root = base_dir_.native();

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        RYURI_THROW_PACKAGE(core::ErrorCode::IOFailure,
                            fmt::format("Cannot read package directory: {}", ec.message()),
                            base_dir_.string());
    }

    std::vector<std::string> found;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            RYURI_THROW_PACKAGE(core::ErrorCode::IOFailure,
                                fmt::format("Directory walk failed: {}", ec.message()),
                                base_dir_.string());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string relative = it->path().lexically_relative(root).generic_u8string();
        if (!EntryPath::isValid(relative)) {
            STORE_WARN("Skipping file with unsupported entry path: {}", relative);
            continue;
        }
        found.push_back(relative);
    }

    std::sort(found.begin(), found.end());
    order_ = std::move(found);
    index_.clear();
    index_.insert(order_.begin(), order_.end());
}

EntryAttributes DirectoryPackageStore::attributes(const std::string& path) const {
    if (!doExists(path)) {
        RYURI_THROW_PACKAGE(core::ErrorCode::NotFound, "Entry not found", path);
    }
    EntryAttributes attrs;
    attrs.compression_method = 8;
    attrs.modified_date = core::Constants::kFixedEntryTime;
    attrs.modified = true;
    return attrs;
}

std::vector<uint8_t> DirectoryPackageStore::doGet(const std::string& path) const {
    return (base_dir_ / path).readAll();
}

void DirectoryPackageStore::doPut(const std::string& path, std::vector<uint8_t> data) {
    (base_dir_ / path).writeAll(data);
    if (index_.insert(path).second) {
        order_.push_back(path);
    }
}

void DirectoryPackageStore::doRemove(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove((base_dir_ / path).native(), ec);
    if (ec) {
        RYURI_THROW_PACKAGE(core::ErrorCode::IOFailure,
                            fmt::format("Cannot delete file: {}", ec.message()), path);
    }
    index_.erase(path);
    order_.erase(std::remove(order_.begin(), order_.end(), path), order_.end());
}

bool DirectoryPackageStore::doExists(const std::string& path) const {
    return index_.find(path) != index_.end();
}

}} // namespace ryuri::store
