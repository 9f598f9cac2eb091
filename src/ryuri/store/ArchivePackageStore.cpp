#include "ryuri/store/ArchivePackageStore.hpp"
#include "ryuri/archive/ZipReader.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace ryuri {
namespace store {

std::unique_ptr<ArchivePackageStore> ArchivePackageStore::fromBlob(std::vector<uint8_t> blob) {
    const size_t blob_size = blob.size();
    archive::ZipReader reader(std::move(blob));

    archive::ZipError result = reader.open();
    if (archive::isError(result)) {
        RYURI_THROW_PACKAGE(core::ErrorCode::CorruptArchive,
                            fmt::format("Unreadable central directory ({})", archive::toString(result)),
                            "");
    }

    std::vector<archive::ZipReader::Entry> entries;
    std::string failed_path;
    result = reader.readAll(entries, failed_path);
    if (archive::isError(result)) {
        const char* what = result == archive::ZipError::DuplicateEntry ? "Duplicate archive entry"
                                                                        : "Corrupt archive entry";
        RYURI_THROW_PACKAGE(core::ErrorCode::CorruptArchive, what, failed_path);
    }

    auto store = std::make_unique<ArchivePackageStore>();
    store->order_.reserve(entries.size());
    for (auto& entry : entries) {
        if (!EntryPath::isValid(entry.info.path)) {
            RYURI_THROW_PACKAGE(core::ErrorCode::CorruptArchive, "Illegal entry path in archive",
                                entry.info.path);
        }
        StoredEntry stored;
        stored.data = std::move(entry.data);
        stored.attributes.compression_method = entry.info.compression_method;
        stored.attributes.modified_date = entry.info.modified_date;
        stored.attributes.modified = false;
        store->order_.push_back(entry.info.path);
        store->entries_.emplace(entry.info.path, std::move(stored));
    }

    STORE_INFO("Opened archive package: {} entries, {} bytes", store->order_.size(), blob_size);
    return store;
}

std::unique_ptr<ArchivePackageStore> ArchivePackageStore::fromFile(const core::Path& path) {
    if (!path.isFile()) {
        RYURI_THROW_PACKAGE(core::ErrorCode::IOFailure, "Archive file does not exist", path.string());
    }
    return fromBlob(path.readAll());
}

EntryAttributes ArchivePackageStore::attributes(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        RYURI_THROW_PACKAGE(core::ErrorCode::NotFound, "Entry not found", path);
    }
    return it->second.attributes;
}

std::vector<uint8_t> ArchivePackageStore::doGet(const std::string& path) const {
    return entries_.at(path).data;
}

void ArchivePackageStore::doPut(const std::string& path, std::vector<uint8_t> data) {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        StoredEntry stored;
        stored.data = std::move(data);
        stored.attributes.modified_date = core::Constants::kFixedEntryTime;
        entries_.emplace(path, std::move(stored));
        order_.push_back(path);
        return;
    }
    if (it->second.data != data) {
        it->second.data = std::move(data);
        it->second.attributes.compression_method = 8;
        it->second.attributes.modified_date = core::Constants::kFixedEntryTime;
        it->second.attributes.modified = true;
    }
}

void ArchivePackageStore::doRemove(const std::string& path) {
    entries_.erase(path);
    order_.erase(std::remove(order_.begin(), order_.end(), path), order_.end());
}

bool ArchivePackageStore::doExists(const std::string& path) const {
    return entries_.find(path) != entries_.end();
}

}} // namespace ryuri::store
