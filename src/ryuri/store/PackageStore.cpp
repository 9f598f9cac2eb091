#include "ryuri/store/PackageStore.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/utils/Digest.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <unordered_set>

namespace ryuri {
namespace store {

std::vector<uint8_t> PackageStore::get(const std::string& path) const {
    EntryPath::validate(path);
    if (!doExists(path)) {
        RYURI_THROW_PACKAGE(core::ErrorCode::NotFound, "Entry not found", path);
    }
    return doGet(path);
}

std::string PackageStore::getString(const std::string& path) const {
    const std::vector<uint8_t> data = get(path);
    return std::string(data.begin(), data.end());
}

void PackageStore::put(const std::string& path, std::vector<uint8_t> data) {
    EntryPath::validate(path);
    doPut(path, std::move(data));
    ++revisions_[path];
}

void PackageStore::put(const std::string& path, const std::string& text) {
    put(path, std::vector<uint8_t>(text.begin(), text.end()));
}

void PackageStore::remove(const std::string& path) {
    EntryPath::validate(path);
    if (!doExists(path)) {
        RYURI_THROW_PACKAGE(core::ErrorCode::NotFound, "Cannot remove missing entry", path);
    }
    doRemove(path);
    ++revisions_[path];
}

bool PackageStore::exists(const std::string& path) const {
    return EntryPath::isValid(path) && doExists(path);
}

std::vector<std::string> PackageStore::list() const {
    const std::vector<std::string>& order = entryOrder();
    std::vector<std::string> result;
    result.reserve(order.size());

    std::unordered_set<std::string> seen;
    for (const auto& path : manifest_order_) {
        if (doExists(path) && seen.insert(path).second) {
            result.push_back(path);
        }
    }
    for (const auto& path : order) {
        if (seen.insert(path).second) {
            result.push_back(path);
        }
    }
    return result;
}

std::string PackageStore::contentHash(const std::string& path) const {
    return utils::Digest::sha256Hex(get(path));
}

uint64_t PackageStore::revision(const std::string& path) const {
    auto it = revisions_.find(path);
    return it == revisions_.end() ? 0 : it->second;
}

}} // namespace ryuri::store
