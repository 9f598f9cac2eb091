#include "ryuri/protect/ProtectionCodec.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/core/ExceptionBridge.hpp"
#include "ryuri/package/PackageLayout.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/store/EntryPath.hpp"
#include "ryuri/utils/Digest.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/utils/StringUtils.hpp"
#include <algorithm>
#include <optional>

namespace ryuri {
namespace protect {

using package::PathUtils;
using store::EntryPath;
using utils::Digest;

namespace {

constexpr size_t kBlockSize = 16;

/**
 * @brief 暂存对存储的修改，失败时按相反顺序恢复
 */
class StoreTransaction {
public:
    explicit StoreTransaction(cache::DocumentCache& cache) : cache_(cache) {}

    void put(const std::string& path, std::vector<uint8_t> data) {
        remember(path);
        cache_.put(path, std::move(data));
    }

    void put(const std::string& path, const std::string& text) {
        remember(path);
        cache_.put(path, text);
    }

    void remove(const std::string& path) {
        remember(path);
        cache_.remove(path);
    }

    void rollback() {
        for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
            try {
                if (it->original) {
                    cache_.put(it->path, *it->original);
                } else if (cache_.store().exists(it->path)) {
                    cache_.remove(it->path);
                }
            } catch (const core::RyuriException& e) {
                PROTECT_ERROR("Rollback of {} failed: {}", it->path, e.what());
            }
        }
        journal_.clear();
    }

private:
    struct Snapshot {
        std::string path;
        std::optional<std::vector<uint8_t>> original;
    };

    void remember(const std::string& path) {
        for (const auto& snapshot : journal_) {
            if (snapshot.path == path) {
                return;
            }
        }
        Snapshot snapshot;
        snapshot.path = path;
        if (cache_.store().exists(path)) {
            snapshot.original = cache_.store().get(path);
        }
        journal_.push_back(std::move(snapshot));
    }

    cache::DocumentCache& cache_;
    std::vector<Snapshot> journal_;
};

bool isDelimiterBefore(char c) {
    return c == '"' || c == '\'' || c == '(' || c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool isDelimiterAfter(char c) {
    return c == '"' || c == '\'' || c == ')' || c == '#' || c == '?' || c == ' ' || c == '\t' ||
           c == '\n' || c == '\r';
}

// 会被改写引用的文档：OPF、样式表、正文
bool holdsReferences(const std::string& path, const std::string& opf_path) {
    if (path == opf_path) {
        return true;
    }
    const std::string ext = EntryPath::extension(path);
    return ext == "css" || ext == "xhtml" || ext == "html" || ext == "htm";
}

void checkAlgorithm(const std::string& algorithm) {
    if (algorithm != ProtectionCodec::kAlgorithmBasic) {
        RYURI_THROW_PARAM(fmt::format("Unknown protection algorithm '{}'", algorithm), "algorithm");
    }
}

// 重写引用并暂存有变化的文档
void rewriteDocuments(StoreTransaction& txn, store::PackageStore& store, const std::string& opf_path,
                      const std::map<std::string, std::string>& mapping) {
    for (const auto& path : store.list()) {
        if (!holdsReferences(path, opf_path) || mapping.count(path)) {
            continue;
        }
        std::string text = store.getString(path);
        const size_t replaced = ProtectionCodec::rewriteReferences(text, path, mapping);
        if (replaced > 0) {
            PROTECT_DEBUG("Rewrote {} references in {}", replaced, path);
            txn.put(path, text);
        }
    }
}

} // namespace

ProtectionCodec::ProtectionCodec(ProtectionOptions options) : options_(std::move(options)) {
    for (auto& ext : options_.extensions) {
        ext = utils::StringUtils::toLower(utils::StringUtils::trim(ext));
        if (!ext.empty() && ext.front() == '.') {
            ext.erase(0, 1);
        }
    }
}

// ========== 方案细节 ==========

std::string ProtectionCodec::obfuscatedPath(const std::string& path, const std::string& salt) {
    const std::string digest = Digest::md5Hex(salt + path);
    std::string name = "_";
    for (char nibble : digest) {
        const int value = (nibble >= '0' && nibble <= '9') ? nibble - '0' : nibble - 'a' + 10;
        name.push_back((value & 1) ? '*' : ':');
    }
    name += "." + EntryPath::extension(path);
    const std::string directory = EntryPath::directory(path);
    return directory.empty() ? name : directory + "/" + name;
}

bool ProtectionCodec::isObfuscatedName(const std::string& file_name) {
    if (file_name.size() < 34 || file_name[0] != '_' || file_name[33] != '.') {
        return false;
    }
    for (size_t i = 1; i <= 32; ++i) {
        if (file_name[i] != '*' && file_name[i] != ':') {
            return false;
        }
    }
    return true;
}

std::vector<uint8_t> ProtectionCodec::transform(const std::vector<uint8_t>& data, const std::string& key,
                                                const std::string& salt, const std::string& path) {
    std::vector<uint8_t> out(data.size());
    std::vector<uint8_t> block;
    for (size_t offset = 0; offset < data.size(); offset += kBlockSize) {
        const uint32_t index = static_cast<uint32_t>(offset / kBlockSize);
        const uint8_t le_index[4] = {
            static_cast<uint8_t>(index & 0xFF),
            static_cast<uint8_t>((index >> 8) & 0xFF),
            static_cast<uint8_t>((index >> 16) & 0xFF),
            static_cast<uint8_t>((index >> 24) & 0xFF)
        };
        Digest digest(Digest::Algorithm::MD5);
        digest.update(key).update(salt).update(path).update(le_index, sizeof(le_index));
        block = digest.finish();

        const size_t count = std::min(kBlockSize, data.size() - offset);
        for (size_t i = 0; i < count; ++i) {
            out[offset + i] = static_cast<uint8_t>(data[offset + i] ^ block[i]);
        }
    }
    return out;
}

std::string ProtectionCodec::checksum(const std::string& key, const std::string& salt,
                                      const std::vector<uint8_t>& plain) {
    Digest digest(Digest::Algorithm::MD5);
    digest.update(key).update(salt).update(plain);
    return digest.finishHex();
}

std::string ProtectionCodec::computeSalt(cache::DocumentCache& cache) {
    if (!package::PackageLayout::locateOpf(cache).empty()) {
        const package::PackageLayout layout = package::PackageLayout::load(cache);
        if (!layout.uniqueIdentifier().empty()) {
            return Digest::md5Hex(layout.uniqueIdentifier());
        }
    }
    std::vector<std::string> paths = cache.store().list();
    std::sort(paths.begin(), paths.end());
    std::string joined;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += paths[i];
    }
    return Digest::md5Hex(joined);
}

size_t ProtectionCodec::rewriteReferences(std::string& text, const std::string& doc_path,
                                          const std::map<std::string, std::string>& mapping) {
    size_t replaced = 0;
    for (const auto& entry : mapping) {
        const std::string relative = PathUtils::relativePath(doc_path, entry.first);
        const std::string replacement = PathUtils::percentEncode(PathUtils::relativePath(doc_path, entry.second));

        std::vector<std::string> patterns = {relative};
        const std::string encoded = PathUtils::percentEncode(relative);
        if (encoded != relative) {
            patterns.push_back(encoded);
        }

        for (const auto& pattern : patterns) {
            size_t pos = 0;
            while ((pos = text.find(pattern, pos)) != std::string::npos) {
                const size_t end = pos + pattern.size();
                const bool before_ok = pos == 0 || isDelimiterBefore(text[pos - 1]);
                const bool after_ok = end == text.size() || isDelimiterAfter(text[end]);
                if (!before_ok || !after_ok) {
                    ++pos;
                    continue;
                }
                text.replace(pos, pattern.size(), replacement);
                pos += replacement.size();
                ++replaced;
            }
        }
    }
    return replaced;
}

bool ProtectionCodec::selects(const std::string& path) const {
    if (path == core::EpubConstants::kMimetypePath || utils::StringUtils::startsWith(path, "META-INF/")) {
        return false;
    }
    if (isObfuscatedName(EntryPath::fileName(path))) {
        return false;
    }
    const std::string ext = EntryPath::extension(path);
    return std::find(options_.extensions.begin(), options_.extensions.end(), ext) != options_.extensions.end();
}

// ========== protect ==========

void ProtectionCodec::doProtect(store::PackageStore& store, cache::DocumentCache& cache,
                                const std::string& key) const {
    checkAlgorithm(options_.algorithm);
    const std::string manifest_path = core::EpubConstants::kProtectionManifestPath;

    ProtectionManifest manifest;
    if (store.exists(manifest_path)) {
        manifest = ProtectionManifest::fromDocument(cache.readXml(manifest_path), manifest_path);
    }

    const std::string opf_path = package::PackageLayout::locateOpf(cache);
    const std::string salt = computeSalt(cache);

    std::vector<ProtectionRecord> staged;
    std::vector<std::vector<uint8_t>> scrambled;
    std::map<std::string, std::string> mapping;
    for (const auto& path : store.list()) {
        if (path == opf_path || !selects(path) || manifest.findByPath(path) || manifest.findByObfuscated(path)) {
            continue;
        }
        ProtectionRecord record;
        record.path = path;
        record.obfuscated = obfuscatedPath(path, salt);
        record.algorithm = options_.algorithm;
        record.salt = salt;
        if (store.exists(record.obfuscated) || mapping.count(record.obfuscated)) {
            RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                                fmt::format("Obfuscated path {} already occupied", record.obfuscated), path);
        }

        const std::vector<uint8_t> plain = store.get(path);
        record.size = plain.size();
        record.checksum = checksum(key, salt, plain);
        scrambled.push_back(transform(plain, key, salt, path));
        mapping[path] = record.obfuscated;
        staged.push_back(std::move(record));
    }

    if (staged.empty()) {
        PROTECT_INFO("No entries selected for protection");
        return;
    }

    StoreTransaction txn(cache);
    try {
        for (size_t i = 0; i < staged.size(); ++i) {
            txn.put(staged[i].obfuscated, std::move(scrambled[i]));
            txn.remove(staged[i].path);
            manifest.merge(staged[i]);
        }
        rewriteDocuments(txn, store, opf_path, mapping);

        const std::string text = cache::DocumentCache::serialize(manifest.toDocument(),
                                                                 cache::SerializationMode::Generic, manifest_path);
        txn.put(manifest_path, text);
    } catch (...) {
        txn.rollback();
        throw;
    }

    if (!opf_path.empty()) {
        package::PackageLayout::load(cache).applyManifestOrder(store);
    }
    PROTECT_INFO("Protected {} entries ({} recorded)", staged.size(), manifest.records().size());
}

// ========== unprotect ==========

void ProtectionCodec::doUnprotect(store::PackageStore& store, cache::DocumentCache& cache,
                                  const std::string& key) const {
    const std::string manifest_path = core::EpubConstants::kProtectionManifestPath;
    if (!store.exists(manifest_path)) {
        RYURI_THROW_PACKAGE(core::ErrorCode::NotFound, "Package has no protection manifest", manifest_path);
    }
    const ProtectionManifest manifest = ProtectionManifest::fromDocument(cache.readXml(manifest_path), manifest_path);

    // 全部校验通过之前不修改存储
    std::vector<std::vector<uint8_t>> restored;
    std::map<std::string, std::string> mapping;
    for (const auto& record : manifest.records()) {
        checkAlgorithm(record.algorithm);
        if (obfuscatedPath(record.path, record.salt) != record.obfuscated) {
            RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                                fmt::format("Recorded name {} does not match its path", record.obfuscated),
                                record.path);
        }
        if (!store.exists(record.obfuscated)) {
            RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                                "Obfuscated entry is missing", record.obfuscated);
        }
        if (store.exists(record.path)) {
            RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                                "Original path is occupied", record.path);
        }
        const std::vector<uint8_t> data = store.get(record.obfuscated);
        if (data.size() != record.size) {
            RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                                fmt::format("Size mismatch: recorded {}, found {}", record.size, data.size()),
                                record.obfuscated);
        }
        std::vector<uint8_t> plain = transform(data, key, record.salt, record.path);
        if (checksum(key, record.salt, plain) != record.checksum) {
            RYURI_THROW_PACKAGE(core::ErrorCode::AuthenticationFailure,
                                "Checksum mismatch (wrong key?)", record.path);
        }
        restored.push_back(std::move(plain));
        mapping[record.obfuscated] = record.path;
    }

    const std::string opf_path = package::PackageLayout::locateOpf(cache);
    StoreTransaction txn(cache);
    try {
        for (size_t i = 0; i < manifest.records().size(); ++i) {
            const ProtectionRecord& record = manifest.records()[i];
            txn.put(record.path, std::move(restored[i]));
            txn.remove(record.obfuscated);
        }
        rewriteDocuments(txn, store, opf_path, mapping);
        txn.remove(manifest_path);
    } catch (...) {
        txn.rollback();
        throw;
    }

    if (!opf_path.empty()) {
        package::PackageLayout::load(cache).applyManifestOrder(store);
    }
    PROTECT_INFO("Unprotected {} entries", manifest.records().size());
}

// ========== 对外接口 ==========

core::VoidResult ProtectionCodec::protect(store::PackageStore& store, cache::DocumentCache& cache,
                                          const std::string& key) const {
    return core::ExceptionBridge::wrapVoidCall([&]() { doProtect(store, cache, key); });
}

core::VoidResult ProtectionCodec::protect(store::PackageStore& store, const std::string& key) const {
    cache::DocumentCache cache(store);
    return protect(store, cache, key);
}

core::VoidResult ProtectionCodec::unprotect(store::PackageStore& store, cache::DocumentCache& cache,
                                            const std::string& key) const {
    return core::ExceptionBridge::wrapVoidCall([&]() { doUnprotect(store, cache, key); });
}

core::VoidResult ProtectionCodec::unprotect(store::PackageStore& store, const std::string& key) const {
    cache::DocumentCache cache(store);
    return unprotect(store, cache, key);
}

}} // namespace ryuri::protect
