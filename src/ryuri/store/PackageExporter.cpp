#include "ryuri/store/PackageExporter.hpp"
#include "ryuri/archive/ZipWriter.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <cstring>

namespace ryuri {
namespace store {

namespace {

std::vector<uint8_t> mimetypeBytes() {
    const char* content = core::EpubConstants::kMimetypeContent;
    return std::vector<uint8_t>(content, content + std::strlen(content));
}

void checkZip(archive::ZipError result, const char* what, const std::string& path) {
    if (archive::isError(result)) {
        RYURI_THROW_PACKAGE(core::ErrorCode::IOFailure,
                            fmt::format("{} ({})", what, archive::toString(result)), path);
    }
}

} // namespace

std::vector<uint8_t> PackageExporter::toArchive(const PackageStore& store) const {
    archive::ZipWriter writer(compression_level_);
    checkZip(writer.open(), "Cannot open archive writer", "");

    const std::string mimetype_path = core::EpubConstants::kMimetypePath;

    archive::ZipWriter::EntryOptions mimetype_options;
    mimetype_options.method = archive::ZipWriter::Method::Store;
    mimetype_options.modified_date = core::Constants::kFixedEntryTime;
    if (store.exists(mimetype_path)) {
        const EntryAttributes attrs = store.attributes(mimetype_path);
        if (!attrs.modified) {
            mimetype_options.modified_date = attrs.modified_date;
        }
    } else {
        STORE_WARN("Package has no mimetype entry, regenerating it");
    }
    checkZip(writer.addEntry(mimetype_path, mimetypeBytes(), mimetype_options),
             "Cannot write mimetype", mimetype_path);

    for (const auto& path : store.list()) {
        if (path == mimetype_path) {
            continue;
        }
        const EntryAttributes attrs = store.attributes(path);
        archive::ZipWriter::EntryOptions options;
        options.method = attrs.compression_method == 0 ? archive::ZipWriter::Method::Store
                                                       : archive::ZipWriter::Method::Deflate;
        options.modified_date = attrs.modified_date;
        checkZip(writer.addEntry(path, store.get(path), options), "Cannot write entry", path);
    }

    std::vector<uint8_t> blob;
    checkZip(writer.finish(blob), "Cannot finalize archive", "");
    STORE_INFO("Exported {} package: {} entries, {} bytes", store.backendName(),
               writer.getStats().entries_written, blob.size());
    return blob;
}

void PackageExporter::toArchiveFile(const PackageStore& store, const core::Path& target) const {
    target.writeAll(toArchive(store));
}

void PackageExporter::toDirectory(const PackageStore& store, const core::Path& target_dir) const {
    const std::string mimetype_path = core::EpubConstants::kMimetypePath;
    (target_dir / mimetype_path).writeAll(mimetypeBytes());
    size_t written = 1;
    for (const auto& path : store.list()) {
        if (path == mimetype_path) {
            continue;
        }
        (target_dir / path).writeAll(store.get(path));
        ++written;
    }
    STORE_INFO("Exported {} package to directory {}: {} entries", store.backendName(),
               target_dir.string(), written);
}

}} // namespace ryuri::store
