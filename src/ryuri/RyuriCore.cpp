#include "ryuri/RyuriCore.hpp"
#include "ryuri/cache/DocumentCache.hpp"
#include "ryuri/package/PackageLayout.hpp"
#include "ryuri/store/ArchivePackageStore.hpp"
#include "ryuri/store/DirectoryPackageStore.hpp"
#include "ryuri/store/PackageExporter.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <iostream>

namespace ryuri {

RYURI_API bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        RYURI_LOG_INFO("RyuriCore initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        if (enable_console) {
            std::cerr << "Failed to initialize RyuriCore: " << e.what() << std::endl;
        }
        return false;
    }
}

RYURI_API void cleanup() {
    RYURI_LOG_INFO("RyuriCore cleanup completed");
    Logger::getInstance().shutdown();
}

RYURI_API std::unique_ptr<store::PackageStore> openPackage(const core::Path& path) {
    std::unique_ptr<store::PackageStore> store;
    if (path.isDirectory()) {
        CORE_DEBUG("Opening directory package {}", path.string());
        store = store::DirectoryPackageStore::open(path);
    } else {
        CORE_DEBUG("Opening archive package {}", path.string());
        store = store::ArchivePackageStore::fromFile(path);
    }

    cache::DocumentCache cache(*store);
    package::PackageLayout::refreshManifestOrder(cache, *store);
    return store;
}

RYURI_API void exportPackage(const store::PackageStore& store, const core::Path& target,
                             ExportFormat format, int compression_level) {
    const store::PackageExporter exporter(compression_level);
    if (format == ExportFormat::Directory) {
        exporter.toDirectory(store, target);
    } else {
        exporter.toArchiveFile(store, target);
    }
    CORE_INFO("Exported {} entries to {}", store.size(), target.string());
}

RYURI_API core::VoidResult runPipeline(store::PackageStore& store,
                                       const std::vector<filter::FilterSpec>& specs,
                                       std::optional<filter::Deadline> deadline) {
    const filter::FilterRegistry registry = filter::FilterRegistry::withBuiltins();
    auto chain = filter::FilterChain::build(specs, registry);
    if (!chain) {
        return chain.error();
    }
    cache::DocumentCache cache(store);
    return chain.value().run(store, cache, deadline);
}

} // namespace ryuri
