#include "ryuri/cache/DocumentCache.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include "ryuri/xml/XMLStreamWriter.hpp"

namespace ryuri {
namespace cache {

const char* toString(SerializationMode mode) noexcept {
    switch (mode) {
        case SerializationMode::Package: return "package";
        case SerializationMode::Markup:  return "markup";
        case SerializationMode::Generic: return "generic";
    }
    return "generic";
}

xml::Document& DocumentCache::readXml(const std::string& path) {
    const uint64_t current = store_.revision(path);
    auto it = documents_.find(path);
    if (it != documents_.end()) {
        if (it->second.revision == current) {
            ++stats_.hits;
            RYURI_LOG_CACHE_DEBUG("Cache hit: {}", path);
            return it->second.document;
        }
        RYURI_LOG_CACHE_DEBUG("Stale cache entry: {} (rev {} -> {})", path, it->second.revision, current);
        documents_.erase(it);
    }

    // 解析失败时不留下任何缓存项
    xml::Document parsed = xml::Document::parse(store_.get(path), path);
    ++stats_.parses;

    CachedDocument cached;
    cached.document = std::move(parsed);
    cached.revision = current;
    auto inserted = documents_.emplace(path, std::move(cached));
    return inserted.first->second.document;
}

std::string DocumentCache::serialize(const xml::Document& document, SerializationMode mode,
                                     const std::string& path) {
    const xml::Node* root = document.root();
    if (!root || !root->isElement()) {
        RYURI_THROW_XML(core::ErrorCode::SerializationMismatch, "Document has no root element", path, -1);
    }

    const std::string xmlns = root->attributeOr("xmlns");
    if (mode == SerializationMode::Package) {
        if (root->localName() != "package" || xmlns != core::EpubConstants::kOpfNamespace) {
            RYURI_THROW_XML(core::ErrorCode::SerializationMismatch,
                            fmt::format("Package mode requires <package xmlns=\"{}\">, got <{}> xmlns=\"{}\"",
                                        core::EpubConstants::kOpfNamespace, root->name(), xmlns),
                            path, -1);
        }
    } else if (mode == SerializationMode::Markup) {
        if (root->localName() != "html" || xmlns != core::EpubConstants::kXhtmlNamespace) {
            RYURI_THROW_XML(core::ErrorCode::SerializationMismatch,
                            fmt::format("Markup mode requires <html xmlns=\"{}\">, got <{}> xmlns=\"{}\"",
                                        core::EpubConstants::kXhtmlNamespace, root->name(), xmlns),
                            path, -1);
        }
    }

    xml::XMLStreamWriter writer(mode == SerializationMode::Markup
                                    ? xml::XMLStreamWriter::EmptyElementStyle::XhtmlVoidOnly
                                    : xml::XMLStreamWriter::EmptyElementStyle::SelfClose);
    writer.startDocument("utf-8");
    if (mode == SerializationMode::Markup) {
        writer.writeDoctype("<!DOCTYPE html>");
    } else if (mode == SerializationMode::Generic && !document.doctype().empty()) {
        writer.writeDoctype(document.doctype());
    }
    root->write(writer);
    writer.endDocument();
    return writer.takeString();
}

void DocumentCache::writeXml(const std::string& path, const xml::Document& document, SerializationMode mode) {
    std::string text = serialize(document, mode, path);
    store_.put(path, text);
    ++stats_.writes;

    const uint64_t current = store_.revision(path);
    auto it = documents_.find(path);
    if (it != documents_.end() && &it->second.document == &document) {
        it->second.revision = current;
    } else {
        CachedDocument cached;
        cached.document = document.clone();
        cached.revision = current;
        documents_[path] = std::move(cached);
    }
    // 写出的文本总带声明，缓存树与之保持一致
    documents_[path].document.setHasDeclaration(true);
    if (mode == SerializationMode::Markup) {
        documents_[path].document.setDoctype("<!DOCTYPE html>");
    }

    CACHE_DEBUG("Wrote {} as {} ({} bytes)", path, toString(mode), text.size());
}

void DocumentCache::forget(const std::string& path) {
    documents_.erase(path);
}

void DocumentCache::clear() {
    documents_.clear();
}

bool DocumentCache::isCached(const std::string& path) const {
    return documents_.find(path) != documents_.end();
}

void DocumentCache::put(const std::string& path, std::vector<uint8_t> data) {
    store_.put(path, std::move(data));
    documents_.erase(path);
}

void DocumentCache::put(const std::string& path, const std::string& text) {
    store_.put(path, text);
    documents_.erase(path);
}

void DocumentCache::remove(const std::string& path) {
    store_.remove(path);
    documents_.erase(path);
}

}} // namespace ryuri::cache
