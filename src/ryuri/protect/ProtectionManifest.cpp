#include "ryuri/protect/ProtectionManifest.hpp"
#include "ryuri/core/Exception.hpp"
#include <cerrno>
#include <cstdlib>
#include <fmt/format.h>

namespace ryuri {
namespace protect {

namespace {

const std::string& requireAttribute(const xml::Node& entry, const char* name, const std::string& source_path) {
    const std::string* value = entry.attribute(name);
    if (!value) {
        RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                            fmt::format("Protection entry lacks '{}' attribute", name), source_path);
    }
    return *value;
}

uint64_t parseSize(const std::string& text, const std::string& source_path) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                            fmt::format("Invalid protection entry size '{}'", text), source_path);
    }
    errno = 0;
    const unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                            fmt::format("Protection entry size '{}' out of range", text), source_path);
    }
    return static_cast<uint64_t>(value);
}

} // namespace

ProtectionManifest ProtectionManifest::fromDocument(const xml::Document& document, const std::string& source_path) {
    const xml::Node* root = document.root();
    if (!root || root->name() != "protection") {
        RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                            "Protection manifest root must be <protection>", source_path);
    }

    ProtectionManifest manifest;
    for (const xml::Node* entry : root->childElements("entry")) {
        ProtectionRecord record;
        record.path = requireAttribute(*entry, "path", source_path);
        record.obfuscated = requireAttribute(*entry, "obfuscated", source_path);
        record.algorithm = requireAttribute(*entry, "algorithm", source_path);
        record.salt = requireAttribute(*entry, "salt", source_path);
        record.size = parseSize(requireAttribute(*entry, "size", source_path), source_path);
        record.checksum = requireAttribute(*entry, "checksum", source_path);
        if (manifest.findByPath(record.path) || manifest.findByObfuscated(record.obfuscated)) {
            RYURI_THROW_PACKAGE(core::ErrorCode::ManifestInconsistent,
                                fmt::format("Duplicate protection entry for '{}'", record.path), source_path);
        }
        manifest.records_.push_back(std::move(record));
    }
    return manifest;
}

xml::Document ProtectionManifest::toDocument() const {
    xml::Node::NodePtr root = xml::Node::element("protection");
    root->setAttribute("version", kVersion);
    for (const auto& record : records_) {
        xml::Node& entry = root->appendChild(xml::Node::element("entry"));
        entry.setAttribute("path", record.path);
        entry.setAttribute("obfuscated", record.obfuscated);
        entry.setAttribute("algorithm", record.algorithm);
        entry.setAttribute("salt", record.salt);
        entry.setAttribute("size", std::to_string(record.size));
        entry.setAttribute("checksum", record.checksum);
    }
    xml::Document document(std::move(root));
    document.setHasDeclaration(true);
    return document;
}

const ProtectionRecord* ProtectionManifest::findByPath(const std::string& path) const {
    for (const auto& record : records_) {
        if (record.path == path) {
            return &record;
        }
    }
    return nullptr;
}

const ProtectionRecord* ProtectionManifest::findByObfuscated(const std::string& obfuscated) const {
    for (const auto& record : records_) {
        if (record.obfuscated == obfuscated) {
            return &record;
        }
    }
    return nullptr;
}

void ProtectionManifest::merge(const ProtectionRecord& record) {
    for (auto& existing : records_) {
        if (existing.path == record.path) {
            existing = record;
            return;
        }
    }
    records_.push_back(record);
}

}} // namespace ryuri::protect
