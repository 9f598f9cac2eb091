#include "ryuri/archive/ZipReader.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <array>
#include <limits>
#include <unordered_set>

namespace ryuri {
namespace archive {

ZipReader::ZipReader(std::vector<uint8_t> blob)
    : blob_(std::move(blob)) {
}

ZipReader::~ZipReader() {
    close();
}

ZipError ZipReader::open() {
    close();

    if (blob_.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        ARCHIVE_ERROR("Archive blob too large for in-memory reader: {} bytes", blob_.size());
        return ZipError::InvalidParameter;
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    // copy=0：读取器直接引用 blob_，blob_ 生命周期覆盖读取器
    const int32_t result = mz_zip_reader_open_buffer(unzip_handle_, blob_.data(),
                                                     static_cast<int32_t>(blob_.size()), 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip buffer ({} bytes), error: {}", blob_.size(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return ZipError::BadFormat;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Opened in-memory archive, {} bytes", blob_.size());
    return ZipError::Ok;
}

void ZipReader::close() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
}

ZipError ZipReader::readAll(std::vector<Entry>& entries, std::string& failed_path) {
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }

    entries.clear();
    std::unordered_set<std::string> seen;

    int32_t status = mz_zip_reader_goto_first_entry(unzip_handle_);
    if (status == MZ_END_OF_LIST) {
        return ZipError::Ok;
    }
    if (status != MZ_OK) {
        ARCHIVE_ERROR("Cannot locate first entry, error: {}", status);
        return ZipError::BadFormat;
    }

    do {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info || !info->filename) {
            ARCHIVE_ERROR("Unreadable central directory record");
            return ZipError::BadFormat;
        }

        Entry entry;
        entry.info.path = info->filename;
        entry.info.compressed_size = static_cast<uint64_t>(info->compressed_size);
        entry.info.uncompressed_size = static_cast<uint64_t>(info->uncompressed_size);
        entry.info.crc32 = info->crc;
        entry.info.compression_method = info->compression_method;
        entry.info.modified_date = info->modified_date;
        entry.info.is_directory = (mz_zip_reader_entry_is_dir(unzip_handle_) == MZ_OK);

        if (!seen.insert(entry.info.path).second) {
            ARCHIVE_ERROR("Duplicate entry in archive: {}", entry.info.path);
            failed_path = entry.info.path;
            return ZipError::DuplicateEntry;
        }

        if (!entry.info.is_directory) {
            const ZipError read_result = readCurrentEntry(entry.data, entry.info.uncompressed_size);
            if (read_result != ZipError::Ok) {
                failed_path = entry.info.path;
                return read_result;
            }
            RYURI_LOG_ZIP_DEBUG("Read entry {} ({} bytes)", entry.info.path, entry.data.size());
            entries.push_back(std::move(entry));
        }

        status = mz_zip_reader_goto_next_entry(unzip_handle_);
    } while (status == MZ_OK);

    if (status != MZ_END_OF_LIST) {
        ARCHIVE_ERROR("Central directory walk ended with error: {}", status);
        return ZipError::BadFormat;
    }

    ARCHIVE_DEBUG("Read {} entries from archive", entries.size());
    return ZipError::Ok;
}

ZipError ZipReader::readCurrentEntry(std::vector<uint8_t>& data, uint64_t expected_size) {
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry for reading");
        return ZipError::BadFormat;
    }

    data.clear();
    data.reserve(static_cast<size_t>(expected_size));

    std::array<uint8_t, core::Constants::kIOBufferSize> buffer;
    int32_t bytes_read = 0;
    do {
        bytes_read = mz_zip_reader_entry_read(unzip_handle_, buffer.data(),
                                              static_cast<int32_t>(buffer.size()));
        if (bytes_read > 0) {
            data.insert(data.end(), buffer.data(), buffer.data() + bytes_read);
        }
    } while (bytes_read > 0);

    // entry_close 负责 CRC 校验
    const int32_t close_result = mz_zip_reader_entry_close(unzip_handle_);
    if (bytes_read < 0 || close_result != MZ_OK) {
        ARCHIVE_ERROR("Entry read failed, read status: {}, close status: {}", bytes_read, close_result);
        return ZipError::BadFormat;
    }
    if (data.size() != expected_size) {
        ARCHIVE_ERROR("Entry size mismatch, expected: {} bytes, read: {} bytes", expected_size, data.size());
        return ZipError::BadFormat;
    }
    return ZipError::Ok;
}

}} // namespace ryuri::archive
