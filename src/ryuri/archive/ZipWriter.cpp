#include "ryuri/archive/ZipWriter.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_mem.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <algorithm>
#include <limits>

namespace ryuri {
namespace archive {

namespace {
constexpr int32_t kMemGrowSize = 128 * 1024;
constexpr int32_t kWriteChunk = 1024 * 1024;
}

ZipWriter::ZipWriter(int compression_level)
    : compression_level_(std::clamp(compression_level, 0, 9)) {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

ZipError ZipWriter::open() {
    cleanup();

    mem_stream_ = mz_stream_mem_create();
    if (!mem_stream_) {
        ARCHIVE_ERROR("Failed to create memory stream");
        return ZipError::InternalError;
    }
    mz_stream_mem_set_grow_size(mem_stream_, kMemGrowSize);
    if (mz_stream_open(mem_stream_, nullptr, MZ_OPEN_MODE_CREATE) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open memory stream");
        cleanup();
        return ZipError::IoFail;
    }

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        cleanup();
        return ZipError::InternalError;
    }

    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    const int32_t result = mz_zip_writer_open(zip_handle_, mem_stream_, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip writer on memory stream, error: {}", result);
        cleanup();
        return ZipError::IoFail;
    }

    // 不使用 Data Descriptor，保证本地文件头携带真实大小
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    stats_ = Stats{};
    written_paths_.clear();
    return ZipError::Ok;
}

ZipError ZipWriter::addEntry(const std::string& path, const uint8_t* data, size_t size,
                             const EntryOptions& options) {
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    if (path.empty() || (size > 0 && !data)) {
        return ZipError::InvalidParameter;
    }
    if (!written_paths_.insert(path).second) {
        ARCHIVE_WARN("Entry {} already written, skipping duplicate", path);
        ++stats_.duplicates_skipped;
        return ZipError::Ok;
    }

    mz_zip_file file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compression_method = (options.method == Method::Store || compression_level_ == 0)
                                       ? MZ_COMPRESS_METHOD_STORE
                                       : MZ_COMPRESS_METHOD_DEFLATE;
    file_info.modified_date = options.modified_date;
    file_info.flag = MZ_ZIP_FLAG_UTF8;
#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {} for writing, error: {}", path, result);
        return ZipError::IoFail;
    }

    size_t offset = 0;
    while (offset < size) {
        const int32_t chunk = static_cast<int32_t>(std::min<size_t>(size - offset, kWriteChunk));
        const int32_t written = mz_zip_writer_entry_write(zip_handle_, data + offset, chunk);
        if (written != chunk) {
            ARCHIVE_ERROR("Short write on entry {}: {} of {} bytes", path, written, chunk);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::CompressionFail;
        }
        offset += static_cast<size_t>(chunk);
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry {}, error: {}", path, result);
        return ZipError::IoFail;
    }

    ++stats_.entries_written;
    stats_.bytes_written += size;
    RYURI_LOG_ZIP_DEBUG("Wrote entry {} ({} bytes, method {})", path, size, file_info.compression_method);
    return ZipError::Ok;
}

ZipError ZipWriter::finish(std::vector<uint8_t>& blob) {
    if (!is_open_) {
        return ZipError::NotOpen;
    }

    const int32_t result = mz_zip_writer_close(zip_handle_);
    is_open_ = false;
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize zip, error: {}", result);
        cleanup();
        return ZipError::IoFail;
    }

    const void* buffer = nullptr;
    int32_t length = 0;
    mz_stream_mem_get_buffer(mem_stream_, &buffer);
    mz_stream_mem_get_buffer_length(mem_stream_, &length);
    if (!buffer || length < 0) {
        ARCHIVE_ERROR("Memory stream returned no buffer");
        cleanup();
        return ZipError::InternalError;
    }

    const uint8_t* bytes = static_cast<const uint8_t*>(buffer);
    blob.assign(bytes, bytes + length);

    ARCHIVE_DEBUG("Archive finalized: {} entries, {} bytes uncompressed, {} bytes archive",
                  stats_.entries_written, stats_.bytes_written, blob.size());
    cleanup();
    return ZipError::Ok;
}

void ZipWriter::cleanup() {
    if (zip_handle_) {
        if (is_open_) {
            mz_zip_writer_close(zip_handle_);
        }
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    if (mem_stream_) {
        mz_stream_close(mem_stream_);
        mz_stream_mem_delete(&mem_stream_);
        mem_stream_ = nullptr;
    }
    is_open_ = false;
}

}} // namespace ryuri::archive
