#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped reads and atomic file writes
// ============================================================

#include "platform.hpp"
#include <string>
#include <fstream>
#include <stdexcept>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: read-only mapping of a whole file. Uploads walk it
//      part by part, the endpoint server serves chunk requests from it. ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const u8* data() const { return data_; }
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

    // Bytes available at offset, capped at max_len; 0 past the end
    u64 span(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    // Copy of span(offset, max_len) bytes
    std::vector<u8> slice(u64 offset, u64 max_len) const {
        u64 n = span(offset, max_len);
        if (n == 0) return {};
        return std::vector<u8>(data_ + offset, data_ + offset + n);
    }

private:
    void unmap();

    std::string path_;
    const u8*   data_{nullptr};
    u64         size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- AtomicFileWriter: sequential writes to "<path>.tmp", renamed
//      into place by commit(). Dropped without commit, the temp file
//      is removed and the target is left untouched. ----
class AtomicFileWriter {
public:
    explicit AtomicFileWriter(const std::string& path);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    void write(const void* data, size_t len);
    void commit();

    u64 bytes_written() const { return written_; }
    const std::string& path() const { return path_; }

private:
    std::string   path_;
    std::string   tmp_path_;
    std::ofstream out_;
    u64           written_{0};
    bool          committed_{false};
};

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

} // namespace file_io
