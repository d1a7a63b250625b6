// ============================================================
// file_io.cpp -- MmapReader / AtomicFileWriter implementation
// ============================================================

#include "file_io.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) : path_(path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    LARGE_INTEGER sz{};
    if (!GetFileSizeEx(file_handle_, &sz)) {
        unmap();
        throw std::runtime_error("Cannot stat file: " + path);
    }
    size_ = (u64)sz.QuadPart;
    if (size_ == 0) return;

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    const void* view = map_handle_ ? MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0) : nullptr;
    if (!view) {
        unmap();
        throw std::runtime_error("Cannot map file: " + path);
    }
    data_ = static_cast<const u8*>(view);
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + std::strerror(errno));
    }
    struct stat st{};
    if (fstat(fd_, &st) != 0 || !S_ISREG(st.st_mode)) {
        unmap();
        throw std::runtime_error("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;
    if (size_ == 0) return;

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        int err = errno;
        unmap();
        throw std::runtime_error("Cannot map file: " + path + ": " + std::strerror(err));
    }
    // Workers read parts i, i+n, i+2n, ... concurrently
    madvise(p, (size_t)size_, MADV_RANDOM);
    data_ = static_cast<const u8*>(p);
#endif
}

MmapReader::~MmapReader() {
    unmap();
}

void MmapReader::unmap() {
#ifdef _WIN32
    if (data_) UnmapViewOfFile(data_);
    if (map_handle_) CloseHandle(map_handle_);
    if (file_handle_ != INVALID_HANDLE_VALUE) CloseHandle(file_handle_);
    map_handle_  = nullptr;
    file_handle_ = INVALID_HANDLE_VALUE;
#else
    if (data_) munmap(const_cast<u8*>(data_), (size_t)size_);
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
#endif
    data_ = nullptr;
    size_ = 0;
}

// ============================================================
// AtomicFileWriter
// ============================================================

AtomicFileWriter::AtomicFileWriter(const std::string& path)
    : path_(path), tmp_path_(path + ".tmp")
{
    ensure_parent_dirs(path_);
    out_.open(tmp_path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw std::runtime_error("Cannot create file: " + tmp_path_);
    }
}

AtomicFileWriter::~AtomicFileWriter() {
    if (committed_) return;
    out_.close();
    std::error_code ec;
    fs::remove(tmp_path_, ec);
    if (ec) {
        LOG_WARN("Cannot remove " + tmp_path_ + ": " + ec.message());
    }
}

void AtomicFileWriter::write(const void* data, size_t len) {
    if (committed_) throw std::runtime_error("write after commit: " + path_);
    if (len == 0) return;
    out_.write(static_cast<const char*>(data), (std::streamsize)len);
    if (!out_) throw std::runtime_error("Write failed: " + tmp_path_);
    written_ += len;
}

void AtomicFileWriter::commit() {
    if (committed_) return;
    out_.flush();
    out_.close();
    if (out_.fail()) throw std::runtime_error("Flush failed: " + tmp_path_);
    fs::rename(tmp_path_, path_);
    committed_ = true;
}

// ============================================================
// Utility functions
// ============================================================

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}
