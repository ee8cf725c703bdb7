#ifndef SPLATQUERY_PLATFORM_HPP
#define SPLATQUERY_PLATFORM_HPP

#include <filesystem>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace splatquery {
namespace platform {
namespace fs = std::filesystem;

/// File handle for memory mapping operations
struct FileHandle {
#ifdef _WIN32
    HANDLE file = INVALID_HANDLE_VALUE;
    HANDLE mapping = nullptr;
#else
    int fd = -1;
#endif
    std::size_t file_size = 0;

    bool valid() const {
#ifdef _WIN32
        return file != INVALID_HANDLE_VALUE;
#else
        return fd >= 0;
#endif
    }
};

/// Memory access pattern hints
enum class AccessHint { Sequential, Random, WillNeed, DontNeed };

/// Open file for memory mapping (read-only)
inline FileHandle file_open(const fs::path& path) {
    FileHandle h;
#ifdef _WIN32
    h.file = CreateFileW(path.wstring().c_str(), GENERIC_READ, FILE_SHARE_READ,
                         nullptr, OPEN_EXISTING,
                         FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (h.file != INVALID_HANDLE_VALUE) {
        LARGE_INTEGER size;
        if (GetFileSizeEx(h.file, &size)) {
            h.file_size = static_cast<std::size_t>(size.QuadPart);
        }
    }
#else
    h.fd = ::open(path.c_str(), O_RDONLY);
    if (h.fd >= 0) {
        struct stat st;
        if (::fstat(h.fd, &st) == 0) {
            h.file_size = static_cast<std::size_t>(st.st_size);
        }
    }
#endif
    return h;
}

inline void file_close(FileHandle& h) {
#ifdef _WIN32
    if (h.mapping) { CloseHandle(h.mapping); h.mapping = nullptr; }
    if (h.file != INVALID_HANDLE_VALUE) { CloseHandle(h.file); h.file = INVALID_HANDLE_VALUE; }
#else
    if (h.fd >= 0) { ::close(h.fd); h.fd = -1; }
#endif
    h.file_size = 0;
}

/// Map the whole file read-only. Returns nullptr on failure or for empty files.
inline void* mmap_read(FileHandle& h) {
    if (!h.valid() || h.file_size == 0) return nullptr;
#ifdef _WIN32
    if (!h.mapping) {
        h.mapping = CreateFileMappingW(h.file, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (!h.mapping) return nullptr;
    }
    return MapViewOfFile(h.mapping, FILE_MAP_READ, 0, 0, h.file_size);
#else
    void* addr = ::mmap(nullptr, h.file_size, PROT_READ, MAP_PRIVATE, h.fd, 0);
    return (addr == MAP_FAILED) ? nullptr : addr;
#endif
}

inline void munmap(void* addr, std::size_t length) {
    if (!addr) return;
#ifdef _WIN32
    (void)length;
    UnmapViewOfFile(addr);
#else
    ::munmap(addr, length);
#endif
}

/// Advise kernel about memory access pattern
inline void madvise(void* addr, std::size_t length, AccessHint hint) {
    if (!addr || length == 0) return;
#ifdef _WIN32
    if (hint == AccessHint::Sequential || hint == AccessHint::WillNeed) {
        WIN32_MEMORY_RANGE_ENTRY range;
        range.VirtualAddress = addr;
        range.NumberOfBytes = length;
        PrefetchVirtualMemory(GetCurrentProcess(), 1, &range, 0);
    }
#else
    int advice = MADV_NORMAL;
    switch (hint) {
        case AccessHint::Sequential: advice = MADV_SEQUENTIAL; break;
        case AccessHint::Random:     advice = MADV_RANDOM; break;
        case AccessHint::WillNeed:   advice = MADV_WILLNEED; break;
        case AccessHint::DontNeed:   advice = MADV_DONTNEED; break;
    }
    ::madvise(addr, length, advice);
#endif
}

/// Read-only view of a whole file, unmapped on destruction.
/// An empty file opens successfully and yields a zero-length view.
class MappedFile {
public:
    MappedFile() = default;
    ~MappedFile() { close(); }

    // Non-copyable
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    bool open(const fs::path& path, AccessHint hint = AccessHint::Sequential) {
        close();
        handle_ = file_open(path);
        if (!handle_.valid()) {
            return false;
        }
        if (handle_.file_size == 0) {
            return true;
        }
        addr_ = mmap_read(handle_);
        if (!addr_) {
            file_close(handle_);
            return false;
        }
        size_ = handle_.file_size;
        madvise(addr_, size_, hint);
        return true;
    }

    void close() {
        munmap(addr_, size_);
        addr_ = nullptr;
        size_ = 0;
        file_close(handle_);
    }

    bool is_open() const { return handle_.valid(); }

    const uint8_t* data() const {
        static const uint8_t empty = 0;
        return addr_ ? static_cast<const uint8_t*>(addr_) : &empty;
    }

    std::size_t size() const { return size_; }

private:
    FileHandle handle_;
    void* addr_ = nullptr;
    std::size_t size_ = 0;
};

} // namespace platform
} // namespace splatquery

#endif // SPLATQUERY_PLATFORM_HPP
