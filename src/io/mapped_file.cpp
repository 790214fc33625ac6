#include "mapped_file.h"

#include <stdexcept>
#include <string>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <cerrno>
#  include <cstring>
#  include <fcntl.h>
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <unistd.h>
#endif

namespace encsniff::detail {

#ifdef _WIN32

MappedFile::MappedFile(const std::filesystem::path& path) {
    const std::string name = path.string();

    file_handle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        file_handle_ = nullptr;
        throw std::runtime_error("MappedFile: cannot open file: " + name);
    }

    LARGE_INTEGER file_size;
    if (!GetFileSizeEx(file_handle_, &file_size)) {
        unmap();
        throw std::runtime_error("MappedFile: cannot get file size: " + name);
    }

    size_ = static_cast<std::size_t>(file_size.QuadPart);
    if (size_ == 0) {
        unmap();
        return; // Empty file, nothing to map.
    }

    mapping_handle_ = CreateFileMappingW(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!mapping_handle_) {
        unmap();
        throw std::runtime_error("MappedFile: CreateFileMapping failed: " + name);
    }

    data_ = static_cast<const std::byte*>(MapViewOfFile(mapping_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        unmap();
        throw std::runtime_error("MappedFile: MapViewOfFile failed: " + name);
    }
}

void MappedFile::unmap() {
    if (data_) {
        UnmapViewOfFile(data_);
        data_ = nullptr;
    }
    if (mapping_handle_) {
        CloseHandle(mapping_handle_);
        mapping_handle_ = nullptr;
    }
    if (file_handle_) {
        CloseHandle(file_handle_);
        file_handle_ = nullptr;
    }
    size_ = 0;
}

#else // POSIX

MappedFile::MappedFile(const std::filesystem::path& path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0)
        throw std::runtime_error("MappedFile: cannot open file: " + path.string() +
                                 " (" + std::strerror(errno) + ")");

    struct stat st;
    if (fstat(fd, &st) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error("MappedFile: fstat failed: " + path.string() +
                                 " (" + std::strerror(err) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        close(fd);
        throw std::runtime_error("MappedFile: is a directory: " + path.string());
    }

    std::size_t size = static_cast<std::size_t>(st.st_size);
    if (size == 0) {
        close(fd);
        return; // Empty file, nothing to map.
    }

    void* mapped = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    int err = errno;
    close(fd); // fd is no longer needed after mmap.

    if (mapped == MAP_FAILED)
        throw std::runtime_error("MappedFile: mmap failed: " + path.string() +
                                 " (" + std::strerror(err) + ")");

    data_ = static_cast<const std::byte*>(mapped);
    size_ = size;
}

void MappedFile::unmap() {
    if (data_) {
        munmap(const_cast<std::byte*>(data_), size_);
        data_ = nullptr;
    }
    size_ = 0;
}

#endif // _WIN32

MappedFile::~MappedFile() {
    unmap();
}

} // namespace encsniff::detail
