#pragma once

#include <cstddef>
#include <filesystem>
#include <span>

namespace encsniff::detail {

// Read-only mapping of a whole file. Empty files have an empty data().
class MappedFile {
public:
    explicit MappedFile(const std::filesystem::path& path);
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    std::span<const std::byte> data() const { return {data_, size_}; }
    std::size_t size() const { return size_; }

private:
    void unmap();

    const std::byte* data_ = nullptr;
    std::size_t size_ = 0;
#ifdef _WIN32
    void* file_handle_ = nullptr;
    void* mapping_handle_ = nullptr;
#endif
};

} // namespace encsniff::detail
