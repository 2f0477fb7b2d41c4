#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sigindex {

// Read-only private mapping of a whole file, used for random access into
// zip archives. Reads through slice() are bounds-checked, so a corrupt
// offset in the archive can never reach outside the mapping.
class MmapFile {
public:
    MmapFile() = default;
    ~MmapFile();

    MmapFile(const MmapFile&) = delete;
    MmapFile& operator=(const MmapFile&) = delete;

    MmapFile(MmapFile&& other) noexcept;
    MmapFile& operator=(MmapFile&& other) noexcept;

    // Map path. Empty files cannot be mapped and fail like missing ones.
    // quiet suppresses the diagnostic for a missing or empty file.
    bool open(const std::string& path, bool quiet = false);
    void close();

    bool is_open() const { return data_ != nullptr; }
    const std::string& path() const { return path_; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }

    // Pointer to [offset, offset + length), or nullptr if that range is not
    // entirely inside the mapping.
    const uint8_t* slice(uint64_t offset, uint64_t length) const {
        if (!data_ || offset > size_ || length > size_ - offset) return nullptr;
        return data_ + offset;
    }

    // madvise hint for the whole mapping (MADV_RANDOM for archive lookups)
    bool advise(int advice);

private:
    void release();

    uint8_t* data_ = nullptr;
    size_t size_ = 0;
    std::string path_;
};

} // namespace sigindex
