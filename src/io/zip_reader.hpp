#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "io/mmap_file.hpp"

namespace sigindex {

struct ZipEntry {
    std::string name;
    uint16_t method = 0;
    uint32_t crc32 = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_header_offset = 0;

    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

// Random-access reader for zip archives (stored and deflate members).
//
// The archive is memory-mapped read-only; read_entry() is const and touches
// no shared mutable state, so one open reader may serve several concurrent
// enumerations. ZIP64 and multi-disk archives are rejected by open().
class ZipReader {
public:
    bool open(const std::string& path);
    void close();

    bool is_open() const { return mmap_.is_open(); }
    const std::string& path() const { return mmap_.path(); }

    size_t num_entries() const { return entries_.size(); }
    const std::vector<ZipEntry>& entries() const { return entries_; }
    const ZipEntry& entry(size_t i) const { return entries_[i]; }

    // Decompress entry i into out. Returns false on an unsupported method,
    // truncated data or CRC mismatch.
    bool read_entry(size_t i, std::string& out) const;

private:
    MmapFile mmap_;
    std::vector<ZipEntry> entries_;
};

} // namespace sigindex
