#include "io/zip_reader.hpp"
#include "io/zip_format.hpp"
#include "io/compression.hpp"

#include <sys/mman.h>
#include <cstdio>
#include <cstring>

namespace sigindex {

template <typename T>
static T load_record(const uint8_t* p) {
    T rec;
    std::memcpy(&rec, p, sizeof(T));
    return rec;
}

// Scan backwards for the end-of-central-directory record.
static bool find_eocd(const MmapFile& mmap, size_t& eocd_pos) {
    size_t size = mmap.size();
    if (size < sizeof(ZipEndOfCentralDir)) return false;

    size_t last = size - sizeof(ZipEndOfCentralDir);
    size_t first = last > ZIP_MAX_COMMENT ? last - ZIP_MAX_COMMENT : 0;
    const uint8_t* data = mmap.data();

    for (size_t pos = last + 1; pos-- > first;) {
        uint32_t sig;
        std::memcpy(&sig, data + pos, sizeof(sig));
        if (sig != ZIP_EOCD_SIG) continue;
        auto eocd = load_record<ZipEndOfCentralDir>(data + pos);
        if (pos + sizeof(ZipEndOfCentralDir) + eocd.comment_length == size) {
            eocd_pos = pos;
            return true;
        }
    }
    return false;
}

bool ZipReader::open(const std::string& path) {
    close();

    if (!mmap_.open(path))
        return false;

    size_t eocd_pos = 0;
    if (!find_eocd(mmap_, eocd_pos)) {
        std::fprintf(stderr, "ZipReader: '%s' is not a zip archive\n", path.c_str());
        close();
        return false;
    }

    auto eocd = load_record<ZipEndOfCentralDir>(mmap_.data() + eocd_pos);
    if (eocd.total_entries == 0xFFFF || eocd.cd_offset == 0xFFFFFFFFu ||
        eocd.cd_size == 0xFFFFFFFFu) {
        std::fprintf(stderr, "ZipReader: ZIP64 archives are not supported (%s)\n",
                     path.c_str());
        close();
        return false;
    }
    if (eocd.disk_number != 0 || eocd.cd_disk != 0 ||
        eocd.disk_entries != eocd.total_entries) {
        std::fprintf(stderr, "ZipReader: multi-disk archives are not supported (%s)\n",
                     path.c_str());
        close();
        return false;
    }
    const uint8_t* ptr = mmap_.slice(eocd.cd_offset, eocd.cd_size);
    if (!ptr) {
        std::fprintf(stderr, "ZipReader: central directory out of range\n");
        close();
        return false;
    }
    const uint8_t* end = ptr + eocd.cd_size;
    entries_.reserve(eocd.total_entries);

    for (uint16_t i = 0; i < eocd.total_entries; i++) {
        if (static_cast<size_t>(end - ptr) < sizeof(ZipCentralHeader)) {
            std::fprintf(stderr, "ZipReader: truncated central directory\n");
            close();
            return false;
        }
        auto hdr = load_record<ZipCentralHeader>(ptr);
        if (hdr.signature != ZIP_CENTRAL_HEADER_SIG) {
            std::fprintf(stderr, "ZipReader: bad central header signature\n");
            close();
            return false;
        }
        size_t rec_size = sizeof(ZipCentralHeader) + hdr.name_length +
                          hdr.extra_length + hdr.comment_length;
        if (static_cast<size_t>(end - ptr) < rec_size) {
            std::fprintf(stderr, "ZipReader: truncated central directory\n");
            close();
            return false;
        }

        ZipEntry e;
        e.name.assign(reinterpret_cast<const char*>(ptr + sizeof(ZipCentralHeader)),
                      hdr.name_length);
        e.method = hdr.method;
        e.crc32 = hdr.crc32;
        e.compressed_size = hdr.compressed_size;
        e.uncompressed_size = hdr.uncompressed_size;
        e.local_header_offset = hdr.local_header_offset;
        entries_.push_back(std::move(e));

        ptr += rec_size;
    }

    // Entries are read in central-directory order, but each pass may skip many
    mmap_.advise(MADV_RANDOM);

    return true;
}

void ZipReader::close() {
    mmap_.close();
    entries_.clear();
}

bool ZipReader::read_entry(size_t i, std::string& out) const {
    out.clear();
    if (i >= entries_.size()) return false;
    const ZipEntry& e = entries_[i];

    const uint8_t* header = mmap_.slice(e.local_header_offset, sizeof(ZipLocalHeader));
    if (!header)
        return false;
    auto local = load_record<ZipLocalHeader>(header);
    if (local.signature != ZIP_LOCAL_HEADER_SIG)
        return false;

    // Sizes come from the central directory: the local header may defer
    // them to a data descriptor.
    uint64_t data_offset = uint64_t(e.local_header_offset) + sizeof(ZipLocalHeader) +
                           local.name_length + local.extra_length;
    const uint8_t* data = mmap_.slice(data_offset, e.compressed_size);
    if (!data)
        return false;

    if (e.method == ZIP_METHOD_STORED) {
        if (e.compressed_size != e.uncompressed_size) return false;
        out.assign(reinterpret_cast<const char*>(data), e.compressed_size);
    } else if (e.method == ZIP_METHOD_DEFLATE) {
        if (!inflate_raw(data, e.compressed_size, e.uncompressed_size, out))
            return false;
        if (out.size() != e.uncompressed_size) return false;
    } else {
        return false;
    }

    return crc32_of(reinterpret_cast<const uint8_t*>(out.data()), out.size()) == e.crc32;
}

} // namespace sigindex
