#include "io/zip_writer.hpp"
#include "io/zip_format.hpp"
#include "io/compression.hpp"

#include <cstdio>
#include <cstring>

namespace sigindex {

// 1980-01-01 00:00:00 in MS-DOS format; archives are reproducible.
static constexpr uint16_t DOS_TIME = 0;
static constexpr uint16_t DOS_DATE = (0 << 9) | (1 << 5) | 1;

bool ZipWriter::add_entry(const std::string& name, const std::string& data,
                          bool compress) {
    PendingEntry e;
    e.name = name;
    e.crc32 = crc32_of(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    e.uncompressed_size = static_cast<uint32_t>(data.size());

    if (compress) {
        if (!deflate_raw(data, e.payload)) {
            std::fprintf(stderr, "ZipWriter: compression failed for '%s'\n",
                         name.c_str());
            return false;
        }
        e.method = ZIP_METHOD_DEFLATE;
    } else {
        e.payload = data;
        e.method = ZIP_METHOD_STORED;
    }

    entries_.push_back(std::move(e));
    return true;
}

bool ZipWriter::write(const std::string& path) const {
    FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp) {
        std::fprintf(stderr, "ZipWriter: cannot open '%s' for writing\n", path.c_str());
        return false;
    }

    bool ok = true;
    uint32_t offset = 0;
    std::vector<uint32_t> local_offsets;
    local_offsets.reserve(entries_.size());

    // Local headers + data
    for (const auto& e : entries_) {
        local_offsets.push_back(offset);

        ZipLocalHeader hdr{};
        hdr.signature = ZIP_LOCAL_HEADER_SIG;
        hdr.version_needed = ZIP_VERSION_NEEDED;
        hdr.flags = ZIP_FLAG_UTF8;
        hdr.method = e.method;
        hdr.mod_time = DOS_TIME;
        hdr.mod_date = DOS_DATE;
        hdr.crc32 = e.crc32;
        hdr.compressed_size = static_cast<uint32_t>(e.payload.size());
        hdr.uncompressed_size = e.uncompressed_size;
        hdr.name_length = static_cast<uint16_t>(e.name.size());
        hdr.extra_length = 0;

        ok = ok && std::fwrite(&hdr, sizeof(hdr), 1, fp) == 1;
        ok = ok && std::fwrite(e.name.data(), 1, e.name.size(), fp) == e.name.size();
        if (!e.payload.empty()) {
            ok = ok && std::fwrite(e.payload.data(), 1, e.payload.size(), fp) == e.payload.size();
        }
        offset += static_cast<uint32_t>(sizeof(hdr) + e.name.size() + e.payload.size());
    }

    // Central directory
    uint32_t cd_offset = offset;
    for (size_t i = 0; i < entries_.size(); i++) {
        const auto& e = entries_[i];

        ZipCentralHeader hdr{};
        hdr.signature = ZIP_CENTRAL_HEADER_SIG;
        hdr.version_made_by = ZIP_VERSION_NEEDED;
        hdr.version_needed = ZIP_VERSION_NEEDED;
        hdr.flags = ZIP_FLAG_UTF8;
        hdr.method = e.method;
        hdr.mod_time = DOS_TIME;
        hdr.mod_date = DOS_DATE;
        hdr.crc32 = e.crc32;
        hdr.compressed_size = static_cast<uint32_t>(e.payload.size());
        hdr.uncompressed_size = e.uncompressed_size;
        hdr.name_length = static_cast<uint16_t>(e.name.size());
        hdr.local_header_offset = local_offsets[i];

        ok = ok && std::fwrite(&hdr, sizeof(hdr), 1, fp) == 1;
        ok = ok && std::fwrite(e.name.data(), 1, e.name.size(), fp) == e.name.size();
        offset += static_cast<uint32_t>(sizeof(hdr) + e.name.size());
    }

    ZipEndOfCentralDir eocd{};
    eocd.signature = ZIP_EOCD_SIG;
    eocd.disk_entries = static_cast<uint16_t>(entries_.size());
    eocd.total_entries = static_cast<uint16_t>(entries_.size());
    eocd.cd_size = offset - cd_offset;
    eocd.cd_offset = cd_offset;
    ok = ok && std::fwrite(&eocd, sizeof(eocd), 1, fp) == 1;

    if (std::fclose(fp) != 0) ok = false;
    if (!ok) {
        std::fprintf(stderr, "ZipWriter: write failed for '%s'\n", path.c_str());
    }
    return ok;
}

} // namespace sigindex
