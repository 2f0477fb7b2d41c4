#pragma once

#include <cstdint>

namespace sigindex {

// PKZIP record signatures (little-endian)
inline constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
inline constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
inline constexpr uint32_t ZIP_EOCD_SIG = 0x06054b50;

inline constexpr uint16_t ZIP_METHOD_STORED = 0;
inline constexpr uint16_t ZIP_METHOD_DEFLATE = 8;

inline constexpr uint16_t ZIP_VERSION_NEEDED = 20;
inline constexpr uint16_t ZIP_FLAG_UTF8 = 0x0800;

// The EOCD comment is at most 65535 bytes.
inline constexpr uint32_t ZIP_MAX_COMMENT = 0xFFFF;

#pragma pack(push, 1)
struct ZipLocalHeader {
    uint32_t signature;          // 0x00: ZIP_LOCAL_HEADER_SIG
    uint16_t version_needed;     // 0x04
    uint16_t flags;              // 0x06
    uint16_t method;             // 0x08
    uint16_t mod_time;           // 0x0A
    uint16_t mod_date;           // 0x0C
    uint32_t crc32;              // 0x0E
    uint32_t compressed_size;    // 0x12
    uint32_t uncompressed_size;  // 0x16
    uint16_t name_length;        // 0x1A
    uint16_t extra_length;       // 0x1C
};

struct ZipCentralHeader {
    uint32_t signature;          // 0x00: ZIP_CENTRAL_HEADER_SIG
    uint16_t version_made_by;    // 0x04
    uint16_t version_needed;     // 0x06
    uint16_t flags;              // 0x08
    uint16_t method;             // 0x0A
    uint16_t mod_time;           // 0x0C
    uint16_t mod_date;           // 0x0E
    uint32_t crc32;              // 0x10
    uint32_t compressed_size;    // 0x14
    uint32_t uncompressed_size;  // 0x18
    uint16_t name_length;        // 0x1C
    uint16_t extra_length;       // 0x1E
    uint16_t comment_length;     // 0x20
    uint16_t disk_start;         // 0x22
    uint16_t internal_attrs;     // 0x24
    uint32_t external_attrs;     // 0x26
    uint32_t local_header_offset; // 0x2A
};

struct ZipEndOfCentralDir {
    uint32_t signature;          // 0x00: ZIP_EOCD_SIG
    uint16_t disk_number;        // 0x04
    uint16_t cd_disk;            // 0x06
    uint16_t disk_entries;       // 0x08
    uint16_t total_entries;      // 0x0A
    uint32_t cd_size;            // 0x0C
    uint32_t cd_offset;          // 0x10
    uint16_t comment_length;     // 0x14
};
#pragma pack(pop)

static_assert(sizeof(ZipLocalHeader) == 30, "ZipLocalHeader must be 30 bytes");
static_assert(sizeof(ZipCentralHeader) == 46, "ZipCentralHeader must be 46 bytes");
static_assert(sizeof(ZipEndOfCentralDir) == 22, "ZipEndOfCentralDir must be 22 bytes");

} // namespace sigindex
