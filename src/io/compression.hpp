#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sigindex {

// True if the buffer starts with the gzip magic bytes (1f 8b).
bool is_gzip(const uint8_t* data, size_t size);

// Decompress a gzip or zlib stream. Returns false on corrupt input.
bool gunzip(const uint8_t* data, size_t size, std::string& out);

// Compress to a gzip stream.
bool gzip(const std::string& in, std::string& out);

// Raw DEFLATE (no header), as stored in zip entries.
// Fails once the output grows past expected_size; 0 if unknown.
bool inflate_raw(const uint8_t* data, size_t size, size_t expected_size,
                 std::string& out);
bool deflate_raw(const std::string& in, std::string& out);

uint32_t crc32_of(const uint8_t* data, size_t size);

} // namespace sigindex
