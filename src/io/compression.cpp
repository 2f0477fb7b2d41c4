#include "io/compression.hpp"

#include <cstring>

#include <zlib.h>

namespace sigindex {

// window_bits selects the container: -15 raw, 15+16 gzip, 15+32 auto-detect.
// A nonzero expected_size is an upper bound on the inflated length.
static bool inflate_with(const uint8_t* data, size_t size, size_t expected_size,
                         int window_bits, std::string& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit2(&strm, window_bits) != Z_OK) return false;

    out.clear();
    size_t guess = size * 4;
    if (expected_size > 0 && expected_size < guess) guess = expected_size;
    out.reserve(guess);

    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    strm.avail_in = static_cast<uInt>(size);

    char buf[65536];
    int ret = Z_OK;
    do {
        strm.next_out = reinterpret_cast<Bytef*>(buf);
        strm.avail_out = sizeof(buf);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return false;
        }
        out.append(buf, sizeof(buf) - strm.avail_out);
        if (expected_size > 0 && out.size() > expected_size) {
            inflateEnd(&strm);
            return false;
        }
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            // input exhausted before end of stream: truncated
            inflateEnd(&strm);
            return false;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

static bool deflate_with(const std::string& in, int window_bits, std::string& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits,
                     8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    out.clear();
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());

    char buf[65536];
    int ret = Z_OK;
    do {
        strm.next_out = reinterpret_cast<Bytef*>(buf);
        strm.avail_out = sizeof(buf);
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            return false;
        }
        out.append(buf, sizeof(buf) - strm.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    return true;
}

bool is_gzip(const uint8_t* data, size_t size) {
    return size >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

bool gunzip(const uint8_t* data, size_t size, std::string& out) {
    return inflate_with(data, size, 0, 15 + 32, out);
}

bool gzip(const std::string& in, std::string& out) {
    return deflate_with(in, 15 + 16, out);
}

bool inflate_raw(const uint8_t* data, size_t size, size_t expected_size,
                 std::string& out) {
    return inflate_with(data, size, expected_size, -15, out);
}

bool deflate_raw(const std::string& in, std::string& out) {
    return deflate_with(in, -15, out);
}

uint32_t crc32_of(const uint8_t* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<uint32_t>(crc);
}

} // namespace sigindex
