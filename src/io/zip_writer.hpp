#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sigindex {

// Builds a zip archive in memory and writes it in one go.
class ZipWriter {
public:
    // Add a member. compress=false stores it uncompressed.
    // Returns false if compression fails.
    bool add_entry(const std::string& name, const std::string& data,
                   bool compress = true);

    // Write the archive. Returns true on success.
    bool write(const std::string& path) const;

    size_t num_entries() const { return entries_.size(); }

private:
    struct PendingEntry {
        std::string name;
        std::string payload;        // stored or deflated bytes
        uint16_t method;
        uint32_t crc32;
        uint32_t uncompressed_size;
    };
    std::vector<PendingEntry> entries_;
};

} // namespace sigindex
