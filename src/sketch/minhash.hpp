#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/config.hpp"

namespace sigindex {

// Bottom-k / FracMinHash sketch over 64-bit k-mer hashes.
//
// Exactly one sampling policy is active per sketch:
//   num policy    (num > 0, max_hash == 0): keep the num smallest hashes
//   scaled policy (num == 0, max_hash > 0): keep every hash <= max_hash
//
// Hashes are stored sorted ascending; abundances (if tracked) are parallel.
class MinHash {
public:
    MinHash(uint32_t ksize, uint32_t num, uint64_t max_hash,
            bool track_abundance = false,
            const std::string& moltype = DEFAULT_MOLTYPE,
            uint32_t seed = DEFAULT_SEED);

    static MinHash make_scaled(uint32_t ksize, uint64_t scaled,
                               bool track_abundance = false,
                               const std::string& moltype = DEFAULT_MOLTYPE,
                               uint32_t seed = DEFAULT_SEED);
    static MinHash make_num(uint32_t ksize, uint32_t num,
                            bool track_abundance = false,
                            const std::string& moltype = DEFAULT_MOLTYPE,
                            uint32_t seed = DEFAULT_SEED);

    uint32_t ksize() const { return ksize_; }
    const std::string& moltype() const { return moltype_; }
    uint32_t seed() const { return seed_; }
    uint32_t num() const { return num_; }
    uint64_t max_hash() const { return max_hash_; }
    uint64_t scaled() const { return scaled_for_max_hash(max_hash_); }
    bool track_abundance() const { return track_abundance_; }

    size_t size() const { return mins_.size(); }
    bool empty() const { return mins_.empty(); }
    const std::vector<uint64_t>& hashes() const { return mins_; }
    const std::vector<uint64_t>& abundances() const { return abunds_; }

    // Add a hash value; ignored if outside the sampling policy.
    void add_hash(uint64_t hash, uint64_t abundance = 1);
    void add_many(const std::vector<uint64_t>& hashes);

    // Copies at a coarser resolution.
    // Throw ConfigurationError on a policy mismatch or a finer target.
    MinHash downsample_scaled(uint64_t new_scaled) const;
    MinHash downsample_num(uint32_t new_num) const;

    // Comparisons. With downsample=true both sides are reduced to the coarser
    // resolution; otherwise differing resolutions are a ConfigurationError.
    // Differing ksize, moltype, seed or policy is always a ConfigurationError.
    uint64_t count_common(const MinHash& other, bool downsample = false) const;
    double jaccard(const MinHash& other, bool downsample = false) const;
    double similarity(const MinHash& other, bool downsample = false,
                      bool ignore_abundance = false) const;
    double angular_similarity(const MinHash& other, bool downsample = false) const;

    // |A & B| / |A|
    double contained_by(const MinHash& other, bool downsample = false) const;
    // |A & B| / |B|
    double containment(const MinHash& other, bool downsample = false) const;
    // |A & B| / min(|A|, |B|)
    double max_containment(const MinHash& other, bool downsample = false) const;

    // Lowercase hex MD5 over ksize and hashes; stable content fingerprint.
    std::string md5sum() const;

    bool operator==(const MinHash& other) const;
    bool operator!=(const MinHash& other) const { return !(*this == other); }

private:
    // Prefix lengths of both hash vectors at the common resolution.
    struct CommonView {
        size_t a_end;
        size_t b_end;
        uint32_t num;       // union truncation for num sketches, 0 for scaled
    };

    CommonView common_view(const MinHash& other, bool downsample) const;
    uint64_t intersect(const MinHash& other, const CommonView& v) const;

    uint32_t ksize_;
    std::string moltype_;
    uint32_t seed_;
    uint32_t num_;
    uint64_t max_hash_;
    bool track_abundance_;
    std::vector<uint64_t> mins_;
    std::vector<uint64_t> abunds_;
};

} // namespace sigindex
