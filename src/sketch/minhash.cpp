#include "sketch/minhash.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace sigindex {

MinHash::MinHash(uint32_t ksize, uint32_t num, uint64_t max_hash,
                 bool track_abundance, const std::string& moltype,
                 uint32_t seed)
    : ksize_(ksize), moltype_(moltype), seed_(seed), num_(num),
      max_hash_(max_hash), track_abundance_(track_abundance) {
    if (num_ != 0 && max_hash_ != 0) {
        throw ConfigurationError("MinHash: 'num' and 'scaled' are mutually exclusive");
    }
    if (num_ == 0 && max_hash_ == 0) {
        throw ConfigurationError("MinHash: one of 'num' or 'scaled' must be set");
    }
    if (ksize_ == 0) {
        throw ConfigurationError("MinHash: ksize must be positive");
    }
}

MinHash MinHash::make_scaled(uint32_t ksize, uint64_t scaled,
                             bool track_abundance, const std::string& moltype,
                             uint32_t seed) {
    if (scaled == 0) {
        throw ConfigurationError("MinHash: scaled must be positive");
    }
    return MinHash(ksize, 0, max_hash_for_scaled(scaled), track_abundance,
                   moltype, seed);
}

MinHash MinHash::make_num(uint32_t ksize, uint32_t num,
                          bool track_abundance, const std::string& moltype,
                          uint32_t seed) {
    return MinHash(ksize, num, 0, track_abundance, moltype, seed);
}

void MinHash::add_hash(uint64_t hash, uint64_t abundance) {
    if (max_hash_ != 0 && hash > max_hash_) return;

    auto it = std::lower_bound(mins_.begin(), mins_.end(), hash);
    size_t pos = static_cast<size_t>(it - mins_.begin());
    if (it != mins_.end() && *it == hash) {
        if (track_abundance_) abunds_[pos] += abundance;
        return;
    }

    if (num_ != 0 && mins_.size() >= num_ && pos >= mins_.size()) return;

    mins_.insert(it, hash);
    if (track_abundance_) {
        abunds_.insert(abunds_.begin() + static_cast<std::ptrdiff_t>(pos), abundance);
    }

    if (num_ != 0 && mins_.size() > num_) {
        mins_.pop_back();
        if (track_abundance_) abunds_.pop_back();
    }
}

void MinHash::add_many(const std::vector<uint64_t>& hashes) {
    for (uint64_t h : hashes) add_hash(h);
}

MinHash MinHash::downsample_scaled(uint64_t new_scaled) const {
    if (num_ != 0) {
        throw ConfigurationError("MinHash: cannot downsample a num sketch by scaled");
    }
    uint64_t new_max = max_hash_for_scaled(new_scaled);
    if (new_max > max_hash_) {
        throw ConfigurationError("MinHash: cannot downsample to a finer scaled (" +
                                 std::to_string(new_scaled) + " < " +
                                 std::to_string(scaled()) + ")");
    }

    MinHash out(ksize_, 0, new_max, track_abundance_, moltype_, seed_);
    size_t end = static_cast<size_t>(
        std::upper_bound(mins_.begin(), mins_.end(), new_max) - mins_.begin());
    out.mins_.assign(mins_.begin(), mins_.begin() + static_cast<std::ptrdiff_t>(end));
    if (track_abundance_) {
        out.abunds_.assign(abunds_.begin(), abunds_.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return out;
}

MinHash MinHash::downsample_num(uint32_t new_num) const {
    if (num_ == 0) {
        throw ConfigurationError("MinHash: cannot downsample a scaled sketch by num");
    }
    if (new_num == 0 || new_num > num_) {
        throw ConfigurationError("MinHash: cannot downsample num " +
                                 std::to_string(num_) + " to " +
                                 std::to_string(new_num));
    }

    MinHash out(ksize_, new_num, 0, track_abundance_, moltype_, seed_);
    size_t end = std::min<size_t>(mins_.size(), new_num);
    out.mins_.assign(mins_.begin(), mins_.begin() + static_cast<std::ptrdiff_t>(end));
    if (track_abundance_) {
        out.abunds_.assign(abunds_.begin(), abunds_.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return out;
}

MinHash::CommonView MinHash::common_view(const MinHash& other, bool downsample) const {
    if (ksize_ != other.ksize_) {
        throw ConfigurationError("incompatible sketches: ksize " +
                                 std::to_string(ksize_) + " vs " +
                                 std::to_string(other.ksize_));
    }
    if (moltype_ != other.moltype_) {
        throw ConfigurationError("incompatible sketches: moltype " + moltype_ +
                                 " vs " + other.moltype_);
    }
    if (seed_ != other.seed_) {
        throw ConfigurationError("incompatible sketches: different seeds");
    }
    if ((num_ != 0) != (other.num_ != 0)) {
        throw ConfigurationError("incompatible sketches: cannot compare num and scaled");
    }

    CommonView v{mins_.size(), other.mins_.size(), 0};
    if (num_ != 0) {
        if (num_ != other.num_ && !downsample) {
            throw ConfigurationError("incompatible sketches: num " +
                                     std::to_string(num_) + " vs " +
                                     std::to_string(other.num_));
        }
        uint32_t n = std::min(num_, other.num_);
        v.a_end = std::min<size_t>(v.a_end, n);
        v.b_end = std::min<size_t>(v.b_end, n);
        v.num = n;
    } else {
        if (max_hash_ != other.max_hash_ && !downsample) {
            throw ConfigurationError("incompatible sketches: scaled " +
                                     std::to_string(scaled()) + " vs " +
                                     std::to_string(other.scaled()));
        }
        uint64_t bound = std::min(max_hash_, other.max_hash_);
        v.a_end = static_cast<size_t>(
            std::upper_bound(mins_.begin(), mins_.end(), bound) - mins_.begin());
        v.b_end = static_cast<size_t>(
            std::upper_bound(other.mins_.begin(), other.mins_.end(), bound) -
            other.mins_.begin());
    }
    return v;
}

uint64_t MinHash::intersect(const MinHash& other, const CommonView& v) const {
    const auto& a = mins_;
    const auto& b = other.mins_;
    uint64_t common = 0;
    size_t i = 0, j = 0;
    while (i < v.a_end && j < v.b_end) {
        if (a[i] < b[j]) {
            i++;
        } else if (b[j] < a[i]) {
            j++;
        } else {
            common++;
            i++;
            j++;
        }
    }
    return common;
}

uint64_t MinHash::count_common(const MinHash& other, bool downsample) const {
    auto v = common_view(other, downsample);
    return intersect(other, v);
}

double MinHash::jaccard(const MinHash& other, bool downsample) const {
    auto v = common_view(other, downsample);

    if (v.num == 0) {
        uint64_t common = intersect(other, v);
        uint64_t total = v.a_end + v.b_end - common;
        if (total == 0) return 0.0;
        return static_cast<double>(common) / static_cast<double>(total);
    }

    // num sketches: the union is truncated to its num smallest hashes
    const auto& a = mins_;
    const auto& b = other.mins_;
    size_t i = 0, j = 0;
    uint64_t total = 0, common = 0;
    while (total < v.num && (i < v.a_end || j < v.b_end)) {
        if (j >= v.b_end || (i < v.a_end && a[i] < b[j])) {
            i++;
        } else if (i >= v.a_end || b[j] < a[i]) {
            j++;
        } else {
            common++;
            i++;
            j++;
        }
        total++;
    }
    if (total == 0) return 0.0;
    return static_cast<double>(common) / static_cast<double>(total);
}

double MinHash::angular_similarity(const MinHash& other, bool downsample) const {
    if (!track_abundance_ || !other.track_abundance_) {
        throw ConfigurationError("angular similarity requires abundance tracking on both sketches");
    }
    auto v = common_view(other, downsample);

    const auto& a = mins_;
    const auto& b = other.mins_;
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < v.a_end; i++) {
        double x = static_cast<double>(abunds_[i]);
        norm_a += x * x;
    }
    for (size_t j = 0; j < v.b_end; j++) {
        double y = static_cast<double>(other.abunds_[j]);
        norm_b += y * y;
    }
    size_t i = 0, j = 0;
    while (i < v.a_end && j < v.b_end) {
        if (a[i] < b[j]) {
            i++;
        } else if (b[j] < a[i]) {
            j++;
        } else {
            dot += static_cast<double>(abunds_[i]) *
                   static_cast<double>(other.abunds_[j]);
            i++;
            j++;
        }
    }

    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;
    double cosine = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    cosine = std::min(1.0, std::max(-1.0, cosine));
    const double pi = std::acos(-1.0);
    return 1.0 - 2.0 * std::acos(cosine) / pi;
}

double MinHash::similarity(const MinHash& other, bool downsample,
                           bool ignore_abundance) const {
    if (track_abundance_ && other.track_abundance_ && !ignore_abundance) {
        return angular_similarity(other, downsample);
    }
    return jaccard(other, downsample);
}

double MinHash::contained_by(const MinHash& other, bool downsample) const {
    auto v = common_view(other, downsample);
    if (v.a_end == 0) return 0.0;
    return static_cast<double>(intersect(other, v)) / static_cast<double>(v.a_end);
}

double MinHash::containment(const MinHash& other, bool downsample) const {
    auto v = common_view(other, downsample);
    if (v.b_end == 0) return 0.0;
    return static_cast<double>(intersect(other, v)) / static_cast<double>(v.b_end);
}

double MinHash::max_containment(const MinHash& other, bool downsample) const {
    auto v = common_view(other, downsample);
    size_t denom = std::min(v.a_end, v.b_end);
    if (denom == 0) return 0.0;
    return static_cast<double>(intersect(other, v)) / static_cast<double>(denom);
}

static std::string bytes_to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; i++)
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    return oss.str();
}

std::string MinHash::md5sum() const {
    std::string buf = std::to_string(ksize_);
    for (uint64_t h : mins_) {
        buf += std::to_string(h);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_Digest(buf.data(), buf.size(), digest, &digest_len, EVP_md5(), nullptr);
    return bytes_to_hex(digest, digest_len);
}

bool MinHash::operator==(const MinHash& other) const {
    return ksize_ == other.ksize_ && moltype_ == other.moltype_ &&
           seed_ == other.seed_ && num_ == other.num_ &&
           max_hash_ == other.max_hash_ && mins_ == other.mins_ &&
           track_abundance_ == other.track_abundance_ &&
           abunds_ == other.abunds_;
}

} // namespace sigindex
