#pragma once

#include <memory>
#include <string>

#include "core/config.hpp"
#include "sketch/minhash.hpp"

namespace sigindex {

// Immutable pairing of one sketch with its metadata.
// Signatures are shared between indexes by SignaturePtr, never copied.
class Signature {
public:
    explicit Signature(MinHash minhash,
                       std::string name = {},
                       std::string filename = {},
                       std::string license = DEFAULT_LICENSE,
                       std::string email = {},
                       std::string hash_function = DEFAULT_HASH_FUNCTION);

    const MinHash& minhash() const { return minhash_; }
    const std::string& name() const { return name_; }
    const std::string& filename() const { return filename_; }
    const std::string& license() const { return license_; }
    const std::string& email() const { return email_; }
    const std::string& hash_function() const { return hash_function_; }

    // Fingerprint of the sketch, computed once.
    const std::string& md5sum() const { return md5_; }

    // name, else filename, else the first 8 characters of md5.
    std::string display_name() const;

    bool operator==(const Signature& other) const {
        return md5_ == other.md5_ && name_ == other.name_;
    }
    bool operator!=(const Signature& other) const { return !(*this == other); }

private:
    MinHash minhash_;
    std::string name_;
    std::string filename_;
    std::string license_;
    std::string email_;
    std::string hash_function_;
    std::string md5_;
};

using SignaturePtr = std::shared_ptr<const Signature>;

inline SignaturePtr make_signature(MinHash minhash, std::string name = {},
                                   std::string filename = {}) {
    return std::make_shared<const Signature>(std::move(minhash), std::move(name),
                                             std::move(filename));
}

} // namespace sigindex
