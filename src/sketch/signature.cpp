#include "sketch/signature.hpp"

#include <utility>

namespace sigindex {

Signature::Signature(MinHash minhash, std::string name, std::string filename,
                     std::string license, std::string email,
                     std::string hash_function)
    : minhash_(std::move(minhash)), name_(std::move(name)),
      filename_(std::move(filename)), license_(std::move(license)),
      email_(std::move(email)), hash_function_(std::move(hash_function)) {
    md5_ = minhash_.md5sum();
}

std::string Signature::display_name() const {
    if (!name_.empty()) return name_;
    if (!filename_.empty()) return filename_;
    return md5_.substr(0, 8);
}

} // namespace sigindex
