#pragma once

#include <memory>
#include <string>
#include <vector>

#include "index/index.hpp"

namespace sigindex {

// In-memory index over a plain list of signatures.
// select/filter build a new list sharing the same signature objects.
class LinearIndex : public Index {
public:
    LinearIndex() = default;
    explicit LinearIndex(std::vector<SignaturePtr> sigs, Location location = std::nullopt);

    // Load every signature in a signature file.
    // Throws LoadError if the file cannot be read or parsed.
    static std::shared_ptr<LinearIndex> load(const std::string& path);

    void signatures(const SignatureVisitor& visit) const override;
    size_t size() const override { return sigs_.size(); }
    Location location() const override { return location_; }

    void insert(SignaturePtr sig) override;
    bool save(const std::string& path) const override;

    IndexPtr select(const SelectionCriteria& sel) const override;
    IndexPtr filter(const SignaturePredicate& pred) const override;

private:
    std::vector<SignaturePtr> sigs_;
    Location location_;
};

} // namespace sigindex
