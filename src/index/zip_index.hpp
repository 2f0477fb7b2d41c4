#pragma once

#include <memory>
#include <string>
#include <vector>

#include "index/index.hpp"

namespace sigindex {

class ZipReader;

// Read-only index streaming signatures out of a zip archive.
//
// Nothing is materialized: every enumeration walks the archive, decodes
// members named *.sig / *.sig.gz (or every member if traverse_yield_all)
// and applies the attached selections and filters. Members that fail to
// decompress or parse yield no signatures and raise no error.
class ZipIndex : public Index {
public:
    explicit ZipIndex(std::shared_ptr<const ZipReader> zip,
                      bool traverse_yield_all = false,
                      std::vector<SelectionCriteria> selections = {},
                      std::vector<SignaturePredicate> filters = {});

    // Throws LoadError if the archive cannot be opened.
    static std::shared_ptr<ZipIndex> load(const std::string& path,
                                          bool traverse_yield_all = false);

    void signatures(const SignatureVisitor& visit) const override;
    Location location() const override;

    // Read-only: both throw UnsupportedOperationError.
    void insert(SignaturePtr sig) override;
    bool save(const std::string& path) const override;

    // Same archive handle, with the selection pushed down into enumeration.
    IndexPtr select(const SelectionCriteria& sel) const override;
    IndexPtr filter(const SignaturePredicate& pred) const override;

    bool traverse_yield_all() const { return traverse_yield_all_; }

private:
    bool accepts(const Signature& sig) const;

    std::shared_ptr<const ZipReader> zip_;
    bool traverse_yield_all_;
    std::vector<SelectionCriteria> selections_;
    std::vector<SignaturePredicate> filters_;
};

} // namespace sigindex
