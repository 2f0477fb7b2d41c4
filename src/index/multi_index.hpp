#pragma once

#include <memory>
#include <string>
#include <vector>

#include "index/index.hpp"

namespace sigindex {

class Logger;

// Aggregates heterogeneous indexes, remembering where each came from.
//
// indexes and sources are parallel lists of identical length. A non-empty
// source overrides the location a sub-index reports for its results; an
// empty source passes the sub-index's own location through.
class MultiIndex : public Index {
public:
    // Throws ConfigurationError if the lists differ in length.
    MultiIndex(std::vector<IndexPtr> indexes, std::vector<Location> sources);

    // Build from a file or directory of signature files.
    // Per-file load failures are skipped (with a warning) when force is set,
    // otherwise the first failure propagates as LoadError.
    // Throws LoadError if path does not exist and ConfigurationError if
    // nothing could be loaded.
    static std::shared_ptr<MultiIndex> load_from_path(const std::string& path,
                                                      bool force,
                                                      const Logger& logger);

    // Build from a manifest listing one index path per line. Any failure
    // propagates immediately.
    static std::shared_ptr<MultiIndex> load_from_pathlist(const std::string& path,
                                                          const Logger& logger);

    // Aggregation only: throws UnsupportedOperationError.
    static std::shared_ptr<MultiIndex> load(const std::string& path);

    void signatures(const SignatureVisitor& visit) const override;
    void signatures_with_location(const LocatedSignatureVisitor& visit) const override;
    size_t size() const override;
    Location location() const override { return std::nullopt; }

    // Aggregation only: both throw UnsupportedOperationError.
    void insert(SignaturePtr sig) override;
    bool save(const std::string& path) const override;

    // Applied to every sub-index; sources are kept as they are.
    IndexPtr select(const SelectionCriteria& sel) const override;
    IndexPtr filter(const SignaturePredicate& pred) const override;

    // Run on every sub-index, re-tag provenance, pool and re-sort.
    std::vector<SearchResult> search(const Signature& query,
                                     const SearchOptions& opts) const override;
    std::vector<GatherResult> gather(const Signature& query,
                                     const GatherOptions& opts = {}) const override;

    const std::vector<IndexPtr>& indexes() const { return indexes_; }
    const std::vector<Location>& sources() const { return sources_; }

private:
    std::vector<IndexPtr> indexes_;
    std::vector<Location> sources_;
};

} // namespace sigindex
