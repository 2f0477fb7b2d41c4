#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "index/selection.hpp"
#include "sketch/signature.hpp"

namespace sigindex {

struct SearchResult {
    double score;
    SignaturePtr signature;
    Location location;
};

struct GatherResult {
    double containment;
    SignaturePtr signature;
    Location location;
};

using SignatureVisitor = std::function<void(const SignaturePtr&)>;
using LocatedSignatureVisitor = std::function<void(const SignaturePtr&, const Location&)>;
using SignaturePredicate = std::function<bool(const Signature&)>;

class Index;
using IndexPtr = std::shared_ptr<Index>;

// A collection of signatures.
//
// Backends provide enumeration, mutation, persistence and selection; the
// search algorithms (find, search, gather, counter_gather) are implemented
// once on top of enumeration and may be overridden by composite backends.
//
// Enumeration is a pull over the backing store: eager backends replay
// memory, lazy backends re-read storage on every call.
class Index {
public:
    virtual ~Index() = default;

    // Visit every signature once, in backend order.
    virtual void signatures(const SignatureVisitor& visit) const = 0;

    // Visit every signature with the location it was read from.
    // Default pairs each signature with location().
    virtual void signatures_with_location(const LocatedSignatureVisitor& visit) const;

    // Materialize the enumeration.
    std::vector<SignaturePtr> signature_list() const;

    // Number of signatures. Lazy backends count by enumerating.
    virtual size_t size() const;

    // Location of the index itself, if any.
    virtual Location location() const = 0;

    // Add a signature. Throws UnsupportedOperationError on read-only backends.
    virtual void insert(SignaturePtr sig) = 0;

    // Persist to path. Returns false on I/O failure;
    // throws UnsupportedOperationError on read-only backends.
    virtual bool save(const std::string& path) const = 0;

    // New index restricted to signatures passing select_signature().
    // Never mutates this index. Throws ConfigurationError for incompatible
    // constraints, even if the result would be empty.
    virtual IndexPtr select(const SelectionCriteria& sel) const = 0;

    // New index restricted to signatures satisfying pred.
    virtual IndexPtr filter(const SignaturePredicate& pred) const = 0;

    // Every signature for which pred(sig, args...) holds, in enumeration order.
    template <typename Pred, typename... Args>
    std::vector<SignaturePtr> find(Pred&& pred, const Args&... args) const {
        std::vector<SignaturePtr> matches;
        signatures([&](const SignaturePtr& sig) {
            if (pred(*sig, args...)) matches.push_back(sig);
        });
        return matches;
    }

    // Signatures scoring >= threshold against query, best first.
    virtual std::vector<SearchResult> search(const Signature& query,
                                             const SearchOptions& opts) const;

    // Every signature overlapping query, by containment of query in match.
    virtual std::vector<GatherResult> gather(const Signature& query,
                                             const GatherOptions& opts = {}) const;

    // Greedy decomposition of query into matching signatures.
    virtual std::vector<GatherResult> counter_gather(const Signature& query,
                                                     const GatherOptions& opts = {}) const;
};

} // namespace sigindex
