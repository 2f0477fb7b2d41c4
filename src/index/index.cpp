#include "index/index.hpp"
#include "search/index_search.hpp"

namespace sigindex {

void Index::signatures_with_location(const LocatedSignatureVisitor& visit) const {
    Location loc = location();
    signatures([&](const SignaturePtr& sig) { visit(sig, loc); });
}

std::vector<SignaturePtr> Index::signature_list() const {
    std::vector<SignaturePtr> sigs;
    signatures([&](const SignaturePtr& sig) { sigs.push_back(sig); });
    return sigs;
}

size_t Index::size() const {
    size_t n = 0;
    signatures([&](const SignaturePtr&) { n++; });
    return n;
}

std::vector<SearchResult> Index::search(const Signature& query,
                                        const SearchOptions& opts) const {
    return search_index(*this, query, opts);
}

std::vector<GatherResult> Index::gather(const Signature& query,
                                        const GatherOptions& opts) const {
    return gather_index(*this, query, opts);
}

std::vector<GatherResult> Index::counter_gather(const Signature& query,
                                                const GatherOptions& opts) const {
    return counter_gather_index(*this, query, opts);
}

} // namespace sigindex
