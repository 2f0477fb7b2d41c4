#include "search/index_search.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "sketch/signature.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace sigindex {

using ScoreFn = std::function<double(const Signature&)>;
using AcceptFn = std::function<void(double, const SignaturePtr&, const Location&)>;

// Score an enumeration in fixed-size batches. Each batch is scored in
// parallel, then offered to accept() in scan order, so the outcome is the
// same as a sequential scan.
static void score_in_batches(const Index& index, const ScoreFn& score_fn,
                             const AcceptFn& accept) {
    std::vector<SignaturePtr> batch;
    std::vector<Location> batch_locs;
    std::vector<double> scores;
    batch.reserve(SCORE_BATCH_SIZE);
    batch_locs.reserve(SCORE_BATCH_SIZE);

    auto flush = [&]() {
        scores.assign(batch.size(), 0.0);
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, batch.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); i++) {
                    scores[i] = score_fn(*batch[i]);
                }
            });
        for (size_t i = 0; i < batch.size(); i++) {
            accept(scores[i], batch[i], batch_locs[i]);
        }
        batch.clear();
        batch_locs.clear();
    };

    index.signatures_with_location([&](const SignaturePtr& sig, const Location& loc) {
        batch.push_back(sig);
        batch_locs.push_back(loc);
        if (batch.size() >= SCORE_BATCH_SIZE) flush();
    });
    if (!batch.empty()) flush();
}

GatherThreshold resolve_gather_threshold(const Signature& query, double threshold_bp) {
    const MinHash& q = query.minhash();
    uint64_t scaled = q.scaled();
    if (scaled == 0) {
        throw ConfigurationError("gather requires scaled signatures");
    }

    GatherThreshold t;
    if (threshold_bp > 0.0) {
        // threshold_bp of N amounts to N/scaled hashes,
        // which in turn requires this containment of the query
        t.n_threshold_hashes = threshold_bp / static_cast<double>(scaled);
        t.containment = t.n_threshold_hashes / static_cast<double>(q.size());
        t.satisfiable = t.containment <= 1.0;
    }
    return t;
}

void validate_search_options(const SearchOptions& opts) {
    if (!opts.threshold) {
        throw ConfigurationError("'search' requires 'threshold'");
    }
    if (opts.do_containment && opts.do_max_containment) {
        throw ConfigurationError(
            "'do_containment' and 'do_max_containment' cannot both be set");
    }
}

std::vector<SearchResult> search_index(const Index& index, const Signature& query,
                                       const SearchOptions& opts) {
    validate_search_options(opts);
    const double threshold = *opts.threshold;
    const MinHash& q = query.minhash();

    ScoreFn score_fn;
    if (opts.do_max_containment) {
        score_fn = [&q](const Signature& s) {
            return q.max_containment(s.minhash(), true);
        };
    } else if (opts.do_containment) {
        score_fn = [&q](const Signature& s) {
            return q.contained_by(s.minhash(), true);
        };
    } else {
        const bool ignore_abundance = opts.ignore_abundance;
        score_fn = [&q, ignore_abundance](const Signature& s) {
            return q.similarity(s.minhash(), true, ignore_abundance);
        };
    }

    std::vector<SearchResult> matches;
    score_in_batches(index, score_fn,
        [&](double score, const SignaturePtr& sig, const Location& loc) {
            if (score >= threshold) matches.push_back({score, sig, loc});
        });

    sort_search_results(matches);
    return matches;
}

std::vector<GatherResult> gather_index(const Index& index, const Signature& query,
                                       const GatherOptions& opts) {
    const MinHash& q = query.minhash();
    if (q.empty()) return {};

    GatherThreshold t = resolve_gather_threshold(query, opts.threshold_bp);
    if (!t.satisfiable) return {};

    std::vector<GatherResult> results;
    score_in_batches(index,
        [&q](const Signature& s) { return q.contained_by(s.minhash(), true); },
        [&](double cont, const SignaturePtr& sig, const Location& loc) {
            if (cont > 0.0 && cont >= t.containment) results.push_back({cont, sig, loc});
        });

    sort_gather_results(results);
    return results;
}

namespace {

struct Candidate {
    size_t id;          // position in the materialized signature list
    int64_t shared;     // hashes shared with the unexplained part of the query
};

} // namespace

std::vector<GatherResult> counter_gather_index(const Index& index,
                                               const Signature& query,
                                               const GatherOptions& opts,
                                               CounterGatherStats* stats) {
    const MinHash& q = query.minhash();
    if (q.empty()) return {};

    GatherThreshold t = resolve_gather_threshold(query, opts.threshold_bp);
    if (!t.satisfiable) return {};

    // Phase 1: materialize once and count shared hashes per candidate
    std::vector<SignaturePtr> sigs;
    std::vector<Location> locs;
    index.signatures_with_location([&](const SignaturePtr& sig, const Location& loc) {
        sigs.push_back(sig);
        locs.push_back(loc);
    });

    std::vector<Candidate> counter(sigs.size());
    tbb::parallel_for(
        tbb::blocked_range<size_t>(0, sigs.size()),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i < range.end(); i++) {
                counter[i].id = i;
                counter[i].shared = static_cast<int64_t>(
                    q.count_common(sigs[i]->minhash(), true));
            }
        });
    if (stats) {
        stats->candidates = counter.size();
        stats->remaining_after_iteration.clear();
    }

    // Phase 2: greedy selection. counter stays in insertion order, so the
    // first maximum found is the earliest candidate.
    std::vector<GatherResult> results;
    while (!counter.empty()) {
        size_t best = 0;
        for (size_t i = 1; i < counter.size(); i++) {
            if (counter[i].shared > counter[best].shared) best = i;
        }
        if (static_cast<double>(counter[best].shared) < t.n_threshold_hashes) break;

        const size_t match_id = counter[best].id;
        const MinHash& match = sigs[match_id]->minhash();
        double cont = q.contained_by(match, true);
        if (cont > 0.0 && cont >= t.containment) {
            results.push_back({cont, sigs[match_id], locs[match_id]});
        }

        counter.erase(counter.begin() + static_cast<std::ptrdiff_t>(best));

        // Hashes explained by the match no longer count for anyone else
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, counter.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); i++) {
                    counter[i].shared -= static_cast<int64_t>(
                        sigs[counter[i].id]->minhash().count_common(match, true));
                }
            });
        counter.erase(std::remove_if(counter.begin(), counter.end(),
                                     [](const Candidate& c) { return c.shared == 0; }),
                      counter.end());

        if (stats) stats->remaining_after_iteration.push_back(counter.size());
    }

    sort_gather_results(results);
    return results;
}

void sort_search_results(std::vector<SearchResult>& results) {
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         return a.score > b.score;
                     });
}

void sort_gather_results(std::vector<GatherResult>& results) {
    std::stable_sort(results.begin(), results.end(),
                     [](const GatherResult& a, const GatherResult& b) {
                         if (a.containment != b.containment)
                             return a.containment > b.containment;
                         return a.signature->md5sum() > b.signature->md5sum();
                     });
}

} // namespace sigindex
