#pragma once

#include <cstddef>
#include <vector>

#include "core/types.hpp"
#include "index/index.hpp"

namespace sigindex {

class Signature;

// Containment threshold derived from a base-pair threshold.
struct GatherThreshold {
    double n_threshold_hashes = 0.0;    // threshold_bp / scaled
    double containment = 0.0;           // n_threshold_hashes / |query|
    bool satisfiable = true;            // false if containment > 1.0
};

// Validate a gather query and convert threshold_bp.
// Throws ConfigurationError if the query is not a scaled sketch.
// Callers must handle the empty-query case first.
GatherThreshold resolve_gather_threshold(const Signature& query, double threshold_bp);

// Per-iteration bookkeeping of counter_gather, for diagnostics.
struct CounterGatherStats {
    size_t candidates = 0;                          // phase-1 mapping size
    std::vector<size_t> remaining_after_iteration;  // mapping size after each pick
};

// Throw ConfigurationError if threshold is missing or both containment
// flags are set.
void validate_search_options(const SearchOptions& opts);

// search: score every signature with one scoring function chosen up front
// (max containment, containment, or similarity), keep score >= threshold,
// stable-sort by score descending.
// Throws ConfigurationError if threshold is missing or both containment
// flags are set; nothing is scanned in that case.
std::vector<SearchResult> search_index(const Index& index, const Signature& query,
                                       const SearchOptions& opts);

// gather: one pass, every signature with nonzero containment of the query
// at or above the threshold. Overlap between matches is not removed.
std::vector<GatherResult> gather_index(const Index& index, const Signature& query,
                                       const GatherOptions& opts);

// counter_gather: greedy decomposition.
//   1. shared[i] = |query & sig_i| for every signature
//   2. repeatedly take the largest shared count (earliest candidate on ties),
//      stop if below n_threshold_hashes, emit it if its containment passes,
//      retire it and subtract its overlap from every other candidate,
//      retiring those that reach zero.
// Each result carries the location of the signature it came from.
std::vector<GatherResult> counter_gather_index(const Index& index,
                                               const Signature& query,
                                               const GatherOptions& opts,
                                               CounterGatherStats* stats = nullptr);

// Result orderings shared by all backends.
// Search: score descending, ties in scan order.
// Gather: containment descending, then md5 descending.
void sort_search_results(std::vector<SearchResult>& results);
void sort_gather_results(std::vector<GatherResult>& results);

} // namespace sigindex
