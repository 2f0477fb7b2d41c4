#pragma once

#include <optional>
#include <string>

namespace sigindex {

// Where a signature was read from; empty if unknown.
using Location = std::optional<std::string>;

struct SearchOptions {
    std::optional<double> threshold;    // required
    bool do_containment = false;        // score = query contained by match
    bool do_max_containment = false;    // score = overlap / smaller sketch
    bool ignore_abundance = false;      // Jaccard even when abundances exist
};

struct GatherOptions {
    double threshold_bp = 0.0;          // minimum overlap in base pairs (0 = none)
};

} // namespace sigindex
