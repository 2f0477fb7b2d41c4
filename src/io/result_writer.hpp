#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "index/index.hpp"

namespace sigindex {

// One output row, flattened from a search or gather result.
struct OutputHit {
    double score;           // similarity / containment
    std::string name;       // display name of the match
    std::string md5;
    std::string source;     // provenance, empty if unknown
    uint32_t ksize = 0;
    uint64_t scaled = 0;
    uint32_t num = 0;
};

enum class OutputFormat { kTab, kJson };

// Parse an output format string ("tab", "json").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

std::vector<OutputHit> to_output_hits(const std::vector<SearchResult>& results);
std::vector<OutputHit> to_output_hits(const std::vector<GatherResult>& results);

// score_name labels the score column ("similarity", "containment", ...).
void write_results_tab(std::ostream& out, const std::vector<OutputHit>& hits,
                       const std::string& score_name);
void write_results_json(std::ostream& out, const std::vector<OutputHit>& hits,
                        const std::string& score_name);
// Returns false if the stream failed while writing.
bool write_results(std::ostream& out, const std::vector<OutputHit>& hits,
                   OutputFormat fmt, const std::string& score_name);

} // namespace sigindex
