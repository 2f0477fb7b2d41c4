#pragma once

#include <string>
#include <vector>

#include "index/index.hpp"
#include "index/selection.hpp"

namespace sigindex {

class CliParser;
class Logger;

// Selection constraints from -k, -moltype, -scaled, -num.
SelectionCriteria selection_from_cli(const CliParser& cli);

// Load every -db location into one MultiIndex.
// With pathlist, each location is a manifest of index paths.
// force skips unloadable files inside directories.
IndexPtr load_databases(const std::vector<std::string>& paths, bool pathlist,
                        bool force, const Logger& logger);

// Load the single query signature in path that satisfies sel.
// Throws ConfigurationError if zero or several signatures match.
SignaturePtr load_query_signature(const std::string& path,
                                  const SelectionCriteria& sel);

// Constraints a database must satisfy to be compared against query:
// same ksize and moltype, and the query's sampling policy.
SelectionCriteria selection_for_query(const Signature& query, bool containment);

} // namespace sigindex
