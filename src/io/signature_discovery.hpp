#pragma once

#include <string>
#include <vector>

namespace sigindex {

// True if the file name ends in a recognized signature suffix
// (.sig or .sig.gz).
bool has_signature_suffix(const std::string& name);

// Expand paths into signature files.
// Directories are walked recursively, keeping regular files with a signature
// suffix (or every regular file if yield_all_files). Other paths are passed
// through as-is. Files found under one directory are sorted by path.
std::vector<std::string> find_signature_files(const std::vector<std::string>& paths,
                                              bool yield_all_files = false);

} // namespace sigindex
