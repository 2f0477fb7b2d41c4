#pragma once

#include <string>
#include <vector>

namespace sigindex {

// Read a manifest of paths, one per line.
// Surrounding whitespace is trimmed; blank lines and '#' comments are skipped.
// Throws LoadError if the file cannot be opened or lists no paths.
std::vector<std::string> read_pathlist(const std::string& path);

} // namespace sigindex
