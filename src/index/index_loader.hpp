#pragma once

#include <string>

#include "index/index.hpp"

namespace sigindex {

class Logger;

// Open any supported index location:
//   directory      -> MultiIndex over its signature files
//   *.zip          -> ZipIndex
//   anything else  -> LinearIndex over one signature file
// yield_all_files loads every file (directories) or member (archives), not
// just those with a signature suffix; unloadable files are then skipped.
// Throws LoadError / ConfigurationError as the underlying loader does.
IndexPtr load_file_as_index(const std::string& path, bool yield_all_files,
                            const Logger& logger);

} // namespace sigindex
