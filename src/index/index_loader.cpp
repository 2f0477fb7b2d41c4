#include "index/index_loader.hpp"
#include "index/linear_index.hpp"
#include "index/multi_index.hpp"
#include "index/zip_index.hpp"
#include "core/config.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <system_error>

namespace sigindex {

static bool ends_with(const std::string& s, const char* suffix) {
    std::string suf(suffix);
    return s.size() >= suf.size() &&
           s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

IndexPtr load_file_as_index(const std::string& path, bool yield_all_files,
                            const Logger& logger) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        logger.debug("Loading directory %s", path.c_str());
        return MultiIndex::load_from_path(path, yield_all_files, logger);
    }
    if (ends_with(path, ZIP_SUFFIX)) {
        logger.debug("Loading zip archive %s", path.c_str());
        return ZipIndex::load(path, yield_all_files);
    }
    logger.debug("Loading signature file %s", path.c_str());
    return LinearIndex::load(path);
}

} // namespace sigindex
