#include "io/signature_discovery.hpp"
#include "core/config.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace sigindex {

static bool ends_with(const std::string& s, const char* suffix) {
    size_t n = std::char_traits<char>::length(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

bool has_signature_suffix(const std::string& name) {
    return ends_with(name, SIG_SUFFIX) || ends_with(name, SIG_GZ_SUFFIX);
}

std::vector<std::string> find_signature_files(const std::vector<std::string>& paths,
                                              bool yield_all_files) {
    std::vector<std::string> files;

    for (const auto& path : paths) {
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec)) {
            files.push_back(path);
            continue;
        }

        std::vector<std::string> found;
        auto opts = std::filesystem::directory_options::skip_permission_denied;
        for (auto it = std::filesystem::recursive_directory_iterator(path, opts, ec);
             !ec && it != std::filesystem::recursive_directory_iterator();
             it.increment(ec)) {
            std::error_code file_ec;
            if (!it->is_regular_file(file_ec)) continue;
            std::string fname = it->path().filename().string();
            if (yield_all_files || has_signature_suffix(fname)) {
                found.push_back(it->path().string());
            }
        }
        if (ec) {
            std::fprintf(stderr, "find_signature_files: error walking %s: %s\n",
                         path.c_str(), ec.message().c_str());
        }

        std::sort(found.begin(), found.end());
        files.insert(files.end(), found.begin(), found.end());
    }

    return files;
}

} // namespace sigindex
