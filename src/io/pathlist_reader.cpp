#include "io/pathlist_reader.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <fstream>

namespace sigindex {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> read_pathlist(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw LoadError("cannot open path list '" + path + "'");
    }

    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;
        result.push_back(std::move(entry));
    }

    if (result.empty()) {
        throw LoadError("path list '" + path + "' contains no paths");
    }
    return result;
}

} // namespace sigindex
