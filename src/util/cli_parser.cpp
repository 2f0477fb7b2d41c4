#include "util/cli_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace sigindex {

CliParser::CliParser(int argc, char* argv[], std::vector<std::string> switches)
    : switches_(std::move(switches)) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[0] == '-' && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            std::string key = arg;
            if (!is_switch(key) && i + 1 < argc && takes_value(argv[i + 1])) {
                opts_[key].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[key].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

// Tokens starting with '-' are keys, except negative numbers like "-1" or "-.5".
bool CliParser::takes_value(const char* next) {
    if (next[0] != '-') return true;
    if (!std::isdigit(static_cast<unsigned char>(next[1])) && next[1] != '.') return false;
    char* end = nullptr;
    std::strtod(next, &end);
    return end != next && *end == '\0';
}

bool CliParser::is_switch(const std::string& key) const {
    return std::find(switches_.begin(), switches_.end(), key) != switches_.end();
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                   const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

uint64_t CliParser::get_uint64(const std::string& key, uint64_t default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    const std::string& v = it->second.back();
    if (v.empty() || v[0] == '-') return default_val;
    try {
        return std::stoull(v);
    } catch (const std::exception&) {
        return default_val;
    }
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    try {
        return std::stoi(it->second.back());
    } catch (const std::exception&) {
        return default_val;
    }
}

double CliParser::get_double(const std::string& key, double default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    try {
        return std::stod(it->second.back());
    } catch (const std::exception&) {
        return default_val;
    }
}

} // namespace sigindex
