#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

// SIGINDEX_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace sigindex {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, SIGINDEX_VERSION);
        return true;
    }
    return false;
}

// Switches understood by every tool.
inline std::vector<std::string> common_switches() {
    return {"-v", "--verbose", "-q", "--quiet", "-h", "--help", "--version"};
}

// Create a Logger tagged with cmd_name.
// -log_level <error|warn|info|debug> wins over -v / --verbose and -q / --quiet.
// Returns false (after printing a message) on an unknown level.
inline bool make_logger(const CliParser& cli, const char* cmd_name, Logger& out) {
    Logger::Level level = Logger::kInfo;
    if (cli.has("-v") || cli.has("--verbose")) level = Logger::kDebug;
    if (cli.has("-q") || cli.has("--quiet")) level = Logger::kWarn;
    if (cli.has("-log_level") &&
        !Logger::parse_level(cli.get_string("-log_level"), level)) {
        std::fprintf(stderr, "Error: unknown log level '%s'\n",
                     cli.get_string("-log_level").c_str());
        return false;
    }
    out = Logger(level, cmd_name);
    return true;
}

// Resolve thread count from CLI (0 or negative -> hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

} // namespace sigindex
