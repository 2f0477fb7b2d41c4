#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sigindex {

// Command-line parser for -key value style arguments.
// A key may be repeated; get_string() returns the last value and
// get_strings() all of them in order.
//
// Keys listed in switches never take a value, so "-force db/" keeps db/ as
// an argument. Other keys take the next token unless it starts with '-' and
// is not a number, so "-threshold -1" passes -1 through for validation.
class CliParser {
public:
    CliParser(int argc, char* argv[], std::vector<std::string> switches = {});

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get string value for a key. Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Get every value given for a repeated key.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Get unsigned 64-bit value for a key. Returns default_val if not found or invalid.
    uint64_t get_uint64(const std::string& key, uint64_t default_val = 0) const;

    // Get integer value for a key. Returns default_val if not found or invalid.
    int get_int(const std::string& key, int default_val = 0) const;

    // Get double value for a key. Returns default_val if not found or invalid.
    double get_double(const std::string& key, double default_val = 0.0) const;

    // Get the program name (argv[0]).
    const std::string& program() const { return program_; }

    // Get positional arguments (those not preceded by a -key).
    const std::vector<std::string>& positional() const { return positional_; }

private:
    static bool takes_value(const char* next);
    bool is_switch(const std::string& key) const;

    std::string program_;
    std::vector<std::string> switches_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace sigindex
