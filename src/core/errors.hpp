#pragma once

#include <stdexcept>
#include <string>

namespace sigindex {

// Base class for all errors raised by the index layer.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid or conflicting parameters: missing threshold, conflicting flags,
// containment without scaled, incompatible sketches.
// Always raised before any signature is scanned.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg) : Error(msg) {}
};

// Mutation or persistence attempted on a read-only or aggregate index.
class UnsupportedOperationError : public Error {
public:
    explicit UnsupportedOperationError(const std::string& msg) : Error(msg) {}
};

// A file, archive, manifest or directory member could not be loaded.
class LoadError : public Error {
public:
    explicit LoadError(const std::string& msg) : Error(msg) {}
};

} // namespace sigindex
