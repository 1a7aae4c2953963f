#pragma once

#include <stdexcept>
#include <string>

namespace nonorec {

/// Bad input data: a missing column, a malformed field or timestamp.
/// Always fatal for the caller that loads the file.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

/// A data file could not be opened for reading or writing.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace nonorec
