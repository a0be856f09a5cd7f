#pragma once

#include <stdexcept>
#include <string>

namespace paircorr {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/** Invalid parameters, detected before any search or compute work. */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

class InvalidDimensionError : public ConfigurationError {
public:
    explicit InvalidDimensionError(const std::string& what) : ConfigurationError(what) {}
};

class ShapeMismatchError : public ConfigurationError {
public:
    explicit ShapeMismatchError(const std::string& what) : ConfigurationError(what) {}
};

/** No pair within the cutoff. Recoverable by enlarging rmax. */
class EmptyResultError : public Error {
public:
    explicit EmptyResultError(const std::string& what) : Error(what) {}
};

} // namespace paircorr
