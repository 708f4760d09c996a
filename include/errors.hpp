#pragma once

#include <stdexcept>
#include <string>

/// Channel count incompatible with the recursion depth rule, spatial rank
/// not 2 or 3, or an unknown option value.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(std::string const& what)
        : std::invalid_argument(what) {}
};

/// Odd axis where an even one is required, unsupported tensor rank, or
/// mismatched shapes between paired tensors.
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(std::string const& what)
        : std::invalid_argument(what) {}
};

/// Squeeze pattern or filter bank that is not defined for the given input.
class UnsupportedPatternError : public std::invalid_argument {
public:
    explicit UnsupportedPatternError(std::string const& what)
        : std::invalid_argument(what) {}
};
