#pragma once

#include <stdexcept>
#include <string>

namespace gslgen {

/**
 * @brief Base class for all errors raised by the transition generator.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Exception thrown when a run configuration is empty or inconsistent.
 *
 * Raised before any enumeration begins; no partial output exists.
 */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg)
        : Error("configuration error: " + msg) {}
};

/**
 * @brief Exception thrown when a formula cannot be built or parsed.
 *
 * Covers negative atom counts, unknown element symbols, malformed formula
 * text and isotope substitutions exceeding the atoms present.
 */
class FormulaError : public Error {
public:
    explicit FormulaError(const std::string& msg)
        : Error("formula error: " + msg) {}
};

} // namespace gslgen
