#pragma once

/**
 * @file Exception.h
 * @brief Exception hierarchy for ApPhot
 */

#include <stdexcept>
#include <string>

namespace Ap::Phot {

/**
 * @brief Base class of all ApPhot exceptions
 */
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}
};

/// Invalid argument (negative size, unknown method string, ...)
class InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/// Index outside of an array's range
class OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/// File could not be opened, decoded or written
class IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("IO error: " + message) {}
};

} // namespace Ap::Phot
