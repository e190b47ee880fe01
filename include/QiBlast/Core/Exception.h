#pragma once

/**
 * @file Exception.h
 * @brief Exception hierarchy for QiBlast
 *
 * Public entry points report unusable input and invalid configuration by
 * throwing. Strategy failures travel as AlgorithmException and never leave
 * the detection orchestrator.
 *
 * Messages follow the "FunctionName: reason" convention.
 */

#include <stdexcept>
#include <string>

namespace Qi::Blast {

/**
 * @brief Base class of all QiBlast exceptions
 */
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input point set cannot be processed (too few points, zero extent)
 */
class InputException : public Exception {
public:
    explicit InputException(const std::string& message)
        : Exception(message) {}
};

/**
 * @brief A configuration threshold or parameter is out of range
 */
class ConfigurationException : public Exception {
public:
    explicit ConfigurationException(const std::string& message)
        : Exception(message) {}
};

/**
 * @brief A detection strategy could not produce a usable row set
 */
class AlgorithmException : public Exception {
public:
    explicit AlgorithmException(const std::string& message)
        : Exception(message) {}
};

/**
 * @brief Invalid argument passed to a public helper
 */
class InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception(message) {}
};

} // namespace Qi::Blast
