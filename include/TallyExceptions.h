#ifndef TALLY_EXCEPTIONS_H
#define TALLY_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Tally {

class TallyException : public std::runtime_error {
public:
    explicit TallyException(const std::string& message) : std::runtime_error(message) {}
};

// Unknown columns, empty value-column sets, malformed keys or request parameters.
class InvalidInputException : public TallyException {
public:
    explicit InvalidInputException(const std::string& message) : TallyException("Invalid Input: " + message) {}
};

// A method whose backend is unavailable, or a statistic that is undefined for the requested column.
class ComputationException : public TallyException {
public:
    explicit ComputationException(const std::string& message) : TallyException("Computation Error: " + message) {}
};

class IOException : public TallyException {
public:
    explicit IOException(const std::string& message) : TallyException("IO Error: " + message) {}
};

class ConfigurationException : public TallyException {
public:
    explicit ConfigurationException(const std::string& message) : TallyException("Configuration Error: " + message) {}
};

} // namespace Tally

#endif // TALLY_EXCEPTIONS_H
