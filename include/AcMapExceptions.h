#ifndef ACMAP_EXCEPTIONS_H
#define ACMAP_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace AcMap {

class AcMapException : public std::runtime_error {
public:
    explicit AcMapException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public AcMapException {
public:
    explicit IOException(const std::string& message) : AcMapException("IO Error: " + message) {}
};

class ConfigurationException : public AcMapException {
public:
    explicit ConfigurationException(const std::string& message) : AcMapException("Configuration Error: " + message) {}
};

class PreconditionException : public AcMapException {
public:
    explicit PreconditionException(const std::string& message) : AcMapException("Precondition Violation: " + message) {}
};

class NumericException : public AcMapException {
public:
    explicit NumericException(const std::string& message) : AcMapException("Numeric Error: " + message) {}
};

class ModelStateException : public AcMapException {
public:
    explicit ModelStateException(const std::string& message) : AcMapException("Model State Error: " + message) {}
};

} // namespace AcMap

#endif // ACMAP_EXCEPTIONS_H
