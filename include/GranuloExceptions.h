#ifndef GRANULO_EXCEPTIONS_H
#define GRANULO_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Granulo {

class GranuloException : public std::runtime_error {
public:
    explicit GranuloException(const std::string& message) : std::runtime_error(message) {}
};

// Malformed sieve scale or settings. Fatal at startup.
class ConfigurationException : public GranuloException {
public:
    explicit ConfigurationException(const std::string& message) : GranuloException("Configuration Error: " + message) {}
};

class ValidationException : public GranuloException {
public:
    explicit ValidationException(const std::string& message) : GranuloException("Validation Error: " + message) {}
};

class InsufficientDataException : public GranuloException {
public:
    explicit InsufficientDataException(const std::string& message) : GranuloException("Insufficient Data: " + message) {}
};

// Requested percentile or size is not covered by the curve.
class OutOfRangeException : public GranuloException {
public:
    explicit OutOfRangeException(const std::string& message) : GranuloException("Out Of Range: " + message) {}
};

class RenderException : public GranuloException {
public:
    explicit RenderException(const std::string& message) : GranuloException("Render Error: " + message) {}
};

} // namespace Granulo

#endif // GRANULO_EXCEPTIONS_H
