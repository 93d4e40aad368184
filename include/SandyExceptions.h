#ifndef SANDY_EXCEPTIONS_H
#define SANDY_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Sandy {

class SandyException : public std::runtime_error {
public:
    explicit SandyException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public SandyException {
public:
    explicit IOException(const std::string& message) : SandyException("IO Error: " + message) {}
};

class DatasetException : public SandyException {
public:
    explicit DatasetException(const std::string& message) : SandyException("Dataset Error: " + message) {}
};

class ValidationException : public SandyException {
public:
    explicit ValidationException(const std::string& message) : SandyException("Validation Error: " + message) {}
};

class InsufficientDataException : public SandyException {
public:
    explicit InsufficientDataException(const std::string& message) : SandyException("Insufficient Data: " + message) {}
};

class ConfigurationException : public SandyException {
public:
    explicit ConfigurationException(const std::string& message) : SandyException("Configuration Error: " + message) {}
};

} // namespace Sandy

#endif // SANDY_EXCEPTIONS_H
