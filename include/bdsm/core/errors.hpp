#pragma once

#include <stdexcept>
#include <string>

namespace bdsm {

class BdsmError : public std::runtime_error {
public:
    explicit BdsmError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public BdsmError {
public:
    explicit ConfigError(const std::string& message)
        : BdsmError("Config error: " + message) {}
};

class ValidationError : public BdsmError {
public:
    explicit ValidationError(const std::string& message)
        : BdsmError("Validation error: " + message) {}
};

class IOError : public BdsmError {
public:
    explicit IOError(const std::string& message)
        : BdsmError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Missing file, map or processing result. The message is passed through
// unchanged since it is shown to interactive users as is.
class NotFoundError : public BdsmError {
public:
    explicit NotFoundError(const std::string& message)
        : BdsmError(message) {}
};

class InvalidFormatError : public BdsmError {
public:
    explicit InvalidFormatError(const std::string& message)
        : BdsmError(message) {}
};

class CacheError : public BdsmError {
public:
    explicit CacheError(const std::string& message)
        : BdsmError("Cache error: " + message) {}
};

class PipelineError : public BdsmError {
public:
    explicit PipelineError(const std::string& message)
        : BdsmError("Pipeline error: " + message) {}
};

} // namespace bdsm
