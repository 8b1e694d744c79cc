#pragma once

#include <stdexcept>
#include <string>

namespace gas_deblend {

class GasDeblendError : public std::runtime_error {
public:
    explicit GasDeblendError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public GasDeblendError {
public:
    explicit ConfigError(const std::string& message)
        : GasDeblendError("Config error: " + message) {}
};

class ValidationError : public GasDeblendError {
public:
    explicit ValidationError(const std::string& message)
        : GasDeblendError("Validation error: " + message) {}
};

class IOError : public GasDeblendError {
public:
    explicit IOError(const std::string& message)
        : GasDeblendError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Mismatched ranks or extents between cube, mask, markers and prior
class InvalidShapeError : public GasDeblendError {
public:
    explicit InvalidShapeError(const std::string& message)
        : GasDeblendError("Invalid shape: " + message) {}
};

// Array rank outside what an operation supports
class InvalidDimensionError : public GasDeblendError {
public:
    explicit InvalidDimensionError(const std::string& message)
        : GasDeblendError("Invalid dimension: " + message) {}
};

class BoundsError : public GasDeblendError {
public:
    explicit BoundsError(const std::string& message)
        : GasDeblendError("Bounds error: " + message) {}
};

class EmptySeedSetError : public GasDeblendError {
public:
    explicit EmptySeedSetError(const std::string& message)
        : GasDeblendError("Empty seed set: " + message) {}
};

class PipelineError : public GasDeblendError {
public:
    explicit PipelineError(const std::string& message)
        : GasDeblendError("Pipeline error: " + message) {}
};

} // namespace gas_deblend
