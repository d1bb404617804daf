#pragma once

#include <stdexcept>
#include <string>

namespace annual_mosaic {

class AnnualMosaicError : public std::runtime_error {
public:
    explicit AnnualMosaicError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public AnnualMosaicError {
public:
    explicit ConfigError(const std::string& message)
        : AnnualMosaicError("Config error: " + message) {}
};

class ValidationError : public AnnualMosaicError {
public:
    explicit ValidationError(const std::string& message)
        : AnnualMosaicError("Validation error: " + message) {}
};

class IOError : public AnnualMosaicError {
public:
    explicit IOError(const std::string& message)
        : AnnualMosaicError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// A scene has no quality band to derive its mask from.
class MissingAuxiliaryBand : public AnnualMosaicError {
public:
    explicit MissingAuxiliaryBand(const std::string& message)
        : AnnualMosaicError("Missing auxiliary band: " + message) {}
};

// A raster does not sit on the expected grid.
class GridMismatch : public AnnualMosaicError {
public:
    explicit GridMismatch(const std::string& message)
        : AnnualMosaicError("Grid mismatch: " + message) {}
};

// Run-level failure, e.g. no scenes and no reference grid to compose on.
class PipelineError : public AnnualMosaicError {
public:
    explicit PipelineError(const std::string& message)
        : AnnualMosaicError("Pipeline error: " + message) {}
};

} // namespace annual_mosaic
