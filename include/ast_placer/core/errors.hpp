#pragma once

#include <stdexcept>
#include <string>

namespace ast_placer {

class AstPlacerError : public std::runtime_error {
public:
    explicit AstPlacerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public AstPlacerError {
public:
    explicit ConfigError(const std::string& message)
        : AstPlacerError("Config error: " + message) {}
};

class ValidationError : public AstPlacerError {
public:
    explicit ValidationError(const std::string& message)
        : AstPlacerError("Validation error: " + message) {}
};

class IOError : public AstPlacerError {
public:
    explicit IOError(const std::string& message)
        : AstPlacerError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class TableFormatError : public IOError {
public:
    explicit TableFormatError(const std::string& message)
        : IOError("Table format error: " + message) {}
};

// Degenerate metric range or non-positive bin count
class InvalidRangeError : public AstPlacerError {
public:
    explicit InvalidRangeError(const std::string& message)
        : AstPlacerError("Invalid range: " + message) {}
};

// Catalog has neither pixel nor sky position columns
class MissingCoordinatesError : public AstPlacerError {
public:
    explicit MissingCoordinatesError(const std::string& message)
        : AstPlacerError("Missing coordinates: " + message) {}
};

// Sky-only catalog but no reference image to convert with
class MissingReferenceImageError : public AstPlacerError {
public:
    explicit MissingReferenceImageError(const std::string& message)
        : AstPlacerError("Missing reference image: " + message) {}
};

class EmptyFilteredCatalogError : public AstPlacerError {
public:
    explicit EmptyFilteredCatalogError(const std::string& message)
        : AstPlacerError("Empty filtered catalog: " + message) {}
};

class PositionSamplingExhausted : public AstPlacerError {
public:
    explicit PositionSamplingExhausted(const std::string& message)
        : AstPlacerError("Position sampling exhausted: " + message) {}
};

} // namespace ast_placer
