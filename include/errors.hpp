#pragma once

#include <stdexcept>
#include <string>

/// Failure categories reported per image (or per batch, for Configuration)
enum class ErrorKind {
    None,
    SourceRead,        // missing, unreadable or undecodable input image
    DestinationWrite,  // output file could not be written
    Configuration,     // input/output directories unusable
    Validation,        // empty image, or name that is not a VHDL identifier
};

const char* error_kind_name(ErrorKind kind);

/// Exception thrown inside a conversion; caught at the per-image boundary
class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
