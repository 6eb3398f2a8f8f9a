#pragma once

#include <stdexcept>
#include <string>

/// Failure categories raised by the icon pipeline
enum class IcoErrorKind {
    InvalidInput,   // unsupported format, non-square or oversized image
    ResizeFailure,  // resampler could not produce the requested size
};

class IcoError : public std::runtime_error {
public:
    IcoError(IcoErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    IcoErrorKind kind() const { return kind_; }

private:
    IcoErrorKind kind_;
};

/// Build a fresh error with the fixed message for its kind
IcoError make_ico_error(IcoErrorKind kind);

/// Build a fresh error with a caller-supplied message
IcoError make_ico_error(IcoErrorKind kind, const std::string& detail);
