#include "ico_error.hpp"

IcoError make_ico_error(IcoErrorKind kind) {
    switch (kind) {
    case IcoErrorKind::InvalidInput:
        return IcoError(kind, "Please give me a square PNG image.");
    case IcoErrorKind::ResizeFailure:
        return IcoError(kind, "Failed to resize image.");
    }
    return IcoError(kind, "Icon conversion failed.");
}

IcoError make_ico_error(IcoErrorKind kind, const std::string& detail) {
    return IcoError(kind, detail);
}
