#include "errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "ok";
        case ErrorKind::SourceRead: return "source read error";
        case ErrorKind::DestinationWrite: return "destination write error";
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::Validation: return "validation error";
    }
    return "unknown error";
}
