#include "core/types.h"

namespace station {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:             return "Ok";
        case ErrorCode::SpawnError:     return "SpawnError";
        case ErrorCode::UnknownSession: return "UnknownSession";
        case ErrorCode::IOError:        return "IOError";
        case ErrorCode::ResizeIgnored:  return "ResizeIgnored";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    if (message.empty()) {
        return error_code_name(code);
    }
    return std::string(error_code_name(code)) + ": " + message;
}

}
