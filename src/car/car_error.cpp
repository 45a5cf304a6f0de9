/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_error.h"

namespace atp::car {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Framing:
            return "framing";
        case ErrorKind::Malformed:
            return "malformed";
        case ErrorKind::Integrity:
            return "integrity";
        case ErrorKind::Structural:
            return "structural";
        case ErrorKind::EndOfInput:
            return "end-of-input";
    }
    return "unknown";
}

static std::string format_message(ErrorKind kind, const std::string& message, std::size_t offset) {
    std::string out = "[";
    out += error_kind_name(kind);
    out += "] ";
    out += message;
    if (offset != CarError::npos) {
        out += " (at offset ";
        out += std::to_string(offset);
        out += ")";
    }
    return out;
}

CarError::CarError(ErrorKind kind, const std::string& message, std::size_t offset)
    : std::runtime_error(format_message(kind, message, offset)), _kind(kind), _offset(offset) {}

}  // namespace atp::car
