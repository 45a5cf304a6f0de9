/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace atp::car {

enum class ErrorKind {
    Framing,
    Malformed,
    Integrity,
    Structural,
    EndOfInput,
};

std::string_view error_kind_name(ErrorKind kind);

// Every failure raised while decoding an archive. `offset` is the byte position where the problem
// was detected, or npos when it is not tied to a position (e.g. MST shape errors).
class CarError : public std::runtime_error {
   public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    CarError(ErrorKind kind, const std::string& message, std::size_t offset = npos);

    ErrorKind kind() const { return _kind; }
    std::size_t offset() const { return _offset; }

   private:
    ErrorKind _kind;
    std::size_t _offset;
};

}  // namespace atp::car
