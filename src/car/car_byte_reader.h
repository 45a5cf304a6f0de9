/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_error.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace atp::car {
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos == _data.size(); }

    std::uint8_t read_u8() {
        if (_pos >= _data.size()) {
            throw CarError(ErrorKind::EndOfInput, std::string("Unexpected EOF while reading byte."), _pos);
        }
        return _data[_pos++];
    }

    // Big-endian unsigned integer of `byte_count` bytes (0..8).
    std::uint64_t read_uint_be(std::size_t byte_count) {
        if (byte_count > 8) {
            throw std::invalid_argument(std::string("byteCount must be in [0..8]"));
        }
        const auto bytes = read_bytes(byte_count);
        std::uint64_t v = 0;
        for (const auto b : bytes) {
            v = (v << 8) | static_cast<std::uint64_t>(b);
        }
        return v;
    }

    // Returned span aliases the underlying buffer.
    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        if (count > remaining()) {
            throw CarError(
                ErrorKind::EndOfInput,
                "Unexpected EOF: requested " + std::to_string(count) + " bytes, "
                    + std::to_string(remaining()) + " available",
                _pos
            );
        }
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

   private:
    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace atp::car
