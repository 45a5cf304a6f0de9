/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_byte_reader.h"

#include <cstddef>
#include <cstdint>

namespace atp::car {
constexpr std::size_t kMaxVarintBytes = 10;

// Unsigned LEB128. Fails with ErrorKind::Malformed past kMaxVarintBytes or on 64-bit overflow.
std::uint64_t read_varint(ByteReader& reader);
}  // namespace atp::car
