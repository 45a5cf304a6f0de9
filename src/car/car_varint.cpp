/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_varint.h"

#include <string>

namespace atp::car {
std::uint64_t read_varint(ByteReader& reader) {
    const std::size_t start = reader.position();
    std::uint64_t value = 0;
    int shift = 0;
    for (std::size_t i = 0; i < kMaxVarintBytes; i++) {
        const std::uint8_t b = reader.read_u8();
        const std::uint64_t low = static_cast<std::uint64_t>(b & 0x7Fu);
        // 10th byte may only carry bit 63.
        if (shift == 63 && low > 1) {
            throw CarError(ErrorKind::Malformed, std::string("malformed varint (overflows 64 bits)"), start);
        }
        value |= low << shift;
        if ((b & 0x80u) == 0) {
            return value;
        }
        shift += 7;
    }
    throw CarError(
        ErrorKind::Malformed,
        "malformed varint (more than " + std::to_string(kMaxVarintBytes) + " bytes)",
        start
    );
}
}  // namespace atp::car
