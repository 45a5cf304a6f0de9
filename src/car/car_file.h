/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_cbor.h"
#include "car/car_value.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>

namespace atp::car {
constexpr std::uint64_t kCarVersion = 1;

// CID string -> decoded block.
using BlockMap = std::map<std::string, Value>;

struct CarFile {
    std::string root;
    BlockMap blocks;
    // Blocks read from the archive, duplicates included.
    std::size_t block_count = 0;
    std::size_t header_size = 0;
};

struct CarDecodeOptions {
    CborDecodeOptions cbor{};
};

// Parses a complete CARv1 archive. Every block is hash-checked against its CID; any failure throws
// CarError and nothing is returned.
CarFile parse_car(std::span<const std::uint8_t> bytes, const CarDecodeOptions& opt = {});
}  // namespace atp::car
