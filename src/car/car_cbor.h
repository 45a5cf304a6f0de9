/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_byte_reader.h"
#include "car/car_value.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace atp::car {

enum class MajorType : std::uint8_t {
    UnsignedInt = 0,
    NegativeInt = 1,
    ByteString = 2,
    TextString = 3,
    Array = 4,
    Map = 5,
    Tag = 6,
    FloatOrSimple = 7,
};

constexpr std::uint64_t kCidTag = 42;
constexpr std::uint8_t kSimpleFalse = 20;
constexpr std::uint8_t kSimpleTrue = 21;
constexpr std::uint8_t kSimpleNull = 22;

struct CborHead {
    MajorType major = MajorType::UnsignedInt;
    std::uint8_t additional_info = 0;
    // Unsigned value, length, count or tag number. For NegativeInt the encoded value is
    // -1 - argument. For FloatOrSimple with additional_info < 24 this is the simple value.
    std::uint64_t argument = 0;
    // Number of bytes following the initial byte (0, 1, 2, 4 or 8).
    std::size_t argument_width = 0;
    // Set for FloatOrSimple heads carrying a half/single/double.
    std::optional<double> float_value;
};

struct CborDecodeOptions {
    std::size_t max_depth = 64;
    // Reject non-minimal argument encodings and map keys out of DAG-CBOR order.
    bool strict = false;
};

CborHead read_head(ByteReader& reader);

// Consumes exactly one complete data item, including everything nested inside it.
Value decode_value(ByteReader& reader, const CborDecodeOptions& options = {});

double decode_half_float(std::uint16_t bits);

// Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
bool is_valid_utf8(std::span<const std::uint8_t> bytes);

}  // namespace atp::car
