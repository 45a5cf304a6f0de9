/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace atp::car {
// CIDv1 binary layout: [multibase 0x00] version codec hash-fn digest-len digest[32].
// Links embedded in DAG-CBOR (tag 42) carry the multibase byte; CAR block headers do not.
constexpr std::size_t kCidBlockSize = 36;
constexpr std::size_t kCidLinkSize = 37;
constexpr std::size_t kCidPrefixSize = 4;

constexpr std::uint8_t kMultibaseIdentity = 0x00;
constexpr std::uint8_t kCidVersion1 = 0x01;
constexpr std::uint8_t kCodecDagCbor = 0x71;
constexpr std::uint8_t kCodecRaw = 0x55;
constexpr std::uint8_t kHashSha256 = 0x12;
constexpr std::uint8_t kSha256Length = 0x20;

constexpr std::array<std::uint8_t, kCidPrefixSize> kDagCborSha256Prefix = {
    kCidVersion1, kCodecDagCbor, kHashSha256, kSha256Length
};
constexpr std::array<std::uint8_t, kCidPrefixSize> kRawSha256Prefix = {
    kCidVersion1, kCodecRaw, kHashSha256, kSha256Length
};

// RFC 4648 base32, lowercase alphabet, no padding.
std::string base32_lower(std::span<const std::uint8_t> bytes);

// "b" + base32_lower(cid_bytes). No validation.
std::string encode_cid(std::span<const std::uint8_t> cid_bytes);

// 37-byte tag-42 payload; accepts DAG-CBOR or raw, SHA-256 only. `offset` is reported on failure.
std::string cid_from_link_bytes(
    std::span<const std::uint8_t> link_bytes,
    std::size_t offset = CarError::npos
);

// 36-byte CAR block CID; accepts DAG-CBOR/SHA-256 only.
std::string cid_from_block_bytes(
    std::span<const std::uint8_t> block_cid_bytes,
    std::size_t offset = CarError::npos
);

// Trailing digest of a 36- or 37-byte layout.
std::span<const std::uint8_t> cid_digest(std::span<const std::uint8_t> cid_bytes);
}  // namespace atp::car
