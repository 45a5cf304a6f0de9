/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_cid.h"
#include "car/car_error.h"
#include "car/car_sha256.h"

#include <algorithm>

namespace atp::car {
static bool has_prefix(
    std::span<const std::uint8_t> bytes,
    const std::array<std::uint8_t, kCidPrefixSize>& prefix
) {
    return bytes.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), bytes.begin());
}

std::string base32_lower(std::span<const std::uint8_t> bytes) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";
    std::string out;
    out.reserve((bytes.size() * 8 + 4) / 5);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (const auto b : bytes) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            out.push_back(alphabet[(buffer >> (bits - 5)) & 0x1Fu]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(alphabet[(buffer << (5 - bits)) & 0x1Fu]);
    }
    return out;
}

std::string encode_cid(std::span<const std::uint8_t> cid_bytes) {
    return "b" + base32_lower(cid_bytes);
}

std::string cid_from_link_bytes(std::span<const std::uint8_t> link_bytes, std::size_t offset) {
    if (link_bytes.size() != kCidLinkSize) {
        throw CarError(
            ErrorKind::Malformed,
            "CID link must be " + std::to_string(kCidLinkSize) + " bytes, got "
                + std::to_string(link_bytes.size()),
            offset
        );
    }
    const auto body = link_bytes.subspan(1);
    if (link_bytes[0] != kMultibaseIdentity
        || (!has_prefix(body, kDagCborSha256Prefix) && !has_prefix(body, kRawSha256Prefix))) {
        throw CarError(ErrorKind::Malformed, std::string("unrecognized CID prefix"), offset);
    }
    return encode_cid(body);
}

std::string cid_from_block_bytes(
    std::span<const std::uint8_t> block_cid_bytes,
    std::size_t offset
) {
    if (block_cid_bytes.size() != kCidBlockSize) {
        throw CarError(
            ErrorKind::Malformed,
            "block CID must be " + std::to_string(kCidBlockSize) + " bytes, got "
                + std::to_string(block_cid_bytes.size()),
            offset
        );
    }
    if (!has_prefix(block_cid_bytes, kDagCborSha256Prefix)) {
        throw CarError(ErrorKind::Malformed, std::string("unrecognized CID prefix"), offset);
    }
    return encode_cid(block_cid_bytes);
}

std::span<const std::uint8_t> cid_digest(std::span<const std::uint8_t> cid_bytes) {
    if (cid_bytes.size() < kSha256Size) {
        throw CarError(ErrorKind::Malformed, std::string("CID too short for a SHA-256 digest"));
    }
    return cid_bytes.last(kSha256Size);
}
}  // namespace atp::car
