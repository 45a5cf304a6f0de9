/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_file.h"
#include "car/car_byte_reader.h"
#include "car/car_cid.h"
#include "car/car_sha256.h"
#include "car/car_varint.h"

#include <algorithm>
#include <string>

namespace atp::car {
static std::string to_hex_bytes(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

static std::string read_header_root(const Value& header, std::size_t offset) {
    const auto* fields = header.get_if<Map>();
    if (!fields) {
        throw CarError(
            ErrorKind::Structural,
            "CAR header must be a map, got " + std::string(value_type_name(header)), offset
        );
    }

    const Value* version = find_entry(*fields, "version");
    const auto* version_num = version ? version->get_if<std::uint64_t>() : nullptr;
    if (!version_num || *version_num != kCarVersion) {
        throw CarError(
            ErrorKind::Structural,
            "unsupported CAR version (expected 1, got "
                + (version_num ? std::to_string(*version_num)
                               : std::string(version ? value_type_name(*version) : "none"))
                + ")",
            offset
        );
    }

    const Value* roots = find_entry(*fields, "roots");
    const auto* roots_list = roots ? roots->get_if<Array>() : nullptr;
    if (!roots_list) {
        throw CarError(ErrorKind::Structural, std::string("CAR header has no roots array"), offset);
    }
    if (roots_list->size() != 1) {
        throw CarError(
            ErrorKind::Structural,
            "CAR header must have exactly 1 root, got " + std::to_string(roots_list->size()), offset
        );
    }
    const auto* root = roots_list->front().get_if<CidLink>();
    if (!root) {
        throw CarError(
            ErrorKind::Structural,
            "CAR root must be a CID link, got " + std::string(value_type_name(roots_list->front())),
            offset
        );
    }
    return root->cid;
}

CarFile parse_car(std::span<const std::uint8_t> bytes, const CarDecodeOptions& opt) {
    ByteReader reader(bytes);
    const std::size_t total = bytes.size();

    CarFile car{};
    const std::uint64_t header_len = read_varint(reader);
    const std::size_t header_start = reader.position();
    const Value header = decode_value(reader, opt.cbor);
    const std::size_t header_read = reader.position() - header_start;
    if (header_read != header_len) {
        throw CarError(
            ErrorKind::Framing,
            "CAR header length mismatch (declared " + std::to_string(header_len) + ", decoded "
                + std::to_string(header_read) + ")",
            header_start
        );
    }
    car.root = read_header_root(header, header_start);
    car.header_size = header_read;

    while (reader.position() != total) {
        const std::size_t len_offset = reader.position();
        const std::uint64_t block_len = read_varint(reader);
        const std::size_t block_start = reader.position();
        if (block_len < kCidBlockSize) {
            throw CarError(
                ErrorKind::Framing,
                "block length " + std::to_string(block_len) + " shorter than a "
                    + std::to_string(kCidBlockSize) + "-byte CID",
                len_offset
            );
        }
        if (block_len > reader.remaining()) {
            throw CarError(
                ErrorKind::EndOfInput,
                "block length " + std::to_string(block_len) + " exceeds remaining "
                    + std::to_string(reader.remaining()) + " bytes",
                len_offset
            );
        }

        const auto cid_raw = reader.read_bytes(kCidBlockSize);
        std::string cid = cid_from_block_bytes(cid_raw, block_start);

        const std::size_t payload_offset = reader.position();
        const auto payload = reader.read_bytes(static_cast<std::size_t>(block_len) - kCidBlockSize);

        const Sha256Digest actual = sha256(payload);
        const auto expected = cid_digest(cid_raw);
        if (!std::equal(expected.begin(), expected.end(), actual.begin(), actual.end())) {
            throw CarError(
                ErrorKind::Integrity,
                "block " + cid + " digest mismatch (expected " + to_hex_bytes(expected)
                    + ", actual " + to_hex_bytes(actual) + ")",
                payload_offset
            );
        }

        ByteReader block_reader(payload);
        Value block = decode_value(block_reader, opt.cbor);
        if (!block_reader.at_end()) {
            throw CarError(
                ErrorKind::Framing,
                "block " + cid + " has " + std::to_string(block_reader.remaining())
                    + " trailing bytes",
                payload_offset + block_reader.position()
            );
        }

        const std::size_t block_read = reader.position() - block_start;
        if (block_read != block_len) {
            throw CarError(
                ErrorKind::Framing,
                "block length mismatch (declared " + std::to_string(block_len) + ", read "
                    + std::to_string(block_read) + ")",
                block_start
            );
        }

        car.blocks.insert_or_assign(std::move(cid), std::move(block));
        car.block_count++;
    }

    return car;
}
}  // namespace atp::car
