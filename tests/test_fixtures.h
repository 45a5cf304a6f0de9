/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_cid.h"
#include "car/car_sha256.h"
#include "car/car_value.h"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Hand-assembled DAG-CBOR / CAR byte fixtures. Only what the tests need; always minimal encodings.
namespace atp::car::testing {

inline Bytes cat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

inline Bytes head(std::uint8_t major, std::uint64_t arg) {
    const std::uint8_t m = static_cast<std::uint8_t>(major << 5);
    if (arg < 24) {
        return {static_cast<std::uint8_t>(m | arg)};
    }
    int width = 8;
    std::uint8_t info = 27;
    if (arg <= 0xFF) {
        width = 1;
        info = 24;
    } else if (arg <= 0xFFFF) {
        width = 2;
        info = 25;
    } else if (arg <= 0xFFFFFFFFull) {
        width = 4;
        info = 26;
    }
    Bytes out{static_cast<std::uint8_t>(m | info)};
    for (int i = width - 1; i >= 0; i--) {
        out.push_back(static_cast<std::uint8_t>((arg >> (8 * i)) & 0xFF));
    }
    return out;
}

inline Bytes cbor_uint(std::uint64_t v) { return head(0, v); }

inline Bytes cbor_text(std::string_view s) {
    Bytes out = head(3, s.size());
    out.insert(out.end(), s.begin(), s.end());
    return out;
}

inline Bytes cbor_bytes(const Bytes& b) { return cat({head(2, b.size()), b}); }

inline Bytes cbor_array(std::initializer_list<Bytes> items) {
    Bytes out = head(4, items.size());
    for (const auto& i : items) {
        out.insert(out.end(), i.begin(), i.end());
    }
    return out;
}

// Pairs are emitted in the order given.
inline Bytes cbor_map(std::initializer_list<std::pair<std::string_view, Bytes>> entries) {
    Bytes out = head(5, entries.size());
    for (const auto& [k, v] : entries) {
        const Bytes key = cbor_text(k);
        out.insert(out.end(), key.begin(), key.end());
        out.insert(out.end(), v.begin(), v.end());
    }
    return out;
}

inline Bytes cbor_null() { return {0xF6}; }

inline Bytes to_bytes(std::string_view s) { return Bytes(s.begin(), s.end()); }

// 36-byte CIDv1 / DAG-CBOR / SHA-256 of `payload`.
inline Bytes block_cid(const Bytes& payload) {
    Bytes out(kDagCborSha256Prefix.begin(), kDagCborSha256Prefix.end());
    const auto digest = sha256(payload);
    out.insert(out.end(), digest.begin(), digest.end());
    return out;
}

inline std::string block_cid_text(const Bytes& payload) { return encode_cid(block_cid(payload)); }

// Tag 42 wrapping the multibase-prefixed CID.
inline Bytes cbor_link(const Bytes& cid36) {
    Bytes body{kMultibaseIdentity};
    body.insert(body.end(), cid36.begin(), cid36.end());
    return cat({head(6, 42), cbor_bytes(body)});
}

inline Bytes varint(std::uint64_t v) {
    Bytes out;
    do {
        std::uint8_t b = static_cast<std::uint8_t>(v & 0x7F);
        v >>= 7;
        if (v != 0) {
            b |= 0x80;
        }
        out.push_back(b);
    } while (v != 0);
    return out;
}

inline Bytes car_section(const Bytes& cid36, const Bytes& payload) {
    return cat({varint(cid36.size() + payload.size()), cid36, payload});
}

inline Bytes car_header(const Bytes& root_cid36) {
    const Bytes hdr = cbor_map({{"roots", cbor_array({cbor_link(root_cid36)})}, {"version", cbor_uint(1)}});
    return cat({varint(hdr.size()), hdr});
}

// Header rooted at the first payload, followed by one correctly hashed block per payload.
inline Bytes make_car(const std::vector<Bytes>& payloads) {
    Bytes out = car_header(block_cid(payloads.front()));
    for (const auto& p : payloads) {
        const Bytes section = car_section(block_cid(p), p);
        out.insert(out.end(), section.begin(), section.end());
    }
    return out;
}

inline Bytes mst_entry(std::uint64_t p, std::string_view k, const Bytes& v_cid36) {
    return cbor_map({{"k", cbor_bytes(to_bytes(k))}, {"p", cbor_uint(p)}, {"t", cbor_null()}, {"v", cbor_link(v_cid36)}});
}

inline Bytes mst_entry_with_tree(
    std::uint64_t p,
    std::string_view k,
    const Bytes& v_cid36,
    const Bytes& t_cid36
) {
    return cbor_map(
        {{"k", cbor_bytes(to_bytes(k))}, {"p", cbor_uint(p)}, {"t", cbor_link(t_cid36)}, {"v", cbor_link(v_cid36)}}
    );
}

}  // namespace atp::car::testing
