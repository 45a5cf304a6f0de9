/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_cbor.h"
#include "car/car_cid.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <unordered_map>

namespace atp::car {
static std::size_t argument_width_for(std::uint8_t additional_info) {
    switch (additional_info) {
        case 24:
            return 1;
        case 25:
            return 2;
        case 26:
            return 4;
        case 27:
            return 8;
        default:
            return 0;
    }
}

double decode_half_float(std::uint16_t bits) {
    const int exponent = (bits >> 10) & 0x1F;
    const int mantissa = bits & 0x3FF;
    double v = 0.0;
    if (exponent == 0) {
        v = std::ldexp(static_cast<double>(mantissa), -24);
    } else if (exponent == 31) {
        v = mantissa == 0 ? std::numeric_limits<double>::infinity()
                          : std::numeric_limits<double>::quiet_NaN();
    } else {
        v = std::ldexp(static_cast<double>(mantissa + 1024), exponent - 25);
    }
    return (bits & 0x8000u) != 0 ? -v : v;
}

static double decode_float_bits(std::uint64_t bits, std::size_t width) {
    if (width == 2) {
        return decode_half_float(static_cast<std::uint16_t>(bits));
    }
    if (width == 4) {
        const std::uint32_t raw = static_cast<std::uint32_t>(bits);
        float f = 0.0f;
        std::memcpy(&f, &raw, sizeof(f));
        return static_cast<double>(f);
    }
    double d = 0.0;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

CborHead read_head(ByteReader& reader) {
    const std::size_t start = reader.position();
    const std::uint8_t first = reader.read_u8();

    CborHead head{};
    head.major = static_cast<MajorType>(first >> 5);
    head.additional_info = static_cast<std::uint8_t>(first & 0x1Fu);

    if (head.additional_info < 24) {
        head.argument = head.additional_info;
        if (head.major == MajorType::FloatOrSimple && head.additional_info != kSimpleFalse
            && head.additional_info != kSimpleTrue && head.additional_info != kSimpleNull) {
            throw CarError(
                ErrorKind::Malformed,
                "unsupported simple value " + std::to_string(head.additional_info),
                start
            );
        }
        return head;
    }

    const std::size_t width = argument_width_for(head.additional_info);
    if (width != 0) {
        if (head.major == MajorType::FloatOrSimple && width == 1) {
            throw CarError(ErrorKind::Malformed, std::string("one-byte simple values are invalid"), start);
        }
        head.argument = reader.read_uint_be(width);
        head.argument_width = width;
        if (head.major == MajorType::FloatOrSimple) {
            head.float_value = decode_float_bits(head.argument, width);
        }
        return head;
    }

    if (head.additional_info == 31) {
        throw CarError(ErrorKind::Malformed, std::string("indefinite lengths not supported"), start);
    }
    throw CarError(
        ErrorKind::Malformed,
        "not well-formed (additional info " + std::to_string(head.additional_info) + ")",
        start
    );
}

bool is_valid_utf8(std::span<const std::uint8_t> s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const std::uint8_t c = s[i];
        if (c < 0x80) {
            i++;
            continue;
        }
        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((c & 0xE0u) == 0xC0u) {
            len = 2;
            cp = c & 0x1Fu;
            min_cp = 0x80;
        } else if ((c & 0xF0u) == 0xE0u) {
            len = 3;
            cp = c & 0x0Fu;
            min_cp = 0x800;
        } else if ((c & 0xF8u) == 0xF0u) {
            len = 4;
            cp = c & 0x07u;
            min_cp = 0x10000;
        } else {
            return false;
        }
        if (i + len > s.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; k++) {
            const std::uint8_t cc = s[i + k];
            if ((cc & 0xC0u) != 0x80u) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        // Overlong forms, UTF-16 surrogates, beyond U+10FFFF.
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

static bool is_minimal(const CborHead& head) {
    switch (head.argument_width) {
        case 0:
            return true;
        case 1:
            return head.argument >= 24;
        case 2:
            return head.argument > 0xFFu;
        case 4:
            return head.argument > 0xFFFFu;
        default:
            return head.argument > 0xFFFFFFFFu;
    }
}

// DAG-CBOR map key order: shorter encoded key first, then bytewise.
static bool key_precedes(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return a.size() < b.size();
    }
    return a < b;
}

static void check_count(const ByteReader& reader, std::uint64_t count, std::size_t start) {
    // Every element needs at least one byte.
    if (count > reader.remaining()) {
        throw CarError(
            ErrorKind::EndOfInput,
            "declared " + std::to_string(count) + " elements but only "
                + std::to_string(reader.remaining()) + " bytes remain",
            start
        );
    }
}

static Value decode_item(ByteReader& reader, const CborDecodeOptions& opt, std::size_t depth) {
    const std::size_t start = reader.position();
    if (depth > opt.max_depth) {
        throw CarError(
            ErrorKind::Malformed, "nesting too deep (limit " + std::to_string(opt.max_depth) + ")",
            start
        );
    }

    const CborHead head = read_head(reader);
    if (opt.strict && head.major != MajorType::FloatOrSimple && !is_minimal(head)) {
        throw CarError(ErrorKind::Malformed, std::string("non-minimal integer encoding"), start);
    }

    switch (head.major) {
        case MajorType::UnsignedInt:
            return head.argument;

        case MajorType::NegativeInt: {
            if (head.argument > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw CarError(ErrorKind::Malformed, std::string("negative integer out of range"), start);
            }
            return std::int64_t{-1} - static_cast<std::int64_t>(head.argument);
        }

        case MajorType::ByteString: {
            const auto bytes = reader.read_bytes(static_cast<std::size_t>(
                std::min<std::uint64_t>(head.argument, std::numeric_limits<std::size_t>::max())
            ));
            return Bytes(bytes.begin(), bytes.end());
        }

        case MajorType::TextString: {
            const auto bytes = reader.read_bytes(static_cast<std::size_t>(
                std::min<std::uint64_t>(head.argument, std::numeric_limits<std::size_t>::max())
            ));
            if (!is_valid_utf8(bytes)) {
                throw CarError(ErrorKind::Malformed, std::string("invalid UTF-8 in text string"), start);
            }
            return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }

        case MajorType::Array: {
            check_count(reader, head.argument, start);
            Array items;
            items.reserve(static_cast<std::size_t>(head.argument));
            for (std::uint64_t i = 0; i < head.argument; i++) {
                items.push_back(decode_item(reader, opt, depth + 1));
            }
            return items;
        }

        case MajorType::Map: {
            check_count(reader, head.argument, start);
            Map entries;
            entries.reserve(static_cast<std::size_t>(head.argument));
            // Key -> position in `entries`; a repeated key keeps its first slot.
            std::unordered_map<std::string, std::size_t> index;
            index.reserve(static_cast<std::size_t>(head.argument));
            for (std::uint64_t i = 0; i < head.argument; i++) {
                const std::size_t key_start = reader.position();
                Value key = decode_item(reader, opt, depth + 1);
                auto* key_text = std::get_if<std::string>(&key.data);
                if (!key_text) {
                    throw CarError(ErrorKind::Malformed, std::string("map keys must be strings"), key_start);
                }
                if (opt.strict && !entries.empty() && !key_precedes(entries.back().key, *key_text)) {
                    throw CarError(
                        ErrorKind::Malformed,
                        "map key \"" + *key_text + "\" out of canonical order after \""
                            + entries.back().key + "\"",
                        key_start
                    );
                }
                Value value = decode_item(reader, opt, depth + 1);

                const auto [slot, inserted] = index.try_emplace(*key_text, entries.size());
                if (inserted) {
                    entries.push_back(MapEntry{std::move(*key_text), std::move(value)});
                } else {
                    entries[slot->second].value = std::move(value);
                }
            }
            return entries;
        }

        case MajorType::Tag: {
            if (head.argument != kCidTag) {
                throw CarError(
                    ErrorKind::Malformed,
                    "unsupported tag " + std::to_string(head.argument) + " (only 42 is allowed)",
                    start
                );
            }
            const std::size_t inner_start = reader.position();
            const Value inner = decode_item(reader, opt, depth + 1);
            const auto* link_bytes = inner.get_if<Bytes>();
            if (!link_bytes) {
                throw CarError(
                    ErrorKind::Malformed,
                    "CID link must be a byte string, got " + std::string(value_type_name(inner)),
                    inner_start
                );
            }
            return CidLink{cid_from_link_bytes(*link_bytes, inner_start)};
        }

        case MajorType::FloatOrSimple:
            if (head.float_value.has_value()) {
                return *head.float_value;
            }
            if (head.argument == kSimpleFalse) {
                return false;
            }
            if (head.argument == kSimpleTrue) {
                return true;
            }
            return nullptr;
    }
    throw CarError(ErrorKind::Malformed, std::string("unreachable major type"), start);
}

Value decode_value(ByteReader& reader, const CborDecodeOptions& options) {
    return decode_item(reader, options, 0);
}
}  // namespace atp::car
