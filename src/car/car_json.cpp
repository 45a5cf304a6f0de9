/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_json.h"
#include "car/car_cbor.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace atp::car {
std::string base64_unpadded(std::span<const std::uint8_t> bytes) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((bytes.size() * 4 + 2) / 3);
    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8) | bytes[i + 2];
        out.push_back(alphabet[(v >> 18) & 0x3Fu]);
        out.push_back(alphabet[(v >> 12) & 0x3Fu]);
        out.push_back(alphabet[(v >> 6) & 0x3Fu]);
        out.push_back(alphabet[v & 0x3Fu]);
    }
    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t v = static_cast<std::uint32_t>(bytes[i]) << 16;
        out.push_back(alphabet[(v >> 18) & 0x3Fu]);
        out.push_back(alphabet[(v >> 12) & 0x3Fu]);
    } else if (rest == 2) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out.push_back(alphabet[(v >> 18) & 0x3Fu]);
        out.push_back(alphabet[(v >> 12) & 0x3Fu]);
        out.push_back(alphabet[(v >> 6) & 0x3Fu]);
    }
    return out;
}

static bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

// Record keys are "<collection>/<rkey>" in practice. Keys with control bytes or ill-formed UTF-8
// go out as hex, and so do text keys already spelled like the hex form, so the two never collide.
static bool renders_as_text(const Bytes& key) {
    for (const auto c : key) {
        if (c < 0x20 || c == 0x7F) {
            return false;
        }
    }
    if (!is_valid_utf8(key)) {
        return false;
    }
    if (key.size() >= 2 && key[0] == '0' && key[1] == 'x') {
        return !std::all_of(key.begin() + 2, key.end(), [](std::uint8_t c) {
            return is_hex_digit(static_cast<char>(c));
        });
    }
    return true;
}

std::string record_key_to_string(const Bytes& key) {
    if (renders_as_text(key)) {
        return std::string(key.begin(), key.end());
    }
    static const char hexdig[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + key.size() * 2);
    for (const auto b : key) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

nlohmann::ordered_json value_to_json(const Value& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::ordered_json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Bytes>) {
                nlohmann::ordered_json j = nlohmann::ordered_json::object();
                j["$bytes"] = base64_unpadded(v);
                return j;
            } else if constexpr (std::is_same_v<T, CidLink>) {
                nlohmann::ordered_json j = nlohmann::ordered_json::object();
                j["$link"] = v.cid;
                return j;
            } else if constexpr (std::is_same_v<T, Array>) {
                nlohmann::ordered_json j = nlohmann::ordered_json::array();
                for (const auto& item : v) {
                    j.push_back(value_to_json(item));
                }
                return j;
            } else if constexpr (std::is_same_v<T, Map>) {
                nlohmann::ordered_json j = nlohmann::ordered_json::object();
                for (const auto& entry : v) {
                    j[entry.key] = value_to_json(entry.value);
                }
                return j;
            } else if constexpr (std::is_same_v<T, double>) {
                // JSON has no NaN/Infinity.
                if (!std::isfinite(v)) {
                    return nullptr;
                }
                return v;
            } else {
                return v;
            }
        },
        value.data
    );
}

nlohmann::ordered_json blocks_to_json(const BlockMap& blocks) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& [cid, block] : blocks) {
        out[cid] = value_to_json(block);
    }
    return out;
}

nlohmann::ordered_json records_to_json(const RecordSet& records, const BlockMap& blocks, bool with_values) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& [key, cid] : records) {
        const std::string name = record_key_to_string(key);
        if (!with_values) {
            out[name] = cid;
            continue;
        }
        nlohmann::ordered_json rec = nlohmann::ordered_json::object();
        rec["cid"] = cid;
        auto it = blocks.find(cid);
        rec["value"] = it == blocks.end() ? nlohmann::ordered_json(nullptr) : value_to_json(it->second);
        out[name] = std::move(rec);
    }
    return out;
}
}  // namespace atp::car
