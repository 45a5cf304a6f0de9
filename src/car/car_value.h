/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace atp::car {
using Bytes = std::vector<std::uint8_t>;

struct CidLink {
    std::string cid;

    bool operator==(const CidLink&) const = default;
};

struct Value;
struct MapEntry;
using Array = std::vector<Value>;
// Kept in input order; DAG-CBOR keys are always text.
using Map = std::vector<MapEntry>;

struct Value {
    using Storage = std::variant<
        std::uint64_t,
        std::int64_t,
        Bytes,
        std::string,
        bool,
        std::nullptr_t,
        double,
        Array,
        Map,
        CidLink>;

    Storage data = nullptr;

    Value() = default;
    template <typename T, typename = std::enable_if_t<std::is_constructible_v<Storage, T>>>
    Value(T v) : data(std::move(v)) {}

    template <typename T>
    bool is() const {
        return std::holds_alternative<T>(data);
    }
    template <typename T>
    const T* get_if() const {
        return std::get_if<T>(&data);
    }
};

struct MapEntry {
    std::string key;
    Value value;
};

// nullptr when absent.
const Value* find_entry(const Map& map, std::string_view key);

// "uint", "nint", "bytes", "text", "bool", "null", "float", "array", "map", "link".
std::string_view value_type_name(const Value& value);
}  // namespace atp::car
