/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_value.h"

namespace atp::car {
const Value* find_entry(const Map& map, std::string_view key) {
    for (const auto& entry : map) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

std::string_view value_type_name(const Value& value) {
    static constexpr std::string_view names[] = {
        "uint", "nint", "bytes", "text", "bool", "null", "float", "array", "map", "link",
    };
    static_assert(std::variant_size_v<Value::Storage> == std::size(names));
    return names[value.data.index()];
}
}  // namespace atp::car
