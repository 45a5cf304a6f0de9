/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "string_utils.h"

#include <unordered_map>

namespace atp::string_utils {
std::string lower_ascii(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c + 32));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::vector<std::string> remove_case_insensitive_duplicates(const std::vector<std::string>& items) {
    std::vector<std::string> out;
    std::unordered_map<std::string, std::size_t> index;
    for (const auto& item : items) {
        auto [it, inserted] = index.try_emplace(lower_ascii(item), out.size());
        if (inserted) {
            out.push_back(item);
        } else {
            out[it->second] = item;
        }
    }
    return out;
}
}  // namespace atp::string_utils
