/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace atp::string_utils {
std::string lower_ascii(std::string_view s);

// One element per ASCII-lowercase spelling: the last spelling seen, at the position where that
// spelling first appeared.
std::vector<std::string> remove_case_insensitive_duplicates(const std::vector<std::string>& items);
}  // namespace atp::string_utils
