/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_file.h"
#include "car/car_mst.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

namespace atp::car {

struct ParserDecodeOptions {
    std::size_t max_depth = 64;
    bool strict = false;
    bool with_values = true;
    bool collect_blocks = false;
    bool debug = false;
};

struct DecodeResult {
    CarFile car;
    std::optional<RepoCommit> commit;
    RecordSet records;
    nlohmann::ordered_json records_json = nlohmann::ordered_json::object();
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
    nlohmann::ordered_json blocks_json = nlohmann::ordered_json::object();
};

class CarParser {
   public:
    static DecodeResult
    DecodeCarFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeCarBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );
};

}  // namespace atp::car
