/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_file.h"
#include "car/car_mst.h"
#include "car/car_value.h"

#include <nlohmann/json.hpp>

#include <span>
#include <string>

namespace atp::car {
// Byte strings become {"$bytes": <base64, unpadded>} and links {"$link": <cid>}.
nlohmann::ordered_json value_to_json(const Value& value);

nlohmann::ordered_json blocks_to_json(const BlockMap& blocks);

// Keys are emitted as text when they are valid UTF-8 without control bytes, "0x" + hex otherwise.
// A text key that already reads as "0x" + lowercase hex is hex-encoded too, keeping names unique. With `with_values` each record
// becomes {"cid": ..., "value": ...}, looked up in `blocks`.
nlohmann::ordered_json records_to_json(const RecordSet& records, const BlockMap& blocks, bool with_values);

std::string record_key_to_string(const Bytes& key);
std::string base64_unpadded(std::span<const std::uint8_t> bytes);
}  // namespace atp::car
