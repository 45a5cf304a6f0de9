/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car_parser.h"

#include "car/car_error.h"
#include "car/car_json.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "utils/string_utils.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace atp::car {

// "app.bsky.feed.post/3k..." -> "app.bsky.feed.post"
static std::vector<std::string> collect_collections(const RecordSet& records) {
    std::vector<std::string> names;
    for (const auto& [key, cid] : records) {
        const std::string text = record_key_to_string(key);
        const auto slash = text.find('/');
        if (slash == std::string::npos || slash == 0) {
            continue;
        }
        std::string name = text.substr(0, slash);
        if (names.empty() || names.back() != name) {
            names.push_back(std::move(name));
        }
    }
    return string_utils::remove_case_insensitive_duplicates(names);
}

static nlohmann::ordered_json build_metadata_block(const DecodeResult& res) {
    nlohmann::ordered_json meta = nlohmann::ordered_json::object();
    meta["root"] = res.car.root;
    meta["headerSize"] = res.car.header_size;
    meta["blockCount"] = res.car.block_count;
    meta["uniqueBlockCount"] = res.car.blocks.size();
    meta["recordCount"] = res.records.size();

    if (res.commit.has_value()) {
        const auto& c = *res.commit;
        nlohmann::ordered_json commit = nlohmann::ordered_json::object();
        commit["did"] = c.did;
        commit["version"] = c.version;
        commit["data"] = c.data;
        if (c.rev.has_value()) {
            commit["rev"] = *c.rev;
        }
        commit["prev"] = c.prev.has_value() ? nlohmann::ordered_json(*c.prev) : nlohmann::ordered_json(nullptr);
        meta["commit"] = std::move(commit);
    }
    meta["collections"] = collect_collections(res.records);
    return meta;
}

DecodeResult
CarParser::DecodeCarFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = atp::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("CAR file is empty: " + path.string());
    }
    return DecodeCarBytes(bytes, opt, path.filename().string());
}

DecodeResult CarParser::DecodeCarBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();

    CarDecodeOptions car_opt{};
    car_opt.cbor.max_depth = opt.max_depth;
    car_opt.cbor.strict = opt.strict;

    DecodeResult result{};
    result.car = parse_car(bytes, car_opt);
    const auto t1 = std::chrono::steady_clock::now();

    // Repository exports root at a commit; bare MST archives root at the tree node itself.
    auto root_it = result.car.blocks.find(result.car.root);
    if (root_it == result.car.blocks.end()) {
        throw CarError(
            ErrorKind::Structural, "root block " + result.car.root + " is not in the archive"
        );
    }
    const auto* root_fields = root_it->second.get_if<Map>();
    if (root_fields && find_entry(*root_fields, "data") && find_entry(*root_fields, "did")) {
        result.commit = read_repo_commit(result.car);
        result.records = enumerate_repo_records(result.car, opt.max_depth);
    } else {
        result.records = enumerate_mst_records(result.car.blocks, root_it->second, opt.max_depth);
    }
    const auto t2 = std::chrono::steady_clock::now();

    result.records_json = records_to_json(result.records, result.car.blocks, opt.with_values);
    result.metadata = build_metadata_block(result);
    if (opt.collect_blocks) {
        result.blocks_json = blocks_to_json(result.car.blocks);
    }
    const auto t3 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto parse_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        const auto mst_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        const auto json_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t3 - t2).count();
        ATP_LOG_INFO(
            "Decode %s: bytes=%zu blocks=%zu records=%zu parse=%lldms mst=%lldms json=%lldms",
            std::string(label).c_str(), bytes.size(), result.car.block_count,
            result.records.size(), static_cast<long long>(parse_ms),
            static_cast<long long>(mst_ms), static_cast<long long>(json_ms)
        );
    }
    return result;
}

}  // namespace atp::car
