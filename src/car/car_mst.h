/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "car/car_file.h"
#include "car/car_value.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace atp::car {
// Full record key -> value CID.
using RecordSet = std::map<Bytes, std::string>;

constexpr std::size_t kDefaultMstDepth = 64;

// Walks an MST node and every subtree reachable through `l` / `t` links present in `blocks`.
// Links whose block is absent are skipped. Shape errors and `p` exceeding the previous key length
// throw CarError(Structural).
RecordSet enumerate_mst_records(
    const BlockMap& blocks,
    const Value& node,
    std::size_t max_depth = kDefaultMstDepth
);

struct RepoCommit {
    std::string did;
    std::uint64_t version = 0;
    std::string data;
    std::optional<std::string> rev;
    std::optional<std::string> prev;
};

RepoCommit read_repo_commit(const CarFile& car);

// read_repo_commit, then enumerate from the commit's `data` node.
RecordSet enumerate_repo_records(const CarFile& car, std::size_t max_depth = kDefaultMstDepth);
}  // namespace atp::car
