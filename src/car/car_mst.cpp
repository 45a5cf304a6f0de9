/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_mst.h"
#include "car/car_error.h"

#include <cstddef>
#include <set>
#include <string>

namespace atp::car {
// Each CID may be entered once per walk; a shared or cyclic subtree is not a search tree.
static const Value* linked_node(const BlockMap& blocks, const Value* link, std::set<std::string>& visited) {
    if (!link) {
        return nullptr;
    }
    const auto* cid = link->get_if<CidLink>();
    if (!cid) {
        if (link->is<std::nullptr_t>()) {
            return nullptr;
        }
        throw CarError(
            ErrorKind::Structural,
            "MST subtree link must be a CID or null, got " + std::string(value_type_name(*link))
        );
    }
    auto it = blocks.find(cid->cid);
    if (it == blocks.end()) {
        return nullptr;
    }
    if (!visited.insert(cid->cid).second) {
        throw CarError(ErrorKind::Structural, "MST node " + cid->cid + " is linked more than once");
    }
    return &it->second;
}

static void merge_into(RecordSet& acc, RecordSet&& other) {
    for (auto& [key, cid] : other) {
        acc.insert_or_assign(key, std::move(cid));
    }
}

static RecordSet walk(
    const BlockMap& blocks,
    const Value& node,
    std::size_t depth,
    std::size_t max_depth,
    std::set<std::string>& visited
) {
    if (depth > max_depth) {
        throw CarError(
            ErrorKind::Structural, "MST deeper than " + std::to_string(max_depth) + " levels"
        );
    }
    const auto* fields = node.get_if<Map>();
    if (!fields) {
        throw CarError(
            ErrorKind::Structural,
            "MST node must be a map, got " + std::string(value_type_name(node))
        );
    }

    RecordSet records;
    if (const Value* left = linked_node(blocks, find_entry(*fields, "l"), visited)) {
        records = walk(blocks, *left, depth + 1, max_depth, visited);
    }

    const Value* entries_value = find_entry(*fields, "e");
    const auto* entries = entries_value ? entries_value->get_if<Array>() : nullptr;
    if (!entries) {
        throw CarError(ErrorKind::Structural, std::string("MST node has no entry array"));
    }

    Bytes prev_key;
    std::size_t index = 0;
    for (const auto& entry_value : *entries) {
        const auto* entry = entry_value.get_if<Map>();
        if (!entry) {
            throw CarError(
                ErrorKind::Structural, "MST entry " + std::to_string(index) + " is not a map"
            );
        }
        const Value* p = find_entry(*entry, "p");
        const Value* k = find_entry(*entry, "k");
        const Value* v = find_entry(*entry, "v");
        const auto* prefix_len = p ? p->get_if<std::uint64_t>() : nullptr;
        const auto* suffix = k ? k->get_if<Bytes>() : nullptr;
        const auto* value_cid = v ? v->get_if<CidLink>() : nullptr;
        if (!prefix_len || !suffix || !value_cid) {
            throw CarError(
                ErrorKind::Structural,
                "MST entry " + std::to_string(index) + " needs uint p, bytes k and link v"
            );
        }
        if (*prefix_len > prev_key.size()) {
            throw CarError(
                ErrorKind::Structural,
                "MST entry " + std::to_string(index) + " prefix length " + std::to_string(*prefix_len)
                    + " exceeds previous key length " + std::to_string(prev_key.size())
            );
        }

        Bytes key(prev_key.begin(), prev_key.begin() + static_cast<std::ptrdiff_t>(*prefix_len));
        key.insert(key.end(), suffix->begin(), suffix->end());
        prev_key = key;
        records.insert_or_assign(std::move(key), value_cid->cid);

        if (const Value* right = linked_node(blocks, find_entry(*entry, "t"), visited)) {
            merge_into(records, walk(blocks, *right, depth + 1, max_depth, visited));
        }
        index++;
    }
    return records;
}

RecordSet enumerate_mst_records(const BlockMap& blocks, const Value& node, std::size_t max_depth) {
    std::set<std::string> visited;
    return walk(blocks, node, 0, max_depth, visited);
}

static const std::string* optional_text(const Map& fields, std::string_view key) {
    const Value* v = find_entry(fields, key);
    return v ? v->get_if<std::string>() : nullptr;
}

RepoCommit read_repo_commit(const CarFile& car) {
    auto it = car.blocks.find(car.root);
    if (it == car.blocks.end()) {
        throw CarError(ErrorKind::Structural, "root block " + car.root + " is not in the archive");
    }
    const auto* fields = it->second.get_if<Map>();
    if (!fields) {
        throw CarError(ErrorKind::Structural, std::string("repo commit must be a map"));
    }

    const std::string* did = optional_text(*fields, "did");
    const Value* version = find_entry(*fields, "version");
    const Value* data = find_entry(*fields, "data");
    const auto* version_num = version ? version->get_if<std::uint64_t>() : nullptr;
    const auto* data_cid = data ? data->get_if<CidLink>() : nullptr;
    if (!did || !version_num || !data_cid) {
        throw CarError(
            ErrorKind::Structural, std::string("repo commit needs text did, uint version and link data")
        );
    }

    RepoCommit commit{};
    commit.did = *did;
    commit.version = *version_num;
    commit.data = data_cid->cid;
    if (const std::string* rev = optional_text(*fields, "rev")) {
        commit.rev = *rev;
    }
    if (const Value* prev = find_entry(*fields, "prev")) {
        if (const auto* prev_cid = prev->get_if<CidLink>()) {
            commit.prev = prev_cid->cid;
        }
    }
    return commit;
}

RecordSet enumerate_repo_records(const CarFile& car, std::size_t max_depth) {
    const RepoCommit commit = read_repo_commit(car);
    auto it = car.blocks.find(commit.data);
    if (it == car.blocks.end()) {
        throw CarError(ErrorKind::Structural, "MST root block " + commit.data + " is not in the archive");
    }
    return enumerate_mst_records(car.blocks, it->second, max_depth);
}
}  // namespace atp::car
