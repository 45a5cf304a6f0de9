/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "common.h"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    bool minimal = false;
    bool write_blocks = false;
    bool strict = false;
    bool debug = false;
    std::size_t max_depth = 64;
};

static void print_usage() {
    ATP_LOG_INFO(
        "Usage:\n" \
        "    car_parser <file-or-dir> [--minimal] [--blocks] [--strict] [--max-depth <n>] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a .car file or directory\n" \
        "    --minimal         writes only key -> CID and skips the metadata .json\n" \
        "    --blocks          also writes every decoded block to <name>_blocks.json\n" \
        "    --strict          rejects non-minimal integers and unsorted map keys\n" \
        "    --max-depth <n>   nesting limit for DAG-CBOR values and MST recursion (default 64)\n" \
        "    --debug           enables extra logging\n"
    );
}

static void write_outputs(
    const fs::path& out_json_dir,
    const std::string& base,
    const atp::car::DecodeResult& res,
    const Settings& settings
) {
    const std::string suffix = settings.minimal ? "_minimal" : "";
    const fs::path json_path = out_json_dir / (base + suffix + std::string(".json"));
    atp::fs_utils::write_text_file(json_path, res.records_json.dump(2));
    ATP_LOG_INFO("Wrote: %s", json_path.string().c_str());

    if (settings.write_blocks) {
        const fs::path blocks_path = out_json_dir / (base + std::string("_blocks.json"));
        atp::fs_utils::write_text_file(blocks_path, res.blocks_json.dump(2));
        ATP_LOG_INFO("Wrote: %s", blocks_path.string().c_str());
    }

    if (settings.minimal) {
        return;
    }
    const fs::path meta_path = out_json_dir / (base + std::string("_metadata.json"));
    atp::fs_utils::write_text_file(meta_path, res.metadata.dump(2));
    ATP_LOG_INFO("Wrote: %s", meta_path.string().c_str());
}

static bool process_file(const fs::path& path, const fs::path& out_json_dir, const Settings& settings) {
    if (!atp::fs_utils::is_car_file(path)) {
        ATP_LOG_WARN("Skipped: %s (not a .car file)", path.string().c_str());
        return true;
    }

    const std::string base = path.stem().string();
    try {
        atp::car::ParserDecodeOptions opt{};
        opt.max_depth = settings.max_depth;
        opt.strict = settings.strict;
        opt.with_values = !settings.minimal;
        opt.collect_blocks = settings.write_blocks;
        opt.debug = settings.debug;
        const auto res = atp::car::CarParser::DecodeCarFile(path, opt);
        write_outputs(out_json_dir, base, res, settings);
        return true;
    } catch (const std::exception& e) {
        ATP_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
    }
    return false;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        ATP_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--minimal") {
            settings.minimal = true;
            continue;
        }
        if (arg == "--blocks") {
            settings.write_blocks = true;
            continue;
        }
        if (arg == "--strict") {
            settings.strict = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                ATP_LOG_ERROR("Missing value for --max-depth");
                return 2;
            }
            const std::string value = argv[++i];
            char* end = nullptr;
            const unsigned long long depth = std::strtoull(value.c_str(), &end, 10);
            if (value.empty() || end == nullptr || *end != '\0' || depth == 0) {
                ATP_LOG_ERROR("Invalid value for --max-depth: %s", value.c_str());
                return 2;
            }
            settings.max_depth = static_cast<std::size_t>(depth);
            continue;
        }
        ATP_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::exists(input)) {
        ATP_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path exe_dir = atp::fs_utils::executable_dir();
    const fs::path out_root = exe_dir / "output";
    const fs::path out_json_dir = out_root / "json";
    atp::fs_utils::ensure_dir(out_json_dir);

    if (fs::is_directory(input)) {
        const auto inputs = atp::fs_utils::collect_inputs(input);
        std::size_t failed = 0;
        for (const auto& p : inputs) {
            if (!process_file(p, out_json_dir, settings)) {
                failed++;
            }
        }
        if (failed != 0) {
            ATP_LOG_WARN("%zu of %zu archives failed to decode", failed, inputs.size());
        } else if (settings.debug) {
            ATP_LOG_INFO("Processed %zu archives", inputs.size());
        }
        return 0;
    }

    process_file(input, out_json_dir, settings);
    return 0;
}
