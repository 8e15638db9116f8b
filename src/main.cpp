/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "common.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    bool write_json = true;
    bool write_xml = false;
    bool minimal = false;
    bool keep_names = false;
    bool debug = false;
    bool quiet = false;
    std::optional<std::string> rotor_key;
};

static void print_usage() {
    NXM_LOG_INFO(
        "Usage:\n" \
        "    nxm_parser <file>... [--xml] [--no-json] [--minimal] [--names] [--key <key>] [--quiet] [--debug]\n" \
        "    nxm_parser --hash <name>...\n\n" \
        "Options:\n" \
        "    Inputs are meta blobs, rotor-wrapped NPK entries, or .json forests to encode\n" \
        "    A .json forest is re-encoded with the types in its <name>_metadata.json\n" \
        "    --xml         writes the decoded forest as .xml\n" \
        "    --no-json     skips the .json forest output\n" \
        "    --minimal     skips the _metadata.json output\n" \
        "    --names       keeps element/attribute name tables in metadata .json\n" \
        "    --key         rotor key for wrapped entries (default: built-in NPK key)\n" \
        "    --hash        prints the mesh hash of each name and exits\n" \
        "    --quiet       only logs warnings and errors\n" \
        "    --debug       enables extra logging\n"
    );
}

static void write_outputs(
    const fs::path& out_root,
    const std::string& base,
    const nxm::DecodeResult& res,
    const Settings& settings
) {
    if (settings.write_json) {
        const fs::path json_path = nxm::fs_utils::output_file(out_root, "json", base, ".json");
        nxm::fs_utils::write_text_file(json_path, res.forest.dump(2));
        NXM_LOG_INFO("Wrote: %s", json_path.string().c_str());
    }
    if (settings.write_xml) {
        const fs::path xml_path = nxm::fs_utils::output_file(out_root, "xml", base, ".xml");
        nxm::fs_utils::write_text_file(xml_path, res.xml);
        NXM_LOG_INFO("Wrote: %s", xml_path.string().c_str());
    }
    if (settings.minimal || !res.metadata.is_object() || res.metadata.empty()) {
        return;
    }
    const fs::path meta_path =
        nxm::fs_utils::output_file(out_root, "json", base, "_metadata.json");
    nxm::fs_utils::write_text_file(meta_path, res.metadata.dump(2));
    NXM_LOG_INFO("Wrote: %s", meta_path.string().c_str());
}

static nlohmann::ordered_json read_json_file(const fs::path& path, bool debug) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto bytes = nxm::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    const auto text = std::string(bytes.begin(), bytes.end());
    auto json = nlohmann::ordered_json::parse(text);
    const auto t1 = std::chrono::steady_clock::now();
    if (debug) {
        const auto parse_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        NXM_LOG_INFO(
            "JSON read %s: bytes=%zu parse=%lldms", path.string().c_str(), bytes.size(),
            static_cast<long long>(parse_ms)
        );
    }
    return json;
}

static bool process_file(const fs::path& path, const fs::path& out_root, const Settings& settings) {
    if (nxm::fs_utils::is_metadata_json(path)) {
        NXM_LOG_INFO("Skipped: %s", path.string().c_str());
        return true;
    }

    const std::string base = path.stem().string();
    try {
        if (nxm::fs_utils::is_json_input(path)) {
            const auto forest = read_json_file(path, settings.debug);
            const fs::path types_path = nxm::fs_utils::metadata_path_for(path);
            auto metadata = nlohmann::ordered_json::object();
            if (fs::exists(types_path)) {
                metadata = read_json_file(types_path, settings.debug);
            } else {
                NXM_LOG_WARN(
                    "%s: no %s, attribute types are inferred from JSON values",
                    path.string().c_str(), types_path.filename().string().c_str()
                );
            }
            nxm::ParserEncodeOptions opt{};
            opt.debug = settings.debug;
            const auto res = nxm::MetaParser::EncodeJsonToMeta(forest, metadata, opt, base);
            const fs::path meta_path = nxm::fs_utils::output_file(out_root, "meta", base, ".meta");
            nxm::fs_utils::write_file(meta_path, res.meta_bytes);
            NXM_LOG_INFO("Wrote: %s", meta_path.string().c_str());
            return true;
        }

        nxm::ParserDecodeOptions opt{};
        opt.emit_xml = settings.write_xml;
        opt.keep_name_tables = settings.keep_names;
        opt.rotor_key = settings.rotor_key;
        opt.debug = settings.debug;
        const auto res = nxm::MetaParser::DecodeMetaFile(path, opt);
        write_outputs(out_root, base, res, settings);
        return true;
    } catch (const std::exception& e) {
        NXM_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
        return false;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    if (std::string_view(argv[1]) == "--hash") {
        if (argc < 3) {
            NXM_LOG_ERROR("Missing value for --hash");
            return 2;
        }
        for (int i = 2; i < argc; i++) {
            NXM_LOG_INFO("%08X  %s", nxm::crypto::mesh_hash(argv[i]), argv[i]);
        }
        return 0;
    }

    Settings settings;
    std::vector<fs::path> inputs;
    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--xml") {
            settings.write_xml = true;
            continue;
        }
        if (arg == "--no-json") {
            settings.write_json = false;
            continue;
        }
        if (arg == "--minimal") {
            settings.minimal = true;
            continue;
        }
        if (arg == "--names") {
            settings.keep_names = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--quiet") {
            settings.quiet = true;
            continue;
        }
        if (arg == "--key") {
            if (i + 1 >= argc) {
                NXM_LOG_ERROR("Missing value for --key");
                return 2;
            }
            settings.rotor_key = std::string(argv[++i]);
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            NXM_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
            return 2;
        }
        inputs.emplace_back(std::string(arg));
    }

    nxm::log::set_quiet(settings.quiet);
    if (inputs.empty()) {
        NXM_LOG_ERROR("No input files given.");
        print_usage();
        return 2;
    }

    const fs::path out_root = nxm::fs_utils::executable_dir() / "output";
    int failures = 0;
    for (const auto& input : inputs) {
        if (!fs::is_regular_file(input)) {
            NXM_LOG_ERROR("Input is not a file: %s", input.string().c_str());
            failures++;
            continue;
        }
        if (!process_file(input, out_root, settings)) {
            failures++;
        }
    }
    return failures == 0 ? 0 : 2;
}
