/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta/meta_tree.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nxm {

struct ParserDecodeOptions {
    bool emit_xml = true;
    bool keep_name_tables = false;
    std::optional<std::string> rotor_key;
    bool debug = false;
};

struct DecodeResult {
    nlohmann::ordered_json forest = nlohmann::ordered_json::array();
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
    std::string xml;
    std::vector<std::uint8_t> meta_payload;
};

struct ParserEncodeOptions {
    bool debug = false;
};

struct EncodeResult {
    std::vector<std::uint8_t> meta_bytes;
};

class MetaParser {
   public:
    static DecodeResult
    DecodeMetaFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeMetaBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );
    static DecodeResult DecodeRotorBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );

    // `metadata` is the decoder's metadata block. Its "attributeTypes" restore
    // each attribute's type code; without it types are inferred from JSON values.
    static EncodeResult EncodeJsonToMeta(
        const nlohmann::ordered_json& forest,
        const nlohmann::ordered_json& metadata = nlohmann::ordered_json::object(),
        const ParserEncodeOptions& opt = {},
        std::string_view label = {}
    );

    static nlohmann::ordered_json ForestToJson(const meta::ElementForest& forest);
    static meta::ElementForest ForestFromJson(
        const nlohmann::ordered_json& forest,
        const nlohmann::ordered_json& metadata = nlohmann::ordered_json::object(),
        std::string_view label = {}
    );
};

}  // namespace nxm
