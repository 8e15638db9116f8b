/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta_attributes.h"
#include "meta_name_table.h"
#include "meta_tree.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace nxm::meta {
inline constexpr std::array<std::uint8_t, 4> kMetaMagic = {0xC1, 0x59, 0x41, 0x0D};

// The attributes offset is counted from the end of magic + file size.
inline constexpr std::size_t kAttributesOffsetBase = 12;

struct MetaHeader {
    std::uint32_t magic = 0;
    std::uint64_t file_size = 0;
    std::uint64_t attributes_offset = 0;
};

struct MetaDocument {
    MetaHeader header{};
    NameTable element_names;
    NameTable attribute_names;
    std::vector<TagRecord> tags;
    std::vector<AttributeMap> attributes;

    std::size_t attributes_start = 0;
    std::size_t end_offset = 0;
};

bool is_meta_blob(std::span<const std::uint8_t> bytes);

// Asset kind guessed from marker strings: "mtg", "gim", "ags" or "unknown1".
std::string_view detect_meta_kind(std::span<const std::uint8_t> bytes);

MetaDocument parse_meta(std::span<const std::uint8_t> bytes);

ElementForest decode_meta_forest(std::span<const std::uint8_t> bytes);
}  // namespace nxm::meta
