/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta_byte_reader.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nxm::meta {
struct NameTable {
    std::vector<std::string> names;

    std::size_t size() const { return names.size(); }
    bool empty() const { return names.empty(); }

    // Throws FormatError for ids outside the table.
    const std::string& at(std::uint64_t id, std::string_view table_label) const;
};

bool is_valid_utf8(std::span<const std::uint8_t> bytes);

// Copies raw bytes into a string, throwing EncodingError if they are not UTF-8.
std::string decode_utf8(std::span<const std::uint8_t> raw, std::size_t offset);

// Varint count followed by that many null-terminated UTF-8 names.
NameTable read_name_table(ByteReader& reader);
}  // namespace nxm::meta
