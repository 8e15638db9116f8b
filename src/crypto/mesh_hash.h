/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nxm::crypto {
// Lower-cases ASCII letters, drops bytes >= 0x80.
std::string normalize_hash_input(std::string_view text);

// Zero-padded little-endian words of the normalized input plus the two sentinels.
std::vector<std::uint32_t> mesh_hash_words(std::string_view text);

// Case-insensitive 32-bit name hash used by NPK indexes. Not collision resistant.
std::uint32_t mesh_hash(std::string_view text);
}  // namespace nxm::crypto
