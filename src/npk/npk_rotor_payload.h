/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nxm::npk {
inline constexpr std::size_t kReversedXorSpan = 128;
inline constexpr std::uint8_t kReversedXorKey = 0x9A;

// Entries wrapped by the rotor layer start with 1D 04 or 15 23.
bool is_rotor_payload(std::span<const std::uint8_t> bytes);

// Key the NPK loader uses for rotor-wrapped entries.
const std::string& default_rotor_key();

std::vector<std::uint8_t> zlib_inflate(std::span<const std::uint8_t> src);

// XORs the first 128 bytes with 0x9A, then reverses the whole buffer.
void unscramble_tail(std::vector<std::uint8_t>& data);

// Rotor decrypt -> zlib inflate -> unscramble.
std::vector<std::uint8_t>
unpack_rotor_payload(std::span<const std::uint8_t> bytes, std::string_view key);
}  // namespace nxm::npk
