/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta_tree.h"

#include <cstdint>
#include <string>
#include <vector>

namespace nxm::meta {
void write_varint(std::vector<std::uint8_t>& out, std::uint64_t v);

// Serializes a forest into a meta blob. Element and attribute names are
// deduplicated in stream order; values keep their type codes.
std::vector<std::uint8_t> write_meta(const ElementForest& forest);
}  // namespace nxm::meta
