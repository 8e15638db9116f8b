/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta_tree.h"

#include <string>
#include <string_view>

namespace nxm::meta {
std::string escape_xml_attribute(std::string_view text);

// Each root as an indented XML document (4 spaces per level), one after another.
std::string write_xml(const ElementForest& forest);
}  // namespace nxm::meta
