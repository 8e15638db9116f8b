/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nxm::fs_utils {
std::filesystem::path executable_dir();

// Whole file; throws on open failure or a short read.
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);

// Parent directories are created as needed.
void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
void write_text_file(const std::filesystem::path& path, std::string_view text);
void ensure_dir(const std::filesystem::path& dir);

// <root>/<kind>/<stem><suffix>, e.g. output/json/foo_metadata.json
std::filesystem::path output_file(
    const std::filesystem::path& root,
    std::string_view kind,
    const std::string& stem,
    std::string_view suffix
);

// Case-insensitive ".json" extension check.
bool is_json_input(const std::filesystem::path& path);

// "<stem>_metadata.json", the companion file written next to each forest.
bool is_metadata_json(const std::filesystem::path& path);
std::filesystem::path metadata_path_for(const std::filesystem::path& json_path);
}  // namespace nxm::fs_utils
