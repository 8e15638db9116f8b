/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "fs_utils.h"

#include <array>
#include <fstream>
#include <stdexcept>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace nxm::fs_utils {
fs::path executable_dir() {
#if defined(_WIN32)
    std::wstring buf(32768, L'\0');
    const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    if (n == 0 || n >= buf.size()) {
        return fs::current_path();
    }
    buf.resize(n);
    return fs::path(buf).parent_path();
#else
    std::array<char, 4096> buf{};
    const ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
    if (n <= 0) {
        return fs::current_path();
    }
    return fs::path(std::string(buf.data(), static_cast<std::size_t>(n))).parent_path();
#endif
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat " + path.string() + ": " + ec.message());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
    if (!buf.empty()
        && !f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()))) {
        throw std::runtime_error(
            "Short read: " + path.string() + " (" + std::to_string(f.gcount()) + " of "
            + std::to_string(buf.size()) + " bytes)"
        );
    }
    return buf;
}

void write_file(const fs::path& path, std::span<const std::uint8_t> bytes) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

void write_text_file(const fs::path& path, std::string_view text) {
    write_file(path, {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()});
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error(
            "Failed to create directory: " + dir.string() + " (" + ec.message() + ")"
        );
    }
}

fs::path output_file(
    const fs::path& root,
    std::string_view kind,
    const std::string& stem,
    std::string_view suffix
) {
    return root / fs::path(kind) / (stem + std::string(suffix));
}

bool is_json_input(const fs::path& path) {
    std::string ext = path.extension().string();
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return ext == ".json";
}

bool is_metadata_json(const fs::path& path) {
    static constexpr std::string_view kSuffix = "_metadata";
    if (!is_json_input(path)) {
        return false;
    }
    const std::string stem = path.stem().string();
    return stem.size() >= kSuffix.size()
           && stem.compare(stem.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0;
}

fs::path metadata_path_for(const fs::path& json_path) {
    return json_path.parent_path() / (json_path.stem().string() + "_metadata.json");
}
}  // namespace nxm::fs_utils
