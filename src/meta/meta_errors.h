/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace nxm::meta {
// Malformed container data. Fatal for the current decode.
class FormatError : public std::runtime_error {
   public:
    explicit FormatError(const std::string& what) : std::runtime_error(what) {}
    FormatError(const std::string& what, std::size_t offset)
        : std::runtime_error(what), _offset(offset) {}

    std::optional<std::size_t> offset() const { return _offset; }

   private:
    std::optional<std::size_t> _offset;
};

// Text field that is not valid UTF-8 (or ends before its terminator).
class EncodingError : public std::runtime_error {
   public:
    EncodingError(const std::string& what, std::span<const std::uint8_t> raw, std::size_t offset)
        : std::runtime_error(what + " (bytes: " + hex_of(raw) + ")"),
          _raw(raw.begin(), raw.end()),
          _offset(offset) {}

    const std::vector<std::uint8_t>& raw_bytes() const { return _raw; }
    std::size_t offset() const { return _offset; }

   private:
    static std::string hex_of(std::span<const std::uint8_t> bytes) {
        static const char hexdig[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (const auto b : bytes) {
            out.push_back(hexdig[(b >> 4) & 0xFu]);
            out.push_back(hexdig[b & 0xFu]);
        }
        return out;
    }

    std::vector<std::uint8_t> _raw;
    std::size_t _offset = 0;
};
}  // namespace nxm::meta
