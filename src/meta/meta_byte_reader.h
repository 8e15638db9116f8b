/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta_errors.h"

#include <cstdint>
#include <cstring>
#include <span>
#include <string>

namespace nxm::meta {
namespace detail {
inline void require_size(std::span<const std::uint8_t> bytes, std::size_t need) {
    if (bytes.size() != need) {
        throw FormatError(
            std::to_string(need) + " byte needed, " + std::to_string(bytes.size()) + " given."
        );
    }
}

inline std::uint64_t load_le(std::span<const std::uint8_t> bytes) {
    std::uint64_t v = 0;
    for (std::size_t i = bytes.size(); i > 0; i--) {
        v = (v << 8) | static_cast<std::uint64_t>(bytes[i - 1]);
    }
    return v;
}
}  // namespace detail

// Fixed-width little-endian decoders. The span must hold exactly the width.
inline std::uint8_t read_u8(std::span<const std::uint8_t> bytes) {
    detail::require_size(bytes, 1);
    return bytes[0];
}

inline std::uint16_t read_u16(std::span<const std::uint8_t> bytes) {
    detail::require_size(bytes, 2);
    return static_cast<std::uint16_t>(detail::load_le(bytes));
}

inline std::uint32_t read_u32(std::span<const std::uint8_t> bytes) {
    detail::require_size(bytes, 4);
    return static_cast<std::uint32_t>(detail::load_le(bytes));
}

inline std::int32_t read_i32(std::span<const std::uint8_t> bytes) {
    return static_cast<std::int32_t>(read_u32(bytes));
}

inline std::uint64_t read_u64(std::span<const std::uint8_t> bytes) {
    detail::require_size(bytes, 8);
    return detail::load_le(bytes);
}

inline float read_f32(std::span<const std::uint8_t> bytes) {
    const std::uint32_t bits = read_u32(bytes);
    float f = 0.0f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    std::span<const std::uint8_t> take(std::size_t n) {
        if (n > remaining()) {
            throw FormatError(
                "Unexpected end of data: " + std::to_string(n) + " byte needed, "
                    + std::to_string(remaining()) + " left at offset " + std::to_string(_pos),
                _pos
            );
        }
        const auto out = _data.subspan(_pos, n);
        _pos += n;
        return out;
    }

    void skip(std::size_t n) { take(n); }

    void seek(std::size_t pos) {
        if (pos > _data.size()) {
            throw FormatError("Seek past end of data: " + std::to_string(pos), _pos);
        }
        _pos = pos;
    }

    std::uint8_t read_u8() { return meta::read_u8(take(1)); }
    std::uint16_t read_u16() { return meta::read_u16(take(2)); }
    std::uint32_t read_u32() { return meta::read_u32(take(4)); }
    std::int32_t read_i32() { return meta::read_i32(take(4)); }
    std::uint64_t read_u64() { return meta::read_u64(take(8)); }
    float read_f32() { return meta::read_f32(take(4)); }

    // Base-128 little-endian varint. Any number of continuation bytes is
    // accepted; groups past bit 63 are consumed and dropped.
    std::uint64_t read_varint() {
        const std::size_t start = _pos;
        std::uint64_t value = 0;
        int shift = 0;
        while (true) {
            if (at_end()) {
                throw FormatError(
                    "Unexpected end of data inside varint starting at offset "
                        + std::to_string(start),
                    _pos
                );
            }
            const std::uint8_t b = _data[_pos++];
            if (shift < 64) {
                value |= static_cast<std::uint64_t>(b & 0x7Fu) << shift;
            }
            if ((b & 0x80u) == 0) {
                return value;
            }
            shift += 7;
        }
    }

    // Bytes up to the next zero byte; the terminator is consumed, not returned.
    std::span<const std::uint8_t> read_cstring() {
        const std::size_t start = _pos;
        std::size_t end = start;
        while (end < _data.size() && _data[end] != 0) {
            end++;
        }
        if (end >= _data.size()) {
            throw FormatError(
                "Unterminated string at offset " + std::to_string(start), _data.size()
            );
        }
        _pos = end + 1;
        return _data.subspan(start, end - start);
    }

   private:
    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace nxm::meta
