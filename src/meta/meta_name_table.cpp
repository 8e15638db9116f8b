/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "meta/meta_name_table.h"

#include <algorithm>

namespace nxm::meta {
const std::string& NameTable::at(std::uint64_t id, std::string_view table_label) const {
    if (id >= names.size()) {
        throw FormatError(
            std::string(table_label) + " id " + std::to_string(id) + " out of range (table has "
            + std::to_string(names.size()) + " entries)"
        );
    }
    return names[static_cast<std::size_t>(id)];
}

bool is_valid_utf8(std::span<const std::uint8_t> bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::uint8_t b0 = bytes[i];
        if (b0 < 0x80u) {
            i++;
            continue;
        }

        int extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((b0 & 0xE0u) == 0xC0u) {
            extra = 1;
            cp = b0 & 0x1Fu;
            min_cp = 0x80u;
        } else if ((b0 & 0xF0u) == 0xE0u) {
            extra = 2;
            cp = b0 & 0x0Fu;
            min_cp = 0x800u;
        } else if ((b0 & 0xF8u) == 0xF0u) {
            extra = 3;
            cp = b0 & 0x07u;
            min_cp = 0x10000u;
        } else {
            return false;
        }

        if (i + static_cast<std::size_t>(extra) >= bytes.size()) {
            return false;
        }
        for (int k = 1; k <= extra; k++) {
            const std::uint8_t bk = bytes[i + static_cast<std::size_t>(k)];
            if ((bk & 0xC0u) != 0x80u) {
                return false;
            }
            cp = (cp << 6) | (bk & 0x3Fu);
        }
        if (cp < min_cp || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
            return false;
        }
        i += static_cast<std::size_t>(extra) + 1;
    }
    return true;
}

std::string decode_utf8(std::span<const std::uint8_t> raw, std::size_t offset) {
    if (!is_valid_utf8(raw)) {
        throw EncodingError(
            "Could not decode UTF-8 text at offset " + std::to_string(offset), raw, offset
        );
    }
    return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
}

NameTable read_name_table(ByteReader& reader) {
    const std::uint64_t count = reader.read_varint();

    NameTable table{};
    // every name needs at least its terminator
    table.names.reserve(
        static_cast<std::size_t>(std::min<std::uint64_t>(count, reader.remaining()))
    );
    for (std::uint64_t i = 0; i < count; i++) {
        const std::size_t start = reader.position();
        std::span<const std::uint8_t> raw;
        try {
            raw = reader.read_cstring();
        } catch (const FormatError&) {
            const auto tail = reader.take(reader.remaining());
            throw EncodingError(
                "Unexpected end of data in name " + std::to_string(i) + " of "
                    + std::to_string(count),
                tail, start
            );
        }
        table.names.push_back(decode_utf8(raw, start));
    }
    return table;
}
}  // namespace nxm::meta
