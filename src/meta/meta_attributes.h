/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta_byte_reader.h"
#include "meta_name_table.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nxm::meta {
enum class AttributeType : std::uint8_t {
    String = 0x01,
    UInt32 = 0x02,
    AltString = 0x03,
    Int32 = 0x05,
    Matrix = 0x06,
    UInt64 = 0x08,
};

std::optional<AttributeType> attribute_type_from_code(std::uint8_t code);

struct AttributeValue {
    using Storage =
        std::variant<std::string, std::uint32_t, std::int32_t, std::uint64_t, std::vector<float>>;

    Storage value;
    AttributeType type = AttributeType::String;

    static AttributeValue string(std::string s, AttributeType t = AttributeType::String);
    static AttributeValue uint32(std::uint32_t v);
    static AttributeValue int32(std::int32_t v);
    static AttributeValue uint64(std::uint64_t v);
    static AttributeValue matrix(std::vector<float> v);

    // Canonical text: decimal integers, matrix as "%.4f" values joined by ','.
    std::string to_text() const;
};

// Attribute name -> value in first-insertion order. Re-setting a name
// replaces the value in place.
class AttributeMap {
   public:
    using Entry = std::pair<std::string, AttributeValue>;

    void set(std::string name, AttributeValue value);
    const AttributeValue* find(std::string_view name) const;

    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }
    const std::vector<Entry>& entries() const { return _entries; }
    auto begin() const { return _entries.begin(); }
    auto end() const { return _entries.end(); }

   private:
    std::vector<Entry> _entries;
};

// "%.4f" per value joined by ','; any NaN prints as "nan".
std::string format_matrix(const std::vector<float>& values);

// Inverse of format_matrix up to its precision. Throws std::invalid_argument.
std::vector<float> parse_matrix_text(std::string_view text);

// True when parse_matrix_text(format_matrix(values)) gives back the same bits.
bool matrix_text_is_exact(const std::vector<float>& values);

// Rebuilds a typed value from its to_text() form. Throws std::invalid_argument
// when the text does not fit the type.
AttributeValue attribute_from_text(AttributeType type, std::string_view text);

AttributeValue decode_attribute_value(ByteReader& reader, std::uint8_t type_code);

// One attribute block per tag, each closed by the 01 00 terminator.
std::vector<AttributeMap> decode_attribute_blocks(
    ByteReader& reader,
    const NameTable& attribute_names,
    std::size_t tag_count
);
}  // namespace nxm::meta
