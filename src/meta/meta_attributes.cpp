/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "meta/meta_attributes.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace nxm::meta {
namespace {
constexpr std::uint8_t kBlockEnd0 = 0x01;
constexpr std::uint8_t kBlockEnd1 = 0x00;

std::string to_hex_u8(std::uint8_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02X", static_cast<unsigned>(v));
    return buf;
}

std::string read_string_value(ByteReader& reader) {
    const std::size_t start = reader.position();
    const auto raw = reader.read_cstring();
    return decode_utf8(raw, start);
}

std::vector<float> read_matrix_value(ByteReader& reader) {
    const std::uint32_t count = reader.read_u32();
    if (static_cast<std::uint64_t>(count) * 4u > reader.remaining()) {
        throw FormatError(
            "Matrix of " + std::to_string(count) + " floats exceeds remaining data at offset "
                + std::to_string(reader.position()),
            reader.position()
        );
    }
    std::vector<float> out;
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
        out.push_back(reader.read_f32());
    }
    return out;
}
}  // namespace

std::optional<AttributeType> attribute_type_from_code(std::uint8_t code) {
    switch (code) {
        case 0x01:
            return AttributeType::String;
        case 0x02:
            return AttributeType::UInt32;
        case 0x03:
            return AttributeType::AltString;
        case 0x05:
            return AttributeType::Int32;
        case 0x06:
            return AttributeType::Matrix;
        case 0x08:
            return AttributeType::UInt64;
        default:
            return std::nullopt;
    }
}

AttributeValue AttributeValue::string(std::string s, AttributeType t) {
    return AttributeValue{Storage(std::in_place_type<std::string>, std::move(s)), t};
}

AttributeValue AttributeValue::uint32(std::uint32_t v) {
    return AttributeValue{Storage(std::in_place_type<std::uint32_t>, v), AttributeType::UInt32};
}

AttributeValue AttributeValue::int32(std::int32_t v) {
    return AttributeValue{Storage(std::in_place_type<std::int32_t>, v), AttributeType::Int32};
}

AttributeValue AttributeValue::uint64(std::uint64_t v) {
    return AttributeValue{Storage(std::in_place_type<std::uint64_t>, v), AttributeType::UInt64};
}

AttributeValue AttributeValue::matrix(std::vector<float> v) {
    return AttributeValue{
        Storage(std::in_place_type<std::vector<float>>, std::move(v)), AttributeType::Matrix
    };
}

std::string format_matrix(const std::vector<float>& values) {
    std::string out;
    char buf[64];
    for (std::size_t i = 0; i < values.size(); i++) {
        if (i != 0) {
            out.push_back(',');
        }
        if (std::isnan(values[i])) {
            // glibc prints "-nan" for a set sign bit
            out += "nan";
            continue;
        }
        std::snprintf(buf, sizeof(buf), "%.4f", static_cast<double>(values[i]));
        out += buf;
    }
    return out;
}

std::vector<float> parse_matrix_text(std::string_view text) {
    std::vector<float> out;
    if (text.empty()) {
        return out;
    }
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = text.find(',', start);
        const std::string token(
            text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start)
        );
        char* end = nullptr;
        const float f = std::strtof(token.c_str(), &end);
        if (token.empty() || end != token.c_str() + token.size()) {
            throw std::invalid_argument("Invalid matrix component '" + token + "'");
        }
        out.push_back(f);
        if (comma == std::string_view::npos) {
            return out;
        }
        start = comma + 1;
    }
}

bool matrix_text_is_exact(const std::vector<float>& values) {
    const auto back = parse_matrix_text(format_matrix(values));
    return back.size() == values.size()
           && (values.empty()
               || std::memcmp(back.data(), values.data(), values.size() * sizeof(float)) == 0);
}

template <typename T>
static T parse_integer_text(std::string_view text, std::string_view kind) {
    T v{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw std::invalid_argument(
            "Invalid " + std::string(kind) + " value '" + std::string(text) + "'"
        );
    }
    return v;
}

AttributeValue attribute_from_text(AttributeType type, std::string_view text) {
    switch (type) {
        case AttributeType::String:
        case AttributeType::AltString:
            return AttributeValue::string(std::string(text), type);
        case AttributeType::UInt32:
            return AttributeValue::uint32(parse_integer_text<std::uint32_t>(text, "UInt32"));
        case AttributeType::Int32:
            return AttributeValue::int32(parse_integer_text<std::int32_t>(text, "Int32"));
        case AttributeType::UInt64:
            return AttributeValue::uint64(parse_integer_text<std::uint64_t>(text, "UInt64"));
        case AttributeType::Matrix:
            return AttributeValue::matrix(parse_matrix_text(text));
    }
    throw std::invalid_argument("Unhandled attribute type");
}

std::string AttributeValue::to_text() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::vector<float>>) {
                return format_matrix(v);
            } else {
                return std::to_string(v);
            }
        },
        value
    );
}

void AttributeMap::set(std::string name, AttributeValue value) {
    for (auto& e : _entries) {
        if (e.first == name) {
            e.second = std::move(value);
            return;
        }
    }
    _entries.emplace_back(std::move(name), std::move(value));
}

const AttributeValue* AttributeMap::find(std::string_view name) const {
    for (const auto& e : _entries) {
        if (e.first == name) {
            return &e.second;
        }
    }
    return nullptr;
}

AttributeValue decode_attribute_value(ByteReader& reader, std::uint8_t type_code) {
    const auto type = attribute_type_from_code(type_code);
    if (!type.has_value()) {
        throw FormatError(
            "Unknown data type code: " + to_hex_u8(type_code) + " at offset "
                + std::to_string(reader.position() - 1),
            reader.position() - 1
        );
    }

    switch (*type) {
        case AttributeType::String:
        case AttributeType::AltString:
            return AttributeValue::string(read_string_value(reader), *type);
        case AttributeType::UInt32:
            return AttributeValue::uint32(reader.read_u32());
        case AttributeType::Int32:
            return AttributeValue::int32(reader.read_i32());
        case AttributeType::Matrix:
            return AttributeValue::matrix(read_matrix_value(reader));
        case AttributeType::UInt64:
            return AttributeValue::uint64(reader.read_u64());
    }
    throw FormatError("Unhandled attribute type " + to_hex_u8(type_code));
}

std::vector<AttributeMap> decode_attribute_blocks(
    ByteReader& reader,
    const NameTable& attribute_names,
    std::size_t tag_count
) {
    std::vector<AttributeMap> out;
    out.reserve(tag_count);
    for (std::size_t tag = 0; tag < tag_count; tag++) {
        AttributeMap attrs;
        const std::uint8_t count = reader.read_u8();
        for (std::uint8_t i = 0; i < count; i++) {
            const std::uint8_t name_id = reader.read_u8();
            const std::uint8_t type_code = reader.read_u8();
            const std::string& name = attribute_names.at(name_id, "Attribute name");
            attrs.set(name, decode_attribute_value(reader, type_code));
        }

        const std::uint8_t end0 = reader.read_u8();
        const std::uint8_t end1 = reader.read_u8();
        if (end0 != kBlockEnd0 || end1 != kBlockEnd1) {
            throw FormatError(
                "Unexpected tag ending flag on offset: " + std::to_string(reader.position()),
                reader.position()
            );
        }
        out.push_back(std::move(attrs));
    }
    return out;
}
}  // namespace nxm::meta
