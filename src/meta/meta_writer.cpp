/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "meta/meta_writer.h"
#include "meta/meta_file.h"

#include <cstring>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>

namespace nxm::meta {
namespace {
void write_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

void write_u64_le(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

void patch_u64_le(std::vector<std::uint8_t>& out, std::size_t off, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out[off + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

void write_cstring(std::vector<std::uint8_t>& out, const std::string& s) {
    if (s.find('\0') != std::string::npos) {
        throw std::runtime_error("Embedded NUL in string: " + s);
    }
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
}

class NameIndex {
   public:
    std::size_t intern(const std::string& name) {
        const auto it = _ids.find(name);
        if (it != _ids.end()) {
            return it->second;
        }
        _names.push_back(name);
        _ids.emplace(name, _names.size() - 1);
        return _names.size() - 1;
    }

    std::size_t id(const std::string& name) const { return _ids.at(name); }
    const std::vector<std::string>& names() const { return _names; }

   private:
    std::vector<std::string> _names;
    std::unordered_map<std::string, std::size_t> _ids;
};

void write_value(std::vector<std::uint8_t>& out, const AttributeValue& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                write_cstring(out, v);
            } else if constexpr (std::is_same_v<T, std::uint32_t>) {
                write_u32_le(out, v);
            } else if constexpr (std::is_same_v<T, std::int32_t>) {
                write_u32_le(out, static_cast<std::uint32_t>(v));
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                write_u64_le(out, v);
            } else {
                write_u32_le(out, static_cast<std::uint32_t>(v.size()));
                for (const float f : v) {
                    std::uint32_t bits = 0;
                    std::memcpy(&bits, &f, sizeof(bits));
                    write_u32_le(out, bits);
                }
            }
        },
        value.value
    );
}
}  // namespace

void write_varint(std::vector<std::uint8_t>& out, std::uint64_t v) {
    while (v >= 0x80u) {
        out.push_back(static_cast<std::uint8_t>((v & 0x7Fu) | 0x80u));
        v >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(v));
}

std::vector<std::uint8_t> write_meta(const ElementForest& forest) {
    const auto order = forest.stream_order();

    NameIndex elements;
    NameIndex attributes;
    for (const auto idx : order) {
        const auto& n = forest.node(idx);
        elements.intern(n.name);
        if (n.attributes.size() > 0xFFu) {
            throw std::runtime_error(
                "Element '" + n.name + "' has more than 255 attributes"
            );
        }
        for (const auto& [name, value] : n.attributes) {
            attributes.intern(name);
        }
    }
    if (attributes.names().size() > 0x100u) {
        throw std::runtime_error("More than 256 distinct attribute names");
    }

    std::vector<std::uint8_t> out;
    out.insert(out.end(), kMetaMagic.begin(), kMetaMagic.end());
    const std::size_t file_size_at = out.size();
    write_u64_le(out, 0);

    write_varint(out, elements.names().size());
    for (const auto& s : elements.names()) {
        write_cstring(out, s);
    }
    write_varint(out, attributes.names().size());
    for (const auto& s : attributes.names()) {
        write_cstring(out, s);
    }

    const std::size_t attr_offset_at = out.size();
    write_u64_le(out, 0);

    write_varint(out, order.size());
    for (const auto idx : order) {
        const auto& n = forest.node(idx);
        write_varint(out, elements.id(n.name));
        write_varint(out, n.children.size());
    }

    const std::size_t attributes_start = out.size();
    for (const auto idx : order) {
        const auto& n = forest.node(idx);
        out.push_back(static_cast<std::uint8_t>(n.attributes.size()));
        for (const auto& [name, value] : n.attributes) {
            out.push_back(static_cast<std::uint8_t>(attributes.id(name)));
            out.push_back(static_cast<std::uint8_t>(value.type));
            write_value(out, value);
        }
        out.push_back(0x01);
        out.push_back(0x00);
    }

    patch_u64_le(out, file_size_at, out.size());
    patch_u64_le(out, attr_offset_at, attributes_start - kAttributesOffsetBase);
    return out;
}
}  // namespace nxm::meta
