/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "meta/meta_file.h"
#include "meta/meta_byte_reader.h"

#include <algorithm>
#include <string>

namespace nxm::meta {
static bool contains_marker(std::span<const std::uint8_t> bytes, std::string_view marker) {
    const auto it = std::search(
        bytes.begin(), bytes.end(), marker.begin(), marker.end(),
        [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); }
    );
    return it != bytes.end();
}

bool is_meta_blob(std::span<const std::uint8_t> bytes) {
    return bytes.size() >= kMetaMagic.size()
           && std::equal(kMetaMagic.begin(), kMetaMagic.end(), bytes.begin());
}

std::string_view detect_meta_kind(std::span<const std::uint8_t> bytes) {
    if (contains_marker(bytes, "Material")) {
        return "mtg";
    }
    if (contains_marker(bytes, "GisFiles")) {
        return "gim";
    }
    if (contains_marker(bytes, "Anim")) {
        return "ags";
    }
    return "unknown1";
}

MetaDocument parse_meta(std::span<const std::uint8_t> bytes) {
    if (!is_meta_blob(bytes)) {
        throw FormatError(std::string("Invalid file format (bad magic)"), 0);
    }

    ByteReader reader(bytes);
    MetaDocument doc{};
    doc.header.magic = reader.read_u32();
    doc.header.file_size = reader.read_u64();

    doc.element_names = read_name_table(reader);
    doc.attribute_names = read_name_table(reader);
    doc.header.attributes_offset = reader.read_u64();

    const std::uint64_t tag_count = reader.read_varint();
    // two varint bytes per tag at minimum
    doc.tags.reserve(
        static_cast<std::size_t>(std::min<std::uint64_t>(tag_count, reader.remaining() / 2))
    );
    for (std::uint64_t i = 0; i < tag_count; i++) {
        const std::uint64_t element_id = reader.read_varint();
        const std::uint64_t child_count = reader.read_varint();
        doc.tags.push_back(TagRecord{doc.element_names.at(element_id, "Element name"), child_count});
    }

    doc.attributes_start = reader.position();
    doc.attributes = decode_attribute_blocks(reader, doc.attribute_names, doc.tags.size());
    doc.end_offset = reader.position();
    return doc;
}

ElementForest decode_meta_forest(std::span<const std::uint8_t> bytes) {
    MetaDocument doc = parse_meta(bytes);
    return build_forest(doc.tags, std::move(doc.attributes));
}
}  // namespace nxm::meta
