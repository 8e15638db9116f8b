/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nxm_parser.h"

#include "meta/meta_file.h"
#include "meta/meta_writer.h"
#include "meta/meta_xml_writer.h"
#include "npk/npk_rotor_payload.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <blake3.h>

#include <array>
#include <chrono>
#include <cstring>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>
#include <variant>

namespace nxm {

static std::string to_hex_bytes(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

static std::array<std::uint8_t, 32> blake3_hash32(std::span<const std::uint8_t> payload) {
    std::array<std::uint8_t, 32> out{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!payload.empty()) {
        blake3_hasher_update(&h, payload.data(), payload.size());
    }
    blake3_hasher_finalize(&h, out.data(), out.size());
    return out;
}

static long long elapsed_ms(
    std::chrono::steady_clock::time_point a,
    std::chrono::steady_clock::time_point b
) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count()
    );
}

static nlohmann::ordered_json node_to_json(const meta::ElementForest& forest, std::size_t idx) {
    const auto& n = forest.node(idx);
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["name"] = n.name;
    nlohmann::ordered_json attrs = nlohmann::ordered_json::object();
    for (const auto& [name, value] : n.attributes) {
        attrs[name] = value.to_text();
    }
    j["attributes"] = std::move(attrs);
    nlohmann::ordered_json children = nlohmann::ordered_json::array();
    for (const auto child : n.children) {
        children.push_back(node_to_json(forest, child));
    }
    j["children"] = std::move(children);
    return j;
}

static meta::AttributeValue
matrix_from_json_array(const nlohmann::ordered_json& v, const std::string& where) {
    std::vector<float> values;
    values.reserve(v.size());
    for (const auto& el : v) {
        if (!el.is_number()) {
            throw std::runtime_error("Matrix attribute holds a non-number at " + where);
        }
        values.push_back(el.get<float>());
    }
    return meta::AttributeValue::matrix(std::move(values));
}

static meta::AttributeValue
attribute_from_json(const nlohmann::ordered_json& v, const std::string& where) {
    if (v.is_string()) {
        return meta::AttributeValue::string(v.get<std::string>());
    }
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= std::numeric_limits<std::uint32_t>::max()) {
            return meta::AttributeValue::uint32(static_cast<std::uint32_t>(u));
        }
        return meta::AttributeValue::uint64(u);
    }
    if (v.is_number_integer()) {
        const auto s = v.get<std::int64_t>();
        if (s < std::numeric_limits<std::int32_t>::min()) {
            throw std::runtime_error("Integer attribute out of int32 range at " + where);
        }
        return meta::AttributeValue::int32(static_cast<std::int32_t>(s));
    }
    if (v.is_array()) {
        return matrix_from_json_array(v, where);
    }
    throw std::runtime_error("Unsupported attribute value at " + where + ": " + v.dump());
}

// Type codes from a metadata block, consumed one element at a time in
// depth-first order.
struct TypeHints {
    const nlohmann::ordered_json* types = nullptr;
    std::map<std::pair<std::size_t, std::string>, std::vector<float>> exact_matrices;
    std::size_t next = 0;
};

static std::uint32_t json_u32(const nlohmann::ordered_json& v, const char* what) {
    if (!v.is_number_unsigned()
        || v.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error(
            std::string("Metadata ") + what + " must be an unsigned 32-bit number"
        );
    }
    return v.get<std::uint32_t>();
}

static TypeHints read_type_hints(const nlohmann::ordered_json& metadata) {
    TypeHints hints{};
    if (!metadata.is_object() || !metadata.contains("attributeTypes")) {
        return hints;
    }
    const auto& types = metadata.at("attributeTypes");
    if (!types.is_array()) {
        throw std::runtime_error("Metadata \"attributeTypes\" must be an array");
    }
    for (const auto& entry : types) {
        if (!entry.is_object()) {
            throw std::runtime_error("Metadata \"attributeTypes\" entries must be objects");
        }
        for (const auto& kv : entry.items()) {
            const std::uint32_t code = json_u32(kv.value(), "type code");
            if (code > 0xFFu || !meta::attribute_type_from_code(static_cast<std::uint8_t>(code))) {
                throw std::runtime_error(
                    "Metadata lists unknown type code " + std::to_string(code) + " for '"
                    + kv.key() + "'"
                );
            }
        }
    }
    hints.types = &types;

    if (metadata.contains("exactMatrices")) {
        for (const auto& m : metadata.at("exactMatrices")) {
            if (!m.is_object() || !m.contains("element") || !m.contains("name")
                || !m.contains("bits") || !m.at("bits").is_array()) {
                throw std::runtime_error("Malformed \"exactMatrices\" entry: " + m.dump());
            }
            std::vector<float> values;
            for (const auto& b : m.at("bits")) {
                const std::uint32_t bits = json_u32(b, "matrix bits");
                float f = 0.0f;
                std::memcpy(&f, &bits, sizeof(f));
                values.push_back(f);
            }
            const auto element =
                static_cast<std::size_t>(json_u32(m.at("element"), "element index"));
            hints.exact_matrices[{element, m.at("name").get<std::string>()}] = std::move(values);
        }
    }
    return hints;
}

static meta::AttributeValue typed_attribute_from_json(
    const nlohmann::ordered_json& v,
    meta::AttributeType type,
    const std::vector<float>* exact,
    const std::string& where
) {
    if (type == meta::AttributeType::Matrix && v.is_array()) {
        return matrix_from_json_array(v, where);
    }
    if (exact != nullptr && v.is_string() && v.get<std::string>() == meta::format_matrix(*exact)) {
        return meta::AttributeValue::matrix(*exact);
    }

    std::string text;
    if (v.is_string()) {
        text = v.get<std::string>();
    } else if (v.is_number_integer()) {
        text = v.dump();
    } else {
        throw std::runtime_error(
            "Value " + v.dump() + " does not fit type code "
            + std::to_string(static_cast<int>(type)) + " at " + where
        );
    }
    try {
        return meta::attribute_from_text(type, text);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string(e.what()) + " at " + where);
    }
}

static std::size_t node_from_json(
    meta::ElementForest& forest,
    const nlohmann::ordered_json& j,
    TypeHints& hints,
    const std::string& where
) {
    if (!j.is_object() || !j.contains("name") || !j.at("name").is_string()) {
        throw std::runtime_error("Element without a string \"name\" at " + where);
    }
    const std::string name = j.at("name").get<std::string>();

    const nlohmann::ordered_json* types = nullptr;
    const std::size_t element = hints.next++;
    if (hints.types != nullptr) {
        if (element >= hints.types->size()) {
            throw std::runtime_error(
                "Metadata \"attributeTypes\" has fewer entries than the forest has elements at "
                + where
            );
        }
        types = &hints.types->at(element);
    }

    meta::AttributeMap attrs;
    if (j.contains("attributes")) {
        const auto& a = j.at("attributes");
        if (!a.is_object()) {
            throw std::runtime_error("\"attributes\" must be an object at " + where);
        }
        for (const auto& kv : a.items()) {
            const std::string attr_where = where + "/" + kv.key();
            if (types == nullptr || !types->contains(kv.key())) {
                attrs.set(kv.key(), attribute_from_json(kv.value(), attr_where));
                continue;
            }
            const auto type = *meta::attribute_type_from_code(
                static_cast<std::uint8_t>(types->at(kv.key()).get<std::uint32_t>())
            );
            const auto it = hints.exact_matrices.find({element, kv.key()});
            const std::vector<float>* exact =
                it == hints.exact_matrices.end() ? nullptr : &it->second;
            attrs.set(kv.key(), typed_attribute_from_json(kv.value(), type, exact, attr_where));
        }
    }

    const std::size_t idx = forest.add_node(name, std::move(attrs));
    if (j.contains("children")) {
        const auto& c = j.at("children");
        if (!c.is_array()) {
            throw std::runtime_error("\"children\" must be an array at " + where);
        }
        for (std::size_t i = 0; i < c.size(); i++) {
            const std::size_t child = node_from_json(
                forest, c.at(i), hints, where + "/" + name + "[" + std::to_string(i) + "]"
            );
            forest.add_child(idx, child);
        }
    }
    return idx;
}

nlohmann::ordered_json MetaParser::ForestToJson(const meta::ElementForest& forest) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto root : forest.roots()) {
        out.push_back(node_to_json(forest, root));
    }
    return out;
}

meta::ElementForest MetaParser::ForestFromJson(
    const nlohmann::ordered_json& forest,
    const nlohmann::ordered_json& metadata,
    std::string_view label
) {
    if (!forest.is_array()) {
        throw std::runtime_error("JSON root must be an array of elements for " + std::string(label));
    }
    TypeHints hints = read_type_hints(metadata);
    meta::ElementForest out;
    for (std::size_t i = 0; i < forest.size(); i++) {
        const std::size_t root = node_from_json(
            out, forest.at(i), hints, std::string(label) + "[" + std::to_string(i) + "]"
        );
        out.add_root(root);
    }
    if (hints.types != nullptr && hints.next != hints.types->size()) {
        throw std::runtime_error(
            "Metadata \"attributeTypes\" lists " + std::to_string(hints.types->size())
            + " elements, forest has " + std::to_string(hints.next)
        );
    }
    return out;
}

// Per element in depth-first order (the order ForestFromJson walks), the
// type code of each attribute. Matrices whose text loses bits are kept exactly.
static void collect_attribute_types(
    const meta::ElementForest& forest,
    std::size_t idx,
    nlohmann::ordered_json& types,
    nlohmann::ordered_json& exact
) {
    const auto& n = forest.node(idx);
    const std::size_t element = types.size();
    nlohmann::ordered_json entry = nlohmann::ordered_json::object();
    for (const auto& [name, value] : n.attributes) {
        entry[name] = static_cast<std::uint32_t>(value.type);
        if (value.type != meta::AttributeType::Matrix) {
            continue;
        }
        const auto& values = std::get<std::vector<float>>(value.value);
        if (meta::matrix_text_is_exact(values)) {
            continue;
        }
        nlohmann::ordered_json bits = nlohmann::ordered_json::array();
        for (const float f : values) {
            std::uint32_t b = 0;
            std::memcpy(&b, &f, sizeof(b));
            bits.push_back(b);
        }
        nlohmann::ordered_json m = nlohmann::ordered_json::object();
        m["element"] = element;
        m["name"] = name;
        m["bits"] = std::move(bits);
        exact.push_back(std::move(m));
    }
    types.push_back(std::move(entry));
    for (const auto child : n.children) {
        collect_attribute_types(forest, child, types, exact);
    }
}

static nlohmann::ordered_json build_metadata_block(
    const meta::MetaDocument& doc,
    const meta::ElementForest& forest,
    std::span<const std::uint8_t> bytes,
    bool keep_name_tables
) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out["magic"] = to_hex_bytes(bytes.first(meta::kMetaMagic.size()));
    out["fileSize"] = doc.header.file_size;
    out["attributesOffset"] = doc.header.attributes_offset;
    out["elementNameCount"] = doc.element_names.size();
    out["attributeNameCount"] = doc.attribute_names.size();
    out["tagCount"] = doc.tags.size();
    out["rootCount"] = forest.roots().size();
    out["kind"] = std::string(meta::detect_meta_kind(bytes));
    out["blake3"] = to_hex_bytes(blake3_hash32(bytes));
    if (doc.end_offset != bytes.size()) {
        out["trailingBytes"] = bytes.size() - doc.end_offset;
    }
    if (keep_name_tables) {
        out["elementNames"] = doc.element_names.names;
        out["attributeNames"] = doc.attribute_names.names;
    }

    nlohmann::ordered_json types = nlohmann::ordered_json::array();
    nlohmann::ordered_json exact = nlohmann::ordered_json::array();
    for (const auto root : forest.roots()) {
        collect_attribute_types(forest, root, types, exact);
    }
    out["attributeTypes"] = std::move(types);
    if (!exact.empty()) {
        out["exactMatrices"] = std::move(exact);
    }
    return out;
}

DecodeResult
MetaParser::DecodeMetaFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("Meta file is empty: " + path.string());
    }
    if (npk::is_rotor_payload(bytes)) {
        return DecodeRotorBytes(bytes, opt, path.filename().string());
    }
    return DecodeMetaBytes(bytes, opt, path.filename().string());
}

DecodeResult MetaParser::DecodeMetaBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    meta::MetaDocument doc = meta::parse_meta(bytes);
    const auto t1 = std::chrono::steady_clock::now();

    DecodeResult result{};
    const meta::ElementForest forest = meta::build_forest(doc.tags, std::move(doc.attributes));
    const auto t2 = std::chrono::steady_clock::now();

    result.forest = ForestToJson(forest);
    if (opt.emit_xml) {
        result.xml = meta::write_xml(forest);
    }
    result.metadata = build_metadata_block(doc, forest, bytes, opt.keep_name_tables);
    result.meta_payload.assign(bytes.begin(), bytes.end());
    if (doc.end_offset != bytes.size()) {
        NXM_LOG_WARN(
            "%s: %zu byte(s) after the last attribute block", std::string(label).c_str(),
            bytes.size() - doc.end_offset
        );
    }

    if (opt.debug) {
        NXM_LOG_INFO(
            "Decoded %s: bytes=%zu tags=%zu roots=%zu parse=%lldms tree=%lldms",
            std::string(label).c_str(), bytes.size(), doc.tags.size(), forest.roots().size(),
            elapsed_ms(t0, t1), elapsed_ms(t1, t2)
        );
    }
    return result;
}

DecodeResult MetaParser::DecodeRotorBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const std::string key = opt.rotor_key.value_or(npk::default_rotor_key());
    const auto t0 = std::chrono::steady_clock::now();
    const auto plain = npk::unpack_rotor_payload(bytes, key);
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        NXM_LOG_INFO(
            "Unpacked rotor payload %s: %zu -> %zu bytes in %lldms", std::string(label).c_str(),
            bytes.size(), plain.size(), elapsed_ms(t0, t1)
        );
    }
    auto result = DecodeMetaBytes(plain, opt, label);
    result.metadata["rotorWrapped"] = true;
    result.metadata["wrappedSize"] = bytes.size();
    return result;
}

EncodeResult MetaParser::EncodeJsonToMeta(
    const nlohmann::ordered_json& forest,
    const nlohmann::ordered_json& metadata,
    const ParserEncodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const meta::ElementForest tree = ForestFromJson(forest, metadata, label);
    EncodeResult result{};
    result.meta_bytes = meta::write_meta(tree);
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        NXM_LOG_INFO(
            "Encoded %s: elements=%zu bytes=%zu in %lldms", std::string(label).c_str(), tree.size(),
            result.meta_bytes.size(), elapsed_ms(t0, t1)
        );
    }
    return result;
}

}  // namespace nxm
