/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "meta/meta_xml_writer.h"

#include <cstddef>

namespace nxm::meta {
namespace {
constexpr std::string_view kIndent = "    ";

void write_indent(std::string& out, int depth) {
    for (int i = 0; i < depth; i++) {
        out += kIndent;
    }
}

void write_element(std::string& out, const ElementForest& forest, std::size_t idx, int depth) {
    const auto& n = forest.node(idx);
    out.push_back('<');
    out += n.name;
    for (const auto& [name, value] : n.attributes) {
        out.push_back(' ');
        out += name;
        out += "=\"";
        out += escape_xml_attribute(value.to_text());
        out.push_back('"');
    }
    if (n.children.empty()) {
        out += " />";
        return;
    }
    out.push_back('>');
    for (const auto child : n.children) {
        out.push_back('\n');
        write_indent(out, depth + 1);
        write_element(out, forest, child, depth + 1);
    }
    out.push_back('\n');
    write_indent(out, depth);
    out += "</";
    out += n.name;
    out.push_back('>');
}
}  // namespace

std::string escape_xml_attribute(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\n':
                out += "&#10;";
                break;
            case '\r':
                out += "&#13;";
                break;
            case '\t':
                out += "&#09;";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

std::string write_xml(const ElementForest& forest) {
    std::string out;
    for (const auto root : forest.roots()) {
        write_element(out, forest, root, 0);
        out.push_back('\n');
    }
    return out;
}
}  // namespace nxm::meta
