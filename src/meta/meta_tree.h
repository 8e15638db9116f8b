/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "meta_attributes.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace nxm::meta {
struct TagRecord {
    std::string name;
    std::uint64_t child_count = 0;
};

struct ElementNode {
    std::string name;
    AttributeMap attributes;
    std::vector<std::size_t> children;
};

// Index-addressed node arena. Children are owned by exactly one parent;
// roots are kept in first-seen order.
class ElementForest {
   public:
    std::size_t add_node(std::string name, AttributeMap attributes);
    void add_child(std::size_t parent, std::size_t child);
    void add_root(std::size_t node);

    const ElementNode& node(std::size_t index) const { return _nodes.at(index); }
    ElementNode& node(std::size_t index) { return _nodes.at(index); }
    const std::vector<std::size_t>& roots() const { return _roots; }
    std::size_t size() const { return _nodes.size(); }
    bool empty() const { return _nodes.empty(); }

    // Inverse of build_forest: every root's tree in breadth-first order.
    std::vector<std::size_t> stream_order() const;

   private:
    std::vector<ElementNode> _nodes;
    std::vector<std::size_t> _roots;
};

// Rebuilds the forest from per-tag child counts. A FIFO of open parents
// hands each tag to the oldest parent that still has free child slots;
// with no open parent the tag starts a new root.
ElementForest build_forest(std::span<const TagRecord> tags, std::vector<AttributeMap> attributes);
}  // namespace nxm::meta
