/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "meta/meta_tree.h"

#include <deque>
#include <utility>

namespace nxm::meta {
std::size_t ElementForest::add_node(std::string name, AttributeMap attributes) {
    _nodes.push_back(ElementNode{std::move(name), std::move(attributes), {}});
    return _nodes.size() - 1;
}

void ElementForest::add_child(std::size_t parent, std::size_t child) {
    _nodes.at(parent).children.push_back(child);
}

void ElementForest::add_root(std::size_t node) {
    _roots.push_back(node);
}

std::vector<std::size_t> ElementForest::stream_order() const {
    std::vector<std::size_t> out;
    out.reserve(_nodes.size());
    for (const auto root : _roots) {
        std::size_t head = out.size();
        out.push_back(root);
        while (head < out.size()) {
            const auto& n = _nodes.at(out[head++]);
            out.insert(out.end(), n.children.begin(), n.children.end());
        }
    }
    return out;
}

ElementForest build_forest(std::span<const TagRecord> tags, std::vector<AttributeMap> attributes) {
    if (attributes.size() != tags.size()) {
        throw FormatError(
            "Attribute block count " + std::to_string(attributes.size())
            + " does not match tag count " + std::to_string(tags.size())
        );
    }

    struct OpenParent {
        std::size_t node;
        std::uint64_t remaining;
    };

    ElementForest forest;
    std::deque<OpenParent> queue;
    for (std::size_t i = 0; i < tags.size(); i++) {
        const auto& tag = tags[i];
        const std::size_t idx = forest.add_node(tag.name, std::move(attributes[i]));

        while (!queue.empty() && queue.front().remaining == 0) {
            queue.pop_front();
        }
        if (queue.empty()) {
            forest.add_root(idx);
        } else {
            forest.add_child(queue.front().node, idx);
            queue.front().remaining--;
        }

        if (tag.child_count > 0) {
            queue.push_back(OpenParent{idx, tag.child_count});
        }
    }

    std::uint64_t missing = 0;
    for (const auto& open : queue) {
        missing += open.remaining;
    }
    if (missing != 0) {
        throw FormatError(
            "Tag stream ended with " + std::to_string(missing) + " declared children missing"
        );
    }
    return forest;
}
}  // namespace nxm::meta
