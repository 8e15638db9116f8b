/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "meta/meta_tree.h"

#include <string>
#include <vector>

using namespace nxm::meta;

namespace {
ElementForest build(const std::vector<TagRecord>& tags) {
    return build_forest(tags, std::vector<AttributeMap>(tags.size()));
}

std::vector<std::string> child_names(const ElementForest& f, std::size_t idx) {
    std::vector<std::string> out;
    for (const auto c : f.node(idx).children) {
        out.push_back(f.node(c).name);
    }
    return out;
}
}  // namespace

TEST(ElementTreeTest, SingleRootWithNestedChild) {
    const auto f = build({{"A", 2}, {"B", 0}, {"C", 1}, {"D", 0}});
    ASSERT_EQ(f.roots().size(), 1u);
    const auto a = f.roots()[0];
    EXPECT_EQ(f.node(a).name, "A");
    EXPECT_EQ(child_names(f, a), (std::vector<std::string>{"B", "C"}));

    const auto b = f.node(a).children[0];
    const auto c = f.node(a).children[1];
    EXPECT_TRUE(f.node(b).children.empty());
    EXPECT_EQ(child_names(f, c), (std::vector<std::string>{"D"}));
}

TEST(ElementTreeTest, IndependentRoots) {
    const auto f = build({{"A", 0}, {"B", 0}});
    ASSERT_EQ(f.roots().size(), 2u);
    EXPECT_EQ(f.node(f.roots()[0]).name, "A");
    EXPECT_EQ(f.node(f.roots()[1]).name, "B");
    EXPECT_TRUE(f.node(f.roots()[0]).children.empty());
    EXPECT_TRUE(f.node(f.roots()[1]).children.empty());
}

TEST(ElementTreeTest, NewRootStartsOnceEveryParentIsFull) {
    const auto f = build({{"A", 1}, {"B", 0}, {"C", 2}, {"D", 0}, {"E", 1}, {"F", 0}});
    ASSERT_EQ(f.roots().size(), 2u);
    const auto a = f.roots()[0];
    const auto c = f.roots()[1];
    EXPECT_EQ(child_names(f, a), (std::vector<std::string>{"B"}));
    EXPECT_EQ(child_names(f, c), (std::vector<std::string>{"D", "E"}));
    EXPECT_EQ(child_names(f, f.node(c).children[1]), (std::vector<std::string>{"F"}));
}

TEST(ElementTreeTest, ChildrenFillParentsInQueueOrder) {
    // level order: A's children first, then B's, then C's
    const auto f = build({{"A", 2}, {"B", 2}, {"C", 1}, {"B1", 0}, {"B2", 0}, {"C1", 0}});
    ASSERT_EQ(f.roots().size(), 1u);
    const auto a = f.roots()[0];
    EXPECT_EQ(child_names(f, a), (std::vector<std::string>{"B", "C"}));
    EXPECT_EQ(child_names(f, f.node(a).children[0]), (std::vector<std::string>{"B1", "B2"}));
    EXPECT_EQ(child_names(f, f.node(a).children[1]), (std::vector<std::string>{"C1"}));
}

TEST(ElementTreeTest, ChildCountsMatchTagsMinusRoots) {
    const std::vector<TagRecord> tags = {
        {"R", 3}, {"a", 0}, {"b", 1}, {"c", 0}, {"d", 0}, {"S", 0}, {"T", 1}, {"e", 0}
    };
    const auto f = build(tags);
    std::uint64_t declared = 0;
    for (const auto& t : tags) {
        declared += t.child_count;
    }
    EXPECT_EQ(declared, tags.size() - f.roots().size());
    EXPECT_EQ(f.size(), tags.size());
}

TEST(ElementTreeTest, EmptyInputGivesEmptyForest) {
    const auto f = build({});
    EXPECT_TRUE(f.empty());
    EXPECT_TRUE(f.roots().empty());
}

TEST(ElementTreeTest, MissingChildrenIsFormatError) {
    EXPECT_THROW(build({{"A", 3}, {"B", 0}}), FormatError);
    EXPECT_THROW(build({{"A", 1}}), FormatError);
}

TEST(ElementTreeTest, AttributeCountMustMatchTagCount) {
    const std::vector<TagRecord> tags = {{"A", 0}, {"B", 0}};
    EXPECT_THROW(build_forest(tags, std::vector<AttributeMap>(1)), FormatError);
}

TEST(ElementTreeTest, AttributesFollowTheirTag) {
    const std::vector<TagRecord> tags = {{"A", 1}, {"B", 0}};
    std::vector<AttributeMap> attrs(2);
    attrs[1].set("k", AttributeValue::uint32(9));
    const auto f = build_forest(tags, std::move(attrs));
    const auto b = f.node(f.roots()[0]).children[0];
    ASSERT_NE(f.node(b).attributes.find("k"), nullptr);
    EXPECT_EQ(f.node(b).attributes.find("k")->to_text(), "9");
    EXPECT_TRUE(f.node(f.roots()[0]).attributes.empty());
}

TEST(ElementTreeTest, StreamOrderReproducesTagSequence) {
    const std::vector<TagRecord> tags = {
        {"A", 2}, {"B", 2}, {"C", 1}, {"B1", 0}, {"B2", 0}, {"C1", 0}, {"Z", 0}
    };
    const auto f = build(tags);
    const auto order = f.stream_order();
    ASSERT_EQ(order.size(), tags.size());
    for (std::size_t i = 0; i < tags.size(); i++) {
        EXPECT_EQ(f.node(order[i]).name, tags[i].name);
        EXPECT_EQ(f.node(order[i]).children.size(), tags[i].child_count);
    }
}
