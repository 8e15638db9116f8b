/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "meta/meta_file.h"
#include "meta/meta_xml_writer.h"
#include "test_blob.h"

using namespace nxm::meta;

TEST(XmlWriterTest, EscapesAttributeText) {
    EXPECT_EQ(escape_xml_attribute("plain"), "plain");
    EXPECT_EQ(escape_xml_attribute("a&b<c>\"d\""), "a&amp;b&lt;c&gt;&quot;d&quot;");
    EXPECT_EQ(escape_xml_attribute("l1\nl2\r\tx"), "l1&#10;l2&#13;&#09;x");
    EXPECT_EQ(escape_xml_attribute("it's"), "it's");
}

TEST(XmlWriterTest, WritesNestedDocument) {
    const auto forest = decode_meta_forest(nxm::test::sample_blob());
    const std::string expected =
        "<Material>\n"
        "    <Item id=\"7\" pos=\"1.0000,2.0000\" />\n"
        "    <Item id=\"x\" />\n"
        "</Material>\n";
    EXPECT_EQ(write_xml(forest), expected);
}

TEST(XmlWriterTest, IndentsEachLevel) {
    ElementForest f;
    const auto a = f.add_node("A", {});
    const auto b = f.add_node("B", {});
    const auto c = f.add_node("C", {});
    f.add_child(a, b);
    f.add_child(b, c);
    f.add_root(a);
    EXPECT_EQ(write_xml(f), "<A>\n    <B>\n        <C />\n    </B>\n</A>\n");
}

TEST(XmlWriterTest, WritesRootsOneAfterAnother) {
    ElementForest f;
    AttributeMap attrs;
    attrs.set("note", AttributeValue::string("x<y"));
    f.add_root(f.add_node("First", std::move(attrs)));
    f.add_root(f.add_node("Second", {}));
    EXPECT_EQ(write_xml(f), "<First note=\"x&lt;y\" />\n<Second />\n");
}

TEST(XmlWriterTest, EmptyForestWritesNothing) {
    EXPECT_EQ(write_xml(ElementForest{}), "");
}
