/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "meta/meta_name_table.h"
#include "test_blob.h"

using namespace nxm::meta;
using nxm::test::BlobBuilder;

TEST(NameTableTest, ReadsExactlyCountNames) {
    BlobBuilder b;
    b.varint(3).cstr("Model").cstr("").cstr("\xC3\xA9t\xC3\xA9").u8(0x42);
    ByteReader r(b.data());
    const NameTable t = read_name_table(r);
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t.names[0], "Model");
    EXPECT_EQ(t.names[1], "");
    EXPECT_EQ(t.names[2], "\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(r.read_u8(), 0x42u);
}

TEST(NameTableTest, EmptyTable) {
    BlobBuilder b;
    b.varint(0);
    ByteReader r(b.data());
    EXPECT_TRUE(read_name_table(r).empty());
    EXPECT_TRUE(r.at_end());
}

TEST(NameTableTest, InvalidUtf8IsEncodingError) {
    BlobBuilder b;
    b.varint(1).bytes({'a', 0xFF, 'b', 0x00});
    ByteReader r(b.data());
    try {
        read_name_table(r);
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_EQ(e.offset(), 1u);
        const std::vector<std::uint8_t> raw = {'a', 0xFF, 'b'};
        EXPECT_EQ(e.raw_bytes(), raw);
        EXPECT_NE(std::string(e.what()).find("61FF62"), std::string::npos);
    }
}

TEST(NameTableTest, MissingTerminatorIsEncodingError) {
    BlobBuilder b;
    b.varint(2).cstr("first").bytes({'s', 'e', 'c'});
    ByteReader r(b.data());
    EXPECT_THROW(read_name_table(r), EncodingError);
}

TEST(NameTableTest, FewerNamesThanCountIsEncodingError) {
    BlobBuilder b;
    b.varint(5).cstr("only");
    ByteReader r(b.data());
    EXPECT_THROW(read_name_table(r), EncodingError);
}

TEST(NameTableTest, LookupOutOfRangeIsFormatError) {
    NameTable t{{"a", "b"}};
    EXPECT_EQ(t.at(1, "Element name"), "b");
    EXPECT_THROW(t.at(2, "Element name"), FormatError);
}

TEST(Utf8Test, Validation) {
    const std::vector<std::uint8_t> ascii = {'o', 'k'};
    const std::vector<std::uint8_t> four_byte = {0xF0, 0x9F, 0x98, 0x80};
    const std::vector<std::uint8_t> overlong = {0xC0, 0x80};
    const std::vector<std::uint8_t> surrogate = {0xED, 0xA0, 0x80};
    const std::vector<std::uint8_t> truncated = {0xE2, 0x82};
    const std::vector<std::uint8_t> stray = {0x80};
    const std::vector<std::uint8_t> too_big = {0xF4, 0x90, 0x80, 0x80};
    EXPECT_TRUE(is_valid_utf8(ascii));
    EXPECT_TRUE(is_valid_utf8(four_byte));
    EXPECT_FALSE(is_valid_utf8(overlong));
    EXPECT_FALSE(is_valid_utf8(surrogate));
    EXPECT_FALSE(is_valid_utf8(truncated));
    EXPECT_FALSE(is_valid_utf8(stray));
    EXPECT_FALSE(is_valid_utf8(too_big));
}
