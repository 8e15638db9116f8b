/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "meta/meta_byte_reader.h"
#include "meta/meta_writer.h"

#include <string>
#include <vector>

using namespace nxm::meta;

TEST(PrimitiveReaderTest, FixedWidthLittleEndian) {
    const std::vector<std::uint8_t> one = {0x01, 0x00, 0x00, 0x00};
    EXPECT_EQ(read_u32(one), 1u);

    const std::vector<std::uint8_t> neg = {0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(read_i32(neg), -1);
    EXPECT_EQ(read_u32(neg), 0xFFFFFFFFu);

    const std::vector<std::uint8_t> u16 = {0x34, 0x12};
    EXPECT_EQ(read_u16(u16), 0x1234u);

    const std::vector<std::uint8_t> u64 = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    EXPECT_EQ(read_u64(u64), 0x0102030405060708ull);

    const std::vector<std::uint8_t> f = {0x00, 0x00, 0x80, 0x3F};
    EXPECT_FLOAT_EQ(read_f32(f), 1.0f);
}

TEST(PrimitiveReaderTest, FixedWidthRequiresExactByteCount) {
    const std::vector<std::uint8_t> three = {0x01, 0x02, 0x03};
    EXPECT_THROW(read_u32(three), FormatError);
    const std::vector<std::uint8_t> five = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_THROW(read_u32(five), FormatError);
    EXPECT_THROW(read_u64(three), FormatError);
    EXPECT_THROW(read_u8(std::span<const std::uint8_t>{}), FormatError);

    try {
        read_u16(three);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_STREQ(e.what(), "2 byte needed, 3 given.");
    }
}

TEST(PrimitiveReaderTest, CursorAdvancesAndFailsOnShortRead) {
    const std::vector<std::uint8_t> data = {0xAA, 0x01, 0x00, 0x00, 0x00, 0x02};
    ByteReader r(data);
    EXPECT_EQ(r.read_u8(), 0xAAu);
    EXPECT_EQ(r.read_u32(), 1u);
    EXPECT_EQ(r.position(), 5u);
    EXPECT_EQ(r.remaining(), 1u);

    try {
        r.read_u16();
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.offset().has_value());
        EXPECT_EQ(*e.offset(), 5u);
    }
    EXPECT_EQ(r.position(), 5u);
    EXPECT_EQ(r.read_u8(), 0x02u);
    EXPECT_TRUE(r.at_end());
}

TEST(PrimitiveReaderTest, VarintKnownEncodings) {
    const std::vector<std::uint8_t> data = {0x00, 0x7F, 0x80, 0x01, 0xE5, 0x8E, 0x26};
    ByteReader r(data);
    EXPECT_EQ(r.read_varint(), 0u);
    EXPECT_EQ(r.read_varint(), 127u);
    EXPECT_EQ(r.read_varint(), 128u);
    EXPECT_EQ(r.read_varint(), 624485u);
    EXPECT_TRUE(r.at_end());
}

TEST(PrimitiveReaderTest, VarintRoundTripsUint32Values) {
    const std::uint32_t values[] = {0u, 1u, 0x7Fu, 0x80u, 0x3FFFu, 0x4000u, 0x12345678u, 0xFFFFFFFFu};
    for (const auto v : values) {
        std::vector<std::uint8_t> buf;
        write_varint(buf, v);
        ByteReader r(buf);
        EXPECT_EQ(r.read_varint(), v);
        EXPECT_TRUE(r.at_end());
    }
}

TEST(PrimitiveReaderTest, VarintAcceptsRedundantContinuationBytes) {
    const std::vector<std::uint8_t> data = {
        0x81, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x00, 0x05
    };
    ByteReader r(data);
    EXPECT_EQ(r.read_varint(), 1u);
    EXPECT_EQ(r.position(), 12u);
    EXPECT_EQ(r.read_u8(), 0x05u);
}

TEST(PrimitiveReaderTest, VarintTruncatedThrows) {
    const std::vector<std::uint8_t> data = {0x80, 0x80};
    ByteReader r(data);
    EXPECT_THROW(r.read_varint(), FormatError);

    ByteReader empty(std::span<const std::uint8_t>{});
    EXPECT_THROW(empty.read_varint(), FormatError);
}

TEST(PrimitiveReaderTest, CStringConsumesTerminator) {
    const std::vector<std::uint8_t> data = {'a', 'b', 0x00, 0x00, 'c'};
    ByteReader r(data);
    const auto ab = r.read_cstring();
    EXPECT_EQ(std::string(ab.begin(), ab.end()), "ab");
    EXPECT_TRUE(r.read_cstring().empty());
    EXPECT_THROW(r.read_cstring(), FormatError);
}
