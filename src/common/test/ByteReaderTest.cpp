#include "ByteReader.hpp"
#include "ByteWriter.hpp"

#include <catch2/catch.hpp>

TEST_CASE("byte reader") {
    const Bytes data{0x01, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xfe, 0xff, 'h', 'i'};
    ByteReader reader(data);

    SECTION("reads little endian values in sequence") {
        CHECK(reader.read_u8() == 0x01);
        CHECK(reader.read_u16() == 0x1234);
        CHECK(reader.read_u32() == 0x12345678);
        CHECK(reader.read_i16() == -2);
        CHECK(reader.read_string(2) == "hi");
        CHECK(reader.at_end());
    }
    SECTION("peek does not advance") {
        CHECK(reader.peek() == 0x01);
        CHECK(reader.position() == 0);
    }
    SECTION("read_bytes returns a view and advances") {
        reader.skip(7);
        auto bytes = reader.read_bytes(2);
        REQUIRE(bytes.size() == 2);
        CHECK(bytes[0] == 0xfe);
        CHECK(bytes[1] == 0xff);
        CHECK(reader.remaining() == 2);
    }
    SECTION("throws rather than reading past the end") {
        reader.skip(10);
        CHECK_THROWS_AS(reader.read_u16(), TruncatedData);
        CHECK(reader.position() == 10);
        CHECK(reader.read_u8() == 'i');
        CHECK_THROWS_AS(reader.read_u8(), TruncatedData);
        CHECK_THROWS_AS(reader.peek(), TruncatedData);
    }
    SECTION("reports where the truncation happened") {
        reader.skip(9);
        CHECK_THROWS_WITH(reader.read_u32(), "Truncated data at offset 9: wanted 4 bytes but only 2 remain");
    }
}

TEST_CASE("byte writer") {
    ByteWriter writer;

    SECTION("writes little endian values") {
        writer.write_u8(0x01);
        writer.write_u16(0x1234);
        writer.write_u32(0x12345678);
        writer.write_i16(-2);
        CHECK(writer.buffer() == Bytes{0x01, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xfe, 0xff});
    }
    SECTION("escapes the node marker bytes") {
        writer.write_escaped_bytes(Bytes{0x00, 0xfc, 0xfd, 0xfe, 0xff});
        CHECK(writer.buffer() == Bytes{0x00, 0xfc, 0xfd, 0xfd, 0xfd, 0xfe, 0xfd, 0xff});
    }
    SECTION("escapes within multi-byte values") {
        writer.write_escaped_u16(0xfe01);
        writer.write_escaped_u32(0x000000ff);
        CHECK(writer.buffer() == Bytes{0x01, 0xfd, 0xfe, 0xfd, 0xff, 0x00, 0x00, 0x00});
    }
    SECTION("unescaped writes leave marker bytes alone") {
        writer.write_u8(0xfe);
        writer.write_string("ok");
        CHECK(writer.buffer() == Bytes{0xfe, 'o', 'k'});
    }
    SECTION("release hands over the buffer") {
        writer.write_u8(7);
        auto bytes = writer.release();
        CHECK(bytes == Bytes{7});
    }
}
