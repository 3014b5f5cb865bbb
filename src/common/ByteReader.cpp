/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ByteReader.hpp"

#include <fmt/format.h>

TruncatedData::TruncatedData(size_t position, size_t wanted, size_t available)
    : std::runtime_error(fmt::format("Truncated data at offset {}: wanted {} bytes but only {} remain", position,
                                     wanted, available)),
      position_(position) {}

void ByteReader::require(size_t count) const {
    if (count > remaining())
        throw TruncatedData(pos_, count, remaining());
}

byte ByteReader::peek() const {
    require(1);
    return data_[pos_];
}

byte ByteReader::read_u8() {
    require(1);
    return data_[pos_++];
}

uint16_t ByteReader::read_u16() {
    require(2);
    const auto lo = static_cast<uint16_t>(data_[pos_]);
    const auto hi = static_cast<uint16_t>(data_[pos_ + 1]);
    pos_ += 2;
    return static_cast<uint16_t>(lo | (hi << 8u));
}

uint32_t ByteReader::read_u32() {
    require(4);
    uint32_t result{};
    for (size_t i = 0; i < 4; ++i)
        result |= static_cast<uint32_t>(data_[pos_ + i]) << (8u * i);
    pos_ += 4;
    return result;
}

int16_t ByteReader::read_i16() { return static_cast<int16_t>(read_u16()); }

gsl::span<const byte> ByteReader::read_bytes(size_t count) {
    require(count);
    auto result = data_.subspan(pos_, count);
    pos_ += count;
    return result;
}

std::string ByteReader::read_string(size_t length) {
    auto bytes = read_bytes(length);
    return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
}

void ByteReader::skip(size_t count) {
    require(count);
    pos_ += count;
}
