/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ByteWriter.hpp"

void ByteWriter::write_u16(uint16_t value) {
    buffer_.push_back(static_cast<byte>(value & 0xffu));
    buffer_.push_back(static_cast<byte>(value >> 8u));
}

void ByteWriter::write_u32(uint32_t value) {
    for (auto shift = 0u; shift < 32u; shift += 8u)
        buffer_.push_back(static_cast<byte>((value >> shift) & 0xffu));
}

void ByteWriter::write_bytes(gsl::span<const byte> bytes) { buffer_.insert(buffer_.end(), bytes.begin(), bytes.end()); }

void ByteWriter::write_string(std::string_view str) {
    for (auto c : str)
        buffer_.push_back(static_cast<byte>(c));
}

void ByteWriter::write_escaped_u8(byte value) {
    if (needs_escape(value))
        buffer_.push_back(EscapeByte);
    buffer_.push_back(value);
}

void ByteWriter::write_escaped_u16(uint16_t value) {
    write_escaped_u8(static_cast<byte>(value & 0xffu));
    write_escaped_u8(static_cast<byte>(value >> 8u));
}

void ByteWriter::write_escaped_u32(uint32_t value) {
    for (auto shift = 0u; shift < 32u; shift += 8u)
        write_escaped_u8(static_cast<byte>((value >> shift) & 0xffu));
}

void ByteWriter::write_escaped_bytes(gsl::span<const byte> bytes) {
    for (auto b : bytes)
        write_escaped_u8(b);
}
