#pragma once

#include "Byte.hpp"

#include <gsl/span>

#include <cstdint>
#include <string_view>
#include <utility>

// Appends little-endian values to a growable buffer.
// The escaped_ variants apply the OTB node escaping: any 0xFD, 0xFE or 0xFF byte is preceded by 0xFD.
class ByteWriter {
public:
    static inline constexpr byte EscapeByte = 0xFD;

    void write_u8(byte value) { buffer_.push_back(value); }
    void write_u16(uint16_t value);
    void write_u32(uint32_t value);
    void write_i16(int16_t value) { write_u16(static_cast<uint16_t>(value)); }
    void write_bytes(gsl::span<const byte> bytes);
    void write_string(std::string_view str);

    void write_escaped_u8(byte value);
    void write_escaped_u16(uint16_t value);
    void write_escaped_u32(uint32_t value);
    void write_escaped_bytes(gsl::span<const byte> bytes);

    [[nodiscard]] static constexpr bool needs_escape(byte b) noexcept { return b >= EscapeByte; }

    [[nodiscard]] const Bytes &buffer() const noexcept { return buffer_; }
    [[nodiscard]] size_t size() const noexcept { return buffer_.size(); }
    [[nodiscard]] Bytes release() { return std::move(buffer_); }

private:
    Bytes buffer_;
};
