/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "Byte.hpp"

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Thrown when a read would run off the end of the underlying buffer.
class TruncatedData : public std::runtime_error {
public:
    TruncatedData(size_t position, size_t wanted, size_t available);

    [[nodiscard]] size_t position() const noexcept { return position_; }

private:
    size_t position_;
};

// A bounds-checked little-endian cursor over a byte buffer. The buffer must outlive the reader.
class ByteReader {
public:
    explicit ByteReader(gsl::span<const byte> data) : data_(data) {}

    [[nodiscard]] size_t position() const noexcept { return pos_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ == data_.size(); }

    [[nodiscard]] byte peek() const;
    byte read_u8();
    uint16_t read_u16();
    uint32_t read_u32();
    int16_t read_i16();
    // Returns a view into the underlying buffer.
    gsl::span<const byte> read_bytes(size_t count);
    std::string read_string(size_t length);
    void skip(size_t count);

private:
    void require(size_t count) const;

    gsl::span<const byte> data_;
    size_t pos_{};
};
