/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "Md5.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace {

constexpr std::array<uint32_t, 64> ShiftAmounts = {
    7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22, //
    5, 9,  14, 20, 5, 9,  14, 20, 5, 9,  14, 20, 5, 9,  14, 20, //
    4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23, //
    6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21};

// floor(abs(sin(i + 1)) * 2^32)
constexpr std::array<uint32_t, 64> SineTable = {
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee, 0xf57c0faf, 0x4787c62a, 0xa8304613, 0xfd469501,
    0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be, 0x6b901122, 0xfd987193, 0xa679438e, 0x49b40821,
    0xf61e2562, 0xc040b340, 0x265e5a51, 0xe9b6c7aa, 0xd62f105d, 0x02441453, 0xd8a1e681, 0xe7d3fbc8,
    0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed, 0xa9e3e905, 0xfcefa3f8, 0x676f02d9, 0x8d2a4c8a,
    0xfffa3942, 0x8771f681, 0x6d9d6122, 0xfde5380c, 0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70,
    0x289b7ec6, 0xeaa127fa, 0xd4ef3085, 0x04881d05, 0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665,
    0xf4292244, 0x432aff97, 0xab9423a7, 0xfc93a039, 0x655b59c3, 0x8f0ccc92, 0xffeff47d, 0x85845dd1,
    0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1, 0xf7537e82, 0xbd3af235, 0x2ad7d2bb, 0xeb86d391};

constexpr uint32_t rotate_left(uint32_t x, uint32_t c) noexcept { return (x << c) | (x >> (32u - c)); }

}

Md5::Md5() : state_{0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476} {}

void Md5::transform(const byte *block) {
    std::array<uint32_t, 16> m{};
    for (size_t i = 0; i < 16; ++i) {
        m[i] = static_cast<uint32_t>(block[i * 4]) | (static_cast<uint32_t>(block[i * 4 + 1]) << 8u)
               | (static_cast<uint32_t>(block[i * 4 + 2]) << 16u) | (static_cast<uint32_t>(block[i * 4 + 3]) << 24u);
    }
    auto a = state_[0];
    auto b = state_[1];
    auto c = state_[2];
    auto d = state_[3];
    for (uint32_t i = 0; i < 64; ++i) {
        uint32_t f{};
        uint32_t g{};
        if (i < 16) {
            f = (b & c) | (~b & d);
            g = i;
        } else if (i < 32) {
            f = (d & b) | (~d & c);
            g = (5 * i + 1) % 16;
        } else if (i < 48) {
            f = b ^ c ^ d;
            g = (3 * i + 5) % 16;
        } else {
            f = c ^ (b | ~d);
            g = (7 * i) % 16;
        }
        const auto temp = d;
        d = c;
        c = b;
        b = b + rotate_left(a + f + SineTable[i] + m[g], ShiftAmounts[i]);
        a = temp;
    }
    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
}

void Md5::append(gsl::span<const byte> data) {
    if (finished_)
        throw std::logic_error("Md5::append called after digest");
    auto offset = static_cast<size_t>(length_ % 64);
    length_ += data.size();
    size_t consumed = 0;
    while (consumed < data.size()) {
        const auto chunk = std::min(data.size() - consumed, 64 - offset);
        std::memcpy(buffer_.data() + offset, data.data() + consumed, chunk);
        consumed += chunk;
        offset += chunk;
        if (offset == 64) {
            transform(buffer_.data());
            offset = 0;
        }
    }
}

void Md5::append(std::string_view data) {
    append(gsl::span<const byte>(reinterpret_cast<const byte *>(data.data()), data.size()));
}

Md5Digest Md5::digest() {
    if (finished_)
        throw std::logic_error("Md5::digest called twice");
    const uint64_t bit_length = length_ * 8;
    const auto offset = static_cast<size_t>(length_ % 64);
    const auto padding_length = offset < 56 ? 56 - offset : 120 - offset;
    Bytes padding(padding_length + 8, 0);
    padding[0] = 0x80;
    for (size_t i = 0; i < 8; ++i)
        padding[padding_length + i] = static_cast<byte>((bit_length >> (8 * i)) & 0xffu);
    append(padding);
    finished_ = true;

    Md5Digest result{};
    for (size_t i = 0; i < 4; ++i)
        for (size_t j = 0; j < 4; ++j)
            result[i * 4 + j] = static_cast<byte>((state_[i] >> (8 * j)) & 0xffu);
    return result;
}

Md5Digest Md5::hash(gsl::span<const byte> data) {
    Md5 md5;
    md5.append(data);
    return md5.digest();
}

Md5Digest Md5::hash(std::string_view data) {
    Md5 md5;
    md5.append(data);
    return md5.digest();
}

std::string Md5::to_hex(const Md5Digest &digest) { return fmt::format("{:02x}", fmt::join(digest, "")); }
