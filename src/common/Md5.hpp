#pragma once

#include "Byte.hpp"

#include <gsl/span>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

using Md5Digest = std::array<byte, 16>;

// Incremental RFC1321 MD5. Call append() any number of times, then digest() once.
class Md5 {
public:
    Md5();

    void append(gsl::span<const byte> data);
    void append(std::string_view data);
    // Finalises the hash. The object must not be appended to afterwards.
    [[nodiscard]] Md5Digest digest();

    [[nodiscard]] static Md5Digest hash(gsl::span<const byte> data);
    [[nodiscard]] static Md5Digest hash(std::string_view data);
    [[nodiscard]] static std::string to_hex(const Md5Digest &digest);

private:
    void transform(const byte *block);

    std::array<uint32_t, 4> state_;
    std::array<byte, 64> buffer_{};
    uint64_t length_{};
    bool finished_{};
};
