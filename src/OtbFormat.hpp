#pragma once

#include "common/Byte.hpp"

#include <cstddef>
#include <cstdint>

namespace otitems::otb {

// Node delimiters and the escape byte of the OTB binary tree.
static inline constexpr byte NodeStart = 0xFE;
static inline constexpr byte NodeEnd = 0xFF;
static inline constexpr byte Escape = 0xFD;

static inline constexpr size_t HeaderSize = 4;
static inline constexpr byte RootNodeType = 0;

enum class RootAttribute : uint8_t { Version = 0x01 };

// major, minor and build numbers followed by the CSD version string.
static inline constexpr uint16_t VersionAttributeSize = 140;
static inline constexpr size_t CsdVersionSize = 128;

enum class ItemAttribute : uint8_t {
    ServerId = 0x10,
    ClientId = 0x11,
    Name = 0x12,
    GroundSpeed = 0x14,
    SpriteHash = 0x20,
    MinimapColor = 0x21,
    MaxReadWriteChars = 0x22,
    MaxReadChars = 0x23,
    Light = 0x2A,
    StackOrder = 0x2B,
    TradeAs = 0x2D
};

}
