/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "ThingType.hpp"
#include "common/Byte.hpp"
#include "common/LruCache.hpp"
#include "common/Md5.hpp"

#include <gsl/span>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>

namespace otitems {

namespace SpriteHash {

static inline constexpr size_t SpriteSize = 32;
static inline constexpr size_t PixelCount = SpriteSize * SpriteSize;
static inline constexpr size_t RgbSize = PixelCount * 3;
// Colour written for transparent pixels, in each of R, G and B.
static inline constexpr byte TransparentColour = 0x11;

}

// Returns the compressed pixels of a sprite, or nullopt if there is no such sprite.
using PixelProvider = std::function<std::optional<Bytes>(uint32_t sprite_id)>;

// Expands a compressed 32x32 sprite (runs of [transparent count u16][coloured count u16][pixels]) into
// SpriteHash::RgbSize bytes of RGB. Pixels carry an alpha byte, which is discarded, when transparent is set.
// Transparent and missing pixels become TransparentColour; a truncated run ends the decode.
[[nodiscard]] std::array<byte, SpriteHash::RgbSize> decode_rgb(gsl::span<const byte> compressed, bool transparent);

// The ItemEditor-compatible sprite hash: MD5 over the first width * height * layers sprites of the default frame
// group, each flipped vertically and written as BGR0. All zero if the thing has no usable default frame group.
[[nodiscard]] Md5Digest compute_sprite_hash(const ThingType &thing, const PixelProvider &pixels, bool transparent);

// Remembers sprite hashes by client id and transparency so bulk syncs hash each appearance once. The pixels
// are assumed to come from the same sprite data on every call; clear() the cache when it changes.
class SpriteHashCache {
public:
    explicit SpriteHashCache(size_t max_size) : cache_(max_size) {}

    [[nodiscard]] Md5Digest hash_for(const ThingType &thing, const PixelProvider &pixels, bool transparent);

    void clear() { cache_.clear(); }
    void set_max_size(size_t max_size) { cache_.set_max_size(max_size); }
    [[nodiscard]] size_t size() const noexcept { return cache_.size(); }
    [[nodiscard]] bool has(uint32_t client_id, bool transparent = false) const {
        return cache_.has(key_for(client_id, transparent));
    }

private:
    static uint64_t key_for(uint32_t client_id, bool transparent) noexcept {
        return (uint64_t{client_id} << 1) | (transparent ? 1 : 0);
    }

    LruCache<uint64_t, Md5Digest> cache_;
};

}
