#include "SpriteHash.hpp"

namespace otitems {

using namespace SpriteHash;

std::array<byte, RgbSize> decode_rgb(gsl::span<const byte> compressed, bool transparent) {
    std::array<byte, RgbSize> rgb{};
    rgb.fill(TransparentColour);
    size_t read = 0;
    size_t write = 0;
    auto next = [&]() -> byte { return read < compressed.size() ? compressed[read++] : byte{0}; };
    auto put = [&](byte b) {
        if (write < rgb.size())
            rgb[write] = b;
        ++write;
    };
    while (compressed.size() - read >= 4) {
        size_t transparent_pixels = next();
        transparent_pixels |= size_t{next()} << 8u;
        size_t coloured_pixels = next();
        coloured_pixels |= size_t{next()} << 8u;
        for (size_t i = 0; i < transparent_pixels; ++i) {
            put(TransparentColour);
            put(TransparentColour);
            put(TransparentColour);
        }
        for (size_t i = 0; i < coloured_pixels; ++i) {
            put(next());
            put(next());
            put(next());
            if (transparent)
                next();
        }
    }
    return rgb;
}

Md5Digest compute_sprite_hash(const ThingType &thing, const PixelProvider &pixels, bool transparent) {
    const auto *group = thing.default_frame_group();
    if (!group)
        return Md5Digest{};
    const auto sprite_count = group->sprites_per_frame();
    if (group->sprite_index.size() < sprite_count)
        return Md5Digest{};

    Md5 md5;
    std::array<byte, PixelCount * 4> bgr0{};
    for (size_t i = 0; i < sprite_count; ++i) {
        auto sprite_id = group->sprite_index[i];
        std::optional<Bytes> compressed;
        if (sprite_id != 0)
            compressed = pixels(sprite_id);
        if (!compressed || compressed->empty()) {
            for (size_t p = 0; p < PixelCount; ++p) {
                bgr0[p * 4] = bgr0[p * 4 + 1] = bgr0[p * 4 + 2] = TransparentColour;
                bgr0[p * 4 + 3] = 0;
            }
        } else {
            auto rgb = decode_rgb(*compressed, transparent);
            size_t out = 0;
            for (size_t y = 0; y < SpriteSize; ++y) {
                const auto *row = &rgb[(SpriteSize - y - 1) * SpriteSize * 3];
                for (size_t x = 0; x < SpriteSize; ++x) {
                    bgr0[out++] = row[x * 3 + 2];
                    bgr0[out++] = row[x * 3 + 1];
                    bgr0[out++] = row[x * 3];
                    bgr0[out++] = 0;
                }
            }
        }
        md5.append(bgr0);
    }
    return md5.digest();
}

Md5Digest SpriteHashCache::hash_for(const ThingType &thing, const PixelProvider &pixels, bool transparent) {
    const auto key = key_for(thing.id, transparent);
    if (auto cached = cache_.get(key))
        return *cached;
    auto digest = compute_sprite_hash(thing, pixels, transparent);
    cache_.set(key, digest);
    return digest;
}

}
