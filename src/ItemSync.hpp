#pragma once

#include "ServerItem.hpp"
#include "SpriteHash.hpp"
#include "ThingType.hpp"

#include <cstdint>

namespace otitems {

// Client versions before 10.10 have no OTB encoding for force-use and full-ground.
static inline constexpr uint32_t ForceUseMinClientVersion = 1010;

struct SyncOptions {
    // Also derive the item type. Only new items should have their type replaced.
    bool sync_type{};
    // e.g. 1098; gates the flags older OTB versions cannot hold.
    uint32_t client_version{};
    // When set, the sprite hash is recomputed from the appearance's pixels.
    const PixelProvider *pixels{};
    bool transparent{};
    // Optional memo for sprite hashes, keyed by client id and transparency.
    SpriteHashCache *hash_cache{};
};

// Applies the appearance's flags and attributes to the server item.
void sync_from_thing_type(ServerItem &item, const ThingType &thing, const SyncOptions &options = {});

// A new server item for the appearance, with its type derived too. Without pixels the sprite hash is zeroed.
[[nodiscard]] ServerItem create_from_thing_type(const ThingType &thing, uint16_t server_id, SyncOptions options = {});

// Whether syncing would leave the item's type, flags and stack order unchanged. Force-use, full-ground and
// allow-distance-read are not compared, since whether an OTB can hold them depends on its client version. Names,
// trade-as, hashes and xml attributes are not compared either.
[[nodiscard]] bool flags_match(const ServerItem &item, const ThingType &thing);

// The type a thing would give a new server item.
[[nodiscard]] ServerItemType type_for(const ThingType &thing) noexcept;

}
