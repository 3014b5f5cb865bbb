/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ItemSync.hpp"

namespace otitems {

namespace {

// Lens help 1112 marks readable signs and books.
constexpr uint16_t ReadableLensHelp = 1112;

// Flags whose value depends on the OTB version or that the appearance never carries.
constexpr uint32_t UncomparedFlags = static_cast<uint32_t>(ServerItemFlag::ForceUse)
                                     | static_cast<uint32_t>(ServerItemFlag::FullGround)
                                     | static_cast<uint32_t>(ServerItemFlag::AllowDistanceRead);

bool readable(const ThingType &thing) {
    return thing.writable || thing.writable_once || (thing.is_lens_help && thing.lens_help == ReadableLensHelp);
}

TileStackOrder stack_order_for(const ThingType &thing) {
    if (thing.is_ground_border)
        return TileStackOrder::Border;
    if (thing.is_on_bottom)
        return TileStackOrder::Bottom;
    if (thing.is_on_top)
        return TileStackOrder::Top;
    return TileStackOrder::None;
}

bool is_animation(const ThingType &thing) {
    const auto *group = thing.default_frame_group();
    return group && group->frames > 1;
}

// The flags and attributes sync derives from the appearance, independent of the item being synced.
ServerItem project(const ThingType &thing, ServerItemType type, uint32_t client_version) {
    ServerItem projected;
    projected.type = type;
    projected.unpassable = thing.is_unpassable;
    projected.block_missiles = thing.block_missile;
    projected.block_pathfinder = thing.block_pathfind;
    projected.has_elevation = thing.has_elevation;
    projected.multi_use = thing.multi_use;
    projected.pickupable = thing.pickupable;
    projected.movable = !thing.is_unmoveable;
    projected.stackable = thing.stackable;
    projected.readable = readable(thing);
    projected.rotatable = thing.rotatable;
    projected.hangable = thing.hangable;
    projected.hook_south = thing.is_vertical;
    projected.hook_east = thing.is_horizontal;
    projected.ignore_look = thing.ignore_look;
    projected.allow_distance_read = false;
    projected.has_charges = false;
    const bool modern = client_version >= ForceUseMinClientVersion;
    projected.force_use = modern && thing.force_use;
    projected.full_ground = modern && thing.is_full_ground;
    projected.is_animation = is_animation(thing);

    projected.light_level = thing.light_level;
    projected.light_color = thing.light_color;
    projected.ground_speed = type == ServerItemType::Ground ? thing.ground_speed : 0;
    projected.minimap_color = thing.mini_map_color;
    projected.max_read_write_chars = thing.writable ? thing.max_read_write_chars : 0;
    projected.max_read_chars = thing.writable_once ? thing.max_read_chars : 0;
    projected.stack_order = stack_order_for(thing);
    projected.has_stack_order = projected.stack_order != TileStackOrder::None;
    return projected;
}

}

ServerItemType type_for(const ThingType &thing) noexcept {
    if (thing.is_ground)
        return ServerItemType::Ground;
    if (thing.is_container)
        return ServerItemType::Container;
    if (thing.is_fluid_container)
        return ServerItemType::Fluid;
    if (thing.is_fluid)
        return ServerItemType::Splash;
    return ServerItemType::None;
}

void sync_from_thing_type(ServerItem &item, const ThingType &thing, const SyncOptions &options) {
    if (options.sync_type)
        item.type = type_for(thing);

    if (options.pixels && !item.is_deprecated()) {
        item.sprite_hash = options.hash_cache
                               ? options.hash_cache->hash_for(thing, *options.pixels, options.transparent)
                               : compute_sprite_hash(thing, *options.pixels, options.transparent);
        item.sprite_assigned = true;
    }

    auto projected = project(thing, item.type, options.client_version);
    item.set_flags(projected.flags());
    item.light_level = projected.light_level;
    item.light_color = projected.light_color;
    item.ground_speed = projected.ground_speed;
    item.minimap_color = projected.minimap_color;
    item.max_read_write_chars = projected.max_read_write_chars;
    item.max_read_chars = projected.max_read_chars;
    item.stack_order = projected.stack_order;
    item.has_stack_order = projected.has_stack_order;

    if (!thing.market_name.empty())
        item.name = thing.market_name;
    if (thing.market_trade_as != 0)
        item.trade_as = thing.market_trade_as;
}

ServerItem create_from_thing_type(const ThingType &thing, uint16_t server_id, SyncOptions options) {
    ServerItem item;
    item.id = server_id;
    item.client_id = static_cast<uint16_t>(thing.id);
    options.sync_type = true;
    sync_from_thing_type(item, thing, options);
    if (!item.sprite_hash && !item.is_deprecated())
        item.sprite_hash = Md5Digest{};
    return item;
}

bool flags_match(const ServerItem &item, const ThingType &thing) {
    const auto expected_type = type_for(thing);
    if (item.type != expected_type)
        return false;
    auto projected = project(thing, expected_type, ForceUseMinClientVersion);
    if ((item.flags() & ~UncomparedFlags) != (projected.flags() & ~UncomparedFlags))
        return false;
    if (item.stack_order != projected.stack_order)
        return false;
    if (thing.writable && item.max_read_write_chars != projected.max_read_write_chars)
        return false;
    if (thing.writable_once && item.max_read_chars != projected.max_read_chars)
        return false;
    return true;
}

}
