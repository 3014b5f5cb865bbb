/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ServerItem.hpp"

#include <magic_enum.hpp>

#include <utility>

namespace otitems {

namespace {

constexpr uint32_t bit(ServerItemFlag flag) noexcept { return magic_enum::enum_integer(flag); }

void set_if(uint32_t &flags, bool value, ServerItemFlag flag) noexcept {
    if (value)
        flags |= bit(flag);
}

bool check(uint32_t flags, ServerItemFlag flag) noexcept { return (flags & bit(flag)) != 0; }

}

uint32_t ServerItem::flags() const {
    uint32_t result{};
    set_if(result, unpassable, ServerItemFlag::Unpassable);
    set_if(result, block_missiles, ServerItemFlag::BlockMissiles);
    set_if(result, block_pathfinder, ServerItemFlag::BlockPathfinder);
    set_if(result, has_elevation, ServerItemFlag::HasElevation);
    set_if(result, force_use, ServerItemFlag::ForceUse);
    set_if(result, multi_use, ServerItemFlag::MultiUse);
    set_if(result, pickupable, ServerItemFlag::Pickupable);
    set_if(result, movable, ServerItemFlag::Movable);
    set_if(result, stackable, ServerItemFlag::Stackable);
    set_if(result, has_stack_order, ServerItemFlag::StackOrder);
    set_if(result, readable, ServerItemFlag::Readable);
    set_if(result, rotatable, ServerItemFlag::Rotatable);
    set_if(result, hangable, ServerItemFlag::Hangable);
    set_if(result, hook_south, ServerItemFlag::HookSouth);
    set_if(result, hook_east, ServerItemFlag::HookEast);
    set_if(result, has_charges, ServerItemFlag::ClientCharges);
    set_if(result, ignore_look, ServerItemFlag::IgnoreLook);
    set_if(result, allow_distance_read, ServerItemFlag::AllowDistanceRead);
    set_if(result, is_animation, ServerItemFlag::IsAnimation);
    set_if(result, full_ground, ServerItemFlag::FullGround);
    return result;
}

void ServerItem::set_flags(uint32_t flags) {
    unpassable = check(flags, ServerItemFlag::Unpassable);
    block_missiles = check(flags, ServerItemFlag::BlockMissiles);
    block_pathfinder = check(flags, ServerItemFlag::BlockPathfinder);
    has_elevation = check(flags, ServerItemFlag::HasElevation);
    force_use = check(flags, ServerItemFlag::ForceUse);
    multi_use = check(flags, ServerItemFlag::MultiUse);
    pickupable = check(flags, ServerItemFlag::Pickupable);
    movable = check(flags, ServerItemFlag::Movable);
    stackable = check(flags, ServerItemFlag::Stackable);
    has_stack_order = check(flags, ServerItemFlag::StackOrder);
    readable = check(flags, ServerItemFlag::Readable);
    rotatable = check(flags, ServerItemFlag::Rotatable);
    hangable = check(flags, ServerItemFlag::Hangable);
    hook_south = check(flags, ServerItemFlag::HookSouth);
    hook_east = check(flags, ServerItemFlag::HookEast);
    has_charges = check(flags, ServerItemFlag::ClientCharges);
    ignore_look = check(flags, ServerItemFlag::IgnoreLook);
    allow_distance_read = check(flags, ServerItemFlag::AllowDistanceRead);
    is_animation = check(flags, ServerItemFlag::IsAnimation);
    full_ground = check(flags, ServerItemFlag::FullGround);
}

std::optional<std::string> ServerItem::xml_attribute_string(std::string_view key) const {
    auto it = xml_attributes.find(std::string(key));
    if (it == xml_attributes.end())
        return std::nullopt;
    if (auto *str = std::get_if<std::string>(&it->second))
        return *str;
    return std::nullopt;
}

void ServerItem::set_xml_attribute(std::string key, XmlAttributeValue value) {
    xml_attributes.insert_or_assign(std::move(key), std::move(value));
}

ServerItemGroup group_for(ServerItemType type) noexcept {
    switch (type) {
    case ServerItemType::Ground: return ServerItemGroup::Ground;
    case ServerItemType::Container: return ServerItemGroup::Container;
    case ServerItemType::Fluid: return ServerItemGroup::Fluid;
    case ServerItemType::Splash: return ServerItemGroup::Splash;
    case ServerItemType::Deprecated: return ServerItemGroup::Deprecated;
    case ServerItemType::None: break;
    }
    return ServerItemGroup::None;
}

ServerItemType type_for(uint8_t group) noexcept {
    switch (static_cast<ServerItemGroup>(group)) {
    case ServerItemGroup::Ground: return ServerItemType::Ground;
    case ServerItemGroup::Container: return ServerItemType::Container;
    case ServerItemGroup::Splash: return ServerItemType::Splash;
    case ServerItemGroup::Fluid: return ServerItemType::Fluid;
    case ServerItemGroup::Deprecated: return ServerItemType::Deprecated;
    default: break;
    }
    return ServerItemType::None;
}

std::string_view to_string(ServerItemType type) { return magic_enum::enum_name(type); }

}
