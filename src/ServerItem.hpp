/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "common/Md5.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace otitems {

// Server-side item classification, as stored in the OTB item node's group byte.
enum class ServerItemType { None = 0, Ground = 1, Container = 2, Fluid = 3, Splash = 4, Deprecated = 5 };

// The group codes the OTB format uses on disk. Only a subset maps to a ServerItemType.
enum class ServerItemGroup : uint8_t {
    None = 0,
    Ground = 1,
    Container = 2,
    Weapon = 3,
    Ammunition = 4,
    Armor = 5,
    Changes = 6,
    Teleport = 7,
    MagicField = 8,
    Writable = 9,
    Key = 10,
    Splash = 11,
    Fluid = 12,
    Door = 13,
    Deprecated = 14
};

// Tile rendering order.
enum class TileStackOrder : uint8_t { None = 0, Border = 1, Bottom = 2, Top = 3 };

// Bits of the OTB item flags word.
enum class ServerItemFlag : uint32_t {
    Unpassable = 1u << 0u,
    BlockMissiles = 1u << 1u,
    BlockPathfinder = 1u << 2u,
    HasElevation = 1u << 3u,
    MultiUse = 1u << 4u,
    Pickupable = 1u << 5u,
    Movable = 1u << 6u,
    Stackable = 1u << 7u,
    FloorChangeDown = 1u << 8u,
    FloorChangeNorth = 1u << 9u,
    FloorChangeEast = 1u << 10u,
    FloorChangeSouth = 1u << 11u,
    FloorChangeWest = 1u << 12u,
    StackOrder = 1u << 13u,
    Readable = 1u << 14u,
    Rotatable = 1u << 15u,
    Hangable = 1u << 16u,
    HookEast = 1u << 17u,
    HookSouth = 1u << 18u,
    CanNotDecay = 1u << 19u,
    AllowDistanceRead = 1u << 20u,
    Unused = 1u << 21u,
    ClientCharges = 1u << 22u,
    IgnoreLook = 1u << 23u,
    IsAnimation = 1u << 24u,
    FullGround = 1u << 25u,
    ForceUse = 1u << 26u
};

// Key under which a nested items.xml attribute keeps its own value.
static inline constexpr std::string_view ParentValueKey = "_parentValue";

// A nested items.xml attribute: child key to value, plus optionally ParentValueKey.
using XmlAttributeRecord = std::map<std::string, std::string>;
using XmlAttributeValue = std::variant<std::string, XmlAttributeRecord>;
using XmlAttributes = std::map<std::string, XmlAttributeValue>;

// One server-visible object definition.
struct ServerItem {
    uint16_t id{};
    uint16_t client_id{};
    uint16_t previous_client_id{};
    ServerItemType type{ServerItemType::None};
    TileStackOrder stack_order{TileStackOrder::None};
    bool has_stack_order{};
    std::string name;
    // Absent only for deprecated items.
    std::optional<Md5Digest> sprite_hash;
    bool sprite_assigned{};
    bool is_custom_created{};

    bool unpassable{};
    bool block_missiles{};
    bool block_pathfinder{};
    bool has_elevation{};
    bool force_use{};
    bool multi_use{};
    bool pickupable{};
    bool movable{true};
    bool stackable{};
    bool readable{};
    bool rotatable{};
    bool hangable{};
    bool hook_south{};
    bool hook_east{};
    bool has_charges{};
    bool ignore_look{};
    bool allow_distance_read{};
    bool is_animation{};
    bool full_ground{};

    uint16_t ground_speed{};
    uint16_t light_level{};
    uint16_t light_color{};
    uint16_t max_read_chars{};
    uint16_t max_read_write_chars{};
    uint16_t minimap_color{};
    uint16_t trade_as{};

    XmlAttributes xml_attributes;

    // The OTB flags word for the boolean properties above.
    [[nodiscard]] uint32_t flags() const;
    void set_flags(uint32_t flags);

    [[nodiscard]] bool has_xml_data() const noexcept { return !xml_attributes.empty(); }
    // Returns the attribute if it is present and a plain string.
    [[nodiscard]] std::optional<std::string> xml_attribute_string(std::string_view key) const;
    void set_xml_attribute(std::string key, XmlAttributeValue value);

    [[nodiscard]] bool is_deprecated() const noexcept { return type == ServerItemType::Deprecated; }
};

[[nodiscard]] ServerItemGroup group_for(ServerItemType type) noexcept;
[[nodiscard]] ServerItemType type_for(uint8_t group) noexcept;

[[nodiscard]] std::string_view to_string(ServerItemType type);

}
