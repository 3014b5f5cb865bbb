/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace otitems {

enum class ThingCategory { Item = 1, Outfit = 2, Effect = 3, Missile = 4 };

enum class FrameGroupType : uint8_t { Default = 0, Walking = 1 };

// Animation geometry of one frame group of a client appearance.
struct FrameGroup {
    static inline constexpr uint8_t DefaultSize = 32;

    FrameGroupType type{FrameGroupType::Default};
    uint8_t width{1};
    uint8_t height{1};
    uint8_t exact_size{DefaultSize};
    uint8_t layers{1};
    uint8_t pattern_x{1};
    uint8_t pattern_y{1};
    uint8_t pattern_z{1};
    uint8_t frames{1};
    std::vector<uint32_t> sprite_index;

    // Sprites in the first frame of the first pattern.
    [[nodiscard]] size_t sprites_per_frame() const noexcept { return size_t{width} * height * layers; }
    [[nodiscard]] size_t total_sprites() const noexcept {
        return sprites_per_frame() * pattern_x * pattern_y * pattern_z * frames;
    }
};

// A client-side appearance record, as far as server item synchronisation is concerned.
struct ThingType {
    uint32_t id{};
    ThingCategory category{ThingCategory::Item};
    std::string name;

    bool is_ground{};
    uint16_t ground_speed{};
    bool is_ground_border{};
    bool is_on_bottom{};
    bool is_on_top{};
    bool is_container{};
    bool stackable{};
    bool force_use{};
    bool multi_use{};
    bool has_charges{};
    bool writable{};
    bool writable_once{};
    uint16_t max_read_write_chars{};
    uint16_t max_read_chars{};
    bool is_fluid_container{};
    bool is_fluid{};
    bool is_unpassable{};
    bool is_unmoveable{};
    bool block_missile{};
    bool block_pathfind{};
    bool no_move_animation{};
    bool pickupable{};
    bool hangable{};

    // Hook south.
    bool is_vertical{};
    // Hook east.
    bool is_horizontal{};
    bool rotatable{};
    bool has_light{};
    uint16_t light_level{};
    uint16_t light_color{};
    bool dont_hide{};
    bool is_translucent{};
    bool floor_change{};

    bool has_offset{};
    int16_t offset_x{};
    int16_t offset_y{};

    bool has_elevation{};
    uint16_t elevation{};

    bool is_lying_object{};
    bool animate_always{};
    bool mini_map{};
    uint16_t mini_map_color{};
    bool is_lens_help{};
    uint16_t lens_help{};
    bool is_full_ground{};
    bool ignore_look{};

    bool cloth{};
    uint16_t cloth_slot{};

    bool is_market_item{};
    std::string market_name;
    uint16_t market_category{};
    uint16_t market_trade_as{};
    uint16_t market_show_as{};
    uint16_t market_restrict_profession{};
    uint16_t market_restrict_level{};

    bool has_default_action{};
    uint16_t default_action{};

    bool wrappable{};
    bool unwrappable{};
    bool top_effect{};
    bool usable{};

    std::map<FrameGroupType, FrameGroup> frame_groups;

    [[nodiscard]] const FrameGroup *default_frame_group() const {
        auto it = frame_groups.find(FrameGroupType::Default);
        return it == frame_groups.end() ? nullptr : &it->second;
    }
};

}
