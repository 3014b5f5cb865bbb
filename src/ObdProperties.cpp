/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ObdProperties.hpp"
#include "common/ByteReader.hpp"
#include "common/ByteWriter.hpp"

#include <fmt/format.h>

namespace otitems {

namespace {

using Flag = ObdPropertyFlag;

void write_flag(ByteWriter &writer, Flag flag) { writer.write_u8(static_cast<byte>(flag)); }

void write_flag_if(ByteWriter &writer, bool set, Flag flag) {
    if (set)
        write_flag(writer, flag);
}

void write_flag_u16(ByteWriter &writer, Flag flag, uint16_t value) {
    write_flag(writer, flag);
    writer.write_u16(value);
}

}

void read_obd_properties(ByteReader &reader, ThingType &thing) {
    try {
        for (;;) {
            auto flag = reader.read_u8();
            switch (static_cast<Flag>(flag)) {
            case Flag::LastFlag: return;
            case Flag::Ground:
                thing.is_ground = true;
                thing.ground_speed = reader.read_u16();
                break;
            case Flag::GroundBorder: thing.is_ground_border = true; break;
            case Flag::OnBottom: thing.is_on_bottom = true; break;
            case Flag::OnTop: thing.is_on_top = true; break;
            case Flag::Container: thing.is_container = true; break;
            case Flag::Stackable: thing.stackable = true; break;
            case Flag::ForceUse: thing.force_use = true; break;
            case Flag::MultiUse: thing.multi_use = true; break;
            case Flag::Writable:
                thing.writable = true;
                thing.max_read_write_chars = reader.read_u16();
                break;
            case Flag::WritableOnce:
                thing.writable_once = true;
                thing.max_read_chars = reader.read_u16();
                break;
            case Flag::FluidContainer: thing.is_fluid_container = true; break;
            case Flag::Fluid: thing.is_fluid = true; break;
            case Flag::Unpassable: thing.is_unpassable = true; break;
            case Flag::Unmoveable: thing.is_unmoveable = true; break;
            case Flag::BlockMissile: thing.block_missile = true; break;
            case Flag::BlockPathfind: thing.block_pathfind = true; break;
            case Flag::NoMoveAnimation: thing.no_move_animation = true; break;
            case Flag::Pickupable: thing.pickupable = true; break;
            case Flag::Hangable: thing.hangable = true; break;
            case Flag::HookSouth: thing.is_vertical = true; break;
            case Flag::HookEast: thing.is_horizontal = true; break;
            case Flag::Rotatable: thing.rotatable = true; break;
            case Flag::HasLight:
                thing.has_light = true;
                thing.light_level = reader.read_u16();
                thing.light_color = reader.read_u16();
                break;
            case Flag::DontHide: thing.dont_hide = true; break;
            case Flag::Translucent: thing.is_translucent = true; break;
            case Flag::HasOffset:
                thing.has_offset = true;
                thing.offset_x = reader.read_i16();
                thing.offset_y = reader.read_i16();
                break;
            case Flag::HasElevation:
                thing.has_elevation = true;
                thing.elevation = reader.read_u16();
                break;
            case Flag::LyingObject: thing.is_lying_object = true; break;
            case Flag::AnimateAlways: thing.animate_always = true; break;
            case Flag::MiniMap:
                thing.mini_map = true;
                thing.mini_map_color = reader.read_u16();
                break;
            case Flag::LensHelp:
                thing.is_lens_help = true;
                thing.lens_help = reader.read_u16();
                break;
            case Flag::FullGround: thing.is_full_ground = true; break;
            case Flag::IgnoreLook: thing.ignore_look = true; break;
            case Flag::Cloth:
                thing.cloth = true;
                thing.cloth_slot = reader.read_u16();
                break;
            case Flag::MarketItem:
                thing.is_market_item = true;
                thing.market_category = reader.read_u16();
                thing.market_trade_as = reader.read_u16();
                thing.market_show_as = reader.read_u16();
                thing.market_name = reader.read_string(reader.read_u16());
                thing.market_restrict_profession = reader.read_u16();
                thing.market_restrict_level = reader.read_u16();
                break;
            case Flag::DefaultAction:
                thing.has_default_action = true;
                thing.default_action = reader.read_u16();
                break;
            case Flag::Wrappable: thing.wrappable = true; break;
            case Flag::Unwrappable: thing.unwrappable = true; break;
            case Flag::TopEffect: thing.top_effect = true; break;
            case Flag::HasCharges: thing.has_charges = true; break;
            case Flag::FloorChange: thing.floor_change = true; break;
            case Flag::Usable: thing.usable = true; break;
            default: throw ObdError(fmt::format("Unknown OBD property flag 0x{:x}", flag));
            }
        }
    } catch (const TruncatedData &e) {
        throw ObdError(fmt::format("OBD: truncated properties for thing {}: {}", thing.id, e.what()));
    }
}

void read_obd_properties(gsl::span<const byte> data, ThingType &thing) {
    ByteReader reader(data);
    read_obd_properties(reader, thing);
}

void write_obd_properties(ByteWriter &writer, const ThingType &thing) {
    if (thing.is_ground)
        write_flag_u16(writer, Flag::Ground, thing.ground_speed);
    else if (thing.is_ground_border)
        write_flag(writer, Flag::GroundBorder);
    else if (thing.is_on_bottom)
        write_flag(writer, Flag::OnBottom);
    else if (thing.is_on_top)
        write_flag(writer, Flag::OnTop);

    write_flag_if(writer, thing.is_container, Flag::Container);
    write_flag_if(writer, thing.stackable, Flag::Stackable);
    write_flag_if(writer, thing.force_use, Flag::ForceUse);
    write_flag_if(writer, thing.multi_use, Flag::MultiUse);
    if (thing.writable)
        write_flag_u16(writer, Flag::Writable, thing.max_read_write_chars);
    if (thing.writable_once)
        write_flag_u16(writer, Flag::WritableOnce, thing.max_read_chars);
    write_flag_if(writer, thing.is_fluid_container, Flag::FluidContainer);
    write_flag_if(writer, thing.is_fluid, Flag::Fluid);
    write_flag_if(writer, thing.is_unpassable, Flag::Unpassable);
    write_flag_if(writer, thing.is_unmoveable, Flag::Unmoveable);
    write_flag_if(writer, thing.block_missile, Flag::BlockMissile);
    write_flag_if(writer, thing.block_pathfind, Flag::BlockPathfind);
    write_flag_if(writer, thing.no_move_animation, Flag::NoMoveAnimation);
    write_flag_if(writer, thing.pickupable, Flag::Pickupable);
    write_flag_if(writer, thing.hangable, Flag::Hangable);
    write_flag_if(writer, thing.is_vertical, Flag::HookSouth);
    write_flag_if(writer, thing.is_horizontal, Flag::HookEast);
    write_flag_if(writer, thing.rotatable, Flag::Rotatable);
    if (thing.has_light) {
        write_flag_u16(writer, Flag::HasLight, thing.light_level);
        writer.write_u16(thing.light_color);
    }
    write_flag_if(writer, thing.dont_hide, Flag::DontHide);
    write_flag_if(writer, thing.is_translucent, Flag::Translucent);
    if (thing.has_offset) {
        write_flag(writer, Flag::HasOffset);
        writer.write_i16(thing.offset_x);
        writer.write_i16(thing.offset_y);
    }
    if (thing.has_elevation)
        write_flag_u16(writer, Flag::HasElevation, thing.elevation);
    write_flag_if(writer, thing.is_lying_object, Flag::LyingObject);
    write_flag_if(writer, thing.animate_always, Flag::AnimateAlways);
    if (thing.mini_map)
        write_flag_u16(writer, Flag::MiniMap, thing.mini_map_color);
    if (thing.is_lens_help)
        write_flag_u16(writer, Flag::LensHelp, thing.lens_help);
    write_flag_if(writer, thing.is_full_ground, Flag::FullGround);
    write_flag_if(writer, thing.ignore_look, Flag::IgnoreLook);
    if (thing.cloth)
        write_flag_u16(writer, Flag::Cloth, thing.cloth_slot);
    if (thing.is_market_item) {
        if (thing.market_name.size() > 0xffff)
            throw ObdError(fmt::format("OBD: market name of thing {} is too long", thing.id));
        write_flag_u16(writer, Flag::MarketItem, thing.market_category);
        writer.write_u16(thing.market_trade_as);
        writer.write_u16(thing.market_show_as);
        writer.write_u16(static_cast<uint16_t>(thing.market_name.size()));
        writer.write_string(thing.market_name);
        writer.write_u16(thing.market_restrict_profession);
        writer.write_u16(thing.market_restrict_level);
    }
    if (thing.has_default_action)
        write_flag_u16(writer, Flag::DefaultAction, thing.default_action);
    write_flag_if(writer, thing.wrappable, Flag::Wrappable);
    write_flag_if(writer, thing.unwrappable, Flag::Unwrappable);
    // Only effects carry the top effect property.
    write_flag_if(writer, thing.top_effect && thing.category == ThingCategory::Effect, Flag::TopEffect);
    write_flag_if(writer, thing.has_charges, Flag::HasCharges);
    write_flag_if(writer, thing.floor_change, Flag::FloorChange);
    write_flag_if(writer, thing.usable, Flag::Usable);
    write_flag(writer, Flag::LastFlag);
}

Bytes write_obd_properties(const ThingType &thing) {
    ByteWriter writer;
    write_obd_properties(writer, thing);
    return writer.release();
}

}
