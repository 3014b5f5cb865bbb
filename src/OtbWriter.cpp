/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "OtbWriter.hpp"
#include "OtbFormat.hpp"
#include "common/ByteWriter.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace otitems {

namespace {

void start_node(ByteWriter &writer, byte type) {
    writer.write_u8(otb::NodeStart);
    writer.write_escaped_u8(type);
}

void end_node(ByteWriter &writer) { writer.write_u8(otb::NodeEnd); }

void write_prop(ByteWriter &writer, byte attribute, gsl::span<const byte> data) {
    if (data.size() > std::numeric_limits<uint16_t>::max())
        throw std::length_error(fmt::format("OTB attribute 0x{:02x} is too long ({} bytes)", attribute, data.size()));
    writer.write_escaped_u8(attribute);
    writer.write_escaped_u16(static_cast<uint16_t>(data.size()));
    writer.write_escaped_bytes(data);
}

void write_prop(ByteWriter &writer, otb::ItemAttribute attribute, gsl::span<const byte> data) {
    write_prop(writer, magic_enum::enum_integer(attribute), data);
}

void write_u16_prop(ByteWriter &writer, otb::ItemAttribute attribute, uint16_t value) {
    ByteWriter data;
    data.write_u16(value);
    write_prop(writer, attribute, data.buffer());
}

void write_version(ByteWriter &writer, const OtbVersion &version) {
    ByteWriter data;
    data.write_u32(version.major_version);
    data.write_u32(version.minor_version);
    data.write_u32(version.build_number);
    auto csd = fmt::format("OTB {}.{}.{}-{}.{}", version.major_version, version.minor_version, version.build_number,
                           version.client_version / 100, version.client_version % 100);
    csd.resize(otb::CsdVersionSize, '\0');
    data.write_string(csd);
    write_prop(writer, magic_enum::enum_integer(otb::RootAttribute::Version), data.buffer());
}

void write_item(ByteWriter &writer, const ServerItem &item) {
    using otb::ItemAttribute;
    start_node(writer, magic_enum::enum_integer(group_for(item.type)));
    writer.write_escaped_u32(item.flags());

    write_u16_prop(writer, ItemAttribute::ServerId, item.id);
    if (!item.is_deprecated()) {
        write_u16_prop(writer, ItemAttribute::ClientId, item.client_id);
        if (item.sprite_hash)
            write_prop(writer, ItemAttribute::SpriteHash, *item.sprite_hash);
        if (item.minimap_color != 0)
            write_u16_prop(writer, ItemAttribute::MinimapColor, item.minimap_color);
        if (item.max_read_write_chars != 0)
            write_u16_prop(writer, ItemAttribute::MaxReadWriteChars, item.max_read_write_chars);
        if (item.max_read_chars != 0)
            write_u16_prop(writer, ItemAttribute::MaxReadChars, item.max_read_chars);
        if (item.light_level != 0 || item.light_color != 0) {
            ByteWriter light;
            light.write_u16(item.light_level);
            light.write_u16(item.light_color);
            write_prop(writer, ItemAttribute::Light, light.buffer());
        }
        if (item.type == ServerItemType::Ground)
            write_u16_prop(writer, ItemAttribute::GroundSpeed, item.ground_speed);
        if (item.stack_order != TileStackOrder::None) {
            const Bytes order{magic_enum::enum_integer(item.stack_order)};
            write_prop(writer, ItemAttribute::StackOrder, order);
        }
        if (item.trade_as != 0)
            write_u16_prop(writer, ItemAttribute::TradeAs, item.trade_as);
        if (!item.name.empty()) {
            ByteWriter name;
            name.write_string(item.name);
            write_prop(writer, ItemAttribute::Name, name.buffer());
        }
    }
    end_node(writer);
}

}

Bytes write_otb(const ServerItemList &items) {
    ByteWriter writer;
    writer.write_u32(0);
    start_node(writer, otb::RootNodeType);
    writer.write_escaped_u32(0); // flags, unused
    write_version(writer, items.version);
    for (const auto *item : items.to_array())
        write_item(writer, *item);
    end_node(writer);
    return writer.release();
}

}
