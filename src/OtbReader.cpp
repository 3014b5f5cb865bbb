/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "OtbReader.hpp"
#include "OtbFormat.hpp"
#include "common/ByteReader.hpp"
#include "common/string_utils.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <algorithm>
#include <charconv>
#include <string_view>

namespace otitems {

namespace {

// Reads the raw bytes of one node, starting just after its NodeStart marker.
OtbNode parse_node(ByteReader &reader) {
    OtbNode node;
    Bytes payload;
    for (;;) {
        const auto offset = reader.position();
        if (reader.at_end())
            throw OtbError(fmt::format("OTB: node starting before offset {} is not terminated", offset));
        const auto value = reader.read_u8();
        if (value == otb::NodeEnd)
            break;
        if (value == otb::NodeStart) {
            node.children.emplace_back(parse_node(reader));
        } else if (value == otb::Escape) {
            if (reader.at_end())
                throw OtbError(fmt::format("OTB: escape byte at offset {} has nothing to escape", offset));
            payload.push_back(reader.read_u8());
        } else {
            payload.push_back(value);
        }
    }
    if (payload.empty())
        throw OtbError(fmt::format("OTB: node ending at offset {} has no type byte", reader.position() - 1));
    node.type = payload.front();
    node.props.assign(payload.begin() + 1, payload.end());
    return node;
}

// The CSD string looks like "OTB 3.62.78-10.98"; recovers 1098 from it.
uint32_t client_version_from_csd(gsl::span<const byte> csd) {
    const auto text = std::string_view(reinterpret_cast<const char *>(csd.data()), csd.size());
    const auto printable = text.substr(0, text.find('\0'));
    const auto dash = printable.rfind('-');
    if (dash == std::string_view::npos)
        return 0;
    const auto version = printable.substr(dash + 1);
    const auto dot = version.find('.');
    if (dot == std::string_view::npos)
        return 0;
    const auto major = version.substr(0, dot);
    const auto minor = version.substr(dot + 1);
    if (!is_number(major) || !is_number(minor))
        return 0;
    uint32_t major_num{};
    uint32_t minor_num{};
    std::from_chars(major.data(), major.data() + major.size(), major_num);
    std::from_chars(minor.data(), minor.data() + minor.size(), minor_num);
    return major_num * 100 + minor_num;
}

void read_root_props(const OtbNode &root, ServerItemList &items) {
    ByteReader reader(root.props);
    reader.skip(4); // flags, unused
    if (reader.at_end())
        return;
    if (reader.read_u8() != magic_enum::enum_integer(otb::RootAttribute::Version))
        return;
    const auto length = reader.read_u16();
    if (length != otb::VersionAttributeSize)
        throw OtbError(fmt::format("OTB: invalid version header size: {}", length));
    items.version.major_version = reader.read_u32();
    items.version.minor_version = reader.read_u32();
    items.version.build_number = reader.read_u32();
    items.version.client_version = client_version_from_csd(reader.read_bytes(otb::CsdVersionSize));
}

uint16_t u16_of(gsl::span<const byte> data) {
    ByteReader reader(data);
    return reader.read_u16();
}

ServerItem read_item(const OtbNode &node, Logger &logger) {
    ServerItem item;
    item.type = type_for(node.type);

    ByteReader reader(node.props);
    item.set_flags(reader.read_u32());

    while (!reader.at_end()) {
        const auto attribute = reader.read_u8();
        const auto length = reader.read_u16();
        const auto data = reader.read_bytes(length);
        switch (static_cast<otb::ItemAttribute>(attribute)) {
        case otb::ItemAttribute::ServerId: item.id = u16_of(data); break;
        case otb::ItemAttribute::ClientId: item.client_id = u16_of(data); break;
        case otb::ItemAttribute::GroundSpeed: item.ground_speed = u16_of(data); break;
        case otb::ItemAttribute::Name:
            item.name.assign(reinterpret_cast<const char *>(data.data()), data.size());
            break;
        case otb::ItemAttribute::SpriteHash: {
            Md5Digest hash{};
            if (data.size() != hash.size())
                throw OtbError(fmt::format("OTB: sprite hash of item {} is {} bytes long", item.id, data.size()));
            std::copy(data.begin(), data.end(), hash.begin());
            item.sprite_hash = hash;
            break;
        }
        case otb::ItemAttribute::MinimapColor: item.minimap_color = u16_of(data); break;
        case otb::ItemAttribute::MaxReadWriteChars: item.max_read_write_chars = u16_of(data); break;
        case otb::ItemAttribute::MaxReadChars: item.max_read_chars = u16_of(data); break;
        case otb::ItemAttribute::Light: {
            ByteReader light(data);
            item.light_level = light.read_u16();
            item.light_color = light.read_u16();
            break;
        }
        case otb::ItemAttribute::StackOrder: {
            ByteReader order(data);
            const auto value = order.read_u8();
            const auto stack_order = magic_enum::enum_cast<TileStackOrder>(value);
            if (!stack_order)
                throw OtbError(fmt::format("OTB: item {} has unknown stack order {}", item.id, value));
            item.stack_order = *stack_order;
            item.has_stack_order = true;
            break;
        }
        case otb::ItemAttribute::TradeAs: item.trade_as = u16_of(data); break;
        default:
            logger.debug("Skipping unknown OTB attribute 0x{:02x} ({} bytes) on item {}", attribute, length, item.id);
            break;
        }
    }

    if (!item.sprite_hash && !item.is_deprecated())
        item.sprite_hash = Md5Digest{};
    return item;
}

}

OtbNode parse_otb_nodes(gsl::span<const byte> buffer) {
    ByteReader reader(buffer);
    if (reader.remaining() < otb::HeaderSize)
        throw OtbError(fmt::format("OTB: file is only {} bytes long", buffer.size()));
    reader.skip(otb::HeaderSize);
    if (reader.at_end() || reader.read_u8() != otb::NodeStart)
        throw OtbError("OTB: missing root node");
    auto root = parse_node(reader);
    if (root.type != otb::RootNodeType)
        throw OtbError(fmt::format("OTB: root node has type {}, expected {}", root.type, otb::RootNodeType));
    if (!reader.at_end())
        throw OtbError(fmt::format("OTB: {} unexpected byte(s) after the root node", reader.remaining()));
    return root;
}

ServerItemList read_otb(gsl::span<const byte> buffer, Logger &logger) {
    try {
        const auto root = parse_otb_nodes(buffer);
        ServerItemList items;
        read_root_props(root, items);
        for (const auto &child : root.children)
            items.add(read_item(child, logger));
        logger.info("Read {} server items from OTB {}.{}.{} (client {})", items.size(), items.version.major_version,
                    items.version.minor_version, items.version.build_number, items.version.client_version);
        return items;
    } catch (const TruncatedData &e) {
        throw OtbError(fmt::format("OTB: truncated node data: {}", e.what()));
    }
}

}
