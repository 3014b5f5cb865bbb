/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "OtbReader.hpp"
#include "OtbWriter.hpp"
#include "common/ByteWriter.hpp"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace otitems;

namespace {

Logger logger = logger_for("OtbCodecTest");

ServerItem make_item(uint16_t id, uint16_t client_id, ServerItemType type = ServerItemType::None) {
    ServerItem item;
    item.id = id;
    item.client_id = client_id;
    item.type = type;
    item.sprite_hash = Md5Digest{};
    return item;
}

ServerItemList sample_items() {
    ServerItemList items;
    items.version = {3, 62, 78, 1098};

    auto ground = make_item(100, 200, ServerItemType::Ground);
    ground.ground_speed = 150;
    ground.minimap_color = 24;
    ground.full_ground = true;
    ground.movable = false;
    items.add(ground);

    auto sign = make_item(101, 201);
    sign.name = "Sign & <Board>";
    sign.readable = true;
    sign.max_read_chars = 100;
    sign.max_read_write_chars = 200;
    sign.stack_order = TileStackOrder::Top;
    sign.has_stack_order = true;
    sign.light_level = 3;
    sign.light_color = 215;
    sign.trade_as = 3031;
    sign.sprite_hash = Md5Digest{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};
    items.add(sign);

    auto chest = make_item(102, 202, ServerItemType::Container);
    chest.pickupable = true;
    chest.hangable = true;
    chest.hook_east = true;
    chest.force_use = true;
    chest.ignore_look = true;
    chest.is_animation = true;
    items.add(chest);

    ServerItem old;
    old.id = 103;
    old.type = ServerItemType::Deprecated;
    items.add(old);
    return items;
}

void check_same(const ServerItem &actual, const ServerItem &expected) {
    CHECK(actual.id == expected.id);
    CHECK(actual.client_id == expected.client_id);
    CHECK(actual.type == expected.type);
    CHECK(actual.flags() == expected.flags());
    CHECK(actual.stack_order == expected.stack_order);
    CHECK(actual.has_stack_order == expected.has_stack_order);
    CHECK(actual.ground_speed == expected.ground_speed);
    CHECK(actual.light_level == expected.light_level);
    CHECK(actual.light_color == expected.light_color);
    CHECK(actual.max_read_chars == expected.max_read_chars);
    CHECK(actual.max_read_write_chars == expected.max_read_write_chars);
    CHECK(actual.minimap_color == expected.minimap_color);
    CHECK(actual.trade_as == expected.trade_as);
    CHECK(actual.name == expected.name);
    CHECK(actual.sprite_hash == expected.sprite_hash);
}

// A hand-assembled OTB: header, root node with a VERSION attribute of the given size, then one node per item
// payload. Payloads must not contain bytes needing escapes.
Bytes raw_otb(const std::vector<Bytes> &item_payloads, uint16_t version_size = 140) {
    ByteWriter writer;
    writer.write_u32(0);
    writer.write_u8(0xfe);
    writer.write_u8(0x00);
    writer.write_u32(0);
    writer.write_u8(0x01);
    writer.write_u16(version_size);
    for (uint16_t i = 0; i < version_size; ++i)
        writer.write_u8(0);
    for (const auto &payload : item_payloads) {
        writer.write_u8(0xfe);
        writer.write_bytes(payload);
        writer.write_u8(0xff);
    }
    writer.write_u8(0xff);
    return writer.release();
}

// Ground item 100, client id 200, speed 150.
const Bytes ground_payload{0x01, 0x00, 0x00, 0x00, 0x00, 0x10, 0x02, 0x00, 0x64, 0x00,
                           0x11, 0x02, 0x00, 0xc8, 0x00, 0x14, 0x02, 0x00, 0x96, 0x00};

}

TEST_CASE("otb round trip") {
    const auto items = sample_items();
    const auto bytes = write_otb(items);
    const auto read = read_otb(bytes, logger);

    SECTION("keeps the version") {
        CHECK(read.version.major_version == 3);
        CHECK(read.version.minor_version == 62);
        CHECK(read.version.build_number == 78);
        CHECK(read.version.client_version == 1098);
    }
    SECTION("keeps every item field") {
        REQUIRE(read.size() == items.size());
        for (const auto *item : items.to_array()) {
            INFO("item " << item->id);
            const auto *round_tripped = read.get_by_id(item->id);
            REQUIRE(round_tripped);
            check_same(*round_tripped, *item);
        }
    }
    SECTION("writes identical bytes every time") { CHECK(write_otb(read) == bytes); }
    SECTION("starts with a zero header and the root node") {
        REQUIRE(bytes.size() > 5);
        CHECK(bytes[0] == 0);
        CHECK(bytes[1] == 0);
        CHECK(bytes[2] == 0);
        CHECK(bytes[3] == 0);
        CHECK(bytes[4] == 0xfe);
        CHECK(bytes.back() == 0xff);
    }
}

TEST_CASE("otb escaping") {
    ServerItemList items;
    auto item = make_item(100, 0xfffe);
    item.sprite_hash = Md5Digest{0xfd, 0xfe, 0xff, 0x00, 0xff, 0xff, 0xfe, 0xfd, 1, 2, 3, 4, 5, 6, 7, 8};
    item.trade_as = 0xfdfe;
    items.add(item);

    const auto bytes = write_otb(items);
    SECTION("escapes marker bytes inside payloads") {
        const Bytes escaped{0xfd, 0xfd, 0xfd, 0xfe, 0xfd, 0xff, 0x00};
        CHECK(std::search(bytes.begin(), bytes.end(), escaped.begin(), escaped.end()) != bytes.end());
    }
    SECTION("reads escaped bytes back exactly") {
        const auto read = read_otb(bytes, logger);
        const auto *round_tripped = read.get_by_id(100);
        REQUIRE(round_tripped);
        CHECK(round_tripped->sprite_hash == item.sprite_hash);
        CHECK(round_tripped->client_id == 0xfffe);
        CHECK(round_tripped->trade_as == 0xfdfe);
    }
}

TEST_CASE("otb reader") {
    SECTION("reads a hand built file") {
        const auto items = read_otb(raw_otb({ground_payload}), logger);
        REQUIRE(items.size() == 1);
        const auto *ground = items.get_by_id(100);
        REQUIRE(ground);
        CHECK(ground->type == ServerItemType::Ground);
        CHECK(ground->client_id == 200);
        CHECK(ground->ground_speed == 150);
        CHECK(items.version.client_version == 0);
    }
    SECTION("fills in a zero sprite hash when none is stored") {
        const auto items = read_otb(raw_otb({ground_payload}), logger);
        CHECK(items.get_by_id(100)->sprite_hash == Md5Digest{});
    }
    SECTION("leaves deprecated items without a sprite hash") {
        const Bytes deprecated{0x0e, 0x00, 0x00, 0x00, 0x00, 0x10, 0x02, 0x00, 0x65, 0x00};
        const auto items = read_otb(raw_otb({deprecated}), logger);
        const auto *item = items.get_by_id(101);
        REQUIRE(item);
        CHECK(item->is_deprecated());
        CHECK(!item->sprite_hash);
    }
    SECTION("skips unknown attributes") {
        auto payload = ground_payload;
        payload.insert(payload.begin() + 10, {0x7f, 0x03, 0x00, 0xaa, 0xbb, 0xcc});
        const auto items = read_otb(raw_otb({payload}), logger);
        const auto *ground = items.get_by_id(100);
        REQUIRE(ground);
        CHECK(ground->client_id == 200);
        CHECK(ground->ground_speed == 150);
    }
    SECTION("maps unlisted groups to no type") {
        auto payload = ground_payload;
        payload[0] = 0x03;
        const auto items = read_otb(raw_otb({payload}), logger);
        CHECK(items.get_by_id(100)->type == ServerItemType::None);
    }
    SECTION("sets has_stack_order when the stack order is stored") {
        auto payload = ground_payload;
        payload.insert(payload.end(), {0x2b, 0x01, 0x00, 0x02});
        const auto items = read_otb(raw_otb({payload}), logger);
        CHECK(items.get_by_id(100)->stack_order == TileStackOrder::Bottom);
        CHECK(items.get_by_id(100)->has_stack_order);
    }
}

TEST_CASE("otb reader failures") {
    SECTION("version attribute must be 140 bytes") {
        CHECK_THROWS_WITH(read_otb(raw_otb({}, 139), logger), "OTB: invalid version header size: 139");
    }
    SECTION("no root node") { CHECK_THROWS_WITH(read_otb(Bytes{0, 0, 0, 0}, logger), "OTB: missing root node"); }
    SECTION("buffer shorter than the header") { CHECK_THROWS_AS(read_otb(Bytes{0, 0}, logger), OtbError); }
    SECTION("unterminated root node") {
        auto bytes = raw_otb({ground_payload});
        bytes.pop_back();
        CHECK_THROWS_AS(read_otb(bytes, logger), OtbError);
    }
    SECTION("data after the root node") {
        auto bytes = raw_otb({ground_payload});
        bytes.push_back(0x00);
        bytes.push_back(0xfe);
        CHECK_THROWS_WITH(read_otb(bytes, logger), "OTB: 2 unexpected byte(s) after the root node");
    }
    SECTION("root node of another type") {
        auto bytes = raw_otb({ground_payload});
        REQUIRE(bytes[5] == 0x00);
        bytes[5] = 0x01;
        CHECK_THROWS_WITH(read_otb(bytes, logger), "OTB: root node has type 1, expected 0");
    }
    SECTION("unterminated item node") {
        auto bytes = raw_otb({ground_payload});
        bytes.resize(bytes.size() - 2);
        CHECK_THROWS_AS(read_otb(bytes, logger), OtbError);
    }
    SECTION("attribute longer than its node") {
        Bytes payload{0x01, 0x00, 0x00, 0x00, 0x00, 0x10, 0x04, 0x00, 0x64, 0x00};
        CHECK_THROWS_AS(read_otb(raw_otb({payload}), logger), OtbError);
    }
    SECTION("sprite hash of the wrong size") {
        Bytes payload{0x01, 0x00, 0x00, 0x00, 0x00, 0x10, 0x02, 0x00, 0x64, 0x00, 0x20, 0x02, 0x00, 0x01, 0x02};
        CHECK_THROWS_AS(read_otb(raw_otb({payload}), logger), OtbError);
    }
}

TEST_CASE("otb writer") {
    SECTION("records the client version in the version string") {
        ServerItemList items;
        items.version = {1, 2, 3, 860};
        const auto bytes = write_otb(items);
        const std::string csd = "OTB 1.2.3-8.60";
        CHECK(std::search(bytes.begin(), bytes.end(), csd.begin(), csd.end()) != bytes.end());
        CHECK(read_otb(bytes, logger).version.client_version == 860);
    }
    SECTION("writes only the server id for deprecated items") {
        ServerItemList items;
        ServerItem old;
        old.id = 100;
        old.client_id = 55;
        old.type = ServerItemType::Deprecated;
        old.name = "gone";
        old.sprite_hash = Md5Digest{};
        items.add(old);
        const auto read = read_otb(write_otb(items), logger);
        const auto *item = read.get_by_id(100);
        REQUIRE(item);
        CHECK(item->client_id == 0);
        CHECK(item->name.empty());
        CHECK(!item->sprite_hash);
    }
    SECTION("writes items in id order whatever order they were added") {
        ServerItemList forwards;
        ServerItemList backwards;
        for (uint16_t id = 100; id < 105; ++id)
            forwards.add(make_item(id, static_cast<uint16_t>(id + 100)));
        for (uint16_t id = 104; id >= 100; --id)
            backwards.add(make_item(id, static_cast<uint16_t>(id + 100)));
        CHECK(write_otb(forwards) == write_otb(backwards));
    }
}
