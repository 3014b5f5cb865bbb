#include "ObdProperties.hpp"
#include "common/ByteReader.hpp"

#include <catch2/catch.hpp>

using namespace otitems;

TEST_CASE("obd property writing") {
    ThingType thing;
    thing.id = 100;

    SECTION("nothing set") { CHECK(write_obd_properties(thing) == Bytes{0xff}); }
    SECTION("ground with speed") {
        thing.is_ground = true;
        thing.ground_speed = 0x0096;
        CHECK(write_obd_properties(thing) == Bytes{0x00, 0x96, 0x00, 0xff});
    }
    SECTION("only one of the ground kinds is written") {
        thing.is_ground = true;
        thing.is_on_top = true;
        thing.is_on_bottom = true;
        CHECK(write_obd_properties(thing) == Bytes{0x00, 0x00, 0x00, 0xff});
        thing.is_ground = false;
        CHECK(write_obd_properties(thing) == Bytes{0x02, 0xff});
    }
    SECTION("light carries level and colour") {
        thing.has_light = true;
        thing.light_level = 7;
        thing.light_color = 215;
        CHECK(write_obd_properties(thing) == Bytes{0x16, 0x07, 0x00, 0xd7, 0x00, 0xff});
    }
    SECTION("negative offsets") {
        thing.has_offset = true;
        thing.offset_x = -8;
        thing.offset_y = 8;
        CHECK(write_obd_properties(thing) == Bytes{0x19, 0xf8, 0xff, 0x08, 0x00, 0xff});
    }
    SECTION("market name has a two byte length") {
        thing.is_market_item = true;
        thing.market_category = 1;
        thing.market_trade_as = 2;
        thing.market_show_as = 3;
        thing.market_name = "axe";
        thing.market_restrict_profession = 4;
        thing.market_restrict_level = 5;
        CHECK(write_obd_properties(thing)
              == Bytes{0x22, 0x01, 0x00, 0x02, 0x00, 0x03, 0x00, 0x03, 0x00, 'a', 'x', 'e', 0x04, 0x00, 0x05, 0x00,
                       0xff});
    }
    SECTION("top effect only for effects") {
        thing.top_effect = true;
        CHECK(write_obd_properties(thing) == Bytes{0xff});
        thing.category = ThingCategory::Effect;
        CHECK(write_obd_properties(thing) == Bytes{0x26, 0xff});
    }
    SECTION("legacy flags follow the regular ones") {
        thing.usable = true;
        thing.has_charges = true;
        thing.stackable = true;
        CHECK(write_obd_properties(thing) == Bytes{0x05, 0xfc, 0xfe, 0xff});
    }
}

TEST_CASE("obd property reading") {
    ThingType thing;

    SECTION("restores what was written") {
        ThingType original;
        original.is_container = true;
        original.writable = true;
        original.max_read_write_chars = 1024;
        original.writable_once = true;
        original.max_read_chars = 512;
        original.has_elevation = true;
        original.elevation = 8;
        original.mini_map = true;
        original.mini_map_color = 86;
        original.is_lens_help = true;
        original.lens_help = 1112;
        original.cloth = true;
        original.cloth_slot = 9;
        original.has_default_action = true;
        original.default_action = 2;
        original.is_vertical = true;
        original.floor_change = true;

        read_obd_properties(write_obd_properties(original), thing);
        CHECK(thing.is_container);
        CHECK(thing.writable);
        CHECK(thing.max_read_write_chars == 1024);
        CHECK(thing.writable_once);
        CHECK(thing.max_read_chars == 512);
        CHECK(thing.elevation == 8);
        CHECK(thing.mini_map_color == 86);
        CHECK(thing.lens_help == 1112);
        CHECK(thing.cloth_slot == 9);
        CHECK(thing.default_action == 2);
        CHECK(thing.is_vertical);
        CHECK(!thing.is_horizontal);
        CHECK(thing.floor_change);
        CHECK(!thing.is_ground);
    }
    SECTION("market item") {
        const Bytes data{0x22, 0x03, 0x00, 0x10, 0x27, 0x00, 0x00, 0x02, 0x00, 'h', 'i', 0x00, 0x00, 0x08, 0x00, 0xff};
        read_obd_properties(data, thing);
        CHECK(thing.is_market_item);
        CHECK(thing.market_category == 3);
        CHECK(thing.market_trade_as == 10000);
        CHECK(thing.market_name == "hi");
        CHECK(thing.market_restrict_level == 8);
    }
    SECTION("stops at the last flag") {
        const Bytes data{0x05, 0xff, 0x42};
        ByteReader reader(data);
        read_obd_properties(reader, thing);
        CHECK(thing.stackable);
        CHECK(reader.remaining() == 1);
    }
    SECTION("unknown flag") {
        CHECK_THROWS_WITH(read_obd_properties(Bytes{0x05, 0x27, 0xff}, thing), "Unknown OBD property flag 0x27");
    }
    SECTION("truncated value") { CHECK_THROWS_AS(read_obd_properties(Bytes{0x00, 0x96}, thing), ObdError); }
    SECTION("missing terminator") { CHECK_THROWS_AS(read_obd_properties(Bytes{0x05, 0x06}, thing), ObdError); }
}
