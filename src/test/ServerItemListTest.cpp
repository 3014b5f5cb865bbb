/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ServerItemList.hpp"

#include <catch2/catch.hpp>

#include <utility>

using namespace otitems;

namespace {

ServerItem make_item(uint16_t id, uint16_t client_id) {
    ServerItem item;
    item.id = id;
    item.client_id = client_id;
    item.sprite_hash = Md5Digest{};
    return item;
}

std::vector<uint16_t> ids_of(const std::vector<ServerItem *> &items) {
    std::vector<uint16_t> ids;
    for (const auto *item : items)
        ids.push_back(item->id);
    return ids;
}

}

TEST_CASE("server item list lookups") {
    ServerItemList items;
    items.add(make_item(100, 500));
    items.add(make_item(102, 501));
    items.add(make_item(101, 500));

    SECTION("by server id") {
        REQUIRE(items.get_by_id(101));
        CHECK(items.get_by_id(101)->client_id == 500);
        CHECK(!items.get_by_id(103));
        CHECK(items.has_item(102));
        CHECK(!items.has_item(99));
    }
    SECTION("by client id, in insertion order") {
        CHECK(ids_of(items.get_by_client_id(500)) == std::vector<uint16_t>{100, 101});
        CHECK(items.first_by_client_id(500)->id == 100);
        CHECK(items.get_by_client_id(999).empty());
        CHECK(!items.first_by_client_id(999));
        CHECK(items.has_client_id(501));
    }
    SECTION("replacing an item reindexes its client id") {
        items.add(make_item(100, 777));
        CHECK(items.size() == 3);
        CHECK(ids_of(items.get_by_client_id(500)) == std::vector<uint16_t>{101});
        CHECK(ids_of(items.get_by_client_id(777)) == std::vector<uint16_t>{100});
    }
    SECTION("removing an item drops it from both indices") {
        CHECK(items.remove(101));
        CHECK(!items.remove(101));
        CHECK(!items.has_item(101));
        CHECK(ids_of(items.get_by_client_id(500)) == std::vector<uint16_t>{100});
        CHECK(items.remove(100));
        CHECK(!items.has_client_id(500));
    }
    SECTION("to_array is sorted by id") {
        std::vector<uint16_t> ids;
        for (const auto *item : std::as_const(items).to_array())
            ids.push_back(item->id);
        CHECK(ids == std::vector<uint16_t>{100, 101, 102});
    }
    SECTION("clear empties everything") {
        items.clear();
        CHECK(items.empty());
        CHECK(!items.has_client_id(500));
    }
}

TEST_CASE("server item list id range") {
    ServerItemList items;
    SECTION("empty list reports the first server id") {
        CHECK(items.min_id() == ServerItemList::FirstServerId);
        CHECK(items.max_id() == ServerItemList::FirstServerId);
        CHECK(items.max_client_id() == 0);
    }
    SECTION("tracks the boundaries as items come and go") {
        items.add(make_item(150, 1));
        items.add(make_item(120, 9));
        items.add(make_item(130, 4));
        CHECK(items.min_id() == 120);
        CHECK(items.max_id() == 150);
        CHECK(items.max_client_id() == 9);
        items.remove(150);
        CHECK(items.max_id() == 130);
        items.remove(120);
        CHECK(items.min_id() == 130);
        CHECK(items.max_client_id() == 4);
    }
}

TEST_CASE("create missing items") {
    ServerItemList items;
    items.add(make_item(100, 1));
    items.add(make_item(101, 2));
    items.add(make_item(102, 3));

    SECTION("fills the client ids above the current highest") {
        CHECK(items.create_missing_items(6) == 3);
        CHECK(items.size() == 6);
        for (uint16_t client_id = 4; client_id <= 6; ++client_id) {
            INFO("client id " << client_id);
            const auto *created = items.first_by_client_id(client_id);
            REQUIRE(created);
            CHECK(created->id == 99 + client_id);
            CHECK(created->sprite_hash == Md5Digest{});
            CHECK(created->type == ServerItemType::None);
        }
    }
    SECTION("does nothing when every client id is present") { CHECK(items.create_missing_items(3) == 0); }
    SECTION("fails when server ids run out") {
        items.add(make_item(65535, 4));
        CHECK_THROWS_AS(items.create_missing_items(5), std::runtime_error);
    }
    SECTION("adds nothing when only some of the server ids are left") {
        items.add(make_item(65533, 4));
        CHECK_THROWS_AS(items.create_missing_items(7), std::runtime_error);
        CHECK(items.size() == 4);
        CHECK(items.max_id() == 65533);
        CHECK(items.max_client_id() == 4);
        CHECK(items.create_missing_items(6) == 2);
        CHECK(items.max_id() == 65535);
    }
}

TEST_CASE("server item flags") {
    SECTION("a default item is only movable") {
        ServerItem item;
        CHECK(item.flags() == static_cast<uint32_t>(ServerItemFlag::Movable));
    }
    SECTION("bits match the OTB layout") {
        ServerItem item;
        item.movable = false;
        item.unpassable = true;
        item.has_stack_order = true;
        item.force_use = true;
        CHECK(item.flags() == ((1u << 0u) | (1u << 13u) | (1u << 26u)));
    }
    SECTION("set_flags is the inverse of flags") {
        ServerItem item;
        item.set_flags(0x07ffffffu);
        CHECK(item.unpassable);
        CHECK(item.full_ground);
        CHECK(item.has_charges);
        CHECK(item.allow_distance_read);
        ServerItem copy;
        copy.set_flags(item.flags());
        CHECK(copy.flags() == item.flags());
    }
    SECTION("floor change bits are not kept") {
        ServerItem item;
        item.set_flags(static_cast<uint32_t>(ServerItemFlag::FloorChangeDown));
        CHECK(item.flags() == 0);
    }
}

TEST_CASE("server item groups") {
    CHECK(group_for(ServerItemType::Fluid) == ServerItemGroup::Fluid);
    CHECK(group_for(ServerItemType::Splash) == ServerItemGroup::Splash);
    CHECK(type_for(static_cast<uint8_t>(12)) == ServerItemType::Fluid);
    CHECK(type_for(static_cast<uint8_t>(11)) == ServerItemType::Splash);
    CHECK(type_for(static_cast<uint8_t>(14)) == ServerItemType::Deprecated);
    CHECK(type_for(static_cast<uint8_t>(9)) == ServerItemType::None);
    CHECK(to_string(ServerItemType::Ground) == "Ground");
}

TEST_CASE("server item xml attributes") {
    ServerItem item;
    CHECK(!item.has_xml_data());
    item.set_xml_attribute("name", std::string("sword"));
    item.set_xml_attribute("absorb", XmlAttributeRecord{{"fire", "10"}});
    CHECK(item.has_xml_data());
    CHECK(item.xml_attribute_string("name") == "sword");
    CHECK(!item.xml_attribute_string("absorb"));
    CHECK(!item.xml_attribute_string("missing"));
}
