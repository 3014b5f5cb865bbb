#include "ItemsXmlReader.hpp"
#include "ItemsXmlWriter.hpp"

#include <catch2/catch.hpp>

using namespace otitems;

namespace {

ServerItem &add_item(ServerItemList &items, uint16_t id) {
    ServerItem item;
    item.id = id;
    item.client_id = id;
    item.sprite_hash = Md5Digest{};
    return items.add(item);
}

ItemsXmlWriteOptions utf8() {
    ItemsXmlWriteOptions options;
    options.encoding = "UTF-8";
    return options;
}

}

TEST_CASE("items xml writer") {
    ServerItemList items;

    SECTION("empty list") {
        add_item(items, 100);
        CHECK(write_items_xml(items, utf8()) == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<items>\n</items>\n");
    }
    SECTION("declares the requested encoding") {
        CHECK(write_items_xml(items).rfind("<?xml version=\"1.0\" encoding=\"iso-8859-1\"?>\n", 0) == 0);
    }
    SECTION("tag attributes in configured order") {
        auto &item = add_item(items, 100);
        item.set_xml_attribute("name", "sword");
        item.set_xml_attribute("plural", "swords");
        item.set_xml_attribute("article", "a");
        CHECK(write_items_xml(items, utf8())
              == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<items>\n"
                 "\t<item id=\"100\" article=\"a\" name=\"sword\" plural=\"swords\" />\n"
                 "</items>\n");
    }
    SECTION("empty tag values are dropped except the name") {
        auto &item = add_item(items, 100);
        item.set_xml_attribute("name", "");
        item.set_xml_attribute("article", "");
        CHECK(write_items_xml(items, utf8()).find("\t<item id=\"100\" name=\"\" />\n") != std::string::npos);
    }
    SECTION("nested attributes alphabetically") {
        auto &item = add_item(items, 100);
        item.set_xml_attribute("name", "shield");
        item.set_xml_attribute("weight", "1000");
        item.set_xml_attribute("defense", "12");
        CHECK(write_items_xml(items, utf8())
              == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<items>\n"
                 "\t<item id=\"100\" name=\"shield\">\n"
                 "\t\t<attribute key=\"defense\" value=\"12\" />\n"
                 "\t\t<attribute key=\"weight\" value=\"1000\" />\n"
                 "\t</item>\n"
                 "</items>\n");
    }
    SECTION("prioritised attributes come first") {
        auto &item = add_item(items, 100);
        item.set_xml_attribute("weight", "1000");
        item.set_xml_attribute("defense", "12");
        item.set_xml_attribute("armor", "3");
        auto options = utf8();
        options.attribute_priority = {{"weight", 0}, {"defense", 1}};
        const auto xml = write_items_xml(items, options);
        const auto weight = xml.find("\"weight\"");
        const auto defense = xml.find("\"defense\"");
        const auto armor = xml.find("\"armor\"");
        CHECK(weight < defense);
        CHECK(defense < armor);
    }
    SECTION("records write their own value then children") {
        auto &item = add_item(items, 100);
        item.set_xml_attribute("absorbPercent",
                               XmlAttributeRecord{{"ice", "5"}, {std::string(ParentValueKey), "all"}, {"fire", "10"}});
        CHECK(write_items_xml(items, utf8())
              == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<items>\n"
                 "\t<item id=\"100\">\n"
                 "\t\t<attribute key=\"absorbPercent\" value=\"all\">\n"
                 "\t\t\t<attribute key=\"fire\" value=\"10\" />\n"
                 "\t\t\t<attribute key=\"ice\" value=\"5\" />\n"
                 "\t\t</attribute>\n"
                 "\t</item>\n"
                 "</items>\n");
    }
    SECTION("values are escaped") {
        auto &item = add_item(items, 100);
        item.set_xml_attribute("name", "\"fish & <chips>\"");
        CHECK(write_items_xml(items, utf8()).find("name=\"&quot;fish &amp; &lt;chips&gt;&quot;\"")
              != std::string::npos);
    }
}

TEST_CASE("items xml writer ranges") {
    ServerItemList items;
    for (uint16_t id = 100; id <= 102; ++id)
        add_item(items, id).set_xml_attribute("name", "wall");
    add_item(items, 103).set_xml_attribute("name", "door");
    add_item(items, 105).set_xml_attribute("name", "door");

    SECTION("identical consecutive items collapse") {
        CHECK(write_items_xml(items, utf8())
              == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<items>\n"
                 "\t<item fromid=\"100\" toid=\"102\" name=\"wall\" />\n"
                 "\t<item id=\"103\" name=\"door\" />\n"
                 "\t<item id=\"105\" name=\"door\" />\n"
                 "</items>\n");
    }
    SECTION("items without xml data break a range") {
        add_item(items, 104);
        const auto xml = write_items_xml(items, utf8());
        CHECK(xml.find("fromid=\"103\"") == std::string::npos);
        CHECK(xml.find("id=\"104\"") == std::string::npos);
    }
    SECTION("dialects without ranges write every id") {
        auto options = utf8();
        options.supports_from_to_id = false;
        const auto xml = write_items_xml(items, options);
        CHECK(xml.find("fromid") == std::string::npos);
        CHECK(xml.find("\t<item id=\"101\" name=\"wall\" />\n") != std::string::npos);
    }
    SECTION("reading the output restores every item") {
        const auto xml = write_items_xml(items, utf8());
        ServerItemList copy;
        for (uint16_t id = 100; id <= 105; ++id)
            add_item(copy, id);
        CHECK(read_items_xml(xml, copy).success);
        for (uint16_t id = 100; id <= 102; ++id)
            CHECK(copy.get_by_id(id)->xml_attribute_string("name") == "wall");
        CHECK(copy.get_by_id(103)->xml_attribute_string("name") == "door");
        CHECK(!copy.get_by_id(104)->has_xml_data());
    }
}

TEST_CASE("items xml write options from a dialect") {
    SECTION("tfs 1.4") {
        const auto schema = AttributeSchema::find("tfs1.4");
        REQUIRE(schema);
        const auto options = ItemsXmlWriteOptions::for_schema(*schema);
        CHECK(options.encoding == "iso-8859-1");
        CHECK(options.supports_from_to_id);
        CHECK(options.tag_attribute_keys == std::vector<std::string>{"article", "name", "plural", "editorsuffix"});
    }
    SECTION("tfs 0.3.6") {
        const auto schema = AttributeSchema::find("tfs0.3.6");
        REQUIRE(schema);
        const auto options = ItemsXmlWriteOptions::for_schema(*schema);
        CHECK(options.encoding == "utf-8");
        CHECK(!options.supports_from_to_id);
    }
}

TEST_CASE("items xml encoding") {
    const std::string text = "name=\"caf\xc3\xa9\"";
    CHECK(encode_items_xml(text, "utf-8") == text);
    CHECK(encode_items_xml(text, "UTF-8") == text);
    CHECK(encode_items_xml(text, "iso-8859-1") == "name=\"caf\xe9\"");
    CHECK(encode_items_xml("", "ISO-8859-1").empty());
    CHECK_THROWS_WITH(encode_items_xml(text, "koi8-r"), "Unsupported items.xml encoding 'koi8-r'");
    CHECK_THROWS_AS(encode_items_xml("\xe2\x82\xac", "iso-8859-1"), std::runtime_error);
}
