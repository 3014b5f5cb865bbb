/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "AttributeSchema.hpp"
#include "common/string_utils.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <set>

using namespace otitems;

TEST_CASE("attribute servers") {
    SECTION("eight dialects, sorted") {
        CHECK(AttributeServers::available()
              == std::vector<std::string>{"tfs0.3.6", "tfs0.4", "tfs0.5", "tfs1.0", "tfs1.1", "tfs1.2", "tfs1.4",
                                          "tfs1.6"});
        CHECK(AttributeServers::all().size() == 8);
    }
    SECTION("labels") {
        const auto labels = AttributeServers::available_with_labels();
        REQUIRE(labels.size() == 8);
        CHECK(labels.front() == std::pair<std::string, std::string>{"tfs0.3.6", "TFS 0.3.6"});
        CHECK(AttributeServers::display_name("tfs1.4") == "TFS 1.4");
        CHECK(AttributeServers::display_name("mystery") == "mystery");
    }
    SECTION("range support") {
        CHECK(!AttributeServers::supports_from_to_id("tfs0.3.6"));
        CHECK(AttributeServers::supports_from_to_id("tfs0.4"));
        CHECK(AttributeServers::supports_from_to_id("tfs1.6"));
        CHECK(AttributeServers::supports_from_to_id("mystery"));
    }
    SECTION("encodings") {
        CHECK(AttributeServers::items_xml_encoding("tfs0.3.6") == "utf-8");
        CHECK(AttributeServers::items_xml_encoding("tfs1.2") == "utf-8");
        CHECK(AttributeServers::items_xml_encoding("tfs1.4") == "iso-8859-1");
        CHECK(AttributeServers::items_xml_encoding("mystery") == "iso-8859-1");
    }
    SECTION("metadata") {
        const auto metadata = AttributeServers::metadata("tfs1.6");
        REQUIRE(metadata);
        CHECK(metadata->server == "tfs1.6");
        CHECK(metadata->display_name == "TFS 1.6");
        CHECK(metadata->supports_from_to_id);
        CHECK(metadata->items_xml_encoding == "iso-8859-1");
        CHECK(!AttributeServers::metadata("mystery"));
    }
    SECTION("identical releases share their attributes") {
        const auto tfs04 = AttributeSchema::find("tfs0.4");
        const auto tfs05 = AttributeSchema::find("tfs0.5");
        REQUIRE(tfs04);
        REQUIRE(tfs05);
        CHECK(tfs04->attribute_keys_in_order() == tfs05->attribute_keys_in_order());
        CHECK(tfs05->display_name() == "TFS 0.5");
    }
}

TEST_CASE("attribute schema queries") {
    const auto schema = AttributeSchema::find("tfs1.4");
    REQUIRE(schema);

    SECTION("categories in definition order without duplicates") {
        const auto categories = schema->categories();
        REQUIRE(categories.size() == 15);
        CHECK(categories[0] == "General");
        CHECK(categories[1] == "Type");
        CHECK(categories[2] == "Combat");
        CHECK(std::set<std::string>(categories.begin(), categories.end()).size() == categories.size());
    }
    SECTION("attributes of a category") {
        const auto absorb = schema->attributes_by_category("Absorb");
        REQUIRE(absorb.size() == 15);
        CHECK(absorb.front()->key == "absorbPercentAll");
        CHECK(schema->attributes_by_category("Nonsense").empty());
    }
    SECTION("every key in order") {
        const auto keys = schema->attribute_keys_in_order();
        CHECK(keys.size() == 111);
        CHECK(keys.front() == "article");
        CHECK(std::find(keys.begin(), keys.end(), "weight") != keys.end());
    }
    SECTION("tag keys") {
        CHECK(schema->tag_attribute_keys() == std::vector<std::string>{"article", "name", "plural", "editorsuffix"});
        CHECK(AttributeSchema::find("tfs1.1")->tag_attribute_keys().empty());
    }
    SECTION("value lists") {
        const auto type = schema->search("type");
        auto it = std::find_if(type.begin(), type.end(), [](const auto *attr) { return attr->key == "type"; });
        REQUIRE(it != type.end());
        CHECK(std::find((*it)->values.begin(), (*it)->values.end(), "container") != (*it)->values.end());
    }
    SECTION("no explicit write order") { CHECK(schema->attribute_priority().empty()); }
    SECTION("case insensitive search") {
        const auto absorb = schema->search("ABSORB");
        CHECK(absorb.size() == 18);
        for (const auto *attr : absorb)
            CHECK(matches_inside("absorb", attr->key));
        CHECK(schema->search("WeIgHt").size() == 1);
        CHECK(schema->search("zzz").empty());
    }
}

TEST_CASE("attribute priority includes nested attributes") {
    AttributeServerData data;
    data.server = "custom";
    ItemAttribute parent;
    parent.key = "absorb";
    parent.order = 2;
    ItemAttribute child;
    child.key = "fire";
    child.order = 1;
    ItemAttribute unordered;
    unordered.key = "ice";
    parent.attributes = {child, unordered};
    data.attributes = {parent};

    const AttributeSchema schema(data);
    CHECK(schema.attribute_priority() == std::map<std::string, int>{{"absorb", 2}, {"fire", 1}});
    CHECK(schema.attribute_keys_in_order() == std::vector<std::string>{"absorb", "fire", "ice"});
}

TEST_CASE("attribute schema registry") {
    AttributeSchemaRegistry registry;
    CHECK(!registry.current_server());
    CHECK(!registry.attributes());

    const auto *attributes = registry.load_server("tfs1.6");
    REQUIRE(attributes);
    CHECK(attributes == registry.attributes());
    CHECK(registry.current_server() == "tfs1.6");

    SECTION("an unknown server keeps the current selection") {
        CHECK(!registry.load_server("mystery"));
        CHECK(registry.current_server() == "tfs1.6");
        CHECK(registry.current_schema()->display_name() == "TFS 1.6");
    }
    SECTION("switching leaves schema data alone") {
        const auto before = registry.current_schema()->attribute_keys_in_order();
        registry.load_server("tfs0.3.6");
        registry.load_server("tfs1.6");
        CHECK(registry.current_schema()->attribute_keys_in_order() == before);
    }
    SECTION("clear") {
        registry.clear();
        CHECK(!registry.current_schema());
    }
}
