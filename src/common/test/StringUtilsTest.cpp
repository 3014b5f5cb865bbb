#include "string_utils.hpp"

#include <catch2/catch.hpp>

TEST_CASE("string utils") {
    SECTION("trim") {
        CHECK(trim("  tfs1.4 \n") == "tfs1.4");
        CHECK(trim("   ").empty());
    }
    SECTION("is_number") {
        CHECK(is_number("123"));
        CHECK(is_number("-5"));
        CHECK(!is_number("-"));
        CHECK(!is_number(""));
        CHECK(!is_number("12a"));
    }
    SECTION("lower_case") { CHECK(lower_case("MaxHitChance") == "maxhitchance"); }
    SECTION("matches") {
        CHECK(matches("slotType", "SLOTTYPE"));
        CHECK(!matches("slot", "slotType"));
    }
    SECTION("matches_inside") {
        CHECK(matches_inside("percent", "absorbPercentFire"));
        CHECK(!matches_inside("reflect", "absorbPercentFire"));
    }
    SECTION("xml_escape") { CHECK(xml_escape(R"(a "b" <c> & d)") == "a &quot;b&quot; &lt;c&gt; &amp; d"); }
}
