/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "AttributeSchema.hpp"

#include <gsl/span>

#include <string_view>
#include <utility>

namespace otitems {

namespace {

class SchemaBuilder {
public:
    SchemaBuilder(std::string_view server, std::string_view display_name, bool supports_from_to_id,
                  std::string_view encoding) {
        data_.server = server;
        data_.display_name = display_name;
        data_.supports_from_to_id = supports_from_to_id;
        data_.items_xml_encoding = encoding;
    }

    SchemaBuilder &category(std::string_view name) {
        category_ = name;
        return *this;
    }
    SchemaBuilder &add(std::string_view key, AttributeType type, gsl::span<const std::string_view> values = {}) {
        return append(key, type, AttributePlacement::Nested, values);
    }
    SchemaBuilder &tag(std::string_view key, AttributeType type) {
        return append(key, type, AttributePlacement::Tag, {});
    }
    SchemaBuilder &add_all(gsl::span<const std::string_view> keys, AttributeType type) {
        for (auto key : keys)
            add(key, type);
        return *this;
    }

    [[nodiscard]] AttributeServerData build() { return std::move(data_); }

private:
    SchemaBuilder &append(std::string_view key, AttributeType type, AttributePlacement placement,
                          gsl::span<const std::string_view> values) {
        ItemAttribute attr;
        attr.key = key;
        attr.type = type;
        attr.category = category_;
        attr.placement = placement;
        attr.values.assign(values.begin(), values.end());
        data_.attributes.push_back(std::move(attr));
        return *this;
    }

    AttributeServerData data_;
    std::string category_;
};

// Some releases changed nothing in items.xml.
AttributeServerData renamed(AttributeServerData data, std::string_view server, std::string_view display_name) {
    data.server = server;
    data.display_name = display_name;
    return data;
}

constexpr std::string_view Directions[] = {"north", "east", "south", "west"};
constexpr std::string_view CorpseTypes[] = {"venom", "blood", "undead", "fire", "energy"};
constexpr std::string_view AmmoAction036[] = {"removecount", "removecharge", "moveback"};
constexpr std::string_view AmmoAction10[] = {"move", "moveback", "removecharge", "removecount"};
constexpr std::string_view TypeValues036[] = {
    "container", "key", "magicfield", "depot", "mailbox", "trashholder", "teleport", "door", "bed"
};
constexpr std::string_view TypeValues04[] = {
    "container", "key", "magicfield", "depot", "mailbox", "trashholder", "teleport", "door", "bed", "rune"
};
constexpr std::string_view TypeValues10[] = {
    "container", "key", "magicfield", "depot", "mailbox", "trashholder", "teleport", "door", "bed"
};
constexpr std::string_view TypeValues11[] = {
    "container", "key", "magicfield", "depot", "mailbox", "trashholder", "teleport", "door", "bed", "rune"
};
constexpr std::string_view SlotType036[] = {
    "head", "body", "legs", "feet", "backpack", "two-handed", "necklace", "ring", "ammo", "hand"
};
constexpr std::string_view SlotType10[] = {
    "head", "body", "legs", "feet", "backpack", "two-handed", "right-hand", "left-hand", "necklace", "ring", "ammo",
    "hand"
};
constexpr std::string_view WeaponType036[] = {
    "sword", "club", "axe", "shield", "distance", "wand", "rod", "ammunition", "fist"
};
constexpr std::string_view WeaponType10[] = {"sword", "club", "axe", "shield", "distance", "wand", "ammunition"};
constexpr std::string_view AmmoType036[] = {
    "none", "bolt", "arrow", "spear", "throwingstar", "throwingknife", "stone", "snowball"
};
constexpr std::string_view AmmoType10[] = {
    "spear", "bolt", "arrow", "poisonarrow", "burstarrow", "throwingstar", "throwingknife", "smallstone", "largerock",
    "snowball", "powerbolt", "infernalbolt", "huntingspear", "enchantedspear", "royalspear", "sniperarrow",
    "onyxarrow", "piercingbolt", "etherealspear", "flasharrow", "flammingarrow", "shiverarrow", "eartharrow"
};
constexpr std::string_view ShootType036[] = {
    "spear", "bolt", "arrow", "fire", "energy", "poisonarrow", "burstarrow", "throwingstar", "throwingknife",
    "smallstone", "death", "largerock", "snowball", "powerbolt", "poisonfield", "infernalbolt", "huntingspear",
    "enchantedspear", "redstar", "greenstar", "royalspear", "sniperarrow", "onyxarrow", "piercingbolt",
    "whirlwindsword", "whirlwindaxe", "whirlwindclub", "etherealspear", "ice", "earth", "holy", "suddendeath",
    "flasharrow", "flammingarrow", "shiverarrow", "energyball", "smallice", "smallholy", "smallearth", "eartharrow",
    "explosion", "cake"
};
constexpr std::string_view ShootType10[] = {
    "spear", "bolt", "arrow", "fire", "energy", "poisonarrow", "burstarrow", "throwingstar", "throwingknife",
    "smallstone", "death", "largerock", "snowball", "powerbolt", "poison", "infernalbolt", "huntingspear",
    "enchantedspear", "redstar", "greenstar", "royalspear", "sniperarrow", "onyxarrow", "piercingbolt",
    "whirlwindsword", "whirlwindaxe", "whirlwindclub", "etherealspear", "ice", "earth", "holy", "suddendeath",
    "flasharrow", "flammingarrow", "shiverarrow", "energyball", "smallice", "smallholy", "smallearth", "eartharrow",
    "explosion", "cake", "tarsalarrow", "vortexbolt", "prismaticbolt", "crystallinearrow", "drillbolt",
    "envenomedarrow"
};
constexpr std::string_view ShootType11[] = {
    "spear", "bolt", "arrow", "fire", "energy", "poisonarrow", "burstarrow", "throwingstar", "throwingknife",
    "smallstone", "death", "largerock", "snowball", "powerbolt", "poison", "infernalbolt", "huntingspear",
    "enchantedspear", "redstar", "greenstar", "royalspear", "sniperarrow", "onyxarrow", "piercingbolt",
    "whirlwindsword", "whirlwindaxe", "whirlwindclub", "etherealspear", "ice", "earth", "holy", "suddendeath",
    "flasharrow", "flammingarrow", "shiverarrow", "energyball", "smallice", "smallholy", "smallearth", "eartharrow",
    "explosion", "cake", "tarsalarrow", "vortexbolt", "prismaticbolt", "crystallinearrow", "drillbolt",
    "envenomedarrow", "gloothspear", "simplearrow"
};
constexpr std::string_view Effect036[] = {
    "drawblood", "loseenergy", "poff", "blockhit", "explosionarea", "explosiondamage", "firearea", "yellowrings",
    "poisonrings", "hitarea", "teleport", "energydamage", "wrapsblue", "wrapsred", "wrapsgreen", "hitbyfire", "poison",
    "mortarea", "soundgreen", "soundred", "poisonarea", "soundyellow", "soundpurple", "soundblue", "soundwhite",
    "bubbles", "craps", "giftwraps", "fireworkyellow", "fireworkred", "fireworkblue", "stun", "sleep", "watercreature",
    "groundshaker", "hearts", "fireattack", "energyarea", "smallclouds", "holydamage", "bigclouds", "icearea",
    "icetornado", "iceattack", "stones", "smallplants", "carniphila", "purpleenergy", "yellowenergy", "holyarea",
    "bigplants", "cake", "giantice", "watersplash", "plantattack", "tutorialarrow", "tutorialsquare",
    "mirrorhorizontal", "mirrorvertical", "skullhorizontal", "skullvertical", "assassin", "stepshorizontal",
    "bloodysteps", "stepsvertical", "yalaharighost", "bats", "smoke", "insects"
};
constexpr std::string_view Effect04[] = {
    "drawblood", "loseenergy", "poff", "blockhit", "explosionarea", "explosiondamage", "firearea", "yellowrings",
    "poisonrings", "hitarea", "teleport", "energydamage", "wrapsblue", "wrapsred", "wrapsgreen", "hitbyfire", "poison",
    "mortarea", "soundgreen", "soundred", "poisonarea", "soundyellow", "soundpurple", "soundblue", "soundwhite",
    "bubbles", "craps", "giftwraps", "fireworkyellow", "fireworkred", "fireworkblue", "stun", "sleep", "watercreature",
    "groundshaker", "hearts", "fireattack", "energyarea", "smallclouds", "holydamage", "bigclouds", "icearea",
    "icetornado", "iceattack", "stones", "smallplants", "carniphila", "purpleenergy", "yellowenergy", "holyarea",
    "bigplants", "cake", "giantice", "watersplash", "plantattack", "tutorialarrow", "tutorialsquare",
    "mirrorhorizontal", "mirrorvertical", "skullhorizontal", "skullvertical", "assassin", "stepshorizontal",
    "bloodysteps", "stepsvertical", "yalaharighost", "bats", "smoke", "insects", "dragonhead"
};
constexpr std::string_view Effect10[] = {
    "redspark", "bluebubble", "poff", "yellowspark", "explosionarea", "explosion", "firearea", "yellowbubble",
    "greenbubble", "blackspark", "teleport", "energy", "blueshimmer", "redshimmer", "greenshimmer", "fire",
    "greenspark", "mortarea", "greennote", "rednote", "poison", "yellownote", "purplenote", "bluenote", "whitenote",
    "bubbles", "dice", "giftwraps", "yellowfirework", "redfirework", "bluefirework", "stun", "sleep", "watercreature",
    "groundshaker", "hearts", "fireattack", "energyarea", "smallclouds", "holydamage", "bigclouds", "icearea",
    "icetornado", "iceattack", "stones", "smallplants", "carniphila", "purpleenergy", "yellowenergy", "holyarea",
    "bigplants", "cake", "giantice", "watersplash", "plantattack", "tutorialarrow", "tutorialsquare",
    "mirrorhorizontal", "mirrorvertical", "skullhorizontal", "skullvertical", "assassin", "stepshorizontal",
    "bloodysteps", "stepsvertical", "yalaharighost", "bats", "smoke", "insects", "dragonhead", "orcshaman",
    "orcshamanfire", "thunder", "ferumbras", "confettihorizontal", "confettivertical", "blacksmoke"
};
constexpr std::string_view Effect11[] = {
    "redspark", "bluebubble", "poff", "yellowspark", "explosionarea", "explosion", "firearea", "yellowbubble",
    "greenbubble", "blackspark", "teleport", "energy", "blueshimmer", "redshimmer", "greenshimmer", "fire",
    "greenspark", "mortarea", "greennote", "rednote", "poison", "yellownote", "purplenote", "bluenote", "whitenote",
    "bubbles", "dice", "giftwraps", "yellowfirework", "redfirework", "bluefirework", "stun", "sleep", "watercreature",
    "groundshaker", "hearts", "fireattack", "energyarea", "smallclouds", "holydamage", "bigclouds", "icearea",
    "icetornado", "iceattack", "stones", "smallplants", "carniphila", "purpleenergy", "yellowenergy", "holyarea",
    "bigplants", "cake", "giantice", "watersplash", "plantattack", "tutorialarrow", "tutorialsquare",
    "mirrorhorizontal", "mirrorvertical", "skullhorizontal", "skullvertical", "assassin", "stepshorizontal",
    "bloodysteps", "stepsvertical", "yalaharighost", "bats", "smoke", "insects", "dragonhead", "orcshaman",
    "orcshamanfire", "thunder", "ferumbras", "confettihorizontal", "confettivertical", "blacksmoke", "redsmoke",
    "yellowsmoke", "greensmoke", "purplesmoke"
};
constexpr std::string_view FluidSource036[] = {
    "water", "blood", "beer", "slime", "lemonade", "milk", "mana", "life", "oil", "urine", "coconutmilk", "wine",
    "mud", "fruitjuice", "lava", "rum", "swamp"
};
constexpr std::string_view FluidSource04[] = {
    "water", "blood", "beer", "slime", "lemonade", "milk", "mana", "life", "oil", "urine", "coconutmilk", "wine",
    "mud", "fruitjuice", "lava", "rum", "swamp", "tea", "mead"
};
constexpr std::string_view FluidSource10[] = {
    "water", "blood", "beer", "slime", "lemonade", "milk", "mana", "life", "oil", "urine", "coconut", "wine", "mud",
    "fruitjuice", "lava", "rum", "swamp", "tea", "mead"
};
constexpr std::string_view FloorChange036[] = {
    "down", "north", "south", "west", "east", "northex", "southex", "westex", "eastex"
};
constexpr std::string_view FloorChange10[] = {
    "down", "north", "south", "southalt", "southex", "west", "east", "eastalt", "eastex"
};
constexpr std::string_view FloorChange14[] = {"down", "north", "south", "southalt", "west", "east", "eastalt"};
constexpr std::string_view AbsorbKeys15[] = {
    "absorbPercentAll", "absorbPercentElements", "absorbPercentMagic", "absorbPercentEnergy", "absorbPercentFire",
    "absorbPercentPoison", "absorbPercentIce", "absorbPercentHoly", "absorbPercentDeath", "absorbPercentLifeDrain",
    "absorbPercentManaDrain", "absorbPercentDrown", "absorbPercentPhysical", "absorbPercentHealing",
    "absorbPercentUndefined"
};
constexpr std::string_view ReflectPercentKeys[] = {
    "reflectPercentAll", "reflectPercentElements", "reflectPercentMagic", "reflectPercentEnergy", "reflectPercentFire",
    "reflectPercentPoison", "reflectPercentIce", "reflectPercentHoly", "reflectPercentDeath",
    "reflectPercentLifeDrain", "reflectPercentManaDrain", "reflectPercentDrown", "reflectPercentPhysical",
    "reflectPercentHealing", "reflectPercentUndefined"
};
constexpr std::string_view ReflectChanceKeys[] = {
    "reflectChanceAll", "reflectChanceElements", "reflectChanceMagic", "reflectChanceEnergy", "reflectChanceFire",
    "reflectChancePoison", "reflectChanceIce", "reflectChanceHoly", "reflectChanceDeath", "reflectChanceLifeDrain",
    "reflectChanceManaDrain", "reflectChanceDrown", "reflectChancePhysical", "reflectChanceHealing",
    "reflectChanceUndefined"
};
constexpr std::string_view Suppress22[] = {
    "suppressShock", "suppressBurn", "suppressPoison", "suppressFreeze", "suppressDazzle", "suppressCurse",
    "suppressDrown", "suppressPhysical", "suppressHaste", "suppressParalyze", "suppressDrunk", "suppressRegeneration",
    "suppressSoul", "suppressOutfit", "suppressInvisible", "suppressInfight", "suppressExhaust", "suppressMuted",
    "suppressPacified", "suppressLight", "suppressAttributes", "suppressManaShield"
};
constexpr std::string_view Suppress9[] = {
    "suppressEnergy", "suppressFire", "suppressPoison", "suppressDrown", "suppressPhysical", "suppressFreeze",
    "suppressDazzle", "suppressCurse", "suppressDrunk"
};
constexpr std::string_view AmmoType16[] = {
    "spear", "bolt", "arrow", "poisonarrow", "burstarrow", "throwingstar", "throwingknife", "smallstone", "largerock",
    "snowball", "powerbolt", "infernalbolt", "huntingspear", "enchantedspear", "royalspear", "sniperarrow",
    "onyxarrow", "piercingbolt", "etherealspear", "flasharrow", "flammingarrow", "shiverarrow", "eartharrow",
    "tarsalarrow", "vortexbolt", "prismaticbolt", "crystallinearrow", "drillbolt", "envenomedarrow", "gloothspear",
    "simplearrow", "redstar", "greenstar", "royalstar", "spectralbolt", "diamondarrow", "leafstar"
};
constexpr std::string_view ShootType16[] = {
    "spear", "bolt", "arrow", "fire", "energy", "poisonarrow", "burstarrow", "throwingstar", "throwingknife",
    "smallstone", "death", "largerock", "snowball", "powerbolt", "poison", "infernalbolt", "huntingspear",
    "enchantedspear", "redstar", "greenstar", "royalspear", "sniperarrow", "onyxarrow", "piercingbolt",
    "whirlwindsword", "whirlwindaxe", "whirlwindclub", "etherealspear", "ice", "earth", "holy", "suddendeath",
    "flasharrow", "flammingarrow", "shiverarrow", "energyball", "smallice", "smallholy", "smallearth", "eartharrow",
    "explosion", "cake", "tarsalarrow", "vortexbolt", "prismaticbolt", "crystallinearrow", "drillbolt",
    "envenomedarrow", "gloothspear", "simplearrow", "leafstar", "diamondarrow", "spectralbolt", "royalstar"
};
constexpr std::string_view Effect16[] = {
    "redspark", "bluebubble", "poff", "yellowspark", "explosionarea", "explosion", "firearea", "yellowbubble",
    "greenbubble", "blackspark", "teleport", "energy", "blueshimmer", "redshimmer", "greenshimmer", "fire",
    "greenspark", "mortarea", "greennote", "rednote", "poison", "yellownote", "purplenote", "bluenote", "whitenote",
    "bubbles", "dice", "giftwraps", "yellowfirework", "redfirework", "bluefirework", "stun", "sleep", "watercreature",
    "groundshaker", "hearts", "fireattack", "energyarea", "smallclouds", "holydamage", "bigclouds", "icearea",
    "icetornado", "iceattack", "stones", "smallplants", "carniphila", "purpleenergy", "yellowenergy", "holyarea",
    "bigplants", "cake", "giantice", "watersplash", "plantattack", "tutorialarrow", "tutorialsquare",
    "mirrorhorizontal", "mirrorvertical", "skullhorizontal", "skullvertical", "assassin", "stepshorizontal",
    "bloodysteps", "stepsvertical", "yalaharighost", "bats", "smoke", "insects", "dragonhead", "orcshaman",
    "orcshamanfire", "thunder", "ferumbras", "confettihorizontal", "confettivertical", "blacksmoke", "redsmoke",
    "yellowsmoke", "greensmoke", "purplesmoke", "earlythunder", "bonecapsule", "criticaldamage", "plungingfish",
    "bluechain", "orangechain", "greenchain", "purplechain", "greychain", "yellowchain", "yellowsparkles",
    "faeexplosion", "faecoming", "faegoing", "bigcloudssinglespace", "stonessinglespace", "blueghost",
    "pointofinterest", "mapeffect", "pinkspark", "greenfirework", "orangefirework", "purplefirework",
    "turquoisefirework", "thecube", "drawink", "prismaticsparkles", "thaian", "thaianghost", "ghostsmoke",
    "floatingblock", "block", "rooting", "ghostlyscratch", "ghostlybite", "bigscratching", "slash", "bite",
    "chivalriouschallenge", "divinedazzle", "electricalspark", "purpleteleport", "redteleport", "orangeteleport",
    "greyteleport", "lightblueteleport", "fatal", "dodge", "hourglass", "fireworksstar", "fireworkscircle",
    "ferumbras1", "gazharagoth", "madmage", "horestis", "devovorga", "ferumbras2", "foam"
};
constexpr std::string_view TypeValues16[] = {
    "container", "key", "magicfield", "depot", "mailbox", "trashholder", "teleport", "door", "bed", "rune", "podium"
};

AttributeServerData make_tfs0_3_6() {
    return SchemaBuilder("tfs0.3.6", "TFS 0.3.6", false, "utf-8")
        .category("General")
        .add("name", AttributeType::String)
        .add("article", AttributeType::String)
        .add("plural", AttributeType::String)
        .add("description", AttributeType::String)
        .add("runespellname", AttributeType::String)
        .add("weight", AttributeType::Number)
        .add("worth", AttributeType::Number)
        .add("showCount", AttributeType::Boolean)
        .add("forceSerialize", AttributeType::Boolean)
        .add("writeOnceItemId", AttributeType::Number)
        .category("Type")
        .add("type", AttributeType::String, TypeValues036)
        .category("Combat")
        .add("attack", AttributeType::Number)
        .add("defense", AttributeType::Number)
        .add("armor", AttributeType::Number)
        .add("extraDefense", AttributeType::Number)
        .add("extraAttack", AttributeType::Number)
        .add("attackSpeed", AttributeType::Number)
        .add("range", AttributeType::Number)
        .add("hitChance", AttributeType::Number)
        .add("maxHitChance", AttributeType::Number)
        .add("breakChance", AttributeType::Number)
        .add("ammoAction", AttributeType::String, AmmoAction036)
        .category("Equipment")
        .add("slotType", AttributeType::String, SlotType036)
        .add("weaponType", AttributeType::String, WeaponType036)
        .add("ammoType", AttributeType::String, AmmoType036)
        .add("shootType", AttributeType::String, ShootType036)
        .add("effect", AttributeType::String, Effect036)
        .category("Container")
        .add("containerSize", AttributeType::Number)
        .add("fluidSource", AttributeType::String, FluidSource036)
        .category("Duration")
        .add("decayTo", AttributeType::Number)
        .add("decayTime", AttributeType::Number)
        .add("duration", AttributeType::Number)
        .add("stopDuration", AttributeType::Boolean)
        .add("showDuration", AttributeType::Boolean)
        .add("charges", AttributeType::Number)
        .add("showCharges", AttributeType::Boolean)
        .category("Transform")
        .add("rotateTo", AttributeType::Number)
        .add("transformEquipTo", AttributeType::Number)
        .add("transformDeEquipTo", AttributeType::Number)
        .add("transformTo", AttributeType::Number)
        .add("maleTransformTo", AttributeType::Number)
        .add("femaleTransformTo", AttributeType::Number)
        .add("partnerDirection", AttributeType::String, Directions)
        .category("Text")
        .add("writeable", AttributeType::Boolean)
        .add("readable", AttributeType::Boolean)
        .add("maxTextLen", AttributeType::Number)
        .category("Properties")
        .add("moveable", AttributeType::Boolean)
        .add("blockProjectile", AttributeType::Boolean)
        .add("allowPickupable", AttributeType::Boolean)
        .add("preventLoss", AttributeType::Boolean)
        .add("preventDrop", AttributeType::Boolean)
        .add("invisible", AttributeType::Boolean)
        .add("floorChange", AttributeType::String, FloorChange036)
        .add("corpseType", AttributeType::String, CorpseTypes)
        .add("manaShield", AttributeType::Boolean)
        .add("showAttributes", AttributeType::Boolean)
        .add("levelDoor", AttributeType::Number)
        .add("replaceable", AttributeType::Boolean)
        .category("Skills")
        .add("speed", AttributeType::Number)
        .add("skillSword", AttributeType::Number)
        .add("skillAxe", AttributeType::Number)
        .add("skillClub", AttributeType::Number)
        .add("skillDist", AttributeType::Number)
        .add("skillFish", AttributeType::Number)
        .add("skillShield", AttributeType::Number)
        .add("skillFist", AttributeType::Number)
        .add("maxHealthPoints", AttributeType::Number)
        .add("maxHealthPercent", AttributeType::Number)
        .add("maxManaPoints", AttributeType::Number)
        .add("maxManaPercent", AttributeType::Number)
        .add("soulPoints", AttributeType::Number)
        .add("soulPercent", AttributeType::Number)
        .add("magicLevelPoints", AttributeType::Number)
        .add("magicLevelPercent", AttributeType::Number)
        .category("Stats")
        .add("increaseMagicValue", AttributeType::Number)
        .add("increaseMagicPercent", AttributeType::Number)
        .add("increaseHealingValue", AttributeType::Number)
        .add("increaseHealingPercent", AttributeType::Number)
        .category("Regeneration")
        .add("healthGain", AttributeType::Number)
        .add("healthTicks", AttributeType::Number)
        .add("manaGain", AttributeType::Number)
        .add("manaTicks", AttributeType::Number)
        .category("Elements")
        .add("elementPhysical", AttributeType::Number)
        .add("elementFire", AttributeType::Number)
        .add("elementEnergy", AttributeType::Number)
        .add("elementEarth", AttributeType::Number)
        .add("elementIce", AttributeType::Number)
        .add("elementHoly", AttributeType::Number)
        .add("elementDeath", AttributeType::Number)
        .add("elementLifeDrain", AttributeType::Number)
        .add("elementManaDrain", AttributeType::Number)
        .add("elementHealing", AttributeType::Number)
        .add("elementUndefined", AttributeType::Number)
        .category("Absorb")
        .add_all(AbsorbKeys15, AttributeType::Number)
        .category("Reflect Percent")
        .add_all(ReflectPercentKeys, AttributeType::Number)
        .category("Reflect Chance")
        .add_all(ReflectChanceKeys, AttributeType::Number)
        .category("Suppress")
        .add_all(Suppress22, AttributeType::Boolean)
        .build();
}

AttributeServerData make_tfs0_4() {
    return SchemaBuilder("tfs0.4", "TFS 0.4", true, "utf-8")
        .category("General")
        .add("name", AttributeType::String)
        .add("article", AttributeType::String)
        .add("plural", AttributeType::String)
        .add("description", AttributeType::String)
        .add("runespellname", AttributeType::String)
        .add("weight", AttributeType::Number)
        .add("worth", AttributeType::Number)
        .add("showCount", AttributeType::Boolean)
        .add("forceSerialize", AttributeType::Boolean)
        .add("writeOnceItemId", AttributeType::Number)
        .category("Type")
        .add("type", AttributeType::String, TypeValues04)
        .category("Combat")
        .add("attack", AttributeType::Number)
        .add("defense", AttributeType::Number)
        .add("armor", AttributeType::Number)
        .add("extraDefense", AttributeType::Number)
        .add("extraAttack", AttributeType::Number)
        .add("attackSpeed", AttributeType::Number)
        .add("range", AttributeType::Number)
        .add("hitChance", AttributeType::Number)
        .add("maxHitChance", AttributeType::Number)
        .add("breakChance", AttributeType::Number)
        .add("ammoAction", AttributeType::String, AmmoAction036)
        .category("Equipment")
        .add("slotType", AttributeType::String, SlotType036)
        .add("weaponType", AttributeType::String, WeaponType036)
        .add("ammoType", AttributeType::String, AmmoType036)
        .add("shootType", AttributeType::String, ShootType036)
        .add("effect", AttributeType::String, Effect04)
        .add("dualWield", AttributeType::Boolean)
        .category("Container")
        .add("containerSize", AttributeType::Number)
        .add("fluidSource", AttributeType::String, FluidSource04)
        .category("Duration")
        .add("decayTo", AttributeType::Number)
        .add("decayTime", AttributeType::Number)
        .add("duration", AttributeType::Number)
        .add("stopDuration", AttributeType::Boolean)
        .add("showDuration", AttributeType::Boolean)
        .add("charges", AttributeType::Number)
        .add("showCharges", AttributeType::Boolean)
        .category("Transform")
        .add("rotateTo", AttributeType::Number)
        .add("transformEquipTo", AttributeType::Number)
        .add("transformDeEquipTo", AttributeType::Number)
        .add("transformTo", AttributeType::Number)
        .add("maleTransformTo", AttributeType::Number)
        .add("femaleTransformTo", AttributeType::Number)
        .add("partnerDirection", AttributeType::String, Directions)
        .category("Text")
        .add("writeable", AttributeType::Boolean)
        .add("readable", AttributeType::Boolean)
        .add("maxTextLen", AttributeType::Number)
        .category("Properties")
        .add("moveable", AttributeType::Boolean)
        .add("blockProjectile", AttributeType::Boolean)
        .add("allowPickupable", AttributeType::Boolean)
        .add("preventLoss", AttributeType::Boolean)
        .add("preventDrop", AttributeType::Boolean)
        .add("invisible", AttributeType::Boolean)
        .add("floorChange", AttributeType::String, FloorChange036)
        .add("corpseType", AttributeType::String, CorpseTypes)
        .add("manaShield", AttributeType::Boolean)
        .add("showAttributes", AttributeType::Boolean)
        .add("levelDoor", AttributeType::Number)
        .add("replaceable", AttributeType::Boolean)
        .category("Skills")
        .add("speed", AttributeType::Number)
        .add("skillSword", AttributeType::Number)
        .add("skillAxe", AttributeType::Number)
        .add("skillClub", AttributeType::Number)
        .add("skillDist", AttributeType::Number)
        .add("skillFish", AttributeType::Number)
        .add("skillShield", AttributeType::Number)
        .add("skillFist", AttributeType::Number)
        .add("maxHealthPoints", AttributeType::Number)
        .add("maxHealthPercent", AttributeType::Number)
        .add("maxManaPoints", AttributeType::Number)
        .add("maxManaPercent", AttributeType::Number)
        .add("soulPoints", AttributeType::Number)
        .add("soulPercent", AttributeType::Number)
        .add("magicLevelPoints", AttributeType::Number)
        .add("magicLevelPercent", AttributeType::Number)
        .category("Stats")
        .add("increaseMagicValue", AttributeType::Number)
        .add("increaseMagicPercent", AttributeType::Number)
        .add("increaseHealingValue", AttributeType::Number)
        .add("increaseHealingPercent", AttributeType::Number)
        .category("Regeneration")
        .add("healthGain", AttributeType::Number)
        .add("healthTicks", AttributeType::Number)
        .add("manaGain", AttributeType::Number)
        .add("manaTicks", AttributeType::Number)
        .category("Elements")
        .add("elementPhysical", AttributeType::Number)
        .add("elementFire", AttributeType::Number)
        .add("elementEnergy", AttributeType::Number)
        .add("elementEarth", AttributeType::Number)
        .add("elementIce", AttributeType::Number)
        .add("elementHoly", AttributeType::Number)
        .add("elementDeath", AttributeType::Number)
        .add("elementLifeDrain", AttributeType::Number)
        .add("elementManaDrain", AttributeType::Number)
        .add("elementHealing", AttributeType::Number)
        .add("elementUndefined", AttributeType::Number)
        .category("Absorb")
        .add_all(AbsorbKeys15, AttributeType::Number)
        .category("Reflect Percent")
        .add_all(ReflectPercentKeys, AttributeType::Number)
        .category("Reflect Chance")
        .add_all(ReflectChanceKeys, AttributeType::Number)
        .category("Suppress")
        .add_all(Suppress22, AttributeType::Boolean)
        .build();
}

AttributeServerData make_tfs0_5() { return renamed(make_tfs0_4(), "tfs0.5", "TFS 0.5"); }

AttributeServerData make_tfs1_0() {
    return SchemaBuilder("tfs1.0", "TFS 1.0", true, "utf-8")
        .category("General")
        .add("name", AttributeType::String)
        .add("article", AttributeType::String)
        .add("plural", AttributeType::String)
        .add("description", AttributeType::String)
        .add("weight", AttributeType::Number)
        .add("showCount", AttributeType::Boolean)
        .add("writeOnceItemId", AttributeType::Number)
        .category("Type")
        .add("type", AttributeType::String, TypeValues10)
        .category("Combat")
        .add("attack", AttributeType::Number)
        .add("defense", AttributeType::Number)
        .add("armor", AttributeType::Number)
        .add("extraDef", AttributeType::Number)
        .add("extraAttack", AttributeType::Number)
        .add("range", AttributeType::Number)
        .add("hitChance", AttributeType::Number)
        .add("maxHitChance", AttributeType::Number)
        .add("breakChance", AttributeType::Number)
        .add("ammoAction", AttributeType::String, AmmoAction10)
        .category("Equipment")
        .add("slotType", AttributeType::String, SlotType10)
        .add("weaponType", AttributeType::String, WeaponType10)
        .add("ammoType", AttributeType::String, AmmoType10)
        .add("shootType", AttributeType::String, ShootType10)
        .add("effect", AttributeType::String, Effect10)
        .category("Container")
        .add("containerSize", AttributeType::Number)
        .add("fluidSource", AttributeType::String, FluidSource10)
        .category("Duration")
        .add("decayTo", AttributeType::Number)
        .add("decayTime", AttributeType::Number)
        .add("duration", AttributeType::Number)
        .add("stopDuration", AttributeType::Boolean)
        .add("showDuration", AttributeType::Boolean)
        .add("charges", AttributeType::Number)
        .add("showCharges", AttributeType::Boolean)
        .category("Transform")
        .add("rotateTo", AttributeType::Number)
        .add("transformEquipTo", AttributeType::Number)
        .add("transformDeEquipTo", AttributeType::Number)
        .add("maleTransformTo", AttributeType::Number)
        .add("femaleTransformTo", AttributeType::Number)
        .add("transformTo", AttributeType::Number)
        .category("Text")
        .add("writeable", AttributeType::Boolean)
        .add("readable", AttributeType::Boolean)
        .add("maxTextLen", AttributeType::Number)
        .add("allowDistRead", AttributeType::Boolean)
        .category("Properties")
        .add("moveable", AttributeType::Boolean)
        .add("blockProjectile", AttributeType::Boolean)
        .add("allowPickupable", AttributeType::Boolean)
        .add("blocking", AttributeType::Boolean)
        .add("invisible", AttributeType::Boolean)
        .add("floorChange", AttributeType::String, FloorChange10)
        .add("corpseType", AttributeType::String, CorpseTypes)
        .add("manaShield", AttributeType::Boolean)
        .add("showAttributes", AttributeType::Boolean)
        .add("levelDoor", AttributeType::Number)
        .add("runeSpellName", AttributeType::String)
        .add("walkStack", AttributeType::Boolean)
        .add("alwaysOnTop", AttributeType::Boolean)
        .add("topOrder", AttributeType::Number)
        .add("partnerDirection", AttributeType::String, Directions)
        .add("replaceable", AttributeType::Boolean)
        .category("Skills")
        .add("speed", AttributeType::Number)
        .add("skillSword", AttributeType::Number)
        .add("skillAxe", AttributeType::Number)
        .add("skillClub", AttributeType::Number)
        .add("skillDist", AttributeType::Number)
        .add("skillFish", AttributeType::Number)
        .add("skillShield", AttributeType::Number)
        .add("skillFist", AttributeType::Number)
        .add("maxHitPoints", AttributeType::Number)
        .add("maxHitPointsPercent", AttributeType::Number)
        .add("maxManaPoints", AttributeType::Number)
        .add("maxManaPointsPercent", AttributeType::Number)
        .add("soulPoints", AttributeType::Number)
        .add("soulPointsPercent", AttributeType::Number)
        .add("magicPoints", AttributeType::Number)
        .add("magicPointsPercent", AttributeType::Number)
        .category("Regeneration")
        .add("healthGain", AttributeType::Number)
        .add("healthTicks", AttributeType::Number)
        .add("manaGain", AttributeType::Number)
        .add("manaTicks", AttributeType::Number)
        .category("Absorb")
        .add_all(AbsorbKeys15, AttributeType::Number)
        .category("Field Absorb")
        .add("fieldAbsorbPercentEnergy", AttributeType::Number)
        .add("fieldAbsorbPercentFire", AttributeType::Number)
        .add("fieldAbsorbPercentPoison", AttributeType::Number)
        .category("Elements")
        .add("elementFire", AttributeType::Number)
        .add("elementEnergy", AttributeType::Number)
        .add("elementEarth", AttributeType::Number)
        .add("elementIce", AttributeType::Number)
        .category("Suppress")
        .add_all(Suppress9, AttributeType::Boolean)
        .build();
}

AttributeServerData make_tfs1_1() {
    return SchemaBuilder("tfs1.1", "TFS 1.1", true, "utf-8")
        .category("General")
        .add("name", AttributeType::String)
        .add("article", AttributeType::String)
        .add("plural", AttributeType::String)
        .add("description", AttributeType::String)
        .add("weight", AttributeType::Number)
        .add("showCount", AttributeType::Boolean)
        .add("writeOnceItemId", AttributeType::Number)
        .category("Type")
        .add("type", AttributeType::String, TypeValues11)
        .category("Combat")
        .add("attack", AttributeType::Number)
        .add("defense", AttributeType::Number)
        .add("armor", AttributeType::Number)
        .add("extraDef", AttributeType::Number)
        .add("extraAttack", AttributeType::Number)
        .add("range", AttributeType::Number)
        .add("hitChance", AttributeType::Number)
        .add("maxHitChance", AttributeType::Number)
        .category("Equipment")
        .add("slotType", AttributeType::String, SlotType10)
        .add("weaponType", AttributeType::String, WeaponType10)
        .add("ammoType", AttributeType::String, AmmoType10)
        .add("shootType", AttributeType::String, ShootType11)
        .add("effect", AttributeType::String, Effect11)
        .category("Container")
        .add("containerSize", AttributeType::Number)
        .add("fluidSource", AttributeType::String, FluidSource10)
        .category("Duration")
        .add("decayTo", AttributeType::Number)
        .add("decayTime", AttributeType::Number)
        .add("duration", AttributeType::Number)
        .add("stopDuration", AttributeType::Boolean)
        .add("showDuration", AttributeType::Boolean)
        .add("charges", AttributeType::Number)
        .add("showCharges", AttributeType::Boolean)
        .category("Transform")
        .add("rotateTo", AttributeType::Number)
        .add("transformEquipTo", AttributeType::Number)
        .add("transformDeEquipTo", AttributeType::Number)
        .add("maleTransformTo", AttributeType::Number)
        .add("femaleTransformTo", AttributeType::Number)
        .add("transformTo", AttributeType::Number)
        .category("Text")
        .add("writeable", AttributeType::Boolean)
        .add("readable", AttributeType::Boolean)
        .add("maxTextLen", AttributeType::Number)
        .add("allowDistRead", AttributeType::Boolean)
        .category("Properties")
        .add("moveable", AttributeType::Boolean)
        .add("blockProjectile", AttributeType::Boolean)
        .add("allowPickupable", AttributeType::Boolean)
        .add("blocking", AttributeType::Boolean)
        .add("invisible", AttributeType::Boolean)
        .add("floorChange", AttributeType::String, FloorChange10)
        .add("corpseType", AttributeType::String, CorpseTypes)
        .add("manaShield", AttributeType::Boolean)
        .add("showAttributes", AttributeType::Boolean)
        .add("levelDoor", AttributeType::Number)
        .add("runeSpellName", AttributeType::String)
        .add("walkStack", AttributeType::Boolean)
        .add("partnerDirection", AttributeType::String, Directions)
        .add("replaceable", AttributeType::Boolean)
        .category("Skills")
        .add("speed", AttributeType::Number)
        .add("skillSword", AttributeType::Number)
        .add("skillAxe", AttributeType::Number)
        .add("skillClub", AttributeType::Number)
        .add("skillDist", AttributeType::Number)
        .add("skillFish", AttributeType::Number)
        .add("skillShield", AttributeType::Number)
        .add("skillFist", AttributeType::Number)
        .add("maxHitPoints", AttributeType::Number)
        .add("maxHitPointsPercent", AttributeType::Number)
        .add("maxManaPoints", AttributeType::Number)
        .add("maxManaPointsPercent", AttributeType::Number)
        .add("soulPoints", AttributeType::Number)
        .add("soulPointsPercent", AttributeType::Number)
        .add("magicPoints", AttributeType::Number)
        .add("magicPointsPercent", AttributeType::Number)
        .category("Regeneration")
        .add("healthGain", AttributeType::Number)
        .add("healthTicks", AttributeType::Number)
        .add("manaGain", AttributeType::Number)
        .add("manaTicks", AttributeType::Number)
        .category("Absorb")
        .add_all(AbsorbKeys15, AttributeType::Number)
        .category("Field Absorb")
        .add("fieldAbsorbPercentEnergy", AttributeType::Number)
        .add("fieldAbsorbPercentFire", AttributeType::Number)
        .add("fieldAbsorbPercentPoison", AttributeType::Number)
        .category("Elements")
        .add("elementFire", AttributeType::Number)
        .add("elementEnergy", AttributeType::Number)
        .add("elementEarth", AttributeType::Number)
        .add("elementIce", AttributeType::Number)
        .category("Suppress")
        .add_all(Suppress9, AttributeType::Boolean)
        .build();
}

AttributeServerData make_tfs1_2() { return renamed(make_tfs1_1(), "tfs1.2", "TFS 1.2"); }

AttributeServerData make_tfs1_4() {
    return SchemaBuilder("tfs1.4", "TFS 1.4", true, "iso-8859-1")
        .category("General")
        .tag("article", AttributeType::String)
        .tag("name", AttributeType::String)
        .tag("plural", AttributeType::String)
        .tag("editorsuffix", AttributeType::String)
        .add("description", AttributeType::String)
        .add("weight", AttributeType::Number)
        .add("showCount", AttributeType::Boolean)
        .add("writeOnceItemId", AttributeType::Number)
        .category("Type")
        .add("type", AttributeType::String, TypeValues11)
        .category("Combat")
        .add("attack", AttributeType::Number)
        .add("defense", AttributeType::Number)
        .add("armor", AttributeType::Number)
        .add("extraDef", AttributeType::Number)
        .add("extraAttack", AttributeType::Number)
        .add("attackSpeed", AttributeType::Number)
        .add("range", AttributeType::Number)
        .add("hitChance", AttributeType::Number)
        .add("maxHitChance", AttributeType::Number)
        .category("Equipment")
        .add("slotType", AttributeType::String, SlotType10)
        .add("weaponType", AttributeType::String, WeaponType10)
        .add("ammoType", AttributeType::String, AmmoType10)
        .add("shootType", AttributeType::String, ShootType11)
        .add("effect", AttributeType::String, Effect11)
        .category("Container")
        .add("containerSize", AttributeType::Number)
        .add("fluidSource", AttributeType::String, FluidSource10)
        .category("Duration")
        .add("decayTo", AttributeType::Number)
        .add("decayTime", AttributeType::Number)
        .add("duration", AttributeType::Number)
        .add("stopDuration", AttributeType::Boolean)
        .add("showDuration", AttributeType::Boolean)
        .add("charges", AttributeType::Number)
        .add("showCharges", AttributeType::Boolean)
        .category("Transform")
        .add("rotateTo", AttributeType::Number)
        .add("destroyTo", AttributeType::Number)
        .add("transformEquipTo", AttributeType::Number)
        .add("transformDeEquipTo", AttributeType::Number)
        .add("maleTransformTo", AttributeType::Number)
        .add("femaleTransformTo", AttributeType::Number)
        .add("transformTo", AttributeType::Number)
        .category("Text")
        .add("writeable", AttributeType::Boolean)
        .add("readable", AttributeType::Boolean)
        .add("maxTextLen", AttributeType::Number)
        .add("allowDistRead", AttributeType::Boolean)
        .category("Properties")
        .add("moveable", AttributeType::Boolean)
        .add("blockProjectile", AttributeType::Boolean)
        .add("allowPickupable", AttributeType::Boolean)
        .add("blocking", AttributeType::Boolean)
        .add("invisible", AttributeType::Boolean)
        .add("floorChange", AttributeType::String, FloorChange14)
        .add("corpseType", AttributeType::String, CorpseTypes)
        .add("manaShield", AttributeType::Boolean)
        .add("showAttributes", AttributeType::Boolean)
        .add("levelDoor", AttributeType::Number)
        .add("runeSpellName", AttributeType::String)
        .add("walkStack", AttributeType::Boolean)
        .add("partnerDirection", AttributeType::String, Directions)
        .add("replaceable", AttributeType::Boolean)
        .add("storeItem", AttributeType::Boolean)
        .category("Skills")
        .add("speed", AttributeType::Number)
        .add("skillSword", AttributeType::Number)
        .add("skillAxe", AttributeType::Number)
        .add("skillClub", AttributeType::Number)
        .add("skillDist", AttributeType::Number)
        .add("skillFish", AttributeType::Number)
        .add("skillShield", AttributeType::Number)
        .add("skillFist", AttributeType::Number)
        .add("maxHitPoints", AttributeType::Number)
        .add("maxHitPointsPercent", AttributeType::Number)
        .add("maxManaPoints", AttributeType::Number)
        .add("maxManaPointsPercent", AttributeType::Number)
        .add("soulPoints", AttributeType::Number)
        .add("soulPointsPercent", AttributeType::Number)
        .add("magicPoints", AttributeType::Number)
        .add("magicPointsPercent", AttributeType::Number)
        .category("Regeneration")
        .add("healthGain", AttributeType::Number)
        .add("healthTicks", AttributeType::Number)
        .add("manaGain", AttributeType::Number)
        .add("manaTicks", AttributeType::Number)
        .category("Absorb")
        .add_all(AbsorbKeys15, AttributeType::Number)
        .category("Field Absorb")
        .add("fieldAbsorbPercentEnergy", AttributeType::Number)
        .add("fieldAbsorbPercentFire", AttributeType::Number)
        .add("fieldAbsorbPercentPoison", AttributeType::Number)
        .category("Elements")
        .add("elementFire", AttributeType::Number)
        .add("elementEnergy", AttributeType::Number)
        .add("elementEarth", AttributeType::Number)
        .add("elementIce", AttributeType::Number)
        .add("elementHoly", AttributeType::Number)
        .add("elementDeath", AttributeType::Number)
        .category("Suppress")
        .add_all(Suppress9, AttributeType::Boolean)
        .build();
}

AttributeServerData make_tfs1_6() {
    return SchemaBuilder("tfs1.6", "TFS 1.6", true, "iso-8859-1")
        .category("General")
        .tag("article", AttributeType::String)
        .tag("name", AttributeType::String)
        .tag("plural", AttributeType::String)
        .tag("editorsuffix", AttributeType::String)
        .add("description", AttributeType::String)
        .add("weight", AttributeType::Number)
        .add("showCount", AttributeType::Boolean)
        .add("writeOnceItemId", AttributeType::Number)
        .category("Type")
        .add("type", AttributeType::String, TypeValues16)
        .category("Combat")
        .add("attack", AttributeType::Number)
        .add("defense", AttributeType::Number)
        .add("armor", AttributeType::Number)
        .add("extraDef", AttributeType::Number)
        .add("extraAttack", AttributeType::Number)
        .add("attackSpeed", AttributeType::Number)
        .add("range", AttributeType::Number)
        .add("hitChance", AttributeType::Number)
        .add("maxHitChance", AttributeType::Number)
        .category("Equipment")
        .add("slotType", AttributeType::String, SlotType10)
        .add("weaponType", AttributeType::String, WeaponType10)
        .add("ammoType", AttributeType::String, AmmoType16)
        .add("shootType", AttributeType::String, ShootType16)
        .add("effect", AttributeType::String, Effect16)
        .category("Container")
        .add("containerSize", AttributeType::Number)
        .add("fluidSource", AttributeType::String, FluidSource10)
        .category("Duration")
        .add("decayTo", AttributeType::Number)
        .add("decayTime", AttributeType::Number)
        .add("duration", AttributeType::Number)
        .add("stopDuration", AttributeType::Boolean)
        .add("showDuration", AttributeType::Boolean)
        .add("charges", AttributeType::Number)
        .add("showCharges", AttributeType::Boolean)
        .category("Transform")
        .add("rotateTo", AttributeType::Number)
        .add("destroyTo", AttributeType::Number)
        .add("transformEquipTo", AttributeType::Number)
        .add("transformDeEquipTo", AttributeType::Number)
        .add("maleTransformTo", AttributeType::Number)
        .add("femaleTransformTo", AttributeType::Number)
        .add("transformTo", AttributeType::Number)
        .add("maleSleeper", AttributeType::Number)
        .add("femaleSleeper", AttributeType::Number)
        .category("Text")
        .add("writeable", AttributeType::Boolean)
        .add("readable", AttributeType::Boolean)
        .add("maxTextLen", AttributeType::Number)
        .add("allowDistRead", AttributeType::Boolean)
        .category("Properties")
        .add("moveable", AttributeType::Boolean)
        .add("blockProjectile", AttributeType::Boolean)
        .add("allowPickupable", AttributeType::Boolean)
        .add("blocking", AttributeType::Boolean)
        .add("invisible", AttributeType::Boolean)
        .add("floorChange", AttributeType::String, FloorChange14)
        .add("corpseType", AttributeType::String, CorpseTypes)
        .add("manaShield", AttributeType::Boolean)
        .add("showAttributes", AttributeType::Boolean)
        .add("levelDoor", AttributeType::Number)
        .add("runeSpellName", AttributeType::String)
        .add("walkStack", AttributeType::Boolean)
        .add("partnerDirection", AttributeType::String, Directions)
        .add("replaceable", AttributeType::Boolean)
        .add("storeItem", AttributeType::Boolean)
        .add("field", AttributeType::Boolean)
        .add("pickupable", AttributeType::Boolean)
        .add("forceSerialize", AttributeType::Boolean)
        .add("supply", AttributeType::Boolean)
        .add("worth", AttributeType::Number)
        .category("Skills")
        .add("speed", AttributeType::Number)
        .add("skillSword", AttributeType::Number)
        .add("skillAxe", AttributeType::Number)
        .add("skillClub", AttributeType::Number)
        .add("skillDist", AttributeType::Number)
        .add("skillFish", AttributeType::Number)
        .add("skillShield", AttributeType::Number)
        .add("skillFist", AttributeType::Number)
        .add("maxHitPoints", AttributeType::Number)
        .add("maxHitPointsPercent", AttributeType::Number)
        .add("maxManaPoints", AttributeType::Number)
        .add("maxManaPointsPercent", AttributeType::Number)
        .add("soulPoints", AttributeType::Number)
        .add("soulPointsPercent", AttributeType::Number)
        .add("magicPoints", AttributeType::Number)
        .add("magicPointsPercent", AttributeType::Number)
        .add("criticalHitChance", AttributeType::Number)
        .add("criticalHitAmount", AttributeType::Number)
        .add("lifeLeechChance", AttributeType::Number)
        .add("lifeLeechAmount", AttributeType::Number)
        .add("manaLeechChance", AttributeType::Number)
        .add("manaLeechAmount", AttributeType::Number)
        .add("magicLevelPoints", AttributeType::Number)
        .category("Regeneration")
        .add("healthGain", AttributeType::Number)
        .add("healthTicks", AttributeType::Number)
        .add("manaGain", AttributeType::Number)
        .add("manaTicks", AttributeType::Number)
        .category("Absorb")
        .add_all(AbsorbKeys15, AttributeType::Number)
        .add("absorbPercentEarth", AttributeType::Number)
        .category("Field Absorb")
        .add("fieldAbsorbPercentEnergy", AttributeType::Number)
        .add("fieldAbsorbPercentFire", AttributeType::Number)
        .add("fieldAbsorbPercentPoison", AttributeType::Number)
        .category("Elements")
        .add("elementFire", AttributeType::Number)
        .add("elementEnergy", AttributeType::Number)
        .add("elementEarth", AttributeType::Number)
        .add("elementIce", AttributeType::Number)
        .add("elementHoly", AttributeType::Number)
        .add("elementDeath", AttributeType::Number)
        .category("Boost Percent")
        .add("boostPercentAll", AttributeType::Number)
        .add("boostPercentElements", AttributeType::Number)
        .add("boostPercentMagic", AttributeType::Number)
        .add("boostPercentEnergy", AttributeType::Number)
        .add("boostPercentFire", AttributeType::Number)
        .add("boostPercentPoison", AttributeType::Number)
        .add("boostPercentIce", AttributeType::Number)
        .add("boostPercentHoly", AttributeType::Number)
        .add("boostPercentDeath", AttributeType::Number)
        .add("boostPercentLifeDrain", AttributeType::Number)
        .add("boostPercentManaDrain", AttributeType::Number)
        .add("boostPercentDrown", AttributeType::Number)
        .add("boostPercentPhysical", AttributeType::Number)
        .add("boostPercentHealing", AttributeType::Number)
        .add("boostPercentUndefined", AttributeType::Number)
        .category("Magic Level Boost")
        .add("magicLevelEnergy", AttributeType::Number)
        .add("magicLevelFire", AttributeType::Number)
        .add("magicLevelPoison", AttributeType::Number)
        .add("magicLevelIce", AttributeType::Number)
        .add("magicLevelHoly", AttributeType::Number)
        .add("magicLevelDeath", AttributeType::Number)
        .add("magicLevelLifeDrain", AttributeType::Number)
        .add("magicLevelManaDrain", AttributeType::Number)
        .add("magicLevelDrown", AttributeType::Number)
        .add("magicLevelPhysical", AttributeType::Number)
        .add("magicLevelHealing", AttributeType::Number)
        .add("magicLevelUndefined", AttributeType::Number)
        .category("Suppress")
        .add_all(Suppress9, AttributeType::Boolean)
        .build();
}

}

namespace AttributeServers {

const std::vector<AttributeServerData> &all() {
    static const std::vector<AttributeServerData> servers{make_tfs0_3_6(), make_tfs0_4(), make_tfs0_5(),
                                                          make_tfs1_0(),   make_tfs1_1(), make_tfs1_2(),
                                                          make_tfs1_4(),   make_tfs1_6()};
    return servers;
}

}

}
