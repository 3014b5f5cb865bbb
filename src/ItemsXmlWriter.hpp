#pragma once

#include "AttributeSchema.hpp"
#include "ServerItemList.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace otitems {

struct ItemsXmlWriteOptions {
    // Declared in the XML header.
    std::string encoding{"iso-8859-1"};
    // Attributes written on the <item> tag, in this order. Everything else becomes a nested <attribute>.
    std::vector<std::string> tag_attribute_keys{"article", "name", "plural", "editorsuffix"};
    // Collapse runs of consecutive ids with identical attributes into one fromid/toid element.
    bool supports_from_to_id{true};
    // Nested attributes with a priority come first, lowest first; the rest follow alphabetically.
    std::map<std::string, int> attribute_priority;

    // The options a server dialect asks for.
    [[nodiscard]] static ItemsXmlWriteOptions for_schema(const AttributeSchema &schema);
};

// Renders every item that has xml attributes as items.xml text. The text is UTF-8 whatever the declared encoding.
[[nodiscard]] std::string write_items_xml(const ServerItemList &items, const ItemsXmlWriteOptions &options = {});

// Converts UTF-8 items.xml text to the bytes of the declared encoding. Supports utf-8 and iso-8859-1; throws
// std::runtime_error if a character cannot be represented or the encoding is unknown.
[[nodiscard]] std::string encode_items_xml(const std::string &xml, std::string_view encoding);

}
