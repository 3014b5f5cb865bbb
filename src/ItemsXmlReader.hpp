/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "ServerItemList.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace otitems {

// Tag attributes accepted when the caller supplies none.
inline const std::vector<std::string> DefaultKnownTagAttributes{"name", "article", "plural", "editorsuffix"};

struct ItemsXmlReadOptions {
    // Nested attribute keys the server dialect understands, compared case insensitively. Empty disables the check.
    std::vector<std::string> known_attributes;
    // Attributes allowed on the <item> tag. Empty means DefaultKnownTagAttributes.
    std::vector<std::string> known_tag_attributes;
};

struct ItemsXmlReadResult {
    bool success{};
    // Unknown nested keys, sorted, one entry per key regardless of case.
    std::vector<std::string> missing_attributes;
    // Unknown tag attributes, sorted.
    std::vector<std::string> missing_tag_attributes;
};

// Merges items.xml content into the xml attributes of items already in the list. Elements naming ids that are
// not in the list are ignored. Malformed XML leaves success false and reports nothing; it never throws.
[[nodiscard]] ItemsXmlReadResult read_items_xml(std::string_view xml, ServerItemList &items,
                                                const ItemsXmlReadOptions &options = {});

}
