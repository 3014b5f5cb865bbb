/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include <limits>
#include <string>
#include <vector>

namespace otitems {

enum class AttributeType { String, Number, Boolean, Mixed };

// Whether an attribute is written on the <item> tag itself or as a nested <attribute> element.
enum class AttributePlacement { Nested, Tag };

// Definition of one items.xml attribute in a server dialect.
struct ItemAttribute {
    static inline constexpr int DefaultOrder = std::numeric_limits<int>::max();

    std::string key;
    AttributeType type{AttributeType::String};
    // Display grouping only.
    std::string category;
    AttributePlacement placement{AttributePlacement::Nested};
    // Write-order priority; DefaultOrder means "alphabetical after any explicitly ordered keys".
    int order{DefaultOrder};
    // Allowed values, or empty for free-form attributes.
    std::vector<std::string> values;
    std::vector<ItemAttribute> attributes;

    [[nodiscard]] bool has_explicit_order() const noexcept { return order != DefaultOrder; }
    [[nodiscard]] bool is_tag() const noexcept { return placement == AttributePlacement::Tag; }
};

// The complete items.xml vocabulary of one server dialect, e.g. "tfs1.4".
struct AttributeServerData {
    std::string server;
    std::string display_name;
    bool supports_from_to_id{true};
    std::string items_xml_encoding{"iso-8859-1"};
    std::vector<ItemAttribute> attributes;
};

struct AttributeServerMetadata {
    std::string server;
    std::string display_name;
    bool supports_from_to_id{};
    std::string items_xml_encoding;
};

}
