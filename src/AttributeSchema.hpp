/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "ItemAttribute.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace otitems {

// Read-only queries over one dialect's attribute definitions. Cheap to copy; refers to compiled-in data.
class AttributeSchema {
public:
    explicit AttributeSchema(const AttributeServerData &data) : data_(&data) {}

    // Looks up a dialect by name, e.g. "tfs1.4".
    [[nodiscard]] static std::optional<AttributeSchema> find(std::string_view server);

    [[nodiscard]] const std::string &server() const noexcept { return data_->server; }
    [[nodiscard]] const std::string &display_name() const noexcept { return data_->display_name; }
    [[nodiscard]] bool supports_from_to_id() const noexcept { return data_->supports_from_to_id; }
    [[nodiscard]] const std::string &items_xml_encoding() const noexcept { return data_->items_xml_encoding; }
    [[nodiscard]] const std::vector<ItemAttribute> &attributes() const noexcept { return data_->attributes; }

    // Category names in definition order, without duplicates.
    [[nodiscard]] std::vector<std::string> categories() const;
    [[nodiscard]] std::vector<const ItemAttribute *> attributes_by_category(std::string_view category) const;
    // Every key including nested children, depth first in definition order.
    [[nodiscard]] std::vector<std::string> attribute_keys_in_order() const;
    // Keys written on the <item> tag rather than as nested elements.
    [[nodiscard]] std::vector<std::string> tag_attribute_keys() const;
    // key -> order for every attribute (at any depth) with an explicit order.
    [[nodiscard]] std::map<std::string, int> attribute_priority() const;
    // Top-level attributes whose key contains the keyword, case insensitively.
    [[nodiscard]] std::vector<const ItemAttribute *> search(std::string_view keyword) const;

    [[nodiscard]] AttributeServerMetadata metadata() const;

private:
    const AttributeServerData *data_;
};

// The compiled-in dialects.
namespace AttributeServers {

static inline constexpr std::string_view DefaultServer = "tfs1.4";

// Every dialect, in release order.
[[nodiscard]] const std::vector<AttributeServerData> &all();
[[nodiscard]] const AttributeServerData *find(std::string_view server);

// Sorted dialect names.
[[nodiscard]] std::vector<std::string> available();
// Sorted (name, display name) pairs.
[[nodiscard]] std::vector<std::pair<std::string, std::string>> available_with_labels();
// Falls back to the name itself for unknown dialects.
[[nodiscard]] std::string display_name(std::string_view server);
// Unknown dialects are assumed to support ranges.
[[nodiscard]] bool supports_from_to_id(std::string_view server);
// Unknown dialects are assumed to use iso-8859-1.
[[nodiscard]] std::string items_xml_encoding(std::string_view server);
[[nodiscard]] std::optional<AttributeServerMetadata> metadata(std::string_view server);

}

// Holds a "current dialect" selection for callers that work with one dialect at a time.
class AttributeSchemaRegistry {
public:
    // Selects the dialect and returns its attributes, or nullptr (leaving the selection alone) if it is unknown.
    const std::vector<ItemAttribute> *load_server(std::string_view server);
    void clear() noexcept { current_ = nullptr; }

    [[nodiscard]] std::optional<std::string> current_server() const;
    [[nodiscard]] std::optional<AttributeSchema> current_schema() const;
    // The current dialect's attributes, or nullptr if none is selected.
    [[nodiscard]] const std::vector<ItemAttribute> *attributes() const;

private:
    const AttributeServerData *current_{};
};

}
