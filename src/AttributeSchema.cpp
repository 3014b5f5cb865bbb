/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "AttributeSchema.hpp"
#include "common/string_utils.hpp"

#include <algorithm>
#include <set>

namespace otitems {

namespace {

void collect_keys(const ItemAttribute &attr, std::vector<std::string> &result) {
    result.push_back(attr.key);
    for (const auto &child : attr.attributes)
        collect_keys(child, result);
}

void collect_priority(const std::vector<ItemAttribute> &attrs, std::map<std::string, int> &result) {
    for (const auto &attr : attrs) {
        if (attr.has_explicit_order())
            result[attr.key] = attr.order;
        collect_priority(attr.attributes, result);
    }
}

}

std::optional<AttributeSchema> AttributeSchema::find(std::string_view server) {
    if (const auto *data = AttributeServers::find(server))
        return AttributeSchema(*data);
    return std::nullopt;
}

std::vector<std::string> AttributeSchema::categories() const {
    std::vector<std::string> result;
    std::set<std::string_view> seen;
    for (const auto &attr : attributes()) {
        if (seen.insert(attr.category).second)
            result.push_back(attr.category);
    }
    return result;
}

std::vector<const ItemAttribute *> AttributeSchema::attributes_by_category(std::string_view category) const {
    std::vector<const ItemAttribute *> result;
    for (const auto &attr : attributes()) {
        if (attr.category == category)
            result.push_back(&attr);
    }
    return result;
}

std::vector<std::string> AttributeSchema::attribute_keys_in_order() const {
    std::vector<std::string> result;
    for (const auto &attr : attributes())
        collect_keys(attr, result);
    return result;
}

std::vector<std::string> AttributeSchema::tag_attribute_keys() const {
    std::vector<std::string> result;
    for (const auto &attr : attributes()) {
        if (attr.is_tag())
            result.push_back(attr.key);
    }
    return result;
}

std::map<std::string, int> AttributeSchema::attribute_priority() const {
    std::map<std::string, int> result;
    collect_priority(attributes(), result);
    return result;
}

std::vector<const ItemAttribute *> AttributeSchema::search(std::string_view keyword) const {
    std::vector<const ItemAttribute *> result;
    for (const auto &attr : attributes()) {
        if (matches_inside(keyword, attr.key))
            result.push_back(&attr);
    }
    return result;
}

AttributeServerMetadata AttributeSchema::metadata() const {
    return {server(), display_name(), supports_from_to_id(), items_xml_encoding()};
}

namespace AttributeServers {

const AttributeServerData *find(std::string_view server) {
    const auto &servers = all();
    auto it = std::find_if(servers.begin(), servers.end(), [&](const auto &data) { return data.server == server; });
    return it == servers.end() ? nullptr : &*it;
}

std::vector<std::string> available() {
    std::vector<std::string> result;
    for (const auto &data : all())
        result.push_back(data.server);
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::pair<std::string, std::string>> available_with_labels() {
    std::vector<std::pair<std::string, std::string>> result;
    for (auto &server : available())
        result.emplace_back(server, display_name(server));
    return result;
}

std::string display_name(std::string_view server) {
    if (const auto *data = find(server))
        return data->display_name;
    return std::string(server);
}

bool supports_from_to_id(std::string_view server) {
    const auto *data = find(server);
    return data ? data->supports_from_to_id : true;
}

std::string items_xml_encoding(std::string_view server) {
    const auto *data = find(server);
    return data ? data->items_xml_encoding : "iso-8859-1";
}

std::optional<AttributeServerMetadata> metadata(std::string_view server) {
    if (const auto *data = find(server))
        return AttributeSchema(*data).metadata();
    return std::nullopt;
}

}

const std::vector<ItemAttribute> *AttributeSchemaRegistry::load_server(std::string_view server) {
    const auto *data = AttributeServers::find(server);
    if (!data)
        return nullptr;
    current_ = data;
    return &data->attributes;
}

std::optional<std::string> AttributeSchemaRegistry::current_server() const {
    if (!current_)
        return std::nullopt;
    return current_->server;
}

std::optional<AttributeSchema> AttributeSchemaRegistry::current_schema() const {
    if (!current_)
        return std::nullopt;
    return AttributeSchema(*current_);
}

const std::vector<ItemAttribute> *AttributeSchemaRegistry::attributes() const {
    return current_ ? &current_->attributes : nullptr;
}

}
