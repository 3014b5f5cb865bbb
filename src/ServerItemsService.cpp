/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ServerItemsService.hpp"
#include "ItemsXmlReader.hpp"
#include "ItemsXmlWriter.hpp"
#include "OtbReader.hpp"
#include "OtbWriter.hpp"

#include <fmt/format.h>

#include <set>
#include <stdexcept>

namespace otitems {

namespace {

AttributeSchema schema_for(std::string_view server) {
    auto schema = AttributeSchema::find(server);
    if (!schema)
        throw std::invalid_argument(fmt::format("Unknown attribute server '{}'; expected one of {}", server,
                                                fmt::join(AttributeServers::available(), ", ")));
    return *schema;
}

}

ServerItemsService::ServerItemsService(size_t sprite_cache_size)
    : log_(logger_for("ServerItems")), hash_cache_(sprite_cache_size) {}

LoadServerItemsResult ServerItemsService::load_server_items(gsl::span<const byte> otb,
                                                            std::optional<std::string_view> xml,
                                                            std::optional<std::string_view> attribute_server) {
    std::optional<AttributeSchema> schema;
    if (attribute_server)
        schema = schema_for(*attribute_server);
    auto items = read_otb(otb, log_);

    items_ = std::move(items);
    schema_ = schema;
    hash_cache_.clear();

    LoadServerItemsResult result{&*items_, false, {}, {}};
    if (!xml || xml->empty())
        return result;

    ItemsXmlReadOptions options;
    if (schema_) {
        options.known_attributes = schema_->attribute_keys_in_order();
        options.known_tag_attributes = schema_->tag_attribute_keys();
    }
    auto xml_result = read_items_xml(*xml, *items_, options);
    if (!xml_result.success) {
        log_.warn("items.xml could not be parsed; no xml attributes were loaded");
        return result;
    }
    result.xml_loaded = true;
    if (!xml_result.missing_attributes.empty())
        log_.warn("items.xml uses {} attribute(s) unknown to {}: {}", xml_result.missing_attributes.size(),
                  schema_->server(), fmt::join(xml_result.missing_attributes, ", "));
    if (!xml_result.missing_tag_attributes.empty())
        log_.warn("items.xml uses unknown item tag attribute(s): {}",
                  fmt::join(xml_result.missing_tag_attributes, ", "));
    result.missing_attributes = std::move(xml_result.missing_attributes);
    result.missing_tag_attributes = std::move(xml_result.missing_tag_attributes);
    return result;
}

SaveServerItemsResult ServerItemsService::save_server_items() const {
    if (!items_)
        throw std::runtime_error("No server items loaded");
    auto options = schema_ ? ItemsXmlWriteOptions::for_schema(*schema_) : ItemsXmlWriteOptions{};
    auto encoding = options.encoding;
    return {write_otb(*items_), write_items_xml(*items_, options), std::move(encoding)};
}

void ServerItemsService::unload_server_items() {
    items_.reset();
    schema_.reset();
    hash_cache_.clear();
}

ServerItem *ServerItemsService::item_by_server_id(uint16_t id) { return items_ ? items_->get_by_id(id) : nullptr; }

std::vector<ServerItem *> ServerItemsService::items_by_client_id(uint16_t client_id) {
    if (!items_)
        return {};
    return items_->get_by_client_id(client_id);
}

ServerItem *ServerItemsService::first_item_by_client_id(uint16_t client_id) {
    return items_ ? items_->first_by_client_id(client_id) : nullptr;
}

std::optional<std::string> ServerItemsService::attribute_server() const {
    if (!schema_)
        return std::nullopt;
    return schema_->server();
}

void ServerItemsService::set_attribute_server(std::string_view server) { schema_ = schema_for(server); }

SyncOptions ServerItemsService::sync_options(const SyncSettings &settings) const {
    SyncOptions options;
    options.client_version = settings.client_version.value_or(items_ ? items_->version.client_version : 0);
    options.pixels = settings.pixels ? &settings.pixels : nullptr;
    options.transparent = settings.transparent;
    return options;
}

bool ServerItemsService::sync_item(uint16_t server_id, const ThingType &thing, const SyncSettings &settings) {
    auto *item = item_by_server_id(server_id);
    if (!item)
        return false;
    sync_from_thing_type(*item, thing, sync_options(settings));
    return true;
}

size_t ServerItemsService::sync_all_items(gsl::span<const ThingType> things, const SyncSettings &settings) {
    if (!items_)
        return 0;
    auto options = sync_options(settings);
    options.hash_cache = &hash_cache_;
    size_t synced = 0;
    for (const auto &thing : things) {
        for (auto *item : items_->get_by_client_id(static_cast<uint16_t>(thing.id))) {
            if (item->is_deprecated())
                continue;
            sync_from_thing_type(*item, thing, options);
            ++synced;
        }
    }
    log_.info("Synced {} server item(s) from {} appearance(s)", synced, things.size());
    return synced;
}

size_t ServerItemsService::create_missing_items(gsl::span<const ThingType> things, const SyncSettings &settings) {
    if (!items_)
        return 0;
    const auto options = sync_options(settings);
    std::vector<const ThingType *> missing;
    std::set<uint16_t> seen;
    for (const auto &thing : things) {
        if (thing.id > UINT16_MAX)
            throw std::invalid_argument(fmt::format("Client id {} does not fit an OTB item", thing.id));
        const auto client_id = static_cast<uint16_t>(thing.id);
        if (!items_->has_client_id(client_id) && seen.insert(client_id).second)
            missing.push_back(&thing);
    }
    if (items_->max_id() + missing.size() > size_t{UINT16_MAX})
        throw std::runtime_error(fmt::format("No server ids left to create {} item(s); highest server id is {}",
                                             missing.size(), items_->max_id()));
    size_t created = 0;
    for (const auto *thing : missing) {
        auto item = create_from_thing_type(*thing, static_cast<uint16_t>(items_->max_id() + 1), options);
        item.is_custom_created = true;
        items_->add(std::move(item));
        ++created;
    }
    if (created)
        log_.info("Created {} server item(s); highest server id is now {}", created, items_->max_id());
    return created;
}

std::vector<uint16_t> ServerItemsService::find_out_of_sync_items(gsl::span<const ThingType> things) const {
    std::vector<uint16_t> out_of_sync;
    if (!items_)
        return out_of_sync;
    for (const auto &thing : things) {
        for (const auto *item : items_->get_by_client_id(static_cast<uint16_t>(thing.id))) {
            if (!item->is_deprecated() && !flags_match(*item, thing))
                out_of_sync.push_back(item->id);
        }
    }
    return out_of_sync;
}

}
