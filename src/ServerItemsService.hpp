/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "AttributeSchema.hpp"
#include "ItemSync.hpp"
#include "ServerItemList.hpp"
#include "SpriteHash.hpp"
#include "ThingType.hpp"
#include "common/Byte.hpp"
#include "common/Logger.hpp"

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otitems {

struct LoadServerItemsResult {
    // The service's list; valid until the next load or unload.
    const ServerItemList *items{};
    // False if items.xml was given but could not be parsed.
    bool xml_loaded{};
    std::vector<std::string> missing_attributes;
    std::vector<std::string> missing_tag_attributes;
};

struct SaveServerItemsResult {
    Bytes otb;
    // UTF-8 text; see encode_items_xml() for the declared encoding.
    std::string xml;
    std::string xml_encoding;
};

// How sync operations reach the client appearance data.
struct SyncSettings {
    // Empty means the client version of the loaded OTB.
    std::optional<uint32_t> client_version;
    // Empty means sprite hashes are left alone.
    PixelProvider pixels;
    bool transparent{};
};

// Holds the server item database being edited and ties the OTB and items.xml codecs to the sync engine.
class ServerItemsService {
public:
    explicit ServerItemsService(size_t sprite_cache_size);

    // Replaces the loaded database. With an attribute server, items.xml keys are checked against its schema and
    // saves use its items.xml conventions. Throws std::invalid_argument for an unknown attribute server and
    // OtbError for a bad OTB; either way the previously loaded database is kept.
    LoadServerItemsResult load_server_items(gsl::span<const byte> otb, std::optional<std::string_view> xml = {},
                                            std::optional<std::string_view> attribute_server = {});
    // Throws std::runtime_error if nothing is loaded.
    [[nodiscard]] SaveServerItemsResult save_server_items() const;
    void unload_server_items();

    [[nodiscard]] bool is_loaded() const noexcept { return items_.has_value(); }
    [[nodiscard]] ServerItemList *item_list() noexcept { return items_ ? &*items_ : nullptr; }
    [[nodiscard]] const ServerItemList *item_list() const noexcept { return items_ ? &*items_ : nullptr; }
    [[nodiscard]] ServerItem *item_by_server_id(uint16_t id);
    [[nodiscard]] std::vector<ServerItem *> items_by_client_id(uint16_t client_id);
    [[nodiscard]] ServerItem *first_item_by_client_id(uint16_t client_id);

    [[nodiscard]] std::optional<std::string> attribute_server() const;
    [[nodiscard]] const std::optional<AttributeSchema> &attribute_schema() const noexcept { return schema_; }
    // Throws std::invalid_argument for an unknown server.
    void set_attribute_server(std::string_view server);

    // Syncs one item's flags and attributes from its appearance. Returns false if there is no such item.
    bool sync_item(uint16_t server_id, const ThingType &thing, const SyncSettings &settings = {});
    // Syncs every non-deprecated item from the appearance with its client id. Returns how many were synced.
    size_t sync_all_items(gsl::span<const ThingType> things, const SyncSettings &settings = {});
    // Adds a server item for every appearance no item refers to yet. Returns how many were created. Throws
    // std::invalid_argument for an appearance id above 65535 and std::runtime_error if the new items would not
    // fit below server id 65535; nothing is added in either case.
    size_t create_missing_items(gsl::span<const ThingType> things, const SyncSettings &settings = {});
    // Ids of non-deprecated items whose flags differ from their appearance.
    [[nodiscard]] std::vector<uint16_t> find_out_of_sync_items(gsl::span<const ThingType> things) const;

    // Forgets sprite hashes remembered by sync_all_items, e.g. after the sprites changed.
    void clear_sprite_hash_cache() { hash_cache_.clear(); }

private:
    [[nodiscard]] SyncOptions sync_options(const SyncSettings &settings) const;

    mutable Logger log_;
    std::optional<ServerItemList> items_;
    std::optional<AttributeSchema> schema_;
    SpriteHashCache hash_cache_;
};

}
