/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "ServerItem.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace otitems {

// OTB header metadata.
struct OtbVersion {
    uint32_t major_version{};
    uint32_t minor_version{};
    uint32_t build_number{};
    // e.g. 1098 for client 10.98.
    uint32_t client_version{};
};

// Owns every ServerItem of one loaded database, indexed by server id and by client id.
// Pointers returned by the accessors stay valid until the item is removed or the list cleared.
class ServerItemList {
public:
    // The first server id used by OpenTibia item databases; reported as min and max of an empty list.
    static inline constexpr uint16_t FirstServerId = 100;

    OtbVersion version;

    // Adds the item, replacing any existing item with the same id.
    ServerItem &add(ServerItem item);
    // Returns false if there was no such item.
    bool remove(uint16_t id);
    void clear();

    [[nodiscard]] ServerItem *get_by_id(uint16_t id);
    [[nodiscard]] const ServerItem *get_by_id(uint16_t id) const;
    // All items sharing the client id, in the order they were added.
    [[nodiscard]] std::vector<ServerItem *> get_by_client_id(uint16_t client_id);
    [[nodiscard]] std::vector<const ServerItem *> get_by_client_id(uint16_t client_id) const;
    [[nodiscard]] ServerItem *first_by_client_id(uint16_t client_id);
    [[nodiscard]] bool has_item(uint16_t id) const { return items_.count(id) != 0; }
    [[nodiscard]] bool has_client_id(uint16_t client_id) const { return by_client_id_.count(client_id) != 0; }

    [[nodiscard]] size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] uint16_t min_id() const noexcept;
    [[nodiscard]] uint16_t max_id() const noexcept;
    [[nodiscard]] uint16_t max_client_id() const noexcept;

    // Items in ascending id order.
    [[nodiscard]] std::vector<const ServerItem *> to_array() const;
    [[nodiscard]] std::vector<ServerItem *> to_array();

    // Creates an item for every client id above the current highest one, up to and including up_to_client_id.
    // New items get consecutive server ids after max_id() and a zeroed sprite hash. Returns how many were made.
    // Throws std::runtime_error, adding nothing, if they would not all fit below server id 65535.
    size_t create_missing_items(uint16_t up_to_client_id);

private:
    void unindex_client(const ServerItem &item);

    std::map<uint16_t, ServerItem> items_;
    std::unordered_map<uint16_t, std::vector<uint16_t>> by_client_id_;
};

}
