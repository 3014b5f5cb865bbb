/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#include "ServerItemList.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace otitems {

ServerItem &ServerItemList::add(ServerItem item) {
    const auto id = item.id;
    if (auto existing = items_.find(id); existing != items_.end()) {
        unindex_client(existing->second);
        items_.erase(existing);
    }
    auto &stored = items_.emplace(id, std::move(item)).first->second;
    by_client_id_[stored.client_id].push_back(id);
    return stored;
}

void ServerItemList::unindex_client(const ServerItem &item) {
    auto it = by_client_id_.find(item.client_id);
    if (it == by_client_id_.end())
        return;
    auto &ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), item.id), ids.end());
    if (ids.empty())
        by_client_id_.erase(it);
}

bool ServerItemList::remove(uint16_t id) {
    auto it = items_.find(id);
    if (it == items_.end())
        return false;
    unindex_client(it->second);
    items_.erase(it);
    return true;
}

void ServerItemList::clear() {
    items_.clear();
    by_client_id_.clear();
}

ServerItem *ServerItemList::get_by_id(uint16_t id) {
    auto it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second;
}

const ServerItem *ServerItemList::get_by_id(uint16_t id) const {
    auto it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second;
}

std::vector<ServerItem *> ServerItemList::get_by_client_id(uint16_t client_id) {
    std::vector<ServerItem *> result;
    if (auto it = by_client_id_.find(client_id); it != by_client_id_.end()) {
        for (auto id : it->second)
            result.push_back(&items_.at(id));
    }
    return result;
}

std::vector<const ServerItem *> ServerItemList::get_by_client_id(uint16_t client_id) const {
    std::vector<const ServerItem *> result;
    if (auto it = by_client_id_.find(client_id); it != by_client_id_.end()) {
        for (auto id : it->second)
            result.push_back(&items_.at(id));
    }
    return result;
}

ServerItem *ServerItemList::first_by_client_id(uint16_t client_id) {
    auto it = by_client_id_.find(client_id);
    if (it == by_client_id_.end() || it->second.empty())
        return nullptr;
    return &items_.at(it->second.front());
}

uint16_t ServerItemList::min_id() const noexcept { return items_.empty() ? FirstServerId : items_.begin()->first; }

uint16_t ServerItemList::max_id() const noexcept { return items_.empty() ? FirstServerId : items_.rbegin()->first; }

uint16_t ServerItemList::max_client_id() const noexcept {
    uint16_t result{};
    for (auto &[id, item] : items_)
        result = std::max(result, item.client_id);
    return result;
}

std::vector<const ServerItem *> ServerItemList::to_array() const {
    std::vector<const ServerItem *> result;
    result.reserve(items_.size());
    for (auto &[id, item] : items_)
        result.push_back(&item);
    return result;
}

std::vector<ServerItem *> ServerItemList::to_array() {
    std::vector<ServerItem *> result;
    result.reserve(items_.size());
    for (auto &[id, item] : items_)
        result.push_back(&item);
    return result;
}

size_t ServerItemList::create_missing_items(uint16_t up_to_client_id) {
    const auto first_client_id = static_cast<uint32_t>(max_client_id()) + 1;
    if (up_to_client_id < first_client_id)
        return 0;
    const size_t wanted = up_to_client_id - first_client_id + 1;
    if (max_id() + wanted > size_t{std::numeric_limits<uint16_t>::max()})
        throw std::runtime_error(fmt::format("No server ids left to create {} item(s); highest server id is {}",
                                             wanted, max_id()));
    size_t created = 0;
    for (auto client_id = first_client_id; client_id <= up_to_client_id; ++client_id) {
        ServerItem item;
        item.id = static_cast<uint16_t>(max_id() + 1);
        item.client_id = static_cast<uint16_t>(client_id);
        item.sprite_hash = Md5Digest{};
        add(std::move(item));
        ++created;
    }
    return created;
}

}
