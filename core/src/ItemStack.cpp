#include "dropshelf/ItemStack.hpp"

#include <algorithm>
#include <utility>

namespace dropshelf {

ItemStack::ItemStack(StackId id, std::vector<Item> items, bool forceStack)
    : id_(id), createdAt_(Clock::now()), items_(std::move(items)),
      forceStack_(forceStack) {}

const Item *ItemStack::find(ItemId id) const {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [id](const Item &i) { return i.id == id; });
    return it == items_.end() ? nullptr : &*it;
}

Item *ItemStack::findMutable(ItemId id) {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [id](const Item &i) { return i.id == id; });
    return it == items_.end() ? nullptr : &*it;
}

std::vector<ItemId> ItemStack::itemIds() const {
    std::vector<ItemId> out;
    out.reserve(items_.size());
    for (const auto &i : items_)
        out.push_back(i.id);
    return out;
}

std::optional<Item> ItemStack::remove(ItemId id) {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [id](const Item &i) { return i.id == id; });
    if (it == items_.end())
        return std::nullopt;
    Item out = std::move(*it);
    items_.erase(it); // keeps the relative order of the rest
    return out;
}

} // namespace dropshelf
