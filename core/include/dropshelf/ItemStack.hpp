// A group of items produced by one drop gesture. Read access is public;
// mutation goes through ShelfCollection only.
#pragma once
#include "ShelfTypes.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace dropshelf {

class ShelfCollection;

class ItemStack {
public:
    ItemStack(StackId id, std::vector<Item> items, bool forceStack = false);

    StackId id() const { return id_; }
    Clock::time_point createdAt() const { return createdAt_; }
    const std::vector<Item> &items() const { return items_; }
    std::size_t count() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    bool isExpanded() const { return expanded_; }
    bool forceStack() const { return forceStack_; }

    // Rendered as an individual card rather than a pile.
    bool isSingleItem() const { return items_.size() == 1 && !forceStack_; }

    // First item; shown when the stack is collapsed.
    const Item *cover() const { return items_.empty() ? nullptr : &items_.front(); }

    const Item *find(ItemId id) const;
    bool contains(ItemId id) const { return find(id) != nullptr; }
    std::vector<ItemId> itemIds() const;

private:
    friend class ShelfCollection;

    void setExpanded(bool on) { expanded_ = on; }
    void append(Item item) { items_.push_back(std::move(item)); }
    std::optional<Item> remove(ItemId id);
    Item *findMutable(ItemId id);

    StackId id_ = 0;
    Clock::time_point createdAt_{};
    std::vector<Item> items_;
    bool expanded_ = false;
    bool forceStack_ = false;
};

} // namespace dropshelf
