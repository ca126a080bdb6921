// The shelf: ordered stacks plus the selection set. Single owner of all
// stacks and items; every mutation goes through this API and runs on the
// coordinating thread. Listeners are called after each state change.
#pragma once
#include "ItemStack.hpp"
#include "ShelfTypes.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace dropshelf {

struct ShelfOptions {
    // Drop incoming items whose path is already on the shelf.
    bool skipDuplicatePaths = false;
};

struct ShelfChange {
    enum class Kind {
        StackAdded,
        ItemsAdded,
        ItemsRemoved,
        ItemReplaced,
        SelectionChanged,
        ExpansionChanged
    };
    Kind kind = Kind::StackAdded;
    std::vector<StackId> stacks;        // stacks touched
    std::vector<StackId> removedStacks; // stacks that emptied and went away
    std::vector<ItemId> items;          // items added, removed or replaced
    bool selectionChanged = false;
};

class ShelfCollection {
public:
    using Listener = std::function<void(const ShelfChange &)>;

    explicit ShelfCollection(ShelfOptions opt = {});

    void setOptions(const ShelfOptions &opt) { opt_ = opt; }
    const ShelfOptions &options() const { return opt_; }

    // ---- Mutations ----

    // New stack at the end from a non-empty batch. Returns 0 when the batch
    // is empty (also after duplicate filtering).
    StackId addBatch(std::vector<Item> items, bool forceStack = false);

    // Adds items to an existing stack. Returns the ids assigned.
    std::vector<ItemId> appendToStack(StackId stack, std::vector<Item> items);

    // Removes the item and its selection entry in one step; a stack left
    // empty is removed too.
    std::optional<Item> removeItem(ItemId id);
    std::vector<Item> removeSelected();
    std::vector<Item> removeStack(StackId id);
    std::vector<Item> clearAll();

    // Swaps an item for a derived artifact in the same position. The new
    // item gets a fresh id that inherits the selection. Returns the old item.
    std::optional<Item> replaceItem(ItemId id, Item replacement,
                                    ItemId *newId = nullptr);
    std::optional<Item> replaceItem(ItemId id, const std::string &newPath,
                                    bool isTemporary = false,
                                    ItemId *newId = nullptr);

    // Collapses several items into one (e.g. an archive made from them). The
    // replacement takes the slot of the first listed item in display order,
    // the others are removed (empty stacks too) and the selection becomes
    // just the new item. Returns the items taken off the shelf, or nothing
    // when none of the ids is present.
    std::vector<Item> replaceItems(const std::vector<ItemId> &ids,
                                   Item replacement, ItemId *newId = nullptr);

    // Removes items whose backing file no longer exists.
    std::vector<Item> validateItems(
        const std::function<bool(const std::string &)> &exists);
    std::vector<Item> validateItems();

    // No-op for ids that are not on the shelf.
    void toggleSelection(ItemId id);
    void select(ItemId id);
    void selectStack(StackId id);
    void selectAll();
    void deselectAll();

    void setExpanded(StackId id, bool expanded);
    void toggleExpanded(StackId id);
    void collapseAll();

    // ---- Read-only view ----

    const std::vector<ItemStack> &stacks() const { return stacks_; }
    const std::unordered_set<ItemId> &selection() const { return selection_; }
    bool isSelected(ItemId id) const { return selection_.count(id) > 0; }
    const ItemStack *findStack(StackId id) const;
    const Item *findItem(ItemId id) const;
    StackId stackOf(ItemId id) const;
    std::size_t itemCount() const { return itemToStack_.size(); }
    std::size_t stackCount() const { return stacks_.size(); }
    bool empty() const { return stacks_.empty(); }
    bool containsPath(const std::string &path) const;

    // Selected items in display order.
    std::vector<const Item *> selectedItems() const;

    // ---- Change notification ----

    int addListener(Listener fn);
    void removeListener(int token);

private:
    ItemStack *findStackMutable(StackId id);
    std::vector<Item> admit(std::vector<Item> items);
    // Removes a set of items, dropping empty stacks; fills the change.
    std::vector<Item> removeIds(const std::vector<ItemId> &ids,
                                ShelfChange &change);
    void notify(const ShelfChange &change);

    ShelfOptions opt_;
    std::vector<ItemStack> stacks_;
    std::unordered_set<ItemId> selection_;
    std::unordered_map<ItemId, StackId> itemToStack_;
    ItemId nextItemId_ = 1;
    StackId nextStackId_ = 1;

    std::vector<std::pair<int, Listener>> listeners_;
    int nextListenerToken_ = 1;
};

} // namespace dropshelf
