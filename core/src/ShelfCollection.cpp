#include "dropshelf/ShelfCollection.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dropshelf {

ShelfCollection::ShelfCollection(ShelfOptions opt) : opt_(opt) {}

ItemStack *ShelfCollection::findStackMutable(StackId id) {
    auto it = std::find_if(stacks_.begin(), stacks_.end(),
                           [id](const ItemStack &s) { return s.id() == id; });
    return it == stacks_.end() ? nullptr : &*it;
}

const ItemStack *ShelfCollection::findStack(StackId id) const {
    auto it = std::find_if(stacks_.begin(), stacks_.end(),
                           [id](const ItemStack &s) { return s.id() == id; });
    return it == stacks_.end() ? nullptr : &*it;
}

StackId ShelfCollection::stackOf(ItemId id) const {
    auto it = itemToStack_.find(id);
    return it == itemToStack_.end() ? 0 : it->second;
}

const Item *ShelfCollection::findItem(ItemId id) const {
    const ItemStack *s = findStack(stackOf(id));
    return s ? s->find(id) : nullptr;
}

bool ShelfCollection::containsPath(const std::string &path) const {
    for (const auto &s : stacks_)
        for (const auto &i : s.items())
            if (i.path == path)
                return true;
    return false;
}

std::vector<const Item *> ShelfCollection::selectedItems() const {
    std::vector<const Item *> out;
    if (selection_.empty())
        return out;
    for (const auto &s : stacks_)
        for (const auto &i : s.items())
            if (selection_.count(i.id))
                out.push_back(&i);
    return out;
}

// Assigns ids and applies the duplicate filter. Ids are handed out here so
// that an item is never visible on the shelf without one.
std::vector<Item> ShelfCollection::admit(std::vector<Item> items) {
    std::vector<Item> out;
    out.reserve(items.size());
    std::unordered_set<std::string> seen;
    for (auto &item : items) {
        if (opt_.skipDuplicatePaths) {
            if (containsPath(item.path) || !seen.insert(item.path).second)
                continue;
        }
        item.id = nextItemId_++;
        out.push_back(std::move(item));
    }
    return out;
}

StackId ShelfCollection::addBatch(std::vector<Item> items, bool forceStack) {
    std::vector<Item> admitted = admit(std::move(items));
    if (admitted.empty())
        return 0;
    const StackId sid = nextStackId_++;
    ShelfChange change;
    change.kind = ShelfChange::Kind::StackAdded;
    change.stacks.push_back(sid);
    for (const auto &i : admitted) {
        itemToStack_[i.id] = sid;
        change.items.push_back(i.id);
    }
    stacks_.emplace_back(sid, std::move(admitted), forceStack);
    notify(change);
    return sid;
}

std::vector<ItemId> ShelfCollection::appendToStack(StackId stack,
                                                   std::vector<Item> items) {
    std::vector<ItemId> ids;
    ItemStack *s = findStackMutable(stack);
    if (!s)
        return ids;
    std::vector<Item> admitted = admit(std::move(items));
    if (admitted.empty())
        return ids;
    for (auto &i : admitted) {
        ids.push_back(i.id);
        itemToStack_[i.id] = stack;
        s->append(std::move(i));
    }
    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemsAdded;
    change.stacks.push_back(stack);
    change.items = ids;
    notify(change);
    return ids;
}

std::vector<Item> ShelfCollection::removeIds(const std::vector<ItemId> &ids,
                                             ShelfChange &change) {
    std::vector<Item> removed;
    for (ItemId id : ids) {
        auto mit = itemToStack_.find(id);
        if (mit == itemToStack_.end())
            continue;
        const StackId sid = mit->second;
        ItemStack *s = findStackMutable(sid);
        if (!s)
            continue;
        auto item = s->remove(id);
        itemToStack_.erase(mit);
        if (selection_.erase(id) > 0)
            change.selectionChanged = true;
        if (!item)
            continue;
        removed.push_back(std::move(*item));
        change.items.push_back(id);
        if (std::find(change.stacks.begin(), change.stacks.end(), sid) ==
            change.stacks.end())
            change.stacks.push_back(sid);
    }
    for (auto it = stacks_.begin(); it != stacks_.end();) {
        if (it->empty()) {
            change.removedStacks.push_back(it->id());
            it = stacks_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<Item> ShelfCollection::removeItem(ItemId id) {
    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemsRemoved;
    auto removed = removeIds({id}, change);
    if (removed.empty())
        return std::nullopt;
    notify(change);
    return std::move(removed.front());
}

std::vector<Item> ShelfCollection::removeSelected() {
    if (selection_.empty())
        return {};
    std::vector<ItemId> ids;
    for (const auto *i : selectedItems())
        ids.push_back(i->id);
    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemsRemoved;
    auto removed = removeIds(ids, change);
    // Stale selection entries cannot exist, but never leave any behind.
    if (!selection_.empty()) {
        selection_.clear();
        change.selectionChanged = true;
    }
    notify(change);
    return removed;
}

std::vector<Item> ShelfCollection::removeStack(StackId id) {
    const ItemStack *s = findStack(id);
    if (!s)
        return {};
    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemsRemoved;
    auto removed = removeIds(s->itemIds(), change);
    notify(change);
    return removed;
}

std::vector<Item> ShelfCollection::clearAll() {
    std::vector<Item> removed;
    if (stacks_.empty())
        return removed;
    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemsRemoved;
    change.selectionChanged = !selection_.empty();
    for (auto &s : stacks_) {
        change.removedStacks.push_back(s.id());
        for (auto &i : s.items_) {
            change.items.push_back(i.id);
            removed.push_back(std::move(i));
        }
    }
    stacks_.clear();
    selection_.clear();
    itemToStack_.clear();
    notify(change);
    return removed;
}

std::optional<Item> ShelfCollection::replaceItem(ItemId id, Item replacement,
                                                 ItemId *newId) {
    const StackId sid = stackOf(id);
    ItemStack *s = findStackMutable(sid);
    Item *slot = s ? s->findMutable(id) : nullptr;
    if (!slot)
        return std::nullopt;
    Item old = std::move(*slot);
    replacement.id = nextItemId_++;
    *slot = std::move(replacement);
    itemToStack_.erase(id);
    itemToStack_[slot->id] = sid;
    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemReplaced;
    change.stacks.push_back(sid);
    change.items = {id, slot->id};
    if (selection_.erase(id) > 0) {
        selection_.insert(slot->id);
        change.selectionChanged = true;
    }
    if (newId)
        *newId = slot->id;
    notify(change);
    return old;
}

std::optional<Item> ShelfCollection::replaceItem(ItemId id,
                                                 const std::string &newPath,
                                                 bool isTemporary,
                                                 ItemId *newId) {
    return replaceItem(id, makeItem(newPath, isTemporary), newId);
}

std::vector<Item> ShelfCollection::replaceItems(const std::vector<ItemId> &ids,
                                               Item replacement,
                                               ItemId *newId) {
    ItemId anchor = 0;
    for (const auto &s : stacks_) {
        for (const auto &i : s.items()) {
            if (std::find(ids.begin(), ids.end(), i.id) != ids.end()) {
                anchor = i.id;
                break;
            }
        }
        if (anchor != 0)
            break;
    }
    if (anchor == 0)
        return {};

    const StackId sid = stackOf(anchor);
    Item *slot = findStackMutable(sid)->findMutable(anchor);
    std::vector<Item> taken;
    taken.push_back(std::move(*slot));
    replacement.id = nextItemId_++;
    *slot = std::move(replacement);
    const ItemId fresh = slot->id;
    itemToStack_.erase(anchor);
    itemToStack_[fresh] = sid;

    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemReplaced;
    change.stacks.push_back(sid);
    change.items.push_back(anchor);
    std::vector<ItemId> rest;
    for (ItemId id : ids)
        if (id != anchor)
            rest.push_back(id);
    // slot is not used past this point; removal may shift the stack.
    for (auto &item : removeIds(rest, change))
        taken.push_back(std::move(item));
    change.items.push_back(fresh);

    selection_.clear();
    selection_.insert(fresh);
    change.selectionChanged = true;
    if (newId)
        *newId = fresh;
    notify(change);
    return taken;
}

std::vector<Item> ShelfCollection::validateItems(
    const std::function<bool(const std::string &)> &exists) {
    std::vector<ItemId> missing;
    for (const auto &s : stacks_)
        for (const auto &i : s.items())
            if (!exists(i.path))
                missing.push_back(i.id);
    if (missing.empty())
        return {};
    ShelfChange change;
    change.kind = ShelfChange::Kind::ItemsRemoved;
    auto removed = removeIds(missing, change);
    notify(change);
    return removed;
}

std::vector<Item> ShelfCollection::validateItems() {
    return validateItems([](const std::string &p) {
        std::error_code ec;
        return fs::exists(fs::path(p), ec);
    });
}

void ShelfCollection::toggleSelection(ItemId id) {
    if (!itemToStack_.count(id))
        return;
    if (selection_.erase(id) == 0)
        selection_.insert(id);
    ShelfChange change;
    change.kind = ShelfChange::Kind::SelectionChanged;
    change.items.push_back(id);
    change.selectionChanged = true;
    notify(change);
}

void ShelfCollection::select(ItemId id) {
    if (!itemToStack_.count(id) || selection_.count(id))
        return;
    selection_.insert(id);
    ShelfChange change;
    change.kind = ShelfChange::Kind::SelectionChanged;
    change.items.push_back(id);
    change.selectionChanged = true;
    notify(change);
}

void ShelfCollection::selectStack(StackId id) {
    const ItemStack *s = findStack(id);
    if (!s)
        return;
    selection_.clear();
    for (const auto &i : s->items())
        selection_.insert(i.id);
    ShelfChange change;
    change.kind = ShelfChange::Kind::SelectionChanged;
    change.stacks.push_back(id);
    change.items = s->itemIds();
    change.selectionChanged = true;
    notify(change);
}

void ShelfCollection::selectAll() {
    if (selection_.size() == itemToStack_.size())
        return;
    for (const auto &kv : itemToStack_)
        selection_.insert(kv.first);
    ShelfChange change;
    change.kind = ShelfChange::Kind::SelectionChanged;
    change.selectionChanged = true;
    notify(change);
}

void ShelfCollection::deselectAll() {
    if (selection_.empty())
        return;
    selection_.clear();
    ShelfChange change;
    change.kind = ShelfChange::Kind::SelectionChanged;
    change.selectionChanged = true;
    notify(change);
}

void ShelfCollection::setExpanded(StackId id, bool expanded) {
    ItemStack *s = findStackMutable(id);
    if (!s || s->isExpanded() == expanded)
        return;
    s->setExpanded(expanded);
    ShelfChange change;
    change.kind = ShelfChange::Kind::ExpansionChanged;
    change.stacks.push_back(id);
    notify(change);
}

void ShelfCollection::toggleExpanded(StackId id) {
    const ItemStack *s = findStack(id);
    if (s)
        setExpanded(id, !s->isExpanded());
}

void ShelfCollection::collapseAll() {
    ShelfChange change;
    change.kind = ShelfChange::Kind::ExpansionChanged;
    for (auto &s : stacks_) {
        if (s.isExpanded()) {
            s.setExpanded(false);
            change.stacks.push_back(s.id());
        }
    }
    if (!change.stacks.empty())
        notify(change);
}

int ShelfCollection::addListener(Listener fn) {
    const int token = nextListenerToken_++;
    listeners_.emplace_back(token, std::move(fn));
    return token;
}

void ShelfCollection::removeListener(int token) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [token](const auto &p) {
                                        return p.first == token;
                                    }),
                     listeners_.end());
}

void ShelfCollection::notify(const ShelfChange &change) {
    // Copy so a listener may unregister itself.
    auto listeners = listeners_;
    for (const auto &p : listeners)
        if (p.second)
            p.second(change);
}

} // namespace dropshelf
