#include "ShelfModel.hpp"
#include "TimeUtils.hpp"
#include <QFileInfo>
#include <QMimeData>
#include <QSet>
#include <QUrl>
#include <QVariant>
#include <algorithm>

// internalId: 0 for top-level rows, stack row + 1 for item rows.

ShelfModel::ShelfModel(dropshelf::ShelfCollection *shelf, QObject *parent)
    : QAbstractItemModel(parent), shelf_(shelf) {
    if (shelf_) {
        listenerToken_ = shelf_->addListener(
            [this](const dropshelf::ShelfChange &c) { onShelfChanged(c); });
    }
    rebuild();
}

ShelfModel::~ShelfModel() {
    if (shelf_ && listenerToken_)
        shelf_->removeListener(listenerToken_);
}

void ShelfModel::rebuild() {
    rows_.clear();
    if (!shelf_)
        return;
    rows_.reserve(shelf_->stackCount());
    for (const auto &s : shelf_->stacks()) {
        Row r;
        r.stack = s.id();
        r.single = s.isSingleItem();
        r.expanded = s.isExpanded();
        r.createdAt = s.createdAt();
        r.items = s.items();
        rows_.push_back(std::move(r));
    }
}

void ShelfModel::onShelfChanged(const dropshelf::ShelfChange &change) {
    using Kind = dropshelf::ShelfChange::Kind;
    switch (change.kind) {
    case Kind::SelectionChanged:
        emit shelfSelectionChanged();
        return;
    case Kind::ExpansionChanged:
        for (dropshelf::StackId id : change.stacks) {
            const auto *s = shelf_->findStack(id);
            if (!s)
                continue;
            for (auto &r : rows_)
                if (r.stack == id)
                    r.expanded = s->isExpanded();
            emit stackExpansionChanged(id, s->isExpanded());
        }
        return;
    default:
        break;
    }
    beginResetModel();
    rebuild();
    endResetModel();
    // The view drops its expansion state on reset; replay it.
    for (const auto &r : rows_)
        if (r.expanded)
            emit stackExpansionChanged(r.stack, true);
    if (change.selectionChanged)
        emit shelfSelectionChanged();
}

QModelIndex ShelfModel::index(int row, int column,
                              const QModelIndex &parent) const {
    if (row < 0 || column < 0 || column >= ColumnCount)
        return {};
    if (!parent.isValid()) {
        if (row >= (int)rows_.size())
            return {};
        return createIndex(row, column, quintptr(0));
    }
    if (parent.internalId() != 0)
        return {};
    const int sr = parent.row();
    if (sr < 0 || sr >= (int)rows_.size() || rows_[sr].single ||
        row >= (int)rows_[sr].items.size())
        return {};
    return createIndex(row, column, quintptr(sr + 1));
}

QModelIndex ShelfModel::parent(const QModelIndex &child) const {
    if (!child.isValid() || child.internalId() == 0)
        return {};
    return createIndex(int(child.internalId() - 1), 0, quintptr(0));
}

int ShelfModel::rowCount(const QModelIndex &parent) const {
    if (!parent.isValid())
        return (int)rows_.size();
    if (parent.internalId() != 0 || parent.column() != 0)
        return 0;
    const auto &r = rows_[parent.row()];
    return r.single ? 0 : (int)r.items.size();
}

int ShelfModel::columnCount(const QModelIndex &) const { return ColumnCount; }

const dropshelf::Item *ShelfModel::itemAt(const QModelIndex &idx) const {
    if (!idx.isValid())
        return nullptr;
    if (idx.internalId() == 0) {
        const auto &r = rows_[idx.row()];
        return (r.single && !r.items.empty()) ? &r.items.front() : nullptr;
    }
    const auto &r = rows_[idx.internalId() - 1];
    if (idx.row() < 0 || idx.row() >= (int)r.items.size())
        return nullptr;
    return &r.items[idx.row()];
}

QString ShelfModel::kindName(dropshelf::ItemKind k) {
    switch (k) {
    case dropshelf::ItemKind::File:
        return tr("File");
    case dropshelf::ItemKind::Directory:
        return tr("Folder");
    case dropshelf::ItemKind::Image:
        return tr("Image");
    case dropshelf::ItemKind::Text:
        return tr("Text");
    case dropshelf::ItemKind::Link:
        return tr("Link");
    case dropshelf::ItemKind::Archive:
        return tr("Archive");
    case dropshelf::ItemKind::Other:
        break;
    }
    return tr("Document");
}

QVariant ShelfModel::data(const QModelIndex &idx, int role) const {
    if (!idx.isValid())
        return {};
    const bool top = idx.internalId() == 0;
    const Row &row = rows_[top ? idx.row() : idx.internalId() - 1];
    const dropshelf::Item *item = itemAt(idx);

    switch (role) {
    case ItemIdRole:
        return item ? QVariant::fromValue<quint64>(item->id) : QVariant();
    case StackIdRole:
        return QVariant::fromValue<quint64>(row.stack);
    case PathRole:
        return item ? QString::fromStdString(item->path) : QVariant();
    case IsStackRole:
        return top && !row.single;
    default:
        break;
    }

    if (!item) {
        // Multi-item stack row: described by its cover.
        const dropshelf::Item &cover = row.items.front();
        if (role == Qt::DisplayRole) {
            if (idx.column() == NameCol)
                return tr("%1 and %n more", nullptr, (int)row.items.size() - 1)
                    .arg(QString::fromStdString(cover.displayName));
            if (idx.column() == KindCol)
                return tr("Stack of %n", nullptr, (int)row.items.size());
            if (idx.column() == AddedCol)
                return dropshelfui::relativeTime(row.createdAt);
        }
        if (role == Qt::DecorationRole && idx.column() == NameCol)
            return icons_.icon(QFileIconProvider::Folder);
        if (role == Qt::ToolTipRole)
            return dropshelfui::localShortTime(row.createdAt);
        return {};
    }

    const QString path = QString::fromStdString(item->path);
    if (role == Qt::DisplayRole) {
        if (idx.column() == NameCol)
            return QString::fromStdString(item->displayName);
        if (idx.column() == KindCol)
            return kindName(item->kind);
        if (idx.column() == AddedCol)
            return dropshelfui::relativeTime(item->addedAt);
    }
    if (role == Qt::DecorationRole && idx.column() == NameCol)
        return icons_.icon(QFileInfo(path));
    if (role == Qt::ToolTipRole) {
        return item->isTemporary ? tr("%1\n(staged copy)").arg(path) : path;
    }
    return {};
}

QVariant ShelfModel::headerData(int section, Qt::Orientation orientation,
                                int role) const {
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole)
        return {};
    switch (section) {
    case NameCol:
        return tr("Name");
    case KindCol:
        return tr("Kind");
    case AddedCol:
        return tr("Added");
    default:
        return {};
    }
}

Qt::ItemFlags ShelfModel::flags(const QModelIndex &idx) const {
    if (!idx.isValid())
        return Qt::NoItemFlags;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsDragEnabled;
}

QStringList ShelfModel::mimeTypes() const {
    return {QStringLiteral("text/uri-list")};
}

QMimeData *ShelfModel::mimeData(const QModelIndexList &indexes) const {
    QList<QUrl> urls;
    QSet<QString> seen;
    for (const QModelIndex &idx : indexes) {
        if (!idx.isValid() || idx.column() != NameCol)
            continue;
        const bool top = idx.internalId() == 0;
        const Row &row = rows_[top ? idx.row() : idx.internalId() - 1];
        std::vector<const dropshelf::Item *> items;
        if (const dropshelf::Item *it = itemAt(idx))
            items.push_back(it);
        else
            for (const auto &i : row.items)
                items.push_back(&i);
        for (const auto *i : items) {
            const QString p = QString::fromStdString(i->path);
            if (seen.contains(p))
                continue;
            seen.insert(p);
            urls.push_back(QUrl::fromLocalFile(p));
        }
    }
    if (urls.isEmpty())
        return nullptr;
    auto *md = new QMimeData();
    md->setUrls(urls);
    return md;
}

dropshelf::StackId ShelfModel::stackIdAt(const QModelIndex &idx) const {
    if (!idx.isValid())
        return 0;
    return rows_[idx.internalId() == 0 ? idx.row() : idx.internalId() - 1].stack;
}

dropshelf::ItemId ShelfModel::itemIdAt(const QModelIndex &idx) const {
    const dropshelf::Item *it = itemAt(idx);
    return it ? it->id : 0;
}

std::vector<dropshelf::ItemId>
ShelfModel::itemIdsAt(const QModelIndex &idx) const {
    std::vector<dropshelf::ItemId> out;
    if (!idx.isValid())
        return out;
    if (const dropshelf::Item *it = itemAt(idx)) {
        out.push_back(it->id);
        return out;
    }
    for (const auto &i : rows_[idx.row()].items)
        out.push_back(i.id);
    return out;
}

QModelIndex ShelfModel::indexForStack(dropshelf::StackId id) const {
    for (int r = 0; r < (int)rows_.size(); ++r)
        if (rows_[r].stack == id)
            return index(r, 0);
    return {};
}

QModelIndex ShelfModel::indexForItem(dropshelf::ItemId id) const {
    for (int r = 0; r < (int)rows_.size(); ++r) {
        const Row &row = rows_[r];
        for (int i = 0; i < (int)row.items.size(); ++i) {
            if (row.items[i].id != id)
                continue;
            const QModelIndex top = index(r, 0);
            return row.single ? top : index(i, 0, top);
        }
    }
    return {};
}
