// Tree model over the shelf: stacks are top-level rows, their items are
// children. A stack rendered as a single item has no children. The model
// works on a snapshot taken after each shelf change.
#pragma once
#include "dropshelf/ShelfCollection.hpp"
#include <QAbstractItemModel>
#include <QFileIconProvider>
#include <vector>

class ShelfModel : public QAbstractItemModel {
    Q_OBJECT
public:
    enum Column { NameCol = 0, KindCol, AddedCol, ColumnCount };
    enum Role {
        ItemIdRole = Qt::UserRole + 1,
        StackIdRole,
        PathRole,
        IsStackRole, // true for a multi-item stack row
    };

    explicit ShelfModel(dropshelf::ShelfCollection *shelf,
                        QObject *parent = nullptr);
    ~ShelfModel() override;

    QModelIndex index(int row, int column,
                      const QModelIndex &parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex &child) const override;
    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;

    QStringList mimeTypes() const override;
    QMimeData *mimeData(const QModelIndexList &indexes) const override;
    Qt::DropActions supportedDragActions() const override {
        return Qt::CopyAction;
    }

    dropshelf::StackId stackIdAt(const QModelIndex &idx) const;
    // 0 for a multi-item stack row.
    dropshelf::ItemId itemIdAt(const QModelIndex &idx) const;
    // Items behind an index: the item itself, or every item of a stack row.
    std::vector<dropshelf::ItemId> itemIdsAt(const QModelIndex &idx) const;
    QModelIndex indexForStack(dropshelf::StackId id) const;
    QModelIndex indexForItem(dropshelf::ItemId id) const;

    static QString kindName(dropshelf::ItemKind k);

signals:
    void stackExpansionChanged(dropshelf::StackId id, bool expanded);
    void shelfSelectionChanged();

private:
    struct Row {
        dropshelf::StackId stack = 0;
        bool single = false;
        bool expanded = false;
        dropshelf::Clock::time_point createdAt{};
        std::vector<dropshelf::Item> items;
    };

    void onShelfChanged(const dropshelf::ShelfChange &change);
    void rebuild();
    const dropshelf::Item *itemAt(const QModelIndex &idx) const;

    dropshelf::ShelfCollection *shelf_ = nullptr; // not owned
    int listenerToken_ = 0;
    std::vector<Row> rows_;
    QFileIconProvider icons_;
};
