// Implementation of ShelfView
#include "ShelfView.hpp"
#include "MimePayloadDecoder.hpp"
#include "ShelfController.hpp"
#include "ShelfModel.hpp"
#include "dropshelf/RuntimeLogging.hpp"
#include <QClipboard>
#include <QContextMenuEvent>
#include <QDesktopServices>
#include <QDrag>
#include <QDragEnterEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QFileInfo>
#include <QGuiApplication>
#include <QHeaderView>
#include <QInputDialog>
#include <QItemSelection>
#include <QKeyEvent>
#include <QLabel>
#include <QLineEdit>
#include <QLoggingCategory>
#include <QMenu>
#include <QMimeData>
#include <QPainter>
#include <QProgressBar>
#include <QPushButton>
#include <QShortcut>
#include <QUrl>
#include <unordered_set>

Q_LOGGING_CATEGORY(dsDrag, "dropshelf.drag")

ShelfView::ShelfView(ShelfController *controller, ShelfModel *model,
                     QWidget *parent)
    : QTreeView(parent), controller_(controller), shelfModel_(model) {
    setModel(model);
    setSelectionMode(QAbstractItemView::ExtendedSelection);
    setSelectionBehavior(QAbstractItemView::SelectRows);
    setDragEnabled(true);
    setAcceptDrops(true);
    setDropIndicatorShown(false);
    setDragDropMode(QAbstractItemView::DragDrop);
    setDefaultDropAction(Qt::CopyAction);
    setUniformRowHeights(true);
    setAnimated(true);
    header()->setStretchLastSection(false);
    header()->setSectionResizeMode(ShelfModel::NameCol, QHeaderView::Stretch);
    header()->setSectionResizeMode(ShelfModel::KindCol,
                                   QHeaderView::ResizeToContents);
    header()->setSectionResizeMode(ShelfModel::AddedCol,
                                   QHeaderView::ResizeToContents);

    connect(selectionModel(), &QItemSelectionModel::selectionChanged, this,
            [this] { pushSelectionToShelf(); });
    connect(shelfModel_, &ShelfModel::shelfSelectionChanged, this,
            [this] { pullSelectionFromShelf(); });
    connect(shelfModel_, &QAbstractItemModel::modelReset, this,
            [this] { pullSelectionFromShelf(); });
    connect(shelfModel_, &ShelfModel::stackExpansionChanged, this,
            &ShelfView::applyStackExpansion);

    connect(this, &QTreeView::expanded, this, [this](const QModelIndex &idx) {
        if (!syncing_)
            controller_->shelf().setExpanded(shelfModel_->stackIdAt(idx), true);
    });
    connect(this, &QTreeView::collapsed, this, [this](const QModelIndex &idx) {
        if (!syncing_)
            controller_->shelf().setExpanded(shelfModel_->stackIdAt(idx),
                                             false);
    });
    connect(this, &QAbstractItemView::doubleClicked, this,
            [this](const QModelIndex &idx) {
                // Stack rows expand on double click; items open.
                if (shelfModel_->itemIdAt(idx) != 0)
                    openSelected();
            });

    connect(&controller_->pipeline(), &DropIngestionPipeline::pendingChanged,
            this, &ShelfView::onPendingChanged);
}

// ---- Drop target ----

void ShelfView::dragEnterEvent(QDragEnterEvent *e) {
    if (dragOut_ || !MimePayloadDecoder::canDecode(e->mimeData())) {
        e->ignore();
        return;
    }
    e->setDropAction(Qt::CopyAction);
    e->accept();
}

void ShelfView::dragMoveEvent(QDragMoveEvent *e) {
    if (dragOut_ || !MimePayloadDecoder::canDecode(e->mimeData())) {
        e->ignore();
        return;
    }
    e->setDropAction(Qt::CopyAction);
    e->accept();
}

void ShelfView::dropEvent(QDropEvent *e) {
    if (dragOut_) {
        e->ignore();
        return;
    }
    // Alt or Shift keeps even a single dropped item as a stack.
    const Qt::KeyboardModifiers mods = e->modifiers();
    const bool forceStack = mods.testFlag(Qt::AltModifier) ||
                            mods.testFlag(Qt::ShiftModifier);
    const quint64 gesture = controller_->handleDrop(e->mimeData(), forceStack);
    qCDebug(dsDrag) << "drop received gesture" << gesture
                    << "formats" << e->mimeData()->formats()
                    << "forceStack=" << forceStack;
    e->setDropAction(Qt::CopyAction);
    e->accept();
}

// ---- Drag source ----

void ShelfView::startDrag(Qt::DropActions supportedActions) {
    Q_UNUSED(supportedActions);
    QModelIndexList indexes;
    for (const QModelIndex &idx : selectedIndexes())
        if (idx.column() == ShelfModel::NameCol)
            indexes << idx;
    if (indexes.isEmpty())
        return;
    QMimeData *md = shelfModel_->mimeData(indexes);
    if (!md)
        return;
    const int count = md->urls().size();
    auto *drag = new QDrag(this);
    drag->setMimeData(md);
    const QModelIndex first = indexes.first();
    const QIcon icon = first.data(Qt::DecorationRole).value<QIcon>();
    if (!icon.isNull())
        drag->setPixmap(icon.pixmap(32, 32));
    dragOut_ = true;
    const Qt::DropAction res = drag->exec(Qt::CopyAction);
    dragOut_ = false;
    qCInfo(dsDrag) << "drag-out items=" << count
                   << "result=" << (res == Qt::IgnoreAction ? "canceled"
                                                            : "accepted");
}

// ---- Selection and expansion sync ----

void ShelfView::pushSelectionToShelf() {
    if (syncing_)
        return;
    std::unordered_set<dropshelf::ItemId> wanted;
    for (const QModelIndex &idx : selectionModel()->selectedRows()) {
        for (dropshelf::ItemId id : shelfModel_->itemIdsAt(idx))
            wanted.insert(id);
    }
    auto &shelf = controller_->shelf();
    if (wanted == shelf.selection())
        return;
    syncing_ = true;
    shelf.deselectAll();
    for (dropshelf::ItemId id : wanted)
        shelf.select(id);
    syncing_ = false;
}

void ShelfView::pullSelectionFromShelf() {
    if (syncing_)
        return;
    const auto &shelf = controller_->shelf();
    QItemSelection sel;
    for (const auto &stack : shelf.stacks()) {
        bool all = true;
        for (const auto &item : stack.items()) {
            if (!shelf.isSelected(item.id)) {
                all = false;
                continue;
            }
            const QModelIndex idx = shelfModel_->indexForItem(item.id);
            if (idx.isValid())
                sel.select(idx, idx);
        }
        if (all && !stack.isSingleItem()) {
            const QModelIndex top = shelfModel_->indexForStack(stack.id());
            if (top.isValid())
                sel.select(top, top);
        }
    }
    syncing_ = true;
    selectionModel()->select(sel, QItemSelectionModel::ClearAndSelect |
                                      QItemSelectionModel::Rows);
    syncing_ = false;
    viewport()->update();
}

void ShelfView::applyStackExpansion(dropshelf::StackId id, bool expanded) {
    const QModelIndex idx = shelfModel_->indexForStack(id);
    if (!idx.isValid())
        return;
    syncing_ = true;
    setExpanded(idx, expanded);
    syncing_ = false;
}

// ---- Actions ----

void ShelfView::openSelected() {
    const auto items = controller_->shelf().selectedItems();
    for (const auto *item : items) {
        const QString path = QString::fromStdString(item->path);
        if (!QDesktopServices::openUrl(QUrl::fromLocalFile(path)))
            emit statusMessage(
                tr("Could not open %1")
                    .arg(QString::fromStdString(item->displayName)),
                5000);
    }
}

void ShelfView::revealSelected() {
    const auto items = controller_->shelf().selectedItems();
    if (items.empty())
        return;
    const QString dir =
        QFileInfo(QString::fromStdString(items.front()->path)).absolutePath();
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(dir)))
        emit statusMessage(tr("Could not open the containing folder"), 5000);
}

void ShelfView::removeSelected() {
    const int n = controller_->removeSelected();
    if (n > 0)
        emit statusMessage(tr("Removed %n item(s)", nullptr, n), 3000);
}

void ShelfView::removeCurrentStack() {
    const dropshelf::StackId id = shelfModel_->stackIdAt(currentIndex());
    if (id == 0)
        return;
    const int n = controller_->removeStack(id);
    if (n > 0)
        emit statusMessage(tr("Removed %n item(s)", nullptr, n), 3000);
}

void ShelfView::copySelected() {
    QMimeData *md = controller_->clipboardMimeData();
    if (!md)
        return;
    const int n = md->urls().size();
    QGuiApplication::clipboard()->setMimeData(md); // clipboard takes ownership
    qCDebug(dsDrag) << "copied to clipboard items=" << n;
    emit statusMessage(tr("Copied %n item(s)", nullptr, n), 3000);
}

void ShelfView::renameCurrent() {
    const auto items = controller_->shelf().selectedItems();
    if (items.size() != 1)
        return;
    const dropshelf::ItemId id = items.front()->id;
    const QString current = QString::fromStdString(items.front()->displayName);
    bool ok = false;
    const QString name = QInputDialog::getText(
        this, tr("Rename"), tr("New name:"), QLineEdit::Normal, current, &ok);
    if (!ok || name.trimmed().isEmpty() || name == current)
        return;
    QString error;
    if (controller_->renameItem(id, name, &error) == 0)
        emit statusMessage(tr("Could not rename: %1").arg(error), 5000);
}

void ShelfView::keyPressEvent(QKeyEvent *e) {
    switch (e->key()) {
    case Qt::Key_Delete:
    case Qt::Key_Backspace:
        removeSelected();
        e->accept();
        return;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        if (shelfModel_->itemIdAt(currentIndex()) != 0) {
            openSelected();
            e->accept();
            return;
        }
        break;
    default:
        break;
    }
    QTreeView::keyPressEvent(e);
}

void ShelfView::contextMenuEvent(QContextMenuEvent *e) {
    const QModelIndex idx = indexAt(e->pos());
    if (!idx.isValid())
        return;
    if (!selectionModel()->isSelected(idx))
        selectionModel()->select(idx, QItemSelectionModel::ClearAndSelect |
                                          QItemSelectionModel::Rows);
    setCurrentIndex(idx);

    QMenu menu(this);
    menu.addAction(tr("Open"), this, &ShelfView::openSelected);
    menu.addAction(tr("Show in Folder"), this, &ShelfView::revealSelected);
    menu.addAction(tr("Copy"), this, &ShelfView::copySelected);
    if (shelfModel_->itemIdAt(idx) != 0 &&
        controller_->shelf().selection().size() == 1)
        menu.addAction(tr("Rename…"), this, &ShelfView::renameCurrent);
    menu.addSeparator();
    if (shelfModel_->data(idx, ShelfModel::IsStackRole).toBool()) {
        const QModelIndex top = idx.sibling(idx.row(), 0);
        menu.addAction(isExpanded(top) ? tr("Collapse") : tr("Expand"), this,
                       [this, top] { setExpanded(top, !isExpanded(top)); });
    }
    menu.addAction(tr("Remove"), this, &ShelfView::removeSelected);
    menu.addAction(tr("Remove Stack"), this, &ShelfView::removeCurrentStack);
    menu.exec(e->globalPos());
}

void ShelfView::paintEvent(QPaintEvent *e) {
    QTreeView::paintEvent(e);
    if (model() && model()->rowCount() > 0)
        return;
    QPainter p(viewport());
    p.setPen(palette().color(QPalette::Disabled, QPalette::Text));
    p.drawText(viewport()->rect(), Qt::AlignCenter | Qt::TextWordWrap,
               tr("Drop files, images, text or links here"));
}

// ---- Preparing overlay ----

void ShelfView::onPendingChanged(int pending) {
    if (pending > 0)
        showPrepOverlay(
            tr("Preparing %n dropped batch(es)…", nullptr, pending));
    else
        hidePrepOverlay();
}

void ShelfView::showPrepOverlay(const QString &text) {
    if (!overlay_) {
        overlay_ = new QWidget(viewport());
        overlay_->setAutoFillBackground(true);
        overlay_->setStyleSheet("background: rgba(0,0,0,0.35); border: 1px "
                                "solid rgba(255,255,255,0.25);");
        overlay_->setAccessibleName(QStringLiteral("Preparing files overlay"));
        overlayLabel_ = new QLabel(overlay_);
        overlayLabel_->setStyleSheet("color: white; font-weight: 600;");
        overlayProgress_ = new QProgressBar(overlay_);
        overlayProgress_->setRange(0, 0); // busy indicator
        overlayCancel_ = new QPushButton(tr("Cancel"), overlay_);
        overlayCancel_->setCursor(Qt::PointingHandCursor);
        connect(overlayCancel_, &QPushButton::clicked, this, [this] {
            qCInfo(dsDrag) << "preparation canceled by user";
            controller_->pipeline().cancelAll();
        });
        auto *esc = new QShortcut(QKeySequence(Qt::Key_Escape), overlay_);
        connect(esc, &QShortcut::activated, this,
                [this] { controller_->pipeline().cancelAll(); });
    }
    overlayLabel_->setText(text);
    updateOverlayGeometry();
    overlay_->show();
}

void ShelfView::hidePrepOverlay() {
    if (overlay_)
        overlay_->hide();
}

void ShelfView::resizeEvent(QResizeEvent *e) {
    QTreeView::resizeEvent(e);
    updateOverlayGeometry();
}

void ShelfView::updateOverlayGeometry() {
    if (!overlay_)
        return;
    const QRect r = viewport()->rect();
    overlay_->setGeometry(r.adjusted(r.width() / 8, r.height() / 3,
                                     -r.width() / 8, -r.height() / 3));
    const int w = overlay_->width();
    int y = 12;
    overlayLabel_->setGeometry(12, y, w - 24, 24);
    y += 30;
    overlayProgress_->setGeometry(12, y, w - 24, 18);
    y += 26;
    overlayCancel_->setGeometry(12, y, 110, 26);
}
