// Tree view for the shelf: drop target for external drags, drag source for
// items and stacks, and two-way sync of selection and expansion with the
// shelf through ShelfModel.
#pragma once
#include "dropshelf/ShelfTypes.hpp"
#include <QTreeView>

class ShelfController;
class ShelfModel;

class ShelfView : public QTreeView {
    Q_OBJECT
public:
    ShelfView(ShelfController *controller, ShelfModel *model,
              QWidget *parent = nullptr);

    // Actions shared with the window menus; all act on the shelf selection.
    void openSelected();
    void revealSelected();
    void removeSelected();
    void removeCurrentStack();
    // Puts the selected items (all items without a selection) on the
    // clipboard as file URLs.
    void copySelected();
    // Asks for a new name for the single selected item.
    void renameCurrent();

signals:
    void statusMessage(const QString &text, int timeoutMs);

protected:
    void dragEnterEvent(QDragEnterEvent *e) override;
    void dragMoveEvent(QDragMoveEvent *e) override;
    void dropEvent(QDropEvent *e) override;
    void startDrag(Qt::DropActions supportedActions) override;
    void keyPressEvent(QKeyEvent *e) override;
    void contextMenuEvent(QContextMenuEvent *e) override;
    void paintEvent(QPaintEvent *e) override;
    void resizeEvent(QResizeEvent *e) override;

private:
    void pushSelectionToShelf();
    void pullSelectionFromShelf();
    void applyStackExpansion(dropshelf::StackId id, bool expanded);
    void onPendingChanged(int pending);

    // Overlay shown while promised files are being prepared
    void showPrepOverlay(const QString &text);
    void hidePrepOverlay();
    void updateOverlayGeometry();

    ShelfController *controller_ = nullptr; // not owned
    ShelfModel *shelfModel_ = nullptr;      // not owned
    bool syncing_ = false;                  // guards selection/expansion echo
    bool dragOut_ = false;                  // our own drag is in progress

    QWidget *overlay_ = nullptr;                    // viewport child
    class QLabel *overlayLabel_ = nullptr;          // child of overlay_
    class QProgressBar *overlayProgress_ = nullptr; // child of overlay_
    class QPushButton *overlayCancel_ = nullptr;    // child of overlay_
};
