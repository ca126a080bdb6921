#include "ShelfWindow.hpp"
#include "SettingsDialog.hpp"
#include "ShelfController.hpp"
#include "ShelfModel.hpp"
#include "ShelfView.hpp"
#include "UiAlerts.hpp"
#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QKeySequence>
#include <QLabel>
#include <QLoggingCategory>
#include <QMenuBar>
#include <QSettings>
#include <QStatusBar>
#include <QTimer>
#include <QToolBar>
Q_DECLARE_LOGGING_CATEGORY(dsShelf)

// Interval of the background check for items whose file vanished.
static constexpr int kValidateIntervalMs = 5000;

ShelfWindow::ShelfWindow(ShelfController *controller, QWidget *parent)
    : QMainWindow(parent), controller_(controller) {
    model_ = new ShelfModel(&controller_->shelf(), this);
    view_ = new ShelfView(controller_, model_, this);
    setCentralWidget(view_);

    buildActions();

    countLabel_ = new QLabel(this);
    statusBar()->addPermanentWidget(countLabel_);
    connect(view_, &ShelfView::statusMessage, this, &ShelfWindow::showStatus);
    connect(model_, &QAbstractItemModel::modelReset, this,
            &ShelfWindow::updateActions);
    connect(model_, &ShelfModel::shelfSelectionChanged, this,
            &ShelfWindow::updateActions);

    connect(controller_, &ShelfController::batchApplied, this,
            [this](quint64, dropshelf::StackId, int items) {
                showStatus(tr("Added %n item(s)", nullptr, items));
            });
    connect(controller_, &ShelfController::dropFailed, this,
            [this](quint64, const QString &message) {
                showStatus(message, 6000);
            });
    // Drop acknowledgement: flash the window when it is in the background.
    connect(&controller_->pipeline(), &DropIngestionPipeline::acknowledged,
            this, [this](quint64) { QApplication::alert(this, 0); });
    connect(&controller_->pipeline(), &DropIngestionPipeline::pendingChanged,
            this, [this](int pending) {
                actCancelDrops_->setEnabled(pending > 0);
            });

    validateTimer_ = new QTimer(this);
    validateTimer_->setInterval(kValidateIntervalMs);
    connect(validateTimer_, &QTimer::timeout, this,
            &ShelfWindow::validateShelf);
    validateTimer_->start();

    QSettings s("DropShelf", "DropShelf");
    const QByteArray geo = s.value("UI/windowGeometry").toByteArray();
    if (geo.isEmpty() || !restoreGeometry(geo))
        resize(420, 520);
    if (s.value("UI/alwaysOnTop", false).toBool()) {
        actAlwaysOnTop_->setChecked(true);
        setWindowFlag(Qt::WindowStaysOnTopHint, true);
    }

    setWindowTitle(tr("DropShelf"));
    updateActions();
    statusBar()->showMessage(tr("Drop files here to keep them at hand"));
}

void ShelfWindow::buildActions() {
    auto *fileMenu = menuBar()->addMenu(tr("&Shelf"));
    actOpen_ = fileMenu->addAction(tr("Open"), view_, &ShelfView::openSelected);
    actOpen_->setShortcut(QKeySequence::Open);
    actReveal_ = fileMenu->addAction(tr("Show in Folder"), view_,
                                     &ShelfView::revealSelected);
    fileMenu->addSeparator();
    actValidate_ = fileMenu->addAction(tr("Remove Missing Files"), this,
                                       &ShelfWindow::validateShelf);
    actCancelDrops_ = fileMenu->addAction(tr("Cancel Pending Drops"), this,
                                          [this] {
                                              controller_->pipeline()
                                                  .cancelAll();
                                          });
    actCancelDrops_->setEnabled(false);
    fileMenu->addSeparator();
    actSettings_ = fileMenu->addAction(tr("Settings…"), this,
                                       &ShelfWindow::showSettings);
    actSettings_->setShortcut(QKeySequence::Preferences);
    auto *actQuit = fileMenu->addAction(tr("Quit"), qApp,
                                        &QCoreApplication::quit);
    actQuit->setShortcut(QKeySequence::Quit);

    auto *editMenu = menuBar()->addMenu(tr("&Edit"));
    actSelectAll_ = editMenu->addAction(tr("Select All"), this, [this] {
        controller_->shelf().selectAll();
    });
    actSelectAll_->setShortcut(QKeySequence::SelectAll);
    actDeselect_ = editMenu->addAction(tr("Deselect All"), this, [this] {
        controller_->shelf().deselectAll();
    });
    actDeselect_->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_A));
    editMenu->addSeparator();
    actCopy_ = editMenu->addAction(tr("Copy"), view_, &ShelfView::copySelected);
    actCopy_->setShortcut(QKeySequence::Copy);
    actRename_ = editMenu->addAction(tr("Rename…"), view_,
                                     &ShelfView::renameCurrent);
    actRename_->setShortcut(QKeySequence(Qt::Key_F2));
    editMenu->addSeparator();
    actRemove_ = editMenu->addAction(tr("Remove"), view_,
                                     &ShelfView::removeSelected);
    actRemoveStack_ = editMenu->addAction(tr("Remove Stack"), view_,
                                          &ShelfView::removeCurrentStack);
    actClear_ = editMenu->addAction(tr("Clear Shelf…"), this,
                                    &ShelfWindow::clearShelf);

    auto *viewMenu = menuBar()->addMenu(tr("&View"));
    actCollapseAll_ = viewMenu->addAction(tr("Collapse All"), this, [this] {
        controller_->shelf().collapseAll();
    });
    actAlwaysOnTop_ = viewMenu->addAction(tr("Always on Top"));
    actAlwaysOnTop_->setCheckable(true);
    connect(actAlwaysOnTop_, &QAction::toggled, this, [this](bool on) {
        QSettings s("DropShelf", "DropShelf");
        s.setValue("UI/alwaysOnTop", on);
        setWindowFlag(Qt::WindowStaysOnTopHint, on);
        show(); // flag changes hide the window
    });

    auto *tb = addToolBar(tr("Shelf"));
    tb->setMovable(false);
    tb->addAction(actOpen_);
    tb->addAction(actCopy_);
    tb->addAction(actRemove_);
    tb->addAction(actClear_);
    tb->addSeparator();
    tb->addAction(actSettings_);
}

void ShelfWindow::updateActions() {
    const auto &shelf = controller_->shelf();
    const bool hasSelection = !shelf.selection().empty();
    actOpen_->setEnabled(hasSelection);
    actReveal_->setEnabled(hasSelection);
    // Copy without a selection takes the whole shelf.
    actCopy_->setEnabled(!shelf.empty());
    actRename_->setEnabled(shelf.selection().size() == 1);
    actRemove_->setEnabled(hasSelection);
    actRemoveStack_->setEnabled(!shelf.empty());
    actClear_->setEnabled(!shelf.empty());
    actSelectAll_->setEnabled(!shelf.empty());
    actDeselect_->setEnabled(hasSelection);
    actCollapseAll_->setEnabled(!shelf.empty());
    countLabel_->setText(tr("%n item(s)", nullptr, int(shelf.itemCount())));
}

void ShelfWindow::showStatus(const QString &text, int timeoutMs) {
    statusBar()->showMessage(text, timeoutMs);
}

void ShelfWindow::clearShelf() {
    const auto n = controller_->shelf().itemCount();
    if (n == 0)
        return;
    if (!UiAlerts::confirm(this, tr("Clear shelf"),
                           tr("Remove all %n item(s) from the shelf?", nullptr,
                              int(n))))
        return;
    controller_->clearAll();
    showStatus(tr("Shelf cleared"), 3000);
}

void ShelfWindow::validateShelf() {
    if (controller_->shelf().empty())
        return;
    const int removed = controller_->validateItems();
    if (removed > 0)
        showStatus(tr("%n missing item(s) removed", nullptr, removed), 5000);
}

void ShelfWindow::showSettings() {
    SettingsDialog dlg(controller_->settings(), &controller_->secrets(), this);
    connect(&dlg, &SettingsDialog::settingsApplied, this,
            [this](const IngestSettings &s) {
                controller_->applySettings(s);
            });
    dlg.exec();
}

void ShelfWindow::changeEvent(QEvent *e) {
    QMainWindow::changeEvent(e);
    // Re-check items whenever the window regains focus.
    if (e->type() == QEvent::ActivationChange && isActiveWindow())
        validateShelf();
}

void ShelfWindow::closeEvent(QCloseEvent *e) {
    QSettings s("DropShelf", "DropShelf");
    s.setValue("UI/windowGeometry", saveGeometry());
    qCInfo(dsShelf) << "window closed items=" << controller_->shelf().itemCount();
    QMainWindow::closeEvent(e);
}
