// Main window: hosts the shelf view, the menus and the status bar.
#pragma once
#include <QMainWindow>

class QAction;
class QLabel;
class QTimer;
class ShelfController;
class ShelfModel;
class ShelfView;

class ShelfWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit ShelfWindow(ShelfController *controller,
                         QWidget *parent = nullptr);

protected:
    void closeEvent(QCloseEvent *e) override;
    void changeEvent(QEvent *e) override;

private slots:
    void clearShelf();
    void validateShelf();
    void showSettings();
    void updateActions();

private:
    void buildActions();
    void showStatus(const QString &text, int timeoutMs = 4000);

    ShelfController *controller_ = nullptr; // not owned
    ShelfModel *model_ = nullptr;
    ShelfView *view_ = nullptr;
    QLabel *countLabel_ = nullptr;
    QTimer *validateTimer_ = nullptr;

    QAction *actOpen_ = nullptr;
    QAction *actReveal_ = nullptr;
    QAction *actCopy_ = nullptr;
    QAction *actRename_ = nullptr;
    QAction *actRemove_ = nullptr;
    QAction *actRemoveStack_ = nullptr;
    QAction *actClear_ = nullptr;
    QAction *actSelectAll_ = nullptr;
    QAction *actDeselect_ = nullptr;
    QAction *actCollapseAll_ = nullptr;
    QAction *actValidate_ = nullptr;
    QAction *actCancelDrops_ = nullptr;
    QAction *actSettings_ = nullptr;
    QAction *actAlwaysOnTop_ = nullptr;
};
