// Application context: owns the staging area, the shelf and the ingestion
// pipeline, applies finished batches and purges staged files of items that
// leave the shelf. Lives on the GUI thread.
#pragma once
#include "DropIngestionPipeline.hpp"
#include "IngestSettings.hpp"
#include "MimePayloadDecoder.hpp"
#include "SecretStore.hpp"
#include "dropshelf/ShelfCollection.hpp"
#include "dropshelf/TempResourceManager.hpp"
#include <QList>
#include <QObject>
#include <QString>
#include <QUrl>
#include <optional>
#include <vector>

class QMimeData;

class ShelfController : public QObject {
    Q_OBJECT
public:
    explicit ShelfController(const IngestSettings &settings,
                             QObject *parent = nullptr);
    ~ShelfController() override;

    dropshelf::ShelfCollection &shelf() { return shelf_; }
    const dropshelf::ShelfCollection &shelf() const { return shelf_; }
    dropshelf::TempResourceManager &staging() { return staging_; }
    DropIngestionPipeline &pipeline() { return *pipeline_; }
    const MimePayloadDecoder &decoder() const { return decoder_; }
    SecretStore &secrets() { return secrets_; }
    const IngestSettings &settings() const { return settings_; }

    // Resolver, shelf and SFTP options take effect for the next drop; the
    // staging root is fixed for the lifetime of the controller.
    void applySettings(const IngestSettings &settings);

    // Decodes and submits one drop gesture. Returns the gesture id.
    quint64 handleDrop(const QMimeData *md, bool forceStack = false);
    quint64 ingest(dropshelf::DropPayload payload, bool forceStack = false);

    // Shelf mutations that also purge staged files of temporary items.
    bool removeItem(dropshelf::ItemId id);
    int removeSelected();
    int removeStack(dropshelf::StackId id);
    int clearAll();
    // Swaps in a derived artifact (e.g. from an external per-item service).
    dropshelf::ItemId replaceItem(dropshelf::ItemId id, const QString &newPath,
                                  bool isTemporary);
    // Collapses several items into one artifact, e.g. an archive built from
    // them; the new item ends up selected. Returns 0 if no id is present.
    dropshelf::ItemId replaceItems(const std::vector<dropshelf::ItemId> &ids,
                                   const QString &newPath, bool isTemporary);
    // Renames the item's file on disk next to the original and swaps the
    // item for one at the new path. Returns the new id (the old id when the
    // name did not change) or 0 with *error filled.
    dropshelf::ItemId renameItem(dropshelf::ItemId id, const QString &newName,
                                 QString *error = nullptr);

    // Clipboard payload: selected items in display order, or every item
    // when nothing is selected.
    QList<QUrl> clipboardUrls() const;
    // file URLs plus the paths as text, one per line; nullptr when empty.
    QMimeData *clipboardMimeData() const;
    int validateItems();

    // Cancels drops in flight and, if configured, removes what was staged.
    void shutdown();

signals:
    void batchApplied(quint64 gestureId, dropshelf::StackId stack, int items);
    void dropFailed(quint64 gestureId, const QString &message);

private:
    void onBatchReady(quint64 gestureId, std::vector<dropshelf::Item> items,
                      bool forceStack);
    void onDropRejected(quint64 gestureId, dropshelf::DropError error,
                        const QString &message);
    void purge(const std::vector<dropshelf::Item> &removed);
    MimeDecodeOptions decodeOptions() const;

    IngestSettings settings_;
    dropshelf::TempResourceManager staging_;
    dropshelf::ShelfCollection shelf_;
    SecretStore secrets_;
    MimePayloadDecoder decoder_;
    DropIngestionPipeline *pipeline_ = nullptr; // child QObject
    bool shutDown_ = false;
};
