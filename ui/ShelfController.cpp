#include "ShelfController.hpp"
#include "dropshelf/PathAllocator.hpp"
#include "dropshelf/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QMimeData>
#include <QStringList>
#include <algorithm>
#include <utility>
Q_LOGGING_CATEGORY(dsShelf, "dropshelf.shelf")
Q_LOGGING_CATEGORY(dsStaging, "dropshelf.staging")

ShelfController::ShelfController(const IngestSettings &settings,
                                 QObject *parent)
    : QObject(parent), settings_(settings),
      staging_(settings.stagingRoot.toStdString()),
      shelf_(settings.shelfOptions()) {
    pipeline_ = new DropIngestionPipeline(&staging_, this);
    pipeline_->setResolverOptions(settings_.resolverOptions());
    decoder_.setOptions(decodeOptions());
    connect(pipeline_, &DropIngestionPipeline::batchReady, this,
            &ShelfController::onBatchReady);
    connect(pipeline_, &DropIngestionPipeline::dropRejected, this,
            &ShelfController::onDropRejected);

    std::string err;
    if (!staging_.ensureRoot(err))
        qCWarning(dsStaging) << "staging root unavailable"
                             << QString::fromStdString(err);
    qCInfo(dsStaging) << "staging root"
                      << QString::fromStdString(
                             dropshelf::loggablePath(staging_.root()));
}

ShelfController::~ShelfController() {
    shutdown();
    // The pipeline joins its workers before staging_ goes away.
    delete pipeline_;
    pipeline_ = nullptr;
}

MimeDecodeOptions ShelfController::decodeOptions() const {
    MimeDecodeOptions o;
    o.sftpDefaults.known_hosts_policy = settings_.knownHostsPolicy;
    // A promise timeout shorter than the SSH default also bounds each
    // connect and SSH call, so a silent server cannot outlive it.
    if (settings_.promiseTimeoutMs > 0)
        o.sftpDefaults.timeout_ms =
            std::min(o.sftpDefaults.timeout_ms, settings_.promiseTimeoutMs);
    if (!settings_.privateKeyPath.isEmpty())
        o.sftpDefaults.private_key_path = settings_.privateKeyPath.toStdString();
    const SecretStore *secrets = &secrets_;
    o.passwordLookup = [secrets](const QString &user, const QString &host) {
        return secrets->getSecret(SecretStore::sftpPasswordKey(user, host));
    };
    return o;
}

void ShelfController::applySettings(const IngestSettings &settings) {
    const QString oldRoot = settings_.stagingRoot;
    settings_ = settings;
    pipeline_->setResolverOptions(settings_.resolverOptions());
    shelf_.setOptions(settings_.shelfOptions());
    decoder_.setOptions(decodeOptions());
    if (oldRoot != settings_.stagingRoot)
        qCInfo(dsStaging) << "staging root change applies after restart";
    qCInfo(dsShelf) << "settings applied maxConcurrent="
                    << settings_.maxConcurrent
                    << "timeoutMs=" << settings_.promiseTimeoutMs
                    << "submissionOrder=" << settings_.preserveSubmissionOrder
                    << "skipDuplicates=" << settings_.skipDuplicatePaths;
}

quint64 ShelfController::handleDrop(const QMimeData *md, bool forceStack) {
    return ingest(decoder_.decode(md), forceStack);
}

quint64 ShelfController::ingest(dropshelf::DropPayload payload,
                                bool forceStack) {
    return pipeline_->submit(std::move(payload), forceStack);
}

void ShelfController::onBatchReady(quint64 gestureId,
                                   std::vector<dropshelf::Item> items,
                                   bool forceStack) {
    const int offered = static_cast<int>(items.size());
    std::vector<dropshelf::Item> offeredItems = items;
    const dropshelf::StackId sid = shelf_.addBatch(std::move(items), forceStack);
    if (sid == 0) {
        purge(offeredItems);
        qCInfo(dsShelf) << "gesture" << gestureId
                        << "batch dropped: all items already on the shelf";
        emit dropFailed(gestureId, tr("Already on the shelf"));
        return;
    }
    const dropshelf::ItemStack *stack = shelf_.findStack(sid);
    const int added = stack ? static_cast<int>(stack->count()) : 0;
    qCInfo(dsShelf) << "gesture" << gestureId << "stack" << sid
                    << "items=" << added << "skipped=" << (offered - added)
                    << "forceStack=" << forceStack;
    emit batchApplied(gestureId, sid, added);
}

void ShelfController::onDropRejected(quint64 gestureId,
                                     dropshelf::DropError error,
                                     const QString &message) {
    qCInfo(dsShelf) << "gesture" << gestureId << "rejected"
                    << dropshelf::dropErrorName(error);
    emit dropFailed(gestureId, message);
}

void ShelfController::purge(const std::vector<dropshelf::Item> &removed) {
    for (const auto &item : removed) {
        if (!item.isTemporary || !staging_.owns(item.path))
            continue;
        std::string err;
        if (!staging_.removeStagedFile(item.path, err))
            qCWarning(dsStaging) << "purge failed" << QString::fromStdString(err);
        else
            qCDebug(dsStaging) << "purged"
                               << QString::fromStdString(
                                      dropshelf::loggablePath(item.path));
    }
}

bool ShelfController::removeItem(dropshelf::ItemId id) {
    auto removed = shelf_.removeItem(id);
    if (!removed)
        return false;
    purge({*removed});
    return true;
}

int ShelfController::removeSelected() {
    const auto removed = shelf_.removeSelected();
    purge(removed);
    return static_cast<int>(removed.size());
}

int ShelfController::removeStack(dropshelf::StackId id) {
    const auto removed = shelf_.removeStack(id);
    purge(removed);
    return static_cast<int>(removed.size());
}

int ShelfController::clearAll() {
    const auto removed = shelf_.clearAll();
    purge(removed);
    qCInfo(dsShelf) << "shelf cleared items=" << removed.size();
    return static_cast<int>(removed.size());
}

dropshelf::ItemId ShelfController::replaceItem(dropshelf::ItemId id,
                                               const QString &newPath,
                                               bool isTemporary) {
    dropshelf::ItemId newId = 0;
    auto old = shelf_.replaceItem(id, newPath.toStdString(), isTemporary, &newId);
    if (!old)
        return 0;
    if (old->path != newPath.toStdString())
        purge({*old});
    return newId;
}

dropshelf::ItemId
ShelfController::replaceItems(const std::vector<dropshelf::ItemId> &ids,
                              const QString &newPath, bool isTemporary) {
    const std::string path = newPath.toStdString();
    dropshelf::ItemId newId = 0;
    const auto old =
        shelf_.replaceItems(ids, dropshelf::makeItem(path, isTemporary), &newId);
    if (old.empty())
        return 0;
    std::vector<dropshelf::Item> stale;
    for (const auto &item : old)
        if (item.path != path)
            stale.push_back(item);
    purge(stale);
    qCInfo(dsShelf) << "replaced items count=" << old.size() << "with"
                    << QString::fromStdString(dropshelf::loggablePath(path));
    return newId;
}

dropshelf::ItemId ShelfController::renameItem(dropshelf::ItemId id,
                                              const QString &newName,
                                              QString *error) {
    const dropshelf::Item *item = shelf_.findItem(id);
    if (!item) {
        if (error)
            *error = tr("The item is no longer on the shelf");
        return 0;
    }
    std::string renamed;
    std::string err;
    if (!dropshelf::PathAllocator::renameEntry(item->path,
                                               newName.toStdString(), renamed,
                                               err)) {
        qCWarning(dsShelf) << "rename failed" << QString::fromStdString(err);
        if (error)
            *error = QString::fromStdString(err);
        return 0;
    }
    if (renamed == item->path)
        return id;
    qCInfo(dsShelf) << "renamed"
                    << QString::fromStdString(dropshelf::loggablePath(item->path))
                    << "to"
                    << QString::fromStdString(dropshelf::loggablePath(renamed));
    // The old path is gone from disk, so nothing is purged.
    dropshelf::ItemId newId = 0;
    shelf_.replaceItem(id, renamed, item->isTemporary, &newId);
    return newId;
}

QList<QUrl> ShelfController::clipboardUrls() const {
    QList<QUrl> urls;
    const auto selected = shelf_.selectedItems();
    if (!selected.empty()) {
        for (const auto *item : selected)
            urls.push_back(QUrl::fromLocalFile(QString::fromStdString(item->path)));
        return urls;
    }
    for (const auto &stack : shelf_.stacks())
        for (const auto &item : stack.items())
            urls.push_back(QUrl::fromLocalFile(QString::fromStdString(item.path)));
    return urls;
}

QMimeData *ShelfController::clipboardMimeData() const {
    const QList<QUrl> urls = clipboardUrls();
    if (urls.isEmpty())
        return nullptr;
    QStringList paths;
    for (const QUrl &u : urls)
        paths << u.toLocalFile();
    auto *md = new QMimeData();
    md->setUrls(urls);
    md->setText(paths.join(QLatin1Char('\n')));
    return md;
}

int ShelfController::validateItems() {
    const auto removed = shelf_.validateItems();
    if (!removed.empty())
        qCInfo(dsShelf) << "removed vanished items count=" << removed.size();
    purge(removed);
    return static_cast<int>(removed.size());
}

void ShelfController::shutdown() {
    if (shutDown_)
        return;
    shutDown_ = true;
    // Joins resolver workers so nothing writes into the root afterwards.
    pipeline_->abortAll();
    if (!settings_.cleanupOnQuit)
        return;
    std::string err;
    if (!staging_.cleanup(err))
        qCWarning(dsStaging) << "cleanup on quit failed"
                             << QString::fromStdString(err);
    else
        qCInfo(dsStaging) << "staged files removed root="
                          << QString::fromStdString(
                                 dropshelf::loggablePath(staging_.root()));
}
