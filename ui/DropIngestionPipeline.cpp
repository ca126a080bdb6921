// Drop ingestion: classification, fast path, promise resolution and
// finalization on the owning thread.
#include "DropIngestionPipeline.hpp"
#include "dropshelf/RuntimeLogging.hpp"
#include "dropshelf/TempResourceManager.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <utility>
Q_LOGGING_CATEGORY(dsIngest, "dropshelf.ingest")

using dropshelf::DropError;

static const char *stageName(DropIngestionPipeline::Stage st) {
    switch (st) {
    case DropIngestionPipeline::Stage::Received:
        return "Received";
    case DropIngestionPipeline::Stage::Classified:
        return "Classified";
    case DropIngestionPipeline::Stage::Resolving:
        return "Resolving";
    case DropIngestionPipeline::Stage::Finalized:
        return "Finalized";
    case DropIngestionPipeline::Stage::Failed:
        return "Failed";
    }
    return "Unknown";
}

DropIngestionPipeline::DropIngestionPipeline(
    dropshelf::TempResourceManager *staging, QObject *parent)
    : QObject(parent), staging_(staging) {
    qRegisterMetaType<dropshelf::DropError>("dropshelf::DropError");
    qRegisterMetaType<std::vector<dropshelf::Item>>(
        "std::vector<dropshelf::Item>");
}

DropIngestionPipeline::~DropIngestionPipeline() {
    // Stop every worker before QObject teardown drops the queued results.
    abortAll();
}

void DropIngestionPipeline::abortAll() {
    if (gestures_.empty())
        return;
    qCInfo(dsIngest) << "aborting gestures count=" << gestures_.size();
    for (auto &kv : gestures_)
        kv.second->resolver->cancel();
    for (auto &kv : gestures_) {
        kv.second->resolver.reset();
        discardStagingDir(kv.second->stagingDir);
    }
    // Results already queued find no gesture and are ignored.
    gestures_.clear();
}

quint64 DropIngestionPipeline::submit(dropshelf::DropPayload payload,
                                      bool forceStack) {
    const quint64 id = nextGestureId_++;
    const auto cls = dropshelf::classifyPayload(payload);
    qCInfo(dsIngest) << "gesture" << id << "stage=" << stageName(Stage::Received)
                     << "direct=" << payload.directPaths.size()
                     << "promises=" << payload.promises.size();
    qCInfo(dsIngest) << "gesture" << id
                     << "stage=" << stageName(Stage::Classified)
                     << "class=" << dropshelf::payloadClassName(cls);

    switch (cls) {
    case dropshelf::PayloadClass::Direct:
        ingestDirect(id, payload, forceStack);
        break;
    case dropshelf::PayloadClass::Promised:
        ingestPromised(id, std::move(payload), forceStack);
        break;
    case dropshelf::PayloadClass::Unrecognized:
        reject(id, DropError::UnrecognizedPayload,
               tr("Nothing usable in this drop"));
        break;
    }
    return id;
}

void DropIngestionPipeline::ingestDirect(quint64 id,
                                         const dropshelf::DropPayload &payload,
                                         bool forceStack) {
    std::vector<dropshelf::Item> items;
    items.reserve(payload.directPaths.size());
    for (const auto &p : payload.directPaths) {
        if (p.empty())
            continue;
        items.push_back(dropshelf::makeItem(p, false));
    }
    qCInfo(dsIngest) << "gesture" << id
                     << "stage=" << stageName(Stage::Finalized)
                     << "path=direct items=" << items.size();
    emit batchReady(id, std::move(items), forceStack);
    emit acknowledged(id);
}

void DropIngestionPipeline::ingestPromised(quint64 id,
                                           dropshelf::DropPayload payload,
                                           bool forceStack) {
    if (!staging_) {
        reject(id, DropError::ResourceError, tr("No staging area configured"));
        return;
    }
    std::string err;
    const std::string dir = staging_->allocateDirectory(std::nullopt, err);
    if (dir.empty()) {
        reject(id, DropError::ResourceError, QString::fromStdString(err));
        return;
    }

    dropshelf::FilePromiseList promises;
    promises.reserve(payload.promises.size());
    for (auto &p : payload.promises)
        if (p)
            promises.push_back(std::move(p));

    const std::size_t submitted = promises.size();
    auto g = std::make_unique<Gesture>();
    g->id = id;
    g->forceStack = forceStack;
    g->stagingDir = dir;
    g->submitted = submitted;
    g->timer.start();
    g->resolver = std::make_unique<dropshelf::PromiseResolver>(resolverOpt_);
    for (std::size_t i = 0; i < promises.size(); ++i) {
        qCDebug(dsIngest) << "gesture" << id << "promise" << i
                          << QString::fromStdString(
                                 dropshelf::loggablePath(promises[i]->describe()));
    }

    // Runs on the last resolver worker; the outcome is copied into the
    // queued call so nothing on the worker side is touched afterwards.
    auto onFinished = [this, id](const dropshelf::ResolutionOutcome &outcome) {
        QMetaObject::invokeMethod(
            this, [this, id, outcome]() { finishGesture(id, outcome); },
            Qt::QueuedConnection);
    };
    dropshelf::PromiseResolver *resolver = g->resolver.get();
    gestures_.emplace(id, std::move(g));
    if (!resolver->start(std::move(promises), dir, onFinished, err)) {
        gestures_.erase(id);
        discardStagingDir(dir);
        reject(id, DropError::ResourceError, QString::fromStdString(err));
        return;
    }
    qCInfo(dsIngest) << "gesture" << id
                     << "stage=" << stageName(Stage::Resolving)
                     << "promises=" << submitted
                     << "maxConcurrent=" << resolverOpt_.maxConcurrent
                     << "dir="
                     << QString::fromStdString(dropshelf::loggablePath(dir));
    emit pendingChanged(pendingCount());
}

void DropIngestionPipeline::finishGesture(quint64 id,
                                          dropshelf::ResolutionOutcome outcome) {
    auto it = gestures_.find(id);
    if (it == gestures_.end())
        return;
    std::unique_ptr<Gesture> g = std::move(it->second);
    gestures_.erase(it);
    const qint64 elapsedMs = g->timer.elapsed();
    // cancel() may land between the resolver's barrier and this queued call.
    const bool canceled = outcome.canceled || g->resolver->isCanceled();
    // Joins the workers; the last one is past its callback already.
    g->resolver.reset();
    emit pendingChanged(pendingCount());

    for (const auto &f : outcome.failures) {
        qCWarning(dsIngest) << "gesture" << id << "promise" << f.index
                            << "failed" << QString::fromStdString(f.error)
                            << "timedOut=" << f.timedOut
                            << "canceled=" << f.canceled;
    }

    if (canceled) {
        qCInfo(dsIngest) << "gesture" << id
                         << "stage=" << stageName(Stage::Failed)
                         << "error=Canceled elapsedMs=" << elapsedMs;
        discardStagingDir(g->stagingDir);
        emit dropRejected(id, DropError::Canceled, tr("Drop canceled"));
        return;
    }
    if (!outcome.succeeded()) {
        qCWarning(dsIngest) << "gesture" << id
                            << "stage=" << stageName(Stage::Failed)
                            << "error=NoPromisesResolved"
                            << "submitted=" << outcome.submitted
                            << "elapsedMs=" << elapsedMs;
        discardStagingDir(g->stagingDir);
        emit dropRejected(id, DropError::NoPromisesResolved,
                          tr("None of the %n dropped file(s) could be created",
                             nullptr, static_cast<int>(outcome.submitted)));
        return;
    }

    std::vector<dropshelf::Item> items;
    items.reserve(outcome.paths.size());
    for (const auto &p : outcome.paths)
        items.push_back(dropshelf::makeItem(p, true));
    qCInfo(dsIngest) << "gesture" << id
                     << "stage=" << stageName(Stage::Finalized)
                     << "path=promised items=" << items.size()
                     << "failed=" << outcome.failures.size()
                     << "elapsedMs=" << elapsedMs;
    emit batchReady(id, std::move(items), g->forceStack);
    emit acknowledged(id);
}

bool DropIngestionPipeline::cancel(quint64 gestureId) {
    auto it = gestures_.find(gestureId);
    if (it == gestures_.end())
        return false;
    qCInfo(dsIngest) << "gesture" << gestureId << "cancel requested";
    it->second->resolver->cancel();
    return true;
}

void DropIngestionPipeline::cancelAll() {
    for (auto &kv : gestures_)
        kv.second->resolver->cancel();
}

void DropIngestionPipeline::reject(quint64 id, DropError error,
                                   const QString &message) {
    qCWarning(dsIngest) << "gesture" << id
                        << "stage=" << stageName(Stage::Failed)
                        << "error=" << dropshelf::dropErrorName(error)
                        << message;
    emit dropRejected(id, error, message);
}

void DropIngestionPipeline::discardStagingDir(const std::string &dir) {
    if (!staging_ || dir.empty())
        return;
    std::string err;
    if (!staging_->removeStagedFile(dir, err))
        qCWarning(dsIngest) << "staging cleanup failed"
                            << QString::fromStdString(err);
}
