// Turns one drop gesture into one batch of shelf items. Direct references are
// handled synchronously; promises are resolved on a PromiseResolver and the
// result is posted back to the thread that owns the pipeline before any
// signal is emitted.
#pragma once
#include "dropshelf/DropPayload.hpp"
#include "dropshelf/PromiseResolver.hpp"
#include "dropshelf/ShelfTypes.hpp"
#include <QElapsedTimer>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <memory>
#include <unordered_map>
#include <vector>

namespace dropshelf {
class TempResourceManager;
}

Q_DECLARE_METATYPE(dropshelf::DropError)
Q_DECLARE_METATYPE(dropshelf::Item)

class DropIngestionPipeline : public QObject {
    Q_OBJECT
public:
    // Per-gesture lifecycle, for logs.
    enum class Stage { Received, Classified, Resolving, Finalized, Failed };

    // staging is not owned and must outlive the pipeline.
    explicit DropIngestionPipeline(dropshelf::TempResourceManager *staging,
                                   QObject *parent = nullptr);
    ~DropIngestionPipeline() override;

    void setResolverOptions(const dropshelf::ResolverOptions &opt) {
        resolverOpt_ = opt;
    }
    const dropshelf::ResolverOptions &resolverOptions() const {
        return resolverOpt_;
    }

    // Starts one gesture and returns its id (never 0). Direct and rejected
    // payloads emit their signal before submit() returns.
    quint64 submit(dropshelf::DropPayload payload, bool forceStack = false);

    // Cancels a gesture that is still resolving. Returns false when the id
    // is unknown or already finished.
    bool cancel(quint64 gestureId);
    void cancelAll();
    // Cancels and joins every gesture in flight without emitting anything;
    // their staging directories are removed.
    void abortAll();

    // Gestures still resolving promises.
    int pendingCount() const { return static_cast<int>(gestures_.size()); }

signals:
    // Exactly one per successful gesture; items keep batch order.
    void batchReady(quint64 gestureId, std::vector<dropshelf::Item> items,
                    bool forceStack);
    void dropRejected(quint64 gestureId, dropshelf::DropError error,
                      const QString &message);
    // Drop accepted and finalized (sound/haptic hook).
    void acknowledged(quint64 gestureId);
    // Number of gestures still resolving changed.
    void pendingChanged(int pending);

private:
    struct Gesture {
        quint64 id = 0;
        bool forceStack = false;
        std::string stagingDir;
        std::size_t submitted = 0;
        QElapsedTimer timer;
        std::unique_ptr<dropshelf::PromiseResolver> resolver;
    };

    void ingestDirect(quint64 id, const dropshelf::DropPayload &payload,
                      bool forceStack);
    void ingestPromised(quint64 id, dropshelf::DropPayload payload,
                        bool forceStack);
    void finishGesture(quint64 id, dropshelf::ResolutionOutcome outcome);
    void reject(quint64 id, dropshelf::DropError error, const QString &message);
    void discardStagingDir(const std::string &dir);

    dropshelf::TempResourceManager *staging_ = nullptr;
    dropshelf::ResolverOptions resolverOpt_;
    std::unordered_map<quint64, std::unique_ptr<Gesture>> gestures_;
    quint64 nextGestureId_ = 1;
};
