#include "IngestSettings.hpp"
#include "dropshelf/TempResourceManager.hpp"
#include <algorithm>

IngestSettings IngestSettings::load() {
    QSettings s("DropShelf", "DropShelf");
    return load(s);
}

IngestSettings IngestSettings::load(QSettings &s) {
    IngestSettings out;
    out.stagingRoot = s.value("Staging/root").toString().trimmed();
    out.maxConcurrent = clampMaxConcurrent(
        s.value("Staging/maxConcurrent", kDefaultMaxConcurrent).toInt());
    out.promiseTimeoutMs =
        clampPromiseTimeout(s.value("Staging/promiseTimeoutMs", 0).toInt());
    out.preserveSubmissionOrder =
        s.value("Staging/preserveSubmissionOrder", false).toBool();
    out.cleanupOnQuit = s.value("Staging/cleanupOnQuit", true).toBool();
    out.skipDuplicatePaths = s.value("Shelf/skipDuplicatePaths", false).toBool();
    out.knownHostsPolicy = dropshelf::knownHostsPolicyFromString(
        s.value("Sftp/knownHostsPolicy", QStringLiteral("strict"))
            .toString()
            .toStdString());
    out.privateKeyPath = s.value("Sftp/privateKeyPath").toString().trimmed();
    return out;
}

void IngestSettings::save() const {
    QSettings s("DropShelf", "DropShelf");
    save(s);
}

void IngestSettings::save(QSettings &s) const {
    if (stagingRoot.isEmpty())
        s.remove("Staging/root");
    else
        s.setValue("Staging/root", stagingRoot);
    s.setValue("Staging/maxConcurrent", clampMaxConcurrent(maxConcurrent));
    s.setValue("Staging/promiseTimeoutMs", clampPromiseTimeout(promiseTimeoutMs));
    s.setValue("Staging/preserveSubmissionOrder", preserveSubmissionOrder);
    s.setValue("Staging/cleanupOnQuit", cleanupOnQuit);
    s.setValue("Shelf/skipDuplicatePaths", skipDuplicatePaths);
    s.setValue("Sftp/knownHostsPolicy",
               QString::fromLatin1(dropshelf::knownHostsPolicyName(knownHostsPolicy)));
    if (privateKeyPath.isEmpty())
        s.remove("Sftp/privateKeyPath");
    else
        s.setValue("Sftp/privateKeyPath", privateKeyPath);
    s.sync();
}

dropshelf::ResolverOptions IngestSettings::resolverOptions() const {
    dropshelf::ResolverOptions o;
    o.maxConcurrent = clampMaxConcurrent(maxConcurrent);
    o.promiseTimeoutMs = clampPromiseTimeout(promiseTimeoutMs);
    o.order = preserveSubmissionOrder ? dropshelf::ResultOrder::Submission
                                      : dropshelf::ResultOrder::Completion;
    return o;
}

dropshelf::ShelfOptions IngestSettings::shelfOptions() const {
    dropshelf::ShelfOptions o;
    o.skipDuplicatePaths = skipDuplicatePaths;
    return o;
}

QString IngestSettings::effectiveStagingRoot() const {
    if (!stagingRoot.isEmpty())
        return stagingRoot;
    return QString::fromStdString(dropshelf::TempResourceManager::defaultRoot());
}

int IngestSettings::clampMaxConcurrent(int v) {
    return std::clamp(v, 1, kMaxConcurrentLimit);
}

int IngestSettings::clampPromiseTimeout(int v) {
    return std::clamp(v, 0, kMaxPromiseTimeoutMs);
}
