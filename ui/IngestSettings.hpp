// Staging, resolver, shelf and SFTP preferences stored in QSettings.
#pragma once
#include "dropshelf/PromiseResolver.hpp"
#include "dropshelf/SftpTypes.hpp"
#include "dropshelf/ShelfCollection.hpp"
#include <QSettings>
#include <QString>

struct IngestSettings {
    static constexpr int kDefaultMaxConcurrent = 4;
    static constexpr int kMaxConcurrentLimit = 16;
    static constexpr int kMaxPromiseTimeoutMs = 600000;

    QString stagingRoot; // empty = <temp>/DropShelfCache
    int maxConcurrent = kDefaultMaxConcurrent;
    int promiseTimeoutMs = 0;
    bool preserveSubmissionOrder = false;
    bool cleanupOnQuit = true;
    bool skipDuplicatePaths = false;
    dropshelf::KnownHostsPolicy knownHostsPolicy =
        dropshelf::KnownHostsPolicy::Strict;
    QString privateKeyPath;

    // Reads QSettings("DropShelf", "DropShelf").
    static IngestSettings load();
    static IngestSettings load(QSettings &s);
    void save() const;
    void save(QSettings &s) const;

    dropshelf::ResolverOptions resolverOptions() const;
    dropshelf::ShelfOptions shelfOptions() const;
    // Root as configured, or the default cache directory.
    QString effectiveStagingRoot() const;

    bool operator==(const IngestSettings &) const = default;

    static int clampMaxConcurrent(int v);
    static int clampPromiseTimeout(int v);
};
