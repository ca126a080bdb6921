// Qt drag-and-drop data to a DropPayload.
//  - file:// URLs: direct references (files that do not exist are skipped)
//  - sftp:// URLs: SftpFilePromise
//  - http(s):// URLs: LinkFilePromise
//  - image data without URLs: DataFilePromise (PNG)
//  - plain text without URLs: TextFilePromise, or a link when the text is
//    a single web URL
#pragma once
#include "dropshelf/DropPayload.hpp"
#include "dropshelf/SftpTypes.hpp"
#include <QString>
#include <QUrl>
#include <functional>
#include <optional>
#include <utility>

class QMimeData;

struct MimeDecodeOptions {
    // Host, port, user and password are filled from each URL; everything
    // else (known_hosts policy, key) comes from here.
    dropshelf::SftpOptions sftpDefaults;
    // Password for user@host when the URL carries none.
    std::function<std::optional<QString>(const QString &user,
                                         const QString &host)>
        passwordLookup;
};

class MimePayloadDecoder {
public:
    explicit MimePayloadDecoder(MimeDecodeOptions opt = {});

    void setOptions(MimeDecodeOptions opt) { opt_ = std::move(opt); }
    const MimeDecodeOptions &options() const { return opt_; }

    dropshelf::DropPayload decode(const QMimeData *md) const;

    // Cheap check used by dragEnterEvent.
    static bool canDecode(const QMimeData *md);

    // Promise for a non-local URL, or nullptr for unsupported schemes and
    // malformed sftp URLs.
    dropshelf::FilePromisePtr promiseForUrl(const QUrl &url) const;

private:
    MimeDecodeOptions opt_;
};
