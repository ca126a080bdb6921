#include "MimePayloadDecoder.hpp"
#include "dropshelf/DataFilePromises.hpp"
#include "dropshelf/RuntimeLogging.hpp"
#include "dropshelf/SftpFilePromise.hpp"
#include <QBuffer>
#include <QByteArray>
#include <QFileInfo>
#include <QImage>
#include <QLoggingCategory>
#include <QMimeData>
#include <memory>
#include <utility>
Q_LOGGING_CATEGORY(dsSftp, "dropshelf.sftp")
Q_DECLARE_LOGGING_CATEGORY(dsIngest)

MimePayloadDecoder::MimePayloadDecoder(MimeDecodeOptions opt)
    : opt_(std::move(opt)) {}

bool MimePayloadDecoder::canDecode(const QMimeData *md) {
    return md && (md->hasUrls() || md->hasImage() || md->hasText());
}

static bool isWebUrl(const QUrl &u) {
    const QString scheme = u.scheme().toLower();
    return u.isValid() && !u.host().isEmpty() &&
           (scheme == QLatin1String("http") || scheme == QLatin1String("https"));
}

dropshelf::FilePromisePtr
MimePayloadDecoder::promiseForUrl(const QUrl &url) const {
    const QString scheme = url.scheme().toLower();
    if (scheme == QLatin1String("sftp")) {
        dropshelf::SftpLocation loc;
        std::string err;
        if (!dropshelf::parseSftpUrl(url.toString(QUrl::FullyEncoded).toStdString(),
                                     loc, err)) {
            qCWarning(dsSftp) << "rejected sftp URL:" << QString::fromStdString(err);
            return nullptr;
        }
        dropshelf::SftpOptions o = opt_.sftpDefaults;
        o.host = loc.host;
        o.port = loc.port;
        o.username = loc.username;
        o.password = loc.password;
        if (!o.password && opt_.passwordLookup && !o.username.empty()) {
            if (auto pw = opt_.passwordLookup(QString::fromStdString(o.username),
                                              QString::fromStdString(o.host)))
                o.password = pw->toStdString();
        }
        qCInfo(dsSftp) << "sftp promise host="
                       << (dropshelf::sensitiveLoggingEnabled()
                               ? QString::fromStdString(o.host)
                               : QStringLiteral("<redacted>"))
                       << "file=" << QString::fromStdString(
                                         dropshelf::loggablePath(loc.path))
                       << "passwordKnown=" << o.password.has_value();
        return std::make_shared<dropshelf::SftpFilePromise>(std::move(o),
                                                            loc.path);
    }
    if (isWebUrl(url))
        return std::make_shared<dropshelf::LinkFilePromise>(
            url.toString(QUrl::FullyEncoded).toStdString());
    return nullptr;
}

dropshelf::DropPayload MimePayloadDecoder::decode(const QMimeData *md) const {
    dropshelf::DropPayload out;
    if (!md)
        return out;

    if (md->hasUrls()) {
        for (const QUrl &u : md->urls()) {
            if (u.isLocalFile()) {
                const QString local = u.toLocalFile();
                if (!local.isEmpty() && QFileInfo::exists(local)) {
                    out.directPaths.push_back(
                        QFileInfo(local).absoluteFilePath().toStdString());
                } else {
                    qCDebug(dsIngest) << "skipping missing file"
                                      << QString::fromStdString(
                                             dropshelf::loggablePath(local.toStdString()));
                }
                continue;
            }
            if (auto p = promiseForUrl(u))
                out.promises.push_back(std::move(p));
        }
        return out;
    }

    if (md->hasImage()) {
        const QImage img = qvariant_cast<QImage>(md->imageData());
        if (!img.isNull()) {
            QByteArray png;
            QBuffer buf(&png);
            if (buf.open(QIODevice::WriteOnly) && img.save(&buf, "PNG")) {
                out.promises.push_back(std::make_shared<dropshelf::DataFilePromise>(
                    png.toStdString(), "image.png"));
                return out;
            }
            qCWarning(dsIngest) << "dropped image could not be encoded as PNG";
        }
    }

    if (md->hasText()) {
        const QString text = md->text();
        const QString trimmed = text.trimmed();
        if (trimmed.isEmpty())
            return out;
        const QUrl asUrl(trimmed, QUrl::StrictMode);
        if (!trimmed.contains(QLatin1Char('\n')) && isWebUrl(asUrl)) {
            out.promises.push_back(std::make_shared<dropshelf::LinkFilePromise>(
                asUrl.toString(QUrl::FullyEncoded).toStdString()));
        } else {
            out.promises.push_back(
                std::make_shared<dropshelf::TextFilePromise>(text.toStdString()));
        }
    }
    return out;
}
