// SecretStore implementation: libsecret (Secret Service) or an optional
// QSettings fallback.
#include "SecretStore.hpp"
#include <QByteArray>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QVariant>
#include <cstdlib>

Q_DECLARE_LOGGING_CATEGORY(dsSftp)

QString SecretStore::sftpPasswordKey(const QString &user, const QString &host) {
    return QStringLiteral("sftp:%1@%2:password").arg(user, host.toLower());
}

#if defined(HAVE_LIBSECRET)

#include <libsecret/secret.h>

static const SecretSchema *dropshelfSchema() {
    static const SecretSchema schema = {
        "dropshelf.secret", SECRET_SCHEMA_NONE,
        {
            {"key", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING},
        }};
    return &schema;
}

SecretStore::PersistResult SecretStore::setSecret(const QString &key,
                                                  const QString &value) {
    if (key.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty secret key")};
    const QByteArray k = key.toUtf8();
    const QByteArray v = value.toUtf8();
    GError *gerr = nullptr;
    const gboolean ok = secret_password_store_sync(
        dropshelfSchema(), SECRET_COLLECTION_DEFAULT, "DropShelf secret",
        v.constData(), nullptr, &gerr, "key", k.constData(), nullptr);
    if (ok)
        return {PersistStatus::Stored, QString()};
    const QString detail = gerr ? QString::fromUtf8(gerr->message)
                                : QStringLiteral("libsecret store failed");
    qCDebug(dsSftp) << "secret store failed" << detail;
    if (gerr)
        g_error_free(gerr);
    return {PersistStatus::BackendError, detail};
}

std::optional<QString> SecretStore::getSecret(const QString &key) const {
    const QByteArray k = key.toUtf8();
    GError *gerr = nullptr;
    gchar *pw = secret_password_lookup_sync(dropshelfSchema(), nullptr, &gerr,
                                            "key", k.constData(), nullptr);
    if (gerr) {
        qCDebug(dsSftp) << "secret lookup failed"
                        << QString::fromUtf8(gerr->message);
        g_error_free(gerr);
    }
    if (!pw)
        return std::nullopt;
    const QString out = QString::fromUtf8(pw);
    secret_password_free(pw);
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
}

void SecretStore::removeSecret(const QString &key) {
    const QByteArray k = key.toUtf8();
    GError *gerr = nullptr;
    secret_password_clear_sync(dropshelfSchema(), nullptr, &gerr, "key",
                               k.constData(), nullptr);
    if (gerr) {
        qCDebug(dsSftp) << "secret removal failed"
                        << QString::fromUtf8(gerr->message);
        g_error_free(gerr);
    }
}

bool SecretStore::insecureFallbackActive() { return false; }

#else // no Secret Service: opt-in fallback

static bool fallbackEnabled() {
    const char *v = std::getenv("DROPSHELF_ENABLE_INSECURE_FALLBACK");
    if (v && *v == '1')
        return true;
    QSettings s("DropShelf", "DropShelf");
    return s.value("Security/enableInsecureSecretFallback", false).toBool();
}

SecretStore::PersistResult SecretStore::setSecret(const QString &key,
                                                  const QString &value) {
    if (key.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty secret key")};
    if (!fallbackEnabled())
        return {PersistStatus::Unavailable,
                QStringLiteral("No secure backend and the insecure fallback is off")};
    QSettings s("DropShelf", "Secrets");
    s.setValue(key, value);
    s.sync();
    if (s.status() != QSettings::NoError)
        return {PersistStatus::BackendError,
                QStringLiteral("QSettings could not persist the secret")};
    return {PersistStatus::Stored, QString()};
}

std::optional<QString> SecretStore::getSecret(const QString &key) const {
    if (!fallbackEnabled())
        return std::nullopt;
    QSettings s("DropShelf", "Secrets");
    const QVariant v = s.value(key);
    if (!v.isValid())
        return std::nullopt;
    return v.toString();
}

void SecretStore::removeSecret(const QString &key) {
    if (!fallbackEnabled())
        return;
    QSettings s("DropShelf", "Secrets");
    s.remove(key);
}

bool SecretStore::insecureFallbackActive() { return fallbackEnabled(); }

#endif
