// Credentials for sftp:// drops. Secret Service (libsecret) when the build
// has it, otherwise an opt-in, unencrypted QSettings fallback.
#pragma once
#include <QString>
#include <optional>

class SecretStore {
public:
    enum class PersistStatus { Stored, Unavailable, BackendError };
    struct PersistResult {
        PersistStatus status = PersistStatus::BackendError;
        QString detail;
        bool ok() const { return status == PersistStatus::Stored; }
    };

    // Logical key for an SFTP password: "sftp:<user>@<host>:password".
    static QString sftpPasswordKey(const QString &user, const QString &host);

    PersistResult setSecret(const QString &key, const QString &value);
    std::optional<QString> getSecret(const QString &key) const;
    void removeSecret(const QString &key);

    // True only without libsecret and with the fallback enabled through
    // DROPSHELF_ENABLE_INSECURE_FALLBACK=1 or Security/enableInsecureSecretFallback.
    static bool insecureFallbackActive();
};
