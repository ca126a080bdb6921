// Promise for a remote file dropped as an sftp:// URL. materialize() opens
// its own SSH session (libssh2), downloads the file in chunks into the
// staging directory and closes the session again.
#pragma once
#include "FilePromise.hpp"
#include "SftpTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace dropshelf {

class SftpFilePromise : public FilePromise {
public:
    SftpFilePromise(SftpOptions session, std::string remotePath);

    std::string suggestedName() const override;
    std::string describe() const override;
    bool materialize(const std::string &destDir, std::string &outPath,
                     std::string &err, CancelCB shouldCancel = {}) override;

    const SftpOptions &options() const { return opt_; }
    const std::string &remotePath() const { return remote_; }

    // Records host (as "[host]:port" off port 22) with a raw host key in an
    // OpenSSH known_hosts file. keyAlg is a LIBSSH2_KNOWNHOST_KEY_* value.
    // Reading, checking and rewriting the file happen under one process-wide
    // lock, so sessions of parallel drops never lose each other's entries.
    // An entry that already matches is left alone; a different key for the
    // same host is refused.
    static bool recordKnownHost(const std::string &knownHostsPath,
                                const std::string &host, std::uint16_t port,
                                const char *key, std::size_t keyLen,
                                int keyAlg, std::string &err);

private:
    // One connection per materialize() call; torn down by the destructor.
    struct Session {
        int sock = -1;
        _LIBSSH2_SESSION *session = nullptr;
        _LIBSSH2_SFTP *sftp = nullptr;
        Session() = default;
        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;
        ~Session();
    };

    // Non-blocking connect polled in short slices so shouldCancel and the
    // timeout are honored while the peer is silent.
    static bool tcpConnect(Session &s, const std::string &host,
                           std::uint16_t port, int timeoutMs,
                           const CancelCB &shouldCancel, std::string &err);
    static bool verifyHostKey(Session &s, const SftpOptions &opt,
                              std::string &err);
    static bool authenticate(Session &s, const SftpOptions &opt,
                             std::string &err);
    bool download(Session &s, const std::string &destDir, std::string &outPath,
                  std::string &err, const CancelCB &shouldCancel) const;

    SftpOptions opt_;
    std::string remote_;
};

} // namespace dropshelf
