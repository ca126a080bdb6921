// libssh2 backend for sftp:// drops: TCP socket, SSH session, known_hosts
// check, authentication and a chunked, cancelable download.
#include "dropshelf/SftpFilePromise.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace dropshelf {

// libssh2_init must run once per process before any session exists.
static bool ensureLibssh2(std::string &err) {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        err = "libssh2_init failed (" + std::to_string(rc) + ")";
        return false;
    }
    return true;
}

static std::string lastSessionError(LIBSSH2_SESSION *session) {
    char *msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

// Keyboard-interactive: answer every prompt with the password.
static void kbintPasswordCallback(const char *, int, const char *, int,
                                  int num_prompts,
                                  const LIBSSH2_USERAUTH_KBDINT_PROMPT *,
                                  LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                                  void **abstract) {
    const char *pass =
        (abstract && *abstract) ? static_cast<const char *>(*abstract) : nullptr;
    const size_t plen = pass ? std::strlen(pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (!pass || plen == 0)
            continue;
        // libssh2 frees the responses with its allocator (malloc by default).
        char *buf = static_cast<char *>(std::malloc(plen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, pass, plen + 1);
        responses[i].text = buf;
        responses[i].length = (unsigned int)plen;
    }
}

SftpFilePromise::Session::~Session() {
    if (sftp) {
        libssh2_sftp_shutdown(sftp);
        sftp = nullptr;
    }
    if (session) {
        libssh2_session_disconnect(session, "bye");
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != -1) {
        ::close(sock);
        sock = -1;
    }
}

SftpFilePromise::SftpFilePromise(SftpOptions session, std::string remotePath)
    : opt_(std::move(session)), remote_(std::move(remotePath)) {}

std::string SftpFilePromise::suggestedName() const {
    const std::string base = remoteBaseName(remote_);
    return base.empty() ? std::string("remote-file") : base;
}

std::string SftpFilePromise::describe() const {
    std::string out = "sftp://";
    if (!opt_.username.empty())
        out += opt_.username + "@";
    out += opt_.host;
    if (opt_.port != 22)
        out += ":" + std::to_string(opt_.port);
    return out + remote_;
}

// Waits for a non-blocking connect in slices of kConnectSliceMs.
static constexpr int kConnectSliceMs = 100;

static bool finishConnect(int fd, int timeoutMs,
                          const FilePromise::CancelCB &shouldCancel,
                          std::string &why) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(timeoutMs);
    while (true) {
        if (shouldCancel && shouldCancel()) {
            why = "Canceled";
            return false;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                              deadline - std::chrono::steady_clock::now())
                              .count();
        if (left <= 0) {
            why = "timed out";
            return false;
        }
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        const int rc = ::poll(&pfd, 1,
                              static_cast<int>(std::min<long long>(left, kConnectSliceMs)));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            why = std::strerror(errno);
            return false;
        }
        if (rc == 0)
            continue;
        int soErr = 0;
        socklen_t len = sizeof(soErr);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len) != 0) {
            why = std::strerror(errno);
            return false;
        }
        if (soErr != 0) {
            why = std::strerror(soErr);
            return false;
        }
        return true;
    }
}

bool SftpFilePromise::tcpConnect(Session &s, const std::string &host,
                                 std::uint16_t port, int timeoutMs,
                                 const CancelCB &shouldCancel,
                                 std::string &err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    std::string why;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd == -1)
            continue;
        int opt = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __linux__
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
            why = std::strerror(errno);
            ::close(fd);
            continue;
        }
        bool connected = ::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0;
        if (!connected && errno == EINPROGRESS)
            connected = finishConnect(fd, timeoutMs, shouldCancel, why);
        else if (!connected)
            why = std::strerror(errno);
        // libssh2 runs the session in blocking mode on this socket.
        if (connected && ::fcntl(fd, F_SETFL, flags) == -1) {
            why = std::strerror(errno);
            connected = false;
        }
        if (connected) {
            s.sock = fd;
            freeaddrinfo(res);
            return true;
        }
        ::close(fd);
        if (why == "Canceled")
            break;
    }
    freeaddrinfo(res);
    if (why == "Canceled") {
        err = "Canceled";
        return false;
    }
    err = "Could not connect to " + host + ":" + std::to_string(port);
    if (!why.empty())
        err += ": " + why;
    return false;
}

static int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

static const char *hostKeyAlgName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
    default:
        return "UNKNOWN";
    }
}

static std::string hostKeyFingerprint(LIBSSH2_SESSION *session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const char *label = "SHA256:";
    const int hashLen = 32;
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const char *label = "SHA1:";
    const int hashLen = 20;
#endif
    const unsigned char *h =
        (const unsigned char *)libssh2_hostkey_hash(session, hashType);
    if (!h)
        return {};
    std::ostringstream oss;
    oss << label;
    for (int i = 0; i < hashLen; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        oss << b;
    }
    return oss.str();
}

static std::string defaultKnownHostsPath(const SftpOptions &opt) {
    if (opt.known_hosts_path.has_value())
        return *opt.known_hosts_path;
    if (const char *home = std::getenv("HOME"))
        return std::string(home) + "/.ssh/known_hosts";
    return {};
}

// Plain first, then hashed entries. Returns a LIBSSH2_KNOWNHOST_CHECK_* code.
static int checkKnownHost(LIBSSH2_KNOWNHOSTS *nh, const std::string &host,
                          std::uint16_t port, const char *key,
                          std::size_t keyLen, int alg) {
    const int plainMask =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int hashMask =
        LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    struct libssh2_knownhost *found = nullptr;
    int check = libssh2_knownhost_checkp(nh, host.c_str(), port, key, keyLen,
                                         plainMask, &found);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
        check = libssh2_knownhost_checkp(nh, host.c_str(), port, key, keyLen,
                                         hashMask, &found);
    return check;
}

// One writer at a time for every known_hosts file this process touches.
static std::mutex &knownHostsMutex() {
    static std::mutex m;
    return m;
}

bool SftpFilePromise::recordKnownHost(const std::string &knownHostsPath,
                                      const std::string &host,
                                      std::uint16_t port, const char *key,
                                      std::size_t keyLen, int keyAlg,
                                      std::string &err) {
    if (knownHostsPath.empty()) {
        err = "known_hosts path is not defined";
        return false;
    }
    if (!key || keyLen == 0 || host.empty()) {
        err = "Nothing to record in known_hosts";
        return false;
    }
    if (!ensureLibssh2(err))
        return false;

    // knownhost collections hang off a session; this one never connects.
    std::unique_ptr<LIBSSH2_SESSION, void (*)(LIBSSH2_SESSION *)> session(
        libssh2_session_init(),
        [](LIBSSH2_SESSION *p) { libssh2_session_free(p); });
    if (!session) {
        err = "libssh2_session_init failed";
        return false;
    }

    std::lock_guard<std::mutex> lk(knownHostsMutex());
    std::unique_ptr<LIBSSH2_KNOWNHOSTS, void (*)(LIBSSH2_KNOWNHOSTS *)> nh(
        libssh2_knownhost_init(session.get()), libssh2_knownhost_free);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }
    std::error_code ec;
    if (std::filesystem::exists(knownHostsPath, ec) &&
        libssh2_knownhost_readfile(nh.get(), knownHostsPath.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        err = "known_hosts is unreadable: " + knownHostsPath;
        return false;
    }

    // Another session may have recorded the host since our own check.
    const int check = checkKnownHost(nh.get(), host, port, key, keyLen, keyAlg);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = "Host key does not match known_hosts";
        return false;
    }

    const std::string entry =
        port == 22 ? host : "[" + host + "]:" + std::to_string(port);
    const int mask =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | keyAlg;
    if (libssh2_knownhost_addc(nh.get(), entry.c_str(), nullptr, key, keyLen,
                               nullptr, 0, mask, nullptr) != 0 ||
        libssh2_knownhost_writefile(nh.get(), knownHostsPath.c_str(),
                                    LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        err = "Could not record the host in known_hosts";
        return false;
    }
    return true;
}

bool SftpFilePromise::verifyHostKey(Session &s, const SftpOptions &opt,
                                    std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(s.session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err = "Could not read the server host key";
        return false;
    }
    const int alg = knownHostKeyAlg(keytype);
    const std::string khPath = defaultKnownHostsPath(opt);

    int check = LIBSSH2_KNOWNHOST_CHECK_NOTFOUND;
    {
        std::lock_guard<std::mutex> lk(knownHostsMutex());
        LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(s.session);
        if (!nh) {
            err = "Could not initialize known_hosts";
            return false;
        }
        // Frees nh on every return path.
        std::unique_ptr<LIBSSH2_KNOWNHOSTS, void (*)(LIBSSH2_KNOWNHOSTS *)>
            guard(nh, libssh2_knownhost_free);
        bool khLoaded = false;
        if (!khPath.empty())
            khLoaded = libssh2_knownhost_readfile(
                           nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
        if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
            err = "known_hosts missing or unreadable (strict policy)";
            return false;
        }
        check = checkKnownHost(nh, opt.host, opt.port, hostkey, keylen, alg);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;

    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = "Host key does not match known_hosts";
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err = "Unknown host in known_hosts";
        return false;
    }

    // AcceptNew with an unknown host. The prompt runs without the lock held.
    if (opt.hostkey_confirm_cb &&
        !opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgName(keytype),
                                hostKeyFingerprint(s.session))) {
        err = "Unknown host: fingerprint not confirmed";
        return false;
    }
    return recordKnownHost(khPath, opt.host, opt.port, hostkey, keylen, alg,
                           err);
}

// Up to three ssh-agent identities.
static bool tryAgent(LIBSSH2_SESSION *session, const std::string &user) {
    LIBSSH2_AGENT *agent = libssh2_agent_init(session);
    if (!agent)
        return false;
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        int tries = 0;
        while (!authed && tries < 3 &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int rc;
            while ((rc = libssh2_agent_userauth(agent, user.c_str(), identity)) ==
                   LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            authed = rc == 0;
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return authed;
}

bool SftpFilePromise::authenticate(Session &s, const SftpOptions &opt,
                                   std::string &err) {
    const std::string &user = opt.username;

    // An explicit key wins.
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        if (libssh2_userauth_publickey_fromfile(s.session, user.c_str(), nullptr,
                                                opt.private_key_path->c_str(),
                                                passphrase) != 0) {
            err = "Key authentication failed: " + lastSessionError(s.session);
            return false;
        }
        return true;
    }

    std::string authlist;
    auto methods = [&]() -> const std::string & {
        if (authlist.empty()) {
            char *m = libssh2_userauth_list(s.session, user.c_str(),
                                            (unsigned)user.size());
            authlist = m ? std::string(m) : std::string();
        }
        return authlist;
    };

    if (opt.password.has_value()) {
        int rc;
        while ((rc = libssh2_userauth_password(s.session, user.c_str(),
                                               opt.password->c_str())) ==
               LIBSSH2_ERROR_EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (rc == 0)
            return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        if (methods().find("keyboard-interactive") != std::string::npos) {
            void **abs = libssh2_session_abstract(s.session);
            if (abs)
                *abs = const_cast<char *>(opt.password->c_str());
            while ((rc = libssh2_userauth_keyboard_interactive(
                        s.session, user.c_str(), kbintPasswordCallback)) ==
                   LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (abs)
                *abs = nullptr;
            if (rc == 0)
                return true;
        }
    }

    if (methods().find("publickey") != std::string::npos &&
        tryAgent(s.session, user))
        return true;

    const std::string last = lastSessionError(s.session);
    err = opt.password.has_value() ? "Password authentication failed"
                                   : "No credentials: key, agent and password unavailable";
    if (!authlist.empty())
        err += " (methods: " + authlist + ")";
    if (!last.empty())
        err += ": " + last;
    return false;
}

bool SftpFilePromise::download(Session &s, const std::string &destDir,
                               std::string &outPath, std::string &err,
                               const CancelCB &shouldCancel) const {
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(s.sftp, remote_.c_str(), (unsigned)remote_.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = "Remote stat failed for " + remote_;
        return false;
    }
    if ((st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
        (st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR) {
        err = "Remote path is a directory: " + remote_;
        return false;
    }

    LIBSSH2_SFTP_HANDLE *rh =
        libssh2_sftp_open_ex(s.sftp, remote_.c_str(), (unsigned)remote_.size(),
                             LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file " + remote_;
        return false;
    }

    std::string local;
    std::FILE *lf = openStagedFile(destDir, suggestedName(), local, err);
    if (!lf) {
        libssh2_sftp_close(rh);
        return false;
    }

    auto fail = [&](const std::string &msg) {
        err = msg;
        std::fclose(lf);
        libssh2_sftp_close(rh);
        std::error_code ec;
        std::filesystem::remove(local, ec);
        return false;
    };

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    while (true) {
        if (shouldCancel && shouldCancel())
            return fail("Canceled");
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n)
                return fail("Local write failed for " + local);
        } else if (n == 0) {
            break; // EOF
        } else {
            return fail("Remote read failed: " + lastSessionError(s.session));
        }
    }

    libssh2_sftp_close(rh);
    if (std::fclose(lf) != 0) {
        std::error_code ec;
        std::filesystem::remove(local, ec);
        err = "Local write failed for " + local;
        return false;
    }
    outPath = local;
    return true;
}

bool SftpFilePromise::materialize(const std::string &destDir,
                                  std::string &outPath, std::string &err,
                                  CancelCB shouldCancel) {
    static_assert(!std::is_copy_constructible_v<Session> &&
                      !std::is_copy_assignable_v<Session>,
                  "Session owns the socket and libssh2 handles");
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    if (opt_.host.empty() || remote_.empty()) {
        err = "Incomplete sftp location";
        return false;
    }
    if (!ensureLibssh2(err))
        return false;

    const int timeoutMs =
        opt_.timeout_ms > 0 ? opt_.timeout_ms : kDefaultSftpTimeoutMs;
    Session s;
    if (!tcpConnect(s, opt_.host, opt_.port, timeoutMs, shouldCancel, err))
        return false;

    s.session = libssh2_session_init();
    if (!s.session) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(s.session, 1);
    // Every blocking call below gives up with LIBSSH2_ERROR_TIMEOUT.
    libssh2_session_set_timeout(s.session, timeoutMs);
    if (libssh2_session_handshake(s.session, s.sock) != 0) {
        err = "SSH handshake failed: " + lastSessionError(s.session);
        return false;
    }
    if (!verifyHostKey(s, opt_, err))
        return false;
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    if (!authenticate(s, opt_, err))
        return false;
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }

    s.sftp = libssh2_sftp_init(s.session);
    if (!s.sftp) {
        err = "Could not start the SFTP subsystem";
        return false;
    }
    return download(s, destDir, outPath, err, shouldCancel);
}

} // namespace dropshelf
