// Connection settings for remote files dropped as sftp:// URLs. Kept free of
// libssh2 types so the URL decoder and the UI can build them.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace dropshelf {

// known_hosts validation of the server key.
enum class KnownHostsPolicy {
    Strict,    // Must match known_hosts exactly.
    AcceptNew, // TOFU: record unknown hosts, reject changed keys.
    Off        // No verification.
};

// "strict", "accept-new", "off"; anything else maps to Strict.
KnownHostsPolicy knownHostsPolicyFromString(const std::string &s);
const char *knownHostsPolicyName(KnownHostsPolicy p);

inline constexpr int kDefaultSftpTimeoutMs = 20000;

struct SftpOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // Bounds the TCP connect and every blocking SSH call. Values <= 0 use
    // kDefaultSftpTimeoutMs.
    int timeout_ms = 20000;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Asked when AcceptNew meets an unknown host. Without a callback the key
    // is accepted and recorded.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;
};

// sftp://[user[:password]@]host[:port]/path
struct SftpLocation {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::optional<std::string> password;
    std::string path; // absolute, percent-decoded
};

bool parseSftpUrl(const std::string &url, SftpLocation &out, std::string &err);

// Last path component, or empty for "/" and "".
std::string remoteBaseName(const std::string &remotePath);

} // namespace dropshelf
