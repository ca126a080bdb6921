#include "dropshelf/SftpTypes.hpp"

#include <cctype>
#include <string_view>
#include <utility>

namespace dropshelf {

KnownHostsPolicy knownHostsPolicyFromString(const std::string &s) {
    std::string v;
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "accept-new" || v == "acceptnew")
        return KnownHostsPolicy::AcceptNew;
    if (v == "off" || v == "none")
        return KnownHostsPolicy::Off;
    return KnownHostsPolicy::Strict;
}

const char *knownHostsPolicyName(KnownHostsPolicy p) {
    switch (p) {
    case KnownHostsPolicy::Strict:
        return "strict";
    case KnownHostsPolicy::AcceptNew:
        return "accept-new";
    case KnownHostsPolicy::Off:
        return "off";
    }
    return "strict";
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

static bool percentDecode(std::string_view in, std::string &out) {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size())
            return false;
        const int hi = hexValue(in[i + 1]);
        const int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0)
            return false;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return true;
}

bool parseSftpUrl(const std::string &url, SftpLocation &out, std::string &err) {
    static constexpr std::string_view kScheme = "sftp://";
    std::string_view rest(url);
    if (rest.size() < kScheme.size()) {
        err = "Not an sftp URL";
        return false;
    }
    for (std::size_t i = 0; i < kScheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(rest[i])) != kScheme[i]) {
            err = "Not an sftp URL";
            return false;
        }
    }
    rest.remove_prefix(kScheme.size());

    const std::size_t slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    std::string_view path =
        slash == std::string_view::npos ? std::string_view() : rest.substr(slash);

    SftpLocation loc;
    const std::size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        std::string_view userinfo = authority.substr(0, at);
        authority.remove_prefix(at + 1);
        const std::size_t colon = userinfo.find(':');
        std::string user;
        if (!percentDecode(userinfo.substr(0, colon), user)) {
            err = "Malformed user in sftp URL";
            return false;
        }
        loc.username = user;
        if (colon != std::string_view::npos) {
            std::string pass;
            if (!percentDecode(userinfo.substr(colon + 1), pass)) {
                err = "Malformed password in sftp URL";
                return false;
            }
            loc.password = pass;
        }
    }

    // host, host:port, [v6], [v6]:port
    std::string_view host = authority;
    std::string_view port;
    if (!host.empty() && host.front() == '[') {
        const std::size_t close = host.find(']');
        if (close == std::string_view::npos) {
            err = "Malformed IPv6 host in sftp URL";
            return false;
        }
        if (close + 1 < host.size()) {
            if (host[close + 1] != ':') {
                err = "Malformed host in sftp URL";
                return false;
            }
            port = host.substr(close + 2);
        }
        host = host.substr(1, close - 1);
    } else {
        const std::size_t colon = host.rfind(':');
        if (colon != std::string_view::npos) {
            port = host.substr(colon + 1);
            host = host.substr(0, colon);
        }
    }
    if (host.empty()) {
        err = "Missing host in sftp URL";
        return false;
    }
    loc.host = std::string(host);

    if (!port.empty()) {
        unsigned long v = 0;
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                err = "Invalid port in sftp URL";
                return false;
            }
            v = v * 10 + static_cast<unsigned long>(c - '0');
            if (v > 65535) {
                err = "Invalid port in sftp URL";
                return false;
            }
        }
        if (v == 0) {
            err = "Invalid port in sftp URL";
            return false;
        }
        loc.port = static_cast<std::uint16_t>(v);
    }

    // Drop query and fragment; they carry nothing for SFTP.
    const std::size_t cut = path.find_first_of("?#");
    if (cut != std::string_view::npos)
        path = path.substr(0, cut);
    if (!percentDecode(path, loc.path)) {
        err = "Malformed path in sftp URL";
        return false;
    }
    if (loc.path.empty() || loc.path == "/") {
        err = "sftp URL does not name a file";
        return false;
    }
    out = std::move(loc);
    return true;
}

std::string remoteBaseName(const std::string &remotePath) {
    std::string p = remotePath;
    while (!p.empty() && p.back() == '/')
        p.pop_back();
    const std::size_t slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

} // namespace dropshelf
