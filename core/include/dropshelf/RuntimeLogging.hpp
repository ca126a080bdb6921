// Runtime policy helpers for diagnostics/sensitive logging.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace dropshelf {

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("DROPSHELF_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Full paths and URLs in logs only in dev builds that opt in.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("DROPSHELF_LOG_SENSITIVE");
}

// Path or URL as it may appear in a log line: untouched when sensitive
// logging is on, otherwise reduced to its last component.
inline std::string loggablePath(const std::string &path) {
    if (sensitiveLoggingEnabled())
        return path;
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const std::size_t slash = p.rfind('/');
    if (slash == std::string::npos || slash + 1 >= p.size())
        return p;
    return "…/" + p.substr(slash + 1);
}

} // namespace dropshelf
