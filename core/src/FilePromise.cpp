#include "dropshelf/FilePromise.hpp"
#include "dropshelf/PathAllocator.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace dropshelf {

std::FILE *openStagedFile(const std::string &dir, const std::string &name,
                          std::string &outPath, std::string &err) {
    const std::string safe = PathAllocator::sanitizeFileName(name);
    // "x" makes the create fail with EEXIST instead of truncating a file that
    // appeared after PathAllocator looked.
    for (int attempt = 0; attempt < 8; ++attempt) {
        const std::string candidate = PathAllocator::allocateIn(dir, safe);
        std::FILE *f = std::fopen(candidate.c_str(), "wbx");
        if (f) {
            outPath = candidate;
            return f;
        }
        if (errno != EEXIST) {
            err = "Could not create " + candidate + ": " + std::strerror(errno);
            return nullptr;
        }
    }
    err = "Could not find a free name for " + safe + " in " + dir;
    return nullptr;
}

bool writeStagedFile(const std::string &dir, const std::string &name,
                     const std::string &bytes, std::string &outPath,
                     std::string &err) {
    std::string path;
    std::FILE *f = openStagedFile(dir, name, path, err);
    if (!f)
        return false;
    const bool wrote =
        bytes.empty() || std::fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
    const bool closed = std::fclose(f) == 0;
    if (!wrote || !closed) {
        err = "Write failed for " + path;
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return false;
    }
    outPath = path;
    return true;
}

} // namespace dropshelf
