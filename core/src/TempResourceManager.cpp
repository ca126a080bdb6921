// Staging root management: lazy creation, per-gesture directories, purge.
#include "dropshelf/TempResourceManager.hpp"
#include "dropshelf/PathAllocator.hpp"

#include <filesystem>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace dropshelf {

static constexpr const char *kCacheDirName = "DropShelfCache";

std::string TempResourceManager::defaultRoot() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = "/tmp";
    return (base / kCacheDirName).string();
}

std::string TempResourceManager::randomName() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned> dist(0, 15);
    static const char kHex[] = "0123456789ABCDEF";
    // 8-4-4-4-12 like a UUID string
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20)
            out.push_back('-');
        out.push_back(kHex[dist(rng)]);
    }
    return out;
}

static std::string normalizedPath(const std::string &path) {
    std::string out = fs::path(path).lexically_normal().string();
    // Keep "/x/y/" and "/x/y" equal so prefix checks compare cleanly.
    while (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

TempResourceManager::TempResourceManager()
    : root_(normalizedPath(defaultRoot())), dedicated_(true) {}

TempResourceManager::TempResourceManager(std::string root)
    : root_(normalizedPath(root.empty() ? defaultRoot() : root)) {
    dedicated_ = root_ == normalizedPath(defaultRoot());
}

bool TempResourceManager::ensureRoot(std::string &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::error_code ec;
    if (fs::is_directory(root_, ec))
        return true;
    fs::create_directories(root_, ec);
    std::error_code again;
    if (ec && !fs::is_directory(root_, again)) {
        err = "Could not create staging root " + root_ + ": " + ec.message();
        return false;
    }
    return true;
}

std::string TempResourceManager::allocateFile(const std::string &name,
                                              std::string &err) {
    if (!ensureRoot(err))
        return {};
    std::string path = PathAllocator::allocateIn(
        root_, PathAllocator::sanitizeFileName(name));
    std::lock_guard<std::mutex> lk(mtx_);
    staged_.insert(normalizedPath(path));
    return path;
}

std::string
TempResourceManager::allocateDirectory(const std::optional<std::string> &name,
                                       std::string &err) {
    std::string lastErr;
    for (int attempt = 0; attempt < 2; ++attempt) {
        std::string rootErr;
        if (!ensureRoot(rootErr)) {
            lastErr = rootErr;
            continue;
        }
        const std::string dirName =
            name.has_value() ? PathAllocator::sanitizeFileName(*name)
                             : randomName();
        const std::string path = PathAllocator::allocateIn(root_, dirName);
        std::error_code ec;
        // create_directory (not create_directories) so a name that appeared
        // after the existence check is reported instead of reused.
        if (fs::create_directory(path, ec)) {
            std::lock_guard<std::mutex> lk(mtx_);
            staged_.insert(normalizedPath(path));
            return path;
        }
        lastErr = "Could not create staging directory " + path +
                  (ec ? ": " + ec.message() : std::string(": already exists"));
    }
    err = lastErr;
    return {};
}

bool TempResourceManager::cleanup(std::string &err) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        std::error_code ec;
        if (dedicated_) {
            if (fs::exists(root_, ec)) {
                fs::remove_all(root_, ec);
                if (ec) {
                    err = "Could not remove staging root " + root_ + ": " +
                          ec.message();
                    return false;
                }
            }
            staged_.clear();
        } else {
            std::string firstErr;
            for (auto it = staged_.begin(); it != staged_.end();) {
                fs::remove_all(*it, ec);
                if (ec) {
                    if (firstErr.empty())
                        firstErr = "Could not remove staged entry " + *it +
                                   ": " + ec.message();
                    ec.clear();
                    ++it;
                } else {
                    it = staged_.erase(it);
                }
            }
            if (!firstErr.empty()) {
                err = firstErr;
                return false;
            }
        }
    }
    return ensureRoot(err);
}

bool TempResourceManager::contains(const std::string &path) const {
    const fs::path p = fs::path(path).lexically_normal();
    const fs::path rel = p.lexically_relative(root_);
    if (rel.empty())
        return false;
    const std::string first = rel.begin()->string();
    return first != ".." && first != ".";
}

bool TempResourceManager::ownsLocked(const std::string &normalized) const {
    if (dedicated_)
        return contains(normalized);
    // staged_ is ordered, so an owning ancestor sorts at or before the path.
    auto it = staged_.upper_bound(normalized);
    while (it != staged_.begin()) {
        --it;
        const std::string &entry = *it;
        if (normalized == entry)
            return true;
        if (normalized.size() > entry.size() &&
            normalized.compare(0, entry.size(), entry) == 0 &&
            normalized[entry.size()] == '/')
            return true;
    }
    return false;
}

bool TempResourceManager::owns(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ownsLocked(normalizedPath(path));
}

bool TempResourceManager::removeStagedFile(const std::string &path,
                                           std::string &err) {
    if (!contains(path)) {
        err = "Refusing to remove a path outside the staging root: " + path;
        return false;
    }
    const std::string p = normalizedPath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    if (!ownsLocked(p)) {
        err = "Refusing to remove a path DropShelf did not stage: " + path;
        return false;
    }
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) {
        err = "Could not remove staged file " + path + ": " + ec.message();
        return false;
    }
    staged_.erase(p);
    // Per-gesture directory goes away with its last file; the root stays.
    const std::string parent = fs::path(p).parent_path().string();
    if (contains(parent) && ownsLocked(parent) &&
        fs::is_directory(parent, ec) && fs::is_empty(parent, ec)) {
        fs::remove(parent, ec);
        if (ec) {
            err = "Could not remove empty staging directory " + parent +
                  ": " + ec.message();
            return false;
        }
        staged_.erase(parent);
    }
    return true;
}

} // namespace dropshelf
