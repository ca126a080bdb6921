// Owner of the staging root where promised files and exported artifacts land.
// Constructed once by the application context and passed down; there is no
// process-wide instance.
#pragma once
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace dropshelf {

class TempResourceManager {
public:
    // Default root: <system temp>/DropShelfCache
    TempResourceManager();
    explicit TempResourceManager(std::string root);

    const std::string &root() const { return root_; }

    // Creates the root if missing. Called before every allocation so an
    // external deletion between calls is tolerated.
    bool ensureRoot(std::string &err);

    // Deduplicated path for a file inside the root. The file is not created.
    // Returns an empty string (and fills err) if the root cannot be created.
    std::string allocateFile(const std::string &name, std::string &err);

    // Creates a fresh subdirectory (random name if none is given). A failed
    // creation is retried once; if that also fails, returns an empty string
    // and err describes the ResourceError.
    std::string allocateDirectory(const std::optional<std::string> &name,
                                  std::string &err);

    // Removes what this manager staged and leaves the root in place.
    // The default root belongs to DropShelf alone and is emptied entirely;
    // a user-chosen root keeps every entry this manager did not create.
    // Idempotent.
    bool cleanup(std::string &err);

    // Deletes one staged file (or directory) and its parent directory when
    // that becomes empty. Paths outside the root, and paths this manager
    // did not stage, are refused.
    bool removeStagedFile(const std::string &path, std::string &err);

    bool contains(const std::string &path) const;
    // True for paths inside an entry allocated by this manager.
    bool owns(const std::string &path) const;
    bool ownsWholeRoot() const { return dedicated_; }

    static std::string defaultRoot();
    static std::string randomName();

private:
    bool ownsLocked(const std::string &normalized) const;

    std::string root_;
    bool dedicated_ = false;
    std::set<std::string> staged_; // allocated entries, normalized
    mutable std::mutex mtx_;       // guards root creation and staged_
};

} // namespace dropshelf
