// Collision-free destination naming against the live filesystem.
#pragma once
#include <string>
#include <utility>

namespace dropshelf {

class PathAllocator {
public:
    // Returns desiredPath if nothing exists there; otherwise the first free
    // "stem_N.ext" (N = 1, 2, ...) in the same directory. Not atomic against
    // concurrent writers: the name is only free at the moment of the check.
    static std::string allocate(const std::string &desiredPath);

    // allocate(dir / name)
    static std::string allocateIn(const std::string &dir,
                                  const std::string &name);

    // Makes a suggested name safe as a single path component. Separators and
    // control characters become '_'; empty or dot-only names become
    // "untitled".
    static std::string sanitizeFileName(const std::string &name);

    // Renames a file or directory within its own directory. The new name is
    // trimmed and sanitized, keeps the current extension when it has none,
    // and gets a "_N" suffix when taken. Renaming to the current name is a
    // no-op that returns the path unchanged.
    static bool renameEntry(const std::string &path, const std::string &newName,
                            std::string &outPath, std::string &err);

    // Splits "photo.final.png" into {"photo.final", ".png"}. A leading dot
    // (".bashrc") is part of the stem.
    static std::pair<std::string, std::string>
    splitExtension(const std::string &fileName);
};

} // namespace dropshelf
