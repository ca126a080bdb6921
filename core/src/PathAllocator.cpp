#include "dropshelf/PathAllocator.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dropshelf {

// A dangling symlink still occupies the name, so look at the link itself.
static bool entryExists(const fs::path &p) {
    std::error_code ec;
    const auto st = fs::symlink_status(p, ec);
    if (ec)
        return false;
    return st.type() != fs::file_type::not_found &&
           st.type() != fs::file_type::none;
}

std::pair<std::string, std::string>
PathAllocator::splitExtension(const std::string &fileName) {
    const auto dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return {fileName, std::string()};
    return {fileName.substr(0, dot), fileName.substr(dot)};
}

std::string PathAllocator::allocate(const std::string &desiredPath) {
    const fs::path desired(desiredPath);
    if (!entryExists(desired))
        return desiredPath;

    const fs::path dir = desired.parent_path();
    const auto [stem, ext] = splitExtension(desired.filename().string());
    for (unsigned long long n = 1;; ++n) {
        const fs::path candidate = dir / (stem + "_" + std::to_string(n) + ext);
        if (!entryExists(candidate))
            return candidate.string();
    }
}

std::string PathAllocator::allocateIn(const std::string &dir,
                                      const std::string &name) {
    return allocate((fs::path(dir) / name).string());
}

std::string PathAllocator::sanitizeFileName(const std::string &name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7f)
            out.push_back('_');
        else
            out.push_back(c);
    }
    if (out.find_first_not_of('.') == std::string::npos)
        return "untitled";
    return out;
}

bool PathAllocator::renameEntry(const std::string &path,
                                const std::string &newName,
                                std::string &outPath, std::string &err) {
    const auto first = newName.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        err = "The new name is empty";
        return false;
    }
    const auto last = newName.find_last_not_of(" \t\r\n");
    std::string name = sanitizeFileName(newName.substr(first, last - first + 1));

    const fs::path source(path);
    if (!entryExists(source)) {
        err = "Cannot rename a missing file: " + path;
        return false;
    }
    const std::string currentExt =
        splitExtension(source.filename().string()).second;
    if (splitExtension(name).second.empty() && !currentExt.empty())
        name += currentExt;

    const fs::path target = source.parent_path() / name;
    if (target == source) {
        outPath = path;
        return true;
    }
    const std::string dest = allocate(target.string());
    std::error_code ec;
    fs::rename(source, dest, ec);
    if (ec) {
        err = "Could not rename " + path + ": " + ec.message();
        return false;
    }
    outPath = dest;
    return true;
}

} // namespace dropshelf
