#include "dropshelf/ShelfTypes.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dropshelf {

const char *dropErrorName(DropError e) {
    switch (e) {
    case DropError::UnrecognizedPayload:
        return "UnrecognizedPayload";
    case DropError::ResolutionError:
        return "ResolutionError";
    case DropError::NoPromisesResolved:
        return "NoPromisesResolved";
    case DropError::ResourceError:
        return "ResourceError";
    case DropError::Canceled:
        return "Canceled";
    }
    return "Unknown";
}

static std::string lowerExtension(const std::string &path) {
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

ItemKind kindForPath(const std::string &path) {
    std::error_code ec;
    if (fs::is_directory(path, ec))
        return ItemKind::Directory;

    const std::string ext = lowerExtension(path);
    if (ext.empty())
        return ItemKind::File;
    static const char *const kImages[] = {"png", "jpg",  "jpeg", "gif",
                                          "bmp", "webp", "heic", "tiff",
                                          "tif", "svg"};
    static const char *const kText[] = {"txt", "md", "rtf", "csv", "log",
                                        "json"};
    static const char *const kLinks[] = {"desktop", "url", "webloc"};
    static const char *const kArchives[] = {"zip", "tar", "gz",  "bz2",
                                            "xz",  "7z",  "rar", "tgz"};
    auto in = [&ext](const auto &list) {
        return std::any_of(std::begin(list), std::end(list),
                           [&ext](const char *e) { return ext == e; });
    };
    if (in(kImages))
        return ItemKind::Image;
    if (in(kText))
        return ItemKind::Text;
    if (in(kLinks))
        return ItemKind::Link;
    if (in(kArchives))
        return ItemKind::Archive;
    return ItemKind::Other;
}

Item makeItem(const std::string &path, bool isTemporary) {
    Item it;
    it.path = path;
    it.displayName = fs::path(path).filename().string();
    if (it.displayName.empty())
        it.displayName = path;
    it.kind = kindForPath(path);
    it.isTemporary = isTemporary;
    it.addedAt = Clock::now();
    return it;
}

} // namespace dropshelf
