// Basic types shared between the ingestion core and the UI: items, ids and
// the drop error taxonomy. Kept plain so the UI can copy them freely.
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace dropshelf {

using ItemId = std::uint64_t;  // 0 = not assigned yet
using StackId = std::uint64_t; // 0 = no stack
using Clock = std::chrono::system_clock;

enum class ItemKind { File, Directory, Image, Text, Link, Archive, Other };

// Gesture-level and per-promise failures.
//  - UnrecognizedPayload: neither direct references nor promises in the drop
//  - ResolutionError: one promise failed (absorbed, never fatal to a batch)
//  - NoPromisesResolved: every promise of a gesture failed
//  - ResourceError: the staging directory could not be created
//  - Canceled: the gesture was canceled before its promises resolved
enum class DropError {
    UnrecognizedPayload,
    ResolutionError,
    NoPromisesResolved,
    ResourceError,
    Canceled
};

const char *dropErrorName(DropError e);

struct Item {
    ItemId id = 0;
    std::string path;        // absolute local path
    std::string displayName; // file name shown to the user
    ItemKind kind = ItemKind::Other;
    bool isTemporary = false; // lives in the staging area, purged on removal
    Clock::time_point addedAt{};
};

// Builds an item for a local path. Kind is derived from the extension (and
// from the filesystem for directories); id stays 0 until the shelf assigns
// one.
Item makeItem(const std::string &path, bool isTemporary = false);

ItemKind kindForPath(const std::string &path);

} // namespace dropshelf
