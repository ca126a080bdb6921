// Abstract handle for a file that a drop source promised but has not written
// yet. Concrete promises (in-memory data, text, links, remote SFTP files) must
// respect this API so ingestion stays decoupled from where the bytes come
// from.
#pragma once
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dropshelf {

class FilePromise {
public:
    // Returns true when the resolution should stop (batch canceled or the
    // per-promise deadline passed).
    using CancelCB = std::function<bool()>;

    virtual ~FilePromise() = default;

    // Name the source proposes for the file; may be empty.
    virtual std::string suggestedName() const = 0;

    // Short human readable origin for logs ("sftp://host/…", "image data").
    virtual std::string describe() const = 0;

    // Write the promised file into destDir. The final name must be picked
    // through PathAllocator (see openStagedFile). Runs on a resolver worker
    // thread and may block; long operations must poll shouldCancel and fail
    // when it returns true. On success fills outPath and returns true.
    virtual bool materialize(const std::string &destDir, std::string &outPath,
                             std::string &err, CancelCB shouldCancel = {}) = 0;
};

using FilePromisePtr = std::shared_ptr<FilePromise>;
using FilePromiseList = std::vector<FilePromisePtr>;

// Creates a new, exclusively opened file named after `name` inside dir,
// deduplicating through PathAllocator and retrying when another writer takes
// the name between the check and the create. Returns nullptr and fills err on
// failure. The caller owns the FILE*.
std::FILE *openStagedFile(const std::string &dir, const std::string &name,
                          std::string &outPath, std::string &err);

// Convenience: openStagedFile + write all bytes + close. A partially written
// file is removed on failure.
bool writeStagedFile(const std::string &dir, const std::string &name,
                     const std::string &bytes, std::string &outPath,
                     std::string &err);

} // namespace dropshelf
